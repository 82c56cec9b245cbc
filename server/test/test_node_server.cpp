#include "NodeServer.h"
#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <limits>

namespace fs = std::filesystem;

namespace {

fs::path makeWorkDir(const std::string &name) {
  auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
  fs::path dir = fs::temp_directory_path() /
                 ("sy-node-test-" + name + "-" + std::to_string(stamp));
  fs::create_directories(dir);
  return dir;
}

void writeConfig(const fs::path &dir, const std::string &address) {
  nlohmann::json config;
  config["address"] = address;
  config["host"] = "127.0.0.1";
  config["port"] = 8545;
  config["difficulty"] = 1;
  config["peers"] = nlohmann::json::array();
  config["peerTimeoutMs"] = 2000;
  config["logLevel"] = "warning";
  std::ofstream(dir / "config.json") << config.dump(2);
}

} // namespace

class NodeServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    dirA = makeWorkDir("a");
    dirB = makeWorkDir("b");
    writeConfig(dirA, "A");
    writeConfig(dirB, "B");

    sy::NodeServer::Overrides overrides;
    overrides.port = 0;
    auto startedA = serverA.start(dirA.string(), overrides);
    ASSERT_TRUE(startedA.isOk()) << startedA.error().message;
    auto startedB = serverB.start(dirB.string(), overrides);
    ASSERT_TRUE(startedB.isOk()) << startedB.error().message;

    clientA = std::make_unique<httplib::Client>("127.0.0.1", serverA.getPort());
    clientB = std::make_unique<httplib::Client>("127.0.0.1", serverB.getPort());
  }

  void TearDown() override {
    serverA.stop();
    serverB.stop();
    std::error_code ec;
    fs::remove_all(dirA, ec);
    fs::remove_all(dirB, ec);
  }

  std::string addressOf(const sy::NodeServer &server) {
    return "127.0.0.1:" + std::to_string(server.getPort());
  }

  fs::path dirA;
  fs::path dirB;
  sy::NodeServer serverA;
  sy::NodeServer serverB;
  std::unique_ptr<httplib::Client> clientA;
  std::unique_ptr<httplib::Client> clientB;
};

TEST_F(NodeServerTest, ServesGenesisChain) {
  auto res = clientA->Get("/chain");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);

  auto chain = sy::Chain::fromJson(nlohmann::json::parse(res->body));
  ASSERT_TRUE(chain.isOk());
  EXPECT_EQ(chain->length(), 1);
  EXPECT_TRUE(chain->validate());
}

TEST_F(NodeServerTest, RejectsInvalidTransaction) {
  auto res = clientA->Post(
      "/transactions", R"({"sender":"Eve","recipient":"Mallory","amount":-5})",
      "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(nlohmann::json::parse(res->body)["error"].get<std::string>(), "InvalidAmount");

  res = clientA->Post("/transactions", "not json", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(nlohmann::json::parse(res->body)["error"].get<std::string>(), "MalformedRecord");

  EXPECT_EQ(serverA.getNode().getPendingCount(), 0);
}

TEST_F(NodeServerTest, MineAnnouncesChainToPeer) {
  auto res = clientA->Post(
      "/peers", nlohmann::json{ { "address", addressOf(serverB) } }.dump(),
      "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);

  res = clientA->Post("/transactions",
                      R"({"sender":"Alice","recipient":"Bob","amount":10})",
                      "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 201);

  res = clientA->Post("/mine", "", "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;
  auto block = sy::Block::fromJson(nlohmann::json::parse(res->body));
  ASSERT_TRUE(block.isOk());
  EXPECT_EQ(block->index, 1);

  // The broadcast completes before /mine answers
  EXPECT_EQ(serverB.getNode().getChainLength(), 2);
  EXPECT_EQ(serverB.getNode().getChain().latest().hash, block->hash);

  res = clientB->Get("/balance?address=Bob");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  EXPECT_EQ(nlohmann::json::parse(res->body)["balance"].get<int64_t>(), 10);
}

TEST_F(NodeServerTest, ResolvePullsLongerChain) {
  ASSERT_TRUE(clientA->Post("/mine", "", "application/json"));
  ASSERT_TRUE(clientA->Post("/mine", "", "application/json"));
  ASSERT_EQ(serverA.getNode().getChainLength(), 3);

  auto res = clientB->Post(
      "/peers", nlohmann::json{ { "address", addressOf(serverA) } }.dump(),
      "application/json");
  ASSERT_TRUE(res);

  res = clientB->Post("/resolve", "", "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  EXPECT_TRUE(nlohmann::json::parse(res->body)["changed"].get<bool>());
  EXPECT_EQ(serverB.getNode().getChainLength(), 3);

  res = clientB->Get("/status");
  ASSERT_TRUE(res);
  auto status = nlohmann::json::parse(res->body);
  EXPECT_EQ(status["address"].get<std::string>(), "B");
  EXPECT_EQ(status["length"].get<size_t>(), 3);
  EXPECT_EQ(status["difficulty"].get<uint32_t>(), 1);
  EXPECT_EQ(status["peers"].size(), 1);
}

TEST_F(NodeServerTest, BalanceRequiresAddress) {
  auto res = clientA->Get("/balance");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(nlohmann::json::parse(res->body)["error"].get<std::string>(), "InvalidAddress");
}

TEST_F(NodeServerTest, BalanceReportsOverflow) {
  const int64_t max = std::numeric_limits<int64_t>::max();
  for (const char *sender : { "Alice", "Carol" }) {
    nlohmann::json tx;
    tx["sender"] = sender;
    tx["recipient"] = "Bob";
    tx["amount"] = max;
    auto res = clientA->Post("/transactions", tx.dump(), "application/json");
    ASSERT_TRUE(res);
    ASSERT_EQ(res->status, 201) << res->body;
  }
  ASSERT_TRUE(clientA->Post("/mine", "", "application/json"));
  ASSERT_EQ(serverA.getNode().getChainLength(), 2);

  auto res = clientA->Get("/balance?address=Bob");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 500);
  EXPECT_EQ(nlohmann::json::parse(res->body)["error"].get<std::string>(),
            "BalanceOverflow");

  res = clientA->Get("/balance?address=Alice");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  EXPECT_EQ(nlohmann::json::parse(res->body)["balance"].get<int64_t>(), -max);
}

TEST_F(NodeServerTest, RejectsNonStringEvidence) {
  auto res = clientA->Post(
      "/transactions",
      R"({"sender":"Alice","recipient":"Bob","amount":1,"signature":5})",
      "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(nlohmann::json::parse(res->body)["error"].get<std::string>(),
            "MalformedRecord");

  res = clientA->Post(
      "/events",
      R"({"event":"new_transaction","payload":{"sender":"Alice","recipient":"Bob","amount":1,"proof":[]}})",
      "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 400);
  EXPECT_EQ(nlohmann::json::parse(res->body)["error"].get<std::string>(),
            "MalformedRecord");

  EXPECT_EQ(serverA.getNode().getPendingCount(), 0);
}

TEST_F(NodeServerTest, TransactionsSpreadToPeersAndLeaveOnceSealed) {
  auto res = clientA->Post(
      "/peers", nlohmann::json{ { "address", addressOf(serverB) } }.dump(),
      "application/json");
  ASSERT_TRUE(res);
  res = clientB->Post(
      "/peers", nlohmann::json{ { "address", addressOf(serverA) } }.dump(),
      "application/json");
  ASSERT_TRUE(res);

  res = clientA->Post("/transactions",
                      R"({"sender":"Alice","recipient":"Bob","amount":10})",
                      "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 201) << res->body;

  // Gossip completes before the submission is answered
  auto pendingB = serverB.getNode().getPendingTransactions();
  ASSERT_EQ(pendingB.size(), 1);
  EXPECT_EQ(pendingB[0].getSender(), "Alice");
  EXPECT_EQ(serverA.getNode().getPendingCount(), 1);

  // A repeated announcement is acknowledged without a second copy
  res = clientB->Post(
      "/events",
      R"({"event":"new_transaction","payload":{"sender":"Alice","recipient":"Bob","amount":10}})",
      "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200);
  EXPECT_TRUE(nlohmann::json::parse(res->body)["known"].get<bool>());
  EXPECT_EQ(serverB.getNode().getPendingCount(), 1);

  res = clientA->Post("/mine", "", "application/json");
  ASSERT_TRUE(res);
  ASSERT_EQ(res->status, 200) << res->body;
  EXPECT_EQ(serverB.getNode().getChainLength(), 2);
  EXPECT_EQ(serverB.getNode().getPendingCount(), 0);
}

TEST(NodeServerConfigTest, CreatesDefaultConfig) {
  fs::path dir = makeWorkDir("defaults");
  {
    sy::NodeServer server;
    sy::NodeServer::Overrides overrides;
    overrides.port = 0;
    overrides.difficulty = 1;
    auto started = server.start(dir.string(), overrides);
    ASSERT_TRUE(started.isOk()) << started.error().message;
    EXPECT_EQ(server.getNode().getConfig().difficulty, 1);
    server.stop();
  }

  std::ifstream in(dir / "config.json");
  ASSERT_TRUE(in.good());
  auto config = nlohmann::json::parse(in);
  EXPECT_EQ(config["address"].get<std::string>(), sy::NodeServer::DEFAULT_ADDRESS);
  EXPECT_EQ(config["port"].get<uint16_t>(), sy::NodeServer::DEFAULT_PORT);
  EXPECT_EQ(config["difficulty"].get<uint32_t>(), sy::Node::DEFAULT_DIFFICULTY);
  EXPECT_TRUE(fs::exists(dir / "node.log"));

  std::error_code ec;
  fs::remove_all(dir, ec);
}

TEST(NodeServerConfigTest, RejectsBadConfig) {
  fs::path dir = makeWorkDir("bad");
  std::ofstream(dir / "config.json") << R"({"port": "eighty"})";

  sy::NodeServer server;
  auto started = server.start(dir.string());
  ASSERT_TRUE(started.isError());
  EXPECT_EQ(started.error().code, sy::Service::E_START);

  std::error_code ec;
  fs::remove_all(dir, ec);
}
