#include "Block.h"
#include "Utilities.h"
#include <gtest/gtest.h>

#include <thread>

namespace {

std::vector<sy::Transaction> sampleTransactions() {
  return { sy::Transaction::create("Alice", "Bob", 10).value(),
           sy::Transaction::create("Bob", "Charlie", 3).value() };
}

} // namespace

TEST(BlockTest, ConstructorComputesHash) {
  sy::Block block(1, sampleTransactions(), std::string(64, 'a'), 1000);
  EXPECT_EQ(block.nonce, 0u);
  EXPECT_EQ(block.timestamp, 1000);
  EXPECT_EQ(block.hash, block.calculateHash());
  EXPECT_EQ(block.hash.size(), 64);
}

TEST(BlockTest, DefaultTimestampIsNow) {
  int64_t before = sy::utl::getCurrentTimeMs();
  sy::Block block(1, {}, std::string(64, 'a'));
  int64_t after = sy::utl::getCurrentTimeMs();
  EXPECT_GE(block.timestamp, before);
  EXPECT_LE(block.timestamp, after);
}

TEST(BlockTest, EmptyTransactionListIsValid) {
  sy::Block block(0, {}, sy::Block::GENESIS_PREVIOUS_HASH, 0);
  EXPECT_TRUE(block.transactions.empty());
  EXPECT_EQ(block.hash, block.calculateHash());
}

TEST(BlockTest, HashCoversEveryField) {
  sy::Block base(1, sampleTransactions(), std::string(64, 'a'), 1000);

  sy::Block changed = base;
  changed.index = 2;
  EXPECT_NE(changed.calculateHash(), base.hash);

  changed = base;
  changed.previousHash = std::string(64, 'b');
  EXPECT_NE(changed.calculateHash(), base.hash);

  changed = base;
  changed.timestamp = 1001;
  EXPECT_NE(changed.calculateHash(), base.hash);

  changed = base;
  changed.nonce = 1;
  EXPECT_NE(changed.calculateHash(), base.hash);

  changed = base;
  changed.transactions.pop_back();
  EXPECT_NE(changed.calculateHash(), base.hash);
}

TEST(BlockTest, HashExcludesStoredHash) {
  sy::Block block(1, sampleTransactions(), std::string(64, 'a'), 1000);
  std::string expected = block.calculateHash();
  block.hash = "garbage";
  EXPECT_EQ(block.calculateHash(), expected);
}

TEST(BlockTest, MineMeetsDifficulty) {
  for (uint32_t difficulty : { 1u, 2u, 3u }) {
    sy::Block block(1, sampleTransactions(), std::string(64, 'a'), 1000);
    auto result = block.mine(difficulty);
    ASSERT_TRUE(result.isOk()) << result.error().message;
    EXPECT_TRUE(block.meetsDifficulty(difficulty));
    EXPECT_EQ(block.hash.substr(0, difficulty), std::string(difficulty, '0'));
    EXPECT_EQ(block.hash, block.calculateHash());
  }
}

TEST(BlockTest, MineWithZeroDifficultyKeepsNonce) {
  sy::Block block(1, {}, std::string(64, 'a'), 1000);
  ASSERT_TRUE(block.mine(0).isOk());
  EXPECT_EQ(block.nonce, 0u);
}

TEST(BlockTest, MineStopsWhenCancelled) {
  sy::Block block(1, sampleTransactions(), std::string(64, 'a'), 1000);
  std::atomic<bool> cancel{ true };

  // 64 zero nibbles is out of reach, only cancellation ends the search
  auto result = block.mine(64, cancel);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, sy::Block::E_CANCELLED);
  EXPECT_EQ(block.hash, block.calculateHash());
}

TEST(BlockTest, MineCanBeCancelledFromAnotherThread) {
  sy::Block block(1, sampleTransactions(), std::string(64, 'a'), 1000);
  std::atomic<bool> cancel{ false };

  std::thread canceller([&cancel]() {
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    cancel = true;
  });
  auto result = block.mine(64, cancel);
  canceller.join();

  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, sy::Block::E_CANCELLED);
  EXPECT_GT(block.nonce, 0u);
  EXPECT_EQ(block.hash, block.calculateHash());
}

TEST(BlockTest, JsonRecordKeepsStoredHash) {
  sy::Block block(3, sampleTransactions(), std::string(64, 'a'), 1234);
  ASSERT_TRUE(block.mine(1).isOk());

  auto j = block.toJson();
  EXPECT_EQ(j["index"], 3);
  EXPECT_EQ(j["previous_hash"], std::string(64, 'a'));
  EXPECT_EQ(j["transactions"].size(), 2);

  j["hash"] = "tampered";
  auto parsed = sy::Block::fromJson(j);
  ASSERT_TRUE(parsed.isOk());
  EXPECT_EQ(parsed->hash, "tampered");
  EXPECT_EQ(parsed->calculateHash(), block.hash);
  EXPECT_EQ(parsed->nonce, block.nonce);
}

TEST(BlockTest, FromJsonRejectsMalformedRecords) {
  auto notObject = sy::Block::fromJson(nlohmann::json::array());
  ASSERT_TRUE(notObject.isError());
  EXPECT_EQ(notObject.error().code, sy::Block::E_MALFORMED);

  sy::Block block(1, sampleTransactions(), std::string(64, 'a'), 1000);
  auto j = block.toJson();
  j.erase("nonce");
  auto missing = sy::Block::fromJson(j);
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, sy::Block::E_MALFORMED);

  j = block.toJson();
  j["transactions"][0]["amount"] = -1;
  auto badTx = sy::Block::fromJson(j);
  ASSERT_TRUE(badTx.isError());
  EXPECT_EQ(badTx.error().code, sy::Block::E_MALFORMED);
}
