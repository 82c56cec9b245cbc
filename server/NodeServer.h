#ifndef SY_LEDGER_NODE_SERVER_H
#define SY_LEDGER_NODE_SERVER_H

#include "Node.h"
#include "Service.h"
#include "../network/HttpTransport.h"
#include "../network/PeerNetwork.h"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace sy {

/**
 * NodeServer - runs one Node behind an HTTP API.
 *
 * The work directory holds config.json and node.log. Peers are reached over
 * HTTP through the same API (POST /events, GET /chain).
 */
class NodeServer : public Service {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  // Error codes
  static constexpr const int32_t E_CONFIG = -1;
  static constexpr const int32_t E_WORK_DIR = -2;
  static constexpr const int32_t E_BIND = -3;
  static constexpr const int32_t E_NODE = -4;

  constexpr static const char *DEFAULT_HOST = "localhost";
  constexpr static uint16_t DEFAULT_PORT = 8545;
  constexpr static const char *DEFAULT_ADDRESS = "node";

  /**
   * Command line values that take precedence over config.json.
   * A port of 0 binds to any free port.
   */
  struct Overrides {
    std::optional<uint16_t> port;
    std::optional<uint32_t> difficulty;
    std::vector<std::string> peers; // appended to the configured peers
  };

  NodeServer();
  ~NodeServer() override;

  Service::Roe<void> start(const std::string &workDir,
                           const Overrides &overrides = {});

  /**
   * Port the listener is bound to, valid after start().
   */
  uint16_t getPort() const { return port_; }

  const Node &getNode() const { return node_; }

protected:
  void runLoop() override;
  Service::Roe<void> onStart() override;
  void onStopRequested() override;
  void onStop() override;

private:
  constexpr static const char *FILE_CONFIG = "config.json";
  constexpr static const char *FILE_LOG = "node.log";

  struct RunFileConfig {
    std::string address{ DEFAULT_ADDRESS };
    std::string host{ DEFAULT_HOST };
    uint16_t port{ DEFAULT_PORT };
    uint32_t difficulty{ Node::DEFAULT_DIFFICULTY };
    std::vector<std::string> peers;
    int64_t peerTimeoutMs{ network::PeerNetwork::TIMEOUT_DEFAULT.count() };
    std::string logLevel{ "info" };

    nlohmann::json toJson() const;
    Roe<void> fromJson(const nlohmann::json &jd);
  };

  Roe<void> ensureConfigFile(const std::string &configPath);
  Roe<void> loadConfig(const std::string &configPath);
  void initHandlers();

  void hGetChain(const httplib::Request &req, httplib::Response &res);
  void hPostEvent(const httplib::Request &req, httplib::Response &res);
  void hNewTransactionEvent(const nlohmann::json &payload,
                            httplib::Response &res);
  void hPostTransaction(const httplib::Request &req, httplib::Response &res);
  void hPostMine(const httplib::Request &req, httplib::Response &res);
  void hPostResolve(const httplib::Request &req, httplib::Response &res);
  void hPostPeer(const httplib::Request &req, httplib::Response &res);
  void hGetPeers(const httplib::Request &req, httplib::Response &res);
  void hGetBalance(const httplib::Request &req, httplib::Response &res);
  void hGetStatus(const httplib::Request &req, httplib::Response &res);

  std::string workDir_;
  Overrides overrides_;
  RunFileConfig config_;
  uint16_t port_{ 0 };

  std::shared_ptr<network::HttpTransport> spTransport_;
  network::PeerNetwork network_;
  Node node_;
  httplib::Server server_;
};

} // namespace sy

#endif // SY_LEDGER_NODE_SERVER_H
