#include "NodeServer.h"
#include "Utilities.h"

#include <filesystem>

namespace sy {

namespace {

const char *CONTENT_JSON = "application/json";

void setJsonError(httplib::Response &res, int status, const std::string &name,
                  const std::string &message) {
  res.status = status;
  nlohmann::json j;
  j["error"] = name;
  j["message"] = message;
  res.set_content(j.dump(), CONTENT_JSON);
}

void setJson(httplib::Response &res, int status, const nlohmann::json &j) {
  res.status = status;
  res.set_content(j.dump(), CONTENT_JSON);
}

nlohmann::json okBody() {
  nlohmann::json j;
  j["ok"] = true;
  return j;
}

// Transaction record with optional string 'signature' and 'proof' evidence
Node::Roe<Transaction> parseSubmission(const nlohmann::json &j,
                                       Node::Attestation &attestation) {
  auto tx = Transaction::fromJson(j);
  if (!tx) {
    int32_t code = tx.error().code == Transaction::E_INVALID_AMOUNT
                       ? Node::E_INVALID_AMOUNT
                       : Node::E_MALFORMED_RECORD;
    return Node::Error(code, tx.error().message);
  }

  for (const char *field : { "signature", "proof" }) {
    if (j.contains(field) && !j[field].is_string()) {
      return Node::Error(Node::E_MALFORMED_RECORD,
                         std::string("'") + field + "' must be a string");
    }
  }
  attestation.signature = j.value("signature", "");
  attestation.proof = j.value("proof", "");
  return tx.value();
}

} // namespace

nlohmann::json NodeServer::RunFileConfig::toJson() const {
  nlohmann::json j;
  j["address"] = address;
  j["host"] = host;
  j["port"] = port;
  j["difficulty"] = difficulty;
  j["peers"] = peers;
  j["peerTimeoutMs"] = peerTimeoutMs;
  j["logLevel"] = logLevel;
  return j;
}

NodeServer::Roe<void>
NodeServer::RunFileConfig::fromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Configuration must be a JSON object");
  }

  if (jd.contains("address")) {
    if (!jd["address"].is_string() || jd["address"].get<std::string>().empty()) {
      return Error(E_CONFIG, "'address' must be a non-empty string");
    }
    address = jd["address"].get<std::string>();
  }

  if (jd.contains("host")) {
    if (!jd["host"].is_string()) {
      return Error(E_CONFIG, "'host' must be a string");
    }
    host = jd["host"].get<std::string>();
  }

  if (jd.contains("port")) {
    if (!jd["port"].is_number_integer()) {
      return Error(E_CONFIG, "'port' is not an integer");
    }
    int64_t value = jd["port"].get<int64_t>();
    if (value < 1 || value > 65535) {
      return Error(E_CONFIG, "'port' is out of range: " + std::to_string(value));
    }
    port = static_cast<uint16_t>(value);
  }

  if (jd.contains("difficulty")) {
    if (!jd["difficulty"].is_number_integer()) {
      return Error(E_CONFIG, "'difficulty' is not an integer");
    }
    int64_t value = jd["difficulty"].get<int64_t>();
    // A SHA-256 hex digest has 64 nibbles
    if (value < 0 || value > 64) {
      return Error(E_CONFIG,
                   "'difficulty' must be within 0..64: " + std::to_string(value));
    }
    difficulty = static_cast<uint32_t>(value);
  }

  if (jd.contains("peers")) {
    if (!jd["peers"].is_array()) {
      return Error(E_CONFIG, "'peers' must be an array");
    }
    peers.clear();
    for (const auto &peer : jd["peers"]) {
      if (!peer.is_string()) {
        return Error(E_CONFIG, "'peers' entries must be host:port strings");
      }
      peers.push_back(peer.get<std::string>());
    }
  }

  if (jd.contains("peerTimeoutMs")) {
    if (!jd["peerTimeoutMs"].is_number_integer() ||
        jd["peerTimeoutMs"].get<int64_t>() <= 0) {
      return Error(E_CONFIG, "'peerTimeoutMs' must be a positive integer");
    }
    peerTimeoutMs = jd["peerTimeoutMs"].get<int64_t>();
  }

  if (jd.contains("logLevel")) {
    if (!jd["logLevel"].is_string()) {
      return Error(E_CONFIG, "'logLevel' must be a string");
    }
    logLevel = jd["logLevel"].get<std::string>();
  }

  return {};
}

NodeServer::NodeServer()
    : Service("NodeServer"),
      spTransport_(std::make_shared<network::HttpTransport>()),
      network_(spTransport_), node_(network_) {
  node_.redirectLogger(log().getFullName());
  network_.redirectLogger(log().getFullName());
  spTransport_->redirectLogger(log().getFullName());
}

NodeServer::~NodeServer() { stop(); }

Service::Roe<void> NodeServer::start(const std::string &workDir,
                                     const Overrides &overrides) {
  if (!isStopSet()) {
    return Service::Error(E_RUNNING, "NodeServer is already running");
  }

  std::error_code ec;
  std::filesystem::create_directories(workDir, ec);
  if (ec) {
    return Service::Error(E_WORK_DIR, "Failed to create work directory " +
                                          workDir + ": " + ec.message());
  }

  workDir_ = workDir;
  overrides_ = overrides;

  log().info << "Starting NodeServer with work directory: " << workDir;
  log().addFileHandler(workDir + "/" + FILE_LOG, logging::Level::DEBUG);

  return Service::start();
}

NodeServer::Roe<void>
NodeServer::ensureConfigFile(const std::string &configPath) {
  if (std::filesystem::exists(configPath)) {
    return {};
  }

  log().info << "No " << FILE_CONFIG << " found, creating with default values";
  auto written =
      utl::writeToNewFile(configPath, RunFileConfig().toJson().dump(2) + "\n");
  if (!written) {
    return Error(E_CONFIG, "Failed to create " + std::string(FILE_CONFIG) +
                               ": " + written.error().message);
  }

  log().info << "Created " << FILE_CONFIG << " at: " << configPath;
  log().info << "Please edit " << FILE_CONFIG << " to configure your node";
  return {};
}

NodeServer::Roe<void> NodeServer::loadConfig(const std::string &configPath) {
  auto jsonResult = utl::loadJsonFile(configPath);
  if (!jsonResult) {
    return Error(E_CONFIG, jsonResult.error().message);
  }

  RunFileConfig config;
  auto parsed = config.fromJson(jsonResult.value());
  if (!parsed) {
    return Error(E_CONFIG, configPath + ": " + parsed.error().message);
  }

  if (overrides_.port) {
    config.port = *overrides_.port;
  }
  if (overrides_.difficulty) {
    config.difficulty = *overrides_.difficulty;
  }
  for (const auto &peer : overrides_.peers) {
    config.peers.push_back(peer);
  }

  config_ = config;
  log().info << "Configuration loaded from " << configPath;
  return {};
}

Service::Roe<void> NodeServer::onStart() {
  std::string configPath =
      (std::filesystem::path(workDir_) / FILE_CONFIG).string();

  auto configReady = ensureConfigFile(configPath);
  if (!configReady) {
    return Service::Error(E_CONFIG, configReady.error().message);
  }
  auto loaded = loadConfig(configPath);
  if (!loaded) {
    return Service::Error(E_CONFIG, "Failed to load configuration: " +
                                        loaded.error().message);
  }

  log().setLevel(logging::parseLevel(config_.logLevel));

  network::PeerNetwork::Config networkConfig;
  networkConfig.timeout = std::chrono::milliseconds(config_.peerTimeoutMs);
  network_.init(networkConfig);

  Node::Config nodeConfig;
  nodeConfig.address = config_.address;
  nodeConfig.difficulty = config_.difficulty;
  auto nodeReady = node_.init(nodeConfig);
  if (!nodeReady) {
    return Service::Error(E_NODE, nodeReady.error().message);
  }

  for (const auto &peer : config_.peers) {
    auto registered = node_.registerPeer(peer);
    if (!registered) {
      return Service::Error(E_CONFIG, "Invalid peer in configuration: " +
                                          registered.error().message);
    }
    log().info << "Registered peer " << peer;
  }

  initHandlers();

  if (config_.port == 0) {
    int bound = server_.bind_to_any_port(config_.host);
    if (bound <= 0) {
      return Service::Error(E_BIND, "Failed to bind " + config_.host);
    }
    port_ = static_cast<uint16_t>(bound);
  } else {
    if (!server_.bind_to_port(config_.host, config_.port)) {
      return Service::Error(E_BIND, "Failed to bind " + config_.host + ":" +
                                        std::to_string(config_.port));
    }
    port_ = config_.port;
  }

  log().info << "Node " << config_.address << " listening on " << config_.host
             << ":" << port_ << ", peers: ["
             << utl::join(config_.peers, ", ") << "]";
  return {};
}

void NodeServer::runLoop() {
  if (!server_.listen_after_bind()) {
    log().error << "HTTP listener exited with an error";
  }
  log().info << "HTTP listener stopped";
}

void NodeServer::onStopRequested() {
  node_.shutdown();
  server_.wait_until_ready();
  server_.stop();
}

void NodeServer::onStop() { log().info << "NodeServer stopped"; }

void NodeServer::initHandlers() {
  server_.set_logger([this](const httplib::Request &req,
                            const httplib::Response &res) {
    log().debug << req.method << " " << req.path << " " << res.status << " ("
                << (req.remote_addr.empty() ? "-" : req.remote_addr) << ")";
  });
  server_.set_error_logger(
      [this](const httplib::Error &err, const httplib::Request *req) {
        std::string path = req ? req->path : "-";
        log().error << "HTTP error " << httplib::to_string(err)
                    << " path=" << path;
      });

  server_.Get(network::PeerNetwork::PATH_CHAIN,
              [this](const httplib::Request &req, httplib::Response &res) {
                hGetChain(req, res);
              });
  server_.Post(network::PeerNetwork::PATH_EVENTS,
               [this](const httplib::Request &req, httplib::Response &res) {
                 hPostEvent(req, res);
               });
  server_.Post("/transactions",
               [this](const httplib::Request &req, httplib::Response &res) {
                 hPostTransaction(req, res);
               });
  server_.Post("/mine",
               [this](const httplib::Request &req, httplib::Response &res) {
                 hPostMine(req, res);
               });
  server_.Post("/resolve",
               [this](const httplib::Request &req, httplib::Response &res) {
                 hPostResolve(req, res);
               });
  server_.Post("/peers",
               [this](const httplib::Request &req, httplib::Response &res) {
                 hPostPeer(req, res);
               });
  server_.Get("/peers",
              [this](const httplib::Request &req, httplib::Response &res) {
                hGetPeers(req, res);
              });
  server_.Get("/balance",
              [this](const httplib::Request &req, httplib::Response &res) {
                hGetBalance(req, res);
              });
  server_.Get("/status",
              [this](const httplib::Request &req, httplib::Response &res) {
                hGetStatus(req, res);
              });
}

void NodeServer::hGetChain(const httplib::Request &, httplib::Response &res) {
  setJson(res, 200, node_.getChain().toJson());
}

void NodeServer::hPostEvent(const httplib::Request &req,
                            httplib::Response &res) {
  auto body = utl::parseJson(req.body);
  if (!body || !body.value().is_object() || !body.value().contains("event") ||
      !body.value()["event"].is_string()) {
    setJsonError(res, 400, Node::getErrorName(Node::E_MALFORMED_RECORD),
                 "Event must be an object with a string 'event'");
    return;
  }

  const nlohmann::json &envelope = body.value();
  std::string event = envelope["event"].get<std::string>();
  if (event == Node::EVENT_NEW_TRANSACTION) {
    hNewTransactionEvent(envelope.value("payload", nlohmann::json()), res);
    return;
  }
  if (event != Node::EVENT_CHAIN_UPDATE) {
    log().debug << "Ignoring event " << event << " from " << req.remote_addr;
    setJson(res, 200, okBody());
    return;
  }

  auto chain = Chain::fromJson(envelope.value("payload", nlohmann::json()));
  if (!chain) {
    setJsonError(res, 400, Node::getErrorName(Node::E_MALFORMED_RECORD),
                 chain.error().message);
    return;
  }

  nlohmann::json reply = okBody();
  reply["changed"] = node_.receiveChain(chain.value());
  setJson(res, 200, reply);
}

void NodeServer::hNewTransactionEvent(const nlohmann::json &payload,
                                      httplib::Response &res) {
  Node::Attestation attestation;
  auto tx = parseSubmission(payload, attestation);
  if (!tx) {
    setJsonError(res, 400, Node::getErrorName(tx.error().code),
                 tx.error().message);
    return;
  }

  nlohmann::json reply = okBody();
  auto submitted = node_.submitTransaction(tx.value(), attestation);
  if (!submitted) {
    if (submitted.error().code != Node::E_DUPLICATE_TRANSACTION) {
      setJsonError(res, 400, Node::getErrorName(submitted.error().code),
                   submitted.error().message);
      return;
    }
    reply["known"] = true;
  }
  setJson(res, 200, reply);
}

void NodeServer::hPostTransaction(const httplib::Request &req,
                                  httplib::Response &res) {
  auto body = utl::parseJson(req.body);
  if (!body) {
    setJsonError(res, 400, Node::getErrorName(Node::E_MALFORMED_RECORD),
                 body.error().message);
    return;
  }

  Node::Attestation attestation;
  auto tx = parseSubmission(body.value(), attestation);
  if (!tx) {
    setJsonError(res, 400, Node::getErrorName(tx.error().code),
                 tx.error().message);
    return;
  }

  auto submitted = node_.submitTransaction(tx.value(), attestation);
  if (!submitted) {
    setJsonError(res, 400, Node::getErrorName(submitted.error().code),
                 submitted.error().message);
    return;
  }
  setJson(res, 201, okBody());
}

void NodeServer::hPostMine(const httplib::Request &req,
                           httplib::Response &res) {
  std::string minerAddress = config_.address;
  if (!req.body.empty()) {
    auto body = utl::parseJson(req.body);
    if (!body || !body.value().is_object()) {
      setJsonError(res, 400, Node::getErrorName(Node::E_MALFORMED_RECORD),
                   "Mine request body must be a JSON object");
      return;
    }
    if (body.value().contains("miner_address")) {
      if (!body.value()["miner_address"].is_string()) {
        setJsonError(res, 400, Node::getErrorName(Node::E_INVALID_ADDRESS),
                     "'miner_address' must be a string");
        return;
      }
      minerAddress = body.value()["miner_address"].get<std::string>();
    }
  }

  auto block = node_.mine(minerAddress);
  if (!block) {
    int status = 500;
    switch (block.error().code) {
    case Node::E_INVALID_ADDRESS:
      status = 400;
      break;
    case Node::E_MINING_CANCELLED:
      status = 409;
      break;
    default:
      break;
    }
    setJsonError(res, status, Node::getErrorName(block.error().code),
                 block.error().message);
    return;
  }
  setJson(res, 200, block.value().toJson());
}

void NodeServer::hPostResolve(const httplib::Request &,
                              httplib::Response &res) {
  nlohmann::json reply;
  reply["changed"] = node_.resolveConflicts();
  setJson(res, 200, reply);
}

void NodeServer::hPostPeer(const httplib::Request &req,
                           httplib::Response &res) {
  auto body = utl::parseJson(req.body);
  if (!body || !body.value().is_object() ||
      !body.value().contains("address") ||
      !body.value()["address"].is_string()) {
    setJsonError(res, 400, Node::getErrorName(Node::E_INVALID_ADDRESS),
                 "Peer request requires a string 'address'");
    return;
  }

  auto registered =
      node_.registerPeer(body.value()["address"].get<std::string>());
  if (!registered) {
    setJsonError(res, 400, Node::getErrorName(registered.error().code),
                 registered.error().message);
    return;
  }
  setJson(res, 200, okBody());
}

void NodeServer::hGetPeers(const httplib::Request &, httplib::Response &res) {
  setJson(res, 200, node_.getPeers());
}

void NodeServer::hGetBalance(const httplib::Request &req,
                             httplib::Response &res) {
  std::string address = req.get_param_value("address");
  if (address.empty()) {
    setJsonError(res, 400, Node::getErrorName(Node::E_INVALID_ADDRESS),
                 "Query parameter 'address' is required");
    return;
  }

  auto balance = node_.getBalance(address);
  if (!balance) {
    setJsonError(res, 500, Node::getErrorName(balance.error().code),
                 balance.error().message);
    return;
  }

  nlohmann::json reply;
  reply["address"] = address;
  reply["balance"] = balance.value();
  setJson(res, 200, reply);
}

void NodeServer::hGetStatus(const httplib::Request &, httplib::Response &res) {
  nlohmann::json reply;
  reply["address"] = config_.address;
  reply["length"] = node_.getChainLength();
  reply["pending"] = node_.getPendingCount();
  reply["peers"] = node_.getPeers();
  reply["difficulty"] = config_.difficulty;
  setJson(res, 200, reply);
}

} // namespace sy
