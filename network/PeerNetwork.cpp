#include "PeerNetwork.h"
#include "Utilities.h"

#include <future>

namespace sy {
namespace network {

PeerNetwork::PeerNetwork(std::shared_ptr<iii::PeerTransport> spTransport)
    : Module("network.peers"), spTransport_(std::move(spTransport)) {}

void PeerNetwork::init(const Config &config) { config_ = config; }

PeerNetwork::Roe<void> PeerNetwork::registerPeer(const std::string &address) {
  std::string host;
  uint16_t port = 0;
  if (!utl::parseHostPort(address, host, port)) {
    return Error(E_INVALID_ADDRESS,
                 "Peer address must be host:port, got '" + address + "'");
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (peers_.insert(address).second) {
    log().info << "Registered peer " << address;
  }
  return {};
}

std::vector<std::string> PeerNetwork::getPeers() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::vector<std::string>(peers_.begin(), peers_.end());
}

std::vector<PeerNetwork::Delivery>
PeerNetwork::broadcast(const std::string &event,
                       const nlohmann::json &payload) {
  nlohmann::json message;
  message["event"] = event;
  message["payload"] = payload;
  const std::string body = message.dump();

  std::vector<std::string> peers = getPeers();
  std::vector<std::future<iii::PeerTransport::Roe<std::string>>> futures;
  futures.reserve(peers.size());
  for (const auto &peer : peers) {
    futures.push_back(std::async(std::launch::async, [this, peer, &body]() {
      return spTransport_->post(peer, PATH_EVENTS, body, config_.timeout);
    }));
  }

  std::vector<Delivery> deliveries;
  deliveries.reserve(peers.size());
  size_t delivered = 0;
  for (size_t i = 0; i < peers.size(); ++i) {
    auto result = futures[i].get();
    Delivery delivery;
    delivery.peer = peers[i];
    delivery.ok = result.isOk();
    if (result.isOk()) {
      ++delivered;
    } else {
      delivery.error = result.error().message;
      log().warning << "Peer unreachable: " << peers[i] << " (" << event
                    << "): " << delivery.error;
    }
    deliveries.push_back(delivery);
  }

  log().debug << "Broadcast " << event << " delivered to " << delivered << "/"
              << peers.size() << " peers";
  return deliveries;
}

std::vector<Chain> PeerNetwork::fetchChains() {
  std::vector<std::string> peers = getPeers();
  std::vector<std::future<iii::PeerTransport::Roe<std::string>>> futures;
  futures.reserve(peers.size());
  for (const auto &peer : peers) {
    futures.push_back(std::async(std::launch::async, [this, peer]() {
      return spTransport_->get(peer, PATH_CHAIN, config_.timeout);
    }));
  }

  std::vector<Chain> chains;
  for (size_t i = 0; i < peers.size(); ++i) {
    auto result = futures[i].get();
    if (!result) {
      log().warning << "Peer unreachable: " << peers[i]
                    << " (fetch chain): " << result.error().message;
      continue;
    }

    auto jsonResult = utl::parseJson(result.value());
    if (!jsonResult) {
      log().warning << "Peer " << peers[i]
                    << " sent unparsable chain: " << jsonResult.error().message;
      continue;
    }

    auto chainResult = Chain::fromJson(jsonResult.value());
    if (!chainResult) {
      log().warning << "Peer " << peers[i]
                    << " sent malformed chain: " << chainResult.error().message;
      continue;
    }
    chains.push_back(chainResult.value());
  }

  log().debug << "Fetched " << chains.size() << "/" << peers.size()
              << " peer chains";
  return chains;
}

} // namespace network
} // namespace sy
