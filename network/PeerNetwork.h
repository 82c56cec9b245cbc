#pragma once

#include "Chain.h"
#include "Module.h"
#include "PeerTransport.hpp"
#include "ResultOrError.hpp"

#include <chrono>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <set>
#include <string>
#include <vector>

namespace sy {
namespace network {

/**
 * PeerNetwork - registry of peer addresses plus best-effort fan-out.
 *
 * Every peer is contacted independently and concurrently. A failing peer is
 * logged and reported in the per-peer results, never as an error of the
 * whole operation.
 */
class PeerNetwork : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INVALID_ADDRESS = 1;

  constexpr static const char *PATH_EVENTS = "/events";
  constexpr static const char *PATH_CHAIN = "/chain";

  static constexpr std::chrono::milliseconds TIMEOUT_DEFAULT{ 5000 };

  struct Config {
    std::chrono::milliseconds timeout{ TIMEOUT_DEFAULT }; // per peer request
  };

  struct Delivery {
    std::string peer;
    bool ok{ false };
    std::string error;
  };

  explicit PeerNetwork(std::shared_ptr<iii::PeerTransport> spTransport);
  ~PeerNetwork() override = default;

  void init(const Config &config);

  /**
   * Add a peer. Registering a known peer again is a no-op.
   * @return E_INVALID_ADDRESS unless address is "host:port"
   */
  Roe<void> registerPeer(const std::string &address);

  std::vector<std::string> getPeers() const;

  /**
   * POST {event, payload} to every peer.
   * @return One entry per registered peer
   */
  std::vector<Delivery> broadcast(const std::string &event,
                                  const nlohmann::json &payload);

  /**
   * GET the chain of every peer. Peers that fail or answer with something
   * that is not a chain are left out.
   */
  std::vector<Chain> fetchChains();

private:
  Config config_;
  std::shared_ptr<iii::PeerTransport> spTransport_;
  mutable std::mutex mutex_;
  std::set<std::string> peers_;
};

} // namespace network
} // namespace sy
