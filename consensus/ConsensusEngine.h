#pragma once

#include "Chain.h"
#include "Module.h"

#include <cstdint>
#include <vector>

namespace sy {
namespace consensus {

/**
 * Longest-valid-chain fork choice.
 *
 * Stateless apart from configuration: given the local chain and a set of raw
 * candidate chains, a single pass decides whether one candidate replaces the
 * local chain. Ties keep the local chain.
 */
class ConsensusEngine : public Module {
public:
  struct Config {
    uint32_t difficulty{ 0 }; // proof of work required of candidate blocks
  };

  struct Resolution {
    bool changed{ false };
    size_t candidates{ 0 };
    size_t rejected{ 0 }; // longer candidates that failed validation
    size_t length{ 0 };   // local length after resolution
  };

  ConsensusEngine();
  ~ConsensusEngine() override = default;

  void init(const Config &config);
  const Config &getConfig() const { return config_; }

  /**
   * Replace `local` with the longest valid candidate if that candidate is
   * strictly longer and differs from it.
   */
  Resolution resolve(Chain &local, const std::vector<Chain> &candidates) const;

  /**
   * Pick the winning candidate without touching the local chain.
   * @return Index into candidates, or -1 when the local chain stays
   */
  int64_t select(const Chain &local, const std::vector<Chain> &candidates,
                 size_t *pRejected = nullptr) const;

private:
  Config config_;
};

} // namespace consensus
} // namespace sy
