#include "ConsensusEngine.h"

namespace sy {
namespace consensus {

ConsensusEngine::ConsensusEngine() : Module("consensus") {}

void ConsensusEngine::init(const Config &config) {
  config_ = config;
  log().info << "Fork choice: longest valid chain, difficulty "
             << config_.difficulty;
}

int64_t ConsensusEngine::select(const Chain &local,
                                const std::vector<Chain> &candidates,
                                size_t *pRejected) const {
  int64_t best = -1;
  size_t bestLength = local.length();
  size_t rejected = 0;

  for (size_t i = 0; i < candidates.size(); ++i) {
    const Chain &candidate = candidates[i];
    if (candidate.length() <= local.length()) {
      log().debug << "Candidate " << i << " with length " << candidate.length()
                  << " is not longer than local " << local.length();
      continue;
    }

    auto check = candidate.check(config_.difficulty);
    if (!check) {
      ++rejected;
      log().warning << "Invalid chain candidate " << i << " (length "
                    << candidate.length() << "): " << check.error().message;
      continue;
    }

    if (candidate.length() > bestLength) {
      best = static_cast<int64_t>(i);
      bestLength = candidate.length();
    }
  }

  if (pRejected) {
    *pRejected = rejected;
  }
  return best;
}

ConsensusEngine::Resolution
ConsensusEngine::resolve(Chain &local,
                         const std::vector<Chain> &candidates) const {
  Resolution resolution;
  resolution.candidates = candidates.size();

  int64_t best = select(local, candidates, &resolution.rejected);
  if (best >= 0) {
    const Chain &winner = candidates[static_cast<size_t>(best)];
    if (winner.latest().hash != local.latest().hash) {
      log().info << "Replacing local chain of length " << local.length()
                 << " with candidate of length " << winner.length();
      local = winner;
      resolution.changed = true;
    }
  }

  resolution.length = local.length();
  return resolution;
}

} // namespace consensus
} // namespace sy
