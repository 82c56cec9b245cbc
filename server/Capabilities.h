#pragma once

#include "ProofSystem.hpp"
#include "Signer.hpp"

#include <string>

namespace sy {

/**
 * Signer that signs nothing and accepts everything.
 * Default for nodes that run without a signature scheme.
 */
class NoopSigner : public iii::Signer {
public:
  std::string sign(const std::string &message) const override { return ""; }

  bool verify(const std::string &message, const std::string &signature,
              const std::string &signerId) const override {
    return true;
  }
};

/**
 * Proof system that proves nothing and accepts everything.
 */
class NoopProofSystem : public iii::ProofSystem {
public:
  std::string prove(const std::string &statement) const override { return ""; }

  bool verify(const std::string &statement,
              const std::string &proof) const override {
    return true;
  }
};

} // namespace sy
