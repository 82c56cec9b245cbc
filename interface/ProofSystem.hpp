#pragma once

#include <string>

namespace sy {
namespace iii {

/**
 * Proof capability for private transfers. Proofs are opaque to the ledger.
 */
class ProofSystem {
public:
  virtual ~ProofSystem() = default;

  virtual std::string prove(const std::string &statement) const = 0;
  virtual bool verify(const std::string &statement,
                      const std::string &proof) const = 0;
};

} // namespace iii
} // namespace sy
