#pragma once

#include <string>

namespace sy {
namespace iii {

/**
 * Signing capability attached to transaction submission.
 * The ledger core treats signatures as opaque strings.
 */
class Signer {
public:
  virtual ~Signer() = default;

  virtual std::string sign(const std::string &message) const = 0;

  /**
   * @param message Bytes that were signed (the transaction identity hash)
   * @param signature Signature supplied with the submission
   * @param signerId Claimed signer, normally the transaction sender
   */
  virtual bool verify(const std::string &message, const std::string &signature,
                      const std::string &signerId) const = 0;
};

} // namespace iii
} // namespace sy
