#pragma once

#include "Transaction.h"
#include "ResultOrError.hpp"

#include <atomic>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sy {

/**
 * Ordered batch of transactions sealed by a proof-of-work nonce.
 *
 * hash covers every other field and is never part of its own input.
 */
struct Block {
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CANCELLED = 1;
  constexpr static int32_t E_MALFORMED = 2;

  // previousHash of the genesis block
  static const std::string GENESIS_PREVIOUS_HASH;

  uint64_t index{ 0 };
  std::vector<Transaction> transactions;
  std::string previousHash;
  int64_t timestamp{ 0 }; // ms since epoch
  uint64_t nonce{ 0 };
  std::string hash;

  Block() = default;

  /**
   * Build an unsealed block with nonce 0 and its hash computed.
   * A negative timestamp means "now".
   */
  Block(uint64_t index, std::vector<Transaction> transactions,
        std::string previousHash, int64_t timestamp = -1);

  template <typename Archive> void serialize(Archive &ar) {
    ar & index & transactions & previousHash & timestamp & nonce;
  }

  std::string calculateHash() const;

  /**
   * True if the stored hash has at least `difficulty` leading zero nibbles.
   */
  bool meetsDifficulty(uint32_t difficulty) const;

  /**
   * Search nonces until the hash meets the difficulty.
   * cancel is polled once per attempt. On E_CANCELLED the block is left
   * consistent (hash matches the current nonce) but unsealed.
   */
  Roe<void> mine(uint32_t difficulty, const std::atomic<bool> &cancel);
  Roe<void> mine(uint32_t difficulty);

  nlohmann::json toJson() const;

  /**
   * Parse a block record. The stored hash is kept as given so that
   * tampering is visible to validation.
   */
  static Roe<Block> fromJson(const nlohmann::json &j);
};

} // namespace sy
