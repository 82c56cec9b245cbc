#pragma once

#include "Block.h"
#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sy {

/**
 * Append-only sequence of blocks starting at the genesis block.
 *
 * A Chain built through append() is always linked. Chains from other sources
 * (fromBlocks, fromJson) are raw and must pass validate() before use.
 */
class Chain {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_CHAIN_LINKAGE = 1;
  constexpr static int32_t E_INVALID = 2;
  constexpr static int32_t E_MALFORMED = 3;
  constexpr static int32_t E_OVERFLOW = 4;

  /**
   * The fixed index-0 block shared by every node.
   */
  static Block genesisBlock();

  /**
   * Chain holding only the genesis block.
   */
  static Chain genesis();

  static Chain fromBlocks(std::vector<Block> blocks);

  /**
   * Parse the peer wire form (array of block records). Structure only, the
   * result is not validated.
   */
  static Roe<Chain> fromJson(const nlohmann::json &j);

  Chain();

  /**
   * Append a block on top of the tip.
   * @return E_CHAIN_LINKAGE unless block.previousHash is the tip hash and
   * block.index is the tip index + 1
   */
  Roe<void> append(const Block &block);

  /**
   * Full-history check: genesis invariants, recomputed hashes, hash links
   * and index continuity. With difficulty > 0 every non-genesis block must
   * also carry a sufficient proof of work.
   * @return E_INVALID naming the first offending block
   */
  Roe<void> check(uint32_t difficulty = 0) const;

  bool validate(uint32_t difficulty = 0) const { return check(difficulty).isOk(); }

  // Precondition: chain is not empty
  const Block &latest() const { return blocks_.back(); }
  size_t length() const { return blocks_.size(); }
  const std::vector<Block> &blocks() const { return blocks_; }

  /**
   * Received minus sent for the address over every block.
   * @return E_OVERFLOW if the running sum leaves the int64 range
   */
  Roe<int64_t> getBalance(const std::string &address) const;

  nlohmann::json toJson() const;

private:
  std::vector<Block> blocks_;
};

} // namespace sy
