#include "Chain.h"

namespace sy {

Block Chain::genesisBlock() {
  return Block(0, {}, Block::GENESIS_PREVIOUS_HASH, 0);
}

Chain Chain::genesis() { return Chain(); }

Chain Chain::fromBlocks(std::vector<Block> blocks) {
  Chain chain;
  chain.blocks_ = std::move(blocks);
  return chain;
}

Chain::Roe<Chain> Chain::fromJson(const nlohmann::json &j) {
  if (!j.is_array()) {
    return Error(E_MALFORMED, "Chain must be an array of blocks");
  }
  std::vector<Block> blocks;
  blocks.reserve(j.size());
  for (const auto &blockJson : j) {
    auto result = Block::fromJson(blockJson);
    if (!result) {
      return Error(E_MALFORMED, result.error().message);
    }
    blocks.push_back(result.value());
  }
  return fromBlocks(std::move(blocks));
}

Chain::Chain() { blocks_.push_back(genesisBlock()); }

Chain::Roe<void> Chain::append(const Block &block) {
  const Block &tip = latest();
  if (block.previousHash != tip.hash) {
    return Error(E_CHAIN_LINKAGE, "Block " + std::to_string(block.index) +
                                      " does not link to tip hash " + tip.hash);
  }
  if (block.index != tip.index + 1) {
    return Error(E_CHAIN_LINKAGE,
                 "Block index " + std::to_string(block.index) +
                     " does not follow tip index " + std::to_string(tip.index));
  }
  blocks_.push_back(block);
  return {};
}

Chain::Roe<void> Chain::check(uint32_t difficulty) const {
  if (blocks_.empty()) {
    return Error(E_INVALID, "Chain is empty");
  }

  const Block &first = blocks_.front();
  if (first.index != 0 || !first.transactions.empty() ||
      first.previousHash != Block::GENESIS_PREVIOUS_HASH) {
    return Error(E_INVALID, "Genesis block is malformed");
  }
  if (first.hash != first.calculateHash()) {
    return Error(E_INVALID, "Genesis block hash mismatch");
  }

  for (size_t i = 1; i < blocks_.size(); ++i) {
    const Block &block = blocks_[i];
    const Block &prev = blocks_[i - 1];
    if (block.hash != block.calculateHash()) {
      return Error(E_INVALID, "Block " + std::to_string(i) + " hash mismatch");
    }
    if (block.previousHash != prev.hash) {
      return Error(E_INVALID,
                   "Block " + std::to_string(i) + " breaks the hash link");
    }
    if (block.index != i) {
      return Error(E_INVALID, "Block " + std::to_string(i) +
                                  " has index " + std::to_string(block.index));
    }
    if (difficulty > 0 && !block.meetsDifficulty(difficulty)) {
      return Error(E_INVALID, "Block " + std::to_string(i) +
                                  " lacks proof of work for difficulty " +
                                  std::to_string(difficulty));
    }
  }
  return {};
}

Chain::Roe<int64_t> Chain::getBalance(const std::string &address) const {
  int64_t balance = 0;
  for (const auto &block : blocks_) {
    for (const auto &tx : block.transactions) {
      if (tx.getRecipient() == address &&
          __builtin_add_overflow(balance, tx.getAmount(), &balance)) {
        return Error(E_OVERFLOW, "Balance of " + address +
                                     " overflows at block " +
                                     std::to_string(block.index));
      }
      if (tx.getSender() == address &&
          __builtin_sub_overflow(balance, tx.getAmount(), &balance)) {
        return Error(E_OVERFLOW, "Balance of " + address +
                                     " overflows at block " +
                                     std::to_string(block.index));
      }
    }
  }
  return balance;
}

nlohmann::json Chain::toJson() const {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &block : blocks_) {
    j.push_back(block.toJson());
  }
  return j;
}

} // namespace sy
