#include "Block.h"
#include "BinaryPack.hpp"
#include "Utilities.h"

namespace sy {

const std::string Block::GENESIS_PREVIOUS_HASH(64, '0');

Block::Block(uint64_t index, std::vector<Transaction> transactions,
             std::string previousHash, int64_t timestamp)
    : index(index), transactions(std::move(transactions)),
      previousHash(std::move(previousHash)),
      timestamp(timestamp < 0 ? utl::getCurrentTimeMs() : timestamp) {
  hash = calculateHash();
}

std::string Block::calculateHash() const {
  return utl::sha256(utl::binaryPack(*this));
}

bool Block::meetsDifficulty(uint32_t difficulty) const {
  return utl::countLeadingZeroNibbles(hash) >= difficulty;
}

Block::Roe<void> Block::mine(uint32_t difficulty,
                             const std::atomic<bool> &cancel) {
  hash = calculateHash();
  while (!meetsDifficulty(difficulty)) {
    if (cancel.load(std::memory_order_relaxed)) {
      return Error(E_CANCELLED, "Mining of block " + std::to_string(index) +
                                    " cancelled at nonce " +
                                    std::to_string(nonce));
    }
    ++nonce;
    hash = calculateHash();
  }
  return {};
}

Block::Roe<void> Block::mine(uint32_t difficulty) {
  std::atomic<bool> never{ false };
  return mine(difficulty, never);
}

nlohmann::json Block::toJson() const {
  nlohmann::json j;
  j["index"] = index;
  j["timestamp"] = timestamp;
  nlohmann::json txArray = nlohmann::json::array();
  for (const auto &tx : transactions) {
    txArray.push_back(tx.toJson());
  }
  j["transactions"] = txArray;
  j["previous_hash"] = previousHash;
  j["nonce"] = nonce;
  j["hash"] = hash;
  return j;
}

Block::Roe<Block> Block::fromJson(const nlohmann::json &j) {
  if (!j.is_object()) {
    return Error(E_MALFORMED, "Block record must be an object");
  }
  for (const char *key :
       { "index", "timestamp", "transactions", "previous_hash", "nonce",
         "hash" }) {
    if (!j.contains(key)) {
      return Error(E_MALFORMED, std::string("Block record missing ") + key);
    }
  }
  if (!j["index"].is_number_unsigned() || !j["timestamp"].is_number_integer() ||
      !j["transactions"].is_array() || !j["previous_hash"].is_string() ||
      !j["nonce"].is_number_unsigned() || !j["hash"].is_string()) {
    return Error(E_MALFORMED, "Block record has mistyped fields");
  }

  Block block;
  block.index = j["index"].get<uint64_t>();
  block.timestamp = j["timestamp"].get<int64_t>();
  block.previousHash = j["previous_hash"].get<std::string>();
  block.nonce = j["nonce"].get<uint64_t>();
  block.hash = j["hash"].get<std::string>();
  for (const auto &txJson : j["transactions"]) {
    auto txResult = Transaction::fromJson(txJson);
    if (!txResult) {
      return Error(E_MALFORMED, "Block " + std::to_string(block.index) +
                                    ": " + txResult.error().message);
    }
    block.transactions.push_back(txResult.value());
  }
  return block;
}

} // namespace sy
