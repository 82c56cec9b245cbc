#include "Mempool.h"

#include <algorithm>

namespace sy {

Mempool::Roe<void> Mempool::add(const Transaction &tx) {
  const std::string &key = tx.getIdentityHash();
  if (byHash_.count(key) > 0) {
    return Error(E_DUPLICATE, "Transaction " + key + " is already pending");
  }
  byHash_.emplace(key, tx);
  order_.push_back(key);
  return {};
}

std::vector<Transaction> Mempool::drain() {
  std::vector<Transaction> result = snapshot();
  byHash_.clear();
  order_.clear();
  return result;
}

bool Mempool::remove(const std::string &identityHash) {
  if (byHash_.erase(identityHash) == 0) {
    return false;
  }
  order_.erase(std::find(order_.begin(), order_.end(), identityHash));
  return true;
}

bool Mempool::contains(const std::string &identityHash) const {
  return byHash_.count(identityHash) > 0;
}

std::vector<Transaction> Mempool::snapshot() const {
  std::vector<Transaction> result;
  result.reserve(order_.size());
  for (const auto &key : order_) {
    result.push_back(byHash_.at(key));
  }
  return result;
}

} // namespace sy
