#pragma once

#include "Transaction.h"
#include "ResultOrError.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace sy {

/**
 * Pending transactions, unique by identity hash, kept in submission order.
 * Not synchronized; the owning node serializes access.
 */
class Mempool {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_DUPLICATE = 1;

  Roe<void> add(const Transaction &tx);

  /**
   * Remove and return every pending transaction in submission order.
   */
  std::vector<Transaction> drain();

  /**
   * Drop one pending transaction.
   * @return false if it was not pending
   */
  bool remove(const std::string &identityHash);

  bool contains(const std::string &identityHash) const;
  size_t size() const { return order_.size(); }
  bool empty() const { return order_.empty(); }

  std::vector<Transaction> snapshot() const;

private:
  std::unordered_map<std::string, Transaction> byHash_;
  std::vector<std::string> order_;
};

} // namespace sy
