#ifndef SY_LEDGER_TRANSACTION_H
#define SY_LEDGER_TRANSACTION_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>

namespace sy {

/**
 * Immutable transfer record.
 *
 * The identity hash is a pure function of (sender, recipient, amount), so two
 * submissions of the same transfer collide on purpose.
 */
class Transaction {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };
  template <typename T> using Roe = ResultOrError<T, Error>;

  constexpr static int32_t E_INVALID_AMOUNT = 1;
  constexpr static int32_t E_MALFORMED = 2;

  /**
   * @return The transaction, or E_INVALID_AMOUNT when amount <= 0
   */
  static Roe<Transaction> create(const std::string &sender,
                                 const std::string &recipient, int64_t amount);

  /**
   * Parse the wire form {sender, recipient, amount}.
   * The identity hash is recomputed, never read from the record.
   */
  static Roe<Transaction> fromJson(const nlohmann::json &j);

  const std::string &getSender() const { return sender_; }
  const std::string &getRecipient() const { return recipient_; }
  int64_t getAmount() const { return amount_; }
  const std::string &getIdentityHash() const { return identityHash_; }

  nlohmann::json toJson() const;

  bool operator==(const Transaction &other) const {
    return identityHash_ == other.identityHash_;
  }

  template <typename Archive> void serialize(Archive &ar) {
    ar & sender_ & recipient_ & amount_;
  }

private:
  Transaction(const std::string &sender, const std::string &recipient,
              int64_t amount);

  std::string sender_;
  std::string recipient_;
  int64_t amount_{ 0 };
  std::string identityHash_;
};

} // namespace sy

#endif // SY_LEDGER_TRANSACTION_H
