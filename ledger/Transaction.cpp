#include "Transaction.h"
#include "BinaryPack.hpp"
#include "Utilities.h"

namespace sy {

Transaction::Transaction(const std::string &sender,
                         const std::string &recipient, int64_t amount)
    : sender_(sender), recipient_(recipient), amount_(amount) {
  identityHash_ = utl::sha256(utl::binaryPack(*this));
}

Transaction::Roe<Transaction> Transaction::create(const std::string &sender,
                                                  const std::string &recipient,
                                                  int64_t amount) {
  if (amount <= 0) {
    return Error(E_INVALID_AMOUNT,
                 "Amount must be positive, got " + std::to_string(amount));
  }
  return Transaction(sender, recipient, amount);
}

Transaction::Roe<Transaction> Transaction::fromJson(const nlohmann::json &j) {
  if (!j.is_object() || !j.contains("sender") || !j.contains("recipient") ||
      !j.contains("amount")) {
    return Error(E_MALFORMED,
                 "Transaction record requires sender, recipient and amount");
  }
  if (!j["sender"].is_string() || !j["recipient"].is_string() ||
      !j["amount"].is_number_integer()) {
    return Error(E_MALFORMED, "Transaction record has mistyped fields");
  }
  return create(j["sender"].get<std::string>(),
                j["recipient"].get<std::string>(), j["amount"].get<int64_t>());
}

nlohmann::json Transaction::toJson() const {
  nlohmann::json j;
  j["sender"] = sender_;
  j["recipient"] = recipient_;
  j["amount"] = amount_;
  return j;
}

} // namespace sy
