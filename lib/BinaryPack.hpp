#ifndef SY_LEDGER_BINARY_PACK_HPP
#define SY_LEDGER_BINARY_PACK_HPP

#include "Serialize.hpp"
#include <sstream>
#include <string>

namespace sy {
namespace utl {

/**
 * Pack a struct/object to binary string using OutputArchive
 * @param t The object to serialize
 * @return Binary string representation
 */
template <typename T> std::string binaryPack(const T &t) {
  std::ostringstream oss;
  OutputArchive ar(oss);
  ar &t;
  return oss.str();
}

} // namespace utl
} // namespace sy

#endif // SY_LEDGER_BINARY_PACK_HPP
