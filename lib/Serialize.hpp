#ifndef SY_LEDGER_SERIALIZE_HPP
#define SY_LEDGER_SERIALIZE_HPP

#include <cstdint>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

namespace sy {

namespace detail {

template <typename T> static constexpr bool is_pointer_v = std::is_pointer_v<T>;

// Cache endianness detection result - initialized once on first use
inline bool isLittleEndian() {
  static const bool cached = []() {
    const uint16_t test = 0x0102;
    return reinterpret_cast<const uint8_t *>(&test)[0] == 0x02;
  }();
  return cached;
}

template <typename T> T swapBytes(T value) {
  uint8_t *bytes = reinterpret_cast<uint8_t *>(&value);
  constexpr size_t size = sizeof(T);
  for (size_t i = 0; i < size / 2; ++i) {
    std::swap(bytes[i], bytes[size - 1 - i]);
  }
  return value;
}

// Convert to big endian (network byte order) for machine-independent output
template <typename T> inline T toBigEndian(T value) {
  static_assert(std::is_same_v<T, uint16_t> || std::is_same_v<T, uint32_t> ||
                    std::is_same_v<T, uint64_t>,
                "toBigEndian only supports uint16_t, uint32_t, and uint64_t");
  return isLittleEndian() ? swapBytes(value) : value;
}

} // namespace detail

/**
 * OutputArchive for serialization (writing)
 * Supports the & operator pattern used by custom structs.
 * Integers are written big-endian, strings and vectors carry a uint64 size.
 *
 * Usage:
 *   std::ostringstream oss;
 *   OutputArchive ar(oss);
 *   ar & myValue;
 *   std::string data = oss.str();
 */
class OutputArchive {
public:
  explicit OutputArchive(std::ostream &os) : os_(os) {}

  void write(uint16_t value) {
    value = detail::toBigEndian(value);
    os_.write(reinterpret_cast<const char *>(&value), sizeof(value));
  }

  void write(uint32_t value) {
    value = detail::toBigEndian(value);
    os_.write(reinterpret_cast<const char *>(&value), sizeof(value));
  }

  void write(int32_t value) { write(static_cast<uint32_t>(value)); }

  void write(uint64_t value) {
    value = detail::toBigEndian(value);
    os_.write(reinterpret_cast<const char *>(&value), sizeof(value));
  }

  void write(int64_t value) { write(static_cast<uint64_t>(value)); }

  void write(const std::string &value) {
    uint64_t size = value.size();
    write(size);
    if (size > 0) {
      os_.write(value.data(), static_cast<std::streamsize>(size));
    }
  }

  template <typename T> void write(const std::vector<T> &value) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    uint64_t size = value.size();
    write(size);
    for (const auto &item : value) {
      (*this) & item;
    }
  }

  OutputArchive &operator&(uint16_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(int32_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint32_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(int64_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(uint64_t value) {
    write(value);
    return *this;
  }

  OutputArchive &operator&(const std::string &value) {
    write(value);
    return *this;
  }

  template <typename T> OutputArchive &operator&(const std::vector<T> &value) {
    write(value);
    return *this;
  }

  // Custom types provide template <typename Archive> void serialize(Archive&).
  // serialize() is non-const by convention, but OutputArchive only reads.
  template <typename T>
  auto operator&(const T &value)
      -> decltype(std::declval<T &>().template serialize<OutputArchive>(
                      std::declval<OutputArchive &>()),
                  *this) {
    static_assert(!detail::is_pointer_v<T>,
                  "Archive does not support pointers");
    const_cast<T &>(value).template serialize<OutputArchive>(*this);
    return *this;
  }

private:
  std::ostream &os_;
};

} // namespace sy

#endif // SY_LEDGER_SERIALIZE_HPP
