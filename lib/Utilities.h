#ifndef SY_LEDGER_UTILITIES_H
#define SY_LEDGER_UTILITIES_H

#include "ResultOrError.hpp"

#include <cstdint>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace sy {

// Error type for utility functions
struct Error : public RoeErrorBase {
  using RoeErrorBase::RoeErrorBase;
};

template <typename T> using Roe = ResultOrError<T, Error>;

namespace utl {

/**
 * Get the current time in milliseconds since the epoch
 */
int64_t getCurrentTimeMs();

bool parseInt(const std::string &str, int &value);

/**
 * Parse a port number from a string (validates range 1-65535)
 * @param str String to parse
 * @param port Output parameter for the parsed port
 * @return true if parsing succeeded and port is in valid range, false otherwise
 */
bool parsePort(const std::string &str, uint16_t &port);

/**
 * Parse a host:port string into separate host and port components
 * @param hostPort String in format "host:port"
 * @param host Output parameter for the host part
 * @param port Output parameter for the port part
 * @return true if parsing succeeded, false otherwise
 */
bool parseHostPort(const std::string &hostPort, std::string &host,
                   uint16_t &port);

/**
 * Join a vector of strings with a delimiter
 */
std::string join(const std::vector<std::string> &strings,
                 const std::string &delimiter);

/**
 * Load and parse a JSON file
 * @param path Path to the JSON file
 * @return Parsed JSON object or error
 */
Roe<nlohmann::json> loadJsonFile(const std::string &path);

/**
 * Parse a JSON document held in a string
 * @param text Document text
 * @return Parsed JSON object or error
 */
Roe<nlohmann::json> parseJson(const std::string &text);

/**
 * Compute SHA-256 hash using libsodium
 * @param input Input bytes to hash
 * @return Lowercase hexadecimal string of the digest (64 characters)
 * @throws std::runtime_error if hash computation fails
 */
std::string sha256(const std::string &input);

/**
 * Count leading '0' characters of a hex digest
 */
uint32_t countLeadingZeroNibbles(const std::string &hexDigest);

/**
 * Write a string to a non-existent file
 * Creates parent directories if needed. Fails if the file already exists.
 * @param filePath Path to the file to write
 * @param content String content to write to the file
 */
Roe<void> writeToNewFile(const std::string &filePath,
                         const std::string &content);

} // namespace utl
} // namespace sy

#endif // SY_LEDGER_UTILITIES_H
