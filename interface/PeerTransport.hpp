#pragma once

#include "ResultOrError.hpp"

#include <chrono>
#include <string>

namespace sy {
namespace iii {

/**
 * Request/response channel to a single peer address ("host:port").
 * Implementations must honour the timeout and never throw.
 */
class PeerTransport {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  virtual ~PeerTransport() = default;

  virtual Roe<std::string> post(const std::string &address,
                                const std::string &path,
                                const std::string &body,
                                std::chrono::milliseconds timeout) = 0;

  virtual Roe<std::string> get(const std::string &address,
                               const std::string &path,
                               std::chrono::milliseconds timeout) = 0;
};

} // namespace iii
} // namespace sy
