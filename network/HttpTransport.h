#pragma once

#include "Module.h"
#include "PeerTransport.hpp"

#include <chrono>
#include <string>

namespace sy {
namespace network {

/**
 * PeerTransport over plain HTTP using cpp-httplib.
 * A fresh client per request keeps calls independent across threads.
 */
class HttpTransport : public Module, public iii::PeerTransport {
public:
  constexpr static int32_t E_ADDRESS = 1;
  constexpr static int32_t E_REQUEST = 2;
  constexpr static int32_t E_STATUS = 3;

  HttpTransport();
  ~HttpTransport() override = default;

  Roe<std::string> post(const std::string &address, const std::string &path,
                        const std::string &body,
                        std::chrono::milliseconds timeout) override;

  Roe<std::string> get(const std::string &address, const std::string &path,
                       std::chrono::milliseconds timeout) override;
};

} // namespace network
} // namespace sy
