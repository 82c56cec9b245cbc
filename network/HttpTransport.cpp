#include "HttpTransport.h"
#include "Utilities.h"

#include <httplib.h>

namespace sy {
namespace network {

namespace {

void applyTimeout(httplib::Client &client, std::chrono::milliseconds timeout) {
  client.set_connection_timeout(timeout);
  client.set_read_timeout(timeout);
  client.set_write_timeout(timeout);
}

} // namespace

HttpTransport::HttpTransport() : Module("network.http") {}

HttpTransport::Roe<std::string>
HttpTransport::post(const std::string &address, const std::string &path,
                    const std::string &body,
                    std::chrono::milliseconds timeout) {
  std::string host;
  uint16_t port = 0;
  if (!utl::parseHostPort(address, host, port)) {
    return Error(E_ADDRESS, "Invalid peer address: " + address);
  }

  httplib::Client client(host, port);
  applyTimeout(client, timeout);

  log().debug << "POST " << address << path << " (" << body.size() << " bytes)";
  auto res = client.Post(path, body, "application/json");
  if (!res) {
    return Error(E_REQUEST, "POST " + address + path + " failed: " +
                                httplib::to_string(res.error()));
  }
  if (res->status < 200 || res->status >= 300) {
    return Error(E_STATUS, "POST " + address + path + " returned status " +
                               std::to_string(res->status));
  }
  return res->body;
}

HttpTransport::Roe<std::string>
HttpTransport::get(const std::string &address, const std::string &path,
                   std::chrono::milliseconds timeout) {
  std::string host;
  uint16_t port = 0;
  if (!utl::parseHostPort(address, host, port)) {
    return Error(E_ADDRESS, "Invalid peer address: " + address);
  }

  httplib::Client client(host, port);
  applyTimeout(client, timeout);

  log().debug << "GET " << address << path;
  auto res = client.Get(path);
  if (!res) {
    return Error(E_REQUEST, "GET " + address + path + " failed: " +
                                httplib::to_string(res.error()));
  }
  if (res->status < 200 || res->status >= 300) {
    return Error(E_STATUS, "GET " + address + path + " returned status " +
                               std::to_string(res->status));
  }
  return res->body;
}

} // namespace network
} // namespace sy
