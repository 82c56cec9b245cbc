#include "Service.h"

namespace sy {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  if (thread_.joinable()) {
    isStopSet_ = true;
    thread_.join();
  }
}

Service::Roe<void> Service::start() {
  if (!isStopSet_) {
    return Error(E_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_START, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  thread_ = std::thread(&Service::runLoop, this);

  log().info << "Service started";
  return {};
}

void Service::stop() {
  if (!thread_.joinable()) {
    return;
  }

  log().info << "Stopping service";

  isStopSet_ = true;
  onStopRequested();
  thread_.join();
  onStop();

  log().info << "Service stopped";
}

} // namespace sy
