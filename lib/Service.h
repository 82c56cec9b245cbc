#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <thread>

namespace sy {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Provides thread lifecycle management with start/stop functionality.
 * Derived classes implement the runLoop() method which executes in the service
 * thread.
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_RUNNING = -1;
  static constexpr const int32_t E_START = -2;

  explicit Service(const std::string &name);

  /**
   * Derived classes must call stop() in their own destructor, since runLoop()
   * is already gone by the time this one runs.
   */
  ~Service() override;

  bool isStopSet() const { return isStopSet_; }

  Roe<void> start();
  void stop();

protected:
  /**
   * Main service loop - implement in derived classes.
   * Runs in the service thread.
   * Should return promptly once isStopSet() becomes true.
   */
  virtual void runLoop() = 0;

  /**
   * Called before the thread starts (in the calling thread context).
   * An error aborts the start.
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called after stop has been requested, before joining the thread.
   * Override to unblock a runLoop() that waits on I/O.
   */
  virtual void onStopRequested() {}

  /**
   * Called after the thread has stopped (in the calling thread context).
   */
  virtual void onStop() {}

private:
  std::atomic<bool> isStopSet_{ true };
  std::thread thread_;
};

} // namespace sy
