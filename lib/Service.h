#pragma once

#include "Module.h"
#include "ResultOrError.hpp"
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace ppi {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Provides thread lifecycle management with start/stop functionality.
 * Derived classes implement the runLoop() method which executes in the service
 * thread or in the current thread when using run().
 *
 * Derived classes must call stop() from their own destructor: the base
 * destructor runs after the derived part is gone.
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
   * Virtual destructor - stops the service if running
   */
  ~Service() override;

  Service(const Service &) = delete;
  Service &operator=(const Service &) = delete;

  bool isStopSet() const { return isStopSet_; }

  Roe<void> run();
  Roe<void> start();
  void stop();

protected:
  /**
   * Main service loop - implement in derived classes.
   * Runs in the service thread or in the caller thread when using run().
   * Should check !isStopSet() periodically to allow graceful shutdown.
   */
  virtual void runLoop() = 0;

  /**
   * Called before the thread starts (in the calling thread context).
   * Override to perform pre-start initialization.
   * @return error to abort start
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called from stop() right after the stop flag is set and before the
   * thread is joined. Override to unblock calls the loop may be waiting in.
   */
  virtual void onStopRequest() {}

  /**
   * Called after the thread has stopped (in the calling thread context).
   * Override to perform cleanup after thread termination.
   */
  virtual void onStop() {}

  /**
   * Sleep for up to the given duration, waking early on stop().
   * @return true if stop was requested
   */
  bool waitForStop(std::chrono::milliseconds duration);

private:
  /// Set while the service is not running, or once stop has been requested
  std::atomic<bool> isStopSet_{ true };

  std::mutex stopMutex_;
  std::condition_variable stopCv_;

  std::thread thread_;
};

} // namespace ppi
