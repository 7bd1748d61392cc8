#pragma once

#include "Module.h"
#include "ResultOrError.hpp"

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace lw {

/**
 * Service - Base class for components that run in a dedicated thread.
 *
 * Provides thread lifecycle management with start/stop functionality.
 * Derived classes implement the runLoop() method which executes in the service
 * thread or in the current thread when using run().
 */
class Service : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  explicit Service(const std::string &name);

  /**
   * Stops the service if running. Derived classes that own state used by
   * runLoop() must call stop() in their own destructor.
   */
  ~Service() override;

  bool isStopSet() const { return isStopSet_; }
  bool isRunning() const { return !isStopSet_; }

  Roe<void> run();
  Roe<void> start();
  void stop();

protected:
  /**
   * Main service loop - implement in derived classes.
   * Should check !isStopSet() periodically to allow graceful shutdown.
   */
  virtual void runLoop() = 0;

  /**
   * Called before the thread starts (in the calling thread context).
   * An error aborts the start.
   */
  virtual Roe<void> onStart() { return {}; }

  /**
   * Called after the thread has stopped (in the calling thread context).
   */
  virtual void onStop() {}

  /**
   * Sleep for up to the given duration, returning early once stop() is
   * requested.
   * @return true if stop was requested
   */
  bool waitForStop(std::chrono::milliseconds duration);

private:
  std::atomic<bool> isStopSet_{ true };

  std::mutex stopMutex_;
  std::condition_variable stopCv_;

  std::thread thread_;
};

} // namespace lw
