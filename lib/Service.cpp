#include "Service.h"

namespace lw {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  if (!isStopSet_) {
    stop();
  }
}

Service::Roe<void> Service::start() {
  if (!isStopSet_) {
    return Error(-1, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(-2, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  thread_ = std::thread(&Service::runLoop, this);

  log().debug << "Service started";
  return {};
}

void Service::stop() {
  if (isStopSet_) {
    log().debug << "Service is not running";
    return;
  }

  log().debug << "Stopping service";

  {
    std::lock_guard<std::mutex> lock(stopMutex_);
    isStopSet_ = true;
  }
  stopCv_.notify_all();

  if (thread_.joinable()) {
    thread_.join();
  }

  onStop();

  log().debug << "Service stopped";
}

Service::Roe<void> Service::run() {
  if (!isStopSet_) {
    return Error(-1, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(-2, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  log().debug << "Service running in current thread";
  runLoop();
  isStopSet_ = true;
  onStop();
  log().debug << "Service stopped (current thread)";
  return {};
}

bool Service::waitForStop(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(stopMutex_);
  return stopCv_.wait_for(lock, duration, [this] { return isStopSet_.load(); });
}

} // namespace lw
