#include "Service.h"

namespace ppi {

Service::Service(const std::string &name) : Module(name) {}

Service::~Service() {
  if (!isStopSet_ || thread_.joinable()) {
    stop();
  }
}

Service::Roe<void> Service::start() {
  if (!isStopSet_ || thread_.joinable()) {
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
  if (isStopSet_ && !thread_.joinable()) {
    log().warning << "Service is not running";
    return;
  }

  log().info << "Stopping service";

  {
    std::lock_guard<std::mutex> lock(stopMutex_);
    isStopSet_ = true;
  }
  stopCv_.notify_all();
  onStopRequest();

  if (thread_.joinable()) {
    thread_.join();
  }

  onStop();

  log().info << "Service stopped";
}

Service::Roe<void> Service::run() {
  if (!isStopSet_ || thread_.joinable()) {
    return Error(E_RUNNING, "Service is already running");
  }

  auto result = onStart();
  if (!result) {
    return Error(E_START, "Service onStart() failed: " + result.error().message);
  }

  isStopSet_ = false;
  log().info << "Service running in current thread";
  runLoop();
  isStopSet_ = true;
  onStop();
  log().info << "Service stopped (current thread)";
  return {};
}

bool Service::waitForStop(std::chrono::milliseconds duration) {
  std::unique_lock<std::mutex> lock(stopMutex_);
  return stopCv_.wait_for(lock, duration, [this] { return isStopSet_.load(); });
}

} // namespace ppi
