#ifndef PP_INDEXER_NOTIFIER_H
#define PP_INDEXER_NOTIFIER_H

#include "../lib/Service.h"
#include "../lib/ThreadSafeQueue.hpp"
#include "../lib/Utilities.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <functional>
#include <string>

namespace ppi {

/**
 * Fire-and-forget delivery of processed events to an external sink.
 *
 * Notifications are queued by the dispatcher and delivered from the
 * notifier's own thread. Sink failures are logged and counted here and
 * never reach the ingestion pipeline.
 */
class Notifier : public Service {
public:
  struct Notification {
    std::string kind;
    std::string signature;
    uint64_t slot{ 0 };
    nlohmann::json payload;
  };

  using Sink = std::function<ppi::Roe<void>(const Notification &)>;

  static constexpr const size_t DEFAULT_MAX_QUEUE_SIZE = 10000;

  Notifier();
  ~Notifier() override;

  void setSink(Sink sink) { sink_ = std::move(sink); }
  void setMaxQueueSize(size_t size) { maxQueueSize_ = size; }

  /**
   * Queue a notification for delivery.
   * @return false if the queue is full and the notification was dropped
   */
  bool enqueue(Notification notification);

  size_t getPending() const { return queue_.size(); }
  uint64_t getDelivered() const { return delivered_; }
  uint64_t getFailed() const { return failed_; }
  uint64_t getDropped() const { return dropped_; }

protected:
  void runLoop() override;
  void onStopRequest() override;
  void onStop() override;

private:
  void deliver(const Notification &notification);

  Sink sink_;
  size_t maxQueueSize_{ DEFAULT_MAX_QUEUE_SIZE };
  ThreadSafeQueue<Notification> queue_;
  std::atomic<uint64_t> delivered_{ 0 };
  std::atomic<uint64_t> failed_{ 0 };
  std::atomic<uint64_t> dropped_{ 0 };
};

} // namespace ppi

#endif // PP_INDEXER_NOTIFIER_H
