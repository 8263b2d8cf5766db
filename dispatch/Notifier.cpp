#include "Notifier.h"

namespace ppi {

Notifier::Notifier() : Service("notifier") {}

Notifier::~Notifier() {
  if (!isStopSet()) {
    stop();
  }
}

bool Notifier::enqueue(Notification notification) {
  if (queue_.size() >= maxQueueSize_) {
    dropped_++;
    log().warning << "Notification queue full, dropping " << notification.kind << " of "
                  << notification.signature;
    return false;
  }
  queue_.push(std::move(notification));
  return true;
}

void Notifier::runLoop() {
  while (!isStopSet()) {
    Notification notification;
    if (queue_.waitPoll(notification, std::chrono::milliseconds(200))) {
      deliver(notification);
    }
  }
}

void Notifier::deliver(const Notification &notification) {
  if (!sink_) {
    log().debug << "Event " << notification.kind << " " << notification.signature << " at slot "
                << notification.slot;
    delivered_++;
    return;
  }

  auto result = sink_(notification);
  if (!result) {
    failed_++;
    log().warning << "Failed to deliver " << notification.kind << " of "
                  << notification.signature << ": " << result.error().message;
    return;
  }
  delivered_++;
}

void Notifier::onStopRequest() { queue_.notifyAll(); }

void Notifier::onStop() {
  size_t pending = queue_.size();
  if (pending > 0) {
    log().warning << pending << " notification(s) not delivered at shutdown";
  }
}

} // namespace ppi
