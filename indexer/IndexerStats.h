#ifndef PP_INDEXER_INDEXER_STATS_H
#define PP_INDEXER_INDEXER_STATS_H

#include "../decoder/Event.h"

#include <nlohmann/json.hpp>

#include <array>
#include <atomic>
#include <cstdint>

namespace ppi {

/**
 * Processing counters shared by the source, the dispatcher and the
 * orchestrator. Writers only ever increase them; readers take a snapshot.
 */
class IndexerStats {
public:
  struct Snapshot {
    uint64_t eventsProcessed{ 0 };
    std::array<uint64_t, EVENT_KIND_COUNT> eventsByKind{};
    uint64_t duplicates{ 0 };
    uint64_t transactionsProcessed{ 0 };
    uint64_t transactionsSkipped{ 0 };
    uint64_t transactionsDropped{ 0 };
    uint64_t errors{ 0 };
    uint64_t handlerErrors{ 0 };
    uint64_t notificationsQueued{ 0 };
    uint64_t lastProcessedSlot{ 0 };
    int64_t startTime{ 0 };

    nlohmann::json toJson() const;
  };

  IndexerStats();

  /** Zero all counters and restart the clock */
  void reset();

  void recordEvent(EventKind kind);
  void recordDuplicate();
  void recordTransaction(uint64_t slot);
  void recordSkipped();
  void recordDropped();
  void recordError();
  void recordHandlerError();
  void recordNotificationQueued();

  uint64_t getErrors() const { return errors_; }
  int64_t getStartTime() const { return startTime_; }

  Snapshot snapshot() const;

private:
  std::atomic<uint64_t> eventsProcessed_{ 0 };
  std::array<std::atomic<uint64_t>, EVENT_KIND_COUNT> eventsByKind_;
  std::atomic<uint64_t> duplicates_{ 0 };
  std::atomic<uint64_t> transactionsProcessed_{ 0 };
  std::atomic<uint64_t> transactionsSkipped_{ 0 };
  std::atomic<uint64_t> transactionsDropped_{ 0 };
  std::atomic<uint64_t> errors_{ 0 };
  std::atomic<uint64_t> handlerErrors_{ 0 };
  std::atomic<uint64_t> notificationsQueued_{ 0 };
  std::atomic<uint64_t> lastProcessedSlot_{ 0 };
  std::atomic<int64_t> startTime_{ 0 };
};

} // namespace ppi

#endif // PP_INDEXER_INDEXER_STATS_H
