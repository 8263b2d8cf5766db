#include "IndexerStats.h"
#include "../lib/Utilities.h"

namespace ppi {

nlohmann::json IndexerStats::Snapshot::toJson() const {
  nlohmann::json j;
  j["eventsProcessed"] = eventsProcessed;
  nlohmann::json byKind = nlohmann::json::object();
  for (EventKind kind : ALL_EVENT_KINDS) {
    byKind[getKindKey(kind)] = eventsByKind[kindIndex(kind)];
  }
  j["eventsByKind"] = byKind;
  j["duplicates"] = duplicates;
  j["transactionsProcessed"] = transactionsProcessed;
  j["transactionsSkipped"] = transactionsSkipped;
  j["transactionsDropped"] = transactionsDropped;
  j["errors"] = errors;
  j["handlerErrors"] = handlerErrors;
  j["notificationsQueued"] = notificationsQueued;
  j["lastProcessedSlot"] = lastProcessedSlot;
  j["startTime"] = startTime;
  return j;
}

IndexerStats::IndexerStats() { reset(); }

void IndexerStats::reset() {
  eventsProcessed_ = 0;
  for (auto &count : eventsByKind_) {
    count = 0;
  }
  duplicates_ = 0;
  transactionsProcessed_ = 0;
  transactionsSkipped_ = 0;
  transactionsDropped_ = 0;
  errors_ = 0;
  handlerErrors_ = 0;
  notificationsQueued_ = 0;
  lastProcessedSlot_ = 0;
  startTime_ = utl::getCurrentTime();
}

void IndexerStats::recordEvent(EventKind kind) {
  eventsProcessed_++;
  size_t i = kindIndex(kind);
  if (i < EVENT_KIND_COUNT) {
    eventsByKind_[i]++;
  }
}

void IndexerStats::recordDuplicate() { duplicates_++; }

void IndexerStats::recordTransaction(uint64_t slot) {
  transactionsProcessed_++;
  uint64_t current = lastProcessedSlot_.load();
  while (slot > current && !lastProcessedSlot_.compare_exchange_weak(current, slot)) {
  }
}

void IndexerStats::recordSkipped() { transactionsSkipped_++; }

void IndexerStats::recordDropped() { transactionsDropped_++; }

void IndexerStats::recordError() { errors_++; }

void IndexerStats::recordHandlerError() { handlerErrors_++; }

void IndexerStats::recordNotificationQueued() { notificationsQueued_++; }

IndexerStats::Snapshot IndexerStats::snapshot() const {
  Snapshot s;
  s.eventsProcessed = eventsProcessed_;
  for (size_t i = 0; i < EVENT_KIND_COUNT; ++i) {
    s.eventsByKind[i] = eventsByKind_[i];
  }
  s.duplicates = duplicates_;
  s.transactionsProcessed = transactionsProcessed_;
  s.transactionsSkipped = transactionsSkipped_;
  s.transactionsDropped = transactionsDropped_;
  s.errors = errors_;
  s.handlerErrors = handlerErrors_;
  s.notificationsQueued = notificationsQueued_;
  s.lastProcessedSlot = lastProcessedSlot_;
  s.startTime = startTime_;
  return s;
}

} // namespace ppi
