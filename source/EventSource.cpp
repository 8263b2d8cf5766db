#include "EventSource.h"
#include "../lib/Utilities.h"

#include <algorithm>

namespace ppi {

const char *EventSource::getModeName(Mode mode) {
  switch (mode) {
  case Mode::LIVE:
    return "live";
  case Mode::FALLBACK:
    return "fallback";
  }
  return "unknown";
}

// ============ Config methods ============

nlohmann::json EventSource::Config::ltsToJson() const {
  nlohmann::json j;
  j["useLive"] = useLive;
  j["fetchFullTransaction"] = fetchFullTransaction;
  j["backfillWindow"] = backfillWindow;
  j["initialLookback"] = initialLookback;
  j["maxCheckpointLag"] = maxCheckpointLag;
  j["batchSlots"] = batchSlots;
  j["maxTransactionsPerBatch"] = maxTransactionsPerBatch;
  j["pollIntervalMs"] = pollIntervalMs;
  j["liveFailureThreshold"] = liveFailureThreshold;
  j["reconnectDelayMs"] = reconnectDelayMs;
  j["maxPollRetries"] = maxPollRetries;
  j["retryBaseDelayMs"] = retryBaseDelayMs;
  j["retryMaxDelayMs"] = retryMaxDelayMs;
  return j;
}

EventSource::Roe<void> EventSource::Config::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Section 'source' must be a JSON object");
  }

  for (auto result : {utl::readJsonField(jd, "useLive", useLive),
                      utl::readJsonField(jd, "fetchFullTransaction", fetchFullTransaction),
                      utl::readJsonField(jd, "backfillWindow", backfillWindow),
                      utl::readJsonField(jd, "initialLookback", initialLookback),
                      utl::readJsonField(jd, "maxCheckpointLag", maxCheckpointLag),
                      utl::readJsonField(jd, "batchSlots", batchSlots),
                      utl::readJsonField(jd, "maxTransactionsPerBatch", maxTransactionsPerBatch),
                      utl::readJsonField(jd, "pollIntervalMs", pollIntervalMs),
                      utl::readJsonField(jd, "liveFailureThreshold", liveFailureThreshold),
                      utl::readJsonField(jd, "reconnectDelayMs", reconnectDelayMs),
                      utl::readJsonField(jd, "maxPollRetries", maxPollRetries),
                      utl::readJsonField(jd, "retryBaseDelayMs", retryBaseDelayMs),
                      utl::readJsonField(jd, "retryMaxDelayMs", retryMaxDelayMs)}) {
    if (!result) {
      return Error(E_CONFIG, result.error().message);
    }
  }

  if (batchSlots == 0) {
    return Error(E_CONFIG, "Field 'batchSlots' must be positive");
  }
  if (maxTransactionsPerBatch == 0) {
    return Error(E_CONFIG, "Field 'maxTransactionsPerBatch' must be positive");
  }
  if (liveFailureThreshold == 0 || maxPollRetries == 0) {
    return Error(E_CONFIG, "Retry thresholds must be positive");
  }
  if (retryMaxDelayMs < retryBaseDelayMs) {
    return Error(E_CONFIG, "Field 'retryMaxDelayMs' must not be below 'retryBaseDelayMs'");
  }
  return {};
}

// ============ EventSource methods ============

EventSource::EventSource() : Service("source") {}

EventSource::~EventSource() {
  if (!isStopSet()) {
    stop();
  }
}

EventSource::Roe<void> EventSource::init(const Config &config, const Dependencies &deps) {
  if (!deps.spRpc || !deps.spCheckpoint || !deps.spStats) {
    return Error(E_CONFIG, "Event source needs an RPC client, a checkpoint store and stats");
  }
  if (config.batchSlots == 0 || config.maxTransactionsPerBatch == 0) {
    return Error(E_CONFIG, "Batch sizes must be positive");
  }
  config_ = config;
  deps_ = deps;
  return {};
}

Service::Roe<void> EventSource::onStart() {
  if (!deps_.spRpc || !deps_.spCheckpoint || !deps_.spStats) {
    return Service::Error(E_START, "Event source not initialized");
  }
  if (!sink_) {
    return Service::Error(E_START, "Event source has no transaction sink");
  }
  liveFailures_ = 0;
  pollFailures_ = 0;
  mode_ = config_.useLive && deps_.spStream ? Mode::LIVE : Mode::FALLBACK;
  return {};
}

void EventSource::onStopRequest() {
  if (deps_.spStream) {
    deps_.spStream->close();
  }
}

void EventSource::runLoop() {
  if (!runStartup()) {
    return;
  }

  if (onReady_) {
    onReady_();
  }

  if (config_.useLive && deps_.spStream) {
    runLive();
  } else {
    log().info << "Live stream disabled, polling";
  }

  if (!isStopSet()) {
    runFallback();
  }
  log().info << "Event source loop finished";
}

bool EventSource::runStartup() {
  bool backfilled = false;
  while (!isStopSet()) {
    auto result = syncFromCheckpoint(backfilled);
    if (result) {
      pollFailures_ = 0;
      return true;
    }
    if (result.error().code == E_STOPPED || isStopSet()) {
      return false;
    }
    if (!handleFailure("Startup sync failed: " + result.error().message)) {
      return false;
    }
  }
  return false;
}

EventSource::Roe<void> EventSource::syncFromCheckpoint(bool &backfilled) {
  auto roeHead = deps_.spRpc->getCurrentSlot();
  if (!roeHead) {
    return Error(E_RPC, "Failed to get current slot: " + roeHead.error().message);
  }
  uint64_t head = roeHead.value();

  auto roeCheckpoint = deps_.spCheckpoint->load();
  if (!roeCheckpoint) {
    return Error(E_CHECKPOINT, "Failed to load checkpoint: " + roeCheckpoint.error().message);
  }
  const auto &checkpoint = roeCheckpoint.value();
  uint64_t lookbackStart = head > config_.initialLookback ? head - config_.initialLookback : 0;

  if (!checkpoint) {
    cursor_ = lookbackStart;
    log().info << "No checkpoint, starting " << config_.initialLookback << " slots behind head "
               << head << " at slot " << cursor_.load();
    return {};
  }

  uint64_t cp = checkpoint->lastProcessedSlot;
  uint64_t lag = head > cp ? head - cp : 0;
  if (lag > config_.maxCheckpointLag) {
    log().warning << "Checkpoint " << cp << " is " << lag << " slots behind head " << head
                  << ", skipping ahead to slot " << lookbackStart;
    cursor_ = lookbackStart;
    auto roeAdvance = deps_.spCheckpoint->advance(lookbackStart);
    if (!roeAdvance) {
      return Error(E_CHECKPOINT, "Failed to advance checkpoint: " + roeAdvance.error().message);
    }
    return {};
  }

  if (!backfilled) {
    backfilled = true;
    uint64_t backfillStart = cp > config_.backfillWindow ? cp - config_.backfillWindow : 0;
    log().info << "Backfilling slots " << backfillStart << "-" << cp;
    auto roeBackfill = processRange(backfillStart, cp, false, true);
    if (!roeBackfill) {
      if (roeBackfill.error().code == E_STOPPED) {
        return roeBackfill.error();
      }
      log().warning << "Backfill incomplete: " << roeBackfill.error().message;
    } else {
      log().info << "Backfill delivered " << roeBackfill.value() << " transactions";
    }
  }

  if (head > cp) {
    log().info << "Catching up slots " << (cp + 1) << "-" << head;
    auto roeCatchUp = processRange(cp + 1, head, true, true);
    if (!roeCatchUp) {
      return roeCatchUp.error();
    }
  }
  cursor_ = std::max(cp, head);
  return {};
}

void EventSource::runLive() {
  mode_ = Mode::LIVE;
  liveFailures_ = 0;

  while (!isStopSet()) {
    auto roeSubscribe = deps_.spStream->subscribe(config_.programId);
    if (!roeSubscribe) {
      if (isStopSet()) {
        break;
      }
      if (!handleLiveFailure("Live subscription failed: " + roeSubscribe.error().message)) {
        return;
      }
      continue;
    }

    log().info << "Live stream connected";

    // Fill the gap left before this subscription took effect. The cursor slot
    // is fetched again since the stream may have delivered only part of it.
    auto roeGap = catchUpLive();
    if (!roeGap) {
      deps_.spStream->close();
      if (roeGap.error().code == E_STOPPED || isStopSet()) {
        break;
      }
      if (!handleLiveFailure("Live catch-up failed: " + roeGap.error().message)) {
        return;
      }
      continue;
    }
    liveFailures_ = 0;

    while (!isStopSet()) {
      auto roeNotification = deps_.spStream->next();
      if (!roeNotification) {
        if (!isStopSet()) {
          log().warning << "Live stream disconnected: " << roeNotification.error().message;
        }
        break;
      }
      handleNotification(roeNotification.value());
    }
    deps_.spStream->close();
  }
}

bool EventSource::handleLiveFailure(const std::string &message) {
  liveFailures_++;
  deps_.spStats->recordError();
  log().warning << message << " (" << liveFailures_ << "/" << config_.liveFailureThreshold << ")";
  if (liveFailures_ >= config_.liveFailureThreshold) {
    log().warning << "Switching to fallback polling from slot " << cursor_.load();
    deps_.spStream->close();
    mode_ = Mode::FALLBACK;
    return false;
  }
  waitForStop(std::chrono::milliseconds(config_.reconnectDelayMs));
  return true;
}

EventSource::Roe<void> EventSource::catchUpLive() {
  auto roeHead = deps_.spRpc->getCurrentSlot();
  if (!roeHead) {
    return Error(E_RPC, "Failed to get current slot: " + roeHead.error().message);
  }
  uint64_t head = roeHead.value();
  uint64_t from = cursor_.load();
  if (head < from) {
    return {};
  }
  auto roeRange = processRange(from, head, true, true);
  if (!roeRange) {
    return roeRange.error();
  }
  if (roeRange.value() > 0) {
    log().info << "Caught up " << roeRange.value() << " transactions in slots " << from << "-"
               << head;
  }
  uint64_t cursor = cursor_.load();
  while (head > cursor && !cursor_.compare_exchange_weak(cursor, head)) {
  }
  return {};
}

void EventSource::handleNotification(const LogNotification &notification) {
  if (notification.failed) {
    log().debug << "Skipping failed transaction " << notification.signature;
    deps_.spStats->recordSkipped();
    return;
  }

  RawTransaction tx;
  bool fetched = false;
  if (config_.fetchFullTransaction) {
    auto roeTx = deps_.spRpc->getTransaction(notification.signature);
    if (roeTx) {
      tx = roeTx.value();
      fetched = true;
    } else {
      log().warning << "Using streamed logs for " << notification.signature << ": "
                    << roeTx.error().message;
    }
  }
  if (!fetched) {
    tx.signature = notification.signature;
    tx.slot = notification.slot;
    tx.success = true;
    tx.logs = notification.logs;
  }

  sink_(tx);

  uint64_t cursor = cursor_.load();
  while (tx.slot > cursor && !cursor_.compare_exchange_weak(cursor, tx.slot)) {
  }
}

void EventSource::runFallback() {
  mode_ = Mode::FALLBACK;
  pollFailures_ = 0;
  log().info << "Polling every " << config_.pollIntervalMs << " ms from slot " << cursor_.load();

  while (!isStopSet()) {
    auto roeHead = deps_.spRpc->getCurrentSlot();
    if (!roeHead) {
      if (!handleFailure("Failed to get current slot: " + roeHead.error().message)) {
        return;
      }
      continue;
    }

    uint64_t head = roeHead.value();
    if (head > cursor_) {
      auto roeRange = processRange(cursor_ + 1, head, true, true);
      if (!roeRange) {
        if (roeRange.error().code == E_STOPPED) {
          return;
        }
        if (!handleFailure("Polling slots up to " + std::to_string(head) +
                           " failed: " + roeRange.error().message)) {
          return;
        }
        continue;
      }
      cursor_ = head;
    }

    pollFailures_ = 0;
    waitForStop(std::chrono::milliseconds(config_.pollIntervalMs));
  }
}

EventSource::Roe<uint64_t> EventSource::processRange(uint64_t startSlot, uint64_t endSlot,
                                        bool advanceCheckpoint, bool interruptible) {
  uint64_t delivered = 0;
  if (startSlot > endSlot) {
    return delivered;
  }

  uint64_t lo = startSlot;
  while (true) {
    if (interruptible && isStopSet()) {
      return Error(E_STOPPED, "Stopped");
    }

    uint64_t hi = endSlot - lo >= config_.batchSlots ? lo + config_.batchSlots - 1 : endSlot;
    auto roeBatch = deps_.spRpc->getTransactionsInRange(lo, hi, config_.maxTransactionsPerBatch);
    if (!roeBatch) {
      return Error(E_RPC, "Failed to fetch slots " + std::to_string(lo) + "-" +
                              std::to_string(hi) + ": " + roeBatch.error().message);
    }
    const auto &batch = roeBatch.value();
    if (batch.coveredUpTo < lo) {
      return Error(E_RPC, "No progress fetching slots " + std::to_string(lo) + "-" +
                              std::to_string(hi));
    }
    // A busy chunk comes back cut short, the rest follows from coveredUpTo + 1
    uint64_t covered = std::min(batch.coveredUpTo, hi);

    for (const auto &tx : batch.transactions) {
      if (interruptible && isStopSet()) {
        return Error(E_STOPPED, "Stopped");
      }
      sink_(tx);
      delivered++;
    }

    if (advanceCheckpoint) {
      auto roeAdvance = deps_.spCheckpoint->advance(covered);
      if (!roeAdvance) {
        return Error(E_CHECKPOINT, "Failed to advance checkpoint to " + std::to_string(covered) +
                                       ": " + roeAdvance.error().message);
      }
    }

    if (covered == endSlot) {
      break;
    }
    lo = covered + 1;
  }
  return delivered;
}

EventSource::Roe<uint64_t> EventSource::replayRange(uint64_t startSlot, uint64_t endSlot) {
  if (!isStopSet()) {
    return Error(E_CONFIG, "Cannot replay while the source is running");
  }
  if (!deps_.spRpc || !sink_) {
    return Error(E_CONFIG, "Event source not initialized");
  }
  if (startSlot > endSlot) {
    return Error(E_CONFIG, "Invalid slot range " + std::to_string(startSlot) + "-" +
                               std::to_string(endSlot));
  }
  log().info << "Replaying slots " << startSlot << "-" << endSlot;
  return processRange(startSlot, endSlot, false, false);
}

std::chrono::milliseconds EventSource::getRetryDelay() const {
  uint64_t delay = config_.retryBaseDelayMs;
  for (uint64_t i = 0; i < pollFailures_ && delay < config_.retryMaxDelayMs; ++i) {
    delay *= 2;
  }
  return std::chrono::milliseconds(std::min(delay, config_.retryMaxDelayMs));
}

bool EventSource::handleFailure(const std::string &message) {
  pollFailures_++;
  deps_.spStats->recordError();
  log().error << message << " (" << pollFailures_ << "/" << config_.maxPollRetries << ")";

  if (pollFailures_ >= config_.maxPollRetries) {
    log().critical << "Giving up after " << pollFailures_ << " consecutive failures";
    if (onFatal_) {
      onFatal_(message);
    }
    return false;
  }

  auto delay = getRetryDelay();
  log().warning << "Retrying in " << delay.count() << " ms";
  return !waitForStop(delay);
}

} // namespace ppi
