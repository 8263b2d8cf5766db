#include "Dispatcher.h"
#include "../lib/Utilities.h"

#include <chrono>
#include <thread>

namespace ppi {

// ============ Config methods ============

nlohmann::json Dispatcher::Config::ltsToJson() const {
  nlohmann::json j;
  j["maxRetries"] = maxRetries;
  j["retryBaseDelayMs"] = retryBaseDelayMs;
  return j;
}

Dispatcher::Roe<void> Dispatcher::Config::ltsFromJson(const nlohmann::json &jd) {
  if (!jd.is_object()) {
    return Error(E_CONFIG, "Section 'dispatch' must be a JSON object");
  }
  auto result = utl::readJsonField(jd, "maxRetries", maxRetries);
  if (!result) {
    return Error(E_CONFIG, result.error().message);
  }
  result = utl::readJsonField(jd, "retryBaseDelayMs", retryBaseDelayMs);
  if (!result) {
    return Error(E_CONFIG, result.error().message);
  }
  if (maxRetries == 0) {
    return Error(E_CONFIG, "Field 'maxRetries' must be positive");
  }
  return {};
}

// ============ Dispatcher methods ============

Dispatcher::Dispatcher() : Module("dispatcher") {}

Dispatcher::Roe<void> Dispatcher::init(const Config &config, const Dependencies &deps) {
  if (!deps.spStore || !deps.spCheckpoint || !deps.spRegistry || !deps.spStats) {
    return Error(E_CONFIG, "Dispatcher needs a store, a checkpoint store, handlers and stats");
  }
  if (config.maxRetries == 0) {
    return Error(E_CONFIG, "maxRetries must be positive");
  }
  config_ = config;
  deps_ = deps;
  return {};
}

Dispatcher::Roe<Dispatcher::TxOutcome> Dispatcher::processTransaction(const RawTransaction &tx) {
  if (!deps_.spStore) {
    return Error(E_CONFIG, "Dispatcher not initialized");
  }

  TxOutcome outcome;
  if (!tx.success) {
    log().debug << "Skipping failed transaction " << tx.signature;
    deps_.spStats->recordSkipped();
    outcome.skipped = true;
    return outcome;
  }
  if (tx.signature.empty()) {
    log().warning << "Skipping transaction without signature at slot " << tx.slot;
    deps_.spStats->recordSkipped();
    outcome.skipped = true;
    return outcome;
  }

  std::vector<ParsedEvent> events = decoder_.decodeTransaction(tx, config_.programId);
  if (events.empty()) {
    deps_.spStats->recordTransaction(tx.slot);
    advanceCheckpoint(tx.slot);
    return outcome;
  }

  Error lastError;
  for (uint64_t attempt = 0; attempt < config_.maxRetries; ++attempt) {
    UnitEvents unitEvents;
    auto roeUnit = runUnit(events, unitEvents);
    if (roeUnit) {
      outcome = roeUnit.value();
      outcome.attempts = static_cast<uint32_t>(attempt + 1);
      afterCommit(tx, outcome, unitEvents);
      return outcome;
    }

    lastError = roeUnit.error();
    log().warning << "Attempt " << (attempt + 1) << "/" << config_.maxRetries << " for "
                  << tx.signature << " failed: " << lastError.message;
    if (attempt + 1 < config_.maxRetries) {
      std::this_thread::sleep_for(std::chrono::milliseconds(config_.retryBaseDelayMs << attempt));
    }
  }

  log().error << "Dropping transaction " << tx.signature << " at slot " << tx.slot << " after "
              << config_.maxRetries << " attempts: " << lastError.message;
  deps_.spStats->recordError();
  deps_.spStats->recordDropped();
  return Error(E_DROPPED, "Transaction " + tx.signature + " dropped: " + lastError.message);
}

Dispatcher::Roe<Dispatcher::TxOutcome> Dispatcher::runUnit(const std::vector<ParsedEvent> &events,
                                                           UnitEvents &unitEvents) {
  auto roeTx = deps_.spStore->begin();
  if (!roeTx) {
    return Error(roeTx.error().code, "begin: " + roeTx.error().message);
  }
  // Rolls back on every early return below
  std::unique_ptr<IEventStore::Transaction> pTx = std::move(roeTx.value());

  TxOutcome outcome;
  for (const auto &event : events) {
    auto roeStore = deps_.spStore->storeEvent(*pTx, event);
    if (!roeStore) {
      return Error(roeStore.error().code, "store: " + roeStore.error().message);
    }
    if (roeStore.value() == IEventStore::StoreResult::DUPLICATE) {
      outcome.duplicates++;
      continue;
    }
    outcome.inserted++;
    unitEvents.inserted.push_back(&event);

    auto roeSavepoint = pTx->savepoint(HANDLER_SAVEPOINT);
    if (!roeSavepoint) {
      return Error(roeSavepoint.error().code, "savepoint: " + roeSavepoint.error().message);
    }

    auto roeHandler = deps_.spRegistry->dispatch(*pTx, event);
    if (!roeHandler) {
      auto roeRollback = pTx->rollbackTo(HANDLER_SAVEPOINT);
      if (!roeRollback) {
        return Error(roeRollback.error().code, "rollback to savepoint: " +
                                                   roeRollback.error().message);
      }
      outcome.handlerErrors++;
      log().error << "Handler for " << getKindKey(event.kind) << " failed in " << event.signature
                  << "#" << event.instructionIndex << "." << event.eventIndex << ": "
                  << roeHandler.error().message;
      continue;
    }

    auto roeRelease = pTx->release(HANDLER_SAVEPOINT);
    if (!roeRelease) {
      return Error(roeRelease.error().code, "release savepoint: " + roeRelease.error().message);
    }
    unitEvents.handled.push_back(&event);
  }

  auto roeCommit = pTx->commit();
  if (!roeCommit) {
    return Error(roeCommit.error().code, "commit: " + roeCommit.error().message);
  }
  return outcome;
}

void Dispatcher::afterCommit(const RawTransaction &tx, const TxOutcome &outcome,
                             const UnitEvents &unitEvents) {
  advanceCheckpoint(tx.slot);

  auto &stats = *deps_.spStats;
  stats.recordTransaction(tx.slot);
  for (const ParsedEvent *pEvent : unitEvents.inserted) {
    stats.recordEvent(pEvent->kind);
  }
  for (uint32_t i = 0; i < outcome.duplicates; ++i) {
    stats.recordDuplicate();
  }
  for (uint32_t i = 0; i < outcome.handlerErrors; ++i) {
    stats.recordHandlerError();
  }

  if (deps_.spNotifier) {
    for (const ParsedEvent *pEvent : unitEvents.handled) {
      Notifier::Notification notification;
      notification.kind = getKindKey(pEvent->kind);
      notification.signature = pEvent->signature;
      notification.slot = pEvent->slot;
      notification.payload = pEvent->toJson();
      if (deps_.spNotifier->enqueue(std::move(notification))) {
        stats.recordNotificationQueued();
      }
    }
  }

  log().debug << "Processed " << tx.signature << " at slot " << tx.slot << ": "
              << outcome.inserted << " new, " << outcome.duplicates << " duplicate, "
              << outcome.handlerErrors << " handler error(s)";
}

void Dispatcher::advanceCheckpoint(uint64_t slot) {
  auto roeAdvance = deps_.spCheckpoint->advance(slot);
  if (!roeAdvance) {
    deps_.spStats->recordError();
    log().warning << "Failed to advance checkpoint to " << slot << ": "
                  << roeAdvance.error().message;
  }
}

} // namespace ppi
