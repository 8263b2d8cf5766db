#ifndef PP_INDEXER_DISPATCHER_H
#define PP_INDEXER_DISPATCHER_H

#include "HandlerRegistry.h"
#include "Notifier.h"
#include "../decoder/EventDecoder.h"
#include "../indexer/IndexerStats.h"
#include "../interface/ICheckpointStore.hpp"
#include "../interface/IEventStore.hpp"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <vector>

namespace ppi {

/**
 * Per-transaction unit of work: decode, store each new event, run its
 * handler, commit, then advance the checkpoint and queue notifications.
 *
 * Storage errors roll back the whole unit and retry it with exponential
 * backoff. A handler error only undoes that handler's writes; the stored
 * event is kept and the rest of the transaction proceeds.
 */
class Dispatcher : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_CONFIG = -1;
  // Retries exhausted, the transaction was not stored
  static constexpr const int32_t E_DROPPED = -2;

  struct Config {
    static constexpr const uint64_t DEFAULT_MAX_RETRIES = 3;
    static constexpr const uint64_t DEFAULT_RETRY_BASE_DELAY_MS = 100;

    std::string programId;
    uint64_t maxRetries{ DEFAULT_MAX_RETRIES };
    uint64_t retryBaseDelayMs{ DEFAULT_RETRY_BASE_DELAY_MS };

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  struct Dependencies {
    std::shared_ptr<IEventStore> spStore;
    std::shared_ptr<ICheckpointStore> spCheckpoint;
    std::shared_ptr<HandlerRegistry> spRegistry;
    std::shared_ptr<IndexerStats> spStats;
    // Optional
    std::shared_ptr<Notifier> spNotifier;
  };

  struct TxOutcome {
    bool skipped{ false };
    uint32_t inserted{ 0 };
    uint32_t duplicates{ 0 };
    uint32_t handlerErrors{ 0 };
    // Attempts used, 1 when the first one succeeded
    uint32_t attempts{ 0 };
  };

  Dispatcher();

  Roe<void> init(const Config &config, const Dependencies &deps);

  Roe<TxOutcome> processTransaction(const RawTransaction &tx);

  const EventDecoder &getDecoder() const { return decoder_; }

private:

  // Events touched by one committed unit
  struct UnitEvents {
    std::vector<const ParsedEvent *> inserted;
    // Inserted and handled without error
    std::vector<const ParsedEvent *> handled;
  };

  Roe<TxOutcome> runUnit(const std::vector<ParsedEvent> &events, UnitEvents &unitEvents);
  void afterCommit(const RawTransaction &tx, const TxOutcome &outcome,
                   const UnitEvents &unitEvents);
  void advanceCheckpoint(uint64_t slot);

  static constexpr const char *HANDLER_SAVEPOINT = "handler";

  Config config_;
  Dependencies deps_;
  EventDecoder decoder_;
};

} // namespace ppi

#endif // PP_INDEXER_DISPATCHER_H
