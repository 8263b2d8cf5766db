#ifndef PP_INDEXER_EVENT_SOURCE_H
#define PP_INDEXER_EVENT_SOURCE_H

#include "../decoder/Event.h"
#include "../indexer/IndexerStats.h"
#include "../interface/ICheckpointStore.hpp"
#include "../interface/ILedgerRpc.hpp"
#include "../interface/ILogStream.hpp"
#include "../lib/Service.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <string>

namespace ppi {

/**
 * Delivers the program's transactions to a sink, in one dedicated thread.
 *
 * On start it catches up from the stored checkpoint (with a short backfill
 * behind it), then follows the ledger either through the push stream (LIVE)
 * or by polling slot ranges (FALLBACK). LIVE degrades to FALLBACK after
 * repeated subscription failures; FALLBACK gives up, through the fatal
 * callback, after repeated poll failures.
 */
class EventSource : public Service {
public:
  enum class Mode : uint8_t { LIVE, FALLBACK };

  static const char *getModeName(Mode mode);

  static constexpr const int32_t E_CONFIG = -10;
  static constexpr const int32_t E_RPC = -11;
  static constexpr const int32_t E_CHECKPOINT = -12;
  static constexpr const int32_t E_STOPPED = -13;

  struct Config {
    static constexpr const uint64_t DEFAULT_BACKFILL_WINDOW = 500;
    static constexpr const uint64_t DEFAULT_INITIAL_LOOKBACK = 1000;
    static constexpr const uint64_t DEFAULT_MAX_CHECKPOINT_LAG = 50000;
    static constexpr const uint64_t DEFAULT_BATCH_SLOTS = 2000;
    static constexpr const uint64_t DEFAULT_MAX_TRANSACTIONS_PER_BATCH = 1000;
    static constexpr const uint64_t DEFAULT_POLL_INTERVAL_MS = 2000;
    static constexpr const uint64_t DEFAULT_LIVE_FAILURE_THRESHOLD = 3;
    static constexpr const uint64_t DEFAULT_RECONNECT_DELAY_MS = 500;
    static constexpr const uint64_t DEFAULT_MAX_POLL_RETRIES = 3;
    static constexpr const uint64_t DEFAULT_RETRY_BASE_DELAY_MS = 10000;
    static constexpr const uint64_t DEFAULT_RETRY_MAX_DELAY_MS = 300000;

    std::string programId;
    bool useLive{ true };
    bool fetchFullTransaction{ true };
    uint64_t backfillWindow{ DEFAULT_BACKFILL_WINDOW };
    uint64_t initialLookback{ DEFAULT_INITIAL_LOOKBACK };
    uint64_t maxCheckpointLag{ DEFAULT_MAX_CHECKPOINT_LAG };
    uint64_t batchSlots{ DEFAULT_BATCH_SLOTS };
    uint64_t maxTransactionsPerBatch{ DEFAULT_MAX_TRANSACTIONS_PER_BATCH };
    uint64_t pollIntervalMs{ DEFAULT_POLL_INTERVAL_MS };
    uint64_t liveFailureThreshold{ DEFAULT_LIVE_FAILURE_THRESHOLD };
    uint64_t reconnectDelayMs{ DEFAULT_RECONNECT_DELAY_MS };
    uint64_t maxPollRetries{ DEFAULT_MAX_POLL_RETRIES };
    uint64_t retryBaseDelayMs{ DEFAULT_RETRY_BASE_DELAY_MS };
    uint64_t retryMaxDelayMs{ DEFAULT_RETRY_MAX_DELAY_MS };

    // programId is not part of this section, it is shared with the dispatcher
    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  struct Dependencies {
    std::shared_ptr<ILedgerRpc> spRpc;
    // Optional, without it the source polls
    std::shared_ptr<ILogStream> spStream;
    std::shared_ptr<ICheckpointStore> spCheckpoint;
    std::shared_ptr<IndexerStats> spStats;
  };

  using TransactionSink = std::function<void(const RawTransaction &)>;

  EventSource();
  ~EventSource() override;

  Roe<void> init(const Config &config, const Dependencies &deps);

  void setTransactionSink(TransactionSink sink) { sink_ = std::move(sink); }
  /** Called from the source thread once startup catch-up is done */
  void setOnReady(std::function<void()> onReady) { onReady_ = std::move(onReady); }
  /** Called from the source thread when polling gave up; the thread then exits */
  void setOnFatal(std::function<void(const std::string &)> onFatal) {
    onFatal_ = std::move(onFatal);
  }

  Mode getMode() const { return mode_; }
  uint64_t getCursor() const { return cursor_; }
  const Config &getConfig() const { return config_; }

  /**
   * Feed [startSlot, endSlot] through the sink in the calling thread without
   * touching the checkpoint. Only valid while the service is not running.
   * @return number of transactions delivered
   */
  Roe<uint64_t> replayRange(uint64_t startSlot, uint64_t endSlot);

protected:
  void runLoop() override;
  Roe<void> onStart() override;
  void onStopRequest() override;

private:
  bool runStartup();
  Roe<void> syncFromCheckpoint(bool &backfilled);
  void runLive();
  /** Deliver [cursor, head] after a (re)subscription */
  Roe<void> catchUpLive();
  /**
   * Count a failed live attempt and wait before the next one.
   * @return false once the source has switched to fallback
   */
  bool handleLiveFailure(const std::string &message);
  void runFallback();
  void handleNotification(const LogNotification &notification);

  /**
   * Fetch and deliver [startSlot, endSlot] in batches of config_.batchSlots.
   * When advanceCheckpoint is set the checkpoint follows each finished batch.
   * When interruptible is set a stop request aborts with E_STOPPED.
   */
  Roe<uint64_t> processRange(uint64_t startSlot, uint64_t endSlot, bool advanceCheckpoint,
                             bool interruptible);

  /**
   * Count a connectivity failure and back off.
   * @return false when the source should give up (retries exhausted or stop)
   */
  bool handleFailure(const std::string &message);
  std::chrono::milliseconds getRetryDelay() const;

  Config config_;
  Dependencies deps_;
  TransactionSink sink_;
  std::function<void()> onReady_;
  std::function<void(const std::string &)> onFatal_;

  std::atomic<Mode> mode_{ Mode::FALLBACK };
  std::atomic<uint64_t> cursor_{ 0 };
  uint64_t liveFailures_{ 0 };
  uint64_t pollFailures_{ 0 };
};

} // namespace ppi

#endif // PP_INDEXER_EVENT_SOURCE_H
