#ifndef PP_INDEXER_INDEXER_H
#define PP_INDEXER_INDEXER_H

#include "IndexerStats.h"
#include "../dispatch/Dispatcher.h"
#include "../dispatch/HandlerRegistry.h"
#include "../dispatch/Notifier.h"
#include "../interface/ICheckpointStore.hpp"
#include "../interface/IEventStore.hpp"
#include "../interface/ILedgerRpc.hpp"
#include "../interface/ILogStream.hpp"
#include "../lib/Module.h"
#include "../lib/ResultOrError.hpp"
#include "../source/EventSource.h"

#include <nlohmann/json.hpp>

#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace ppi {

/**
 * Owns the pipeline (source, dispatcher, notifier) and its lifecycle.
 *
 * State changes go through canTransition(); start() and stop() are safe to
 * call from any thread, the source reports readiness and fatal failures from
 * its own thread.
 */
class Indexer : public Module {
public:
  struct Error : RoeErrorBase {
    using RoeErrorBase::RoeErrorBase;
  };

  template <typename T> using Roe = ResultOrError<T, Error>;

  static constexpr const int32_t E_CONFIG = -1;
  static constexpr const int32_t E_STATE = -2;
  static constexpr const int32_t E_INIT = -3;
  static constexpr const int32_t E_START = -4;
  static constexpr const int32_t E_REINDEX = -5;
  static constexpr const int32_t E_REPROCESS = -6;

  enum class State : uint8_t { STOPPED, STARTING, RUNNING, STOPPING, ERRORED };

  static const char *getStateName(State state);

  static constexpr bool canTransition(State from, State to) {
    switch (from) {
    case State::STOPPED:
      return to == State::STARTING;
    case State::STARTING:
      return to == State::RUNNING || to == State::STOPPING || to == State::ERRORED;
    case State::RUNNING:
      return to == State::STOPPING || to == State::ERRORED;
    case State::STOPPING:
      return to == State::STOPPED;
    case State::ERRORED:
      return to == State::STOPPING || to == State::STARTING;
    }
    return false;
  }

  /**
   * Contents of config.json. Connection settings are consumed by the
   * application when it builds the collaborators.
   */
  struct Config {
    static constexpr const char *DEFAULT_RPC_URL = "https://api.devnet.solana.com";
    static constexpr const char *DEFAULT_WS_URL = "wss://api.devnet.solana.com";
    static constexpr const char *DEFAULT_COMMITMENT = "confirmed";
    static constexpr const char *DEFAULT_DATABASE = "indexer.db";
    static constexpr const char *DEFAULT_LOG_LEVEL = "info";
    static constexpr const uint64_t DEFAULT_HEALTH_LOG_INTERVAL_SEC = 60;

    std::string rpcUrl{ DEFAULT_RPC_URL };
    std::string wsUrl{ DEFAULT_WS_URL };
    std::string programId;
    std::string commitment{ DEFAULT_COMMITMENT };
    // Relative paths are resolved against the work directory
    std::string database{ DEFAULT_DATABASE };
    // Empty disables the webhook
    std::string notifyUrl;
    std::string logLevel{ DEFAULT_LOG_LEVEL };
    // 0 disables the periodic health line
    uint64_t healthLogIntervalSec{ DEFAULT_HEALTH_LOG_INTERVAL_SEC };
    EventSource::Config source;
    Dispatcher::Config dispatch;

    nlohmann::json ltsToJson() const;
    Roe<void> ltsFromJson(const nlohmann::json &jd);
  };

  struct Collaborators {
    std::shared_ptr<ILedgerRpc> spRpc;
    // Optional
    std::shared_ptr<ILogStream> spStream;
    std::shared_ptr<IEventStore> spStore;
    std::shared_ptr<ICheckpointStore> spCheckpoint;
  };

  struct Status {
    State state{ State::STOPPED };
    bool running{ false };
    EventSource::Mode mode{ EventSource::Mode::FALLBACK };
    IndexerStats::Snapshot stats;
    int64_t uptimeSeconds{ 0 };
    std::optional<Checkpoint> checkpoint;

    nlohmann::json toJson() const;
    /** One line for the periodic health log */
    std::string toSummary() const;
  };

  Indexer();
  ~Indexer() override;

  Roe<void> init(const Config &config, const Collaborators &collaborators);

  void registerHandler(EventKind kind, HandlerRegistry::Handler handler);
  void setNotificationSink(Notifier::Sink sink);

  /** No-op (with a warning) when already starting or running */
  Roe<void> start();
  /** No-op (with a warning) when already stopped */
  Roe<void> stop();

  State getState() const;
  Status getStatus() const;

  /**
   * Replay [fromSlot, toSlot] through the dispatcher. Only while stopped.
   * Stored events are deduplicated and the checkpoint never moves back.
   * @return number of transactions replayed
   */
  Roe<uint64_t> reindex(uint64_t fromSlot, uint64_t toSlot);

  /**
   * Fetch one transaction by signature and run it through the dispatcher,
   * for transactions the source missed. Only while stopped.
   */
  Roe<Dispatcher::TxOutcome> reprocess(const std::string &signature);

  /** Log the status summary, warning when the indexer is not running */
  void logHealth() const;

  const std::shared_ptr<IndexerStats> &getStats() const { return spStats_; }

private:
  bool transitionTo(State to);
  bool transitionFrom(State from, State to);
  void onSourceReady();
  void onSourceFatal(const std::string &message);

  mutable std::mutex stateMutex_;
  State state_{ State::STOPPED };
  bool initialized_{ false };
  int64_t startedAt_{ 0 };

  Config config_;
  Collaborators collaborators_;
  std::shared_ptr<IndexerStats> spStats_;
  std::shared_ptr<HandlerRegistry> spRegistry_;
  std::shared_ptr<Notifier> spNotifier_;
  std::shared_ptr<Dispatcher> spDispatcher_;
  std::unique_ptr<EventSource> pSource_;
};

} // namespace ppi

#endif // PP_INDEXER_INDEXER_H
