#include "Indexer.h"
#include "../lib/Logger.h"
#include "../lib/Utilities.h"

#include <sstream>

namespace ppi {

const char *Indexer::getStateName(State state) {
  switch (state) {
  case State::STOPPED:
    return "stopped";
  case State::STARTING:
    return "starting";
  case State::RUNNING:
    return "running";
  case State::STOPPING:
    return "stopping";
  case State::ERRORED:
    return "errored";
  }
  return "unknown";
}

// ============ Config methods ============

nlohmann::json Indexer::Config::ltsToJson() const {
  nlohmann::json j;
  j["rpcUrl"] = rpcUrl;
  j["wsUrl"] = wsUrl;
  j["programId"] = programId;
  j["commitment"] = commitment;
  j["database"] = database;
  j["notifyUrl"] = notifyUrl;
  j["logLevel"] = logLevel;
  j["healthLogIntervalSec"] = healthLogIntervalSec;
  j["source"] = source.ltsToJson();
  j["dispatch"] = dispatch.ltsToJson();
  return j;
}

Indexer::Roe<void> Indexer::Config::ltsFromJson(const nlohmann::json &jd) {
  try {
    if (!jd.is_object()) {
      return Error(E_CONFIG, "Configuration must be a JSON object");
    }

    for (auto result : {utl::readJsonField(jd, "rpcUrl", rpcUrl),
                        utl::readJsonField(jd, "wsUrl", wsUrl),
                        utl::readJsonField(jd, "programId", programId),
                        utl::readJsonField(jd, "commitment", commitment),
                        utl::readJsonField(jd, "database", database),
                        utl::readJsonField(jd, "notifyUrl", notifyUrl),
                        utl::readJsonField(jd, "logLevel", logLevel),
                        utl::readJsonField(jd, "healthLogIntervalSec", healthLogIntervalSec)}) {
      if (!result) {
        return Error(E_CONFIG, result.error().message);
      }
    }

    if (rpcUrl.empty()) {
      return Error(E_CONFIG, "Field 'rpcUrl' cannot be empty");
    }
    if (database.empty()) {
      return Error(E_CONFIG, "Field 'database' cannot be empty");
    }

    if (programId.empty()) {
      return Error(E_CONFIG, "Field 'programId' cannot be empty");
    }
    auto roeKey = utl::base58Decode(programId);
    if (!roeKey || roeKey.value().size() != 32) {
      return Error(E_CONFIG, "Field 'programId' must be a base58 public key");
    }

    if (commitment != "confirmed" && commitment != "finalized") {
      return Error(E_CONFIG, "Field 'commitment' must be 'confirmed' or 'finalized'");
    }

    logging::Level level;
    if (!logging::parseLevel(logLevel, level)) {
      return Error(E_CONFIG, "Unknown log level: " + logLevel);
    }

    if (jd.contains("source")) {
      auto result = source.ltsFromJson(jd["source"]);
      if (!result) {
        return Error(E_CONFIG, result.error().message);
      }
    }
    if (jd.contains("dispatch")) {
      auto result = dispatch.ltsFromJson(jd["dispatch"]);
      if (!result) {
        return Error(E_CONFIG, result.error().message);
      }
    }

    source.programId = programId;
    dispatch.programId = programId;
    return {};
  } catch (const std::exception &e) {
    return Error(E_CONFIG, "Failed to parse configuration: " + std::string(e.what()));
  }
}

// ============ Status methods ============

nlohmann::json Indexer::Status::toJson() const {
  nlohmann::json j;
  j["state"] = getStateName(state);
  j["running"] = running;
  j["mode"] = EventSource::getModeName(mode);
  j["uptimeSeconds"] = uptimeSeconds;
  j["stats"] = stats.toJson();
  if (checkpoint) {
    nlohmann::json cp;
    cp["lastProcessedSlot"] = checkpoint->lastProcessedSlot;
    cp["updatedAt"] = checkpoint->updatedAt;
    j["checkpoint"] = cp;
  } else {
    j["checkpoint"] = nullptr;
  }
  return j;
}

std::string Indexer::Status::toSummary() const {
  std::ostringstream oss;
  oss << "state=" << getStateName(state) << " mode=" << EventSource::getModeName(mode)
      << " events=" << stats.eventsProcessed << " duplicates=" << stats.duplicates
      << " transactions=" << stats.transactionsProcessed
      << " dropped=" << stats.transactionsDropped << " errors=" << stats.errors
      << " lastSlot=" << stats.lastProcessedSlot << " checkpoint=";
  if (checkpoint) {
    oss << checkpoint->lastProcessedSlot;
  } else {
    oss << "none";
  }
  oss << " uptime=" << uptimeSeconds << "s";
  return oss.str();
}

// ============ Indexer methods ============

Indexer::Indexer()
    : Module("indexer"), spStats_(std::make_shared<IndexerStats>()),
      spRegistry_(std::make_shared<HandlerRegistry>()), spNotifier_(std::make_shared<Notifier>()),
      spDispatcher_(std::make_shared<Dispatcher>()), pSource_(std::make_unique<EventSource>()) {
  spRegistry_->redirectLogger(log().getFullName());
  spNotifier_->redirectLogger(log().getFullName());
  spDispatcher_->redirectLogger(log().getFullName());
  pSource_->redirectLogger(log().getFullName());
}

Indexer::~Indexer() {
  State state = getState();
  if (state != State::STOPPED) {
    auto result = stop();
    if (!result) {
      log().error << "Failed to stop indexer: " << result.error().message;
    }
  }
}

Indexer::Roe<void> Indexer::init(const Config &config, const Collaborators &collaborators) {
  std::lock_guard<std::mutex> lock(stateMutex_);
  if (state_ != State::STOPPED) {
    return Error(E_STATE, std::string("Cannot initialize while ") + getStateName(state_));
  }
  if (!collaborators.spRpc || !collaborators.spStore || !collaborators.spCheckpoint) {
    return Error(E_INIT, "RPC client, event store and checkpoint store are required");
  }

  config_ = config;
  config_.source.programId = config.programId;
  config_.dispatch.programId = config.programId;
  collaborators_ = collaborators;

  Dispatcher::Dependencies dispatchDeps;
  dispatchDeps.spStore = collaborators.spStore;
  dispatchDeps.spCheckpoint = collaborators.spCheckpoint;
  dispatchDeps.spRegistry = spRegistry_;
  dispatchDeps.spStats = spStats_;
  dispatchDeps.spNotifier = spNotifier_;
  auto roeDispatcher = spDispatcher_->init(config_.dispatch, dispatchDeps);
  if (!roeDispatcher) {
    return Error(E_INIT, "Dispatcher: " + roeDispatcher.error().message);
  }

  EventSource::Dependencies sourceDeps;
  sourceDeps.spRpc = collaborators.spRpc;
  sourceDeps.spStream = collaborators.spStream;
  sourceDeps.spCheckpoint = collaborators.spCheckpoint;
  sourceDeps.spStats = spStats_;
  auto roeSource = pSource_->init(config_.source, sourceDeps);
  if (!roeSource) {
    return Error(E_INIT, "Event source: " + roeSource.error().message);
  }

  pSource_->setTransactionSink([this](const RawTransaction &tx) {
    auto result = spDispatcher_->processTransaction(tx);
    if (!result) {
      log().debug << "Transaction " << tx.signature << " not processed: " << result.error().message;
    }
  });
  pSource_->setOnReady([this]() { onSourceReady(); });
  pSource_->setOnFatal([this](const std::string &message) { onSourceFatal(message); });

  initialized_ = true;
  log().info << "Initialized for program " << config_.programId << " ("
             << spRegistry_->size() << " handler(s))";
  return {};
}

void Indexer::registerHandler(EventKind kind, HandlerRegistry::Handler handler) {
  spRegistry_->registerHandler(kind, std::move(handler));
}

void Indexer::setNotificationSink(Notifier::Sink sink) { spNotifier_->setSink(std::move(sink)); }

bool Indexer::transitionTo(State to) {
  if (!canTransition(state_, to)) {
    log().warning << "Invalid state transition " << getStateName(state_) << " -> "
                  << getStateName(to);
    return false;
  }
  log().info << "State " << getStateName(state_) << " -> " << getStateName(to);
  state_ = to;
  return true;
}

bool Indexer::transitionFrom(State from, State to) {
  std::lock_guard<std::mutex> lock(stateMutex_);
  if (state_ != from) {
    return false;
  }
  return transitionTo(to);
}

Indexer::Roe<void> Indexer::start() {
  std::unique_lock<std::mutex> lock(stateMutex_);
  if (state_ == State::STARTING || state_ == State::RUNNING) {
    log().warning << "Indexer already " << getStateName(state_);
    return {};
  }
  if (!initialized_) {
    return Error(E_INIT, "Indexer not initialized");
  }
  bool recovering = state_ == State::ERRORED;
  if (!transitionTo(State::STARTING)) {
    return Error(E_STATE, std::string("Cannot start while ") + getStateName(state_));
  }
  lock.unlock();

  if (recovering) {
    // The source thread has exited on its own, join it before restarting
    if (!pSource_->isStopSet()) {
      pSource_->stop();
    }
    if (!spNotifier_->isStopSet()) {
      spNotifier_->stop();
    }
  }

  spStats_->reset();
  startedAt_ = utl::getCurrentTime();

  auto roeNotifier = spNotifier_->start();
  if (!roeNotifier) {
    transitionFrom(State::STARTING, State::ERRORED);
    return Error(E_START, "Notifier: " + roeNotifier.error().message);
  }

  auto roeSource = pSource_->start();
  if (!roeSource) {
    spNotifier_->stop();
    transitionFrom(State::STARTING, State::ERRORED);
    return Error(E_START, "Event source: " + roeSource.error().message);
  }
  return {};
}

Indexer::Roe<void> Indexer::stop() {
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (state_ == State::STOPPED) {
      log().warning << "Indexer already stopped";
      return {};
    }
    if (!transitionTo(State::STOPPING)) {
      return Error(E_STATE, std::string("Cannot stop while ") + getStateName(state_));
    }
  }

  if (!pSource_->isStopSet()) {
    pSource_->stop();
  }
  if (!spNotifier_->isStopSet()) {
    spNotifier_->stop();
  }

  std::lock_guard<std::mutex> lock(stateMutex_);
  transitionTo(State::STOPPED);
  return {};
}

Indexer::State Indexer::getState() const {
  std::lock_guard<std::mutex> lock(stateMutex_);
  return state_;
}

Indexer::Status Indexer::getStatus() const {
  Status status;
  status.state = getState();
  status.running = status.state == State::RUNNING;
  status.mode = pSource_->getMode();
  status.stats = spStats_->snapshot();
  if (status.state == State::STARTING || status.state == State::RUNNING) {
    status.uptimeSeconds = utl::getCurrentTime() - startedAt_;
  }
  if (collaborators_.spCheckpoint) {
    auto roeCheckpoint = collaborators_.spCheckpoint->load();
    if (roeCheckpoint) {
      status.checkpoint = roeCheckpoint.value();
    } else {
      log().warning << "Failed to read checkpoint: " << roeCheckpoint.error().message;
    }
  }
  return status;
}

Indexer::Roe<uint64_t> Indexer::reindex(uint64_t fromSlot, uint64_t toSlot) {
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!initialized_) {
      return Error(E_INIT, "Indexer not initialized");
    }
    if (state_ != State::STOPPED) {
      return Error(E_STATE, std::string("Reindex requires a stopped indexer, state is ") +
                                getStateName(state_));
    }
  }
  if (fromSlot > toSlot) {
    return Error(E_REINDEX, "Invalid slot range " + std::to_string(fromSlot) + "-" +
                                std::to_string(toSlot));
  }

  log().info << "Reindexing slots " << fromSlot << "-" << toSlot;
  auto roeReplay = pSource_->replayRange(fromSlot, toSlot);
  if (!roeReplay) {
    return Error(E_REINDEX, roeReplay.error().message);
  }
  log().info << "Reindex replayed " << roeReplay.value() << " transaction(s)";
  return roeReplay.value();
}

Indexer::Roe<Dispatcher::TxOutcome> Indexer::reprocess(const std::string &signature) {
  {
    std::lock_guard<std::mutex> lock(stateMutex_);
    if (!initialized_) {
      return Error(E_INIT, "Indexer not initialized");
    }
    if (state_ != State::STOPPED) {
      return Error(E_STATE, std::string("Reprocess requires a stopped indexer, state is ") +
                                getStateName(state_));
    }
  }
  if (signature.empty()) {
    return Error(E_REPROCESS, "Signature cannot be empty");
  }

  log().info << "Reprocessing transaction " << signature;
  auto roeTx = collaborators_.spRpc->getTransaction(signature);
  if (!roeTx) {
    return Error(E_REPROCESS, "Failed to fetch " + signature + ": " + roeTx.error().message);
  }
  const RawTransaction &tx = roeTx.value();

  auto roeOutcome = spDispatcher_->processTransaction(tx);
  if (!roeOutcome) {
    return Error(E_REPROCESS, roeOutcome.error().message);
  }
  const auto &outcome = roeOutcome.value();
  if (outcome.skipped) {
    log().warning << "Transaction " << signature << " was skipped, nothing to index";
  } else {
    log().info << "Transaction " << signature << " in slot " << tx.slot << ": "
               << outcome.inserted << " new event(s), " << outcome.duplicates
               << " already stored";
  }
  return outcome;
}

void Indexer::logHealth() const {
  Status status = getStatus();
  if (status.state == State::RUNNING) {
    log().info << "Health: " << status.toSummary();
  } else {
    log().warning << "Health: " << status.toSummary();
  }
}

void Indexer::onSourceReady() {
  if (transitionFrom(State::STARTING, State::RUNNING)) {
    log().info << "Indexer running in " << EventSource::getModeName(pSource_->getMode())
               << " mode";
  }
}

void Indexer::onSourceFatal(const std::string &message) {
  std::lock_guard<std::mutex> lock(stateMutex_);
  if (state_ == State::STARTING || state_ == State::RUNNING) {
    log().error << "Event source failed: " << message;
    transitionTo(State::ERRORED);
  }
}

} // namespace ppi
