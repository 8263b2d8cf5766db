#include "Dispatcher.h"
#include "HandlerRegistry.h"
#include "Notifier.h"
#include "EventFixtures.h"
#include "SqliteCheckpointStore.h"
#include "SqliteDb.h"
#include "SqliteEventStore.h"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>

using namespace ppi;
using ppi::test::makeAddress;
using ppi::test::makeClaimTransaction;

namespace {

/** Delegates to a real store, failing begin() a scripted number of times */
class FlakyEventStore : public IEventStore {
public:
  explicit FlakyEventStore(std::shared_ptr<IEventStore> inner) : inner_(std::move(inner)) {}

  void failBegin(int count) { beginFailures_ = count; }
  int getBeginCalls() const { return beginCalls_; }

  Roe<std::unique_ptr<Transaction>> begin() override {
    beginCalls_++;
    if (beginFailures_ < 0 || beginFailures_-- > 0) {
      return Error(SqliteDb::E_BUSY, "database is locked");
    }
    return inner_->begin();
  }

  Roe<StoreResult> storeEvent(Transaction &tx, const ParsedEvent &event) override {
    return inner_->storeEvent(tx, event);
  }

  Roe<uint64_t> countEvents() override { return inner_->countEvents(); }
  Roe<bool> hasEvent(const DedupKey &key) override { return inner_->hasEvent(key); }

private:
  std::shared_ptr<IEventStore> inner_;
  int beginFailures_{ 0 };
  int beginCalls_{ 0 };
};

class NullTransaction : public IEventStore::Transaction {
public:
  Roe<void> commit() override { return {}; }
  Roe<void> rollback() override { return {}; }
  Roe<void> savepoint(const std::string &) override { return {}; }
  Roe<void> release(const std::string &) override { return {}; }
  Roe<void> rollbackTo(const std::string &) override { return {}; }
};

} // namespace

class DispatcherTest : public ::testing::Test {
protected:
  void SetUp() override {
    programId_ = makeAddress(7);

    spDb_ = std::make_shared<SqliteDb>();
    auto result = spDb_->open(":memory:");
    ASSERT_TRUE(result.isOk()) << result.error().message;
    ASSERT_TRUE(spDb_->exec("CREATE TABLE claims(signature TEXT, amount INTEGER);").isOk());

    spEvents_ = std::make_shared<SqliteEventStore>(spDb_);
    spStore_ = std::make_shared<FlakyEventStore>(spEvents_);
    spCheckpoint_ = std::make_shared<SqliteCheckpointStore>(spDb_);
    spRegistry_ = std::make_shared<HandlerRegistry>();
    spStats_ = std::make_shared<IndexerStats>();
    spNotifier_ = std::make_shared<Notifier>();
  }

  void initDispatcher() {
    Dispatcher::Config config;
    config.programId = programId_;
    config.maxRetries = 3;
    config.retryBaseDelayMs = 1;

    Dispatcher::Dependencies deps;
    deps.spStore = spStore_;
    deps.spCheckpoint = spCheckpoint_;
    deps.spRegistry = spRegistry_;
    deps.spStats = spStats_;
    deps.spNotifier = spNotifier_;
    auto result = dispatcher_.init(config, deps);
    ASSERT_TRUE(result.isOk()) << result.error().message;
  }

  // Handler that records each claim in the claims table
  void registerClaimHandler() {
    spRegistry_->registerHandler(
        EventKind::EARNINGS_CLAIMED,
        [this](IEventStore::Transaction &, const ParsedEvent &event) -> Roe<void> {
          handlerCalls_++;
          auto amount = event.getUInt("amount");
          auto result = spDb_->exec("INSERT INTO claims VALUES('" + event.signature + "', " +
                                    std::to_string(amount.value_or(0)) + ");");
          if (!result) {
            return Error(1, result.error().message);
          }
          return {};
        });
  }

  int64_t queryInt(const std::string &sql) {
    auto roeStmt = spDb_->prepare(sql);
    EXPECT_TRUE(roeStmt.isOk());
    EXPECT_EQ(sqlite3_step(roeStmt.value().get()), SQLITE_ROW);
    return sqlite3_column_int64(roeStmt.value().get(), 0);
  }

  uint64_t countEvents() { return spEvents_->countEvents().value(); }

  std::optional<uint64_t> checkpointSlot() {
    auto roeCp = spCheckpoint_->load();
    EXPECT_TRUE(roeCp.isOk());
    if (!roeCp.value()) {
      return std::nullopt;
    }
    return roeCp.value()->lastProcessedSlot;
  }

  std::string programId_;
  std::shared_ptr<SqliteDb> spDb_;
  std::shared_ptr<SqliteEventStore> spEvents_;
  std::shared_ptr<FlakyEventStore> spStore_;
  std::shared_ptr<SqliteCheckpointStore> spCheckpoint_;
  std::shared_ptr<HandlerRegistry> spRegistry_;
  std::shared_ptr<IndexerStats> spStats_;
  std::shared_ptr<Notifier> spNotifier_;
  Dispatcher dispatcher_;
  int handlerCalls_{ 0 };
};

TEST_F(DispatcherTest, InitRequiresDependencies) {
  Dispatcher dispatcher;
  Dispatcher::Dependencies deps;
  deps.spStore = spStore_;
  auto result = dispatcher.init(Dispatcher::Config(), deps);
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Dispatcher::E_CONFIG);

  RawTransaction tx = makeClaimTransaction(programId_, "sig-uninit", 10);
  EXPECT_TRUE(dispatcher.processTransaction(tx).isError());
}

TEST_F(DispatcherTest, StoresEventAndRunsHandler) {
  registerClaimHandler();
  initDispatcher();

  auto result = dispatcher_.processTransaction(makeClaimTransaction(programId_, "sig-1", 100, 250));
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result.value().inserted, 1u);
  EXPECT_EQ(result.value().duplicates, 0u);
  EXPECT_EQ(result.value().attempts, 1u);

  EXPECT_EQ(countEvents(), 1u);
  EXPECT_EQ(handlerCalls_, 1);
  EXPECT_EQ(queryInt("SELECT SUM(amount) FROM claims;"), 250);
  EXPECT_EQ(checkpointSlot(), std::optional<uint64_t>(100));

  auto snapshot = spStats_->snapshot();
  EXPECT_EQ(snapshot.eventsProcessed, 1u);
  EXPECT_EQ(snapshot.eventsByKind[static_cast<size_t>(EventKind::EARNINGS_CLAIMED)], 1u);
  EXPECT_EQ(snapshot.transactionsProcessed, 1u);
  EXPECT_EQ(snapshot.lastProcessedSlot, 100u);
}

TEST_F(DispatcherTest, ReplayedTransactionIsDeduplicated) {
  registerClaimHandler();
  initDispatcher();

  RawTransaction tx = makeClaimTransaction(programId_, "sig-replay", 100);
  ASSERT_TRUE(dispatcher_.processTransaction(tx).isOk());

  auto replay = dispatcher_.processTransaction(tx);
  ASSERT_TRUE(replay.isOk());
  EXPECT_EQ(replay.value().inserted, 0u);
  EXPECT_EQ(replay.value().duplicates, 1u);

  EXPECT_EQ(countEvents(), 1u);
  EXPECT_EQ(handlerCalls_, 1);
  EXPECT_EQ(queryInt("SELECT COUNT(*) FROM claims;"), 1);
  EXPECT_EQ(spStats_->snapshot().duplicates, 1u);
  EXPECT_EQ(spStats_->snapshot().eventsProcessed, 1u);
}

TEST_F(DispatcherTest, HandlerErrorKeepsEventAndUndoesHandlerWrites) {
  spRegistry_->registerHandler(
      EventKind::EARNINGS_CLAIMED,
      [this](IEventStore::Transaction &, const ParsedEvent &event) -> Roe<void> {
        handlerCalls_++;
        auto result = spDb_->exec("INSERT INTO claims VALUES('" + event.signature + "', 1);");
        if (!result) {
          return Error(1, result.error().message);
        }
        return Error(2, "player not registered");
      });
  initDispatcher();

  auto result = dispatcher_.processTransaction(makeClaimTransaction(programId_, "sig-bad", 100));
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result.value().inserted, 1u);
  EXPECT_EQ(result.value().handlerErrors, 1u);

  EXPECT_EQ(countEvents(), 1u);
  EXPECT_EQ(queryInt("SELECT COUNT(*) FROM claims;"), 0);
  EXPECT_EQ(checkpointSlot(), std::optional<uint64_t>(100));
  EXPECT_EQ(spStats_->snapshot().handlerErrors, 1u);
  // Not handled, nothing to announce
  EXPECT_EQ(spNotifier_->getPending(), 0u);
}

TEST_F(DispatcherTest, MissingHandlerCountsAsHandled) {
  initDispatcher();

  auto result = dispatcher_.processTransaction(makeClaimTransaction(programId_, "sig-none", 100));
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value().inserted, 1u);
  EXPECT_EQ(result.value().handlerErrors, 0u);
  EXPECT_EQ(spNotifier_->getPending(), 1u);
}

TEST_F(DispatcherTest, RetriesStorageFailures) {
  registerClaimHandler();
  initDispatcher();
  spStore_->failBegin(2);

  auto result = dispatcher_.processTransaction(makeClaimTransaction(programId_, "sig-retry", 100));
  ASSERT_TRUE(result.isOk()) << result.error().message;
  EXPECT_EQ(result.value().attempts, 3u);
  EXPECT_EQ(spStore_->getBeginCalls(), 3);
  EXPECT_EQ(countEvents(), 1u);
  EXPECT_EQ(spStats_->snapshot().transactionsDropped, 0u);
}

TEST_F(DispatcherTest, DropsAfterRetriesExhausted) {
  registerClaimHandler();
  initDispatcher();
  spStore_->failBegin(-1);

  auto result = dispatcher_.processTransaction(makeClaimTransaction(programId_, "sig-drop", 100));
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Dispatcher::E_DROPPED);
  EXPECT_EQ(spStore_->getBeginCalls(), 3);

  EXPECT_EQ(countEvents(), 0u);
  EXPECT_EQ(handlerCalls_, 0);
  EXPECT_FALSE(checkpointSlot().has_value());
  auto snapshot = spStats_->snapshot();
  EXPECT_EQ(snapshot.transactionsDropped, 1u);
  EXPECT_EQ(snapshot.errors, 1u);
}

TEST_F(DispatcherTest, SkipsFailedTransactions) {
  registerClaimHandler();
  initDispatcher();

  RawTransaction tx = makeClaimTransaction(programId_, "sig-failed", 100);
  tx.success = false;
  auto result = dispatcher_.processTransaction(tx);
  ASSERT_TRUE(result.isOk());
  EXPECT_TRUE(result.value().skipped);
  EXPECT_EQ(countEvents(), 0u);
  EXPECT_EQ(spStore_->getBeginCalls(), 0);
  EXPECT_EQ(spStats_->snapshot().transactionsSkipped, 1u);
  EXPECT_FALSE(checkpointSlot().has_value());
}

TEST_F(DispatcherTest, TransactionWithoutEventsAdvancesCheckpoint) {
  initDispatcher();

  RawTransaction tx = ppi::test::makeTransaction("sig-empty", 321, {"Program log: nothing"});
  auto result = dispatcher_.processTransaction(tx);
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value().inserted, 0u);
  EXPECT_EQ(spStore_->getBeginCalls(), 0);
  EXPECT_EQ(checkpointSlot(), std::optional<uint64_t>(321));
  EXPECT_EQ(spStats_->snapshot().transactionsProcessed, 1u);
}

TEST_F(DispatcherTest, CheckpointNeverMovesBack) {
  initDispatcher();
  ASSERT_TRUE(dispatcher_.processTransaction(makeClaimTransaction(programId_, "sig-new", 500)).isOk());
  ASSERT_TRUE(dispatcher_.processTransaction(makeClaimTransaction(programId_, "sig-old", 200)).isOk());
  EXPECT_EQ(checkpointSlot(), std::optional<uint64_t>(500));
  EXPECT_EQ(countEvents(), 2u);
}

TEST_F(DispatcherTest, QueuesNotificationsForHandledEvents) {
  registerClaimHandler();
  initDispatcher();

  RawTransaction tx = makeClaimTransaction(programId_, "sig-notify", 100, 77);
  ASSERT_TRUE(dispatcher_.processTransaction(tx).isOk());
  ASSERT_TRUE(dispatcher_.processTransaction(tx).isOk());

  // The replay was a duplicate and is not announced again
  EXPECT_EQ(spNotifier_->getPending(), 1u);
  EXPECT_EQ(spStats_->snapshot().notificationsQueued, 1u);
}

TEST_F(DispatcherTest, IgnoresOtherPrograms) {
  registerClaimHandler();
  initDispatcher();

  RawTransaction tx = makeClaimTransaction(makeAddress(9), "sig-foreign", 100);
  auto result = dispatcher_.processTransaction(tx);
  ASSERT_TRUE(result.isOk());
  EXPECT_EQ(result.value().inserted, 0u);
  EXPECT_EQ(countEvents(), 0u);
  EXPECT_EQ(handlerCalls_, 0);
}

TEST(DispatcherConfigTest, ParsesAndValidates) {
  Dispatcher::Config config;
  ASSERT_TRUE(config.ltsFromJson({{"maxRetries", 5}, {"retryBaseDelayMs", 20}}).isOk());
  EXPECT_EQ(config.maxRetries, 5u);
  EXPECT_EQ(config.retryBaseDelayMs, 20u);

  Dispatcher::Config zero;
  auto result = zero.ltsFromJson({{"maxRetries", 0}});
  ASSERT_TRUE(result.isError());
  EXPECT_EQ(result.error().code, Dispatcher::E_CONFIG);

  EXPECT_TRUE(Dispatcher::Config().ltsFromJson("retries").isError());
}

TEST(HandlerRegistryTest, RegisterFindAndReplace) {
  HandlerRegistry registry;
  EXPECT_FALSE(registry.has(EventKind::PLAYER_CREATED));

  int first = 0;
  int second = 0;
  registry.registerHandler(EventKind::PLAYER_CREATED,
                           [&first](IEventStore::Transaction &, const ParsedEvent &) -> Roe<void> {
                             first++;
                             return {};
                           });
  registry.registerHandler(EventKind::PLAYER_CREATED,
                           [&second](IEventStore::Transaction &, const ParsedEvent &) -> Roe<void> {
                             second++;
                             return {};
                           });
  EXPECT_TRUE(registry.has(EventKind::PLAYER_CREATED));
  EXPECT_EQ(registry.size(), 1u);
  ASSERT_NE(registry.find(EventKind::PLAYER_CREATED), nullptr);
  EXPECT_EQ(registry.find(EventKind::EARNINGS_CLAIMED), nullptr);

  NullTransaction tx;
  ParsedEvent event;
  event.kind = EventKind::PLAYER_CREATED;
  EXPECT_TRUE(registry.dispatch(tx, event).isOk());
  EXPECT_EQ(first, 0);
  EXPECT_EQ(second, 1);

  // Kinds without a handler are treated as handled
  event.kind = EventKind::SLOT_UNLOCKED;
  EXPECT_TRUE(registry.dispatch(tx, event).isOk());
}

TEST(NotifierTest, DeliversQueuedNotifications) {
  Notifier notifier;
  std::mutex mutex;
  std::vector<std::string> received;
  notifier.setSink([&](const Notifier::Notification &notification) -> ppi::Roe<void> {
    std::lock_guard<std::mutex> lock(mutex);
    received.push_back(notification.signature);
    if (notification.signature == "bad") {
      return ppi::Error(3, "HTTP 500");
    }
    return {};
  });

  ASSERT_TRUE(notifier.start().isOk());
  for (const char *sig : {"a", "bad", "b"}) {
    Notifier::Notification notification;
    notification.kind = "earnings_claimed";
    notification.signature = sig;
    EXPECT_TRUE(notifier.enqueue(notification));
  }

  auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(5);
  while (notifier.getDelivered() + notifier.getFailed() < 3 &&
         std::chrono::steady_clock::now() < deadline) {
    std::this_thread::sleep_for(std::chrono::milliseconds(5));
  }
  notifier.stop();

  EXPECT_EQ(notifier.getDelivered(), 2u);
  EXPECT_EQ(notifier.getFailed(), 1u);
  std::lock_guard<std::mutex> lock(mutex);
  EXPECT_EQ(received, (std::vector<std::string>{"a", "bad", "b"}));
}

TEST(NotifierTest, DropsWhenQueueIsFull) {
  Notifier notifier;
  notifier.setMaxQueueSize(2);
  EXPECT_TRUE(notifier.enqueue(Notifier::Notification()));
  EXPECT_TRUE(notifier.enqueue(Notifier::Notification()));
  EXPECT_FALSE(notifier.enqueue(Notifier::Notification()));
  EXPECT_EQ(notifier.getPending(), 2u);
  EXPECT_EQ(notifier.getDropped(), 1u);
}
