#ifndef PP_INDEXER_EVENT_H
#define PP_INDEXER_EVENT_H

#include <nlohmann/json.hpp>

#include <array>
#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace ppi {

/**
 * Closed set of program events the indexer understands.
 * The numeric values are stable and used as array indices for statistics.
 */
enum class EventKind : uint8_t {
  PLAYER_CREATED = 0,
  BUSINESS_CREATED,
  BUSINESS_CREATED_IN_SLOT,
  BUSINESS_UPGRADED,
  BUSINESS_UPGRADED_IN_SLOT,
  BUSINESS_SOLD,
  BUSINESS_SOLD_FROM_SLOT,
  EARNINGS_UPDATED,
  EARNINGS_CLAIMED,
  BUSINESS_TRANSFERRED,
  BUSINESS_DEACTIVATED,
  SLOT_UNLOCKED,
  PREMIUM_SLOT_PURCHASED,
};

constexpr const size_t EVENT_KIND_COUNT = 13;

constexpr std::array<EventKind, EVENT_KIND_COUNT> ALL_EVENT_KINDS = {
    EventKind::PLAYER_CREATED,           EventKind::BUSINESS_CREATED,
    EventKind::BUSINESS_CREATED_IN_SLOT, EventKind::BUSINESS_UPGRADED,
    EventKind::BUSINESS_UPGRADED_IN_SLOT, EventKind::BUSINESS_SOLD,
    EventKind::BUSINESS_SOLD_FROM_SLOT,  EventKind::EARNINGS_UPDATED,
    EventKind::EARNINGS_CLAIMED,         EventKind::BUSINESS_TRANSFERRED,
    EventKind::BUSINESS_DEACTIVATED,     EventKind::SLOT_UNLOCKED,
    EventKind::PREMIUM_SLOT_PURCHASED,
};

/** Program-side event name, e.g. "EarningsUpdated". Input of the discriminator hash. */
const char *getKindName(EventKind kind);

/** Storage/JSON key, e.g. "earnings_updated" */
const char *getKindKey(EventKind kind);

bool parseKindKey(const std::string &key, EventKind &kind);

inline size_t kindIndex(EventKind kind) { return static_cast<size_t>(kind); }

/**
 * Typed value of one decoded field.
 * std::string holds a base58 public key, the integers hold numeric fields.
 */
using FieldValue = std::variant<std::string, uint64_t, int64_t>;

struct EventField {
  std::string name;
  FieldValue value;
};

/**
 * Identity of one decoded event. Unique in storage.
 */
struct DedupKey {
  std::string signature;
  uint32_t instructionIndex{ 0 };
  uint32_t eventIndex{ 0 };

  bool operator==(const DedupKey &other) const {
    return signature == other.signature &&
           instructionIndex == other.instructionIndex &&
           eventIndex == other.eventIndex;
  }
};

struct ParsedEvent {
  enum class Origin : uint8_t { BINARY = 0, LOG_FALLBACK = 1 };

  EventKind kind{ EventKind::PLAYER_CREATED };
  std::string signature;
  uint64_t slot{ 0 };
  std::optional<int64_t> blockTime;
  uint32_t instructionIndex{ 0 };
  uint32_t eventIndex{ 0 };
  // In layout order; absent fields are simply not present
  std::vector<EventField> fields;
  // Discriminator followed by payload, empty for log-fallback events
  std::string raw;
  Origin origin{ Origin::BINARY };
  bool partial{ false };

  bool has(const std::string &name) const;
  const FieldValue *find(const std::string &name) const;
  std::optional<std::string> getString(const std::string &name) const;
  std::optional<uint64_t> getUInt(const std::string &name) const;
  std::optional<int64_t> getInt(const std::string &name) const;

  // Replaces an existing field of the same name
  void set(const std::string &name, FieldValue value);

  /** Wallet the event is about (player, wallet, owner, seller or old_owner), or "" */
  std::string getWallet() const;

  DedupKey getDedupKey() const;

  nlohmann::json fieldsToJson() const;
  nlohmann::json toJson() const;
};

/**
 * Where the decoder currently is inside a transaction.
 */
struct TxContext {
  std::string signature;
  uint64_t slot{ 0 };
  std::optional<int64_t> blockTime;
  std::string feePayer;
  uint32_t instructionIndex{ 0 };
  uint32_t eventIndex{ 0 };
};

/**
 * One ledger transaction as delivered by either the poll or push path.
 */
struct RawTransaction {
  std::string signature;
  uint64_t slot{ 0 };
  std::optional<int64_t> blockTime;
  bool success{ true };
  std::vector<std::string> logs;
  // accounts[0] is the fee payer when known
  std::vector<std::string> accounts;

  std::string getFeePayer() const { return accounts.empty() ? "" : accounts.front(); }
};

} // namespace ppi

#endif // PP_INDEXER_EVENT_H
