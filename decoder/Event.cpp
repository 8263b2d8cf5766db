#include "Event.h"

namespace ppi {

namespace {

struct KindNames {
  EventKind kind;
  const char *name;
  const char *key;
};

const KindNames KIND_NAMES[EVENT_KIND_COUNT] = {
    {EventKind::PLAYER_CREATED, "PlayerCreated", "player_created"},
    {EventKind::BUSINESS_CREATED, "BusinessCreated", "business_created"},
    {EventKind::BUSINESS_CREATED_IN_SLOT, "BusinessCreatedInSlot", "business_created_in_slot"},
    {EventKind::BUSINESS_UPGRADED, "BusinessUpgraded", "business_upgraded"},
    {EventKind::BUSINESS_UPGRADED_IN_SLOT, "BusinessUpgradedInSlot", "business_upgraded_in_slot"},
    {EventKind::BUSINESS_SOLD, "BusinessSold", "business_sold"},
    {EventKind::BUSINESS_SOLD_FROM_SLOT, "BusinessSoldFromSlot", "business_sold_from_slot"},
    {EventKind::EARNINGS_UPDATED, "EarningsUpdated", "earnings_updated"},
    {EventKind::EARNINGS_CLAIMED, "EarningsClaimed", "earnings_claimed"},
    {EventKind::BUSINESS_TRANSFERRED, "BusinessTransferred", "business_transferred"},
    {EventKind::BUSINESS_DEACTIVATED, "BusinessDeactivated", "business_deactivated"},
    {EventKind::SLOT_UNLOCKED, "SlotUnlocked", "slot_unlocked"},
    {EventKind::PREMIUM_SLOT_PURCHASED, "PremiumSlotPurchased", "premium_slot_purchased"},
};

// Field names that identify the wallet an event belongs to, by priority
const char *WALLET_FIELDS[] = {"player", "wallet", "owner", "seller", "old_owner"};

} // namespace

const char *getKindName(EventKind kind) {
  size_t i = kindIndex(kind);
  return i < EVENT_KIND_COUNT ? KIND_NAMES[i].name : "Unknown";
}

const char *getKindKey(EventKind kind) {
  size_t i = kindIndex(kind);
  return i < EVENT_KIND_COUNT ? KIND_NAMES[i].key : "unknown";
}

bool parseKindKey(const std::string &key, EventKind &kind) {
  for (const auto &entry : KIND_NAMES) {
    if (key == entry.key) {
      kind = entry.kind;
      return true;
    }
  }
  return false;
}

bool ParsedEvent::has(const std::string &name) const {
  return find(name) != nullptr;
}

const FieldValue *ParsedEvent::find(const std::string &name) const {
  for (const auto &field : fields) {
    if (field.name == name) {
      return &field.value;
    }
  }
  return nullptr;
}

std::optional<std::string> ParsedEvent::getString(const std::string &name) const {
  const FieldValue *value = find(name);
  if (value == nullptr || !std::holds_alternative<std::string>(*value)) {
    return std::nullopt;
  }
  return std::get<std::string>(*value);
}

std::optional<uint64_t> ParsedEvent::getUInt(const std::string &name) const {
  const FieldValue *value = find(name);
  if (value == nullptr || !std::holds_alternative<uint64_t>(*value)) {
    return std::nullopt;
  }
  return std::get<uint64_t>(*value);
}

std::optional<int64_t> ParsedEvent::getInt(const std::string &name) const {
  const FieldValue *value = find(name);
  if (value == nullptr || !std::holds_alternative<int64_t>(*value)) {
    return std::nullopt;
  }
  return std::get<int64_t>(*value);
}

void ParsedEvent::set(const std::string &name, FieldValue value) {
  for (auto &field : fields) {
    if (field.name == name) {
      field.value = std::move(value);
      return;
    }
  }
  fields.push_back({name, std::move(value)});
}

std::string ParsedEvent::getWallet() const {
  for (const char *name : WALLET_FIELDS) {
    auto wallet = getString(name);
    if (wallet) {
      return *wallet;
    }
  }
  return "";
}

DedupKey ParsedEvent::getDedupKey() const {
  DedupKey key;
  key.signature = signature;
  key.instructionIndex = instructionIndex;
  key.eventIndex = eventIndex;
  return key;
}

nlohmann::json ParsedEvent::fieldsToJson() const {
  nlohmann::json j = nlohmann::json::object();
  for (const auto &field : fields) {
    std::visit([&](const auto &v) { j[field.name] = v; }, field.value);
  }
  return j;
}

nlohmann::json ParsedEvent::toJson() const {
  nlohmann::json j;
  j["kind"] = getKindKey(kind);
  j["signature"] = signature;
  j["slot"] = slot;
  if (blockTime) {
    j["blockTime"] = *blockTime;
  } else {
    j["blockTime"] = nullptr;
  }
  j["instructionIndex"] = instructionIndex;
  j["eventIndex"] = eventIndex;
  j["origin"] = origin == Origin::BINARY ? "binary" : "log_fallback";
  j["partial"] = partial;
  j["fields"] = fieldsToJson();
  return j;
}

} // namespace ppi
