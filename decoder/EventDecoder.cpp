#include "EventDecoder.h"
#include "ByteReader.h"
#include "../lib/Utilities.h"

#include <sstream>

namespace ppi {

namespace {

using FT = EventDecoder::FieldType;

std::vector<EventDecoder::KindSpec> buildKindSpecs() {
  std::vector<EventDecoder::KindSpec> specs;

  auto add = [&](EventKind kind, std::vector<EventDecoder::Layout> layouts) {
    EventDecoder::KindSpec spec;
    spec.kind = kind;
    spec.discriminator = EventDecoder::discriminatorFor(kind);
    spec.layouts = std::move(layouts);
    specs.push_back(std::move(spec));
  };

  add(EventKind::PLAYER_CREATED,
      {{"default", 0,
        {{"wallet", 0, FT::PUBKEY},
         {"entry_fee", 32, FT::U64},
         {"created_at", 40, FT::I64},
         {"next_earnings_time", 48, FT::I64}}}});

  add(EventKind::BUSINESS_CREATED,
      {{"default", 0,
        {{"owner", 0, FT::PUBKEY},
         {"business_type", 32, FT::U8},
         {"slot_index", 33, FT::U8},
         {"base_cost", 34, FT::U64},
         {"total_paid", 42, FT::U64},
         {"daily_rate", 50, FT::U16},
         {"created_at", 52, FT::I64}}}});

  add(EventKind::BUSINESS_CREATED_IN_SLOT,
      {{"default", 0,
        {{"player", 0, FT::PUBKEY},
         {"slot_index", 32, FT::U8},
         {"business_type", 33, FT::U8},
         {"level", 34, FT::U8},
         {"base_cost", 40, FT::U64},
         {"slot_cost", 48, FT::U64},
         {"total_paid", 56, FT::U64},
         {"daily_rate", 64, FT::U16},
         {"created_at", 66, FT::U32}}}});

  add(EventKind::BUSINESS_UPGRADED,
      {{"default", 0,
        {{"owner", 0, FT::PUBKEY},
         {"slot_index", 32, FT::U8},
         {"old_level", 33, FT::U8},
         {"new_level", 34, FT::U8},
         {"upgrade_cost", 35, FT::U64},
         {"new_daily_rate", 43, FT::U16},
         {"upgraded_at", 45, FT::I64}}}});

  // Older program builds wrote one padding byte after new_level
  add(EventKind::BUSINESS_UPGRADED_IN_SLOT,
      {{"padded", 55,
        {{"player", 0, FT::PUBKEY},
         {"slot_index", 32, FT::U8},
         {"business_type", 33, FT::U8},
         {"old_level", 34, FT::U8},
         {"new_level", 35, FT::U8},
         {"upgrade_cost", 37, FT::U64},
         {"new_daily_rate", 45, FT::U16},
         {"upgraded_at", 47, FT::I64}}},
       {"compact", 0,
        {{"player", 0, FT::PUBKEY},
         {"slot_index", 32, FT::U8},
         {"business_type", 33, FT::U8},
         {"old_level", 34, FT::U8},
         {"new_level", 35, FT::U8},
         {"upgrade_cost", 36, FT::U64},
         {"new_daily_rate", 44, FT::U16},
         {"upgraded_at", 46, FT::I64}}}});

  add(EventKind::BUSINESS_SOLD,
      {{"default", 0,
        {{"seller", 0, FT::PUBKEY},
         {"slot_index", 32, FT::U8},
         {"business_type", 33, FT::U8},
         {"sale_price", 34, FT::U64},
         {"sold_at", 42, FT::I64}}}});

  // The padded layout reads return_amount over slot_discount. That is what the
  // deployed program emits, keep it as is.
  add(EventKind::BUSINESS_SOLD_FROM_SLOT,
      {{"padded", 57,
        {{"player", 0, FT::PUBKEY},
         {"slot_index", 32, FT::U8},
         {"business_type", 33, FT::U8},
         {"total_invested", 34, FT::U64},
         {"days_held", 44, FT::U64},
         {"base_fee_pct", 52, FT::U8},
         {"slot_discount", 53, FT::U8},
         {"return_amount", 53, FT::U32},
         {"sold_at", 57, FT::I64}}},
       {"compact", 0,
        {{"player", 0, FT::PUBKEY},
         {"slot_index", 32, FT::U8},
         {"business_type", 33, FT::U8},
         {"total_invested", 34, FT::U64},
         {"days_held", 42, FT::U64},
         {"base_fee_pct", 50, FT::U8},
         {"slot_discount", 51, FT::U8},
         {"return_amount", 52, FT::U32}}}});

  add(EventKind::EARNINGS_UPDATED,
      {{"default", 0,
        {{"player", 0, FT::PUBKEY},
         {"earnings_added", 32, FT::U64},
         {"total_pending", 40, FT::U64},
         {"next_earnings_time", 48, FT::I64},
         {"businesses_count", 56, FT::U8}}}});

  add(EventKind::EARNINGS_CLAIMED,
      {{"default", 0,
        {{"player", 0, FT::PUBKEY},
         {"amount", 32, FT::U64},
         {"claimed_at", 40, FT::I64}}}});

  add(EventKind::BUSINESS_TRANSFERRED,
      {{"default", 0,
        {{"old_owner", 0, FT::PUBKEY},
         {"new_owner", 32, FT::PUBKEY},
         {"slot_index", 64, FT::U8},
         {"transferred_at", 65, FT::I64}}}});

  add(EventKind::BUSINESS_DEACTIVATED,
      {{"default", 0,
        {{"owner", 0, FT::PUBKEY},
         {"slot_index", 32, FT::U8},
         {"reason", 33, FT::U8},
         {"deactivated_at", 34, FT::I64}}}});

  add(EventKind::SLOT_UNLOCKED,
      {{"default", 0,
        {{"wallet", 0, FT::PUBKEY},
         {"slot_index", 32, FT::U8},
         {"cost", 33, FT::U64},
         {"unlocked_at", 41, FT::I64}}}});

  add(EventKind::PREMIUM_SLOT_PURCHASED,
      {{"default", 0,
        {{"wallet", 0, FT::PUBKEY},
         {"slot_index", 32, FT::U8},
         {"slot_type", 33, FT::U8},
         {"cost", 34, FT::U64},
         {"purchased_at", 42, FT::I64}}}});

  return specs;
}

const std::vector<EventDecoder::KindSpec> &getKindSpecs() {
  static const std::vector<EventDecoder::KindSpec> specs = buildKindSpecs();
  return specs;
}

std::optional<FieldValue> readField(const ByteReader &reader,
                                    const EventDecoder::FieldSpec &field) {
  switch (field.type) {
  case FT::PUBKEY: {
    auto bytes = reader.readBytes(field.offset, EventDecoder::PUBKEY_SIZE);
    if (!bytes) {
      return std::nullopt;
    }
    return FieldValue(utl::base58Encode(*bytes));
  }
  case FT::U8: {
    auto v = reader.readU8(field.offset);
    return v ? std::optional<FieldValue>(uint64_t(*v)) : std::nullopt;
  }
  case FT::U16: {
    auto v = reader.readU16(field.offset);
    return v ? std::optional<FieldValue>(uint64_t(*v)) : std::nullopt;
  }
  case FT::U32: {
    auto v = reader.readU32(field.offset);
    return v ? std::optional<FieldValue>(uint64_t(*v)) : std::nullopt;
  }
  case FT::U64: {
    auto v = reader.readU64(field.offset);
    return v ? std::optional<FieldValue>(*v) : std::nullopt;
  }
  case FT::I64: {
    auto v = reader.readI64(field.offset);
    return v ? std::optional<FieldValue>(*v) : std::nullopt;
  }
  }
  return std::nullopt;
}

bool startsWith(const std::string &s, const char *prefix) {
  return s.compare(0, std::char_traits<char>::length(prefix), prefix) == 0;
}

} // namespace

EventDecoder::EventDecoder() : Module("decoder") {}

size_t EventDecoder::getFieldSize(FieldType type) {
  switch (type) {
  case FieldType::PUBKEY:
    return PUBKEY_SIZE;
  case FieldType::U8:
    return 1;
  case FieldType::U16:
    return 2;
  case FieldType::U32:
    return 4;
  case FieldType::U64:
  case FieldType::I64:
    return 8;
  }
  return 0;
}

std::string EventDecoder::discriminatorFor(EventKind kind) {
  std::string digest = utl::sha256Bytes(std::string("event:") + getKindName(kind));
  return digest.substr(0, DISCRIMINATOR_SIZE);
}

const EventDecoder::KindSpec *EventDecoder::findKind(const std::string &discriminator) {
  for (const auto &spec : getKindSpecs()) {
    if (spec.discriminator == discriminator) {
      return &spec;
    }
  }
  return nullptr;
}

const EventDecoder::KindSpec &EventDecoder::getKindSpec(EventKind kind) {
  // The table is built in enum order
  return getKindSpecs().at(kindIndex(kind));
}

size_t EventDecoder::minimumBytes(EventKind kind) {
  const Layout &layout = getKindSpec(kind).layouts.back();
  const FieldSpec &first = layout.fields.front();
  return first.offset + getFieldSize(first.type);
}

std::optional<ParsedEvent> EventDecoder::decode(const std::string &discriminator,
                                                const std::string &payload,
                                                const TxContext &ctx) const {
  const KindSpec *spec = findKind(discriminator);
  if (spec == nullptr) {
    log().debug << "Unknown discriminator " << utl::hexEncode(discriminator)
                << " in " << ctx.signature;
    return std::nullopt;
  }

  if (payload.size() < minimumBytes(spec->kind)) {
    log().debug << getKindName(spec->kind) << " payload too short ("
                << payload.size() << " bytes) in " << ctx.signature;
    return std::nullopt;
  }

  const Layout *layout = &spec->layouts.back();
  for (const auto &candidate : spec->layouts) {
    if (candidate.probeLength <= payload.size()) {
      layout = &candidate;
      break;
    }
  }

  ParsedEvent ev;
  ev.kind = spec->kind;
  ev.signature = ctx.signature;
  ev.slot = ctx.slot;
  ev.blockTime = ctx.blockTime;
  ev.instructionIndex = ctx.instructionIndex;
  ev.eventIndex = ctx.eventIndex;
  ev.raw = discriminator + payload;
  ev.origin = ParsedEvent::Origin::BINARY;

  ByteReader reader(payload);
  std::vector<std::string> skipped;
  for (const auto &field : layout->fields) {
    auto value = readField(reader, field);
    if (!value) {
      skipped.push_back(field.name);
      continue;
    }
    ev.fields.push_back({field.name, std::move(*value)});
  }

  if (spec->kind == EventKind::BUSINESS_SOLD_FROM_SLOT && !ev.has("sold_at") &&
      ctx.blockTime) {
    ev.set("sold_at", *ctx.blockTime);
  }

  if (!skipped.empty()) {
    ev.partial = true;
    std::ostringstream oss;
    for (size_t i = 0; i < skipped.size(); ++i) {
      oss << (i == 0 ? "" : ",") << skipped[i];
    }
    log().debug << getKindName(spec->kind) << " (" << layout->name << ", "
                << payload.size() << " bytes) missing " << oss.str() << " in "
                << ctx.signature;
  }

  return ev;
}

std::optional<ParsedEvent> EventDecoder::decodeDataLine(const std::string &encoded,
                                                        const TxContext &ctx) const {
  auto roeBytes = utl::base64Decode(encoded);
  if (!roeBytes) {
    log().warning << "Invalid base64 in program data of " << ctx.signature << ": "
                  << roeBytes.error().message;
    return std::nullopt;
  }
  const std::string &bytes = roeBytes.value();
  if (bytes.size() < DISCRIMINATOR_SIZE) {
    log().debug << "Program data too short for a discriminator in " << ctx.signature;
    return std::nullopt;
  }
  return decode(bytes.substr(0, DISCRIMINATOR_SIZE), bytes.substr(DISCRIMINATOR_SIZE), ctx);
}

std::vector<ParsedEvent> EventDecoder::decodeTransaction(const RawTransaction &tx,
                                                         const std::string &programId) const {
  std::vector<ParsedEvent> events;

  TxContext ctx;
  ctx.signature = tx.signature;
  ctx.slot = tx.slot;
  ctx.blockTime = tx.blockTime;
  ctx.feePayer = tx.getFeePayer();

  std::vector<std::string> invokeStack;
  bool seenTopLevel = false;

  for (const auto &line : tx.logs) {
    if (startsWith(line, PROGRAM_DATA_PREFIX)) {
      bool ours = programId.empty() || invokeStack.empty() || invokeStack.back() == programId;
      if (!ours) {
        continue;
      }
      auto ev = decodeDataLine(line.substr(std::char_traits<char>::length(PROGRAM_DATA_PREFIX)), ctx);
      ctx.eventIndex++;
      if (ev) {
        events.push_back(std::move(*ev));
      }
      continue;
    }

    if (!startsWith(line, "Program ") || startsWith(line, LogFallbackParser::PROGRAM_LOG_PREFIX)) {
      continue;
    }

    // "Program <id> invoke [n]", "Program <id> success", "Program <id> failed: ..."
    std::istringstream iss(line);
    std::string word, id, action;
    iss >> word >> id >> action;
    if (action == "invoke") {
      if (invokeStack.empty()) {
        if (seenTopLevel) {
          ctx.instructionIndex++;
        }
        seenTopLevel = true;
        ctx.eventIndex = 0;
      }
      invokeStack.push_back(id);
    } else if (action == "success" || startsWith(action, "failed")) {
      if (!invokeStack.empty()) {
        invokeStack.pop_back();
      }
    }
  }

  if (events.empty()) {
    return fallback_.parse(tx.logs, ctx);
  }
  return events;
}

} // namespace ppi
