#include "LogFallbackParser.h"
#include "../lib/Utilities.h"

#include <regex>

namespace ppi {

namespace {

const std::regex RE_EARNINGS_PLAYER(R"(Earnings updated for player: ([1-9A-HJ-NP-Za-km-z]{32,44}))");
const std::regex RE_EARNINGS_ADDED(R"(New earnings added: (\d+) lamports)");
const std::regex RE_EARNINGS_PENDING(R"(Total pending: (\d+) lamports)");
const std::regex RE_CLAIMED(R"(Claimed (\d+) lamports)");
const std::regex RE_PLAYER_CREATED(R"(Player created! Entry fee: (\d+) lamports)");
const std::regex RE_SLOT_UNLOCKED(R"(Slot (\d+) unlocked for (\d+) lamports)");
const std::regex RE_PREMIUM_SLOT(R"(Premium slot (.+?) purchased for (\d+) lamports)");

bool captureUInt(const std::smatch &m, size_t group, uint64_t &value) {
  return utl::parseUInt64(m[group].str(), value);
}

} // namespace

LogFallbackParser::LogFallbackParser() : Module("decoder.fallback") {}

std::vector<ParsedEvent> LogFallbackParser::parse(const std::vector<std::string> &logs,
                                                  const TxContext &ctx) const {
  std::vector<ParsedEvent> events;

  // Event index is the position among recovered events, not the log line
  auto makeEvent = [&](EventKind kind) {
    ParsedEvent ev;
    ev.kind = kind;
    ev.signature = ctx.signature;
    ev.slot = ctx.slot;
    ev.blockTime = ctx.blockTime;
    ev.instructionIndex = 0;
    ev.eventIndex = static_cast<uint32_t>(events.size());
    ev.origin = ParsedEvent::Origin::LOG_FALLBACK;
    ev.partial = true;
    return ev;
  };

  // Index into events of the EarningsUpdated the following amount lines belong to
  int openEarnings = -1;

  for (const auto &line : logs) {
    if (line.compare(0, std::char_traits<char>::length(PROGRAM_LOG_PREFIX),
                     PROGRAM_LOG_PREFIX) != 0) {
      continue;
    }

    std::smatch m;
    uint64_t amount = 0;
    uint64_t index = 0;

    if (std::regex_search(line, m, RE_EARNINGS_PLAYER)) {
      const std::string player = m[1].str();
      openEarnings = -1;
      for (size_t i = 0; i < events.size(); ++i) {
        if (events[i].kind == EventKind::EARNINGS_UPDATED &&
            events[i].getString("player") == player) {
          openEarnings = static_cast<int>(i);
        }
      }
      if (openEarnings < 0) {
        ParsedEvent ev = makeEvent(EventKind::EARNINGS_UPDATED);
        ev.set("player", player);
        events.push_back(std::move(ev));
        openEarnings = static_cast<int>(events.size()) - 1;
      }
    } else if (std::regex_search(line, m, RE_EARNINGS_ADDED)) {
      if (openEarnings >= 0 && captureUInt(m, 1, amount)) {
        events[openEarnings].set("earnings_added", amount);
      }
    } else if (std::regex_search(line, m, RE_EARNINGS_PENDING)) {
      if (openEarnings >= 0 && captureUInt(m, 1, amount)) {
        events[openEarnings].set("total_pending", amount);
      }
    } else if (std::regex_search(line, m, RE_CLAIMED)) {
      if (captureUInt(m, 1, amount) && !ctx.feePayer.empty()) {
        ParsedEvent ev = makeEvent(EventKind::EARNINGS_CLAIMED);
        ev.set("player", ctx.feePayer);
        ev.set("amount", amount);
        events.push_back(std::move(ev));
      }
    } else if (std::regex_search(line, m, RE_PLAYER_CREATED)) {
      if (captureUInt(m, 1, amount) && !ctx.feePayer.empty()) {
        ParsedEvent ev = makeEvent(EventKind::PLAYER_CREATED);
        ev.set("wallet", ctx.feePayer);
        ev.set("entry_fee", amount);
        events.push_back(std::move(ev));
      }
    } else if (std::regex_search(line, m, RE_SLOT_UNLOCKED)) {
      if (captureUInt(m, 1, index) && captureUInt(m, 2, amount) && !ctx.feePayer.empty()) {
        ParsedEvent ev = makeEvent(EventKind::SLOT_UNLOCKED);
        ev.set("wallet", ctx.feePayer);
        ev.set("slot_index", index);
        ev.set("cost", amount);
        events.push_back(std::move(ev));
      }
    } else if (std::regex_search(line, m, RE_PREMIUM_SLOT)) {
      if (captureUInt(m, 2, amount) && !ctx.feePayer.empty()) {
        ParsedEvent ev = makeEvent(EventKind::PREMIUM_SLOT_PURCHASED);
        ev.set("wallet", ctx.feePayer);
        ev.set("cost", amount);
        events.push_back(std::move(ev));
      }
    }
  }

  if (!events.empty()) {
    log().debug << "Recovered " << events.size() << " event(s) from log text in "
                << ctx.signature;
  }
  return events;
}

} // namespace ppi
