#ifndef PP_INDEXER_LOG_FALLBACK_PARSER_H
#define PP_INDEXER_LOG_FALLBACK_PARSER_H

#include "Event.h"
#include "../lib/Module.h"

#include <string>
#include <vector>

namespace ppi {

/**
 * Recovers reduced-fidelity events from the human readable "Program log:"
 * lines the program prints next to its binary events.
 *
 * Only used when no binary event could be decoded from a transaction. The
 * resulting events carry Origin::LOG_FALLBACK and only the fields the text
 * exposes (typically the wallet and one amount).
 */
class LogFallbackParser : public Module {
public:
  static constexpr const char *PROGRAM_LOG_PREFIX = "Program log: ";

  LogFallbackParser();

  std::vector<ParsedEvent> parse(const std::vector<std::string> &logs,
                                 const TxContext &ctx) const;
};

} // namespace ppi

#endif // PP_INDEXER_LOG_FALLBACK_PARSER_H
