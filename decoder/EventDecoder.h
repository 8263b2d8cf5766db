#ifndef PP_INDEXER_EVENT_DECODER_H
#define PP_INDEXER_EVENT_DECODER_H

#include "Event.h"
#include "LogFallbackParser.h"
#include "../lib/Module.h"

#include <optional>
#include <string>
#include <vector>

namespace ppi {

/**
 * Turns program log lines into ParsedEvents.
 *
 * Binary events are "Program data: <base64>" lines holding an 8-byte
 * discriminator followed by a little-endian payload. Payload layouts are
 * described by a static table; kinds whose on-chain encoding drifted carry
 * more than one layout and are resolved by payload length.
 *
 * Decoding never throws and never fails a transaction: anything that cannot
 * be decoded is skipped and logged.
 */
class EventDecoder : public Module {
public:
  static constexpr const size_t DISCRIMINATOR_SIZE = 8;
  static constexpr const size_t PUBKEY_SIZE = 32;
  static constexpr const char *PROGRAM_DATA_PREFIX = "Program data: ";

  enum class FieldType : uint8_t { PUBKEY, U8, U16, U32, U64, I64 };

  struct FieldSpec {
    const char *name;
    size_t offset;
    FieldType type;
  };

  struct Layout {
    const char *name;
    // Smallest payload this layout is chosen for
    size_t probeLength;
    std::vector<FieldSpec> fields;
  };

  struct KindSpec {
    EventKind kind;
    std::string discriminator;
    // In preference order, the last one is the fallback
    std::vector<Layout> layouts;
  };

  EventDecoder();
  ~EventDecoder() override = default;

  static size_t getFieldSize(FieldType type);

  /** First 8 bytes of sha256("event:" + kind name) */
  static std::string discriminatorFor(EventKind kind);

  /** @return table entry for a discriminator, or nullptr when unknown */
  static const KindSpec *findKind(const std::string &discriminator);

  static const KindSpec &getKindSpec(EventKind kind);

  /** Payload bytes needed before any field of the kind can be read */
  static size_t minimumBytes(EventKind kind);

  /**
   * Decode one event payload (without its discriminator).
   * @return nullopt for unknown discriminators and undersized payloads
   */
  std::optional<ParsedEvent> decode(const std::string &discriminator,
                                    const std::string &payload,
                                    const TxContext &ctx) const;

  /**
   * Decode every event a transaction emitted for programId, in log order.
   * An empty programId accepts events from any program. Falls back to the
   * text log parser when no binary event was found.
   */
  std::vector<ParsedEvent> decodeTransaction(const RawTransaction &tx,
                                             const std::string &programId) const;

private:
  std::optional<ParsedEvent> decodeDataLine(const std::string &encoded,
                                            const TxContext &ctx) const;

  LogFallbackParser fallback_;
};

} // namespace ppi

#endif // PP_INDEXER_EVENT_DECODER_H
