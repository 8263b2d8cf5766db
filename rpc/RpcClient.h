#ifndef PP_INDEXER_RPC_CLIENT_H
#define PP_INDEXER_RPC_CLIENT_H

#include "../interface/ILedgerRpc.hpp"
#include "../lib/Module.h"

#include <nlohmann/json.hpp>

#include <atomic>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace httplib {
class Client;
}

namespace ppi {
namespace rpc {

/**
 * Solana JSON-RPC over HTTP(S).
 *
 * Only the three calls the indexer needs are exposed. Transport failures map
 * to E_HTTP, JSON-RPC error objects to E_RPC and unexpected response shapes
 * to E_PARSE.
 *
 * Slot ranges are served from one signature listing: the first request walks
 * getSignaturesForAddress from the newest entry down to its start slot, and
 * the following forward chunks are cut from that listing while it covers them.
 */
class RpcClient : public ILedgerRpc, public Module {
public:
  struct Config {
    std::string url;
    std::string programId;
    std::string commitment{ "confirmed" };
    int timeoutSec{ 30 };
  };

  static constexpr const int32_t E_HTTP = -1;
  static constexpr const int32_t E_RPC = -2;
  static constexpr const int32_t E_PARSE = -3;
  static constexpr const int32_t E_CONFIG = -4;

  // getSignaturesForAddress returns at most this many entries per call
  static constexpr const size_t MAX_SIGNATURES_PER_PAGE = 1000;

  struct SignatureInfo {
    std::string signature;
    uint64_t slot{ 0 };
  };

  RpcClient();
  ~RpcClient() override;

  Roe<void> init(const Config &config);

  Roe<uint64_t> getCurrentSlot() override;
  Roe<TransactionBatch> getTransactionsInRange(uint64_t startSlot, uint64_t endSlot,
                                               size_t limit) override;
  Roe<RawTransaction> getTransaction(const std::string &signature) override;

  /** Build a RawTransaction from a getTransaction "result" object */
  static Roe<RawTransaction> parseTransaction(const std::string &signature,
                                              const nlohmann::json &result);

  /** Extract the "result" member of a JSON-RPC response body */
  static Roe<nlohmann::json> parseResponse(const std::string &body);

  /**
   * Read one getSignaturesForAddress page (newest first). Successful entries at
   * or above startSlot are appended to signatures, and before is set to the
   * anchor for the next page.
   * @return true once the walk is over: an entry below startSlot was seen or
   *         the page was not full
   */
  static Roe<bool> parseSignaturePage(const nlohmann::json &page, uint64_t startSlot,
                                      size_t pageSize, std::vector<SignatureInfo> &signatures,
                                      std::string &before);

  /**
   * Pick the signatures of [startSlot, endSlot] out of a newest-first listing,
   * oldest first. Past limit the selection stops at the last whole slot.
   */
  static std::vector<SignatureInfo> selectBatch(const std::vector<SignatureInfo> &newestFirst,
                                                uint64_t startSlot, uint64_t endSlot,
                                                size_t limit, uint64_t &coveredUpTo);

  /** Whether a listing walked down to lowSlot can serve [startSlot, endSlot] */
  static bool listingCovers(const std::vector<SignatureInfo> &newestFirst, uint64_t lowSlot,
                            uint64_t startSlot, uint64_t endSlot);

private:
  Roe<nlohmann::json> call(const std::string &method, const nlohmann::json &params);
  Roe<void> walkSignatures(uint64_t startSlot);

  Config config_;
  std::string path_;
  std::unique_ptr<httplib::Client> pClient_;
  std::atomic<uint64_t> nextId_{ 1 };

  // Listing from the last walk, newest first, complete for
  // [listingLowSlot_, slot of the first entry)
  std::mutex listingMutex_;
  std::vector<SignatureInfo> listing_;
  uint64_t listingLowSlot_{ 0 };
};

} // namespace rpc
} // namespace ppi

#endif // PP_INDEXER_RPC_CLIENT_H
