#include "RpcClient.h"
#include "../lib/Utilities.h"

#include <httplib.h>

#include <algorithm>

namespace ppi {
namespace rpc {

RpcClient::RpcClient() : Module("rpc") {}

RpcClient::~RpcClient() = default;

Roe<void> RpcClient::init(const Config &config) {
  std::string scheme;
  std::string host;
  uint16_t port = 0;
  std::string path;
  if (!utl::parseUrl(config.url, scheme, host, port, path)) {
    return Error(E_CONFIG, "Invalid RPC url: " + config.url);
  }
  if (scheme != "http" && scheme != "https") {
    return Error(E_CONFIG, "Unsupported RPC scheme: " + scheme);
  }

  config_ = config;
  path_ = path;
  pClient_ = std::make_unique<httplib::Client>(scheme + "://" + host + ":" + std::to_string(port));
  pClient_->set_connection_timeout(config.timeoutSec, 0);
  pClient_->set_read_timeout(config.timeoutSec, 0);
  pClient_->set_write_timeout(config.timeoutSec, 0);
  pClient_->set_keep_alive(true);

  log().info << "RPC endpoint " << scheme << "://" << host << ":" << port << path_;
  return {};
}

Roe<nlohmann::json> RpcClient::parseResponse(const std::string &body) {
  nlohmann::json response;
  try {
    response = nlohmann::json::parse(body);
  } catch (const nlohmann::json::exception &e) {
    return Error(E_PARSE, std::string("Invalid JSON-RPC response: ") + e.what());
  }

  if (!response.is_object()) {
    return Error(E_PARSE, "JSON-RPC response is not an object");
  }
  if (response.contains("error") && !response["error"].is_null()) {
    const auto &err = response["error"];
    std::string message = err.is_object() ? err.value("message", err.dump()) : err.dump();
    return Error(E_RPC, message);
  }
  if (!response.contains("result")) {
    return Error(E_PARSE, "JSON-RPC response has no result");
  }
  return response["result"];
}

Roe<nlohmann::json> RpcClient::call(const std::string &method, const nlohmann::json &params) {
  if (!pClient_) {
    return Error(E_CONFIG, "RPC client not initialized");
  }

  nlohmann::json request;
  request["jsonrpc"] = "2.0";
  request["id"] = nextId_++;
  request["method"] = method;
  request["params"] = params;

  auto res = pClient_->Post(path_, request.dump(), "application/json");
  if (!res) {
    return Error(E_HTTP, method + ": " + httplib::to_string(res.error()));
  }
  if (res->status != 200) {
    return Error(E_HTTP, method + ": HTTP " + std::to_string(res->status));
  }

  auto roeResult = parseResponse(res->body);
  if (!roeResult) {
    return Error(roeResult.error().code, method + ": " + roeResult.error().message);
  }
  return roeResult;
}

Roe<uint64_t> RpcClient::getCurrentSlot() {
  nlohmann::json options;
  options["commitment"] = config_.commitment;
  auto roeResult = call("getSlot", nlohmann::json::array({options}));
  if (!roeResult) {
    return roeResult.error();
  }
  if (!roeResult.value().is_number_unsigned()) {
    return Error(E_PARSE, "getSlot: unexpected result " + roeResult.value().dump());
  }
  return roeResult.value().get<uint64_t>();
}

Roe<ILedgerRpc::TransactionBatch> RpcClient::getTransactionsInRange(uint64_t startSlot,
                                                                    uint64_t endSlot,
                                                                    size_t limit) {
  if (limit == 0) {
    return Error(E_CONFIG, "Transaction limit must be positive");
  }
  TransactionBatch batch;
  batch.coveredUpTo = endSlot;
  if (startSlot > endSlot) {
    return batch;
  }

  std::vector<SignatureInfo> selected;
  {
    std::lock_guard<std::mutex> lock(listingMutex_);
    if (!listingCovers(listing_, listingLowSlot_, startSlot, endSlot)) {
      auto roeWalk = walkSignatures(startSlot);
      if (!roeWalk) {
        return roeWalk.error();
      }
    }
    selected = selectBatch(listing_, startSlot, endSlot, limit, batch.coveredUpTo);
  }

  if (batch.coveredUpTo < endSlot) {
    log().warning << "Slot range " << startSlot << "-" << endSlot << " holds more than " << limit
                  << " transactions, taking slots up to " << batch.coveredUpTo;
  }

  batch.transactions.reserve(selected.size());
  for (const auto &info : selected) {
    auto roeTx = getTransaction(info.signature);
    if (!roeTx) {
      return roeTx.error();
    }
    batch.transactions.push_back(std::move(roeTx.value()));
  }
  std::stable_sort(batch.transactions.begin(), batch.transactions.end(),
                   [](const RawTransaction &a, const RawTransaction &b) { return a.slot < b.slot; });

  // Delivered slots are not asked for again unless replayed
  {
    std::lock_guard<std::mutex> lock(listingMutex_);
    while (!listing_.empty() && listing_.back().slot <= batch.coveredUpTo) {
      listing_.pop_back();
    }
    listingLowSlot_ = std::max(listingLowSlot_, batch.coveredUpTo + 1);
  }
  return batch;
}

Roe<void> RpcClient::walkSignatures(uint64_t startSlot) {
  std::vector<SignatureInfo> listing;
  std::string before;
  bool done = false;
  while (!done) {
    nlohmann::json options;
    options["limit"] = MAX_SIGNATURES_PER_PAGE;
    options["commitment"] = config_.commitment;
    if (!before.empty()) {
      options["before"] = before;
    }

    auto roeResult =
        call("getSignaturesForAddress", nlohmann::json::array({config_.programId, options}));
    if (!roeResult) {
      return roeResult.error();
    }
    auto roeDone = parseSignaturePage(roeResult.value(), startSlot, MAX_SIGNATURES_PER_PAGE,
                                      listing, before);
    if (!roeDone) {
      return roeDone.error();
    }
    done = roeDone.value();
  }

  log().debug << "Listed " << listing.size() << " signatures down to slot " << startSlot;
  listing_ = std::move(listing);
  listingLowSlot_ = startSlot;
  return {};
}

Roe<bool> RpcClient::parseSignaturePage(const nlohmann::json &page, uint64_t startSlot,
                                        size_t pageSize, std::vector<SignatureInfo> &signatures,
                                        std::string &before) {
  if (!page.is_array()) {
    return Error(E_PARSE, "getSignaturesForAddress: result is not an array");
  }

  try {
    for (const auto &entry : page) {
      SignatureInfo info;
      info.slot = entry.at("slot").get<uint64_t>();
      if (info.slot < startSlot) {
        return true;
      }
      info.signature = entry.at("signature").get<std::string>();
      if (!entry.contains("err") || entry["err"].is_null()) {
        signatures.push_back(std::move(info));
      }
    }
    if (page.empty() || page.size() < pageSize) {
      return true;
    }
    // Failed entries still anchor the next page
    before = page.back().at("signature").get<std::string>();
  } catch (const nlohmann::json::exception &e) {
    return Error(E_PARSE, std::string("getSignaturesForAddress: ") + e.what());
  }
  return false;
}

bool RpcClient::listingCovers(const std::vector<SignatureInfo> &newestFirst, uint64_t lowSlot,
                              uint64_t startSlot, uint64_t endSlot) {
  // The newest listed slot may have gained entries since the walk
  return !newestFirst.empty() && startSlot >= lowSlot && endSlot < newestFirst.front().slot;
}

std::vector<RpcClient::SignatureInfo>
RpcClient::selectBatch(const std::vector<SignatureInfo> &newestFirst, uint64_t startSlot,
                       uint64_t endSlot, size_t limit, uint64_t &coveredUpTo) {
  std::vector<SignatureInfo> selected;
  for (auto it = newestFirst.rbegin(); it != newestFirst.rend(); ++it) {
    if (it->slot < startSlot) {
      continue;
    }
    if (it->slot > endSlot) {
      break;
    }
    selected.push_back(*it);
  }

  coveredUpTo = endSlot;
  if (selected.size() <= limit) {
    return selected;
  }

  uint64_t cutSlot = selected[limit].slot;
  size_t count = limit;
  while (count > 0 && selected[count - 1].slot == cutSlot) {
    count--;
  }
  if (count > 0) {
    coveredUpTo = cutSlot - 1;
  } else {
    // A single slot above the limit goes out whole
    while (count < selected.size() && selected[count].slot == cutSlot) {
      count++;
    }
    coveredUpTo = cutSlot;
  }
  selected.resize(count);
  return selected;
}

Roe<RawTransaction> RpcClient::getTransaction(const std::string &signature) {
  nlohmann::json options;
  options["encoding"] = "json";
  options["maxSupportedTransactionVersion"] = 0;
  options["commitment"] = config_.commitment;

  auto roeResult = call("getTransaction", nlohmann::json::array({signature, options}));
  if (!roeResult) {
    return roeResult.error();
  }
  return parseTransaction(signature, roeResult.value());
}

Roe<RawTransaction> RpcClient::parseTransaction(const std::string &signature,
                                                const nlohmann::json &result) {
  if (result.is_null()) {
    return Error(E_RPC, "Transaction not found: " + signature);
  }

  RawTransaction tx;
  tx.signature = signature;
  try {
    tx.slot = result.at("slot").get<uint64_t>();
    if (result.contains("blockTime") && !result["blockTime"].is_null()) {
      tx.blockTime = result["blockTime"].get<int64_t>();
    }

    const auto &meta = result.at("meta");
    if (!meta.is_null()) {
      tx.success = !meta.contains("err") || meta["err"].is_null();
      if (meta.contains("logMessages") && meta["logMessages"].is_array()) {
        tx.logs = meta["logMessages"].get<std::vector<std::string>>();
      }
    }

    const auto &message = result.at("transaction").at("message");
    if (message.contains("accountKeys")) {
      for (const auto &key : message["accountKeys"]) {
        // jsonParsed encoding wraps keys in objects
        tx.accounts.push_back(key.is_object() ? key.at("pubkey").get<std::string>()
                                              : key.get<std::string>());
      }
    }
  } catch (const nlohmann::json::exception &e) {
    return Error(E_PARSE, "Malformed transaction " + signature + ": " + e.what());
  }
  return tx;
}

} // namespace rpc
} // namespace ppi
