#include "LogSubscriber.h"
#include "RpcClient.h"

#include <gtest/gtest.h>

#include <string>
#include <utility>
#include <vector>

using ppi::rpc::LogSubscriber;
using ppi::rpc::RpcClient;

TEST(RpcClientTest, ParseResponseReturnsResult) {
  auto roe = RpcClient::parseResponse(R"({"jsonrpc":"2.0","id":1,"result":12345})");
  ASSERT_TRUE(roe.isOk()) << roe.error().message;
  EXPECT_EQ(roe.value(), 12345);
}

TEST(RpcClientTest, ParseResponseMapsErrors) {
  auto rpcError = RpcClient::parseResponse(
      R"({"jsonrpc":"2.0","id":1,"error":{"code":-32005,"message":"Node is behind"}})");
  ASSERT_TRUE(rpcError.isError());
  EXPECT_EQ(rpcError.error().code, RpcClient::E_RPC);
  EXPECT_EQ(rpcError.error().message, "Node is behind");

  auto invalid = RpcClient::parseResponse("<html>502 Bad Gateway</html>");
  ASSERT_TRUE(invalid.isError());
  EXPECT_EQ(invalid.error().code, RpcClient::E_PARSE);

  auto noResult = RpcClient::parseResponse(R"({"jsonrpc":"2.0","id":1})");
  ASSERT_TRUE(noResult.isError());
  EXPECT_EQ(noResult.error().code, RpcClient::E_PARSE);

  EXPECT_TRUE(RpcClient::parseResponse("[1,2]").isError());
}

TEST(RpcClientTest, ParseResponseAcceptsNullResult) {
  auto roe = RpcClient::parseResponse(R"({"jsonrpc":"2.0","id":1,"result":null})");
  ASSERT_TRUE(roe.isOk());
  EXPECT_TRUE(roe.value().is_null());
}

TEST(RpcClientTest, ParseTransactionReadsMetaAndAccounts) {
  auto result = nlohmann::json::parse(R"({
    "slot": 250000123,
    "blockTime": 1700000000,
    "meta": {
      "err": null,
      "logMessages": ["Program X invoke [1]", "Program X success"]
    },
    "transaction": {
      "message": {"accountKeys": ["FeePayer1111", "Program2222"]}
    }
  })");
  auto roe = RpcClient::parseTransaction("sig-1", result);
  ASSERT_TRUE(roe.isOk()) << roe.error().message;
  const auto &tx = roe.value();
  EXPECT_EQ(tx.signature, "sig-1");
  EXPECT_EQ(tx.slot, 250000123u);
  EXPECT_EQ(tx.blockTime, 1700000000);
  EXPECT_TRUE(tx.success);
  ASSERT_EQ(tx.logs.size(), 2u);
  EXPECT_EQ(tx.logs[0], "Program X invoke [1]");
  EXPECT_EQ(tx.getFeePayer(), "FeePayer1111");
}

TEST(RpcClientTest, ParseTransactionHandlesFailureAndParsedKeys) {
  auto result = nlohmann::json::parse(R"({
    "slot": 7,
    "blockTime": null,
    "meta": {"err": {"InstructionError": [0, {"Custom": 1}]}, "logMessages": []},
    "transaction": {
      "message": {"accountKeys": [{"pubkey": "Payer", "signer": true, "writable": true}]}
    }
  })");
  auto roe = RpcClient::parseTransaction("sig-2", result);
  ASSERT_TRUE(roe.isOk()) << roe.error().message;
  EXPECT_FALSE(roe.value().success);
  EXPECT_FALSE(roe.value().blockTime.has_value());
  EXPECT_EQ(roe.value().getFeePayer(), "Payer");
}

TEST(RpcClientTest, ParseTransactionRejectsMissingOrMalformed) {
  auto missing = RpcClient::parseTransaction("sig-3", nlohmann::json());
  ASSERT_TRUE(missing.isError());
  EXPECT_EQ(missing.error().code, RpcClient::E_RPC);

  auto malformed = RpcClient::parseTransaction("sig-4", nlohmann::json::parse(R"({"slot":"x"})"));
  ASSERT_TRUE(malformed.isError());
  EXPECT_EQ(malformed.error().code, RpcClient::E_PARSE);
}

TEST(RpcClientTest, InitRejectsBadUrls) {
  RpcClient client;
  RpcClient::Config config;
  config.url = "not a url";
  EXPECT_EQ(client.init(config).error().code, RpcClient::E_CONFIG);
  config.url = "wss://api.devnet.solana.com";
  EXPECT_EQ(client.init(config).error().code, RpcClient::E_CONFIG);
}

TEST(RpcClientTest, CallsFailBeforeInit) {
  RpcClient client;
  auto roe = client.getCurrentSlot();
  ASSERT_TRUE(roe.isError());
  EXPECT_EQ(roe.error().code, RpcClient::E_CONFIG);
}

TEST(RpcClientTest, RangeRequestsValidateBeforeCalling) {
  RpcClient client;
  auto zeroLimit = client.getTransactionsInRange(10, 20, 0);
  ASSERT_TRUE(zeroLimit.isError());
  EXPECT_EQ(zeroLimit.error().code, RpcClient::E_CONFIG);

  auto inverted = client.getTransactionsInRange(20, 10, 5);
  ASSERT_TRUE(inverted.isOk());
  EXPECT_TRUE(inverted.value().transactions.empty());

  auto uninitialized = client.getTransactionsInRange(10, 20, 5);
  ASSERT_TRUE(uninitialized.isError());
  EXPECT_EQ(uninitialized.error().code, RpcClient::E_CONFIG);
}

namespace {

nlohmann::json signatureEntry(const std::string &signature, uint64_t slot, bool failed = false) {
  nlohmann::json entry;
  entry["signature"] = signature;
  entry["slot"] = slot;
  entry["err"] = failed ? nlohmann::json({{"InstructionError", {0, "Custom"}}}) : nlohmann::json();
  entry["blockTime"] = 1700000000;
  return entry;
}

std::vector<std::string> signaturesOf(const std::vector<RpcClient::SignatureInfo> &infos) {
  std::vector<std::string> result;
  for (const auto &info : infos) {
    result.push_back(info.signature);
  }
  return result;
}

} // namespace

TEST(RpcClientTest, SignaturePagesWalkBackToStartSlot) {
  std::vector<RpcClient::SignatureInfo> signatures;
  std::string before;

  // Full page: the last entry anchors the next request, failed or not
  nlohmann::json first = nlohmann::json::array(
      {signatureEntry("s9", 190), signatureEntry("s8", 180, true), signatureEntry("s7", 170)});
  auto roeFirst = RpcClient::parseSignaturePage(first, 150, 3, signatures, before);
  ASSERT_TRUE(roeFirst.isOk()) << roeFirst.error().message;
  EXPECT_FALSE(roeFirst.value());
  EXPECT_EQ(before, "s7");

  nlohmann::json second = nlohmann::json::array(
      {signatureEntry("s6", 160), signatureEntry("s5", 150), signatureEntry("s4", 140)});
  auto roeSecond = RpcClient::parseSignaturePage(second, 150, 3, signatures, before);
  ASSERT_TRUE(roeSecond.isOk());
  EXPECT_TRUE(roeSecond.value());
  EXPECT_EQ(before, "s7");

  EXPECT_EQ(signaturesOf(signatures), (std::vector<std::string>{"s9", "s7", "s6", "s5"}));
  EXPECT_EQ(signatures.back().slot, 150u);
}

TEST(RpcClientTest, ShortSignaturePageEndsTheWalk) {
  std::vector<RpcClient::SignatureInfo> signatures;
  std::string before;
  nlohmann::json page = nlohmann::json::array({signatureEntry("a", 500), signatureEntry("b", 400)});
  auto roe = RpcClient::parseSignaturePage(page, 100, 1000, signatures, before);
  ASSERT_TRUE(roe.isOk());
  EXPECT_TRUE(roe.value());
  EXPECT_TRUE(before.empty());
  EXPECT_EQ(signatures.size(), 2u);

  auto empty = RpcClient::parseSignaturePage(nlohmann::json::array(), 100, 1000, signatures, before);
  ASSERT_TRUE(empty.isOk());
  EXPECT_TRUE(empty.value());
}

TEST(RpcClientTest, MalformedSignaturePageIsRejected) {
  std::vector<RpcClient::SignatureInfo> signatures;
  std::string before;
  auto notArray = RpcClient::parseSignaturePage(nlohmann::json::object(), 0, 10, signatures, before);
  ASSERT_TRUE(notArray.isError());
  EXPECT_EQ(notArray.error().code, RpcClient::E_PARSE);

  auto noSlot = RpcClient::parseSignaturePage(nlohmann::json::parse(R"([{"signature":"x"}])"), 0,
                                              10, signatures, before);
  ASSERT_TRUE(noSlot.isError());
  EXPECT_EQ(noSlot.error().code, RpcClient::E_PARSE);
}

namespace {

// Newest first, as getSignaturesForAddress lists them
std::vector<RpcClient::SignatureInfo> listing(std::vector<std::pair<std::string, uint64_t>> entries) {
  std::vector<RpcClient::SignatureInfo> result;
  for (auto &entry : entries) {
    RpcClient::SignatureInfo info;
    info.signature = entry.first;
    info.slot = entry.second;
    result.push_back(info);
  }
  return result;
}

} // namespace

TEST(RpcClientTest, SelectBatchReturnsRangeOldestFirst) {
  auto newestFirst = listing({{"f", 2100}, {"e", 2000}, {"d", 1500}, {"c", 1200}, {"b", 1001},
                              {"a", 900}});
  uint64_t coveredUpTo = 0;
  auto selected = RpcClient::selectBatch(newestFirst, 1001, 2000, 10, coveredUpTo);
  EXPECT_EQ(signaturesOf(selected), (std::vector<std::string>{"b", "c", "d", "e"}));
  EXPECT_EQ(coveredUpTo, 2000u);
}

TEST(RpcClientTest, SelectBatchKeepsOldestWhenOverLimit) {
  // 1500 signatures over slots 1001..2500, one per slot
  std::vector<RpcClient::SignatureInfo> newestFirst;
  for (uint64_t slot = 2500; slot >= 1001; --slot) {
    RpcClient::SignatureInfo info;
    info.signature = "sig" + std::to_string(slot);
    info.slot = slot;
    newestFirst.push_back(info);
  }

  uint64_t coveredUpTo = 0;
  auto selected = RpcClient::selectBatch(newestFirst, 1001, 3000, 1000, coveredUpTo);
  ASSERT_EQ(selected.size(), 1000u);
  EXPECT_EQ(selected.front().slot, 1001u);
  EXPECT_EQ(selected.back().slot, 2000u);
  EXPECT_EQ(coveredUpTo, 2000u);

  auto rest = RpcClient::selectBatch(newestFirst, coveredUpTo + 1, 3000, 1000, coveredUpTo);
  ASSERT_EQ(rest.size(), 500u);
  EXPECT_EQ(rest.front().slot, 2001u);
  EXPECT_EQ(coveredUpTo, 3000u);
}

TEST(RpcClientTest, SelectBatchNeverSplitsASlot) {
  auto newestFirst = listing({{"e", 30}, {"d2", 20}, {"d1", 20}, {"c", 20}, {"b", 10}, {"a", 5}});
  uint64_t coveredUpTo = 0;

  auto selected = RpcClient::selectBatch(newestFirst, 5, 30, 3, coveredUpTo);
  EXPECT_EQ(signaturesOf(selected), (std::vector<std::string>{"a", "b"}));
  EXPECT_EQ(coveredUpTo, 19u);

  // A slot larger than the limit is taken whole
  selected = RpcClient::selectBatch(newestFirst, 20, 30, 2, coveredUpTo);
  EXPECT_EQ(signaturesOf(selected), (std::vector<std::string>{"c", "d1", "d2"}));
  EXPECT_EQ(coveredUpTo, 20u);
}

TEST(RpcClientTest, ListingServesLaterChunksBelowItsNewestSlot) {
  auto newestFirst = listing({{"d", 5000}, {"c", 3500}, {"b", 2200}, {"a", 1001}});
  EXPECT_TRUE(RpcClient::listingCovers(newestFirst, 1001, 1001, 3000));
  EXPECT_TRUE(RpcClient::listingCovers(newestFirst, 1001, 3001, 4999));
  // Newest listed slot and beyond need a fresh walk
  EXPECT_FALSE(RpcClient::listingCovers(newestFirst, 1001, 3001, 5000));
  EXPECT_FALSE(RpcClient::listingCovers(newestFirst, 1001, 5001, 7000));
  // Older than the walk went
  EXPECT_FALSE(RpcClient::listingCovers(newestFirst, 1001, 900, 2000));
  EXPECT_FALSE(RpcClient::listingCovers({}, 0, 0, 10));
}

TEST(LogSubscriberTest, SubscribeRequestShape) {
  auto request = LogSubscriber::makeSubscribeRequest("Prog111", "confirmed");
  EXPECT_EQ(request["jsonrpc"], "2.0");
  EXPECT_EQ(request["id"], LogSubscriber::SUBSCRIBE_REQUEST_ID);
  EXPECT_EQ(request["method"], "logsSubscribe");
  ASSERT_EQ(request["params"].size(), 2u);
  EXPECT_EQ(request["params"][0]["mentions"][0], "Prog111");
  EXPECT_EQ(request["params"][1]["commitment"], "confirmed");
}

TEST(LogSubscriberTest, ParsesLogsNotification) {
  auto message = nlohmann::json::parse(R"({
    "jsonrpc": "2.0",
    "method": "logsNotification",
    "params": {
      "subscription": 24040,
      "result": {
        "context": {"slot": 5208469},
        "value": {
          "signature": "5h6xBEauJ3PK6SWC",
          "err": null,
          "logs": ["Program data: AAAA"]
        }
      }
    }
  })");
  auto notification = LogSubscriber::parseNotification(message);
  ASSERT_TRUE(notification.has_value());
  EXPECT_EQ(notification->signature, "5h6xBEauJ3PK6SWC");
  EXPECT_EQ(notification->slot, 5208469u);
  EXPECT_FALSE(notification->failed);
  ASSERT_EQ(notification->logs.size(), 1u);
}

TEST(LogSubscriberTest, FlagsFailedTransactions) {
  auto message = nlohmann::json::parse(R"({
    "method": "logsNotification",
    "params": {"result": {"context": {"slot": 1},
               "value": {"signature": "s", "err": {"InstructionError": []}, "logs": []}}}
  })");
  auto notification = LogSubscriber::parseNotification(message);
  ASSERT_TRUE(notification.has_value());
  EXPECT_TRUE(notification->failed);
}

TEST(LogSubscriberTest, IgnoresOtherMessages) {
  EXPECT_FALSE(LogSubscriber::parseNotification(
                   nlohmann::json::parse(R"({"jsonrpc":"2.0","result":24040,"id":2})"))
                   .has_value());
  EXPECT_FALSE(LogSubscriber::parseNotification(
                   nlohmann::json::parse(R"({"method":"logsNotification","params":{}})"))
                   .has_value());
  EXPECT_FALSE(LogSubscriber::parseNotification(nlohmann::json::array()).has_value());
}

TEST(LogSubscriberTest, InitRejectsHttpUrls) {
  LogSubscriber subscriber;
  LogSubscriber::Config config;
  config.url = "https://api.devnet.solana.com";
  EXPECT_EQ(subscriber.init(config).error().code, LogSubscriber::E_CONFIG);

  LogSubscriber notInitialized;
  auto roe = notInitialized.next();
  ASSERT_TRUE(roe.isError());
  EXPECT_EQ(roe.error().code, LogSubscriber::E_DISCONNECTED);
}
