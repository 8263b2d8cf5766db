#include "EventDecoder.h"
#include "EventFixtures.h"

#include <gtest/gtest.h>

using ppi::EventDecoder;
using ppi::EventKind;
using ppi::ParsedEvent;
using ppi::RawTransaction;
using namespace ppi::test;

namespace {

const std::string COMPUTE_BUDGET = "ComputeBudget111111111111111111111111111111";
const std::string TOKEN_PROGRAM = "TokenkegQfeZyiNwAJbNbGKPFXCWuBvf9Ss623VQ5DA";

std::string slotUnlockedPayload(uint8_t walletSeed, uint8_t index, uint64_t cost) {
  return PayloadBuilder().pubkey(makeKey(walletSeed)).u8(index).u64(cost).i64(1700000000).bytes();
}

} // namespace

class DecodeTransactionTest : public ::testing::Test {
protected:
  EventDecoder decoder;
  std::string programId = makeAddress(90);
};

TEST_F(DecodeTransactionTest, TracksInstructionAndEventIndices) {
  std::vector<std::string> logs = {
      invokeLine(COMPUTE_BUDGET, 1),
      successLine(COMPUTE_BUDGET),
      invokeLine(programId, 1),
      "Program log: Instruction: ClaimEarnings",
      programDataLine(EventKind::EARNINGS_CLAIMED, earningsClaimedPayload(1, 100, 1700000000)),
      invokeLine(TOKEN_PROGRAM, 2),
      programDataLine(EventKind::PLAYER_CREATED, PayloadBuilder().pubkey(makeKey(4)).bytes()),
      successLine(TOKEN_PROGRAM),
      programDataLine(EventKind::SLOT_UNLOCKED, slotUnlockedPayload(1, 2, 300)),
      successLine(programId),
      invokeLine(programId, 1),
      programDataLine(EventKind::SLOT_UNLOCKED, slotUnlockedPayload(1, 3, 400)),
      successLine(programId),
  };
  RawTransaction tx = makeTransaction("sig-indices", 100, logs);

  auto events = decoder.decodeTransaction(tx, programId);
  ASSERT_EQ(events.size(), 3u);

  EXPECT_EQ(events[0].kind, EventKind::EARNINGS_CLAIMED);
  EXPECT_EQ(events[0].instructionIndex, 1u);
  EXPECT_EQ(events[0].eventIndex, 0u);

  // The inner token program line is not ours and does not take an index
  EXPECT_EQ(events[1].kind, EventKind::SLOT_UNLOCKED);
  EXPECT_EQ(events[1].instructionIndex, 1u);
  EXPECT_EQ(events[1].eventIndex, 1u);
  EXPECT_EQ(events[1].getUInt("slot_index"), 2u);

  EXPECT_EQ(events[2].instructionIndex, 2u);
  EXPECT_EQ(events[2].eventIndex, 0u);
  EXPECT_EQ(events[2].getUInt("slot_index"), 3u);

  for (const auto &ev : events) {
    EXPECT_EQ(ev.signature, "sig-indices");
    EXPECT_EQ(ev.slot, 100u);
    EXPECT_EQ(ev.origin, ParsedEvent::Origin::BINARY);
  }
}

TEST_F(DecodeTransactionTest, EmptyProgramIdAcceptsEveryProgram) {
  std::vector<std::string> logs = {
      invokeLine(programId, 1),
      invokeLine(TOKEN_PROGRAM, 2),
      programDataLine(EventKind::PLAYER_CREATED, PayloadBuilder().pubkey(makeKey(4)).bytes()),
      successLine(TOKEN_PROGRAM),
      successLine(programId),
  };
  RawTransaction tx = makeTransaction("sig-any", 1, logs);

  EXPECT_EQ(decoder.decodeTransaction(tx, "").size(), 1u);
  EXPECT_TRUE(decoder.decodeTransaction(tx, programId).empty());
}

TEST_F(DecodeTransactionTest, BadDataLinesAreSkippedButKeepTheirIndex) {
  std::vector<std::string> lines = {
      "Program data: %%% not base64 %%%",
      "Program data: AQID",
      programDataLine(EventKind::EARNINGS_CLAIMED, std::string(10, '\x01')),
      std::string(EventDecoder::PROGRAM_DATA_PREFIX) +
          ppi::utl::base64Encode("UNKNOWN!" + std::string(40, '\x01')),
      programDataLine(EventKind::EARNINGS_CLAIMED, earningsClaimedPayload(1, 55, 1700000000)),
  };
  RawTransaction tx = makeTransaction("sig-bad", 7, instructionLogs(programId, lines));

  auto events = decoder.decodeTransaction(tx, programId);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].getUInt("amount"), 55u);
  EXPECT_EQ(events[0].instructionIndex, 0u);
  EXPECT_EQ(events[0].eventIndex, 4u);
}

TEST_F(DecodeTransactionTest, FailedInnerInvocationPopsTheStack) {
  std::vector<std::string> logs = {
      invokeLine(programId, 1),
      invokeLine(TOKEN_PROGRAM, 2),
      "Program " + TOKEN_PROGRAM + " failed: custom program error: 0x1",
      programDataLine(EventKind::EARNINGS_CLAIMED, earningsClaimedPayload(1, 9, 1700000000)),
      successLine(programId),
  };
  auto events = decoder.decodeTransaction(makeTransaction("sig-failed", 1, logs), programId);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].eventIndex, 0u);
}

TEST_F(DecodeTransactionTest, FallsBackToLogTextWithoutBinaryEvents) {
  std::string player = makeAddress(1);
  std::vector<std::string> lines = {
      "Program log: Instruction: UpdateEarnings",
      "Program log: Earnings updated for player: " + player,
      "Program log: New earnings added: 1500 lamports",
      "Program log: Total pending: 4500 lamports",
  };
  RawTransaction tx = makeTransaction("sig-text", 9, instructionLogs(programId, lines));

  auto events = decoder.decodeTransaction(tx, programId);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].kind, EventKind::EARNINGS_UPDATED);
  EXPECT_EQ(events[0].origin, ParsedEvent::Origin::LOG_FALLBACK);
  EXPECT_TRUE(events[0].partial);
  EXPECT_EQ(events[0].getString("player"), player);
  EXPECT_EQ(events[0].getUInt("earnings_added"), 1500u);
  EXPECT_EQ(events[0].getUInt("total_pending"), 4500u);
}

TEST_F(DecodeTransactionTest, BinaryEventsSuppressLogFallback) {
  std::vector<std::string> lines = {
      "Program log: Claimed 100 lamports",
      programDataLine(EventKind::EARNINGS_CLAIMED, earningsClaimedPayload(1, 100, 1700000000)),
  };
  auto events = decoder.decodeTransaction(
      makeTransaction("sig-both", 1, instructionLogs(programId, lines)), programId);
  ASSERT_EQ(events.size(), 1u);
  EXPECT_EQ(events[0].origin, ParsedEvent::Origin::BINARY);
}

TEST_F(DecodeTransactionTest, NoEventsForUnrelatedLogs) {
  auto tx = makeTransaction("sig-none", 1,
                            instructionLogs(programId, {"Program log: Instruction: Noop",
                                                        "Program consumption: 1000 units"}));
  EXPECT_TRUE(decoder.decodeTransaction(tx, programId).empty());
}
