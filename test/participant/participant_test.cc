#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include "../../src/participant/participant.h"
#include "../test_utils.h"

#include <memory>
#include <set>

using namespace XtSim;
using namespace XtSim::test_utils;
using namespace std::chrono_literals;

namespace {

const std::string kChainA("\x12\x34", 2);
const std::string kCoordinator = "shared-publisher";

Message ProposalFrom(const std::string& sender) {
    XTRequest req;
    TransactionRequest tx;
    tx.chain_id = kChainA;
    tx.transactions.push_back(std::string("\x01\x02\x03\x04\x05", 5));
    req.transactions.push_back(tx);
    return MakeXTRequestMessage(sender, req);
}

}  // namespace

class ParticipantTest : public ::testing::Test {
protected:
    void StartParticipant(VoteStrategy strategy) {
        StartParticipant(FastParticipantOptions("sequencer-A", kChainA, strategy));
    }

    void StartParticipant(ParticipantOptions options, bool originate = false, int tx_count = 0) {
        auto fds = MakeSocketPair();
        participant_ = std::make_unique<Participant>(std::move(options));
        participant_->Attach(fds.first);
        peer_ = std::make_unique<TestPeer>(fds.second);
        participant_->Start(originate, tx_count);
    }

    void TearDown() override {
        participant_.reset();
        peer_.reset();
    }

    // Reads one message that must be a Vote
    Vote ExpectVote() {
        Message msg;
        EXPECT_TRUE(peer_->Receive(&msg, 2000ms));
        EXPECT_EQ(msg.type(), PayloadType::kVote);
        EXPECT_EQ(msg.sender_id, "sequencer-A");
        if (msg.type() != PayloadType::kVote) {
            return Vote{};
        }
        return std::get<Vote>(msg.payload);
    }

    void ExpectSilence(std::chrono::milliseconds window) {
        Message msg;
        EXPECT_FALSE(peer_->Receive(&msg, window))
            << "unexpected " << PayloadTypeName(msg.type());
    }

    std::unique_ptr<Participant> participant_;
    std::unique_ptr<TestPeer> peer_;
};

TEST_F(ParticipantTest, CommitDecisionProducesOneBlock) {
    StartParticipant(VoteStrategy::kCommit);
    peer_->Send(ProposalFrom("sequencer-B"));

    Vote vote = ExpectVote();
    EXPECT_EQ(vote.sender_chain_id, kChainA);
    EXPECT_EQ(vote.xt_id, 1u);
    EXPECT_TRUE(vote.vote);
    EXPECT_TRUE(participant_->IsPending(1));

    peer_->Send(MakeDecidedMessage(kCoordinator, 1, true));

    Message msg;
    ASSERT_TRUE(peer_->Receive(&msg, 2000ms));
    ASSERT_EQ(msg.type(), PayloadType::kBlock);
    const Block& block = std::get<Block>(msg.payload);
    EXPECT_EQ(block.chain_id, kChainA);
    EXPECT_EQ(block.included_xt_ids, std::vector<uint32_t>{1});
    EXPECT_THAT(block.block_data, ::testing::MatchesRegex(
        "Block from sequencer-A at [0-9]+\\.[0-9][0-9] with 1 TXs"));

    ExpectSilence(200ms);
    EXPECT_TRUE(WaitUntil([&]() { return participant_->PendingCount() == 0; }, 1000ms));
    EXPECT_EQ(participant_->stats().blocks_sent.load(), 1u);
    EXPECT_EQ(participant_->state(), ParticipantState::kCommitted);
}

TEST_F(ParticipantTest, AbortDecisionRemovesEntry) {
    StartParticipant(VoteStrategy::kAbort);
    peer_->Send(ProposalFrom("sequencer-B"));

    Vote vote = ExpectVote();
    EXPECT_EQ(vote.xt_id, 1u);
    EXPECT_FALSE(vote.vote);

    peer_->Send(MakeDecidedMessage(kCoordinator, 1, false));
    ExpectSilence(200ms);
    EXPECT_FALSE(participant_->IsPending(1));
    EXPECT_EQ(participant_->state(), ParticipantState::kAborted);
    EXPECT_EQ(participant_->stats().blocks_sent.load(), 0u);
}

TEST_F(ParticipantTest, DuplicateDecisionIsIgnored) {
    StartParticipant(VoteStrategy::kCommit);
    peer_->Send(ProposalFrom("sequencer-B"));
    ExpectVote();

    peer_->Send(MakeDecidedMessage(kCoordinator, 1, true));
    peer_->Send(MakeDecidedMessage(kCoordinator, 1, true));

    Message msg;
    ASSERT_TRUE(peer_->Receive(&msg, 2000ms));
    EXPECT_EQ(msg.type(), PayloadType::kBlock);
    ExpectSilence(200ms);
    EXPECT_EQ(participant_->stats().decisions_received.load(), 2u);
    EXPECT_EQ(participant_->stats().blocks_sent.load(), 1u);
}

TEST_F(ParticipantTest, DecisionForUnknownTransactionIsNoOp) {
    StartParticipant(VoteStrategy::kCommit);
    peer_->Send(MakeDecidedMessage(kCoordinator, 42, true));
    ExpectSilence(200ms);
    EXPECT_EQ(participant_->PendingCount(), 0u);
    EXPECT_EQ(participant_->state(), ParticipantState::kIdle);
    EXPECT_TRUE(participant_->IsRunning());
}

TEST_F(ParticipantTest, LateVoteStillSentAfterDecision) {
    StartParticipant(VoteStrategy::kDelay);
    peer_->Send(ProposalFrom("sequencer-B"));

    // The coordinator times out before our vote arrives
    peer_->Send(MakeDecidedMessage(kCoordinator, 1, false));
    EXPECT_TRUE(WaitUntil([&]() { return !participant_->IsPending(1); }, 1000ms));

    Vote vote = ExpectVote();
    EXPECT_EQ(vote.xt_id, 1u);
    EXPECT_TRUE(vote.vote);
    ExpectSilence(200ms);
    EXPECT_EQ(participant_->stats().blocks_sent.load(), 0u);
}

TEST_F(ParticipantTest, TruncatedFrameThenCloseStopsParticipant) {
    StartParticipant(VoteStrategy::kCommit);
    peer_->SendRaw(std::string("\x00\x00\x00\x32", 4) + std::string(10, '\x01'));
    peer_->Close();

    EXPECT_TRUE(WaitUntil([&]() { return !participant_->IsRunning(); }, 2000ms));
    EXPECT_TRUE(participant_->WaitForExit(1000ms));
}

TEST_F(ParticipantTest, MalformedFrameIsDiscarded) {
    StartParticipant(VoteStrategy::kCommit);
    // sender_id claims 5 bytes, 1 present
    peer_->SendRaw(std::string("\x00\x00\x00\x03\x0a\x05\x41", 7));
    peer_->Send(ProposalFrom("sequencer-B"));

    Vote vote = ExpectVote();
    EXPECT_EQ(vote.xt_id, 1u);
    EXPECT_EQ(participant_->stats().decode_errors.load(), 1u);
    EXPECT_TRUE(participant_->IsRunning());
}

TEST_F(ParticipantTest, OversizedFrameStopsParticipant) {
    ParticipantOptions options = FastParticipantOptions("sequencer-A", kChainA, VoteStrategy::kCommit);
    options.max_frame_bytes = 64;
    StartParticipant(options);
    peer_->SendRaw(std::string("\x00\x00\x10\x00", 4));

    EXPECT_TRUE(WaitUntil([&]() { return !participant_->IsRunning(); }, 2000ms));
}

TEST_F(ParticipantTest, IgnoresVotesAndBlocksFromCoordinator) {
    StartParticipant(VoteStrategy::kCommit);
    peer_->Send(MakeVoteMessage("sequencer-B", kChainA, 1, true));
    peer_->Send(MakeBlockMessage("sequencer-B", kChainA, "data", {1}));
    Message empty;
    empty.sender_id = kCoordinator;
    peer_->Send(empty);

    ExpectSilence(200ms);
    EXPECT_EQ(participant_->PendingCount(), 0u);
    EXPECT_EQ(participant_->stats().decode_errors.load(), 0u);
}

TEST_F(ParticipantTest, InitiatorSendsRequestBeforeVote) {
    StartParticipant(VoteStrategy::kCommit);
    ASSERT_TRUE(participant_->SendTransaction());

    Message msg;
    ASSERT_TRUE(peer_->Receive(&msg, 2000ms));
    ASSERT_EQ(msg.type(), PayloadType::kXTRequest);
    const XTRequest& req = std::get<XTRequest>(msg.payload);
    ASSERT_EQ(req.transactions.size(), 3u);
    std::vector<std::string> chains = Participant::DefaultParticipatingChains();
    for (size_t i = 0; i < req.transactions.size(); ++i) {
        EXPECT_EQ(req.transactions[i].chain_id, chains[i]);
        ASSERT_EQ(req.transactions[i].transactions.size(), 1u);
        std::string payload{0x01, 0x02, 0x03, 0x04, static_cast<char>(0x05 + i)};
        EXPECT_EQ(req.transactions[i].transactions[0], payload);
    }

    Vote vote = ExpectVote();
    EXPECT_EQ(vote.xt_id, 1u);
    EXPECT_EQ(participant_->last_xt_id(), 1u);
}

TEST_F(ParticipantTest, OriginatorSendsRequestedCount) {
    StartParticipant(FastParticipantOptions("sequencer-A", kChainA, VoteStrategy::kCommit), true, 2);

    int requests = 0;
    std::set<uint32_t> voted;
    for (int i = 0; i < 4; ++i) {
        Message msg;
        ASSERT_TRUE(peer_->Receive(&msg, 2000ms));
        if (msg.type() == PayloadType::kXTRequest) {
            ++requests;
        } else if (msg.type() == PayloadType::kVote) {
            voted.insert(std::get<Vote>(msg.payload).xt_id);
        }
    }
    EXPECT_EQ(requests, 2);
    EXPECT_THAT(voted, ::testing::ElementsAre(1u, 2u));
    EXPECT_EQ(participant_->stats().proposals_sent.load(), 2u);
}

TEST_F(ParticipantTest, StopEndsReceiveLoop) {
    StartParticipant(VoteStrategy::kCommit);
    EXPECT_TRUE(participant_->IsRunning());
    participant_->Stop();
    EXPECT_TRUE(participant_->WaitForExit(1000ms));
    EXPECT_FALSE(participant_->IsRunning());
}

TEST_F(ParticipantTest, DestructionAbandonsPendingVote) {
    ParticipantOptions options = FastParticipantOptions("sequencer-A", kChainA, VoteStrategy::kCommit);
    options.vote_options.base_delay = {5000ms, 5000ms};
    StartParticipant(options);
    peer_->Send(ProposalFrom("sequencer-B"));
    ASSERT_TRUE(WaitUntil([&]() { return participant_->IsPending(1); }, 1000ms));

    auto start = std::chrono::steady_clock::now();
    participant_.reset();
    EXPECT_LT(std::chrono::steady_clock::now() - start, 2000ms);

    Message msg;
    EXPECT_FALSE(peer_->Receive(&msg, 100ms));
}

TEST_F(ParticipantTest, ConnectFailsWithoutListener) {
    ParticipantOptions options = FastParticipantOptions("sequencer-A", kChainA, VoteStrategy::kCommit);
    options.host = "127.0.0.1";
    options.port = 1;
    Participant participant(options);
    EXPECT_FALSE(participant.Connect());
    EXPECT_FALSE(participant.IsRunning());
}
