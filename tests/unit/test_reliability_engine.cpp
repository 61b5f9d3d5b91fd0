/**
 * @file test_reliability_engine.cpp
 * @brief Protocol rules of the reliability engine, driven without a transport
 */

#include <gtest/gtest.h>

#include "Base64.h"
#include "IntegrityCodec.h"
#include "MetricsCollector.h"
#include "ReliabilityEngine.h"
#include "TransferRegistry.h"

#include <atomic>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace ChatCast;

namespace {

    class RecordingSink : public IReplySink {
    public:
        void send(const ControlFrame& reply) override {
            std::lock_guard<std::mutex> lock(mutex_);
            replies_.push_back(reply);
        }

        std::vector<ControlFrame> take() {
            std::lock_guard<std::mutex> lock(mutex_);
            std::vector<ControlFrame> out;
            out.swap(replies_);
            return out;
        }

    private:
        std::mutex mutex_;
        std::vector<ControlFrame> replies_;
    };

    class ThrowingSink : public IReplySink {
    public:
        void send(const ControlFrame& reply) override {
            if (reply.command != ControlCommand::NACK) {
                throw std::runtime_error("socket gone");
            }
            nacks.push_back(reply);
        }
        std::vector<ControlFrame> nacks;
    };

    std::vector<uint8_t> chunkBytes(uint32_t seq, size_t size = 8) {
        return std::vector<uint8_t>(size, static_cast<uint8_t>(seq));
    }

}

class ReliabilityEngineTest : public ::testing::Test {
protected:
    ReliabilityEngineTest() : registry_(4), engine_(registry_, codec_) {}

    FileChunkFrame makeChunk(const std::string& transferId, uint32_t seq, uint32_t totalChunks) {
        auto payload = chunkBytes(seq);
        FileChunkFrame chunk;
        chunk.transferId = transferId;
        chunk.sequence = seq;
        chunk.totalChunks = totalChunks;
        chunk.chunkSizeHint = 8;
        chunk.filename = "data.bin";
        chunk.totalSize = static_cast<uint64_t>(totalChunks) * 8;
        chunk.integrityTag = codec_.tag(payload, seq);
        chunk.payloadBase64 = Base64::encode(payload);
        return chunk;
    }

    ControlFrame resumeRequest(const std::string& transferId) {
        ControlFrame resume = ControlFrame::make(ControlCommand::RESUME_REQUEST);
        resume.transferId = transferId;
        return resume;
    }

    Crc32IntegrityCodec codec_;
    TransferRegistry registry_;
    ReliabilityEngine engine_;
    RecordingSink sink_;
};

TEST_F(ReliabilityEngineTest, UntaggedMessageIsAcked) {
    MessageFrame msg;
    msg.sequence = 7;
    msg.payload = {'h', 'e', 'l', 'l', 'o'};

    auto result = engine_.dispatch(msg, "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::ACK);
    EXPECT_EQ(replies[0].sequence, 7);
    EXPECT_FALSE(replies[0].integrityStatus.has_value());
    EXPECT_EQ(result.handled, FrameKind::MESSAGE);
    EXPECT_EQ(result.command, ControlCommand::ACK);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(ReliabilityEngineTest, TaggedMessageAckCarriesVerification) {
    MessageFrame msg;
    msg.sequence = 3;
    msg.payload = {'h', 'i'};
    std::string tag = codec_.tag(msg.payload, 3);
    msg.integrityTag = tag;

    engine_.dispatch(msg, "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::ACK);
    EXPECT_EQ(replies[0].integrityStatus, std::string("valid"));
    EXPECT_EQ(replies[0].expectedTag, tag);
    EXPECT_EQ(replies[0].receivedTag, tag);
}

TEST_F(ReliabilityEngineTest, MessageWithWrongTagFailsIntegrity) {
    MessageFrame msg;
    msg.sequence = 4;
    msg.payload = {'x'};
    msg.integrityTag = codec_.tag(msg.payload, 5);

    auto result = engine_.dispatch(msg, "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::INTEGRITY_FAIL);
    EXPECT_EQ(replies[0].sequence, 4);
    EXPECT_EQ(replies[0].reason, std::string("integrity_compromised"));
    EXPECT_EQ(replies[0].expectedTag, codec_.tag(msg.payload, 4));
    EXPECT_EQ(result.reason, std::string("integrity_compromised"));
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(ReliabilityEngineTest, EmptyMessageTagCountsAsAbsent) {
    MessageFrame msg;
    msg.sequence = 1;
    msg.integrityTag = std::string();

    engine_.dispatch(msg, "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::ACK);
}

TEST_F(ReliabilityEngineTest, OutOfOrderTransferResumeAndCompletion) {
    const std::string id = "transfer-123";

    for (uint32_t seq : {0u, 2u, 1u}) {
        engine_.dispatch(makeChunk(id, seq, 4), "peer", sink_);
    }

    auto early = sink_.take();
    // ACK 0 + CUM_ACK(0) for seq 0, then ACK 2, ACK 1
    ASSERT_EQ(early.size(), 4u);
    EXPECT_EQ(early[0].command, ControlCommand::ACK);
    EXPECT_EQ(early[1].command, ControlCommand::CUM_ACK);
    EXPECT_EQ(early[1].sequence, 0);
    EXPECT_EQ(early[2].command, ControlCommand::ACK);
    EXPECT_EQ(early[2].sequence, 2);
    EXPECT_EQ(early[3].command, ControlCommand::ACK);
    EXPECT_EQ(early[3].sequence, 1);

    engine_.dispatch(resumeRequest(id), "peer", sink_);
    auto resume = sink_.take();
    ASSERT_EQ(resume.size(), 1u);
    EXPECT_EQ(resume[0].command, ControlCommand::MISSING);
    EXPECT_EQ(resume[0].transferId, id);
    EXPECT_EQ(resume[0].missing, std::vector<uint32_t>{3});

    engine_.dispatch(makeChunk(id, 3, 4), "peer", sink_);
    auto last = sink_.take();
    ASSERT_EQ(last.size(), 2u);
    EXPECT_EQ(last[0].command, ControlCommand::ACK);
    EXPECT_EQ(last[0].sequence, 3);
    EXPECT_EQ(last[1].command, ControlCommand::CUM_ACK);
    EXPECT_EQ(last[1].sequence, 3);
    EXPECT_EQ(last[1].transferId, id);

    auto state = registry_.get(id);
    ASSERT_NE(state, nullptr);
    EXPECT_EQ(state->highestContiguous(), 3);
    EXPECT_EQ(state->received(), (std::set<uint32_t>{0, 1, 2, 3}));
    EXPECT_TRUE(state->isComplete());
}

TEST_F(ReliabilityEngineTest, CorruptedFirstChunkCreatesNoEntry) {
    auto chunk = makeChunk("t-corrupt", 0, 4);
    chunk.payloadBase64 = Base64::encode(chunkBytes(9));

    auto result = engine_.dispatch(chunk, "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::INTEGRITY_FAIL);
    EXPECT_EQ(replies[0].reason, std::string("integrity_compromised"));
    EXPECT_EQ(replies[0].transferId, std::string("t-corrupt"));
    EXPECT_EQ(result.command, ControlCommand::INTEGRITY_FAIL);
    EXPECT_EQ(registry_.get("t-corrupt"), nullptr);
}

TEST_F(ReliabilityEngineTest, CorruptedLaterChunkLeavesReceivedUnchanged) {
    engine_.dispatch(makeChunk("t", 0, 4), "peer", sink_);
    sink_.take();

    auto bad = makeChunk("t", 1, 4);
    bad.integrityTag = codec_.tag(chunkBytes(1), 2);
    engine_.dispatch(bad, "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::INTEGRITY_FAIL);
    EXPECT_EQ(registry_.get("t")->received(), std::set<uint32_t>{0});
}

TEST_F(ReliabilityEngineTest, EmptyTransferIdIsRejected) {
    auto chunk = makeChunk("", 2, 4);

    auto result = engine_.dispatch(chunk, "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::NACK);
    EXPECT_EQ(replies[0].sequence, 2);
    EXPECT_EQ(replies[0].reason, std::string("missing_transfer_id"));
    EXPECT_FALSE(result.transferId.has_value());
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(ReliabilityEngineTest, BadBase64IsInvalidEncoding) {
    auto chunk = makeChunk("t-enc", 1, 4);
    chunk.payloadBase64 = "not base64!";

    engine_.dispatch(chunk, "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::NACK);
    EXPECT_EQ(replies[0].reason, std::string("invalid_encoding"));
    EXPECT_EQ(replies[0].transferId, std::string("t-enc"));
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(ReliabilityEngineTest, DuplicateChunkIsAckedWithoutGrowth) {
    auto before = MetricsCollector::instance().getFrameMetrics().duplicateChunks;

    engine_.dispatch(makeChunk("dup", 1, 4), "peer", sink_);
    engine_.dispatch(makeChunk("dup", 1, 4), "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0].command, ControlCommand::ACK);
    EXPECT_EQ(replies[1].command, ControlCommand::ACK);
    EXPECT_EQ(registry_.get("dup")->receivedCount(), 1u);
    EXPECT_EQ(MetricsCollector::instance().getFrameMetrics().duplicateChunks, before + 1);
}

TEST_F(ReliabilityEngineTest, CumulativeAckOnIntervalAndCompletion) {
    const std::string id = "cum";
    std::vector<int64_t> cumAcks;

    for (uint32_t seq = 0; seq < 6; ++seq) {
        engine_.dispatch(makeChunk(id, seq, 6), "peer", sink_);
    }
    for (const auto& reply : sink_.take()) {
        if (reply.command == ControlCommand::CUM_ACK) {
            cumAcks.push_back(*reply.sequence);
        }
    }

    // seq 0 and 4 are on the interval; seq 5 completes the transfer
    EXPECT_EQ(cumAcks, (std::vector<int64_t>{0, 4, 5}));
}

TEST_F(ReliabilityEngineTest, CompleteTransferRepeatsCumulativeAckOnRetransmit) {
    const std::string id = "lost-final-ack";
    for (uint32_t seq = 0; seq < 4; ++seq) {
        engine_.dispatch(makeChunk(id, seq, 4), "peer", sink_);
    }
    sink_.take();

    // Final chunk sent again because the completion CUM_ACK never arrived
    engine_.dispatch(makeChunk(id, 3, 4), "peer", sink_);
    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0].command, ControlCommand::ACK);
    EXPECT_EQ(replies[0].sequence, 3);
    EXPECT_EQ(replies[1].command, ControlCommand::CUM_ACK);
    EXPECT_EQ(replies[1].sequence, 3);

    // Any duplicate of a complete transfer reports completion too
    engine_.dispatch(makeChunk(id, 1, 4), "peer", sink_);
    replies = sink_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0].command, ControlCommand::ACK);
    EXPECT_EQ(replies[0].sequence, 1);
    EXPECT_EQ(replies[1].command, ControlCommand::CUM_ACK);
    EXPECT_EQ(replies[1].sequence, 3);
}

TEST_F(ReliabilityEngineTest, IncompleteDuplicateOffIntervalGetsNoCumulativeAck) {
    engine_.dispatch(makeChunk("partial", 1, 4), "peer", sink_);
    sink_.take();

    engine_.dispatch(makeChunk("partial", 1, 4), "peer", sink_);
    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::ACK);
}

TEST_F(ReliabilityEngineTest, NoCumulativeAckWithoutTotal) {
    engine_.dispatch(makeChunk("open-ended", 0, 0), "peer", sink_);
    engine_.dispatch(makeChunk("open-ended", 4, 0), "peer", sink_);

    for (const auto& reply : sink_.take()) {
        EXPECT_NE(reply.command, ControlCommand::CUM_ACK);
    }
}

TEST_F(ReliabilityEngineTest, CumulativeAckIntervalIsConfigurable) {
    TransferRegistry registry;
    ReliabilityEngine::Options options;
    options.cumAckInterval = 2;
    ReliabilityEngine engine(registry, codec_, options);

    for (uint32_t seq = 0; seq < 5; ++seq) {
        engine.dispatch(makeChunk("every-other", seq, 10), "peer", sink_);
    }

    std::vector<int64_t> cumAcks;
    for (const auto& reply : sink_.take()) {
        if (reply.command == ControlCommand::CUM_ACK) cumAcks.push_back(*reply.sequence);
    }
    EXPECT_EQ(cumAcks, (std::vector<int64_t>{0, 2, 4}));
}

TEST_F(ReliabilityEngineTest, ResumeForUnknownTransfer) {
    auto result = engine_.dispatch(resumeRequest("ghost"), "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::CUM_ACK);
    EXPECT_EQ(replies[0].sequence, -1);
    EXPECT_EQ(replies[0].transferId, std::string("ghost"));
    EXPECT_EQ(result.command, ControlCommand::RESUME_REQUEST);
    EXPECT_EQ(registry_.size(), 0u);
}

TEST_F(ReliabilityEngineTest, ResumeForCompleteTransfer) {
    for (uint32_t seq = 0; seq < 3; ++seq) {
        engine_.dispatch(makeChunk("done", seq, 3), "peer", sink_);
    }
    sink_.take();

    engine_.dispatch(resumeRequest("done"), "peer", sink_);
    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::CUM_ACK);
    EXPECT_EQ(replies[0].sequence, 2);
}

TEST_F(ReliabilityEngineTest, ResumeReportsEverySingleGap) {
    const uint32_t total = 8;
    for (uint32_t k = 0; k < total; ++k) {
        std::string id = "gap-" + std::to_string(k);
        for (uint32_t seq = 0; seq < total; ++seq) {
            if (seq != k) engine_.dispatch(makeChunk(id, seq, total), "peer", sink_);
        }
        sink_.take();

        engine_.dispatch(resumeRequest(id), "peer", sink_);
        auto replies = sink_.take();
        ASSERT_EQ(replies.size(), 1u);
        EXPECT_EQ(replies[0].command, ControlCommand::MISSING);
        EXPECT_EQ(replies[0].missing, std::vector<uint32_t>{k});
    }
}

TEST_F(ReliabilityEngineTest, OtherControlsAreEchoedWithoutReply) {
    ControlFrame unknown = ControlFrame::make(ControlCommand::UNKNOWN);
    unknown.commandName = "PING";
    auto echoed = engine_.dispatch(unknown, "peer", sink_);
    EXPECT_EQ(echoed.commandName, "PING");
    EXPECT_EQ(echoed.command, ControlCommand::UNKNOWN);

    ControlFrame ack = ControlFrame::make(ControlCommand::ACK);
    ack.sequence = 4;
    auto acked = engine_.dispatch(ack, "peer", sink_);
    EXPECT_EQ(acked.command, ControlCommand::ACK);
    EXPECT_EQ(acked.sequence, 4);

    auto noId = engine_.dispatch(ControlFrame::make(ControlCommand::RESUME_REQUEST), "peer", sink_);
    EXPECT_EQ(noId.command, ControlCommand::RESUME_REQUEST);

    EXPECT_TRUE(sink_.take().empty());
}

TEST_F(ReliabilityEngineTest, UndecodableFrameBecomesInternalErrorNack) {
    auto result = engine_.reportUndecodable("unknown frame type 'BLOB'", 12, "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::NACK);
    EXPECT_EQ(replies[0].sequence, 12);
    EXPECT_EQ(replies[0].reason, std::string("internal_error:unknown frame type 'BLOB'"));
    EXPECT_EQ(result.reason, replies[0].reason);

    engine_.reportUndecodable("malformed JSON", std::nullopt, "peer", sink_);
    replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].sequence, -1);
}

TEST_F(ReliabilityEngineTest, FailureInsideDispatchIsContained) {
    ThrowingSink sink;
    MessageFrame msg;
    msg.sequence = 21;

    DispatchResult result;
    EXPECT_NO_THROW(result = engine_.dispatch(msg, "peer", sink));

    ASSERT_EQ(sink.nacks.size(), 1u);
    EXPECT_EQ(sink.nacks[0].sequence, 21);
    EXPECT_EQ(sink.nacks[0].reason, std::string("internal_error:socket gone"));
    EXPECT_EQ(result.command, ControlCommand::NACK);
}

TEST_F(ReliabilityEngineTest, ConcurrentTransfersAllComplete) {
    const int transfers = 16;
    const uint32_t chunks = 40;
    std::atomic<int> completedCumAcks{0};

    CallbackReplySink sink([&](const ControlFrame& reply) {
        if (reply.command == ControlCommand::CUM_ACK && reply.sequence == static_cast<int64_t>(chunks) - 1) {
            ++completedCumAcks;
        }
    });

    std::vector<std::thread> threads;
    for (int t = 0; t < transfers; ++t) {
        // Two senders per transfer: even and odd sequences
        for (uint32_t parity = 0; parity < 2; ++parity) {
            threads.emplace_back([&, t, parity]() {
                std::string id = "parallel-" + std::to_string(t);
                for (uint32_t seq = parity; seq < chunks; seq += 2) {
                    engine_.dispatch(makeChunk(id, seq, chunks), "peer-" + std::to_string(parity), sink);
                }
            });
        }
    }
    for (auto& th : threads) th.join();

    EXPECT_EQ(completedCumAcks.load(), transfers);
    for (int t = 0; t < transfers; ++t) {
        auto state = registry_.get("parallel-" + std::to_string(t));
        ASSERT_NE(state, nullptr);
        EXPECT_TRUE(state->isComplete());
        EXPECT_EQ(state->receivedCount(), chunks);
    }
}

TEST_F(ReliabilityEngineTest, HmacCodecDrivesSameRules) {
    HmacIntegrityCodec hmac(std::vector<uint8_t>{'k', 'e', 'y'});
    TransferRegistry registry;
    ReliabilityEngine engine(registry, hmac);

    auto payload = chunkBytes(0);
    FileChunkFrame chunk = makeChunk("hmac", 0, 1);
    chunk.integrityTag = hmac.tag(payload, 0);
    engine.dispatch(chunk, "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 2u);
    EXPECT_EQ(replies[0].command, ControlCommand::ACK);
    EXPECT_EQ(replies[1].command, ControlCommand::CUM_ACK);

    // A CRC tag does not satisfy the keyed codec
    engine.dispatch(makeChunk("hmac-2", 0, 1), "peer", sink_);
    replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::INTEGRITY_FAIL);
}

TEST_F(ReliabilityEngineTest, KeyedCodecNeverRevealsExpectedTag) {
    HmacIntegrityCodec hmac(std::vector<uint8_t>{'s', 'e', 'c', 'r', 'e', 't'});
    TransferRegistry registry;
    ReliabilityEngine engine(registry, hmac);

    // Chunk with a junk tag: the reply must not hand out the correct one
    FileChunkFrame chunk = makeChunk("forged", 0, 1);
    chunk.integrityTag = "00";
    engine.dispatch(chunk, "peer", sink_);

    auto replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::INTEGRITY_FAIL);
    EXPECT_FALSE(replies[0].expectedTag.has_value());
    EXPECT_EQ(replies[0].receivedTag, std::string("00"));
    EXPECT_FALSE(registry.contains("forged"));

    // Same for messages
    MessageFrame msg;
    msg.sequence = 2;
    msg.payload = {'h', 'i'};
    msg.integrityTag = "00";
    engine.dispatch(msg, "peer", sink_);
    replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::INTEGRITY_FAIL);
    EXPECT_FALSE(replies[0].expectedTag.has_value());

    // A valid tag is acknowledged without echoing the computed tag back
    msg.integrityTag = hmac.tag(msg.payload, 2);
    engine.dispatch(msg, "peer", sink_);
    replies = sink_.take();
    ASSERT_EQ(replies.size(), 1u);
    EXPECT_EQ(replies[0].command, ControlCommand::ACK);
    EXPECT_EQ(replies[0].integrityStatus, std::string("valid"));
    EXPECT_FALSE(replies[0].expectedTag.has_value());
    EXPECT_EQ(replies[0].receivedTag, msg.integrityTag);
}
