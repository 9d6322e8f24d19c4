#include <gtest/gtest.h>
#include <nlohmann/json.hpp>
#include "signaling/signaling_error.hpp"
#include "signaling/signaling_message.hpp"

using namespace peerdrop::signaling;
using peerdrop::network::IceCandidate;
using peerdrop::network::SessionDescription;
using json = nlohmann::json;

TEST(SignalingMessageTest, OfferCarriesPeerJsPayload) {
    const auto message = SignalingMessage::offer("alice", "bob", "dc_1", SessionDescription{"v=0", "offer"});
    const json frame = json::parse(message.serialize());

    EXPECT_EQ(frame["type"], "OFFER");
    EXPECT_EQ(frame["src"], "alice");
    EXPECT_EQ(frame["dst"], "bob");
    EXPECT_EQ(frame["payload"]["sdp"]["sdp"], "v=0");
    EXPECT_EQ(frame["payload"]["sdp"]["type"], "offer");
    EXPECT_EQ(frame["payload"]["type"], "data");
    EXPECT_EQ(frame["payload"]["connectionId"], "dc_1");
    EXPECT_EQ(frame["payload"]["label"], "dc_1");
    EXPECT_EQ(frame["payload"]["reliable"], true);
    EXPECT_EQ(frame["payload"]["serialization"], "binary");
}

TEST(SignalingMessageTest, AnswerOmitsChannelOptions) {
    const auto message = SignalingMessage::answer("bob", "alice", "dc_1", SessionDescription{"v=0", "answer"});
    const json frame = json::parse(message.serialize());
    EXPECT_EQ(frame["type"], "ANSWER");
    EXPECT_FALSE(frame["payload"].contains("label"));

    const auto parsed = SignalingMessage::parse(message.serialize());
    EXPECT_EQ(parsed.type, SignalingType::ANSWER);
    EXPECT_EQ(parsed.description.type, "answer");
    EXPECT_EQ(parsed.connection_id, "dc_1");
}

TEST(SignalingMessageTest, CandidateRoundTrip) {
    const IceCandidate candidate{"candidate:1 1 UDP 1 10.0.0.1 5000 typ host", "0", 0};
    const auto parsed = SignalingMessage::parse(
        SignalingMessage::ice_candidate("alice", "bob", "dc_9", candidate).serialize());

    EXPECT_EQ(parsed.type, SignalingType::CANDIDATE);
    EXPECT_EQ(parsed.src, "alice");
    EXPECT_EQ(parsed.candidate.candidate, candidate.candidate);
    EXPECT_EQ(parsed.candidate.sdp_mid, "0");
    ASSERT_TRUE(parsed.candidate.sdp_mline_index.has_value());
    EXPECT_EQ(*parsed.candidate.sdp_mline_index, 0);
    EXPECT_EQ(parsed.connection_id, "dc_9");
}

TEST(SignalingMessageTest, ServerFrames) {
    EXPECT_EQ(SignalingMessage::parse(R"({"type":"OPEN"})").type, SignalingType::OPEN);
    EXPECT_EQ(SignalingMessage::parse(R"({"type":"ID-TAKEN","payload":{"msg":"taken"}})").type,
              SignalingType::ID_TAKEN);
    EXPECT_EQ(SignalingMessage::parse(R"({"type":"INVALID-KEY"})").type, SignalingType::INVALID_KEY);

    const auto expire = SignalingMessage::parse(R"({"type":"EXPIRE","src":"bob","dst":"alice"})");
    EXPECT_EQ(expire.type, SignalingType::EXPIRE);
    EXPECT_EQ(expire.src, "bob");

    const auto error = SignalingMessage::parse(R"({"type":"ERROR","payload":{"msg":"Invalid message"}})");
    EXPECT_EQ(error.reason, "Invalid message");
    EXPECT_EQ(SignalingMessage::parse(R"({"type":"ERROR"})").reason, "unspecified server error");
}

TEST(SignalingMessageTest, HeartbeatIsTypeOnly) {
    EXPECT_EQ(SignalingMessage::heartbeat().serialize(), R"({"type":"HEARTBEAT"})");
}

TEST(SignalingMessageTest, WireNames) {
    EXPECT_EQ(signaling_type_to_string(SignalingType::ID_TAKEN), "ID-TAKEN");
    EXPECT_EQ(signaling_type_to_string(SignalingType::INVALID_KEY), "INVALID-KEY");
    EXPECT_EQ(signaling_type_to_string(SignalingType::CANDIDATE), "CANDIDATE");
}

TEST(SignalingMessageTest, MalformedFramesAreRejected) {
    EXPECT_THROW(SignalingMessage::parse("{"), MalformedFrame);
    EXPECT_THROW(SignalingMessage::parse(R"({"payload":{}})"), MalformedFrame);
    EXPECT_THROW(SignalingMessage::parse(R"({"type":"WARP"})"), MalformedFrame);
    // OFFER without src
    EXPECT_THROW(SignalingMessage::parse(
        R"({"type":"OFFER","payload":{"sdp":{"sdp":"v=0","type":"offer"},"connectionId":"dc_1"}})"),
        MalformedFrame);
    // OFFER without sdp
    EXPECT_THROW(SignalingMessage::parse(R"({"type":"OFFER","src":"a","payload":{"connectionId":"dc_1"}})"),
                 MalformedFrame);
    // CANDIDATE without connection id
    EXPECT_THROW(SignalingMessage::parse(
        R"({"type":"CANDIDATE","src":"a","payload":{"candidate":{"candidate":"c"}}})"),
        MalformedFrame);
}
