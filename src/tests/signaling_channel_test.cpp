#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <chrono>
#include <thread>
#include "signaling/signaling_channel.hpp"
#include "signaling/signaling_error.hpp"
#include "test_utils.hpp"

using namespace peerdrop::signaling;
using namespace peerdrop::test;
using namespace std::chrono_literals;
using ::testing::_;
using ::testing::HasSubstr;
using ::testing::NiceMock;
using ::testing::Return;

class SignalingChannelTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeSignalingServer> server = std::make_shared<FakeSignalingServer>();
    SignalingConfig config;

    void SetUp() override {
        config.server = "ws://localhost:9000";
        config.heartbeat_interval = 20ms;
    }

    std::unique_ptr<SignalingChannel> make_channel() {
        return std::make_unique<SignalingChannel>(server->make_transport(), config);
    }
};

TEST_F(SignalingChannelTest, BuildUrlFollowsPeerJsLayout) {
    SignalingConfig defaults;
    EXPECT_EQ(SignalingChannel::build_url(defaults, "happy-apple-sunset", "tok"),
              "wss://0.peerjs.com/peerjs?key=peerjs&id=happy-apple-sunset&token=tok");

    config.server = "ws://localhost:9000/myapp";
    EXPECT_EQ(SignalingChannel::build_url(config, "x", "t"), "ws://localhost:9000/myapp?key=peerjs&id=x&token=t");
}

TEST_F(SignalingChannelTest, RegistersAndSendsHeartbeats) {
    auto channel = make_channel();
    channel->register_peer("alice", 1s);

    EXPECT_TRUE(channel->is_registered());
    EXPECT_EQ(channel->peer_id(), "alice");
    EXPECT_TRUE(server->is_registered("alice"));

    std::this_thread::sleep_for(100ms);
    EXPECT_GE(server->heartbeats(), 1);

    channel->close();
    EXPECT_TRUE(channel->is_closed());
    EXPECT_FALSE(channel->is_registered());
    EXPECT_FALSE(server->is_registered("alice"));
}

TEST_F(SignalingChannelTest, TakenIdIsARegistrationError) {
    auto first = make_channel();
    first->register_peer("alice", 1s);

    auto second = make_channel();
    try {
        second->register_peer("alice", 1s);
        FAIL() << "expected RegistrationError";
    } catch (const RegistrationError& e) {
        EXPECT_EQ(e.reason(), RegistrationError::Reason::ID_TAKEN);
    }
    EXPECT_TRUE(second->is_closed());
}

TEST_F(SignalingChannelTest, InvalidKeyIsARegistrationError) {
    server->set_greeting(R"({"type":"INVALID-KEY","payload":{"msg":"Invalid key provided"}})");
    auto channel = make_channel();
    try {
        channel->register_peer("alice", 1s);
        FAIL() << "expected RegistrationError";
    } catch (const RegistrationError& e) {
        EXPECT_EQ(e.reason(), RegistrationError::Reason::INVALID_KEY);
    }
}

TEST_F(SignalingChannelTest, SilentServerTimesOut) {
    server->set_greeting("");
    auto channel = make_channel();
    try {
        channel->register_peer("alice", 100ms);
        FAIL() << "expected RegistrationError";
    } catch (const RegistrationError& e) {
        EXPECT_EQ(e.reason(), RegistrationError::Reason::TIMEOUT);
    }
}

TEST_F(SignalingChannelTest, UnreachableServer) {
    server->set_reachable(false);
    auto channel = make_channel();
    try {
        channel->register_peer("alice", 1s);
        FAIL() << "expected RegistrationError";
    } catch (const RegistrationError& e) {
        EXPECT_EQ(e.reason(), RegistrationError::Reason::UNREACHABLE);
        EXPECT_THAT(e.what(), HasSubstr("connection refused"));
    }
}

TEST_F(SignalingChannelTest, RelaysMessagesBetweenPeers) {
    auto alice = make_channel();
    auto bob = make_channel();
    alice->register_peer("alice", 1s);
    bob->register_peer("bob", 1s);

    alice->send(SignalingMessage::offer("alice", "bob", "dc_1", {"v=0", "offer"}));

    auto received = bob->receive(1s);
    ASSERT_TRUE(received.has_value());
    EXPECT_EQ(received->type, SignalingType::OFFER);
    EXPECT_EQ(received->src, "alice");
    EXPECT_EQ(received->connection_id, "dc_1");

    EXPECT_FALSE(bob->receive(20ms).has_value());
}

TEST_F(SignalingChannelTest, SubscribeFlushesQueuedMessagesFirst) {
    auto alice = make_channel();
    auto bob = make_channel();
    alice->register_peer("alice", 1s);
    bob->register_peer("bob", 1s);

    alice->send(SignalingMessage::leave("alice", "bob"));

    std::vector<SignalingType> seen;
    bob->subscribe([&seen](SignalingMessage message) { seen.push_back(message.type); },
                   [](const std::string&) {});
    alice->send(SignalingMessage::offer("alice", "bob", "dc_1", {"v=0", "offer"}));
    bob->unsubscribe();

    ASSERT_EQ(seen.size(), 2u);
    EXPECT_EQ(seen[0], SignalingType::LEAVE);
    EXPECT_EQ(seen[1], SignalingType::OFFER);
}

TEST_F(SignalingChannelTest, ServerCloseIsReported) {
    auto channel = make_channel();
    channel->register_peer("alice", 1s);

    std::string reason;
    channel->subscribe([](SignalingMessage) {}, [&reason](const std::string& why) { reason = why; });
    ASSERT_TRUE(server->kick("alice", "server shutting down"));

    EXPECT_EQ(reason, "server shutting down");
    EXPECT_TRUE(channel->is_closed());
    EXPECT_THROW(channel->send(SignalingMessage::leave("alice", "bob")), ChannelClosed);
    EXPECT_THROW(channel->receive(10ms), ChannelClosed);
}

TEST_F(SignalingChannelTest, MalformedFramesAreDropped) {
    auto transport = std::make_unique<NiceMock<MockSignalingTransport>>();
    auto* mock = transport.get();
    ON_CALL(*mock, send_text(_)).WillByDefault(Return(true));
    EXPECT_CALL(*mock, open(HasSubstr("id=alice"), _, _))
        .WillOnce([mock](const std::string&, std::chrono::milliseconds, std::string&) {
            mock->text_handler("this is not json");
            mock->text_handler(R"({"type":"HEARTBEAT"})");
            mock->text_handler(R"({"type":"OPEN"})");
            return true;
        });

    SignalingChannel channel(std::move(transport), config);
    channel.register_peer("alice", 1s);
    EXPECT_TRUE(channel.is_registered());

    mock->text_handler(R"({"type":"OFFER","payload":{}})");
    EXPECT_FALSE(channel.receive(20ms).has_value());
}

TEST_F(SignalingChannelTest, SendFailureIsChannelClosed) {
    auto transport = std::make_unique<NiceMock<MockSignalingTransport>>();
    auto* mock = transport.get();
    EXPECT_CALL(*mock, send_text(_)).WillRepeatedly(Return(false));

    SignalingChannel channel(std::move(transport), config);
    EXPECT_THROW(channel.send(SignalingMessage::leave("alice", "bob")), ChannelClosed);
}
