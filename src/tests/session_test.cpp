#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <thread>
#include "crypto/crypto_engine.hpp"
#include "negotiation/negotiation_error.hpp"
#include "session/peer_id.hpp"
#include "session/receiver_session.hpp"
#include "session/sender_session.hpp"
#include "session/session_error.hpp"
#include "store/store_error.hpp"
#include "transfer/transfer_error.hpp"
#include "test_utils.hpp"

using namespace peerdrop::session;
using namespace peerdrop::test;
using namespace std::chrono_literals;
using peerdrop::crypto::AuthFailure;
using peerdrop::crypto::CryptoEngine;
using peerdrop::negotiation::NegotiationError;
using peerdrop::negotiation::NegotiationState;
using peerdrop::store::IoError;
using peerdrop::transfer::PeerAbort;
using ::testing::Contains;
using ::testing::HasSubstr;

namespace {

// Records every hook; share details are also published through a future
class RecordingObserver : public SessionObserver {
public:
    void on_negotiation_state(NegotiationState::State state) override {
        std::lock_guard<std::mutex> lock(mutex_);
        states.push_back(state);
    }

    void on_share_details(const std::string& peer_id, const std::string& key_base64) override {
        if (!shared_.exchange(true)) {
            details_.set_value({peer_id, key_base64});
        }
    }

    void on_connected(const std::string& remote_peer_id) override {
        std::lock_guard<std::mutex> lock(mutex_);
        remote = remote_peer_id;
    }

    void on_progress(const peerdrop::transfer::TransferProgress& progress) override {
        std::lock_guard<std::mutex> lock(mutex_);
        last_progress = progress;
        ++progress_updates;
    }

    void on_complete(const std::filesystem::path& path) override {
        std::lock_guard<std::mutex> lock(mutex_);
        completed = path;
    }

    std::future<std::pair<std::string, std::string>> share_details() { return details_.get_future(); }

    std::vector<NegotiationState::State> states;
    std::string remote;
    peerdrop::transfer::TransferProgress last_progress;
    int progress_updates = 0;
    std::filesystem::path completed;

private:
    std::mutex mutex_;
    std::atomic<bool> shared_{false};
    std::promise<std::pair<std::string, std::string>> details_;
};

} // namespace

class SessionTest : public ::testing::Test {
protected:
    std::shared_ptr<FakeSignalingServer> server = std::make_shared<FakeSignalingServer>();
    std::shared_ptr<LoopbackDataChannel> sender_end;
    std::shared_ptr<LoopbackDataChannel> receiver_end;
    TempDir source_dir;
    TempDir output_dir;

    void SetUp() override {
        std::tie(sender_end, receiver_end) = LoopbackDataChannel::create_pair();
    }

    SessionConfig make_config(SessionConfig config) {
        config.signaling.server = "ws://localhost:9000";
        config.negotiation.registration = 1s;
        config.negotiation.peer_discovery = 5s;
        config.negotiation.candidates = 2s;
        config.transfer.idle_timeout = 2s;
        config.transfer.ready_timeout = 2s;
        config.transfer.completion_timeout = 2s;
        return config;
    }

    SessionFactories make_factories(std::shared_ptr<LoopbackDataChannel> end) {
        SessionFactories factories;
        auto server_ref = server;
        factories.make_transport = [server_ref]() -> std::unique_ptr<peerdrop::signaling::SignalingTransport> {
            return server_ref->make_transport();
        };
        factories.make_engine = [end](const peerdrop::network::RtcConfig&)
            -> std::unique_ptr<peerdrop::network::RtcEngine> {
            return std::make_unique<FakeRtcEngine>(end);
        };
        return factories;
    }

    std::unique_ptr<SenderSession> make_sender() {
        return std::make_unique<SenderSession>(make_config(SessionConfig::sender_defaults()),
                                               make_factories(sender_end));
    }

    std::unique_ptr<ReceiverSession> make_receiver(const CryptoEngine::Key& key) {
        return std::make_unique<ReceiverSession>(make_config(SessionConfig::receiver_defaults()),
                                                 make_factories(receiver_end), key);
    }
};

TEST_F(SessionTest, SendsFileToReceiver) {
    const auto content = random_bytes(3 * peerdrop::transfer::FileMetadata::CHUNK_SIZE + 10);
    const auto file = source_dir.write_file("photo.jpg", content);

    auto sender = make_sender();
    RecordingObserver sender_observer;
    sender->set_observer(&sender_observer);
    auto details = sender_observer.share_details();
    auto sent = std::async(std::launch::async, [&] { return sender->run(file, "brave-tiger-moon"); });

    ASSERT_EQ(details.wait_for(5s), std::future_status::ready);
    const auto [peer_id, key] = details.get();
    EXPECT_EQ(peer_id, "brave-tiger-moon");
    EXPECT_EQ(key, sender->key_base64());

    auto receiver = make_receiver(CryptoEngine::key_from_base64(key));
    RecordingObserver receiver_observer;
    receiver->set_observer(&receiver_observer);
    const auto path = receiver->run(peer_id, output_dir.path());
    const auto metadata = sent.get();

    EXPECT_EQ(path, output_dir.path() / "photo.jpg");
    EXPECT_EQ(read_file(path), content);
    EXPECT_EQ(metadata.total_chunks, 4u);
    ASSERT_TRUE(receiver->metadata().has_value());
    EXPECT_EQ(receiver->metadata()->size, content.size());

    EXPECT_EQ(receiver_observer.remote, "brave-tiger-moon");
    EXPECT_EQ(receiver_observer.completed, path);
    EXPECT_TRUE(receiver_observer.last_progress.complete());
    EXPECT_EQ(sender_observer.completed, file);
    EXPECT_GT(sender_observer.progress_updates, 0);
    EXPECT_THAT(sender_observer.states, Contains(NegotiationState::State::CONNECTED));
    EXPECT_FALSE(server->is_registered("brave-tiger-moon"));
}

TEST_F(SessionTest, SenderGeneratesPeerId) {
    const auto file = source_dir.write_file("note.txt", "hi");
    auto sender = make_sender();
    RecordingObserver observer;
    sender->set_observer(&observer);
    auto details = observer.share_details();
    auto sent = std::async(std::launch::async, [&] { return sender->run(file); });

    ASSERT_EQ(details.wait_for(5s), std::future_status::ready);
    const auto shared = details.get();
    EXPECT_TRUE(is_valid_peer_id(shared.first));
    EXPECT_EQ(shared.first, sender->peer_id());

    sender->cancel();
    EXPECT_THROW(sent.get(), SessionCancelled);
}

TEST_F(SessionTest, WrongKeyLeavesNoFile) {
    const auto file = source_dir.write_file("secret.txt", "classified");
    auto sender = make_sender();
    RecordingObserver observer;
    sender->set_observer(&observer);
    auto details = observer.share_details();
    auto sent = std::async(std::launch::async, [&] { return sender->run(file, "quiet-river-echo"); });
    ASSERT_EQ(details.wait_for(5s), std::future_status::ready);

    auto receiver = make_receiver(CryptoEngine::generate_key());
    EXPECT_THROW(receiver->run("quiet-river-echo", output_dir.path()), AuthFailure);
    EXPECT_THROW(sent.get(), PeerAbort);
    EXPECT_TRUE(std::filesystem::is_empty(output_dir.path()));
}

TEST_F(SessionTest, CancelWhileWaitingForPeer) {
    const auto file = source_dir.write_file("note.txt", "hi");
    auto sender = make_sender();
    RecordingObserver observer;
    sender->set_observer(&observer);
    auto details = observer.share_details();
    auto sent = std::async(std::launch::async, [&] { return sender->run(file, "lonely-owl-dusk"); });
    ASSERT_EQ(details.wait_for(5s), std::future_status::ready);

    sender->cancel();
    ASSERT_EQ(sent.wait_for(5s), std::future_status::ready);
    EXPECT_THROW(sent.get(), SessionCancelled);
    EXPECT_TRUE(sender->cancelled());
}

TEST_F(SessionTest, CancelBeforeRun) {
    const auto file = source_dir.write_file("note.txt", "hi");
    auto sender = make_sender();
    sender->cancel();
    EXPECT_THROW(sender->run(file, "early-bird-moon"), SessionCancelled);
    EXPECT_FALSE(server->is_registered("early-bird-moon"));
}

TEST_F(SessionTest, InvalidPeerIdsAreRejected) {
    const auto file = source_dir.write_file("note.txt", "hi");
    auto sender = make_sender();
    EXPECT_THROW(sender->run(file, "not a valid id"), SessionError);

    auto receiver = make_receiver(CryptoEngine::generate_key());
    EXPECT_THROW(receiver->run("-bad-", output_dir.path()), SessionError);
    EXPECT_TRUE(server->relayed().empty());
}

TEST_F(SessionTest, MissingFileFailsBeforeSignaling) {
    auto sender = make_sender();
    EXPECT_THROW(sender->run(source_dir.path() / "absent.txt", "brave-tiger-moon"), IoError);
    EXPECT_FALSE(server->is_registered("brave-tiger-moon"));
}

TEST_F(SessionTest, ReceiverReportsUnknownSender) {
    auto receiver = make_receiver(CryptoEngine::generate_key());
    EXPECT_THROW(receiver->run("nobody-is-here", output_dir.path()), NegotiationError);
    EXPECT_TRUE(std::filesystem::is_empty(output_dir.path()));
}

TEST_F(SessionTest, FactoriesAreRequired) {
    EXPECT_THROW(SenderSession(SessionConfig::sender_defaults(), SessionFactories{}), SessionError);
}

TEST_F(SessionTest, MissingEngineIsASessionError) {
    const auto file = source_dir.write_file("note.txt", "hi");
    SessionFactories factories = make_factories(sender_end);
    factories.make_engine = [](const peerdrop::network::RtcConfig&) -> std::unique_ptr<peerdrop::network::RtcEngine> {
        return nullptr;
    };
    SenderSession sender(make_config(SessionConfig::sender_defaults()), factories);
    EXPECT_THROW(sender.run(file, "brave-tiger-moon"), SessionError);
}

// A second run would reuse the key and nonce salt of the first
TEST_F(SessionTest, SessionsRunOnlyOnce) {
    const auto file = source_dir.write_file("hello.txt", "HelloWorld");
    auto sender = make_sender();
    RecordingObserver observer;
    sender->set_observer(&observer);
    auto details = observer.share_details();
    auto sent = std::async(std::launch::async, [&] { return sender->run(file, "brave-tiger-moon"); });
    ASSERT_EQ(details.wait_for(5s), std::future_status::ready);

    auto receiver = make_receiver(CryptoEngine::key_from_base64(details.get().second));
    receiver->run("brave-tiger-moon", output_dir.path());
    sent.get();

    const auto relayed = server->relayed().size();
    try {
        sender->run(file, "brave-tiger-moon");
        FAIL() << "expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_THAT(e.what(), HasSubstr("already ran"));
    }
    try {
        receiver->run("brave-tiger-moon", output_dir.path());
        FAIL() << "expected SessionError";
    } catch (const SessionError& e) {
        EXPECT_THAT(e.what(), HasSubstr("already ran"));
    }
    EXPECT_EQ(server->relayed().size(), relayed);
    EXPECT_FALSE(server->is_registered("brave-tiger-moon"));
}

TEST_F(SessionTest, FailedRunIsNotRepeatable) {
    auto sender = make_sender();
    EXPECT_THROW(sender->run(source_dir.path() / "absent.txt", "brave-tiger-moon"), IoError);
    const auto file = source_dir.write_file("hello.txt", "HelloWorld");
    EXPECT_THROW(sender->run(file, "brave-tiger-moon"), SessionError);
}
