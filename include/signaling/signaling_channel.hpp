#ifndef PEERDROP_SIGNALING_CHANNEL_HPP
#define PEERDROP_SIGNALING_CHANNEL_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include "network/channel.hpp"
#include "signaling/signaling_message.hpp"
#include "signaling/signaling_transport.hpp"

namespace peerdrop {
namespace signaling {

struct SignalingConfig {
    // Bare host means wss://host:443
    std::string server = "0.peerjs.com";
    std::string api_key = "peerjs";
    std::string path = "/peerjs";
    std::chrono::milliseconds heartbeat_interval{5000};
    std::chrono::milliseconds connect_timeout{10000};
};

// Typed PeerJS session over a SignalingTransport.
//
// Inbound frames are parsed on the transport thread. Frames that match no
// known shape are logged and dropped. Valid frames are either queued for
// receive() or, once a subscriber is installed, handed straight to it.
class SignalingChannel {
public:
    using MessageHandler = std::function<void(SignalingMessage)>;
    using ClosedHandler = std::function<void(const std::string& reason)>;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    SignalingChannel(std::unique_ptr<SignalingTransport> transport, SignalingConfig config);
    ~SignalingChannel();

    SignalingChannel(const SignalingChannel&) = delete;
    SignalingChannel& operator=(const SignalingChannel&) = delete;


    // ---- REGISTRATION ----
    // Connects and waits for OPEN. Throws RegistrationError.
    void register_peer(const std::string& peer_id, std::chrono::milliseconds timeout);
    bool is_registered() const { return registered_; }
    const std::string& peer_id() const { return peer_id_; }


    // ---- MESSAGE EXCHANGE ----
    // Throws ChannelClosed when the connection is gone
    void send(const SignalingMessage& message);
    // nullopt on timeout; throws ChannelClosed once closed and drained
    std::optional<SignalingMessage> receive(std::chrono::milliseconds timeout);
    // Queued messages are flushed to on_message before this returns.
    // on_closed fires immediately if the channel is already closed.
    void subscribe(MessageHandler on_message, ClosedHandler on_closed);
    void unsubscribe();


    // ---- TEARDOWN ----
    void close();
    bool is_closed() const;


    // ---- UTILITY METHODS ----
    static std::string build_url(const SignalingConfig& config, const std::string& peer_id,
                                 const std::string& token);

private:
    // ---- PARAMETERS ----
    std::unique_ptr<SignalingTransport> transport_;
    SignalingConfig config_;
    std::string peer_id_;
    std::atomic<bool> registered_{false};
    network::Channel<SignalingMessage> inbox_;

    mutable std::mutex state_mutex_;
    MessageHandler on_message_;
    ClosedHandler on_closed_;
    bool closed_ = false;
    std::string close_reason_;

    std::thread heartbeat_thread_;
    std::mutex heartbeat_mutex_;
    std::condition_variable heartbeat_cv_;
    bool heartbeat_stop_ = false;


    // ---- TRANSPORT CALLBACKS ----
    void on_text(const std::string& text);
    void on_transport_closed(const std::string& reason);


    // ---- HEARTBEAT ----
    void start_heartbeat();
    void stop_heartbeat();
    void heartbeat_loop();
};

} // namespace signaling
} // namespace peerdrop

#endif // PEERDROP_SIGNALING_CHANNEL_HPP
