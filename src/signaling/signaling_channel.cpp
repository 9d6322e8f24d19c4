#include "signaling/signaling_channel.hpp"
#include "signaling/server_url.hpp"
#include "signaling/signaling_error.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace peerdrop {
namespace signaling {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SignalingChannel::SignalingChannel(std::unique_ptr<SignalingTransport> transport,
                                   SignalingConfig config)
    : transport_(std::move(transport))
    , config_(std::move(config)) {
    if (!transport_) {
        throw SignalingError("no transport supplied");
    }
    transport_->set_text_handler([this](const std::string& text) { on_text(text); });
    transport_->set_close_handler([this](const std::string& reason) { on_transport_closed(reason); });
}

SignalingChannel::~SignalingChannel() {
    close();
}

//==============================================
// REGISTRATION
//==============================================

void SignalingChannel::register_peer(const std::string& peer_id, std::chrono::milliseconds timeout) {
    using Reason = RegistrationError::Reason;

    if (registered_) {
        throw SignalingError("already registered as '" + peer_id_ + "'");
    }
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_) {
            throw ChannelClosed(close_reason_);
        }
    }
    peer_id_ = peer_id;

    const std::string token = boost::uuids::to_string(boost::uuids::random_generator()());
    std::string url;
    try {
        url = build_url(config_, peer_id, token);
    } catch (const SignalingError& e) {
        throw RegistrationError(Reason::UNREACHABLE, e.what());
    }

    BOOST_LOG_TRIVIAL(info) << "Signaling: Registering '" << peer_id << "' with " << config_.server;

    const auto deadline = std::chrono::steady_clock::now() + timeout;
    std::string error;
    if (!transport_->open(url, std::min(timeout, config_.connect_timeout), error)) {
        throw RegistrationError(Reason::UNREACHABLE, error);
    }

    for (;;) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        SignalingMessage message;
        const auto status = remaining.count() > 0
            ? inbox_.consume_for(message, remaining)
            : network::Channel<SignalingMessage>::Status::TIMEOUT;

        if (status == network::Channel<SignalingMessage>::Status::TIMEOUT) {
            close();
            throw RegistrationError(Reason::TIMEOUT,
                "no OPEN from server within " + std::to_string(timeout.count()) + " ms");
        }
        if (status == network::Channel<SignalingMessage>::Status::CLOSED) {
            std::string reason;
            {
                std::lock_guard<std::mutex> lock(state_mutex_);
                reason = close_reason_;
            }
            throw RegistrationError(Reason::UNREACHABLE, "connection closed before OPEN: " + reason);
        }

        switch (message.type) {
            case SignalingType::OPEN:
                registered_ = true;
                start_heartbeat();
                BOOST_LOG_TRIVIAL(info) << "Signaling: Registered as '" << peer_id << "'";
                return;
            case SignalingType::ID_TAKEN:
                close();
                throw RegistrationError(Reason::ID_TAKEN, "peer id '" + peer_id + "' is already in use");
            case SignalingType::INVALID_KEY:
                close();
                throw RegistrationError(Reason::INVALID_KEY, "server rejected API key '" + config_.api_key + "'");
            case SignalingType::ERROR:
                close();
                throw RegistrationError(Reason::SERVER_ERROR, message.reason);
            default:
                BOOST_LOG_TRIVIAL(debug) << "Signaling: Ignoring " << signaling_type_to_string(message.type)
                                         << " before OPEN";
                break;
        }
    }
}

//==============================================
// MESSAGE EXCHANGE
//==============================================

void SignalingChannel::send(const SignalingMessage& message) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_) {
            throw ChannelClosed(close_reason_);
        }
    }
    if (!transport_->send_text(message.serialize())) {
        throw ChannelClosed("failed to send " + signaling_type_to_string(message.type));
    }
    BOOST_LOG_TRIVIAL(debug) << "Signaling: Sent " << signaling_type_to_string(message.type)
                             << (message.dst.empty() ? "" : " to " + message.dst);
}

std::optional<SignalingMessage> SignalingChannel::receive(std::chrono::milliseconds timeout) {
    SignalingMessage message;
    switch (inbox_.consume_for(message, timeout)) {
        case network::Channel<SignalingMessage>::Status::ITEM:
            return message;
        case network::Channel<SignalingMessage>::Status::TIMEOUT:
            return std::nullopt;
        case network::Channel<SignalingMessage>::Status::CLOSED:
        default: {
            std::lock_guard<std::mutex> lock(state_mutex_);
            throw ChannelClosed(close_reason_);
        }
    }
}

void SignalingChannel::subscribe(MessageHandler on_message, ClosedHandler on_closed) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    SignalingMessage queued;
    while (inbox_.try_consume(queued)) {
        on_message(std::move(queued));
    }
    on_message_ = std::move(on_message);
    on_closed_ = std::move(on_closed);
    if (closed_ && on_closed_) {
        on_closed_(close_reason_);
    }
}

void SignalingChannel::unsubscribe() {
    std::lock_guard<std::mutex> lock(state_mutex_);
    on_message_ = nullptr;
    on_closed_ = nullptr;
}

//==============================================
// TEARDOWN
//==============================================

void SignalingChannel::close() {
    stop_heartbeat();
    bool was_open = false;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!closed_) {
            closed_ = true;
            close_reason_ = "closed locally";
            was_open = true;
        }
    }
    transport_->close();
    inbox_.close();
    registered_ = false;
    if (was_open) {
        BOOST_LOG_TRIVIAL(debug) << "Signaling: Channel closed";
    }
}

bool SignalingChannel::is_closed() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return closed_;
}

//==============================================
// TRANSPORT CALLBACKS
//==============================================

void SignalingChannel::on_text(const std::string& text) {
    SignalingMessage message;
    try {
        message = SignalingMessage::parse(text);
    } catch (const MalformedFrame& e) {
        BOOST_LOG_TRIVIAL(warning) << "Signaling: Dropping frame: " << e.what();
        return;
    }

    if (message.type == SignalingType::HEARTBEAT) {
        BOOST_LOG_TRIVIAL(trace) << "Signaling: Heartbeat from server";
        return;
    }
    BOOST_LOG_TRIVIAL(debug) << "Signaling: Received " << signaling_type_to_string(message.type)
                             << (message.src.empty() ? "" : " from " + message.src);

    std::lock_guard<std::mutex> lock(state_mutex_);
    if (closed_) {
        return;
    }
    if (on_message_) {
        on_message_(std::move(message));
    } else {
        inbox_.produce(std::move(message));
    }
}

void SignalingChannel::on_transport_closed(const std::string& reason) {
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (closed_) {
            return;
        }
        closed_ = true;
        close_reason_ = reason;
        BOOST_LOG_TRIVIAL(warning) << "Signaling: Connection to server lost: " << reason;
        if (on_closed_) {
            on_closed_(reason);
        }
    }
    inbox_.close();
    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
        heartbeat_stop_ = true;
    }
    heartbeat_cv_.notify_all();
}

//==============================================
// HEARTBEAT
//==============================================

void SignalingChannel::start_heartbeat() {
    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
        heartbeat_stop_ = false;
    }
    heartbeat_thread_ = std::thread(&SignalingChannel::heartbeat_loop, this);
}

void SignalingChannel::stop_heartbeat() {
    {
        std::lock_guard<std::mutex> lock(heartbeat_mutex_);
        heartbeat_stop_ = true;
    }
    heartbeat_cv_.notify_all();
    if (heartbeat_thread_.joinable()) {
        heartbeat_thread_.join();
    }
}

void SignalingChannel::heartbeat_loop() {
    const std::string frame = SignalingMessage::heartbeat().serialize();
    std::unique_lock<std::mutex> lock(heartbeat_mutex_);
    while (!heartbeat_cv_.wait_for(lock, config_.heartbeat_interval, [this] { return heartbeat_stop_; })) {
        lock.unlock();
        if (!transport_->send_text(frame)) {
            BOOST_LOG_TRIVIAL(debug) << "Signaling: Heartbeat not sent, transport closed";
        }
        lock.lock();
    }
}

//==============================================
// UTILITY METHODS
//==============================================

std::string SignalingChannel::build_url(const SignalingConfig& config, const std::string& peer_id,
                                        const std::string& token) {
    ServerUrl url = ServerUrl::parse(config.server);
    // A server given with its own path keeps it
    if (url.target.empty() || url.target == "/") {
        url.target = config.path;
    }
    url.target += (url.target.find('?') == std::string::npos ? "?" : "&");
    url.target += "key=" + config.api_key + "&id=" + peer_id + "&token=" + token;
    return url.to_string();
}

} // namespace signaling
} // namespace peerdrop
