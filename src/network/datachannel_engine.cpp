#include "network/datachannel_engine.hpp"
#include <boost/log/trivial.hpp>
#include <cstring>
#include <deque>
#include <stdexcept>
#include <variant>

namespace peerdrop {
namespace network {

namespace {

//==============================================
// DATA CHANNEL ADAPTER
//==============================================

class RtcDataChannel : public DataChannel, public std::enable_shared_from_this<RtcDataChannel> {
public:
    static std::shared_ptr<RtcDataChannel> wrap(std::shared_ptr<rtc::DataChannel> channel) {
        auto adapter = std::shared_ptr<RtcDataChannel>(new RtcDataChannel(std::move(channel)));
        adapter->install();
        return adapter;
    }

    ~RtcDataChannel() override {
        channel_->resetCallbacks();
    }

    bool send(const std::vector<uint8_t>& message) override {
        if (!channel_->isOpen()) {
            return false;
        }
        try {
            rtc::binary data(message.size());
            std::memcpy(data.data(), message.data(), message.size());
            return channel_->send(std::move(data));
        } catch (const std::exception& e) {
            BOOST_LOG_TRIVIAL(warning) << "DataChannel: Send failed: " << e.what();
            return false;
        }
    }

    std::size_t buffered_amount() const override { return channel_->bufferedAmount(); }
    bool is_open() const override { return channel_->isOpen(); }
    std::string label() const override { return channel_->label(); }

    void close() override {
        if (!channel_->isClosed()) {
            channel_->close();
        }
    }

    void set_message_handler(MessageHandler handler) override {
        std::lock_guard<std::mutex> lock(mutex_);
        message_handler_ = std::move(handler);
        while (message_handler_ && !pending_.empty()) {
            message_handler_(std::move(pending_.front()));
            pending_.pop_front();
        }
    }

    void set_closed_handler(ClosedHandler handler) override {
        bool already_closed = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_handler_ = std::move(handler);
            already_closed = closed_ && closed_handler_;
        }
        if (already_closed) {
            closed_handler_();
        }
    }

private:
    explicit RtcDataChannel(std::shared_ptr<rtc::DataChannel> channel) : channel_(std::move(channel)) {}

    std::shared_ptr<rtc::DataChannel> channel_;
    mutable std::mutex mutex_;
    MessageHandler message_handler_;
    ClosedHandler closed_handler_;
    std::deque<std::vector<uint8_t>> pending_;
    bool closed_ = false;

    void install() {
        std::weak_ptr<RtcDataChannel> weak = shared_from_this();
        channel_->onMessage([weak](rtc::message_variant data) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            std::vector<uint8_t> bytes;
            if (auto* binary = std::get_if<rtc::binary>(&data)) {
                bytes.resize(binary->size());
                std::memcpy(bytes.data(), binary->data(), binary->size());
            } else {
                const auto& text = std::get<std::string>(data);
                bytes.assign(text.begin(), text.end());
            }
            self->deliver(std::move(bytes));
        });
        channel_->onClosed([weak]() {
            if (auto self = weak.lock()) {
                self->mark_closed();
            }
        });
    }

    void deliver(std::vector<uint8_t> bytes) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (message_handler_) {
            message_handler_(std::move(bytes));
        } else {
            pending_.push_back(std::move(bytes));
        }
    }

    void mark_closed() {
        ClosedHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
            handler = closed_handler_;
        }
        BOOST_LOG_TRIVIAL(info) << "DataChannel: '" << channel_->label() << "' closed";
        if (handler) {
            handler();
        }
    }
};

rtc::Configuration make_configuration(const RtcConfig& config) {
    rtc::Configuration rtc_config;
    for (const auto& url : config.stun_servers) {
        rtc_config.iceServers.emplace_back(url);
    }
    for (const auto& url : config.turn_servers) {
        rtc_config.iceServers.emplace_back(url);
    }
    return rtc_config;
}

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

DataChannelEngine::DataChannelEngine(const RtcConfig& config, std::chrono::milliseconds description_timeout)
    : config_(config)
    , description_timeout_(description_timeout) {
    try {
        peer_ = std::make_shared<rtc::PeerConnection>(make_configuration(config_));
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("WebRTC engine: cannot create peer connection: ") + e.what());
    }
    install_callbacks();
    BOOST_LOG_TRIVIAL(debug) << "DataChannelEngine: Peer connection created with "
                             << config_.stun_servers.size() + config_.turn_servers.size() << " ICE servers";
}

DataChannelEngine::~DataChannelEngine() {
    close();
}

//==============================================
// DESCRIPTIONS
//==============================================

SessionDescription DataChannelEngine::create_offer() {
    auto future = expect_description();
    // Creating the first channel triggers the local offer
    local_channel_ = peer_->createDataChannel(config_.channel_label);
    watch_channel(local_channel_);
    return wait_for(future, "offer");
}

SessionDescription DataChannelEngine::create_answer(const SessionDescription& offer) {
    auto future = expect_description();
    set_remote_description(offer);
    return wait_for(future, "answer");
}

void DataChannelEngine::set_remote_description(const SessionDescription& description) {
    try {
        peer_->setRemoteDescription(rtc::Description(description.sdp, description.type));
    } catch (const std::exception& e) {
        throw std::runtime_error(std::string("WebRTC engine: rejected remote ") + description.type + ": " + e.what());
    }
}

//==============================================
// CANDIDATES
//==============================================

void DataChannelEngine::add_ice_candidate(const IceCandidate& candidate) {
    try {
        peer_->addRemoteCandidate(rtc::Candidate(candidate.candidate, candidate.sdp_mid));
    } catch (const std::exception& e) {
        // One bad candidate does not doom the connection
        BOOST_LOG_TRIVIAL(warning) << "DataChannelEngine: Ignoring remote candidate: " << e.what();
    }
}

//==============================================
// EVENT HANDLERS
//==============================================

void DataChannelEngine::on_ice_candidate(CandidateHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    candidate_handler_ = std::move(handler);
}

void DataChannelEngine::on_data_channel_open(ChannelOpenHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    open_handler_ = std::move(handler);
}

void DataChannelEngine::on_failure(FailureHandler handler) {
    std::lock_guard<std::mutex> lock(mutex_);
    failure_handler_ = std::move(handler);
}

void DataChannelEngine::install_callbacks() {
    peer_->onLocalDescription([this](rtc::Description description) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (pending_description_) {
            pending_description_->set_value(SessionDescription{std::string(description), description.typeString()});
            pending_description_.reset();
        }
    });

    peer_->onLocalCandidate([this](rtc::Candidate candidate) {
        CandidateHandler handler;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            handler = candidate_handler_;
        }
        if (handler) {
            handler(IceCandidate{candidate.candidate(), candidate.mid(), 0});
        }
    });

    peer_->onStateChange([this](rtc::PeerConnection::State state) {
        BOOST_LOG_TRIVIAL(debug) << "DataChannelEngine: Peer connection state " << static_cast<int>(state);
        if (state == rtc::PeerConnection::State::Failed) {
            report_failure("peer connection failed");
        }
    });

    peer_->onDataChannel([this](std::shared_ptr<rtc::DataChannel> channel) {
        BOOST_LOG_TRIVIAL(info) << "DataChannelEngine: Remote opened channel '" << channel->label() << "'";
        watch_channel(std::move(channel));
    });
}

void DataChannelEngine::watch_channel(std::shared_ptr<rtc::DataChannel> channel) {
    std::weak_ptr<rtc::DataChannel> weak = channel;
    channel->onOpen([this, weak]() {
        if (auto opened = weak.lock()) {
            announce_channel(opened);
        }
    });
    if (channel->isOpen()) {
        announce_channel(channel);
    }
}

void DataChannelEngine::announce_channel(std::shared_ptr<rtc::DataChannel> channel) {
    ChannelOpenHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (channel_announced_) {
            return;
        }
        channel_announced_ = true;
        handler = open_handler_;
    }
    BOOST_LOG_TRIVIAL(info) << "DataChannelEngine: Channel '" << channel->label() << "' open";
    if (handler) {
        handler(RtcDataChannel::wrap(std::move(channel)));
    }
}

void DataChannelEngine::report_failure(const std::string& reason) {
    FailureHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        handler = failure_handler_;
    }
    BOOST_LOG_TRIVIAL(error) << "DataChannelEngine: " << reason;
    if (handler) {
        handler(reason);
    }
}

std::future<SessionDescription> DataChannelEngine::expect_description() {
    std::lock_guard<std::mutex> lock(mutex_);
    pending_description_.emplace();
    return pending_description_->get_future();
}

SessionDescription DataChannelEngine::wait_for(std::future<SessionDescription>& future, const std::string& what) {
    if (future.wait_for(description_timeout_) != std::future_status::ready) {
        std::lock_guard<std::mutex> lock(mutex_);
        pending_description_.reset();
        throw std::runtime_error("WebRTC engine: no local " + what + " produced");
    }
    return future.get();
}

//==============================================
// TEARDOWN
//==============================================

void DataChannelEngine::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        candidate_handler_ = nullptr;
        open_handler_ = nullptr;
        failure_handler_ = nullptr;
        pending_description_.reset();
    }
    if (!peer_) {
        return;
    }
    peer_->resetCallbacks();
    if (local_channel_) {
        local_channel_->resetCallbacks();
    }
    peer_->close();
    BOOST_LOG_TRIVIAL(debug) << "DataChannelEngine: Peer connection closed";
}

} // namespace network
} // namespace peerdrop
