#ifndef PEERDROP_SESSION_CONFIG_HPP
#define PEERDROP_SESSION_CONFIG_HPP

#include <chrono>
#include <functional>
#include <memory>
#include "logger/logger.hpp"
#include "negotiation/negotiator.hpp"
#include "network/rtc_engine.hpp"
#include "signaling/signaling_channel.hpp"
#include "signaling/signaling_transport.hpp"
#include "transfer/transfer_protocol.hpp"

namespace peerdrop {
namespace session {

struct SessionConfig {
    signaling::SignalingConfig signaling;
    network::RtcConfig rtc;
    negotiation::NegotiationTimeouts negotiation;
    transfer::TransferConfig transfer;
    logging::LogConfig log;

    static SessionConfig sender_defaults() {
        return SessionConfig{};
    }

    // The receiver only waits for an answer from a known peer
    static SessionConfig receiver_defaults() {
        SessionConfig config;
        config.negotiation.peer_discovery = std::chrono::seconds(30);
        return config;
    }
};

// How a session obtains its transports; tests swap in fakes
struct SessionFactories {
    std::function<std::unique_ptr<signaling::SignalingTransport>()> make_transport;
    std::function<std::unique_ptr<network::RtcEngine>(const network::RtcConfig&)> make_engine;
};

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SESSION_CONFIG_HPP
