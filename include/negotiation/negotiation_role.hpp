#ifndef PEERDROP_NEGOTIATION_ROLE_HPP
#define PEERDROP_NEGOTIATION_ROLE_HPP

#include <memory>
#include <optional>
#include <string>
#include "network/rtc_engine.hpp"
#include "signaling/signaling_message.hpp"

namespace peerdrop {
namespace negotiation {

// What differs between the two ends of one negotiation. The Negotiator runs
// the same state machine for both and asks the role at the two points where
// they diverge.
class NegotiationRole {
public:
    virtual ~NegotiationRole() = default;

    virtual std::string name() const = 0;

    // Description sent before waiting for the peer, nullopt when this side waits first
    virtual std::optional<network::SessionDescription>
    produce_initial_description(network::RtcEngine& engine) = 0;

    // Applies the remote description; returns the reply to send, if any
    virtual std::optional<network::SessionDescription>
    produce_response_description(network::RtcEngine& engine,
                                 const network::SessionDescription& remote) = 0;

    // Message type carrying the remote description
    virtual signaling::SignalingType expected_remote_type() const = 0;

    // True when the remote peer id is learned from the first description
    virtual bool discovers_peer() const = 0;
};

// Receiver side: creates the data channel and the offer
class OffererRole : public NegotiationRole {
public:
    std::string name() const override { return "offerer"; }

    std::optional<network::SessionDescription>
    produce_initial_description(network::RtcEngine& engine) override {
        return engine.create_offer();
    }

    std::optional<network::SessionDescription>
    produce_response_description(network::RtcEngine& engine,
                                 const network::SessionDescription& remote) override {
        engine.set_remote_description(remote);
        return std::nullopt;
    }

    signaling::SignalingType expected_remote_type() const override {
        return signaling::SignalingType::ANSWER;
    }

    bool discovers_peer() const override { return false; }
};

// Sender side: waits for an offer from anyone and answers it
class AnswererRole : public NegotiationRole {
public:
    std::string name() const override { return "answerer"; }

    std::optional<network::SessionDescription>
    produce_initial_description(network::RtcEngine&) override {
        return std::nullopt;
    }

    std::optional<network::SessionDescription>
    produce_response_description(network::RtcEngine& engine,
                                 const network::SessionDescription& remote) override {
        return engine.create_answer(remote);
    }

    signaling::SignalingType expected_remote_type() const override {
        return signaling::SignalingType::OFFER;
    }

    bool discovers_peer() const override { return true; }
};

} // namespace negotiation
} // namespace peerdrop

#endif // PEERDROP_NEGOTIATION_ROLE_HPP
