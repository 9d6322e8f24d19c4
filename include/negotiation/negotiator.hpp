#ifndef PEERDROP_NEGOTIATOR_HPP
#define PEERDROP_NEGOTIATOR_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <variant>
#include "negotiation/negotiation_role.hpp"
#include "negotiation/negotiation_state.hpp"
#include "network/channel.hpp"
#include "network/data_channel.hpp"
#include "network/rtc_engine.hpp"
#include "signaling/signaling_channel.hpp"

namespace peerdrop {
namespace negotiation {

struct NegotiationTimeouts {
    std::chrono::milliseconds registration{10000};
    // How long to wait for the remote description
    std::chrono::milliseconds peer_discovery{120000};
    // From sending/applying descriptions until the data channel opens
    std::chrono::milliseconds candidates{30000};
};

// ---- INBOUND EVENTS ----
struct SignalingEvent {
    signaling::SignalingMessage message;
};
struct SignalingClosedEvent {
    std::string reason;
};
struct LocalCandidateEvent {
    network::IceCandidate candidate;
};
struct ChannelOpenEvent {
    std::shared_ptr<network::DataChannel> channel;
};
struct EngineFailureEvent {
    std::string reason;
};

using NegotiationEvent = std::variant<SignalingEvent, SignalingClosedEvent, LocalCandidateEvent,
                                      ChannelOpenEvent, EngineFailureEvent>;

// Drives one offer/answer/candidate exchange to an open data channel.
// Signaling and engine callbacks all land in one event inbox consumed by
// run(); cancel() closes that inbox.
class Negotiator {
public:
    using StateObserver = std::function<void(NegotiationState::State)>;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    Negotiator(signaling::SignalingChannel& signaling, network::RtcEngine& engine,
               std::unique_ptr<NegotiationRole> role, NegotiationTimeouts timeouts);
    ~Negotiator();

    Negotiator(const Negotiator&) = delete;
    Negotiator& operator=(const Negotiator&) = delete;


    // ---- NEGOTIATION ----
    // remote_id is required when the role does not discover its peer.
    // Throws SignalingError, NegotiationError or NegotiationCancelled; the
    // state is FAILED afterwards with the reason kept.
    std::shared_ptr<network::DataChannel> run(const std::string& local_id,
                                              const std::optional<std::string>& remote_id);
    // Safe from any thread
    void cancel();
    // CONNECTED -> CLOSED once the session is done with the channel
    void close();


    // ---- GETTERS AND SETTERS ----
    NegotiationState::State state() const;
    std::string failure_reason() const;
    std::string remote_peer_id() const;
    const std::string& connection_id() const { return connection_id_; }
    void set_state_observer(StateObserver observer);

private:
    using Clock = std::chrono::steady_clock;

    // ---- PARAMETERS ----
    signaling::SignalingChannel& signaling_;
    network::RtcEngine& engine_;
    std::unique_ptr<NegotiationRole> role_;
    NegotiationTimeouts timeouts_;
    network::Channel<NegotiationEvent> inbox_;
    std::atomic<bool> cancelled_{false};

    mutable std::mutex state_mutex_;
    NegotiationState state_;
    std::string failure_reason_;
    std::string remote_id_;
    StateObserver observer_;

    std::string local_id_;
    std::string connection_id_;
    bool remote_description_applied_ = false;
    std::shared_ptr<network::DataChannel> channel_;


    // ---- PHASES ----
    void register_local(const std::string& local_id);
    void attach();
    void detach();
    signaling::SignalingMessage await_description(Clock::time_point deadline);
    void apply_description(const signaling::SignalingMessage& message);
    std::shared_ptr<network::DataChannel> await_channel(Clock::time_point deadline);


    // ---- EVENT HANDLING ----
    NegotiationEvent next_event(Clock::time_point deadline, const std::string& waiting_for);
    // Returns true when event is the remote description this side waits for
    bool handle_event(NegotiationEvent& event, signaling::SignalingMessage* description);
    bool handle_signaling(const signaling::SignalingMessage& message,
                          signaling::SignalingMessage* description);
    void forward_local_candidate(const network::IceCandidate& candidate);


    // ---- STATE CONTROL ----
    void transition(NegotiationState::State next);
    void fail(const std::string& reason);
};

} // namespace negotiation
} // namespace peerdrop

#endif // PEERDROP_NEGOTIATOR_HPP
