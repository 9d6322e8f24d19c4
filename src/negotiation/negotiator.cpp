#include "negotiation/negotiator.hpp"
#include "negotiation/negotiation_error.hpp"
#include "signaling/signaling_error.hpp"
#include <boost/log/trivial.hpp>
#include <boost/uuid/uuid.hpp>
#include <boost/uuid/uuid_generators.hpp>
#include <boost/uuid/uuid_io.hpp>

namespace peerdrop {
namespace negotiation {

using signaling::SignalingMessage;
using signaling::SignalingType;
using State = NegotiationState::State;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Negotiator::Negotiator(signaling::SignalingChannel& signaling, network::RtcEngine& engine,
                       std::unique_ptr<NegotiationRole> role, NegotiationTimeouts timeouts)
    : signaling_(signaling)
    , engine_(engine)
    , role_(std::move(role))
    , timeouts_(timeouts) {
    if (!role_) {
        throw NegotiationError("no negotiation role supplied");
    }
    BOOST_LOG_TRIVIAL(debug) << "Negotiator: Created as " << role_->name();
}

Negotiator::~Negotiator() {
    cancel();
    detach();
}

//==============================================
// NEGOTIATION
//==============================================

std::shared_ptr<network::DataChannel> Negotiator::run(const std::string& local_id,
                                                      const std::optional<std::string>& remote_id) {
    if (cancelled_) {
        fail("cancelled");
        throw NegotiationCancelled();
    }
    if (!role_->discovers_peer() && (!remote_id || remote_id->empty())) {
        fail("no remote peer id");
        throw NegotiationError("the " + role_->name() + " needs the remote peer id");
    }

    local_id_ = local_id;
    if (remote_id) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        remote_id_ = *remote_id;
    }

    try {
        transition(State::REGISTERING);
        register_local(local_id);
        attach();

        if (!role_->discovers_peer()) {
            connection_id_ = "dc_" + boost::uuids::to_string(boost::uuids::random_generator()());
        }
        std::optional<network::SessionDescription> initial;
        try {
            initial = role_->produce_initial_description(engine_);
        } catch (const NegotiationError&) {
            throw;
        } catch (const std::exception& e) {
            throw NegotiationError(std::string("cannot create local description: ") + e.what());
        }
        if (initial) {
            signaling_.send(SignalingMessage::offer(local_id_, remote_peer_id(), connection_id_, *initial));
            BOOST_LOG_TRIVIAL(info) << "Negotiator: Offer sent to '" << remote_peer_id() << "'";
        }

        transition(State::WAITING_FOR_PEER);
        const SignalingMessage description = await_description(Clock::now() + timeouts_.peer_discovery);

        transition(State::EXCHANGING_DESCRIPTIONS);
        apply_description(description);

        transition(State::GATHERING_CANDIDATES);
        auto channel = await_channel(Clock::now() + timeouts_.candidates);

        transition(State::CONNECTED);
        detach();
        return channel;
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Negotiator: " << e.what();
        fail(e.what());
        detach();
        throw;
    }
}

void Negotiator::cancel() {
    if (!cancelled_.exchange(true)) {
        BOOST_LOG_TRIVIAL(debug) << "Negotiator: Cancelling";
    }
    inbox_.close();
}

void Negotiator::close() {
    StateObserver observer;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!state_.transition_to(State::CLOSED)) {
            return;
        }
        observer = observer_;
    }
    BOOST_LOG_TRIVIAL(debug) << "Negotiator: CLOSED";
    if (observer) {
        observer(State::CLOSED);
    }
}

//==============================================
// GETTERS AND SETTERS
//==============================================

NegotiationState::State Negotiator::state() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return state_.get_state();
}

std::string Negotiator::failure_reason() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return failure_reason_;
}

std::string Negotiator::remote_peer_id() const {
    std::lock_guard<std::mutex> lock(state_mutex_);
    return remote_id_;
}

void Negotiator::set_state_observer(StateObserver observer) {
    std::lock_guard<std::mutex> lock(state_mutex_);
    observer_ = std::move(observer);
}

//==============================================
// PHASES
//==============================================

void Negotiator::register_local(const std::string& local_id) {
    if (signaling_.is_registered()) {
        if (signaling_.peer_id() != local_id) {
            BOOST_LOG_TRIVIAL(warning) << "Negotiator: Signaling already registered as '"
                                       << signaling_.peer_id() << "'";
            local_id_ = signaling_.peer_id();
        }
        return;
    }
    signaling_.register_peer(local_id, timeouts_.registration);
}

// Engine and signaling callbacks become inbox events from here on
void Negotiator::attach() {
    engine_.on_ice_candidate([this](const network::IceCandidate& candidate) {
        inbox_.produce(LocalCandidateEvent{candidate});
    });
    engine_.on_data_channel_open([this](std::shared_ptr<network::DataChannel> channel) {
        inbox_.produce(ChannelOpenEvent{std::move(channel)});
    });
    engine_.on_failure([this](const std::string& reason) {
        inbox_.produce(EngineFailureEvent{reason});
    });
    signaling_.subscribe(
        [this](SignalingMessage message) { inbox_.produce(SignalingEvent{std::move(message)}); },
        [this](const std::string& reason) { inbox_.produce(SignalingClosedEvent{reason}); });
}

void Negotiator::detach() {
    signaling_.unsubscribe();
    engine_.on_ice_candidate(nullptr);
    engine_.on_data_channel_open(nullptr);
    engine_.on_failure(nullptr);
}

SignalingMessage Negotiator::await_description(Clock::time_point deadline) {
    const std::string waiting_for = role_->discovers_peer()
        ? "waiting for an offer"
        : "waiting for the answer from '" + remote_peer_id() + "'";
    BOOST_LOG_TRIVIAL(info) << "Negotiator: " << waiting_for;

    SignalingMessage description;
    for (;;) {
        NegotiationEvent event = next_event(deadline, waiting_for);
        if (handle_event(event, &description)) {
            return description;
        }
    }
}

void Negotiator::apply_description(const SignalingMessage& message) {
    if (role_->discovers_peer()) {
        std::lock_guard<std::mutex> lock(state_mutex_);
        remote_id_ = message.src;
        connection_id_ = message.connection_id;
    }
    BOOST_LOG_TRIVIAL(info) << "Negotiator: " << signaling::signaling_type_to_string(message.type)
                            << " received from '" << message.src << "'";

    std::optional<network::SessionDescription> reply;
    try {
        reply = role_->produce_response_description(engine_, message.description);
    } catch (const NegotiationError&) {
        throw;
    } catch (const std::exception& e) {
        throw NegotiationError(std::string("cannot apply remote description: ") + e.what());
    }
    remote_description_applied_ = true;

    if (reply) {
        signaling_.send(SignalingMessage::answer(local_id_, remote_peer_id(), connection_id_, *reply));
        BOOST_LOG_TRIVIAL(info) << "Negotiator: Answer sent to '" << remote_peer_id() << "'";
    }
}

std::shared_ptr<network::DataChannel> Negotiator::await_channel(Clock::time_point deadline) {
    for (;;) {
        NegotiationEvent event = next_event(deadline, "waiting for the data channel to open");
        handle_event(event, nullptr);
        if (channel_) {
            BOOST_LOG_TRIVIAL(info) << "Negotiator: Data channel '" << channel_->label() << "' open";
            return channel_;
        }
    }
}

//==============================================
// EVENT HANDLING
//==============================================

NegotiationEvent Negotiator::next_event(Clock::time_point deadline, const std::string& waiting_for) {
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
    if (remaining.count() <= 0) {
        throw NegotiationTimeout(waiting_for);
    }

    NegotiationEvent event;
    switch (inbox_.consume_for(event, remaining)) {
        case network::Channel<NegotiationEvent>::Status::ITEM:
            return event;
        case network::Channel<NegotiationEvent>::Status::TIMEOUT:
            throw NegotiationTimeout(waiting_for);
        case network::Channel<NegotiationEvent>::Status::CLOSED:
        default:
            throw NegotiationCancelled();
    }
}

bool Negotiator::handle_event(NegotiationEvent& event, SignalingMessage* description) {
    if (auto* signal = std::get_if<SignalingEvent>(&event)) {
        return handle_signaling(signal->message, description);
    }
    if (auto* closed = std::get_if<SignalingClosedEvent>(&event)) {
        throw signaling::ChannelClosed(closed->reason);
    }
    if (auto* local = std::get_if<LocalCandidateEvent>(&event)) {
        forward_local_candidate(local->candidate);
        return false;
    }
    if (auto* open = std::get_if<ChannelOpenEvent>(&event)) {
        if (!open->channel) {
            throw NegotiationError("engine reported an open data channel without a channel");
        }
        channel_ = open->channel;
        return false;
    }
    if (auto* failure = std::get_if<EngineFailureEvent>(&event)) {
        throw NegotiationError("WebRTC engine failure: " + failure->reason);
    }
    return false;
}

bool Negotiator::handle_signaling(const SignalingMessage& message, SignalingMessage* description) {
    const std::string remote = remote_peer_id();
    const std::string type = signaling::signaling_type_to_string(message.type);

    switch (message.type) {
        case SignalingType::OFFER:
        case SignalingType::ANSWER:
            if (description && message.type == role_->expected_remote_type() &&
                (role_->discovers_peer() || message.src == remote)) {
                *description = message;
                return true;
            }
            BOOST_LOG_TRIVIAL(warning) << "Negotiator: Ignoring unexpected " << type
                                       << " from '" << message.src << "'";
            return false;

        case SignalingType::CANDIDATE:
            if (message.src != remote || !remote_description_applied_) {
                BOOST_LOG_TRIVIAL(warning) << "Negotiator: Ignoring candidate from '" << message.src << "'";
                return false;
            }
            if (!connection_id_.empty() && message.connection_id != connection_id_) {
                BOOST_LOG_TRIVIAL(warning) << "Negotiator: Ignoring candidate for connection "
                                           << message.connection_id;
                return false;
            }
            try {
                engine_.add_ice_candidate(message.candidate);
            } catch (const std::exception& e) {
                throw NegotiationError(std::string("candidate exchange failed: ") + e.what());
            }
            BOOST_LOG_TRIVIAL(debug) << "Negotiator: Remote candidate added";
            return false;

        case SignalingType::ERROR:
            throw NegotiationError("signaling server error: " + message.reason);

        case SignalingType::EXPIRE:
            throw NegotiationError(remote.empty() ? std::string("signaling message expired")
                                                  : "peer '" + remote + "' not found");

        case SignalingType::LEAVE:
            if (!remote.empty() && message.src == remote) {
                throw NegotiationError("peer '" + message.src + "' left");
            }
            BOOST_LOG_TRIVIAL(debug) << "Negotiator: Ignoring LEAVE from '" << message.src << "'";
            return false;

        case SignalingType::ID_TAKEN:
        case SignalingType::INVALID_KEY:
            throw NegotiationError("server rejected the session (" + type + ")");

        default:
            BOOST_LOG_TRIVIAL(debug) << "Negotiator: Ignoring " << type;
            return false;
    }
}

void Negotiator::forward_local_candidate(const network::IceCandidate& candidate) {
    const std::string remote = remote_peer_id();
    if (remote.empty() || connection_id_.empty()) {
        BOOST_LOG_TRIVIAL(debug) << "Negotiator: Dropping local candidate, no peer yet";
        return;
    }
    signaling_.send(SignalingMessage::ice_candidate(local_id_, remote, connection_id_, candidate));
    BOOST_LOG_TRIVIAL(debug) << "Negotiator: Local candidate sent";
}

//==============================================
// STATE CONTROL
//==============================================

void Negotiator::transition(State next) {
    StateObserver observer;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        const State current = state_.get_state();
        if (!state_.transition_to(next)) {
            throw NegotiationError("illegal transition " + NegotiationState::state_to_string(current) +
                                   " -> " + NegotiationState::state_to_string(next));
        }
        observer = observer_;
    }
    BOOST_LOG_TRIVIAL(debug) << "Negotiator: " << NegotiationState::state_to_string(next);
    if (observer) {
        observer(next);
    }
}

void Negotiator::fail(const std::string& reason) {
    StateObserver observer;
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (!state_.transition_to(State::FAILED)) {
            return;
        }
        failure_reason_ = reason;
        observer = observer_;
    }
    if (observer) {
        observer(State::FAILED);
    }
}

} // namespace negotiation
} // namespace peerdrop
