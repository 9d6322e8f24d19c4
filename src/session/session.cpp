#include "session/session.hpp"
#include "session/session_error.hpp"
#include <boost/log/trivial.hpp>

namespace peerdrop {
namespace session {

//==============================================
// SESSION RESOURCES
//==============================================

SessionResources::SessionResources(Session& owner) : owner_(owner) {}

SessionResources::~SessionResources() {
    owner_.untrack();
    try {
        if (channel) {
            channel->close();
            channel.reset();
        }
        if (negotiator) {
            negotiator->close();
            negotiator.reset();
        }
        if (engine) {
            engine->close();
            engine.reset();
        }
        if (signaling) {
            signaling->close();
            signaling.reset();
        }
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Session: Error while releasing resources: " << e.what();
    }
    BOOST_LOG_TRIVIAL(debug) << "Session: Resources released";
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

Session::Session(SessionConfig config, SessionFactories factories)
    : config_(std::move(config))
    , factories_(std::move(factories)) {
    if (!factories_.make_transport || !factories_.make_engine) {
        throw SessionError("transport and engine factories are required");
    }
}

//==============================================
// CONTROL
//==============================================

void Session::cancel() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (cancelled_) {
        return;
    }
    cancelled_ = true;
    BOOST_LOG_TRIVIAL(info) << "Session: Cancel requested";

    if (active_transfer_) {
        active_transfer_->cancel();
        return;
    }
    if (active_negotiator_) {
        active_negotiator_->cancel();
    }
    // Unblocks a registration still waiting for the server
    if (active_signaling_) {
        active_signaling_->close();
    }
}

bool Session::cancelled() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return cancelled_;
}

void Session::begin_run() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (started_) {
        throw SessionError("session already ran");
    }
    started_ = true;
}

Session::ScopedTransfer::ScopedTransfer(Session& session, transfer::TransferProtocol& protocol)
    : session_(session) {
    std::lock_guard<std::mutex> lock(session_.mutex_);
    session_.active_transfer_ = &protocol;
    if (session_.cancelled_) {
        protocol.cancel();
    }
}

Session::ScopedTransfer::~ScopedTransfer() {
    std::lock_guard<std::mutex> lock(session_.mutex_);
    session_.active_transfer_ = nullptr;
}

//==============================================
// NEGOTIATION
//==============================================

std::shared_ptr<network::DataChannel> Session::connect(SessionResources& resources,
                                                       std::unique_ptr<negotiation::NegotiationRole> role,
                                                       const std::string& local_id,
                                                       const std::optional<std::string>& remote_id,
                                                       const negotiation::NegotiationTimeouts& timeouts) {
    resources.signaling = std::make_unique<signaling::SignalingChannel>(factories_.make_transport(),
                                                                        config_.signaling);
    resources.engine = factories_.make_engine(config_.rtc);
    if (!resources.engine) {
        throw SessionError("no WebRTC engine available");
    }

    resources.negotiator = std::make_unique<negotiation::Negotiator>(
        *resources.signaling, *resources.engine, std::move(role), timeouts);
    resources.negotiator->set_state_observer([this, local_id](negotiation::NegotiationState::State state) {
        if (observer_) {
            observer_->on_negotiation_state(state);
        }
        on_negotiation_state(state, local_id);
    });
    track(resources.signaling.get(), resources.negotiator.get());

    resources.channel = resources.negotiator->run(local_id, remote_id);
    const std::string remote = resources.negotiator->remote_peer_id();
    BOOST_LOG_TRIVIAL(info) << "Session: Connected to '" << remote << "'";
    if (observer_) {
        observer_->on_connected(remote);
    }
    return resources.channel;
}

void Session::on_negotiation_state(negotiation::NegotiationState::State, const std::string&) {}

void Session::track(signaling::SignalingChannel* signaling, negotiation::Negotiator* negotiator) {
    std::lock_guard<std::mutex> lock(mutex_);
    active_signaling_ = signaling;
    active_negotiator_ = negotiator;
    if (cancelled_) {
        negotiator->cancel();
        signaling->close();
    }
}

void Session::untrack() {
    std::lock_guard<std::mutex> lock(mutex_);
    active_signaling_ = nullptr;
    active_negotiator_ = nullptr;
}

} // namespace session
} // namespace peerdrop
