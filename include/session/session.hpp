#ifndef PEERDROP_SESSION_HPP
#define PEERDROP_SESSION_HPP

#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include "negotiation/negotiation_role.hpp"
#include "negotiation/negotiator.hpp"
#include "network/data_channel.hpp"
#include "network/rtc_engine.hpp"
#include "session/session_config.hpp"
#include "session/session_observer.hpp"
#include "signaling/signaling_channel.hpp"
#include "transfer/transfer_protocol.hpp"

namespace peerdrop {
namespace session {

class Session;

// Everything one session opens. Released in reverse order on every exit
// path: data channel, negotiator, engine, signaling.
class SessionResources {
public:
    explicit SessionResources(Session& owner);
    ~SessionResources();

    SessionResources(const SessionResources&) = delete;
    SessionResources& operator=(const SessionResources&) = delete;

    std::unique_ptr<signaling::SignalingChannel> signaling;
    std::unique_ptr<network::RtcEngine> engine;
    std::unique_ptr<negotiation::Negotiator> negotiator;
    std::shared_ptr<network::DataChannel> channel;

private:
    Session& owner_;
};

// Common driver for SenderSession and ReceiverSession: builds the
// collaborators, negotiates, and routes cancel() to whatever is running.
class Session {
public:
    virtual ~Session() = default;

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;


    // ---- CONTROL ----
    // Safe from any thread, e.g. a signal handler's io_context
    void cancel();
    bool cancelled() const;
    // Not owned; must outlive the session's run
    void set_observer(SessionObserver* observer) { observer_ = observer; }

protected:
    Session(SessionConfig config, SessionFactories factories);

    // Keeps cancel() pointed at a running transfer for its lifetime
    class ScopedTransfer {
    public:
        ScopedTransfer(Session& session, transfer::TransferProtocol& protocol);
        ~ScopedTransfer();

    private:
        Session& session_;
    };

    // ---- PARAMETERS ----
    SessionConfig config_;
    SessionFactories factories_;
    SessionObserver* observer_ = nullptr;


    // A session runs once; key and nonce salt are never reused.
    // Throws SessionError on a second call.
    void begin_run();

    // ---- NEGOTIATION ----
    // Opens signaling and engine into resources and negotiates a data channel
    std::shared_ptr<network::DataChannel> connect(SessionResources& resources,
                                                  std::unique_ptr<negotiation::NegotiationRole> role,
                                                  const std::string& local_id,
                                                  const std::optional<std::string>& remote_id,
                                                  const negotiation::NegotiationTimeouts& timeouts);
    // Extra per-role reaction to negotiation state changes
    virtual void on_negotiation_state(negotiation::NegotiationState::State state, const std::string& local_id);

private:
    friend class SessionResources;

    mutable std::mutex mutex_;
    bool cancelled_ = false;
    bool started_ = false;
    signaling::SignalingChannel* active_signaling_ = nullptr;
    negotiation::Negotiator* active_negotiator_ = nullptr;
    transfer::TransferProtocol* active_transfer_ = nullptr;

    void track(signaling::SignalingChannel* signaling, negotiation::Negotiator* negotiator);
    void untrack();
};

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SESSION_HPP
