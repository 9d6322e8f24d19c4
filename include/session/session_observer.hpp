#ifndef PEERDROP_SESSION_OBSERVER_HPP
#define PEERDROP_SESSION_OBSERVER_HPP

#include <filesystem>
#include <string>
#include "negotiation/negotiation_state.hpp"
#include "transfer/progress.hpp"

namespace peerdrop {
namespace session {

// Presentation hooks. Called on the session thread; every hook is optional.
class SessionObserver {
public:
    virtual ~SessionObserver() = default;

    virtual void on_negotiation_state(negotiation::NegotiationState::State) {}
    // Sender only: what the user must pass to the receiver
    virtual void on_share_details(const std::string& /*peer_id*/, const std::string& /*key_base64*/) {}
    virtual void on_connected(const std::string& /*remote_peer_id*/) {}
    virtual void on_progress(const transfer::TransferProgress&) {}
    virtual void on_complete(const std::filesystem::path& /*path*/) {}
};

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SESSION_OBSERVER_HPP
