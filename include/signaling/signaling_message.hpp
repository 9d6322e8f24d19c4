#ifndef PEERDROP_SIGNALING_MESSAGE_HPP
#define PEERDROP_SIGNALING_MESSAGE_HPP

#include <string>
#include "network/rtc_engine.hpp"

namespace peerdrop {
namespace signaling {

enum class SignalingType {
    OPEN,
    OFFER,
    ANSWER,
    CANDIDATE,
    ERROR,
    LEAVE,
    ID_TAKEN,
    INVALID_KEY,
    EXPIRE,
    HEARTBEAT
};

// Wire names as used by PeerJS servers ("ID-TAKEN", "OFFER", ...)
std::string signaling_type_to_string(SignalingType type);

// One PeerJS frame. Only the fields belonging to the frame type are
// meaningful; the rest stay empty.
struct SignalingMessage {
    SignalingType type = SignalingType::HEARTBEAT;
    std::string src;
    std::string dst;
    std::string connection_id;
    // OFFER and ANSWER
    network::SessionDescription description;
    // CANDIDATE
    network::IceCandidate candidate;
    // ERROR
    std::string reason;


    // ---- CONSTRUCTION ----
    static SignalingMessage offer(const std::string& src, const std::string& dst,
                                  const std::string& connection_id,
                                  const network::SessionDescription& description);
    static SignalingMessage answer(const std::string& src, const std::string& dst,
                                   const std::string& connection_id,
                                   const network::SessionDescription& description);
    static SignalingMessage ice_candidate(const std::string& src, const std::string& dst,
                                          const std::string& connection_id,
                                          const network::IceCandidate& candidate);
    static SignalingMessage leave(const std::string& src, const std::string& dst);
    static SignalingMessage heartbeat();


    // ---- SERIALIZATION AND DESERIALIZATION ----
    std::string serialize() const;
    // Throws MalformedFrame for invalid JSON, unknown types or missing fields
    static SignalingMessage parse(const std::string& text);
};

} // namespace signaling
} // namespace peerdrop

#endif // PEERDROP_SIGNALING_MESSAGE_HPP
