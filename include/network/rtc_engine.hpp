#ifndef PEERDROP_NETWORK_RTC_ENGINE_HPP
#define PEERDROP_NETWORK_RTC_ENGINE_HPP

#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "network/data_channel.hpp"

namespace peerdrop {
namespace network {

// SDP blob plus its type ("offer" or "answer"), relayed verbatim
struct SessionDescription {
    std::string sdp;
    std::string type;
};

struct IceCandidate {
    std::string candidate;
    std::string sdp_mid;
    std::optional<uint16_t> sdp_mline_index;
};

struct RtcConfig {
    std::vector<std::string> stun_servers{"stun:stun.l.google.com:19302"};
    // turn:user:password@host:port
    std::vector<std::string> turn_servers;
    std::string channel_label = "file-transfer";
};

// WebRTC peer connection as seen by the negotiator. ICE, DTLS and SCTP stay
// inside the implementation; handlers may fire on engine threads.
class RtcEngine {
public:
    using CandidateHandler = std::function<void(const IceCandidate&)>;
    using ChannelOpenHandler = std::function<void(std::shared_ptr<DataChannel>)>;
    using FailureHandler = std::function<void(const std::string&)>;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~RtcEngine() = default;


    // ---- DESCRIPTIONS ----
    // Creates the data channel and returns the local offer
    virtual SessionDescription create_offer() = 0;
    // Applies a remote offer and returns the local answer
    virtual SessionDescription create_answer(const SessionDescription& offer) = 0;
    // Applies a remote answer
    virtual void set_remote_description(const SessionDescription& description) = 0;


    // ---- CANDIDATES ----
    virtual void add_ice_candidate(const IceCandidate& candidate) = 0;


    // ---- EVENT HANDLERS ----
    // Install before create_offer/create_answer so no event is missed
    virtual void on_ice_candidate(CandidateHandler handler) = 0;
    virtual void on_data_channel_open(ChannelOpenHandler handler) = 0;
    virtual void on_failure(FailureHandler handler) = 0;


    // ---- TEARDOWN ----
    virtual void close() = 0;

protected:
    RtcEngine() = default;
};

} // namespace network
} // namespace peerdrop

#endif // PEERDROP_NETWORK_RTC_ENGINE_HPP
