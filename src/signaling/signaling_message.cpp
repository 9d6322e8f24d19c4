#include "signaling/signaling_message.hpp"
#include "signaling/signaling_error.hpp"
#include <nlohmann/json.hpp>

namespace peerdrop {
namespace signaling {

using json = nlohmann::json;

namespace {

constexpr const char* BROWSER = "peerdrop";

SignalingType type_from_string(const std::string& name) {
    if (name == "OPEN")        return SignalingType::OPEN;
    if (name == "OFFER")       return SignalingType::OFFER;
    if (name == "ANSWER")      return SignalingType::ANSWER;
    if (name == "CANDIDATE")   return SignalingType::CANDIDATE;
    if (name == "ERROR")       return SignalingType::ERROR;
    if (name == "LEAVE")       return SignalingType::LEAVE;
    if (name == "ID-TAKEN")    return SignalingType::ID_TAKEN;
    if (name == "INVALID-KEY") return SignalingType::INVALID_KEY;
    if (name == "EXPIRE")      return SignalingType::EXPIRE;
    if (name == "HEARTBEAT")   return SignalingType::HEARTBEAT;
    throw MalformedFrame("unknown type '" + name + "'");
}

const json& require(const json& object, const char* key) {
    if (!object.is_object() || !object.contains(key)) {
        throw MalformedFrame(std::string("missing field '") + key + "'");
    }
    return object.at(key);
}

std::string require_string(const json& object, const char* key) {
    const json& value = require(object, key);
    if (!value.is_string()) {
        throw MalformedFrame(std::string("field '") + key + "' is not a string");
    }
    return value.get<std::string>();
}

} // namespace

std::string signaling_type_to_string(SignalingType type) {
    switch (type) {
        case SignalingType::OPEN:        return "OPEN";
        case SignalingType::OFFER:       return "OFFER";
        case SignalingType::ANSWER:      return "ANSWER";
        case SignalingType::CANDIDATE:   return "CANDIDATE";
        case SignalingType::ERROR:       return "ERROR";
        case SignalingType::LEAVE:       return "LEAVE";
        case SignalingType::ID_TAKEN:    return "ID-TAKEN";
        case SignalingType::INVALID_KEY: return "INVALID-KEY";
        case SignalingType::EXPIRE:      return "EXPIRE";
        case SignalingType::HEARTBEAT:   return "HEARTBEAT";
        default:                         return "UNKNOWN";
    }
}

//==============================================
// CONSTRUCTION
//==============================================

SignalingMessage SignalingMessage::offer(const std::string& src, const std::string& dst,
                                         const std::string& connection_id,
                                         const network::SessionDescription& description) {
    SignalingMessage message;
    message.type = SignalingType::OFFER;
    message.src = src;
    message.dst = dst;
    message.connection_id = connection_id;
    message.description = description;
    return message;
}

SignalingMessage SignalingMessage::answer(const std::string& src, const std::string& dst,
                                          const std::string& connection_id,
                                          const network::SessionDescription& description) {
    SignalingMessage message = offer(src, dst, connection_id, description);
    message.type = SignalingType::ANSWER;
    return message;
}

SignalingMessage SignalingMessage::ice_candidate(const std::string& src, const std::string& dst,
                                                 const std::string& connection_id,
                                                 const network::IceCandidate& candidate) {
    SignalingMessage message;
    message.type = SignalingType::CANDIDATE;
    message.src = src;
    message.dst = dst;
    message.connection_id = connection_id;
    message.candidate = candidate;
    return message;
}

SignalingMessage SignalingMessage::leave(const std::string& src, const std::string& dst) {
    SignalingMessage message;
    message.type = SignalingType::LEAVE;
    message.src = src;
    message.dst = dst;
    return message;
}

SignalingMessage SignalingMessage::heartbeat() {
    return SignalingMessage{};
}

//==============================================
// SERIALIZATION
//==============================================

std::string SignalingMessage::serialize() const {
    json frame;
    frame["type"] = signaling_type_to_string(type);
    if (!src.empty()) {
        frame["src"] = src;
    }
    if (!dst.empty()) {
        frame["dst"] = dst;
    }

    switch (type) {
        case SignalingType::OFFER:
        case SignalingType::ANSWER: {
            json payload = {
                {"sdp", {{"sdp", description.sdp}, {"type", description.type}}},
                {"type", "data"},
                {"connectionId", connection_id},
                {"browser", BROWSER}
            };
            if (type == SignalingType::OFFER) {
                payload["label"] = connection_id;
                payload["reliable"] = true;
                payload["serialization"] = "binary";
            }
            frame["payload"] = payload;
            break;
        }
        case SignalingType::CANDIDATE: {
            json ice = {
                {"candidate", candidate.candidate},
                {"sdpMid", candidate.sdp_mid}
            };
            if (candidate.sdp_mline_index) {
                ice["sdpMLineIndex"] = *candidate.sdp_mline_index;
            } else {
                ice["sdpMLineIndex"] = nullptr;
            }
            frame["payload"] = {
                {"candidate", ice},
                {"type", "data"},
                {"connectionId", connection_id}
            };
            break;
        }
        case SignalingType::ERROR:
            frame["payload"] = {{"msg", reason}};
            break;
        default:
            break;
    }
    return frame.dump();
}

//==============================================
// DESERIALIZATION
//==============================================

SignalingMessage SignalingMessage::parse(const std::string& text) {
    json frame;
    try {
        frame = json::parse(text);
    } catch (const json::parse_error& e) {
        throw MalformedFrame(e.what());
    }

    SignalingMessage message;
    message.type = type_from_string(require_string(frame, "type"));

    if (frame.contains("src") && frame["src"].is_string()) {
        message.src = frame["src"].get<std::string>();
    }
    if (frame.contains("dst") && frame["dst"].is_string()) {
        message.dst = frame["dst"].get<std::string>();
    }

    try {
        switch (message.type) {
            case SignalingType::OFFER:
            case SignalingType::ANSWER: {
                const json& payload = require(frame, "payload");
                const json& sdp = require(payload, "sdp");
                message.description.sdp = require_string(sdp, "sdp");
                message.description.type = require_string(sdp, "type");
                message.connection_id = require_string(payload, "connectionId");
                if (message.src.empty()) {
                    throw MalformedFrame("missing field 'src'");
                }
                break;
            }
            case SignalingType::CANDIDATE: {
                const json& payload = require(frame, "payload");
                const json& ice = require(payload, "candidate");
                message.candidate.candidate = require_string(ice, "candidate");
                if (ice.contains("sdpMid") && ice["sdpMid"].is_string()) {
                    message.candidate.sdp_mid = ice["sdpMid"].get<std::string>();
                }
                if (ice.contains("sdpMLineIndex") && ice["sdpMLineIndex"].is_number_unsigned()) {
                    message.candidate.sdp_mline_index = ice["sdpMLineIndex"].get<uint16_t>();
                }
                message.connection_id = require_string(payload, "connectionId");
                if (message.src.empty()) {
                    throw MalformedFrame("missing field 'src'");
                }
                break;
            }
            case SignalingType::ERROR: {
                // Servers send ERROR both with and without a payload
                message.reason = "unspecified server error";
                if (frame.contains("payload") && frame["payload"].is_object()) {
                    const json& payload = frame["payload"];
                    if (payload.contains("msg") && payload["msg"].is_string()) {
                        message.reason = payload["msg"].get<std::string>();
                    }
                }
                break;
            }
            default:
                break;
        }
    } catch (const json::exception& e) {
        throw MalformedFrame(e.what());
    }

    return message;
}

} // namespace signaling
} // namespace peerdrop
