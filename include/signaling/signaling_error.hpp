#ifndef PEERDROP_SIGNALING_ERROR_HPP
#define PEERDROP_SIGNALING_ERROR_HPP

#include <stdexcept>
#include <string>

namespace peerdrop {
namespace signaling {

class SignalingError : public std::runtime_error {
public:
    explicit SignalingError(const std::string& message)
        : std::runtime_error("Signaling error: " + message) {}

protected:
    struct Raw {};
    SignalingError(Raw, const std::string& message)
        : std::runtime_error(message) {}
};

class RegistrationError : public SignalingError {
public:
    enum class Reason {
        ID_TAKEN,
        INVALID_KEY,
        SERVER_ERROR,
        UNREACHABLE,
        TIMEOUT
    };

    RegistrationError(Reason reason, const std::string& message)
        : SignalingError(Raw{}, "Registration failed (" + reason_to_string(reason) + "): " + message)
        , reason_(reason) {}

    Reason reason() const { return reason_; }

    static std::string reason_to_string(Reason reason) {
        switch (reason) {
            case Reason::ID_TAKEN:     return "id taken";
            case Reason::INVALID_KEY:  return "invalid key";
            case Reason::SERVER_ERROR: return "server error";
            case Reason::UNREACHABLE:  return "unreachable";
            case Reason::TIMEOUT:      return "timeout";
            default:                   return "unknown";
        }
    }

private:
    Reason reason_;
};

// Terminal: the connection is gone and nothing is left queued
class ChannelClosed : public SignalingError {
public:
    explicit ChannelClosed(const std::string& message)
        : SignalingError(Raw{}, "Signaling channel closed: " + message) {}
};

// Frame that is not valid JSON or matches no known shape
class MalformedFrame : public SignalingError {
public:
    explicit MalformedFrame(const std::string& message)
        : SignalingError(Raw{}, "Malformed signaling frame: " + message) {}
};

} // namespace signaling
} // namespace peerdrop

#endif // PEERDROP_SIGNALING_ERROR_HPP
