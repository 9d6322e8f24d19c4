#ifndef PEERDROP_SESSION_ERROR_HPP
#define PEERDROP_SESSION_ERROR_HPP

#include <stdexcept>
#include <string>

namespace peerdrop {
namespace session {

class SessionError : public std::runtime_error {
public:
    explicit SessionError(const std::string& message)
        : std::runtime_error("Session error: " + message) {}
};

class SessionCancelled : public SessionError {
public:
    SessionCancelled()
        : SessionError("cancelled by user") {}
};

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SESSION_ERROR_HPP
