#ifndef PEERDROP_SIGNALING_SERVER_URL_HPP
#define PEERDROP_SIGNALING_SERVER_URL_HPP

#include <cstdint>
#include <string>

namespace peerdrop {
namespace signaling {

// ws:// or wss:// endpoint split into its connection parts.
// A bare "host[:port]" is taken as wss.
struct ServerUrl {
    bool secure = true;
    std::string host;
    uint16_t port = 443;
    // Path plus query, empty when the URL has neither
    std::string target;

    // Throws SignalingError on unsupported schemes, empty hosts or bad ports
    static ServerUrl parse(const std::string& text);

    // Value for the HTTP Host header, port omitted when it is the default
    std::string host_header() const;
    std::string request_target() const { return target.empty() ? "/" : target; }
    std::string to_string() const;
};

} // namespace signaling
} // namespace peerdrop

#endif // PEERDROP_SIGNALING_SERVER_URL_HPP
