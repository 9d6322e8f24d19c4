#include "signaling/server_url.hpp"
#include "signaling/signaling_error.hpp"
#include <cctype>

namespace peerdrop {
namespace signaling {

ServerUrl ServerUrl::parse(const std::string& text) {
    ServerUrl url;
    std::string rest = text;

    const auto scheme_end = rest.find("://");
    if (scheme_end != std::string::npos) {
        const std::string scheme = rest.substr(0, scheme_end);
        if (scheme == "wss" || scheme == "https") {
            url.secure = true;
        } else if (scheme == "ws" || scheme == "http") {
            url.secure = false;
        } else {
            throw SignalingError("unsupported URL scheme '" + scheme + "'");
        }
        rest = rest.substr(scheme_end + 3);
    }
    url.port = url.secure ? 443 : 80;

    const auto target_start = rest.find_first_of("/?");
    std::string authority = rest.substr(0, target_start);
    if (target_start != std::string::npos) {
        url.target = rest.substr(target_start);
        if (url.target.front() == '?') {
            url.target.insert(0, "/");
        }
    }

    // [v6addr]:port or host:port
    std::string port_text;
    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string::npos) {
            throw SignalingError("unterminated IPv6 address in '" + text + "'");
        }
        url.host = authority.substr(1, close - 1);
        if (close + 1 < authority.size()) {
            if (authority[close + 1] != ':') {
                throw SignalingError("invalid authority in '" + text + "'");
            }
            port_text = authority.substr(close + 2);
        }
    } else {
        const auto colon = authority.find(':');
        url.host = authority.substr(0, colon);
        if (colon != std::string::npos) {
            port_text = authority.substr(colon + 1);
        }
    }

    if (url.host.empty()) {
        throw SignalingError("missing host in '" + text + "'");
    }

    if (!port_text.empty() || authority.back() == ':') {
        if (port_text.empty() || port_text.size() > 5) {
            throw SignalingError("invalid port in '" + text + "'");
        }
        unsigned long value = 0;
        for (char c : port_text) {
            if (!std::isdigit(static_cast<unsigned char>(c))) {
                throw SignalingError("invalid port in '" + text + "'");
            }
            value = value * 10 + static_cast<unsigned long>(c - '0');
        }
        if (value == 0 || value > 65535) {
            throw SignalingError("port out of range in '" + text + "'");
        }
        url.port = static_cast<uint16_t>(value);
    }

    return url;
}

std::string ServerUrl::host_header() const {
    const std::string name = host.find(':') != std::string::npos ? "[" + host + "]" : host;
    const uint16_t default_port = secure ? 443 : 80;
    if (port == default_port) {
        return name;
    }
    return name + ":" + std::to_string(port);
}

std::string ServerUrl::to_string() const {
    return std::string(secure ? "wss://" : "ws://") + host_header() + request_target();
}

} // namespace signaling
} // namespace peerdrop
