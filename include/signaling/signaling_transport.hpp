#ifndef PEERDROP_SIGNALING_TRANSPORT_HPP
#define PEERDROP_SIGNALING_TRANSPORT_HPP

#include <chrono>
#include <functional>
#include <string>

namespace peerdrop {
namespace signaling {

// Text-frame duplex connection to the signaling server (a WebSocket in
// production). Handlers are called from the transport's own thread.
class SignalingTransport {
public:
    using TextHandler = std::function<void(const std::string&)>;
    using CloseHandler = std::function<void(const std::string& reason)>;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~SignalingTransport() = default;


    // ---- CONNECTION CONTROL ----
    // Blocks until connected; returns false with a reason on failure
    virtual bool open(const std::string& url, std::chrono::milliseconds timeout,
                      std::string& error) = 0;
    virtual bool send_text(const std::string& text) = 0;
    virtual void close() = 0;
    virtual bool is_open() const = 0;


    // ---- GETTERS AND SETTERS ----
    // Install before open()
    virtual void set_text_handler(TextHandler handler) = 0;
    virtual void set_close_handler(CloseHandler handler) = 0;

protected:
    SignalingTransport() = default;
};

} // namespace signaling
} // namespace peerdrop

#endif // PEERDROP_SIGNALING_TRANSPORT_HPP
