#ifndef PEERDROP_SIGNALING_WEBSOCKET_TRANSPORT_HPP
#define PEERDROP_SIGNALING_WEBSOCKET_TRANSPORT_HPP

#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <boost/asio.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/ssl.hpp>
#include <boost/beast/websocket.hpp>
#include <boost/beast/websocket/ssl.hpp>
#include "signaling/server_url.hpp"
#include "signaling/signaling_transport.hpp"

namespace peerdrop {
namespace signaling {

// Boost.Beast WebSocket client for ws:// and wss:// servers.
// All socket work runs on one io_context thread owned by the transport.
class WebSocketTransport : public SignalingTransport {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    WebSocketTransport();
    ~WebSocketTransport() override;

    WebSocketTransport(const WebSocketTransport&) = delete;
    WebSocketTransport& operator=(const WebSocketTransport&) = delete;


    // ---- CONNECTION CONTROL ----
    bool open(const std::string& url, std::chrono::milliseconds timeout,
              std::string& error) override;
    bool send_text(const std::string& text) override;
    void close() override;
    bool is_open() const override { return open_; }


    // ---- GETTERS AND SETTERS ----
    void set_text_handler(TextHandler handler) override;
    void set_close_handler(CloseHandler handler) override;

private:
    using tcp = boost::asio::ip::tcp;
    using PlainStream = boost::beast::websocket::stream<boost::beast::tcp_stream>;
    using SecureStream = boost::beast::websocket::stream<
        boost::beast::ssl_stream<boost::beast::tcp_stream>>;

    struct ConnectAttempt;

    // ---- PARAMETERS ----
    boost::asio::io_context io_context_;
    boost::asio::executor_work_guard<boost::asio::io_context::executor_type> work_guard_;
    boost::asio::ssl::context ssl_context_;
    tcp::resolver resolver_;
    std::unique_ptr<PlainStream> plain_;
    std::unique_ptr<SecureStream> secure_;
    ServerUrl url_;
    boost::beast::flat_buffer read_buffer_;
    std::deque<std::shared_ptr<const std::string>> write_queue_;
    std::thread io_thread_;
    std::atomic<bool> open_{false};
    std::atomic<bool> closing_{false};

    std::mutex handler_mutex_;
    TextHandler text_handler_;
    CloseHandler close_handler_;


    // ---- CONNECTION SEQUENCE ----
    void start_connect(std::shared_ptr<ConnectAttempt> attempt);
    void on_resolved(std::shared_ptr<ConnectAttempt> attempt, tcp::resolver::results_type results);
    void on_connected(std::shared_ptr<ConnectAttempt> attempt);
    void start_websocket_handshake(std::shared_ptr<ConnectAttempt> attempt);


    // ---- INCOMING AND OUTGOING FRAMES ----
    void async_read_next();
    void write_next();
    void handle_disconnect(const std::string& reason);


    // ---- UTILITY METHODS ----
    // Calls f with whichever stream is active
    template<typename F>
    void with_stream(F&& f) {
        if (secure_) {
            f(*secure_);
        } else if (plain_) {
            f(*plain_);
        }
    }
    void shutdown_socket();
};

} // namespace signaling
} // namespace peerdrop

#endif // PEERDROP_SIGNALING_WEBSOCKET_TRANSPORT_HPP
