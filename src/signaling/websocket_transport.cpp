#include "signaling/websocket_transport.hpp"
#include <future>
#include <boost/beast/http.hpp>
#include <boost/log/trivial.hpp>

namespace peerdrop {
namespace signaling {

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace ssl = boost::asio::ssl;

// Outcome of one open() call. Whoever settles first wins: the handshake
// chain on the io thread, or the caller giving up on timeout.
struct WebSocketTransport::ConnectAttempt {
    std::promise<std::string> promise;
    std::atomic<bool> settled{false};

    // Empty error means connected
    bool settle(const std::string& error) {
        if (settled.exchange(true)) {
            return false;
        }
        promise.set_value(error);
        return true;
    }
};

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

WebSocketTransport::WebSocketTransport()
    : work_guard_(boost::asio::make_work_guard(io_context_))
    , ssl_context_(ssl::context::tls_client)
    , resolver_(io_context_) {
    ssl_context_.set_default_verify_paths();
    ssl_context_.set_verify_mode(ssl::verify_peer);

    io_thread_ = std::thread([this] {
        for (;;) {
            try {
                io_context_.run();
                break;
            } catch (const std::exception& e) {
                BOOST_LOG_TRIVIAL(error) << "WebSocket: I/O loop error: " << e.what();
            }
        }
    });
    BOOST_LOG_TRIVIAL(debug) << "WebSocket: Transport created";
}

WebSocketTransport::~WebSocketTransport() {
    close();
    work_guard_.reset();
    io_context_.stop();
    if (io_thread_.joinable()) {
        io_thread_.join();
    }
    BOOST_LOG_TRIVIAL(debug) << "WebSocket: Transport destroyed";
}

//==============================================
// CONNECTION CONTROL
//==============================================

bool WebSocketTransport::open(const std::string& url, std::chrono::milliseconds timeout,
                              std::string& error) {
    if (open_) {
        error = "transport already open";
        return false;
    }

    try {
        url_ = ServerUrl::parse(url);
    } catch (const std::exception& e) {
        error = e.what();
        return false;
    }
    closing_ = false;

    BOOST_LOG_TRIVIAL(info) << "WebSocket: Connecting to " << url_.host_header()
                            << (url_.secure ? " (TLS)" : "");

    auto attempt = std::make_shared<ConnectAttempt>();
    auto result = attempt->promise.get_future();
    boost::asio::post(io_context_, [this, attempt] { start_connect(attempt); });

    if (result.wait_for(timeout) != std::future_status::ready && attempt->settle("timed out")) {
        boost::asio::post(io_context_, [this] { shutdown_socket(); });
        error = "connection to " + url_.host_header() + " timed out";
        BOOST_LOG_TRIVIAL(error) << "WebSocket: " << error;
        return false;
    }

    error = result.get();
    if (!error.empty()) {
        BOOST_LOG_TRIVIAL(error) << "WebSocket: " << error;
        return false;
    }
    return true;
}

bool WebSocketTransport::send_text(const std::string& text) {
    if (!open_) {
        return false;
    }
    auto message = std::make_shared<const std::string>(text);
    boost::asio::post(io_context_, [this, message] {
        write_queue_.push_back(message);
        if (write_queue_.size() == 1) {
            write_next();
        }
    });
    return true;
}

void WebSocketTransport::close() {
    if (closing_.exchange(true) || !open_) {
        open_ = false;
        return;
    }

    BOOST_LOG_TRIVIAL(debug) << "WebSocket: Closing connection";
    auto done = std::make_shared<std::promise<void>>();
    auto closed = done->get_future();
    boost::asio::post(io_context_, [this, done] {
        with_stream([this, done](auto& ws) {
            ws.async_close(websocket::close_code::normal, [this, done](beast::error_code ec) {
                if (ec) {
                    BOOST_LOG_TRIVIAL(debug) << "WebSocket: Close handshake failed: " << ec.message();
                }
                shutdown_socket();
                done->set_value();
            });
        });
    });

    if (closed.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
        BOOST_LOG_TRIVIAL(warning) << "WebSocket: Close handshake timed out";
        boost::asio::post(io_context_, [this] { shutdown_socket(); });
    }
    open_ = false;
    BOOST_LOG_TRIVIAL(info) << "WebSocket: Connection closed";
}

//==============================================
// GETTERS AND SETTERS
//==============================================

void WebSocketTransport::set_text_handler(TextHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    text_handler_ = std::move(handler);
}

void WebSocketTransport::set_close_handler(CloseHandler handler) {
    std::lock_guard<std::mutex> lock(handler_mutex_);
    close_handler_ = std::move(handler);
}

//==============================================
// CONNECTION SEQUENCE
//==============================================

void WebSocketTransport::start_connect(std::shared_ptr<ConnectAttempt> attempt) {
    read_buffer_.consume(read_buffer_.size());
    write_queue_.clear();

    if (url_.secure) {
        plain_.reset();
        secure_ = std::make_unique<SecureStream>(io_context_, ssl_context_);
        // SNI, required by most TLS front ends
        if (!SSL_set_tlsext_host_name(secure_->next_layer().native_handle(), url_.host.c_str())) {
            attempt->settle("failed to set TLS server name");
            return;
        }
        secure_->next_layer().set_verify_callback(ssl::host_name_verification(url_.host));
    } else {
        secure_.reset();
        plain_ = std::make_unique<PlainStream>(io_context_);
    }

    resolver_.async_resolve(url_.host, std::to_string(url_.port),
        [this, attempt](beast::error_code ec, tcp::resolver::results_type results) {
            if (ec) {
                attempt->settle("cannot resolve " + url_.host + ": " + ec.message());
                return;
            }
            on_resolved(attempt, results);
        });
}

void WebSocketTransport::on_resolved(std::shared_ptr<ConnectAttempt> attempt,
                                     tcp::resolver::results_type results) {
    with_stream([this, attempt, results](auto& ws) {
        auto& layer = beast::get_lowest_layer(ws);
        layer.async_connect(results,
            [this, attempt](beast::error_code ec, tcp::resolver::results_type::endpoint_type endpoint) {
                if (ec) {
                    attempt->settle("cannot connect to " + url_.host_header() + ": " + ec.message());
                    shutdown_socket();
                    return;
                }
                BOOST_LOG_TRIVIAL(debug) << "WebSocket: TCP connected to " << endpoint;
                on_connected(attempt);
            });
    });
}

void WebSocketTransport::on_connected(std::shared_ptr<ConnectAttempt> attempt) {
    if (!secure_) {
        start_websocket_handshake(attempt);
        return;
    }
    secure_->next_layer().async_handshake(ssl::stream_base::client,
        [this, attempt](beast::error_code ec) {
            if (ec) {
                attempt->settle("TLS handshake failed: " + ec.message());
                shutdown_socket();
                return;
            }
            start_websocket_handshake(attempt);
        });
}

void WebSocketTransport::start_websocket_handshake(std::shared_ptr<ConnectAttempt> attempt) {
    with_stream([this, attempt](auto& ws) {
        // The websocket layer keeps its own idle timeouts from here on
        beast::get_lowest_layer(ws).expires_never();
        ws.set_option(websocket::stream_base::timeout::suggested(beast::role_type::client));
        ws.set_option(websocket::stream_base::decorator([](websocket::request_type& request) {
            request.set(beast::http::field::user_agent, "peerdrop");
        }));

        ws.async_handshake(url_.host_header(), url_.request_target(),
            [this, attempt](beast::error_code ec) {
                if (ec) {
                    attempt->settle("WebSocket handshake failed: " + ec.message());
                    shutdown_socket();
                    return;
                }
                open_ = true;
                if (!attempt->settle("")) {
                    // Caller already gave up
                    open_ = false;
                    shutdown_socket();
                    return;
                }
                BOOST_LOG_TRIVIAL(info) << "WebSocket: Connected to " << url_.host_header();
                async_read_next();
            });
    });
}

//==============================================
// INCOMING AND OUTGOING FRAMES
//==============================================

void WebSocketTransport::async_read_next() {
    with_stream([this](auto& ws) {
        ws.async_read(read_buffer_, [this](beast::error_code ec, std::size_t bytes) {
            if (ec) {
                handle_disconnect(ec == websocket::error::closed ? "closed by server" : ec.message());
                return;
            }

            const std::string text = beast::buffers_to_string(read_buffer_.data());
            read_buffer_.consume(read_buffer_.size());
            BOOST_LOG_TRIVIAL(trace) << "WebSocket: Received frame of " << bytes << " bytes";

            TextHandler handler;
            {
                std::lock_guard<std::mutex> lock(handler_mutex_);
                handler = text_handler_;
            }
            if (handler) {
                try {
                    handler(text);
                } catch (const std::exception& e) {
                    BOOST_LOG_TRIVIAL(error) << "WebSocket: Text handler failed: " << e.what();
                }
            }
            async_read_next();
        });
    });
}

void WebSocketTransport::write_next() {
    if (write_queue_.empty()) {
        return;
    }
    with_stream([this](auto& ws) {
        ws.text(true);
        ws.async_write(boost::asio::buffer(*write_queue_.front()),
            [this](beast::error_code ec, std::size_t) {
                if (ec) {
                    BOOST_LOG_TRIVIAL(error) << "WebSocket: Write failed: " << ec.message();
                    write_queue_.clear();
                    handle_disconnect(ec.message());
                    return;
                }
                write_queue_.pop_front();
                if (!write_queue_.empty()) {
                    write_next();
                }
            });
    });
}

void WebSocketTransport::handle_disconnect(const std::string& reason) {
    const bool was_open = open_.exchange(false);
    shutdown_socket();
    if (!was_open || closing_) {
        return;
    }

    BOOST_LOG_TRIVIAL(warning) << "WebSocket: Connection lost: " << reason;
    CloseHandler handler;
    {
        std::lock_guard<std::mutex> lock(handler_mutex_);
        handler = close_handler_;
    }
    if (handler) {
        handler(reason);
    }
}

//==============================================
// UTILITY METHODS
//==============================================

void WebSocketTransport::shutdown_socket() {
    resolver_.cancel();
    with_stream([](auto& ws) {
        beast::error_code ec;
        auto& socket = beast::get_lowest_layer(ws).socket();
        if (socket.is_open()) {
            socket.shutdown(tcp::socket::shutdown_both, ec);
            socket.close(ec);
        }
    });
}

} // namespace signaling
} // namespace peerdrop
