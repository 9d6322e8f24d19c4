#ifndef PEERDROP_NETWORK_DATA_CHANNEL_HPP
#define PEERDROP_NETWORK_DATA_CHANNEL_HPP

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace peerdrop {
namespace network {

// Reliable, ordered, message-preserving byte channel between the two peers.
// Implementations deliver inbound messages on their own threads.
class DataChannel {
public:
    using MessageHandler = std::function<void(std::vector<uint8_t>)>;
    using ClosedHandler = std::function<void()>;


    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~DataChannel() = default;


    // ---- OUTGOING DATA ----
    // Returns false when the channel is closed or the message was refused
    virtual bool send(const std::vector<uint8_t>& message) = 0;
    // Bytes queued locally but not yet handed to the network
    virtual std::size_t buffered_amount() const = 0;


    // ---- CHANNEL CONTROL ----
    virtual bool is_open() const = 0;
    virtual void close() = 0;
    virtual std::string label() const = 0;


    // ---- GETTERS AND SETTERS ----
    // Messages received before a handler is installed are queued and
    // replayed to it
    virtual void set_message_handler(MessageHandler handler) = 0;
    virtual void set_closed_handler(ClosedHandler handler) = 0;

protected:
    DataChannel() = default;
};

} // namespace network
} // namespace peerdrop

#endif // PEERDROP_NETWORK_DATA_CHANNEL_HPP
