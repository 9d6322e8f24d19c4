#ifndef PEERDROP_TRANSFER_PROTOCOL_HPP
#define PEERDROP_TRANSFER_PROTOCOL_HPP

#include <atomic>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "crypto/crypto_engine.hpp"
#include "network/channel.hpp"
#include "network/data_channel.hpp"
#include "transfer/file_metadata.hpp"
#include "transfer/message_frame.hpp"
#include "transfer/progress.hpp"

namespace peerdrop {
namespace transfer {

struct TransferConfig {
    uint32_t chunk_size = FileMetadata::CHUNK_SIZE;
    // Longest silence tolerated between two inbound messages
    std::chrono::milliseconds idle_timeout{30000};
    std::chrono::milliseconds ready_timeout{30000};
    // Sender wait for the receiver's Done echo
    std::chrono::milliseconds completion_timeout{30000};
    // Sender pauses while the data channel holds more than this
    std::size_t max_buffered_bytes = 1024 * 1024;
    std::chrono::milliseconds backpressure_poll{5};
};

// Common plumbing for both transfer roles: an inbox fed by the data
// channel, frame decoding, and the Error message sent on fatal failure.
class TransferProtocol {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    TransferProtocol(std::shared_ptr<network::DataChannel> channel,
                     const crypto::CryptoEngine& engine, TransferConfig config);
    virtual ~TransferProtocol();

    TransferProtocol(const TransferProtocol&) = delete;
    TransferProtocol& operator=(const TransferProtocol&) = delete;


    // ---- CONTROL ----
    // Safe from any thread; the running transfer throws TransferCancelled
    void cancel();
    bool cancelled() const { return cancelled_; }
    void set_progress_observer(ProgressObserver observer) { progress_observer_ = std::move(observer); }

protected:
    // ---- PARAMETERS ----
    std::shared_ptr<network::DataChannel> channel_;
    const crypto::CryptoEngine& engine_;
    TransferConfig config_;
    TransferProgress progress_;


    // ---- OUTGOING MESSAGES ----
    // Throw ChannelLost when the channel refuses the message
    void send_control(const ControlMessage& message);
    void send_chunk(const ChunkMessage& chunk);


    // ---- INCOMING MESSAGES ----
    // Blocks for the next frame. A peer Error becomes PeerAbort.
    // Throws TransferTimeout, ChannelLost, TransferCancelled, ProtocolViolation.
    Frame next_frame(std::chrono::milliseconds timeout, const std::string& waiting_for);
    // Non-blocking variant, nullopt when nothing is queued
    std::optional<Frame> poll_frame();


    // ---- FAILURE HANDLING ----
    // Best-effort Error message for failures that did not come from the peer
    void notify_failure(const std::exception& error);
    void report_progress();

private:
    network::Channel<std::vector<uint8_t>> inbox_;
    std::atomic<bool> cancelled_{false};
    std::atomic<bool> channel_closed_{false};
    ProgressObserver progress_observer_;

    Frame decode_inbound(const std::vector<uint8_t>& data);
    [[noreturn]] void throw_closed();
};

} // namespace transfer
} // namespace peerdrop

#endif // PEERDROP_TRANSFER_PROTOCOL_HPP
