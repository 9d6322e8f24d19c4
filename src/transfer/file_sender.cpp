#include "transfer/file_sender.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>
#include <thread>

namespace peerdrop {
namespace transfer {

using Clock = std::chrono::steady_clock;

FileSender::FileSender(std::shared_ptr<network::DataChannel> channel,
                       const crypto::CryptoEngine& engine, TransferConfig config)
    : TransferProtocol(std::move(channel), engine, config) {}

FileMetadata FileSender::send(store::FileSource& source) {
    const FileMetadata metadata = FileMetadata::describe(source.filename(), source.size(), config_.chunk_size);
    progress_ = TransferProgress{};
    progress_.total_bytes = metadata.size;
    progress_.total_chunks = metadata.total_chunks;

    BOOST_LOG_TRIVIAL(info) << "Sender: Sending " << metadata.filename << " (" << metadata.size
                            << " bytes, " << metadata.total_chunks << " chunks)";
    try {
        send_metadata(metadata);
        await_ready();
        stream_chunks(metadata, source);
        send_control(ControlMessage::done());
        await_completion();
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Sender: " << e.what();
        notify_failure(e);
        throw;
    }

    BOOST_LOG_TRIVIAL(info) << "Sender: Transfer of " << metadata.filename << " complete";
    return metadata;
}

//==============================================
// PROTOCOL PHASES
//==============================================

void FileSender::send_metadata(const FileMetadata& metadata) {
    const std::string body = metadata.to_json();
    const auto nonce = crypto::CryptoEngine::generate_nonce();
    auto ciphertext = engine_.encrypt(reinterpret_cast<const uint8_t*>(body.data()), body.size(), nonce);
    send_control(ControlMessage::encrypted_file_info(nonce, std::move(ciphertext)));
}

void FileSender::await_ready() {
    const Frame frame = next_frame(config_.ready_timeout, "waiting for the receiver to get ready");
    const auto* control = std::get_if<ControlMessage>(&frame);
    if (!control || control->type != ControlType::READY) {
        throw ProtocolViolation(control ? "expected ready, got " + control_type_to_string(control->type)
                                        : std::string("expected ready, got a chunk"));
    }
    BOOST_LOG_TRIVIAL(info) << "Sender: Receiver is ready";
}

void FileSender::stream_chunks(const FileMetadata& metadata, store::FileSource& source) {
    for (uint64_t index = 0; index < metadata.total_chunks; ++index) {
        wait_for_buffer();

        const std::size_t expected = metadata.chunk_length(index);
        const std::vector<uint8_t> plaintext = source.read_next(expected);
        if (plaintext.size() != expected) {
            throw store::IoError("file changed while sending: chunk " + std::to_string(index) + " has " +
                                 std::to_string(plaintext.size()) + " of " + std::to_string(expected) + " bytes");
        }

        ChunkMessage chunk;
        chunk.index = index;
        chunk.nonce = engine_.chunk_nonce(index);
        chunk.ciphertext = engine_.encrypt(plaintext, chunk.nonce);
        send_chunk(chunk);

        progress_.bytes_transferred += plaintext.size();
        progress_.chunks_transferred = index + 1;
        report_progress();
        drain_inbound();
    }
}

// Done echo from the receiver, sent once its file is finalized
void FileSender::await_completion() {
    const auto deadline = Clock::now() + config_.completion_timeout;
    for (;;) {
        const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - Clock::now());
        if (remaining.count() <= 0) {
            throw TransferTimeout("waiting for the receiver to confirm completion");
        }
        const Frame frame = next_frame(remaining, "waiting for the receiver to confirm completion");
        const auto* control = std::get_if<ControlMessage>(&frame);
        if (control && control->type == ControlType::DONE) {
            return;
        }
        handle_while_streaming(frame);
    }
}

//==============================================
// FLOW CONTROL
//==============================================

void FileSender::wait_for_buffer() {
    auto last_progress = Clock::now();
    std::size_t last_buffered = channel_->buffered_amount();

    while (last_buffered > config_.max_buffered_bytes) {
        drain_inbound();
        std::this_thread::sleep_for(config_.backpressure_poll);

        const std::size_t buffered = channel_->buffered_amount();
        if (buffered < last_buffered) {
            last_progress = Clock::now();
        } else if (Clock::now() - last_progress > config_.idle_timeout) {
            throw TransferTimeout("waiting for the data channel to drain");
        }
        last_buffered = buffered;
    }
}

void FileSender::drain_inbound() {
    while (auto frame = poll_frame()) {
        handle_while_streaming(*frame);
    }
}

void FileSender::handle_while_streaming(const Frame& frame) {
    const auto* control = std::get_if<ControlMessage>(&frame);
    if (!control || control->type != ControlType::ACK) {
        throw ProtocolViolation(control ? "unexpected " + control_type_to_string(control->type) + " from receiver"
                                        : std::string("unexpected chunk from receiver"));
    }
    if (control->index >= progress_.total_chunks) {
        throw ProtocolViolation("ack for unknown chunk " + std::to_string(control->index));
    }
    ++progress_.chunks_acknowledged;
    BOOST_LOG_TRIVIAL(trace) << "Sender: Chunk " << control->index << " acknowledged";
    report_progress();
}

} // namespace transfer
} // namespace peerdrop
