#include "transfer/file_receiver.hpp"
#include "crypto/byte_order.hpp"
#include "transfer/transfer_error.hpp"
#include <algorithm>
#include <boost/log/trivial.hpp>

namespace peerdrop {
namespace transfer {

FileReceiver::FileReceiver(std::shared_ptr<network::DataChannel> channel,
                           const crypto::CryptoEngine& engine, TransferConfig config,
                           std::filesystem::path output_directory)
    : TransferProtocol(std::move(channel), engine, config)
    , output_directory_(std::move(output_directory)) {}

std::filesystem::path FileReceiver::receive() {
    try {
        metadata_ = await_metadata();
        const FileMetadata& metadata = *metadata_;

        // Discards the partial file on every exit but finalize()
        store::FileSink sink(output_directory_, metadata.filename);
        received_.assign(metadata.total_chunks, false);
        progress_ = TransferProgress{};
        progress_.total_bytes = metadata.size;
        progress_.total_chunks = metadata.total_chunks;

        send_control(ControlMessage::ready());
        report_progress();

        for (;;) {
            const Frame frame = next_frame(config_.idle_timeout, "waiting for the next chunk");
            if (handle_frame(frame, sink)) {
                break;
            }
        }

        const std::filesystem::path path = sink.finalize();
        try {
            send_control(ControlMessage::done());
        } catch (const ChannelLost& e) {
            // The file is complete either way
            BOOST_LOG_TRIVIAL(warning) << "Receiver: Completion not confirmed to sender: " << e.what();
        }
        BOOST_LOG_TRIVIAL(info) << "Receiver: Saved " << path.string();
        return path;
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "Receiver: " << e.what();
        notify_failure(e);
        throw;
    }
}

//==============================================
// PROTOCOL PHASES
//==============================================

FileMetadata FileReceiver::await_metadata() {
    const Frame frame = next_frame(config_.ready_timeout, "waiting for file metadata");

    if (std::holds_alternative<LegacyChunk>(frame)) {
        throw ProtocolViolation("received an unencrypted chunk");
    }
    if (const auto* chunk = std::get_if<ChunkMessage>(&frame)) {
        throw ProtocolViolation("chunk " + std::to_string(chunk->index) + " arrived before file metadata");
    }

    const auto& control = std::get<ControlMessage>(frame);
    if (control.type == ControlType::FILE_INFO) {
        throw ProtocolViolation("received unencrypted file metadata");
    }
    if (control.type != ControlType::ENCRYPTED_FILE_INFO) {
        throw ProtocolViolation("expected file metadata, got " + control_type_to_string(control.type));
    }

    // AuthFailure here means the keys differ
    const std::vector<uint8_t> plaintext = engine_.decrypt(control.ciphertext, control.nonce);
    FileMetadata metadata = FileMetadata::from_json(std::string(plaintext.begin(), plaintext.end()));
    metadata.validate();

    BOOST_LOG_TRIVIAL(info) << "Receiver: Incoming " << metadata.filename << " (" << metadata.size
                            << " bytes, " << metadata.total_chunks << " chunks)";
    return metadata;
}

bool FileReceiver::handle_frame(const Frame& frame, store::FileSink& sink) {
    if (const auto* chunk = std::get_if<ChunkMessage>(&frame)) {
        write_chunk(*chunk, sink);
        return false;
    }
    if (std::holds_alternative<LegacyChunk>(frame)) {
        throw ProtocolViolation("received an unencrypted chunk");
    }

    const auto& control = std::get<ControlMessage>(frame);
    if (control.type != ControlType::DONE) {
        throw ProtocolViolation("unexpected " + control_type_to_string(control.type) + " during transfer");
    }
    if (progress_.chunks_transferred != progress_.total_chunks) {
        throw ProtocolViolation("done after " + std::to_string(progress_.chunks_transferred) + " of " +
                                std::to_string(progress_.total_chunks) + " chunks");
    }
    return true;
}

void FileReceiver::write_chunk(const ChunkMessage& chunk, store::FileSink& sink) {
    const FileMetadata& metadata = *metadata_;
    if (chunk.index >= metadata.total_chunks) {
        throw ProtocolViolation("chunk index " + std::to_string(chunk.index) + " out of range (" +
                                std::to_string(metadata.total_chunks) + " chunks)");
    }

    // Nonce is [BE index][session salt]
    if (crypto::ByteOrder::load_big<uint64_t>(chunk.nonce.data()) != chunk.index) {
        throw ProtocolViolation("nonce of chunk " + std::to_string(chunk.index) + " does not carry its index");
    }
    crypto::CryptoEngine::Salt salt;
    std::copy(chunk.nonce.begin() + 8, chunk.nonce.end(), salt.begin());
    if (!salt_) {
        salt_ = salt;
    } else if (*salt_ != salt) {
        throw ProtocolViolation("chunk " + std::to_string(chunk.index) + " uses a different nonce salt");
    }

    if (received_[chunk.index]) {
        BOOST_LOG_TRIVIAL(debug) << "Receiver: Ignoring duplicate chunk " << chunk.index;
        return;
    }

    const std::vector<uint8_t> plaintext = engine_.decrypt(chunk.ciphertext, chunk.nonce);
    if (plaintext.size() != metadata.chunk_length(chunk.index)) {
        throw ProtocolViolation("chunk " + std::to_string(chunk.index) + " has " +
                                std::to_string(plaintext.size()) + " bytes, expected " +
                                std::to_string(metadata.chunk_length(chunk.index)));
    }

    sink.write_at(metadata.chunk_offset(chunk.index), plaintext.data(), plaintext.size());
    received_[chunk.index] = true;
    progress_.bytes_transferred += plaintext.size();
    ++progress_.chunks_transferred;

    send_control(ControlMessage::ack(chunk.index));
    BOOST_LOG_TRIVIAL(trace) << "Receiver: Chunk " << chunk.index << " written";
    report_progress();
}

} // namespace transfer
} // namespace peerdrop
