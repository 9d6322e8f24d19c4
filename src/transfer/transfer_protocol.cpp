#include "transfer/transfer_protocol.hpp"
#include "transfer/codec.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>

namespace peerdrop {
namespace transfer {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TransferProtocol::TransferProtocol(std::shared_ptr<network::DataChannel> channel,
                                   const crypto::CryptoEngine& engine, TransferConfig config)
    : channel_(std::move(channel))
    , engine_(engine)
    , config_(config) {
    if (!channel_) {
        throw TransferError("no data channel");
    }
    if (config_.chunk_size == 0 || config_.chunk_size > FileMetadata::CHUNK_SIZE) {
        throw TransferError("chunk size must be between 1 and " + std::to_string(FileMetadata::CHUNK_SIZE));
    }

    channel_->set_message_handler([this](std::vector<uint8_t> message) {
        inbox_.produce(std::move(message));
    });
    channel_->set_closed_handler([this]() {
        channel_closed_ = true;
        inbox_.close();
    });
}

TransferProtocol::~TransferProtocol() {
    channel_->set_message_handler(nullptr);
    channel_->set_closed_handler(nullptr);
}

//==============================================
// CONTROL
//==============================================

void TransferProtocol::cancel() {
    if (!cancelled_.exchange(true)) {
        BOOST_LOG_TRIVIAL(info) << "Transfer: Cancelling";
        if (channel_->is_open() && !channel_->send(Codec::encode(ControlMessage::error("cancelled by user")))) {
            BOOST_LOG_TRIVIAL(warning) << "Transfer: Could not tell the peer about the cancellation";
        }
    }
    inbox_.close();
}

//==============================================
// OUTGOING MESSAGES
//==============================================

void TransferProtocol::send_control(const ControlMessage& message) {
    if (!channel_->send(Codec::encode(message))) {
        throw ChannelLost("cannot send " + control_type_to_string(message.type));
    }
    BOOST_LOG_TRIVIAL(debug) << "Transfer: Sent " << control_type_to_string(message.type);
}

void TransferProtocol::send_chunk(const ChunkMessage& chunk) {
    if (!channel_->send(Codec::encode(chunk))) {
        throw ChannelLost("cannot send chunk " + std::to_string(chunk.index));
    }
    BOOST_LOG_TRIVIAL(trace) << "Transfer: Sent chunk " << chunk.index;
}

//==============================================
// INCOMING MESSAGES
//==============================================

Frame TransferProtocol::next_frame(std::chrono::milliseconds timeout, const std::string& waiting_for) {
    if (cancelled_) {
        throw TransferCancelled();
    }

    std::vector<uint8_t> data;
    switch (inbox_.consume_for(data, timeout)) {
        case network::Channel<std::vector<uint8_t>>::Status::ITEM:
            if (cancelled_) {
                throw TransferCancelled();
            }
            return decode_inbound(data);
        case network::Channel<std::vector<uint8_t>>::Status::TIMEOUT:
            throw TransferTimeout(waiting_for);
        case network::Channel<std::vector<uint8_t>>::Status::CLOSED:
        default:
            throw_closed();
    }
}

std::optional<Frame> TransferProtocol::poll_frame() {
    if (cancelled_) {
        throw TransferCancelled();
    }

    std::vector<uint8_t> data;
    if (inbox_.try_consume(data)) {
        return decode_inbound(data);
    }
    if (channel_closed_) {
        throw_closed();
    }
    return std::nullopt;
}

Frame TransferProtocol::decode_inbound(const std::vector<uint8_t>& data) {
    Frame frame = Codec::decode(data);
    if (const auto* control = std::get_if<ControlMessage>(&frame)) {
        BOOST_LOG_TRIVIAL(debug) << "Transfer: Received " << control_type_to_string(control->type);
        if (control->type == ControlType::ERROR) {
            throw PeerAbort(control->message.empty() ? "unspecified error" : control->message);
        }
    }
    return frame;
}

void TransferProtocol::throw_closed() {
    if (cancelled_) {
        throw TransferCancelled();
    }
    throw ChannelLost("closed by peer");
}

//==============================================
// FAILURE HANDLING
//==============================================

void TransferProtocol::notify_failure(const std::exception& error) {
    // The peer already knows, or there is nobody left to tell
    if (dynamic_cast<const PeerAbort*>(&error) || dynamic_cast<const ChannelLost*>(&error) ||
        dynamic_cast<const TransferCancelled*>(&error) || !channel_->is_open()) {
        return;
    }

    try {
        if (!channel_->send(Codec::encode(ControlMessage::error(error.what())))) {
            BOOST_LOG_TRIVIAL(warning) << "Transfer: Could not send error to peer";
        }
    } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(warning) << "Transfer: Could not send error to peer: " << e.what();
    }
}

void TransferProtocol::report_progress() {
    if (progress_observer_) {
        progress_observer_(progress_);
    }
}

} // namespace transfer
} // namespace peerdrop
