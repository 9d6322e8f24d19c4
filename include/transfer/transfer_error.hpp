#ifndef PEERDROP_TRANSFER_ERROR_HPP
#define PEERDROP_TRANSFER_ERROR_HPP

#include <stdexcept>
#include <string>

namespace peerdrop {
namespace transfer {

class TransferError : public std::runtime_error {
public:
    explicit TransferError(const std::string& message)
        : std::runtime_error("Transfer error: " + message) {}
};

// Out-of-sequence message, bad index or nonce, unencrypted data, missing chunks
class ProtocolViolation : public TransferError {
public:
    explicit ProtocolViolation(const std::string& message)
        : TransferError("protocol violation: " + message) {}
};

// The remote side sent an Error control message
class PeerAbort : public TransferError {
public:
    explicit PeerAbort(const std::string& message)
        : TransferError("peer aborted: " + message)
        , peer_message_(message) {}

    const std::string& peer_message() const { return peer_message_; }

private:
    std::string peer_message_;
};

class TransferTimeout : public TransferError {
public:
    explicit TransferTimeout(const std::string& message)
        : TransferError("timed out " + message) {}
};

class ChannelLost : public TransferError {
public:
    explicit ChannelLost(const std::string& message)
        : TransferError("data channel lost: " + message) {}
};

class TransferCancelled : public TransferError {
public:
    TransferCancelled()
        : TransferError("cancelled") {}
};

} // namespace transfer
} // namespace peerdrop

#endif // PEERDROP_TRANSFER_ERROR_HPP
