#ifndef PEERDROP_TRANSFER_PROGRESS_HPP
#define PEERDROP_TRANSFER_PROGRESS_HPP

#include <cstdint>
#include <functional>

namespace peerdrop {
namespace transfer {

struct TransferProgress {
    uint64_t total_bytes = 0;
    uint64_t total_chunks = 0;
    // Sent by the sender, written by the receiver
    uint64_t bytes_transferred = 0;
    uint64_t chunks_transferred = 0;
    // Sender only, from Ack messages
    uint64_t chunks_acknowledged = 0;

    bool complete() const { return chunks_transferred == total_chunks; }
};

using ProgressObserver = std::function<void(const TransferProgress&)>;

} // namespace transfer
} // namespace peerdrop

#endif // PEERDROP_TRANSFER_PROGRESS_HPP
