#ifndef PEERDROP_FILE_SENDER_HPP
#define PEERDROP_FILE_SENDER_HPP

#include "store/file_source.hpp"
#include "transfer/transfer_protocol.hpp"

namespace peerdrop {
namespace transfer {

// Sending half of the transfer protocol:
// FileInfoEnc -> wait Ready -> chunks 0..n-1 -> Done -> wait Done echo.
// The engine must carry this session's salt.
class FileSender : public TransferProtocol {
public:
    FileSender(std::shared_ptr<network::DataChannel> channel,
               const crypto::CryptoEngine& engine, TransferConfig config);

    // Returns the metadata announced to the receiver. Throws TransferError,
    // CryptoError or IoError after a best-effort Error to the peer.
    FileMetadata send(store::FileSource& source);

private:
    void send_metadata(const FileMetadata& metadata);
    void await_ready();
    void stream_chunks(const FileMetadata& metadata, store::FileSource& source);
    void await_completion();

    // Blocks while the channel buffer is above max_buffered_bytes
    void wait_for_buffer();
    void drain_inbound();
    void handle_while_streaming(const Frame& frame);
};

} // namespace transfer
} // namespace peerdrop

#endif // PEERDROP_FILE_SENDER_HPP
