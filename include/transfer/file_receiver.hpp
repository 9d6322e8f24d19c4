#ifndef PEERDROP_FILE_RECEIVER_HPP
#define PEERDROP_FILE_RECEIVER_HPP

#include <filesystem>
#include <optional>
#include <vector>
#include "store/file_sink.hpp"
#include "transfer/transfer_protocol.hpp"

namespace peerdrop {
namespace transfer {

// Receiving half of the transfer protocol:
// wait FileInfoEnc -> Ready -> chunks (any order) with an Ack each -> Done -> Done echo.
class FileReceiver : public TransferProtocol {
public:
    FileReceiver(std::shared_ptr<network::DataChannel> channel,
                 const crypto::CryptoEngine& engine, TransferConfig config,
                 std::filesystem::path output_directory);

    // Returns the path of the finalized file. On failure the partial file is
    // removed and the peer told, unless the failure came from the peer.
    std::filesystem::path receive();

    const std::optional<FileMetadata>& metadata() const { return metadata_; }

private:
    std::filesystem::path output_directory_;
    std::optional<FileMetadata> metadata_;
    std::optional<crypto::CryptoEngine::Salt> salt_;
    std::vector<bool> received_;

    FileMetadata await_metadata();
    // Returns true when the transfer finished
    bool handle_frame(const Frame& frame, store::FileSink& sink);
    void write_chunk(const ChunkMessage& chunk, store::FileSink& sink);
};

} // namespace transfer
} // namespace peerdrop

#endif // PEERDROP_FILE_RECEIVER_HPP
