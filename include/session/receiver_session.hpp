#ifndef PEERDROP_RECEIVER_SESSION_HPP
#define PEERDROP_RECEIVER_SESSION_HPP

#include <filesystem>
#include <optional>
#include <string>
#include "crypto/crypto_engine.hpp"
#include "session/session.hpp"
#include "transfer/file_metadata.hpp"

namespace peerdrop {
namespace session {

// Fetches one file from a known sender peer id with the shared key
class ReceiverSession : public Session {
public:
    ReceiverSession(SessionConfig config, SessionFactories factories, const crypto::CryptoEngine::Key& key);
    ~ReceiverSession() override;

    // Returns the path of the written file. Registers under a throwaway id.
    std::filesystem::path run(const std::string& remote_peer_id, const std::filesystem::path& output_directory);

    const std::optional<transfer::FileMetadata>& metadata() const { return metadata_; }

private:
    crypto::CryptoEngine::Key key_;
    std::optional<transfer::FileMetadata> metadata_;
};

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_RECEIVER_SESSION_HPP
