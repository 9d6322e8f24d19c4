#ifndef PEERDROP_SENDER_SESSION_HPP
#define PEERDROP_SENDER_SESSION_HPP

#include <filesystem>
#include <string>
#include "crypto/crypto_engine.hpp"
#include "session/session.hpp"
#include "transfer/file_metadata.hpp"

namespace peerdrop {
namespace session {

// Shares one file: registers under a peer id, waits for the receiver's
// offer, then streams the file over the negotiated data channel.
class SenderSession : public Session {
public:
    // A fresh key and nonce salt are generated per session
    SenderSession(SessionConfig config, SessionFactories factories);
    ~SenderSession() override;

    // Blocks until the receiver confirmed the whole file. An empty peer_id
    // picks a generated one. Throws SessionCancelled after cancel().
    transfer::FileMetadata run(const std::filesystem::path& file, const std::string& peer_id = "");

    // What the receiver needs besides the peer id
    std::string key_base64() const;
    const std::string& peer_id() const { return peer_id_; }

protected:
    void on_negotiation_state(negotiation::NegotiationState::State state, const std::string& local_id) override;

private:
    crypto::CryptoEngine::Key key_;
    crypto::CryptoEngine::Salt salt_;
    std::string peer_id_;
};

} // namespace session
} // namespace peerdrop

#endif // PEERDROP_SENDER_SESSION_HPP
