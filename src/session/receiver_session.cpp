#include "session/receiver_session.hpp"
#include "session/peer_id.hpp"
#include "session/session_error.hpp"
#include "transfer/file_receiver.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/crypto.h>

namespace peerdrop {
namespace session {

ReceiverSession::ReceiverSession(SessionConfig config, SessionFactories factories,
                                 const crypto::CryptoEngine::Key& key)
    : Session(std::move(config), std::move(factories))
    , key_(key) {}

ReceiverSession::~ReceiverSession() {
    OPENSSL_cleanse(key_.data(), key_.size());
}

std::filesystem::path ReceiverSession::run(const std::string& remote_peer_id,
                                           const std::filesystem::path& output_directory) {
    begin_run();
    if (!is_valid_peer_id(remote_peer_id)) {
        throw SessionError("invalid peer id '" + remote_peer_id + "'");
    }
    const std::string local_id = generate_peer_id();
    BOOST_LOG_TRIVIAL(info) << "ReceiverSession: Connecting to '" << remote_peer_id
                            << "' as '" << local_id << "'";

    try {
        SessionResources resources(*this);
        auto channel = connect(resources, std::make_unique<negotiation::OffererRole>(),
                               local_id, remote_peer_id, config_.negotiation);

        crypto::CryptoEngine engine(key_);
        transfer::FileReceiver receiver(channel, engine, config_.transfer, output_directory);
        ScopedTransfer scope(*this, receiver);
        receiver.set_progress_observer([this](const transfer::TransferProgress& progress) {
            if (observer_) {
                observer_->on_progress(progress);
            }
        });

        std::filesystem::path written;
        try {
            written = receiver.receive();
        } catch (const std::exception&) {
            metadata_ = receiver.metadata();
            throw;
        }
        metadata_ = receiver.metadata();
        BOOST_LOG_TRIVIAL(info) << "ReceiverSession: Saved " << written;
        if (observer_) {
            observer_->on_complete(written);
        }
        return written;
    } catch (const std::exception& e) {
        if (cancelled()) {
            BOOST_LOG_TRIVIAL(info) << "ReceiverSession: Stopped after cancel: " << e.what();
            throw SessionCancelled();
        }
        BOOST_LOG_TRIVIAL(error) << "ReceiverSession: " << e.what();
        throw;
    }
}

} // namespace session
} // namespace peerdrop
