#include "session/sender_session.hpp"
#include "session/peer_id.hpp"
#include "session/session_error.hpp"
#include "store/file_source.hpp"
#include "transfer/file_sender.hpp"
#include <boost/log/trivial.hpp>
#include <openssl/crypto.h>

namespace peerdrop {
namespace session {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

SenderSession::SenderSession(SessionConfig config, SessionFactories factories)
    : Session(std::move(config), std::move(factories))
    , key_(crypto::CryptoEngine::generate_key())
    , salt_(crypto::CryptoEngine::generate_salt()) {}

SenderSession::~SenderSession() {
    OPENSSL_cleanse(key_.data(), key_.size());
    OPENSSL_cleanse(salt_.data(), salt_.size());
}

std::string SenderSession::key_base64() const {
    return crypto::CryptoEngine::key_to_base64(key_);
}

//==============================================
// RUN
//==============================================

transfer::FileMetadata SenderSession::run(const std::filesystem::path& file, const std::string& peer_id) {
    begin_run();

    // A missing file fails before anything touches the network
    store::FileSource source(file);

    if (peer_id.empty()) {
        peer_id_ = generate_peer_id();
    } else if (!is_valid_peer_id(peer_id)) {
        throw SessionError("invalid peer id '" + peer_id + "'");
    } else {
        peer_id_ = peer_id;
    }
    BOOST_LOG_TRIVIAL(info) << "SenderSession: Sharing '" << source.filename() << "' ("
                            << source.size() << " bytes) as '" << peer_id_ << "'";

    try {
        SessionResources resources(*this);
        auto channel = connect(resources, std::make_unique<negotiation::AnswererRole>(),
                               peer_id_, std::nullopt, config_.negotiation);

        crypto::CryptoEngine engine(key_, salt_);
        transfer::FileSender sender(channel, engine, config_.transfer);
        ScopedTransfer scope(*this, sender);
        sender.set_progress_observer([this](const transfer::TransferProgress& progress) {
            if (observer_) {
                observer_->on_progress(progress);
            }
        });

        transfer::FileMetadata metadata = sender.send(source);
        BOOST_LOG_TRIVIAL(info) << "SenderSession: Transfer of '" << metadata.filename << "' complete";
        if (observer_) {
            observer_->on_complete(source.path());
        }
        return metadata;
    } catch (const std::exception& e) {
        if (cancelled()) {
            BOOST_LOG_TRIVIAL(info) << "SenderSession: Stopped after cancel: " << e.what();
            throw SessionCancelled();
        }
        BOOST_LOG_TRIVIAL(error) << "SenderSession: " << e.what();
        throw;
    }
}

void SenderSession::on_negotiation_state(negotiation::NegotiationState::State state, const std::string& local_id) {
    if (state == negotiation::NegotiationState::State::WAITING_FOR_PEER && observer_) {
        observer_->on_share_details(local_id, key_base64());
    }
}

} // namespace session
} // namespace peerdrop
