#ifndef PEERDROP_TRANSFER_MESSAGE_FRAME_HPP
#define PEERDROP_TRANSFER_MESSAGE_FRAME_HPP

#include <cstdint>
#include <string>
#include <variant>
#include <vector>
#include "crypto/crypto_engine.hpp"

namespace peerdrop {
namespace transfer {

// First byte of every data channel message
enum class FramePrefix : uint8_t {
    CONTROL = 0,
    LEGACY_CHUNK = 1,
    CHUNK = 2
};

// Control message types, JSON "type" field
enum class ControlType {
    ENCRYPTED_FILE_INFO,
    // Plaintext metadata, only recognized to be rejected
    FILE_INFO,
    READY,
    ACK,
    DONE,
    ERROR
};

std::string control_type_to_string(ControlType type);

struct ControlMessage {
    ControlType type = ControlType::READY;
    // ENCRYPTED_FILE_INFO
    std::vector<uint8_t> nonce;
    std::vector<uint8_t> ciphertext;
    // ACK
    uint64_t index = 0;
    // ERROR
    std::string message;

    static ControlMessage encrypted_file_info(const crypto::CryptoEngine::Nonce& nonce,
                                              std::vector<uint8_t> ciphertext);
    static ControlMessage ready();
    static ControlMessage ack(uint64_t index);
    static ControlMessage done();
    static ControlMessage error(const std::string& message);
};

// [2][8 byte BE index][12 byte nonce][ciphertext || 16 byte tag]
struct ChunkMessage {
    uint64_t index = 0;
    crypto::CryptoEngine::Nonce nonce{};
    std::vector<uint8_t> ciphertext;
};

// Prefix 1 frame from old senders: unencrypted, rejected by receivers
struct LegacyChunk {
    uint64_t index = 0;
};

using Frame = std::variant<ControlMessage, ChunkMessage, LegacyChunk>;

} // namespace transfer
} // namespace peerdrop

#endif // PEERDROP_TRANSFER_MESSAGE_FRAME_HPP
