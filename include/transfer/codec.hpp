#ifndef PEERDROP_TRANSFER_CODEC_HPP
#define PEERDROP_TRANSFER_CODEC_HPP

#include <cstdint>
#include <vector>
#include "transfer/message_frame.hpp"

namespace peerdrop {
namespace transfer {

class Codec {
public:
  static constexpr std::size_t INDEX_SIZE = 8;
  static constexpr std::size_t CHUNK_HEADER_SIZE = 1 + INDEX_SIZE + crypto::CryptoEngine::NONCE_SIZE;
  // Header plus a bare tag, i.e. an empty plaintext
  static constexpr std::size_t MIN_CHUNK_FRAME = CHUNK_HEADER_SIZE + crypto::CryptoEngine::TAG_SIZE;


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Prefix 0 followed by the UTF-8 JSON body
  static std::vector<uint8_t> encode(const ControlMessage& message);
  static std::vector<uint8_t> encode(const ChunkMessage& chunk);
  // Throws ProtocolViolation for empty, truncated, unknown or malformed frames
  static Frame decode(const std::vector<uint8_t>& data);

private:
  // ---- DESERIALIZATION HELPERS ----
  static ControlMessage decode_control(const uint8_t* data, std::size_t length);
  static ChunkMessage decode_chunk(const uint8_t* data, std::size_t length);
};

} // namespace transfer
} // namespace peerdrop

#endif // PEERDROP_TRANSFER_CODEC_HPP
