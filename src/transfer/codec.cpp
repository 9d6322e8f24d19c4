#include "transfer/codec.hpp"
#include <algorithm>
#include "crypto/base64.hpp"
#include "crypto/byte_order.hpp"
#include "transfer/transfer_error.hpp"
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>

namespace peerdrop {
namespace transfer {

using json = nlohmann::json;

//==============================================
// SERIALIZATION
//==============================================

std::vector<uint8_t> Codec::encode(const ControlMessage& message) {
  json body = {{"type", control_type_to_string(message.type)}};

  switch (message.type) {
    case ControlType::ENCRYPTED_FILE_INFO:
      body["nonce"] = crypto::base64_encode(message.nonce);
      body["ciphertext"] = crypto::base64_encode(message.ciphertext);
      break;
    case ControlType::ACK:
      body["index"] = message.index;
      break;
    case ControlType::ERROR:
      body["message"] = message.message;
      break;
    case ControlType::FILE_INFO:
      throw TransferError("refusing to encode unencrypted file metadata");
    default:
      break;
  }

  const std::string text = body.dump();
  std::vector<uint8_t> frame;
  frame.reserve(1 + text.size());
  frame.push_back(static_cast<uint8_t>(FramePrefix::CONTROL));
  frame.insert(frame.end(), text.begin(), text.end());
  return frame;
}

std::vector<uint8_t> Codec::encode(const ChunkMessage& chunk) {
  std::vector<uint8_t> frame(CHUNK_HEADER_SIZE + chunk.ciphertext.size());
  frame[0] = static_cast<uint8_t>(FramePrefix::CHUNK);
  crypto::ByteOrder::store_big<uint64_t>(chunk.index, frame.data() + 1);
  std::copy(chunk.nonce.begin(), chunk.nonce.end(), frame.begin() + 1 + INDEX_SIZE);
  std::copy(chunk.ciphertext.begin(), chunk.ciphertext.end(), frame.begin() + CHUNK_HEADER_SIZE);
  return frame;
}


//==============================================
// DESERIALIZATION
//==============================================

Frame Codec::decode(const std::vector<uint8_t>& data) {
  if (data.empty()) {
    throw ProtocolViolation("empty message");
  }

  switch (static_cast<FramePrefix>(data[0])) {
    case FramePrefix::CONTROL:
      return decode_control(data.data() + 1, data.size() - 1);
    case FramePrefix::CHUNK:
      return decode_chunk(data.data(), data.size());
    case FramePrefix::LEGACY_CHUNK: {
      LegacyChunk legacy;
      if (data.size() >= 1 + INDEX_SIZE) {
        legacy.index = crypto::ByteOrder::load_big<uint64_t>(data.data() + 1);
      }
      return legacy;
    }
    default:
      throw ProtocolViolation("unknown frame prefix " + std::to_string(data[0]));
  }
}

ControlMessage Codec::decode_control(const uint8_t* data, std::size_t length) {
  json body;
  try {
    body = json::parse(data, data + length);
  } catch (const json::parse_error& e) {
    throw ProtocolViolation(std::string("control message is not valid JSON: ") + e.what());
  }

  if (!body.is_object() || !body.contains("type") || !body["type"].is_string()) {
    throw ProtocolViolation("control message without type");
  }

  const std::string type = body["type"].get<std::string>();
  ControlMessage message;

  if (type == "encrypted_file_info") {
    message.type = ControlType::ENCRYPTED_FILE_INFO;
    if (!body.contains("nonce") || !body["nonce"].is_string() ||
        !body.contains("ciphertext") || !body["ciphertext"].is_string()) {
      throw ProtocolViolation("encrypted_file_info without nonce or ciphertext");
    }
    auto nonce = crypto::base64_decode(body["nonce"].get<std::string>());
    auto ciphertext = crypto::base64_decode(body["ciphertext"].get<std::string>());
    if (!nonce || !ciphertext) {
      throw ProtocolViolation("encrypted_file_info carries invalid base64");
    }
    message.nonce = std::move(*nonce);
    message.ciphertext = std::move(*ciphertext);
  } else if (type == "file_info") {
    message.type = ControlType::FILE_INFO;
  } else if (type == "ready") {
    message.type = ControlType::READY;
  } else if (type == "ack") {
    message.type = ControlType::ACK;
    if (!body.contains("index") || !body["index"].is_number_unsigned()) {
      throw ProtocolViolation("ack without index");
    }
    message.index = body["index"].get<uint64_t>();
  } else if (type == "done") {
    message.type = ControlType::DONE;
  } else if (type == "error") {
    message.type = ControlType::ERROR;
    if (body.contains("message") && body["message"].is_string()) {
      message.message = body["message"].get<std::string>();
    }
  } else {
    throw ProtocolViolation("unknown control message type '" + type + "'");
  }

  BOOST_LOG_TRIVIAL(trace) << "Codec: Decoded control message " << type;
  return message;
}

ChunkMessage Codec::decode_chunk(const uint8_t* data, std::size_t length) {
  if (length < MIN_CHUNK_FRAME) {
    throw ProtocolViolation("chunk frame of " + std::to_string(length) + " bytes is too short");
  }

  ChunkMessage chunk;
  chunk.index = crypto::ByteOrder::load_big<uint64_t>(data + 1, length - 1);
  std::copy(data + 1 + INDEX_SIZE, data + CHUNK_HEADER_SIZE, chunk.nonce.begin());
  chunk.ciphertext.assign(data + CHUNK_HEADER_SIZE, data + length);
  return chunk;
}

} // namespace transfer
} // namespace peerdrop
