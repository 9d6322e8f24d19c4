#include "transfer/message_frame.hpp"

namespace peerdrop {
namespace transfer {

std::string control_type_to_string(ControlType type) {
  switch (type) {
    case ControlType::ENCRYPTED_FILE_INFO: return "encrypted_file_info";
    case ControlType::FILE_INFO:           return "file_info";
    case ControlType::READY:               return "ready";
    case ControlType::ACK:                 return "ack";
    case ControlType::DONE:                return "done";
    case ControlType::ERROR:               return "error";
    default:                               return "unknown";
  }
}

ControlMessage ControlMessage::encrypted_file_info(const crypto::CryptoEngine::Nonce& nonce,
                                                   std::vector<uint8_t> ciphertext) {
  ControlMessage message;
  message.type = ControlType::ENCRYPTED_FILE_INFO;
  message.nonce.assign(nonce.begin(), nonce.end());
  message.ciphertext = std::move(ciphertext);
  return message;
}

ControlMessage ControlMessage::ready() {
  return ControlMessage{};
}

ControlMessage ControlMessage::ack(uint64_t index) {
  ControlMessage message;
  message.type = ControlType::ACK;
  message.index = index;
  return message;
}

ControlMessage ControlMessage::done() {
  ControlMessage message;
  message.type = ControlType::DONE;
  return message;
}

ControlMessage ControlMessage::error(const std::string& text) {
  ControlMessage message;
  message.type = ControlType::ERROR;
  message.message = text;
  return message;
}

} // namespace transfer
} // namespace peerdrop
