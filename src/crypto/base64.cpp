#include "crypto/base64.hpp"
#include <openssl/evp.h>
#include <cctype>
#include <stdexcept>

namespace peerdrop::crypto {

namespace {

bool is_base64_char(char c) {
  return std::isalnum(static_cast<unsigned char>(c)) || c == '+' || c == '/';
}

// EVP_DecodeBlock accepts some garbage silently, so check the shape first
bool is_well_formed(const std::string& encoded) {
  if (encoded.size() % 4 != 0) {
    return false;
  }

  std::size_t padding = 0;
  for (std::size_t i = 0; i < encoded.size(); ++i) {
    char c = encoded[i];
    if (c == '=') {
      padding++;
      continue;
    }
    if (padding > 0 || !is_base64_char(c)) {
      return false;
    }
  }
  return padding <= 2;
}

} // namespace

std::string base64_encode(const uint8_t* data, size_t length) {
  if (length == 0) {
    return {};
  }

  std::string output;
  output.resize(((length + 2) / 3) * 4);
  int len = EVP_EncodeBlock(reinterpret_cast<unsigned char*>(&output[0]),
                            data,
                            static_cast<int>(length));
  if (len < 0) {
    throw std::runtime_error("Base64: EVP_EncodeBlock failed");
  }
  output.resize(static_cast<std::size_t>(len));
  return output;
}

std::string base64_encode(const std::vector<uint8_t>& data) {
  return base64_encode(data.data(), data.size());
}

std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded) {
  if (encoded.empty()) {
    return std::vector<uint8_t>();
  }
  if (!is_well_formed(encoded)) {
    return std::nullopt;
  }

  std::vector<uint8_t> output((encoded.size() / 4) * 3);
  int len = EVP_DecodeBlock(output.data(),
                            reinterpret_cast<const unsigned char*>(encoded.data()),
                            static_cast<int>(encoded.size()));
  if (len < 0) {
    return std::nullopt;
  }

  // EVP_DecodeBlock counts padding as zero bytes
  std::size_t padding = 0;
  if (encoded[encoded.size() - 1] == '=') {
    padding++;
  }
  if (encoded[encoded.size() - 2] == '=') {
    padding++;
  }
  output.resize(static_cast<std::size_t>(len) - padding);
  return output;
}

} // namespace peerdrop::crypto
