#ifndef PEERDROP_BASE64_HPP
#define PEERDROP_BASE64_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace peerdrop::crypto {

// Standard alphabet with padding, backed by OpenSSL's EVP block codec
std::string base64_encode(const uint8_t* data, size_t length);
std::string base64_encode(const std::vector<uint8_t>& data);

// Returns nullopt for anything that is not well formed padded base64
std::optional<std::vector<uint8_t>> base64_decode(const std::string& encoded);

} // namespace peerdrop::crypto

#endif // PEERDROP_BASE64_HPP
