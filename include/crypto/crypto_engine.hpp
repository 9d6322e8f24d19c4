#ifndef PEERDROP_CRYPTO_ENGINE_HPP
#define PEERDROP_CRYPTO_ENGINE_HPP

#include <array>
#include <cstdint>
#include <string>
#include <vector>
#include "crypto_error.hpp"

namespace peerdrop::crypto {

// AES-256-GCM for one transfer session.
//
// Chunk nonces are [8 byte big endian chunk index][4 byte session salt], so a
// nonce never repeats within a session. Metadata uses a fresh random nonce.
// The engine keeps only the key and salt; every call builds its own cipher
// context, so one engine may be shared by concurrent chunk workers.
class CryptoEngine {
public:
  static constexpr size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr size_t NONCE_SIZE = 12;   // 96 bit GCM nonce
  static constexpr size_t TAG_SIZE = 16;     // GCM authentication tag
  static constexpr size_t SALT_SIZE = 4;     // per-session nonce salt

  using Key = std::array<uint8_t, KEY_SIZE>;
  using Nonce = std::array<uint8_t, NONCE_SIZE>;
  using Salt = std::array<uint8_t, SALT_SIZE>;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Receiving side: chunk nonces arrive with the chunks
  explicit CryptoEngine(const Key& key);
  // Sending side: salt is fixed for the whole session
  CryptoEngine(const Key& key, const Salt& salt);
  ~CryptoEngine();

  CryptoEngine(const CryptoEngine&) = delete;
  CryptoEngine& operator=(const CryptoEngine&) = delete;


  // ---- KEY AND NONCE MATERIAL ----
  static Key generate_key();
  static Salt generate_salt();
  static Nonce generate_nonce();
  static Nonce chunk_nonce(uint64_t index, const Salt& salt);
  // Chunk nonce built from this session's salt
  Nonce chunk_nonce(uint64_t index) const;
  const Salt& salt() const { return salt_; }


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  // Returns ciphertext with the 16 byte tag appended
  std::vector<uint8_t> encrypt(const uint8_t* plaintext, size_t length, const Nonce& nonce) const;
  std::vector<uint8_t> encrypt(const std::vector<uint8_t>& plaintext, const Nonce& nonce) const;
  // Throws AuthFailure; never returns partial plaintext
  std::vector<uint8_t> decrypt(const uint8_t* ciphertext, size_t length,
                               const uint8_t* nonce, size_t nonce_length) const;
  std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext,
                               const std::vector<uint8_t>& nonce) const;
  std::vector<uint8_t> decrypt(const std::vector<uint8_t>& ciphertext, const Nonce& nonce) const;


  // ---- KEY ENCODING ----
  static std::string key_to_base64(const Key& key);
  // Throws InitializationError on malformed input or wrong length
  static Key key_from_base64(const std::string& encoded);

private:
  // ---- PARAMETERS ----
  Key key_;
  Salt salt_{};
};

} // namespace peerdrop::crypto

#endif // PEERDROP_CRYPTO_ENGINE_HPP
