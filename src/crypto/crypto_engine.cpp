#include "crypto/crypto_engine.hpp"
#include "crypto/base64.hpp"
#include "crypto/byte_order.hpp"
#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <algorithm>
#include <boost/algorithm/string/trim.hpp>
#include <boost/log/trivial.hpp>

namespace peerdrop::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

namespace {

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw InitializationError("Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  EVP_CIPHER_CTX* get() { return ctx; }
};

template<size_t N>
std::array<uint8_t, N> random_array(const char* what) {
  std::array<uint8_t, N> bytes;
  if (RAND_bytes(bytes.data(), static_cast<int>(bytes.size())) != 1) {
    throw InitializationError(std::string("Failed to generate random ") + what);
  }
  return bytes;
}

// EVP wants a valid pointer even for zero length input
const uint8_t kEmpty = 0;

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CryptoEngine::CryptoEngine(const Key& key)
  : key_(key) {
  BOOST_LOG_TRIVIAL(debug) << "Crypto engine: Initialized for decryption";
}

CryptoEngine::CryptoEngine(const Key& key, const Salt& salt)
  : key_(key)
  , salt_(salt) {
  BOOST_LOG_TRIVIAL(debug) << "Crypto engine: Initialized with session salt";
}

CryptoEngine::~CryptoEngine() {
  OPENSSL_cleanse(key_.data(), key_.size());
  OPENSSL_cleanse(salt_.data(), salt_.size());
}

//==============================================
// KEY AND NONCE MATERIAL
//==============================================

CryptoEngine::Key CryptoEngine::generate_key() {
  return random_array<KEY_SIZE>("key");
}

CryptoEngine::Salt CryptoEngine::generate_salt() {
  return random_array<SALT_SIZE>("salt");
}

CryptoEngine::Nonce CryptoEngine::generate_nonce() {
  return random_array<NONCE_SIZE>("nonce");
}

CryptoEngine::Nonce CryptoEngine::chunk_nonce(uint64_t index, const Salt& salt) {
  Nonce nonce;
  ByteOrder::store_big<uint64_t>(index, nonce.data());
  std::copy(salt.begin(), salt.end(), nonce.begin() + sizeof(uint64_t));
  return nonce;
}

CryptoEngine::Nonce CryptoEngine::chunk_nonce(uint64_t index) const {
  return chunk_nonce(index, salt_);
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

std::vector<uint8_t> CryptoEngine::encrypt(const uint8_t* plaintext, size_t length,
                                           const Nonce& nonce) const {
  CipherContext context;

  if (EVP_EncryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
      EVP_EncryptInit_ex(context.get(), nullptr, nullptr, key_.data(), nonce.data()) != 1) {
    throw EncryptionError("Failed to initialize AES-256-GCM context");
  }

  std::vector<uint8_t> output(length + TAG_SIZE);
  int len = 0;
  if (EVP_EncryptUpdate(context.get(), output.data(), &len,
                        length > 0 ? plaintext : &kEmpty,
                        static_cast<int>(length)) != 1) {
    throw EncryptionError("Failed to encrypt data block");
  }
  int ciphertext_len = len;

  if (EVP_EncryptFinal_ex(context.get(), output.data() + ciphertext_len, &len) != 1) {
    throw EncryptionError("Failed to finalize encryption");
  }
  ciphertext_len += len;

  if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_GET_TAG, TAG_SIZE,
                          output.data() + ciphertext_len) != 1) {
    throw EncryptionError("Failed to read authentication tag");
  }

  output.resize(static_cast<size_t>(ciphertext_len) + TAG_SIZE);
  BOOST_LOG_TRIVIAL(trace) << "Crypto engine: Encrypted " << length << " bytes";
  return output;
}

std::vector<uint8_t> CryptoEngine::encrypt(const std::vector<uint8_t>& plaintext,
                                           const Nonce& nonce) const {
  return encrypt(plaintext.data(), plaintext.size(), nonce);
}

std::vector<uint8_t> CryptoEngine::decrypt(const uint8_t* ciphertext, size_t length,
                                           const uint8_t* nonce, size_t nonce_length) const {
  if (nonce_length != NONCE_SIZE) {
    throw AuthFailure("malformed nonce length " + std::to_string(nonce_length));
  }
  if (length < TAG_SIZE) {
    throw AuthFailure("ciphertext truncated to " + std::to_string(length) + " bytes");
  }

  const size_t body_length = length - TAG_SIZE;
  std::array<uint8_t, TAG_SIZE> tag;
  std::copy(ciphertext + body_length, ciphertext + length, tag.begin());

  CipherContext context;
  if (EVP_DecryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, NONCE_SIZE, nullptr) != 1 ||
      EVP_DecryptInit_ex(context.get(), nullptr, nullptr, key_.data(), nonce) != 1) {
    throw DecryptionError("Failed to initialize AES-256-GCM context");
  }

  std::vector<uint8_t> plaintext(body_length + 1);
  int len = 0;
  if (EVP_DecryptUpdate(context.get(), plaintext.data(), &len,
                        body_length > 0 ? ciphertext : &kEmpty,
                        static_cast<int>(body_length)) != 1) {
    throw DecryptionError("Failed to decrypt data block");
  }
  int plaintext_len = len;

  if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_TAG, TAG_SIZE, tag.data()) != 1) {
    throw DecryptionError("Failed to set authentication tag");
  }

  if (EVP_DecryptFinal_ex(context.get(), plaintext.data() + plaintext_len, &len) != 1) {
    OPENSSL_cleanse(plaintext.data(), plaintext.size());
    throw AuthFailure("tag mismatch");
  }
  plaintext_len += len;

  plaintext.resize(static_cast<size_t>(plaintext_len));
  BOOST_LOG_TRIVIAL(trace) << "Crypto engine: Decrypted " << plaintext_len << " bytes";
  return plaintext;
}

std::vector<uint8_t> CryptoEngine::decrypt(const std::vector<uint8_t>& ciphertext,
                                           const std::vector<uint8_t>& nonce) const {
  return decrypt(ciphertext.data(), ciphertext.size(), nonce.data(), nonce.size());
}

std::vector<uint8_t> CryptoEngine::decrypt(const std::vector<uint8_t>& ciphertext,
                                           const Nonce& nonce) const {
  return decrypt(ciphertext.data(), ciphertext.size(), nonce.data(), nonce.size());
}

//==============================================
// KEY ENCODING
//==============================================

std::string CryptoEngine::key_to_base64(const Key& key) {
  return base64_encode(key.data(), key.size());
}

CryptoEngine::Key CryptoEngine::key_from_base64(const std::string& encoded) {
  auto bytes = base64_decode(boost::algorithm::trim_copy(encoded));
  if (!bytes) {
    BOOST_LOG_TRIVIAL(error) << "Crypto engine: Key is not valid base64";
    throw InitializationError("Invalid base64 key");
  }
  if (bytes->size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Crypto engine: Invalid key size: " << bytes->size()
                             << " bytes (expected " << KEY_SIZE << " bytes)";
    throw InitializationError("Invalid key length: expected " + std::to_string(KEY_SIZE) +
                              " bytes, got " + std::to_string(bytes->size()));
  }

  Key key;
  std::copy(bytes->begin(), bytes->end(), key.begin());
  OPENSSL_cleanse(bytes->data(), bytes->size());
  return key;
}

} // namespace peerdrop::crypto
