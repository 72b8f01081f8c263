#include "crypto/cipher.hpp"
#include <openssl/evp.h>
#include <openssl/err.h>
#include <openssl/rand.h>
#include <boost/log/trivial.hpp>

namespace quloud::crypto {

//=================================================
// RAII WRAPPER TO MANAGE CIPHER CONTEXT LIFECYCLE
//=================================================

namespace {

struct CipherContext {
  EVP_CIPHER_CTX* ctx = nullptr;

  // Initialize new cipher context
  CipherContext() {
    ctx = EVP_CIPHER_CTX_new();
    if (!ctx) {
      throw CryptoError("Cipher: Failed to create cipher context");
    }
  }

  ~CipherContext() {
    if (ctx) {
      EVP_CIPHER_CTX_free(ctx);
    }
  }

  CipherContext(const CipherContext&) = delete;
  CipherContext& operator=(const CipherContext&) = delete;

  // Access the underlying context
  EVP_CIPHER_CTX* get() { return ctx; }
};

} // namespace

//==============================================
// KEY GENERATION
//==============================================

Bytes random_bytes(std::size_t length) {
  Bytes buffer(length);
  if (length > 0 && RAND_bytes(buffer.data(), static_cast<int>(buffer.size())) != 1) {
    throw RandomError("Failed to generate " + std::to_string(length) + " random bytes");
  }
  return buffer;
}

Bytes AesGcmCipher::generate_key() const {
  BOOST_LOG_TRIVIAL(debug) << "Cipher: Generating " << KEY_SIZE << " byte key";
  return random_bytes(KEY_SIZE);
}

void AesGcmCipher::check_key(const Bytes& key) {
  if (key.size() != KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "Cipher: Invalid key size: " << key.size()
                             << " bytes (expected " << KEY_SIZE << " bytes)";
    throw KeyLengthError(key.size(), KEY_SIZE);
  }
}

//==============================================
// ENCRYPTION/DECRYPTION OPERATIONS
//==============================================

Bytes AesGcmCipher::encrypt(const Bytes& key, const Bytes& plaintext) const {
  check_key(key);

  // Fresh nonce for every call, written in front of the body
  Bytes output = random_bytes(NONCE_SIZE);
  output.resize(NONCE_SIZE + plaintext.size() + TAG_SIZE);

  CipherContext context;
  if (EVP_EncryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
      EVP_EncryptInit_ex(context.get(), nullptr, nullptr, key.data(), output.data()) != 1) {
    throw EncryptionError("Cipher: Failed to initialize encryption context");
  }

  int outlen = 0;
  uint8_t* body = output.data() + NONCE_SIZE;
  if (!plaintext.empty() &&
      EVP_EncryptUpdate(context.get(), body, &outlen, plaintext.data(),
                        static_cast<int>(plaintext.size())) != 1) {
    throw EncryptionError("Cipher: Failed to encrypt data");
  }

  int final_len = 0;
  if (EVP_EncryptFinal_ex(context.get(), body + outlen, &final_len) != 1) {
    throw EncryptionError("Cipher: Failed to finalize encryption");
  }

  uint8_t* tag = body + plaintext.size();
  if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_GET_TAG, static_cast<int>(TAG_SIZE), tag) != 1) {
    throw EncryptionError("Cipher: Failed to read authentication tag");
  }

  BOOST_LOG_TRIVIAL(trace) << "Cipher: Encrypted " << plaintext.size() << " bytes into "
                           << output.size() << " bytes";
  return output;
}

Bytes AesGcmCipher::decrypt(const Bytes& key, const Bytes& ciphertext) const {
  check_key(key);

  if (ciphertext.size() < OVERHEAD) {
    BOOST_LOG_TRIVIAL(warning) << "Cipher: Ciphertext too short: " << ciphertext.size() << " bytes";
    throw AuthenticationError("ciphertext shorter than nonce and tag");
  }

  const uint8_t* nonce = ciphertext.data();
  const uint8_t* body = ciphertext.data() + NONCE_SIZE;
  const std::size_t body_size = ciphertext.size() - OVERHEAD;
  Bytes tag(ciphertext.end() - TAG_SIZE, ciphertext.end());

  CipherContext context;
  if (EVP_DecryptInit_ex(context.get(), EVP_aes_256_gcm(), nullptr, nullptr, nullptr) != 1 ||
      EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_IVLEN, static_cast<int>(NONCE_SIZE), nullptr) != 1 ||
      EVP_DecryptInit_ex(context.get(), nullptr, nullptr, key.data(), nonce) != 1) {
    throw DecryptionError("Cipher: Failed to initialize decryption context");
  }

  Bytes plaintext(body_size);
  int outlen = 0;
  if (body_size > 0 &&
      EVP_DecryptUpdate(context.get(), plaintext.data(), &outlen, body,
                        static_cast<int>(body_size)) != 1) {
    throw DecryptionError("Cipher: Failed to decrypt data");
  }

  if (EVP_CIPHER_CTX_ctrl(context.get(), EVP_CTRL_GCM_SET_TAG, static_cast<int>(TAG_SIZE), tag.data()) != 1) {
    throw DecryptionError("Cipher: Failed to set authentication tag");
  }

  // GCM verifies the tag here; any change to nonce, body or tag lands in this branch
  uint8_t final_block[EVP_MAX_BLOCK_LENGTH];
  int final_len = 0;
  if (EVP_DecryptFinal_ex(context.get(), final_block, &final_len) != 1) {
    ERR_clear_error();
    BOOST_LOG_TRIVIAL(warning) << "Cipher: Authentication tag mismatch";
    throw AuthenticationError("integrity check failed");
  }

  BOOST_LOG_TRIVIAL(trace) << "Cipher: Decrypted " << ciphertext.size() << " bytes into "
                           << plaintext.size() << " bytes";
  return plaintext;
}

} // namespace quloud::crypto
