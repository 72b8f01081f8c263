#ifndef QULOUD_CRYPTO_CIPHER_HPP
#define QULOUD_CRYPTO_CIPHER_HPP

#include <cstddef>
#include <memory>
#include "crypto_error.hpp"
#include "utils/bytes.hpp"

namespace quloud::crypto {

// Authenticated symmetric encryption used for both the owner layer and the
// storage node layer. Implementations hold no mutable state.
class Cipher {
public:
  virtual ~Cipher() = default;

  // Produces a fresh random key of key_size() bytes
  virtual Bytes generate_key() const = 0;
  // Returns a self-contained ciphertext (nonce and tag included).
  // Throws KeyLengthError if key has the wrong length.
  virtual Bytes encrypt(const Bytes& key, const Bytes& plaintext) const = 0;
  // Throws AuthenticationError on a wrong key or tampered data,
  // KeyLengthError if key has the wrong length.
  virtual Bytes decrypt(const Bytes& key, const Bytes& ciphertext) const = 0;

  virtual std::size_t key_size() const = 0;
};

// AES-256-GCM over OpenSSL EVP.
// Ciphertext layout: nonce(12) || encrypted body || tag(16)
class AesGcmCipher : public Cipher {
public:
  static constexpr std::size_t KEY_SIZE = 32;     // 256 bits for AES-256
  static constexpr std::size_t NONCE_SIZE = 12;   // 96 bit GCM nonce
  static constexpr std::size_t TAG_SIZE = 16;     // 128 bit GCM tag
  static constexpr std::size_t OVERHEAD = NONCE_SIZE + TAG_SIZE;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  AesGcmCipher() = default;
  ~AesGcmCipher() override = default;


  // ---- KEY GENERATION ----
  Bytes generate_key() const override;


  // ---- ENCRYPTION/DECRYPTION OPERATIONS ----
  Bytes encrypt(const Bytes& key, const Bytes& plaintext) const override;
  Bytes decrypt(const Bytes& key, const Bytes& ciphertext) const override;


  // ---- GETTERS ----
  std::size_t key_size() const override { return KEY_SIZE; }

private:
  // Throws KeyLengthError unless key is exactly KEY_SIZE bytes
  static void check_key(const Bytes& key);
};

// Fills a buffer of the given length from the OpenSSL CSPRNG
Bytes random_bytes(std::size_t length);

} // namespace quloud::crypto

#endif // QULOUD_CRYPTO_CIPHER_HPP
