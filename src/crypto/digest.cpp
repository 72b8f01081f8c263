#include "crypto/digest.hpp"
#include <openssl/evp.h>
#include <openssl/crypto.h>
#include <boost/log/trivial.hpp>

namespace quloud::crypto {

namespace {

// RAII wrapper around the OpenSSL digest context
struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw CryptoError("Digest: Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

Bytes digest_parts(const uint8_t* first, std::size_t first_len,
                   const uint8_t* second, std::size_t second_len) {
  DigestContext context;

  // Initialize the context with SHA-256 algorithm
  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw CryptoError("Digest: Failed to initialize hash context");
  }

  // Feed the inputs in order; empty parts are skipped
  if (first_len > 0 && !EVP_DigestUpdate(context.get(), first, first_len)) {
    throw CryptoError("Digest: Failed to update hash");
  }
  if (second_len > 0 && !EVP_DigestUpdate(context.get(), second, second_len)) {
    throw CryptoError("Digest: Failed to update hash");
  }

  Bytes hash(EVP_MAX_MD_SIZE);
  unsigned int hash_len = 0;
  if (!EVP_DigestFinal_ex(context.get(), hash.data(), &hash_len)) {
    throw CryptoError("Digest: Failed to finalize hash");
  }
  hash.resize(hash_len);
  return hash;
}

} // namespace

Bytes sha256(const Bytes& first, const Bytes& second) {
  return digest_parts(first.data(), first.size(), second.data(), second.size());
}

std::string sha256_hex(const std::string& text) {
  auto hash = digest_parts(reinterpret_cast<const uint8_t*>(text.data()), text.size(), nullptr, 0);
  return utils::to_hex(hash);
}

bool constant_time_equal(const Bytes& lhs, const Bytes& rhs) {
  if (lhs.size() != rhs.size()) {
    return false;
  }
  if (lhs.empty()) {
    return true;
  }
  return CRYPTO_memcmp(lhs.data(), rhs.data(), lhs.size()) == 0;
}

} // namespace quloud::crypto
