#include "store/key_vault.hpp"
#include "crypto/cipher.hpp"
#include <boost/log/trivial.hpp>

namespace quloud {
namespace store {

KeyVault::KeyVault(ByteStore& backend) : backend_(backend) {}

//==============================================
// KEY OPERATIONS
//==============================================

void KeyVault::store_key(const std::string& blob_id, const Bytes& key) {
  if (key.size() != crypto::AesGcmCipher::KEY_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "KeyVault: Refusing key of " << key.size() << " bytes for blob " << blob_id;
    throw crypto::KeyLengthError(key.size(), crypto::AesGcmCipher::KEY_SIZE);
  }
  backend_.put(blob_id, key);
  BOOST_LOG_TRIVIAL(debug) << "KeyVault: Stored key for blob " << blob_id;
}

std::optional<Bytes> KeyVault::retrieve_key(const std::string& blob_id) const {
  return backend_.get(blob_id);
}

void KeyVault::delete_key(const std::string& blob_id) {
  auto existing = backend_.get(blob_id);
  if (!existing) {
    BOOST_LOG_TRIVIAL(debug) << "KeyVault: No key to shred for blob " << blob_id;
    return;
  }

  Bytes noise = crypto::random_bytes(existing->size());
  if (!backend_.overwrite(blob_id, noise)) {
    // Removed by a concurrent delete between get and overwrite
    BOOST_LOG_TRIVIAL(debug) << "KeyVault: Key for blob " << blob_id << " vanished before shredding";
    return;
  }
  backend_.remove(blob_id);

  BOOST_LOG_TRIVIAL(info) << "KeyVault: Shredded key for blob " << blob_id;
}

bool KeyVault::has_key(const std::string& blob_id) const {
  return backend_.exists(blob_id);
}

} // namespace store
} // namespace quloud
