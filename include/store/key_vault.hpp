#ifndef QULOUD_STORE_KEY_VAULT_HPP
#define QULOUD_STORE_KEY_VAULT_HPP

#include <optional>
#include <string>
#include "store/byte_store.hpp"

namespace quloud {
namespace store {

// Per-document key storage with crypto erasure.
class KeyVault {
public:
  explicit KeyVault(ByteStore& backend);

  // ---- KEY OPERATIONS ----
  // Associates key with blob_id, replacing any previous key.
  // Throws crypto::KeyLengthError for keys that are not 32 bytes.
  void store_key(const std::string& blob_id, const Bytes& key);

  // nullopt when no key is held for blob_id
  std::optional<Bytes> retrieve_key(const std::string& blob_id) const;

  // Shreds the key: the record is first overwritten in place with fresh
  // random bytes of the same length and only then removed. A missing key is
  // a no-op. If the overwrite fails the record is left in place and
  // StoreError propagates.
  void delete_key(const std::string& blob_id);

  bool has_key(const std::string& blob_id) const;

private:
  ByteStore& backend_;
};

} // namespace store
} // namespace quloud

#endif // QULOUD_STORE_KEY_VAULT_HPP
