#ifndef QULOUD_NODE_STORAGE_LAYER_HPP
#define QULOUD_NODE_STORAGE_LAYER_HPP

#include <optional>
#include <string>
#include "crypto/cipher.hpp"
#include "node/key_mode.hpp"
#include "store/blob_store.hpp"
#include "store/key_vault.hpp"

namespace quloud::node {

// The storage node's own encryption layer over the bytes it is asked to keep.
// Persisted bytes are always this layer's ciphertext, never what was received.
class StorageLayer {
public:
  // Throws std::invalid_argument if keys is NodeKeyed without a node key
  StorageLayer(const crypto::Cipher& cipher, store::BlobStore& blobs,
               store::KeyVault& vault, NodeKeys keys);

  // ---- LAYER OPERATIONS ----
  // Encrypts with a fresh key (per-document) or the node key and persists.
  // Storage failures propagate.
  void seal(const std::string& blob_id, const Bytes& received);

  // Strips this layer. nullopt when the blob or its key is missing;
  // AuthenticationError propagates since it means corrupted local state.
  std::optional<Bytes> open(const std::string& blob_id) const;

  // Shreds the key first, then removes the data. Both steps are idempotent.
  // Returns whether data existed.
  bool erase(const std::string& blob_id);

  bool holds(const std::string& blob_id) const;

  KeyMode mode() const { return keys_.mode; }

private:
  const crypto::Cipher& cipher_;
  store::BlobStore& blobs_;
  store::KeyVault& vault_;
  NodeKeys keys_;

  std::optional<Bytes> key_for(const std::string& blob_id) const;
};

} // namespace quloud::node

#endif // QULOUD_NODE_STORAGE_LAYER_HPP
