#include "node/storage_layer.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace quloud::node {

StorageLayer::StorageLayer(const crypto::Cipher& cipher, store::BlobStore& blobs,
                           store::KeyVault& vault, NodeKeys keys)
    : cipher_(cipher), blobs_(blobs), vault_(vault), keys_(std::move(keys)) {
  if (keys_.mode == KeyMode::NodeKeyed && !keys_.node_key) {
    throw std::invalid_argument("StorageLayer: node-keyed mode requires a node key");
  }
  BOOST_LOG_TRIVIAL(debug) << "StorageLayer: Running in " << to_string(keys_.mode) << " mode";
}

//==============================================
// LAYER OPERATIONS
//==============================================

void StorageLayer::seal(const std::string& blob_id, const Bytes& received) {
  if (keys_.mode == KeyMode::PerDocument) {
    Bytes key = cipher_.generate_key();
    Bytes sealed = cipher_.encrypt(key, received);
    blobs_.store(blob_id, sealed);
    vault_.store_key(blob_id, key);
  } else {
    Bytes sealed = cipher_.encrypt(*keys_.node_key, received);
    blobs_.store(blob_id, sealed);
  }
  BOOST_LOG_TRIVIAL(debug) << "StorageLayer: Sealed blob " << blob_id << " (" << received.size() << " bytes)";
}

std::optional<Bytes> StorageLayer::open(const std::string& blob_id) const {
  auto sealed = blobs_.retrieve(blob_id);
  if (!sealed) {
    return std::nullopt;
  }

  auto key = key_for(blob_id);
  if (!key) {
    BOOST_LOG_TRIVIAL(debug) << "StorageLayer: Blob " << blob_id << " present but its key is gone";
    return std::nullopt;
  }

  try {
    return cipher_.decrypt(*key, *sealed);
  } catch (const crypto::AuthenticationError&) {
    BOOST_LOG_TRIVIAL(error) << "StorageLayer: Cannot open own layer of blob " << blob_id
                             << ", local data is corrupt";
    throw;
  }
}

bool StorageLayer::erase(const std::string& blob_id) {
  if (keys_.mode == KeyMode::PerDocument) {
    vault_.delete_key(blob_id);
  }
  bool existed = blobs_.remove(blob_id);
  BOOST_LOG_TRIVIAL(debug) << "StorageLayer: Erased blob " << blob_id << (existed ? "" : " (not present)");
  return existed;
}

bool StorageLayer::holds(const std::string& blob_id) const {
  return blobs_.exists(blob_id);
}

std::optional<Bytes> StorageLayer::key_for(const std::string& blob_id) const {
  if (keys_.mode == KeyMode::NodeKeyed) {
    return keys_.node_key;
  }
  return vault_.retrieve_key(blob_id);
}

} // namespace quloud::node
