#pragma once

#include <filesystem>
#include <memory>
#include <string>
#include "bus/message_bus.hpp"
#include "crypto/cipher.hpp"
#include "node/request_handlers.hpp"
#include "node/request_router.hpp"
#include "node/storage_layer.hpp"
#include "proof/proof_engine.hpp"
#include "store/file_byte_store.hpp"

namespace quloud {
namespace node {

// Wires one storage node: file stores under {root}/blobs and {root}/keys,
// the node key at {root}/node.key (node-keyed mode only), the storage layer,
// the proof engine and the four request handlers.
// Handlers are subscribed by raw pointer: stop the bus before destroying the node.
class StorageNode {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  StorageNode(std::string node_id, const std::filesystem::path& root, KeyMode mode,
              bus::MessageBus& bus, bus::Destinations destinations = bus::Destinations{});
  ~StorageNode() = default;

  StorageNode(const StorageNode&) = delete;
  StorageNode& operator=(const StorageNode&) = delete;


  // ---- INITIALIZATION ----
  // Subscribes each handler to its request destination
  void start();
  // Serves every request category from one shared channel instead
  void start_on_channel(const std::string& channel);


  // ---- GETTERS ----
  const std::string& node_id() const { return node_id_; }
  StorageLayer& layer() { return *layer_; }
  const proof::ProofEngine& proof_engine() const { return *proof_engine_; }
  RequestRouter& router() { return *router_; }

private:
  // ---- PARAMETERS ----
  std::string node_id_;
  bus::MessageBus& bus_;
  bus::Destinations destinations_;
  bool started_ = false;

  // System components
  crypto::AesGcmCipher cipher_;
  std::unique_ptr<store::FileByteStore> blob_backend_;
  std::unique_ptr<store::FileByteStore> key_backend_;
  std::unique_ptr<store::BlobStore> blobs_;
  std::unique_ptr<store::KeyVault> vault_;
  std::unique_ptr<StorageLayer> layer_;
  std::unique_ptr<proof::ProofEngine> proof_engine_;

  // Request handlers
  std::unique_ptr<StoreRequestHandler> store_handler_;
  std::unique_ptr<RetrieveRequestHandler> retrieve_handler_;
  std::unique_ptr<ProofRequestHandler> proof_handler_;
  std::unique_ptr<DeleteRequestHandler> delete_handler_;
  std::unique_ptr<RequestRouter> router_;
};

} // namespace node
} // namespace quloud
