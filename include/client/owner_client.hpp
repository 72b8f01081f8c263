#ifndef QULOUD_CLIENT_OWNER_CLIENT_HPP
#define QULOUD_CLIENT_OWNER_CLIENT_HPP

#include <chrono>
#include <optional>
#include <string>
#include <vector>
#include "bus/message_bus.hpp"
#include "client/response_tracker.hpp"
#include "crypto/cipher.hpp"
#include "proof/proof_engine.hpp"
#include "protocol/codec.hpp"
#include "store/blob_store.hpp"
#include "store/key_vault.hpp"

namespace quloud::client {

// Owner side of the protocol. The owner encrypts every blob under its own
// fresh key (the owner layer), keeps that ciphertext and key locally, and
// only ever sends the owner-layer ciphertext to storage nodes.
//
// The constructor subscribes to the three response destinations; stop the
// bus before destroying the client. Pending responses it hands out must not
// outlive it.
class OwnerClient {
public:
  static constexpr std::size_t SEED_SIZE = 32;

  OwnerClient(const crypto::Cipher& cipher, store::BlobStore& blobs, store::KeyVault& vault,
              bus::MessageBus& bus, bus::Destinations destinations = bus::Destinations{});

  OwnerClient(const OwnerClient&) = delete;
  OwnerClient& operator=(const OwnerClient&) = delete;


  // ---- STORE ----
  // Encrypts locally, persists ciphertext and key, then publishes `replicas`
  // store requests carrying the same ciphertext. One pending acknowledgement
  // per request; replicas == 0 stores locally only.
  std::vector<PendingResponse<protocol::StoreResponse>> store_blob(const std::string& blob_id, const Bytes& data,
                                                                   std::size_t replicas);


  // ---- RETRIEVE ----
  // Local decrypt. node_id is empty; found is false when blob or key is missing.
  protocol::RetrieveResponse retrieve_blob(const std::string& blob_id) const;
  // Asks one storage node for its copy; the data in the answer is owner-layer ciphertext
  PendingResponse<protocol::RetrieveResponse> fetch_remote(const std::string& blob_id);
  // Repairs the local copy from a remote one. False on timeout, not found,
  // or a remote copy that does not open under the local key.
  bool restore_blob(const std::string& blob_id, std::chrono::milliseconds timeout);


  // ---- PROOF OF STORAGE ----
  PendingResponse<protocol::ProofResponse> request_proof(const std::string& blob_id, const Bytes& seed);
  // Proof a node holding blob_id must return for seed, computed from the local copy
  std::optional<Bytes> expected_proof(const std::string& blob_id, const Bytes& seed) const;
  bool verify_proof(const protocol::ProofResponse& response, const Bytes& seed) const;
  static Bytes generate_seed();


  // ---- DELETE ----
  // Shreds the local key, removes the local blob and broadcasts an anonymous delete
  void delete_blob(const std::string& blob_id);

private:
  const crypto::Cipher& cipher_;
  store::BlobStore& blobs_;
  store::KeyVault& vault_;
  bus::MessageBus& bus_;
  bus::Destinations destinations_;
  proof::ProofEngine proof_engine_;

  ResponseTracker<protocol::StoreResponse> store_responses_;
  ResponseTracker<protocol::RetrieveResponse> retrieve_responses_;
  ResponseTracker<protocol::ProofResponse> proof_responses_;

  template <typename Response>
  void on_response(const Bytes& raw, ResponseTracker<Response>& tracker);
};

} // namespace quloud::client

#endif // QULOUD_CLIENT_OWNER_CLIENT_HPP
