#include "client/owner_client.hpp"
#include <boost/log/trivial.hpp>

namespace quloud::client {

using namespace quloud::protocol;

OwnerClient::OwnerClient(const crypto::Cipher& cipher, store::BlobStore& blobs, store::KeyVault& vault,
                         bus::MessageBus& bus, bus::Destinations destinations)
  : cipher_(cipher)
  , blobs_(blobs)
  , vault_(vault)
  , bus_(bus)
  , destinations_(std::move(destinations))
  , proof_engine_([this](const std::string& blob_id) { return blobs_.retrieve(blob_id); }) {

  bus_.subscribe(destinations_.store_responses,
                 [this](const Bytes& raw) { on_response(raw, store_responses_); });
  bus_.subscribe(destinations_.retrieve_responses,
                 [this](const Bytes& raw) { on_response(raw, retrieve_responses_); });
  bus_.subscribe(destinations_.proof_responses,
                 [this](const Bytes& raw) { on_response(raw, proof_responses_); });
}

template <typename Response>
void OwnerClient::on_response(const Bytes& raw, ResponseTracker<Response>& tracker) {
  try {
    tracker.fulfill(MessageCodec::decode_as<Response>(raw));
  } catch (const MessageError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Owner client: Dropping malformed response: " << e.what();
  }
}


//==============================================
// STORE
//==============================================

std::vector<PendingResponse<StoreResponse>> OwnerClient::store_blob(const std::string& blob_id, const Bytes& data,
                                                                    std::size_t replicas) {
  Bytes key = cipher_.generate_key();
  Bytes owner_layer = cipher_.encrypt(key, data);

  blobs_.store(blob_id, owner_layer);
  vault_.store_key(blob_id, key);
  BOOST_LOG_TRIVIAL(info) << "Owner client: Stored blob " << blob_id << " locally ("
                          << owner_layer.size() << " bytes encrypted)";

  std::vector<PendingResponse<StoreResponse>> acknowledgements;
  acknowledgements.reserve(replicas);
  Bytes request = MessageCodec::encode(StoreRequest{blob_id, owner_layer});
  for (std::size_t i = 0; i < replicas; ++i) {
    acknowledgements.push_back(store_responses_.expect(blob_id));
    bus_.publish(destinations_.store_requests, request);
  }

  if (replicas > 0) {
    BOOST_LOG_TRIVIAL(info) << "Owner client: Requested " << replicas << " replicas of blob " << blob_id;
  }
  return acknowledgements;
}


//==============================================
// RETRIEVE
//==============================================

RetrieveResponse OwnerClient::retrieve_blob(const std::string& blob_id) const {
  RetrieveResponse response;
  response.blob_id = blob_id;

  auto owner_layer = blobs_.retrieve(blob_id);
  auto key = vault_.retrieve_key(blob_id);
  if (!owner_layer || !key) {
    BOOST_LOG_TRIVIAL(info) << "Owner client: Blob " << blob_id << " not available locally";
    return response;
  }

  response.data = cipher_.decrypt(*key, *owner_layer);
  response.found = true;
  return response;
}

PendingResponse<RetrieveResponse> OwnerClient::fetch_remote(const std::string& blob_id) {
  auto pending = retrieve_responses_.expect(blob_id);
  bus_.publish(destinations_.retrieve_requests, MessageCodec::encode(RetrieveRequest{blob_id}));
  BOOST_LOG_TRIVIAL(debug) << "Owner client: Requested remote copy of blob " << blob_id;
  return pending;
}

bool OwnerClient::restore_blob(const std::string& blob_id, std::chrono::milliseconds timeout) {
  auto pending = fetch_remote(blob_id);
  if (pending.wait_for(timeout) != std::future_status::ready) {
    BOOST_LOG_TRIVIAL(warning) << "Owner client: Restore of blob " << blob_id << " timed out";
    return false;
  }

  RetrieveResponse response = pending.get();
  if (!response.found || !response.data) {
    BOOST_LOG_TRIVIAL(warning) << "Owner client: Node " << response.node_id << " does not hold blob " << blob_id;
    return false;
  }

  // Refuse a copy that does not open under the key we still hold
  if (auto key = vault_.retrieve_key(blob_id)) {
    try {
      cipher_.decrypt(*key, *response.data);
    } catch (const crypto::AuthenticationError& e) {
      BOOST_LOG_TRIVIAL(error) << "Owner client: Remote copy of blob " << blob_id << " from node "
                               << response.node_id << " failed verification: " << e.what();
      return false;
    }
  }

  blobs_.store(blob_id, *response.data);
  BOOST_LOG_TRIVIAL(info) << "Owner client: Restored blob " << blob_id << " from node " << response.node_id;
  return true;
}


//==============================================
// PROOF OF STORAGE
//==============================================

PendingResponse<ProofResponse> OwnerClient::request_proof(const std::string& blob_id, const Bytes& seed) {
  auto pending = proof_responses_.expect(blob_id);
  bus_.publish(destinations_.proof_requests, MessageCodec::encode(ProofRequest{blob_id, seed}));
  BOOST_LOG_TRIVIAL(debug) << "Owner client: Challenged storage of blob " << blob_id
                           << " with seed " << utils::hex_preview(seed);
  return pending;
}

std::optional<Bytes> OwnerClient::expected_proof(const std::string& blob_id, const Bytes& seed) const {
  return proof_engine_.request_proof_of_storage(blob_id, seed);
}

bool OwnerClient::verify_proof(const ProofResponse& response, const Bytes& seed) const {
  if (!response.found || !response.proof) {
    return false;
  }
  auto expected = expected_proof(response.blob_id, seed);
  if (!expected) {
    return false;
  }

  bool valid = proof::ProofEngine::verify(*expected, *response.proof);
  BOOST_LOG_TRIVIAL(info) << "Owner client: Proof from node " << response.node_id << " for blob "
                          << response.blob_id << (valid ? " verified" : " REJECTED");
  return valid;
}

Bytes OwnerClient::generate_seed() {
  return crypto::random_bytes(SEED_SIZE);
}


//==============================================
// DELETE
//==============================================

void OwnerClient::delete_blob(const std::string& blob_id) {
  vault_.delete_key(blob_id);
  blobs_.remove(blob_id);
  bus_.publish(destinations_.delete_requests, MessageCodec::encode(DeleteRequest{blob_id}));
  BOOST_LOG_TRIVIAL(info) << "Owner client: Deleted blob " << blob_id << " and broadcast erasure";
}

} // namespace quloud::client
