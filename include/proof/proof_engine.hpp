#ifndef QULOUD_PROOF_PROOF_ENGINE_HPP
#define QULOUD_PROOF_PROOF_ENGINE_HPP

#include <functional>
#include <optional>
#include <string>
#include "utils/bytes.hpp"

namespace quloud::proof {

struct ProofResult {
  bool found = false;
  std::optional<Bytes> proof;
};

// Seeded proof of possession over the ciphertext layer the verifier holds.
//
// The engine does not know where that layer comes from. A storage node
// resolves a blob by stripping its own encryption (StorageLayer::open); the
// owner resolves it to the ciphertext kept in its local BlobStore. Both then
// hash the same bytes, which is what lets the owner check a node's answer.
class ProofEngine {
public:
  // Returns the verifiable layer for a blob id, or nullopt if it is not held
  using LayerResolver = std::function<std::optional<Bytes>(const std::string&)>;

  explicit ProofEngine(LayerResolver resolver);

  // SHA-256(data || seed)
  static Bytes compute_proof(const Bytes& data, const Bytes& seed);

  // Node side. Missing blob gives {found=false, proof=nullopt}, never an exception.
  ProofResult provide_proof_of_storage(const std::string& blob_id, const Bytes& seed) const;

  // Owner side expected value, same construction as compute_proof
  std::optional<Bytes> request_proof_of_storage(const std::string& blob_id, const Bytes& seed) const;

  // Constant-time comparison of an expected and a received proof
  static bool verify(const Bytes& expected, const Bytes& received);

private:
  LayerResolver resolver_;
};

} // namespace quloud::proof

#endif // QULOUD_PROOF_PROOF_ENGINE_HPP
