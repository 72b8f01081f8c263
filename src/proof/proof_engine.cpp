#include "proof/proof_engine.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <stdexcept>

namespace quloud::proof {

ProofEngine::ProofEngine(LayerResolver resolver) : resolver_(std::move(resolver)) {
  if (!resolver_) {
    throw std::invalid_argument("ProofEngine: layer resolver must be set");
  }
}

Bytes ProofEngine::compute_proof(const Bytes& data, const Bytes& seed) {
  return crypto::sha256(data, seed);
}

ProofResult ProofEngine::provide_proof_of_storage(const std::string& blob_id, const Bytes& seed) const {
  auto layer = resolver_(blob_id);
  if (!layer) {
    BOOST_LOG_TRIVIAL(debug) << "ProofEngine: No verifiable layer for blob " << blob_id;
    return ProofResult{false, std::nullopt};
  }

  Bytes proof = compute_proof(*layer, seed);
  BOOST_LOG_TRIVIAL(debug) << "ProofEngine: Proof for blob " << blob_id << " is "
                           << utils::hex_preview(proof);
  return ProofResult{true, std::move(proof)};
}

std::optional<Bytes> ProofEngine::request_proof_of_storage(const std::string& blob_id, const Bytes& seed) const {
  auto layer = resolver_(blob_id);
  if (!layer) {
    BOOST_LOG_TRIVIAL(warning) << "ProofEngine: Cannot compute expected proof, blob " << blob_id
                               << " is not held locally";
    return std::nullopt;
  }
  return compute_proof(*layer, seed);
}

bool ProofEngine::verify(const Bytes& expected, const Bytes& received) {
  return crypto::constant_time_equal(expected, received);
}

} // namespace quloud::proof
