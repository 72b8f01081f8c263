#ifndef QULOUD_PROTOCOL_MESSAGES_HPP
#define QULOUD_PROTOCOL_MESSAGES_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include "utils/bytes.hpp"

namespace quloud::protocol {

// Type byte carried in every frame
enum class MessageType : uint8_t {
  STORE_REQUEST = 1,
  STORE_RESPONSE = 2,
  RETRIEVE_REQUEST = 3,
  RETRIEVE_RESPONSE = 4,
  PROOF_REQUEST = 5,
  PROOF_RESPONSE = 6,
  DELETE_REQUEST = 7
};

struct StoreRequest {
  std::string blob_id;
  Bytes data;
};

struct StoreResponse {
  std::string blob_id;
  std::string node_id;
  bool stored = false;
};

struct RetrieveRequest {
  std::string blob_id;
};

struct RetrieveResponse {
  std::string blob_id;
  std::string node_id;
  std::optional<Bytes> data;
  bool found = false;
};

struct ProofRequest {
  std::string blob_id;
  Bytes seed;
};

struct ProofResponse {
  std::string blob_id;
  std::string node_id;
  std::optional<Bytes> proof;
  bool found = false;
};

// No response exists for deletes
struct DeleteRequest {
  std::string blob_id;
};

using Message = std::variant<StoreRequest, StoreResponse, RetrieveRequest, RetrieveResponse,
                             ProofRequest, ProofResponse, DeleteRequest>;

MessageType type_of(const Message& message);
const std::string& blob_id_of(const Message& message);
std::string to_string(MessageType type);

} // namespace quloud::protocol

#endif // QULOUD_PROTOCOL_MESSAGES_HPP
