#include "node/request_handlers.hpp"
#include <boost/log/trivial.hpp>

namespace quloud::node {

using namespace quloud::protocol;

//==============================================
// COMMON HANDLING
//==============================================

RequestHandler::RequestHandler(std::string node_id, bus::Publisher& publisher, bus::Destinations destinations)
  : node_id_(std::move(node_id))
  , publisher_(publisher)
  , destinations_(std::move(destinations)) {}

void RequestHandler::handle(const Bytes& raw) {
  Message message;
  try {
    message = MessageCodec::decode(raw);
  } catch (const MessageError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Handler: Dropping malformed frame of " << raw.size() << " bytes: " << e.what();
    return;
  }

  if (!handle_message(message)) {
    BOOST_LOG_TRIVIAL(debug) << "Handler: Ignoring " << to_string(type_of(message))
                             << " for blob " << blob_id_of(message);
  }
}

void RequestHandler::respond(const std::string& destination, const Message& response) {
  publisher_.publish(destination, MessageCodec::encode(response));
}


//==============================================
// STORE
//==============================================

StoreRequestHandler::StoreRequestHandler(StorageLayer& layer, std::string node_id,
                                         bus::Publisher& publisher, bus::Destinations destinations)
  : RequestHandler(std::move(node_id), publisher, std::move(destinations))
  , layer_(layer) {}

void StoreRequestHandler::handle(const StoreRequest& request) {
  BOOST_LOG_TRIVIAL(info) << "Store handler: Storing blob " << request.blob_id
                          << " (" << request.data.size() << " bytes)";

  // A persistence failure escapes before anything is published
  layer_.seal(request.blob_id, request.data);

  respond(destinations_.store_responses, StoreResponse{request.blob_id, node_id_, true});
}

bool StoreRequestHandler::handle_message(const Message& message) {
  if (const auto* request = std::get_if<StoreRequest>(&message)) {
    handle(*request);
    return true;
  }
  return false;
}


//==============================================
// RETRIEVE
//==============================================

RetrieveRequestHandler::RetrieveRequestHandler(StorageLayer& layer, std::string node_id,
                                               bus::Publisher& publisher, bus::Destinations destinations)
  : RequestHandler(std::move(node_id), publisher, std::move(destinations))
  , layer_(layer) {}

void RetrieveRequestHandler::handle(const RetrieveRequest& request) {
  auto data = layer_.open(request.blob_id);
  bool found = data.has_value();

  BOOST_LOG_TRIVIAL(info) << "Retrieve handler: Blob " << request.blob_id << (found ? " found" : " not found");
  respond(destinations_.retrieve_responses,
          RetrieveResponse{request.blob_id, node_id_, std::move(data), found});
}

bool RetrieveRequestHandler::handle_message(const Message& message) {
  if (const auto* request = std::get_if<RetrieveRequest>(&message)) {
    handle(*request);
    return true;
  }
  return false;
}


//==============================================
// PROOF
//==============================================

ProofRequestHandler::ProofRequestHandler(const proof::ProofEngine& engine, std::string node_id,
                                         bus::Publisher& publisher, bus::Destinations destinations)
  : RequestHandler(std::move(node_id), publisher, std::move(destinations))
  , engine_(engine) {}

void ProofRequestHandler::handle(const ProofRequest& request) {
  auto result = engine_.provide_proof_of_storage(request.blob_id, request.seed);

  BOOST_LOG_TRIVIAL(info) << "Proof handler: Challenge for blob " << request.blob_id
                          << (result.found ? " answered" : " for unknown blob");
  respond(destinations_.proof_responses,
          ProofResponse{request.blob_id, node_id_, std::move(result.proof), result.found});
}

bool ProofRequestHandler::handle_message(const Message& message) {
  if (const auto* request = std::get_if<ProofRequest>(&message)) {
    handle(*request);
    return true;
  }
  return false;
}


//==============================================
// DELETE
//==============================================

DeleteRequestHandler::DeleteRequestHandler(StorageLayer& layer, std::string node_id,
                                           bus::Publisher& publisher, bus::Destinations destinations)
  : RequestHandler(std::move(node_id), publisher, std::move(destinations))
  , layer_(layer) {}

void DeleteRequestHandler::handle(const DeleteRequest& request) {
  bool existed = layer_.erase(request.blob_id);
  BOOST_LOG_TRIVIAL(info) << "Delete handler: Blob " << request.blob_id
                          << (existed ? " erased" : " was not held");
}

bool DeleteRequestHandler::handle_message(const Message& message) {
  if (const auto* request = std::get_if<DeleteRequest>(&message)) {
    handle(*request);
    return true;
  }
  return false;
}

} // namespace quloud::node
