#include "node/request_router.hpp"
#include <boost/log/trivial.hpp>

namespace quloud::node {

using namespace quloud::protocol;

RequestRouter::RequestRouter(StoreRequestHandler& store, RetrieveRequestHandler& retrieve,
                             ProofRequestHandler& proof, DeleteRequestHandler& erase)
  : store_(store), retrieve_(retrieve), proof_(proof), delete_(erase) {}

void RequestRouter::handle(const Bytes& raw) {
  Message message;
  try {
    message = MessageCodec::decode(raw);
  } catch (const MessageError& e) {
    BOOST_LOG_TRIVIAL(debug) << "Router: Dropping malformed frame: " << e.what();
    return;
  }

  if (!route(message)) {
    BOOST_LOG_TRIVIAL(debug) << "Router: Ignoring " << to_string(type_of(message))
                             << " for blob " << blob_id_of(message);
  }
}

bool RequestRouter::route(const Message& message) {
  switch (type_of(message)) {
    case MessageType::STORE_REQUEST:    return store_.handle_message(message);
    case MessageType::RETRIEVE_REQUEST: return retrieve_.handle_message(message);
    case MessageType::PROOF_REQUEST:    return proof_.handle_message(message);
    case MessageType::DELETE_REQUEST:   return delete_.handle_message(message);
    default:                            return false;
  }
}

} // namespace quloud::node
