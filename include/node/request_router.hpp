#ifndef QULOUD_NODE_REQUEST_ROUTER_HPP
#define QULOUD_NODE_REQUEST_ROUTER_HPP

#include "node/request_handlers.hpp"

namespace quloud::node {

// Serves every request category from a single shared channel by routing
// on the message type. Responses and undecodable frames are dropped.
class RequestRouter {
public:
  RequestRouter(StoreRequestHandler& store, RetrieveRequestHandler& retrieve,
                ProofRequestHandler& proof, DeleteRequestHandler& erase);

  void handle(const Bytes& raw);
  // Returns false for anything that is not a request
  bool route(const protocol::Message& message);

private:
  StoreRequestHandler& store_;
  RetrieveRequestHandler& retrieve_;
  ProofRequestHandler& proof_;
  DeleteRequestHandler& delete_;
};

} // namespace quloud::node

#endif // QULOUD_NODE_REQUEST_ROUTER_HPP
