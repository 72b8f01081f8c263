#ifndef QULOUD_NODE_REQUEST_HANDLERS_HPP
#define QULOUD_NODE_REQUEST_HANDLERS_HPP

#include <string>
#include "bus/message_bus.hpp"
#include "node/storage_layer.hpp"
#include "proof/proof_engine.hpp"
#include "protocol/codec.hpp"

namespace quloud::node {

// Common part of the four storage node handlers. Each inbound frame runs
// once to completion on the calling thread; there are no internal retries.
class RequestHandler {
public:
  RequestHandler(std::string node_id, bus::Publisher& publisher, bus::Destinations destinations);
  virtual ~RequestHandler() = default;

  // Entry point for raw bus payloads. Frames that fail to decode, or that
  // carry a message this handler does not serve, are dropped without a
  // response. Storage and integrity failures propagate to the caller.
  void handle(const Bytes& raw);

  // Typed dispatch; returns false when the message is not for this handler
  virtual bool handle_message(const protocol::Message& message) = 0;

  const std::string& node_id() const { return node_id_; }

protected:
  void respond(const std::string& destination, const protocol::Message& response);

  std::string node_id_;
  bus::Publisher& publisher_;
  bus::Destinations destinations_;
};

// Seals the received bytes under this node's layer and acknowledges
class StoreRequestHandler : public RequestHandler {
public:
  StoreRequestHandler(StorageLayer& layer, std::string node_id, bus::Publisher& publisher,
                      bus::Destinations destinations = bus::Destinations{});

  void handle(const protocol::StoreRequest& request);
  bool handle_message(const protocol::Message& message) override;
  using RequestHandler::handle;

private:
  StorageLayer& layer_;
};

// Answers with the bytes as received, i.e. this node's layer stripped
class RetrieveRequestHandler : public RequestHandler {
public:
  RetrieveRequestHandler(StorageLayer& layer, std::string node_id, bus::Publisher& publisher,
                         bus::Destinations destinations = bus::Destinations{});

  void handle(const protocol::RetrieveRequest& request);
  bool handle_message(const protocol::Message& message) override;
  using RequestHandler::handle;

private:
  StorageLayer& layer_;
};

class ProofRequestHandler : public RequestHandler {
public:
  ProofRequestHandler(const proof::ProofEngine& engine, std::string node_id, bus::Publisher& publisher,
                      bus::Destinations destinations = bus::Destinations{});

  void handle(const protocol::ProofRequest& request);
  bool handle_message(const protocol::Message& message) override;
  using RequestHandler::handle;

private:
  const proof::ProofEngine& engine_;
};

// Shreds the key and removes the data. Publishes nothing, so the network
// never learns who asked for the erasure.
class DeleteRequestHandler : public RequestHandler {
public:
  DeleteRequestHandler(StorageLayer& layer, std::string node_id, bus::Publisher& publisher,
                       bus::Destinations destinations = bus::Destinations{});

  void handle(const protocol::DeleteRequest& request);
  bool handle_message(const protocol::Message& message) override;
  using RequestHandler::handle;

private:
  StorageLayer& layer_;
};

} // namespace quloud::node

#endif // QULOUD_NODE_REQUEST_HANDLERS_HPP
