#ifndef QULOUD_BUS_MESSAGE_BUS_HPP
#define QULOUD_BUS_MESSAGE_BUS_HPP

#include <functional>
#include <stdexcept>
#include <string>
#include "utils/bytes.hpp"

namespace quloud {
namespace bus {

class BusError : public std::runtime_error {
public:
  explicit BusError(const std::string& message) : std::runtime_error("Bus error: " + message) {}
};

// Named destinations for every request and response category
struct Destinations {
  std::string store_requests = "quloud.store.requests";
  std::string store_responses = "quloud.store.responses";
  std::string retrieve_requests = "quloud.retrieve.requests";
  std::string retrieve_responses = "quloud.retrieve.responses";
  std::string proof_requests = "quloud.proof.requests";
  std::string proof_responses = "quloud.proof.responses";
  std::string delete_requests = "quloud.delete.requests";

  // Store, retrieve and proof requests go to exactly one consumer.
  // Deletes and every response fan out to all consumers.
  bool is_work_queue(const std::string& destination) const {
    return destination == store_requests || destination == retrieve_requests ||
           destination == proof_requests;
  }
};

class Publisher {
public:
  virtual ~Publisher() = default;
  virtual void publish(const std::string& destination, const Bytes& payload) = 0;
};

// Publish/subscribe transport. Handlers get raw payload bytes on a thread
// owned by the bus; an exception thrown by a handler is logged, never fatal.
class MessageBus : public Publisher {
public:
  using Handler = std::function<void(const Bytes&)>;

  virtual void subscribe(const std::string& source, Handler handler) = 0;
  // Stops delivery and joins consumer threads. Safe to call twice.
  virtual void stop() = 0;
};

} // namespace bus
} // namespace quloud

#endif // QULOUD_BUS_MESSAGE_BUS_HPP
