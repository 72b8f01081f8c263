#ifndef QULOUD_BUS_LOCAL_BUS_HPP
#define QULOUD_BUS_LOCAL_BUS_HPP

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <map>
#include <memory>
#include <mutex>
#include <thread>
#include <vector>
#include "bus/channel.hpp"
#include "bus/message_bus.hpp"

namespace quloud {
namespace bus {

// In-process bus. Every subscription owns a Channel drained by its own
// consumer thread. Work-queue destinations hand each message to one
// subscription in turn, all other destinations copy it to every subscription.
class LocalBus : public MessageBus {
public:
  explicit LocalBus(Destinations destinations = Destinations{});
  ~LocalBus() override;

  LocalBus(const LocalBus&) = delete;
  LocalBus& operator=(const LocalBus&) = delete;


  // ---- MESSAGE BUS OPERATIONS ----
  // Messages for a destination nobody subscribed to are dropped
  void publish(const std::string& destination, const Bytes& payload) override;
  // Throws BusError after stop()
  void subscribe(const std::string& source, Handler handler) override;
  void stop() override;


  // ---- QUERY METHODS ----
  bool has_subscriber(const std::string& destination) const;
  // Blocks until every delivered message has been handled or timeout expires
  bool wait_idle(std::chrono::milliseconds timeout) const;

private:
  struct Subscription {
    std::string source;
    Handler handler;
    Channel channel;
    std::thread worker;
  };

  // ---- PARAMETERS ----
  Destinations destinations_;
  std::vector<std::unique_ptr<Subscription>> subscriptions_;
  std::map<std::string, std::size_t> next_consumer_;
  mutable std::mutex mutex_;
  bool running_ = true;

  // Messages enqueued but not yet fully handled
  std::size_t pending_ = 0;
  mutable std::mutex pending_mutex_;
  mutable std::condition_variable idle_;


  // ---- CONSUMER LOOP ----
  void consume_loop(Subscription& subscription);
  void deliver(Subscription& subscription, const std::string& destination, const Bytes& payload);
  void mark_handled();
};

} // namespace bus
} // namespace quloud

#endif // QULOUD_BUS_LOCAL_BUS_HPP
