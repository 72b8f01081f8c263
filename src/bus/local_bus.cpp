#include "bus/local_bus.hpp"
#include <boost/log/trivial.hpp>

namespace quloud {
namespace bus {

namespace {
constexpr std::chrono::milliseconds POLL_INTERVAL{100};
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

LocalBus::LocalBus(Destinations destinations) : destinations_(std::move(destinations)) {
  BOOST_LOG_TRIVIAL(debug) << "Local bus: Created";
}

LocalBus::~LocalBus() {
  stop();
}


//==============================================
// MESSAGE BUS OPERATIONS
//==============================================

void LocalBus::publish(const std::string& destination, const Bytes& payload) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_) {
    BOOST_LOG_TRIVIAL(warning) << "Local bus: Dropping message for " << destination << ", bus stopped";
    return;
  }

  std::vector<Subscription*> targets;
  for (auto& subscription : subscriptions_) {
    if (subscription->source == destination) {
      targets.push_back(subscription.get());
    }
  }

  if (targets.empty()) {
    BOOST_LOG_TRIVIAL(debug) << "Local bus: No subscriber for " << destination << ", message dropped";
    return;
  }

  if (destinations_.is_work_queue(destination)) {
    std::size_t& next = next_consumer_[destination];
    deliver(*targets[next % targets.size()], destination, payload);
    ++next;
  } else {
    for (auto* target : targets) {
      deliver(*target, destination, payload);
    }
  }
}

void LocalBus::subscribe(const std::string& source, Handler handler) {
  if (!handler) {
    throw BusError("empty handler for " + source);
  }

  std::lock_guard<std::mutex> lock(mutex_);
  if (!running_) {
    throw BusError("subscribe to " + source + " after stop");
  }

  auto subscription = std::make_unique<Subscription>();
  subscription->source = source;
  subscription->handler = std::move(handler);
  Subscription& ref = *subscription;
  subscription->worker = std::thread(&LocalBus::consume_loop, this, std::ref(ref));
  subscriptions_.push_back(std::move(subscription));

  BOOST_LOG_TRIVIAL(info) << "Local bus: Subscribed to " << source;
}

void LocalBus::stop() {
  std::vector<std::unique_ptr<Subscription>> stopping;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!running_) {
      return;
    }
    running_ = false;
    stopping.swap(subscriptions_);
  }

  for (auto& subscription : stopping) {
    subscription->channel.close();
  }
  for (auto& subscription : stopping) {
    if (subscription->worker.joinable()) {
      subscription->worker.join();
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Local bus: Stopped " << stopping.size() << " subscriptions";
}


//==============================================
// QUERY METHODS
//==============================================

bool LocalBus::has_subscriber(const std::string& destination) const {
  std::lock_guard<std::mutex> lock(mutex_);
  for (const auto& subscription : subscriptions_) {
    if (subscription->source == destination) {
      return true;
    }
  }
  return false;
}

bool LocalBus::wait_idle(std::chrono::milliseconds timeout) const {
  std::unique_lock<std::mutex> lock(pending_mutex_);
  return idle_.wait_for(lock, timeout, [this] { return pending_ == 0; });
}


//==============================================
// CONSUMER LOOP
//==============================================

void LocalBus::deliver(Subscription& subscription, const std::string& destination, const Bytes& payload) {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    ++pending_;
  }
  if (!subscription.channel.produce(Envelope{destination, payload})) {
    mark_handled();
  }
}

void LocalBus::consume_loop(Subscription& subscription) {
  BOOST_LOG_TRIVIAL(debug) << "Local bus: Consumer started for " << subscription.source;

  Envelope envelope;
  while (true) {
    if (!subscription.channel.wait_consume(envelope, POLL_INTERVAL)) {
      if (subscription.channel.closed()) {
        break;
      }
      continue;
    }

    try {
      subscription.handler(envelope.payload);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Local bus: Handler for " << subscription.source
                               << " failed: " << e.what();
    }
    mark_handled();
  }

  BOOST_LOG_TRIVIAL(debug) << "Local bus: Consumer stopped for " << subscription.source;
}

void LocalBus::mark_handled() {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    --pending_;
  }
  idle_.notify_all();
}

} // namespace bus
} // namespace quloud
