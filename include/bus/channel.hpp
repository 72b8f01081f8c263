#pragma once

#include <chrono>
#include <condition_variable>
#include <mutex>
#include <queue>
#include <string>
#include "utils/bytes.hpp"

namespace quloud {
namespace bus {

// A payload together with the destination it was published to
struct Envelope {
  std::string destination;
  Bytes payload;
};

class Channel {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR
    Channel() = default;
    ~Channel() = default;


    // ---- CHANNEL CONTROL METHODS ----
    // Adds an envelope to the back of the queue. Returns false once closed.
    bool produce(Envelope envelope);
    // Retrieves and removes next envelope from queue without blocking
    bool consume(Envelope& envelope);
    // Blocks until an envelope arrives, the channel is closed or timeout expires.
    // Queued envelopes are still handed out after close.
    bool wait_consume(Envelope& envelope, std::chrono::milliseconds timeout);
    // Wakes every waiter and rejects further produce calls
    void close();


    // ---- QUERY METHODS ----
    // Returns true if the channel has no messages
    bool empty() const;
    // Returns the number of messages in the channel
    std::size_t size() const;
    bool closed() const;

private:
    // ---- PARAMETERS ----
    mutable std::mutex mutex_;
    std::condition_variable ready_;
    std::queue<Envelope> queue_;
    bool closed_ = false;
};

} // namespace bus
} // namespace quloud
