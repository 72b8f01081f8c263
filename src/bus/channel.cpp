#include "bus/channel.hpp"
#include <boost/log/trivial.hpp>

namespace quloud {
namespace bus {

bool Channel::produce(Envelope envelope) {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            BOOST_LOG_TRIVIAL(debug) << "Channel: Rejected message for " << envelope.destination
                                     << ", channel closed";
            return false;
        }
        queue_.push(std::move(envelope));
        BOOST_LOG_TRIVIAL(trace) << "Channel: Added message. Channel size: " << queue_.size();
    }
    ready_.notify_one();
    return true;
}

bool Channel::consume(Envelope& envelope) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (queue_.empty()) {
        return false;
    }

    envelope = std::move(queue_.front());
    queue_.pop();
    BOOST_LOG_TRIVIAL(trace) << "Channel: Retrieved message. Channel size: " << queue_.size();
    return true;
}

bool Channel::wait_consume(Envelope& envelope, std::chrono::milliseconds timeout) {
    std::unique_lock<std::mutex> lock(mutex_);
    ready_.wait_for(lock, timeout, [this] { return !queue_.empty() || closed_; });
    if (queue_.empty()) {
        return false;
    }

    envelope = std::move(queue_.front());
    queue_.pop();
    return true;
}

void Channel::close() {
    {
        std::lock_guard<std::mutex> lock(mutex_);
        closed_ = true;
    }
    ready_.notify_all();
}

bool Channel::empty() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.empty();
}

std::size_t Channel::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return queue_.size();
}

bool Channel::closed() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return closed_;
}

} // namespace bus
} // namespace quloud
