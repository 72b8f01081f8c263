#ifndef QULOUD_CLIENT_RESPONSE_TRACKER_HPP
#define QULOUD_CLIENT_RESPONSE_TRACKER_HPP

#include <boost/log/trivial.hpp>
#include <chrono>
#include <cstdint>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <string>
#include <utility>

namespace quloud::client {

template <typename Response>
class ResponseTracker;

// One outstanding request registered with a ResponseTracker. A wait that
// times out withdraws the request, as does dropping it unanswered, so a
// later response for the same blob id reaches a live request instead.
// Must not outlive the tracker that issued it.
template <typename Response>
class PendingResponse {
public:
  PendingResponse(ResponseTracker<Response>& tracker, std::string blob_id, std::uint64_t ticket,
                  std::future<Response> future)
    : tracker_(&tracker)
    , blob_id_(std::move(blob_id))
    , ticket_(ticket)
    , future_(std::move(future)) {}

  PendingResponse(PendingResponse&& other) noexcept
    : tracker_(std::exchange(other.tracker_, nullptr))
    , blob_id_(std::move(other.blob_id_))
    , ticket_(other.ticket_)
    , future_(std::move(other.future_))
    , withdrawn_(other.withdrawn_) {}

  PendingResponse& operator=(PendingResponse&& other) noexcept {
    if (this != &other) {
      withdraw();
      tracker_ = std::exchange(other.tracker_, nullptr);
      blob_id_ = std::move(other.blob_id_);
      ticket_ = other.ticket_;
      future_ = std::move(other.future_);
      withdrawn_ = other.withdrawn_;
    }
    return *this;
  }

  PendingResponse(const PendingResponse&) = delete;
  PendingResponse& operator=(const PendingResponse&) = delete;

  ~PendingResponse() {
    withdraw();
  }

  // On timeout the request is withdrawn; a response that slipped in while
  // withdrawing still counts as ready
  template <typename Rep, typename Period>
  std::future_status wait_for(const std::chrono::duration<Rep, Period>& timeout) {
    if (withdrawn_) {
      return std::future_status::timeout;
    }
    std::future_status status = future_.wait_for(timeout);
    if (status == std::future_status::ready || withdraw()) {
      return status;
    }
    return future_.wait_for(std::chrono::seconds(0));
  }

  // Throws std::future_error once the request has been withdrawn unanswered
  Response get() {
    tracker_ = nullptr;
    return future_.get();
  }

  std::uint64_t ticket() const { return ticket_; }

private:
  // True when this request was still queued and has now been removed
  bool withdraw() {
    if (!tracker_) {
      return false;
    }
    withdrawn_ = tracker_->abandon(blob_id_, ticket_);
    tracker_ = nullptr;
    return withdrawn_;
  }

  ResponseTracker<Response>* tracker_;
  std::string blob_id_;
  std::uint64_t ticket_;
  std::future<Response> future_;
  bool withdrawn_ = false;
};

// Matches asynchronous responses to outstanding requests by blob id.
// Every expect() yields a one-shot PendingResponse; responses for the same
// blob id fulfil the oldest outstanding request first. A response nobody
// waits for is logged and dropped.
template <typename Response>
class ResponseTracker {
public:
  PendingResponse<Response> expect(const std::string& blob_id) {
    std::promise<Response> promise;
    std::future<Response> future = promise.get_future();

    std::lock_guard<std::mutex> lock(mutex_);
    std::uint64_t ticket = next_ticket_++;
    pending_[blob_id].push_back(Entry{ticket, std::move(promise)});
    return PendingResponse<Response>(*this, blob_id, ticket, std::move(future));
  }

  // Returns false when no request was waiting for this blob id
  bool fulfill(const Response& response) {
    std::promise<Response> promise;
    {
      std::lock_guard<std::mutex> lock(mutex_);
      auto it = pending_.find(response.blob_id);
      if (it == pending_.end() || it->second.empty()) {
        BOOST_LOG_TRIVIAL(debug) << "Response tracker: Unmatched response for blob " << response.blob_id;
        return false;
      }
      promise = std::move(it->second.front().promise);
      it->second.pop_front();
      if (it->second.empty()) {
        pending_.erase(it);
      }
    }
    promise.set_value(response);
    return true;
  }

  // Drops exactly the request holding ticket. Returns false when it was
  // already answered or withdrawn.
  bool abandon(const std::string& blob_id, std::uint64_t ticket) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(blob_id);
    if (it == pending_.end()) {
      return false;
    }
    auto& queue = it->second;
    bool removed = false;
    for (auto entry = queue.begin(); entry != queue.end(); ++entry) {
      if (entry->ticket == ticket) {
        queue.erase(entry);
        removed = true;
        BOOST_LOG_TRIVIAL(debug) << "Response tracker: Withdrew request " << ticket << " for blob " << blob_id;
        break;
      }
    }
    if (queue.empty()) {
      pending_.erase(it);
    }
    return removed;
  }

  std::size_t outstanding(const std::string& blob_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = pending_.find(blob_id);
    return it == pending_.end() ? 0 : it->second.size();
  }

  std::size_t outstanding() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::size_t total = 0;
    for (const auto& entry : pending_) {
      total += entry.second.size();
    }
    return total;
  }

private:
  struct Entry {
    std::uint64_t ticket;
    std::promise<Response> promise;
  };

  std::map<std::string, std::deque<Entry>> pending_;
  std::uint64_t next_ticket_ = 0;
  mutable std::mutex mutex_;
};

} // namespace quloud::client

#endif // QULOUD_CLIENT_RESPONSE_TRACKER_HPP
