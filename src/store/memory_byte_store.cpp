#include "store/memory_byte_store.hpp"
#include <algorithm>

namespace quloud {
namespace store {

void MemoryByteStore::put(const std::string& id, const Bytes& data) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_[id] = data;
}

std::optional<Bytes> MemoryByteStore::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return std::nullopt;
  }
  return it->second;
}

bool MemoryByteStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.erase(id) > 0;
}

bool MemoryByteStore::overwrite(const std::string& id, const Bytes& data) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(id);
  if (it == records_.end()) {
    return false;
  }

  Bytes& record = it->second;
  if (data.size() > record.size()) {
    record.resize(data.size());
  }
  std::copy(data.begin(), data.end(), record.begin());
  return true;
}

bool MemoryByteStore::exists(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.count(id) > 0;
}

std::optional<Bytes> MemoryByteStore::raw(const std::string& id) const {
  return get(id);
}

std::map<std::string, Bytes> MemoryByteStore::snapshot() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}

std::size_t MemoryByteStore::size() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_.size();
}

} // namespace store
} // namespace quloud
