#pragma once

#include <map>
#include <mutex>
#include <string>
#include "store/byte_store.hpp"

namespace quloud {
namespace store {

// In-memory ByteStore. Records live in a map guarded by a mutex; overwrite
// rewrites the existing buffer element by element so tests can inspect the
// exact bytes left behind.
class MemoryByteStore : public ByteStore {
public:
  void put(const std::string& id, const Bytes& data) override;
  std::optional<Bytes> get(const std::string& id) const override;
  bool remove(const std::string& id) override;
  bool overwrite(const std::string& id, const Bytes& data) override;
  bool exists(const std::string& id) const override;

  // ---- INSPECTION ----
  // Same as get; named separately so tests read as direct inspection
  std::optional<Bytes> raw(const std::string& id) const;
  // Copy of every record currently held
  std::map<std::string, Bytes> snapshot() const;
  std::size_t size() const;

private:
  mutable std::mutex mutex_;
  std::map<std::string, Bytes> records_;
};

} // namespace store
} // namespace quloud
