#pragma once

#include <optional>
#include <stdexcept>
#include <string>
#include "utils/bytes.hpp"

namespace quloud {
namespace store {

// Durable key-value storage of raw bytes by string id.
// Every call completes indivisibly with respect to other calls on the same instance.
class ByteStore {
public:
  virtual ~ByteStore() = default;

  // ---- CORE STORAGE OPERATIONS ----
  // Stores bytes under id, replacing any previous record
  virtual void put(const std::string& id, const Bytes& data) = 0;
  // Returns the record or nullopt when absent
  virtual std::optional<Bytes> get(const std::string& id) const = 0;
  // Removes the record; returns whether it existed
  virtual bool remove(const std::string& id) = 0;
  // Rewrites an existing record in place without reallocating it.
  // Returns false if the record is absent.
  virtual bool overwrite(const std::string& id, const Bytes& data) = 0;


  // ---- QUERY OPERATIONS ----
  virtual bool exists(const std::string& id) const = 0;
};

class StoreError : public std::runtime_error {
public:
  explicit StoreError(const std::string& message) : std::runtime_error(message) {}
};

} // namespace store
} // namespace quloud
