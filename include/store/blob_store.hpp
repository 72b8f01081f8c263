#ifndef QULOUD_STORE_BLOB_STORE_HPP
#define QULOUD_STORE_BLOB_STORE_HPP

#include <optional>
#include <string>
#include "store/byte_store.hpp"

namespace quloud {
namespace store {

// Maps a blob id to opaque bytes. Stores exactly the bytes given; the
// encryption layers live above this class.
class BlobStore {
public:
  explicit BlobStore(ByteStore& backend);

  // Replaces any existing blob with the same id
  void store(const std::string& blob_id, const Bytes& data);
  std::optional<Bytes> retrieve(const std::string& blob_id) const;
  // Returns whether the blob existed; a missing id is not an error
  bool remove(const std::string& blob_id);
  bool exists(const std::string& blob_id) const;

private:
  ByteStore& backend_;
};

} // namespace store
} // namespace quloud

#endif // QULOUD_STORE_BLOB_STORE_HPP
