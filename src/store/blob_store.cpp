#include "store/blob_store.hpp"
#include <boost/log/trivial.hpp>

namespace quloud {
namespace store {

BlobStore::BlobStore(ByteStore& backend) : backend_(backend) {}

void BlobStore::store(const std::string& blob_id, const Bytes& data) {
  BOOST_LOG_TRIVIAL(debug) << "BlobStore: Storing blob " << blob_id << " (" << data.size() << " bytes)";
  backend_.put(blob_id, data);
}

std::optional<Bytes> BlobStore::retrieve(const std::string& blob_id) const {
  auto data = backend_.get(blob_id);
  if (!data) {
    BOOST_LOG_TRIVIAL(debug) << "BlobStore: Blob not found: " << blob_id;
  }
  return data;
}

bool BlobStore::remove(const std::string& blob_id) {
  bool existed = backend_.remove(blob_id);
  BOOST_LOG_TRIVIAL(debug) << "BlobStore: Remove " << blob_id << (existed ? " done" : " skipped, not present");
  return existed;
}

bool BlobStore::exists(const std::string& blob_id) const {
  return backend_.exists(blob_id);
}

} // namespace store
} // namespace quloud
