#pragma once

#include <filesystem>
#include <mutex>
#include <string>
#include "store/byte_store.hpp"

namespace quloud {
namespace store {

// Filesystem backed ByteStore using content-addressed paths, so ids never
// become raw path components.
class FileByteStore : public ByteStore {
public:

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit FileByteStore(const std::filesystem::path& base_path);


  // ---- CORE STORAGE OPERATIONS ----
  // Writes to a temporary file and renames it over the target
  void put(const std::string& id, const Bytes& data) override;
  std::optional<Bytes> get(const std::string& id) const override;
  // Deletes the file and prunes empty parent directories
  bool remove(const std::string& id) override;
  // Writes into the existing file without truncating and syncs it to disk
  bool overwrite(const std::string& id, const Bytes& data) override;


  // ---- QUERY OPERATIONS ----
  bool exists(const std::string& id) const override;
  // Location a given id maps to; exposed for tests and tooling
  std::filesystem::path path_for(const std::string& id) const;

  const std::filesystem::path& base_path() const { return base_path_; }

private:
  // ---- PARAMETERS ----
  // Root path for all stored files
  std::filesystem::path base_path_;
  mutable std::mutex mutex_;


  // ---- CAS STORAGE SUPPORT ----
  // Creates a directory structure using parts of the hash:
  // {base_path}/{hash[0:2]}/{hash[2:4]}/{hash[4:6]}/{remaining_hash}
  std::filesystem::path get_path_for_hash(const std::string& hash) const;


  // ---- UTILITY METHODS ----
  void check_directory_exists(const std::filesystem::path& path) const;
  void prune_empty_parents(std::filesystem::path dir) const;
};

} // namespace store
} // namespace quloud
