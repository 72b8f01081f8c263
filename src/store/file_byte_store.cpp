#include "store/file_byte_store.hpp"
#include "crypto/digest.hpp"
#include <boost/log/trivial.hpp>
#include <cerrno>
#include <cstring>
#include <fstream>
#include <fcntl.h>
#include <unistd.h>

namespace quloud {
namespace store {

namespace {

// Writes the whole buffer to an open descriptor, then flushes it to disk
void write_and_sync(int fd, const Bytes& data, const std::filesystem::path& path) {
  std::size_t written = 0;
  while (written < data.size()) {
    ssize_t n = ::write(fd, data.data() + written, data.size() - written);
    if (n < 0) {
      if (errno == EINTR) {
        continue;
      }
      throw StoreError("FileByteStore: Failed to write " + path.string() + ": " + std::strerror(errno));
    }
    written += static_cast<std::size_t>(n);
  }
  if (::fsync(fd) != 0) {
    throw StoreError("FileByteStore: Failed to sync " + path.string() + ": " + std::strerror(errno));
  }
}

// Closes the descriptor when leaving scope
struct FileDescriptor {
  int fd;
  explicit FileDescriptor(int descriptor) : fd(descriptor) {}
  ~FileDescriptor() {
    if (fd >= 0) {
      ::close(fd);
    }
  }
  FileDescriptor(const FileDescriptor&) = delete;
  FileDescriptor& operator=(const FileDescriptor&) = delete;
};

} // namespace

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

FileByteStore::FileByteStore(const std::filesystem::path& base_path) : base_path_(base_path) {
  BOOST_LOG_TRIVIAL(info) << "FileByteStore: Initializing with base path: " << base_path_.string();
  try {
    check_directory_exists(base_path_);
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("FileByteStore: Cannot create base directory: " + std::string(e.what()));
  }
}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

void FileByteStore::put(const std::string& id, const Bytes& data) {
  std::lock_guard<std::mutex> lock(mutex_);
  BOOST_LOG_TRIVIAL(debug) << "FileByteStore: Storing " << data.size() << " bytes with id: " << id;

  std::filesystem::path file_path = path_for(id);
  std::filesystem::path temp_path = file_path;
  temp_path += ".tmp";

  try {
    check_directory_exists(file_path.parent_path());
  } catch (const std::filesystem::filesystem_error& e) {
    throw StoreError("FileByteStore: Failed to create directory: " + std::string(e.what()));
  }

  {
    FileDescriptor file(::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0600));
    if (file.fd < 0) {
      throw StoreError("FileByteStore: Failed to create file: " + temp_path.string());
    }
    try {
      write_and_sync(file.fd, data, temp_path);
    } catch (const StoreError&) {
      std::error_code ec;
      std::filesystem::remove(temp_path, ec);
      throw;
    }
  }

  // Rename is atomic on POSIX, readers see either the old or the new record
  std::error_code ec;
  std::filesystem::rename(temp_path, file_path, ec);
  if (ec) {
    std::filesystem::remove(temp_path, ec);
    throw StoreError("FileByteStore: Failed to move file into place: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "FileByteStore: Stored id: " << id;
}

std::optional<Bytes> FileByteStore::get(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::path file_path = path_for(id);

  if (!std::filesystem::exists(file_path)) {
    BOOST_LOG_TRIVIAL(debug) << "FileByteStore: Id not found: " << id;
    return std::nullopt;
  }

  // Open file in binary mode to handle all content correctly
  std::ifstream file(file_path, std::ios::binary);
  if (!file) {
    throw StoreError("FileByteStore: Failed to open file: " + file_path.string());
  }

  Bytes data(std::filesystem::file_size(file_path));
  if (!data.empty() && !file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(data.size()))) {
    throw StoreError("FileByteStore: Failed to read file: " + file_path.string());
  }

  BOOST_LOG_TRIVIAL(debug) << "FileByteStore: Read " << data.size() << " bytes for id: " << id;
  return data;
}

bool FileByteStore::remove(const std::string& id) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::path file_path = path_for(id);

  std::error_code ec;
  bool removed = std::filesystem::remove(file_path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "FileByteStore: Failed to remove file with id: " << id;
    throw StoreError("FileByteStore: Failed to remove file: " + ec.message());
  }

  if (removed) {
    prune_empty_parents(file_path.parent_path());
    BOOST_LOG_TRIVIAL(debug) << "FileByteStore: Removed id: " << id;
  }
  return removed;
}

bool FileByteStore::overwrite(const std::string& id, const Bytes& data) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::filesystem::path file_path = path_for(id);

  // No O_CREAT and no O_TRUNC: the existing blocks are rewritten
  FileDescriptor file(::open(file_path.c_str(), O_WRONLY));
  if (file.fd < 0) {
    if (errno == ENOENT) {
      return false;
    }
    throw StoreError("FileByteStore: Failed to open file for overwrite: " + file_path.string());
  }
  write_and_sync(file.fd, data, file_path);

  BOOST_LOG_TRIVIAL(debug) << "FileByteStore: Overwrote " << data.size() << " bytes in place for id: " << id;
  return true;
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool FileByteStore::exists(const std::string& id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  return std::filesystem::exists(path_for(id));
}

std::filesystem::path FileByteStore::path_for(const std::string& id) const {
  return get_path_for_hash(crypto::sha256_hex(id));
}


//==============================================
// CAS STORAGE SUPPORT
//==============================================

std::filesystem::path FileByteStore::get_path_for_hash(const std::string& hash) const {
  std::filesystem::path path = base_path_;

  for (size_t i = 0; i < 6; i += 2) {
    path /= hash.substr(i, 2);
  }

  path /= hash.substr(6);
  return path;
}


//==============================================
// UTILITY METHODS
//==============================================

void FileByteStore::check_directory_exists(const std::filesystem::path& path) const {
  if (!std::filesystem::exists(path)) {
    std::filesystem::create_directories(path);
  }
}

void FileByteStore::prune_empty_parents(std::filesystem::path dir) const {
  // Clean up empty parent directories up to base_path_
  std::error_code ec;
  while (dir != base_path_ && dir.native().size() > base_path_.native().size()) {
    if (!std::filesystem::is_empty(dir, ec) || ec) {
      break;
    }
    std::filesystem::remove(dir, ec);
    dir = dir.parent_path();
  }
}

} // namespace store
} // namespace quloud
