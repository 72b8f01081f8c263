#include "node/key_mode.hpp"
#include "store/byte_store.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace quloud::node {

KeyMode parse_key_mode(const std::string& text) {
  if (text == "per-document") {
    return KeyMode::PerDocument;
  }
  if (text == "node-keyed") {
    return KeyMode::NodeKeyed;
  }
  throw std::invalid_argument("Unknown key mode: " + text);
}

std::string to_string(KeyMode mode) {
  switch (mode) {
    case KeyMode::PerDocument: return "per-document";
    case KeyMode::NodeKeyed:   return "node-keyed";
  }
  return "unknown";
}

//==============================================
// NODE KEY BOOTSTRAP
//==============================================

Bytes load_or_create_node_key(const std::filesystem::path& path, const crypto::Cipher& cipher) {
  namespace fs = std::filesystem;

  if (fs::exists(path)) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
      throw store::StoreError("NodeKey: Failed to open key file: " + path.string());
    }
    Bytes key((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    if (key.size() != cipher.key_size()) {
      BOOST_LOG_TRIVIAL(error) << "NodeKey: Key file " << path.string() << " holds "
                               << key.size() << " bytes";
      throw crypto::KeyLengthError(key.size(), cipher.key_size());
    }
    BOOST_LOG_TRIVIAL(info) << "NodeKey: Loaded node key from " << path.string();
    return key;
  }

  BOOST_LOG_TRIVIAL(info) << "NodeKey: No key at " << path.string() << ", generating a new one";
  Bytes key = cipher.generate_key();

  std::error_code ec;
  if (path.has_parent_path()) {
    fs::create_directories(path.parent_path(), ec);
    if (ec) {
      throw store::StoreError("NodeKey: Failed to create directory for " + path.string() + ": " + ec.message());
    }
  }

  {
    std::ofstream file(path, std::ios::binary | std::ios::trunc);
    if (!file) {
      throw store::StoreError("NodeKey: Failed to create key file: " + path.string());
    }
    file.write(reinterpret_cast<const char*>(key.data()), static_cast<std::streamsize>(key.size()));
    if (!file) {
      throw store::StoreError("NodeKey: Failed to write key file: " + path.string());
    }
  }

  fs::permissions(path, fs::perms::owner_read | fs::perms::owner_write, fs::perm_options::replace, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(warning) << "NodeKey: Could not restrict permissions on " << path.string()
                               << ": " << ec.message();
  }
  return key;
}

} // namespace quloud::node
