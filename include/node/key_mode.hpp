#ifndef QULOUD_NODE_KEY_MODE_HPP
#define QULOUD_NODE_KEY_MODE_HPP

#include <filesystem>
#include <optional>
#include <string>
#include <utility>
#include "crypto/cipher.hpp"

namespace quloud::node {

// Deployment profile of a storage node. One mode per vault, never switched live.
enum class KeyMode {
  PerDocument,  // fresh key per blob, kept in the KeyVault
  NodeKeyed     // one node key for every blob
};

// Throws std::invalid_argument for anything but "per-document" / "node-keyed"
KeyMode parse_key_mode(const std::string& text);
std::string to_string(KeyMode mode);

// Key material a node encrypts with, handed to the components that need it
struct NodeKeys {
  KeyMode mode = KeyMode::PerDocument;
  std::optional<Bytes> node_key;  // set in NodeKeyed mode only

  static NodeKeys per_document() { return NodeKeys{KeyMode::PerDocument, std::nullopt}; }
  static NodeKeys node_keyed(Bytes key) { return NodeKeys{KeyMode::NodeKeyed, std::move(key)}; }
};

// Reads the node key from path, or generates and persists one (mode 0600)
// when the file does not exist. Throws crypto::KeyLengthError if the file
// holds a key of the wrong size and store::StoreError on I/O failure.
Bytes load_or_create_node_key(const std::filesystem::path& path, const crypto::Cipher& cipher);

} // namespace quloud::node

#endif // QULOUD_NODE_KEY_MODE_HPP
