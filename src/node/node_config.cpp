#include "node/node_config.hpp"
#include "crypto/cipher.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>

namespace quloud::node {

std::string generate_node_id() {
  return "node-" + utils::to_hex(crypto::random_bytes(4));
}

//==============================================
// VALUE PARSING
//==============================================

uint16_t parse_port(const std::string& text) {
  std::size_t consumed = 0;
  unsigned long value = 0;
  try {
    value = std::stoul(text, &consumed);
  } catch (const std::exception&) {
    throw ConfigError("invalid port '" + text + "'");
  }
  if (consumed != text.size() || value > 65535) {
    throw ConfigError("invalid port '" + text + "'");
  }
  return static_cast<uint16_t>(value);
}

PeerAddress parse_peer(const std::string& text) {
  std::size_t delimiter_pos = text.rfind(':');
  if (delimiter_pos == std::string::npos || delimiter_pos == 0) {
    throw ConfigError("invalid peer address '" + text + "', expected host:port");
  }

  PeerAddress peer;
  peer.host = text.substr(0, delimiter_pos);
  peer.port = parse_port(text.substr(delimiter_pos + 1));
  if (peer.port == 0) {
    throw ConfigError("peer port must not be 0 in '" + text + "'");
  }
  return peer;
}

std::vector<PeerAddress> parse_peer_list(const std::string& text) {
  std::vector<PeerAddress> peers;
  std::stringstream stream(text);
  std::string entry;
  while (std::getline(stream, entry, ',')) {
    if (!entry.empty()) {
      peers.push_back(parse_peer(entry));
    }
  }
  return peers;
}

namespace {

KeyMode parse_mode_value(const std::string& text) {
  try {
    return parse_key_mode(text);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(e.what());
  }
}

logging::severity_level parse_level_value(const std::string& text) {
  try {
    return logging::parse_log_level(text);
  } catch (const std::invalid_argument& e) {
    throw ConfigError(e.what());
  }
}

std::chrono::milliseconds parse_timeout(const std::string& text) {
  std::size_t consumed = 0;
  long long value = 0;
  try {
    value = std::stoll(text, &consumed);
  } catch (const std::exception&) {
    throw ConfigError("invalid timeout '" + text + "'");
  }
  if (consumed != text.size() || value <= 0) {
    throw ConfigError("invalid timeout '" + text + "'");
  }
  return std::chrono::milliseconds(value);
}

} // namespace

//==============================================
// ENVIRONMENT
//==============================================

NodeConfig load_config_from_env(const EnvLookup& lookup) {
  NodeConfig config;

  auto value_of = [&lookup](const char* name) -> std::string {
    const char* value = lookup(name);
    return value ? std::string(value) : std::string();
  };

  std::string node_id = value_of("NODE_ID");
  config.node_id = node_id.empty() ? generate_node_id() : node_id;

  if (auto storage = value_of("STORAGE_DIR"); !storage.empty()) {
    config.storage_dir = storage;
  }
  if (auto mode = value_of("QULOUD_KEY_MODE"); !mode.empty()) {
    config.key_mode = parse_mode_value(mode);
  }
  if (auto host = value_of("QULOUD_HOST"); !host.empty()) {
    config.listen_address = host;
  }
  if (auto port = value_of("QULOUD_PORT"); !port.empty()) {
    config.listen_port = parse_port(port);
  }
  if (auto peers = value_of("QULOUD_PEERS"); !peers.empty()) {
    config.peers = parse_peer_list(peers);
  }
  if (auto level = value_of("QULOUD_LOG_LEVEL"); !level.empty()) {
    config.log_level = parse_level_value(level);
  }
  config.log_file = value_of("QULOUD_LOG_FILE");
  if (auto timeout = value_of("QULOUD_TIMEOUT_MS"); !timeout.empty()) {
    config.response_timeout = parse_timeout(timeout);
  }

  return config;
}

//==============================================
// COMMAND LINE
//==============================================

void apply_command_line(NodeConfig& config, int argc, const char* const argv[]) {
  for (int i = 1; i < argc; ++i) {
    const std::string flag(argv[i]);
    if (i + 1 >= argc) {
      throw ConfigError("missing value for " + flag);
    }
    const std::string value(argv[++i]);

    if (flag == "-h" || flag == "--host") {
      config.listen_address = value;
    } else if (flag == "-p" || flag == "--port") {
      config.listen_port = parse_port(value);
    } else if (flag == "-b" || flag == "--peer") {
      config.peers.push_back(parse_peer(value));
    } else if (flag == "-i" || flag == "--id") {
      config.node_id = value;
    } else if (flag == "-s" || flag == "--storage") {
      config.storage_dir = value;
    } else if (flag == "-m" || flag == "--mode") {
      config.key_mode = parse_mode_value(value);
    } else if (flag == "-l" || flag == "--log-level") {
      config.log_level = parse_level_value(value);
    } else if (flag == "-f" || flag == "--log-file") {
      config.log_file = value;
    } else {
      throw ConfigError("unknown argument " + flag);
    }
  }

  if (config.node_id.empty()) {
    throw ConfigError("node id must not be empty");
  }
}

} // namespace quloud::node
