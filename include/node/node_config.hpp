#ifndef QULOUD_NODE_NODE_CONFIG_HPP
#define QULOUD_NODE_NODE_CONFIG_HPP

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <stdexcept>
#include <string>
#include <vector>
#include "bus/message_bus.hpp"
#include "logger/logger.hpp"
#include "node/key_mode.hpp"

namespace quloud::node {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
      : std::runtime_error("Configuration error: " + message) {}
};

struct PeerAddress {
  std::string host;
  uint16_t port = 0;
};

struct NodeConfig {
  std::string node_id;
  std::filesystem::path storage_dir = "./data";
  KeyMode key_mode = KeyMode::PerDocument;
  std::string listen_address = "127.0.0.1";
  uint16_t listen_port = 3001;
  std::vector<PeerAddress> peers;
  logging::severity_level log_level = boost::log::trivial::info;
  std::string log_file;
  bus::Destinations destinations;
  std::chrono::milliseconds response_timeout{5000};
};

// Returns the value of an environment variable or nullptr
using EnvLookup = std::function<const char*(const char*)>;

// "node-" followed by 8 random hex digits
std::string generate_node_id();

// Defaults overlaid with NODE_ID, STORAGE_DIR, QULOUD_KEY_MODE, QULOUD_HOST,
// QULOUD_PORT, QULOUD_PEERS, QULOUD_LOG_LEVEL, QULOUD_LOG_FILE and
// QULOUD_TIMEOUT_MS. Throws ConfigError on an invalid value.
NodeConfig load_config_from_env(const EnvLookup& lookup);

// Applies -h/--host, -p/--port, -b/--peer (repeatable), -i/--id,
// -s/--storage, -m/--mode, -l/--log-level, -f/--log-file on top of config.
// Throws ConfigError on unknown flags, missing values or invalid values.
void apply_command_line(NodeConfig& config, int argc, const char* const argv[]);

// ---- VALUE PARSING ----
uint16_t parse_port(const std::string& text);
// "host:port"
PeerAddress parse_peer(const std::string& text);
// Comma separated "host:port" list; empty entries are skipped
std::vector<PeerAddress> parse_peer_list(const std::string& text);

} // namespace quloud::node

#endif // QULOUD_NODE_NODE_CONFIG_HPP
