#include "bus/tcp_bus.hpp"
#include "cli/cli.hpp"
#include "logger/logger.hpp"
#include "node/node_config.hpp"
#include "node/storage_node.hpp"
#include "store/file_byte_store.hpp"
#include <boost/log/trivial.hpp>
#include <cstdlib>
#include <iostream>
#include <optional>
#include <string>

void print_usage(const std::string& program_name) {
  std::cerr << "Usage: " << program_name << " [options]\n"
        << "Options:\n"
        << "  -h, --host        Listen address (QULOUD_HOST, default 127.0.0.1)\n"
        << "  -p, --port        Listen port (QULOUD_PORT, default 3001)\n"
        << "  -b, --peer        Peer host:port, repeatable (QULOUD_PEERS)\n"
        << "  -i, --id          Node id (NODE_ID, default random)\n"
        << "  -s, --storage     Storage directory (STORAGE_DIR, default ./data)\n"
        << "  -m, --mode        Key mode: per-document or node-keyed (QULOUD_KEY_MODE)\n"
        << "  -l, --log-level   trace, debug, info, warning, error, fatal (QULOUD_LOG_LEVEL)\n"
        << "  -f, --log-file    Also write logs to this file (QULOUD_LOG_FILE)\n"
        << "Example: " << program_name << " -h 127.0.0.1 -p 3002 -b 127.0.0.1:3001\n";
}

namespace {

// Stops the bus when the components subscribed to it go out of scope
struct BusStopper {
  quloud::bus::TcpBus& bus;
  ~BusStopper() { bus.stop(); }
};

} // namespace

// Runs the storage node and the owner shell until the user quits
void serve(const quloud::node::NodeConfig& config, quloud::bus::TcpBus& bus) {
  using namespace quloud;

  const auto owner_root = config.storage_dir / "owner";
  store::FileByteStore owner_blob_backend(owner_root / "blobs");
  store::FileByteStore owner_key_backend(owner_root / "keys");
  store::BlobStore owner_blobs(owner_blob_backend);
  store::KeyVault owner_vault(owner_key_backend);
  crypto::AesGcmCipher cipher;

  // Handlers capture these, so the stopper is declared after them and runs first
  std::optional<node::StorageNode> storage_node;
  std::optional<client::OwnerClient> owner;
  BusStopper stopper{bus};

  storage_node.emplace(config.node_id, config.storage_dir / "node", config.key_mode, bus, config.destinations);
  storage_node->start();
  owner.emplace(cipher, owner_blobs, owner_vault, bus, config.destinations);

  cli::CLI cli(*owner,
               [&bus](const std::string& host, uint16_t port) { return bus.connect(host, port); },
               config.response_timeout);

  BOOST_LOG_TRIVIAL(info) << "Main: Node " << config.node_id << " listening on "
                          << config.listen_address << ":" << bus.port()
                          << " in " << node::to_string(config.key_mode) << " mode";
  cli.run();
}

bool run_node(const quloud::node::NodeConfig& config) {
  using namespace quloud;

  try {
    bus::TcpBus bus(config.node_id, config.listen_address, config.listen_port, config.destinations);
    if (!bus.start_listener()) {
      std::cerr << "Error: Failed to listen on " << config.listen_address << ":" << config.listen_port << '\n';
      return false;
    }
    for (const auto& peer : config.peers) {
      if (!bus.connect(peer.host, peer.port)) {
        BOOST_LOG_TRIVIAL(warning) << "Main: Could not reach peer " << peer.host << ":" << peer.port;
      }
    }

    serve(config, bus);
    return true;
  } catch (const std::exception& e) {
    std::cerr << "Error: Failed to start node: " << e.what() << '\n';
    return false;
  }
}

int main(int argc, char* argv[]) {
  quloud::node::NodeConfig config;
  try {
    config = quloud::node::load_config_from_env([](const char* name) { return std::getenv(name); });
    quloud::node::apply_command_line(config, argc, argv);
  } catch (const quloud::node::ConfigError& e) {
    std::cerr << "Error: " << e.what() << '\n';
    print_usage(argv[0]);
    return 1;
  }

  quloud::logging::init_logging(config.log_file, config.log_level);

  if (!run_node(config)) {
    return 1;
  }
  return 0;
}
