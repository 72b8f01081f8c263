#include "cli/cli.hpp"
#include "node/node_config.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iostream>
#include <iterator>
#include <sstream>

namespace quloud {
namespace cli {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(client::OwnerClient& client, Connector connector, std::chrono::milliseconds timeout)
  : running_(false)
  , timeout_(timeout)
  , client_(client)
  , connector_(std::move(connector)) {
  BOOST_LOG_TRIVIAL(info) << "CLI initialized";
}


//==============================================
// STARTUP
//==============================================

void CLI::run() {
  running_ = true;
  std::string line;

  BOOST_LOG_TRIVIAL(info) << "Starting CLI loop";
  std::cout << "Quloud_Shell> " << std::flush;

  while (running_ && std::getline(std::cin, line)) {
    std::istringstream iss(line);
    std::string command;
    std::vector<std::string> args;

    iss >> command;
    for (std::string arg; iss >> arg;) {
      args.push_back(arg);
    }

    if (command == "quit") {
      running_ = false;
      continue;
    }
    if (!command.empty()) {
      process_command(command, args);
    }

    if (running_) {
      std::cout << "Quloud_Shell> " << std::flush;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "CLI loop ended";
}


//==============================================
// COMMAND PROCESSING
//==============================================

void CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  BOOST_LOG_TRIVIAL(debug) << "Processing command: " << command << " with " << args.size() << " arguments";

  if (command == "store" && (args.size() == 2 || args.size() == 3)) {
    std::size_t replicas = 1;
    if (args.size() == 3) {
      try {
        replicas = std::stoul(args[2]);
      } catch (const std::exception&) {
        std::cout << "Invalid replica count: " << args[2] << std::endl;
        return;
      }
    }
    handle_store_command(args[0], args[1], replicas);
  }
  else if (command == "read" && args.size() == 1) {
    handle_read_command(args[0]);
  }
  else if (command == "restore" && args.size() == 1) {
    handle_restore_command(args[0]);
  }
  else if (command == "prove" && args.size() == 1) {
    handle_prove_command(args[0]);
  }
  else if (command == "delete" && args.size() == 1) {
    handle_delete_command(args[0]);
  }
  else if (command == "connect" && args.size() == 1) {
    handle_connect_command(args[0]);
  }
  else if (command == "help" && args.empty()) {
    handle_help_command();
  }
  else {
    std::cout << "Unknown command or invalid arguments (try 'help')" << std::endl;
  }
}

void CLI::handle_store_command(const std::string& blob_id, const std::string& path, std::size_t replicas) {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    std::cout << "Error opening file: " << path << std::endl;
    return;
  }
  Bytes data((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());

  try {
    auto acknowledgements = client_.store_blob(blob_id, data, replicas);
    std::size_t stored = 0;
    for (auto& ack : acknowledgements) {
      if (ack.wait_for(timeout_) == std::future_status::ready && ack.get().stored) {
        ++stored;
      }
    }
    std::cout << "Stored " << blob_id << " locally, " << stored << " of " << replicas
              << " replicas acknowledged" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error storing blob", e.what());
  }
}

void CLI::handle_read_command(const std::string& blob_id) {
  try {
    auto response = client_.retrieve_blob(blob_id);
    if (!response.found) {
      std::cout << "Blob " << blob_id << " is not held locally (try 'restore " << blob_id << "')" << std::endl;
      return;
    }
    std::cout << utils::to_string(*response.data) << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error reading blob", e.what());
  }
}

void CLI::handle_restore_command(const std::string& blob_id) {
  try {
    bool restored = client_.restore_blob(blob_id, timeout_);
    std::cout << (restored ? "Restored " : "Could not restore ") << blob_id << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error restoring blob", e.what());
  }
}

void CLI::handle_prove_command(const std::string& blob_id) {
  try {
    Bytes seed = client::OwnerClient::generate_seed();
    auto pending = client_.request_proof(blob_id, seed);
    if (pending.wait_for(timeout_) != std::future_status::ready) {
      std::cout << "No proof received for " << blob_id << std::endl;
      return;
    }

    auto response = pending.get();
    if (!response.found) {
      std::cout << "Node " << response.node_id << " does not hold " << blob_id << std::endl;
      return;
    }
    bool valid = client_.verify_proof(response, seed);
    std::cout << "Proof from " << response.node_id << (valid ? " verified" : " INVALID") << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error proving storage", e.what());
  }
}

void CLI::handle_delete_command(const std::string& blob_id) {
  try {
    client_.delete_blob(blob_id);
    std::cout << "Blob deleted and erasure broadcast" << std::endl;
  } catch (const std::exception& e) {
    log_and_display_error("Error deleting blob", e.what());
  }
}

void CLI::handle_connect_command(const std::string& connection_string) {
  node::PeerAddress peer;
  try {
    peer = node::parse_peer(connection_string);
  } catch (const std::exception&) {
    std::cout << "Invalid format. Usage: connect ip:port (e.g., connect 127.0.0.1:3002)" << std::endl;
    return;
  }

  bool success = connector_ && connector_(peer.host, peer.port);
  std::cout << (success ? "Successfully connected to " : "Failed to connect to ")
            << peer.host << ":" << peer.port << std::endl;
}

void CLI::handle_help_command() {
  std::cout << "Available commands:" << std::endl;
  std::cout << "  help                        Display this help message" << std::endl;
  std::cout << "  store <id> <file> [copies]  Encrypt <file> as blob <id> and replicate it" << std::endl;
  std::cout << "  read <id>                   Decrypt and print the local copy of <id>" << std::endl;
  std::cout << "  restore <id>                Rebuild the local copy of <id> from a storage node" << std::endl;
  std::cout << "  prove <id>                  Challenge a storage node to prove it holds <id>" << std::endl;
  std::cout << "  delete <id>                 Shred <id> locally and on every node" << std::endl;
  std::cout << "  connect <ip:port>           Connect to the node at <ip:port>" << std::endl;
  std::cout << "  quit                        Exit the shell" << std::endl << std::endl;
}

void CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << message << ": " << error;
  std::cout << message << ": " << error << std::endl;
}

} // namespace cli
} // namespace quloud
