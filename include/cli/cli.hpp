#pragma once

#include <chrono>
#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "client/owner_client.hpp"

namespace quloud {
namespace cli {

// Interactive owner shell over an OwnerClient
class CLI {
public:
    // Opens a bus link to host:port
    using Connector = std::function<bool(const std::string& host, uint16_t port)>;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(client::OwnerClient& client, Connector connector, std::chrono::milliseconds timeout);


    // ---- STARTUP ----
    void run();

private:
    // ---- PARAMETERS ----
    bool running_;
    std::chrono::milliseconds timeout_;
    // System components
    client::OwnerClient& client_;
    Connector connector_;


    // ---- COMMAND PROCESSING ----
    void process_command(const std::string& command, const std::vector<std::string>& args);
    void handle_store_command(const std::string& blob_id, const std::string& path, std::size_t replicas);
    void handle_read_command(const std::string& blob_id);
    void handle_restore_command(const std::string& blob_id);
    void handle_prove_command(const std::string& blob_id);
    void handle_delete_command(const std::string& blob_id);
    void handle_connect_command(const std::string& connection_string);
    void handle_help_command();
    void log_and_display_error(const std::string& message, const std::string& error);
};

} // namespace cli
} // namespace quloud
