#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "bus/local_bus.hpp"
#include "bus/tcp_link.hpp"

namespace quloud {
namespace bus {

// Message bus spanning processes over plain TCP links.
//
// Incoming connections are accepted on an io_context thread; both sides
// exchange node ids before a TcpLink is created. Frames arriving on a link
// are handed to local subscribers through a LocalBus and never forwarded
// again, so every published message crosses at most one hop.
class TcpBus : public MessageBus {
public:
  static constexpr std::chrono::milliseconds DEFAULT_HANDSHAKE_TIMEOUT{5000};

  // -- CONSTRUCTOR AND DESTRUCTOR ----
  // Port 0 binds an ephemeral port, see port()
  TcpBus(std::string node_id, std::string address, uint16_t port,
         Destinations destinations = Destinations{});
  ~TcpBus() override;

  TcpBus(const TcpBus&) = delete;
  TcpBus& operator=(const TcpBus&) = delete;


  // ---- INITIALIZATION AND TEARDOWN ----
  bool start_listener();
  void stop() override;
  // Time an accepted connection has to send its id; set before start_listener()
  void set_handshake_timeout(std::chrono::milliseconds timeout);


  // ---- CONNECTION INITIATION ----
  // Connects to a remote bus and performs the id handshake
  bool connect(const std::string& remote_address, uint16_t remote_port);


  // ---- MESSAGE BUS OPERATIONS ----
  // Work-queue destinations go to one consumer in turn (this process if it
  // subscribed, or one link); everything else goes to every consumer.
  void publish(const std::string& destination, const Bytes& payload) override;
  void subscribe(const std::string& source, Handler handler) override;


  // ---- GETTERS ----
  uint16_t port() const { return bound_port_; }
  const std::string& node_id() const { return node_id_; }
  std::size_t link_count() const;
  bool has_link(const std::string& peer_id) const;

private:

  // ---- PARAMETERS ----
  const std::string node_id_;
  const std::string address_;
  const uint16_t port_;
  uint16_t bound_port_;
  Destinations destinations_;
  std::chrono::milliseconds handshake_timeout_;

  // Server state
  std::unique_ptr<std::thread> io_thread_;
  bool is_running_;
  bool stopped_;

  // Incoming connection handlers
  boost::asio::io_context io_context_;
  std::unique_ptr<boost::asio::ip::tcp::acceptor> acceptor_;

  // Local delivery and connected peers
  LocalBus local_;
  std::map<std::string, std::shared_ptr<TcpLink>> links_;
  std::map<std::string, std::size_t> next_consumer_;
  mutable std::mutex mutex_;


  // ---- INITIALIZATION AND TEARDOWN ----
  // Main listening loop that handles incoming connections
  void start_accept();


  // ---- HANDSHAKE ----
  // Sends local id then waits for the remote id
  bool initiate_handshake(std::shared_ptr<boost::asio::ip::tcp::socket> socket);
  // Reads remote id asynchronously under a deadline, then answers with the local one
  void receive_handshake(std::shared_ptr<boost::asio::ip::tcp::socket> socket);
  void finish_handshake(std::shared_ptr<boost::asio::ip::tcp::socket> socket, const std::string& peer_id);
  void send_id(boost::asio::ip::tcp::socket& socket);
  std::string read_id(boost::asio::ip::tcp::socket& socket);


  // ---- LINK MANAGEMENT ----
  bool add_link(std::shared_ptr<boost::asio::ip::tcp::socket> socket, const std::string& peer_id);
  void on_frame(const std::string& destination, Bytes payload);
  void prune_closed_links();
};

} // namespace bus
} // namespace quloud
