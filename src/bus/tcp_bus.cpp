#include "bus/tcp_bus.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <vector>

namespace quloud {
namespace bus {

namespace {
// Node ids longer than this are refused during the handshake
constexpr std::uint32_t MAX_ID_LENGTH = 256;

// Per-connection state of an inbound handshake
struct InboundHandshake {
  explicit InboundHandshake(boost::asio::io_context& io_context) : deadline(io_context) {}

  boost::asio::steady_timer deadline;
  std::uint32_t network_length = 0;
  std::string peer_id;
};

void abort_handshake(boost::asio::ip::tcp::socket& socket, const std::string& reason) {
  BOOST_LOG_TRIVIAL(error) << "TCP bus: Handshake failed: " << reason;
  boost::system::error_code ec;
  socket.close(ec);
}
}

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpBus::TcpBus(std::string node_id, std::string address, uint16_t port, Destinations destinations)
  : node_id_(std::move(node_id))
  , address_(std::move(address))
  , port_(port)
  , bound_port_(port)
  , destinations_(std::move(destinations))
  , handshake_timeout_(DEFAULT_HANDSHAKE_TIMEOUT)
  , is_running_(false)
  , stopped_(false)
  , local_(destinations_) {
  BOOST_LOG_TRIVIAL(info) << "TCP bus: Initializing node " << node_id_ << " on " << address_ << ":" << port_;
}

TcpBus::~TcpBus() {
  stop();
}


//==============================================
// INITIALIZATION AND TEARDOWN
//==============================================

bool TcpBus::start_listener() {
  if (is_running_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP bus: Listener already running";
    return false;
  }

  try {
    // Create endpoint and acceptor
    boost::asio::ip::tcp::endpoint endpoint(boost::asio::ip::make_address(address_), port_);
    acceptor_ = std::make_unique<boost::asio::ip::tcp::acceptor>(io_context_, endpoint);
    bound_port_ = acceptor_->local_endpoint().port();

    is_running_ = true;

    // Start accepting connections
    start_accept();

    // Start io_context in a separate thread
    io_thread_ = std::make_unique<std::thread>([this]() {
      try {
        auto work_guard = boost::asio::make_work_guard(io_context_);
        io_context_.run();
      } catch (const std::exception& e) {
        BOOST_LOG_TRIVIAL(error) << "TCP bus: IO context error: " << e.what();
        is_running_ = false;
      }
    });

    BOOST_LOG_TRIVIAL(info) << "TCP bus: Listening on " << address_ << ":" << bound_port_;
    return true;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP bus: Failed to start listener: " << e.what();
    return false;
  }
}

void TcpBus::start_accept() {
  if (!acceptor_ || !is_running_) {
    return;
  }

  // Create new socket for incoming connection
  auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context_);

  acceptor_->async_accept(*socket,
    [this, socket](const boost::system::error_code& error) {
      if (!error) {
        receive_handshake(socket);
      } else if (error != boost::asio::error::operation_aborted) {
        BOOST_LOG_TRIVIAL(error) << "TCP bus: Accept error: " << error.message();
      }
      start_accept();  // Continue accepting new connections
    });
}

void TcpBus::stop() {
  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return;
    }
    stopped_ = true;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP bus: Initiating shutdown";

  is_running_ = false;

  // Stop io_context and wait for io_thread to finish
  io_context_.stop();
  if (io_thread_ && io_thread_->joinable()) {
    io_thread_->join();
  }

  // Stop accepting new connections
  if (acceptor_ && acceptor_->is_open()) {
    boost::system::error_code ec;
    acceptor_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP bus: Error closing acceptor: " << ec.message();
    }
  }

  std::map<std::string, std::shared_ptr<TcpLink>> links;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    links.swap(links_);
  }
  for (auto& entry : links) {
    entry.second->stop_processing();
  }

  local_.stop();
  BOOST_LOG_TRIVIAL(info) << "TCP bus: Shutdown complete";
}


//==============================================
// CONNECTION INITIATION
//==============================================

bool TcpBus::connect(const std::string& remote_address, uint16_t remote_port) {
  auto socket = std::make_shared<boost::asio::ip::tcp::socket>(io_context_);

  try {
    // Resolve remote address to endpoints and connect to the first available one
    boost::asio::ip::tcp::resolver resolver(io_context_);
    auto endpoints = resolver.resolve(remote_address, std::to_string(remote_port));
    boost::asio::connect(*socket, endpoints);
    BOOST_LOG_TRIVIAL(info) << "TCP bus: Connected to " << remote_address << ":" << remote_port;
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP bus: Connection to " << remote_address << ":" << remote_port
                             << " failed: " << e.what();
    return false;
  }

  return initiate_handshake(socket);
}


//==============================================
// HANDSHAKE
//==============================================

bool TcpBus::initiate_handshake(std::shared_ptr<boost::asio::ip::tcp::socket> socket) {
  try {
    send_id(*socket);
    std::string peer_id = read_id(*socket);
    return add_link(socket, peer_id);
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "TCP bus: Handshake failed: " << e.what();
    boost::system::error_code ec;
    socket->close(ec);
    return false;
  }
}

// Runs on the io thread without blocking it: a connection that never sends
// its id is closed when the deadline fires
void TcpBus::receive_handshake(std::shared_ptr<boost::asio::ip::tcp::socket> socket) {
  auto handshake = std::make_shared<InboundHandshake>(io_context_);

  handshake->deadline.expires_after(handshake_timeout_);
  handshake->deadline.async_wait([socket](const boost::system::error_code& error) {
    if (!error) {
      abort_handshake(*socket, "peer did not identify itself in time");
    }
  });

  boost::asio::async_read(*socket,
    boost::asio::buffer(&handshake->network_length, sizeof(handshake->network_length)),
    [this, socket, handshake](const boost::system::error_code& error, std::size_t) {
      if (error) {
        handshake->deadline.cancel();
        abort_handshake(*socket, error.message());
        return;
      }

      std::uint32_t length = boost::endian::big_to_native(handshake->network_length);
      if (length == 0 || length > MAX_ID_LENGTH) {
        handshake->deadline.cancel();
        abort_handshake(*socket, "invalid peer id length " + std::to_string(length));
        return;
      }

      handshake->peer_id.assign(length, '\0');
      boost::asio::async_read(*socket, boost::asio::buffer(&handshake->peer_id[0], length),
        [this, socket, handshake](const boost::system::error_code& error, std::size_t) {
          handshake->deadline.cancel();
          if (error) {
            abort_handshake(*socket, error.message());
            return;
          }
          BOOST_LOG_TRIVIAL(debug) << "TCP bus: Received id " << handshake->peer_id;
          finish_handshake(socket, handshake->peer_id);
        });
    });
}

void TcpBus::finish_handshake(std::shared_ptr<boost::asio::ip::tcp::socket> socket, const std::string& peer_id) {
  try {
    if (has_link(peer_id)) {
      BOOST_LOG_TRIVIAL(warning) << "TCP bus: Peer " << peer_id << " already connected";
      boost::system::error_code ec;
      socket->close(ec);
      return;
    }
    send_id(*socket);
    add_link(socket, peer_id);
  } catch (const std::exception& e) {
    abort_handshake(*socket, e.what());
  }
}

void TcpBus::set_handshake_timeout(std::chrono::milliseconds timeout) {
  handshake_timeout_ = timeout;
}

void TcpBus::send_id(boost::asio::ip::tcp::socket& socket) {
  std::uint32_t network_length = boost::endian::native_to_big(static_cast<std::uint32_t>(node_id_.size()));
  std::vector<boost::asio::const_buffer> buffers{
    boost::asio::buffer(&network_length, sizeof(network_length)),
    boost::asio::buffer(node_id_)
  };
  boost::asio::write(socket, buffers);
  BOOST_LOG_TRIVIAL(debug) << "TCP bus: Sent id " << node_id_;
}

std::string TcpBus::read_id(boost::asio::ip::tcp::socket& socket) {
  std::uint32_t network_length = 0;
  boost::asio::read(socket, boost::asio::buffer(&network_length, sizeof(network_length)));
  std::uint32_t length = boost::endian::big_to_native(network_length);
  if (length == 0 || length > MAX_ID_LENGTH) {
    throw BusError("invalid peer id length " + std::to_string(length));
  }

  std::string peer_id(length, '\0');
  boost::asio::read(socket, boost::asio::buffer(&peer_id[0], peer_id.size()));
  BOOST_LOG_TRIVIAL(debug) << "TCP bus: Received id " << peer_id;
  return peer_id;
}


//==============================================
// LINK MANAGEMENT
//==============================================

bool TcpBus::add_link(std::shared_ptr<boost::asio::ip::tcp::socket> socket, const std::string& peer_id) {
  if (peer_id == node_id_) {
    BOOST_LOG_TRIVIAL(warning) << "TCP bus: Refusing link to self (" << peer_id << ")";
    socket->close();
    return false;
  }

  auto link = std::make_shared<TcpLink>(peer_id, socket);
  link->set_frame_processor([this](const std::string& destination, Bytes payload) {
    on_frame(destination, std::move(payload));
  });

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      return false;
    }
    auto existing = links_.find(peer_id);
    if (existing != links_.end() && existing->second->is_open()) {
      BOOST_LOG_TRIVIAL(warning) << "TCP bus: Peer " << peer_id << " already connected";
      return false;
    }
    links_[peer_id] = link;
  }

  if (!link->start_processing()) {
    std::lock_guard<std::mutex> lock(mutex_);
    links_.erase(peer_id);
    return false;
  }

  BOOST_LOG_TRIVIAL(info) << "TCP bus: Linked with peer " << peer_id;
  return true;
}

void TcpBus::on_frame(const std::string& destination, Bytes payload) {
  local_.publish(destination, payload);
}

void TcpBus::prune_closed_links() {
  std::vector<std::shared_ptr<TcpLink>> closed;
  {
    std::lock_guard<std::mutex> lock(mutex_);
    for (auto it = links_.begin(); it != links_.end();) {
      if (!it->second->is_open()) {
        BOOST_LOG_TRIVIAL(info) << "TCP bus: Dropping closed link to " << it->first;
        closed.push_back(it->second);
        it = links_.erase(it);
      } else {
        ++it;
      }
    }
  }
  for (auto& link : closed) {
    link->stop_processing();
  }
}


//==============================================
// MESSAGE BUS OPERATIONS
//==============================================

void TcpBus::publish(const std::string& destination, const Bytes& payload) {
  prune_closed_links();

  bool local_consumer = local_.has_subscriber(destination);
  std::vector<std::shared_ptr<TcpLink>> remote;
  std::shared_ptr<TcpLink> chosen;
  bool deliver_locally = false;

  {
    std::lock_guard<std::mutex> lock(mutex_);
    if (stopped_) {
      BOOST_LOG_TRIVIAL(warning) << "TCP bus: Dropping message for " << destination << ", bus stopped";
      return;
    }

    if (destinations_.is_work_queue(destination)) {
      // Candidates in a stable order: this process first, then links by id
      std::vector<std::shared_ptr<TcpLink>> candidates;
      if (local_consumer) {
        candidates.push_back(nullptr);
      }
      for (auto& entry : links_) {
        candidates.push_back(entry.second);
      }
      if (candidates.empty()) {
        BOOST_LOG_TRIVIAL(warning) << "TCP bus: No consumer for " << destination << ", message dropped";
        return;
      }
      std::size_t& next = next_consumer_[destination];
      chosen = candidates[next % candidates.size()];
      ++next;
      deliver_locally = (chosen == nullptr);
    } else {
      deliver_locally = local_consumer;
      for (auto& entry : links_) {
        remote.push_back(entry.second);
      }
    }
  }

  if (deliver_locally) {
    local_.publish(destination, payload);
  }
  if (chosen) {
    remote.push_back(chosen);
  }

  std::size_t sent = 0;
  for (auto& link : remote) {
    if (link->send_frame(destination, payload)) {
      ++sent;
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "TCP bus: Published to " << destination << " ("
                           << (deliver_locally ? "local, " : "") << sent << " of "
                           << remote.size() << " links)";
}

void TcpBus::subscribe(const std::string& source, Handler handler) {
  local_.subscribe(source, std::move(handler));
}


//==============================================
// GETTERS
//==============================================

std::size_t TcpBus::link_count() const {
  std::lock_guard<std::mutex> lock(mutex_);
  std::size_t open = 0;
  for (const auto& entry : links_) {
    if (entry.second->is_open()) {
      ++open;
    }
  }
  return open;
}

bool TcpBus::has_link(const std::string& peer_id) const {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = links_.find(peer_id);
  return it != links_.end() && it->second->is_open();
}

} // namespace bus
} // namespace quloud
