#include "bus/tcp_link.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <cstring>

namespace quloud {
namespace bus {

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

TcpLink::TcpLink(std::string peer_id, std::shared_ptr<boost::asio::ip::tcp::socket> socket)
  : peer_id_(std::move(peer_id))
  , socket_(std::move(socket)) {
  BOOST_LOG_TRIVIAL(debug) << "TCP link: Created link to peer " << peer_id_;
}

// Cleanup connection and resources on destruction
TcpLink::~TcpLink() {
  stop_processing();
  BOOST_LOG_TRIVIAL(debug) << "TCP link: Destroyed link to peer " << peer_id_;
}


//==============================================
// STREAM CONTROL OPERATIONS
//==============================================

void TcpLink::set_frame_processor(FrameProcessor processor) {
  frame_processor_ = std::move(processor);
}

bool TcpLink::start_processing() {
  if (!socket_ || !socket_->is_open() || !frame_processor_) {
    BOOST_LOG_TRIVIAL(error) << "TCP link: Cannot start processing - socket not connected or no processor set";
    return false;
  }

  if (processing_active_) {
    BOOST_LOG_TRIVIAL(debug) << "TCP link: Stream processing already active";
    return true;
  }

  processing_active_ = true;
  processing_thread_ = std::make_unique<std::thread>(&TcpLink::process_stream, this);
  BOOST_LOG_TRIVIAL(info) << "TCP link: Processing frames from peer " << peer_id_;
  return true;
}

// Gracefully stop stream processing and cleanup resources
void TcpLink::stop_processing() {
  processing_active_ = false;
  close_socket();

  // Wait for processing thread to complete
  if (processing_thread_ && processing_thread_->joinable()) {
    processing_thread_->join();
    processing_thread_.reset();
    BOOST_LOG_TRIVIAL(debug) << "TCP link: Processing thread joined for peer " << peer_id_;
  }

  std::lock_guard<std::mutex> lock(io_mutex_);
  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;
    socket_->close(ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(error) << "TCP link: Socket close error: " << ec.message();
    }
  }
}


//==============================================
// INCOMING FRAME PROCESSING
//==============================================

void TcpLink::process_stream() {
  std::string destination;
  Bytes payload;

  while (processing_active_) {
    if (!read_frame(destination, payload)) {
      break;
    }

    try {
      frame_processor_(destination, std::move(payload));
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "TCP link: Frame processor error: " << e.what();
    }
    payload.clear();
  }

  open_ = false;
  BOOST_LOG_TRIVIAL(info) << "TCP link: Stream processing stopped for peer " << peer_id_;
}

bool TcpLink::read_frame(std::string& destination, Bytes& payload) {
  boost::system::error_code ec;

  // First read the size
  std::uint64_t network_size = 0;
  boost::asio::read(*socket_, boost::asio::buffer(&network_size, sizeof(network_size)), ec);
  if (ec) {
    if (processing_active_ && ec != boost::asio::error::eof) {
      BOOST_LOG_TRIVIAL(error) << "TCP link: Size read error from " << peer_id_ << ": " << ec.message();
    } else {
      BOOST_LOG_TRIVIAL(debug) << "TCP link: Peer " << peer_id_ << " closed the connection";
    }
    return false;
  }

  std::uint64_t size = boost::endian::big_to_native(network_size);
  if (size < sizeof(std::uint32_t) || size > MAX_FRAME_SIZE) {
    BOOST_LOG_TRIVIAL(error) << "TCP link: Invalid frame size " << size << " from " << peer_id_;
    return false;
  }

  // Now read the frame body
  Bytes body(size);
  boost::asio::read(*socket_, boost::asio::buffer(body), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP link: Read error from " << peer_id_ << ": " << ec.message();
    return false;
  }

  std::uint32_t network_length = 0;
  std::memcpy(&network_length, body.data(), sizeof(network_length));
  std::uint32_t destination_length = boost::endian::big_to_native(network_length);
  if (destination_length > size - sizeof(network_length)) {
    BOOST_LOG_TRIVIAL(error) << "TCP link: Invalid destination length from " << peer_id_;
    return false;
  }

  auto destination_begin = body.begin() + sizeof(network_length);
  destination.assign(destination_begin, destination_begin + destination_length);
  payload.assign(destination_begin + destination_length, body.end());

  BOOST_LOG_TRIVIAL(trace) << "TCP link: Received " << payload.size() << " bytes for "
                           << destination << " from " << peer_id_;
  return true;
}


//==============================================
// OUTGOING FRAMES
//==============================================

bool TcpLink::send_frame(const std::string& destination, const Bytes& payload) {
  if (!open_ || !socket_ || !socket_->is_open()) {
    BOOST_LOG_TRIVIAL(error) << "TCP link: Cannot send frame - socket to " << peer_id_ << " not connected";
    return false;
  }

  std::uint32_t network_length = boost::endian::native_to_big(static_cast<std::uint32_t>(destination.size()));
  std::uint64_t network_size = boost::endian::native_to_big(
      static_cast<std::uint64_t>(sizeof(network_length) + destination.size() + payload.size()));

  std::vector<boost::asio::const_buffer> buffers{
    boost::asio::buffer(&network_size, sizeof(network_size)),
    boost::asio::buffer(&network_length, sizeof(network_length)),
    boost::asio::buffer(destination),
    boost::asio::buffer(payload)
  };

  std::lock_guard<std::mutex> lock(io_mutex_);
  boost::system::error_code ec;
  boost::asio::write(*socket_, buffers, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "TCP link: Send error to " << peer_id_ << ": " << ec.message();
    open_ = false;
    return false;
  }

  BOOST_LOG_TRIVIAL(trace) << "TCP link: Sent " << payload.size() << " bytes for "
                           << destination << " to " << peer_id_;
  return true;
}


//==============================================
// TEARDOWN
//==============================================

void TcpLink::close_socket() {
  std::lock_guard<std::mutex> lock(io_mutex_);
  open_ = false;

  if (socket_ && socket_->is_open()) {
    boost::system::error_code ec;

    // Shutdown both send and receive operations; wakes a blocked reader
    socket_->shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    if (ec && ec != boost::asio::error::not_connected) {
      BOOST_LOG_TRIVIAL(debug) << "TCP link: Socket shutdown error: " << ec.message();
    }
  }
}

} // namespace bus
} // namespace quloud
