#pragma once

#include <boost/asio.hpp>
#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include "utils/bytes.hpp"

namespace quloud {
namespace bus {

// One connected peer of the TCP bus. Frames on the wire are
//   uint64 big-endian size | uint32 big-endian destination length | destination | payload
// where size covers everything after itself.
class TcpLink {
public:
    using FrameProcessor = std::function<void(const std::string& destination, Bytes payload)>;

    static constexpr std::uint64_t MAX_FRAME_SIZE = 512ull * 1024 * 1024;

    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    TcpLink(std::string peer_id, std::shared_ptr<boost::asio::ip::tcp::socket> socket);
    ~TcpLink();

    TcpLink(const TcpLink&) = delete;
    TcpLink& operator=(const TcpLink&) = delete;


    // ---- STREAM CONTROL OPERATIONS ----
    void set_frame_processor(FrameProcessor processor);
    // Starts the reader thread. Fails if the socket is closed or no processor is set.
    bool start_processing();
    // Shuts the socket down and joins the reader thread
    void stop_processing();


    // ---- OUTGOING FRAMES ----
    bool send_frame(const std::string& destination, const Bytes& payload);


    // ---- GETTERS ----
    bool is_open() const { return open_; }

private:
    // ---- PARAMETERS ----
    std::string peer_id_;
    std::shared_ptr<boost::asio::ip::tcp::socket> socket_;
    FrameProcessor frame_processor_;
    std::unique_ptr<std::thread> processing_thread_;
    std::atomic<bool> processing_active_{false};
    std::atomic<bool> open_{true};
    std::mutex io_mutex_;


    // ---- INCOMING FRAME PROCESSING ----
    void process_stream();
    bool read_frame(std::string& destination, Bytes& payload);
    void close_socket();
};

} // namespace bus
} // namespace quloud
