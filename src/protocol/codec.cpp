#include "protocol/codec.hpp"
#include <boost/endian/conversion.hpp>
#include <boost/log/trivial.hpp>
#include <cstring>
#include <iterator>

namespace quloud::protocol {

namespace {

constexpr uint8_t MAGIC[3] = {'Q', 'L', 'D'};
constexpr std::size_t HEADER_SIZE = sizeof(MAGIC) + 2;

//==============================================
// FRAME WRITER
//==============================================

class FrameWriter {
public:
  explicit FrameWriter(MessageType type) {
    out_.insert(out_.end(), std::begin(MAGIC), std::end(MAGIC));
    out_.push_back(MessageCodec::VERSION);
    out_.push_back(static_cast<uint8_t>(type));
  }

  void write_bytes(const uint8_t* data, std::size_t size) {
    if (size > MessageCodec::MAX_FIELD_SIZE) {
      throw MessageError("field of " + std::to_string(size) + " bytes exceeds limit");
    }
    uint32_t network_size = boost::endian::native_to_big(static_cast<uint32_t>(size));
    const auto* size_bytes = reinterpret_cast<const uint8_t*>(&network_size);
    out_.insert(out_.end(), size_bytes, size_bytes + sizeof(network_size));
    out_.insert(out_.end(), data, data + size);
  }

  void write_string(const std::string& value) {
    write_bytes(reinterpret_cast<const uint8_t*>(value.data()), value.size());
  }

  void write_bytes(const Bytes& value) { write_bytes(value.data(), value.size()); }

  void write_optional(const std::optional<Bytes>& value) {
    write_bool(value.has_value());
    if (value) {
      write_bytes(*value);
    }
  }

  void write_bool(bool value) { out_.push_back(value ? 1 : 0); }

  Bytes finish() { return std::move(out_); }

private:
  Bytes out_;
};

//==============================================
// FRAME READER
//==============================================

class FrameReader {
public:
  FrameReader(const Bytes& frame, std::size_t offset) : frame_(frame), pos_(offset) {}

  Bytes read_bytes() {
    uint32_t network_size = 0;
    take(&network_size, sizeof(network_size));
    uint32_t size = boost::endian::big_to_native(network_size);
    if (size > MessageCodec::MAX_FIELD_SIZE) {
      throw MessageError("field length " + std::to_string(size) + " exceeds limit");
    }
    if (size > remaining()) {
      throw MessageError("truncated field");
    }
    Bytes value(frame_.begin() + pos_, frame_.begin() + pos_ + size);
    pos_ += size;
    return value;
  }

  std::string read_string() {
    Bytes raw = read_bytes();
    return std::string(raw.begin(), raw.end());
  }

  std::optional<Bytes> read_optional() {
    if (!read_bool()) {
      return std::nullopt;
    }
    return read_bytes();
  }

  bool read_bool() {
    uint8_t value = 0;
    take(&value, sizeof(value));
    if (value > 1) {
      throw MessageError("invalid boolean value " + std::to_string(value));
    }
    return value == 1;
  }

  // Every byte of the frame must belong to a field
  void expect_end() const {
    if (remaining() != 0) {
      throw MessageError(std::to_string(remaining()) + " trailing bytes");
    }
  }

private:
  const Bytes& frame_;
  std::size_t pos_;

  std::size_t remaining() const { return frame_.size() - pos_; }

  void take(void* out, std::size_t size) {
    if (size > remaining()) {
      throw MessageError("truncated frame");
    }
    std::memcpy(out, frame_.data() + pos_, size);
    pos_ += size;
  }
};

//==============================================
// PER-TYPE ENCODING
//==============================================

struct Encoder {
  Bytes operator()(const StoreRequest& m) const {
    FrameWriter w(MessageType::STORE_REQUEST);
    w.write_string(m.blob_id);
    w.write_bytes(m.data);
    return w.finish();
  }
  Bytes operator()(const StoreResponse& m) const {
    FrameWriter w(MessageType::STORE_RESPONSE);
    w.write_string(m.blob_id);
    w.write_string(m.node_id);
    w.write_bool(m.stored);
    return w.finish();
  }
  Bytes operator()(const RetrieveRequest& m) const {
    FrameWriter w(MessageType::RETRIEVE_REQUEST);
    w.write_string(m.blob_id);
    return w.finish();
  }
  Bytes operator()(const RetrieveResponse& m) const {
    FrameWriter w(MessageType::RETRIEVE_RESPONSE);
    w.write_string(m.blob_id);
    w.write_string(m.node_id);
    w.write_optional(m.data);
    w.write_bool(m.found);
    return w.finish();
  }
  Bytes operator()(const ProofRequest& m) const {
    FrameWriter w(MessageType::PROOF_REQUEST);
    w.write_string(m.blob_id);
    w.write_bytes(m.seed);
    return w.finish();
  }
  Bytes operator()(const ProofResponse& m) const {
    FrameWriter w(MessageType::PROOF_RESPONSE);
    w.write_string(m.blob_id);
    w.write_string(m.node_id);
    w.write_optional(m.proof);
    w.write_bool(m.found);
    return w.finish();
  }
  Bytes operator()(const DeleteRequest& m) const {
    FrameWriter w(MessageType::DELETE_REQUEST);
    w.write_string(m.blob_id);
    return w.finish();
  }
};

Message decode_body(MessageType type, FrameReader& r) {
  switch (type) {
    case MessageType::STORE_REQUEST: {
      StoreRequest m;
      m.blob_id = r.read_string();
      m.data = r.read_bytes();
      return m;
    }
    case MessageType::STORE_RESPONSE: {
      StoreResponse m;
      m.blob_id = r.read_string();
      m.node_id = r.read_string();
      m.stored = r.read_bool();
      return m;
    }
    case MessageType::RETRIEVE_REQUEST: {
      RetrieveRequest m;
      m.blob_id = r.read_string();
      return m;
    }
    case MessageType::RETRIEVE_RESPONSE: {
      RetrieveResponse m;
      m.blob_id = r.read_string();
      m.node_id = r.read_string();
      m.data = r.read_optional();
      m.found = r.read_bool();
      return m;
    }
    case MessageType::PROOF_REQUEST: {
      ProofRequest m;
      m.blob_id = r.read_string();
      m.seed = r.read_bytes();
      return m;
    }
    case MessageType::PROOF_RESPONSE: {
      ProofResponse m;
      m.blob_id = r.read_string();
      m.node_id = r.read_string();
      m.proof = r.read_optional();
      m.found = r.read_bool();
      return m;
    }
    case MessageType::DELETE_REQUEST: {
      DeleteRequest m;
      m.blob_id = r.read_string();
      return m;
    }
  }
  throw MessageError("unknown message type " + std::to_string(static_cast<int>(type)));
}

} // namespace

//==============================================
// SERIALIZATION AND DESERIALIZATION
//==============================================

Bytes MessageCodec::encode(const Message& message) {
  Bytes frame = std::visit(Encoder{}, message);
  BOOST_LOG_TRIVIAL(trace) << "Codec: Encoded " << to_string(type_of(message)) << " for blob "
                           << blob_id_of(message) << " into " << frame.size() << " bytes";
  return frame;
}

Message MessageCodec::decode(const Bytes& frame) {
  if (frame.size() < HEADER_SIZE) {
    throw MessageError("frame shorter than header");
  }
  if (std::memcmp(frame.data(), MAGIC, sizeof(MAGIC)) != 0) {
    throw MessageError("bad magic");
  }
  if (frame[3] != VERSION) {
    throw MessageError("unsupported version " + std::to_string(frame[3]));
  }

  uint8_t raw_type = frame[4];
  if (raw_type < static_cast<uint8_t>(MessageType::STORE_REQUEST) ||
      raw_type > static_cast<uint8_t>(MessageType::DELETE_REQUEST)) {
    throw MessageError("unknown message type " + std::to_string(raw_type));
  }

  FrameReader reader(frame, HEADER_SIZE);
  Message message = decode_body(static_cast<MessageType>(raw_type), reader);
  reader.expect_end();
  return message;
}

//==============================================
// MESSAGE HELPERS
//==============================================

MessageType type_of(const Message& message) {
  // Variant alternatives are declared in type byte order
  return static_cast<MessageType>(message.index() + 1);
}

const std::string& blob_id_of(const Message& message) {
  return std::visit([](const auto& m) -> const std::string& { return m.blob_id; }, message);
}

std::string to_string(MessageType type) {
  switch (type) {
    case MessageType::STORE_REQUEST:     return "StoreRequest";
    case MessageType::STORE_RESPONSE:    return "StoreResponse";
    case MessageType::RETRIEVE_REQUEST:  return "RetrieveRequest";
    case MessageType::RETRIEVE_RESPONSE: return "RetrieveResponse";
    case MessageType::PROOF_REQUEST:     return "ProofRequest";
    case MessageType::PROOF_RESPONSE:    return "ProofResponse";
    case MessageType::DELETE_REQUEST:    return "DeleteRequest";
  }
  return "Unknown";
}

} // namespace quloud::protocol
