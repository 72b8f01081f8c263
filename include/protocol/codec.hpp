#ifndef QULOUD_PROTOCOL_CODEC_HPP
#define QULOUD_PROTOCOL_CODEC_HPP

#include <cstdint>
#include <stdexcept>
#include <string>
#include "protocol/messages.hpp"

namespace quloud::protocol {

class MessageError : public std::runtime_error {
public:
  explicit MessageError(const std::string& message)
      : std::runtime_error("Message error: " + message) {}
};

// Binary frame layout:
//   "QLD" | version (1 byte) | type (1 byte) | fields in declaration order
// Strings and byte fields are a big-endian uint32 length followed by the
// bytes. Optional fields carry a presence byte first. Booleans are 0 or 1.
class MessageCodec {
public:
  static constexpr uint8_t VERSION = 1;
  static constexpr uint32_t MAX_FIELD_SIZE = 256 * 1024 * 1024;

  // ---- SERIALIZATION AND DESERIALIZATION ----
  static Bytes encode(const Message& message);
  // Throws MessageError on anything but a complete, well formed frame
  static Message decode(const Bytes& frame);

  // Decodes and requires the frame to carry T
  template <typename T>
  static T decode_as(const Bytes& frame) {
    Message message = decode(frame);
    if (auto* typed = std::get_if<T>(&message)) {
      return std::move(*typed);
    }
    throw MessageError("unexpected message type " + to_string(type_of(message)));
  }
};

} // namespace quloud::protocol

#endif // QULOUD_PROTOCOL_CODEC_HPP
