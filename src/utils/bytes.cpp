#include "utils/bytes.hpp"
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace quloud {
namespace utils {

Bytes to_bytes(const std::string& text) {
  return Bytes(text.begin(), text.end());
}

std::string to_string(const Bytes& data) {
  return std::string(data.begin(), data.end());
}

std::string to_hex(const Bytes& data) {
  std::stringstream ss;
  for (uint8_t byte : data) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

std::string hex_preview(const Bytes& data, std::size_t max_bytes) {
  std::size_t count = std::min(max_bytes, data.size());
  std::string preview = to_hex(Bytes(data.begin(), data.begin() + count));
  if (count < data.size()) {
    preview += "..";
  }
  return preview;
}

} // namespace utils
} // namespace quloud
