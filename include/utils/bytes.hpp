#ifndef QULOUD_UTILS_BYTES_HPP
#define QULOUD_UTILS_BYTES_HPP

#include <cstdint>
#include <string>
#include <vector>

namespace quloud {

// Raw binary payload used by every layer (blobs, keys, seeds, proofs)
using Bytes = std::vector<uint8_t>;

namespace utils {

// Copies the characters of a string into a byte vector
Bytes to_bytes(const std::string& text);
// Copies a byte vector into a string (binary safe)
std::string to_string(const Bytes& data);
// Lowercase hex of the whole buffer
std::string to_hex(const Bytes& data);
// Hex of the first max_bytes bytes, followed by ".." when truncated.
// Used in log lines so large payloads never end up in the log.
std::string hex_preview(const Bytes& data, std::size_t max_bytes = 8);

} // namespace utils
} // namespace quloud

#endif // QULOUD_UTILS_BYTES_HPP
