#ifndef QULOUD_CRYPTO_DIGEST_HPP
#define QULOUD_CRYPTO_DIGEST_HPP

#include <cstddef>
#include <string>
#include "crypto_error.hpp"
#include "utils/bytes.hpp"

namespace quloud::crypto {

constexpr std::size_t SHA256_SIZE = 32;

// SHA-256 over the concatenation of the given parts, in order
Bytes sha256(const Bytes& first, const Bytes& second = {});
// Lowercase hex SHA-256 of a string, used for content-addressed paths
std::string sha256_hex(const std::string& text);

// Constant-time equality for digests and tags
bool constant_time_equal(const Bytes& lhs, const Bytes& rhs);

} // namespace quloud::crypto

#endif // QULOUD_CRYPTO_DIGEST_HPP
