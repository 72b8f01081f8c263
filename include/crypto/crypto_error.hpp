#ifndef QULOUD_CRYPTO_ERROR_HPP
#define QULOUD_CRYPTO_ERROR_HPP

#include <cstddef>
#include <stdexcept>
#include <string>

namespace quloud::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message)
        : std::runtime_error(message) {}
};

// Key is not the fixed cipher key length (raised on both encrypt and decrypt)
class KeyLengthError : public CryptoError {
public:
    KeyLengthError(std::size_t actual, std::size_t expected)
        : CryptoError("Key length error: got " + std::to_string(actual) +
                      " bytes, expected " + std::to_string(expected))
        , actual_(actual) {}

    std::size_t actual() const { return actual_; }

private:
    std::size_t actual_;
};

// Integrity check failed: tampered ciphertext or wrong key
class AuthenticationError : public CryptoError {
public:
    explicit AuthenticationError(const std::string& message)
        : CryptoError("Authentication error: " + message) {}
};

class EncryptionError : public CryptoError {
public:
    explicit EncryptionError(const std::string& message)
        : CryptoError("Encryption error: " + message) {}
};

class DecryptionError : public CryptoError {
public:
    explicit DecryptionError(const std::string& message)
        : CryptoError("Decryption error: " + message) {}
};

class RandomError : public CryptoError {
public:
    explicit RandomError(const std::string& message)
        : CryptoError("Random generator error: " + message) {}
};

} // namespace quloud::crypto

#endif // QULOUD_CRYPTO_ERROR_HPP
