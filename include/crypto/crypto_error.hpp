#ifndef BLOBSHARD_CRYPTO_ERROR_HPP
#define BLOBSHARD_CRYPTO_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blobshard::crypto {

class CryptoError : public std::runtime_error {
public:
    explicit CryptoError(const std::string& message) 
        : std::runtime_error(message) {}
};

class DigestError : public CryptoError {
public:
    explicit DigestError(const std::string& message) 
        : CryptoError("Digest error: " + message) {}
};

class ContentIdError : public CryptoError {
public:
    explicit ContentIdError(const std::string& message) 
        : CryptoError("Content ID error: " + message) {}
};

} // namespace blobshard::crypto

#endif // BLOBSHARD_CRYPTO_ERROR_HPP
