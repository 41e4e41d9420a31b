#ifndef BLOBSHARD_NETWORK_ERROR_HPP
#define BLOBSHARD_NETWORK_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blobshard {
namespace network {

// Raised when a frame cannot be encoded or decoded
class CodecError : public std::runtime_error {
public:
  explicit CodecError(const std::string& message)
    : std::runtime_error("Codec error: " + message) {}
};

} // namespace network
} // namespace blobshard

#endif // BLOBSHARD_NETWORK_ERROR_HPP
