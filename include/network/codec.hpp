#ifndef BLOBSHARD_NETWORK_CODEC_HPP
#define BLOBSHARD_NETWORK_CODEC_HPP

#include <cstdint>
#include <iostream>
#include <boost/endian/conversion.hpp>
#include "network/message_frame.hpp"

namespace blobshard {
namespace network {

// Frame layout, integers big endian:
//   u8 message type | u32 hash length | hash | u64 payload length | payload
class Codec {
public:
  static constexpr uint32_t MAX_HASH_LENGTH = 1024;
  static constexpr uint64_t DEFAULT_MAX_PAYLOAD_SIZE = 1ULL << 32;  // 4 GiB
  // Payload buffer grows by at most this much per read
  static constexpr std::size_t PAYLOAD_READ_CHUNK = 64 * 1024;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit Codec(uint64_t max_payload_size = DEFAULT_MAX_PAYLOAD_SIZE);


  // ---- SERIALIZATION AND DESERIALIZATION ----
  // Serializes a message frame to an output stream, returns the bytes written
  std::size_t serialize(const MessageFrame& frame, std::ostream& output) const;
  // Deserializes one message frame, throws CodecError on truncated or unknown frames
  MessageFrame deserialize(std::istream& input) const;

  // Fixed part of every frame
  static constexpr std::size_t HEADER_SIZE = sizeof(uint8_t) + sizeof(uint32_t) + sizeof(uint64_t);

private:
  // ---- PARAMETERS ----
  uint64_t max_payload_size_;


  // ---- STREAM OPERATIONS ----
  // Writes bytes to an output stream
  static void write_bytes(std::ostream& output, const void* data, std::size_t size);
  // Reads bytes from an input stream
  static void read_bytes(std::istream& input, void* data, std::size_t size, const char* field);


  // ---- HOST TO NETWORK BYTE ORDER CONVERSION ----
  static uint32_t to_network_order(uint32_t host_value) {
    return boost::endian::native_to_big(host_value);
  }
  static uint64_t to_network_order(uint64_t host_value) {
    return boost::endian::native_to_big(host_value);
  }


  // ---- NETWORK TO HOST BYTE ORDER CONVERSION ----
  static uint32_t from_network_order(uint32_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
  static uint64_t from_network_order(uint64_t network_value) {
    return boost::endian::big_to_native(network_value);
  }
};

} // namespace network
} // namespace blobshard

#endif // BLOBSHARD_NETWORK_CODEC_HPP
