#include "network/codec.hpp"
#include "network/network_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <string>

namespace blobshard {
namespace network {

Codec::Codec(uint64_t max_payload_size)
  : max_payload_size_(max_payload_size) {
  BOOST_LOG_TRIVIAL(debug) << "Codec: Initializing Codec with max payload size: " << max_payload_size_;
}

std::size_t Codec::serialize(const MessageFrame& frame, std::ostream& output) const {
  if (!output.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid output stream state";
    throw CodecError("invalid output stream");
  }
  if (frame.hash.size() > MAX_HASH_LENGTH) {
    throw CodecError("hash of " + std::to_string(frame.hash.size()) + " bytes exceeds the frame limit");
  }
  if (frame.payload.size() > max_payload_size_) {
    throw CodecError("payload of " + std::to_string(frame.payload.size()) + " bytes exceeds the frame limit");
  }

  std::size_t total_bytes = 0;

  // Write message type
  uint8_t msg_type = static_cast<uint8_t>(frame.message_type);
  BOOST_LOG_TRIVIAL(trace) << "Codec: Writing message type: " << static_cast<int>(msg_type);
  write_bytes(output, &msg_type, sizeof(msg_type));
  total_bytes += sizeof(msg_type);

  // Write hash length and hash
  uint32_t network_hash_length = to_network_order(static_cast<uint32_t>(frame.hash.size()));
  write_bytes(output, &network_hash_length, sizeof(network_hash_length));
  write_bytes(output, frame.hash.data(), frame.hash.size());
  total_bytes += sizeof(network_hash_length) + frame.hash.size();

  // Write payload length and payload
  uint64_t network_payload_size = to_network_order(static_cast<uint64_t>(frame.payload.size()));
  BOOST_LOG_TRIVIAL(trace) << "Codec: Writing payload size: " << frame.payload.size();
  write_bytes(output, &network_payload_size, sizeof(network_payload_size));
  write_bytes(output, frame.payload.data(), frame.payload.size());
  total_bytes += sizeof(network_payload_size) + frame.payload.size();

  output.flush();
  BOOST_LOG_TRIVIAL(debug) << "Codec: Serialized " << message_type_to_string(frame.message_type)
                           << " frame. Total bytes written: " << total_bytes;
  return total_bytes;
}

MessageFrame Codec::deserialize(std::istream& input) const {
  if (!input.good()) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Invalid input stream state";
    throw CodecError("invalid input stream");
  }

  MessageFrame frame;

  // Read message type
  uint8_t msg_type;
  read_bytes(input, &msg_type, sizeof(msg_type), "message type");
  if (!is_known_message_type(msg_type)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Unknown message type: " << static_cast<int>(msg_type);
    throw CodecError("unknown message type " + std::to_string(msg_type));
  }
  frame.message_type = static_cast<MessageType>(msg_type);

  // Read hash
  uint32_t network_hash_length;
  read_bytes(input, &network_hash_length, sizeof(network_hash_length), "hash length");
  uint32_t hash_length = from_network_order(network_hash_length);
  if (hash_length > MAX_HASH_LENGTH) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Hash length out of range: " << hash_length;
    throw CodecError("hash length " + std::to_string(hash_length) + " exceeds the frame limit");
  }
  frame.hash.resize(hash_length);
  read_bytes(input, &frame.hash[0], hash_length, "hash");

  // Read payload
  uint64_t network_payload_size;
  read_bytes(input, &network_payload_size, sizeof(network_payload_size), "payload length");
  uint64_t payload_size = from_network_order(network_payload_size);
  if (payload_size > max_payload_size_) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Payload size out of range: " << payload_size;
    throw CodecError("payload length " + std::to_string(payload_size) + " exceeds the frame limit");
  }
  // Memory is committed only as payload bytes actually arrive
  uint64_t received = 0;
  while (received < payload_size) {
    std::size_t step = static_cast<std::size_t>(std::min<uint64_t>(PAYLOAD_READ_CHUNK, payload_size - received));
    frame.payload.resize(static_cast<std::size_t>(received) + step);
    read_bytes(input, frame.payload.data() + received, step, "payload");
    received += step;
  }

  BOOST_LOG_TRIVIAL(debug) << "Codec: Deserialized " << message_type_to_string(frame.message_type)
                           << " frame with payload size: " << payload_size;
  return frame;
}

void Codec::write_bytes(std::ostream& output, const void* data, std::size_t size) {
  if (size == 0) {
    return;
  }
  if (!output.write(static_cast<const char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Failed to write " << size << " bytes to output stream";
    throw CodecError("failed to write to output stream");
  }
}

void Codec::read_bytes(std::istream& input, void* data, std::size_t size, const char* field) {
  if (size == 0) {
    return;
  }
  if (!input.read(static_cast<char*>(data), size)) {
    BOOST_LOG_TRIVIAL(error) << "Codec: Truncated frame while reading " << field;
    throw CodecError(std::string("truncated frame while reading ") + field);
  }
}

} // namespace network
} // namespace blobshard
