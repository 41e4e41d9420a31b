#ifndef BLOBSHARD_NETWORK_MESSAGE_FRAME_HPP
#define BLOBSHARD_NETWORK_MESSAGE_FRAME_HPP

#include <cstdint>
#include <string>
#include "common/types.hpp"

namespace blobshard {
namespace network {

// Message type shared by requests and responses
enum class MessageType : uint8_t {
    GET = 0,
    HAVE = 1,
    PUSH = 2,
    DATA = 16,
    NOT_FOUND = 17,
    HAVE_RESULT = 18,
    PUSH_ACK = 19,
    ERROR = 20
};

bool is_known_message_type(uint8_t value);
bool is_request_type(MessageType type);
const char* message_type_to_string(MessageType type);

// Wire representation of one request or response
struct MessageFrame {
    MessageType message_type{MessageType::GET};
    std::string hash;
    Bytes payload;
};

} // namespace network
} // namespace blobshard

#endif // BLOBSHARD_NETWORK_MESSAGE_FRAME_HPP
