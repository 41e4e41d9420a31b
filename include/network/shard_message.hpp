#ifndef BLOBSHARD_NETWORK_SHARD_MESSAGE_HPP
#define BLOBSHARD_NETWORK_SHARD_MESSAGE_HPP

#include <string>
#include "common/types.hpp"
#include "network/message_frame.hpp"

namespace blobshard {
namespace network {

// Get, Have or Push for one content hash
struct ShardRequest {
    MessageType type{MessageType::GET};
    std::string hash;
    Bytes data;  // Push only

    static ShardRequest get(const std::string& hash) { return {MessageType::GET, hash, {}}; }
    static ShardRequest have(const std::string& hash) { return {MessageType::HAVE, hash, {}}; }
    static ShardRequest push(const std::string& hash, Bytes data) {
        return {MessageType::PUSH, hash, std::move(data)};
    }
};

// Data, NotFound, Have, PushAck or Error
struct ShardResponse {
    MessageType type{MessageType::NOT_FOUND};
    Bytes data;           // Data only
    bool have{false};     // Have only
    std::string message;  // Error only

    static ShardResponse found(Bytes data) { return {MessageType::DATA, std::move(data), false, {}}; }
    static ShardResponse not_found() { return {MessageType::NOT_FOUND, {}, false, {}}; }
    static ShardResponse have_result(bool have) { return {MessageType::HAVE_RESULT, {}, have, {}}; }
    static ShardResponse push_ack() { return {MessageType::PUSH_ACK, {}, false, {}}; }
    static ShardResponse error(const std::string& message) { return {MessageType::ERROR, {}, false, message}; }

    bool is_error() const { return type == MessageType::ERROR; }
};


// ---- FRAME CONVERSION ----
// The *_from_frame functions throw CodecError when the frame carries the wrong kind of message
MessageFrame to_frame(const ShardRequest& request);
MessageFrame to_frame(const ShardResponse& response);
ShardRequest request_from_frame(const MessageFrame& frame);
ShardResponse response_from_frame(const MessageFrame& frame);

} // namespace network
} // namespace blobshard

#endif // BLOBSHARD_NETWORK_SHARD_MESSAGE_HPP
