#include "network/shard_message.hpp"
#include "network/network_error.hpp"
#include <boost/log/trivial.hpp>

namespace blobshard {
namespace network {

bool is_known_message_type(uint8_t value) {
  switch (static_cast<MessageType>(value)) {
    case MessageType::GET:
    case MessageType::HAVE:
    case MessageType::PUSH:
    case MessageType::DATA:
    case MessageType::NOT_FOUND:
    case MessageType::HAVE_RESULT:
    case MessageType::PUSH_ACK:
    case MessageType::ERROR:
      return true;
  }
  return false;
}

bool is_request_type(MessageType type) {
  return type == MessageType::GET || type == MessageType::HAVE || type == MessageType::PUSH;
}

const char* message_type_to_string(MessageType type) {
  switch (type) {
    case MessageType::GET: return "Get";
    case MessageType::HAVE: return "Have";
    case MessageType::PUSH: return "Push";
    case MessageType::DATA: return "Data";
    case MessageType::NOT_FOUND: return "NotFound";
    case MessageType::HAVE_RESULT: return "HaveResult";
    case MessageType::PUSH_ACK: return "PushAck";
    case MessageType::ERROR: return "Error";
  }
  return "Unknown";
}


//==============================================
// REQUESTS
//==============================================

MessageFrame to_frame(const ShardRequest& request) {
  if (!is_request_type(request.type)) {
    throw CodecError(std::string("not a request type: ") + message_type_to_string(request.type));
  }
  MessageFrame frame;
  frame.message_type = request.type;
  frame.hash = request.hash;
  if (request.type == MessageType::PUSH) {
    frame.payload = request.data;
  }
  return frame;
}

ShardRequest request_from_frame(const MessageFrame& frame) {
  if (!is_request_type(frame.message_type)) {
    BOOST_LOG_TRIVIAL(error) << "Shard message: Expected a request, got "
                             << message_type_to_string(frame.message_type);
    throw CodecError(std::string("expected a request frame, got ") + message_type_to_string(frame.message_type));
  }
  if (frame.message_type != MessageType::PUSH && !frame.payload.empty()) {
    throw CodecError(std::string(message_type_to_string(frame.message_type)) + " request carries a payload");
  }
  return ShardRequest{frame.message_type, frame.hash, frame.payload};
}


//==============================================
// RESPONSES
//==============================================

MessageFrame to_frame(const ShardResponse& response) {
  MessageFrame frame;
  frame.message_type = response.type;
  switch (response.type) {
    case MessageType::DATA:
      frame.payload = response.data;
      break;
    case MessageType::HAVE_RESULT:
      frame.payload.push_back(response.have ? 1 : 0);
      break;
    case MessageType::ERROR:
      frame.payload.assign(response.message.begin(), response.message.end());
      break;
    case MessageType::NOT_FOUND:
    case MessageType::PUSH_ACK:
      break;
    default:
      throw CodecError(std::string("not a response type: ") + message_type_to_string(response.type));
  }
  return frame;
}

ShardResponse response_from_frame(const MessageFrame& frame) {
  switch (frame.message_type) {
    case MessageType::DATA:
      return ShardResponse::found(frame.payload);
    case MessageType::NOT_FOUND:
      return ShardResponse::not_found();
    case MessageType::HAVE_RESULT:
      if (frame.payload.size() != 1 || frame.payload[0] > 1) {
        throw CodecError("malformed Have response payload");
      }
      return ShardResponse::have_result(frame.payload[0] == 1);
    case MessageType::PUSH_ACK:
      return ShardResponse::push_ack();
    case MessageType::ERROR:
      return ShardResponse::error(std::string(frame.payload.begin(), frame.payload.end()));
    default:
      BOOST_LOG_TRIVIAL(error) << "Shard message: Expected a response, got "
                               << message_type_to_string(frame.message_type);
      throw CodecError(std::string("expected a response frame, got ") + message_type_to_string(frame.message_type));
  }
}

} // namespace network
} // namespace blobshard
