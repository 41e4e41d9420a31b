#include <gtest/gtest.h>
#include <sstream>
#include "network/codec.hpp"
#include "network/message_frame.hpp"
#include "network/network_error.hpp"
#include "network/shard_message.hpp"
#include "crypto/content_address.hpp"
#include "test_utils.hpp"

using namespace blobshard;
using namespace blobshard::network;

class CodecTest : public ::testing::Test {
protected:
  Codec codec;
  std::string hash = crypto::ContentAddress::compute_hash(test::to_bytes("codec test shard"));

  void SetUp() override {
    test::init_test_logging();
  }

  std::string serialize_to_string(const MessageFrame& frame) {
    std::stringstream stream;
    codec.serialize(frame, stream);
    return stream.str();
  }

  MessageFrame round_trip(const MessageFrame& input_frame) {
    std::stringstream stream;
    std::size_t written = 0;
    EXPECT_NO_THROW({
      written = codec.serialize(input_frame, stream);
    }) << "Serialization failed";
    EXPECT_EQ(written, Codec::HEADER_SIZE + input_frame.hash.size() + input_frame.payload.size());
    EXPECT_EQ(stream.str().size(), written);

    stream.seekg(0);
    return codec.deserialize(stream);
  }

  // Decodes the first length bytes of a valid encoding
  void expect_truncated(const std::string& encoded, std::size_t length, const std::string& field) {
    std::stringstream stream(encoded.substr(0, length));
    try {
      codec.deserialize(stream);
      FAIL() << "Expected CodecError at length " << length;
    } catch (const CodecError& e) {
      EXPECT_NE(std::string(e.what()).find(field), std::string::npos)
        << "length " << length << ": " << e.what();
    }
  }
};

TEST_F(CodecTest, RequestFramesRoundTrip) {
  for (const ShardRequest& request : {ShardRequest::get(hash), ShardRequest::have(hash),
                                      ShardRequest::push(hash, test::random_bytes(4096))}) {
    MessageFrame decoded = round_trip(to_frame(request));
    EXPECT_EQ(decoded.message_type, request.type);
    EXPECT_EQ(decoded.hash, hash);

    ShardRequest parsed = request_from_frame(decoded);
    EXPECT_EQ(parsed.type, request.type);
    EXPECT_EQ(parsed.hash, request.hash);
    EXPECT_EQ(parsed.data, request.data);
  }
}

TEST_F(CodecTest, ResponseFramesRoundTrip) {
  Bytes data = test::random_bytes(1000, 3);

  ShardResponse found = response_from_frame(round_trip(to_frame(ShardResponse::found(data))));
  EXPECT_EQ(found.type, MessageType::DATA);
  EXPECT_EQ(found.data, data);

  EXPECT_EQ(response_from_frame(round_trip(to_frame(ShardResponse::not_found()))).type, MessageType::NOT_FOUND);
  EXPECT_EQ(response_from_frame(round_trip(to_frame(ShardResponse::push_ack()))).type, MessageType::PUSH_ACK);

  ShardResponse held = response_from_frame(round_trip(to_frame(ShardResponse::have_result(true))));
  EXPECT_EQ(held.type, MessageType::HAVE_RESULT);
  EXPECT_TRUE(held.have);
  EXPECT_FALSE(response_from_frame(round_trip(to_frame(ShardResponse::have_result(false)))).have);

  ShardResponse error = response_from_frame(round_trip(to_frame(ShardResponse::error("Storage error: disk full"))));
  EXPECT_TRUE(error.is_error());
  EXPECT_EQ(error.message, "Storage error: disk full");
}

TEST_F(CodecTest, EmptyDataResponse) {
  MessageFrame decoded = round_trip(to_frame(ShardResponse::found(Bytes{})));
  EXPECT_TRUE(decoded.hash.empty());
  EXPECT_TRUE(decoded.payload.empty());
  EXPECT_TRUE(response_from_frame(decoded).data.empty());
}

TEST_F(CodecTest, BigEndianLayout) {
  MessageFrame frame;
  frame.message_type = MessageType::PUSH;
  frame.hash = "abc";
  frame.payload = {0xDE, 0xAD};

  std::string encoded = serialize_to_string(frame);
  const std::string expected("\x02"
                             "\x00\x00\x00\x03"
                             "abc"
                             "\x00\x00\x00\x00\x00\x00\x00\x02"
                             "\xDE\xAD", 18);
  EXPECT_EQ(encoded, expected);
}

TEST_F(CodecTest, TruncatedFrames) {
  MessageFrame frame = to_frame(ShardRequest::push(hash, test::random_bytes(32)));
  std::string encoded = serialize_to_string(frame);
  const std::size_t hash_end = 1 + 4 + hash.size();

  expect_truncated(encoded, 0, "message type");
  expect_truncated(encoded, 1, "hash length");
  expect_truncated(encoded, 4, "hash length");
  expect_truncated(encoded, 5, "hash");
  expect_truncated(encoded, hash_end - 1, "hash");
  expect_truncated(encoded, hash_end, "payload length");
  expect_truncated(encoded, hash_end + 7, "payload length");
  expect_truncated(encoded, hash_end + 8, "payload");
  expect_truncated(encoded, encoded.size() - 1, "payload");

  std::stringstream complete(encoded);
  EXPECT_NO_THROW(codec.deserialize(complete));
}

TEST_F(CodecTest, UnknownMessageType) {
  for (uint8_t type : {uint8_t{3}, uint8_t{15}, uint8_t{21}, uint8_t{255}}) {
    std::string encoded = serialize_to_string(to_frame(ShardRequest::get(hash)));
    encoded[0] = static_cast<char>(type);
    std::stringstream stream(encoded);
    EXPECT_THROW(codec.deserialize(stream), CodecError) << static_cast<int>(type);
  }
}

TEST_F(CodecTest, OversizeLengthsRejected) {
  Codec small_codec(64);

  MessageFrame big_payload = to_frame(ShardRequest::push(hash, Bytes(65, 0x11)));
  std::stringstream sink;
  EXPECT_THROW(small_codec.serialize(big_payload, sink), CodecError);

  // A declared length beyond the limit fails before any allocation
  std::stringstream declared(serialize_to_string(big_payload));
  EXPECT_THROW(small_codec.deserialize(declared), CodecError);

  MessageFrame long_hash;
  long_hash.hash.assign(Codec::MAX_HASH_LENGTH + 1, 'a');
  EXPECT_THROW(codec.serialize(long_hash, sink), CodecError);

  std::string header("\x00\xFF\xFF\xFF\xFF", 5);
  std::stringstream huge_hash(header);
  EXPECT_THROW(codec.deserialize(huge_hash), CodecError);
}

TEST_F(CodecTest, DeclaredPayloadLargerThanStream) {
  // Push frame, empty hash, almost 4 GiB declared, ten bytes sent
  std::string encoded("\x02\x00\x00\x00\x00\x00\x00\x00\x00\xFF\xFF\xFF\xF0", Codec::HEADER_SIZE);
  encoded.append(10, 'x');
  std::stringstream stream(encoded);

  try {
    codec.deserialize(stream);
    FAIL() << "Expected CodecError";
  } catch (const CodecError& e) {
    EXPECT_NE(std::string(e.what()).find("truncated frame while reading payload"), std::string::npos) << e.what();
  }
}

TEST_F(CodecTest, ConsecutiveFramesOnOneStream) {
  std::stringstream stream;
  codec.serialize(to_frame(ShardRequest::have(hash)), stream);
  codec.serialize(to_frame(ShardResponse::have_result(true)), stream);

  stream.seekg(0);
  EXPECT_EQ(codec.deserialize(stream).message_type, MessageType::HAVE);
  EXPECT_EQ(codec.deserialize(stream).message_type, MessageType::HAVE_RESULT);
}

TEST_F(CodecTest, WrongKindOfFrame) {
  EXPECT_THROW(request_from_frame(to_frame(ShardResponse::push_ack())), CodecError);
  EXPECT_THROW(response_from_frame(to_frame(ShardRequest::get(hash))), CodecError);
  EXPECT_THROW(to_frame(ShardRequest{MessageType::DATA, hash, {}}), CodecError);
  EXPECT_THROW(to_frame(ShardResponse{MessageType::PUSH, {}, false, {}}), CodecError);

  MessageFrame get_with_payload = to_frame(ShardRequest::get(hash));
  get_with_payload.payload = {1, 2, 3};
  EXPECT_THROW(request_from_frame(get_with_payload), CodecError);

  MessageFrame bad_have;
  bad_have.message_type = MessageType::HAVE_RESULT;
  bad_have.payload = {2};
  EXPECT_THROW(response_from_frame(bad_have), CodecError);
  bad_have.payload = {};
  EXPECT_THROW(response_from_frame(bad_have), CodecError);
}

TEST_F(CodecTest, MessageTypeNames) {
  EXPECT_STREQ(message_type_to_string(MessageType::GET), "Get");
  EXPECT_STREQ(message_type_to_string(MessageType::HAVE_RESULT), "HaveResult");
  EXPECT_TRUE(is_request_type(MessageType::PUSH));
  EXPECT_FALSE(is_request_type(MessageType::DATA));
  EXPECT_TRUE(is_known_message_type(20));
  EXPECT_FALSE(is_known_message_type(3));
}
