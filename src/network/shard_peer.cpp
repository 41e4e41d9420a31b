#include "network/shard_peer.hpp"
#include "network/shard_server.hpp"
#include <boost/log/trivial.hpp>
#include <sstream>

namespace blobshard {
namespace network {

LoopbackPeer::LoopbackPeer(std::string id, ShardServer& server)
  : id_(std::move(id))
  , server_(server) {
  BOOST_LOG_TRIVIAL(debug) << "Loopback peer: Created peer " << id_;
}

ShardResponse LoopbackPeer::request(const ShardRequest& request) {
  BOOST_LOG_TRIVIAL(debug) << "Loopback peer: Sending " << message_type_to_string(request.type)
                           << " for " << request.hash << " to " << id_;

  std::stringstream outbound;
  codec_.serialize(to_frame(request), outbound);

  std::stringstream inbound;
  server_.serve(outbound, inbound);

  return response_from_frame(codec_.deserialize(inbound));
}

} // namespace network
} // namespace blobshard
