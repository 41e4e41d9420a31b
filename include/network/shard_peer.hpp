#ifndef BLOBSHARD_NETWORK_SHARD_PEER_HPP
#define BLOBSHARD_NETWORK_SHARD_PEER_HPP

#include <string>
#include "network/codec.hpp"
#include "network/shard_message.hpp"

namespace blobshard {
namespace network {

class ShardServer;

// A remote node answering the shard transfer contract
class ShardPeer {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    virtual ~ShardPeer() = default;


    // ---- REQUESTS ----
    // Throws on transport or framing failures, remote failures arrive as Error responses
    virtual ShardResponse request(const ShardRequest& request) = 0;


    // ---- GETTERS ----
    virtual std::string id() const = 0;

protected:
    ShardPeer() = default;
};

// Peer backed by a server in the same process. Every request and response goes through
// the frame codec, so it exercises the same bytes a real transport would carry.
class LoopbackPeer : public ShardPeer {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    LoopbackPeer(std::string id, ShardServer& server);


    // ---- REQUESTS ----
    ShardResponse request(const ShardRequest& request) override;


    // ---- GETTERS ----
    std::string id() const override { return id_; }

private:
    // ---- PARAMETERS ----
    std::string id_;
    ShardServer& server_;
    Codec codec_;
};

} // namespace network
} // namespace blobshard

#endif // BLOBSHARD_NETWORK_SHARD_PEER_HPP
