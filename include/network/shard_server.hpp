#ifndef BLOBSHARD_NETWORK_SHARD_SERVER_HPP
#define BLOBSHARD_NETWORK_SHARD_SERVER_HPP

#include <condition_variable>
#include <cstdint>
#include <functional>
#include <iostream>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <boost/asio/thread_pool.hpp>
#include "common/types.hpp"
#include "store/store.hpp"
#include "shard/shard_encoder.hpp"
#include "network/codec.hpp"
#include "network/shard_message.hpp"
#include "network/shard_peer.hpp"

namespace blobshard {
namespace network {

// Answers Get / Have / Push from a local blob store, and fetches, heals and publishes
// sharded blobs. Peer selection belongs to the caller.
class ShardServer {
public:
  using ResponseCallback = std::function<void(const ShardResponse&)>;

  static constexpr std::size_t DEFAULT_WORKER_THREADS = 4;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  ShardServer(store::BlobStore& store, const shard::ShardEncoder& encoder,
              std::size_t worker_threads = DEFAULT_WORKER_THREADS);
  ~ShardServer();

  ShardServer(const ShardServer&) = delete;
  ShardServer& operator=(const ShardServer&) = delete;


  // ---- PROCESSING OF INCOMING REQUESTS ----
  // Never throws, failures are reported as Error responses
  ShardResponse handle(const ShardRequest& request);
  // Handles the request on the worker pool, callback fires exactly once
  void submit(ShardRequest request, ResponseCallback callback);
  // Decodes one request frame from input and writes the response frame to output
  void serve(std::istream& input, std::ostream& output);
  // Blocks until every submitted request has been handled
  void wait();


  // ---- PROCESSING OF USER REQUESTS ----
  // Creates the manifest and stores every shard locally
  shard::ShardManifest publish(const Bytes& data, const std::string& mime_type, const std::string& reach,
                               const std::optional<std::string>& author_id = std::nullopt);
  // Local shards first, then peers for what is missing; returns the verified blob
  Bytes retrieve(const shard::ShardManifest& manifest, const std::vector<ShardPeer*>& peers);
  // Regenerates and stores every shard missing locally, returns how many were written
  std::size_t heal(const shard::ShardManifest& manifest, const std::vector<ShardPeer*>& peers);


  // ---- GETTERS ----
  store::BlobStore& get_store() { return store_; }
  const shard::ShardEncoder& get_encoder() const { return encoder_; }

private:
  // ---- PARAMETERS ----
  store::BlobStore& store_;
  shard::ShardEncoder encoder_;
  Codec codec_;
  std::mutex pending_mutex_;
  std::condition_variable pending_cv_;
  std::size_t pending_{0};
  boost::asio::thread_pool pool_;


  // ---- REQUEST HANDLERS ----
  ShardResponse handle_get(const std::string& hash);
  ShardResponse handle_have(const std::string& hash);
  ShardResponse handle_push(const std::string& hash, const Bytes& data);


  // ---- SHARD COLLECTION ----
  // Shards of the manifest held locally and intact
  std::vector<ShardSlot> read_local_shards(const shard::ShardManifest& manifest, std::size_t needed);
  // Asks peers for missing shards until needed shards are held
  void fetch_missing_shards(const shard::ShardManifest& manifest, const std::vector<ShardPeer*>& peers,
                            std::vector<ShardSlot>& shards, std::size_t needed);
  std::optional<Bytes> fetch_from_peers(const std::string& hash, const std::vector<ShardPeer*>& peers);
  // Shards required before reconstruction can succeed
  static std::size_t required_shards(const shard::ShardManifest& manifest);
  static std::size_t count_present(const std::vector<ShardSlot>& shards);
};

} // namespace network
} // namespace blobshard

#endif // BLOBSHARD_NETWORK_SHARD_SERVER_HPP
