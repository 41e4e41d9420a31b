#ifndef BLOBSHARD_SHARD_ENCODER_HPP
#define BLOBSHARD_SHARD_ENCODER_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "shard/manifest.hpp"
#include "shard/shard_config.hpp"

namespace blobshard::shard {

// Decides how blobs decompose, builds manifests and shard buffers, and recovers blobs
// from partial shard sets. Stateless apart from its configuration and never touches
// disk, so one instance may be shared across threads.
class ShardEncoder {
public:
  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit ShardEncoder(const ShardConfig& config = ShardConfig{});


  // ---- ENCODING ----
  Encoding determine_encoding(uint64_t size) const;

  ShardManifest create_manifest(const Bytes& data, const std::string& mime_type,
                                const std::string& reach,
                                const std::optional<std::string>& author_id = std::nullopt) const;
  // Same as above with the encoding chosen by the caller
  ShardManifest create_manifest(const Bytes& data, const Encoding& encoding,
                                const std::string& mime_type, const std::string& reach,
                                const std::optional<std::string>& author_id = std::nullopt) const;

  // Shard buffers in the order of the manifest's shard_hashes
  std::vector<Bytes> create_shards(const Bytes& data, const Encoding& encoding) const;


  // ---- DECODING ----
  // shards is indexed like shard_hashes, empty slots are missing shards
  Bytes reconstruct(const ShardManifest& manifest, const std::vector<ShardSlot>& shards) const;
  // Throws HashMismatchError for the first present shard that does not match the manifest
  void verify_shards(const ShardManifest& manifest, const std::vector<ShardSlot>& shards) const;
  // Every shard of the manifest, rebuilding missing ones where the encoding allows it
  std::vector<Bytes> regenerate_shards(const ShardManifest& manifest, const std::vector<ShardSlot>& shards) const;


  // ---- GETTERS ----
  const ShardConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  ShardConfig config_;


  // ---- SHARDING SUPPORT ----
  std::vector<Bytes> split_chunked(const Bytes& data) const;
  std::vector<Bytes> encode_reed_solomon(const Bytes& data, const Encoding& encoding) const;
  // Recovers all D + P shards of a Reed-Solomon manifest
  std::vector<Bytes> recover_reed_solomon(const ShardManifest& manifest, const Encoding& encoding,
                                          const std::vector<ShardSlot>& shards, bool data_only) const;
  // Concatenates the first count shards and truncates to the manifest size
  Bytes join_shards(const ShardManifest& manifest, const std::vector<Bytes>& shards, size_t count) const;
  void check_slot_count(const ShardManifest& manifest, const std::vector<ShardSlot>& shards) const;
};

} // namespace blobshard::shard

#endif // BLOBSHARD_SHARD_ENCODER_HPP
