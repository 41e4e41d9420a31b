#ifndef BLOBSHARD_SHARD_CONFIG_HPP
#define BLOBSHARD_SHARD_CONFIG_HPP

#include <cstdint>

namespace blobshard::shard {

// Policy for decomposing a blob into shards. Note that with the defaults
// rs_threshold < single_shard_max, so the chunked encoding is never selected.
struct ShardConfig {
  static constexpr uint64_t DEFAULT_SHARD_SIZE = 1024 * 1024;
  static constexpr uint32_t DEFAULT_DATA_SHARDS = 4;
  static constexpr uint32_t DEFAULT_PARITY_SHARDS = 3;
  static constexpr uint64_t DEFAULT_RS_THRESHOLD = 10 * 1024 * 1024;
  static constexpr uint64_t DEFAULT_SINGLE_SHARD_MAX = 16 * 1024 * 1024;
  // Shard counts travel as single bytes in manifests
  static constexpr uint32_t MAX_TOTAL_SHARDS = 255;

  uint64_t shard_size{DEFAULT_SHARD_SIZE};
  uint32_t rs_data_shards{DEFAULT_DATA_SHARDS};
  uint32_t rs_parity_shards{DEFAULT_PARITY_SHARDS};
  uint64_t rs_threshold{DEFAULT_RS_THRESHOLD};
  uint64_t single_shard_max{DEFAULT_SINGLE_SHARD_MAX};

  // Throws InvalidDataError when the policy cannot produce valid manifests
  void validate() const;
};

} // namespace blobshard::shard

#endif // BLOBSHARD_SHARD_CONFIG_HPP
