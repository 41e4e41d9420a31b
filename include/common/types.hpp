#ifndef BLOBSHARD_COMMON_TYPES_HPP
#define BLOBSHARD_COMMON_TYPES_HPP

#include <cstdint>
#include <optional>
#include <vector>

namespace blobshard {

// Raw payload bytes of a blob or shard
using Bytes = std::vector<uint8_t>;

// Positional shard slot, empty when the shard is not held
using ShardSlot = std::optional<Bytes>;

} // namespace blobshard

#endif // BLOBSHARD_COMMON_TYPES_HPP
