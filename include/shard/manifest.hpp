#ifndef BLOBSHARD_SHARD_MANIFEST_HPP
#define BLOBSHARD_SHARD_MANIFEST_HPP

#include <cstdint>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <nlohmann/json_fwd.hpp>

namespace blobshard::shard {

enum class EncodingKind : uint8_t {
  None = 0,
  Chunked = 1,
  ReedSolomon = 2
};

// How a blob decomposes into shards
struct Encoding {
  EncodingKind kind{EncodingKind::None};
  uint32_t data_shards{0};
  uint32_t parity_shards{0};

  static Encoding none() { return Encoding{EncodingKind::None, 0, 0}; }
  static Encoding chunked() { return Encoding{EncodingKind::Chunked, 0, 0}; }
  static Encoding reed_solomon(uint32_t data, uint32_t parity) {
    return Encoding{EncodingKind::ReedSolomon, data, parity};
  }

  // "none", "chunked" or "rs-<data>-<data + parity>"
  std::string label() const;
  // Throws InvalidDataError for unknown or malformed labels
  static Encoding parse(const std::string& label);

  bool operator==(const Encoding& other) const {
    return kind == other.kind && data_shards == other.data_shards && parity_shards == other.parity_shards;
  }
  bool operator!=(const Encoding& other) const { return !(*this == other); }
};

std::ostream& operator<<(std::ostream& os, const Encoding& encoding);

// Durable description of one blob's decomposition
struct ShardManifest {
  std::string content_id;
  std::string blob_hash;
  uint64_t total_size{0};
  std::string mime_type;
  std::string encoding;
  uint32_t data_shards{0};
  uint32_t total_shards{0};
  uint64_t shard_size{0};
  std::vector<std::string> shard_hashes;
  std::string reach;
  std::optional<std::string> author_id;
  std::string created_at;
  std::optional<std::string> verified_at;

  Encoding encoding_value() const { return Encoding::parse(encoding); }

  // Structural checks, throws InvalidDataError
  void validate() const;

  std::string to_json_string(int indent = -1) const;
  static ShardManifest from_json_string(const std::string& text);
};

void to_json(nlohmann::json& j, const ShardManifest& manifest);
void from_json(const nlohmann::json& j, ShardManifest& manifest);

// Current UTC time as YYYY-MM-DDTHH:MM:SS.ffffff+00:00
std::string current_timestamp();

} // namespace blobshard::shard

#endif // BLOBSHARD_SHARD_MANIFEST_HPP
