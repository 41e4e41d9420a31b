#include "shard/shard_encoder.hpp"
#include "shard/reed_solomon.hpp"
#include "crypto/content_address.hpp"
#include "store/storage_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace blobshard::shard {

using crypto::ContentAddress;
using store::HashMismatchError;
using store::InvalidDataError;
using store::NotFoundError;

//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ShardEncoder::ShardEncoder(const ShardConfig& config) : config_(config) {
  config_.validate();
  BOOST_LOG_TRIVIAL(debug) << "Shard encoder: Initialized with shard size " << config_.shard_size
                           << ", rs " << config_.rs_data_shards << "+" << config_.rs_parity_shards
                           << ", rs threshold " << config_.rs_threshold
                           << ", single shard max " << config_.single_shard_max;
}


//==============================================
// ENCODING
//==============================================

Encoding ShardEncoder::determine_encoding(uint64_t size) const {
  if (size <= config_.single_shard_max) {
    return Encoding::none();
  }
  if (size < config_.rs_threshold) {
    return Encoding::chunked();
  }
  return Encoding::reed_solomon(config_.rs_data_shards, config_.rs_parity_shards);
}

ShardManifest ShardEncoder::create_manifest(const Bytes& data, const std::string& mime_type,
                                            const std::string& reach,
                                            const std::optional<std::string>& author_id) const {
  return create_manifest(data, determine_encoding(data.size()), mime_type, reach, author_id);
}

ShardManifest ShardEncoder::create_manifest(const Bytes& data, const Encoding& encoding,
                                            const std::string& mime_type, const std::string& reach,
                                            const std::optional<std::string>& author_id) const {
  auto [content_id, blob_hash] = ContentAddress::compute_addresses(data);

  ShardManifest manifest;
  manifest.content_id = content_id;
  manifest.blob_hash = blob_hash;
  manifest.total_size = data.size();
  manifest.mime_type = mime_type;
  manifest.encoding = encoding.label();
  manifest.reach = reach;
  manifest.author_id = author_id;

  switch (encoding.kind) {
    case EncodingKind::None:
      // The single shard is the blob itself
      manifest.data_shards = 1;
      manifest.total_shards = 1;
      manifest.shard_size = data.size();
      manifest.shard_hashes.push_back(blob_hash);
      break;

    case EncodingKind::Chunked: {
      std::vector<Bytes> pieces = split_chunked(data);
      manifest.data_shards = static_cast<uint32_t>(pieces.size());
      manifest.total_shards = static_cast<uint32_t>(pieces.size());
      manifest.shard_size = config_.shard_size;
      for (const auto& piece : pieces) {
        manifest.shard_hashes.push_back(ContentAddress::compute_hash(piece));
      }
      break;
    }

    case EncodingKind::ReedSolomon: {
      std::vector<Bytes> shards = encode_reed_solomon(data, encoding);
      manifest.data_shards = encoding.data_shards;
      manifest.total_shards = encoding.data_shards + encoding.parity_shards;
      manifest.shard_size = shards.front().size();
      for (const auto& shard : shards) {
        manifest.shard_hashes.push_back(ContentAddress::compute_hash(shard));
      }
      break;
    }
  }

  if (manifest.total_shards > ShardConfig::MAX_TOTAL_SHARDS) {
    throw InvalidDataError("blob of " + std::to_string(data.size()) + " bytes needs " +
                           std::to_string(manifest.total_shards) + " shards, more than a manifest can list");
  }

  manifest.created_at = current_timestamp();
  manifest.verified_at = manifest.created_at;

  BOOST_LOG_TRIVIAL(info) << "Shard encoder: Created manifest for " << blob_hash << " (" << data.size()
                          << " bytes, " << manifest.encoding << ", " << manifest.total_shards << " shards)";
  return manifest;
}

std::vector<Bytes> ShardEncoder::create_shards(const Bytes& data, const Encoding& encoding) const {
  switch (encoding.kind) {
    case EncodingKind::None:
      return {data};
    case EncodingKind::Chunked:
      return split_chunked(data);
    case EncodingKind::ReedSolomon:
      return encode_reed_solomon(data, encoding);
  }
  throw InvalidDataError("unsupported encoding " + encoding.label());
}


//==============================================
// DECODING
//==============================================

Bytes ShardEncoder::reconstruct(const ShardManifest& manifest, const std::vector<ShardSlot>& shards) const {
  manifest.validate();
  check_slot_count(manifest, shards);
  Encoding encoding = manifest.encoding_value();

  Bytes data;
  switch (encoding.kind) {
    case EncodingKind::None:
      if (!shards[0]) {
        throw NotFoundError("shard 0 of " + manifest.blob_hash);
      }
      data = *shards[0];
      break;

    case EncodingKind::Chunked: {
      // No redundancy, every shard is required
      data.reserve(manifest.total_size);
      for (size_t i = 0; i < shards.size(); ++i) {
        if (!shards[i]) {
          BOOST_LOG_TRIVIAL(warning) << "Shard encoder: Missing chunk " << i << " of " << manifest.blob_hash;
          throw NotFoundError("shard " + std::to_string(i) + " of " + manifest.blob_hash);
        }
        data.insert(data.end(), shards[i]->begin(), shards[i]->end());
      }
      if (data.size() > manifest.total_size) {
        data.resize(manifest.total_size);
      }
      break;
    }

    case EncodingKind::ReedSolomon: {
      std::vector<Bytes> recovered = recover_reed_solomon(manifest, encoding, shards, true);
      data = join_shards(manifest, recovered, manifest.data_shards);
      break;
    }
  }

  std::string actual = ContentAddress::compute_hash(data);
  if (actual != manifest.blob_hash) {
    BOOST_LOG_TRIVIAL(error) << "Shard encoder: Reconstructed blob does not match " << manifest.blob_hash;
    throw HashMismatchError(manifest.blob_hash, actual);
  }

  BOOST_LOG_TRIVIAL(info) << "Shard encoder: Reconstructed " << manifest.blob_hash << " (" << data.size() << " bytes)";
  return data;
}

void ShardEncoder::verify_shards(const ShardManifest& manifest, const std::vector<ShardSlot>& shards) const {
  check_slot_count(manifest, shards);
  for (size_t i = 0; i < shards.size(); ++i) {
    if (!shards[i]) {
      continue;
    }
    std::string actual = ContentAddress::compute_hash(*shards[i]);
    if (actual != manifest.shard_hashes[i]) {
      BOOST_LOG_TRIVIAL(warning) << "Shard encoder: Shard " << i << " of " << manifest.blob_hash
                                 << " does not match its manifest hash";
      throw HashMismatchError(manifest.shard_hashes[i], actual);
    }
  }
}

std::vector<Bytes> ShardEncoder::regenerate_shards(const ShardManifest& manifest,
                                                   const std::vector<ShardSlot>& shards) const {
  manifest.validate();
  check_slot_count(manifest, shards);
  Encoding encoding = manifest.encoding_value();

  if (encoding.kind == EncodingKind::ReedSolomon) {
    return recover_reed_solomon(manifest, encoding, shards, false);
  }

  std::vector<Bytes> result;
  result.reserve(shards.size());
  for (size_t i = 0; i < shards.size(); ++i) {
    if (!shards[i]) {
      throw NotFoundError("shard " + std::to_string(i) + " of " + manifest.blob_hash);
    }
    result.push_back(*shards[i]);
  }
  return result;
}


//==============================================
// SHARDING SUPPORT
//==============================================

std::vector<Bytes> ShardEncoder::split_chunked(const Bytes& data) const {
  std::vector<Bytes> pieces;
  for (uint64_t offset = 0; offset < data.size(); offset += config_.shard_size) {
    uint64_t end = std::min<uint64_t>(offset + config_.shard_size, data.size());
    pieces.emplace_back(data.begin() + offset, data.begin() + end);
  }
  // An empty blob still decomposes into one (empty) shard
  if (pieces.empty()) {
    pieces.emplace_back();
  }
  return pieces;
}

std::vector<Bytes> ShardEncoder::encode_reed_solomon(const Bytes& data, const Encoding& encoding) const {
  ReedSolomon rs(encoding.data_shards, encoding.parity_shards);
  size_t data_count = encoding.data_shards;
  size_t shard_size = (data.size() + data_count - 1) / data_count;

  // Zero padding past the end of data fills the last data shards
  std::vector<Bytes> shards;
  shards.reserve(rs.total_shards());
  for (size_t i = 0; i < data_count; ++i) {
    Bytes shard(shard_size, 0);
    size_t offset = i * shard_size;
    if (offset < data.size()) {
      size_t length = std::min(shard_size, data.size() - offset);
      std::copy(data.begin() + offset, data.begin() + offset + length, shard.begin());
    }
    shards.push_back(std::move(shard));
  }
  for (size_t i = 0; i < encoding.parity_shards; ++i) {
    shards.emplace_back(shard_size, 0);
  }

  rs.encode(shards);
  BOOST_LOG_TRIVIAL(debug) << "Shard encoder: Encoded " << data.size() << " bytes into "
                           << shards.size() << " shards of " << shard_size << " bytes";
  return shards;
}

std::vector<Bytes> ShardEncoder::recover_reed_solomon(const ShardManifest& manifest, const Encoding& encoding,
                                                      const std::vector<ShardSlot>& shards, bool data_only) const {
  size_t present_count = static_cast<size_t>(
    std::count_if(shards.begin(), shards.end(), [](const ShardSlot& s) { return s.has_value(); }));
  if (present_count < manifest.data_shards) {
    BOOST_LOG_TRIVIAL(warning) << "Shard encoder: Only " << present_count << " of " << manifest.total_shards
                               << " shards present for " << manifest.blob_hash;
    throw InvalidDataError("need at least " + std::to_string(manifest.data_shards) + " shards, only have " +
                           std::to_string(present_count));
  }

  std::vector<Bytes> buffers;
  std::vector<bool> present;
  buffers.reserve(shards.size());
  present.reserve(shards.size());
  for (size_t i = 0; i < shards.size(); ++i) {
    if (shards[i]) {
      if (shards[i]->size() != manifest.shard_size) {
        throw InvalidDataError("shard " + std::to_string(i) + " is " + std::to_string(shards[i]->size()) +
                               " bytes, manifest declares " + std::to_string(manifest.shard_size));
      }
      buffers.push_back(*shards[i]);
      present.push_back(true);
    } else {
      buffers.emplace_back(manifest.shard_size, 0);
      present.push_back(false);
    }
  }

  ReedSolomon rs(encoding.data_shards, encoding.parity_shards);
  if (data_only) {
    rs.reconstruct_data(buffers, present);
  } else {
    rs.reconstruct(buffers, present);
  }
  return buffers;
}

Bytes ShardEncoder::join_shards(const ShardManifest& manifest, const std::vector<Bytes>& shards, size_t count) const {
  Bytes data;
  data.reserve(manifest.shard_size * count);
  for (size_t i = 0; i < count; ++i) {
    data.insert(data.end(), shards[i].begin(), shards[i].end());
  }
  if (data.size() > manifest.total_size) {
    data.resize(manifest.total_size);
  }
  return data;
}

void ShardEncoder::check_slot_count(const ShardManifest& manifest, const std::vector<ShardSlot>& shards) const {
  if (shards.size() != manifest.total_shards) {
    throw InvalidDataError("expected " + std::to_string(manifest.total_shards) + " shard slots, got " +
                           std::to_string(shards.size()));
  }
}

} // namespace blobshard::shard
