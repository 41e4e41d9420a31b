#include "shard/manifest.hpp"
#include "shard/shard_config.hpp"
#include "crypto/content_address.hpp"
#include "store/storage_error.hpp"
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>
#include <chrono>
#include <cstdio>
#include <ctime>

namespace blobshard::shard {

using store::InvalidDataError;

//==============================================
// ENCODING LABELS
//==============================================

std::string Encoding::label() const {
  switch (kind) {
    case EncodingKind::None:
      return "none";
    case EncodingKind::Chunked:
      return "chunked";
    case EncodingKind::ReedSolomon:
      return "rs-" + std::to_string(data_shards) + "-" + std::to_string(data_shards + parity_shards);
  }
  return "unknown";
}

Encoding Encoding::parse(const std::string& label) {
  if (label == "none") {
    return none();
  }
  if (label == "chunked") {
    return chunked();
  }

  // rs-<data>-<total>
  if (label.rfind("rs-", 0) == 0) {
    size_t dash = label.find('-', 3);
    if (dash != std::string::npos && dash > 3 && dash + 1 < label.size()) {
      std::string data_part = label.substr(3, dash - 3);
      std::string total_part = label.substr(dash + 1);
      bool digits = data_part.find_first_not_of("0123456789") == std::string::npos &&
                    total_part.find_first_not_of("0123456789") == std::string::npos;
      if (digits && data_part.size() <= 3 && total_part.size() <= 3) {
        uint32_t data = static_cast<uint32_t>(std::stoul(data_part));
        uint32_t total = static_cast<uint32_t>(std::stoul(total_part));
        if (data >= 1 && total >= data && total <= ShardConfig::MAX_TOTAL_SHARDS) {
          return reed_solomon(data, total - data);
        }
      }
    }
  }

  BOOST_LOG_TRIVIAL(warning) << "Manifest: Unrecognized encoding label: " << label;
  throw InvalidDataError("unrecognized encoding label '" + label + "'");
}

std::ostream& operator<<(std::ostream& os, const Encoding& encoding) {
  return os << encoding.label();
}


//==============================================
// MANIFEST
//==============================================

void ShardManifest::validate() const {
  Encoding parsed = encoding_value();

  if (!crypto::ContentAddress::is_content_hash(blob_hash)) {
    throw InvalidDataError("manifest blob_hash is not a content hash: " + blob_hash);
  }
  if (shard_hashes.size() != total_shards) {
    throw InvalidDataError("manifest lists " + std::to_string(shard_hashes.size()) +
                           " shard hashes for " + std::to_string(total_shards) + " shards");
  }
  if (total_shards == 0 || data_shards == 0 || data_shards > total_shards) {
    throw InvalidDataError("manifest shard counts are inconsistent: data " + std::to_string(data_shards) +
                           ", total " + std::to_string(total_shards));
  }
  for (const auto& hash : shard_hashes) {
    if (!crypto::ContentAddress::is_content_hash(hash)) {
      throw InvalidDataError("manifest shard hash is not a content hash: " + hash);
    }
  }

  switch (parsed.kind) {
    case EncodingKind::None:
      if (total_shards != 1 || shard_hashes[0] != blob_hash) {
        throw InvalidDataError("single shard manifest must list the blob itself");
      }
      break;
    case EncodingKind::Chunked:
      if (data_shards != total_shards) {
        throw InvalidDataError("chunked manifest cannot carry parity shards");
      }
      break;
    case EncodingKind::ReedSolomon:
      if (data_shards != parsed.data_shards || total_shards != parsed.data_shards + parsed.parity_shards) {
        throw InvalidDataError("shard counts disagree with encoding " + encoding);
      }
      break;
  }
}

std::string ShardManifest::to_json_string(int indent) const {
  return nlohmann::json(*this).dump(indent);
}

ShardManifest ShardManifest::from_json_string(const std::string& text) {
  try {
    return nlohmann::json::parse(text).get<ShardManifest>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Manifest: Failed to parse manifest JSON: " << e.what();
    throw InvalidDataError(std::string("malformed manifest JSON: ") + e.what());
  }
}

void to_json(nlohmann::json& j, const ShardManifest& m) {
  j = nlohmann::json{
    {"content_id", m.content_id},
    {"blob_hash", m.blob_hash},
    {"total_size", m.total_size},
    {"mime_type", m.mime_type},
    {"encoding", m.encoding},
    {"data_shards", m.data_shards},
    {"total_shards", m.total_shards},
    {"shard_size", m.shard_size},
    {"shard_hashes", m.shard_hashes},
    {"reach", m.reach},
    {"author_id", m.author_id ? nlohmann::json(*m.author_id) : nlohmann::json(nullptr)},
    {"created_at", m.created_at},
    {"verified_at", m.verified_at ? nlohmann::json(*m.verified_at) : nlohmann::json(nullptr)}
  };
}

void from_json(const nlohmann::json& j, ShardManifest& m) {
  // Older manifests carry the content id as blob_cid
  if (j.contains("content_id")) {
    j.at("content_id").get_to(m.content_id);
  } else {
    j.at("blob_cid").get_to(m.content_id);
  }
  j.at("blob_hash").get_to(m.blob_hash);
  j.at("total_size").get_to(m.total_size);
  j.at("mime_type").get_to(m.mime_type);
  j.at("encoding").get_to(m.encoding);
  j.at("data_shards").get_to(m.data_shards);
  j.at("total_shards").get_to(m.total_shards);
  j.at("shard_size").get_to(m.shard_size);
  j.at("shard_hashes").get_to(m.shard_hashes);
  j.at("reach").get_to(m.reach);
  j.at("created_at").get_to(m.created_at);

  m.author_id.reset();
  if (j.contains("author_id") && !j.at("author_id").is_null()) {
    m.author_id = j.at("author_id").get<std::string>();
  }
  m.verified_at.reset();
  if (j.contains("verified_at") && !j.at("verified_at").is_null()) {
    m.verified_at = j.at("verified_at").get<std::string>();
  }
}

std::string current_timestamp() {
  auto now = std::chrono::system_clock::now();
  std::time_t seconds = std::chrono::system_clock::to_time_t(now);
  auto micros = std::chrono::duration_cast<std::chrono::microseconds>(now.time_since_epoch()).count() % 1000000;
  if (micros < 0) {
    micros += 1000000;
  }

  std::tm utc{};
  gmtime_r(&seconds, &utc);
  char date[32];
  std::strftime(date, sizeof(date), "%Y-%m-%dT%H:%M:%S", &utc);
  char buf[48];
  std::snprintf(buf, sizeof(buf), "%s.%06lld+00:00", date, static_cast<long long>(micros));
  return buf;
}

} // namespace blobshard::shard
