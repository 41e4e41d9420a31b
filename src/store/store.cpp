#include "store/store.hpp"
#include "crypto/content_address.hpp"
#include <boost/log/trivial.hpp>
#include <nlohmann/json.hpp>
#include <algorithm>
#include <atomic>
#include <cstdio>
#include <cstring>
#include <fstream>
#include <functional>
#include <system_error>
#include <thread>

namespace fs = std::filesystem;

namespace blobshard {
namespace store {

using crypto::ContentAddress;

void to_json(nlohmann::json& j, const ChunkIndex& index) {
  j = nlohmann::json{
    {"hash", index.hash},
    {"size_bytes", index.size_bytes},
    {"chunk_count", index.chunk_count},
    {"chunk_size", index.chunk_size},
    {"chunk_hashes", index.chunk_hashes}
  };
}

void from_json(const nlohmann::json& j, ChunkIndex& index) {
  j.at("hash").get_to(index.hash);
  j.at("size_bytes").get_to(index.size_bytes);
  j.at("chunk_count").get_to(index.chunk_count);
  j.at("chunk_size").get_to(index.chunk_size);
  j.at("chunk_hashes").get_to(index.chunk_hashes);
}

namespace {

std::string chunk_file_name(uint32_t chunk) {
  char name[16];
  std::snprintf(name, sizeof(name), "%08u", chunk);
  return name;
}

// Unique per process and thread so racing writers never share a temporary
std::string temp_suffix() {
  static std::atomic<uint64_t> counter{0};
  return ".tmp." + std::to_string(std::hash<std::thread::id>{}(std::this_thread::get_id())) +
         "." + std::to_string(counter.fetch_add(1));
}

bool is_sidecar_name(const std::string& name) {
  auto ends_with = [&name](const std::string& suffix) {
    return name.size() >= suffix.size() &&
           name.compare(name.size() - suffix.size(), suffix.size(), suffix) == 0;
  };
  return ends_with(".chunks") || ends_with(".d") || name.find(".tmp.") != std::string::npos;
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

BlobStore::BlobStore(const StoreConfig& config) : config_(config) {
  if (config_.chunk_size == 0) {
    throw InvalidDataError("chunk size must be greater than zero");
  }
  BOOST_LOG_TRIVIAL(info) << "Blob store: Initializing blob store with root: " << config_.root_dir.string();
  check_directory_exists(config_.root_dir);
  BOOST_LOG_TRIVIAL(debug) << "Blob store: Root directory created/verified at: " << config_.root_dir.string();
}

BlobStore::BlobStore(const fs::path& root_dir) : BlobStore(StoreConfig{root_dir}) {}


//==============================================
// CORE STORAGE OPERATIONS
//==============================================

StoreResult BlobStore::store(const Bytes& data) {
  std::string hash = ContentAddress::compute_hash(data);
  fs::path path = blob_path(hash);

  // Duplicate content is always a no-op
  std::error_code ec;
  if (fs::exists(path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Blob store: Blob already exists: " << hash;
    return existing_result(hash);
  }

  check_directory_exists(path.parent_path());

  if (data.size() <= config_.max_inline_size) {
    write_file_atomic(path, data.data(), data.size());
    BOOST_LOG_TRIVIAL(info) << "Blob store: Stored blob " << hash << " (" << data.size() << " bytes)";

    StoreResult result;
    result.hash = hash;
    result.size_bytes = data.size();
    result.chunk_count = 1;
    result.chunked = false;
    result.already_existed = false;
    return result;
  }

  return store_chunked(hash, data);
}

Bytes BlobStore::get(const std::string& hash) const {
  BOOST_LOG_TRIVIAL(debug) << "Blob store: Retrieving blob: " << hash;
  validate_hash(hash);

  fs::path path = blob_path(hash);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    BOOST_LOG_TRIVIAL(debug) << "Blob store: Blob not found: " << hash;
    throw NotFoundError(hash);
  }

  if (is_chunked(hash)) {
    return get_chunked(hash);
  }
  if (is_orphaned_sentinel(hash)) {
    throw NotFoundError(hash);
  }

  return read_file(path);
}

Bytes BlobStore::get_range(const std::string& hash, uint64_t start, uint64_t end) const {
  BOOST_LOG_TRIVIAL(debug) << "Blob store: Retrieving range [" << start << ", " << end << ") of " << hash;
  validate_hash(hash);

  if (start > end) {
    throw InvalidDataError("range start " + std::to_string(start) + " exceeds end " + std::to_string(end));
  }

  fs::path path = blob_path(hash);
  std::error_code ec;
  if (!fs::exists(path, ec)) {
    throw NotFoundError(hash);
  }

  if (is_chunked(hash)) {
    return get_chunked_range(hash, start, end);
  }
  if (is_orphaned_sentinel(hash)) {
    throw NotFoundError(hash);
  }

  uint64_t total = fs::file_size(path, ec);
  if (ec) {
    throw IoError(path.string(), ec.message());
  }
  end = std::min(end, total);
  if (start >= end) {
    return {};
  }
  return read_file_range(path, start, end - start);
}

void BlobStore::remove(const std::string& hash) {
  BOOST_LOG_TRIVIAL(info) << "Blob store: Removing blob: " << hash;
  validate_hash(hash);

  // Chunk set first so a surviving canonical file never points at nothing
  std::error_code ec;
  if (is_chunked(hash)) {
    fs::remove_all(chunk_dir_path(hash), ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "Blob store: Ignoring chunk directory removal error: " << ec.message();
    }
    fs::remove(chunk_index_path(hash), ec);
    if (ec) {
      BOOST_LOG_TRIVIAL(debug) << "Blob store: Ignoring chunk index removal error: " << ec.message();
    }
  }

  fs::remove(blob_path(hash), ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(debug) << "Blob store: Ignoring blob removal error: " << ec.message();
  }

  BOOST_LOG_TRIVIAL(info) << "Blob store: Removed blob: " << hash;
}

void BlobStore::clear() {
  BOOST_LOG_TRIVIAL(info) << "Blob store: Clearing entire store at: " << config_.root_dir.string();
  std::error_code ec;
  fs::remove_all(config_.root_dir, ec);
  if (ec) {
    throw IoError(config_.root_dir.string(), ec.message());
  }
  check_directory_exists(config_.root_dir);
  BOOST_LOG_TRIVIAL(info) << "Blob store: Store cleared successfully";
}


//==============================================
// QUERY OPERATIONS
//==============================================

bool BlobStore::exists(const std::string& hash) const {
  if (!ContentAddress::is_content_hash(hash)) {
    BOOST_LOG_TRIVIAL(debug) << "Blob store: Malformed hash in existence check: " << hash;
    return false;
  }

  std::error_code ec;
  bool found = fs::exists(blob_path(hash), ec);
  BOOST_LOG_TRIVIAL(debug) << "Blob store: Blob " << hash << (found ? " exists" : " not found");
  return found;
}

uint64_t BlobStore::size(const std::string& hash) const {
  validate_hash(hash);

  fs::path path = blob_path(hash);
  std::error_code ec;
  uint64_t length = fs::file_size(path, ec);
  if (ec) {
    if (ec == std::errc::no_such_file_or_directory) {
      throw NotFoundError(hash);
    }
    throw IoError(path.string(), ec.message());
  }

  if (length == SENTINEL_SIZE) {
    if (is_chunked(hash)) {
      return read_chunk_index(hash).size_bytes;
    }
    if (is_orphaned_sentinel(hash)) {
      throw NotFoundError(hash);
    }
  }
  return length;
}

StoreStats BlobStore::stats() const {
  StoreStats stats;
  fs::path blobs_dir = config_.root_dir / "blobs";

  std::error_code ec;
  if (!fs::exists(blobs_dir, ec)) {
    return stats;
  }

  try {
    for (const auto& prefix : fs::directory_iterator(blobs_dir)) {
      if (!prefix.is_directory()) {
        continue;
      }
      for (const auto& entry : fs::directory_iterator(prefix.path())) {
        std::string name = entry.path().filename().string();
        if (is_sidecar_name(name) || !entry.is_regular_file()) {
          continue;
        }

        if (entry.file_size() == SENTINEL_SIZE && is_orphaned_sentinel(name)) {
          continue;
        }

        ++stats.total_blobs;
        if (entry.file_size() == SENTINEL_SIZE && is_chunked(name)) {
          ++stats.chunked_blobs;
          stats.total_bytes += read_chunk_index(name).size_bytes;
        } else {
          stats.total_bytes += entry.file_size();
        }
      }
    }
  } catch (const fs::filesystem_error& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to walk store: " << e.what();
    throw IoError(blobs_dir.string(), e.what());
  }

  BOOST_LOG_TRIVIAL(debug) << "Blob store: " << stats.total_blobs << " blobs, "
                           << stats.total_bytes << " bytes, " << stats.chunked_blobs << " chunked";
  return stats;
}


//==============================================
// PATH LAYOUT
//==============================================

fs::path BlobStore::blob_path(const std::string& hash) const {
  // Four hex chars after the prefix bound the entries per directory
  std::string hash_part = hash.compare(0, ContentAddress::HASH_PREFIX_LENGTH, ContentAddress::HASH_PREFIX) == 0
                            ? hash.substr(ContentAddress::HASH_PREFIX_LENGTH)
                            : hash;
  return config_.root_dir / "blobs" / hash_part.substr(0, 4) / hash;
}

fs::path BlobStore::chunk_dir_path(const std::string& hash) const {
  fs::path path = blob_path(hash);
  return path.parent_path() / (hash + ".d");
}

fs::path BlobStore::chunk_index_path(const std::string& hash) const {
  fs::path path = blob_path(hash);
  return path.parent_path() / (hash + ".chunks");
}


//==============================================
// CHUNKED STORAGE SUPPORT
//==============================================

StoreResult BlobStore::store_chunked(const std::string& hash, const Bytes& data) {
  fs::path chunk_dir = chunk_dir_path(hash);
  check_directory_exists(chunk_dir);

  ChunkIndex index;
  index.hash = hash;
  index.size_bytes = data.size();
  index.chunk_size = config_.chunk_size;
  index.chunk_count = static_cast<uint32_t>((data.size() + config_.chunk_size - 1) / config_.chunk_size);
  index.chunk_hashes.reserve(index.chunk_count);

  for (uint32_t i = 0; i < index.chunk_count; ++i) {
    uint64_t offset = static_cast<uint64_t>(i) * config_.chunk_size;
    size_t length = static_cast<size_t>(std::min<uint64_t>(config_.chunk_size, data.size() - offset));
    const uint8_t* chunk = data.data() + offset;

    index.chunk_hashes.push_back(ContentAddress::compute_hash(chunk, length));
    write_file_atomic(chunk_dir / chunk_file_name(i), chunk, length);
  }
  BOOST_LOG_TRIVIAL(debug) << "Blob store: Wrote " << index.chunk_count << " chunks for " << hash;

  std::string index_json = nlohmann::json(index).dump();
  write_file_atomic(chunk_index_path(hash),
                    reinterpret_cast<const uint8_t*>(index_json.data()), index_json.size());

  // The sentinel goes last so a reader that sees it can trust the chunk set
  write_file_atomic(blob_path(hash), reinterpret_cast<const uint8_t*>(CHUNKED_SENTINEL), SENTINEL_SIZE);

  BOOST_LOG_TRIVIAL(info) << "Blob store: Stored chunked blob " << hash << " (" << data.size()
                          << " bytes, " << index.chunk_count << " chunks)";

  StoreResult result;
  result.hash = hash;
  result.size_bytes = data.size();
  result.chunk_count = index.chunk_count;
  result.chunked = true;
  result.already_existed = false;
  return result;
}

StoreResult BlobStore::existing_result(const std::string& hash) const {
  StoreResult result;
  result.hash = hash;
  result.already_existed = true;

  if (is_chunked(hash)) {
    ChunkIndex index = read_chunk_index(hash);
    result.size_bytes = index.size_bytes;
    result.chunk_count = index.chunk_count;
    result.chunked = true;
  } else {
    result.size_bytes = size(hash);
    result.chunk_count = 1;
    result.chunked = false;
  }
  return result;
}

Bytes BlobStore::get_chunked(const std::string& hash) const {
  ChunkIndex index = read_chunk_index(hash);
  fs::path chunk_dir = chunk_dir_path(hash);

  Bytes data;
  data.reserve(index.size_bytes);
  for (uint32_t i = 0; i < index.chunk_count; ++i) {
    Bytes chunk = read_file(chunk_dir / chunk_file_name(i));
    data.insert(data.end(), chunk.begin(), chunk.end());
  }

  // Corrupted bytes are never returned
  std::string computed = ContentAddress::compute_hash(data);
  if (computed != hash) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Reassembled blob hash mismatch, expected " << hash
                             << ", actual " << computed;
    throw HashMismatchError(hash, computed);
  }

  BOOST_LOG_TRIVIAL(debug) << "Blob store: Reassembled " << index.chunk_count << " chunks for " << hash;
  return data;
}

Bytes BlobStore::get_chunked_range(const std::string& hash, uint64_t start, uint64_t end) const {
  ChunkIndex index = read_chunk_index(hash);
  end = std::min(end, index.size_bytes);
  if (start >= end) {
    return {};
  }

  uint32_t first = static_cast<uint32_t>(start / index.chunk_size);
  uint32_t last = static_cast<uint32_t>((end - 1) / index.chunk_size);

  Bytes data;
  data.reserve(end - start);
  for (uint32_t i = first; i <= last; ++i) {
    Bytes chunk = read_verified_chunk(hash, index, i);
    uint64_t chunk_start = static_cast<uint64_t>(i) * index.chunk_size;
    uint64_t from = std::max(start, chunk_start) - chunk_start;
    uint64_t to = std::min<uint64_t>(end - chunk_start, chunk.size());
    if (from < to) {
      data.insert(data.end(), chunk.begin() + from, chunk.begin() + to);
    }
  }

  BOOST_LOG_TRIVIAL(debug) << "Blob store: Served range from chunks " << first << ".." << last << " of " << hash;
  return data;
}

Bytes BlobStore::read_verified_chunk(const std::string& hash, const ChunkIndex& index, uint32_t chunk) const {
  Bytes data = read_file(chunk_dir_path(hash) / chunk_file_name(chunk));
  std::string computed = ContentAddress::compute_hash(data);
  if (computed != index.chunk_hashes[chunk]) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Chunk " << chunk << " of " << hash << " failed verification";
    throw HashMismatchError(index.chunk_hashes[chunk], computed);
  }
  return data;
}

ChunkIndex BlobStore::read_chunk_index(const std::string& hash) const {
  fs::path index_path = chunk_index_path(hash);
  Bytes raw = read_file(index_path);

  ChunkIndex index;
  try {
    index = nlohmann::json::parse(raw.begin(), raw.end()).get<ChunkIndex>();
  } catch (const nlohmann::json::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Unreadable chunk index " << index_path.string() << ": " << e.what();
    throw InvalidDataError("unreadable chunk index for " + hash + ": " + e.what());
  }

  if (index.hash != hash) {
    throw InvalidDataError("chunk index for " + hash + " names " + index.hash);
  }
  if (index.chunk_size == 0 || index.chunk_hashes.size() != index.chunk_count) {
    throw InvalidDataError("inconsistent chunk index for " + hash);
  }
  return index;
}

bool BlobStore::is_chunked(const std::string& hash) const {
  fs::path path = blob_path(hash);
  std::error_code ec;
  if (fs::file_size(path, ec) != SENTINEL_SIZE || ec) {
    return false;
  }
  if (!fs::exists(chunk_index_path(hash), ec)) {
    return false;
  }

  Bytes content = read_file(path);
  return content.size() == SENTINEL_SIZE &&
         std::memcmp(content.data(), CHUNKED_SENTINEL, SENTINEL_SIZE) == 0;
}

bool BlobStore::is_orphaned_sentinel(const std::string& hash) const {
  fs::path path = blob_path(hash);
  std::error_code ec;
  if (fs::file_size(path, ec) != SENTINEL_SIZE || ec) {
    return false;
  }
  if (fs::exists(chunk_index_path(hash), ec)) {
    return false;
  }

  Bytes content = read_file(path);
  if (content.size() != SENTINEL_SIZE ||
      std::memcmp(content.data(), CHUNKED_SENTINEL, SENTINEL_SIZE) != 0) {
    return false;
  }

  // A genuine seven byte blob spelling the sentinel hashes to its own name
  if (ContentAddress::compute_hash(content) == hash) {
    return false;
  }
  BOOST_LOG_TRIVIAL(warning) << "Blob store: Chunk marker without index for " << hash;
  return true;
}


//==============================================
// FILE SUPPORT
//==============================================

void BlobStore::write_file_atomic(const fs::path& path, const uint8_t* data, size_t size) const {
  fs::path temp_path = path;
  temp_path += temp_suffix();

  {
    std::ofstream file(temp_path, std::ios::binary | std::ios::trunc);
    if (!file) {
      BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to create file: " << temp_path.string();
      throw IoError(temp_path.string(), "failed to create file");
    }
    if (size > 0) {
      file.write(reinterpret_cast<const char*>(data), static_cast<std::streamsize>(size));
    }
    file.flush();
    if (!file) {
      file.close();
      std::error_code ignored;
      fs::remove(temp_path, ignored);
      BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to write file: " << temp_path.string();
      throw IoError(temp_path.string(), "failed to write file");
    }
  }

  std::error_code ec;
  fs::rename(temp_path, path, ec);
  if (ec) {
    std::error_code ignored;
    fs::remove(temp_path, ignored);
    BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to move file into place: " << path.string();
    throw IoError(path.string(), ec.message());
  }
}

Bytes BlobStore::read_file(const fs::path& path) const {
  std::error_code ec;
  uint64_t length = fs::file_size(path, ec);
  if (ec) {
    throw IoError(path.string(), ec.message());
  }
  return read_file_range(path, 0, length);
}

Bytes BlobStore::read_file_range(const fs::path& path, uint64_t offset, uint64_t length) const {
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to open file: " << path.string();
    throw IoError(path.string(), "failed to open file");
  }

  Bytes data(length);
  if (length == 0) {
    return data;
  }

  file.seekg(static_cast<std::streamoff>(offset));
  file.read(reinterpret_cast<char*>(data.data()), static_cast<std::streamsize>(length));
  if (static_cast<uint64_t>(file.gcount()) != length) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Short read on " << path.string();
    throw IoError(path.string(), "short read");
  }
  return data;
}

void BlobStore::check_directory_exists(const fs::path& path) const {
  std::error_code ec;
  fs::create_directories(path, ec);
  if (ec) {
    BOOST_LOG_TRIVIAL(error) << "Blob store: Failed to create directory " << path.string() << ": " << ec.message();
    throw IoError(path.string(), ec.message());
  }
}

void BlobStore::validate_hash(const std::string& hash) const {
  if (!ContentAddress::is_content_hash(hash)) {
    throw InvalidDataError("malformed content hash: " + hash);
  }
}

} // namespace store
} // namespace blobshard
