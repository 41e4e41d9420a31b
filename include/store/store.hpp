#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "store/storage_error.hpp"

namespace blobshard {
namespace store {

// Outcome of a single store() call, not persisted
struct StoreResult {
  std::string hash;
  uint64_t size_bytes{0};
  uint32_t chunk_count{0};
  bool chunked{false};
  bool already_existed{false};
};

struct StoreStats {
  uint64_t total_blobs{0};
  uint64_t total_bytes{0};
  uint64_t chunked_blobs{0};
};

// Sidecar record written next to a chunked blob
struct ChunkIndex {
  std::string hash;
  uint64_t size_bytes{0};
  uint32_t chunk_count{0};
  uint64_t chunk_size{0};
  std::vector<std::string> chunk_hashes;
};

struct StoreConfig {
  std::filesystem::path root_dir;
  // Size of each internal chunk of an oversized blob
  uint64_t chunk_size{1024 * 1024};
  // Largest blob written as a single file
  uint64_t max_inline_size{16 * 1024 * 1024};
};

class BlobStore {
public:
  static constexpr const char* CHUNKED_SENTINEL = "CHUNKED";
  static constexpr size_t SENTINEL_SIZE = 7;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  explicit BlobStore(const StoreConfig& config);
  explicit BlobStore(const std::filesystem::path& root_dir);


  // ---- CORE STORAGE OPERATIONS ----
  // Stores bytes under their content hash, a no-op when already present
  StoreResult store(const Bytes& data);
  // Returns the full blob, reassembling and verifying chunked blobs
  Bytes get(const std::string& hash) const;
  // Returns bytes [start, min(end, size)) of the blob
  Bytes get_range(const std::string& hash, uint64_t start, uint64_t end) const;
  // Removes a blob and its chunk set, missing files are ignored
  void remove(const std::string& hash);
  // Removes all stored data and resets the store
  void clear();


  // ---- QUERY OPERATIONS ----
  // Checks the canonical path only, does not verify chunk integrity
  bool exists(const std::string& hash) const;
  // Logical blob size, read from the chunk index for chunked blobs
  uint64_t size(const std::string& hash) const;
  StoreStats stats() const;


  // ---- PATH LAYOUT ----
  // {root}/blobs/{hash[7:11]}/{hash}
  std::filesystem::path blob_path(const std::string& hash) const;
  // {root}/blobs/{hash[7:11]}/{hash}.d/
  std::filesystem::path chunk_dir_path(const std::string& hash) const;
  // {root}/blobs/{hash[7:11]}/{hash}.chunks
  std::filesystem::path chunk_index_path(const std::string& hash) const;

  const StoreConfig& config() const { return config_; }

private:
  // ---- PARAMETERS ----
  StoreConfig config_;


  // ---- CHUNKED STORAGE SUPPORT ----
  StoreResult store_chunked(const std::string& hash, const Bytes& data);
  StoreResult existing_result(const std::string& hash) const;
  Bytes get_chunked(const std::string& hash) const;
  Bytes get_chunked_range(const std::string& hash, uint64_t start, uint64_t end) const;
  Bytes read_verified_chunk(const std::string& hash, const ChunkIndex& index, uint32_t chunk) const;
  ChunkIndex read_chunk_index(const std::string& hash) const;
  // Sentinel content at the canonical path plus an index sidecar
  bool is_chunked(const std::string& hash) const;
  // Sentinel left behind after its chunk set and index are gone
  bool is_orphaned_sentinel(const std::string& hash) const;


  // ---- FILE SUPPORT ----
  // Writes to a temporary sibling, then renames over the target
  void write_file_atomic(const std::filesystem::path& path, const uint8_t* data, size_t size) const;
  Bytes read_file(const std::filesystem::path& path) const;
  Bytes read_file_range(const std::filesystem::path& path, uint64_t offset, uint64_t length) const;
  void check_directory_exists(const std::filesystem::path& path) const;
  // Throws InvalidDataError unless hash is a well formed content hash
  void validate_hash(const std::string& hash) const;
};

} // namespace store
} // namespace blobshard
