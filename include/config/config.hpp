#pragma once

#include <cstddef>
#include <filesystem>
#include <stdexcept>
#include <string>
#include "store/store.hpp"
#include "shard/shard_config.hpp"
#include "logger/logger.hpp"

namespace blobshard {
namespace config {

class ConfigError : public std::runtime_error {
public:
  explicit ConfigError(const std::string& message)
    : std::runtime_error("Config error: " + message) {}
};

// Everything a blobshard process needs, loaded from a JSON file where every key is optional:
//
//   {
//     "store":  {"root_dir": "data", "chunk_size": 1048576, "max_inline_size": 16777216},
//     "shard":  {"shard_size": 1048576, "rs_data_shards": 4, "rs_parity_shards": 3,
//                "rs_threshold": 10485760, "single_shard_max": 16777216},
//     "log":    {"level": "info", "console": true, "file": "", "rotation_size": 10485760},
//     "worker_threads": 4
//   }
struct Config {
  static constexpr const char* DEFAULT_ROOT_DIR = "blobshard_data";

  store::StoreConfig store{DEFAULT_ROOT_DIR};
  shard::ShardConfig shard;
  logging::LogConfig log;
  std::size_t worker_threads{4};

  // Throws ConfigError describing the first invalid setting
  void validate() const;

  static Config load_file(const std::filesystem::path& path);
  static Config from_json_string(const std::string& text);
};

} // namespace config
} // namespace blobshard
