#include "config/config.hpp"
#include "store/storage_error.hpp"
#include <nlohmann/json.hpp>
#include <boost/log/trivial.hpp>
#include <fstream>
#include <sstream>

namespace blobshard {
namespace config {

using json = nlohmann::json;

namespace {

// Copies j[key] into target when present, leaving the default otherwise
template <typename T>
void read_optional(const json& j, const char* section, const char* key, T& target) {
  if (!j.contains(key)) {
    return;
  }
  try {
    j.at(key).get_to(target);
  } catch (const json::exception& e) {
    throw ConfigError(std::string(section) + "." + key + ": " + e.what());
  }
}

void warn_unknown_keys(const json& j, const char* section, std::initializer_list<const char*> known) {
  for (auto it = j.begin(); it != j.end(); ++it) {
    bool found = false;
    for (const char* key : known) {
      if (it.key() == key) {
        found = true;
        break;
      }
    }
    if (!found) {
      BOOST_LOG_TRIVIAL(warning) << "Config: Ignoring unknown key " << section << "." << it.key();
    }
  }
}

const json& section_of(const json& root, const char* name) {
  const json& section = root.at(name);
  if (!section.is_object()) {
    throw ConfigError(std::string("section '") + name + "' must be an object");
  }
  return section;
}

} // namespace


//==============================================
// VALIDATION
//==============================================

void Config::validate() const {
  if (store.root_dir.empty()) {
    throw ConfigError("store.root_dir must not be empty");
  }
  if (store.chunk_size == 0) {
    throw ConfigError("store.chunk_size must be greater than zero");
  }
  if (store.max_inline_size == 0) {
    throw ConfigError("store.max_inline_size must be greater than zero");
  }
  if (worker_threads == 0) {
    throw ConfigError("worker_threads must be greater than zero");
  }
  if (log.rotation_size == 0) {
    throw ConfigError("log.rotation_size must be greater than zero");
  }

  try {
    shard.validate();
  } catch (const store::InvalidDataError& e) {
    throw ConfigError(std::string("shard: ") + e.what());
  }
}


//==============================================
// LOADING
//==============================================

Config Config::load_file(const std::filesystem::path& path) {
  std::ifstream file(path);
  if (!file) {
    BOOST_LOG_TRIVIAL(error) << "Config: Failed to open " << path;
    throw ConfigError("cannot open " + path.string());
  }
  std::stringstream buffer;
  buffer << file.rdbuf();

  BOOST_LOG_TRIVIAL(info) << "Config: Loading " << path;
  return from_json_string(buffer.str());
}

Config Config::from_json_string(const std::string& text) {
  json root;
  try {
    root = json::parse(text);
  } catch (const json::parse_error& e) {
    throw ConfigError(std::string("malformed JSON: ") + e.what());
  }
  if (!root.is_object()) {
    throw ConfigError("top level must be an object");
  }
  warn_unknown_keys(root, "config", {"store", "shard", "log", "worker_threads"});

  Config config;

  if (root.contains("store")) {
    const json& j = section_of(root, "store");
    warn_unknown_keys(j, "store", {"root_dir", "chunk_size", "max_inline_size"});
    std::string root_dir = config.store.root_dir.string();
    read_optional(j, "store", "root_dir", root_dir);
    config.store.root_dir = root_dir;
    read_optional(j, "store", "chunk_size", config.store.chunk_size);
    read_optional(j, "store", "max_inline_size", config.store.max_inline_size);
  }

  if (root.contains("shard")) {
    const json& j = section_of(root, "shard");
    warn_unknown_keys(j, "shard", {"shard_size", "rs_data_shards", "rs_parity_shards", "rs_threshold",
                                   "single_shard_max"});
    read_optional(j, "shard", "shard_size", config.shard.shard_size);
    read_optional(j, "shard", "rs_data_shards", config.shard.rs_data_shards);
    read_optional(j, "shard", "rs_parity_shards", config.shard.rs_parity_shards);
    read_optional(j, "shard", "rs_threshold", config.shard.rs_threshold);
    read_optional(j, "shard", "single_shard_max", config.shard.single_shard_max);
  }

  if (root.contains("log")) {
    const json& j = section_of(root, "log");
    warn_unknown_keys(j, "log", {"level", "console", "file", "rotation_size"});
    std::string level;
    read_optional(j, "log", "level", level);
    if (!level.empty()) {
      try {
        config.log.level = logging::parse_severity(level);
      } catch (const std::invalid_argument& e) {
        throw ConfigError(std::string("log.level: ") + e.what());
      }
    }
    read_optional(j, "log", "console", config.log.console);
    read_optional(j, "log", "file", config.log.file);
    read_optional(j, "log", "rotation_size", config.log.rotation_size);
  }

  read_optional(root, "config", "worker_threads", config.worker_threads);

  config.validate();
  return config;
}

} // namespace config
} // namespace blobshard
