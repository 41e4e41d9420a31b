#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include "config/config.hpp"
#include "test_utils.hpp"

using namespace blobshard;
using namespace blobshard::config;

class ConfigTest : public ::testing::Test {
protected:
  void SetUp() override {
    test::init_test_logging(boost::log::trivial::error);
  }

  static void expect_config_error(const std::string& text, const std::string& fragment) {
    try {
      Config::from_json_string(text);
      FAIL() << "Expected ConfigError for " << text;
    } catch (const ConfigError& e) {
      std::string message = e.what();
      EXPECT_EQ(message.rfind("Config error: ", 0), 0u) << message;
      EXPECT_NE(message.find(fragment), std::string::npos) << message;
    }
  }
};

TEST_F(ConfigTest, Defaults) {
  Config config;
  EXPECT_EQ(config.store.root_dir, std::filesystem::path("blobshard_data"));
  EXPECT_EQ(config.store.chunk_size, 1024u * 1024u);
  EXPECT_EQ(config.store.max_inline_size, 16u * 1024u * 1024u);
  EXPECT_EQ(config.shard.shard_size, 1024u * 1024u);
  EXPECT_EQ(config.shard.rs_data_shards, 4u);
  EXPECT_EQ(config.shard.rs_parity_shards, 3u);
  EXPECT_EQ(config.shard.rs_threshold, 10u * 1024u * 1024u);
  EXPECT_EQ(config.shard.single_shard_max, 16u * 1024u * 1024u);
  EXPECT_EQ(config.log.level, boost::log::trivial::info);
  EXPECT_TRUE(config.log.console);
  EXPECT_TRUE(config.log.file.empty());
  EXPECT_EQ(config.worker_threads, 4u);
  EXPECT_NO_THROW(config.validate());

  Config empty = Config::from_json_string("{}");
  EXPECT_EQ(empty.store.root_dir, config.store.root_dir);
  EXPECT_EQ(empty.worker_threads, config.worker_threads);
}

TEST_F(ConfigTest, PartialSections) {
  Config config = Config::from_json_string(R"({
    "store": {"root_dir": "/var/lib/blobshard", "chunk_size": 4096},
    "shard": {"rs_data_shards": 10, "rs_parity_shards": 4},
    "log": {"level": "DEBUG", "file": "blobshard.log"},
    "worker_threads": 8
  })");

  EXPECT_EQ(config.store.root_dir, std::filesystem::path("/var/lib/blobshard"));
  EXPECT_EQ(config.store.chunk_size, 4096u);
  EXPECT_EQ(config.store.max_inline_size, 16u * 1024u * 1024u);
  EXPECT_EQ(config.shard.rs_data_shards, 10u);
  EXPECT_EQ(config.shard.rs_parity_shards, 4u);
  EXPECT_EQ(config.shard.shard_size, shard::ShardConfig::DEFAULT_SHARD_SIZE);
  EXPECT_EQ(config.log.level, boost::log::trivial::debug);
  EXPECT_EQ(config.log.file, "blobshard.log");
  EXPECT_TRUE(config.log.console);
  EXPECT_EQ(config.worker_threads, 8u);
}

TEST_F(ConfigTest, UnknownKeysAreIgnored) {
  Config config = Config::from_json_string(R"({"store": {"compression": "zstd"}, "metrics": true})");
  EXPECT_EQ(config.store.root_dir, std::filesystem::path(Config::DEFAULT_ROOT_DIR));
}

TEST_F(ConfigTest, TypeErrorsNameTheKey) {
  expect_config_error(R"({"store": {"chunk_size": "large"}})", "store.chunk_size");
  expect_config_error(R"({"shard": {"rs_data_shards": [4]}})", "shard.rs_data_shards");
  expect_config_error(R"({"log": {"console": "yes"}})", "log.console");
  expect_config_error(R"({"worker_threads": "many"})", "worker_threads");
}

TEST_F(ConfigTest, InvalidValues) {
  expect_config_error(R"({"store": {"root_dir": ""}})", "store.root_dir");
  expect_config_error(R"({"store": {"chunk_size": 0}})", "store.chunk_size");
  expect_config_error(R"({"store": {"max_inline_size": 0}})", "store.max_inline_size");
  expect_config_error(R"({"worker_threads": 0})", "worker_threads");
  expect_config_error(R"({"log": {"rotation_size": 0}})", "log.rotation_size");
  expect_config_error(R"({"log": {"level": "chatty"}})", "log.level");
  expect_config_error(R"({"shard": {"shard_size": 0}})", "shard");
  expect_config_error(R"({"shard": {"rs_data_shards": 0}})", "shard");
  expect_config_error(R"({"shard": {"rs_data_shards": 200, "rs_parity_shards": 100}})", "shard");
}

TEST_F(ConfigTest, MalformedDocuments) {
  expect_config_error("{\"store\": ", "malformed JSON");
  expect_config_error("[1, 2, 3]", "top level");
  expect_config_error(R"({"store": "data"})", "store");
  expect_config_error(R"({"log": 5})", "log");
}

TEST_F(ConfigTest, LoadFile) {
  std::filesystem::path dir = test::make_test_dir("config_test");
  std::filesystem::path path = dir / "blobshard.json";
  {
    std::ofstream file(path);
    file << R"({"store": {"root_dir": "shards"}, "worker_threads": 2})";
  }

  Config config = Config::load_file(path);
  EXPECT_EQ(config.store.root_dir, std::filesystem::path("shards"));
  EXPECT_EQ(config.worker_threads, 2u);

  EXPECT_THROW(Config::load_file(dir / "missing.json"), ConfigError);

  std::error_code ec;
  std::filesystem::remove_all(dir, ec);
}
