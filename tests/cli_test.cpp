#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include "cli/cli.hpp"
#include "crypto/content_address.hpp"
#include "test_utils.hpp"

using namespace blobshard;
using blobshard::crypto::ContentAddress;

namespace fs = std::filesystem;

class CLITest : public ::testing::Test {
protected:
  fs::path test_dir;
  config::Config config;
  std::ostringstream out;
  std::ostringstream err;

  void SetUp() override {
    test::init_test_logging(boost::log::trivial::fatal);
    test_dir = test::make_test_dir("cli_test");
    config.store.root_dir = test_dir / "store";
    config.shard.shard_size = 64;
    config.shard.single_shard_max = 256;
    config.shard.rs_threshold = 512;
    config.worker_threads = 1;
  }

  void TearDown() override {
    std::error_code ec;
    fs::remove_all(test_dir, ec);
  }

  int run(const std::vector<std::string>& args) {
    out.str("");
    err.str("");
    cli::CLI command_line(config, out, err);
    return command_line.run(args);
  }

  fs::path write_file(const std::string& name, const Bytes& data) {
    fs::path path = test_dir / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    return path;
  }

  static Bytes read_file(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
  }

  static std::vector<std::string> lines(const std::string& text) {
    std::vector<std::string> result;
    std::istringstream stream(text);
    for (std::string line; std::getline(stream, line);) {
      result.push_back(line);
    }
    return result;
  }
};

TEST_F(CLITest, PutAndGet) {
  Bytes data = test::to_bytes("hello from the command line");
  fs::path input = write_file("input.txt", data);
  std::string hash = ContentAddress::compute_hash(data);

  ASSERT_EQ(run({"put", input.string()}), 0) << err.str();
  std::vector<std::string> output = lines(out.str());
  ASSERT_EQ(output.size(), 3u);
  EXPECT_EQ(output[0], hash);
  EXPECT_EQ(output[1], ContentAddress::content_id_from_hash(hash));
  EXPECT_EQ(output[2], std::to_string(data.size()) + " bytes");

  ASSERT_EQ(run({"put", input.string()}), 0);
  EXPECT_NE(out.str().find("already stored"), std::string::npos);

  ASSERT_EQ(run({"get", hash}), 0);
  EXPECT_EQ(out.str(), "hello from the command line");

  fs::path copy = test_dir / "copy.txt";
  ASSERT_EQ(run({"get", hash, copy.string()}), 0);
  EXPECT_EQ(read_file(copy), data);
}

TEST_F(CLITest, PutLargeBlobReportsChunks) {
  config.store.chunk_size = 100;
  config.store.max_inline_size = 200;
  fs::path input = write_file("large.bin", test::random_bytes(1000));

  ASSERT_EQ(run({"put", input.string()}), 0) << err.str();
  EXPECT_EQ(lines(out.str()).back(), "1000 bytes, 10 chunks");

  ASSERT_EQ(run({"stats"}), 0);
  EXPECT_EQ(out.str(), "blobs: 1\nbytes: 1000\nchunked: 1\n");
}

TEST_F(CLITest, QueriesAndDelete) {
  Bytes data = test::random_bytes(300, 9);
  fs::path input = write_file("blob.bin", data);
  ASSERT_EQ(run({"put", input.string()}), 0);
  std::string hash = lines(out.str())[0];

  EXPECT_EQ(run({"has", hash}), 0);
  EXPECT_EQ(out.str(), "true\n");
  EXPECT_EQ(run({"size", hash}), 0);
  EXPECT_EQ(out.str(), "300\n");

  ASSERT_EQ(run({"range", hash, "10", "20"}), 0);
  EXPECT_EQ(out.str(), std::string(data.begin() + 10, data.begin() + 20));

  ASSERT_EQ(run({"delete", hash}), 0);
  EXPECT_EQ(run({"has", hash}), 1);
  EXPECT_EQ(out.str(), "false\n");
}

TEST_F(CLITest, Failures) {
  std::string absent = ContentAddress::compute_hash(test::to_bytes("absent"));
  EXPECT_EQ(run({"get", absent}), 1);
  EXPECT_NE(err.str().find("Not found"), std::string::npos) << err.str();

  EXPECT_EQ(run({"size", "sha256-xyz"}), 1);
  EXPECT_NE(err.str().find("Invalid data"), std::string::npos) << err.str();

  EXPECT_EQ(run({"put", (test_dir / "no-such-file").string()}), 1);
  EXPECT_NE(err.str().find("I/O error"), std::string::npos) << err.str();
}

TEST_F(CLITest, UsageErrors) {
  EXPECT_EQ(run({}), 2);
  EXPECT_EQ(run({"frobnicate"}), 2);
  EXPECT_NE(err.str().find("Unknown command"), std::string::npos);
  EXPECT_EQ(run({"get"}), 2);
  EXPECT_EQ(run({"range", "h", "ten", "20"}), 2);
  EXPECT_EQ(run({"stats", "extra"}), 2);
  EXPECT_EQ(run({"encode", "file", "--mime"}), 2);
}

TEST_F(CLITest, EncodeVerifyRepairDecode) {
  Bytes data = test::random_bytes(2000, 77);
  fs::path input = write_file("video.bin", data);
  fs::path manifest_path = test_dir / "video.manifest.json";

  ASSERT_EQ(run({"encode", input.string(), "--mime", "video/mp4", "--author", "node-1",
                 "--manifest", manifest_path.string()}), 0) << err.str();
  std::string hash = ContentAddress::compute_hash(data);
  EXPECT_EQ(out.str(), hash + " rs-4-7 7 shards\n");

  Bytes raw = read_file(manifest_path);
  shard::ShardManifest manifest = shard::ShardManifest::from_json_string(std::string(raw.begin(), raw.end()));
  EXPECT_EQ(manifest.blob_hash, hash);
  EXPECT_EQ(manifest.mime_type, "video/mp4");
  EXPECT_EQ(manifest.reach, "commons");
  EXPECT_EQ(manifest.author_id, std::optional<std::string>("node-1"));

  ASSERT_EQ(run({"verify", manifest_path.string()}), 0);
  EXPECT_EQ(lines(out.str()).back(), "7 of 7 shards intact, 4 required: recoverable");

  {
    store::BlobStore store(config.store);
    store.remove(manifest.shard_hashes[0]);
    store.remove(manifest.shard_hashes[5]);
  }

  ASSERT_EQ(run({"verify", manifest_path.string()}), 0);
  std::vector<std::string> report = lines(out.str());
  ASSERT_EQ(report.size(), 8u);
  EXPECT_EQ(report[0], "shard 0 " + manifest.shard_hashes[0] + " missing");
  EXPECT_EQ(report[1], "shard 1 " + manifest.shard_hashes[1] + " ok");
  EXPECT_EQ(report[7], "5 of 7 shards intact, 4 required: recoverable");

  fs::path decoded = test_dir / "decoded.bin";
  ASSERT_EQ(run({"decode", manifest_path.string(), decoded.string()}), 0) << err.str();
  EXPECT_EQ(read_file(decoded), data);

  ASSERT_EQ(run({"repair", manifest_path.string()}), 0) << err.str();
  EXPECT_EQ(out.str(), "Regenerated 2 shards of " + hash + "\n");

  ASSERT_EQ(run({"verify", manifest_path.string()}), 0);
  EXPECT_EQ(lines(out.str()).back(), "7 of 7 shards intact, 4 required: recoverable");
}

TEST_F(CLITest, VerifyReportsUnrecoverable) {
  Bytes data = test::random_bytes(2000, 78);
  fs::path input = write_file("doc.bin", data);
  fs::path manifest_path = test_dir / "doc.manifest.json";
  ASSERT_EQ(run({"encode", input.string(), "--manifest", manifest_path.string()}), 0);

  Bytes raw = read_file(manifest_path);
  shard::ShardManifest manifest = shard::ShardManifest::from_json_string(std::string(raw.begin(), raw.end()));
  {
    store::BlobStore store(config.store);
    for (size_t i = 0; i < 4; ++i) {
      store.remove(manifest.shard_hashes[i]);
    }
  }

  EXPECT_EQ(run({"verify", manifest_path.string()}), 1);
  EXPECT_EQ(lines(out.str()).back(), "3 of 7 shards intact, 4 required: not recoverable");
  EXPECT_EQ(run({"decode", manifest_path.string(), (test_dir / "out.bin").string()}), 1);
  EXPECT_NE(err.str().find("need at least 4 shards"), std::string::npos) << err.str();
}
