#include "cli/cli.hpp"
#include "crypto/content_address.hpp"
#include "store/storage_error.hpp"
#include <boost/log/trivial.hpp>
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>

namespace blobshard {
namespace cli {

namespace {

constexpr int EXIT_OK = 0;
constexpr int EXIT_FAILURE_CODE = 1;
constexpr int EXIT_USAGE = 2;

uint64_t parse_offset(const std::string& value) {
  if (value.empty() || value.find_first_not_of("0123456789") != std::string::npos) {
    throw std::invalid_argument("not an unsigned integer: " + value);
  }
  return std::stoull(value);
}

// Splits "--flag value" pairs from positional arguments
struct ParsedArgs {
  std::vector<std::string> positional;
  std::vector<std::pair<std::string, std::string>> flags;

  std::optional<std::string> flag(const std::string& name) const {
    for (const auto& [key, value] : flags) {
      if (key == name) {
        return value;
      }
    }
    return std::nullopt;
  }
};

ParsedArgs split_args(const std::vector<std::string>& args) {
  ParsedArgs parsed;
  for (size_t i = 0; i < args.size(); ++i) {
    if (args[i].rfind("--", 0) == 0) {
      if (i + 1 >= args.size()) {
        throw std::invalid_argument("missing value for " + args[i]);
      }
      parsed.flags.emplace_back(args[i], args[i + 1]);
      ++i;
    } else {
      parsed.positional.push_back(args[i]);
    }
  }
  return parsed;
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

CLI::CLI(const config::Config& config, std::ostream& out, std::ostream& err)
  : config_(config)
  , out_(out)
  , err_(err)
  , store_(config_.store)
  , encoder_(config_.shard)
  , shard_server_(store_, encoder_, config_.worker_threads) {
  BOOST_LOG_TRIVIAL(debug) << "CLI: Initialized over " << config_.store.root_dir;
}


//==============================================
// STARTUP
//==============================================

int CLI::run(const std::vector<std::string>& args) {
  if (args.empty()) {
    err_ << "Missing command" << std::endl;
    print_commands(err_);
    return EXIT_USAGE;
  }

  const std::string& command = args.front();
  std::vector<std::string> rest(args.begin() + 1, args.end());
  BOOST_LOG_TRIVIAL(debug) << "CLI: Processing command: " << command;

  try {
    return process_command(command, rest);
  } catch (const std::invalid_argument& e) {
    err_ << "Invalid arguments: " << e.what() << std::endl;
    return EXIT_USAGE;
  } catch (const store::StorageError& e) {
    return log_and_display_error("Error", e.what());
  } catch (const std::exception& e) {
    return log_and_display_error("Unexpected error", e.what());
  }
}

void CLI::print_commands(std::ostream& os) {
  os << "Commands:\n"
     << "  put <file|->                         Store a blob, print its hash and content id\n"
     << "  get <hash> [out]                     Write a blob to out (default stdout)\n"
     << "  range <hash> <start> <end> [out]     Write bytes [start, end) of a blob\n"
     << "  has <hash>                           Exit 0 when the blob is stored, 1 otherwise\n"
     << "  size <hash>                          Print the blob size in bytes\n"
     << "  delete <hash>                        Remove a blob\n"
     << "  stats                                Print blob counts and total size\n"
     << "  encode <file|-> [--mime m] [--reach r] [--author a] [--manifest out]\n"
     << "                                       Shard a blob into the store, print its manifest\n"
     << "  decode <manifest> [out]              Reconstruct a blob from local shards\n"
     << "  verify <manifest>                    Check every shard of a manifest\n"
     << "  repair <manifest>                    Regenerate missing shards from the ones held\n";
}


//==============================================
// COMMAND PROCESSING
//==============================================

int CLI::process_command(const std::string& command, const std::vector<std::string>& args) {
  if (command == "put") return handle_put_command(args);
  if (command == "get") return handle_get_command(args);
  if (command == "range") return handle_range_command(args);
  if (command == "has") return handle_has_command(args);
  if (command == "size") return handle_size_command(args);
  if (command == "delete") return handle_delete_command(args);
  if (command == "stats") return handle_stats_command(args);
  if (command == "encode") return handle_encode_command(args);
  if (command == "decode") return handle_decode_command(args);
  if (command == "verify") return handle_verify_command(args);
  if (command == "repair") return handle_repair_command(args);

  err_ << "Unknown command: " << command << std::endl;
  print_commands(err_);
  return EXIT_USAGE;
}

int CLI::handle_put_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    throw std::invalid_argument("usage: put <file|->");
  }
  Bytes data = read_input(args[0]);
  store::StoreResult result = store_.store(data);

  out_ << result.hash << "\n"
       << crypto::ContentAddress::content_id_from_hash(result.hash) << "\n"
       << result.size_bytes << " bytes";
  if (result.chunked) {
    out_ << ", " << result.chunk_count << " chunks";
  }
  if (result.already_existed) {
    out_ << ", already stored";
  }
  out_ << std::endl;
  return EXIT_OK;
}

int CLI::handle_get_command(const std::vector<std::string>& args) {
  if (args.empty() || args.size() > 2) {
    throw std::invalid_argument("usage: get <hash> [out]");
  }
  write_output(args.size() == 2 ? args[1] : "-", store_.get(args[0]));
  return EXIT_OK;
}

int CLI::handle_range_command(const std::vector<std::string>& args) {
  if (args.size() < 3 || args.size() > 4) {
    throw std::invalid_argument("usage: range <hash> <start> <end> [out]");
  }
  uint64_t start = parse_offset(args[1]);
  uint64_t end = parse_offset(args[2]);
  write_output(args.size() == 4 ? args[3] : "-", store_.get_range(args[0], start, end));
  return EXIT_OK;
}

int CLI::handle_has_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    throw std::invalid_argument("usage: has <hash>");
  }
  bool found = store_.exists(args[0]);
  out_ << (found ? "true" : "false") << std::endl;
  return found ? EXIT_OK : EXIT_FAILURE_CODE;
}

int CLI::handle_size_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    throw std::invalid_argument("usage: size <hash>");
  }
  out_ << store_.size(args[0]) << std::endl;
  return EXIT_OK;
}

int CLI::handle_delete_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    throw std::invalid_argument("usage: delete <hash>");
  }
  store_.remove(args[0]);
  out_ << "Deleted " << args[0] << std::endl;
  return EXIT_OK;
}

int CLI::handle_stats_command(const std::vector<std::string>& args) {
  if (!args.empty()) {
    throw std::invalid_argument("usage: stats");
  }
  store::StoreStats stats = store_.stats();
  out_ << "blobs: " << stats.total_blobs << "\n"
       << "bytes: " << stats.total_bytes << "\n"
       << "chunked: " << stats.chunked_blobs << std::endl;
  return EXIT_OK;
}

int CLI::handle_encode_command(const std::vector<std::string>& args) {
  ParsedArgs parsed = split_args(args);
  if (parsed.positional.size() != 1) {
    throw std::invalid_argument("usage: encode <file|-> [--mime m] [--reach r] [--author a] [--manifest out]");
  }

  Bytes data = read_input(parsed.positional[0]);
  shard::ShardManifest manifest = shard_server_.publish(
    data,
    parsed.flag("--mime").value_or("application/octet-stream"),
    parsed.flag("--reach").value_or("commons"),
    parsed.flag("--author"));

  std::string text = manifest.to_json_string(2);
  std::string target = parsed.flag("--manifest").value_or("-");
  write_output(target, Bytes(text.begin(), text.end()));
  if (target != "-") {
    out_ << manifest.blob_hash << " " << manifest.encoding << " " << manifest.total_shards << " shards" << std::endl;
  } else {
    out_ << std::endl;
  }
  return EXIT_OK;
}

int CLI::handle_decode_command(const std::vector<std::string>& args) {
  if (args.empty() || args.size() > 2) {
    throw std::invalid_argument("usage: decode <manifest> [out]");
  }
  shard::ShardManifest manifest = read_manifest(args[0]);
  write_output(args.size() == 2 ? args[1] : "-", shard_server_.retrieve(manifest, {}));
  return EXIT_OK;
}

int CLI::handle_verify_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    throw std::invalid_argument("usage: verify <manifest>");
  }
  shard::ShardManifest manifest = read_manifest(args[0]);
  manifest.validate();

  size_t intact = 0;
  for (size_t i = 0; i < manifest.shard_hashes.size(); ++i) {
    const std::string& hash = manifest.shard_hashes[i];
    std::string state;
    if (!store_.exists(hash)) {
      state = "missing";
    } else {
      try {
        Bytes shard_data = store_.get(hash);
        state = crypto::ContentAddress::compute_hash(shard_data) == hash ? "ok" : "corrupt";
      } catch (const store::HashMismatchError&) {
        state = "corrupt";
      }
    }
    if (state == "ok") {
      ++intact;
    }
    out_ << "shard " << i << " " << hash << " " << state << "\n";
  }

  size_t required = manifest.encoding_value().kind == shard::EncodingKind::ReedSolomon
    ? manifest.data_shards : manifest.total_shards;
  bool recoverable = intact >= required;
  out_ << intact << " of " << manifest.total_shards << " shards intact, " << required << " required: "
       << (recoverable ? "recoverable" : "not recoverable") << std::endl;
  return recoverable ? EXIT_OK : EXIT_FAILURE_CODE;
}

int CLI::handle_repair_command(const std::vector<std::string>& args) {
  if (args.size() != 1) {
    throw std::invalid_argument("usage: repair <manifest>");
  }
  shard::ShardManifest manifest = read_manifest(args[0]);
  size_t written = shard_server_.heal(manifest, {});
  out_ << "Regenerated " << written << " shards of " << manifest.blob_hash << std::endl;
  return EXIT_OK;
}

int CLI::log_and_display_error(const std::string& message, const std::string& error) {
  BOOST_LOG_TRIVIAL(error) << "CLI: " << message << ": " << error;
  err_ << message << ": " << error << std::endl;
  return EXIT_FAILURE_CODE;
}


//==============================================
// INPUT AND OUTPUT
//==============================================

Bytes CLI::read_input(const std::string& path) const {
  if (path == "-") {
    return Bytes(std::istreambuf_iterator<char>(std::cin), std::istreambuf_iterator<char>());
  }
  std::ifstream file(path, std::ios::binary);
  if (!file) {
    throw store::IoError(path, "cannot open for reading");
  }
  return Bytes(std::istreambuf_iterator<char>(file), std::istreambuf_iterator<char>());
}

void CLI::write_output(const std::string& path, const Bytes& data) {
  if (path == "-") {
    out_.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
    out_.flush();
    return;
  }
  std::ofstream file(path, std::ios::binary | std::ios::trunc);
  if (!file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()))) {
    throw store::IoError(path, "cannot write output");
  }
}

shard::ShardManifest CLI::read_manifest(const std::string& path) const {
  Bytes raw = read_input(path);
  return shard::ShardManifest::from_json_string(std::string(raw.begin(), raw.end()));
}

} // namespace cli
} // namespace blobshard
