#pragma once

#include <iostream>
#include <string>
#include <vector>
#include "common/types.hpp"
#include "config/config.hpp"
#include "store/store.hpp"
#include "shard/shard_encoder.hpp"
#include "network/shard_server.hpp"

namespace blobshard {
namespace cli {

// One-shot command front end over a local store
class CLI {
public:
    // ---- CONSTRUCTOR AND DESTRUCTOR ----
    CLI(const config::Config& config, std::ostream& out, std::ostream& err);


    // ---- STARTUP ----
    // Runs a single command, returns the process exit code
    int run(const std::vector<std::string>& args);

    static void print_commands(std::ostream& os);

private:
    // ---- PARAMETERS ----
    config::Config config_;
    std::ostream& out_;
    std::ostream& err_;
    // System components
    store::BlobStore store_;
    shard::ShardEncoder encoder_;
    network::ShardServer shard_server_;


    // ---- COMMAND PROCESSING ----
    int process_command(const std::string& command, const std::vector<std::string>& args);
    int handle_put_command(const std::vector<std::string>& args);
    int handle_get_command(const std::vector<std::string>& args);
    int handle_range_command(const std::vector<std::string>& args);
    int handle_has_command(const std::vector<std::string>& args);
    int handle_size_command(const std::vector<std::string>& args);
    int handle_delete_command(const std::vector<std::string>& args);
    int handle_stats_command(const std::vector<std::string>& args);
    int handle_encode_command(const std::vector<std::string>& args);
    int handle_decode_command(const std::vector<std::string>& args);
    int handle_verify_command(const std::vector<std::string>& args);
    int handle_repair_command(const std::vector<std::string>& args);
    int log_and_display_error(const std::string& message, const std::string& error);


    // ---- INPUT AND OUTPUT ----
    // "-" is stdin / stdout
    Bytes read_input(const std::string& path) const;
    void write_output(const std::string& path, const Bytes& data);
    shard::ShardManifest read_manifest(const std::string& path) const;
};

} // namespace cli
} // namespace blobshard
