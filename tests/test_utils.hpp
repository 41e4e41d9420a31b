#ifndef BLOBSHARD_TEST_UTILS_HPP
#define BLOBSHARD_TEST_UTILS_HPP

#include <chrono>
#include <filesystem>
#include <random>
#include <string>
#include <boost/log/trivial.hpp>
#include "common/types.hpp"
#include "logger/logger.hpp"

namespace blobshard::test {

// Quiet console logging unless a test raises the level itself
inline void init_test_logging(boost::log::trivial::severity_level level = boost::log::trivial::warning) {
    logging::LogConfig config;
    config.level = level;
    logging::init_logging(config);
}

// Unique directory under the system temp dir
inline std::filesystem::path make_test_dir(const std::string& prefix) {
    static std::mt19937_64 rng{std::random_device{}()};
    std::filesystem::path dir = std::filesystem::temp_directory_path() /
        (prefix + "_" + std::to_string(std::chrono::system_clock::now().time_since_epoch().count()) +
         "_" + std::to_string(rng()));
    std::filesystem::create_directories(dir);
    return dir;
}

// Deterministic pseudo-random payload
inline Bytes random_bytes(size_t size, uint32_t seed = 42) {
    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dist(0, 255);
    Bytes data(size);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dist(gen));
    }
    return data;
}

inline Bytes to_bytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

} // namespace blobshard::test

#endif // BLOBSHARD_TEST_UTILS_HPP
