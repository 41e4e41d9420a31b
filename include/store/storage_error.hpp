#ifndef BLOBSHARD_STORAGE_ERROR_HPP
#define BLOBSHARD_STORAGE_ERROR_HPP

#include <stdexcept>
#include <string>

namespace blobshard::store {

class StorageError : public std::runtime_error {
public:
    explicit StorageError(const std::string& message)
        : std::runtime_error(message) {}
};

// Requested content, or a required shard, is not held locally
class NotFoundError : public StorageError {
public:
    explicit NotFoundError(const std::string& what_missing)
        : StorageError("Not found: " + what_missing)
        , missing_(what_missing) {}

    const std::string& missing() const { return missing_; }

private:
    std::string missing_;
};

// Bytes do not hash to the address they were claimed under
class HashMismatchError : public StorageError {
public:
    HashMismatchError(const std::string& expected, const std::string& actual)
        : StorageError("Hash mismatch: expected " + expected + ", actual " + actual)
        , expected_(expected)
        , actual_(actual) {}

    const std::string& expected() const { return expected_; }
    const std::string& actual() const { return actual_; }

private:
    std::string expected_;
    std::string actual_;
};

class InvalidDataError : public StorageError {
public:
    explicit InvalidDataError(const std::string& reason)
        : StorageError("Invalid data: " + reason) {}
};

class IoError : public StorageError {
public:
    IoError(const std::string& path, const std::string& reason)
        : StorageError("I/O error on " + path + ": " + reason)
        , path_(path) {}

    const std::string& path() const { return path_; }

private:
    std::string path_;
};

} // namespace blobshard::store

#endif // BLOBSHARD_STORAGE_ERROR_HPP
