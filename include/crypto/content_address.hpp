#ifndef BLOBSHARD_CRYPTO_CONTENT_ADDRESS_HPP
#define BLOBSHARD_CRYPTO_CONTENT_ADDRESS_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>
#include "common/types.hpp"
#include "crypto/crypto_error.hpp"

namespace blobshard::crypto {

class ContentAddress {
public:
  static constexpr size_t DIGEST_SIZE = 32;
  static constexpr const char* HASH_PREFIX = "sha256-";
  static constexpr size_t HASH_PREFIX_LENGTH = 7;
  static constexpr size_t HASH_LENGTH = HASH_PREFIX_LENGTH + 2 * DIGEST_SIZE;

  using Digest = std::array<uint8_t, DIGEST_SIZE>;


  // ---- DIGESTS ----
  // SHA-256 over the given bytes using OpenSSL EVP
  static Digest sha256(const uint8_t* data, size_t size);
  static Digest sha256(const Bytes& data);


  // ---- CONTENT HASH ----
  // Returns "sha256-" followed by the lowercase hex digest
  static std::string compute_hash(const Bytes& data);
  static std::string compute_hash(const uint8_t* data, size_t size);
  // Returns (content id, content hash) computed from a single digest
  static std::pair<std::string, std::string> compute_addresses(const Bytes& data);
  // True when the string is "sha256-" followed by 64 lowercase hex chars
  static bool is_content_hash(const std::string& hash);


  // ---- CONTENT ID ----
  // CIDv1, raw codec, sha2-256 multihash, base32 multibase ("bafkrei...")
  static std::string content_id_from_digest(const Digest& digest);
  static std::string content_id_from_hash(const std::string& hash);
  // Inverse of content_id_from_hash, throws ContentIdError on malformed input
  static std::string hash_from_content_id(const std::string& content_id);

private:
  static std::string hash_from_digest(const Digest& digest);
  static Digest digest_from_hash(const std::string& hash);
};

} // namespace blobshard::crypto

#endif // BLOBSHARD_CRYPTO_CONTENT_ADDRESS_HPP
