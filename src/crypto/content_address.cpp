#include "crypto/content_address.hpp"
#include <openssl/evp.h>
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <iomanip>
#include <sstream>

namespace blobshard::crypto {

namespace {

// CIDv1 header: version 1, raw codec (0x55), sha2-256 multihash (0x12) of 32 bytes
constexpr uint8_t CID_PREFIX[] = {0x01, 0x55, 0x12, 0x20};
constexpr char BASE32_ALPHABET[] = "abcdefghijklmnopqrstuvwxyz234567";
constexpr char MULTIBASE_BASE32 = 'b';

//=================================================
// RAII WRAPPER TO MANAGE DIGEST CONTEXT LIFECYCLE
//=================================================

struct DigestContext {
  EVP_MD_CTX* ctx = nullptr;

  DigestContext() {
    ctx = EVP_MD_CTX_new();
    if (!ctx) {
      throw DigestError("Failed to create hash context");
    }
  }

  ~DigestContext() {
    if (ctx) {
      EVP_MD_CTX_free(ctx);
    }
  }

  DigestContext(const DigestContext&) = delete;
  DigestContext& operator=(const DigestContext&) = delete;

  EVP_MD_CTX* get() { return ctx; }
};

// RFC 4648 base32, lowercase, no padding
std::string base32_encode(const std::vector<uint8_t>& input) {
  std::string output;
  output.reserve((input.size() * 8 + 4) / 5);

  uint32_t buffer = 0;
  int bits = 0;
  for (uint8_t byte : input) {
    buffer = (buffer << 8) | byte;
    bits += 8;
    while (bits >= 5) {
      output.push_back(BASE32_ALPHABET[(buffer >> (bits - 5)) & 0x1F]);
      bits -= 5;
    }
  }
  if (bits > 0) {
    output.push_back(BASE32_ALPHABET[(buffer << (5 - bits)) & 0x1F]);
  }
  return output;
}

std::vector<uint8_t> base32_decode(const std::string& input) {
  std::vector<uint8_t> output;
  output.reserve(input.size() * 5 / 8);

  uint32_t buffer = 0;
  int bits = 0;
  for (char c : input) {
    int value;
    if (c >= 'a' && c <= 'z') {
      value = c - 'a';
    } else if (c >= '2' && c <= '7') {
      value = c - '2' + 26;
    } else {
      throw ContentIdError("Invalid base32 character in content id");
    }
    buffer = (buffer << 5) | static_cast<uint32_t>(value);
    bits += 5;
    if (bits >= 8) {
      output.push_back(static_cast<uint8_t>((buffer >> (bits - 8)) & 0xFF));
      bits -= 8;
    }
  }
  return output;
}

int hex_value(char c) {
  if (c >= '0' && c <= '9') return c - '0';
  if (c >= 'a' && c <= 'f') return c - 'a' + 10;
  return -1;
}

} // namespace


//==============================================
// DIGESTS
//==============================================

ContentAddress::Digest ContentAddress::sha256(const uint8_t* data, size_t size) {
  DigestContext context;

  if (!EVP_DigestInit_ex(context.get(), EVP_sha256(), nullptr)) {
    throw DigestError("Failed to initialize hash context");
  }

  if (size > 0 && !EVP_DigestUpdate(context.get(), data, size)) {
    throw DigestError("Failed to update hash");
  }

  Digest digest{};
  unsigned int digest_len = 0;
  if (!EVP_DigestFinal_ex(context.get(), digest.data(), &digest_len) || digest_len != DIGEST_SIZE) {
    throw DigestError("Failed to finalize hash");
  }

  return digest;
}

ContentAddress::Digest ContentAddress::sha256(const Bytes& data) {
  return sha256(data.data(), data.size());
}


//==============================================
// CONTENT HASH
//==============================================

std::string ContentAddress::compute_hash(const Bytes& data) {
  return hash_from_digest(sha256(data));
}

std::string ContentAddress::compute_hash(const uint8_t* data, size_t size) {
  return hash_from_digest(sha256(data, size));
}

std::pair<std::string, std::string> ContentAddress::compute_addresses(const Bytes& data) {
  Digest digest = sha256(data);
  std::string content_id = content_id_from_digest(digest);
  std::string hash = hash_from_digest(digest);
  BOOST_LOG_TRIVIAL(trace) << "Content address: " << hash << " -> " << content_id;
  return {content_id, hash};
}

bool ContentAddress::is_content_hash(const std::string& hash) {
  if (hash.size() != HASH_LENGTH || hash.compare(0, HASH_PREFIX_LENGTH, HASH_PREFIX) != 0) {
    return false;
  }
  for (size_t i = HASH_PREFIX_LENGTH; i < hash.size(); ++i) {
    if (hex_value(hash[i]) < 0) {
      return false;
    }
  }
  return true;
}

std::string ContentAddress::hash_from_digest(const Digest& digest) {
  std::stringstream ss;
  ss << HASH_PREFIX;
  for (uint8_t byte : digest) {
    ss << std::hex << std::setw(2) << std::setfill('0') << static_cast<int>(byte);
  }
  return ss.str();
}

ContentAddress::Digest ContentAddress::digest_from_hash(const std::string& hash) {
  if (!is_content_hash(hash)) {
    throw ContentIdError("Malformed content hash: " + hash);
  }

  Digest digest{};
  for (size_t i = 0; i < DIGEST_SIZE; ++i) {
    size_t pos = HASH_PREFIX_LENGTH + 2 * i;
    digest[i] = static_cast<uint8_t>((hex_value(hash[pos]) << 4) | hex_value(hash[pos + 1]));
  }
  return digest;
}


//==============================================
// CONTENT ID
//==============================================

std::string ContentAddress::content_id_from_digest(const Digest& digest) {
  std::vector<uint8_t> binary(std::begin(CID_PREFIX), std::end(CID_PREFIX));
  binary.insert(binary.end(), digest.begin(), digest.end());
  return MULTIBASE_BASE32 + base32_encode(binary);
}

std::string ContentAddress::content_id_from_hash(const std::string& hash) {
  return content_id_from_digest(digest_from_hash(hash));
}

std::string ContentAddress::hash_from_content_id(const std::string& content_id) {
  if (content_id.empty() || content_id[0] != MULTIBASE_BASE32) {
    throw ContentIdError("Unsupported multibase in content id: " + content_id);
  }

  std::vector<uint8_t> binary = base32_decode(content_id.substr(1));
  if (binary.size() != sizeof(CID_PREFIX) + DIGEST_SIZE ||
      !std::equal(std::begin(CID_PREFIX), std::end(CID_PREFIX), binary.begin())) {
    throw ContentIdError("Content id is not a CIDv1 raw sha2-256: " + content_id);
  }

  Digest digest{};
  std::copy(binary.begin() + sizeof(CID_PREFIX), binary.end(), digest.begin());
  return hash_from_digest(digest);
}

} // namespace blobshard::crypto
