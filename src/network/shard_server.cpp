#include "network/shard_server.hpp"
#include "network/network_error.hpp"
#include "crypto/content_address.hpp"
#include <boost/asio/post.hpp>
#include <boost/log/trivial.hpp>
#include <algorithm>

namespace blobshard {
namespace network {

using crypto::ContentAddress;
using shard::EncodingKind;
using shard::ShardManifest;

ShardServer::ShardServer(store::BlobStore& store, const shard::ShardEncoder& encoder, std::size_t worker_threads)
  : store_(store)
  , encoder_(encoder)
  , pool_(std::max<std::size_t>(worker_threads, 1)) {
  BOOST_LOG_TRIVIAL(info) << "Shard server: Initialized with " << std::max<std::size_t>(worker_threads, 1)
                          << " worker threads, store root " << store_.config().root_dir;
}

ShardServer::~ShardServer() {
  pool_.join();
  BOOST_LOG_TRIVIAL(debug) << "Shard server: Worker pool stopped";
}


//==============================================
// PROCESSING OF INCOMING REQUESTS
//==============================================

ShardResponse ShardServer::handle(const ShardRequest& request) {
  BOOST_LOG_TRIVIAL(debug) << "Shard server: Handling " << message_type_to_string(request.type)
                           << " for " << request.hash;
  try {
    switch (request.type) {
      case MessageType::GET:
        return handle_get(request.hash);
      case MessageType::HAVE:
        return handle_have(request.hash);
      case MessageType::PUSH:
        return handle_push(request.hash, request.data);
      default:
        BOOST_LOG_TRIVIAL(error) << "Shard server: Not a request: " << message_type_to_string(request.type);
        return ShardResponse::error(std::string("Invalid request type: ") + message_type_to_string(request.type));
    }
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Shard server: Failed to handle " << message_type_to_string(request.type)
                             << " for " << request.hash << ": " << e.what();
    return ShardResponse::error(e.what());
  }
}

void ShardServer::submit(ShardRequest request, ResponseCallback callback) {
  {
    std::lock_guard<std::mutex> lock(pending_mutex_);
    ++pending_;
  }

  boost::asio::post(pool_, [this, request = std::move(request), callback = std::move(callback)]() {
    ShardResponse response = handle(request);
    try {
      callback(response);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(error) << "Shard server: Response callback for " << request.hash << " failed: " << e.what();
    }

    std::lock_guard<std::mutex> lock(pending_mutex_);
    if (--pending_ == 0) {
      pending_cv_.notify_all();
    }
  });
}

void ShardServer::serve(std::istream& input, std::ostream& output) {
  ShardResponse response;
  try {
    response = handle(request_from_frame(codec_.deserialize(input)));
  } catch (const CodecError& e) {
    BOOST_LOG_TRIVIAL(warning) << "Shard server: Rejected malformed request: " << e.what();
    response = ShardResponse::error(e.what());
  } catch (const std::exception& e) {
    BOOST_LOG_TRIVIAL(error) << "Shard server: Failed to read request: " << e.what();
    response = ShardResponse::error(e.what());
  }
  codec_.serialize(to_frame(response), output);
}

void ShardServer::wait() {
  std::unique_lock<std::mutex> lock(pending_mutex_);
  pending_cv_.wait(lock, [this] { return pending_ == 0; });
}


//==============================================
// REQUEST HANDLERS
//==============================================

ShardResponse ShardServer::handle_get(const std::string& hash) {
  if (!ContentAddress::is_content_hash(hash)) {
    BOOST_LOG_TRIVIAL(warning) << "Shard server: Get with malformed hash: " << hash;
    return ShardResponse::error(store::InvalidDataError("malformed content hash: " + hash).what());
  }
  try {
    if (!store_.exists(hash)) {
      return ShardResponse::not_found();
    }
    return ShardResponse::found(store_.get(hash));
  } catch (const store::NotFoundError&) {
    // Removed between the existence check and the read
    return ShardResponse::not_found();
  } catch (const store::HashMismatchError& e) {
    BOOST_LOG_TRIVIAL(error) << "Shard server: Stored blob " << hash << " is corrupt: " << e.what();
    return ShardResponse::error(e.what());
  } catch (const store::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "Shard server: Failed to read " << hash << ": " << e.what();
    return ShardResponse::error(std::string("Storage error: ") + e.what());
  }
}

ShardResponse ShardServer::handle_have(const std::string& hash) {
  return ShardResponse::have_result(store_.exists(hash));
}

ShardResponse ShardServer::handle_push(const std::string& hash, const Bytes& data) {
  // Bytes are verified before anything touches the disk
  std::string actual = ContentAddress::compute_hash(data);
  if (actual != hash) {
    store::HashMismatchError mismatch(hash, actual);
    BOOST_LOG_TRIVIAL(warning) << "Shard server: Rejected push: " << mismatch.what();
    return ShardResponse::error(mismatch.what());
  }

  try {
    store::StoreResult result = store_.store(data);
    BOOST_LOG_TRIVIAL(info) << "Shard server: Accepted push of " << hash << " (" << result.size_bytes << " bytes"
                            << (result.already_existed ? ", already held)" : ")");
    return ShardResponse::push_ack();
  } catch (const store::StorageError& e) {
    BOOST_LOG_TRIVIAL(error) << "Shard server: Failed to store pushed shard " << hash << ": " << e.what();
    return ShardResponse::error(std::string("Storage error: ") + e.what());
  }
}


//==============================================
// PROCESSING OF USER REQUESTS
//==============================================

ShardManifest ShardServer::publish(const Bytes& data, const std::string& mime_type, const std::string& reach,
                                   const std::optional<std::string>& author_id) {
  ShardManifest manifest = encoder_.create_manifest(data, mime_type, reach, author_id);
  std::vector<Bytes> shards = encoder_.create_shards(data, manifest.encoding_value());

  if (shards.size() != manifest.shard_hashes.size()) {
    throw store::InvalidDataError("encoder produced " + std::to_string(shards.size()) + " shards for a manifest of " +
                                  std::to_string(manifest.shard_hashes.size()));
  }

  for (std::size_t i = 0; i < shards.size(); ++i) {
    store::StoreResult result = store_.store(shards[i]);
    if (result.hash != manifest.shard_hashes[i]) {
      throw store::HashMismatchError(manifest.shard_hashes[i], result.hash);
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Shard server: Published " << manifest.blob_hash << " as " << manifest.encoding
                          << " with " << shards.size() << " shards";
  return manifest;
}

Bytes ShardServer::retrieve(const ShardManifest& manifest, const std::vector<ShardPeer*>& peers) {
  manifest.validate();
  std::size_t needed = required_shards(manifest);

  std::vector<ShardSlot> shards = read_local_shards(manifest, needed);
  fetch_missing_shards(manifest, peers, shards, needed);

  BOOST_LOG_TRIVIAL(info) << "Shard server: Holding " << count_present(shards) << " of " << manifest.total_shards
                          << " shards for " << manifest.blob_hash << ", " << needed << " required";
  return encoder_.reconstruct(manifest, shards);
}

std::size_t ShardServer::heal(const ShardManifest& manifest, const std::vector<ShardPeer*>& peers) {
  manifest.validate();

  std::vector<ShardSlot> shards = read_local_shards(manifest, manifest.total_shards);
  std::vector<bool> held_locally;
  held_locally.reserve(shards.size());
  for (const auto& slot : shards) {
    held_locally.push_back(slot.has_value());
  }
  if (count_present(shards) == manifest.total_shards) {
    BOOST_LOG_TRIVIAL(info) << "Shard server: All shards of " << manifest.blob_hash << " are held locally";
    return 0;
  }

  fetch_missing_shards(manifest, peers, shards, required_shards(manifest));
  std::vector<Bytes> complete = encoder_.regenerate_shards(manifest, shards);

  std::size_t written = 0;
  for (std::size_t i = 0; i < complete.size(); ++i) {
    if (held_locally[i]) {
      continue;
    }
    std::string actual = ContentAddress::compute_hash(complete[i]);
    if (actual != manifest.shard_hashes[i]) {
      BOOST_LOG_TRIVIAL(error) << "Shard server: Regenerated shard " << i << " of " << manifest.blob_hash
                               << " does not match the manifest";
      throw store::HashMismatchError(manifest.shard_hashes[i], actual);
    }
    if (!store_.store(complete[i]).already_existed) {
      ++written;
    }
  }

  BOOST_LOG_TRIVIAL(info) << "Shard server: Healed " << manifest.blob_hash << ", wrote " << written << " shards";
  return written;
}


//==============================================
// SHARD COLLECTION
//==============================================

std::vector<ShardSlot> ShardServer::read_local_shards(const ShardManifest& manifest, std::size_t needed) {
  std::vector<ShardSlot> shards(manifest.total_shards);
  std::size_t held = 0;

  for (std::size_t i = 0; i < shards.size() && held < needed; ++i) {
    const std::string& hash = manifest.shard_hashes[i];
    if (!store_.exists(hash)) {
      continue;
    }
    try {
      Bytes data = store_.get(hash);
      if (ContentAddress::compute_hash(data) != hash) {
        BOOST_LOG_TRIVIAL(warning) << "Shard server: Local shard " << i << " of " << manifest.blob_hash
                                   << " is corrupt, treating it as missing";
        continue;
      }
      shards[i] = std::move(data);
      ++held;
    } catch (const store::StorageError& e) {
      BOOST_LOG_TRIVIAL(warning) << "Shard server: Local shard " << i << " of " << manifest.blob_hash
                                 << " is unreadable, treating it as missing: " << e.what();
    }
  }
  return shards;
}

void ShardServer::fetch_missing_shards(const ShardManifest& manifest, const std::vector<ShardPeer*>& peers,
                                       std::vector<ShardSlot>& shards, std::size_t needed) {
  std::size_t held = count_present(shards);
  for (std::size_t i = 0; i < shards.size() && held < needed; ++i) {
    if (shards[i]) {
      continue;
    }
    std::optional<Bytes> data = fetch_from_peers(manifest.shard_hashes[i], peers);
    if (data) {
      shards[i] = std::move(data);
      ++held;
    }
  }
}

std::optional<Bytes> ShardServer::fetch_from_peers(const std::string& hash, const std::vector<ShardPeer*>& peers) {
  for (ShardPeer* peer : peers) {
    if (peer == nullptr) {
      continue;
    }
    try {
      ShardResponse have = peer->request(ShardRequest::have(hash));
      if (have.type != MessageType::HAVE_RESULT || !have.have) {
        continue;
      }

      ShardResponse response = peer->request(ShardRequest::get(hash));
      if (response.type != MessageType::DATA) {
        BOOST_LOG_TRIVIAL(debug) << "Shard server: Peer " << peer->id() << " answered "
                                 << message_type_to_string(response.type) << " for " << hash;
        continue;
      }
      if (ContentAddress::compute_hash(response.data) != hash) {
        BOOST_LOG_TRIVIAL(warning) << "Shard server: Discarding mismatching shard " << hash
                                   << " from peer " << peer->id();
        continue;
      }

      BOOST_LOG_TRIVIAL(debug) << "Shard server: Fetched " << hash << " from peer " << peer->id();
      return std::move(response.data);
    } catch (const std::exception& e) {
      BOOST_LOG_TRIVIAL(warning) << "Shard server: Request to peer " << peer->id() << " for " << hash
                                 << " failed: " << e.what();
    }
  }
  return std::nullopt;
}

std::size_t ShardServer::required_shards(const ShardManifest& manifest) {
  if (manifest.encoding_value().kind == EncodingKind::ReedSolomon) {
    return manifest.data_shards;
  }
  return manifest.total_shards;
}

std::size_t ShardServer::count_present(const std::vector<ShardSlot>& shards) {
  return static_cast<std::size_t>(
    std::count_if(shards.begin(), shards.end(), [](const ShardSlot& slot) { return slot.has_value(); }));
}

} // namespace network
} // namespace blobshard
