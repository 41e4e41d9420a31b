#include "shard/reed_solomon.hpp"
#include "store/storage_error.hpp"
#include <boost/log/trivial.hpp>
#include <algorithm>
#include <string>

namespace blobshard::shard {

using store::InvalidDataError;

namespace {

Matrix build_matrix(size_t data_shards, size_t total_shards) {
  // Vandermonde rows are linearly independent; multiplying by the inverse of the top
  // square makes the top square the identity without losing that property.
  Matrix vandermonde = Matrix::vandermonde(total_shards, data_shards);
  Matrix top = vandermonde.sub_matrix(0, 0, data_shards, data_shards);
  return vandermonde.multiply(top.invert());
}

} // namespace


//==============================================
// CONSTRUCTOR AND DESTRUCTOR
//==============================================

ReedSolomon::ReedSolomon(size_t data_shards, size_t parity_shards)
  : data_shards_(data_shards)
  , parity_shards_(parity_shards)
  , matrix_(0, 0) {
  if (data_shards_ == 0) {
    throw InvalidDataError("Reed-Solomon requires at least one data shard");
  }
  if (data_shards_ + parity_shards_ > MAX_TOTAL_SHARDS) {
    throw InvalidDataError("Reed-Solomon supports at most " + std::to_string(MAX_TOTAL_SHARDS) +
                           " shards, got " + std::to_string(data_shards_ + parity_shards_));
  }
  matrix_ = build_matrix(data_shards_, total_shards());
  BOOST_LOG_TRIVIAL(trace) << "Reed-Solomon: Built " << total_shards() << "x" << data_shards_ << " encoding matrix";
}


//==============================================
// CODING OPERATIONS
//==============================================

void ReedSolomon::encode(std::vector<Bytes>& shards) const {
  size_t shard_size = check_shard_sizes(shards, nullptr);

  std::vector<const uint8_t*> rows;
  std::vector<const Bytes*> inputs;
  std::vector<Bytes*> outputs;
  for (size_t i = 0; i < data_shards_; ++i) {
    inputs.push_back(&shards[i]);
  }
  for (size_t i = data_shards_; i < total_shards(); ++i) {
    rows.push_back(matrix_.row(i));
    outputs.push_back(&shards[i]);
  }

  code_shards(rows, inputs, outputs, shard_size);
}

bool ReedSolomon::verify(const std::vector<Bytes>& shards) const {
  size_t shard_size = check_shard_sizes(shards, nullptr);

  std::vector<Bytes> expected(parity_shards_, Bytes(shard_size, 0));
  std::vector<const uint8_t*> rows;
  std::vector<const Bytes*> inputs;
  std::vector<Bytes*> outputs;
  for (size_t i = 0; i < data_shards_; ++i) {
    inputs.push_back(&shards[i]);
  }
  for (size_t i = 0; i < parity_shards_; ++i) {
    rows.push_back(matrix_.row(data_shards_ + i));
    outputs.push_back(&expected[i]);
  }
  code_shards(rows, inputs, outputs, shard_size);

  for (size_t i = 0; i < parity_shards_; ++i) {
    if (expected[i] != shards[data_shards_ + i]) {
      return false;
    }
  }
  return true;
}

void ReedSolomon::reconstruct_data(std::vector<Bytes>& shards, std::vector<bool>& present) const {
  reconstruct_internal(shards, present, true);
}

void ReedSolomon::reconstruct(std::vector<Bytes>& shards, std::vector<bool>& present) const {
  reconstruct_internal(shards, present, false);
}


//==============================================
// CODING SUPPORT
//==============================================

void ReedSolomon::reconstruct_internal(std::vector<Bytes>& shards, std::vector<bool>& present,
                                       bool data_only) const {
  if (shards.size() != total_shards() || present.size() != total_shards()) {
    throw InvalidDataError("expected " + std::to_string(total_shards()) + " shard slots, got " +
                           std::to_string(shards.size()));
  }

  size_t present_count = static_cast<size_t>(std::count(present.begin(), present.end(), true));
  if (present_count == total_shards()) {
    return;
  }
  if (present_count < data_shards_) {
    throw InvalidDataError("too few shards to reconstruct: have " + std::to_string(present_count) +
                           ", need " + std::to_string(data_shards_));
  }

  size_t shard_size = check_shard_sizes(shards, &present);

  // Any data_shards present rows of the encoding matrix form an invertible square
  Matrix sub(data_shards_, data_shards_);
  std::vector<const Bytes*> sub_shards;
  for (size_t i = 0; i < total_shards() && sub_shards.size() < data_shards_; ++i) {
    if (!present[i]) {
      continue;
    }
    size_t sub_row = sub_shards.size();
    for (size_t c = 0; c < data_shards_; ++c) {
      sub.at(sub_row, c) = matrix_.at(i, c);
    }
    sub_shards.push_back(&shards[i]);
  }
  Matrix decode = sub.invert();

  std::vector<const uint8_t*> rows;
  std::vector<Bytes*> outputs;
  std::vector<size_t> rebuilt;
  for (size_t i = 0; i < data_shards_; ++i) {
    if (present[i]) {
      continue;
    }
    shards[i].assign(shard_size, 0);
    rows.push_back(decode.row(i));
    outputs.push_back(&shards[i]);
    rebuilt.push_back(i);
  }
  code_shards(rows, sub_shards, outputs, shard_size);
  for (size_t i : rebuilt) {
    present[i] = true;
  }

  if (data_only) {
    BOOST_LOG_TRIVIAL(debug) << "Reed-Solomon: Rebuilt " << rebuilt.size() << " data shards";
    return;
  }

  // Parity is recomputed from the now complete data shards
  std::vector<const Bytes*> data_inputs;
  for (size_t i = 0; i < data_shards_; ++i) {
    data_inputs.push_back(&shards[i]);
  }
  rows.clear();
  outputs.clear();
  for (size_t i = data_shards_; i < total_shards(); ++i) {
    if (present[i]) {
      continue;
    }
    shards[i].assign(shard_size, 0);
    rows.push_back(matrix_.row(i));
    outputs.push_back(&shards[i]);
    rebuilt.push_back(i);
  }
  code_shards(rows, data_inputs, outputs, shard_size);
  for (size_t i : rebuilt) {
    present[i] = true;
  }

  BOOST_LOG_TRIVIAL(debug) << "Reed-Solomon: Rebuilt " << rebuilt.size() << " shards";
}

void ReedSolomon::code_shards(const std::vector<const uint8_t*>& rows,
                              const std::vector<const Bytes*>& inputs,
                              const std::vector<Bytes*>& outputs,
                              size_t byte_count) {
  for (size_t out = 0; out < outputs.size(); ++out) {
    uint8_t* target = outputs[out]->data();
    for (size_t in = 0; in < inputs.size(); ++in) {
      const uint8_t* table = Galois::multiplication_row(rows[out][in]);
      const uint8_t* source = inputs[in]->data();
      if (in == 0) {
        for (size_t b = 0; b < byte_count; ++b) {
          target[b] = table[source[b]];
        }
      } else {
        for (size_t b = 0; b < byte_count; ++b) {
          target[b] ^= table[source[b]];
        }
      }
    }
  }
}

size_t ReedSolomon::check_shard_sizes(const std::vector<Bytes>& shards, const std::vector<bool>* present) const {
  if (shards.size() != total_shards()) {
    throw InvalidDataError("expected " + std::to_string(total_shards()) + " shards, got " +
                           std::to_string(shards.size()));
  }

  size_t shard_size = 0;
  bool sized = false;
  for (size_t i = 0; i < shards.size(); ++i) {
    if (present && !(*present)[i]) {
      continue;
    }
    if (!sized) {
      shard_size = shards[i].size();
      sized = true;
    } else if (shards[i].size() != shard_size) {
      throw InvalidDataError("shard " + std::to_string(i) + " is " + std::to_string(shards[i].size()) +
                             " bytes, expected " + std::to_string(shard_size));
    }
  }
  return shard_size;
}

} // namespace blobshard::shard
