#ifndef BLOBSHARD_SHARD_REED_SOLOMON_HPP
#define BLOBSHARD_SHARD_REED_SOLOMON_HPP

#include <cstddef>
#include <vector>
#include "common/types.hpp"
#include "shard/galois.hpp"

namespace blobshard::shard {

// Systematic Reed-Solomon erasure code over GF(2^8). The first data_shards rows of the
// encoding matrix are the identity, so data shards are stored verbatim and any
// data_shards of the total suffice to recover the rest.
class ReedSolomon {
public:
  static constexpr size_t MAX_TOTAL_SHARDS = Galois::FIELD_SIZE;

  // ---- CONSTRUCTOR AND DESTRUCTOR ----
  // Throws InvalidDataError for zero data shards or too many shards for the field
  ReedSolomon(size_t data_shards, size_t parity_shards);


  // ---- CODING OPERATIONS ----
  // Fills the parity entries of shards from its data entries, all entries equal size
  void encode(std::vector<Bytes>& shards) const;
  // True when the parity entries agree with the data entries
  bool verify(const std::vector<Bytes>& shards) const;
  // Regenerates missing data shards; present flags are updated for rebuilt entries
  void reconstruct_data(std::vector<Bytes>& shards, std::vector<bool>& present) const;
  // Regenerates every missing shard, data and parity
  void reconstruct(std::vector<Bytes>& shards, std::vector<bool>& present) const;


  // ---- GETTERS ----
  size_t data_shards() const { return data_shards_; }
  size_t parity_shards() const { return parity_shards_; }
  size_t total_shards() const { return data_shards_ + parity_shards_; }

private:
  // ---- PARAMETERS ----
  size_t data_shards_;
  size_t parity_shards_;
  // total x data encoding matrix
  Matrix matrix_;


  // ---- CODING SUPPORT ----
  void reconstruct_internal(std::vector<Bytes>& shards, std::vector<bool>& present, bool data_only) const;
  // outputs[i] = sum over j of rows[i][j] * inputs[j]
  static void code_shards(const std::vector<const uint8_t*>& rows,
                          const std::vector<const Bytes*>& inputs,
                          const std::vector<Bytes*>& outputs,
                          size_t byte_count);
  size_t check_shard_sizes(const std::vector<Bytes>& shards, const std::vector<bool>* present) const;
};

} // namespace blobshard::shard

#endif // BLOBSHARD_SHARD_REED_SOLOMON_HPP
