#include "shard/shard_config.hpp"
#include "store/storage_error.hpp"
#include <boost/log/trivial.hpp>
#include <string>

namespace blobshard::shard {

void ShardConfig::validate() const {
  if (shard_size == 0) {
    throw store::InvalidDataError("shard_size must be greater than zero");
  }
  if (rs_data_shards == 0) {
    throw store::InvalidDataError("rs_data_shards must be at least 1");
  }
  if (rs_data_shards + rs_parity_shards > MAX_TOTAL_SHARDS) {
    throw store::InvalidDataError("rs_data_shards + rs_parity_shards must not exceed " +
                                  std::to_string(MAX_TOTAL_SHARDS));
  }
  if (rs_threshold <= single_shard_max + 1) {
    BOOST_LOG_TRIVIAL(warning) << "Shard config: rs_threshold (" << rs_threshold
                               << ") does not exceed single_shard_max (" << single_shard_max
                               << "), chunked encoding is unreachable";
  }
}

} // namespace blobshard::shard
