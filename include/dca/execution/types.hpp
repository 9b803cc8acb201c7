#pragma once

#include <dca/schema/encoding/scale/encoder.hpp>
#include <dca/storage/rocksdb/storage.hpp>

namespace dca::execution {

using encoder_t = dca::schema::encoding::scale_encoder_t;
using storage_t = dca::storage::storage<dca::storage::rocksdb_storage_tag>;

}  // namespace dca::execution
