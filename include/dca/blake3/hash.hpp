#pragma once
#include <dca/schema/primitives.hpp>
#include <cstdint>
#include <span>

namespace dca::blake3 {

dca::schema::hash32_t hash(const dca::schema::bytes_view_t& bytes);

}  // namespace dca::blake3
