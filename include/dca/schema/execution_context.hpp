#pragma once
#include <dca/schema/primitives.hpp>

// Schema type: execution context.
// Who is calling and at which time; every entry point runs against one.
namespace dca::schema {

struct execution_context_t final {
  address_t caller{};
  timestamp_seconds_t timestamp{};
};

}  // namespace dca::schema
