#pragma once
#include <dca/schema/primitives.hpp>
#include <optional>
#include <span>

namespace dca::schema::encoding {

// Encoding library is a build time choice; callers only see encoder<Tag>.
template <typename Library>
struct encoder {
  template <typename T>
  dca::schema::bytes_t encode(const T& obj);

  template <typename T>
  void encode(const T& obj, dca::schema::bytes_t& out);

  template <typename T>
  T decode(const dca::schema::bytes_view_t& bytes);

  template <typename T>
  std::optional<T> try_decode(const dca::schema::bytes_view_t& bytes);
};

}  // namespace dca::schema::encoding
