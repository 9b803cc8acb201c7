#pragma once
#include <dca/schema/primitives.hpp>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace dca::storage {

using key_value_entry_t = std::pair<dca::schema::bytes_t, dca::schema::bytes_t>;

/// Writes that must land together: every put and delete of one committed
/// transaction.
struct write_set final {
  std::vector<key_value_entry_t> puts;
  std::vector<dca::schema::bytes_t> deletes;

  bool empty() const { return puts.empty() && deletes.empty(); }
};

template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder, const dca::schema::bytes_view_t& key);

  /// Encode and persist value at key.
  template <typename T, typename Encoder>
  void put(Encoder& encoder,
           const dca::schema::bytes_view_t& key,
           const T& value);

  /// Return all key-value pairs that share the provided key prefix.
  std::vector<key_value_entry_t> list_by_prefix(
      const dca::schema::bytes_view_t& prefix) const;

  /// Atomically apply all puts and deletes of the write set.
  void apply(const write_set& writes) const;
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace dca::storage
