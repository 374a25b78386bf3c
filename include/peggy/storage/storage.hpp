#pragma once
#include <peggy/schema/primitives.hpp>
#include <algorithm>
#include <optional>
#include <string_view>
#include <utility>
#include <vector>

namespace peggy::storage {

using key_value_entry_t =
    std::pair<peggy::schema::bytes_t, peggy::schema::bytes_t>;

/// Buffered mutation; std::nullopt marks a deletion.
using pending_write_t = std::pair<peggy::schema::bytes_t,
                                  std::optional<peggy::schema::bytes_t>>;

namespace detail {

/// Smallest key above every key that starts with `prefix`, or std::nullopt
/// when the prefix is all 0xFF bytes.
inline std::optional<peggy::schema::bytes_t> prefix_upper_bound(
    const peggy::schema::bytes_view_t& prefix) {
  auto upper = peggy::schema::make_bytes(prefix);
  while (!upper.empty()) {
    if (upper.back() != 0xFF) {
      ++upper.back();
      return upper;
    }
    upper.pop_back();
  }
  return std::nullopt;
}

inline bool has_prefix(const peggy::schema::bytes_t& key,
                       const peggy::schema::bytes_view_t& prefix) {
  return key.size() >= prefix.size() &&
         std::equal(std::begin(prefix), std::end(prefix), std::begin(key));
}

}  // namespace detail

/// Last committed consensus checkpoint persisted by the storage backend.
struct committed_state final {
  int64_t height{};
  peggy::schema::hash32_t state_root{};
};

/// Ordered byte keyed store. Every specialization iterates keys in
/// lexicographic byte order.
template <typename Library>
struct storage {
  /// Decode and return value at key, or std::nullopt when missing.
  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const peggy::schema::bytes_view_t& key) const;

  /// Encode and persist value at key.
  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const peggy::schema::bytes_view_t& key,
           const T& value);

  std::optional<peggy::schema::bytes_t> get_raw(
      const peggy::schema::bytes_view_t& key) const;

  void put_raw(const peggy::schema::bytes_view_t& key,
               const peggy::schema::bytes_view_t& value);

  void erase(const peggy::schema::bytes_view_t& key);

  /// Return all key-value pairs that share the provided key prefix, ascending.
  std::vector<key_value_entry_t> list_by_prefix(
      const peggy::schema::bytes_view_t& prefix) const;

  /// Visit key-value pairs under prefix in descending key order. `visit`
  /// takes (key, value) and returns false to stop the scan.
  template <typename Visitor>
  void scan_prefix_reverse(const peggy::schema::bytes_view_t& prefix,
                           Visitor&& visit) const;

  /// Apply buffered writes in order as one unit.
  void apply_writes(const std::vector<pending_write_t>& writes);
};

/// Construct a concrete storage backend rooted at filesystem path.
template <typename Library>
storage<Library> make_storage(const std::string_view& path);

}  // namespace peggy::storage
