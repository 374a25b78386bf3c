#pragma once
#include <peggy/storage/storage.hpp>
#include <iterator>
#include <map>

namespace peggy::storage {

struct memory_storage_tag {};

/// Process local ordered store. Used by component tests and as a scratch
/// backend; nothing survives the process.
template <>
struct storage<memory_storage_tag> final {
  std::map<peggy::schema::bytes_t, peggy::schema::bytes_t> entries;

  template <typename T, typename Encoder>
  std::optional<T> get(Encoder& encoder,
                       const peggy::schema::bytes_view_t& key) const {
    auto value = get_raw(key);
    if (!value) {
      return std::nullopt;
    }
    return {encoder.template decode<T>(
        peggy::schema::bytes_view_t{value->data(), value->size()})};
  }

  template <typename Encoder, typename T>
  void put(Encoder& encoder,
           const peggy::schema::bytes_view_t& key,
           const T& value) {
    entries[peggy::schema::make_bytes(key)] = encoder.encode(value);
  }

  std::optional<peggy::schema::bytes_t> get_raw(
      const peggy::schema::bytes_view_t& key) const {
    auto found = entries.find(peggy::schema::make_bytes(key));
    if (found == std::end(entries)) {
      return std::nullopt;
    }
    return found->second;
  }

  void put_raw(const peggy::schema::bytes_view_t& key,
               const peggy::schema::bytes_view_t& value) {
    entries[peggy::schema::make_bytes(key)] = peggy::schema::make_bytes(value);
  }

  void erase(const peggy::schema::bytes_view_t& key) {
    entries.erase(peggy::schema::make_bytes(key));
  }

  std::vector<key_value_entry_t> list_by_prefix(
      const peggy::schema::bytes_view_t& prefix) const {
    auto out = std::vector<key_value_entry_t>{};
    auto first = peggy::schema::make_bytes(prefix);
    for (auto it = entries.lower_bound(first); it != std::end(entries); ++it) {
      if (!detail::has_prefix(it->first, prefix)) {
        break;
      }
      out.push_back(*it);
    }
    return out;
  }

  template <typename Visitor>
  void scan_prefix_reverse(const peggy::schema::bytes_view_t& prefix,
                           Visitor&& visit) const {
    auto upper = detail::prefix_upper_bound(prefix);
    auto last = upper ? entries.lower_bound(*upper) : std::end(entries);
    for (auto it = std::make_reverse_iterator(last); it != std::rend(entries);
         ++it) {
      if (!detail::has_prefix(it->first, prefix) ||
          !visit(it->first, it->second)) {
        break;
      }
    }
  }

  void apply_writes(const std::vector<pending_write_t>& writes) {
    for (const auto& [key, value] : writes) {
      if (value) {
        entries[key] = *value;
      } else {
        entries.erase(key);
      }
    }
  }
};

using memory_storage_t = storage<memory_storage_tag>;

template <>
inline storage<memory_storage_tag> make_storage<memory_storage_tag>(
    const std::string_view& path) {
  static_cast<void>(path);
  return storage<memory_storage_tag>{};
}

}  // namespace peggy::storage
