#pragma once
#include <peggy/storage/storage.hpp>
#include <iterator>
#include <map>

namespace peggy::storage {

/// Write buffer layered over `Backing`. Reads see buffered writes first;
/// nothing reaches the backing store until flush().
template <typename Backing>
struct cache_storage_tag {};

template <typename Backing>
struct storage<cache_storage_tag<Backing>> final {
  explicit storage(Backing& backing_store) : backing{backing_store} {}

  Backing& backing;
  std::map<peggy::schema::bytes_t, std::optional<peggy::schema::bytes_t>>
      writes;

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
    writes[peggy::schema::make_bytes(key)] = encoder.encode(value);
  }

  std::optional<peggy::schema::bytes_t> get_raw(
      const peggy::schema::bytes_view_t& key) const {
    auto found = writes.find(peggy::schema::make_bytes(key));
    if (found != std::end(writes)) {
      return found->second;
    }
    return backing.get_raw(key);
  }

  void put_raw(const peggy::schema::bytes_view_t& key,
               const peggy::schema::bytes_view_t& value) {
    writes[peggy::schema::make_bytes(key)] = peggy::schema::make_bytes(value);
  }

  void erase(const peggy::schema::bytes_view_t& key) {
    writes[peggy::schema::make_bytes(key)] = std::nullopt;
  }

  std::vector<key_value_entry_t> list_by_prefix(
      const peggy::schema::bytes_view_t& prefix) const {
    auto merged = std::map<peggy::schema::bytes_t, peggy::schema::bytes_t>{};
    for (auto& entry : backing.list_by_prefix(prefix)) {
      merged.insert(std::move(entry));
    }

    auto first = peggy::schema::make_bytes(prefix);
    for (auto it = writes.lower_bound(first); it != std::end(writes); ++it) {
      const auto& [key, value] = *it;
      if (!detail::has_prefix(key, prefix)) {
        break;
      }
      if (value) {
        merged[key] = *value;
      } else {
        merged.erase(key);
      }
    }
    return {std::make_move_iterator(std::begin(merged)),
            std::make_move_iterator(std::end(merged))};
  }

  /// Merges the buffered writes under prefix into the backing store's
  /// reverse scan. A buffered key shadows the backing entry; a buffered
  /// deletion hides it.
  template <typename Visitor>
  void scan_prefix_reverse(const peggy::schema::bytes_view_t& prefix,
                           Visitor&& visit) const {
    auto upper = detail::prefix_upper_bound(prefix);
    auto buffered =
        std::make_reverse_iterator(upper ? writes.lower_bound(*upper)
                                         : std::end(writes));
    auto buffered_end = std::make_reverse_iterator(
        writes.lower_bound(peggy::schema::make_bytes(prefix)));
    auto stopped = false;

    // Emit buffered puts whose key sorts above `bound` (all when null).
    auto drain_above = [&](const peggy::schema::bytes_t* bound) {
      while (!stopped && buffered != buffered_end &&
             (bound == nullptr || *bound < buffered->first)) {
        if (buffered->second && !visit(buffered->first, *buffered->second)) {
          stopped = true;
        }
        ++buffered;
      }
    };

    backing.scan_prefix_reverse(
        prefix, [&](const peggy::schema::bytes_t& key,
                    const peggy::schema::bytes_t& value) {
          drain_above(&key);
          if (stopped) {
            return false;
          }
          if (buffered != buffered_end && buffered->first == key) {
            const auto& shadow = buffered->second;
            ++buffered;
            if (shadow && !visit(key, *shadow)) {
              stopped = true;
            }
            return !stopped;
          }
          stopped = !visit(key, value);
          return !stopped;
        });
    drain_above(nullptr);
  }

  void apply_writes(const std::vector<pending_write_t>& pending) {
    for (const auto& [key, value] : pending) {
      writes[key] = value;
    }
  }

  /// Hand the buffered writes to the caller, ordered by key, and reset.
  std::vector<pending_write_t> take_writes() {
    auto out = std::vector<pending_write_t>{
        std::make_move_iterator(std::begin(writes)),
        std::make_move_iterator(std::end(writes))};
    writes.clear();
    return out;
  }

  /// Push buffered writes into the backing store.
  void flush() { backing.apply_writes(take_writes()); }

  /// Drop buffered writes without touching the backing store.
  void discard() { writes.clear(); }
};

template <typename Backing>
using cache_storage_t = storage<cache_storage_tag<Backing>>;

template <typename Backing>
cache_storage_t<Backing> make_cache_storage(Backing& backing) {
  return cache_storage_t<Backing>{backing};
}

}  // namespace peggy::storage
