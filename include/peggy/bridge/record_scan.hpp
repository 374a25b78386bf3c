#pragma once

#include <peggy/schema/primitives.hpp>
#include <cstddef>
#include <optional>
#include <utility>
#include <vector>

namespace peggy::bridge {

/// Decode at most `count` records stored under `prefix`, highest key first.
template <typename T, typename Encoder, typename Store>
std::vector<T> last_records(Encoder& encoder,
                            const Store& store,
                            const peggy::schema::bytes_view_t& prefix,
                            const std::size_t count) {
  auto out = std::vector<T>{};
  if (count == 0) {
    return out;
  }
  store.scan_prefix_reverse(prefix, [&](const peggy::schema::bytes_t&,
                                        const peggy::schema::bytes_t& value) {
    out.push_back(encoder.template decode<T>(value));
    return out.size() < count;
  });
  return out;
}

/// Highest keyed record under `prefix` accepted by `match`.
template <typename T, typename Encoder, typename Store, typename Predicate>
std::optional<T> find_last_record(Encoder& encoder,
                                  const Store& store,
                                  const peggy::schema::bytes_view_t& prefix,
                                  Predicate&& match) {
  auto found = std::optional<T>{};
  store.scan_prefix_reverse(prefix, [&](const peggy::schema::bytes_t&,
                                        const peggy::schema::bytes_t& value) {
    auto record = encoder.template decode<T>(value);
    if (match(record)) {
      found = std::move(record);
      return false;
    }
    return true;
  });
  return found;
}

}  // namespace peggy::bridge
