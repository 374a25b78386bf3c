#pragma once

#include <peggy/schema/key/bridge_keys.hpp>
#include <cstdint>
#include <string_view>

namespace peggy::bridge {

/// Last value issued by the named counter, 0 when it was never used.
template <typename Encoder, typename Store>
uint64_t last_sequence(Encoder& encoder,
                       const Store& store,
                       const std::string_view name) {
  auto key = peggy::schema::key::make_sequence_key(name);
  return store.template get<uint64_t>(encoder, key).value_or(0);
}

/// Advance the named counter and return the new value. Counters start at 1.
template <typename Encoder, typename Store>
uint64_t next_sequence(Encoder& encoder,
                       Store& store,
                       const std::string_view name) {
  auto next = last_sequence(encoder, store, name) + 1;
  store.put(encoder, peggy::schema::key::make_sequence_key(name), next);
  return next;
}

}  // namespace peggy::bridge
