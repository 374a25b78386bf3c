#pragma once

#include <spdlog/spdlog.h>
#include <peggy/bridge/record_scan.hpp>
#include <peggy/schema/key/bridge_keys.hpp>
#include <peggy/schema/outgoing_logic_call.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace peggy::bridge {

/// Outgoing logic calls keyed by (invalidation id, invalidation nonce).
/// Plain upsert store; ordering of invalidation nonces is not checked here.
template <typename Encoder, typename Store>
class logic_call_registry final {
 public:
  logic_call_registry(Encoder& encoder, Store& store)
      : encoder_{encoder}, store_{store} {}

  void set(const peggy::schema::outgoing_logic_call_t& call) {
    store_.put(encoder_,
               peggy::schema::key::make_logic_call_key(call.invalidation_id,
                                                       call.invalidation_nonce),
               call);
    spdlog::debug("Stored logic call {}/{}",
                  peggy::schema::to_hex(call.invalidation_id),
                  call.invalidation_nonce);
  }

  std::optional<peggy::schema::outgoing_logic_call_t> get(
      const peggy::schema::bytes_view_t& invalidation_id,
      uint64_t invalidation_nonce) const {
    return store_.template get<peggy::schema::outgoing_logic_call_t>(
        encoder_, peggy::schema::key::make_logic_call_key(invalidation_id,
                                                          invalidation_nonce));
  }

  /// All calls in key order: invalidation id length, id bytes, then nonce,
  /// each ascending.
  std::vector<peggy::schema::outgoing_logic_call_t> list() const {
    auto out = std::vector<peggy::schema::outgoing_logic_call_t>{};
    for (const auto& [key, value] : store_.list_by_prefix(prefix())) {
      out.push_back(
          encoder_.template decode<peggy::schema::outgoing_logic_call_t>(value));
    }
    return out;
  }

  /// Up to `count` calls in descending key order.
  std::vector<peggy::schema::outgoing_logic_call_t> last(
      std::size_t count) const {
    return last_records<peggy::schema::outgoing_logic_call_t>(
        encoder_, store_, prefix(), count);
  }

  /// Highest keyed call accepted by `match`.
  template <typename Predicate>
  std::optional<peggy::schema::outgoing_logic_call_t> find_last(
      Predicate&& match) const {
    return find_last_record<peggy::schema::outgoing_logic_call_t>(
        encoder_, store_, prefix(), std::forward<Predicate>(match));
  }

 private:
  static peggy::schema::bytes_t prefix() {
    return peggy::schema::key::make_prefix_key(
        peggy::schema::key::kLogicCallKeyPrefix);
  }

  Encoder& encoder_;
  Store& store_;
};

/// Highest invalidation nonce accepted per invalidation id. Consulted by the
/// message layer before a logic call reaches the registry.
template <typename Encoder, typename Store>
class invalidation_guard final {
 public:
  invalidation_guard(Encoder& encoder, Store& store)
      : encoder_{encoder}, store_{store} {}

  std::optional<uint64_t> last_nonce(
      const peggy::schema::bytes_view_t& invalidation_id) const {
    return store_.template get<uint64_t>(
        encoder_, peggy::schema::key::make_logic_call_nonce_key(invalidation_id));
  }

  /// True when `nonce` is strictly above every nonce accepted for the id.
  bool admits(const peggy::schema::bytes_view_t& invalidation_id,
              uint64_t nonce) const {
    auto last = last_nonce(invalidation_id);
    return !last || nonce > *last;
  }

  void record(const peggy::schema::bytes_view_t& invalidation_id,
              uint64_t nonce) {
    store_.put(encoder_,
               peggy::schema::key::make_logic_call_nonce_key(invalidation_id),
               nonce);
  }

 private:
  Encoder& encoder_;
  Store& store_;
};

}  // namespace peggy::bridge
