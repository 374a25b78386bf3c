#pragma once

#include <spdlog/spdlog.h>
#include <peggy/schema/batch_confirm.hpp>
#include <peggy/schema/key/bridge_keys.hpp>
#include <peggy/schema/logic_call_confirm.hpp>
#include <peggy/schema/valset_confirm.hpp>
#include <cstdint>
#include <optional>
#include <utility>
#include <vector>

namespace peggy::bridge {

/// Describes how a confirmation kind names the object it signs.
template <typename Record>
struct confirm_traits;

template <>
struct confirm_traits<peggy::schema::valset_confirm_t> final {
  using subject_t = uint64_t;

  static subject_t subject(const peggy::schema::valset_confirm_t& record) {
    return record.nonce;
  }

  static peggy::schema::bytes_t prefix(const subject_t& nonce) {
    return peggy::schema::key::make_valset_confirm_prefix_key(nonce);
  }
};

template <>
struct confirm_traits<peggy::schema::batch_confirm_t> final {
  using subject_t = std::pair<uint64_t, peggy::schema::eth_address_t>;

  static subject_t subject(const peggy::schema::batch_confirm_t& record) {
    return {record.nonce, record.token_contract};
  }

  static peggy::schema::bytes_t prefix(const subject_t& subject) {
    return peggy::schema::key::make_batch_confirm_prefix_key(subject.first,
                                                             subject.second);
  }
};

template <>
struct confirm_traits<peggy::schema::logic_call_confirm_t> final {
  using subject_t = std::pair<peggy::schema::bytes_t, uint64_t>;

  static subject_t subject(const peggy::schema::logic_call_confirm_t& record) {
    return {record.invalidation_id, record.invalidation_nonce};
  }

  static peggy::schema::bytes_t prefix(const subject_t& subject) {
    return peggy::schema::key::make_logic_call_confirm_prefix_key(
        subject.first, subject.second);
  }
};

/// Orchestrator confirmations for one kind of signed object, at most one per
/// (subject, orchestrator). Resubmission overwrites.
template <typename Encoder, typename Store, typename Record>
class confirm_store final {
 public:
  using traits_t = confirm_traits<Record>;
  using subject_t = typename traits_t::subject_t;

  confirm_store(Encoder& encoder, Store& store)
      : encoder_{encoder}, store_{store} {}

  void set_confirm(const Record& record) {
    store_.put(encoder_, key(traits_t::subject(record), record.orchestrator),
               record);
    spdlog::debug("Stored confirmation from {}", record.orchestrator);
  }

  std::optional<Record> get_confirm(
      const subject_t& subject,
      const peggy::schema::native_address_t& orchestrator) const {
    return store_.template get<Record>(encoder_, key(subject, orchestrator));
  }

  /// Every confirmation for the subject, orchestrator ascending.
  std::vector<Record> get_all_confirms(const subject_t& subject) const {
    auto out = std::vector<Record>{};
    for (const auto& [entry_key, value] :
         store_.list_by_prefix(traits_t::prefix(subject))) {
      out.push_back(encoder_.template decode<Record>(value));
    }
    return out;
  }

  /// True when `validator` has not confirmed the subject yet.
  bool is_pending(const subject_t& subject,
                  const peggy::schema::native_address_t& validator) const {
    return !store_.get_raw(key(subject, validator)).has_value();
  }

 private:
  static peggy::schema::bytes_t key(
      const subject_t& subject,
      const peggy::schema::native_address_t& orchestrator) {
    return peggy::schema::key::make_confirm_key(traits_t::prefix(subject),
                                                orchestrator);
  }

  Encoder& encoder_;
  Store& store_;
};

template <typename Encoder, typename Store>
using valset_confirm_store =
    confirm_store<Encoder, Store, peggy::schema::valset_confirm_t>;

template <typename Encoder, typename Store>
using batch_confirm_store =
    confirm_store<Encoder, Store, peggy::schema::batch_confirm_t>;

template <typename Encoder, typename Store>
using logic_call_confirm_store =
    confirm_store<Encoder, Store, peggy::schema::logic_call_confirm_t>;

}  // namespace peggy::bridge
