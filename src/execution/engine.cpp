#include <spdlog/spdlog.h>
#include <peggy/blake3/hash.hpp>
#include <peggy/bridge/asset_mapping_table.hpp>
#include <peggy/bridge/batch_builder.hpp>
#include <peggy/bridge/confirm_store.hpp>
#include <peggy/bridge/logic_call_registry.hpp>
#include <peggy/bridge/outgoing_pool.hpp>
#include <peggy/bridge/validator_registry.hpp>
#include <peggy/bridge/valset_builder.hpp>
#include <peggy/common/critical.hpp>
#include <peggy/execution/engine.hpp>
#include <peggy/schema/message_type.hpp>
#include <limits>
#include <string>
#include <tuple>
#include <utility>

using namespace peggy::schema;

namespace {

using encoder_t = peggy::schema::encoding::scale_encoder_t;

constexpr auto kCheckTxCodespace = std::string_view{"peggy.checktx"};
constexpr auto kFinalizeCodespace = std::string_view{"peggy.finalize"};

peggy::schema::hash32_t fold_state_root(const peggy::schema::hash32_t& seed,
                                        const peggy::schema::bytes_t& tx,
                                        uint64_t height,
                                        uint64_t index) {
  auto material = peggy::schema::bytes_t{};
  material.reserve(seed.size() + tx.size() + 16);
  material.insert(std::end(material), std::begin(seed), std::end(seed));
  material.insert(std::end(material), std::begin(tx), std::end(tx));

  auto encoder = encoder_t{};
  auto encoded_suffix = encoder.encode(std::tuple{height, index});
  material.insert(std::end(material), std::begin(encoded_suffix),
                  std::end(encoded_suffix));
  return peggy::blake3::hash(
      peggy::schema::bytes_view_t{material.data(), material.size()});
}

std::optional<peggy::schema::transaction_t> decode_transaction(
    const peggy::schema::bytes_view_t& raw_tx,
    std::string& error) {
  if (raw_tx.empty()) {
    error = "empty transaction";
    return std::nullopt;
  }
  auto encoder = encoder_t{};
  auto tx = encoder.try_decode<peggy::schema::transaction_t>(raw_tx);
  if (!tx) {
    error = "malformed SCALE transaction";
  }
  return tx;
}

transaction_result_t make_failure(transaction_error_code code,
                                  std::string log,
                                  std::string info,
                                  std::string_view codespace) {
  auto result = transaction_result_t{};
  result.code = static_cast<uint32_t>(code);
  result.log = std::move(log);
  result.info = std::move(info);
  result.codespace = std::string{codespace};
  return result;
}

transaction_event_attribute_t make_attribute(std::string key,
                                             std::string value) {
  return transaction_event_attribute_t{
      .key = std::move(key), .value = std::move(value), .index = true};
}

// Account that has to sign the payload. std::nullopt marks governance
// messages, which only the module authority may send.
std::optional<native_address_t> designated_signer(
    const transaction_payload_t& payload) {
  return std::visit(
      overloaded{
          [](const register_eth_address_t& msg)
              -> std::optional<native_address_t> { return msg.validator; },
          [](const request_valset_t& msg) -> std::optional<native_address_t> {
            return msg.requester;
          },
          [](const send_to_eth_t& msg) -> std::optional<native_address_t> {
            return msg.sender;
          },
          [](const cancel_send_to_eth_t& msg)
              -> std::optional<native_address_t> { return msg.sender; },
          [](const request_batch_t& msg) -> std::optional<native_address_t> {
            return msg.requester;
          },
          [](const valset_confirm_t& msg) -> std::optional<native_address_t> {
            return msg.orchestrator;
          },
          [](const batch_confirm_t& msg) -> std::optional<native_address_t> {
            return msg.orchestrator;
          },
          [](const logic_call_confirm_t& msg)
              -> std::optional<native_address_t> { return msg.orchestrator; },
          [](const submit_logic_call_t&) -> std::optional<native_address_t> {
            return std::nullopt;
          },
          [](const set_asset_mapping_t&) -> std::optional<native_address_t> {
            return std::nullopt;
          }},
      payload);
}

}  // namespace

namespace peggy::execution {

engine::engine(peggy::schema::encoding::scale_encoder_t& encoder,
               peggy::storage::rocksdb_storage_t& storage,
               peggy::bridge::collaborators collaborators,
               engine_options options)
    : encoder_{encoder},
      storage_{storage},
      collaborators_{std::move(collaborators)},
      options_{std::move(options)},
      block_store_{storage} {
  auto lock = std::scoped_lock{mutex_};
  if (!collaborators_.staking || !collaborators_.escrow ||
      !collaborators_.refund) {
    peggy::common::critical("bridge engine collaborator missing");
  }
  if (options_.authority.empty()) {
    spdlog::warn("No module authority configured; governance messages will be "
                 "rejected");
  }
  load_persisted_state();
  spdlog::info("Bridge engine ready at height {}", last_committed_height_);
}

transaction_result_t engine::check_transaction(
    const peggy::schema::bytes_view_t& raw_tx) {
  auto lock = std::scoped_lock{mutex_};
  auto decode_error = std::string{};
  auto maybe_tx = decode_transaction(raw_tx, decode_error);
  if (!maybe_tx) {
    return make_failure(transaction_error_code::invalid_transaction,
                        "invalid transaction", decode_error,
                        kCheckTxCodespace);
  }
  return validate_transaction(*maybe_tx, kCheckTxCodespace);
}

transaction_result_t engine::validate_transaction(
    const peggy::schema::transaction_t& tx,
    std::string_view codespace) const {
  if (tx.version != 1) {
    return make_failure(transaction_error_code::unsupported_transaction_version,
                        "unsupported transaction version", "expected version 1",
                        codespace);
  }
  if (!is_valid_native_address(tx.signer)) {
    return make_failure(transaction_error_code::invalid_address,
                        "invalid signer address", tx.signer, codespace);
  }

  auto expected = designated_signer(tx.payload);
  if (expected) {
    if (!is_valid_native_address(*expected)) {
      return make_failure(transaction_error_code::invalid_address,
                          "invalid account address", *expected, codespace);
    }
    if (*expected != tx.signer) {
      return make_failure(transaction_error_code::authorization_denied,
                          "signer does not own the message", tx.signer,
                          codespace);
    }
  } else if (options_.authority.empty() || tx.signer != options_.authority) {
    return make_failure(transaction_error_code::authorization_denied,
                        "signer is not the module authority", tx.signer,
                        codespace);
  }

  return transaction_result_t{};
}

transaction_result_t engine::execute_operation(
    const peggy::schema::transaction_t& tx,
    transaction_store_t& store) {
  auto result = transaction_result_t{};
  auto fail = [&](transaction_error_code code, std::string log,
                  std::string info = {}) {
    result = make_failure(code, std::move(log), std::move(info),
                          kFinalizeCodespace);
  };
  auto emit = [&](std::vector<transaction_event_attribute_t> attributes) {
    result.events.push_back(transaction_event_t{
        .type = std::string{to_string(message_type_of(tx.payload))},
        .attributes = std::move(attributes)});
  };

  auto registry =
      peggy::bridge::validator_registry<encoder_t, transaction_store_t>{
          encoder_, store};
  auto mappings =
      peggy::bridge::asset_mapping_table<encoder_t, transaction_store_t>{
          encoder_, store, options_.voucher_denom_prefix};

  // Shared by the three confirmation kinds.
  auto admits_confirm = [&](const native_address_t& orchestrator,
                            const eth_address_t& eth_signer,
                            const bytes_t& signature) {
    if (signature.empty()) {
      fail(transaction_error_code::invalid_signature, "empty signature");
      return false;
    }
    auto registered = registry.eth_address(orchestrator);
    if (!registered) {
      fail(transaction_error_code::validator_not_registered,
           "orchestrator has no registered ethereum address", orchestrator);
      return false;
    }
    if (*registered != eth_signer) {
      fail(transaction_error_code::eth_signer_mismatch,
           "ethereum signer does not match registration",
           peggy::schema::to_string(eth_signer));
      return false;
    }
    return true;
  };

  std::visit(
      overloaded{
          [&](const register_eth_address_t& msg) {
            registry.set_eth_address(msg.validator, msg.eth_address);
            emit({make_attribute("validator", msg.validator),
                  make_attribute("eth_address",
                                 peggy::schema::to_string(msg.eth_address))});
          },
          [&](const request_valset_t&) {
            auto builder =
                peggy::bridge::valset_builder<encoder_t, transaction_store_t>{
                    encoder_, store, collaborators_.staking};
            auto valset = builder.build_snapshot(current_block_height_);
            result.data = encoder_.encode(valset.nonce);
            emit({make_attribute("valset_nonce", std::to_string(valset.nonce)),
                  make_attribute("members",
                                 std::to_string(valset.members.size()))});
          },
          [&](const send_to_eth_t& msg) {
            if (msg.amount.amount == 0) {
              fail(transaction_error_code::invalid_amount,
                   "amount must be positive");
              return;
            }
            if (msg.amount.amount >
                std::numeric_limits<amount_t>::max() - msg.bridge_fee.amount) {
              fail(transaction_error_code::invalid_amount,
                   "amount plus fee overflows");
              return;
            }
            if (msg.amount.denom != msg.bridge_fee.denom) {
              fail(transaction_error_code::fee_denom_mismatch,
                   "fee denom differs from amount denom",
                   msg.bridge_fee.denom);
              return;
            }
            auto token = mappings.denom_to_erc20(msg.amount.denom);
            if (!token) {
              fail(transaction_error_code::unknown_denom,
                   "denom has no token contract", msg.amount.denom);
              return;
            }

            auto pool =
                peggy::bridge::outgoing_pool<encoder_t, transaction_store_t>{
                    encoder_, store};
            auto id = pool.enqueue(
                msg.sender, msg.eth_dest,
                erc20_token_t{.contract = token->erc20,
                              .amount = msg.amount.amount},
                erc20_token_t{.contract = token->erc20,
                              .amount = msg.bridge_fee.amount},
                msg.amount.denom, collaborators_.escrow);
            if (!id) {
              fail(transaction_error_code::insufficient_funds,
                   "insufficient funds for amount plus fee", msg.sender);
              return;
            }
            result.data = encoder_.encode(*id);
            emit({make_attribute("outgoing_tx_id", std::to_string(*id)),
                  make_attribute("sender", msg.sender),
                  make_attribute("token_contract",
                                 peggy::schema::to_string(token->erc20)),
                  make_attribute("amount",
                                 peggy::schema::to_string(msg.amount.amount))});
          },
          [&](const cancel_send_to_eth_t& msg) {
            auto pool =
                peggy::bridge::outgoing_pool<encoder_t, transaction_store_t>{
                    encoder_, store};
            if (!pool.cancel(msg.transaction_id, msg.sender,
                             collaborators_.refund)) {
              fail(transaction_error_code::transfer_missing,
                   "no unbatched transfer with this id for sender",
                   std::to_string(msg.transaction_id));
              return;
            }
            emit({make_attribute("outgoing_tx_id",
                                 std::to_string(msg.transaction_id)),
                  make_attribute("sender", msg.sender)});
          },
          [&](const request_batch_t& msg) {
            auto token = mappings.denom_to_erc20(msg.denom);
            if (!token) {
              fail(transaction_error_code::unknown_denom,
                   "denom has no token contract", msg.denom);
              return;
            }
            auto builder =
                peggy::bridge::batch_builder<encoder_t, transaction_store_t>{
                    encoder_, store};
            auto batch = builder.build_batch(
                token->erc20, options_.max_batch_size, current_block_height_);
            if (!batch) {
              result.info = "nothing to batch";
              return;
            }
            result.data = encoder_.encode(batch->batch_nonce);
            emit({make_attribute("batch_nonce",
                                 std::to_string(batch->batch_nonce)),
                  make_attribute("token_contract",
                                 peggy::schema::to_string(token->erc20)),
                  make_attribute("transactions",
                                 std::to_string(batch->transactions.size()))});
          },
          [&](const valset_confirm_t& msg) {
            auto valsets =
                peggy::bridge::valset_store<encoder_t, transaction_store_t>{
                    encoder_, store};
            if (!valsets.get(msg.nonce)) {
              fail(transaction_error_code::valset_missing, "unknown valset",
                   std::to_string(msg.nonce));
              return;
            }
            if (!admits_confirm(msg.orchestrator, msg.eth_address,
                                msg.signature)) {
              return;
            }
            peggy::bridge::valset_confirm_store<encoder_t, transaction_store_t>{
                encoder_, store}
                .set_confirm(msg);
            emit({make_attribute("valset_nonce", std::to_string(msg.nonce)),
                  make_attribute("orchestrator", msg.orchestrator)});
          },
          [&](const batch_confirm_t& msg) {
            auto batches =
                peggy::bridge::batch_store<encoder_t, transaction_store_t>{
                    encoder_, store};
            if (!batches.get(msg.nonce, msg.token_contract)) {
              fail(transaction_error_code::batch_missing, "unknown batch",
                   std::to_string(msg.nonce));
              return;
            }
            if (!admits_confirm(msg.orchestrator, msg.eth_signer,
                                msg.signature)) {
              return;
            }
            peggy::bridge::batch_confirm_store<encoder_t, transaction_store_t>{
                encoder_, store}
                .set_confirm(msg);
            emit({make_attribute("batch_nonce", std::to_string(msg.nonce)),
                  make_attribute("token_contract",
                                 peggy::schema::to_string(msg.token_contract)),
                  make_attribute("orchestrator", msg.orchestrator)});
          },
          [&](const logic_call_confirm_t& msg) {
            auto calls = peggy::bridge::logic_call_registry<
                encoder_t, transaction_store_t>{encoder_, store};
            if (!calls.get(msg.invalidation_id, msg.invalidation_nonce)) {
              fail(transaction_error_code::logic_call_missing,
                   "unknown logic call",
                   to_hex(msg.invalidation_id) + "/" +
                       std::to_string(msg.invalidation_nonce));
              return;
            }
            if (!admits_confirm(msg.orchestrator, msg.eth_signer,
                                msg.signature)) {
              return;
            }
            peggy::bridge::logic_call_confirm_store<encoder_t,
                                                    transaction_store_t>{
                encoder_, store}
                .set_confirm(msg);
            emit({make_attribute("invalidation_id",
                                 to_hex(msg.invalidation_id)),
                  make_attribute("invalidation_nonce",
                                 std::to_string(msg.invalidation_nonce)),
                  make_attribute("orchestrator", msg.orchestrator)});
          },
          [&](const submit_logic_call_t& msg) {
            const auto& call = msg.call;
            if (call.invalidation_id.empty() ||
                call.logic_contract_address == eth_address_t{}) {
              fail(transaction_error_code::invalid_logic_call,
                   "logic call needs an invalidation id and a contract");
              return;
            }
            auto guard = peggy::bridge::invalidation_guard<
                encoder_t, transaction_store_t>{encoder_, store};
            if (!guard.admits(call.invalidation_id, call.invalidation_nonce)) {
              fail(transaction_error_code::invalidation_nonce_not_increasing,
                   "invalidation nonce must increase",
                   std::to_string(
                       guard.last_nonce(call.invalidation_id).value_or(0)));
              return;
            }
            peggy::bridge::logic_call_registry<encoder_t, transaction_store_t>{
                encoder_, store}
                .set(call);
            guard.record(call.invalidation_id, call.invalidation_nonce);
            emit({make_attribute("invalidation_id",
                                 to_hex(call.invalidation_id)),
                  make_attribute("invalidation_nonce",
                                 std::to_string(call.invalidation_nonce))});
          },
          [&](const set_asset_mapping_t& msg) {
            if (msg.denom.empty() ||
                peggy::bridge::parse_voucher_denom(
                    options_.voucher_denom_prefix, msg.denom)) {
              fail(transaction_error_code::invalid_denom,
                   "denom is empty or reserved for vouchers", msg.denom);
              return;
            }
            mappings.set_mapping(msg.denom, msg.erc20, msg.cosmos_originated);
            emit({make_attribute("denom", msg.denom),
                  make_attribute("erc20", peggy::schema::to_string(msg.erc20)),
                  make_attribute("cosmos_originated",
                                 msg.cosmos_originated ? "true" : "false")});
          }},
      tx.payload);

  return result;
}

block_result_t engine::finalize_block(
    uint64_t height,
    const std::vector<peggy::schema::bytes_t>& txs) {
  auto lock = std::scoped_lock{mutex_};
  if (!block_store_.writes.empty()) {
    spdlog::warn("Discarding uncommitted block {} state", pending_height_);
    block_store_.discard();
  }
  current_block_height_ = height;

  auto result = block_result_t{};
  result.tx_results.reserve(txs.size());

  auto rolling_root = last_committed_state_root_;
  for (size_t i = 0; i < txs.size(); ++i) {
    auto raw_tx = peggy::schema::bytes_view_t{txs[i].data(), txs[i].size()};
    auto decode_error = std::string{};
    auto maybe_tx = decode_transaction(raw_tx, decode_error);
    if (!maybe_tx) {
      spdlog::warn("Rejected undecodable transaction {} at height {}: {}", i,
                   height, decode_error);
      result.tx_results.push_back(
          make_failure(transaction_error_code::invalid_transaction,
                       "invalid transaction", decode_error,
                       kFinalizeCodespace));
      continue;
    }

    auto tx_result = validate_transaction(*maybe_tx, kFinalizeCodespace);
    if (tx_result.code == 0) {
      auto tx_store = transaction_store_t{block_store_};
      tx_result = execute_operation(*maybe_tx, tx_store);
      if (tx_result.code == 0) {
        tx_store.flush();
        rolling_root = fold_state_root(rolling_root, txs[i], height, i);
      }
    }
    if (tx_result.code != 0) {
      spdlog::warn("Rejected {} transaction {} at height {}: {}",
                   to_string(message_type_of(maybe_tx->payload)), i, height,
                   tx_result.log);
    }
    result.tx_results.push_back(std::move(tx_result));
  }

  pending_height_ = static_cast<int64_t>(height);
  pending_state_root_ = rolling_root;
  result.state_root = rolling_root;
  spdlog::info("Finalized block {} with {} transaction(s)", height,
               txs.size());
  return result;
}

commit_result_t engine::commit() {
  auto lock = std::scoped_lock{mutex_};
  if (pending_height_ > 0) {
    storage_.apply_writes(
        block_store_.take_writes(),
        peggy::storage::committed_state{.height = pending_height_,
                                        .state_root = pending_state_root_});
    last_committed_height_ = pending_height_;
    last_committed_state_root_ = pending_state_root_;
    pending_height_ = 0;
    spdlog::info("Committed block {}", last_committed_height_);
  }

  auto result = commit_result_t{};
  result.retain_height = 0;
  result.committed_height = last_committed_height_;
  result.state_root = last_committed_state_root_;
  return result;
}

app_info_t engine::info() const {
  auto lock = std::scoped_lock{mutex_};
  auto result = app_info_t{};
  result.last_block_height = last_committed_height_;
  result.last_block_state_root = last_committed_state_root_;
  return result;
}

void engine::load_persisted_state() {
  spdlog::debug("Loading persisted engine state");
  if (auto committed = storage_.load_committed_state()) {
    last_committed_height_ = committed->height;
    last_committed_state_root_ = committed->state_root;
  } else {
    last_committed_state_root_ = make_zero_hash();
    storage_.save_committed_state(peggy::storage::committed_state{
        .height = last_committed_height_,
        .state_root = last_committed_state_root_});
  }
  pending_state_root_ = last_committed_state_root_;
}

}  // namespace peggy::execution
