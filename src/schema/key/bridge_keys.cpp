#include <peggy/schema/key/bridge_keys.hpp>

#include <peggy/schema/key/builder.hpp>

#include <limits>

namespace peggy::schema::key {

peggy::schema::bytes_t make_prefix_key(std::string_view prefix) {
  return peggy::schema::make_bytes(prefix);
}

peggy::schema::bytes_t make_valset_key(uint64_t nonce) {
  return builder{}.write(kValsetKeyPrefix).write(nonce).data;
}

peggy::schema::bytes_t make_batch_key(uint64_t batch_nonce,
                                      const eth_address_t& token_contract) {
  return builder{}
      .write(kBatchKeyPrefix)
      .write(batch_nonce)
      .write(token_contract)
      .data;
}

peggy::schema::bytes_t make_batch_nonce_prefix_key(uint64_t batch_nonce) {
  return builder{}.write(kBatchKeyPrefix).write(batch_nonce).data;
}

peggy::schema::bytes_t make_pool_tx_key(uint64_t id) {
  return builder{}.write(kPoolTxKeyPrefix).write(id).data;
}

peggy::schema::bytes_t make_pool_denom_key(uint64_t id) {
  return builder{}.write(kPoolDenomKeyPrefix).write(id).data;
}

peggy::schema::bytes_t make_pool_fee_key(const eth_address_t& token_contract,
                                         const amount_t& fee,
                                         uint64_t id) {
  auto complement = std::numeric_limits<amount_t>::max() - fee;
  return builder{}
      .write(kPoolFeeKeyPrefix)
      .write(token_contract)
      .write(complement)
      .write(id)
      .data;
}

peggy::schema::bytes_t make_pool_fee_prefix_key(
    const eth_address_t& token_contract) {
  return builder{}.write(kPoolFeeKeyPrefix).write(token_contract).data;
}

peggy::schema::bytes_t make_logic_call_key(
    const peggy::schema::bytes_view_t& invalidation_id,
    uint64_t invalidation_nonce) {
  return builder{}
      .write(kLogicCallKeyPrefix)
      .write_sized(invalidation_id)
      .write(invalidation_nonce)
      .data;
}

peggy::schema::bytes_t make_logic_call_nonce_key(
    const peggy::schema::bytes_view_t& invalidation_id) {
  return builder{}
      .write(kLogicCallNonceKeyPrefix)
      .write_sized(invalidation_id)
      .data;
}

peggy::schema::bytes_t make_valset_confirm_prefix_key(uint64_t nonce) {
  return builder{}.write(kValsetConfirmKeyPrefix).write(nonce).data;
}

peggy::schema::bytes_t make_batch_confirm_prefix_key(
    uint64_t batch_nonce,
    const eth_address_t& token_contract) {
  return builder{}
      .write(kBatchConfirmKeyPrefix)
      .write(batch_nonce)
      .write(token_contract)
      .data;
}

peggy::schema::bytes_t make_logic_call_confirm_prefix_key(
    const peggy::schema::bytes_view_t& invalidation_id,
    uint64_t invalidation_nonce) {
  return builder{}
      .write(kLogicCallConfirmKeyPrefix)
      .write_sized(invalidation_id)
      .write(invalidation_nonce)
      .data;
}

peggy::schema::bytes_t make_confirm_key(peggy::schema::bytes_t subject_prefix,
                                        const native_address_t& orchestrator) {
  auto key = builder{std::move(subject_prefix)};
  return key.write(std::string_view{orchestrator}).data;
}

peggy::schema::bytes_t make_eth_address_key(const native_address_t& validator) {
  return builder{}
      .write(kEthAddressKeyPrefix)
      .write(std::string_view{validator})
      .data;
}

peggy::schema::bytes_t make_denom_to_erc20_key(std::string_view denom) {
  return builder{}.write(kDenomToErc20KeyPrefix).write(denom).data;
}

peggy::schema::bytes_t make_erc20_to_denom_key(const eth_address_t& contract) {
  return builder{}.write(kErc20ToDenomKeyPrefix).write(contract).data;
}

peggy::schema::bytes_t make_sequence_key(std::string_view name) {
  return builder{}.write(kSequenceKeyPrefix).write(name).data;
}

}  // namespace peggy::schema::key
