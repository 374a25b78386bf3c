#pragma once

#include <peggy/schema/primitives.hpp>
#include <array>
#include <cstdint>
#include <string_view>

// Schema key type: bridge keys.
// Bridge workflow: canonical key prefixes and key codecs for valsets, batches,
// the outgoing pool, logic calls, confirmations and asset mappings.
namespace peggy::schema::key {

inline constexpr std::string_view kBridgePrefix{"PEGGY|"};
inline constexpr std::string_view kValsetKeyPrefix{"PEGGY|VALSET|"};
inline constexpr std::string_view kBatchKeyPrefix{"PEGGY|BATCH|"};
inline constexpr std::string_view kPoolTxKeyPrefix{"PEGGY|POOL|TX|"};
inline constexpr std::string_view kPoolFeeKeyPrefix{"PEGGY|POOL|FEE|"};
inline constexpr std::string_view kPoolDenomKeyPrefix{"PEGGY|POOL|DENOM|"};
inline constexpr std::string_view kLogicCallKeyPrefix{"PEGGY|LOGIC_CALL|"};
inline constexpr std::string_view kLogicCallNonceKeyPrefix{
    "PEGGY|LOGIC_CALL_NONCE|"};
inline constexpr std::string_view kValsetConfirmKeyPrefix{
    "PEGGY|CONFIRM|VALSET|"};
inline constexpr std::string_view kBatchConfirmKeyPrefix{
    "PEGGY|CONFIRM|BATCH|"};
inline constexpr std::string_view kLogicCallConfirmKeyPrefix{
    "PEGGY|CONFIRM|LOGIC_CALL|"};
inline constexpr std::string_view kEthAddressKeyPrefix{"PEGGY|ETH_ADDRESS|"};
inline constexpr std::string_view kDenomToErc20KeyPrefix{
    "PEGGY|DENOM_TO_ERC20|"};
inline constexpr std::string_view kErc20ToDenomKeyPrefix{
    "PEGGY|ERC20_TO_DENOM|"};
inline constexpr std::string_view kSequenceKeyPrefix{"PEGGY|SEQ|"};

inline constexpr std::string_view kValsetSequence{"VALSET"};
inline constexpr std::string_view kBatchSequence{"BATCH"};
inline constexpr std::string_view kOutgoingTxSequence{"TX"};

inline constexpr std::array<std::string_view, 14> kBridgeKeyspaces{
    kValsetKeyPrefix,           kBatchKeyPrefix,
    kPoolTxKeyPrefix,           kPoolFeeKeyPrefix,
    kPoolDenomKeyPrefix,        kLogicCallKeyPrefix,
    kLogicCallNonceKeyPrefix,   kValsetConfirmKeyPrefix,
    kBatchConfirmKeyPrefix,     kLogicCallConfirmKeyPrefix,
    kEthAddressKeyPrefix,       kDenomToErc20KeyPrefix,
    kErc20ToDenomKeyPrefix,     kSequenceKeyPrefix};

peggy::schema::bytes_t make_prefix_key(std::string_view prefix);

peggy::schema::bytes_t make_valset_key(uint64_t nonce);

peggy::schema::bytes_t make_batch_key(uint64_t batch_nonce,
                                      const eth_address_t& token_contract);
peggy::schema::bytes_t make_batch_nonce_prefix_key(uint64_t batch_nonce);

peggy::schema::bytes_t make_pool_tx_key(uint64_t id);

/// Native denom escrowed for a queued transfer; refunds pay it back.
peggy::schema::bytes_t make_pool_denom_key(uint64_t id);

/// Fee priority index entry. The fee is stored as its complement so that an
/// ascending scan yields fee descending, then id ascending.
peggy::schema::bytes_t make_pool_fee_key(const eth_address_t& token_contract,
                                         const amount_t& fee,
                                         uint64_t id);
peggy::schema::bytes_t make_pool_fee_prefix_key(
    const eth_address_t& token_contract);

peggy::schema::bytes_t make_logic_call_key(
    const peggy::schema::bytes_view_t& invalidation_id,
    uint64_t invalidation_nonce);
peggy::schema::bytes_t make_logic_call_nonce_key(
    const peggy::schema::bytes_view_t& invalidation_id);

peggy::schema::bytes_t make_valset_confirm_prefix_key(uint64_t nonce);
peggy::schema::bytes_t make_batch_confirm_prefix_key(
    uint64_t batch_nonce,
    const eth_address_t& token_contract);
peggy::schema::bytes_t make_logic_call_confirm_prefix_key(
    const peggy::schema::bytes_view_t& invalidation_id,
    uint64_t invalidation_nonce);

/// Append the orchestrator component to a confirmation subject prefix.
peggy::schema::bytes_t make_confirm_key(peggy::schema::bytes_t subject_prefix,
                                        const native_address_t& orchestrator);

peggy::schema::bytes_t make_eth_address_key(const native_address_t& validator);

peggy::schema::bytes_t make_denom_to_erc20_key(std::string_view denom);
peggy::schema::bytes_t make_erc20_to_denom_key(const eth_address_t& contract);

peggy::schema::bytes_t make_sequence_key(std::string_view name);

}  // namespace peggy::schema::key
