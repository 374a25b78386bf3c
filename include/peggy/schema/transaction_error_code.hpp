#pragma once

#include <cstdint>

namespace peggy::schema {

enum class transaction_error_code : uint32_t {
  invalid_transaction = 1,
  unsupported_transaction_version = 2,
  authorization_denied = 3,
  invalid_address = 4,
  invalid_amount = 5,
  fee_denom_mismatch = 6,
  unknown_denom = 7,
  insufficient_funds = 8,
  transfer_missing = 9,
  valset_missing = 10,
  batch_missing = 11,
  logic_call_missing = 12,
  invalid_signature = 13,
  validator_not_registered = 14,
  eth_signer_mismatch = 15,
  invalid_logic_call = 16,
  invalidation_nonce_not_increasing = 17,
  invalid_denom = 18,
};

}  // namespace peggy::schema
