#pragma once

#include <peggy/schema/primitives.hpp>
#include <peggy/schema/transaction_result.hpp>
#include <cstdint>
#include <vector>

// Schema type: block result.
// Bridge workflow: per transaction results of a finalized block plus the
// candidate post block state root.
namespace peggy::schema {

template <uint16_t Version>
struct block_result;

template <>
struct block_result<1> final {
  uint16_t version{1};
  std::vector<transaction_result_t> tx_results;
  hash32_t state_root{};
};

using block_result_t = block_result<1>;

}  // namespace peggy::schema
