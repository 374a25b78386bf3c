#pragma once

#include <peggy/bridge/asset_mapping_table.hpp>
#include <peggy/bridge/query_surface.hpp>
#include <peggy/schema/primitives.hpp>
#include <cstddef>
#include <string>

namespace peggy::execution {

/// Runtime parameters of the bridge module.
struct engine_options final {
  /// Account allowed to submit logic calls and asset mappings. Left empty,
  /// every governance message is denied.
  peggy::schema::native_address_t authority;

  /// Upper bound on transfers taken into one batch.
  std::size_t max_batch_size{100};

  /// Page size of the "last N" queries when the caller gives none.
  std::size_t last_requests_limit{peggy::bridge::kDefaultLastRequestsLimit};

  std::string voucher_denom_prefix{
      std::string{peggy::bridge::kDefaultVoucherDenomPrefix}};
};

}  // namespace peggy::execution
