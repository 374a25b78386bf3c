#pragma once

#include <peggy/schema/bonded_validator.hpp>
#include <peggy/schema/coin.hpp>
#include <peggy/schema/primitives.hpp>
#include <functional>
#include <vector>

namespace peggy::bridge {

/// Current bonded validators and their stake, in the staking module's order.
using staking_source_t =
    std::function<std::vector<peggy::schema::bonded_validator_t>()>;

/// Move `coin` out of the account into bridge custody. Returns false when the
/// account cannot cover it; nothing is moved in that case.
using escrow_t = std::function<bool(const peggy::schema::native_address_t&,
                                    const peggy::schema::coin_t&)>;

/// Return previously escrowed `coin` to the account.
using refund_t = std::function<void(const peggy::schema::native_address_t&,
                                    const peggy::schema::coin_t&)>;

/// Hooks into the staking and bank modules of the hosting chain.
struct collaborators final {
  staking_source_t staking;
  escrow_t escrow;
  refund_t refund;
};

}  // namespace peggy::bridge
