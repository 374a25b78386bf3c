#include <peggy/bridge/logic_call_registry.hpp>
#include <peggy/testing/bridge_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>

namespace {

using peggy::testing::make_eth_address;
using registry_t =
    peggy::bridge::logic_call_registry<peggy::testing::scale_encoder_t,
                                       peggy::testing::memory_store_t>;
using guard_t = peggy::bridge::invalidation_guard<peggy::testing::scale_encoder_t,
                                                  peggy::testing::memory_store_t>;

peggy::schema::outgoing_logic_call_t make_call(peggy::schema::bytes_t id,
                                               uint64_t nonce,
                                               uint64_t timeout = 100) {
  return peggy::schema::outgoing_logic_call_t{
      .transfers = {peggy::schema::erc20_token_t{
          .contract = make_eth_address(1), .amount = 10}},
      .fees = {peggy::schema::erc20_token_t{.contract = make_eth_address(1),
                                            .amount = 1}},
      .logic_contract_address = make_eth_address(2),
      .payload = {0x01, 0x02},
      .timeout = timeout,
      .invalidation_id = std::move(id),
      .invalidation_nonce = nonce};
}

}  // namespace

TEST(logic_call_registry, set_is_an_upsert) {
  auto fixture = peggy::testing::bridge_fixture{};
  auto registry = registry_t{fixture.encoder(), fixture.store()};
  const auto id = peggy::schema::bytes_t{0xAB};

  registry.set(make_call(id, 1, 100));
  registry.set(make_call(id, 1, 200));

  auto stored = registry.get(id, 1);
  ASSERT_TRUE(stored.has_value());
  EXPECT_EQ(stored->timeout, 200u);
  EXPECT_EQ(stored->transfers.size(), 1u);
  EXPECT_EQ(registry.list().size(), 1u);
  EXPECT_FALSE(registry.get(id, 2).has_value());
}

TEST(logic_call_registry, list_follows_key_order) {
  auto fixture = peggy::testing::bridge_fixture{};
  auto registry = registry_t{fixture.encoder(), fixture.store()};
  registry.set(make_call({0x02}, 5));
  registry.set(make_call({0x01, 0x00}, 1));
  registry.set(make_call({0x02}, 1));
  registry.set(make_call({0x01}, 9));

  auto all = registry.list();
  ASSERT_EQ(all.size(), 4u);
  // Shorter ids first, then id bytes, then nonce.
  EXPECT_EQ(all[0].invalidation_id, peggy::schema::bytes_t{0x01});
  EXPECT_EQ(all[1].invalidation_id, peggy::schema::bytes_t{0x02});
  EXPECT_EQ(all[1].invalidation_nonce, 1u);
  EXPECT_EQ(all[2].invalidation_id, peggy::schema::bytes_t{0x02});
  EXPECT_EQ(all[2].invalidation_nonce, 5u);
  EXPECT_EQ(all[3].invalidation_id, (peggy::schema::bytes_t{0x01, 0x00}));
}

TEST(invalidation_guard, admits_only_increasing_nonces) {
  auto fixture = peggy::testing::bridge_fixture{};
  auto guard = guard_t{fixture.encoder(), fixture.store()};
  const auto id = peggy::schema::bytes_t{0xCA, 0xFE};

  EXPECT_FALSE(guard.last_nonce(id).has_value());
  EXPECT_TRUE(guard.admits(id, 0));

  guard.record(id, 4);
  EXPECT_EQ(guard.last_nonce(id), 4u);
  EXPECT_FALSE(guard.admits(id, 3));
  EXPECT_FALSE(guard.admits(id, 4));
  EXPECT_TRUE(guard.admits(id, 5));

  // Each invalidation id keeps its own high-water mark.
  EXPECT_TRUE(guard.admits(peggy::schema::bytes_t{0xCA}, 1));
}
