#include <covenant/execution/engine.hpp>
#include <covenant/schema/asset_state.hpp>
#include <covenant/schema/listing_state.hpp>
#include <covenant/testing/execution_fixture.hpp>
#include <gtest/gtest.h>

#include <cstdint>
#include <string>
#include <tuple>
#include <vector>

namespace {

using covenant::schema::amount_t;
using covenant::schema::transaction_error_code;
using covenant::testing::code_of;

const auto kCreator = covenant::testing::make_account(20);
const auto kCollector = covenant::testing::make_account(21);
const auto kSecondBuyer = covenant::testing::make_account(22);
const auto kOperator = covenant::testing::make_account(23);

covenant::schema::asset_state_t load_asset(
    covenant::testing::execution_fixture& fixture,
    const uint64_t token_id) {
  return covenant::testing::query_value<covenant::schema::asset_state_t>(
      fixture.engine(), "/marketplace/asset",
      covenant::testing::query_key(token_id));
}

covenant::schema::listing_state_t load_listing(
    covenant::testing::execution_fixture& fixture,
    const uint64_t token_id) {
  return covenant::testing::query_value<covenant::schema::listing_state_t>(
      fixture.engine(), "/marketplace/listing",
      covenant::testing::query_key(token_id));
}

amount_t pending_of(covenant::testing::execution_fixture& fixture,
                    const covenant::schema::account_id_t& account) {
  return covenant::testing::query_balance(fixture.engine(), account)
      .pending_withdrawal;
}

uint64_t holdings_of(covenant::testing::execution_fixture& fixture,
                     const covenant::schema::account_id_t& account) {
  return covenant::testing::query_value<uint64_t>(
      fixture.engine(), "/marketplace/balance",
      covenant::testing::query_key(account));
}

bool is_operator(covenant::testing::execution_fixture& fixture,
                 const covenant::schema::account_id_t& owner,
                 const covenant::schema::account_id_t& operator_account) {
  return covenant::testing::query_value<bool>(
      fixture.engine(), "/marketplace/operator",
      covenant::testing::query_key(std::tuple{owner, operator_account}));
}

uint64_t mint(covenant::testing::execution_fixture& fixture,
              const covenant::schema::account_id_t& creator) {
  auto result = fixture.submit(
      creator, covenant::schema::mint_asset_t{.uri = "ipfs://artwork"});
  EXPECT_EQ(result.code, 0u) << result.log;
  auto encoder = covenant::testing::scale_encoder_t{};
  return encoder.decode<uint64_t>(
      covenant::schema::make_bytes_view(result.data));
}

}  // namespace

TEST(marketplace, mint_numbers_tokens_from_one) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_mint"};
  EXPECT_EQ(mint(fixture, kCreator), 1u);
  EXPECT_EQ(mint(fixture, kCollector), 2u);

  auto asset = load_asset(fixture, 2);
  EXPECT_EQ(asset.owner, kCollector);
  EXPECT_EQ(asset.creator, kCollector);
  EXPECT_EQ(asset.uri, "ipfs://artwork");
  EXPECT_FALSE(asset.approved.has_value());

  auto listing = load_listing(fixture, 1);
  EXPECT_EQ(listing.token_id, 1u);
  EXPECT_FALSE(listing.active);
  EXPECT_EQ(fixture.engine()
                .query("/marketplace/listing",
                       covenant::schema::make_bytes_view(
                           covenant::testing::query_key(uint64_t{3})))
                .code,
            3u);
}

TEST(marketplace, listing_validates_owner_price_and_duplicates) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_list"};
  auto token = mint(fixture, kCreator);

  EXPECT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = 99, .price = 10})
                .code,
            code_of(transaction_error_code::token_missing));
  EXPECT_EQ(fixture
                .submit(kCollector, covenant::schema::list_item_t{
                                        .token_id = token, .price = 10})
                .code,
            code_of(transaction_error_code::not_token_owner));
  EXPECT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = token, .price = 0})
                .code,
            code_of(transaction_error_code::price_must_be_above_zero));
  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = token, .price = 10})
                .code,
            0u);
  EXPECT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = token, .price = 20})
                .code,
            code_of(transaction_error_code::already_listed));

  auto listing = load_listing(fixture, token);
  EXPECT_TRUE(listing.active);
  EXPECT_EQ(listing.seller, kCreator);
  EXPECT_EQ(listing.price, 10);
}

TEST(marketplace, primary_then_secondary_sale_splits_proceeds) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_sale"};
  auto token = mint(fixture, kCreator);
  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = token, .price = 100})
                .code,
            0u);

  EXPECT_EQ(fixture
                .submit(kCollector,
                        covenant::schema::buy_item_t{.token_id = token}, 99)
                .code,
            code_of(transaction_error_code::insufficient_payment));

  auto primary = fixture.submit(
      kCollector, covenant::schema::buy_item_t{.token_id = token}, 100);
  ASSERT_EQ(primary.code, 0u) << primary.log << " " << primary.info;
  EXPECT_TRUE(covenant::testing::has_event(primary, "ItemSold"));
  EXPECT_EQ(pending_of(fixture, fixture.platform()), 2);
  EXPECT_EQ(pending_of(fixture, kCreator), 98);
  EXPECT_EQ(load_asset(fixture, token).owner, kCollector);
  EXPECT_FALSE(load_listing(fixture, token).active);
  EXPECT_EQ(fixture
                .submit(kSecondBuyer,
                        covenant::schema::buy_item_t{.token_id = token}, 100)
                .code,
            code_of(transaction_error_code::not_listed));

  ASSERT_EQ(fixture
                .submit(kCollector, covenant::schema::list_item_t{
                                        .token_id = token, .price = 100})
                .code,
            0u);
  auto secondary = fixture.submit(
      kSecondBuyer, covenant::schema::buy_item_t{.token_id = token}, 100);
  ASSERT_EQ(secondary.code, 0u) << secondary.log << " " << secondary.info;
  EXPECT_EQ(pending_of(fixture, fixture.platform()), 4);
  EXPECT_EQ(pending_of(fixture, kCreator), 103);
  EXPECT_EQ(pending_of(fixture, kCollector), 93);
  EXPECT_EQ(load_asset(fixture, token).owner, kSecondBuyer);
  EXPECT_EQ(covenant::testing::query_held(fixture.engine()), 200);
}

TEST(marketplace, excess_payment_is_returned_through_the_sink) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_excess"};
  auto token = mint(fixture, kCreator);
  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = token, .price = 100})
                .code,
            0u);

  auto refunds =
      std::vector<std::pair<covenant::schema::account_id_t, amount_t>>{};
  fixture.engine().set_transfer_sink(
      [&](const covenant::schema::account_id_t& account,
          const amount_t& amount) {
        refunds.push_back({account, amount});
        return true;
      });
  auto result = fixture.submit(
      kCollector, covenant::schema::buy_item_t{.token_id = token}, 150);
  ASSERT_EQ(result.code, 0u) << result.log << " " << result.info;
  ASSERT_EQ(refunds.size(), 1u);
  EXPECT_EQ(refunds.front().first, kCollector);
  EXPECT_EQ(refunds.front().second, 50);
  EXPECT_EQ(covenant::testing::query_balance(fixture.engine(), kCollector)
                .available,
            50);
  EXPECT_EQ(covenant::testing::query_held(fixture.engine()), 100);
}

TEST(marketplace, failed_refund_rolls_back_the_sale) {
  auto fixture =
      covenant::testing::execution_fixture{"covenant_mkt_refund_failure"};
  auto token = mint(fixture, kCreator);
  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = token, .price = 100})
                .code,
            0u);
  fixture.engine().set_transfer_sink(
      [](const covenant::schema::account_id_t&, const amount_t&) {
        return false;
      });

  auto result = fixture.submit(
      kCollector, covenant::schema::buy_item_t{.token_id = token}, 120);
  EXPECT_EQ(result.code, code_of(transaction_error_code::transfer_failed));
  EXPECT_TRUE(result.events.empty());
  EXPECT_TRUE(load_listing(fixture, token).active);
  EXPECT_EQ(load_asset(fixture, token).owner, kCreator);
  EXPECT_EQ(pending_of(fixture, kCreator), 0);
  EXPECT_EQ(covenant::testing::query_held(fixture.engine()), 0);
}

TEST(marketplace, transfer_withdraws_active_listing) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_transfer"};
  auto token = mint(fixture, kCreator);
  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = token, .price = 100})
                .code,
            0u);

  auto result = fixture.submit(
      kCreator, covenant::schema::transfer_asset_t{
                    .from = kCreator, .to = kCollector, .token_id = token});
  ASSERT_EQ(result.code, 0u) << result.log;
  EXPECT_TRUE(covenant::testing::has_event(result, "ListingCanceled"));
  EXPECT_FALSE(load_listing(fixture, token).active);
  EXPECT_EQ(load_asset(fixture, token).owner, kCollector);
  EXPECT_EQ(load_asset(fixture, token).creator, kCreator);
  EXPECT_EQ(fixture
                .submit(kSecondBuyer,
                        covenant::schema::buy_item_t{.token_id = token}, 100)
                .code,
            code_of(transaction_error_code::not_listed));
}

TEST(marketplace, approved_spender_may_transfer_once) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_approve"};
  auto token = mint(fixture, kCreator);

  EXPECT_EQ(fixture
                .submit(kOperator, covenant::schema::transfer_asset_t{
                                       .from = kCreator,
                                       .to = kOperator,
                                       .token_id = token})
                .code,
            code_of(transaction_error_code::not_owner_or_approved));
  EXPECT_EQ(fixture
                .submit(kCollector, covenant::schema::approve_asset_t{
                                        .spender = kOperator,
                                        .token_id = token})
                .code,
            code_of(transaction_error_code::not_token_owner));
  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::approve_asset_t{
                                      .spender = kOperator, .token_id = token})
                .code,
            0u);
  EXPECT_EQ(load_asset(fixture, token).approved, kOperator);

  EXPECT_EQ(fixture
                .submit(kOperator, covenant::schema::transfer_asset_t{
                                       .from = kCollector,
                                       .to = kOperator,
                                       .token_id = token})
                .code,
            code_of(transaction_error_code::not_owner_or_approved));
  EXPECT_EQ(fixture
                .submit(kOperator, covenant::schema::transfer_asset_t{
                                       .from = kCreator,
                                       .to = covenant::schema::make_zero_hash(),
                                       .token_id = token})
                .code,
            code_of(transaction_error_code::zero_address));
  ASSERT_EQ(fixture
                .submit(kOperator, covenant::schema::transfer_asset_t{
                                       .from = kCreator,
                                       .to = kCollector,
                                       .token_id = token})
                .code,
            0u);

  auto asset = load_asset(fixture, token);
  EXPECT_EQ(asset.owner, kCollector);
  EXPECT_FALSE(asset.approved.has_value());
  EXPECT_EQ(fixture
                .submit(kOperator, covenant::schema::transfer_asset_t{
                                       .from = kCollector,
                                       .to = kOperator,
                                       .token_id = token})
                .code,
            code_of(transaction_error_code::not_owner_or_approved));
}

TEST(marketplace, operator_may_transfer_and_approve_any_owned_token) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_operator"};
  auto first = mint(fixture, kCreator);
  auto second = mint(fixture, kCreator);

  EXPECT_EQ(fixture
                .submit(kCreator, covenant::schema::set_approval_for_all_t{
                                      .operator_account =
                                          covenant::schema::make_zero_hash(),
                                      .approved = true})
                .code,
            code_of(transaction_error_code::zero_address));
  EXPECT_FALSE(is_operator(fixture, kCreator, kOperator));

  auto granted = fixture.submit(
      kCreator, covenant::schema::set_approval_for_all_t{
                    .operator_account = kOperator, .approved = true});
  ASSERT_EQ(granted.code, 0u) << granted.log << " " << granted.info;
  ASSERT_EQ(granted.events.size(), 1u);
  EXPECT_EQ(granted.events.front().type, "ApprovalForAll");
  EXPECT_EQ(
      covenant::testing::find_attribute(granted.events.front(), "operator"),
      covenant::schema::to_hex(kOperator));
  EXPECT_EQ(
      covenant::testing::find_attribute(granted.events.front(), "approved"),
      "true");
  EXPECT_TRUE(is_operator(fixture, kCreator, kOperator));
  EXPECT_FALSE(is_operator(fixture, kCollector, kOperator));

  ASSERT_EQ(fixture
                .submit(kOperator, covenant::schema::transfer_asset_t{
                                       .from = kCreator,
                                       .to = kOperator,
                                       .token_id = first})
                .code,
            0u);
  EXPECT_EQ(load_asset(fixture, first).owner, kOperator);

  ASSERT_EQ(fixture
                .submit(kOperator, covenant::schema::approve_asset_t{
                                       .spender = kSecondBuyer,
                                       .token_id = second})
                .code,
            0u);
  ASSERT_EQ(fixture
                .submit(kSecondBuyer, covenant::schema::transfer_asset_t{
                                          .from = kCreator,
                                          .to = kCollector,
                                          .token_id = second})
                .code,
            0u);
  EXPECT_EQ(load_asset(fixture, second).owner, kCollector);

  // Operator rights follow the owner, not the token.
  EXPECT_EQ(fixture
                .submit(kOperator, covenant::schema::transfer_asset_t{
                                       .from = kCollector,
                                       .to = kOperator,
                                       .token_id = second})
                .code,
            code_of(transaction_error_code::not_owner_or_approved));

  auto third = mint(fixture, kCreator);
  auto revoked = fixture.submit(
      kCreator, covenant::schema::set_approval_for_all_t{
                    .operator_account = kOperator, .approved = false});
  ASSERT_EQ(revoked.code, 0u);
  EXPECT_EQ(
      covenant::testing::find_attribute(revoked.events.front(), "approved"),
      "false");
  EXPECT_FALSE(is_operator(fixture, kCreator, kOperator));
  EXPECT_EQ(fixture
                .submit(kOperator, covenant::schema::transfer_asset_t{
                                       .from = kCreator,
                                       .to = kOperator,
                                       .token_id = third})
                .code,
            code_of(transaction_error_code::not_owner_or_approved));
}

TEST(marketplace, holdings_and_supply_follow_mint_transfer_and_sale) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_holdings"};
  EXPECT_EQ(covenant::testing::query_value<uint64_t>(
                fixture.engine(), "/marketplace/total_supply"),
            0u);
  EXPECT_EQ(holdings_of(fixture, kCreator), 0u);

  auto first = mint(fixture, kCreator);
  auto second = mint(fixture, kCreator);
  EXPECT_EQ(holdings_of(fixture, kCreator), 2u);
  EXPECT_EQ(covenant::testing::query_value<uint64_t>(
                fixture.engine(), "/marketplace/total_supply"),
            2u);

  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::transfer_asset_t{
                                      .from = kCreator,
                                      .to = kCollector,
                                      .token_id = first})
                .code,
            0u);
  EXPECT_EQ(holdings_of(fixture, kCreator), 1u);
  EXPECT_EQ(holdings_of(fixture, kCollector), 1u);

  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = second, .price = 100})
                .code,
            0u);
  ASSERT_EQ(fixture
                .submit(kSecondBuyer,
                        covenant::schema::buy_item_t{.token_id = second}, 100)
                .code,
            0u);
  EXPECT_EQ(holdings_of(fixture, kCreator), 0u);
  EXPECT_EQ(holdings_of(fixture, kSecondBuyer), 1u);
  EXPECT_EQ(holdings_of(fixture, kCollector), 1u);
  EXPECT_EQ(covenant::testing::query_value<uint64_t>(
                fixture.engine(), "/marketplace/total_supply"),
            2u);
}

TEST(marketplace, token_uri_reads_minted_metadata) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_uri"};
  auto token = mint(fixture, kCreator);
  EXPECT_EQ(covenant::testing::query_value<std::string>(
                fixture.engine(), "/marketplace/token_uri",
                covenant::testing::query_key(token)),
            "ipfs://artwork");

  auto missing = fixture.engine().query(
      "/marketplace/token_uri", covenant::schema::make_bytes_view(
                                    covenant::testing::query_key(uint64_t{999})));
  EXPECT_EQ(missing.code, 3u);
}

TEST(marketplace, cancel_is_seller_only) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_cancel"};
  auto token = mint(fixture, kCreator);
  EXPECT_EQ(fixture
                .submit(kCreator,
                        covenant::schema::cancel_listing_t{.token_id = token})
                .code,
            code_of(transaction_error_code::not_listed));
  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = token, .price = 5})
                .code,
            0u);
  EXPECT_EQ(fixture
                .submit(kCollector,
                        covenant::schema::cancel_listing_t{.token_id = token})
                .code,
            code_of(transaction_error_code::not_token_owner));
  ASSERT_EQ(fixture
                .submit(kCreator,
                        covenant::schema::cancel_listing_t{.token_id = token})
                .code,
            0u);
  EXPECT_FALSE(load_listing(fixture, token).active);

  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = token, .price = 7})
                .code,
            0u);
  EXPECT_EQ(load_listing(fixture, token).price, 7);
}

TEST(marketplace, withdraw_delivers_pending_once) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_withdraw"};
  auto token = mint(fixture, kCreator);
  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = token, .price = 100})
                .code,
            0u);
  ASSERT_EQ(fixture
                .submit(kCollector,
                        covenant::schema::buy_item_t{.token_id = token}, 100)
                .code,
            0u);

  auto delivered = amount_t{};
  fixture.engine().set_transfer_sink(
      [&](const covenant::schema::account_id_t&, const amount_t& amount) {
        delivered += amount;
        return true;
      });
  auto first = fixture.submit(kCreator, covenant::schema::withdraw_t{});
  ASSERT_EQ(first.code, 0u) << first.log;
  EXPECT_EQ(delivered, 98);
  EXPECT_EQ(pending_of(fixture, kCreator), 0);
  EXPECT_EQ(covenant::testing::query_held(fixture.engine()), 2);

  auto second = fixture.submit(kCreator, covenant::schema::withdraw_t{});
  EXPECT_EQ(second.code,
            code_of(transaction_error_code::no_pending_withdrawals));
  EXPECT_EQ(second.codespace, "covenant.ledger");
  EXPECT_EQ(delivered, 98);
}

TEST(marketplace, platform_fee_is_platform_administered_and_capped) {
  auto fixture = covenant::testing::execution_fixture{"covenant_mkt_fee"};
  EXPECT_EQ(covenant::testing::query_value<covenant::schema::basis_points_t>(
                fixture.engine(), "/marketplace/fee"),
            250u);
  EXPECT_EQ(fixture
                .submit(kCreator,
                        covenant::schema::update_platform_fee_t{.fee_bps = 100})
                .code,
            code_of(transaction_error_code::unauthorized));
  EXPECT_EQ(fixture
                .submit(fixture.platform(),
                        covenant::schema::update_platform_fee_t{.fee_bps = 1001})
                .code,
            code_of(transaction_error_code::invalid_fee));

  auto updated = fixture.submit(
      fixture.platform(),
      covenant::schema::update_platform_fee_t{.fee_bps = 1000});
  ASSERT_EQ(updated.code, 0u);
  ASSERT_EQ(updated.events.size(), 1u);
  EXPECT_EQ(covenant::testing::find_attribute(updated.events.front(),
                                              "old_fee_bps"),
            "250");
  EXPECT_EQ(covenant::testing::query_value<covenant::schema::basis_points_t>(
                fixture.engine(), "/marketplace/fee"),
            1000u);

  auto token = mint(fixture, kCreator);
  ASSERT_EQ(fixture
                .submit(kCreator, covenant::schema::list_item_t{
                                      .token_id = token, .price = 100})
                .code,
            0u);
  ASSERT_EQ(fixture
                .submit(kCollector,
                        covenant::schema::buy_item_t{.token_id = token}, 100)
                .code,
            0u);
  EXPECT_EQ(pending_of(fixture, fixture.platform()), 10);
  EXPECT_EQ(pending_of(fixture, kCreator), 90);
}
