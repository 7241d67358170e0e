#pragma once

#include <covenant/execution/call_context.hpp>
#include <covenant/schema/approve_asset.hpp>
#include <covenant/schema/asset_state.hpp>
#include <covenant/schema/buy_item.hpp>
#include <covenant/schema/cancel_listing.hpp>
#include <covenant/schema/list_item.hpp>
#include <covenant/schema/listing_state.hpp>
#include <covenant/schema/mint_asset.hpp>
#include <covenant/schema/set_approval_for_all.hpp>
#include <covenant/schema/transaction_result.hpp>
#include <covenant/schema/transfer_asset.hpp>
#include <covenant/schema/update_platform_fee.hpp>
#include <covenant/schema/withdraw.hpp>
#include <optional>

namespace covenant::execution {

/// Asset registry plus fixed-price listings. Sale proceeds are split into
/// platform fee, creator royalty (secondary sales only) and seller remainder,
/// all credited through the ledger.
class marketplace_module final {
 public:
  explicit marketplace_module(call_context& context);

  covenant::schema::transaction_result_t mint(
      const covenant::schema::mint_asset_t& payload);
  covenant::schema::transaction_result_t approve(
      const covenant::schema::approve_asset_t& payload);
  covenant::schema::transaction_result_t set_approval_for_all(
      const covenant::schema::set_approval_for_all_t& payload);
  /// Ownership change outside the sale path by the owner, the token's
  /// approved account or one of the owner's operators. Withdraws any active
  /// listing.
  covenant::schema::transaction_result_t transfer(
      const covenant::schema::transfer_asset_t& payload);
  covenant::schema::transaction_result_t list(
      const covenant::schema::list_item_t& payload);
  /// Settles a sale. Excess payment goes back to the buyer as the last step.
  covenant::schema::transaction_result_t buy(
      const covenant::schema::buy_item_t& payload);
  covenant::schema::transaction_result_t cancel(
      const covenant::schema::cancel_listing_t& payload);
  covenant::schema::transaction_result_t update_platform_fee(
      const covenant::schema::update_platform_fee_t& payload);
  covenant::schema::transaction_result_t withdraw(
      const covenant::schema::withdraw_t& payload);

  static std::optional<covenant::schema::asset_state_t> load_asset(
      const state_overlay& state,
      uint64_t token_id);
  static std::optional<covenant::schema::listing_state_t> load_listing(
      const state_overlay& state,
      uint64_t token_id);
  static covenant::schema::basis_points_t platform_fee(
      const state_overlay& state,
      const engine_options& options);
  /// Tokens ever minted. Tokens are never burned, so this is also the supply.
  static uint64_t asset_count(const state_overlay& state);
  static uint64_t balance_of(const state_overlay& state,
                             const covenant::schema::account_id_t& owner);
  static bool is_approved_for_all(
      const state_overlay& state,
      const covenant::schema::account_id_t& owner,
      const covenant::schema::account_id_t& operator_account);

 private:
  covenant::schema::transaction_result_t missing_token(uint64_t token_id) const;
  bool may_manage(const covenant::schema::asset_state_t& asset) const;
  /// Move ownership, clear the single-token approval and shift one unit of
  /// holdings from the old owner to the new one.
  void move_asset(covenant::schema::asset_state_t& asset,
                  const covenant::schema::account_id_t& to);
  void adjust_holdings(const covenant::schema::account_id_t& owner,
                       bool increment);
  void save_asset(const covenant::schema::asset_state_t& asset);
  void save_listing(const covenant::schema::listing_state_t& listing);

  call_context& context_;
  encoder_t encoder_;
};

}  // namespace covenant::execution
