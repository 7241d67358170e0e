#include <spdlog/fmt/fmt.h>
#include <spdlog/spdlog.h>
#include <covenant/common/critical.hpp>
#include <covenant/execution/marketplace_module.hpp>
#include <covenant/schema/key/engine_keys.hpp>

using namespace covenant::schema;

namespace covenant::execution {

marketplace_module::marketplace_module(call_context& context)
    : context_{context} {}

transaction_result_t marketplace_module::mint(const mint_asset_t& payload) {
  auto token_id = asset_count(context_.state) + 1;
  auto asset = asset_state_t{};
  asset.token_id = token_id;
  asset.owner = context_.caller;
  asset.creator = context_.caller;
  asset.uri = payload.uri;
  save_asset(asset);
  adjust_holdings(asset.owner, true);
  context_.state.put(key::make_prefix_key(encoder_, key::kAssetCountKey),
                     token_id);

  context_.events.push_back(make_event(
      "Transfer",
      {make_attribute("from", to_hex(make_zero_hash()), true),
       make_attribute("to", to_hex(asset.owner), true),
       make_attribute("token_id", std::to_string(token_id), true)}));
  context_.events.push_back(make_event(
      "ItemMinted",
      {make_attribute("token_id", std::to_string(token_id), true),
       make_attribute("creator", to_hex(asset.creator), true),
       make_attribute("uri", asset.uri)}));

  auto result = make_success_result();
  result.data = encoder_.encode(token_id);
  return result;
}

transaction_result_t marketplace_module::approve(
    const approve_asset_t& payload) {
  auto asset = load_asset(context_.state, payload.token_id);
  if (!asset) {
    return missing_token(payload.token_id);
  }
  if (context_.caller != asset->owner &&
      !is_approved_for_all(context_.state, asset->owner, context_.caller)) {
    return make_error_result(
        transaction_error_code::not_token_owner, kMarketplaceCodespace,
        unauthorized_info(context_.caller, "owner_or_operator"));
  }
  if (is_null(payload.spender)) {
    asset->approved.reset();
  } else {
    asset->approved = payload.spender;
  }
  save_asset(*asset);

  context_.events.push_back(make_event(
      "Approval",
      {make_attribute("owner", to_hex(asset->owner), true),
       make_attribute("spender", to_hex(payload.spender), true),
       make_attribute("token_id", std::to_string(payload.token_id), true)}));
  return make_success_result();
}

transaction_result_t marketplace_module::set_approval_for_all(
    const set_approval_for_all_t& payload) {
  if (is_null(payload.operator_account)) {
    return make_error_result(transaction_error_code::zero_address,
                             kMarketplaceCodespace, "field=operator");
  }

  auto key = key::make_operator_key(encoder_, context_.caller,
                                    payload.operator_account);
  context_.state.put(std::move(key), payload.approved);

  context_.events.push_back(make_event(
      "ApprovalForAll",
      {make_attribute("owner", to_hex(context_.caller), true),
       make_attribute("operator", to_hex(payload.operator_account), true),
       make_attribute("approved", payload.approved ? "true" : "false")}));
  return make_success_result();
}

transaction_result_t marketplace_module::transfer(
    const transfer_asset_t& payload) {
  auto asset = load_asset(context_.state, payload.token_id);
  if (!asset) {
    return missing_token(payload.token_id);
  }
  if (!may_manage(*asset) || payload.from != asset->owner) {
    return make_error_result(
        transaction_error_code::not_owner_or_approved, kMarketplaceCodespace,
        unauthorized_info(context_.caller, "owner_or_approved"));
  }
  if (is_null(payload.to)) {
    return make_error_result(transaction_error_code::zero_address,
                             kMarketplaceCodespace, "field=to");
  }

  auto listing = load_listing(context_.state, payload.token_id);
  if (listing && listing->active) {
    listing->active = false;
    save_listing(*listing);
    context_.events.push_back(make_event(
        "ListingCanceled",
        {make_attribute("token_id", std::to_string(payload.token_id), true),
         make_attribute("seller", to_hex(listing->seller), true)}));
  }
  move_asset(*asset, payload.to);

  context_.events.push_back(make_event(
      "Transfer",
      {make_attribute("from", to_hex(payload.from), true),
       make_attribute("to", to_hex(payload.to), true),
       make_attribute("token_id", std::to_string(payload.token_id), true)}));
  return make_success_result();
}

transaction_result_t marketplace_module::list(const list_item_t& payload) {
  auto asset = load_asset(context_.state, payload.token_id);
  if (!asset) {
    return missing_token(payload.token_id);
  }
  if (context_.caller != asset->owner) {
    return make_error_result(transaction_error_code::not_token_owner,
                             kMarketplaceCodespace,
                             unauthorized_info(context_.caller, "owner"));
  }
  if (payload.price == 0) {
    return make_error_result(transaction_error_code::price_must_be_above_zero,
                             kMarketplaceCodespace);
  }
  auto existing = load_listing(context_.state, payload.token_id);
  if (existing && existing->active) {
    return make_error_result(
        transaction_error_code::already_listed, kMarketplaceCodespace,
        fmt::format("token_id={}", payload.token_id));
  }

  auto listing = listing_state_t{};
  listing.token_id = payload.token_id;
  listing.seller = context_.caller;
  listing.price = payload.price;
  listing.active = true;
  save_listing(listing);

  context_.events.push_back(make_event(
      "ItemListed",
      {make_attribute("token_id", std::to_string(payload.token_id), true),
       make_attribute("seller", to_hex(listing.seller), true),
       make_attribute("price", listing.price.str())}));
  return make_success_result();
}

transaction_result_t marketplace_module::buy(const buy_item_t& payload) {
  auto listing = load_listing(context_.state, payload.token_id);
  if (!listing || !listing->active) {
    return make_error_result(transaction_error_code::not_listed,
                             kMarketplaceCodespace,
                             fmt::format("token_id={}", payload.token_id));
  }
  if (context_.value < listing->price) {
    return make_error_result(
        transaction_error_code::insufficient_payment, kMarketplaceCodespace,
        fmt::format("value={} price={}", context_.value.str(),
                    listing->price.str()));
  }
  auto asset = load_asset(context_.state, payload.token_id);
  if (!asset) {
    return missing_token(payload.token_id);
  }

  const auto& price = listing->price;
  auto fee = apply_basis_points(
      price, platform_fee(context_.state, context_.options));
  auto royalty = asset->creator != listing->seller
                     ? apply_basis_points(price,
                                          context_.options.creator_royalty_bps)
                     : amount_t{0};
  auto seller_amount = amount_t{price - fee - royalty};
  auto excess = amount_t{context_.value - price};

  listing->active = false;
  save_listing(*listing);
  move_asset(*asset, context_.caller);

  context_.ledger.credit(context_.options.platform_account, fee);
  context_.ledger.credit(asset->creator, royalty);
  context_.ledger.credit(listing->seller, seller_amount);
  spdlog::debug("Token {} sold for {}: fee {} royalty {} seller {}",
                payload.token_id, price.str(), fee.str(), royalty.str(),
                seller_amount.str());

  context_.events.push_back(make_event(
      "Transfer",
      {make_attribute("from", to_hex(listing->seller), true),
       make_attribute("to", to_hex(context_.caller), true),
       make_attribute("token_id", std::to_string(payload.token_id), true)}));
  context_.events.push_back(make_event(
      "ItemSold",
      {make_attribute("token_id", std::to_string(payload.token_id), true),
       make_attribute("seller", to_hex(listing->seller), true),
       make_attribute("buyer", to_hex(context_.caller), true),
       make_attribute("price", price.str())}));

  if (excess > 0) {
    auto code = context_.ledger.transfer(context_.caller, excess);
    if (code != transaction_error_code::ok) {
      return make_error_result(
          code, kMarketplaceCodespace,
          fmt::format("refund={} buyer={}", excess.str(),
                      to_hex(context_.caller)));
    }
  }
  return make_success_result();
}

transaction_result_t marketplace_module::cancel(
    const cancel_listing_t& payload) {
  auto listing = load_listing(context_.state, payload.token_id);
  if (!listing || !listing->active) {
    return make_error_result(transaction_error_code::not_listed,
                             kMarketplaceCodespace,
                             fmt::format("token_id={}", payload.token_id));
  }
  if (context_.caller != listing->seller) {
    return make_error_result(transaction_error_code::not_token_owner,
                             kMarketplaceCodespace,
                             unauthorized_info(context_.caller, "seller"));
  }

  listing->active = false;
  save_listing(*listing);
  context_.events.push_back(make_event(
      "ListingCanceled",
      {make_attribute("token_id", std::to_string(payload.token_id), true),
       make_attribute("seller", to_hex(listing->seller), true)}));
  return make_success_result();
}

transaction_result_t marketplace_module::update_platform_fee(
    const update_platform_fee_t& payload) {
  if (context_.caller != context_.options.platform_account) {
    return make_error_result(transaction_error_code::unauthorized,
                             kMarketplaceCodespace,
                             unauthorized_info(context_.caller, "platform"));
  }
  if (payload.fee_bps > context_.options.max_marketplace_fee_bps) {
    return make_error_result(
        transaction_error_code::invalid_fee, kMarketplaceCodespace,
        fmt::format("fee_bps={} max={}", payload.fee_bps,
                    context_.options.max_marketplace_fee_bps));
  }

  auto previous = platform_fee(context_.state, context_.options);
  context_.state.put(key::make_prefix_key(encoder_, key::kMarketplaceFeeKey),
                     payload.fee_bps);
  context_.events.push_back(make_event(
      "PlatformFeeUpdated",
      {make_attribute("old_fee_bps", std::to_string(previous)),
       make_attribute("new_fee_bps", std::to_string(payload.fee_bps))}));
  return make_success_result();
}

transaction_result_t marketplace_module::withdraw(const withdraw_t&) {
  auto withdrawn = amount_t{};
  auto code = context_.ledger.withdraw(context_.caller, withdrawn);
  if (code != transaction_error_code::ok) {
    return make_error_result(
        code, kLedgerCodespace,
        fmt::format("account={}", to_hex(context_.caller)));
  }
  context_.events.push_back(make_event(
      "Withdrawal", {make_attribute("account", to_hex(context_.caller), true),
                     make_attribute("amount", withdrawn.str())}));
  return make_success_result();
}

std::optional<asset_state_t> marketplace_module::load_asset(
    const state_overlay& state,
    uint64_t token_id) {
  auto encoder = encoder_t{};
  return state.get<asset_state_t>(key::make_asset_key(encoder, token_id));
}

std::optional<listing_state_t> marketplace_module::load_listing(
    const state_overlay& state,
    uint64_t token_id) {
  auto encoder = encoder_t{};
  return state.get<listing_state_t>(key::make_listing_key(encoder, token_id));
}

basis_points_t marketplace_module::platform_fee(const state_overlay& state,
                                                const engine_options& options) {
  auto encoder = encoder_t{};
  return state
      .get<basis_points_t>(
          key::make_prefix_key(encoder, key::kMarketplaceFeeKey))
      .value_or(options.marketplace_fee_bps);
}

uint64_t marketplace_module::asset_count(const state_overlay& state) {
  auto encoder = encoder_t{};
  return state.get<uint64_t>(key::make_prefix_key(encoder, key::kAssetCountKey))
      .value_or(0);
}

uint64_t marketplace_module::balance_of(const state_overlay& state,
                                        const account_id_t& owner) {
  auto encoder = encoder_t{};
  return state.get<uint64_t>(key::make_holding_key(encoder, owner))
      .value_or(0);
}

bool marketplace_module::is_approved_for_all(
    const state_overlay& state,
    const account_id_t& owner,
    const account_id_t& operator_account) {
  auto encoder = encoder_t{};
  return state
      .get<bool>(key::make_operator_key(encoder, owner, operator_account))
      .value_or(false);
}

bool marketplace_module::may_manage(const asset_state_t& asset) const {
  if (context_.caller == asset.owner) {
    return true;
  }
  if (asset.approved.has_value() && *asset.approved == context_.caller) {
    return true;
  }
  return is_approved_for_all(context_.state, asset.owner, context_.caller);
}

transaction_result_t marketplace_module::missing_token(
    uint64_t token_id) const {
  return make_error_result(transaction_error_code::token_missing,
                           kMarketplaceCodespace,
                           fmt::format("token_id={}", token_id));
}

void marketplace_module::move_asset(asset_state_t& asset,
                                    const account_id_t& to) {
  adjust_holdings(asset.owner, false);
  adjust_holdings(to, true);
  asset.owner = to;
  asset.approved.reset();
  save_asset(asset);
}

void marketplace_module::adjust_holdings(const account_id_t& owner,
                                         const bool increment) {
  auto held = balance_of(context_.state, owner);
  if (!increment && held == 0) {
    covenant::common::critical("Holdings underflow for {}", to_hex(owner));
  }
  context_.state.put(key::make_holding_key(encoder_, owner),
                     increment ? held + 1 : held - 1);
}

void marketplace_module::save_asset(const asset_state_t& asset) {
  context_.state.put(key::make_asset_key(encoder_, asset.token_id), asset);
}

void marketplace_module::save_listing(const listing_state_t& listing) {
  context_.state.put(key::make_listing_key(encoder_, listing.token_id),
                     listing);
}

}  // namespace covenant::execution
