#include <boost/program_options.hpp>
#include <covenant/common/critical.hpp>
#include <covenant/execution/engine.hpp>
#include <covenant/schema/encoding/scale/encoder.hpp>
#include <covenant/schema/transaction.hpp>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <iostream>
#include <string>
#include <string_view>
#include <tuple>
#include <vector>

namespace {

using encoder_t = covenant::schema::encoding::encoder<
    covenant::schema::encoding::scale_encoder_tag>;
namespace po = boost::program_options;

covenant::schema::account_id_t get_account(const po::variables_map& vm,
                                           const std::string& name) {
  if (!vm.contains(name)) {
    covenant::common::critical("missing required account argument --{}",
                               name);
  }
  auto account =
      covenant::schema::try_make_hash32(vm[name].as<std::string>());
  if (!account) {
    covenant::common::critical("account argument --{} must be 32-byte hex",
                               name);
  }
  return *account;
}

std::vector<covenant::schema::account_id_t> get_accounts(
    const po::variables_map& vm,
    const std::string& name) {
  auto accounts = std::vector<covenant::schema::account_id_t>{};
  if (!vm.contains(name)) {
    return accounts;
  }
  for (const auto& value : vm[name].as<std::vector<std::string>>()) {
    auto account = covenant::schema::try_make_hash32(value);
    if (!account) {
      covenant::common::critical("--{} entry '{}' must be 32-byte hex", name,
                                 value);
    }
    accounts.push_back(*account);
  }
  return accounts;
}

std::vector<std::string> get_strings(const po::variables_map& vm,
                                     const std::string& name) {
  if (!vm.contains(name)) {
    return {};
  }
  return vm[name].as<std::vector<std::string>>();
}

covenant::schema::amount_t get_amount(const po::variables_map& vm,
                                      const std::string& name) {
  auto text = vm[name].as<std::string>();
  if (text.empty() || !std::ranges::all_of(text, [](const char c) {
        return std::isdigit(static_cast<unsigned char>(c)) != 0;
      })) {
    covenant::common::critical("amount argument --{} must be a decimal integer",
                               name);
  }
  return covenant::schema::amount_t{text};
}

covenant::schema::transaction_payload_t build_payload(
    const po::variables_map& vm) {
  auto payload = vm["payload"].as<std::string>();
  auto escrow_id = vm["escrow-id"].as<uint64_t>();
  auto token_id = vm["token-id"].as<uint64_t>();
  if (payload == "create_escrow") {
    return covenant::schema::create_escrow_t{
        .seller = get_account(vm, "seller"),
        .arbiter = get_account(vm, "arbiter"),
        .duration = vm["duration"].as<uint64_t>(),
        .description = vm["description"].as<std::string>()};
  }
  if (payload == "release_escrow") {
    return covenant::schema::release_escrow_t{.escrow_id = escrow_id};
  }
  if (payload == "refund_escrow") {
    return covenant::schema::refund_escrow_t{.escrow_id = escrow_id};
  }
  if (payload == "raise_dispute") {
    return covenant::schema::raise_dispute_t{.escrow_id = escrow_id};
  }
  if (payload == "resolve_dispute") {
    return covenant::schema::resolve_dispute_t{
        .escrow_id = escrow_id, .recipient = get_account(vm, "recipient")};
  }
  if (payload == "withdraw_platform_fees") {
    return covenant::schema::withdraw_platform_fees_t{};
  }
  if (payload == "open_voting_session") {
    return covenant::schema::open_voting_session_t{
        .title = vm["title"].as<std::string>(),
        .voting_start = vm["voting-start"].as<uint64_t>(),
        .voting_end = vm["voting-end"].as<uint64_t>(),
        .proposal_names = get_strings(vm, "proposal-name"),
        .proposal_descriptions = get_strings(vm, "proposal-description")};
  }
  if (payload == "register_voter") {
    return covenant::schema::register_voter_t{.voter =
                                                  get_account(vm, "voter")};
  }
  if (payload == "register_voters_batch") {
    return covenant::schema::register_voters_batch_t{
        .voters = get_accounts(vm, "voter")};
  }
  if (payload == "add_proposal") {
    return covenant::schema::add_proposal_t{
        .name = vm["name"].as<std::string>(),
        .description = vm["description"].as<std::string>()};
  }
  if (payload == "cast_vote") {
    return covenant::schema::cast_vote_t{
        .proposal_id = vm["proposal-id"].as<uint64_t>()};
  }
  if (payload == "delegate_vote") {
    return covenant::schema::delegate_vote_t{.to = get_account(vm, "to")};
  }
  if (payload == "finalize_voting") {
    return covenant::schema::finalize_voting_t{};
  }
  if (payload == "extend_voting") {
    return covenant::schema::extend_voting_t{
        .new_end = vm["new-end"].as<uint64_t>()};
  }
  if (payload == "mint_asset") {
    return covenant::schema::mint_asset_t{.uri = vm["uri"].as<std::string>()};
  }
  if (payload == "approve_asset") {
    return covenant::schema::approve_asset_t{
        .spender = get_account(vm, "spender"), .token_id = token_id};
  }
  if (payload == "set_approval_for_all") {
    return covenant::schema::set_approval_for_all_t{
        .operator_account = get_account(vm, "operator"),
        .approved = vm["approved"].as<bool>()};
  }
  if (payload == "transfer_asset") {
    return covenant::schema::transfer_asset_t{.from = get_account(vm, "from"),
                                              .to = get_account(vm, "to"),
                                              .token_id = token_id};
  }
  if (payload == "list_item") {
    return covenant::schema::list_item_t{.token_id = token_id,
                                         .price = get_amount(vm, "price")};
  }
  if (payload == "buy_item") {
    return covenant::schema::buy_item_t{.token_id = token_id};
  }
  if (payload == "cancel_listing") {
    return covenant::schema::cancel_listing_t{.token_id = token_id};
  }
  if (payload == "update_platform_fee") {
    auto fee = vm["fee-bps"].as<uint32_t>();
    if (fee > covenant::schema::kBasisPointsDenominator) {
      covenant::common::critical("--fee-bps {} exceeds {}", fee,
                                 covenant::schema::kBasisPointsDenominator);
    }
    return covenant::schema::update_platform_fee_t{
        .fee_bps = static_cast<covenant::schema::basis_points_t>(fee)};
  }
  if (payload == "withdraw") {
    return covenant::schema::withdraw_t{};
  }
  covenant::common::critical("unsupported payload type {}", payload);
}

covenant::schema::bytes_t build_query_key(const po::variables_map& vm) {
  auto encoder = encoder_t{};
  auto path = vm["path"].as<std::string>();
  if (path == "/engine/info" || path == "/ledger/held" ||
      path == "/escrow/platform_balance" || path == "/escrow/count" ||
      path == "/voting/winner" || path == "/voting/summary" ||
      path == "/marketplace/fee" || path == "/marketplace/total_supply") {
    return {};
  }
  if (path == "/engine/nonce" || path == "/ledger/balance" ||
      path == "/voting/voter" || path == "/marketplace/balance") {
    return encoder.encode(get_account(vm, "account"));
  }
  if (path == "/escrow/get" || path == "/escrow/expired") {
    return encoder.encode(vm["escrow-id"].as<uint64_t>());
  }
  if (path == "/voting/proposal") {
    return encoder.encode(vm["proposal-id"].as<uint64_t>());
  }
  if (path == "/marketplace/operator") {
    return encoder.encode(
        std::tuple{get_account(vm, "account"), get_account(vm, "operator")});
  }
  if (path == "/marketplace/listing" || path == "/marketplace/asset" ||
      path == "/marketplace/token_uri") {
    return encoder.encode(vm["token-id"].as<uint64_t>());
  }
  if (path == "/events/range") {
    return encoder.encode(
        std::tuple{vm["from-id"].as<uint64_t>(), vm["to-id"].as<uint64_t>()});
  }
  covenant::common::critical("unsupported query path {}", path);
}

void print_help(const po::options_description& options) {
  std::cout << "Usage:\n"
            << "  transaction_builder transaction [options]\n"
            << "  transaction_builder query-key [options]\n"
            << "  transaction_builder chain-id\n\n";
  std::cout << options << '\n';
}

}  // namespace

int main(int argc, const char** argv) {
  auto command = std::string{};
  auto options = po::options_description{"transaction_builder options"};
  options.add_options()("help,h", "show help")(
      "command", po::value<std::string>(&command),
      "transaction|query-key|chain-id")("payload", po::value<std::string>(),
                                        "transaction payload type")(
      "path", po::value<std::string>(), "query path")(
      "chain-id", po::value<std::string>(),
      "32-byte chain id hex (defaults to the engine chain id)")(
      "nonce", po::value<uint64_t>()->default_value(1), "transaction nonce")(
      "caller", po::value<std::string>(), "caller account hex")(
      "value", po::value<std::string>()->default_value("0"),
      "attached currency amount")("account", po::value<std::string>(),
                                  "queried account hex")(
      "escrow-id", po::value<uint64_t>()->default_value(0), "escrow id")(
      "seller", po::value<std::string>(), "escrow seller account hex")(
      "arbiter", po::value<std::string>(), "escrow arbiter account hex")(
      "duration", po::value<uint64_t>()->default_value(86400),
      "escrow duration seconds")(
      "description", po::value<std::string>()->default_value(""),
      "escrow or proposal description")(
      "recipient", po::value<std::string>(), "dispute recipient account hex")(
      "title", po::value<std::string>()->default_value(""), "ballot title")(
      "voting-start", po::value<uint64_t>()->default_value(0),
      "voting window start seconds")(
      "voting-end", po::value<uint64_t>()->default_value(0),
      "voting window end seconds")(
      "proposal-name", po::value<std::vector<std::string>>()->multitoken(),
      "initial proposal names")(
      "proposal-description",
      po::value<std::vector<std::string>>()->multitoken(),
      "initial proposal descriptions")(
      "voter", po::value<std::vector<std::string>>()->multitoken(),
      "voter account hex values")(
      "name", po::value<std::string>()->default_value(""), "proposal name")(
      "proposal-id", po::value<uint64_t>()->default_value(0), "proposal id")(
      "to", po::value<std::string>(), "delegate or transfer target hex")(
      "from", po::value<std::string>(), "transfer source hex")(
      "new-end", po::value<uint64_t>()->default_value(0),
      "extended voting end seconds")(
      "uri", po::value<std::string>()->default_value(""), "asset uri")(
      "spender", po::value<std::string>(), "approved spender hex")(
      "operator", po::value<std::string>(), "operator account hex")(
      "approved", po::value<bool>()->default_value(true),
      "grant (true) or revoke (false) an operator")(
      "token-id", po::value<uint64_t>()->default_value(1), "asset token id")(
      "price", po::value<std::string>()->default_value("0"), "listing price")(
      "fee-bps", po::value<uint32_t>()->default_value(0),
      "marketplace platform fee bps")(
      "from-id", po::value<uint64_t>()->default_value(0),
      "event range from")(
      "to-id", po::value<uint64_t>()->default_value(0), "event range to");

  auto positional = po::positional_options_description{};
  positional.add("command", 1);
  auto vm = po::variables_map{};
  po::store(po::command_line_parser(argc, argv)
                .options(options)
                .positional(positional)
                .run(),
            vm);
  po::notify(vm);

  if (vm.contains("help") || command.empty()) {
    print_help(options);
    return 0;
  }

  if (command == "transaction" || command == "tx") {
    if (!vm.contains("payload")) {
      covenant::common::critical("transaction mode requires --payload");
    }
    auto chain_id = vm.contains("chain-id")
                        ? get_account(vm, "chain-id")
                        : covenant::execution::make_chain_id();
    auto transaction =
        covenant::schema::transaction_t{.version = 1,
                                        .chain_id = chain_id,
                                        .nonce = vm["nonce"].as<uint64_t>(),
                                        .caller = get_account(vm, "caller"),
                                        .value = get_amount(vm, "value"),
                                        .payload = build_payload(vm)};
    auto encoded = encoder_t{}.encode(transaction);
    std::cout << covenant::schema::to_base64(covenant::schema::bytes_view_t{
                     encoded.data(), encoded.size()})
              << '\n';
    return 0;
  }

  if (command == "query-key") {
    if (!vm.contains("path")) {
      covenant::common::critical("query-key mode requires --path");
    }
    auto key = build_query_key(vm);
    std::cout << covenant::schema::to_base64(
                     covenant::schema::bytes_view_t{key.data(), key.size()})
              << '\n';
    return 0;
  }

  if (command == "chain-id") {
    std::cout << covenant::schema::to_hex(covenant::execution::make_chain_id())
              << '\n';
    return 0;
  }

  covenant::common::critical("command must be transaction|query-key|chain-id");
}
