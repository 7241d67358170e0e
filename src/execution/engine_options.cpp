#include <spdlog/spdlog.h>
#include <covenant/common/critical.hpp>
#include <covenant/execution/engine_options.hpp>

namespace covenant::execution {

void validate_options(const engine_options& options) {
  if (covenant::schema::is_null(options.platform_account)) {
    covenant::common::critical("platform account must be configured");
  }
  if (options.max_marketplace_fee_bps >
      covenant::schema::kBasisPointsDenominator) {
    covenant::common::critical("marketplace fee cap exceeds 10000 bps");
  }
  if (options.marketplace_fee_bps > options.max_marketplace_fee_bps) {
    spdlog::error("Marketplace fee {} bps exceeds cap {} bps",
                  options.marketplace_fee_bps, options.max_marketplace_fee_bps);
    covenant::common::critical("invalid marketplace fee");
  }
  if (options.escrow_fee_bps > covenant::schema::kBasisPointsDenominator) {
    covenant::common::critical("escrow fee exceeds 10000 bps");
  }
  if (options.creator_royalty_bps + options.max_marketplace_fee_bps >
      covenant::schema::kBasisPointsDenominator) {
    covenant::common::critical("royalty and fee cap exceed sale price");
  }
  if (options.max_delegation_hops == 0) {
    covenant::common::critical("delegation hop limit must be positive");
  }
}

}  // namespace covenant::execution
