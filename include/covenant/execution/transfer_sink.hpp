#pragma once

#include <covenant/schema/primitives.hpp>
#include <functional>

namespace covenant::execution {

/// Host callback delivering outgoing currency. Returning false reports a
/// failed transfer and rolls the calling transaction back.
using transfer_sink_t =
    std::function<bool(const covenant::schema::account_id_t& recipient,
                       const covenant::schema::amount_t& amount)>;

}  // namespace covenant::execution
