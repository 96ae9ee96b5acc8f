#pragma once

#include "castlink/net/NetConfig.hpp"

#include <cstddef>
#include <functional>
#include <vector>

namespace castlink::cast {

/**
 * @brief Picks the one address a connect attempt will use.
 *
 * Called with a non-empty candidate list; returns an index into it. A policy
 * never causes a second attempt: failover across addresses is left to the
 * caller.
 */
using AddressPolicy =
    std::function<std::size_t(const std::vector<net::asio::ip::address>& candidates)>;

/// Always the first candidate (discovery order).
AddressPolicy firstAddress();

/// A uniformly random candidate.
AddressPolicy randomAddress();

/// Successive calls on the same policy object walk the list in order.
AddressPolicy roundRobin();

} // namespace castlink::cast
