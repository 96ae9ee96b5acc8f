#pragma once

#include "castlink/core/Expected.hpp"
#include "castlink/net/NetConfig.hpp"

#include <string>
#include <vector>

namespace castlink::cast {

/**
 * @brief A receiver as reported by service discovery.
 *
 * Only `id`, `port` and `addresses` are required; everything else is
 * descriptive.
 */
struct DeviceRecord {
    std::string id;
    std::string friendlyName;
    std::string model;
    std::string statusText;
    unsigned statusFlag = 0;
    std::vector<net::asio::ip::address> addresses;
    unsigned short port = 0;

    /// True when id is non-empty, port is non-zero and there is an address.
    bool isValid() const;

    /**
     * @brief Build a record from mDNS TXT strings.
     *
     * Recognised keys: `id`, `fn` (friendly name), `md` (model), `rs` (status
     * text) and `st` (status flag, C integer syntax). A bare key without `=`
     * is read as an empty value; an unparsable `st` is ignored.
     */
    static DeviceRecord fromTxt(const std::vector<std::string>& txt,
                                std::vector<net::asio::ip::address> addresses,
                                unsigned short port);
};

/// Decimal TCP port in [1, 65535]; `std::errc::invalid_argument` for
/// anything that is not a plain number, `result_out_of_range` otherwise.
castlink::expected<unsigned short> parsePort(const std::string& text);

} // namespace castlink::cast
