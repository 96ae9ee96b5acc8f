#pragma once

#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

namespace castlink {

/**
 * @brief Error conditions raised by castlink itself.
 *
 * Transport failures are not listed here: they are the asio / std error codes
 * produced by the socket and are passed through untouched.
 */
enum class errc {
    not_found = 1,        ///< no usable network address
    out_of_order,         ///< operation not valid in the current connection or app state
    protocol_decode,      ///< malformed inbound frame
    request_rejected,     ///< receiver answered a request with an error message
    invalid_record        ///< device record is missing its id, port or addresses
};

const std::error_category& castlink_category() noexcept;

std::error_code make_error_code(errc e) noexcept;

/**
 * @brief Ordered collection of errors gathered by a teardown path.
 *
 * Cleanup code attempts every step and appends each failure here instead of
 * returning at the first one.
 */
class ErrorList {
public:
    struct Entry {
        std::string context;
        std::error_code code;
    };

    /// Records @p code under @p context; an empty code is ignored.
    void append(std::string context, std::error_code code);

    bool empty() const { return entries.empty(); }
    std::size_t size() const { return entries.size(); }

    /// First recorded error, or an empty code when the list is empty.
    std::error_code first() const;

    /// "context: message; context: message" for logs.
    std::string message() const;

private:
    std::vector<Entry> entries;
};

} // namespace castlink

namespace std {
template <>
struct is_error_code_enum<castlink::errc> : true_type {};
} // namespace std
