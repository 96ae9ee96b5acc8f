// Expected.hpp
// -----------------------------------------------------------------------------
// Aliases for tl::expected / tl::unexpected used by every fallible call in
// castlink. The error type defaults to std::error_code; teardown paths use
// castlink::ErrorList so that every failed cleanup step is kept.

#pragma once

#include <system_error>
#include <type_traits>
#include <utility>

#include <tl/expected.hpp>

namespace castlink {

template <typename T, typename E = std::error_code>
using expected = tl::expected<T, E>;

template <typename E>
using unexpected_t = tl::unexpected<E>;

template <typename E>
[[nodiscard]] constexpr unexpected_t<std::decay_t<E>> unexpected(E&& error) {
    return unexpected_t<std::decay_t<E>>(std::forward<E>(error));
}

} // namespace castlink
