#pragma once

#include <asio.hpp>
#include <asio/ssl.hpp>
#include <system_error>   // std::error_code

namespace castlink::net {

/**
 * @brief Centralises networking aliases so higher-level code never includes Asio directly.
 *
 * Exposes:
 * - `castlink::net::asio` as the standalone Asio namespace.
 * - `castlink::net::tcp` as the protocol alias.
 * - `castlink::net::ssl` for the TLS layer (OpenSSL backed).
 */
namespace asio = ::asio;
namespace ssl = ::asio::ssl;

using tcp = asio::ip::tcp;
} // namespace castlink::net
