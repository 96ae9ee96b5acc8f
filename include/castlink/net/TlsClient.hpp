#pragma once
#include "castlink/net/NetConfig.hpp"
#include "castlink/net/Deadline.hpp"
#include "castlink/net/TimeoutConfig.hpp"
#include "castlink/net/NetService.hpp"
#include "castlink/log/Log.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <utility>
#include <vector>

namespace castlink::net {
using duration = TimeoutConfig::duration;

/**
 * @brief TLS client stream over `tcp::socket` with deadlines on every blocking call.
 *
 * Highlights:
 * - `connect(...)` performs the TCP connect and the TLS handshake inside one
 *   timeout budget.
 * - `write_all(...)` blocks the caller while enforcing a deadline.
 * - `async_read_exact(...)` feeds a receive pump; its handler runs on the strand.
 * - All stream work is posted onto one strand, so a pending read and a write
 *   issued from another thread never touch the TLS engine concurrently.
 *
 * Receivers present self-signed certificates, so peer verification is off.
 *
 * The object itself is not thread-safe: `connect`, `close` and `write_all`
 * must be serialised by the owner. Pending handlers keep the stream alive, so
 * `close()` may run while a read is still outstanding.
 */
class TlsClient {
public:
    using stream_type = ssl::stream<tcp::socket>;
    using Bytes = std::vector<std::uint8_t>;

    TlsClient()
    : io_(shared_io_context())
    , sslContext_(ssl::context::tls_client)
    , strand_(asio::make_strand(*io_))
    , writeTimeout_(TimeoutConfig::writeTimeout())
    {
        sslContext_.set_verify_mode(ssl::verify_none);
    }

    ~TlsClient() { close(); }

    TlsClient(const TlsClient&) = delete;
    TlsClient& operator=(const TlsClient&) = delete;

    // Drops any previous stream, then connects and handshakes. The handshake
    // gets whatever is left of the budget after the TCP connect.
    std::error_code connect(const tcp::endpoint& endpoint, duration timeout) {
        close();
        auto stream = std::make_shared<stream_type>(tcp::socket(strand_), sslContext_);
        const auto start = std::chrono::steady_clock::now();
        const auto budget = TimeoutConfig::sanitize(timeout);

        auto ec = with_deadline(strand_, budget, "tcp connect",
            [stream, endpoint, this](auto completion){
                asio::post(strand_, [stream, endpoint, completion]{
                    stream->lowest_layer().async_connect(endpoint, completion);
                });
            },
            [stream]{ cancelStream(*stream); }
        );
        if (ec) {
            closeOnStrand(stream);
            return ec;
        }

        const auto elapsed = std::chrono::duration_cast<duration>(
            std::chrono::steady_clock::now() - start);
        const auto remaining = budget > elapsed ? budget - elapsed : duration::zero();

        ec = with_deadline(strand_, remaining, "tls handshake",
            [stream, this](auto completion){
                asio::post(strand_, [stream, completion]{
                    stream->async_handshake(ssl::stream_base::client, completion);
                });
            },
            [stream]{ cancelStream(*stream); }
        );
        if (ec) {
            closeOnStrand(stream);
            return ec;
        }

        stream_ = std::move(stream);
        return {};
    }

    // The frame is shared with the operation so it outlives a timed-out call.
    std::error_code write_all(std::shared_ptr<const Bytes> data, duration timeout) {
        auto stream = stream_;
        if (!stream) {
            return std::make_error_code(std::errc::not_connected);
        }
        return with_deadline(strand_, TimeoutConfig::sanitize(timeout), "write",
            [stream, data, this](auto completion){
                asio::post(strand_, [stream, data, completion]{
                    asio::async_write(*stream, asio::buffer(*data),
                        [data, completion](const std::error_code& op_ec, std::size_t){
                            completion(op_ec);
                        });
                });
            },
            [stream]{ cancelStream(*stream); }
        );
    }

    std::error_code write_all(std::shared_ptr<const Bytes> data) {
        return write_all(std::move(data), writeTimeout_);
    }

    /**
     * @brief Start reading exactly @p n bytes into @p buf.
     *
     * @p handler is invoked on the strand with `(error_code, bytesTransferred)`.
     * The caller owns @p buf and must keep it alive until the handler runs.
     */
    template <typename Handler>
    void async_read_exact(void* buf, std::size_t n, Handler handler) {
        auto stream = stream_;
        if (!stream) {
            asio::post(strand_, [handler = std::move(handler)]() mutable {
                handler(std::make_error_code(std::errc::not_connected), std::size_t{0});
            });
            return;
        }
        asio::post(strand_, [stream, buf, n, handler = std::move(handler)]() mutable {
            asio::async_read(*stream, asio::buffer(buf, n),
                [stream, handler = std::move(handler)](const std::error_code& ec,
                                                       std::size_t transferred) mutable {
                    handler(ec, transferred);
                });
        });
    }

    /**
     * @brief Send TLS close_notify and wait (bounded) for the peer's reply.
     *
     * Peers that simply drop the socket, or never answer, are not treated as
     * errors.
     */
    std::error_code shutdown(duration timeout) {
        auto stream = stream_;
        if (!stream) {
            return {};
        }
        auto ec = with_deadline(strand_, TimeoutConfig::sanitize(timeout), "tls shutdown",
            [stream, this](auto completion){
                asio::post(strand_, [stream, completion]{
                    stream->async_shutdown(completion);
                });
            },
            [stream]{ cancelStream(*stream); }
        );
        if (ec == asio::error::eof || ec == ssl::error::stream_truncated ||
            ec == asio::error::timed_out || ec == asio::error::operation_aborted) {
            return {};
        }
        return ec;
    }

    void setLowLatency() {
        auto stream = stream_;
        if (!stream) return;
        std::error_code ec;
        stream->lowest_layer().set_option(tcp::no_delay(true), ec);
        stream->lowest_layer().set_option(asio::socket_base::keep_alive(true), ec);
    }

    bool is_open() const { return stream_ && stream_->lowest_layer().is_open(); }

    // Best-effort cancellation of pending operations, e.g. to unblock a
    // receive pump before teardown.
    void cancel() {
        if (auto stream = stream_) {
            asio::post(strand_, [stream]{ cancelStream(*stream); });
        }
    }

    // Returns the first error raised while closing the socket. Closing a
    // stream that is not open is not an error.
    std::error_code close() {
        auto stream = std::move(stream_);
        if (!stream) {
            return {};
        }
        logInfo("[TlsClient] close()\n");
        return closeOnStrand(stream);
    }

private:
    std::error_code closeOnStrand(const std::shared_ptr<stream_type>& stream) {
        return with_deadline(strand_, writeTimeout_, "close",
            [stream, this](auto completion){
                asio::post(strand_, [stream, completion]{
                    completion(closeStream(*stream));
                });
            },
            []{}
        );
    }

    static void cancelStream(stream_type& stream) {
        std::error_code ec;
        stream.lowest_layer().cancel(ec);
    }

    // Pattern: cancel -> shutdown -> close.
    static std::error_code closeStream(stream_type& stream) {
        auto& socket = stream.lowest_layer();
        if (!socket.is_open()) {
            return {};
        }
        std::error_code ec;
        socket.cancel(ec);
        socket.shutdown(tcp::socket::shutdown_both, ec);
        if (ec == asio::error::not_connected) {
            ec.clear();
        }
        std::error_code closeEc;
        socket.close(closeEc);
        return ec ? ec : closeEc;
    }

    std::shared_ptr<asio::io_context> io_;
    ssl::context sslContext_;
    asio::strand<asio::io_context::executor_type> strand_;
    std::shared_ptr<stream_type> stream_;
    duration writeTimeout_;
};

} // namespace castlink::net
