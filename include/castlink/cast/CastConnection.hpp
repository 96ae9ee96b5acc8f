#pragma once
#include "castlink/core/Error.hpp"
#include "castlink/core/Expected.hpp"
#include "castlink/net/NetConfig.hpp"
#include "castlink/net/TimeoutConfig.hpp"
#include "castlink/net/TlsClient.hpp"
#include "castlink/cast/CastChannel.hpp"
#include "castlink/cast/CastConfig.hpp"
#include "castlink/cast/CastTypes.hpp"

#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <thread>
#include <vector>

namespace castlink::cast {

using castlink::expected;

/**
 * @brief Transport lifecycle for one receiver.
 *
 * Owns the TLS stream, a receive pump and the dispatch worker thread.
 *
 * Threading model:
 * - The receive pump runs on the network strand. It only reads frames and
 *   queues them; it never decodes and never takes a device lock.
 * - The dispatch worker (one per live connection) decodes queued frames,
 *   answers heartbeats, matches replies to pending requests and hands state
 *   to the Listener. Apart from `connectionOpened()` it is the only thread
 *   that calls the Listener.
 * - `send()` may be called from any thread; writes are serialised.
 * - `connect()` / `disconnect()` are serialised against each other. Sinks are
 *   called from the caller thread or the worker and must not call back into
 *   this connection.
 */
class CastConnection {
public:
    /// Receives decoded state from the dispatch worker.
    class Listener {
    public:
        virtual ~Listener() = default;

        /// Transport is up; called on the connecting thread before the worker starts.
        virtual void connectionOpened() = 0;

        virtual void receiverStatusReceived(const CastEvent& event) = 0;
        virtual void mediaStatusReceived(const CastEvent& event) = 0;
        virtual void requestRejected(const CastEvent& event) = 0;

        /// The worker hit an unrecoverable error and is exiting.
        virtual void connectionLost(const std::error_code& ec) = 0;
    };

    explicit CastConnection(Listener& listener);
    ~CastConnection();

    // non-copyable / non-movable
    CastConnection(const CastConnection&) = delete;
    CastConnection& operator=(const CastConnection&) = delete;
    CastConnection(CastConnection&&) = delete;
    CastConnection& operator=(CastConnection&&) = delete;

    /**
     * @brief Open the TLS transport and start dispatching.
     *
     * TCP connect and TLS handshake share @p timeout. Heartbeat timings are
     * read from `net::TimeoutConfig` here. Fails with
     * `errc::out_of_order` when already connected; transport failures are
     * returned as-is (e.g. `asio::error::timed_out`).
     */
    expected<void> connect(const std::string& id,
                           const net::tcp::endpoint& endpoint,
                           net::duration timeout,
                           ErrorSink errors,
                           StateSink states);

    /**
     * @brief Stop dispatching and close the transport. Idempotent.
     *
     * Every teardown step runs even if an earlier one fails; all failures are
     * returned together.
     */
    expected<void, ErrorList> disconnect();

    /// Write one frame; `std::errc::not_connected` if the transport is down.
    expected<void> send(const CastRequest& request);

    bool isConnected() const { return connected.load(); }

    CastChannel& channel() { return castChannel; }

    /// Requests sent and still waiting for their reply.
    std::size_t pendingRequestCount() const;

private:
    // Frames travel from the receive pump to the worker through the inbox.
    // Pump handlers hold it by shared_ptr so they never touch a destroyed
    // connection.
    struct Inbox {
        struct Item {
            std::vector<std::uint8_t> body;
            std::error_code error;
        };

        std::mutex m;
        std::condition_variable cv;
        std::deque<Item> items;
        bool running = false;
        bool pumpActive = false;
    };

    struct ReceiveBuffer {
        std::array<std::uint8_t, config::CAST_FRAME_HEADER_SIZE> header{};
        std::vector<std::uint8_t> body;
    };

    void run();
    void startWorker();
    void stopWorker();

    void receiveHeader(std::shared_ptr<Inbox> inbox, std::shared_ptr<ReceiveBuffer> buffer);
    void receiveBody(std::shared_ptr<Inbox> inbox, std::shared_ptr<ReceiveBuffer> buffer);
    static void finishReceive(Inbox& inbox, const std::error_code& ec);
    void stopReceive();

    void dispatch(const CastEvent& event);
    void matchReply(const CastEvent& event);
    void handleNetworkFailure(std::string_view where, const std::error_code& ec);

    expected<void> writeFrame(const CastRequest& request);
    void pushError(const std::error_code& ec, std::string context);
    void pushState(ConnectionState state);

    Listener& listener;
    CastChannel castChannel;
    net::TlsClient tlsClient;

    std::string deviceId;
    ErrorSink errorSink;
    StateSink stateSink;

    std::mutex lifecycleMutex;
    std::mutex writeMutex;
    std::atomic<bool> connected{false};

    std::shared_ptr<Inbox> inbox;
    std::thread worker;
    std::chrono::steady_clock::time_point lastReceiveTime{};
    net::duration heartbeatInterval{};
    net::duration livenessTimeout{};

    mutable std::mutex pendingMutex;
    std::map<int, std::string> pendingRequests;
};

} // namespace castlink::cast
