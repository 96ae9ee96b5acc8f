#pragma once

#include <atomic>
#include <chrono>

namespace castlink::net {

/**
 * @brief Process-wide fallback timeouts.
 *
 * - connect: TCP connect plus TLS handshake, for callers that do not pass
 *   their own budget.
 * - write: one blocking frame write, and the close path of `TlsClient`.
 * - heartbeat: idle time before a PING is sent (5 s).
 * - liveness: silence after which the peer is declared dead (15 s, three
 *   missed heartbeats).
 *
 * Values are read when a `TlsClient` is created or a connect starts; changing
 * them does not affect operations already in progress.
 */
class TimeoutConfig {
public:
    using duration = std::chrono::milliseconds;

    static void setConnectTimeout(duration timeout) {
        connectStorage().store(sanitize(timeout));
    }

    static duration connectTimeout() {
        return connectStorage().load();
    }

    static void setWriteTimeout(duration timeout) {
        writeStorage().store(sanitize(timeout));
    }

    static duration writeTimeout() {
        return writeStorage().load();
    }

    static void setHeartbeatInterval(duration interval) {
        heartbeatStorage().store(positive(interval));
    }

    static duration heartbeatInterval() {
        return heartbeatStorage().load();
    }

    static void setLivenessTimeout(duration timeout) {
        livenessStorage().store(positive(timeout));
    }

    static duration livenessTimeout() {
        return livenessStorage().load();
    }

    /** Snapshots every value and puts it back when it goes out of scope. */
    class ScopedOverride {
    public:
        ScopedOverride()
        : connect_(connectTimeout())
        , write_(writeTimeout())
        , heartbeat_(heartbeatInterval())
        , liveness_(livenessTimeout()) {}

        ScopedOverride(const ScopedOverride&) = delete;
        ScopedOverride& operator=(const ScopedOverride&) = delete;

        ~ScopedOverride() {
            setConnectTimeout(connect_);
            setWriteTimeout(write_);
            setHeartbeatInterval(heartbeat_);
            setLivenessTimeout(liveness_);
        }

    private:
        duration connect_;
        duration write_;
        duration heartbeat_;
        duration liveness_;
    };

    static duration sanitize(duration timeout) {
        return timeout.count() < 0 ? duration::zero() : timeout;
    }

private:
    // A zero interval would turn the dispatch worker into a busy loop.
    static duration positive(duration value) {
        return value.count() < 1 ? duration{1} : value;
    }

    static std::atomic<duration>& connectStorage() {
        static std::atomic<duration> timeout{duration{2000}};
        return timeout;
    }

    static std::atomic<duration>& writeStorage() {
        static std::atomic<duration> timeout{duration{1000}};
        return timeout;
    }

    static std::atomic<duration>& heartbeatStorage() {
        static std::atomic<duration> interval{duration{5000}};
        return interval;
    }

    static std::atomic<duration>& livenessStorage() {
        static std::atomic<duration> timeout{duration{15000}};
        return timeout;
    }
};

} // namespace castlink::net
