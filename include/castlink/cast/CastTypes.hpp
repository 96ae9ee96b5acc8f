#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <system_error>

namespace castlink::cast {

enum class ConnectionState : std::uint8_t {
    Disconnected = 0,
    Connecting = 1,
    Connected = 2
};

const char* toString(ConnectionState state);

/**
 * @brief Receiver volume. `level` is in [0, 1].
 *
 * Silence is requested in the canonical form `{0, true}`; see canonicalVolume().
 */
struct VolumeState {
    float level = 0.0f;
    bool muted = false;

    std::string describe() const;
};

bool operator==(const VolumeState& a, const VolumeState& b);
bool operator!=(const VolumeState& a, const VolumeState& b);

/// Clamp @p level to [0, 1]; a clamped level of exactly 0 becomes `{0, muted}`.
VolumeState canonicalVolume(float level);

/**
 * @brief The application currently running on the receiver.
 *
 * An AppState with an empty `transportId` means the receiver reported no
 * addressable application; media cannot be loaded until one is launched.
 */
struct AppState {
    std::string appId;
    std::string displayName;
    std::string transportId;
    std::string sessionId;
    std::string statusText;

    bool hasTransport() const { return !transportId.empty(); }
    std::string describe() const;
};

bool operator==(const AppState& a, const AppState& b);
bool operator!=(const AppState& a, const AppState& b);

struct MediaState {
    std::int64_t mediaSessionId = 0;
    std::string playerState;        // IDLE, BUFFERING, PLAYING, PAUSED
    std::string contentId;
    double currentTime = 0.0;

    std::string describe() const;
};

bool operator==(const MediaState& a, const MediaState& b);
bool operator!=(const MediaState& a, const MediaState& b);

/// Aspects of the cached state touched by a merge.
enum class ChangeFlags : std::uint8_t {
    None = 0,
    Volume = 1u << 0,
    App = 1u << 1,
    Media = 1u << 2
};

constexpr ChangeFlags operator|(ChangeFlags a, ChangeFlags b) {
    return static_cast<ChangeFlags>(static_cast<std::uint8_t>(a) | static_cast<std::uint8_t>(b));
}

constexpr ChangeFlags operator&(ChangeFlags a, ChangeFlags b) {
    return static_cast<ChangeFlags>(static_cast<std::uint8_t>(a) & static_cast<std::uint8_t>(b));
}

inline ChangeFlags& operator|=(ChangeFlags& a, ChangeFlags b) {
    a = a | b;
    return a;
}

constexpr bool any(ChangeFlags flags) { return flags != ChangeFlags::None; }

// Sinks -----------------------------------------------------------------------

struct DeviceError {
    std::string deviceId;
    std::error_code code;
    std::string context;
};

struct StateChange {
    std::string deviceId;
    ConnectionState state = ConnectionState::Disconnected;
};

/// Receives transport and protocol errors. May be empty.
using ErrorSink = std::function<void(const DeviceError&)>;

/// Receives connection lifecycle transitions. May be empty.
using StateSink = std::function<void(const StateChange&)>;

} // namespace castlink::cast
