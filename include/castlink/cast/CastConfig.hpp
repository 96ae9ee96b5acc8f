#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace castlink::cast::config {

/**
 * @brief Constants that define Cast v2 networking and protocol behaviour.
 *
 * Keeping the values here prevents magic strings and timings from drifting
 * across translation units.
 */

// Networking ------------------------------------------------------------------
constexpr unsigned short CAST_PORT_DEFAULT = 8009;
constexpr std::chrono::milliseconds CAST_SHUTDOWN_TIMEOUT{250};

// Framing ---------------------------------------------------------------------
constexpr std::size_t CAST_FRAME_HEADER_SIZE = 4;            // big-endian payload length
constexpr std::uint32_t CAST_FRAME_MAX_SIZE = 64 * 1024;     // receivers reject larger messages

// Endpoints -------------------------------------------------------------------
constexpr const char* CAST_SENDER_ID = "sender-0";
constexpr const char* CAST_RECEIVER_ID = "receiver-0";
constexpr const char* CAST_DEFAULT_MEDIA_RECEIVER_APP_ID = "CC1AD845";

// Namespaces ------------------------------------------------------------------
constexpr const char* CAST_NS_CONNECTION = "urn:x-cast:com.google.cast.tp.connection";
constexpr const char* CAST_NS_HEARTBEAT = "urn:x-cast:com.google.cast.tp.heartbeat";
constexpr const char* CAST_NS_RECEIVER = "urn:x-cast:com.google.cast.receiver";
constexpr const char* CAST_NS_MEDIA = "urn:x-cast:com.google.cast.media";

} // namespace castlink::cast::config
