// CastChannel.hpp
// -----------------------------------------------------------------------------
// Encoding and decoding for the Cast v2 wire protocol.
// Responsibilities:
//   * Build one framed CastMessage per outbound intent, stamped with a
//     correlation id (the JSON `requestId`).
//   * Parse inbound frame bodies into typed CastEvent values.
//   * Keep protobuf and JSON details out of CastConnection and CastDevice.

#pragma once

#include "castlink/core/Expected.hpp"
#include "castlink/cast/CastConfig.hpp"
#include "castlink/cast/CastTypes.hpp"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace castlink::cast {

using castlink::expected;

/**
 * @brief One encoded outbound message.
 *
 * `frame` holds the 4-byte length prefix followed by the serialized envelope.
 * It is shared so a transport write can outlive the caller's copy.
 */
struct CastRequest {
    int requestId = 0;          // 0 for messages that expect no reply
    std::string nameSpace;
    std::string type;
    std::shared_ptr<const std::vector<std::uint8_t>> frame;
};

/**
 * @brief A decoded inbound message.
 *
 * Status payloads are unpacked into the optional state members; the raw
 * routing information is kept for logging and correlation.
 */
struct CastEvent {
    enum class Kind {
        ReceiverStatus,
        MediaStatus,
        Ping,
        Pong,
        Close,
        Rejected,   // LAUNCH_ERROR, INVALID_REQUEST, LOAD_FAILED, ...
        Other
    };

    Kind kind = Kind::Other;
    std::string sourceId;
    std::string destinationId;
    std::string nameSpace;
    std::string type;
    int requestId = 0;          // 0 when the message is unsolicited

    std::optional<VolumeState> volume;
    std::optional<AppState> app;
    std::optional<MediaState> media;
    std::string reason;         // set for Rejected
};

const char* toString(CastEvent::Kind kind);

class CastChannel {
public:
    explicit CastChannel(std::string senderId = config::CAST_SENDER_ID,
                         int firstRequestId = 1);

    CastChannel(const CastChannel&) = delete;
    CastChannel& operator=(const CastChannel&) = delete;

    // Platform plumbing ------------------------------------------------------
    expected<CastRequest> connect();
    expected<CastRequest> close();
    expected<CastRequest> ping();
    expected<CastRequest> pong();

    // Receiver namespace -----------------------------------------------------
    expected<CastRequest> getStatus();
    expected<CastRequest> launchApp(const std::string& appId);
    expected<CastRequest> setVolume(const VolumeState& volume);
    expected<CastRequest> setMuted(bool muted);

    // Media --------------------------------------------------------------------
    /// Open a virtual connection to an application's transport.
    expected<CastRequest> connectMedia(const std::string& transportId);
    expected<CastRequest> loadUrl(const std::string& transportId,
                                  const std::string& url,
                                  const std::string& mimeType,
                                  bool autoplay);

    /// Decode one frame body (the bytes after the length prefix).
    expected<CastEvent> decode(const std::uint8_t* data, std::size_t size) const;

    /// Validate a length prefix; 0 and anything above the frame limit are rejected.
    static expected<std::uint32_t> frameLength(const std::uint8_t* header, std::size_t size);

    const std::string& senderId() const { return sender; }

private:
    int nextRequestId();

    std::string sender;
    std::atomic<int> requestCounter;
};

} // namespace castlink::cast
