// CastChannel.cpp
// -----------------------------------------------------------------------------
// Implements the Cast v2 encoders and the inbound decoder declared in
// CastChannel.hpp. Envelopes are protobuf CastMessage values; payloads are
// compact JSON produced and parsed with jsoncpp.

#include "castlink/cast/CastChannel.hpp"

#include "castlink/cast/ByteBuffer.hpp"
#include "castlink/core/Error.hpp"
#include "castlink/log/Log.hpp"

#include "cast_channel.pb.h"

#include <json/json.h>

#include <memory>
#include <utility>

namespace castlink::cast {

using castlink::unexpected;

namespace {

std::string toJson(const Json::Value& value) {
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    return Json::writeString(builder, value);
}

expected<CastRequest> encode(const std::string& source,
                             const std::string& destination,
                             const char* nameSpace,
                             const Json::Value& payload,
                             int requestId) {
    proto::CastMessage message;
    message.set_protocol_version(proto::CastMessage::CASTV2_1_0);
    message.set_source_id(source);
    message.set_destination_id(destination);
    message.set_namespace_(nameSpace);
    message.set_payload_type(proto::CastMessage::STRING);
    message.set_payload_utf8(toJson(payload));

    std::string body;
    if (!message.SerializeToString(&body)) {
        return unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    if (body.size() > config::CAST_FRAME_MAX_SIZE) {
        logError("[CastChannel] message of ", body.size(), " bytes exceeds frame limit\n");
        return unexpected(std::make_error_code(std::errc::message_size));
    }

    ByteBuffer frame;
    frame.appendUInt32BE(static_cast<std::uint32_t>(body.size()));
    frame.appendBytes(body);

    CastRequest request;
    request.requestId = requestId;
    request.nameSpace = nameSpace;
    request.type = payload["type"].asString();
    request.frame = std::make_shared<const std::vector<std::uint8_t>>(frame.release());
    return request;
}

Json::Value typed(const char* type, int requestId) {
    Json::Value payload(Json::objectValue);
    payload["type"] = type;
    if (requestId != 0) {
        payload["requestId"] = requestId;
    }
    return payload;
}

std::string stringMember(const Json::Value& object, const char* key) {
    const auto& value = object[key];
    return value.isString() ? value.asString() : std::string{};
}

std::optional<VolumeState> parseVolume(const Json::Value& volume) {
    if (!volume.isObject()) {
        return std::nullopt;
    }
    VolumeState state;
    if (volume["level"].isNumeric()) {
        state.level = static_cast<float>(volume["level"].asDouble());
    }
    if (volume["muted"].isBool()) {
        state.muted = volume["muted"].asBool();
    }
    return state;
}

// A status with no applications still tells us that nothing addressable is
// running, so it yields an empty AppState rather than no AppState.
AppState parseApplications(const Json::Value& applications) {
    AppState app;
    if (!applications.isArray() || applications.empty()) {
        return app;
    }
    const auto& first = applications[0u];
    app.appId = stringMember(first, "appId");
    app.displayName = stringMember(first, "displayName");
    app.transportId = stringMember(first, "transportId");
    app.sessionId = stringMember(first, "sessionId");
    app.statusText = stringMember(first, "statusText");
    return app;
}

MediaState parseMediaStatus(const Json::Value& status) {
    MediaState media;
    media.playerState = "IDLE";
    if (!status.isArray() || status.empty()) {
        return media;
    }
    const auto& first = status[0u];
    if (first["mediaSessionId"].isIntegral()) {
        media.mediaSessionId = first["mediaSessionId"].asInt64();
    }
    if (first["playerState"].isString()) {
        media.playerState = first["playerState"].asString();
    }
    if (first["currentTime"].isNumeric()) {
        media.currentTime = first["currentTime"].asDouble();
    }
    if (first["media"].isObject()) {
        media.contentId = stringMember(first["media"], "contentId");
    }
    return media;
}

bool isRejection(const std::string& type) {
    return type == "LAUNCH_ERROR"
        || type == "INVALID_REQUEST"
        || type == "LOAD_FAILED"
        || type == "LOAD_CANCELLED"
        || type == "INVALID_PLAYER_STATE";
}

std::error_code decodeError() {
    return make_error_code(errc::protocol_decode);
}

} // namespace

const char* toString(CastEvent::Kind kind) {
    switch (kind) {
        case CastEvent::Kind::ReceiverStatus: return "receiver-status";
        case CastEvent::Kind::MediaStatus:    return "media-status";
        case CastEvent::Kind::Ping:           return "ping";
        case CastEvent::Kind::Pong:           return "pong";
        case CastEvent::Kind::Close:          return "close";
        case CastEvent::Kind::Rejected:       return "rejected";
        case CastEvent::Kind::Other:          return "other";
    }
    return "unknown";
}

CastChannel::CastChannel(std::string senderId, int firstRequestId)
: sender(std::move(senderId))
, requestCounter(firstRequestId < 1 ? 1 : firstRequestId)
{}

int CastChannel::nextRequestId() {
    return requestCounter.fetch_add(1, std::memory_order_relaxed);
}

expected<CastRequest> CastChannel::connect() {
    return encode(sender, config::CAST_RECEIVER_ID, config::CAST_NS_CONNECTION,
                  typed("CONNECT", 0), 0);
}

expected<CastRequest> CastChannel::close() {
    return encode(sender, config::CAST_RECEIVER_ID, config::CAST_NS_CONNECTION,
                  typed("CLOSE", 0), 0);
}

expected<CastRequest> CastChannel::ping() {
    return encode(sender, config::CAST_RECEIVER_ID, config::CAST_NS_HEARTBEAT,
                  typed("PING", 0), 0);
}

expected<CastRequest> CastChannel::pong() {
    return encode(sender, config::CAST_RECEIVER_ID, config::CAST_NS_HEARTBEAT,
                  typed("PONG", 0), 0);
}

expected<CastRequest> CastChannel::getStatus() {
    const int id = nextRequestId();
    return encode(sender, config::CAST_RECEIVER_ID, config::CAST_NS_RECEIVER,
                  typed("GET_STATUS", id), id);
}

expected<CastRequest> CastChannel::launchApp(const std::string& appId) {
    if (appId.empty()) {
        return unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    const int id = nextRequestId();
    auto payload = typed("LAUNCH", id);
    payload["appId"] = appId;
    return encode(sender, config::CAST_RECEIVER_ID, config::CAST_NS_RECEIVER, payload, id);
}

expected<CastRequest> CastChannel::setVolume(const VolumeState& volume) {
    const int id = nextRequestId();
    auto payload = typed("SET_VOLUME", id);
    payload["volume"]["level"] = static_cast<double>(volume.level);
    payload["volume"]["muted"] = volume.muted;
    return encode(sender, config::CAST_RECEIVER_ID, config::CAST_NS_RECEIVER, payload, id);
}

expected<CastRequest> CastChannel::setMuted(bool muted) {
    const int id = nextRequestId();
    auto payload = typed("SET_VOLUME", id);
    payload["volume"]["muted"] = muted;
    return encode(sender, config::CAST_RECEIVER_ID, config::CAST_NS_RECEIVER, payload, id);
}

expected<CastRequest> CastChannel::connectMedia(const std::string& transportId) {
    if (transportId.empty()) {
        return unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    const int id = nextRequestId();
    return encode(sender, transportId, config::CAST_NS_CONNECTION,
                  typed("CONNECT", id), id);
}

expected<CastRequest> CastChannel::loadUrl(const std::string& transportId,
                                           const std::string& url,
                                           const std::string& mimeType,
                                           bool autoplay) {
    if (transportId.empty() || url.empty()) {
        return unexpected(std::make_error_code(std::errc::invalid_argument));
    }
    const int id = nextRequestId();
    auto payload = typed("LOAD", id);
    payload["autoplay"] = autoplay;
    payload["media"]["contentId"] = url;
    payload["media"]["contentType"] = mimeType;
    payload["media"]["streamType"] = "BUFFERED";
    return encode(sender, transportId, config::CAST_NS_MEDIA, payload, id);
}

expected<std::uint32_t> CastChannel::frameLength(const std::uint8_t* header, std::size_t size) {
    if (!header || size < config::CAST_FRAME_HEADER_SIZE) {
        return unexpected(decodeError());
    }
    const auto length = ByteBuffer::readUInt32BE(header);
    if (length == 0 || length > config::CAST_FRAME_MAX_SIZE) {
        logError("[CastChannel] invalid frame length ", length, "\n");
        return unexpected(decodeError());
    }
    return length;
}

expected<CastEvent> CastChannel::decode(const std::uint8_t* data, std::size_t size) const {
    if (!data || size == 0) {
        return unexpected(decodeError());
    }

    proto::CastMessage message;
    if (!message.ParseFromArray(data, static_cast<int>(size))) {
        logError("[CastChannel] failed to parse envelope (", size, " bytes)\n");
        return unexpected(decodeError());
    }

    CastEvent event;
    event.sourceId = message.source_id();
    event.destinationId = message.destination_id();
    event.nameSpace = message.namespace_();

    if (message.payload_type() != proto::CastMessage::STRING) {
        // Binary payloads belong to device authentication, which is not used.
        return event;
    }

    Json::Value payload;
    Json::CharReaderBuilder builder;
    std::string errors;
    const std::string& text = message.payload_utf8();
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    if (!reader->parse(text.data(), text.data() + text.size(), &payload, &errors)
        || !payload.isObject()) {
        logError("[CastChannel] bad JSON payload on ", event.nameSpace, ": ", errors, "\n");
        return unexpected(decodeError());
    }

    if (!payload["type"].isString()) {
        logError("[CastChannel] payload without type on ", event.nameSpace, "\n");
        return unexpected(decodeError());
    }
    event.type = payload["type"].asString();
    if (payload["requestId"].isIntegral()) {
        event.requestId = payload["requestId"].asInt();
    }

    if (event.nameSpace == config::CAST_NS_HEARTBEAT) {
        if (event.type == "PING") event.kind = CastEvent::Kind::Ping;
        else if (event.type == "PONG") event.kind = CastEvent::Kind::Pong;
    } else if (event.nameSpace == config::CAST_NS_CONNECTION) {
        if (event.type == "CLOSE") event.kind = CastEvent::Kind::Close;
    } else if (event.nameSpace == config::CAST_NS_RECEIVER) {
        if (event.type == "RECEIVER_STATUS") {
            const auto& status = payload["status"];
            if (!status.isObject()) {
                logError("[CastChannel] RECEIVER_STATUS without status object\n");
                return unexpected(decodeError());
            }
            event.kind = CastEvent::Kind::ReceiverStatus;
            event.volume = parseVolume(status["volume"]);
            event.app = parseApplications(status["applications"]);
        }
    } else if (event.nameSpace == config::CAST_NS_MEDIA) {
        if (event.type == "MEDIA_STATUS") {
            event.kind = CastEvent::Kind::MediaStatus;
            event.media = parseMediaStatus(payload["status"]);
        }
    }

    if (event.kind == CastEvent::Kind::Other && isRejection(event.type)) {
        event.kind = CastEvent::Kind::Rejected;
        event.reason = stringMember(payload, "reason");
        if (event.reason.empty()) {
            event.reason = event.type;
        }
    }

    return event;
}

} // namespace castlink::cast
