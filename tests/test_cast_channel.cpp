#include "castlink/cast/CastChannel.hpp"
#include "castlink/core/Error.hpp"

#include "MockReceiver.hpp"
#include "TestSupport.hpp"

#include "cast_channel.pb.h"

#include <json/json.h>

#include <array>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

using namespace castlink::cast;
using castlink::test::MockReceiver;

namespace {

struct Unwrapped {
    bool ok = false;
    std::uint32_t length = 0;
    castlink::proto::CastMessage message;
    Json::Value payload;
};

Unwrapped unwrap(const CastRequest& request) {
    Unwrapped out;
    if (!request.frame || request.frame->size() < config::CAST_FRAME_HEADER_SIZE) {
        return out;
    }
    const auto& bytes = *request.frame;
    out.length = ByteBuffer::readUInt32BE(bytes.data());
    if (out.length + config::CAST_FRAME_HEADER_SIZE != bytes.size()) {
        return out;
    }
    if (!out.message.ParseFromArray(bytes.data() + config::CAST_FRAME_HEADER_SIZE,
                                    static_cast<int>(out.length))) {
        return out;
    }
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    const std::string& text = out.message.payload_utf8();
    std::string errors;
    out.ok = reader->parse(text.data(), text.data() + text.size(), &out.payload, &errors);
    return out;
}

expected<CastEvent> decodeFrame(const CastChannel& channel, const std::vector<std::uint8_t>& frame) {
    return channel.decode(frame.data() + config::CAST_FRAME_HEADER_SIZE,
                          frame.size() - config::CAST_FRAME_HEADER_SIZE);
}

std::vector<std::uint8_t> receiverFrame(const char* nameSpace, const std::string& payload) {
    return MockReceiver::frame(config::CAST_RECEIVER_ID, nameSpace, payload);
}

} // namespace

static void testEnvelope() {
    CastChannel channel;
    auto request = channel.getStatus();
    ASSERT_TRUE(request.has_value(), "GET_STATUS encodes");

    auto frame = unwrap(*request);
    ASSERT_TRUE(frame.ok, "frame parses back");
    ASSERT_EQ(frame.message.source_id(), std::string("sender-0"), "source id");
    ASSERT_EQ(frame.message.destination_id(), std::string("receiver-0"), "destination id");
    ASSERT_EQ(frame.message.namespace_(), std::string(config::CAST_NS_RECEIVER), "receiver namespace");
    ASSERT_TRUE(frame.message.payload_type() == castlink::proto::CastMessage::STRING, "string payload");
    ASSERT_EQ(frame.payload["type"].asString(), std::string("GET_STATUS"), "payload type");
    ASSERT_EQ(frame.payload["requestId"].asInt(), request->requestId, "requestId in payload");
    ASSERT_EQ(request->type, std::string("GET_STATUS"), "request type");
}

static void testRequestIdsIncrease() {
    CastChannel channel("sender-0", 7);
    auto first = channel.getStatus();
    auto second = channel.launchApp(config::CAST_DEFAULT_MEDIA_RECEIVER_APP_ID);
    ASSERT_TRUE(first && second, "both encode");
    ASSERT_EQ(first->requestId, 7, "first id honours the start value");
    ASSERT_EQ(second->requestId, 8, "ids increase by one");

    // Plumbing messages are not correlated and do not consume ids.
    auto ping = channel.ping();
    auto hello = channel.connect();
    ASSERT_TRUE(ping && hello, "plumbing encodes");
    ASSERT_EQ(ping->requestId, 0, "PING carries no id");
    ASSERT_EQ(hello->requestId, 0, "CONNECT carries no id");
    ASSERT_TRUE(unwrap(*ping).payload["requestId"].isNull(), "no requestId key in PING");
    ASSERT_EQ(channel.getStatus()->requestId, 9, "next id unaffected by plumbing");
}

static void testVolumeCanonicalForm() {
    // A negative level and an explicit zero are the same request on the wire.
    CastChannel a;
    CastChannel b;
    auto negative = a.setVolume(canonicalVolume(-0.3f));
    auto zero = b.setVolume(canonicalVolume(0.0f));
    ASSERT_TRUE(negative && zero, "volume encodes");
    ASSERT_TRUE(*negative->frame == *zero->frame, "byte-identical frames for -0.3 and 0");

    auto payload = unwrap(*zero).payload;
    ASSERT_EQ(payload["volume"]["level"].asDouble(), 0.0, "level 0");
    ASSERT_TRUE(payload["volume"]["muted"].asBool(), "silence is sent muted");

    auto loud = canonicalVolume(1.7f);
    ASSERT_EQ(loud.level, 1.0f, "clamped to 1");
    ASSERT_TRUE(!loud.muted, "1.0 is not muted");

    CastChannel c;
    auto clamped = unwrap(*c.setVolume(loud)).payload;
    ASSERT_EQ(clamped["volume"]["level"].asDouble(), 1.0, "level 1 on the wire");
    ASSERT_TRUE(!clamped["volume"]["muted"].asBool(), "unmuted on the wire");

    auto half = canonicalVolume(0.5f);
    ASSERT_EQ(half.level, 0.5f, "in-range level kept");
    ASSERT_TRUE(!half.muted, "in-range level unmuted");
}

static void testMuteOnly() {
    CastChannel channel;
    auto payload = unwrap(*channel.setMuted(true)).payload;
    ASSERT_EQ(payload["type"].asString(), std::string("SET_VOLUME"), "mute is SET_VOLUME");
    ASSERT_TRUE(payload["volume"]["muted"].asBool(), "muted flag");
    ASSERT_TRUE(payload["volume"]["level"].isNull(), "level untouched by mute");
}

static void testLaunchAndLoad() {
    CastChannel channel;
    auto launch = channel.launchApp("CC1AD845");
    ASSERT_TRUE(launch.has_value(), "launch encodes");
    ASSERT_EQ(unwrap(*launch).payload["appId"].asString(), std::string("CC1AD845"), "appId");

    auto empty = channel.launchApp("");
    ASSERT_TRUE(!empty && empty.error() == std::errc::invalid_argument, "empty app id rejected");

    auto attach = channel.connectMedia("web-5");
    ASSERT_TRUE(attach.has_value(), "connectMedia encodes");
    auto attachFrame = unwrap(*attach);
    ASSERT_EQ(attachFrame.message.destination_id(), std::string("web-5"), "CONNECT goes to transport");
    ASSERT_EQ(attachFrame.message.namespace_(), std::string(config::CAST_NS_CONNECTION), "connection ns");

    auto load = channel.loadUrl("web-5", "http://example.com/a.mp4", "video/mp4", true);
    ASSERT_TRUE(load.has_value(), "load encodes");
    auto loadFrame = unwrap(*load);
    ASSERT_EQ(loadFrame.message.destination_id(), std::string("web-5"), "LOAD goes to transport");
    ASSERT_EQ(loadFrame.message.namespace_(), std::string(config::CAST_NS_MEDIA), "media ns");
    ASSERT_EQ(loadFrame.payload["media"]["contentId"].asString(),
              std::string("http://example.com/a.mp4"), "content id");
    ASSERT_EQ(loadFrame.payload["media"]["contentType"].asString(), std::string("video/mp4"), "mime");
    ASSERT_EQ(loadFrame.payload["media"]["streamType"].asString(), std::string("BUFFERED"), "stream type");
    ASSERT_TRUE(loadFrame.payload["autoplay"].asBool(), "autoplay");

    ASSERT_TRUE(!channel.loadUrl("", "http://x", "video/mp4", true), "load without transport rejected");
    ASSERT_TRUE(!channel.connectMedia(""), "attach without transport rejected");
}

static void testDecodeReceiverStatus() {
    CastChannel channel;
    const std::string status =
        "{\"volume\":{\"level\":0.25,\"muted\":true},"
        "\"applications\":[{\"appId\":\"CC1AD845\",\"displayName\":\"Default Media Receiver\","
        "\"transportId\":\"web-7\",\"sessionId\":\"s-1\",\"statusText\":\"Ready\"}]}";
    auto event = decodeFrame(channel,
        receiverFrame(config::CAST_NS_RECEIVER, MockReceiver::statusPayload(42, status)));

    ASSERT_TRUE(event.has_value(), "status decodes");
    ASSERT_TRUE(event->kind == CastEvent::Kind::ReceiverStatus, "receiver status kind");
    ASSERT_EQ(event->requestId, 42, "requestId echoed");
    ASSERT_TRUE(event->volume.has_value(), "volume present");
    ASSERT_EQ(event->volume->level, 0.25f, "volume level");
    ASSERT_TRUE(event->volume->muted, "volume muted");
    ASSERT_TRUE(event->app.has_value(), "app present");
    ASSERT_EQ(event->app->appId, std::string("CC1AD845"), "app id");
    ASSERT_EQ(event->app->displayName, std::string("Default Media Receiver"), "display name");
    ASSERT_EQ(event->app->transportId, std::string("web-7"), "transport id");
    ASSERT_TRUE(event->app->hasTransport(), "transport usable");

    // No applications: an app state that says nothing is running.
    auto idle = decodeFrame(channel, receiverFrame(config::CAST_NS_RECEIVER,
        MockReceiver::statusPayload(0, "{\"volume\":{\"level\":1.0,\"muted\":false}}")));
    ASSERT_TRUE(idle.has_value(), "idle status decodes");
    ASSERT_TRUE(idle->app.has_value() && !idle->app->hasTransport(), "idle app without transport");
    ASSERT_EQ(idle->requestId, 0, "unsolicited status");
}

static void testDecodeMediaStatus() {
    CastChannel channel;
    auto event = decodeFrame(channel, receiverFrame(config::CAST_NS_MEDIA,
        "{\"type\":\"MEDIA_STATUS\",\"requestId\":3,\"status\":[{\"mediaSessionId\":11,"
        "\"playerState\":\"PLAYING\",\"currentTime\":12.5,\"media\":{\"contentId\":\"http://x/y.mp3\"}}]}"));
    ASSERT_TRUE(event.has_value(), "media status decodes");
    ASSERT_TRUE(event->kind == CastEvent::Kind::MediaStatus, "media status kind");
    ASSERT_TRUE(event->media.has_value(), "media present");
    ASSERT_EQ(event->media->mediaSessionId, static_cast<std::int64_t>(11), "media session");
    ASSERT_EQ(event->media->playerState, std::string("PLAYING"), "player state");
    ASSERT_EQ(event->media->contentId, std::string("http://x/y.mp3"), "content id");
    ASSERT_EQ(event->media->currentTime, 12.5, "current time");

    auto empty = decodeFrame(channel, receiverFrame(config::CAST_NS_MEDIA,
        "{\"type\":\"MEDIA_STATUS\",\"status\":[]}"));
    ASSERT_TRUE(empty && empty->media && empty->media->playerState == "IDLE", "empty status is idle");
}

static void testDecodePlumbing() {
    CastChannel channel;
    auto ping = decodeFrame(channel, receiverFrame(config::CAST_NS_HEARTBEAT, "{\"type\":\"PING\"}"));
    ASSERT_TRUE(ping && ping->kind == CastEvent::Kind::Ping, "ping");

    auto pong = decodeFrame(channel, receiverFrame(config::CAST_NS_HEARTBEAT, "{\"type\":\"PONG\"}"));
    ASSERT_TRUE(pong && pong->kind == CastEvent::Kind::Pong, "pong");

    auto close = decodeFrame(channel, receiverFrame(config::CAST_NS_CONNECTION, "{\"type\":\"CLOSE\"}"));
    ASSERT_TRUE(close && close->kind == CastEvent::Kind::Close, "close");
    ASSERT_EQ(close->sourceId, std::string("receiver-0"), "close source");

    auto other = decodeFrame(channel, receiverFrame(config::CAST_NS_RECEIVER,
        "{\"type\":\"LAUNCH_STATUS\",\"requestId\":4}"));
    ASSERT_TRUE(other && other->kind == CastEvent::Kind::Other, "unknown types are Other");
}

static void testDecodeRejection() {
    CastChannel channel;
    auto rejected = decodeFrame(channel, receiverFrame(config::CAST_NS_RECEIVER,
        "{\"type\":\"LAUNCH_ERROR\",\"requestId\":5,\"reason\":\"NOT_FOUND\"}"));
    ASSERT_TRUE(rejected.has_value(), "rejection decodes");
    ASSERT_TRUE(rejected->kind == CastEvent::Kind::Rejected, "rejected kind");
    ASSERT_EQ(rejected->requestId, 5, "rejected id");
    ASSERT_EQ(rejected->reason, std::string("NOT_FOUND"), "reason");

    auto failed = decodeFrame(channel, receiverFrame(config::CAST_NS_MEDIA,
        "{\"type\":\"LOAD_FAILED\",\"requestId\":6}"));
    ASSERT_TRUE(failed && failed->kind == CastEvent::Kind::Rejected, "load failure rejected");
    ASSERT_EQ(failed->reason, std::string("LOAD_FAILED"), "reason defaults to type");
}

static void testDecodeMalformed() {
    CastChannel channel;
    const std::array<std::uint8_t, 5> garbage{0xff, 0xff, 0xff, 0xff, 0xff};
    auto notProto = channel.decode(garbage.data(), garbage.size());
    ASSERT_TRUE(!notProto && notProto.error() == castlink::errc::protocol_decode, "garbage rejected");

    ASSERT_TRUE(!channel.decode(nullptr, 0), "empty body rejected");

    auto badJson = decodeFrame(channel, receiverFrame(config::CAST_NS_RECEIVER, "{not json"));
    ASSERT_TRUE(!badJson && badJson.error() == castlink::errc::protocol_decode, "bad JSON rejected");

    auto noType = decodeFrame(channel, receiverFrame(config::CAST_NS_RECEIVER, "{\"requestId\":1}"));
    ASSERT_TRUE(!noType, "payload without type rejected");

    auto noStatus = decodeFrame(channel, receiverFrame(config::CAST_NS_RECEIVER,
        "{\"type\":\"RECEIVER_STATUS\",\"requestId\":1}"));
    ASSERT_TRUE(!noStatus, "RECEIVER_STATUS without status rejected");
}

static void testFrameLength() {
    const std::array<std::uint8_t, 4> ok{0x00, 0x00, 0x01, 0x00};
    auto length = CastChannel::frameLength(ok.data(), ok.size());
    ASSERT_TRUE(length.has_value(), "valid length");
    ASSERT_EQ(*length, static_cast<std::uint32_t>(256), "big-endian length");

    const std::array<std::uint8_t, 4> zero{0, 0, 0, 0};
    ASSERT_TRUE(!CastChannel::frameLength(zero.data(), zero.size()), "zero length rejected");

    const std::array<std::uint8_t, 4> huge{0x00, 0x01, 0x00, 0x01};
    ASSERT_TRUE(!CastChannel::frameLength(huge.data(), huge.size()), "oversized length rejected");

    ASSERT_TRUE(!CastChannel::frameLength(ok.data(), 2), "short header rejected");
}

static void testErrorCategory() {
    std::error_code ec = castlink::errc::out_of_order;
    ASSERT_EQ(std::string(ec.category().name()), std::string("castlink"), "category name");
    ASSERT_TRUE(ec == castlink::errc::out_of_order, "enum comparison");
    ASSERT_TRUE(!ec.message().empty(), "message text");

    castlink::ErrorList list;
    list.append("ignored", std::error_code{});
    ASSERT_TRUE(list.empty(), "empty codes are not recorded");
    list.append("close message", std::make_error_code(std::errc::broken_pipe));
    list.append("socket close", castlink::make_error_code(castlink::errc::protocol_decode));
    ASSERT_EQ(list.size(), static_cast<std::size_t>(2), "two errors kept");
    ASSERT_TRUE(list.first() == std::errc::broken_pipe, "first error preserved");
    ASSERT_TRUE(list.message().find("; ") != std::string::npos, "messages joined");
}

int main() {
    testEnvelope();
    testRequestIdsIncrease();
    testVolumeCanonicalForm();
    testMuteOnly();
    testLaunchAndLoad();
    testDecodeReceiverStatus();
    testDecodeMediaStatus();
    testDecodePlumbing();
    testDecodeRejection();
    testDecodeMalformed();
    testFrameLength();
    testErrorCategory();

    return finishTests("CastChannel");
}
