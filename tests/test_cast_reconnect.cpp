#include "castlink/cast/CastDevice.hpp"
#include "castlink/core/Error.hpp"

#include "MockReceiver.hpp"
#include "TestSupport.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <thread>

using namespace castlink::cast;
using namespace std::chrono_literals;
using castlink::test::MockReceiver;
using castlink::test::SilentTcpServer;
using castlink::test::SinkRecorder;

namespace ip = castlink::net::asio::ip;

namespace {

std::unique_ptr<CastDevice> makeDevice(unsigned short port) {
    DeviceRecord record;
    record.id = "reconnect-test";
    record.friendlyName = "Reconnect";
    record.port = port;
    record.addresses = {ip::make_address("127.0.0.1")};
    auto device = CastDevice::create(record);
    if (!device) {
        return nullptr;
    }
    return std::move(*device);
}

} // namespace

static void testHandshakeTimeout() {
    SilentTcpServer server;
    SinkRecorder sinks;
    auto device = makeDevice(server.port());
    ASSERT_TRUE(device != nullptr, "device created");

    const auto start = std::chrono::steady_clock::now();
    auto result = device->connect(300ms, sinks.errorSink(), sinks.stateSink());
    const auto elapsed = std::chrono::steady_clock::now() - start;

    ASSERT_TRUE(!result, "connect to a silent peer fails");
    ASSERT_TRUE(elapsed < 2s, "failure within the timeout budget");
    ASSERT_TRUE(device->state() == ConnectionState::Disconnected, "back to disconnected");
    ASSERT_TRUE(sinks.lastStateIs(ConnectionState::Disconnected), "Disconnected reported");
    ASSERT_TRUE(device->disconnect().has_value(), "disconnect after failed connect");
}

static void testTransportDrop() {
    MockReceiver mock;
    mock.setAutoReplyStatus(true);
    SinkRecorder sinks;
    auto device = makeDevice(mock.port());
    ASSERT_TRUE(device != nullptr, "device created");

    ASSERT_TRUE(device->connect(2000ms, sinks.errorSink(), sinks.stateSink()).has_value(), "connect");
    ASSERT_TRUE(waitUntil([&]{ return mock.hasClient(); }), "receiver sees the client");
    ASSERT_TRUE(device->updateStatus().has_value(), "request status");
    ASSERT_TRUE(waitUntil([&]{ return device->volume().has_value(); }), "status merged");

    mock.dropClient();
    ASSERT_TRUE(waitUntil([&]{ return device->state() == ConnectionState::Disconnected; }),
                "drop detected");
    ASSERT_TRUE(waitUntil([&]{ return sinks.errorCount() >= 1; }), "drop reported to the error sink");
    ASSERT_TRUE(waitUntil([&]{ return sinks.lastStateIs(ConnectionState::Disconnected); }),
                "Disconnected reported");
    ASSERT_TRUE(device->updateStatus().error() == castlink::errc::out_of_order,
                "requests refused after the drop");
    ASSERT_TRUE(device->volume().has_value(), "last known volume kept after the drop");

    // A fresh connect recovers without an explicit disconnect.
    sinks.clear();
    ASSERT_TRUE(device->connect(2000ms, sinks.errorSink(), sinks.stateSink()).has_value(), "reconnect");
    ASSERT_TRUE(device->state() == ConnectionState::Connected, "connected again");
    ASSERT_TRUE(!device->volume() && !device->app(), "caches reset by the new session");
    ASSERT_TRUE(waitUntil([&]{ return mock.connectionsAccepted() == 2; }), "second connection accepted");
    ASSERT_TRUE(device->disconnect().has_value(), "disconnect");
}

static void testFailedReconnectKeepsState() {
    MockReceiver mock;
    mock.setAutoReplyStatus(true);
    auto device = makeDevice(mock.port());
    ASSERT_TRUE(device != nullptr, "device created");

    ASSERT_TRUE(device->connect(2000ms).has_value(), "connect");
    ASSERT_TRUE(device->updateStatus().has_value(), "request status");
    ASSERT_TRUE(waitUntil([&]{ return device->volume().has_value() && device->app().has_value(); }),
                "status merged");

    mock.dropClient();
    ASSERT_TRUE(waitUntil([&]{ return device->state() == ConnectionState::Disconnected; }),
                "drop detected");
    mock.stop();

    auto again = device->connect(500ms);
    ASSERT_TRUE(!again, "reconnect to a stopped receiver fails");
    ASSERT_TRUE(device->state() == ConnectionState::Disconnected, "still disconnected");
    ASSERT_TRUE(device->volume().has_value() && device->app().has_value(),
                "failed reconnect keeps the last known state");

    ASSERT_TRUE(device->disconnect().has_value(), "disconnect");
    ASSERT_TRUE(!device->volume() && !device->app(), "disconnect clears the state");
}

static void testHeartbeatLiveness() {
    castlink::net::TimeoutConfig::ScopedOverride restore;
    castlink::net::TimeoutConfig::setHeartbeatInterval(100ms);
    castlink::net::TimeoutConfig::setLivenessTimeout(500ms);
    castlink::net::TimeoutConfig::setWriteTimeout(500ms);

    MockReceiver mock;
    mock.setAnswerPings(false);
    SinkRecorder sinks;
    auto device = makeDevice(mock.port());
    ASSERT_TRUE(device != nullptr, "device created");

    const auto start = std::chrono::steady_clock::now();
    ASSERT_TRUE(device->connect(2000ms, sinks.errorSink(), sinks.stateSink()).has_value(), "connect");
    ASSERT_TRUE(waitUntil([&]{ return mock.count("PING") >= 1; }), "idle session sends PING");

    ASSERT_TRUE(waitUntil([&]{ return device->state() == ConnectionState::Disconnected; }),
                "silent peer declared dead");
    ASSERT_TRUE(std::chrono::steady_clock::now() - start >= 500ms, "not before the liveness timeout");
    ASSERT_TRUE(sinks.sawError(castlink::net::asio::error::timed_out), "timeout reported to the error sink");
    ASSERT_TRUE(waitUntil([&]{ return sinks.lastStateIs(ConnectionState::Disconnected); }),
                "Disconnected reported");
    ASSERT_TRUE(mock.count("PING") >= 2, "PING repeated while waiting");
    ASSERT_TRUE(device->disconnect().has_value(), "disconnect after liveness failure");
}

static void testReceiverClose() {
    MockReceiver mock;
    SinkRecorder sinks;
    auto device = makeDevice(mock.port());
    ASSERT_TRUE(device != nullptr, "device created");

    ASSERT_TRUE(device->connect(2000ms, sinks.errorSink(), sinks.stateSink()).has_value(), "connect");
    mock.push(config::CAST_NS_CONNECTION, "{\"type\":\"CLOSE\"}");

    ASSERT_TRUE(waitUntil([&]{ return device->state() == ConnectionState::Disconnected; }),
                "receiver CLOSE ends the session");
    ASSERT_TRUE(sinks.sawError(std::errc::connection_reset), "CLOSE reported as connection reset");
    ASSERT_TRUE(device->disconnect().has_value(), "disconnect after CLOSE");
}

static void testHeartbeatAndProtocolErrors() {
    MockReceiver mock;
    SinkRecorder sinks;
    auto device = makeDevice(mock.port());
    ASSERT_TRUE(device != nullptr, "device created");

    ASSERT_TRUE(device->connect(2000ms, sinks.errorSink(), sinks.stateSink()).has_value(), "connect");

    mock.push(config::CAST_NS_HEARTBEAT, "{\"type\":\"PING\"}");
    ASSERT_TRUE(waitUntil([&]{ return mock.count("PONG") == 1; }), "PING answered with PONG");

    // A malformed payload is reported but does not end the session.
    mock.push(config::CAST_NS_RECEIVER, "{not json");
    ASSERT_TRUE(waitUntil([&]{ return sinks.sawError(castlink::errc::protocol_decode); }),
                "decode failure reported");
    ASSERT_TRUE(device->state() == ConnectionState::Connected, "still connected after a bad frame");

    // A rejected status request releases the claim so the next call retries.
    ASSERT_TRUE(device->updateStatus().has_value(), "request status");
    ASSERT_TRUE(waitUntil([&]{ return mock.count("GET_STATUS") == 1; }), "status requested");
    mock.push(config::CAST_NS_RECEIVER,
              "{\"type\":\"INVALID_REQUEST\",\"requestId\":" +
              std::to_string(mock.lastRequestId("GET_STATUS")) + ",\"reason\":\"INVALID_COMMAND\"}");
    ASSERT_TRUE(waitUntil([&]{ return sinks.sawError(castlink::errc::request_rejected); }),
                "rejection reported");
    ASSERT_TRUE(waitUntil([&]{ return !device->statusRequestInFlight(); }), "claim released");

    mock.setAutoReplyStatus(true);
    ASSERT_TRUE(device->updateStatus().has_value(), "retry status");
    ASSERT_TRUE(waitUntil([&]{ return device->volume().has_value(); }), "status merged on retry");
    ASSERT_EQ(mock.count("GET_STATUS"), 2, "one retry on the wire");

    ASSERT_TRUE(device->disconnect().has_value(), "disconnect");
}

static void testRepeatedSessions() {
    MockReceiver mock;
    auto device = makeDevice(mock.port());
    ASSERT_TRUE(device != nullptr, "device created");

    constexpr int kTries = 20;
    for (int i = 0; i < kTries; ++i) {
        auto connected = device->connect(2000ms, {}, {}, roundRobin());
        ASSERT_TRUE(connected.has_value(), "connect should succeed");
        auto closed = device->disconnect();
        ASSERT_TRUE(closed.has_value(), "disconnect should succeed");
    }

    ASSERT_TRUE(waitUntil([&]{ return mock.connectionsAccepted() >= kTries; }),
                "receiver observed all connections");
    ASSERT_TRUE(waitUntil([&]{ return mock.count("CLOSE") == kTries; }), "every session closed politely");
}

int main() {
    testHandshakeTimeout();
    testTransportDrop();
    testFailedReconnectKeepsState();
    testHeartbeatLiveness();
    testReceiverClose();
    testHeartbeatAndProtocolErrors();
    testRepeatedSessions();

    return finishTests("CastReconnect");
}
