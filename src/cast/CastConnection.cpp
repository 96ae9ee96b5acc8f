/**
 * @brief Implements the Cast transport: TLS connect, receive pump, dispatch worker.
 */
#include "castlink/cast/CastConnection.hpp"

#include "castlink/log/Log.hpp"

#include <utility>

namespace castlink::cast {

using castlink::unexpected;
namespace asio = castlink::net::asio;

CastConnection::CastConnection(Listener& owner)
: listener(owner)
{}

CastConnection::~CastConnection() {
    if (auto result = disconnect(); !result) {
        logError("[CastConnection] teardown on destruction: ", result.error().message(), "\n");
    }
}

expected<void>
CastConnection::connect(const std::string& id,
                        const net::tcp::endpoint& endpoint,
                        net::duration timeout,
                        ErrorSink errors,
                        StateSink states) {
    std::lock_guard lifecycle(lifecycleMutex);

    if (connected.load()) {
        logError("[CastConnection] connect() while already connected to ", deviceId, "\n");
        return unexpected(make_error_code(errc::out_of_order));
    }

    // Leftovers from a connection that dropped on its own.
    stopWorker();
    stopReceive();
    {
        std::lock_guard lock(writeMutex);
        if (auto ec = tlsClient.close(); ec) {
            logError("[CastConnection] closing stale socket: ", ec.message(), "\n");
        }
    }

    deviceId = id;
    errorSink = std::move(errors);
    stateSink = std::move(states);
    heartbeatInterval = net::TimeoutConfig::heartbeatInterval();
    livenessTimeout = net::TimeoutConfig::livenessTimeout();
    {
        std::lock_guard lock(pendingMutex);
        pendingRequests.clear();
    }

    pushState(ConnectionState::Connecting);

    if (auto ec = tlsClient.connect(endpoint, timeout); ec) {
        logError("[CastConnection] connect failed: ", ec.message(),
                 " (to ", endpoint.address().to_string(), ":", endpoint.port(), ")",
                 " timeout=", timeout.count(), "ms\n");
        pushState(ConnectionState::Disconnected);
        return unexpected(ec);
    }

    tlsClient.setLowLatency();

    auto hello = castChannel.connect();
    if (hello) {
        if (auto sent = writeFrame(*hello); !sent) {
            hello = unexpected(sent.error());
        }
    }
    if (!hello) {
        logError("[CastConnection] virtual connection failed: ", hello.error().message(), "\n");
        std::lock_guard lock(writeMutex);
        if (auto ec = tlsClient.close(); ec) {
            logError("[CastConnection] close after failed CONNECT: ", ec.message(), "\n");
        }
        pushState(ConnectionState::Disconnected);
        return unexpected(hello.error());
    }

    listener.connectionOpened();

    inbox = std::make_shared<Inbox>();
    inbox->running = true;
    inbox->pumpActive = true;
    lastReceiveTime = std::chrono::steady_clock::now();
    connected = true;

    receiveHeader(inbox, std::make_shared<ReceiveBuffer>());
    startWorker();

    logInfo("[CastConnection] connected to ", deviceId, " at ",
            endpoint.address().to_string(), ":", endpoint.port(), "\n");
    pushState(ConnectionState::Connected);
    return {};
}

expected<void, ErrorList> CastConnection::disconnect() {
    std::lock_guard lifecycle(lifecycleMutex);

    const bool wasConnected = connected.exchange(false);
    if (!wasConnected && !worker.joinable() && !tlsClient.is_open()) {
        return {};
    }

    logInfo("[CastConnection] disconnect() ", deviceId, "\n");
    ErrorList errors;

    if (wasConnected) {
        auto bye = castChannel.close();
        if (bye) {
            if (auto sent = writeFrame(*bye); !sent) {
                errors.append("close message", sent.error());
            }
        } else {
            errors.append("close message", bye.error());
        }
    }

    stopWorker();
    stopReceive();

    {
        std::lock_guard lock(writeMutex);
        if (wasConnected) {
            errors.append("tls shutdown", tlsClient.shutdown(config::CAST_SHUTDOWN_TIMEOUT));
        }
        errors.append("socket close", tlsClient.close());
    }

    {
        std::lock_guard lock(pendingMutex);
        if (!pendingRequests.empty()) {
            logInfo("[CastConnection] dropping ", pendingRequests.size(), " unanswered request(s)\n");
        }
        pendingRequests.clear();
    }

    if (wasConnected) {
        pushState(ConnectionState::Disconnected);
    }

    if (!errors.empty()) {
        logError("[CastConnection] teardown errors: ", errors.message(), "\n");
        return unexpected(errors);
    }
    return {};
}

expected<void> CastConnection::send(const CastRequest& request) {
    if (!connected.load()) {
        return unexpected(std::make_error_code(std::errc::not_connected));
    }

    // Record before writing: the reply may be dispatched before write returns.
    // Virtual-connection messages are never answered, so they are not tracked.
    const bool tracked = request.requestId != 0 && request.nameSpace != config::CAST_NS_CONNECTION;
    if (tracked) {
        std::lock_guard lock(pendingMutex);
        pendingRequests[request.requestId] = request.type;
    }

    auto sent = writeFrame(request);
    if (!sent && tracked) {
        std::lock_guard lock(pendingMutex);
        pendingRequests.erase(request.requestId);
    }
    return sent;
}

std::size_t CastConnection::pendingRequestCount() const {
    std::lock_guard lock(pendingMutex);
    return pendingRequests.size();
}

expected<void> CastConnection::writeFrame(const CastRequest& request) {
    if (!request.frame) {
        return unexpected(std::make_error_code(std::errc::invalid_argument));
    }

    std::lock_guard lock(writeMutex);
    if (auto ec = tlsClient.write_all(request.frame); ec) {
        logError("[CastConnection] TX ", request.type, " failed: ", ec.message(), "\n");
        return unexpected(ec);
    }
    logDebug("[CastConnection] TX ", request.nameSpace, " ", request.type, " #", request.requestId,
             " bytes=", request.frame->size(), "\n");
    return {};
}

// Receive pump ----------------------------------------------------------------

void CastConnection::receiveHeader(std::shared_ptr<Inbox> box,
                                   std::shared_ptr<ReceiveBuffer> buffer) {
    tlsClient.async_read_exact(buffer->header.data(), buffer->header.size(),
        [this, box, buffer](const std::error_code& ec, std::size_t) {
            if (ec) {
                finishReceive(*box, ec);
                return;
            }
            // A bad length prefix loses frame sync, so it ends the pump.
            auto length = CastChannel::frameLength(buffer->header.data(), buffer->header.size());
            if (!length) {
                finishReceive(*box, length.error());
                return;
            }
            buffer->body.resize(*length);

            std::lock_guard lock(box->m);
            if (!box->running) {
                box->pumpActive = false;
                box->cv.notify_all();
                return;
            }
            receiveBody(box, buffer);
        });
}

void CastConnection::receiveBody(std::shared_ptr<Inbox> box,
                                 std::shared_ptr<ReceiveBuffer> buffer) {
    tlsClient.async_read_exact(buffer->body.data(), buffer->body.size(),
        [this, box, buffer](const std::error_code& ec, std::size_t) {
            if (ec) {
                finishReceive(*box, ec);
                return;
            }

            std::lock_guard lock(box->m);
            if (!box->running) {
                box->pumpActive = false;
                box->cv.notify_all();
                return;
            }
            box->items.push_back(Inbox::Item{std::move(buffer->body), {}});
            box->cv.notify_all();
            buffer->body.clear();
            receiveHeader(box, buffer);
        });
}

void CastConnection::finishReceive(Inbox& box, const std::error_code& ec) {
    std::lock_guard lock(box.m);
    if (box.running) {
        box.items.push_back(Inbox::Item{{}, ec});
    }
    box.pumpActive = false;
    box.cv.notify_all();
}

// Once this returns no pump handler will start another read, so the stream
// can be closed safely.
void CastConnection::stopReceive() {
    auto box = inbox;
    if (!box) {
        return;
    }
    {
        std::lock_guard lock(box->m);
        box->running = false;
    }
    box->cv.notify_all();
    tlsClient.cancel();

    std::unique_lock lock(box->m);
    box->cv.wait(lock, [&]{ return !box->pumpActive; });
}

// Dispatch worker -------------------------------------------------------------

void CastConnection::startWorker() {
    worker = std::thread([this] {
        this->run();
    });
}

void CastConnection::stopWorker() {
    if (auto box = inbox) {
        {
            std::lock_guard lock(box->m);
            box->running = false;
        }
        box->cv.notify_all();
    }
    if (worker.joinable()) {
        worker.join();
    }
}

void CastConnection::run() {
    auto box = inbox;

    while (true) {
        Inbox::Item item;
        bool received = false;
        {
            std::unique_lock lock(box->m);
            box->cv.wait_for(lock, heartbeatInterval,
                             [&]{ return !box->running || !box->items.empty(); });
            if (!box->running) {
                break;
            }
            if (!box->items.empty()) {
                item = std::move(box->items.front());
                box->items.pop_front();
                received = true;
            }
        }

        const auto now = std::chrono::steady_clock::now();

        if (!received) {
            if (now - lastReceiveTime > livenessTimeout) {
                handleNetworkFailure("heartbeat", asio::error::timed_out);
                break;
            }
            auto ping = castChannel.ping();
            if (!ping) {
                pushError(ping.error(), "encode PING");
                continue;
            }
            if (auto sent = send(*ping); !sent) {
                handleNetworkFailure("PING", sent.error());
                break;
            }
            continue;
        }

        if (item.error) {
            handleNetworkFailure("receive", item.error);
            break;
        }
        lastReceiveTime = now;

        auto event = castChannel.decode(item.body.data(), item.body.size());
        if (!event) {
            pushError(event.error(), "decode");
            continue;
        }
        logDebug("[CastConnection] RX ", event->nameSpace, " ", event->type,
                 " from ", event->sourceId, " (", toString(event->kind), ")\n");

        if (event->kind == CastEvent::Kind::Close && event->sourceId == config::CAST_RECEIVER_ID) {
            handleNetworkFailure("receiver CLOSE", std::make_error_code(std::errc::connection_reset));
            break;
        }

        dispatch(*event);
    }
}

void CastConnection::dispatch(const CastEvent& event) {
    matchReply(event);

    switch (event.kind) {
        case CastEvent::Kind::ReceiverStatus:
            listener.receiverStatusReceived(event);
            break;
        case CastEvent::Kind::MediaStatus:
            listener.mediaStatusReceived(event);
            break;
        case CastEvent::Kind::Ping: {
            auto pong = castChannel.pong();
            if (!pong) {
                pushError(pong.error(), "encode PONG");
            } else if (auto sent = send(*pong); !sent) {
                pushError(sent.error(), "PONG");
            }
            break;
        }
        case CastEvent::Kind::Pong:
            break;
        case CastEvent::Kind::Rejected:
            logError("[CastConnection] RX ", event.type, " for #", event.requestId,
                     " reason=", event.reason, "\n");
            pushError(make_error_code(errc::request_rejected), event.type + ": " + event.reason);
            listener.requestRejected(event);
            break;
        case CastEvent::Kind::Close:
            logInfo("[CastConnection] RX CLOSE from ", event.sourceId, "\n");
            break;
        case CastEvent::Kind::Other:
            logInfo("[CastConnection] RX ", event.type, " on ", event.nameSpace, " (ignored)\n");
            break;
    }
}

void CastConnection::matchReply(const CastEvent& event) {
    if (event.requestId == 0) {
        return;
    }
    std::string requestType;
    {
        std::lock_guard lock(pendingMutex);
        auto it = pendingRequests.find(event.requestId);
        if (it == pendingRequests.end()) {
            return;
        }
        requestType = std::move(it->second);
        pendingRequests.erase(it);
    }
    logInfo("[CastConnection] RX ", event.type, " answers ", requestType, " #", event.requestId, "\n");
}

void CastConnection::handleNetworkFailure(std::string_view where, const std::error_code& ec) {
    if (!connected.exchange(false)) {
        return; // disconnect() is already tearing down
    }

    logError("[CastConnection] ", where, " failed: ", ec.message(), "\n");
    pushError(ec, std::string(where));
    {
        std::lock_guard lock(pendingMutex);
        pendingRequests.clear();
    }
    listener.connectionLost(ec);
    pushState(ConnectionState::Disconnected);
}

void CastConnection::pushError(const std::error_code& ec, std::string context) {
    if (errorSink) {
        errorSink(DeviceError{deviceId, ec, std::move(context)});
    }
}

void CastConnection::pushState(ConnectionState state) {
    if (stateSink) {
        stateSink(StateChange{deviceId, state});
    }
}

} // namespace castlink::cast
