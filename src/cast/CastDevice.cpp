/**
 * @brief Implements the receiver state cache and the request façade.
 */
#include "castlink/cast/CastDevice.hpp"

#include "castlink/log/Log.hpp"

#include <mutex>
#include <sstream>
#include <utility>

namespace castlink::cast {

using castlink::unexpected;

expected<std::unique_ptr<CastDevice>> CastDevice::create(const DeviceRecord& record) {
    if (!record.isValid()) {
        logError("[CastDevice] rejected record id='", record.id, "' port=", record.port,
                 " addresses=", record.addresses.size(), "\n");
        return unexpected(make_error_code(errc::invalid_record));
    }
    return std::make_unique<CastDevice>(Key{}, record);
}

CastDevice::CastDevice(Key, const DeviceRecord& record)
: deviceId(record.id)
, friendlyName(record.friendlyName.empty() ? record.id : record.friendlyName)
, modelName(record.model)
, statusText(record.statusText)
, status(record.statusFlag)
, addresses(record.addresses)
, port(record.port)
, connection(*this)
{}

CastDevice::~CastDevice() {
    // Stop the worker while every member it touches is still alive.
    if (auto result = disconnect(); !result) {
        logError("[CastDevice] ", deviceId, " teardown: ", result.error().message(), "\n");
    }
}

expected<void> CastDevice::connect(net::duration timeout,
                                   ErrorSink errors,
                                   StateSink states,
                                   AddressPolicy policy) {
    net::tcp::endpoint endpoint;
    std::string id;
    {
        std::unique_lock lock(mutex);
        if (addresses.empty()) {
            return unexpected(make_error_code(errc::not_found));
        }
        if (connectionState != ConnectionState::Disconnected) {
            logError("[CastDevice] ", deviceId, " connect() while ",
                     toString(connectionState), "\n");
            return unexpected(make_error_code(errc::out_of_order));
        }

        std::size_t index = policy ? policy(addresses) : 0;
        if (index >= addresses.size()) {
            index = 0;
        }
        endpoint = net::tcp::endpoint(addresses[index], port);
        id = deviceId;

        connectionState = ConnectionState::Connecting;
    }

    auto result = connection.connect(id, endpoint, timeout, std::move(errors), std::move(states));

    std::unique_lock lock(mutex);
    if (!result || !connection.isConnected()) {
        connectionState = ConnectionState::Disconnected;
        statusRequestId.reset();
        if (!result) {
            return result;
        }
        return unexpected(std::make_error_code(std::errc::connection_reset));
    }
    connectionState = ConnectionState::Connected;
    return {};
}

expected<void, ErrorList> CastDevice::disconnect() {
    auto result = connection.disconnect();

    std::unique_lock lock(mutex);
    connectionState = ConnectionState::Disconnected;
    resetCachesLocked();
    return result;
}

expected<void> CastDevice::updateStatus() {
    expected<CastRequest> request;
    {
        std::unique_lock lock(mutex);
        if (connectionState != ConnectionState::Connected) {
            return unexpected(make_error_code(errc::out_of_order));
        }
        if (volumeState && appState) {
            return {};
        }
        if (statusRequestId) {
            return {}; // join the request already in flight
        }
        request = connection.channel().getStatus();
        if (!request) {
            return unexpected(request.error());
        }
        statusRequestId = request->requestId;
    }

    auto sent = connection.send(*request);
    if (!sent) {
        std::unique_lock lock(mutex);
        if (statusRequestId == request->requestId) {
            statusRequestId.reset();
        }
    }
    return sent;
}

expected<void> CastDevice::launchApp(const std::string& appId) {
    if (auto ready = requireConnected(); !ready) {
        return ready;
    }
    return sendRequest(connection.channel().launchApp(appId));
}

expected<void> CastDevice::setVolumeLevel(float level) {
    if (auto ready = requireConnected(); !ready) {
        return ready;
    }
    return sendRequest(connection.channel().setVolume(canonicalVolume(level)));
}

expected<void> CastDevice::setMuted(bool muted) {
    if (auto ready = requireConnected(); !ready) {
        return ready;
    }
    return sendRequest(connection.channel().setMuted(muted));
}

expected<void> CastDevice::loadMedia(const std::string& url,
                                     const std::string& mimeType,
                                     bool autoplay) {
    std::string transportId;
    {
        std::shared_lock lock(mutex);
        if (connectionState != ConnectionState::Connected) {
            return unexpected(make_error_code(errc::out_of_order));
        }
        if (!appState || !appState->hasTransport()) {
            logError("[CastDevice] ", deviceId, " loadMedia() without a running app\n");
            return unexpected(make_error_code(errc::out_of_order));
        }
        transportId = appState->transportId;
    }

    if (auto attached = sendRequest(connection.channel().connectMedia(transportId)); !attached) {
        return attached;
    }
    return sendRequest(connection.channel().loadUrl(transportId, url, mimeType, autoplay));
}

ChangeFlags CastDevice::setVolume(const VolumeState& volume) {
    std::unique_lock lock(mutex);
    if (!volumeState || *volumeState != volume) {
        volumeState = volume;
        return ChangeFlags::Volume;
    }
    return ChangeFlags::None;
}

ChangeFlags CastDevice::setApp(const AppState& app) {
    std::unique_lock lock(mutex);
    if (!appState || *appState != app) {
        appState = app;
        return ChangeFlags::App;
    }
    return ChangeFlags::None;
}

ChangeFlags CastDevice::setMedia(const MediaState& media) {
    std::unique_lock lock(mutex);
    if (!mediaState || *mediaState != media) {
        mediaState = media;
        return ChangeFlags::Media;
    }
    return ChangeFlags::None;
}

std::string CastDevice::id() const {
    std::shared_lock lock(mutex);
    return deviceId;
}

std::string CastDevice::name() const {
    std::shared_lock lock(mutex);
    return friendlyName;
}

std::string CastDevice::model() const {
    std::shared_lock lock(mutex);
    return modelName;
}

std::string CastDevice::service() const {
    std::shared_lock lock(mutex);
    if (appState && !appState->displayName.empty()) {
        return appState->displayName;
    }
    return statusText;
}

ConnectionState CastDevice::state() const {
    std::shared_lock lock(mutex);
    return connectionState;
}

unsigned CastDevice::statusFlag() const {
    std::shared_lock lock(mutex);
    return status;
}

std::optional<VolumeState> CastDevice::volume() const {
    std::shared_lock lock(mutex);
    return volumeState;
}

std::optional<AppState> CastDevice::app() const {
    std::shared_lock lock(mutex);
    return appState;
}

std::optional<MediaState> CastDevice::media() const {
    std::shared_lock lock(mutex);
    return mediaState;
}

bool CastDevice::statusRequestInFlight() const {
    std::shared_lock lock(mutex);
    return statusRequestId.has_value();
}

std::size_t CastDevice::pendingRequests() const {
    return connection.pendingRequestCount();
}

std::string CastDevice::describe() const {
    std::shared_lock lock(mutex);
    std::ostringstream os;
    os << "<cast.device id=" << deviceId;
    if (!friendlyName.empty()) os << " name=\"" << friendlyName << "\"";
    if (!modelName.empty()) os << " model=\"" << modelName << "\"";
    const std::string& svc =
        (appState && !appState->displayName.empty()) ? appState->displayName : statusText;
    if (!svc.empty()) os << " service=\"" << svc << "\"";
    os << " state=" << toString(connectionState);
    if (volumeState) os << " volume=" << volumeState->describe();
    if (appState) os << " app=" << appState->describe();
    if (mediaState) os << " media=" << mediaState->describe();
    os << ">";
    return os.str();
}

void CastDevice::setChangeHandler(ChangeHandler handler) {
    std::unique_lock lock(mutex);
    changeHandler = std::move(handler);
}

// Dispatch path -----------------------------------------------------------------

// Runs before the worker starts, so nothing it merges is wiped.
void CastDevice::connectionOpened() {
    std::unique_lock lock(mutex);
    resetCachesLocked();
}

void CastDevice::receiverStatusReceived(const CastEvent& event) {
    ChangeFlags changed = ChangeFlags::None;
    if (event.volume) {
        changed |= setVolume(*event.volume);
    }
    if (event.app) {
        changed |= setApp(*event.app);
    }
    {
        std::unique_lock lock(mutex);
        if (statusRequestId && event.requestId == *statusRequestId) {
            statusRequestId.reset();
        }
    }
    notifyChanges(changed);
}

void CastDevice::mediaStatusReceived(const CastEvent& event) {
    if (event.media) {
        notifyChanges(setMedia(*event.media));
    }
}

void CastDevice::requestRejected(const CastEvent& event) {
    std::unique_lock lock(mutex);
    if (statusRequestId && event.requestId == *statusRequestId) {
        statusRequestId.reset();
    }
}

void CastDevice::connectionLost(const std::error_code& ec) {
    std::unique_lock lock(mutex);
    logError("[CastDevice] ", deviceId, " lost connection: ", ec.message(), "\n");
    connectionState = ConnectionState::Disconnected;
    statusRequestId.reset();
}

// Helpers -----------------------------------------------------------------------

expected<void> CastDevice::requireConnected() const {
    std::shared_lock lock(mutex);
    if (connectionState != ConnectionState::Connected) {
        return unexpected(make_error_code(errc::out_of_order));
    }
    return {};
}

expected<void> CastDevice::sendRequest(expected<CastRequest> request) {
    if (!request) {
        return unexpected(request.error());
    }
    return connection.send(*request);
}

void CastDevice::resetCachesLocked() {
    volumeState.reset();
    appState.reset();
    mediaState.reset();
    statusRequestId.reset();
}

void CastDevice::notifyChanges(ChangeFlags changed) {
    if (!any(changed)) {
        return;
    }
    ChangeHandler handler;
    std::string id;
    {
        std::shared_lock lock(mutex);
        handler = changeHandler;
        id = deviceId;
    }
    if (handler) {
        handler(id, changed);
    }
}

} // namespace castlink::cast
