#pragma once
#include "castlink/core/Error.hpp"
#include "castlink/core/Expected.hpp"
#include "castlink/net/NetConfig.hpp"
#include "castlink/net/TimeoutConfig.hpp"
#include "castlink/cast/AddressPolicy.hpp"
#include "castlink/cast/CastConfig.hpp"
#include "castlink/cast/CastConnection.hpp"
#include "castlink/cast/CastTypes.hpp"
#include "castlink/cast/DeviceRecord.hpp"

#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <shared_mutex>
#include <string>

namespace castlink::cast {

using castlink::expected;

/**
 * @brief One Cast receiver: identity, cached state and the control surface.
 *
 * Responsibilities:
 * - Own the CastConnection and drive the Disconnected / Connecting / Connected
 *   state machine.
 * - Cache the last volume, application and media state reported by the
 *   receiver. The dispatch worker is the only writer of these caches.
 * - Encode control requests through the connection's channel and send them.
 *   Requests are fire-and-forget: their effect shows up as a later merge or as
 *   an error on the ErrorSink.
 *
 * Locking: one shared mutex guards everything below. It is never held across
 * a transport call, a connect or a disconnect.
 */
class CastDevice : private CastConnection::Listener {
    struct Key {
        explicit Key() = default;
    };

public:
    /// Invoked by the dispatch worker after a merge that changed something.
    using ChangeHandler = std::function<void(const std::string& deviceId, ChangeFlags changed)>;

    /**
     * @brief Build a device from a discovery record.
     * @return `errc::invalid_record` when the id is empty, the port is 0 or
     *         there is no address.
     */
    static expected<std::unique_ptr<CastDevice>> create(const DeviceRecord& record);

    /// Only reachable through create().
    CastDevice(Key, const DeviceRecord& record);
    ~CastDevice() override;

    // non-copyable / non-movable
    CastDevice(const CastDevice&) = delete;
    CastDevice& operator=(const CastDevice&) = delete;
    CastDevice(CastDevice&&) = delete;
    CastDevice& operator=(CastDevice&&) = delete;

    /**
     * @brief Connect to one address chosen by @p policy within @p timeout.
     *
     * There is no retry and no fallback to other addresses. On success the
     * volume, app and media caches are reset to unknown; a failed attempt
     * leaves them as they were.
     */
    expected<void> connect(net::duration timeout,
                           ErrorSink errors = {},
                           StateSink states = {},
                           AddressPolicy policy = firstAddress());

    /**
     * @brief Tear the connection down and reset the caches.
     *
     * Caches and state are reset whatever happens during teardown; teardown
     * failures are returned together.
     */
    expected<void, ErrorList> disconnect();

    /**
     * @brief Ask the receiver for its status unless it is already known.
     *
     * At most one status request is in flight; callers arriving while one is
     * pending join it instead of sending another.
     */
    expected<void> updateStatus();

    // Requests ----------------------------------------------------------------
    expected<void> launchApp(const std::string& appId);

    /// Clamped to [0, 1]; 0 is sent as the canonical `{0, muted}` form.
    expected<void> setVolumeLevel(float level);

    expected<void> setMuted(bool muted);

    /// Needs a running app with a transport id (`errc::out_of_order` otherwise).
    expected<void> loadMedia(const std::string& url,
                             const std::string& mimeType,
                             bool autoplay);

    // Merges (dispatch worker only) ----------------------------------------------
    ChangeFlags setVolume(const VolumeState& volume);
    ChangeFlags setApp(const AppState& app);
    ChangeFlags setMedia(const MediaState& media);

    // Accessors ---------------------------------------------------------------
    std::string id() const;
    std::string name() const;
    std::string model() const;
    /// Running app's display name when known, else the record's status text.
    std::string service() const;
    ConnectionState state() const;
    unsigned statusFlag() const;
    std::optional<VolumeState> volume() const;
    std::optional<AppState> app() const;
    std::optional<MediaState> media() const;
    bool statusRequestInFlight() const;
    /// Correlated requests still waiting for their reply.
    std::size_t pendingRequests() const;
    std::string describe() const;

    void setChangeHandler(ChangeHandler handler);

private:
    // CastConnection::Listener
    void connectionOpened() override;
    void receiverStatusReceived(const CastEvent& event) override;
    void mediaStatusReceived(const CastEvent& event) override;
    void requestRejected(const CastEvent& event) override;
    void connectionLost(const std::error_code& ec) override;

    expected<void> requireConnected() const;
    expected<void> sendRequest(expected<CastRequest> request);
    void resetCachesLocked();
    void notifyChanges(ChangeFlags changed);

    mutable std::shared_mutex mutex;

    std::string deviceId;
    std::string friendlyName;
    std::string modelName;
    std::string statusText;
    unsigned status = 0;
    std::vector<net::asio::ip::address> addresses;
    unsigned short port = config::CAST_PORT_DEFAULT;

    ConnectionState connectionState = ConnectionState::Disconnected;
    std::optional<VolumeState> volumeState;
    std::optional<AppState> appState;
    std::optional<MediaState> mediaState;
    std::optional<int> statusRequestId;   // in-flight GET_STATUS claim

    ChangeHandler changeHandler;

    // Declared last: destroyed first, so the worker stops before the state it
    // writes to goes away.
    CastConnection connection;
};

} // namespace castlink::cast
