#include "castlink/cast/CastTypes.hpp"

#include <algorithm>
#include <cmath>
#include <sstream>

namespace castlink::cast {

const char* toString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting:   return "connecting";
        case ConnectionState::Connected:    return "connected";
    }
    return "unknown";
}

bool operator==(const VolumeState& a, const VolumeState& b) {
    return a.level == b.level && a.muted == b.muted;
}

bool operator!=(const VolumeState& a, const VolumeState& b) {
    return !(a == b);
}

VolumeState canonicalVolume(float level) {
    const float clamped = std::isnan(level) ? 0.0f : std::clamp(level, 0.0f, 1.0f);
    if (clamped == 0.0f) {
        return VolumeState{0.0f, true};
    }
    return VolumeState{clamped, false};
}

std::string VolumeState::describe() const {
    std::ostringstream os;
    os << "<volume level=" << level;
    if (muted) os << " muted";
    os << ">";
    return os.str();
}

bool operator==(const AppState& a, const AppState& b) {
    return a.appId == b.appId
        && a.displayName == b.displayName
        && a.transportId == b.transportId
        && a.sessionId == b.sessionId
        && a.statusText == b.statusText;
}

bool operator!=(const AppState& a, const AppState& b) {
    return !(a == b);
}

std::string AppState::describe() const {
    std::ostringstream os;
    os << "<app id=" << appId;
    if (!displayName.empty()) os << " name=\"" << displayName << "\"";
    if (!statusText.empty()) os << " status=\"" << statusText << "\"";
    if (!transportId.empty()) os << " transport=" << transportId;
    os << ">";
    return os.str();
}

bool operator==(const MediaState& a, const MediaState& b) {
    return a.mediaSessionId == b.mediaSessionId
        && a.playerState == b.playerState
        && a.contentId == b.contentId
        && a.currentTime == b.currentTime;
}

bool operator!=(const MediaState& a, const MediaState& b) {
    return !(a == b);
}

std::string MediaState::describe() const {
    std::ostringstream os;
    os << "<media session=" << mediaSessionId << " state=" << playerState;
    if (!contentId.empty()) os << " content=" << contentId;
    os << " t=" << currentTime << ">";
    return os.str();
}

} // namespace castlink::cast
