#pragma once

#include <optional>

#include <QJsonObject>
#include <QString>

namespace huelink {

inline constexpr const char kLibraryName[] = "huelink";
inline constexpr const char kLibraryVersion[] = "0.3.0";

struct BridgeOptions {
    QString deviceType = defaultDeviceType();
    int requestTimeoutMs = 10000;
    // link button wait while creating a user
    int grantWaitMs = 30000;
    int grantPollIntervalMs = 900;
    int grantPollJitterMs = 100;
    // unset disables per light auto-sync on read
    std::optional<qint64> lightAutoSyncMs;

    static QString defaultDeviceType();
    static BridgeOptions fromJson(const QJsonObject &obj);
};

struct LocatorOptions {
    int attempts = 3;
    int ttl = 2;
    QString searchTarget = QStringLiteral("upnp:rootdevice");
    int descriptionTimeoutMs = 5000;

    // attempts clamped to what discover() actually runs
    int effectiveAttempts() const;

    static LocatorOptions fromJson(const QJsonObject &obj);
};

} // namespace huelink
