#include "hue_config.h"

#include <algorithm>

#include <QHostInfo>

namespace huelink {

namespace {

int readInt(const QJsonObject &obj, const QString &key, int fallback)
{
    if (!obj.contains(key))
        return fallback;
    bool ok = false;
    const int value = obj.value(key).toVariant().toInt(&ok);
    return ok ? value : fallback;
}

QString readString(const QJsonObject &obj, const QString &key, const QString &fallback)
{
    const QString value = obj.value(key).toString().trimmed();
    return value.isEmpty() ? fallback : value;
}

} // namespace

QString BridgeOptions::defaultDeviceType()
{
    const QString localHost = QHostInfo::localHostName().left(20);
    return QStringLiteral("%1#%2")
        .arg(QLatin1String(kLibraryName), localHost.isEmpty() ? QStringLiteral("client") : localHost);
}

BridgeOptions BridgeOptions::fromJson(const QJsonObject &obj)
{
    BridgeOptions out;
    out.deviceType = readString(obj, QStringLiteral("deviceType"), out.deviceType);
    out.requestTimeoutMs = std::clamp(readInt(obj, QStringLiteral("requestTimeoutMs"), out.requestTimeoutMs), 500, 120000);
    out.grantWaitMs = std::clamp(readInt(obj, QStringLiteral("grantWaitMs"), out.grantWaitMs), 0, 600000);
    out.grantPollIntervalMs = std::clamp(readInt(obj, QStringLiteral("grantPollIntervalMs"), out.grantPollIntervalMs), 0, 60000);
    out.grantPollJitterMs = std::clamp(readInt(obj, QStringLiteral("grantPollJitterMs"), out.grantPollJitterMs), 0, 10000);

    const QJsonValue autoSync = obj.value(QStringLiteral("lightAutoSyncMs"));
    if (autoSync.isDouble() && autoSync.toDouble() >= 0)
        out.lightAutoSyncMs = static_cast<qint64>(autoSync.toDouble());

    return out;
}

int LocatorOptions::effectiveAttempts() const
{
    return std::min(4, std::max(1, attempts));
}

LocatorOptions LocatorOptions::fromJson(const QJsonObject &obj)
{
    LocatorOptions out;
    out.attempts = readInt(obj, QStringLiteral("attempts"), out.attempts);
    out.ttl = std::clamp(readInt(obj, QStringLiteral("ttl"), out.ttl), 1, 255);
    out.searchTarget = readString(obj, QStringLiteral("searchTarget"), out.searchTarget);
    out.descriptionTimeoutMs = std::clamp(readInt(obj, QStringLiteral("descriptionTimeoutMs"), out.descriptionTimeoutMs), 500, 60000);
    return out;
}

} // namespace huelink
