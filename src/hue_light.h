#pragma once

#include <optional>

#include <QJsonObject>
#include <QString>

#include "hue_state.h"

namespace huelink {

struct LightState {
    bool on = false;
    int brightness = 0;
    int hue = 0;
    int saturation = 0;
    double cieX = 0.0;
    double cieY = 0.0;
    int colorTemperature = 0;
    // unset until the bridge reports one, white-only bulbs never do
    std::optional<ColorMode> colorMode;
    Effect effect = Effect::None;
};

// A single bulb known to a bridge. Owned by its Bridge.
//
// Read accessors refresh the light first when an auto-sync interval is set
// and the cached state is older than that. If that refresh fails the cached
// value is returned and *error is set.
class Light : public StateTarget
{
public:
    Light(Bridge &bridge, int id);

    QString name(Error *error = nullptr) override;
    bool setName(const QString &name, Error *error = nullptr) override;

    bool isOn(Error *error = nullptr);
    int brightness(Error *error = nullptr);
    int hue(Error *error = nullptr);
    int saturation(Error *error = nullptr);
    double cieX(Error *error = nullptr);
    double cieY(Error *error = nullptr);
    int colorTemperature(Error *error = nullptr);
    std::optional<ColorMode> colorMode(Error *error = nullptr);
    Effect effect(Error *error = nullptr);

    // The cached state as is, no refresh.
    const LightState &cachedState() const { return m_state; }

    std::optional<qint64> autoSyncInterval() const { return m_autoSyncInterval; }
    void setAutoSyncInterval(std::optional<qint64> intervalMs) { m_autoSyncInterval = intervalMs; }
    qint64 lastSyncMs() const { return m_lastSyncMs; }

    // GET lights/<id> and parse the answer.
    bool refresh(Error *error = nullptr);

    // Updates the cache from a light object as the bridge reports it. Keys
    // missing from "state" keep their value, keys of the wrong type fail the
    // whole parse and leave the cache untouched.
    bool parse(const QJsonObject &json, bool requireState, Error *error = nullptr);

    QString toString() const override;

protected:
    QString statePath() const override;
    void applyConfirmed(const QJsonObject &fields) override;
    bool resync(Error *error) override;

private:
    friend class Group;

    bool autoSync(Error *error);

    QString m_name;
    LightState m_state;

    std::optional<qint64> m_autoSyncInterval;
    qint64 m_lastSyncMs = 0;
    bool m_syncing = false;
};

} // namespace huelink
