#pragma once

#include <map>
#include <optional>

#include <QJsonObject>
#include <QJsonValue>
#include <QMutex>
#include <QString>

#include "hue_lightcontrol.h"

namespace huelink {

// Common state writing for objects that have a state endpoint on the bridge
// (lights and groups). A setter either sends its field right away or, while
// a transaction is open on this object in the calling thread, adds it to the
// pending payload.
class StateTarget : public LightControl
{
public:
    StateTarget(Bridge &bridge, int id);

    StateTarget(const StateTarget &) = delete;
    StateTarget &operator=(const StateTarget &) = delete;

    int id() const override { return m_id; }
    Bridge *bridge() const override { return &m_bridge; }

    std::optional<int> transitionTime() const override { return m_transitionTime; }
    void setTransitionTime(std::optional<int> transitionTime) override { m_transitionTime = transitionTime; }

    bool setOn(bool on, Error *error = nullptr) override;
    bool setBrightness(int brightness, Error *error = nullptr) override;
    bool setHue(int hue, Error *error = nullptr) override;
    bool setSaturation(int saturation, Error *error = nullptr) override;
    bool setCieXY(double x, double y, Error *error = nullptr) override;
    bool setColorTemperature(int colorTemperature, Error *error = nullptr) override;
    bool setEffect(Effect effect, Error *error = nullptr) override;
    bool setAlert(Alert alert, Error *error = nullptr) override;

    bool stateChangeTransaction(std::optional<int> transitionTime,
                                const Changes &changes,
                                Error *error = nullptr) override;

    // True while the calling thread has a transaction open on this object.
    bool hasOpenTransaction() const;

protected:
    // Path below api/<username>/ that takes state changes.
    virtual QString statePath() const = 0;
    // Called with the fields the bridge confirmed.
    virtual void applyConfirmed(const QJsonObject &fields) = 0;
    // Reloads the object from the bridge after a failed transaction.
    virtual bool resync(Error *error) = 0;

    Bridge &m_bridge;

private:
    bool stateChange(const QString &key, const QJsonValue &value, Error *error);
    bool commit(const QJsonObject &payload, Error *error);
    QJsonObject takePending(Qt::HANDLE context);

    const int m_id;
    std::optional<int> m_transitionTime;

    mutable QMutex m_pendingMutex;
    std::map<Qt::HANDLE, QJsonObject> m_pending;
};

} // namespace huelink
