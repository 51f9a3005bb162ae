#pragma once

#include <optional>

#include <QList>
#include <QString>

#include "hue_lightcontrol.h"

namespace huelink {

// A client side group of lights, bridge groups and other virtual groups,
// possibly spanning several bridges. Created and owned by a Bridge, see
// Bridge::createVirtualGroup(). Members are not owned and have to outlive
// the group.
class VirtualGroup : public LightControl
{
public:
    VirtualGroup(const VirtualGroup &) = delete;
    VirtualGroup &operator=(const VirtualGroup &) = delete;

    int id() const override { return m_id; }
    Bridge *bridge() const override { return &m_bridge; }

    QString name(Error *error = nullptr) override;
    bool setName(const QString &name, Error *error = nullptr) override;

    std::optional<int> transitionTime() const override { return m_transitionTime; }
    void setTransitionTime(std::optional<int> transitionTime) override { m_transitionTime = transitionTime; }

    // Direct members in insertion order.
    QList<LightControl *> lights() const { return m_lights; }
    LightControl *light(int id) const;
    QList<LightControl *> lightsWithId(int id) const;
    // Sorted, without duplicates.
    QList<int> lightIds() const;

    // Returns false if light already is a member. Fails with a Validation
    // error if light is this group or contains it somewhere below.
    bool add(LightControl *light, Error *error = nullptr);
    bool remove(LightControl *light);

    bool setOn(bool on, Error *error = nullptr) override;
    bool setBrightness(int brightness, Error *error = nullptr) override;
    bool setHue(int hue, Error *error = nullptr) override;
    bool setSaturation(int saturation, Error *error = nullptr) override;
    bool setCieXY(double x, double y, Error *error = nullptr) override;
    bool setColorTemperature(int colorTemperature, Error *error = nullptr) override;
    bool setEffect(Effect effect, Error *error = nullptr) override;
    bool setAlert(Alert alert, Error *error = nullptr) override;

    // Opens one transaction on every light or bridge group reachable from
    // here, each exactly once, and runs changes inside the innermost one.
    bool stateChangeTransaction(std::optional<int> transitionTime,
                                const Changes &changes,
                                Error *error = nullptr) override;

    QString toString() const override;

private:
    friend class Bridge;

    VirtualGroup(Bridge &bridge, int id, const QString &name);

    bool reaches(const LightControl *from) const;
    static void collectReal(const VirtualGroup *group, QList<LightControl *> *out);
    static bool transactionOn(const QList<LightControl *> &lights,
                              int index,
                              std::optional<int> transitionTime,
                              const Changes &changes,
                              Error *error);

    Bridge &m_bridge;
    const int m_id;
    QString m_name;
    std::optional<int> m_transitionTime;
    QList<LightControl *> m_lights;
};

} // namespace huelink
