#pragma once

#include <map>
#include <memory>

#include <QJsonObject>
#include <QList>
#include <QString>

#include "hue_state.h"

namespace huelink {

class Light;

// A light group stored on the bridge. Group 0 always exists and contains
// every light of its bridge.
class Group : public StateTarget
{
public:
    Group(Bridge &bridge, int id);

    QString name(Error *error = nullptr) override;
    bool setName(const QString &name, Error *error = nullptr) override;

    bool isImplicit() const { return id() == 0; }

    QList<Light *> lights() const;
    Light *light(int id) const;
    QList<int> lightIds() const;

    // Membership edits are not part of the bridge API this library speaks.
    // add() on group 0 is a no-op returning false; anything else fails.
    bool add(Light *light, Error *error = nullptr);
    bool remove(Light *light, Error *error = nullptr);

    // Name and member list as reported by the bridge. Every member must
    // already be in lights.
    bool parse(const QJsonObject &json,
               const std::map<int, std::unique_ptr<Light>> &lights,
               Error *error = nullptr);

    QString toString() const override;

protected:
    QString statePath() const override;
    void applyConfirmed(const QJsonObject &fields) override;
    bool resync(Error *error) override;

private:
    friend class Bridge;

    void setMembers(const std::map<int, std::unique_ptr<Light>> &lights);

    QString m_name;
    std::map<int, Light *> m_lights;
};

} // namespace huelink
