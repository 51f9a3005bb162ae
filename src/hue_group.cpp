#include "hue_group.h"

#include <QJsonArray>
#include <QStringList>

#include "hue_bridge.h"
#include "hue_light.h"

namespace huelink {

namespace {

bool parseError(Error *error, int id, const QString &detail)
{
    return fail(error, Error::comm(QStringLiteral("Group %1 result parsing failed: %2").arg(id).arg(detail)));
}

} // namespace

Group::Group(Bridge &bridge, int id)
    : StateTarget(bridge, id)
{
    if (isImplicit())
        m_name = QStringLiteral("Implicit");
}

QString Group::name(Error *)
{
    return m_name;
}

bool Group::setName(const QString &name, Error *error)
{
    const QString trimmed = name.trimmed();
    if (trimmed.size() > 32) {
        return fail(error, Error::validation(QStringLiteral(
                               "Name (without leading or trailing whitespace) has to be at most 32 characters long")));
    }

    QJsonObject body;
    body.insert(QStringLiteral("name"), trimmed);
    QList<QJsonObject> response;
    if (!m_bridge.checkedSuccessRequest(Method::Put, QStringLiteral("groups/%1").arg(id()), body, &response, error))
        return false;

    const QJsonObject success = response.isEmpty() ? QJsonObject() : response.first().value(QStringLiteral("success")).toObject();
    const QJsonValue actual = success.value(QStringLiteral("/groups/%1/name").arg(id()));
    m_name = actual.isString() ? actual.toString() : trimmed;
    return true;
}

QList<Light *> Group::lights() const
{
    QList<Light *> out;
    for (const auto &entry : m_lights)
        out.append(entry.second);
    return out;
}

Light *Group::light(int id) const
{
    const auto it = m_lights.find(id);
    return it == m_lights.end() ? nullptr : it->second;
}

QList<int> Group::lightIds() const
{
    QList<int> out;
    for (const auto &entry : m_lights)
        out.append(entry.first);
    return out;
}

bool Group::add(Light *light, Error *error)
{
    if (!light || light->bridge() != bridge())
        return fail(error, Error::validation(QStringLiteral("A group can only contain lights from the same bridge")));
    if (isImplicit())
        return false;
    return fail(error, Error::unsupported(QStringLiteral("Adding lights to a group is not supported by version 1.0 of the Hue API")));
}

bool Group::remove(Light *light, Error *error)
{
    if (!light || light->bridge() != bridge())
        return fail(error, Error::validation(QStringLiteral("A group may only contain lights from the same bridge")));
    if (isImplicit())
        return fail(error, Error::validation(QStringLiteral("It is not allowed to remove a light from the implicit group")));
    return fail(error, Error::unsupported(QStringLiteral("Removing lights from a group is not supported by version 1.0 of the Hue API")));
}

bool Group::parse(const QJsonObject &json,
                  const std::map<int, std::unique_ptr<Light>> &lights,
                  Error *error)
{
    const QJsonValue nameValue = json.value(QStringLiteral("name"));
    if (!nameValue.isString())
        return parseError(error, id(), QStringLiteral("'name' missing or not a string"));

    const QJsonValue lightsValue = json.value(QStringLiteral("lights"));
    if (!lightsValue.isArray())
        return parseError(error, id(), QStringLiteral("'lights' missing or not an array"));

    std::map<int, Light *> members;
    const QJsonArray ids = lightsValue.toArray();
    for (const QJsonValue &value : ids) {
        bool ok = false;
        int lightId = -1;
        if (value.isString()) {
            lightId = value.toString().toInt(&ok);
        } else if (value.isDouble()) {
            lightId = value.toInt();
            ok = true;
        }
        if (!ok)
            return parseError(error, id(), QStringLiteral("light id %1 is not a number").arg(value.toVariant().toString()));

        const auto it = lights.find(lightId);
        if (it == lights.end())
            return fail(error, Error::comm(QStringLiteral("Can not find light with id %1").arg(lightId)));
        members.emplace(lightId, it->second.get());
    }

    m_name = nameValue.toString();
    m_lights = std::move(members);
    return true;
}

void Group::setMembers(const std::map<int, std::unique_ptr<Light>> &lights)
{
    m_lights.clear();
    for (const auto &entry : lights)
        m_lights.emplace(entry.first, entry.second.get());
}

QString Group::statePath() const
{
    return QStringLiteral("groups/%1/action").arg(id());
}

void Group::applyConfirmed(const QJsonObject &fields)
{
    for (const auto &entry : m_lights)
        entry.second->applyConfirmed(fields);
}

bool Group::resync(Error *error)
{
    return m_bridge.sync(error);
}

QString Group::toString() const
{
    QStringList ids;
    for (const auto &entry : m_lights)
        ids.append(QString::number(entry.first));
    return QStringLiteral("%1(%2)[%3]").arg(id()).arg(m_name, ids.join(QLatin1Char(',')));
}

} // namespace huelink
