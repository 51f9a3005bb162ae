#include "hue_virtualgroup.h"

#include <algorithm>

#include <QStringList>

namespace huelink {

VirtualGroup::VirtualGroup(Bridge &bridge, int id, const QString &name)
    : m_bridge(bridge)
    , m_id(id)
    , m_name(name)
{
}

QString VirtualGroup::name(Error *)
{
    return m_name;
}

bool VirtualGroup::setName(const QString &name, Error *)
{
    m_name = name;
    return true;
}

LightControl *VirtualGroup::light(int id) const
{
    for (LightControl *member : m_lights) {
        if (member->id() == id)
            return member;
    }
    return nullptr;
}

QList<LightControl *> VirtualGroup::lightsWithId(int id) const
{
    QList<LightControl *> out;
    for (LightControl *member : m_lights) {
        if (member->id() == id)
            out.append(member);
    }
    return out;
}

QList<int> VirtualGroup::lightIds() const
{
    QList<int> ids;
    for (const LightControl *member : m_lights) {
        if (!ids.contains(member->id()))
            ids.append(member->id());
    }
    std::sort(ids.begin(), ids.end());
    return ids;
}

bool VirtualGroup::reaches(const LightControl *from) const
{
    const auto *group = dynamic_cast<const VirtualGroup *>(from);
    if (!group)
        return false;
    for (const LightControl *member : group->m_lights) {
        if (member == this || reaches(member))
            return true;
    }
    return false;
}

bool VirtualGroup::add(LightControl *light, Error *error)
{
    if (!light)
        return fail(error, Error::validation(QStringLiteral("Can not add a null light")));
    if (light == this)
        return fail(error, Error::validation(QStringLiteral("Can not add me to myself.")));
    if (reaches(light)) {
        return fail(error, Error::validation(QStringLiteral("Adding %1 would result in a circular reference because it references %2")
                                                 .arg(light->toString(), toString())));
    }
    if (m_lights.contains(light))
        return false;
    m_lights.append(light);
    return true;
}

bool VirtualGroup::remove(LightControl *light)
{
    return m_lights.removeOne(light);
}

bool VirtualGroup::setOn(bool on, Error *error)
{
    for (LightControl *member : m_lights) {
        if (!member->setOn(on, error))
            return false;
    }
    return true;
}

bool VirtualGroup::setBrightness(int brightness, Error *error)
{
    if (!validateBrightness(brightness, error))
        return false;
    for (LightControl *member : m_lights) {
        if (!member->setBrightness(brightness, error))
            return false;
    }
    return true;
}

bool VirtualGroup::setHue(int hue, Error *error)
{
    if (!validateHue(hue, error))
        return false;
    for (LightControl *member : m_lights) {
        if (!member->setHue(hue, error))
            return false;
    }
    return true;
}

bool VirtualGroup::setSaturation(int saturation, Error *error)
{
    if (!validateSaturation(saturation, error))
        return false;
    for (LightControl *member : m_lights) {
        if (!member->setSaturation(saturation, error))
            return false;
    }
    return true;
}

bool VirtualGroup::setCieXY(double x, double y, Error *error)
{
    if (!validateCieXY(x, y, error))
        return false;
    for (LightControl *member : m_lights) {
        if (!member->setCieXY(x, y, error))
            return false;
    }
    return true;
}

bool VirtualGroup::setColorTemperature(int colorTemperature, Error *error)
{
    if (!validateColorTemperature(colorTemperature, error))
        return false;
    for (LightControl *member : m_lights) {
        if (!member->setColorTemperature(colorTemperature, error))
            return false;
    }
    return true;
}

bool VirtualGroup::setEffect(Effect effect, Error *error)
{
    for (LightControl *member : m_lights) {
        if (!member->setEffect(effect, error))
            return false;
    }
    return true;
}

bool VirtualGroup::setAlert(Alert alert, Error *error)
{
    for (LightControl *member : m_lights) {
        if (!member->setAlert(alert, error))
            return false;
    }
    return true;
}

void VirtualGroup::collectReal(const VirtualGroup *group, QList<LightControl *> *out)
{
    for (LightControl *member : group->m_lights) {
        if (const auto *nested = dynamic_cast<const VirtualGroup *>(member))
            collectReal(nested, out);
        else if (!out->contains(member))
            out->append(member);
    }
}

bool VirtualGroup::transactionOn(const QList<LightControl *> &lights,
                                 int index,
                                 std::optional<int> transitionTime,
                                 const Changes &changes,
                                 Error *error)
{
    if (index >= lights.size())
        return changes ? changes(error) : true;

    return lights.at(index)->stateChangeTransaction(
        transitionTime,
        [&](Error *inner) { return transactionOn(lights, index + 1, transitionTime, changes, inner); },
        error);
}

bool VirtualGroup::stateChangeTransaction(std::optional<int> transitionTime,
                                          const Changes &changes,
                                          Error *error)
{
    QList<LightControl *> real;
    collectReal(this, &real);
    // the innermost transaction commits first, so open them last to first
    std::reverse(real.begin(), real.end());
    return transactionOn(real, 0, transitionTime, changes, error);
}

QString VirtualGroup::toString() const
{
    QStringList children;
    for (const LightControl *member : m_lights)
        children.append(member->toString());
    return QStringLiteral("%1(%2)[%3]").arg(m_id).arg(m_name, children.join(QLatin1Char(',')));
}

} // namespace huelink
