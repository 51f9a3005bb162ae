#include "hue_light.h"

#include <QDateTime>
#include <QJsonArray>
#include <QLoggingCategory>
#include <QScopeGuard>

#include "hue_bridge.h"

Q_LOGGING_CATEGORY(lightLog, "huelink.light");

namespace huelink {

namespace {

bool parseError(Error *error, int id, const QString &detail)
{
    return fail(error, Error::comm(QStringLiteral("Light %1 result parsing failed: %2").arg(id).arg(detail)));
}

bool readNumber(const QJsonObject &obj, const char *key, int id, int *out, Error *error)
{
    const QJsonValue value = obj.value(QLatin1String(key));
    if (value.isUndefined())
        return true;
    if (!value.isDouble())
        return parseError(error, id, QStringLiteral("'%1' is not a number").arg(QLatin1String(key)));
    *out = value.toInt();
    return true;
}

bool readXy(const QJsonValue &value, double *x, double *y)
{
    const QJsonArray xy = value.toArray();
    if (!value.isArray() || xy.size() != 2 || !xy.at(0).isDouble() || !xy.at(1).isDouble())
        return false;
    *x = xy.at(0).toDouble();
    *y = xy.at(1).toDouble();
    return true;
}

} // namespace

Light::Light(Bridge &bridge, int id)
    : StateTarget(bridge, id)
    , m_autoSyncInterval(bridge.options().lightAutoSyncMs)
{
}

QString Light::name(Error *error)
{
    autoSync(error);
    return m_name;
}

bool Light::setName(const QString &name, Error *error)
{
    const QString trimmed = name.trimmed();
    if (trimmed.size() > 32) {
        return fail(error, Error::validation(QStringLiteral(
                               "Name (without leading or trailing whitespace) has to be at most 32 characters long")));
    }

    const QString path = QStringLiteral("lights/%1").arg(id());
    QJsonObject body;
    body.insert(QStringLiteral("name"), trimmed);
    QList<QJsonObject> response;
    if (!m_bridge.checkedSuccessRequest(Method::Put, path, body, &response, error))
        return false;

    const QJsonObject success = response.isEmpty() ? QJsonObject() : response.first().value(QStringLiteral("success")).toObject();
    const QJsonValue actual = success.value(QStringLiteral("/lights/%1/name").arg(id()));
    m_name = actual.isString() ? actual.toString() : trimmed;
    return true;
}

bool Light::isOn(Error *error)
{
    autoSync(error);
    return m_state.on;
}

int Light::brightness(Error *error)
{
    autoSync(error);
    return m_state.brightness;
}

int Light::hue(Error *error)
{
    autoSync(error);
    return m_state.hue;
}

int Light::saturation(Error *error)
{
    autoSync(error);
    return m_state.saturation;
}

double Light::cieX(Error *error)
{
    autoSync(error);
    return m_state.cieX;
}

double Light::cieY(Error *error)
{
    autoSync(error);
    return m_state.cieY;
}

int Light::colorTemperature(Error *error)
{
    autoSync(error);
    return m_state.colorTemperature;
}

std::optional<ColorMode> Light::colorMode(Error *error)
{
    autoSync(error);
    return m_state.colorMode;
}

Effect Light::effect(Error *error)
{
    autoSync(error);
    return m_state.effect;
}

bool Light::autoSync(Error *error)
{
    if (m_syncing || !m_autoSyncInterval || *m_autoSyncInterval == 0)
        return true;
    if (QDateTime::currentMSecsSinceEpoch() - m_lastSyncMs <= *m_autoSyncInterval)
        return true;
    return refresh(error);
}

bool Light::refresh(Error *error)
{
    // parsing or a full sync below must not start another refresh
    m_syncing = true;
    auto done = qScopeGuard([this]() { m_syncing = false; });

    qCDebug(lightLog) << "Refreshing light" << id();
    QList<QJsonObject> response;
    if (!m_bridge.request(Method::Get, QStringLiteral("lights/%1").arg(id()), std::nullopt, &response, error))
        return false;
    if (response.isEmpty())
        return fail(error, Error::comm(QStringLiteral("Empty response for light %1").arg(id())));

    const QJsonObject &json = response.first();
    if (json.contains(QStringLiteral("error")))
        return fail(error, Error::bridge(json.value(QStringLiteral("error")).toObject()));

    return parse(json, true, error);
}

bool Light::parse(const QJsonObject &json, bool requireState, Error *error)
{
    const QJsonValue nameValue = json.value(QStringLiteral("name"));
    if (!nameValue.isString())
        return parseError(error, id(), QStringLiteral("'name' missing or not a string"));

    const QJsonValue stateValue = json.value(QStringLiteral("state"));
    if (stateValue.isUndefined() && !requireState) {
        m_name = nameValue.toString();
        return true;
    }
    if (!stateValue.isObject())
        return parseError(error, id(), QStringLiteral("'state' missing or not an object"));

    const QJsonObject state = stateValue.toObject();
    LightState next = m_state;

    const QJsonValue on = state.value(QStringLiteral("on"));
    if (!on.isUndefined()) {
        if (!on.isBool())
            return parseError(error, id(), QStringLiteral("'on' is not a boolean"));
        next.on = on.toBool();
    }

    if (!readNumber(state, "bri", id(), &next.brightness, error)
        || !readNumber(state, "hue", id(), &next.hue, error)
        || !readNumber(state, "sat", id(), &next.saturation, error)
        || !readNumber(state, "ct", id(), &next.colorTemperature, error)) {
        return false;
    }

    const QJsonValue xy = state.value(QStringLiteral("xy"));
    if (!xy.isUndefined() && !readXy(xy, &next.cieX, &next.cieY))
        return parseError(error, id(), QStringLiteral("'xy' is not a pair of numbers"));

    const QJsonValue colormode = state.value(QStringLiteral("colormode"));
    if (!colormode.isUndefined()) {
        const std::optional<ColorMode> mode = colorModeFromName(colormode.toString());
        if (!colormode.isString() || !mode)
            return parseError(error, id(), QStringLiteral("unknown colormode %1").arg(colormode.toVariant().toString()));
        next.colorMode = mode;
    }

    const QJsonValue effect = state.value(QStringLiteral("effect"));
    if (!effect.isUndefined()) {
        const std::optional<Effect> parsed = effectFromName(effect.toString());
        if (!effect.isString() || !parsed)
            return parseError(error, id(), QStringLiteral("unknown effect %1").arg(effect.toVariant().toString()));
        next.effect = *parsed;
    }

    m_name = nameValue.toString();
    m_state = next;
    m_lastSyncMs = QDateTime::currentMSecsSinceEpoch();
    return true;
}

QString Light::statePath() const
{
    return QStringLiteral("lights/%1/state").arg(id());
}

void Light::applyConfirmed(const QJsonObject &fields)
{
    // the bridge ranks xy over ct over hs when a change carries several
    std::optional<ColorMode> mode;
    for (auto it = fields.constBegin(); it != fields.constEnd(); ++it) {
        const QString &key = it.key();
        const QJsonValue &value = it.value();
        if (key == QLatin1String("on")) {
            m_state.on = value.toBool();
        } else if (key == QLatin1String("bri")) {
            m_state.brightness = value.toInt();
        } else if (key == QLatin1String("hue")) {
            m_state.hue = value.toInt();
            if (!mode)
                mode = ColorMode::HS;
        } else if (key == QLatin1String("sat")) {
            m_state.saturation = value.toInt();
            if (!mode)
                mode = ColorMode::HS;
        } else if (key == QLatin1String("xy")) {
            if (readXy(value, &m_state.cieX, &m_state.cieY))
                mode = ColorMode::XY;
        } else if (key == QLatin1String("ct")) {
            m_state.colorTemperature = value.toInt();
            if (mode != ColorMode::XY)
                mode = ColorMode::CT;
        } else if (key == QLatin1String("effect")) {
            if (const std::optional<Effect> effect = effectFromName(value.toString()))
                m_state.effect = *effect;
        }
    }
    if (mode)
        m_state.colorMode = mode;
}

bool Light::resync(Error *error)
{
    return refresh(error);
}

QString Light::toString() const
{
    QString color;
    if (m_state.colorMode == ColorMode::CT) {
        color = QStringLiteral("CT:%1").arg(m_state.colorTemperature);
    } else if (m_state.colorMode == ColorMode::HS) {
        color = QStringLiteral("HS:%1/%2").arg(m_state.hue).arg(m_state.saturation);
    } else if (m_state.colorMode == ColorMode::XY) {
        color = QStringLiteral("XY:%1/%2").arg(m_state.cieX).arg(m_state.cieY);
    }
    return QStringLiteral("%1(%2)[%3,%4]")
        .arg(id())
        .arg(m_name, m_state.on ? QStringLiteral("ON") : QStringLiteral("OFF"), color);
}

} // namespace huelink
