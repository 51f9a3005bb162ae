#include "hue_bridge.h"

#include <QElapsedTimer>
#include <QLoggingCategory>
#include <QRandomGenerator>
#include <QRegularExpression>
#include <QThread>

#include "hue_group.h"
#include "hue_http.h"
#include "hue_light.h"
#include "hue_virtualgroup.h"

Q_LOGGING_CATEGORY(bridgeLog, "huelink.bridge");

namespace huelink {

namespace {

constexpr int kLinkButtonNotPressed = 101;

bool isValidUsername(const QString &username)
{
    static const QRegularExpression pattern(QStringLiteral("^\\s*[-\\w]{10,40}\\s*$"));
    return username.trimmed().isEmpty() || pattern.match(username).hasMatch();
}

Error invalidUsername()
{
    return Error::validation(QStringLiteral(
        "A username must be 10-40 characters long and may only contain the characters -,_,a-z,A-Z,0-9"));
}

// Both empty or the same string.
bool equalEnough(const QString &a, const QString &b)
{
    const QString left = a.trimmed();
    const QString right = b.trimmed();
    return (left.isEmpty() && right.isEmpty()) || left == right;
}

QUrl baseUrlFor(const QHostAddress &address)
{
    QUrl url;
    url.setScheme(QStringLiteral("http"));
    url.setHost(address.toString());
    url.setPath(QStringLiteral("/"));
    return url;
}

bool parseId(const QString &key, int *id)
{
    bool ok = false;
    const int value = key.toInt(&ok);
    if (!ok || value < 0)
        return false;
    *id = value;
    return true;
}

} // namespace

Bridge::Bridge(const QUrl &baseUrl,
               const QString &username,
               std::unique_ptr<Transport> transport,
               BridgeOptions options)
    : m_baseUrl(baseUrl)
    , m_username(username.trimmed())
    , m_options(std::move(options))
    , m_transport(std::move(transport))
{
    if (!m_transport)
        m_transport = std::make_unique<HttpTransport>(m_baseUrl, m_options.requestTimeoutMs);

    // always there, holds every light
    m_groups.emplace(0, std::make_unique<Group>(*this, 0));
}

Bridge::Bridge(const QHostAddress &address,
               const QString &username,
               std::unique_ptr<Transport> transport,
               BridgeOptions options)
    : Bridge(baseUrlFor(address), username, std::move(transport), std::move(options))
{
}

Bridge::~Bridge() = default;

bool Bridge::setUsername(const QString &username, Error *error)
{
    if (!isValidUsername(username))
        return fail(error, invalidUsername());
    if (!equalEnough(m_username, username))
        m_authenticated = false;
    m_username = username.trimmed();
    return true;
}

bool Bridge::authenticate(bool waitForGrant, Error *error)
{
    return authenticate(m_username, waitForGrant, error);
}

bool Bridge::authenticate(const QString &username, bool waitForGrant, Error *error)
{
    if (!isValidUsername(username))
        return fail(error, invalidUsername());

    const QString candidate = username.trimmed();
    if (!m_authenticated || !equalEnough(m_username, candidate)) {
        // The bridge answers "link button not pressed" for unknown users as
        // well, so an existing user can only be detected by using it.
        if (!candidate.isEmpty()) {
            Error userError;
            if (completeSync(candidate, &userError)) {
                m_authenticated = true;
                qCInfo(bridgeLog) << "Authenticated on" << m_baseUrl.toString() << "with existing username";
            } else {
                qCInfo(bridgeLog) << "Username not accepted by" << m_baseUrl.toString() << ":" << userError.toString();
            }
        }

        if (!m_authenticated) {
            const Error grantError = requestUser(candidate, waitForGrant);
            if (!m_authenticated)
                return fail(error, grantError);
        }
    }

    if (!m_initialSyncDone && !completeSync(m_username, error))
        return false;

    return m_authenticated;
}

Error Bridge::requestUser(const QString &username, bool waitForGrant)
{
    Error last = Error::comm(QStringLiteral("No answer to create user request"));
    QElapsedTimer elapsed;
    elapsed.start();

    for (;;) {
        QJsonObject body;
        body.insert(QStringLiteral("devicetype"), m_options.deviceType);
        if (username.size() >= 10)
            body.insert(QStringLiteral("username"), username);

        // not below api/<username>/, there is no user yet
        QList<QJsonObject> response;
        Error requestError;
        if (!m_transport->request(Method::Post, QStringLiteral("api"), body, &response, &requestError)) {
            qCWarning(bridgeLog) << "Create user request failed:" << requestError.toString();
            last = requestError;
        } else {
            const QJsonObject entry = response.value(0);
            const QJsonObject success = entry.value(QStringLiteral("success")).toObject();
            const QJsonObject errorObj = entry.value(QStringLiteral("error")).toObject();
            if (success.contains(QStringLiteral("username"))) {
                m_username = success.value(QStringLiteral("username")).toString().trimmed();
                m_authenticated = true;
                qCInfo(bridgeLog) << "Created user on" << m_baseUrl.toString();
                return Error();
            }
            if (errorObj.contains(QStringLiteral("type"))) {
                last = Error::bridge(errorObj);
                if (last.bridgeType != kLinkButtonNotPressed) {
                    qCWarning(bridgeLog) << "Got unexpected error on create user:" << last.toString();
                    return last;
                }
                qCDebug(bridgeLog) << "Link button on" << m_baseUrl.toString() << "not pressed yet";
            }
        }

        if (!waitForGrant)
            break;
        if (elapsed.elapsed() > m_options.grantWaitMs) {
            qCInfo(bridgeLog) << "Gave up waiting for the link button after" << elapsed.elapsed() << "ms";
            break;
        }
        const int jitter = m_options.grantPollJitterMs > 0
            ? int(QRandomGenerator::global()->bounded(m_options.grantPollJitterMs + 1))
            : 0;
        QThread::msleep(static_cast<unsigned long>(m_options.grantPollIntervalMs + jitter));
    }

    return last;
}

bool Bridge::checkAuthAndSync(Error *error)
{
    if (!m_authenticated)
        return fail(error, Error::state(QStringLiteral("Need to authenticate first.")));
    if (!m_initialSyncDone)
        return completeSync(m_username, error);
    return true;
}

bool Bridge::sync(Error *error)
{
    if (!m_authenticated)
        return fail(error, Error::state(QStringLiteral("Need to authenticate first.")));
    return completeSync(m_username, error);
}

QString Bridge::userPath(const QString &username, const QString &path) const
{
    QString out = QStringLiteral("api/") + username.trimmed();
    if (!path.isEmpty())
        out += QLatin1Char('/') + path;
    return out;
}

bool Bridge::completeSync(const QString &username, Error *error)
{
    qCDebug(bridgeLog) << "Full sync of" << m_baseUrl.toString();

    QList<QJsonObject> response;
    if (!m_transport->request(Method::Get, userPath(username, QString()), std::nullopt, &response, error))
        return false;
    if (response.isEmpty())
        return fail(error, Error::comm(QStringLiteral("Empty response")));

    const QJsonObject &datastore = response.first();
    if (datastore.contains(QStringLiteral("error")))
        return fail(error, Error::bridge(datastore.value(QStringLiteral("error")).toObject()));

    const QJsonValue config = datastore.value(QStringLiteral("config"));
    const QJsonValue lights = datastore.value(QStringLiteral("lights"));
    const QJsonValue groups = datastore.value(QStringLiteral("groups"));
    if (!config.isObject() || !lights.isObject() || !groups.isObject()) {
        return fail(error, Error::comm(QStringLiteral(
                               "Incomplete response. Missing at least one of config/lights/groups")));
    }

    const QJsonValue name = config.toObject().value(QStringLiteral("name"));
    if (!name.isString())
        return fail(error, Error::comm(QStringLiteral("Config result parsing failed: 'name' missing or not a string")));
    m_name = name.toString();

    if (!parseLights(lights.toObject(), true, error) || !parseGroups(groups.toObject(), error)) {
        qCWarning(bridgeLog) << "Sync of" << m_baseUrl.toString() << "failed:" << (error ? error->toString() : QString());
        return false;
    }

    if (!equalEnough(m_username, username))
        m_authenticated = false;
    m_username = username.trimmed();
    m_initialSyncDone = true;
    qCDebug(bridgeLog) << "Synced" << m_lights.size() << "lights and" << m_groups.size() << "groups";
    return true;
}

bool Bridge::parseLights(const QJsonObject &json, bool requireState, Error *error)
{
    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        int id = -1;
        if (!parseId(it.key(), &id))
            return fail(error, Error::comm(QStringLiteral("Lights result parsing failed: unexpected id %1").arg(it.key())));
        if (!it.value().isObject())
            return fail(error, Error::comm(QStringLiteral("Lights result parsing failed: light %1 is not an object").arg(id)));

        auto found = m_lights.find(id);
        if (found == m_lights.end())
            found = m_lights.emplace(id, std::make_unique<Light>(*this, id)).first;
        if (!found->second->parse(it.value().toObject(), requireState, error))
            return false;
    }

    m_groups.at(0)->setMembers(m_lights);
    return true;
}

bool Bridge::parseGroups(const QJsonObject &json, Error *error)
{
    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        int id = -1;
        if (!parseId(it.key(), &id))
            return fail(error, Error::comm(QStringLiteral("Groups result parsing failed: unexpected id %1").arg(it.key())));
        if (!it.value().isObject())
            return fail(error, Error::comm(QStringLiteral("Groups result parsing failed: group %1 is not an object").arg(id)));

        auto found = m_groups.find(id);
        if (found == m_groups.end())
            found = m_groups.emplace(id, std::make_unique<Group>(*this, id)).first;
        if (!found->second->parse(it.value().toObject(), m_lights, error))
            return false;
    }

    // whatever the bridge says, group 0 is all lights
    m_groups.at(0)->setMembers(m_lights);
    return true;
}

QString Bridge::name(Error *error)
{
    if (!checkAuthAndSync(error))
        return QString();
    return m_name;
}

bool Bridge::setName(const QString &name, Error *error)
{
    const QString trimmed = name.trimmed();
    if (trimmed.size() < 4 || trimmed.size() > 16) {
        return fail(error, Error::validation(QStringLiteral(
                               "Name (without leading or trailing whitespace) has to be 4-16 characters long")));
    }

    QJsonObject body;
    body.insert(QStringLiteral("name"), trimmed);
    if (!checkedSuccessRequest(Method::Put, QStringLiteral("config"), body, nullptr, error))
        return false;
    m_name = trimmed;
    return true;
}

QList<Light *> Bridge::lights(Error *error)
{
    QList<Light *> out;
    if (!checkAuthAndSync(error))
        return out;
    for (const auto &entry : m_lights)
        out.append(entry.second.get());
    return out;
}

Light *Bridge::light(int id, Error *error)
{
    if (!checkAuthAndSync(error))
        return nullptr;
    const auto it = m_lights.find(id);
    return it == m_lights.end() ? nullptr : it->second.get();
}

QList<int> Bridge::lightIds(Error *error)
{
    QList<int> out;
    if (!checkAuthAndSync(error))
        return out;
    for (const auto &entry : m_lights)
        out.append(entry.first);
    return out;
}

QList<Group *> Bridge::groups(Error *error)
{
    QList<Group *> out;
    if (!checkAuthAndSync(error))
        return out;
    for (const auto &entry : m_groups)
        out.append(entry.second.get());
    return out;
}

Group *Bridge::group(int id, Error *error)
{
    if (!checkAuthAndSync(error))
        return nullptr;
    const auto it = m_groups.find(id);
    return it == m_groups.end() ? nullptr : it->second.get();
}

QList<int> Bridge::groupIds(Error *error)
{
    QList<int> out;
    if (!checkAuthAndSync(error))
        return out;
    for (const auto &entry : m_groups)
        out.append(entry.first);
    return out;
}

QList<VirtualGroup *> Bridge::virtualGroups() const
{
    QList<VirtualGroup *> out;
    for (const auto &entry : m_virtualGroups)
        out.append(entry.second.get());
    return out;
}

VirtualGroup *Bridge::virtualGroup(int id) const
{
    const auto it = m_virtualGroups.find(id);
    return it == m_virtualGroups.end() ? nullptr : it->second.get();
}

QList<int> Bridge::virtualGroupIds() const
{
    QList<int> out;
    for (const auto &entry : m_virtualGroups)
        out.append(entry.first);
    return out;
}

VirtualGroup *Bridge::createVirtualGroup(int id,
                                         const QString &name,
                                         const QList<LightControl *> &members,
                                         Error *error)
{
    if (id < 0) {
        fail(error, Error::validation(QStringLiteral("id has to be non-negative")));
        return nullptr;
    }
    if (m_virtualGroups.count(id) > 0) {
        fail(error, Error::validation(QStringLiteral("There is already a virtual group with id %1 on %2")
                                          .arg(id)
                                          .arg(toString())));
        return nullptr;
    }

    std::unique_ptr<VirtualGroup> group(new VirtualGroup(*this, id, name));
    for (LightControl *member : members) {
        if (!group->add(member, error))
            return nullptr;
    }

    VirtualGroup *out = group.get();
    m_virtualGroups.emplace(id, std::move(group));
    return out;
}

bool Bridge::searchForNewLights(Error *error)
{
    return checkedSuccessRequest(Method::Post, QStringLiteral("lights"), std::nullopt, nullptr, error);
}

QList<Light *> Bridge::newLights(Error *error)
{
    QList<Light *> out;

    QList<QJsonObject> response;
    if (!request(Method::Get, QStringLiteral("lights/new"), std::nullopt, &response, error))
        return out;
    if (response.isEmpty()) {
        fail(error, Error::comm(QStringLiteral("Empty response")));
        return out;
    }

    const QJsonObject &json = response.first();
    if (json.contains(QStringLiteral("error"))) {
        fail(error, Error::bridge(json.value(QStringLiteral("error")).toObject()));
        return out;
    }

    const QJsonValue lastscan = json.value(QStringLiteral("lastscan"));
    if (!lastscan.isString()) {
        fail(error, Error::comm(QStringLiteral("New lights result parsing failed: 'lastscan' missing")));
        return out;
    }
    m_scanActive = lastscan.toString() == QLatin1String("active");

    QJsonObject found;
    QList<int> ids;
    for (auto it = json.constBegin(); it != json.constEnd(); ++it) {
        int id = -1;
        if (!parseId(it.key(), &id))
            continue;
        found.insert(it.key(), it.value());
        ids.append(id);
    }

    // new lights are reported with their name only
    if (!parseLights(found, false, error))
        return out;

    for (int id : ids)
        out.append(m_lights.at(id).get());
    return out;
}

bool Bridge::request(Method method,
                     const QString &path,
                     const std::optional<QJsonObject> &body,
                     QList<QJsonObject> *response,
                     Error *error)
{
    if (!checkAuthAndSync(error))
        return false;
    return m_transport->request(method, userPath(m_username, path), body, response, error);
}

bool Bridge::checkedSuccessRequest(Method method,
                                   const QString &path,
                                   const std::optional<QJsonObject> &body,
                                   QList<QJsonObject> *response,
                                   Error *error)
{
    QList<QJsonObject> entries;
    if (!request(method, path, body, &entries, error))
        return false;
    if (entries.isEmpty())
        return fail(error, Error::comm(QStringLiteral("Empty response")));

    for (const QJsonObject &entry : entries) {
        if (!entry.contains(QStringLiteral("success")))
            return fail(error, Error::bridge(entry.value(QStringLiteral("error")).toObject()));
    }

    if (response)
        *response = entries;
    return true;
}

QString Bridge::toString() const
{
    return QStringLiteral("%1@%2#%3")
        .arg(m_initialSyncDone ? m_name : QStringLiteral("<Unsynced Hue Bridge>"),
             m_baseUrl.toString(),
             m_udn);
}

} // namespace huelink
