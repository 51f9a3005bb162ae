#pragma once

#include <map>
#include <memory>
#include <optional>

#include <QHostAddress>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QUrl>

#include "hue_config.h"
#include "hue_error.h"
#include "hue_transport.h"

namespace huelink {

class Group;
class Light;
class LightControl;
class VirtualGroup;

// One Hue bridge and the lights and groups it reported.
//
// A Bridge owns every Light, Group and VirtualGroup it hands out; the
// pointers stay valid for the lifetime of the Bridge. Ids that disappear
// from the bridge are kept. A Bridge is meant to be used from one thread at
// a time, only pending transactions are kept per thread.
class Bridge
{
public:
    // transport defaults to HTTP towards baseUrl.
    explicit Bridge(const QUrl &baseUrl,
                    const QString &username = QString(),
                    std::unique_ptr<Transport> transport = nullptr,
                    BridgeOptions options = BridgeOptions());
    // For a known address, base URL http://<address>/.
    explicit Bridge(const QHostAddress &address,
                    const QString &username = QString(),
                    std::unique_ptr<Transport> transport = nullptr,
                    BridgeOptions options = BridgeOptions());
    ~Bridge();

    Bridge(const Bridge &) = delete;
    Bridge &operator=(const Bridge &) = delete;

    QString udn() const { return m_udn; }
    void setUdn(const QString &udn) { m_udn = udn; }
    QUrl baseUrl() const { return m_baseUrl; }
    const BridgeOptions &options() const { return m_options; }

    QString username() const { return m_username; }
    // 10-40 of [-_a-zA-Z0-9], surrounding whitespace ignored. An empty
    // string clears the username. A different username drops the
    // authentication.
    bool setUsername(const QString &username, Error *error = nullptr);

    bool isAuthenticated() const { return m_authenticated; }
    bool isInitialSyncDone() const { return m_initialSyncDone; }

    // Tries the given username first. If that is not known to the bridge a
    // new user is requested, with waitForGrant this repeats until the link
    // button is pressed or BridgeOptions::grantWaitMs ran out. Does the
    // initial full sync once authenticated; a failing sync is reported but
    // keeps the authentication.
    bool authenticate(const QString &username, bool waitForGrant, Error *error = nullptr);
    bool authenticate(bool waitForGrant, Error *error = nullptr);

    // Fails with a State error unless authenticated, syncs if that never
    // happened.
    bool checkAuthAndSync(Error *error = nullptr);
    // Reloads config, lights and groups.
    bool sync(Error *error = nullptr);

    QString name(Error *error = nullptr);
    bool setName(const QString &name, Error *error = nullptr);

    QList<Light *> lights(Error *error = nullptr);
    Light *light(int id, Error *error = nullptr);
    QList<int> lightIds(Error *error = nullptr);

    QList<Group *> groups(Error *error = nullptr);
    Group *group(int id, Error *error = nullptr);
    QList<int> groupIds(Error *error = nullptr);

    QList<VirtualGroup *> virtualGroups() const;
    VirtualGroup *virtualGroup(int id) const;
    QList<int> virtualGroupIds() const;
    VirtualGroup *createVirtualGroup(int id,
                                     const QString &name,
                                     const QList<LightControl *> &members = QList<LightControl *>(),
                                     Error *error = nullptr);

    // Starts a search for new lights on the bridge. Results come in over
    // roughly a minute through newLights().
    bool searchForNewLights(Error *error = nullptr);
    // Lights found by the last search. Empty also while a scan runs.
    QList<Light *> newLights(Error *error = nullptr);
    bool isScanActive() const { return m_scanActive; }

    // Request below api/<username>/, after checkAuthAndSync().
    bool request(Method method,
                 const QString &path,
                 const std::optional<QJsonObject> &body,
                 QList<QJsonObject> *response,
                 Error *error = nullptr);
    // Like request(), but every response entry must be a success entry.
    bool checkedSuccessRequest(Method method,
                               const QString &path,
                               const std::optional<QJsonObject> &body,
                               QList<QJsonObject> *response,
                               Error *error = nullptr);

    QString toString() const;

private:
    bool completeSync(const QString &username, Error *error);
    bool parseLights(const QJsonObject &json, bool requireState, Error *error);
    bool parseGroups(const QJsonObject &json, Error *error);
    Error requestUser(const QString &username, bool waitForGrant);
    QString userPath(const QString &username, const QString &path) const;

    QUrl m_baseUrl;
    QString m_udn;
    QString m_username;
    BridgeOptions m_options;
    std::unique_ptr<Transport> m_transport;

    QString m_name;
    bool m_authenticated = false;
    bool m_initialSyncDone = false;
    bool m_scanActive = false;

    std::map<int, std::unique_ptr<Light>> m_lights;
    std::map<int, std::unique_ptr<Group>> m_groups;
    std::map<int, std::unique_ptr<VirtualGroup>> m_virtualGroups;
};

} // namespace huelink
