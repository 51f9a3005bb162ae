#pragma once

#include <deque>
#include <map>
#include <memory>
#include <optional>
#include <ostream>

#include <QJsonDocument>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QUrl>

#include "hue_bridge.h"
#include "hue_config.h"
#include "hue_transport.h"

// string conversion so catch can print QString
inline std::ostream &operator<<(std::ostream &os, const QString &str)
{
    os << str.toStdString();
    return os;
}

inline const char kTestUsername[] = "huelinktestuser";

inline QJsonObject jsonObject(const char *text)
{
    return QJsonDocument::fromJson(QByteArray(text)).object();
}

inline QList<QJsonObject> jsonList(const char *text)
{
    QList<QJsonObject> out;
    huelink::parseResponseBody(QByteArray(text), &out);
    return out;
}

// Three lights and one group. Light 5 is in CT mode.
inline const char kFullState[] = R"({
    "config": { "name": "Living Bridge", "swversion": "01003372" },
    "lights": {
        "1": { "name": "Desk", "type": "Extended color light",
               "state": { "on": true, "bri": 200, "hue": 10000, "sat": 120, "xy": [0.4, 0.5],
                          "ct": 250, "colormode": "hs", "effect": "none", "alert": "none", "reachable": true } },
        "2": { "name": "Shelf",
               "state": { "on": false, "bri": 0, "hue": 0, "sat": 0, "xy": [0.1, 0.2],
                          "ct": 153, "colormode": "XY", "effect": "colorloop" } },
        "5": { "name": "Ceiling",
               "state": { "on": true, "bri": 100, "hue": 0, "sat": 0, "xy": [0.3, 0.3],
                          "ct": 300, "colormode": "ct", "effect": "none" } }
    },
    "groups": {
        "1": { "name": "Office", "lights": ["1", "2"] }
    },
    "schedules": {}
})";

struct RecordedRequest {
    huelink::Method method;
    QString path;
    std::optional<QJsonObject> body;
};

// Answers requests from canned replies. Queued replies are used once and
// take precedence over standing ones. Requests without a reply fail with a
// Comm error.
class FakeTransport : public huelink::Transport
{
public:
    struct Reply {
        bool ok = true;
        QList<QJsonObject> response;
        huelink::Error error;
    };

    void on(huelink::Method method, const QString &path, const QList<QJsonObject> &response)
    {
        m_standing[key(method, path)] = Reply{true, response, huelink::Error()};
    }

    void queue(huelink::Method method, const QString &path, const QList<QJsonObject> &response)
    {
        m_queued[key(method, path)].push_back(Reply{true, response, huelink::Error()});
    }

    void queueFailure(huelink::Method method, const QString &path, const huelink::Error &error)
    {
        m_queued[key(method, path)].push_back(Reply{false, {}, error});
    }

    bool request(huelink::Method method,
                 const QString &path,
                 const std::optional<QJsonObject> &body,
                 QList<QJsonObject> *response,
                 huelink::Error *error = nullptr) override
    {
        requests.append(RecordedRequest{method, path, body});

        const QString k = key(method, path);
        Reply reply;
        auto queued = m_queued.find(k);
        if (queued != m_queued.end() && !queued->second.empty()) {
            reply = queued->second.front();
            queued->second.pop_front();
        } else if (m_standing.count(k) > 0) {
            reply = m_standing.at(k);
        } else {
            return huelink::fail(error, huelink::Error::comm(QStringLiteral("No fake reply for ") + k));
        }

        if (!reply.ok)
            return huelink::fail(error, reply.error);
        if (response)
            *response = reply.response;
        return true;
    }

    int count(huelink::Method method, const QString &path) const
    {
        int n = 0;
        for (const RecordedRequest &r : requests) {
            if (r.method == method && r.path == path)
                ++n;
        }
        return n;
    }

    int count(huelink::Method method) const
    {
        int n = 0;
        for (const RecordedRequest &r : requests) {
            if (r.method == method)
                ++n;
        }
        return n;
    }

    QList<RecordedRequest> requests;

private:
    static QString key(huelink::Method method, const QString &path)
    {
        return QLatin1String(huelink::methodName(method)) + QLatin1Char(' ') + path;
    }

    std::map<QString, Reply> m_standing;
    std::map<QString, std::deque<Reply>> m_queued;
};

inline huelink::BridgeOptions testOptions()
{
    huelink::BridgeOptions options;
    options.deviceType = QStringLiteral("huelink#test");
    options.grantWaitMs = 2000;
    options.grantPollIntervalMs = 1;
    options.grantPollJitterMs = 0;
    return options;
}

inline std::unique_ptr<huelink::Bridge> makeBridge(FakeTransport **fake,
                                                   const QString &username = QString(),
                                                   const huelink::BridgeOptions &options = testOptions())
{
    auto transport = std::make_unique<FakeTransport>();
    *fake = transport.get();
    return std::make_unique<huelink::Bridge>(QUrl(QStringLiteral("http://192.168.1.2/")), username,
                                             std::move(transport), options);
}

// Authenticated by trying the username, initial sync done, request log
// cleared.
inline std::unique_ptr<huelink::Bridge> syncedBridge(FakeTransport **fake,
                                                     const huelink::BridgeOptions &options = testOptions())
{
    auto bridge = makeBridge(fake, QString::fromLatin1(kTestUsername), options);
    (*fake)->on(huelink::Method::Get, QStringLiteral("api/huelinktestuser"), jsonList(kFullState));
    bridge->authenticate(false);
    (*fake)->requests.clear();
    return bridge;
}

inline QList<QJsonObject> successReply(const char *path, const QJsonValue &value)
{
    QJsonObject success;
    success.insert(QString::fromLatin1(path), value);
    QJsonObject entry;
    entry.insert(QStringLiteral("success"), success);
    return {entry};
}
