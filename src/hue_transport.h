#pragma once

#include <optional>

#include <QByteArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QUrl>

#include "hue_error.h"

namespace huelink {

enum class Method {
    Get,
    Post,
    Put,
    Delete
};

const char *methodName(Method method);

// Generic HTTP+JSON transport towards one bridge. Paths are relative to the
// bridge base URL. The response body is normalized to a list of objects.
class Transport
{
public:
    virtual ~Transport() = default;

    virtual bool request(Method method,
                         const QString &path,
                         const std::optional<QJsonObject> &body,
                         QList<QJsonObject> *response,
                         Error *error = nullptr) = 0;
};

// Fetches the UPnP device description a discovery response points to.
class DescriptionFetcher
{
public:
    virtual ~DescriptionFetcher() = default;

    virtual bool fetch(const QUrl &url, QByteArray *payload, Error *error = nullptr) = 0;
};

// Splits a response body into its JSON objects: a single object or an array
// of objects. Anything else is a Comm error.
bool parseResponseBody(const QByteArray &payload, QList<QJsonObject> *out, Error *error = nullptr);

} // namespace huelink
