#include "hue_transport.h"

#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>

namespace huelink {

const char *methodName(Method method)
{
    switch (method) {
    case Method::Get:
        return "GET";
    case Method::Post:
        return "POST";
    case Method::Put:
        return "PUT";
    case Method::Delete:
        return "DELETE";
    }
    return "GET";
}

bool parseResponseBody(const QByteArray &payload, QList<QJsonObject> *out, Error *error)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(payload, &parseError);
    if (parseError.error != QJsonParseError::NoError)
        return fail(error, Error::comm(QStringLiteral("Invalid JSON from Hue bridge: %1").arg(parseError.errorString())));

    QList<QJsonObject> result;
    if (doc.isObject()) {
        result.append(doc.object());
    } else if (doc.isArray()) {
        const QJsonArray arr = doc.array();
        for (const QJsonValue &value : arr) {
            if (!value.isObject())
                return fail(error, Error::comm(QStringLiteral("Unexpected response from Hue bridge: array entry is not an object")));
            result.append(value.toObject());
        }
    } else {
        return fail(error, Error::comm(QStringLiteral("Unexpected response from Hue bridge")));
    }

    if (out)
        *out = result;
    return true;
}

} // namespace huelink
