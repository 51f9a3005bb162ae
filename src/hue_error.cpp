#include "hue_error.h"

namespace huelink {

namespace {

Error make(ErrorKind kind, const QString &message)
{
    Error err;
    err.kind = kind;
    err.message = message;
    err.payload.insert(QStringLiteral("description"), message);
    return err;
}

} // namespace

const char *errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::None:
        return "ok";
    case ErrorKind::Validation:
        return "validation";
    case ErrorKind::Comm:
        return "comm";
    case ErrorKind::Configuration:
        return "configuration";
    case ErrorKind::Unsupported:
        return "unsupported";
    case ErrorKind::State:
        return "state";
    }
    return "unknown";
}

QString Error::toString() const
{
    if (isOk())
        return QStringLiteral("ok");
    if (bridgeType != 0)
        return QStringLiteral("%1: %2 (bridge error %3)")
            .arg(QLatin1String(errorKindName(kind)), message)
            .arg(bridgeType);
    return QStringLiteral("%1: %2").arg(QLatin1String(errorKindName(kind)), message);
}

Error Error::validation(const QString &message)
{
    return make(ErrorKind::Validation, message);
}

Error Error::comm(const QString &message)
{
    return make(ErrorKind::Comm, message);
}

Error Error::bridge(const QJsonObject &errorObj)
{
    Error err;
    err.kind = ErrorKind::Comm;
    err.bridgeType = errorObj.value(QStringLiteral("type")).toInt();
    err.message = errorObj.value(QStringLiteral("description")).toString();
    if (err.message.isEmpty())
        err.message = QStringLiteral("Hue bridge rejected the request");
    err.payload = errorObj;
    return err;
}

Error Error::configuration(const QString &message)
{
    return make(ErrorKind::Configuration, message);
}

Error Error::unsupported(const QString &message)
{
    return make(ErrorKind::Unsupported, message);
}

Error Error::state(const QString &message)
{
    return make(ErrorKind::State, message);
}

bool fail(Error *out, const Error &err)
{
    if (out)
        *out = err;
    return false;
}

} // namespace huelink
