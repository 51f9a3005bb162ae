#pragma once

#include <QJsonObject>
#include <QString>

namespace huelink {

enum class ErrorKind {
    None,
    Validation,    // caller supplied value out of range, nothing was sent
    Comm,          // transport failure or structured bridge error
    Configuration, // local setup failure (sockets)
    Unsupported,   // known unsupported bridge action
    State          // called in the wrong state (not authenticated, transaction open)
};

struct Error {
    ErrorKind kind = ErrorKind::None;
    QString message;
    int bridgeType = 0;
    QJsonObject payload;

    bool isOk() const noexcept { return kind == ErrorKind::None; }
    QString toString() const;

    static Error validation(const QString &message);
    static Error comm(const QString &message);
    static Error bridge(const QJsonObject &errorObj);
    static Error configuration(const QString &message);
    static Error unsupported(const QString &message);
    static Error state(const QString &message);
};

const char *errorKindName(ErrorKind kind);

// Stores err into *out when out is set; always returns false so callers can
// write `return fail(error, Error::validation(...));`.
bool fail(Error *out, const Error &err);

} // namespace huelink
