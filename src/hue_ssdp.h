#pragma once

#include <QByteArray>
#include <QHostAddress>
#include <QList>
#include <QPair>
#include <QString>

#include "hue_error.h"

namespace huelink {

inline constexpr const char kSsdpMulticastAddress[] = "239.255.255.250";
inline constexpr quint16 kSsdpMulticastPort = 1900;

// One reply to an M-SEARCH. Header names are stored upper-cased, in the
// order they appeared.
class SsdpResponse
{
public:
    SsdpResponse() = default;
    explicit SsdpResponse(const QHostAddress &source);

    QHostAddress source() const { return m_source; }
    QList<QPair<QString, QString>> headers() const { return m_headers; }

    QString header(const QString &name) const;
    bool hasHeader(const QString &name) const;
    void setHeader(const QString &name, const QString &value);

    QString toString() const;

    // Returns false if the datagram does not start with the expected
    // "HTTP/1.1 200 OK" status line.
    static bool parse(const QByteArray &datagram, const QHostAddress &source, SsdpResponse *out);

private:
    int indexOf(const QString &name) const;

    QHostAddress m_source;
    QList<QPair<QString, QString>> m_headers;
};

class SsdpClient
{
public:
    virtual ~SsdpClient() = default;

    // Sends one search and collects replies until no datagram arrived for
    // maxWaitSeconds*1000 + socketTimeoutMs. Socket setup failures are
    // Configuration errors, an empty result is not an error.
    virtual bool search(const QString &searchTarget,
                        int maxWaitSeconds,
                        int socketTimeoutMs,
                        int ttl,
                        QList<SsdpResponse> *responses,
                        Error *error = nullptr) = 0;
};

class UdpSsdpClient : public SsdpClient
{
public:
    bool search(const QString &searchTarget,
                int maxWaitSeconds,
                int socketTimeoutMs,
                int ttl,
                QList<SsdpResponse> *responses,
                Error *error = nullptr) override;

    static QByteArray buildSearchMessage(const QString &searchTarget, int maxWaitSeconds);
};

} // namespace huelink
