#include "hue_ssdp.h"

#include <QLoggingCategory>
#include <QNetworkDatagram>
#include <QRegularExpression>
#include <QSysInfo>
#include <QUdpSocket>

#include "hue_config.h"

Q_LOGGING_CATEGORY(ssdpLog, "huelink.ssdp");

namespace huelink {

namespace {

constexpr char kResponseStatusLine[] = "HTTP/1.1 200 OK\r\n";

const QRegularExpression &headerPattern()
{
    static const QRegularExpression pattern(QStringLiteral("^([^\\p{Cc} :]+):\\s*(.*)$"));
    return pattern;
}

} // namespace

SsdpResponse::SsdpResponse(const QHostAddress &source)
    : m_source(source)
{
}

int SsdpResponse::indexOf(const QString &name) const
{
    const QString key = name.toUpper();
    for (int i = 0; i < m_headers.size(); ++i) {
        if (m_headers.at(i).first == key)
            return i;
    }
    return -1;
}

QString SsdpResponse::header(const QString &name) const
{
    const int i = indexOf(name);
    return i < 0 ? QString() : m_headers.at(i).second;
}

bool SsdpResponse::hasHeader(const QString &name) const
{
    return indexOf(name) >= 0;
}

void SsdpResponse::setHeader(const QString &name, const QString &value)
{
    const int i = indexOf(name);
    if (i < 0)
        m_headers.append(qMakePair(name.toUpper(), value));
    else
        m_headers[i].second = value;
}

QString SsdpResponse::toString() const
{
    QString out = QStringLiteral("Response from: %1\n").arg(m_source.toString());
    for (const auto &entry : m_headers)
        out += entry.first + QStringLiteral(": ") + entry.second + QLatin1Char('\n');
    return out;
}

bool SsdpResponse::parse(const QByteArray &datagram, const QHostAddress &source, SsdpResponse *out)
{
    if (!datagram.startsWith(kResponseStatusLine))
        return false;

    SsdpResponse response(source);
    const QString message = QString::fromUtf8(datagram.mid(int(sizeof(kResponseStatusLine)) - 1));
    const QStringList lines = message.split(QRegularExpression(QStringLiteral("[\\r\\n]+")), Qt::SkipEmptyParts);

    QString continuationHeader;
    for (const QString &line : lines) {
        if (continuationHeader.isEmpty() || !line.startsWith(QLatin1Char(' '))) {
            const QRegularExpressionMatch match = headerPattern().match(line);
            if (!match.hasMatch()) {
                continuationHeader.clear();
                continue;
            }
            const QString name = match.captured(1).toUpper();
            const QString value = match.captured(2);
            if (response.hasHeader(name)) {
                // RFC 2616 4.2: repeated headers are lists, join with comma
                QString existing = response.header(name);
                if (!existing.trimmed().isEmpty())
                    existing += QLatin1Char(',');
                response.setHeader(name, existing + value);
            } else {
                response.setHeader(name, value);
            }
            continuationHeader = name;
        } else {
            QString existing = response.header(continuationHeader);
            if (!existing.isEmpty())
                existing += QLatin1Char(' ');
            response.setHeader(continuationHeader, existing + line.trimmed());
        }
    }

    if (out)
        *out = response;
    return true;
}

QByteArray UdpSsdpClient::buildSearchMessage(const QString &searchTarget, int maxWaitSeconds)
{
    QByteArray msg;
    msg += "M-SEARCH * HTTP/1.1\r\n";
    msg += "HOST: " + QByteArray(kSsdpMulticastAddress) + ':' + QByteArray::number(kSsdpMulticastPort) + "\r\n";
    msg += "MAN: \"ssdp:discover\"\r\n";
    msg += "MX: " + QByteArray::number(maxWaitSeconds) + "\r\n";
    msg += "ST: " + searchTarget.toUtf8() + "\r\n";
    msg += "USER-AGENT: " + QSysInfo::productType().toUtf8() + '/' + QSysInfo::productVersion().toUtf8()
        + " UPnP/1.1 " + QByteArray(kLibraryName) + '/' + QByteArray(kLibraryVersion) + "\r\n";
    msg += "\r\n";
    return msg;
}

bool UdpSsdpClient::search(const QString &searchTarget,
                           int maxWaitSeconds,
                           int socketTimeoutMs,
                           int ttl,
                           QList<SsdpResponse> *responses,
                           Error *error)
{
    const QHostAddress group(QString::fromLatin1(kSsdpMulticastAddress));

    QUdpSocket socket;
    if (!socket.bind(QHostAddress(QHostAddress::AnyIPv4), 0,
                     QUdpSocket::ShareAddress | QUdpSocket::ReuseAddressHint)) {
        return fail(error, Error::configuration(QStringLiteral("Can not bind discovery socket: %1")
                                                    .arg(socket.errorString())));
    }

    if (!socket.joinMulticastGroup(group)) {
        return fail(error, Error::configuration(QStringLiteral("Can not join multicast group %1: %2")
                                                    .arg(group.toString(), socket.errorString())));
    }

    socket.setSocketOption(QAbstractSocket::MulticastTtlOption, ttl);
    if (socket.socketOption(QAbstractSocket::MulticastTtlOption).toInt() != ttl)
        return fail(error, Error::configuration(QStringLiteral("Can not set TTL %1").arg(ttl)));

    const QByteArray message = buildSearchMessage(searchTarget, maxWaitSeconds);
    if (socket.writeDatagram(message, group, kSsdpMulticastPort) == -1) {
        return fail(error, Error::configuration(QStringLiteral("Can not send search request: %1")
                                                    .arg(socket.errorString())));
    }
    qCDebug(ssdpLog) << "SSDP search sent, ST:" << searchTarget << "MX:" << maxWaitSeconds;

    QList<SsdpResponse> result;
    const int idleTimeoutMs = maxWaitSeconds * 1000 + socketTimeoutMs;
    while (socket.waitForReadyRead(idleTimeoutMs)) {
        while (socket.hasPendingDatagrams()) {
            const QNetworkDatagram datagram = socket.receiveDatagram();
            qCDebug(ssdpLog).noquote() << "Response from" << datagram.senderAddress().toString()
                                       << "\n" << datagram.data();
            SsdpResponse response;
            if (SsdpResponse::parse(datagram.data(), datagram.senderAddress(), &response)) {
                result.append(response);
            } else {
                qCDebug(ssdpLog) << "Response from" << datagram.senderAddress().toString()
                                 << "appears to not have the proper formatting. Ignoring it.";
            }
        }
    }

    if (socket.error() != QAbstractSocket::SocketTimeoutError
        && socket.error() != QAbstractSocket::UnknownSocketError) {
        return fail(error, Error::comm(QStringLiteral("Problem receiving search responses: %1")
                                           .arg(socket.errorString())));
    }

    if (responses)
        *responses = result;
    return true;
}

} // namespace huelink
