#pragma once

#include <QByteArray>
#include <QString>
#include <QUrl>

#include "hue_transport.h"

class QNetworkAccessManager;
class QNetworkRequest;

namespace huelink {

struct HttpResult {
    bool ok = false;
    int statusCode = 0;
    QByteArray payload;
    QString error;
};

class HttpClient : public DescriptionFetcher
{
public:
    explicit HttpClient(int timeoutMs = 10000, QNetworkAccessManager *manager = nullptr);

    HttpResult get(const QUrl &url,
                   const QByteArray &accept = QByteArrayLiteral("application/json")) const;

    HttpResult request(const QByteArray &method,
                       const QUrl &url,
                       const QByteArray &payload,
                       const QByteArray &accept = QByteArrayLiteral("application/json")) const;

    bool fetch(const QUrl &url, QByteArray *payload, Error *error = nullptr) override;

    int timeoutMs() const { return m_timeoutMs; }

private:
    bool buildRequest(const QUrl &url,
                      const QByteArray &accept,
                      bool hasJsonBody,
                      QNetworkRequest *request,
                      QString *error) const;

    int m_timeoutMs;
    QNetworkAccessManager *m_manager;
};

class HttpTransport : public Transport
{
public:
    explicit HttpTransport(const QUrl &baseUrl,
                           int timeoutMs = 10000,
                           QNetworkAccessManager *manager = nullptr);

    bool request(Method method,
                 const QString &path,
                 const std::optional<QJsonObject> &body,
                 QList<QJsonObject> *response,
                 Error *error = nullptr) override;

    QUrl baseUrl() const { return m_baseUrl; }

private:
    QUrl m_baseUrl;
    HttpClient m_http;
};

} // namespace huelink
