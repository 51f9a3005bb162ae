#include "hue_http.h"

#include <memory>

#include <QEventLoop>
#include <QJsonDocument>
#include <QLoggingCategory>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QThread>
#include <QTimer>

#include "hue_config.h"

Q_LOGGING_CATEGORY(httpLog, "huelink.http");

namespace huelink {

HttpClient::HttpClient(int timeoutMs, QNetworkAccessManager *manager)
    : m_timeoutMs(timeoutMs > 0 ? timeoutMs : 10000)
    , m_manager(manager)
{
}

HttpResult HttpClient::get(const QUrl &url, const QByteArray &accept) const
{
    return request(QByteArrayLiteral("GET"), url, {}, accept);
}

bool HttpClient::fetch(const QUrl &url, QByteArray *payload, Error *error)
{
    const HttpResult result = get(url, QByteArrayLiteral("text/xml, application/xml, */*"));
    if (!result.ok) {
        return fail(error, Error::comm(QStringLiteral("Fetching %1 failed: %2")
                                           .arg(url.toString(), result.error)));
    }
    if (payload)
        *payload = result.payload;
    return true;
}

bool HttpClient::buildRequest(const QUrl &url,
                              const QByteArray &accept,
                              bool hasJsonBody,
                              QNetworkRequest *request,
                              QString *error) const
{
    if (!request) {
        if (error)
            *error = QStringLiteral("Request object is null");
        return false;
    }

    if (!url.isValid() || url.host().isEmpty()) {
        if (error)
            *error = QStringLiteral("Invalid request URL: %1").arg(url.toString());
        return false;
    }

    QNetworkRequest out(url);
    out.setRawHeader("Accept", accept);
    out.setRawHeader("User-Agent", QByteArray(kLibraryName) + '/' + kLibraryVersion);
    if (hasJsonBody)
        out.setHeader(QNetworkRequest::ContentTypeHeader, QStringLiteral("application/json"));

    *request = out;
    if (error)
        error->clear();
    return true;
}

HttpResult HttpClient::request(const QByteArray &method,
                               const QUrl &url,
                               const QByteArray &payload,
                               const QByteArray &accept) const
{
    HttpResult result;

    QNetworkRequest requestObj;
    if (!buildRequest(url, accept, !payload.isEmpty(), &requestObj, &result.error))
        return result;

    // A manager can only serve the thread it lives in.
    std::unique_ptr<QNetworkAccessManager> localManager;
    QNetworkAccessManager *manager = m_manager;
    if (!manager || manager->thread() != QThread::currentThread()) {
        localManager = std::make_unique<QNetworkAccessManager>();
        manager = localManager.get();
    }

    qCDebug(httpLog).noquote() << "Request" << method << url.toString()
                               << (payload.isEmpty() ? QByteArray() : payload);

    QNetworkReply *reply = nullptr;
    if (method == QByteArrayLiteral("GET")) {
        reply = manager->get(requestObj);
    } else if (method == QByteArrayLiteral("POST")) {
        reply = manager->post(requestObj, payload);
    } else if (method == QByteArrayLiteral("PUT")) {
        reply = manager->put(requestObj, payload);
    } else {
        reply = manager->sendCustomRequest(requestObj, method, payload);
    }

    if (!reply) {
        result.error = QStringLiteral("Failed to create network request");
        return result;
    }

    QEventLoop loop;
    QTimer timer;
    timer.setSingleShot(true);
    bool timedOut = false;

    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timer, &QTimer::timeout, &loop, [&]() {
        timedOut = true;
        loop.quit();
    });

    timer.start(m_timeoutMs);
    loop.exec();

    if (timedOut) {
        reply->abort();
        reply->deleteLater();
        result.error = QStringLiteral("Request timed out");
        qCWarning(httpLog) << "Hue request timed out:" << method << url.toString();
        return result;
    }

    result.statusCode = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    result.payload = reply->readAll();

    qCDebug(httpLog).noquote() << "Response" << method << url.toString()
                               << "status:" << result.statusCode << result.payload;

    if (reply->error() != QNetworkReply::NoError) {
        result.error = reply->errorString();
        qCWarning(httpLog) << "Hue request failed:" << method << url.toString()
                           << "error:" << result.error;
        reply->deleteLater();
        return result;
    }

    if (result.statusCode >= 200 && result.statusCode < 300) {
        result.ok = true;
    } else {
        result.error = QStringLiteral("HTTP %1").arg(result.statusCode);
    }

    reply->deleteLater();
    return result;
}

HttpTransport::HttpTransport(const QUrl &baseUrl, int timeoutMs, QNetworkAccessManager *manager)
    : m_baseUrl(baseUrl)
    , m_http(timeoutMs, manager)
{
    // resolved() replaces the last path segment unless the base ends in '/'
    QString path = m_baseUrl.path();
    if (!path.endsWith(QLatin1Char('/'))) {
        path.append(QLatin1Char('/'));
        m_baseUrl.setPath(path);
    }
}

bool HttpTransport::request(Method method,
                            const QString &path,
                            const std::optional<QJsonObject> &body,
                            QList<QJsonObject> *response,
                            Error *error)
{
    if (body && (method == Method::Get || method == Method::Delete)) {
        return fail(error, Error::comm(QStringLiteral("Will not send JSON content for request method %1")
                                           .arg(QLatin1String(methodName(method)))));
    }

    const QUrl url = m_baseUrl.resolved(QUrl(path));
    const QByteArray payload = body ? QJsonDocument(*body).toJson(QJsonDocument::Compact) : QByteArray();
    const HttpResult result = m_http.request(QByteArray(methodName(method)), url, payload);

    // The bridge reports most failures as JSON error entries, keep those.
    if (!result.ok && result.payload.trimmed().isEmpty())
        return fail(error, Error::comm(result.error));

    return parseResponseBody(result.payload, response, error);
}

} // namespace huelink
