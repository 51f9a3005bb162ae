#include "hue_discovery.h"

#include <QLoggingCategory>
#include <QRegularExpression>
#include <QStringList>
#include <QXmlStreamReader>

#include "hue_bridge.h"
#include "hue_http.h"
#include "hue_ssdp.h"

Q_LOGGING_CATEGORY(discoveryLog, "huelink.discovery");

namespace huelink {

namespace {

const QRegularExpression &usnPattern()
{
    static const QRegularExpression pattern(QStringLiteral("^uuid:[-\\w]+$"));
    return pattern;
}

const QRegularExpression &modelNamePattern()
{
    static const QRegularExpression pattern(QStringLiteral("philips\\s+hue\\s+bridge"),
                                            QRegularExpression::CaseInsensitiveOption);
    return pattern;
}

} // namespace

bool parseDeviceDescription(const QByteArray &xml, QUrl *urlBase, Error *error)
{
    QXmlStreamReader reader(xml);
    QStringList path;
    bool isHueBridge = false;
    bool haveUrlBase = false;
    QString urlBaseText;

    while (!reader.atEnd()) {
        const QXmlStreamReader::TokenType token = reader.readNext();
        if (token == QXmlStreamReader::EndElement) {
            if (!path.isEmpty())
                path.removeLast();
            continue;
        }
        if (token != QXmlStreamReader::StartElement)
            continue;

        const QString name = reader.name().toString();
        const QString parent = path.isEmpty() ? QString() : path.constLast();
        if (name == QLatin1String("modelName") && parent == QLatin1String("device")) {
            // readElementText() consumes the end element, nothing to pop
            const QString model = reader.readElementText(QXmlStreamReader::IncludeChildElements);
            if (modelNamePattern().match(model).hasMatch())
                isHueBridge = true;
        } else if (name == QLatin1String("URLBase") && !haveUrlBase) {
            urlBaseText = reader.readElementText(QXmlStreamReader::IncludeChildElements).trimmed();
            haveUrlBase = true;
        } else {
            path.append(name);
        }
    }

    if (reader.hasError()) {
        return fail(error, Error::comm(QStringLiteral("Invalid device description (line %1): %2")
                                           .arg(reader.lineNumber())
                                           .arg(reader.errorString())));
    }

    QUrl url;
    if (isHueBridge && haveUrlBase) {
        url = QUrl(urlBaseText, QUrl::StrictMode);
        if (!url.isValid() || url.scheme().isEmpty() || url.host().isEmpty())
            return fail(error, Error::comm(QStringLiteral("Invalid URLBase in device description: %1").arg(urlBaseText)));
    }

    if (urlBase)
        *urlBase = url;
    return true;
}

BridgeLocator::BridgeLocator(SsdpClient &ssdp,
                             DescriptionFetcher &fetcher,
                             LocatorOptions options,
                             BridgeOptions bridgeOptions)
    : m_ssdp(ssdp)
    , m_fetcher(fetcher)
    , m_options(std::move(options))
    , m_bridgeOptions(std::move(bridgeOptions))
{
}

bool BridgeLocator::candidateBaseUrl(const SsdpResponse &response, QUrl *baseUrl, Error *error)
{
    *baseUrl = QUrl();

    const QString server = response.header(QStringLiteral("SERVER"));
    if (!server.contains(QLatin1String("IpBridge")))
        return true;

    const QString location = response.header(QStringLiteral("LOCATION")).trimmed();
    if (!location.endsWith(QLatin1String(".xml")))
        return true;

    const QUrl locationUrl(location, QUrl::StrictMode);
    if (!locationUrl.isValid())
        return fail(error, Error::comm(QStringLiteral("Invalid LOCATION %1").arg(location)));

    QByteArray xml;
    if (!m_fetcher.fetch(locationUrl, &xml, error))
        return false;

    return parseDeviceDescription(xml, baseUrl, error);
}

DiscoveryResult BridgeLocator::discover()
{
    DiscoveryResult result;
    QStringList accepted;

    const int rounds = m_options.effectiveAttempts();
    for (int round = 0; round < rounds && result.bridges.empty(); ++round) {
        const int maxWaitSeconds = 1 + round;
        const int socketTimeoutMs = 500 + round * 1500;

        QList<SsdpResponse> responses;
        Error searchError;
        if (!m_ssdp.search(m_options.searchTarget, maxWaitSeconds, socketTimeoutMs, m_options.ttl,
                           &responses, &searchError)) {
            qCWarning(discoveryLog) << "Discovery search failed:" << searchError.toString();
            result.failures.append(searchError);
            break;
        }
        qCDebug(discoveryLog) << "Round" << round + 1 << "of" << rounds << "got" << responses.size() << "responses";

        for (const SsdpResponse &response : responses) {
            const QString usn = response.header(QStringLiteral("USN"));
            if (!usnPattern().match(usn).hasMatch() || accepted.contains(usn))
                continue;

            QUrl baseUrl;
            Error candidateError;
            if (!candidateBaseUrl(response, &baseUrl, &candidateError)) {
                qCInfo(discoveryLog) << "Skipping candidate" << usn << "from"
                                     << response.source().toString() << ":" << candidateError.toString();
                result.failures.append(candidateError);
                continue;
            }
            if (baseUrl.isEmpty())
                continue;

            qCInfo(discoveryLog) << "Found Hue bridge" << usn << "at" << baseUrl.toString();
            accepted.append(usn);
            auto bridge = std::make_unique<Bridge>(baseUrl, QString(), nullptr, m_bridgeOptions);
            bridge->setUdn(usn);
            result.bridges.push_back(std::move(bridge));
        }
    }

    return result;
}

DiscoveryResult discoverBridges(const LocatorOptions &options, const BridgeOptions &bridgeOptions)
{
    UdpSsdpClient ssdp;
    HttpClient http(options.descriptionTimeoutMs);
    BridgeLocator locator(ssdp, http, options, bridgeOptions);
    return locator.discover();
}

} // namespace huelink
