#pragma once

#include <memory>
#include <vector>

#include <QByteArray>
#include <QList>
#include <QUrl>

#include "hue_config.h"
#include "hue_error.h"

namespace huelink {

class Bridge;
class DescriptionFetcher;
class SsdpClient;
class SsdpResponse;

struct DiscoveryResult {
    std::vector<std::unique_ptr<Bridge>> bridges;
    // Everything that went wrong along the way, in order. Discovery may still
    // have found bridges.
    QList<Error> failures;

    Error lastFailure() const { return failures.isEmpty() ? Error() : failures.constLast(); }
};

// Parses a UPnP device description. Returns false on malformed XML or a
// URLBase that is not a valid URL. If the description does not belong to a
// Hue bridge, returns true and leaves *urlBase empty.
bool parseDeviceDescription(const QByteArray &xml, QUrl *urlBase, Error *error = nullptr);

class BridgeLocator
{
public:
    BridgeLocator(SsdpClient &ssdp,
                  DescriptionFetcher &fetcher,
                  LocatorOptions options = {},
                  BridgeOptions bridgeOptions = {});

    // Searches the local network in up to LocatorOptions::effectiveAttempts()
    // rounds with growing timeouts, stopping after the first round that found
    // a bridge. Returned bridges carry their UDN and no credential.
    DiscoveryResult discover();

    const LocatorOptions &options() const { return m_options; }

private:
    bool candidateBaseUrl(const SsdpResponse &response, QUrl *baseUrl, Error *error);

    SsdpClient &m_ssdp;
    DescriptionFetcher &m_fetcher;
    LocatorOptions m_options;
    BridgeOptions m_bridgeOptions;
};

// Discovery over the real network: UDP multicast and HTTP description fetch.
DiscoveryResult discoverBridges(const LocatorOptions &options = {},
                                const BridgeOptions &bridgeOptions = {});

} // namespace huelink
