#include <iostream>

#include <QCoreApplication>
#include <QHostAddress>

#include "hue_bridge.h"
#include "hue_config.h"
#include "hue_discovery.h"
#include "hue_group.h"
#include "hue_light.h"

namespace {

int listBridges()
{
    const huelink::DiscoveryResult result = huelink::discoverBridges();
    for (const huelink::Error &failure : result.failures)
        std::cerr << "discovery: " << failure.toString().toStdString() << '\n';

    if (result.bridges.empty()) {
        std::cerr << "no Hue bridge found" << '\n';
        return result.failures.isEmpty() ? 0 : 1;
    }

    for (const auto &bridge : result.bridges)
        std::cout << bridge->udn().toStdString() << ' ' << bridge->baseUrl().toString().toStdString() << '\n';
    return 0;
}

int showBridge(const QString &address, const QString &username)
{
    const QHostAddress host(address);
    if (host.isNull()) {
        std::cerr << "not an IP address: " << address.toStdString() << '\n';
        return 2;
    }

    huelink::Bridge bridge(host);
    huelink::Error error;
    if (username.isEmpty())
        std::cerr << "press the link button on the bridge" << '\n';
    if (!bridge.authenticate(username, true, &error)) {
        std::cerr << "authentication failed: " << error.toString().toStdString() << '\n';
        return 1;
    }

    std::cout << bridge.toString().toStdString() << '\n';
    std::cout << "username: " << bridge.username().toStdString() << '\n';

    const QList<huelink::Light *> lights = bridge.lights(&error);
    if (!error.isOk()) {
        std::cerr << "reading lights failed: " << error.toString().toStdString() << '\n';
        return 1;
    }
    for (const huelink::Light *light : lights)
        std::cout << "light " << light->toString().toStdString() << '\n';

    for (const huelink::Group *group : bridge.groups(&error))
        std::cout << "group " << group->toString().toStdString() << '\n';
    return error.isOk() ? 0 : 1;
}

} // namespace

int main(int argc, char **argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("huelink-demo"));
    QCoreApplication::setApplicationVersion(QString::fromLatin1(huelink::kLibraryVersion));

    const QStringList args = QCoreApplication::arguments().mid(1);
    if (args.size() > 2) {
        std::cerr << "usage: huelink-demo [address [username]]" << '\n';
        return 2;
    }

    if (args.isEmpty())
        return listBridges();
    return showBridge(args.at(0), args.value(1));
}
