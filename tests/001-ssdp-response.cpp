#include <QHostAddress>

#include "fake_transport.h"
#include "catch2/catch.hpp"
#include "hue_ssdp.h"

using namespace huelink;

TEST_CASE("SSDP response from a Hue bridge", "[ssdp]")
{
    const QByteArray datagram =
        "HTTP/1.1 200 OK\r\n"
        "CACHE-CONTROL: max-age=100\r\n"
        "EXT:\r\n"
        "LOCATION: http://192.168.1.2:80/description.xml\r\n"
        "SERVER: FreeRTOS/6.0.5, UPnP/1.0, IpBridge/0.1\r\n"
        "ST: upnp:rootdevice\r\n"
        "usn: uuid:2f402f80-da50-11e1-9b23-0017880a1234::upnp:rootdevice\r\n"
        "\r\n";

    SsdpResponse response;
    REQUIRE(SsdpResponse::parse(datagram, QHostAddress(QStringLiteral("192.168.1.2")), &response));

    CHECK(response.source() == QHostAddress(QStringLiteral("192.168.1.2")));
    CHECK(response.header(QStringLiteral("location")) == QStringLiteral("http://192.168.1.2:80/description.xml"));
    CHECK(response.header(QStringLiteral("SERVER")).contains(QStringLiteral("IpBridge")));
    CHECK(response.hasHeader(QStringLiteral("EXT")));
    CHECK(response.header(QStringLiteral("EXT")).isEmpty());
    CHECK(response.header(QStringLiteral("USN")) == QStringLiteral("uuid:2f402f80-da50-11e1-9b23-0017880a1234::upnp:rootdevice"));
    CHECK_FALSE(response.hasHeader(QStringLiteral("NT")));

    const auto headers = response.headers();
    REQUIRE(headers.size() == 6);
    CHECK(headers.at(0).first == QStringLiteral("CACHE-CONTROL"));
    CHECK(headers.at(5).first == QStringLiteral("USN"));
}

TEST_CASE("SSDP continuation lines and repeated headers", "[ssdp]")
{
    const QByteArray datagram =
        "HTTP/1.1 200 OK\r\n"
        "SERVER: Linux/3.14\r\n"
        " UPnP/1.0 IpBridge/1.16.0\r\n"
        "X-LIST: a\r\n"
        "X-List: b\r\n"
        "not a header line\r\n"
        " stray continuation\r\n"
        "ST: upnp:rootdevice\r\n";

    SsdpResponse response;
    REQUIRE(SsdpResponse::parse(datagram, QHostAddress::LocalHost, &response));

    CHECK(response.header(QStringLiteral("SERVER")) == QStringLiteral("Linux/3.14 UPnP/1.0 IpBridge/1.16.0"));
    CHECK(response.header(QStringLiteral("X-LIST")) == QStringLiteral("a,b"));
    CHECK(response.header(QStringLiteral("ST")) == QStringLiteral("upnp:rootdevice"));
    CHECK(response.headers().size() == 3);
}

TEST_CASE("SSDP replies without 200 status line are rejected", "[ssdp]")
{
    SsdpResponse response;
    CHECK_FALSE(SsdpResponse::parse("NOTIFY * HTTP/1.1\r\nHOST: 239.255.255.250:1900\r\n\r\n",
                                    QHostAddress::LocalHost, &response));
    CHECK_FALSE(SsdpResponse::parse("HTTP/1.1 404 Not Found\r\n\r\n", QHostAddress::LocalHost, &response));
    CHECK_FALSE(SsdpResponse::parse(QByteArray(), QHostAddress::LocalHost, &response));
}

TEST_CASE("M-SEARCH request", "[ssdp]")
{
    const QByteArray msg = UdpSsdpClient::buildSearchMessage(QStringLiteral("upnp:rootdevice"), 3);

    CHECK(msg.startsWith("M-SEARCH * HTTP/1.1\r\n"));
    CHECK(msg.contains("HOST: 239.255.255.250:1900\r\n"));
    CHECK(msg.contains("MAN: \"ssdp:discover\"\r\n"));
    CHECK(msg.contains("MX: 3\r\n"));
    CHECK(msg.contains("ST: upnp:rootdevice\r\n"));
    CHECK(msg.contains(" UPnP/1.1 huelink/"));
    CHECK(msg.endsWith("\r\n\r\n"));
}
