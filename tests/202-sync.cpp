#include <QThread>

#include "fake_transport.h"
#include "catch2/catch.hpp"
#include "hue_group.h"
#include "hue_light.h"

using namespace huelink;

TEST_CASE("Full state is cached", "[sync]")
{
    FakeTransport *fake = nullptr;
    auto bridge = syncedBridge(&fake);

    CHECK(bridge->isInitialSyncDone());
    CHECK(bridge->name() == QStringLiteral("Living Bridge"));
    CHECK(bridge->lightIds() == QList<int>{1, 2, 5});

    Light *desk = bridge->light(1);
    REQUIRE(desk != nullptr);
    CHECK(desk->name() == QStringLiteral("Desk"));
    CHECK(desk->isOn());
    CHECK(desk->brightness() == 200);
    CHECK(desk->hue() == 10000);
    CHECK(desk->saturation() == 120);
    CHECK(desk->cieX() == Approx(0.4));
    CHECK(desk->cieY() == Approx(0.5));
    CHECK(desk->colorTemperature() == 250);
    CHECK(desk->colorMode() == ColorMode::HS);
    CHECK(desk->effect() == Effect::None);
    CHECK(desk->toString() == QStringLiteral("1(Desk)[ON,HS:10000/120]"));

    Light *shelf = bridge->light(2);
    REQUIRE(shelf != nullptr);
    CHECK_FALSE(shelf->isOn());
    CHECK(shelf->colorMode() == ColorMode::XY);
    CHECK(shelf->effect() == Effect::ColorLoop);
    CHECK(shelf->toString() == QStringLiteral("2(Shelf)[OFF,XY:0.1/0.2]"));

    Light *ceiling = bridge->light(5);
    REQUIRE(ceiling != nullptr);
    CHECK(ceiling->colorMode() == ColorMode::CT);
    CHECK(ceiling->toString() == QStringLiteral("5(Ceiling)[ON,CT:300]"));

    CHECK(bridge->light(3) == nullptr);
    CHECK(fake->requests.isEmpty());
}

TEST_CASE("Groups reference the cached lights", "[sync]")
{
    FakeTransport *fake = nullptr;
    auto bridge = syncedBridge(&fake);

    CHECK(bridge->groupIds() == QList<int>{0, 1});

    Group *all = bridge->group(0);
    REQUIRE(all != nullptr);
    CHECK(all->isImplicit());
    CHECK(all->name() == QStringLiteral("Implicit"));
    CHECK(all->lightIds() == QList<int>{1, 2, 5});

    Group *office = bridge->group(1);
    REQUIRE(office != nullptr);
    CHECK_FALSE(office->isImplicit());
    CHECK(office->name() == QStringLiteral("Office"));
    CHECK(office->lightIds() == QList<int>{1, 2});
    CHECK(office->light(1) == bridge->light(1));
    CHECK(office->light(5) == nullptr);
    CHECK(office->toString() == QStringLiteral("1(Office)[1,2]"));
}

TEST_CASE("A resync updates entities in place", "[sync]")
{
    FakeTransport *fake = nullptr;
    auto bridge = syncedBridge(&fake);
    Light *desk = bridge->light(1);

    fake->on(Method::Get, QStringLiteral("api/huelinktestuser"), jsonList(R"({
        "config": { "name": "Living Bridge" },
        "lights": {
            "1": { "name": "Desk lamp", "state": { "on": false, "bri": 10 } },
            "9": { "name": "Porch", "state": { "on": true, "ct": 400, "colormode": "ct" } }
        },
        "groups": { "1": { "name": "Office", "lights": [1, "9"] } }
    })"));

    Error error;
    REQUIRE(bridge->sync(&error));
    CHECK(bridge->light(1) == desk);
    CHECK(desk->name() == QStringLiteral("Desk lamp"));
    CHECK_FALSE(desk->isOn());
    CHECK(desk->brightness() == 10);
    // absent keys keep their value
    CHECK(desk->hue() == 10000);
    CHECK(desk->colorMode() == ColorMode::HS);

    // lights missing from the answer are kept
    CHECK(bridge->lightIds() == QList<int>{1, 2, 5, 9});
    CHECK(bridge->group(0)->lightIds() == QList<int>{1, 2, 5, 9});
    CHECK(bridge->group(1)->lightIds() == QList<int>{1, 9});
}

TEST_CASE("Broken sync answers are Comm errors", "[sync]")
{
    FakeTransport *fake = nullptr;
    auto bridge = syncedBridge(&fake);
    const QString path = QStringLiteral("api/huelinktestuser");
    Error error;

    SECTION("unknown light in a group")
    {
        fake->on(Method::Get, path, jsonList(R"({
            "config": { "name": "Living Bridge" },
            "lights": {},
            "groups": { "1": { "name": "Office", "lights": ["1", "7"] } }
        })"));
        CHECK_FALSE(bridge->sync(&error));
        CHECK(error.kind == ErrorKind::Comm);
        CHECK(error.message == QStringLiteral("Can not find light with id 7"));
    }
    SECTION("incomplete")
    {
        fake->on(Method::Get, path, jsonList(R"({ "config": { "name": "Living Bridge" }, "lights": {} })"));
        CHECK_FALSE(bridge->sync(&error));
        CHECK(error.kind == ErrorKind::Comm);
        CHECK(error.message.startsWith(QStringLiteral("Incomplete response")));
    }
    SECTION("empty")
    {
        fake->on(Method::Get, path, QList<QJsonObject>());
        CHECK_FALSE(bridge->sync(&error));
        CHECK(error.kind == ErrorKind::Comm);
    }
    SECTION("bridge error")
    {
        fake->on(Method::Get, path,
                 jsonList(R"([{"error":{"type":1,"address":"/","description":"unauthorized user"}}])"));
        CHECK_FALSE(bridge->sync(&error));
        CHECK(error.kind == ErrorKind::Comm);
        CHECK(error.bridgeType == 1);
        CHECK(error.payload.value(QStringLiteral("address")).toString() == QStringLiteral("/"));
    }
    SECTION("config name missing")
    {
        fake->on(Method::Get, path, jsonList(R"({ "config": {}, "lights": {}, "groups": {} })"));
        CHECK_FALSE(bridge->sync(&error));
        CHECK(error.kind == ErrorKind::Comm);
    }
    SECTION("unknown color mode")
    {
        fake->on(Method::Get, path, jsonList(R"({
            "config": { "name": "Living Bridge" },
            "lights": { "1": { "name": "Desk", "state": { "hue": 5, "colormode": "rgb" } } },
            "groups": {}
        })"));
        CHECK_FALSE(bridge->sync(&error));
        CHECK(error.kind == ErrorKind::Comm);
        // nothing of the failed light was taken over
        CHECK(bridge->light(1)->cachedState().hue == 10000);
    }
    SECTION("wrong value type")
    {
        fake->on(Method::Get, path, jsonList(R"({
            "config": { "name": "Living Bridge" },
            "lights": { "5": { "name": "Ceiling", "state": { "on": "yes" } } },
            "groups": {}
        })"));
        CHECK_FALSE(bridge->sync(&error));
        CHECK(error.kind == ErrorKind::Comm);
        CHECK(bridge->light(5)->cachedState().on);
    }
    SECTION("light without state")
    {
        fake->on(Method::Get, path, jsonList(R"({
            "config": { "name": "Living Bridge" },
            "lights": { "5": { "name": "Ceiling" } },
            "groups": {}
        })"));
        CHECK_FALSE(bridge->sync(&error));
        CHECK(error.kind == ErrorKind::Comm);
    }
}

TEST_CASE("Lights refresh when their cache is stale", "[sync]")
{
    FakeTransport *fake = nullptr;
    auto bridge = syncedBridge(&fake);
    Light *desk = bridge->light(1);
    const QString lightPath = QStringLiteral("api/huelinktestuser/lights/1");
    fake->on(Method::Get, lightPath,
             jsonList(R"({ "name": "Desk lamp", "state": { "on": false, "bri": 42, "colormode": "ct", "ct": 333 } })"));

    SECTION("disabled by default")
    {
        CHECK_FALSE(desk->autoSyncInterval().has_value());
        QThread::msleep(5);
        CHECK(desk->name() == QStringLiteral("Desk"));
        CHECK(fake->requests.isEmpty());
    }
    SECTION("fresh cache is used")
    {
        desk->setAutoSyncInterval(60000);
        CHECK(desk->brightness() == 200);
        CHECK(fake->requests.isEmpty());
    }
    SECTION("stale cache is refreshed")
    {
        desk->setAutoSyncInterval(1);
        QThread::msleep(5);
        Error error;
        CHECK(desk->brightness(&error) == 42);
        CHECK(error.isOk());
        CHECK(desk->name() == QStringLiteral("Desk lamp"));
        CHECK(desk->colorMode() == ColorMode::CT);
        CHECK(fake->count(Method::Get, lightPath) >= 1);
    }
    SECTION("failed refresh returns the cached value")
    {
        desk->setAutoSyncInterval(1);
        QThread::msleep(5);
        fake->queueFailure(Method::Get, lightPath, Error::comm(QStringLiteral("Connection timed out")));
        Error error;
        CHECK(desk->brightness(&error) == 200);
        CHECK(error.kind == ErrorKind::Comm);
    }
}

TEST_CASE("Auto-sync interval comes from the bridge options", "[sync]")
{
    BridgeOptions options = testOptions();
    options.lightAutoSyncMs = 60000;
    FakeTransport *fake = nullptr;
    auto bridge = syncedBridge(&fake, options);

    REQUIRE(bridge->light(2)->autoSyncInterval().has_value());
    CHECK(*bridge->light(2)->autoSyncInterval() == 60000);
    CHECK(bridge->light(2)->lastSyncMs() > 0);
}

TEST_CASE("Searching for new lights", "[sync]")
{
    FakeTransport *fake = nullptr;
    auto bridge = syncedBridge(&fake);

    fake->on(Method::Post, QStringLiteral("api/huelinktestuser/lights"),
             jsonList(R"([{"success":{"/lights":"Searching for new devices"}}])"));
    REQUIRE(bridge->searchForNewLights());
    REQUIRE(fake->requests.size() == 1);
    CHECK_FALSE(fake->requests.at(0).body.has_value());

    fake->queue(Method::Get, QStringLiteral("api/huelinktestuser/lights/new"),
                jsonList(R"({ "7": { "name": "Hue Lamp 7" }, "lastscan": "active" })"));
    Error error;
    const QList<Light *> found = bridge->newLights(&error);
    REQUIRE(found.size() == 1);
    CHECK(error.isOk());
    CHECK(found.at(0)->id() == 7);
    CHECK(found.at(0)->name() == QStringLiteral("Hue Lamp 7"));
    CHECK(bridge->isScanActive());
    CHECK(bridge->light(7) == found.at(0));
    CHECK(bridge->group(0)->lightIds() == QList<int>{1, 2, 5, 7});

    fake->queue(Method::Get, QStringLiteral("api/huelinktestuser/lights/new"),
                jsonList(R"({ "lastscan": "2012-10-29T12:00:00" })"));
    CHECK(bridge->newLights().isEmpty());
    CHECK_FALSE(bridge->isScanActive());

    fake->queue(Method::Get, QStringLiteral("api/huelinktestuser/lights/new"), jsonList(R"({ "7": {} })"));
    CHECK(bridge->newLights(&error).isEmpty());
    CHECK(error.kind == ErrorKind::Comm);
}

TEST_CASE("Bridge name and string form", "[sync]")
{
    FakeTransport *fake = nullptr;
    auto bridge = syncedBridge(&fake);
    bridge->setUdn(QStringLiteral("uuid:2f402f80-da50-11e1-9b23-0017880a1234"));

    CHECK(bridge->toString()
          == QStringLiteral("Living Bridge@http://192.168.1.2/#uuid:2f402f80-da50-11e1-9b23-0017880a1234"));

    Error error;
    CHECK_FALSE(bridge->setName(QStringLiteral(" abc "), &error));
    CHECK(error.kind == ErrorKind::Validation);
    CHECK_FALSE(bridge->setName(QStringLiteral("a name that is far too long"), &error));
    CHECK(fake->requests.isEmpty());

    fake->on(Method::Put, QStringLiteral("api/huelinktestuser/config"),
             successReply("/config/name", QStringLiteral("Hallway")));
    REQUIRE(bridge->setName(QStringLiteral("  Hallway "), &error));
    CHECK(bridge->name() == QStringLiteral("Hallway"));
    REQUIRE(fake->requests.size() == 1);
    CHECK(fake->requests.at(0).body->value(QStringLiteral("name")).toString() == QStringLiteral("Hallway"));

    fake->on(Method::Put, QStringLiteral("api/huelinktestuser/config"),
             jsonList(R"([{"error":{"type":7,"address":"/config/name","description":"invalid value"}}])"));
    CHECK_FALSE(bridge->setName(QStringLiteral("Kitchen"), &error));
    CHECK(error.bridgeType == 7);
    CHECK(bridge->name() == QStringLiteral("Hallway"));
}
