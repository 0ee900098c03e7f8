// test_superuser.cpp
// Superuser elevation against real processes: pseudo_peer stands in for
// sudo and execs a privileged muxbridge.
#include <gtest/gtest.h>
#include <QCoreApplication>
#include <QPointer>
#include <cerrno>
#include <csignal>
#include <vector>
#include "peer_bridge.hpp"
#include "superuser.hpp"
#include "test_support.hpp"

using namespace muxbridge;
using muxbridge::testing::Frontend;
using nlohmann::json;

namespace {

const char* const SU_PATH  = "/superuser";
const char* const SU_IFACE = "cockpit.Superuser";
const char* const PASSWORD = "p4ssw0rd";

config::BridgeConfig pseudoConfig(bool withPassword) {
    config::SuperuserBridge pseudo;
    pseudo.label      = "pseudo";
    pseudo.spawn      = { PSEUDO_PEER_BINARY, MUXBRIDGE_BINARY, "--privileged" };
    pseudo.privileged = true;
    if (withPassword)
        pseudo.environ = { std::string("PSEUDO_PASSWORD=") + PASSWORD };

    // Never offered: not privileged
    config::SuperuserBridge plain;
    plain.label = "plain";
    plain.spawn = { MUXBRIDGE_BINARY };

    config::BridgeConfig c;
    c.superuserBridges = { pseudo, plain };
    return c;
}

// Peer processes of this test binary, live or winding down.
std::vector<QPointer<PeerBridge>> peerBridges() {
    std::vector<QPointer<PeerBridge>> out;
    for (auto* peer : QCoreApplication::instance()->findChildren<PeerBridge*>())
        out.emplace_back(peer);
    return out;
}

json promptArgs() {
    return json::array({ "", "can haz pw?", "", false, "" });
}

class SuperuserTest : public ::testing::Test {
protected:
    explicit SuperuserTest(bool withPassword = false)
      : fe(pseudoConfig(withPassword))
    {}

    void start() {
        const auto id = fe.sendBusCall(fe.internalBus(), SU_PATH, SU_IFACE, "Start",
                                       json::array({ "pseudo" }));
        fe.assertBusReply(id, json::array());
        fe.assertBusProps(SU_PATH, SU_IFACE, { {"Current", "pseudo"} });
    }

    /** @brief Watch /superuser, expecting it idle with the given bridges. */
    void watchSuperuser(const json& bridges) {
        const json methods = fe.checkBusCall(SU_PATH, bus::PropertiesInterface, "Get",
                                             json::array({ SU_IFACE, "Methods" }))[0]["v"];
        fe.watchBus(SU_PATH, SU_IFACE, {
            {"Bridges", bridges},
            {"Current", "none"},
            {"Methods", methods}
        });
    }

    Frontend fe;
};

class SuperuserPasswordTest : public SuperuserTest {
protected:
    SuperuserPasswordTest() : SuperuserTest(true) {}
};

} // namespace

TEST_F(SuperuserTest, OffersPrivilegedBridgesOnly) {
    fe.init();
    fe.assertBusProps(SU_PATH, SU_IFACE, {
        {"Bridges", json::array({ "pseudo" })},
        {"Current", "none"}
    });
    json methods = fe.checkBusCall(SU_PATH, bus::PropertiesInterface, "Get",
                                   json::array({ SU_IFACE, "Methods" }));
    EXPECT_EQ(methods[0]["v"], json({ {"pseudo", bus::variant("a{sv}",
                                         { {"label", bus::variant("s", "pseudo")} })} }));
}

TEST_F(SuperuserTest, NotRunningDeniesAccess) {
    fe.init();
    fe.checkOpen("null", { {"superuser", true} }, "access-denied");
    fe.checkOpen("null", { {"superuser", "try"} });
}

TEST_F(SuperuserTest, StartWithoutPassword) {
    fe.init();
    watchSuperuser(json::array({ "pseudo" }));

    const auto id = fe.sendBusCall(fe.internalBus(), SU_PATH, SU_IFACE, "Start",
                                   json::array({ "pseudo" }));
    fe.assertBusNotify(SU_PATH, SU_IFACE, { {"Current", "init"} });
    fe.assertBusNotify(SU_PATH, SU_IFACE, { {"Current", "pseudo"} });
    fe.assertBusReply(id, json::array());

    // A routed channel lands on the privileged peer
    const auto echo = fe.checkOpen("echo", { {"superuser", true} });
    fe.sendData(echo, "hello");
    EXPECT_EQ(fe.nextData(echo), "hello");
    fe.checkClose(echo);

    const auto peerBus = fe.checkOpen("dbus-json3", { {"bus", "internal"}, {"superuser", "try"} });
    fe.assertBusProps(SU_PATH, SU_IFACE, { {"Current", "root"}, {"Bridges", json::array()} },
                      peerBus);
}

TEST_F(SuperuserTest, StartTwiceIsRefused) {
    fe.init();
    const auto& b = fe.internalBus();
    const auto first = fe.sendBusCall(b, SU_PATH, SU_IFACE, "Start", json::array({ "pseudo" }));
    const auto second = fe.sendBusCall(b, SU_PATH, SU_IFACE, "Start", json::array({ "pseudo" }));
    fe.assertBusError(second, SuperuserManager::ErrorName,
                      "A superuser bridge is already starting or running");
    fe.assertBusReply(first, json::array());

    const auto third = fe.sendBusCall(b, SU_PATH, SU_IFACE, "Start", json::array({ "pseudo" }));
    fe.assertBusError(third, SuperuserManager::ErrorName,
                      "A superuser bridge is already starting or running");
}

TEST_F(SuperuserTest, UnknownBridge) {
    fe.init();
    const auto id = fe.sendBusCall(fe.internalBus(), SU_PATH, SU_IFACE, "Start",
                                   json::array({ "plain" }));
    fe.assertBusError(id, SuperuserManager::ErrorName,
                      "Unknown superuser bridge type \"plain\"");
    fe.assertBusProps(SU_PATH, SU_IFACE, { {"Current", "none"} });
}

TEST_F(SuperuserTest, StopClosesRoutedChannels) {
    fe.init();
    start();

    const auto routed = fe.checkOpen("null", { {"superuser", "require"} });
    const auto local  = fe.checkOpen("null");

    const auto id = fe.sendBusCall(fe.internalBus(), SU_PATH, SU_IFACE, "Stop", json::array());
    json close = fe.assertMsg("", { {"command", "close"}, {"channel", routed} });
    EXPECT_FALSE(close.contains("problem"));
    fe.assertBusReply(id, json::array());
    fe.assertBusProps(SU_PATH, SU_IFACE, { {"Current", "none"} });

    // the local channel is untouched, the routed id is free again
    EXPECT_NE(fe.bridge().channel(local), nullptr);
    fe.sendJson("", { {"command", "open"}, {"channel", routed}, {"payload", "null"} });
    fe.assertMsg("", { {"command", "ready"}, {"channel", routed} });

    // Stop when nothing runs is fine
    fe.checkBusCall(SU_PATH, SU_IFACE, "Stop", json::array(), json::array());

    // and elevation can start again
    start();
}

TEST_F(SuperuserTest, AnswerWithoutPromptIsIgnored) {
    fe.init();
    fe.checkBusCall(SU_PATH, SU_IFACE, "Answer", json::array({ "nobody asked" }), json::array());
}

TEST_F(SuperuserTest, InitElevation) {
    fe.init({ {"superuser", { {"id", "pseudo"} }} });
    fe.assertMsg("", { {"command", "superuser-init-done"} });
    fe.assertBusProps(SU_PATH, SU_IFACE, { {"Current", "pseudo"} });
    fe.checkOpen("null", { {"superuser", true} });
}

TEST_F(SuperuserTest, InitElevationWithUnknownLabel) {
    fe.init({ {"superuser", { {"id", "nope"} }} });
    fe.assertMsg("", { {"command", "superuser-init-done"} });
    fe.assertBusProps(SU_PATH, SU_IFACE, { {"Current", "none"} });
}

TEST_F(SuperuserPasswordTest, StartWithPassword) {
    fe.init();
    watchSuperuser(json::array({ "pseudo" }));
    fe.addBusMatch(SU_PATH, SU_IFACE);

    const auto& b = fe.internalBus();
    const auto id = fe.sendBusCall(b, SU_PATH, SU_IFACE, "Start", json::array({ "pseudo" }));
    fe.assertBusNotify(SU_PATH, SU_IFACE, { {"Current", "init"} });
    fe.assertBusSignal(SU_PATH, SU_IFACE, "Prompt", promptArgs());

    // No stopping halfway
    const auto stop = fe.sendBusCall(b, SU_PATH, SU_IFACE, "Stop", json::array());
    fe.assertBusError(stop, SuperuserManager::ErrorName,
                      "Cannot stop a superuser bridge while it is starting");

    const auto answer = fe.sendBusCall(b, SU_PATH, SU_IFACE, "Answer", json::array({ PASSWORD }));
    fe.assertBusReply(answer, json::array());
    fe.assertBusNotify(SU_PATH, SU_IFACE, { {"Current", "pseudo"} });
    fe.assertBusReply(id, json::array());
    fe.assertBusProps(SU_PATH, SU_IFACE, { {"Current", "pseudo"} });
}

TEST_F(SuperuserPasswordTest, WrongPassword) {
    fe.init();
    watchSuperuser(json::array({ "pseudo" }));
    fe.addBusMatch(SU_PATH, SU_IFACE);

    const auto& b = fe.internalBus();
    const auto id = fe.sendBusCall(b, SU_PATH, SU_IFACE, "Start", json::array({ "pseudo" }));
    fe.assertBusNotify(SU_PATH, SU_IFACE, { {"Current", "init"} });
    fe.assertBusSignal(SU_PATH, SU_IFACE, "Prompt", promptArgs());

    const auto answer = fe.sendBusCall(b, SU_PATH, SU_IFACE, "Answer", json::array({ "wrong" }));
    fe.assertBusReply(answer, json::array());
    fe.assertBusNotify(SU_PATH, SU_IFACE, { {"Current", "none"} });
    fe.assertBusError(id, SuperuserManager::ErrorName, "pseudo says: Bad password");
    fe.assertBusProps(SU_PATH, SU_IFACE, { {"Current", "none"} });
    fe.checkOpen("null", { {"superuser", true} }, "access-denied");
}

TEST_F(SuperuserPasswordTest, InitElevationWithPassword) {
    fe.init({ {"superuser", { {"id", "pseudo"} }} });
    json challenge = fe.assertMsg("", {
        {"command", "authorize"},
        {"challenge", "plain1:"},
        {"prompt", "can haz pw?"},
        {"echo", false}
    });

    // a stale cookie is ignored
    fe.sendJson("", { {"command", "authorize"}, {"cookie", "bogus"}, {"response", "wrong"} });
    fe.sendJson("", { {"command", "authorize"}, {"cookie", challenge["cookie"]},
                      {"response", PASSWORD} });
    fe.assertMsg("", { {"command", "superuser-init-done"} });
    fe.assertBusProps(SU_PATH, SU_IFACE, { {"Current", "pseudo"} });
}

TEST_F(SuperuserTest, EofStopsThePeer) {
    fe.init();
    const auto before = peerBridges();
    start();

    PeerBridge* peer = nullptr;
    for (auto const& candidate : peerBridges()) {
        bool seen = false;
        for (auto const& old : before)
            seen = seen || (old && old.data() == candidate.data());
        if (!seen)
            peer = candidate.data();
    }
    ASSERT_NE(peer, nullptr);
    const qint64 pid = peer->processId();
    ASSERT_GT(pid, 0);

    fe.checkOpen("echo", { {"superuser", true} });
    fe.transport().eof();
    EXPECT_EQ(fe.exitCode(), 0);
    EXPECT_EQ(fe.bridge().superuser().phase(), SuperuserManager::Phase::Idle);

    // The peer sees its stdin close, exits and is reaped
    EXPECT_TRUE(fe.waitUntil([pid] {
        return ::kill(static_cast<pid_t>(pid), 0) < 0 && errno == ESRCH;
    })) << "peer " << pid << " still around";
    EXPECT_TRUE(fe.idle());
}

TEST(SuperuserPeerExit, ActsLikeStop) {
    config::SuperuserBridge brief;
    brief.label      = "brief";
    brief.spawn      = { "timeout", "3", MUXBRIDGE_BINARY, "--privileged" };
    brief.privileged = true;
    config::BridgeConfig c;
    c.superuserBridges = { brief };

    Frontend fe(c);
    fe.init();
    const json methods = fe.checkBusCall(SU_PATH, bus::PropertiesInterface, "Get",
                                         json::array({ SU_IFACE, "Methods" }))[0]["v"];
    fe.watchBus(SU_PATH, SU_IFACE, {
        {"Bridges", json::array({ "brief" })},
        {"Current", "none"},
        {"Methods", methods}
    });

    const auto& b = fe.internalBus();
    auto id = fe.sendBusCall(b, SU_PATH, SU_IFACE, "Start", json::array({ "brief" }));
    fe.assertBusNotify(SU_PATH, SU_IFACE, { {"Current", "init"} });
    fe.assertBusNotify(SU_PATH, SU_IFACE, { {"Current", "brief"} });
    fe.assertBusReply(id, json::array());

    const auto echo = fe.checkOpen("echo", { {"superuser", true} });
    fe.sendData(echo, "still here");
    EXPECT_EQ(fe.nextData(echo), "still here");

    // timeout ends the peer under our feet
    json close = fe.assertMsg("", { {"command", "close"}, {"channel", echo} });
    EXPECT_FALSE(close.contains("problem"));
    fe.assertBusNotify(SU_PATH, SU_IFACE, { {"Current", "none"} });
    EXPECT_EQ(fe.exitCode(), -1);

    // the id is free and elevation can start over
    fe.sendJson("", { {"command", "open"}, {"channel", echo}, {"payload", "null"} });
    fe.assertMsg("", { {"command", "ready"}, {"channel", echo} });

    id = fe.sendBusCall(b, SU_PATH, SU_IFACE, "Start", json::array({ "brief" }));
    fe.assertBusNotify(SU_PATH, SU_IFACE, { {"Current", "init"} });
    fe.assertBusNotify(SU_PATH, SU_IFACE, { {"Current", "brief"} });
    fe.assertBusReply(id, json::array());
}

TEST(SuperuserPrivileged, AlreadyRoot) {
    Bridge::Options options;
    options.privileged = true;
    Frontend fe(pseudoConfig(false), options);
    fe.init();

    fe.assertBusProps(SU_PATH, SU_IFACE, {
        {"Bridges", json::array()},
        {"Current", "root"}
    });
    const auto id = fe.sendBusCall(fe.internalBus(), SU_PATH, SU_IFACE, "Start",
                                   json::array({ "pseudo" }));
    fe.assertBusError(id, SuperuserManager::ErrorName,
                      "This bridge already runs with administrative access");

    // superuser channels open locally
    fe.checkOpen("null", { {"superuser", "require"} });
}
