/**
 * @file   superuser.cpp
 * @brief  Implements SuperuserManager: the /superuser bus members and the
 *         peer lifecycle behind Start, Stop and Answer.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "superuser.hpp"
 #include "errors.hpp"
 #include "logging.hpp"
 #include "peer_bridge.hpp"
 #include <QCoreApplication>

 using namespace muxbridge;
 using nlohmann::json;

 SuperuserManager::SuperuserManager(PeerRouter& router, bool privileged)
   : bus::BusObject(Interface)
   , m_router(router)
   , m_phase(privileged ? Phase::Privileged : Phase::Idle)
 {
     registerMembers();
 }

 SuperuserManager::~SuperuserManager() {
     detachPeer();
 }

 void SuperuserManager::registerMembers() {
     addProperty("Bridges", "as", json::array());
     addProperty("Current", "s", privileged() ? "root" : "none");
     addProperty("Methods", "a{sv}", json::object());
     addSignal("Prompt", { "s", "s", "s", "b", "s" });

     addAsyncMethod("Start", { "s" }, {}, [this](const json& args, bus::PendingReply reply) {
         start(args[0].get<std::string>(),
               [this](const std::string& prompt, const std::string& message, bool echo) {
                   // (message, prompt, default, echo, error)
                   emitSignal("Prompt", json::array({ message, prompt, "", echo, "" }));
               },
               [reply](bool ok, const std::string& message) {
                   if (ok) reply.ret();
                   else    reply.fail(ErrorName, message);
               });
     });
     addMethod("Stop", {}, {}, [this](const json&) {
         stop();
         return json::array();
     });
     addMethod("Answer", { "s" }, {}, [this](const json& args) {
         answer(args[0].get<std::string>());
         return json::array();
     });
 }

 void SuperuserManager::setBridges(const std::vector<config::SuperuserBridge>& bridges) {
     m_bridges.clear();
     for (auto const& b : bridges)
         if (b.privileged)
             m_bridges.push_back(b);
     publishBridges();
 }

 std::vector<std::string> SuperuserManager::labels() const {
     std::vector<std::string> out;
     if (privileged()) return out;
     for (auto const& b : m_bridges)
         out.push_back(b.label);
     return out;
 }

 void SuperuserManager::publishBridges() {
     json methods = json::object();
     for (auto const& label : labels())
         methods[label] = bus::variant("a{sv}", { {"label", bus::variant("s", label)} });
     setProperty("Bridges", labels());
     setProperty("Methods", methods);
 }

 // -- Transitions ----------------------------------------------------------------

 void SuperuserManager::start(const std::string& label, PromptFn onPrompt, DoneFn onDone) {
     if (m_phase == Phase::Privileged)
         throw BusError(ErrorName, "This bridge already runs with administrative access");
     if (m_phase != Phase::Idle)
         throw BusError(ErrorName, "A superuser bridge is already starting or running");

     const config::SuperuserBridge* chosen = nullptr;
     for (auto const& b : m_bridges) {
         if (label == "any" || b.label == label) {
             chosen = &b;
             break;
         }
     }
     if (!chosen)
         throw BusError(ErrorName, "Unknown superuser bridge type \"" + label + "\"");

     qCInfo(lcSuperuser) << "starting superuser bridge" << chosen->label.c_str();
     m_onPrompt = std::move(onPrompt);
     m_onDone   = std::move(onDone);
     m_phase    = Phase::Connecting;
     setProperty("Current", "init");

     // Owned by the application until shutdown() hands it to deleteLater(),
     // so a peer still winding down at exit is killed by ~PeerBridge.
     m_peer = new PeerBridge(*chosen, m_router.initHost(), QCoreApplication::instance());
     PeerBridge* peer = m_peer;

     QObject::connect(peer, &PeerBridge::authorizeRequested, peer,
         [this](const QString& cookie, const QString& prompt, const QString& message, bool echo) {
             m_pendingCookie = cookie.toStdString();
             qCDebug(lcSuperuser) << "peer asks:" << prompt;
             if (m_onPrompt)
                 m_onPrompt(prompt.toStdString(), message.toStdString(), echo);
         });
     QObject::connect(peer, &PeerBridge::connected, peer, [this] { onConnected(); });
     QObject::connect(peer, &PeerBridge::frameReceived, peer,
         [this](const io::Frame& frame) { m_router.peerFrame(frame); });
     QObject::connect(peer, &PeerBridge::disconnected, peer,
         [this](const QString& message) { onDisconnected(message.toStdString()); });

     peer->start();
 }

 void SuperuserManager::stop() {
     if (m_phase == Phase::Connecting)
         throw BusError(ErrorName, "Cannot stop a superuser bridge while it is starting");
     if (m_phase != Phase::Running)
         return;

     qCInfo(lcSuperuser) << "stopping superuser bridge" << m_peer->label().c_str();
     detachPeer();
     m_phase = Phase::Idle;
     m_router.peerGone();
     setProperty("Current", "none");
 }

 void SuperuserManager::answer(const std::string& response) {
     if (!m_peer || m_pendingCookie.empty())
         return;
     std::string cookie;
     cookie.swap(m_pendingCookie);
     m_peer->answer(cookie, response);
 }

 void SuperuserManager::shutdown() {
     detachPeer();
     if (m_phase != Phase::Privileged)
         m_phase = Phase::Idle;
     m_onPrompt = nullptr;
     m_onDone   = nullptr;
 }

 bool SuperuserManager::send(const io::Frame& frame) {
     if (!running()) return false;
     m_peer->send(frame);
     return true;
 }

 // -- Peer events ----------------------------------------------------------------

 void SuperuserManager::onConnected() {
     m_phase = Phase::Running;
     m_pendingCookie.clear();
     qCInfo(lcSuperuser) << "superuser bridge" << m_peer->label().c_str() << "is running";
     setProperty("Current", m_peer->label());
     finishStart(true, {});
 }

 /**
  * An exit while Running is handled like Stop.  An exit while Connecting
  * fails the pending Start with the peer's last words.
  */
 void SuperuserManager::onDisconnected(const std::string& message) {
     const Phase was = m_phase;
     detachPeer();
     m_phase = Phase::Idle;
     m_pendingCookie.clear();

     if (was == Phase::Running) {
         qCWarning(lcSuperuser) << "superuser bridge exited:" << message.c_str();
         m_router.peerGone();
         setProperty("Current", "none");
     } else if (was == Phase::Connecting) {
         qCInfo(lcSuperuser) << "superuser bridge failed to start:" << message.c_str();
         setProperty("Current", "none");
         finishStart(false, message);
     }
 }

 void SuperuserManager::detachPeer() {
     if (!m_peer) return;
     PeerBridge* peer = m_peer;
     m_peer = nullptr;
     m_pendingCookie.clear();
     peer->shutdown();
 }

 void SuperuserManager::finishStart(bool ok, const std::string& message) {
     DoneFn done = std::move(m_onDone);
     m_onDone   = nullptr;
     m_onPrompt = nullptr;
     if (done)
         done(ok, message);
 }
