/**
 * @file   bridge.cpp
 * @brief  Implements the Bridge session: construction, output, channel
 *         hosting, the superuser peer relay and session teardown.
 *
 * Frame dispatch lives in router.cpp.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "bridge.hpp"
 #include "logging.hpp"
 #include <QSysInfo>

 using namespace muxbridge;
 using nlohmann::json;

 Bridge::Bridge(io::TransportPtr transport, config::BridgeConfig config, Options options)
   : m_transport(std::move(transport))
   , m_config(std::move(config))
   , m_options(options)
   , m_registry(channels::defaultChannelTypes())
   , m_machineHost(QSysInfo::machineHostName().toStdString())
 {
     m_superuser = std::make_shared<SuperuserManager>(*this, m_options.privileged);
     m_superuser->setBridges(m_config.superuserBridges);
     m_loginMessages = std::make_shared<LoginMessages>();

     m_bus.exportObject("/superuser", m_superuser);
     m_bus.exportObject("/LoginMessages", m_loginMessages);
 }

 Bridge::~Bridge() {
     if (m_transport) {
         m_transport->setFrameHook(nullptr);
         m_transport->setClosedHook(nullptr);
     }
     m_ended = true;
     m_registry.clear();
     m_registry.reap();
     m_superuser->shutdown();
 }

 void Bridge::start() {
     m_transport->setFrameHook([this](const io::Frame& f) { onFrame(f); });
     m_transport->setClosedHook([this](const std::string& p) { onTransportClosed(p); });

     write(io::controlFrame({
         {"command", "init"},
         {"version", 1},
         {"capabilities", { {"explicit-superuser", true} }}
     }));
 }

 void Bridge::shutdown() {
     if (m_ended) return;
     m_ended = true;
     qCInfo(lcRouter) << "session ending";
     m_registry.clear();
     m_superuser->shutdown();
     m_transport->close();
 }

 // -- Output -------------------------------------------------------------------

 void Bridge::write(const io::Frame& frame) {
     if (m_ended) return;
     if (!m_transport->send(frame))
         qCDebug(lcTransport) << "dropped frame for" << frame.channel.c_str();
 }

 void Bridge::channelFrame(const io::Frame& frame) {
     write(frame);
 }

 void Bridge::channelReleased(const std::string& id) {
     m_registry.release(id);
 }

 // -- Superuser peer relay -----------------------------------------------------

 /**
  * Frames from the peer keep their channel ids; only ids this session
  * routed to the peer get through.
  */
 void Bridge::peerFrame(const io::Frame& frame) {
     if (m_ended) return;

     if (!frame.isControl()) {
         if (m_registry.isRouted(frame.channel))
             write(frame);
         else
             qCDebug(lcSuperuser) << "dropping peer data for unrouted channel" << frame.channel.c_str();
         return;
     }

     json message = json::parse(frame.payload, nullptr, false);
     if (message.is_discarded() || !message.is_object()) {
         qCWarning(lcSuperuser) << "peer sent an invalid control message";
         return;
     }

     const auto id      = message.value("channel", std::string{});
     const auto command = message.value("command", std::string{});
     if (id.empty()) {
         qCDebug(lcSuperuser) << "ignoring peer command" << command.c_str();
         return;
     }
     if (!m_registry.isRouted(id)) {
         qCDebug(lcSuperuser) << "dropping peer" << command.c_str() << "for unrouted channel" << id.c_str();
         return;
     }

     write(frame);
     if (command == "close")
         m_registry.removeRoute(id);
 }

 void Bridge::peerGone() {
     for (auto const& id : m_registry.routes()) {
         qCDebug(lcSuperuser) << "closing superuser channel" << id.c_str();
         write(io::controlFrame({ {"command", "close"}, {"channel", id} }));
     }
     m_registry.clearRoutes();
 }

 // -- Teardown -----------------------------------------------------------------

 void Bridge::fatal(const std::string& message) {
     if (m_ended) return;
     qCCritical(lcRouter) << "protocol error:" << message.c_str();
     write(io::controlFrame({ {"command", "close"},
                              {"problem", "protocol-error"},
                              {"message", message} }));
     terminate(1);
 }

 void Bridge::terminate(int exitCode) {
     if (m_ended) return;
     shutdown();
     if (m_onTerminated)
         m_onTerminated(exitCode);
 }
