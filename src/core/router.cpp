/**
 * @file   router.cpp
 * @brief  The control router: decodes inbound frames and dispatches them
 *         to channels, the superuser peer or session-wide handlers.
 *
 * Protocol violations are thrown as ProtocolError from anywhere below
 * dispatch() and end the session in onFrame().
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "bridge.hpp"
 #include "errors.hpp"
 #include "logging.hpp"

 using namespace muxbridge;
 using nlohmann::json;

 // -- Entry points ---------------------------------------------------------------

 void Bridge::onFrame(const io::Frame& frame) {
     if (m_ended) return;
     try {
         dispatch(frame);
     } catch (const ProtocolError& e) {
         fatal(e.what());
     } catch (const json::exception& e) {
         fatal(std::string("malformed control message: ") + e.what());
     }
     m_registry.reap();
 }

 /**
  * A clean EOF ends the session silently.  A framing error still gets a
  * protocol-error close out before the session ends.
  */
 void Bridge::onTransportClosed(const std::string& problem) {
     if (m_ended) return;
     if (problem.empty()) {
         qCInfo(lcRouter) << "front end disconnected";
         terminate(0);
     } else {
         fatal("transport failed: " + problem);
     }
     m_registry.reap();
 }

 void Bridge::dispatch(const io::Frame& frame) {
     if (!frame.isControl()) {
         if (!m_initReceived)
             throw ProtocolError("data frame received before init");

         if (m_registry.isRouted(frame.channel)) {
             m_superuser->send(frame);
         } else if (auto ch = m_registry.find(frame.channel)) {
             ch->receiveData(frame.payload);
         } else {
             qCDebug(lcRouter) << "data for unknown channel" << frame.channel.c_str();
         }
         return;
     }

     json message = json::parse(frame.payload, nullptr, false);
     if (message.is_discarded() || !message.is_object())
         throw ProtocolError("control message is not a JSON object");

     auto cmd = message.find("command");
     if (cmd == message.end() || !cmd->is_string())
         throw ProtocolError("control message without a command");

     if (!m_initReceived && *cmd != "init")
         throw ProtocolError("expected init, got " + cmd->get<std::string>());

     handleControl(message, frame);
 }

 void Bridge::handleControl(const json& message, const io::Frame& frame) {
     const auto command = message["command"].get<std::string>();
     qCDebug(lcRouter) << "control" << command.c_str();

     if (command == "init") {
         if (m_initReceived)
             throw ProtocolError("duplicate init");
         handleInit(message);
     } else if (command == "open") {
         handleOpen(message, frame);
     } else if (command == "done" || command == "close" || command == "options") {
         handleChannelCommand(command, message, frame);
     } else if (command == "ping") {
         if (message.contains("channel")) {
             handleChannelCommand(command, message, frame);
         } else {
             json pong = message;
             pong["command"] = "pong";
             write(io::controlFrame(pong));
         }
     } else if (command == "kill" || command == "logout") {
         handleKill(message, frame);
     } else if (command == "authorize") {
         handleAuthorize(message);
     } else if (command == "ready" || command == "pong") {
         // nothing to do
     } else {
         throw ProtocolError("unknown command: " + command);
     }
 }

 // -- init -------------------------------------------------------------------------

 void Bridge::handleInit(const json& message) {
     auto version = message.find("version");
     if (version == message.end() || !version->is_number_integer() || *version != 1)
         throw ProtocolError("unsupported protocol version");

     m_initReceived = true;
     auto host = message.find("host");
     if (host != message.end() && host->is_string() && !host->get<std::string>().empty())
         m_host = host->get<std::string>();
     qCInfo(lcRouter) << "session initialized for host" << m_host.c_str();

     auto su = message.find("superuser");
     if (su != message.end() && su->is_object()) {
         auto id = su->find("id");
         if (id != su->end() && id->is_string())
             startInitElevation(id->get<std::string>());
     }
 }

 /**
  * Elevation requested in init.  Prompts go to the front end as
  * "authorize" challenges; the outcome, good or bad, is announced with
  * "superuser-init-done".
  */
 void Bridge::startInitElevation(const std::string& label) {
     auto done = [this] {
         m_authorizeCookie.clear();
         write(io::controlFrame({ {"command", "superuser-init-done"} }));
     };

     try {
         m_superuser->start(label,
             [this](const std::string& prompt, const std::string& message, bool echo) {
                 m_authorizeCookie = "superuser-init-" + std::to_string(++m_cookieSeq);
                 json challenge = {
                     {"command", "authorize"},
                     {"cookie", m_authorizeCookie},
                     {"challenge", "plain1:"},
                     {"prompt", prompt},
                     {"echo", echo}
                 };
                 if (!message.empty())
                     challenge["message"] = message;
                 write(io::controlFrame(challenge));
             },
             [this, done](bool ok, const std::string& message) {
                 if (!ok)
                     qCWarning(lcSuperuser) << "init-time elevation failed:" << message.c_str();
                 done();
             });
     } catch (const BusError& e) {
         qCWarning(lcSuperuser) << "init-time elevation refused:" << e.what();
         done();
     }
 }

 void Bridge::handleAuthorize(const json& message) {
     const auto cookie = message.value("cookie", std::string{});
     if (cookie.empty() || cookie != m_authorizeCookie) {
         qCDebug(lcRouter) << "ignoring authorize for unknown cookie" << cookie.c_str();
         return;
     }
     m_authorizeCookie.clear();
     m_superuser->answer(message.value("response", std::string{}));
 }

 // -- open -------------------------------------------------------------------------

 bool Bridge::isLocalHost(const std::string& host) const {
     return host == m_host || host == "localhost"
         || (!m_machineHost.empty() && host == m_machineHost);
 }

 void Bridge::refuseOpen(const std::string& id, const std::string& problem,
                         const std::string& message)
 {
     json close = { {"command", "close"}, {"channel", id}, {"problem", problem} };
     if (!message.empty())
         close["message"] = message;
     write(io::controlFrame(close));
 }

 /**
  * Checks run in a fixed order: channel id, host, superuser routing,
  * payload.  A bad host is always reported as no-host, even when the
  * superuser check would fail too.
  */
 void Bridge::handleOpen(const json& message, const io::Frame& frame) {
     auto idIt = message.find("channel");
     if (idIt == message.end() || !idIt->is_string() || idIt->get<std::string>().empty())
         throw ProtocolError("open without a channel id");
     const auto id = idIt->get<std::string>();

     if (m_registry.contains(id))
         throw ProtocolError("channel id " + id + " is already in use");

     // 1) host
     auto host = message.find("host");
     if (host != message.end() && !host->is_null()) {
         if (!host->is_string() || !isLocalHost(host->get<std::string>())) {
             refuseOpen(id, "no-host");
             return;
         }
     }

     // 2) superuser
     const json su = message.value("superuser", json());
     const bool require = (su == true) || (su == "require");
     const bool attempt = (su == "try");
     if ((require || attempt) && !m_superuser->privileged()) {
         if (m_superuser->running()) {
             qCDebug(lcRouter) << "routing channel" << id.c_str() << "to the superuser bridge";
             m_registry.addRoute(id);
             m_superuser->send(frame);
             return;
         }
         if (require) {
             refuseOpen(id, "access-denied");
             return;
         }
     }

     // 3) endpoint
     auto payload = message.find("payload");
     if (payload == message.end() || !payload->is_string() || payload->get<std::string>().empty()) {
         refuseOpen(id, "protocol-error", "open without a payload");
         return;
     }
     try {
         m_registry.open(*this, id, message);
     } catch (const ChannelError& e) {
         refuseOpen(id, e.problem(), e.attrs().value("message", std::string{}));
     }
 }

 // -- channel-scoped commands ------------------------------------------------------

 void Bridge::handleChannelCommand(const std::string& command,
                                   const json& message,
                                   const io::Frame& frame)
 {
     auto idIt = message.find("channel");
     if (idIt == message.end() || !idIt->is_string() || idIt->get<std::string>().empty())
         throw ProtocolError(command + " without a channel id");
     const auto id = idIt->get<std::string>();

     if (m_registry.isRouted(id)) {
         m_superuser->send(frame);
         return;
     }

     Channel* ch = m_registry.find(id);
     if (!ch) {
         qCDebug(lcRouter) << command.c_str() << "for unknown channel" << id.c_str();
         return;
     }

     if (command == "done")
         ch->receiveDone();
     else if (command == "close")
         ch->receiveClose();
     else if (command == "options")
         ch->receiveOptions(message);
     else if (command == "ping")
         ch->receivePing(message);
 }

 /**
  * "kill" closes every local channel, or only those of kill.group, and is
  * passed on to a running peer.  "logout" closes everything.
  */
 void Bridge::handleKill(const json& message, const io::Frame& frame) {
     const bool logout = message["command"] == "logout";
     const auto group  = logout ? std::string{} : message.value("group", std::string{});

     for (auto const& id : m_registry.ids()) {
         Channel* ch = m_registry.find(id);
         if (ch && (group.empty() || ch->group() == group))
             ch->terminate("terminated");
     }

     if (m_superuser->running()) {
         if (logout)
             m_superuser->send(io::controlFrame({ {"command", "kill"} }));
         else
             m_superuser->send(frame);
     }
 }
