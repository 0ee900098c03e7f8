/**
 * @file   dbus_json_channel.cpp
 * @brief  Implements the dbus-json3 channel against the InternalBus.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "dbus_json_channel.hpp"
 #include "../errors.hpp"
 #include "../logging.hpp"
 #include <algorithm>

 namespace muxbridge::channels {

 using nlohmann::json;

 DbusJsonChannel::~DbusJsonChannel() {
     *m_alive = false;
     detach();
 }

 bool DbusJsonChannel::Rule::matches(const std::string& p, const std::string& i,
                                     const std::string& m) const
 {
     if (!path.empty()) {
         if (pathNamespace) {
             const bool under = path == "/" || p == path
                 || (p.size() > path.size() && p.compare(0, path.size(), path) == 0
                     && p[path.size()] == '/');
             if (!under) return false;
         } else if (p != path) {
             return false;
         }
     }
     if (!iface.empty() && iface != i) return false;
     if (!member.empty() && !m.empty() && member != m) return false;
     return true;
 }

 DbusJsonChannel::Rule DbusJsonChannel::parseRule(const json& match) {
     if (!match.is_object())
         throw ChannelError("protocol-error", "watch/match rule must be an object");

     Rule r;
     auto str = [&match](const char* key) -> std::string {
         auto it = match.find(key);
         if (it == match.end() || it->is_null()) return {};
         if (!it->is_string())
             throw ChannelError("protocol-error", std::string("\"") + key + "\" must be a string");
         return it->get<std::string>();
     };

     r.path = str("path");
     if (r.path.empty()) {
         r.path = str("path_namespace");
         r.pathNamespace = !r.path.empty();
     }
     r.iface  = str("interface");
     r.member = str("member");
     return r;
 }

 // -- Lifecycle --------------------------------------------------------------------

 void DbusJsonChannel::doOpen(const json& options) {
     const auto busName = options.value("bus", std::string{});
     if (busName != "internal")
         throw ChannelError("not-supported", "only the internal bus is available");

     m_bus = &host().internalBus();
     m_bus->addWatcher(this);
     ready();
 }

 void DbusJsonChannel::doClose() {
     detach();
 }

 void DbusJsonChannel::detach() {
     if (m_bus) {
         m_bus->removeWatcher(this);
         m_bus = nullptr;
     }
 }

 // -- Inbound messages -------------------------------------------------------------

 void DbusJsonChannel::doData(const std::string& data) {
     json message = json::parse(data, nullptr, false);
     if (message.is_discarded() || !message.is_object())
         throw ChannelError("protocol-error", "dbus-json3 message is not a JSON object");
     if (!m_bus)
         return;

     const json id = message.value("id", json());

     if (message.contains("call")) {
         handleCall(message["call"], id);
     } else if (message.contains("watch")) {
         handleWatch(message["watch"], id);
     } else if (message.contains("unwatch")) {
         auto rule = parseRule(message["unwatch"]);
         m_watches.erase(std::remove(m_watches.begin(), m_watches.end(), rule), m_watches.end());
         if (!id.is_null())
             sendJson({ {"id", id}, {"reply", json::array()} });
     } else if (message.contains("add-match")) {
         m_matches.push_back(parseRule(message["add-match"]));
         if (!id.is_null())
             sendJson({ {"id", id}, {"reply", json::array()} });
     } else if (message.contains("remove-match")) {
         auto rule = parseRule(message["remove-match"]);
         auto it = std::find(m_matches.begin(), m_matches.end(), rule);
         if (it != m_matches.end())
             m_matches.erase(it);
         if (!id.is_null())
             sendJson({ {"id", id}, {"reply", json::array()} });
     } else if (message.contains("meta")) {
         // Front-end supplied descriptions only matter for external buses.
     } else {
         throw ChannelError("protocol-error", "unknown dbus-json3 message: " + data);
     }
 }

 /**
  * `{"call":[path, interface, method, args], "id": I}`.  The reply may come
  * after this channel closed; it is dropped then.
  */
 void DbusJsonChannel::handleCall(const json& call, const json& id) {
     if (!call.is_array() || call.size() != 4
         || !call[0].is_string() || !call[1].is_string() || !call[2].is_string()
         || !call[3].is_array())
     {
         throw ChannelError("protocol-error", "\"call\" must be [path, interface, method, args]");
     }

     std::weak_ptr<bool> alive = m_alive;
     auto usable = [this, alive] {
         auto a = alive.lock();
         return a && *a && state() != State::Closed;
     };

     bus::PendingReply reply(
         [this, id, usable](const json& out) {
             if (!usable() || id.is_null()) return;
             sendJson({ {"reply", json::array({ out })}, {"id", id} });
         },
         [this, id, usable](const std::string& name, const std::string& message) {
             if (!usable() || id.is_null()) return;
             sendJson({ {"error", json::array({ name, json::array({ message }) })}, {"id", id} });
         });

     m_bus->call(call[0].get<std::string>(), call[1].get<std::string>(),
                 call[2].get<std::string>(), call[3], reply);
 }

 /**
  * Answers with, in order: a "meta" for each interface this channel has not
  * seen yet, one "notify" carrying every property of every matching object,
  * and the reply.
  */
 void DbusJsonChannel::handleWatch(const json& match, const json& id) {
     Rule rule = parseRule(match);
     m_watches.push_back(rule);

     const std::string ns = rule.path.empty() ? "/" : rule.path;
     json meta   = json::object();
     json notify = json::object();

     for (auto const& object : m_bus->objectsUnder(ns)) {
         if (!rule.matches(object->path(), object->interfaceName()))
             continue;
         const auto& iface = object->interfaceName();
         if (m_metaSent.insert(iface).second)
             meta[iface] = object->descriptor().meta();
         notify[object->path()][iface] = object->properties();
     }

     if (!meta.empty())
         sendJson({ {"meta", meta} });
     if (!notify.empty())
         sendJson({ {"notify", notify} });
     if (!id.is_null())
         sendJson({ {"id", id}, {"reply", json::array()} });
 }

 // -- Bus events -------------------------------------------------------------------

 void DbusJsonChannel::busPropertiesChanged(const std::string& path,
                                            const std::string& iface,
                                            const json& changed)
 {
     if (state() == State::Closed) return;
     for (auto const& w : m_watches) {
         if (w.matches(path, iface)) {
             sendJson({ {"notify", { {path, { {iface, changed} }} }} });
             return;
         }
     }
 }

 void DbusJsonChannel::busSignal(const std::string& path,
                                 const std::string& iface,
                                 const std::string& member,
                                 const json& args)
 {
     if (state() == State::Closed) return;
     for (auto const& m : m_matches) {
         if (m.matches(path, iface, member)) {
             sendJson({ {"signal", json::array({ path, iface, member, args })} });
             return;
         }
     }
 }

 } // namespace muxbridge::channels
