/**
 * @file   internal_bus.cpp
 * @brief  Implements InternalBus: export table, call dispatch, the
 *         standard Properties/Introspectable interfaces and watcher fan-out.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "internal_bus.hpp"
 #include "../errors.hpp"
 #include "../logging.hpp"
 #include <algorithm>
 #include <set>
 #include <stdexcept>

 namespace muxbridge::bus {

 using nlohmann::json;

 namespace {

     bool underNamespace(const std::string& path, const std::string& ns) {
         if (ns.empty() || ns == "/" || path == ns) return true;
         return path.size() > ns.size()
             && path.compare(0, ns.size(), ns) == 0
             && path[ns.size()] == '/';
     }

     void checkArgs(const json& args, std::size_t count) {
         if (!args.is_array() || args.size() != count)
             throw BusError(error::InvalidArgs,
                            "Expected " + std::to_string(count) + " arguments");
         for (auto const& a : args)
             if (!a.is_string())
                 throw BusError(error::InvalidArgs, "Expected string arguments");
     }

 } // namespace

 InternalBus::~InternalBus() {
     for (auto& [path, object] : m_objects) {
         object->m_bus = nullptr;
         object->m_path.clear();
     }
 }

 // -- Export table -------------------------------------------------------------

 void InternalBus::exportObject(const std::string& path, std::shared_ptr<BusObject> object) {
     if (!object || path.empty() || path[0] != '/')
         throw std::invalid_argument("invalid object path: " + path);
     if (m_objects.count(path))
         throw std::invalid_argument("object already exported at " + path);
     if (object->m_bus)
         throw std::invalid_argument("object already exported at " + object->m_path);

     object->m_bus  = this;
     object->m_path = path;
     qCDebug(lcBus) << "exported" << object->interfaceName().c_str() << "at" << path.c_str();
     m_objects.emplace(path, std::move(object));
 }

 void InternalBus::unexportObject(const std::string& path) {
     auto it = m_objects.find(path);
     if (it == m_objects.end()) return;
     it->second->m_bus = nullptr;
     it->second->m_path.clear();
     m_objects.erase(it);
 }

 std::shared_ptr<BusObject> InternalBus::find(const std::string& path) const {
     auto it = m_objects.find(path);
     return it == m_objects.end() ? nullptr : it->second;
 }

 std::vector<std::shared_ptr<BusObject>> InternalBus::objectsUnder(const std::string& ns) const {
     std::vector<std::shared_ptr<BusObject>> out;
     for (auto const& [path, object] : m_objects)
         if (underNamespace(path, ns))
             out.push_back(object);
     return out;
 }

 // -- Calls ----------------------------------------------------------------------

 /**
  * Resolves path, interface and method in that order; the first miss
  * fails the reply with the matching Unknown* error.  BusError thrown by
  * a handler becomes an error reply; so does a JSON type mismatch while
  * reading arguments.  Any other exception fails the call as
  * org.freedesktop.DBus.Error.Failed.
  */
 void InternalBus::call(const std::string& path,
                        const std::string& iface,
                        const std::string& method,
                        const json& args,
                        PendingReply reply)
 {
     qCDebug(lcBus) << "call" << path.c_str() << iface.c_str() << method.c_str();

     // Keep the object alive even if the handler unexports it.
     auto object = find(path);
     try {
         if (!object && iface == IntrospectableInterface && method == "Introspect") {
             reply.ret(json::array({ introspect(path) }));
             return;
         }
         if (!object)
             throw BusError(error::UnknownObject, "Object does not exist at path " + path);

         if (iface == PropertiesInterface) {
             callProperties(*object, method, args, reply);
             return;
         }
         if (iface == IntrospectableInterface) {
             if (method != "Introspect")
                 throw BusError(error::UnknownMethod, "Unknown method " + method + " on " + iface);
             reply.ret(json::array({ introspect(path) }));
             return;
         }
         if (iface != object->interfaceName())
             throw BusError(error::UnknownInterface,
                            "Object " + path + " does not implement " + iface);

         auto info = object->descriptor().findMethod(method);
         if (!info)
             throw BusError(error::UnknownMethod, "Unknown method " + method + " on " + iface);

         if (!args.is_array() || args.size() != info->in.size())
             throw BusError(error::InvalidArgs,
                            "Method " + method + " expects " + std::to_string(info->in.size())
                            + " arguments");
         for (std::size_t i = 0; i < info->in.size(); ++i)
             if (!matchesSignature(args[i], info->in[i]))
                 throw BusError(error::InvalidArgs,
                                "Argument " + std::to_string(i) + " of " + method
                                + " is not of type " + info->in[i]);

         info->handler(args, reply);
     } catch (const BusError& e) {
         qCDebug(lcBus) << "call failed:" << e.name().c_str() << e.what();
         reply.fail(e.name(), e.what());
     } catch (const json::exception& e) {
         reply.fail(error::InvalidArgs, e.what());
     } catch (const std::exception& e) {
         qCWarning(lcBus) << "method" << method.c_str() << "on" << path.c_str() << "failed:" << e.what();
         reply.fail(error::Failed, e.what());
     }
 }

 void InternalBus::callProperties(BusObject& object, const std::string& method,
                                  const json& args, const PendingReply& reply)
 {
     auto& desc = object.m_iface;

     if (method == "GetAll") {
         checkArgs(args, 1);
         const auto iface = args[0].get<std::string>();
         if (!iface.empty() && iface != desc.name())
             throw BusError(error::UnknownInterface, "Object does not implement " + iface);
         json all = json::object();
         for (auto const& p : desc.propertyList())
             all[p.name] = variant(p.type, p.value);
         reply.ret(json::array({ all }));
         return;
     }

     if (method == "Get" || method == "Set") {
         if (method == "Get") {
             checkArgs(args, 2);
         } else if (!args.is_array() || args.size() != 3
                    || !args[0].is_string() || !args[1].is_string()) {
             throw BusError(error::InvalidArgs, "Set expects (ssv)");
         }

         const auto iface = args[0].get<std::string>();
         const auto name  = args[1].get<std::string>();
         if (iface != desc.name())
             throw BusError(error::UnknownInterface, "Object does not implement " + iface);
         auto prop = desc.findProperty(name);
         if (!prop)
             throw BusError(error::UnknownProperty, "Unknown property " + name + " on " + iface);

         if (method == "Get") {
             reply.ret(json::array({ variant(prop->type, prop->value) }));
             return;
         }

         if (!prop->writable)
             throw BusError(error::PropertyReadOnly, "Property " + name + " is read-only");
         const json& v = args[2];
         if (!matchesSignature(v, "v") || v["t"] != prop->type)
             throw BusError(error::InvalidArgs, "Property " + name + " has type " + prop->type);
         object.setProperty(name, v["v"]);
         reply.ret();
         return;
     }

     throw BusError(error::UnknownMethod, "Unknown method " + method + " on " + PropertiesInterface);
 }

 std::string InternalBus::introspect(const std::string& path) const {
     std::string xml = "<node>";
     auto self = find(path);
     if (self) {
         xml += "<interface name=\"" + std::string(IntrospectableInterface) + "\">"
                "<method name=\"Introspect\"><arg type=\"s\" direction=\"out\"/></method>"
                "</interface>";
         xml += self->descriptor().introspectXml();
     }

     // Immediate children only.
     std::set<std::string> children;
     const std::string prefix = (path == "/") ? "/" : path + "/";
     for (auto const& [p, object] : m_objects) {
         if (p.size() <= prefix.size() || p.compare(0, prefix.size(), prefix) != 0)
             continue;
         children.insert(p.substr(prefix.size(), p.find('/', prefix.size()) - prefix.size()));
     }
     for (auto const& child : children)
         xml += "<node name=\"" + child + "\"/>";

     xml += "</node>";
     return xml;
 }

 // -- Watchers -------------------------------------------------------------------

 void InternalBus::addWatcher(BusWatcher* watcher) {
     if (watcher && !isWatching(watcher))
         m_watchers.push_back(watcher);
 }

 void InternalBus::removeWatcher(BusWatcher* watcher) {
     m_watchers.erase(std::remove(m_watchers.begin(), m_watchers.end(), watcher),
                      m_watchers.end());
 }

 bool InternalBus::isWatching(BusWatcher* watcher) const {
     return std::find(m_watchers.begin(), m_watchers.end(), watcher) != m_watchers.end();
 }

 // Watchers may unregister while being notified, so iterate over a copy
 // and skip any that left in the meantime.
 void InternalBus::propertiesChanged(BusObject& object, const json& changed) {
     const auto watchers = m_watchers;
     for (auto* w : watchers)
         if (isWatching(w))
             w->busPropertiesChanged(object.path(), object.interfaceName(), changed);
 }

 void InternalBus::signalEmitted(BusObject& object, const std::string& name, const json& args) {
     qCDebug(lcBus) << "signal" << object.path().c_str() << name.c_str();
     const auto watchers = m_watchers;
     for (auto* w : watchers)
         if (isWatching(w))
             w->busSignal(object.path(), object.interfaceName(), name, args);
 }

 } // namespace muxbridge::bus
