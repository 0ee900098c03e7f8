/**
 * @file   bus_object.cpp
 * @brief  Implements PendingReply, InterfaceDescriptor, signature checks
 *         and the BusObject member registry.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "bus_object.hpp"
 #include "internal_bus.hpp"
 #include <sstream>
 #include <stdexcept>

 namespace muxbridge::bus {

 using nlohmann::json;

 namespace {

     // Length of the single complete type starting at sig[pos]; 0 if invalid.
     std::size_t completeTypeLength(const std::string& sig, std::size_t pos) {
         if (pos >= sig.size()) return 0;
         const char c = sig[pos];
         if (c == 'a') {
             auto inner = completeTypeLength(sig, pos + 1);
             return inner ? inner + 1 : 0;
         }
         if (c == '(' || c == '{') {
             const char close = (c == '(') ? ')' : '}';
             std::size_t i = pos + 1;
             while (i < sig.size() && sig[i] != close) {
                 auto len = completeTypeLength(sig, i);
                 if (!len) return 0;
                 i += len;
             }
             return (i < sig.size()) ? i - pos + 1 : 0;
         }
         static const std::string basic = "ybnqiuxtdhsogv";
         return basic.find(c) != std::string::npos ? 1 : 0;
     }

     // Split "(sib)" / "{sv}" member list into complete types.
     std::vector<std::string> memberTypes(const std::string& sig) {
         std::vector<std::string> out;
         std::size_t i = 1;
         while (i + 1 < sig.size()) {
             auto len = completeTypeLength(sig, i);
             if (!len) break;
             out.push_back(sig.substr(i, len));
             i += len;
         }
         return out;
     }

     void xmlArgs(std::ostringstream& xml,
                  const std::vector<std::string>& types,
                  const char* direction)
     {
         for (auto const& t : types) {
             xml << "<arg type=\"" << t << "\"";
             if (direction) xml << " direction=\"" << direction << "\"";
             xml << "/>";
         }
     }

 } // namespace

 // -- PendingReply -------------------------------------------------------------

 PendingReply::PendingReply(ReturnFn onReturn, ErrorFn onError)
   : m_shared(std::make_shared<Shared>())
 {
     m_shared->onReturn = std::move(onReturn);
     m_shared->onError  = std::move(onError);
 }

 void PendingReply::ret(json outArgs) const {
     if (m_shared->done) return;
     m_shared->done = true;
     if (m_shared->onReturn) m_shared->onReturn(outArgs);
 }

 void PendingReply::fail(const std::string& name, const std::string& message) const {
     if (m_shared->done) return;
     m_shared->done = true;
     if (m_shared->onError) m_shared->onError(name, message);
 }

 bool PendingReply::done() const noexcept {
     return m_shared->done;
 }

 // -- InterfaceDescriptor ------------------------------------------------------

 const MethodInfo* InterfaceDescriptor::findMethod(const std::string& name) const {
     for (auto const& m : m_methods)
         if (m.name == name) return &m;
     return nullptr;
 }

 PropertyInfo* InterfaceDescriptor::findProperty(const std::string& name) {
     for (auto& p : m_properties)
         if (p.name == name) return &p;
     return nullptr;
 }

 const PropertyInfo* InterfaceDescriptor::findProperty(const std::string& name) const {
     for (auto const& p : m_properties)
         if (p.name == name) return &p;
     return nullptr;
 }

 const SignalInfo* InterfaceDescriptor::findSignal(const std::string& name) const {
     for (auto const& s : m_signals)
         if (s.name == name) return &s;
     return nullptr;
 }

 json InterfaceDescriptor::meta() const {
     json methods    = json::object();
     json properties = json::object();
     json signals_   = json::object();

     for (auto const& m : m_methods)
         methods[m.name] = { {"in", m.in}, {"out", m.out} };
     for (auto const& p : m_properties)
         properties[p.name] = { {"flags", p.writable ? "rw" : "r"}, {"type", p.type} };
     for (auto const& s : m_signals)
         signals_[s.name] = { {"in", s.args} };

     return { {"methods", methods}, {"properties", properties}, {"signals", signals_} };
 }

 std::string InterfaceDescriptor::introspectXml() const {
     std::ostringstream xml;
     xml << "<interface name=\"" << m_name << "\">";
     for (auto const& m : m_methods) {
         xml << "<method name=\"" << m.name << "\">";
         xmlArgs(xml, m.in, "in");
         xmlArgs(xml, m.out, "out");
         xml << "</method>";
     }
     for (auto const& p : m_properties) {
         xml << "<property name=\"" << p.name << "\" type=\"" << p.type
             << "\" access=\"" << (p.writable ? "readwrite" : "read") << "\"/>";
     }
     for (auto const& s : m_signals) {
         xml << "<signal name=\"" << s.name << "\">";
         xmlArgs(xml, s.args, nullptr);
         xml << "</signal>";
     }
     xml << "</interface>";
     return xml.str();
 }

 // -- Signatures ---------------------------------------------------------------

 bool matchesSignature(const json& value, const std::string& sig) {
     if (sig.empty() || completeTypeLength(sig, 0) != sig.size())
         return false;

     switch (sig[0]) {
       case 's': case 'o': case 'g':
         return value.is_string();
       case 'b':
         return value.is_boolean();
       case 'y': case 'n': case 'q': case 'i':
       case 'u': case 'x': case 't': case 'h':
         return value.is_number_integer();
       case 'd':
         return value.is_number();
       case 'v':
         return value.is_object()
             && value.contains("t") && value["t"].is_string()
             && value.contains("v")
             && matchesSignature(value["v"], value["t"].get<std::string>());
       case '(': {
         auto members = memberTypes(sig);
         if (!value.is_array() || value.size() != members.size()) return false;
         for (std::size_t i = 0; i < members.size(); ++i)
             if (!matchesSignature(value[i], members[i])) return false;
         return true;
       }
       case 'a': {
         const std::string elem = sig.substr(1);
         if (elem == "y")
             return value.is_string();          // byte arrays travel as base64
         if (elem[0] == '{') {
             auto kv = memberTypes(elem);
             if (!value.is_object() || kv.size() != 2) return false;
             for (auto const& item : value.items())
                 if (!matchesSignature(item.value(), kv[1])) return false;
             return true;
         }
         if (!value.is_array()) return false;
         for (auto const& item : value)
             if (!matchesSignature(item, elem)) return false;
         return true;
       }
       default:
         return false;
     }
 }

 json variant(const std::string& type, json value) {
     return { {"t", type}, {"v", std::move(value)} };
 }

 // -- BusObject ----------------------------------------------------------------

 BusObject::BusObject(std::string interfaceName)
   : m_iface(std::move(interfaceName))
 {}

 BusObject::~BusObject() = default;

 json BusObject::property(const std::string& name) const {
     auto p = m_iface.findProperty(name);
     return p ? p->value : json();
 }

 json BusObject::properties() const {
     json all = json::object();
     for (auto const& p : m_iface.propertyList())
         all[p.name] = p.value;
     return all;
 }

 void BusObject::setProperty(const std::string& name, json value) {
     auto p = m_iface.findProperty(name);
     if (!p)
         throw std::out_of_range("no property " + name + " on " + m_iface.name());
     if (p->value == value)
         return;
     p->value = std::move(value);
     if (m_bus)
         m_bus->propertiesChanged(*this, { {name, p->value} });
 }

 void BusObject::emitSignal(const std::string& name, const json& args) {
     if (m_bus)
         m_bus->signalEmitted(*this, name, args);
 }

 void BusObject::addMethod(std::string name,
                           std::vector<std::string> in,
                           std::vector<std::string> out,
                           MethodFn handler)
 {
     addAsyncMethod(std::move(name), std::move(in), std::move(out),
         [handler = std::move(handler)](const json& args, PendingReply reply) {
             reply.ret(handler(args));
         });
 }

 void BusObject::addAsyncMethod(std::string name,
                                std::vector<std::string> in,
                                std::vector<std::string> out,
                                AsyncMethodFn handler)
 {
     m_iface.methodList().push_back({ std::move(name), std::move(in),
                                      std::move(out), std::move(handler) });
 }

 void BusObject::addProperty(std::string name, std::string type,
                             json initial, bool writable)
 {
     m_iface.propertyList().push_back({ std::move(name), std::move(type),
                                        writable, std::move(initial) });
 }

 void BusObject::addSignal(std::string name, std::vector<std::string> args) {
     m_iface.signalList().push_back({ std::move(name), std::move(args) });
 }

 } // namespace muxbridge::bus
