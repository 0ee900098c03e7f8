/**
 * @file   bus_object.hpp
 * @brief  Declares the building blocks of the internal object bus:
 *         interface descriptors, pending replies and the BusObject base.
 *
 * An exported object describes its interface with an explicit table of
 * methods, properties and signals, built once in its constructor.  The
 * same table answers introspection ("meta") and drives dispatch.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>

namespace muxbridge::bus {

class InternalBus;

/**
 * @class PendingReply
 * @brief Handle for answering one method call, now or later.
 *
 * Copies share one completion state: the first ret()/fail() wins and
 * every later call is ignored.
 */
class PendingReply {
public:
    using ReturnFn = std::function<void(const nlohmann::json& outArgs)>;
    using ErrorFn  = std::function<void(const std::string& name,
                                        const std::string& message)>;

    PendingReply(ReturnFn onReturn, ErrorFn onError);

    /** @brief Complete with the method's output arguments (a JSON array). */
    void ret(nlohmann::json outArgs = nlohmann::json::array()) const;

    /** @brief Complete with a named error. */
    void fail(const std::string& name, const std::string& message) const;

    /** @return True once ret() or fail() was called. */
    bool done() const noexcept;

private:
    struct Shared {
        ReturnFn onReturn;
        ErrorFn  onError;
        bool     done{false};
    };
    std::shared_ptr<Shared> m_shared;
};

/// Handler that may complete its reply asynchronously.
using AsyncMethodFn = std::function<void(const nlohmann::json& args, PendingReply reply)>;
/// Handler that returns its output arguments directly.
using MethodFn      = std::function<nlohmann::json(const nlohmann::json& args)>;

struct MethodInfo {
    std::string              name;
    std::vector<std::string> in;       ///< Input signatures
    std::vector<std::string> out;      ///< Output signatures
    AsyncMethodFn            handler;
};

struct PropertyInfo {
    std::string    name;
    std::string    type;               ///< D-Bus signature
    bool           writable{false};
    nlohmann::json value;              ///< Current value (plain JSON)
};

struct SignalInfo {
    std::string              name;
    std::vector<std::string> args;     ///< Argument signatures
};

/**
 * @class InterfaceDescriptor
 * @brief Ordered table of an interface's members.
 */
class InterfaceDescriptor {
public:
    explicit InterfaceDescriptor(std::string name) : m_name(std::move(name)) {}

    const std::string& name() const noexcept { return m_name; }

    // "signals" is a Qt keyword, hence the *List names
    std::vector<MethodInfo>&         methodList() noexcept { return m_methods; }
    const std::vector<MethodInfo>&   methodList() const noexcept { return m_methods; }
    std::vector<PropertyInfo>&       propertyList() noexcept { return m_properties; }
    const std::vector<PropertyInfo>& propertyList() const noexcept { return m_properties; }
    std::vector<SignalInfo>&         signalList() noexcept { return m_signals; }
    const std::vector<SignalInfo>&   signalList() const noexcept { return m_signals; }

    const MethodInfo*   findMethod(const std::string& name) const;
    PropertyInfo*       findProperty(const std::string& name);
    const PropertyInfo* findProperty(const std::string& name) const;
    const SignalInfo*   findSignal(const std::string& name) const;

    /**
     * @brief Interface description as sent in a "meta" message.
     *
     * `{"methods":{M:{"in":[..],"out":[..]}},
     *   "properties":{P:{"flags":"r"|"rw","type":T}},
     *   "signals":{S:{"in":[..]}}}`
     */
    nlohmann::json meta() const;

    /** @brief The interface as a D-Bus introspection XML fragment. */
    std::string introspectXml() const;

private:
    std::string               m_name;
    std::vector<MethodInfo>   m_methods;
    std::vector<PropertyInfo> m_properties;
    std::vector<SignalInfo>   m_signals;
};

/**
 * @brief Check a JSON value against a single complete D-Bus type.
 * @param value      Value from a dbus-json3 message.
 * @param signature  E.g. "s", "b", "as", "a{sv}", "v".
 */
bool matchesSignature(const nlohmann::json& value, const std::string& signature);

/**
 * @brief Wrap a value as a dbus-json3 variant: `{"t": type, "v": value}`.
 */
nlohmann::json variant(const std::string& type, nlohmann::json value);

/**
 * @class BusObject
 * @brief Base class for objects exported on the InternalBus.
 *
 * Subclasses register their members in the constructor.  Property writes
 * through setProperty() notify every watcher before they return.
 */
class BusObject {
public:
    explicit BusObject(std::string interfaceName);
    virtual ~BusObject();

    BusObject(const BusObject&) = delete;
    BusObject& operator=(const BusObject&) = delete;

    const InterfaceDescriptor& descriptor() const noexcept { return m_iface; }
    const std::string& interfaceName() const noexcept { return m_iface.name(); }

    /** @return Export path, or empty while not exported. */
    const std::string& path() const noexcept { return m_path; }

    /** @return The bus this object is exported on, or nullptr. */
    InternalBus* bus() const noexcept { return m_bus; }

    /** @brief Current value of a property (null if unknown). */
    nlohmann::json property(const std::string& name) const;

    /** @brief All properties as a name -> value object. */
    nlohmann::json properties() const;

    /**
     * @brief Change a property and notify watchers if the value changed.
     * @throws std::out_of_range for an unknown property.
     */
    void setProperty(const std::string& name, nlohmann::json value);

    /**
     * @brief Emit a signal to every matching subscriber.
     * @param name  Signal name from the descriptor.
     * @param args  JSON array of arguments.
     */
    void emitSignal(const std::string& name, const nlohmann::json& args);

protected:
    void addMethod(std::string name,
                   std::vector<std::string> in,
                   std::vector<std::string> out,
                   MethodFn handler);
    void addAsyncMethod(std::string name,
                        std::vector<std::string> in,
                        std::vector<std::string> out,
                        AsyncMethodFn handler);
    void addProperty(std::string name, std::string type,
                     nlohmann::json initial, bool writable = false);
    void addSignal(std::string name, std::vector<std::string> args);

private:
    friend class InternalBus;

    InterfaceDescriptor m_iface;
    InternalBus*        m_bus{nullptr};
    std::string         m_path;
};

} // namespace muxbridge::bus
