/**
 * @file   internal_bus.hpp
 * @brief  Declares the InternalBus, an in-process object bus with D-Bus
 *         call, property and signal semantics.
 *
 * Objects are exported by path.  Calls are dispatched through each
 * object's InterfaceDescriptor; org.freedesktop.DBus.Properties and
 * org.freedesktop.DBus.Introspectable are answered by the bus itself.
 * Property changes and signals are pushed to every registered BusWatcher
 * synchronously, before the change that caused them returns.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "bus_object.hpp"

namespace muxbridge::bus {

/// Well-known error names.
namespace error {
    inline constexpr const char* UnknownObject    = "org.freedesktop.DBus.Error.UnknownObject";
    inline constexpr const char* UnknownInterface = "org.freedesktop.DBus.Error.UnknownInterface";
    inline constexpr const char* UnknownMethod    = "org.freedesktop.DBus.Error.UnknownMethod";
    inline constexpr const char* UnknownProperty  = "org.freedesktop.DBus.Error.UnknownProperty";
    inline constexpr const char* PropertyReadOnly = "org.freedesktop.DBus.Error.PropertyReadOnly";
    inline constexpr const char* InvalidArgs      = "org.freedesktop.DBus.Error.InvalidArgs";
    inline constexpr const char* Failed           = "org.freedesktop.DBus.Error.Failed";
}

inline constexpr const char* PropertiesInterface   = "org.freedesktop.DBus.Properties";
inline constexpr const char* IntrospectableInterface = "org.freedesktop.DBus.Introspectable";

/**
 * @class BusWatcher
 * @brief Receives every property change and signal on the bus.
 *
 * Watchers do their own filtering against their subscriptions.
 */
class BusWatcher {
public:
    virtual ~BusWatcher() = default;

    virtual void busPropertiesChanged(const std::string& path,
                                      const std::string& iface,
                                      const nlohmann::json& changed) = 0;

    virtual void busSignal(const std::string& path,
                           const std::string& iface,
                           const std::string& member,
                           const nlohmann::json& args) = 0;
};

/**
 * @class InternalBus
 * @brief Object registry and call dispatcher.
 */
class InternalBus {
public:
    InternalBus() = default;
    ~InternalBus();

    InternalBus(const InternalBus&) = delete;
    InternalBus& operator=(const InternalBus&) = delete;

    /**
     * @brief Export an object at a path.
     * @throws std::invalid_argument if the path is taken or the object is
     *         already exported elsewhere.
     */
    void exportObject(const std::string& path, std::shared_ptr<BusObject> object);

    /** @brief Remove the object at path, if any. */
    void unexportObject(const std::string& path);

    /** @return The object at path, or nullptr. */
    std::shared_ptr<BusObject> find(const std::string& path) const;

    /** @return Every object at or below pathNamespace, in path order. */
    std::vector<std::shared_ptr<BusObject>> objectsUnder(const std::string& pathNamespace) const;

    /**
     * @brief Dispatch one method call.
     *
     * Exactly one of the reply's callbacks runs, possibly after call()
     * returned (asynchronous methods).
     */
    void call(const std::string& path,
              const std::string& iface,
              const std::string& method,
              const nlohmann::json& args,
              PendingReply reply);

    void addWatcher(BusWatcher* watcher);
    void removeWatcher(BusWatcher* watcher);

private:
    friend class BusObject;

    void propertiesChanged(BusObject& object, const nlohmann::json& changed);
    void signalEmitted(BusObject& object, const std::string& name, const nlohmann::json& args);

    void callProperties(BusObject& object, const std::string& method,
                        const nlohmann::json& args, const PendingReply& reply);
    std::string introspect(const std::string& path) const;
    bool isWatching(BusWatcher* watcher) const;

    std::map<std::string, std::shared_ptr<BusObject>> m_objects;
    std::vector<BusWatcher*>                          m_watchers;
};

} // namespace muxbridge::bus
