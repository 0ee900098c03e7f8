/**
 * @file   dbus_json_channel.hpp
 * @brief  The "dbus-json3" channel: the front end's window onto the
 *         InternalBus.
 *
 * Every data frame is one JSON message: "call", "watch"/"unwatch" or
 * "add-match"/"remove-match".  Replies, property notifications and
 * signals flow back on the same channel.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <memory>
#include <set>
#include <string>
#include <vector>
#include "../channel.hpp"
#include "../bus/internal_bus.hpp"

namespace muxbridge::channels {

class DbusJsonChannel : public Channel, public bus::BusWatcher {
public:
    using Channel::Channel;
    ~DbusJsonChannel() override;

    void busPropertiesChanged(const std::string& path,
                              const std::string& iface,
                              const nlohmann::json& changed) override;

    void busSignal(const std::string& path,
                   const std::string& iface,
                   const std::string& member,
                   const nlohmann::json& args) override;

protected:
    void doOpen(const nlohmann::json& options) override;
    void doData(const std::string& data) override;
    void doClose() override;

private:
    /// One watch or match rule.  Empty fields match anything.
    struct Rule {
        std::string path;
        bool        pathNamespace{false};
        std::string iface;
        std::string member;

        bool matches(const std::string& p, const std::string& i,
                     const std::string& m = {}) const;
        bool operator==(const Rule& o) const {
            return path == o.path && pathNamespace == o.pathNamespace
                && iface == o.iface && member == o.member;
        }
    };

    static Rule parseRule(const nlohmann::json& match);

    void handleCall(const nlohmann::json& call, const nlohmann::json& id);
    void handleWatch(const nlohmann::json& match, const nlohmann::json& id);
    void detach();

    bus::InternalBus*     m_bus{nullptr};
    std::vector<Rule>     m_watches;
    std::vector<Rule>     m_matches;
    std::set<std::string> m_metaSent;        ///< Interfaces already described
    std::shared_ptr<bool> m_alive{std::make_shared<bool>(true)};
};

} // namespace muxbridge::channels
