/**
 * @file   registry.hpp
 * @brief  Declares ChannelRegistry, the owner of every open channel and of
 *         the set of ids routed to the superuser peer.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "channel.hpp"
#include "channels/channel_types.hpp"

namespace muxbridge {

/**
 * @class ChannelRegistry
 * @brief id -> Channel map with id uniqueness across local and routed ids.
 *
 * Released channels are parked until reap(), so a channel can release
 * itself from inside one of its own calls.
 */
class ChannelRegistry {
public:
    explicit ChannelRegistry(channels::ChannelTypes types);
    ~ChannelRegistry();

    /**
     * @brief Create and start the endpoint for an "open" message.
     * @return The channel; it may already be closed if opening failed.
     * @throws ProtocolError if id is already in use.
     * @throws ChannelError  "not-supported" for an unknown payload.
     */
    Channel* open(ChannelHost& host, const std::string& id, const nlohmann::json& options);

    /** @return The open channel with this id, or nullptr. */
    Channel* find(const std::string& id) const;

    /** @return True if id names a local channel or a routed one. */
    bool contains(const std::string& id) const;

    /** @brief Drop the channel from the id map; destroyed at reap(). */
    void release(const std::string& id);

    /** @brief Destroy released channels. */
    void reap();

    /** @brief Close channel id without a problem; no-op if unknown. */
    void close(const std::string& id);

    /** @brief Drop every channel without sending anything. */
    void clear();

    /** @return Ids of the open local channels, in order. */
    std::vector<std::string> ids() const;

    /// Routes to the superuser peer ---------------------------------------------

    void addRoute(const std::string& id) { m_routes.insert(id); }
    void removeRoute(const std::string& id) { m_routes.erase(id); }
    bool isRouted(const std::string& id) const { return m_routes.count(id) != 0; }
    const std::set<std::string>& routes() const noexcept { return m_routes; }
    void clearRoutes() { m_routes.clear(); }

    const channels::ChannelTypes& types() const noexcept { return m_types; }

private:
    channels::ChannelTypes                          m_types;
    std::map<std::string, std::unique_ptr<Channel>> m_channels;
    std::vector<std::unique_ptr<Channel>>           m_graveyard;
    std::set<std::string>                           m_routes;
};

} // namespace muxbridge
