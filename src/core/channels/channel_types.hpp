/**
 * @file   channel_types.hpp
 * @brief  Maps "payload" tags to channel factories.
 *
 * Adding a payload type is one add() call; the router never names
 * concrete channel classes.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <functional>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "../channel.hpp"

namespace muxbridge::channels {

/// Builds one endpoint; nothing may be sent before Channel::start().
using ChannelFactory = std::function<std::unique_ptr<Channel>(ChannelHost& host,
                                                               const std::string& id,
                                                               const nlohmann::json& options)>;

class ChannelTypes {
public:
    /** @brief Register (or replace) the factory for a payload tag. */
    void add(const std::string& payload, ChannelFactory factory);

    template <typename T>
    void add(const std::string& payload) {
        add(payload, [](ChannelHost& host, const std::string& id, const nlohmann::json& options) {
            return std::unique_ptr<Channel>(std::make_unique<T>(host, id, options));
        });
    }

    /** @return True if payload has a factory. */
    bool contains(const std::string& payload) const;

    /** @return A new endpoint, or nullptr for an unknown payload. */
    std::unique_ptr<Channel> create(const std::string& payload,
                                    ChannelHost& host,
                                    const std::string& id,
                                    const nlohmann::json& options) const;

    std::vector<std::string> payloads() const;

private:
    std::map<std::string, ChannelFactory> m_factories;
};

/** @brief null, echo, dbus-json3, fsread1 and fslist1. */
ChannelTypes defaultChannelTypes();

} // namespace muxbridge::channels
