/**
 * @file   channel_types.cpp
 * @brief  Implements ChannelTypes and the bundled payload set.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "channel_types.hpp"
 #include "dbus_json_channel.hpp"
 #include "fs_channels.hpp"
 #include "simple_channels.hpp"

 namespace muxbridge::channels {

 void ChannelTypes::add(const std::string& payload, ChannelFactory factory) {
     m_factories[payload] = std::move(factory);
 }

 bool ChannelTypes::contains(const std::string& payload) const {
     return m_factories.count(payload) != 0;
 }

 std::unique_ptr<Channel> ChannelTypes::create(const std::string& payload,
                                               ChannelHost& host,
                                               const std::string& id,
                                               const nlohmann::json& options) const
 {
     auto it = m_factories.find(payload);
     if (it == m_factories.end())
         return nullptr;
     return it->second(host, id, options);
 }

 std::vector<std::string> ChannelTypes::payloads() const {
     std::vector<std::string> out;
     for (auto const& [name, factory] : m_factories)
         out.push_back(name);
     return out;
 }

 ChannelTypes defaultChannelTypes() {
     ChannelTypes types;
     types.add<NullChannel>("null");
     types.add<EchoChannel>("echo");
     types.add<DbusJsonChannel>("dbus-json3");
     types.add<FsReadChannel>("fsread1");
     types.add<FsListChannel>("fslist1");
     return types;
 }

 } // namespace muxbridge::channels
