/**
 * @file   registry.cpp
 * @brief  Implements ChannelRegistry.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "registry.hpp"
 #include "errors.hpp"
 #include "logging.hpp"

 using namespace muxbridge;
 using nlohmann::json;

 ChannelRegistry::ChannelRegistry(channels::ChannelTypes types)
   : m_types(std::move(types))
 {}

 ChannelRegistry::~ChannelRegistry() {
     clear();
     reap();
 }

 Channel* ChannelRegistry::open(ChannelHost& host, const std::string& id, const json& options) {
     if (contains(id))
         throw ProtocolError("channel id " + id + " is already in use");

     const auto payload = options.value("payload", std::string{});
     auto channel = m_types.create(payload, host, id, options);
     if (!channel)
         throw ChannelError("not-supported", "unsupported payload type: " + payload);

     Channel* raw = channel.get();
     m_channels.emplace(id, std::move(channel));
     raw->start();
     return raw;
 }

 Channel* ChannelRegistry::find(const std::string& id) const {
     auto it = m_channels.find(id);
     return it == m_channels.end() ? nullptr : it->second.get();
 }

 bool ChannelRegistry::contains(const std::string& id) const {
     return m_channels.count(id) != 0 || m_routes.count(id) != 0;
 }

 void ChannelRegistry::release(const std::string& id) {
     auto it = m_channels.find(id);
     if (it == m_channels.end()) return;
     qCDebug(lcChannel) << "released channel" << id.c_str();
     m_graveyard.push_back(std::move(it->second));
     m_channels.erase(it);
 }

 void ChannelRegistry::reap() {
     // Destructors may release further channels; swap first.
     while (!m_graveyard.empty()) {
         std::vector<std::unique_ptr<Channel>> dead;
         dead.swap(m_graveyard);
     }
 }

 void ChannelRegistry::close(const std::string& id) {
     if (auto ch = find(id))
         ch->receiveClose();
 }

 void ChannelRegistry::clear() {
     for (auto& [id, channel] : m_channels)
         m_graveyard.push_back(std::move(channel));
     m_channels.clear();
     m_routes.clear();
 }

 std::vector<std::string> ChannelRegistry::ids() const {
     std::vector<std::string> out;
     out.reserve(m_channels.size());
     for (auto const& [id, channel] : m_channels)
         out.push_back(id);
     return out;
 }
