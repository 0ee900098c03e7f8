/**
 * @file   bridge.hpp
 * @brief  Declares Bridge, one protocol session between a front end and
 *         this host.
 *
 * The Bridge owns everything that lives for the length of a session: the
 * channel registry, the internal bus with its /superuser and
 * /LoginMessages objects, and (through SuperuserManager) the privileged
 * peer.  All of it runs on the thread of the Qt event loop.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <functional>
#include <memory>
#include <string>
#include <nlohmann/json.hpp>
#include "bus/internal_bus.hpp"
#include "channel.hpp"
#include "config.hpp"
#include "io/transport.hpp"
#include "login_messages.hpp"
#include "registry.hpp"
#include "superuser.hpp"

namespace muxbridge {

class Bridge : public ChannelHost, public PeerRouter {
public:
    struct Options {
        bool privileged = false;   ///< Run as the superuser peer of another bridge
    };

    /// Session ended; exit code 0 for a clean EOF, 1 after a fatal error.
    using TerminatedFn = std::function<void(int exitCode)>;

    Bridge(io::TransportPtr transport, config::BridgeConfig config, Options options);
    ~Bridge() override;

    /** @brief Hook up the transport and send the greeting. */
    void start();

    /** @brief End the session without sending anything more. */
    void shutdown();

    void setTerminatedHook(TerminatedFn fn) { m_onTerminated = std::move(fn); }

    /** @return The open local channel with this id, or nullptr. */
    Channel* channel(const std::string& id) const { return m_registry.find(id); }

    ChannelRegistry&  registry() noexcept { return m_registry; }
    SuperuserManager& superuser() noexcept { return *m_superuser; }

    /** @return Host name given by the front end's init. */
    const std::string& host() const noexcept { return m_host; }
    bool ended() const noexcept { return m_ended; }

    /// ChannelHost ------------------------------------------------------------
    void channelFrame(const io::Frame& frame) override;
    void channelReleased(const std::string& id) override;
    bus::InternalBus& internalBus() override { return m_bus; }

    /// PeerRouter -------------------------------------------------------------
    void peerFrame(const io::Frame& frame) override;
    void peerGone() override;
    std::string initHost() const override { return m_host; }

private:
    /// Control router (router.cpp) --------------------------------------------
    void onFrame(const io::Frame& frame);
    void onTransportClosed(const std::string& problem);
    void dispatch(const io::Frame& frame);
    void handleControl(const nlohmann::json& message, const io::Frame& frame);
    void handleInit(const nlohmann::json& message);
    void handleOpen(const nlohmann::json& message, const io::Frame& frame);
    void handleChannelCommand(const std::string& command,
                              const nlohmann::json& message,
                              const io::Frame& frame);
    void handleKill(const nlohmann::json& message, const io::Frame& frame);
    void handleAuthorize(const nlohmann::json& message);
    void startInitElevation(const std::string& label);

    bool isLocalHost(const std::string& host) const;
    void refuseOpen(const std::string& id, const std::string& problem,
                    const std::string& message = {});
    void fatal(const std::string& message);
    void terminate(int exitCode);
    void write(const io::Frame& frame);

    io::TransportPtr                  m_transport;
    config::BridgeConfig              m_config;
    Options                           m_options;
    bus::InternalBus                  m_bus;          // outlives the channels
    std::shared_ptr<SuperuserManager> m_superuser;
    std::shared_ptr<LoginMessages>    m_loginMessages;
    ChannelRegistry                   m_registry;
    std::string                       m_host{"localhost"};
    std::string                       m_machineHost;
    std::string                       m_authorizeCookie;  ///< Pending init-time prompt
    unsigned                          m_cookieSeq{0};
    bool                              m_initReceived{false};
    bool                              m_ended{false};
    TerminatedFn                      m_onTerminated;
};

} // namespace muxbridge
