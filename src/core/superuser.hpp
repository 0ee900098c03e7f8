/**
 * @file   superuser.hpp
 * @brief  Declares SuperuserManager, the /superuser bus object and the
 *         elevation state machine behind it.
 *
 * Phases:
 *   Idle ──Start──▶ Connecting ──peer init──▶ Running ──Stop/exit──▶ Idle
 *                        └──── peer exit ────▶ Idle (Start fails)
 * A bridge started with --privileged sits in Privileged for good.
 *
 * The Current property mirrors the phase: "none", "init", the label of the
 * running bridge, or "root".
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <functional>
#include <string>
#include <vector>
#include "bus/bus_object.hpp"
#include "config.hpp"
#include "io/frame.hpp"

namespace muxbridge {

class PeerBridge;

/**
 * @class PeerRouter
 * @brief What the state machine needs from the session.
 */
class PeerRouter {
public:
    virtual ~PeerRouter() = default;

    /** @brief A frame from the running peer. */
    virtual void peerFrame(const io::Frame& frame) = 0;

    /** @brief The running peer is gone; close every channel routed to it. */
    virtual void peerGone() = 0;

    /** @brief Host name to hand the peer in its init answer. */
    virtual std::string initHost() const = 0;
};

class SuperuserManager : public bus::BusObject {
public:
    enum class Phase { Idle, Connecting, Running, Privileged };

    static constexpr const char* Interface = "cockpit.Superuser";
    static constexpr const char* ErrorName = "cockpit.Superuser.Error";

    /// A credential is needed: (prompt, message, echo).
    using PromptFn = std::function<void(const std::string& prompt,
                                        const std::string& message,
                                        bool echo)>;
    /// The Start finished; message is empty on success.
    using DoneFn   = std::function<void(bool ok, const std::string& message)>;

    SuperuserManager(PeerRouter& router, bool privileged);
    ~SuperuserManager() override;

    /** @brief Replace the configured bridges; only privileged ones are offered. */
    void setBridges(const std::vector<config::SuperuserBridge>& bridges);

    /**
     * @brief Begin elevation with the named bridge.
     * @param label     Bridge label, or "any" for the first one.
     * @param onPrompt  Called for every authentication challenge.
     * @param onDone    Called once when the peer runs or has failed.
     * @throws BusError (cockpit.Superuser.Error) for an unknown label or
     *         while a peer is already connecting or running.
     */
    void start(const std::string& label, PromptFn onPrompt, DoneFn onDone);

    /**
     * @brief Stop the running peer and close its channels.  No-op when idle.
     * @throws BusError while a Start is still in progress.
     */
    void stop();

    /** @brief Answer the pending challenge.  No-op without one. */
    void answer(const std::string& response);

    /** @brief Drop the peer without closing any channel. */
    void shutdown();

    /** @brief Write a frame to the running peer. @return False if none runs. */
    bool send(const io::Frame& frame);

    Phase phase() const noexcept { return m_phase; }
    bool running() const noexcept { return m_phase == Phase::Running; }
    bool privileged() const noexcept { return m_phase == Phase::Privileged; }

    /** @return Labels offered in the Bridges property. */
    std::vector<std::string> labels() const;

private:
    void registerMembers();
    void publishBridges();
    void onConnected();
    void onDisconnected(const std::string& message);
    void detachPeer();
    void finishStart(bool ok, const std::string& message);

    PeerRouter&                          m_router;
    Phase                                m_phase{Phase::Idle};
    std::vector<config::SuperuserBridge> m_bridges;
    PeerBridge*                          m_peer{nullptr};
    std::string                          m_pendingCookie;
    PromptFn                             m_onPrompt;
    DoneFn                               m_onDone;
};

} // namespace muxbridge
