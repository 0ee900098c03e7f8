/**
 * @file   channel.hpp
 * @brief  Declares the Channel endpoint base class and the ChannelHost
 *         interface channels use to reach the session.
 *
 * Every payload type ("echo", "fsread1", "dbus-json3", ...) derives from
 * Channel and overrides the do*() hooks.  The base class owns the
 * lifecycle state machine and the channel's FlowGate.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "flow_gate.hpp"
#include "io/frame.hpp"

namespace muxbridge {

namespace bus { class InternalBus; }

/**
 * @class ChannelHost
 * @brief The part of the session a channel is allowed to see.
 */
class ChannelHost {
public:
    virtual ~ChannelHost() = default;

    /** @brief Write a frame that has passed the channel's gate. */
    virtual void channelFrame(const io::Frame& frame) = 0;

    /** @brief The channel's close frame is out; its id may be reused. */
    virtual void channelReleased(const std::string& id) = 0;

    /** @brief The session's internal object bus. */
    virtual bus::InternalBus& internalBus() = 0;
};

/**
 * @class Channel
 * @brief One open channel endpoint.
 *
 * Lifecycle: Opening -> Ready -> Active -> Closed, with "done" tracked
 * separately for each direction.  A channel that fails while Opening goes
 * straight to Closed and never sends "ready".
 */
class Channel {
public:
    enum class State { Opening, Ready, Active, Closed };

    /**
     * @brief Construct the endpoint.  Nothing is sent until start().
     * @param host     Session the channel lives in.
     * @param id       Channel id chosen by the front end.
     * @param options  The complete "open" message.
     */
    Channel(ChannelHost& host, std::string id, nlohmann::json options);
    virtual ~Channel();

    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;

    /// Capability set ---------------------------------------------------------

    /** @brief Run doOpen(); a ChannelError closes the channel with its problem. */
    void start();

    /** @brief Inbound data frame from the front end. */
    void receiveData(const std::string& data);

    /** @brief Front end sent "done". */
    void receiveDone();

    /** @brief Front end sent "close". */
    void receiveClose() { terminate({}); }

    /**
     * @brief Run doClose() and close the channel with the given problem.
     * @param problem  Problem code; empty for a clean close.
     */
    void terminate(const std::string& problem);

    /** @brief Front end sent "ping" addressed to this channel. */
    void receivePing(const nlohmann::json& message);

    /** @brief Front end sent "options". */
    void receiveOptions(const nlohmann::json& message);

    /** @brief Hold outbound frames until thaw(). */
    void freeze() noexcept;

    /** @brief Flush held frames in order and resume. */
    void thaw();

    /// Inspection -------------------------------------------------------------

    const std::string& id() const noexcept { return m_id; }
    const std::string& payload() const noexcept { return m_payload; }
    const nlohmann::json& options() const noexcept { return m_options; }
    State state() const noexcept { return m_state; }
    bool frozen() const noexcept { return m_gate.frozen(); }
    bool doneSent() const noexcept { return m_doneSent; }
    bool doneReceived() const noexcept { return m_doneReceived; }

    /** @brief The "group" open option ("default" when absent). */
    std::string group() const;

protected:
    /// Endpoint hooks ---------------------------------------------------------

    /** @brief Set the endpoint up; call ready() or throw ChannelError. */
    virtual void doOpen(const nlohmann::json& options) = 0;
    virtual void doData(const std::string& data);
    virtual void doDone();
    /** @brief Front end closed the channel; default closes without problem. */
    virtual void doClose();
    virtual void doOptions(const nlohmann::json& message);

    /// Output -----------------------------------------------------------------

    void ready(nlohmann::json attrs = nlohmann::json::object());
    void sendData(const std::string& data);
    void sendJson(const nlohmann::json& message);
    void sendDone();

    /**
     * @brief Close the channel.  Idempotent.
     * @param problem  Problem code; empty for a clean close.
     * @param attrs    Extra attributes for the close message.
     */
    void close(const std::string& problem = {},
               nlohmann::json attrs = nlohmann::json::object());

    ChannelHost& host() noexcept { return m_host; }

private:
    void sendControl(nlohmann::json message);
    void release();

    ChannelHost&   m_host;
    std::string    m_id;
    std::string    m_payload;
    nlohmann::json m_options;
    FlowGate       m_gate;
    State          m_state{State::Opening};
    bool           m_doneSent{false};
    bool           m_doneReceived{false};
    bool           m_released{false};
};

} // namespace muxbridge
