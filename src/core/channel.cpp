/**
 * @file   channel.cpp
 * @brief  Implements the Channel base: lifecycle transitions, error
 *         containment, and output through the channel's FlowGate.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "channel.hpp"
 #include "errors.hpp"
 #include "logging.hpp"

 using namespace muxbridge;
 using nlohmann::json;

 Channel::Channel(ChannelHost& host, std::string id, json options)
   : m_host(host)
   , m_id(std::move(id))
   , m_payload(options.value("payload", std::string{}))
   , m_options(std::move(options))
   , m_gate([this](const io::Frame& f){ m_host.channelFrame(f); })
 {}

 Channel::~Channel() = default;

 std::string Channel::group() const {
     auto it = m_options.find("group");
     if (it != m_options.end() && it->is_string())
         return it->get<std::string>();
     return "default";
 }

 // -- Capability set ---------------------------------------------------------

 /**
  * Runs the endpoint's doOpen().  A ChannelError thrown while opening turns
  * into a close carrying the endpoint's problem; "ready" is never sent.
  */
 void Channel::start() {
     qCDebug(lcChannel) << "opening" << m_payload.c_str() << "channel" << m_id.c_str();
     try {
         doOpen(m_options);
     } catch (const ChannelError& e) {
         qCDebug(lcChannel) << "channel" << m_id.c_str() << "failed to open:" << e.problem().c_str();
         close(e.problem(), e.attrs());
     }
 }

 void Channel::receiveData(const std::string& data) {
     if (m_state == State::Closed) return;
     if (m_doneReceived) {
         close("protocol-error", {{"message", "data received after done"}});
         return;
     }
     if (m_state == State::Ready)
         m_state = State::Active;
     try {
         doData(data);
     } catch (const ChannelError& e) {
         close(e.problem(), e.attrs());
     }
 }

 void Channel::receiveDone() {
     if (m_state == State::Closed) return;
     if (m_doneReceived) {
         close("protocol-error", {{"message", "received done twice"}});
         return;
     }
     m_doneReceived = true;
     try {
         doDone();
     } catch (const ChannelError& e) {
         close(e.problem(), e.attrs());
     }
 }

 void Channel::terminate(const std::string& problem) {
     if (m_state == State::Closed) return;
     try {
         doClose();
     } catch (const ChannelError& e) {
         close(e.problem(), e.attrs());
         return;
     }
     close(problem);
 }

 void Channel::receivePing(const json& message) {
     if (m_state == State::Closed) return;
     json pong = message;
     pong["command"] = "pong";
     sendControl(std::move(pong));
 }

 void Channel::receiveOptions(const json& message) {
     if (m_state == State::Closed) return;
     try {
         doOptions(message);
     } catch (const ChannelError& e) {
         close(e.problem(), e.attrs());
     }
 }

 void Channel::freeze() noexcept {
     m_gate.freeze();
 }

 /**
  * Flushes the gate.  A channel that closed while frozen is released only
  * now, once its close frame has actually gone out.
  */
 void Channel::thaw() {
     m_gate.thaw();
     if (m_state == State::Closed && !m_gate.frozen())
         release();
 }

 // -- Default hooks ----------------------------------------------------------

 void Channel::doData(const std::string&) {
     throw ChannelError("protocol-error", "channel does not accept data");
 }

 void Channel::doDone() {}

 void Channel::doClose() {}

 void Channel::doOptions(const json&) {}

 // -- Output -------------------------------------------------------------------

 void Channel::ready(json attrs) {
     if (m_state != State::Opening) return;
     m_state = State::Ready;
     attrs["command"] = "ready";
     sendControl(std::move(attrs));
 }

 void Channel::sendData(const std::string& data) {
     if (m_state == State::Closed || m_doneSent) {
         qCWarning(lcChannel) << "channel" << m_id.c_str() << "dropped data after done/close";
         return;
     }
     if (m_state == State::Ready)
         m_state = State::Active;
     m_gate.push(io::Frame{ m_id, data });
 }

 void Channel::sendJson(const json& message) {
     sendData(message.dump());
 }

 void Channel::sendDone() {
     if (m_state == State::Closed || m_doneSent) return;
     m_doneSent = true;
     sendControl({ {"command", "done"} });
 }

 void Channel::close(const std::string& problem, json attrs) {
     if (m_state == State::Closed) return;
     m_state = State::Closed;

     if (!attrs.is_object())
         attrs = json::object();
     attrs["command"] = "close";
     if (!problem.empty())
         attrs["problem"] = problem;
     sendControl(std::move(attrs));

     if (!m_gate.frozen())
         release();
 }

 void Channel::sendControl(json message) {
     message["channel"] = m_id;
     m_gate.push(io::controlFrame(message));
 }

 void Channel::release() {
     if (m_released) return;
     m_released = true;
     m_host.channelReleased(m_id);
 }
