/**
 * @file   flow_gate.hpp
 * @brief  A per-channel freeze/thaw gate for outbound frames.
 *
 * Provides the FlowGate class, which passes frames straight to a sink
 * while thawed and queues them, in order, while frozen.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #pragma once

 #include <deque>
 #include <functional>
 #include "io/frame.hpp"

 namespace muxbridge {

 /**
  * @class FlowGate
  * @brief Outbound backpressure gate owned by exactly one channel.
  *
  * Freezing one gate never delays any other gate: each channel owns its
  * own queue and the sink is shared.
  */
 class FlowGate {
 public:
     /// Where frames go once they pass the gate.
     using SinkFn = std::function<void(const io::Frame&)>;

     explicit FlowGate(SinkFn sink) : m_sink(std::move(sink)) {}

     /**
      * @brief Pass a frame through, or queue it while frozen.
      * @param frame  Outbound frame.
      */
     void push(io::Frame frame) {
         if (m_frozen) {
             m_pending.push_back(std::move(frame));
             return;
         }
         m_sink(frame);
     }

     /** @brief Queue every later frame until thaw(). */
     void freeze() noexcept { m_frozen = true; }

     /**
      * @brief Release queued frames in FIFO order and resume passthrough.
      *
      * If the sink freezes the gate again while flushing, the remaining
      * frames stay queued.
      */
     void thaw() {
         m_frozen = false;
         while (!m_frozen && !m_pending.empty()) {
             io::Frame frame = std::move(m_pending.front());
             m_pending.pop_front();
             m_sink(frame);
         }
     }

     /** @return True while frames are being queued. */
     bool frozen() const noexcept { return m_frozen; }

     /** @return Number of queued frames. */
     std::size_t pending() const noexcept { return m_pending.size(); }

 private:
     SinkFn                m_sink;           ///< Downstream writer
     std::deque<io::Frame> m_pending;        ///< Frames held while frozen
     bool                  m_frozen{false};  ///< Gate state
 };

 } // namespace muxbridge
