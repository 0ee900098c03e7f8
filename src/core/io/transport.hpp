/**
 * @file   transport.hpp
 * @brief  Defines the abstract ITransport interface that carries Frames
 *         between the bridge and its front end.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 *
 */

#ifndef MUXBRIDGE_IO_TRANSPORT_HPP
#define MUXBRIDGE_IO_TRANSPORT_HPP

#include <functional>
#include <memory>
#include <string>
#include "frame.hpp"

namespace muxbridge::io {

/**
 * @class ITransport
 * @brief Abstract frame transport.
 *
 * Concrete implementations must provide send() and close().  Received
 * frames and the end of the stream are pushed to the hooks installed by
 * the owner of the transport.
 */
class ITransport {
public:
    /// Called once per decoded inbound frame.
    using FrameFn  = std::function<void(const Frame&)>;
    /// Called once when the stream ends; problem is empty on clean EOF.
    using ClosedFn = std::function<void(const std::string& problem)>;

    /**
     * @brief Virtual destructor.
     */
    virtual ~ITransport() = default;

    /**
     * @brief Send a frame.
     *
     * @param frame  The Frame to send.
     * @return       True on success; false once the transport is closed or
     *               the write failed.
     */
    virtual bool send(const Frame& frame) noexcept = 0;

    /**
     * @brief Stop reading and writing.  No hook fires afterwards.
     */
    virtual void close() noexcept = 0;

    /** @brief Install the inbound frame hook. */
    void setFrameHook(FrameFn fn) { m_onFrame = std::move(fn); }

    /** @brief Install the end-of-stream hook. */
    void setClosedHook(ClosedFn fn) { m_onClosed = std::move(fn); }

protected:
    /** @brief Hand one decoded frame to the owner. */
    void deliver(const Frame& frame) {
        if (m_onFrame) m_onFrame(frame);
    }

    /** @brief Report the end of the stream to the owner. */
    void deliverClosed(const std::string& problem) {
        if (m_onClosed) m_onClosed(problem);
    }

private:
    FrameFn  m_onFrame;
    ClosedFn m_onClosed;
};

/**
 * @typedef TransportPtr
 * @brief Shared pointer alias for ITransport.
 */
using TransportPtr = std::shared_ptr<ITransport>;

} // namespace muxbridge::io

#endif // MUXBRIDGE_IO_TRANSPORT_HPP
