/**
 * @file   stdio_transport.hpp
 * @brief  Declares StdioTransport: an ITransport over a pair of file
 *         descriptors, driven by the Qt event loop.
 *
 * StdioTransport watches its input descriptor with a QSocketNotifier,
 * decodes frames with FrameReader and writes encoded frames to its output
 * descriptor in one uninterrupted write loop.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

#ifndef MUXBRIDGE_IO_STDIO_TRANSPORT_HPP
#define MUXBRIDGE_IO_STDIO_TRANSPORT_HPP

#include "transport.hpp"
#include <memory>
#include <QSocketNotifier>

namespace muxbridge::io {

/**
 * @class StdioTransport
 * @brief Final implementation of ITransport over two file descriptors.
 *
 * Normally bound to stdin/stdout.  The input descriptor is switched to
 * non-blocking mode; writes block until the whole frame is out.
 */
class StdioTransport final : public ITransport {
public:
    /**
     * @brief Constructs the transport.
     * @param inFd   Descriptor frames are read from.
     * @param outFd  Descriptor frames are written to.
     */
    StdioTransport(int inFd, int outFd);

    /**
     * @brief Stops watching the input descriptor.
     */
    ~StdioTransport() noexcept override;

    /**
     * @brief Encodes and writes a frame.
     * @param frame  Frame to send.
     * @return       True if every byte was written.
     */
    bool send(const Frame& frame) noexcept override;

    /**
     * @brief Stops reading; later send() calls fail.
     */
    void close() noexcept override;

private:
    /// Drain readable input and deliver every complete frame.
    void onReadable();

    int                              m_in{-1};        /**< Input FD */
    int                              m_out{-1};       /**< Output FD */
    bool                             m_closed{false}; /**< Set by close() or EOF */
    FrameReader                      m_reader;        /**< Inbound decoder */
    std::unique_ptr<QSocketNotifier> m_notifier;      /**< Readability watch on m_in */
    static constexpr size_t BUF_SIZE = 65536;         /**< Read chunk size */
    char                             m_buf[BUF_SIZE]; /**< Temporary read buffer */
};

} // namespace muxbridge::io

#endif // MUXBRIDGE_IO_STDIO_TRANSPORT_HPP
