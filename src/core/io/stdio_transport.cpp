/**
 * @file   stdio_transport.cpp
 * @brief  Implements StdioTransport: descriptor setup, send(), and the
 *         read path feeding FrameReader.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "stdio_transport.hpp"
 #include "../errors.hpp"
 #include "../logging.hpp"
 #include <cerrno>
 #include <cstring>
 #include <fcntl.h>
 #include <unistd.h>

 namespace muxbridge::io {

 StdioTransport::StdioTransport(int inFd, int outFd)
   : m_in(inFd)
   , m_out(outFd)
 {
     // Make input non-blocking; the notifier tells us when to read
     int flags = ::fcntl(m_in, F_GETFL);
     if (flags >= 0)
         ::fcntl(m_in, F_SETFL, flags | O_NONBLOCK);

     m_notifier = std::make_unique<QSocketNotifier>(m_in, QSocketNotifier::Read);
     QObject::connect(m_notifier.get(), &QSocketNotifier::activated,
                      m_notifier.get(), [this]{ onReadable(); });
 }

 StdioTransport::~StdioTransport() noexcept {
     if (m_notifier)
         m_notifier->setEnabled(false);
 }

 bool StdioTransport::send(const Frame& frame) noexcept {
     if (m_closed) return false;

     std::string bytes;
     try {
         bytes = encodeFrame(frame);
     } catch (const std::bad_alloc&) {
         return false;
     }

     // One frame, one uninterrupted write loop
     const char* p   = bytes.data();
     size_t      left = bytes.size();
     while (left > 0) {
         ssize_t n = ::write(m_out, p, left);
         if (n < 0) {
             if (errno == EINTR) continue;
             qCWarning(lcTransport) << "write failed:" << std::strerror(errno);
             return false;
         }
         p    += n;
         left -= static_cast<size_t>(n);
     }
     return true;
 }

 void StdioTransport::close() noexcept {
     m_closed = true;
     if (m_notifier)
         m_notifier->setEnabled(false);
 }

 void StdioTransport::onReadable() {
     if (m_closed) return;

     ssize_t n = ::read(m_in, m_buf, BUF_SIZE);
     if (n < 0 && (errno == EAGAIN || errno == EWOULDBLOCK || errno == EINTR))
         return;

     if (n <= 0) {
         // End of stream: clean unless a frame was cut off
         if (n < 0)
             qCWarning(lcTransport) << "read failed:" << std::strerror(errno);
         std::string problem;
         try {
             m_reader.finish();
         } catch (const ProtocolError& e) {
             qCWarning(lcTransport) << e.what();
             problem = "protocol-error";
         }
         close();
         qCDebug(lcTransport) << "input closed";
         deliverClosed(problem);
         return;
     }

     m_reader.feed(m_buf, static_cast<size_t>(n));
     try {
         Frame frame;
         while (!m_closed && m_reader.next(frame))
             deliver(frame);
     } catch (const ProtocolError& e) {
         qCCritical(lcTransport) << "malformed framing:" << e.what();
         m_notifier->setEnabled(false);
         deliverClosed("protocol-error");
     }
 }

 } // namespace muxbridge::io
