/**
 * @file   frame.cpp
 * @brief  Implements frame encoding and the incremental FrameReader.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "frame.hpp"
 #include "../errors.hpp"

 namespace muxbridge::io {

 Frame controlFrame(const nlohmann::json& message) {
     return Frame{ std::string{}, message.dump() };
 }

 std::string encodeFrame(const Frame& frame) {
     const std::size_t length = frame.channel.size() + 1 + frame.payload.size();
     std::string out = std::to_string(length);
     out.reserve(out.size() + 1 + length);
     out += '\n';
     out += frame.channel;
     out += '\n';
     out += frame.payload;
     return out;
 }

 void FrameReader::feed(const char* data, std::size_t len) {
     // Drop consumed bytes before growing the buffer again
     if (m_pos > 0 && m_pos == m_buf.size()) {
         m_buf.clear();
         m_pos = 0;
     } else if (m_pos > 65536) {
         m_buf.erase(0, m_pos);
         m_pos = 0;
     }
     m_buf.append(data, len);
 }

 bool FrameReader::next(Frame& out) {
     const std::size_t avail = m_buf.size() - m_pos;
     if (avail == 0)
         return false;

     // ---------- length header ------------------------------------------------
     std::size_t length = 0;
     std::size_t digits = 0;
     for (;;) {
         if (digits == avail)
             return false;               // header not complete yet
         const char c = m_buf[m_pos + digits];
         if (c == '\n')
             break;
         if (c < '0' || c > '9')
             throw ProtocolError("invalid frame length header");
         if (++digits > MAX_HEADER_DIGITS)
             throw ProtocolError("frame length header too long");
         length = length * 10 + static_cast<std::size_t>(c - '0');
     }
     if (digits == 0)
         throw ProtocolError("empty frame length header");
     if (length == 0)
         throw ProtocolError("zero-length frame");

     // ---------- body -----------------------------------------------------------
     const std::size_t bodyStart = m_pos + digits + 1;
     if (m_buf.size() - bodyStart < length)
         return false;                   // wait for the rest of the body

     const std::size_t sep = m_buf.find('\n', bodyStart);
     if (sep == std::string::npos || sep >= bodyStart + length)
         throw ProtocolError("frame has no channel separator");

     out.channel.assign(m_buf, bodyStart, sep - bodyStart);
     out.payload.assign(m_buf, sep + 1, bodyStart + length - sep - 1);
     m_pos = bodyStart + length;
     return true;
 }

 void FrameReader::finish() const {
     if (buffered() != 0)
         throw ProtocolError("transport closed in the middle of a frame");
 }

 } // namespace muxbridge::io
