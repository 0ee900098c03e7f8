/**
 * @file   frame.hpp
 * @brief  Declares the Frame struct and the length-prefixed frame codec
 *         used on every muxbridge transport.
 *
 * A frame is written as `<length>\n<channel>\n<payload>` where length is
 * the decimal byte count of `<channel>\n<payload>`.  An empty channel id
 * marks a control frame whose payload is one JSON object.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

#ifndef MUXBRIDGE_IO_FRAME_HPP
#define MUXBRIDGE_IO_FRAME_HPP

#include <cstddef>
#include <string>
#include <nlohmann/json.hpp>

namespace muxbridge::io {

/**
 * @struct Frame
 * @brief One addressed unit of the multiplexed stream.
 */
struct Frame {
    std::string channel;   ///< Channel id; empty for control frames
    std::string payload;   ///< Raw bytes (JSON text for control frames)

    /** @brief True if this frame belongs to the control channel. */
    bool isControl() const noexcept { return channel.empty(); }
};

/**
 * @brief Build a control frame from a JSON message.
 * @param message  Control message; must contain "command".
 */
Frame controlFrame(const nlohmann::json& message);

/**
 * @brief Serialize one frame into its on-the-wire byte string.
 * @param frame  Frame to encode.
 * @return       `<length>\n<channel>\n<payload>`.
 */
std::string encodeFrame(const Frame& frame);

/**
 * @class FrameReader
 * @brief Incremental decoder turning arbitrary byte chunks into Frames.
 *
 * Bytes are fed in as they arrive; complete frames are taken out with
 * next().  Malformed framing throws muxbridge::ProtocolError.
 */
class FrameReader {
public:
    /// Longest accepted length header, in digits.
    static constexpr std::size_t MAX_HEADER_DIGITS = 10;

    /**
     * @brief Append received bytes to the internal buffer.
     * @param data  Pointer to the received bytes.
     * @param len   Number of bytes.
     */
    void feed(const char* data, std::size_t len);

    /** @brief Convenience overload for std::string chunks. */
    void feed(const std::string& chunk) { feed(chunk.data(), chunk.size()); }

    /**
     * @brief Extract the next complete frame, if one is buffered.
     * @param[out] out  Receives the frame.
     * @return          True if a frame was produced.
     * @throws ProtocolError on malformed framing.
     */
    bool next(Frame& out);

    /**
     * @brief Signal end of input.
     * @throws ProtocolError if a partial frame is still buffered.
     */
    void finish() const;

    /** @brief Number of buffered, not yet decoded bytes. */
    std::size_t buffered() const noexcept { return m_buf.size() - m_pos; }

private:
    std::string m_buf;      ///< Received bytes
    std::size_t m_pos{0};   ///< Start of the first undecoded byte
};

} // namespace muxbridge::io

#endif // MUXBRIDGE_IO_FRAME_HPP
