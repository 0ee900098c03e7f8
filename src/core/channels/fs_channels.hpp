/**
 * @file   fs_channels.hpp
 * @brief  The "fsread1" and "fslist1" filesystem channel payloads.
 *
 * Both channels do their work while opening and finish on their own:
 * fsread1 sends the file's bytes, "done" and a close carrying the file's
 * change tag; fslist1 sends one "present" event per directory entry,
 * "done" and close.  Filesystem errors become close problems.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <string>
#include "../channel.hpp"
#include "../errors.hpp"

namespace muxbridge::channels {

/**
 * @brief Map an errno value from an operation on path to a ChannelError.
 *
 * EACCES/EPERM -> access-denied, ENOENT -> not-found, anything else
 * -> internal-error.  The message reads `[Errno N] <strerror>: '<path>'`.
 */
ChannelError errnoError(int err, const std::string& path);

class FsReadChannel : public Channel {
public:
    using Channel::Channel;

    /// Bytes per data frame.
    static constexpr std::size_t BLOCK_SIZE = 64 * 1024;

protected:
    void doOpen(const nlohmann::json& options) override;
};

class FsListChannel : public Channel {
public:
    using Channel::Channel;

protected:
    void doOpen(const nlohmann::json& options) override;
};

} // namespace muxbridge::channels
