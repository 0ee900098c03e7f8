/**
 * @file   login_messages.hpp
 * @brief  The /LoginMessages bus object (interface cockpit.LoginMessages).
 *
 * The session manager passes the login messages in a memory file whose
 * descriptor number is in COCKPIT_LOGIN_MESSAGES_MEMFD.  They can be read
 * any number of times until dismissed.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <optional>
#include <string>
#include "bus/bus_object.hpp"

namespace muxbridge {

class LoginMessages : public bus::BusObject {
public:
    static constexpr const char* EnvVar = "COCKPIT_LOGIN_MESSAGES_MEMFD";

    /** @brief Take the messages from the environment, if any. */
    LoginMessages();

    /** @brief Use the given messages directly. */
    explicit LoginMessages(std::optional<std::string> messages);

    /** @return The messages, or "{}" if there are none or they were dismissed. */
    std::string get() const;

    /** @brief Forget the messages.  Idempotent. */
    void dismiss() noexcept { m_messages.reset(); }

    /**
     * @brief Read the whole descriptor from offset 0 and close it.
     * @param fd   Descriptor to consume.
     * @param out  Receives the contents.
     * @param err  Optional out-param for the failure reason.
     * @return     false if reading failed (the descriptor is closed anyway).
     */
    static bool consumeFd(int fd, std::string& out, std::string* err = nullptr);

private:
    void registerMembers();

    std::optional<std::string> m_messages;
};

} // namespace muxbridge
