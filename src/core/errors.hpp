/**
 * @file   errors.hpp
 * @brief  Exception types used by the bridge: protocol-fatal errors,
 *         per-channel problems and internal bus errors.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <stdexcept>
#include <string>
#include <nlohmann/json.hpp>

namespace muxbridge {

/**
 * @brief Violation of the framing or control protocol.
 *
 * Ends the whole session; nothing tries to recover from it.
 */
class ProtocolError : public std::runtime_error {
public:
    explicit ProtocolError(const std::string& message)
      : std::runtime_error(message)
    {}
};

/**
 * @brief Failure confined to one channel.
 *
 * Carries the problem code sent in the channel's close message plus any
 * extra attributes (usually "message").
 */
class ChannelError : public std::runtime_error {
public:
    ChannelError(std::string problem,
                 const std::string& message = {},
                 nlohmann::json attrs = nlohmann::json::object())
      : std::runtime_error(message.empty() ? problem : message)
      , m_problem(std::move(problem))
      , m_attrs(std::move(attrs))
    {
        if (!message.empty())
            m_attrs["message"] = message;
    }

    /** @return Problem code, e.g. "not-found". */
    const std::string& problem() const noexcept { return m_problem; }

    /** @return Extra attributes for the close message. */
    const nlohmann::json& attrs() const noexcept { return m_attrs; }

private:
    std::string    m_problem;
    nlohmann::json m_attrs;
};

/**
 * @brief D-Bus style error returned from an internal bus call.
 */
class BusError : public std::runtime_error {
public:
    BusError(std::string name, const std::string& message)
      : std::runtime_error(message)
      , m_name(std::move(name))
    {}

    /** @return Error name, e.g. "org.freedesktop.DBus.Error.UnknownMethod". */
    const std::string& name() const noexcept { return m_name; }

private:
    std::string m_name;
};

} // namespace muxbridge
