/**
 * @file   simple_channels.hpp
 * @brief  The "null" and "echo" channel payloads.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include "../channel.hpp"

namespace muxbridge::channels {

/**
 * @class NullChannel
 * @brief Accepts and discards everything; closes when told to.
 */
class NullChannel : public Channel {
public:
    using Channel::Channel;

protected:
    void doOpen(const nlohmann::json&) override { ready(); }
    void doData(const std::string&) override {}
};

/**
 * @class EchoChannel
 * @brief Sends every data frame straight back; "done" ends the channel.
 */
class EchoChannel : public Channel {
public:
    using Channel::Channel;

protected:
    void doOpen(const nlohmann::json&) override { ready(); }
    void doData(const std::string& data) override { sendData(data); }
    void doDone() override {
        sendDone();
        close();
    }
};

} // namespace muxbridge::channels
