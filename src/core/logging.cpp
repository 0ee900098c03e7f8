/**
 * @file   logging.cpp
 * @brief  Defines the muxbridge logging categories.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

#include "logging.hpp"

Q_LOGGING_CATEGORY(lcTransport, "muxbridge.transport", QtInfoMsg)
Q_LOGGING_CATEGORY(lcRouter,    "muxbridge.router",    QtInfoMsg)
Q_LOGGING_CATEGORY(lcChannel,   "muxbridge.channel",   QtInfoMsg)
Q_LOGGING_CATEGORY(lcBus,       "muxbridge.bus",       QtInfoMsg)
Q_LOGGING_CATEGORY(lcSuperuser, "muxbridge.superuser", QtInfoMsg)
Q_LOGGING_CATEGORY(lcPeer,      "muxbridge.peer",      QtInfoMsg)

namespace muxbridge::logging {

void install(bool debug) {
    qSetMessagePattern(QStringLiteral(
        "muxbridge[%{pid}] %{if-category}%{category}: %{endif}%{message}"));
    if (debug)
        QLoggingCategory::setFilterRules(QStringLiteral("muxbridge.*.debug=true"));
}

} // namespace muxbridge::logging
