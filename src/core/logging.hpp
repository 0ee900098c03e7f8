/**
 * @file   logging.hpp
 * @brief  Qt logging categories for every bridge component and the
 *         process-wide logging setup.
 *
 * All output goes to stderr; stdout is reserved for the protocol.
 * Categories can be tuned at run time with QT_LOGGING_RULES, e.g.
 * `QT_LOGGING_RULES="muxbridge.bus.debug=true"`.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */
#pragma once

#include <QLoggingCategory>

Q_DECLARE_LOGGING_CATEGORY(lcTransport)
Q_DECLARE_LOGGING_CATEGORY(lcRouter)
Q_DECLARE_LOGGING_CATEGORY(lcChannel)
Q_DECLARE_LOGGING_CATEGORY(lcBus)
Q_DECLARE_LOGGING_CATEGORY(lcSuperuser)
Q_DECLARE_LOGGING_CATEGORY(lcPeer)

namespace muxbridge::logging {

/**
 * @brief Install the message pattern and category filter rules.
 * @param debug  Enable debug output for every muxbridge category.
 */
void install(bool debug);

} // namespace muxbridge::logging
