/**
 * @file   bridge_main.cpp
 * @brief  Entry point of the muxbridge executable: parses the command line,
 *         loads the configuration and runs one Bridge session on
 *         stdin/stdout.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

#include <atomic>
#include <csignal>
#include <memory>
#include <string>
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QTimer>

#include "../../core/bridge.hpp"
#include "../../core/config.hpp"
#include "../../core/io/stdio_transport.hpp"
#include "../../core/logging.hpp"

// -----------------------------------------------------------------------------
// SIGINT/SIGTERM handling – set an atomic flag from signal-handler context
// -----------------------------------------------------------------------------
static std::atomic_bool g_stop{false};
static void onSignal(int){ g_stop = true; }

// -----------------------------------------------------------------------------
// MAIN
// -----------------------------------------------------------------------------
int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("muxbridge"));
    QCoreApplication::setApplicationVersion(QStringLiteral("1.0"));

    // 1) Command line ---------------------------------------------------------
    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("Multiplexing protocol bridge speaking on stdin/stdout"));
    parser.addHelpOption();
    parser.addVersionOption();
    QCommandLineOption privilegedOpt(QStringLiteral("privileged"),
        QStringLiteral("Run as the privileged peer of another bridge"));
    QCommandLineOption configOpt(QStringLiteral("superuser-config"),
        QStringLiteral("Read superuser bridge definitions from <file>"),
        QStringLiteral("file"));
    QCommandLineOption debugOpt(QStringLiteral("debug"),
        QStringLiteral("Enable debug output on stderr"));
    parser.addOption(privilegedOpt);
    parser.addOption(configOpt);
    parser.addOption(debugOpt);
    parser.process(app);

    muxbridge::logging::install(parser.isSet(debugOpt));

    // 2) Configuration --------------------------------------------------------
    muxbridge::config::BridgeConfig config = muxbridge::config::defaults();
    if (parser.isSet(configOpt)) {
        const std::string path = parser.value(configOpt).toStdString();
        std::string err;
        if (!muxbridge::config::loadFile(path, config, &err)) {
            qCCritical(lcRouter) << "cannot load" << path.c_str() << ":" << err.c_str();
            return 1;
        }
        if (!err.empty())
            qCWarning(lcRouter) << path.c_str() << ":" << err.c_str();
    }

    // 3) Session --------------------------------------------------------------
    std::signal(SIGPIPE, SIG_IGN);
    std::signal(SIGINT, onSignal);
    std::signal(SIGTERM, onSignal);

    auto transport = std::make_shared<muxbridge::io::StdioTransport>(0, 1);
    muxbridge::Bridge::Options options;
    options.privileged = parser.isSet(privilegedOpt);
    muxbridge::Bridge bridge(transport, std::move(config), options);
    bridge.setTerminatedHook([](int code) { QCoreApplication::exit(code); });

    // 4) Poll the signal flag from the event loop -----------------------------
    QTimer stopTimer;
    stopTimer.setInterval(100);
    QObject::connect(&stopTimer, &QTimer::timeout, [&bridge] {
        if (!g_stop) return;
        qCInfo(lcRouter) << "terminating on signal";
        bridge.shutdown();
        QCoreApplication::exit(0);
    });
    stopTimer.start();

    bridge.start();
    return app.exec();
}
