/**
 * @file   peer_bridge.hpp
 * @brief  Declares PeerBridge, a QObject that runs a privileged peer bridge
 *         process and speaks the framed protocol over its stdio.
 *
 * Before the peer sends its own "init" it may ask for authentication
 * with "authorize" challenges, surfaced as authorizeRequested().  Once
 * the "init" arrives PeerBridge answers it, emits connected() and from
 * then on hands every frame to frameReceived().
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

#ifndef MUXBRIDGE_PEER_BRIDGE_HPP
#define MUXBRIDGE_PEER_BRIDGE_HPP

#include <QObject>
#include <QProcess>
#include <QString>
#include <string>
#include "config.hpp"
#include "io/frame.hpp"

Q_DECLARE_METATYPE(muxbridge::io::Frame)

namespace muxbridge {

/**
 * @class PeerBridge
 * @brief One spawned peer bridge process.
 *
 * Exactly one of connected()/disconnected() ends the handshake, and
 * disconnected() fires at most once.
 */
class PeerBridge : public QObject {
    Q_OBJECT
public:
    /**
     * @brief Prepare (but do not start) the peer.
     * @param config    Command, environment and label.
     * @param initHost  Host name sent in the peer's "init" answer.
     * @param parent    Optional parent QObject.
     */
    PeerBridge(config::SuperuserBridge config,
               std::string initHost,
               QObject* parent = nullptr);
    ~PeerBridge() override;

    /** @brief Spawn the process.  A failure to start is reported via disconnected(). */
    void start();

    /** @brief Write one frame to the peer's stdin. */
    void send(const io::Frame& frame);

    /** @brief Answer an authorize challenge. */
    void answer(const std::string& cookie, const std::string& response);

    /**
     * @brief Detach and let the process go.
     *
     * No signal fires afterwards.  The peer's stdin is closed so it can
     * exit on its own; it is killed if it is still around after a grace
     * period, and this object deletes itself once the process is gone.
     */
    void shutdown();

    const std::string& label() const noexcept { return m_config.label; }
    bool isConnected() const noexcept { return m_connected; }

    /** @return Process id of the peer, or 0 while it is not running. */
    qint64 processId() const { return m_process->processId(); }

    /** @return Last non-empty line the peer wrote to stderr. */
    const std::string& lastError() const noexcept { return m_lastError; }

    /// Grace period between closing stdin and killing the process.
    static constexpr int KILL_TIMEOUT_MS = 2000;

signals:
    /**
     * @brief The peer wants a credential.
     * @param cookie   Cookie to pass back to answer().
     * @param prompt   Prompt text, e.g. "Password:".
     * @param message  Optional explanation.
     * @param echo     Whether the answer may be shown while typed.
     */
    void authorizeRequested(const QString& cookie, const QString& prompt,
                            const QString& message, bool echo);

    /** @brief The peer's init arrived and was answered. */
    void connected();

    /** @brief A frame from a connected peer. */
    void frameReceived(const muxbridge::io::Frame& frame);

    /**
     * @brief The process is gone (or never started).
     * @param message  Last stderr line, or a generic description.
     */
    void disconnected(const QString& message);

private slots:
    void onStdout();
    void onStderr();
    void onFinished(int exitCode, QProcess::ExitStatus status);
    void onError(QProcess::ProcessError error);

private:
    void handleHandshake(const io::Frame& frame);
    void consumeStderrLines(bool flush);
    void end(const std::string& fallback);

    config::SuperuserBridge m_config;
    std::string             m_initHost;
    QProcess*               m_process{nullptr};   /**< Child of this */
    io::FrameReader         m_reader;
    QByteArray              m_stderr;             /**< Incomplete stderr line */
    std::string             m_lastError;
    bool                    m_connected{false};
    bool                    m_ended{false};
};

} // namespace muxbridge

#endif // MUXBRIDGE_PEER_BRIDGE_HPP
