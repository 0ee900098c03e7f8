/**
 * @file   peer_bridge.cpp
 * @brief  Implements PeerBridge: process setup, the authorize/init
 *         handshake, frame decoding and stderr collection.
 *
 * @author Martin Ševčík (xsevcim00)
 * @author Jakub Lůčný (xlucnyj00)
 * @date   2025-06-02
 */

 #include "peer_bridge.hpp"
 #include "errors.hpp"
 #include "logging.hpp"
 #include <QProcessEnvironment>
 #include <QStringList>
 #include <QTimer>

 using namespace muxbridge;
 using nlohmann::json;

 PeerBridge::PeerBridge(config::SuperuserBridge config,
                        std::string initHost,
                        QObject* parent)
   : QObject(parent)
   , m_config(std::move(config))
   , m_initHost(std::move(initHost))
 {
     m_process = new QProcess(this);
     m_process->setProcessChannelMode(QProcess::SeparateChannels);

     connect(m_process, &QProcess::readyReadStandardOutput,
             this,      &PeerBridge::onStdout);
     connect(m_process, &QProcess::readyReadStandardError,
             this,      &PeerBridge::onStderr);
     connect(m_process,
             QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
             this, &PeerBridge::onFinished);
     connect(m_process, &QProcess::errorOccurred,
             this,      &PeerBridge::onError);
 }

 PeerBridge::~PeerBridge() {
     if (m_process && m_process->state() != QProcess::NotRunning) {
         m_process->blockSignals(true);
         m_process->kill();
         m_process->waitForFinished(KILL_TIMEOUT_MS);
     }
 }

 void PeerBridge::start() {
     // Parent environment plus the configured KEY=VALUE entries
     auto env = QProcessEnvironment::systemEnvironment();
     for (auto const& entry : m_config.environ) {
         auto eq = entry.find('=');
         if (eq == std::string::npos) {
             qCWarning(lcPeer) << "ignoring malformed environment entry" << entry.c_str();
             continue;
         }
         env.insert(QString::fromStdString(entry.substr(0, eq)),
                    QString::fromStdString(entry.substr(eq + 1)));
     }
     m_process->setProcessEnvironment(env);

     QStringList args;
     for (std::size_t i = 1; i < m_config.spawn.size(); ++i)
         args << QString::fromStdString(m_config.spawn[i]);

     qCInfo(lcPeer) << "starting" << m_config.label.c_str() << "bridge:"
                    << QString::fromStdString(m_config.spawn.front()) << args;
     m_process->start(QString::fromStdString(m_config.spawn.front()), args);
 }

 void PeerBridge::send(const io::Frame& frame) {
     if (m_ended || m_process->state() == QProcess::NotRunning) return;
     const std::string bytes = io::encodeFrame(frame);
     m_process->write(bytes.data(), static_cast<qint64>(bytes.size()));
 }

 void PeerBridge::answer(const std::string& cookie, const std::string& response) {
     send(io::controlFrame({ {"command", "authorize"},
                             {"cookie", cookie},
                             {"response", response} }));
 }

 void PeerBridge::shutdown() {
     blockSignals(true);
     m_ended = true;

     if (m_process->state() == QProcess::NotRunning) {
         deleteLater();
         return;
     }

     qCDebug(lcPeer) << "stopping" << m_config.label.c_str() << "bridge";
     m_process->closeWriteChannel();
     connect(m_process,
             QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished),
             this, &QObject::deleteLater);
     QTimer::singleShot(KILL_TIMEOUT_MS, m_process, &QProcess::kill);
 }

 // -- Process output -------------------------------------------------------------

 void PeerBridge::onStdout() {
     const QByteArray chunk = m_process->readAllStandardOutput();
     if (m_ended) return;

     try {
         m_reader.feed(chunk.constData(), static_cast<std::size_t>(chunk.size()));
         io::Frame frame;
         while (!m_ended && m_reader.next(frame)) {
             if (m_connected)
                 emit frameReceived(frame);
             else
                 handleHandshake(frame);
         }
     } catch (const ProtocolError& e) {
         qCCritical(lcPeer) << m_config.label.c_str() << "bridge sent bad framing:" << e.what();
         m_process->kill();
     }
 }

 /**
  * Before init only "authorize" challenges are expected; anything that is
  * not a control frame breaks the handshake.
  */
 void PeerBridge::handleHandshake(const io::Frame& frame) {
     if (!frame.isControl())
         throw ProtocolError("peer sent data before init");

     json message = json::parse(frame.payload, nullptr, false);
     if (message.is_discarded() || !message.is_object())
         throw ProtocolError("peer sent an invalid control message");

     const auto command = message.value("command", std::string{});
     if (command == "authorize") {
         emit authorizeRequested(QString::fromStdString(message.value("cookie", std::string{})),
                                 QString::fromStdString(message.value("prompt", std::string{})),
                                 QString::fromStdString(message.value("message", std::string{})),
                                 message.value("echo", false));
     } else if (command == "init") {
         if (message.value("version", 0) != 1)
             throw ProtocolError("peer speaks an unsupported protocol version");
         send(io::controlFrame({ {"command", "init"},
                                 {"version", 1},
                                 {"host", m_initHost} }));
         m_connected = true;
         qCInfo(lcPeer) << m_config.label.c_str() << "bridge connected";
         emit connected();
     } else {
         qCDebug(lcPeer) << "ignoring" << command.c_str() << "before init";
     }
 }

 void PeerBridge::onStderr() {
     m_stderr += m_process->readAllStandardError();
     consumeStderrLines(false);
 }

 void PeerBridge::consumeStderrLines(bool flush) {
     int nl;
     while ((nl = m_stderr.indexOf('\n')) >= 0 || (flush && !m_stderr.isEmpty())) {
         QByteArray line = (nl >= 0) ? m_stderr.left(nl) : m_stderr;
         m_stderr.remove(0, nl >= 0 ? nl + 1 : m_stderr.size());
         line = line.trimmed();
         if (line.isEmpty()) continue;
         qCInfo(lcPeer).noquote() << m_config.label.c_str() << ":" << QString::fromUtf8(line);
         m_lastError = line.toStdString();
     }
 }

 // -- Process lifetime -----------------------------------------------------------

 void PeerBridge::onFinished(int exitCode, QProcess::ExitStatus status) {
     m_stderr += m_process->readAllStandardError();
     consumeStderrLines(true);
     if (status == QProcess::CrashExit)
         end(m_config.label + " bridge crashed");
     else
         end(m_config.label + " bridge exited with status " + std::to_string(exitCode));
 }

 void PeerBridge::onError(QProcess::ProcessError error) {
     // Other errors are followed by finished()
     if (error == QProcess::FailedToStart)
         end("failed to start " + m_config.spawn.front() + ": "
             + m_process->errorString().toStdString());
 }

 void PeerBridge::end(const std::string& fallback) {
     if (m_ended) return;
     m_ended = true;
     const std::string message = m_lastError.empty() ? fallback : m_lastError;
     qCInfo(lcPeer) << m_config.label.c_str() << "bridge gone:" << message.c_str();
     emit disconnected(QString::fromStdString(message));
 }
