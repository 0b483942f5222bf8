/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TidalSession.h"

#include "OutputPump.h"
#include "SessionWriter.h"

#include <KLocalizedString>

#include <QDebug>
#include <QFile>
#include <QTextStream>

namespace TidalRelay
{

TidalSession::TidalSession(const SessionConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
{
}

TidalSession::~TidalSession()
{
    if (isRunning()) {
        // Receivers may already be half destroyed at this point
        const QSignalBlocker blocker(this);
        stop();
    }
}

bool TidalSession::readBootstrapScript(const QString &path, QStringList *lines, QString *errorMessage)
{
    if (path.isEmpty()) {
        if (errorMessage) {
            *errorMessage = i18n("no bootstrap script configured");
        }
        return false;
    }

    QFile file(path);
    if (!file.open(QIODevice::ReadOnly | QIODevice::Text)) {
        if (errorMessage) {
            *errorMessage = i18n("cannot read %1: %2", path, file.errorString());
        }
        return false;
    }

    QTextStream in(&file);
    while (!in.atEnd()) {
        const QString line = in.readLine();
        if (lines) {
            lines->append(line);
        }
    }

    return true;
}

bool TidalSession::start()
{
    if (isRunning() || m_state == State::Starting || m_state == State::Stopping) {
        qWarning() << "TidalSession::start: session is already" << stateName(state());
        return false;
    }

    setState(State::Starting);

    // Read the script first so a bad path never leaves a process behind
    QStringList bootLines;
    QString error;
    if (!readBootstrapScript(m_config.bootScriptPath, &bootLines, &error)) {
        return abortStart(SessionFault::Kind::BootstrapReadFailure, error);
    }

    // Anything left from a previous run is released before the new spawn
    teardown();

    m_process = new QProcess(this);
    m_process->setProgram(m_config.interpreterPath);
    m_process->setArguments({});
    m_process->setProcessChannelMode(QProcess::SeparateChannels);
    m_process->start(QIODevice::ReadWrite);

    if (!m_process->waitForStarted(m_config.startTimeoutMs)) {
        return abortStart(SessionFault::Kind::SpawnFailure, i18n("cannot launch %1: %2", m_config.interpreterPath, m_process->errorString()));
    }
    ++m_spawnCount;

    qDebug() << "TidalSession: started" << m_config.interpreterPath << "pid" << m_process->processId();

    m_writer = new SessionWriter(m_process, this);
    m_writer->setWriteTimeout(m_config.writeTimeoutMs);

    m_pump = new OutputPump(m_process, this);
    m_pump->setPollInterval(m_config.pollIntervalMs);
    connect(m_pump, &OutputPump::stdoutReceived, this, &TidalSession::stdoutReceived);
    connect(m_pump, &OutputPump::stderrReceived, this, &TidalSession::stderrReceived);
    connect(m_pump, &OutputPump::faulted, this, &TidalSession::onPumpFaulted);
    connect(m_pump, &OutputPump::finished, this, &TidalSession::onPumpFinished);
    m_pump->start();

    // Prime the interpreter before anyone else can send
    for (const QString &line : std::as_const(bootLines)) {
        if (!isRunning()) {
            break;
        }
        if (!m_writer->send(line)) {
            return abortStart(SessionFault::Kind::SpawnFailure, i18n("cannot replay the bootstrap script: %1", m_writer->lastError()));
        }
    }

    if (!isRunning()) {
        return abortStart(SessionFault::Kind::SpawnFailure, i18n("%1 exited while replaying the bootstrap script", m_config.interpreterPath));
    }

    // Later write failures are reported, not fatal
    connect(m_writer, &SessionWriter::writeFailed, this, &TidalSession::onWriteFailed);

    setState(State::Running);
    return true;
}

void TidalSession::stop()
{
    if (m_state == State::Starting || m_state == State::Stopping) {
        return;
    }

    if (!isRunning()) {
        // Nothing alive; release what is left without complaint
        if (m_pump) {
            m_pump->halt();
        }
        if (m_writer) {
            m_writer->close();
        }
        setState(State::Stopped);
        return;
    }

    setState(State::Stopping);

    m_pump->halt();
    m_writer->close();

    m_process->kill();
    if (!m_process->waitForFinished(m_config.stopTimeoutMs)) {
        qWarning() << "TidalSession::stop: interpreter did not exit within" << m_config.stopTimeoutMs << "ms";
    }

    qDebug() << "TidalSession: stopped" << m_config.interpreterPath;

    setState(State::Stopped);
}

bool TidalSession::isRunning() const
{
    return m_process != nullptr && m_process->state() == QProcess::Running;
}

TidalSession::State TidalSession::state() const
{
    if (m_state == State::Starting || m_state == State::Stopping) {
        return m_state;
    }
    return isRunning() ? State::Running : State::Stopped;
}

bool TidalSession::send(const QString &line)
{
    if (!isRunning() || m_state != State::Running) {
        return false;
    }
    return m_writer->send(line);
}

qint64 TidalSession::processId() const
{
    return isRunning() ? m_process->processId() : 0;
}

int TidalSession::sentCount() const
{
    return m_writer ? m_writer->sentCount() : 0;
}

QString TidalSession::stateName(State state)
{
    switch (state) {
    case State::Starting:
        return QStringLiteral("Starting");
    case State::Running:
        return QStringLiteral("Running");
    case State::Stopping:
        return QStringLiteral("Stopping");
    case State::Stopped:
    default:
        return QStringLiteral("Stopped");
    }
}

void TidalSession::onWriteFailed(const QString &message)
{
    Q_EMIT faultOccurred(SessionFault{SessionFault::Kind::WriteFailure, message});
}

void TidalSession::onPumpFaulted(const QString &message)
{
    // The process handle stays as is; a later stop() or toggle cleans it up
    Q_EMIT faultOccurred(SessionFault{SessionFault::Kind::PumpFault, message});
}

void TidalSession::onPumpFinished()
{
    const int exitCode = m_process ? m_process->exitCode() : -1;
    qDebug() << "TidalSession: interpreter exited with code" << exitCode;

    if (m_writer) {
        m_writer->close();
    }
    setState(State::Stopped);
    Q_EMIT processExited(exitCode);
}

void TidalSession::setState(State newState)
{
    if (m_state != newState) {
        m_state = newState;
        Q_EMIT stateChanged(newState);
    }
}

bool TidalSession::abortStart(SessionFault::Kind kind, const QString &message)
{
    qWarning() << "TidalSession::start:" << SessionFault::kindName(kind) << message;

    teardown();
    setState(State::Stopped);

    Q_EMIT faultOccurred(SessionFault{kind, message});
    return false;
}

void TidalSession::teardown()
{
    if (m_pump) {
        m_pump->halt();
        m_pump->deleteLater();
        m_pump = nullptr;
    }
    if (m_writer) {
        m_writer->close();
        m_writer->deleteLater();
        m_writer = nullptr;
    }
    if (m_process) {
        if (m_process->state() != QProcess::NotRunning) {
            m_process->kill();
            m_process->waitForFinished(m_config.stopTimeoutMs);
        }
        m_process->disconnect(this);
        m_process->deleteLater();
        m_process = nullptr;
    }
}

} // namespace TidalRelay

#include "moc_TidalSession.cpp"
