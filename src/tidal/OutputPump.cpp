/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "OutputPump.h"

#include <QDebug>
#include <QTimer>

namespace TidalRelay
{

OutputPump::OutputPump(QProcess *process, QObject *parent)
    : QObject(parent)
    , m_process(process)
    , m_stdoutReader(process, QProcess::StandardOutput)
    , m_stderrReader(process, QProcess::StandardError)
    , m_timer(new QTimer(this))
{
    m_timer->setInterval(m_pollIntervalMs);
    connect(m_timer, &QTimer::timeout, this, &OutputPump::poll);
}

OutputPump::~OutputPump() = default;

void OutputPump::setPollInterval(int ms)
{
    m_pollIntervalMs = qMax(1, ms);
    m_timer->setInterval(m_pollIntervalMs);
}

void OutputPump::start()
{
    if (m_started || !m_process) {
        return;
    }
    m_started = true;
    m_active = true;

    connect(m_process.data(), &QProcess::errorOccurred, this, &OutputPump::onProcessError);
    connect(m_process.data(), QOverload<int, QProcess::ExitStatus>::of(&QProcess::finished), this, &OutputPump::onProcessFinished);

    m_timer->start();
}

void OutputPump::halt()
{
    if (!m_active) {
        return;
    }
    m_active = false;
    detach();
}

void OutputPump::poll()
{
    if (!m_active) {
        return;
    }

    drain();

    // Liveness is checked after draining so the last batch is not lost
    if (!m_process || m_process->state() == QProcess::NotRunning) {
        finish();
    }
}

void OutputPump::drain()
{
    const QString out = m_stdoutReader.poll();
    if (!out.isEmpty()) {
        Q_EMIT stdoutReceived(out);
    }

    // A slot connected to stdoutReceived may have halted us
    if (!m_active) {
        return;
    }

    const QString err = m_stderrReader.poll();
    if (!err.isEmpty()) {
        Q_EMIT stderrReceived(err);
    }
}

void OutputPump::finish()
{
    if (!m_active) {
        return;
    }
    m_active = false;
    detach();
    Q_EMIT finished();
}

void OutputPump::detach()
{
    m_timer->stop();
    if (m_process) {
        disconnect(m_process.data(), nullptr, this, nullptr);
    }
}

void OutputPump::onProcessError(QProcess::ProcessError error)
{
    if (!m_active) {
        return;
    }

    switch (error) {
    case QProcess::ReadError:
    case QProcess::UnknownError:
        break;
    default:
        // Crashes and exits are picked up by the liveness check;
        // start and write errors belong to the session and the writer
        return;
    }

    const QString message = m_process ? m_process->errorString() : QString();
    qWarning() << "OutputPump: read fault:" << message;

    m_active = false;
    detach();

    if (!m_faulted) {
        m_faulted = true;
        Q_EMIT faulted(message);
    }
}

void OutputPump::onProcessFinished()
{
    if (!m_active) {
        return;
    }
    drain();
    finish();
}

} // namespace TidalRelay

#include "moc_OutputPump.cpp"
