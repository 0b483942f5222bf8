/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionWriter.h"

#include <KLocalizedString>

#include <QDeadlineTimer>
#include <QDebug>
#include <QIODevice>
#include <QProcess>

namespace TidalRelay
{

SessionWriter::SessionWriter(QIODevice *device, QObject *parent)
    : QObject(parent)
    , m_device(device)
{
    // A broken pipe surfaces as a process error, not as a short write
    if (auto *process = qobject_cast<QProcess *>(device)) {
        connect(process, &QProcess::errorOccurred, this, [this](QProcess::ProcessError error) {
            if (error == QProcess::WriteError) {
                m_deviceWriteError = true;
            }
        });
    }
}

SessionWriter::~SessionWriter() = default;

QString SessionWriter::normalize(const QString &line)
{
    QString result = line;
    result.replace(QLatin1Char('\n'), QLatin1Char('\r'));
    result.replace(QStringLiteral("\r\r"), QStringLiteral("\n"));
    return result;
}

bool SessionWriter::send(const QString &line)
{
    if (m_closed) {
        return fail(i18n("write channel is closed"));
    }
    if (!m_device || !m_device->isOpen() || !m_device->isWritable()) {
        return fail(i18n("interpreter input is not writable"));
    }

    const QByteArray data = (normalize(line) + QLatin1Char('\n')).toUtf8();

    m_deviceWriteError = false;
    const qint64 written = m_device->write(data);
    if (m_deviceWriteError || written != data.size()) {
        return fail(m_device->errorString());
    }

    // Flush now; command boundaries are inferred from separate writes
    const QDeadlineTimer deadline(m_writeTimeoutMs);
    while (m_device->bytesToWrite() > 0) {
        if (!m_device->waitForBytesWritten(int(deadline.remainingTime()))) {
            break;
        }
    }

    if (m_deviceWriteError) {
        return fail(m_device->errorString());
    }

    if (m_device->bytesToWrite() > 0) {
        auto *process = qobject_cast<QProcess *>(m_device.data());
        if (process && process->state() != QProcess::Running) {
            return fail(i18n("interpreter exited before reading the command"));
        }

        // The interpreter is alive but slow; the event loop delivers the rest
        qWarning() << "SessionWriter: delivery delayed," << m_device->bytesToWrite() << "bytes still queued after" << m_writeTimeoutMs << "ms";
        ++m_delayedCount;
    }

    ++m_sentCount;
    return true;
}

void SessionWriter::close()
{
    if (m_closed) {
        return;
    }
    m_closed = true;

    if (!m_device) {
        return;
    }

    if (auto *process = qobject_cast<QProcess *>(m_device.data())) {
        // Only the write side; output is still drained by the pump
        process->closeWriteChannel();
    } else if (m_device->isOpen()) {
        m_device->close();
    }
}

bool SessionWriter::fail(const QString &message)
{
    qWarning() << "SessionWriter: write failed:" << message;
    m_lastError = message;
    Q_EMIT writeFailed(message);
    return false;
}

} // namespace TidalRelay

#include "moc_SessionWriter.cpp"
