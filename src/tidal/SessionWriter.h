/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONWRITER_H
#define SESSIONWRITER_H

#include <QObject>
#include <QPointer>
#include <QString>

class QIODevice;

namespace TidalRelay
{

/**
 * SessionWriter writes commands to the interpreter's standard input.
 *
 * GHCi treats a carriage return as "continue the same command" and a line
 * feed as "run it". Every send is normalized accordingly, terminated with a
 * single line feed and flushed before send() returns, so each command is
 * visible to the interpreter before the next one is written.
 *
 * Failures are reported through writeFailed() and a false return value;
 * the caller is never interrupted.
 */
class SessionWriter : public QObject
{
    Q_OBJECT

public:
    static constexpr int DEFAULT_WRITE_TIMEOUT_MS = 1000;

    explicit SessionWriter(QIODevice *device, QObject *parent = nullptr);
    ~SessionWriter() override;

    /**
     * Apply the newline translation without the terminator
     *
     * "\n" becomes "\r", then "\r\r" (a former blank line) becomes "\n".
     */
    static QString normalize(const QString &line);

    /**
     * Normalize, terminate, write and flush one command
     *
     * If the flush does not finish within the write timeout while the
     * interpreter is still alive, the remaining bytes stay queued and are
     * delivered from the event loop; the send still counts as successful.
     *
     * @return false if the command could not be handed to the device
     */
    bool send(const QString &line);

    /**
     * Close the write side. Safe to call repeatedly.
     */
    void close();

    bool isClosed() const { return m_closed; }

    int writeTimeout() const { return m_writeTimeoutMs; }
    void setWriteTimeout(int ms) { m_writeTimeoutMs = ms; }

    /**
     * Number of commands written successfully
     */
    int sentCount() const { return m_sentCount; }

    /**
     * Number of sends whose flush outlasted the write timeout
     */
    int delayedCount() const { return m_delayedCount; }

    QString lastError() const { return m_lastError; }

Q_SIGNALS:
    /**
     * Emitted when a write or flush fails
     */
    void writeFailed(const QString &message);

private:
    bool fail(const QString &message);

    QPointer<QIODevice> m_device;
    int m_writeTimeoutMs = DEFAULT_WRITE_TIMEOUT_MS;
    int m_sentCount = 0;
    int m_delayedCount = 0;
    QString m_lastError;
    bool m_closed = false;
    bool m_deviceWriteError = false;
};

} // namespace TidalRelay

#endif // SESSIONWRITER_H
