/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef OUTPUTPUMP_H
#define OUTPUTPUMP_H

#include "LineReader.h"

#include <QObject>
#include <QPointer>
#include <QProcess>
#include <QString>

class QTimer;

namespace TidalRelay
{

/**
 * OutputPump drains a running interpreter's stdout and stderr.
 *
 * QProcess fills its read buffers asynchronously from the event loop; the
 * pump empties them on a fixed cadence. Each cycle polls stdout, then
 * stderr, and emits every non-empty batch in the order it was produced.
 *
 * The cycle ends when the process is no longer alive (after one last drain)
 * or when the process reports a read error. A read error is emitted through
 * faulted() exactly once. The pump never restarts itself; a fresh session
 * gets a fresh pump.
 */
class OutputPump : public QObject
{
    Q_OBJECT

public:
    static constexpr int DEFAULT_POLL_INTERVAL_MS = 200;

    explicit OutputPump(QProcess *process, QObject *parent = nullptr);
    ~OutputPump() override;

    /**
     * Begin polling. Does nothing if the pump already ran.
     */
    void start();

    /**
     * Stop polling without a final drain and without emitting finished()
     *
     * Used by the stop path before the process is killed.
     */
    void halt();

    /**
     * Whether the poll cycle is currently scheduled
     */
    bool isActive() const { return m_active; }

    /**
     * Whether faulted() has been emitted
     */
    bool hasFaulted() const { return m_faulted; }

    int pollInterval() const { return m_pollIntervalMs; }
    void setPollInterval(int ms);

Q_SIGNALS:
    /**
     * A non-empty batch of standard output
     */
    void stdoutReceived(const QString &text);

    /**
     * A non-empty batch of standard error
     */
    void stderrReceived(const QString &text);

    /**
     * Polling failed; the pump has stopped
     */
    void faulted(const QString &message);

    /**
     * The process is gone and its output has been drained
     */
    void finished();

private Q_SLOTS:
    void poll();
    void onProcessError(QProcess::ProcessError error);
    void onProcessFinished();

private:
    void drain();
    void finish();
    void detach();

    QPointer<QProcess> m_process;
    LineReader m_stdoutReader;
    LineReader m_stderrReader;
    QTimer *m_timer = nullptr;

    int m_pollIntervalMs = DEFAULT_POLL_INTERVAL_MS;
    bool m_started = false;
    bool m_active = false;
    bool m_faulted = false;
};

} // namespace TidalRelay

#endif // OUTPUTPUMP_H
