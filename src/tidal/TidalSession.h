/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TIDALSESSION_H
#define TIDALSESSION_H

#include "SessionConfig.h"
#include "SessionFault.h"

#include <QObject>
#include <QProcess>
#include <QString>
#include <QStringList>

namespace TidalRelay
{

class OutputPump;
class SessionWriter;

/**
 * TidalSession owns one interpreter process.
 *
 * start() spawns the configured interpreter, attaches an OutputPump and a
 * SessionWriter to it, and replays the bootstrap script before returning.
 * stop() closes the input, kills the process and waits for it to be reaped.
 *
 * Liveness is always read from the process itself, never cached, so a
 * session whose interpreter died on its own reports Stopped.
 *
 * All methods must be called from the thread the session lives in.
 */
class TidalSession : public QObject
{
    Q_OBJECT

public:
    /**
     * Lifecycle state of the session
     */
    enum class State {
        Stopped,    // No live process
        Starting,   // Spawning and replaying the bootstrap script
        Running,    // Process alive and accepting input
        Stopping    // Tearing down
    };
    Q_ENUM(State)

    explicit TidalSession(const SessionConfig &config, QObject *parent = nullptr);
    ~TidalSession() override;

    /**
     * Read a bootstrap script into lines, in file order
     *
     * @param path Script location
     * @param lines Receives the lines, without terminators
     * @param errorMessage Receives the reason on failure
     * @return false if the file is missing or unreadable
     */
    static bool readBootstrapScript(const QString &path, QStringList *lines, QString *errorMessage = nullptr);

    /**
     * Spawn the interpreter and prime it with the bootstrap script
     *
     * @return false if the session was already alive or the start failed,
     *         which includes an interpreter that dies during the bootstrap
     *         replay; failures are also emitted through faultOccurred()
     */
    bool start();

    /**
     * Kill the interpreter. Safe to call on a stopped session.
     */
    void stop();

    /**
     * Whether the interpreter process exists and is alive
     */
    bool isRunning() const;

    State state() const;

    /**
     * Send one fragment to the interpreter
     *
     * A no-op returning false when the session is not running.
     */
    bool send(const QString &line);

    /**
     * PID of the interpreter, or 0 when not running
     */
    qint64 processId() const;

    /**
     * Number of processes spawned by this session
     */
    int spawnCount() const { return m_spawnCount; }

    /**
     * Number of lines written to the current process, bootstrap included
     */
    int sentCount() const;

    const SessionConfig &config() const { return m_config; }

    static QString stateName(State state);

Q_SIGNALS:
    void stateChanged(State newState);

    /**
     * Interpreter output, one poll batch at a time
     */
    void stdoutReceived(const QString &text);
    void stderrReceived(const QString &text);

    /**
     * Any failure: spawn, bootstrap, write or pump
     */
    void faultOccurred(const TidalRelay::SessionFault &fault);

    /**
     * The interpreter exited without stop() being called
     */
    void processExited(int exitCode);

private Q_SLOTS:
    void onWriteFailed(const QString &message);
    void onPumpFaulted(const QString &message);
    void onPumpFinished();

private:
    void setState(State newState);
    bool abortStart(SessionFault::Kind kind, const QString &message);
    void teardown();

    SessionConfig m_config;
    State m_state = State::Stopped;

    QProcess *m_process = nullptr;
    SessionWriter *m_writer = nullptr;
    OutputPump *m_pump = nullptr;

    int m_spawnCount = 0;
};

} // namespace TidalRelay

#endif // TIDALSESSION_H
