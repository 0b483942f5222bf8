/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef SESSIONREGISTRY_H
#define SESSIONREGISTRY_H

#include "SessionConfig.h"

#include <QMutex>
#include <QObject>
#include <QPointer>

namespace TidalRelay
{

class TidalSession;

/**
 * SessionRegistry holds the one active interpreter session.
 *
 * Create a single registry at startup and hand it to whoever needs the
 * session; there is no global instance. toggle() is the only way the slot
 * changes. It is serialized by a mutex and may be called from any thread:
 * calls from other threads are carried out in the registry's own thread and
 * block until the transition is done, so a second toggle always sees the
 * result of the first.
 *
 * A toggle or shutdown requested from a slot connected to one of the
 * registry's signals, while a transition is still running, is queued and
 * carried out once the event loop is reached again.
 */
class SessionRegistry : public QObject
{
    Q_OBJECT

public:
    /**
     * Outcome of a toggle
     */
    enum class Transition {
        Started,    // A new session is running
        Stopped,    // The running session was stopped
        Failed,     // A start was attempted and failed; no session is active
        Deferred    // Requested during another transition; queued to run after it
    };
    Q_ENUM(Transition)

    explicit SessionRegistry(const SessionConfig &config, QObject *parent = nullptr);
    ~SessionRegistry() override;

    /**
     * Stop the running session, or start a new one if none is running
     */
    Transition toggle();

    /**
     * The active session, or nullptr
     *
     * Plain lookup; may return a session whose interpreter has died.
     */
    TidalSession *current() const;

    /**
     * Whether a session exists and its interpreter is alive
     */
    bool hasRunningSession() const;

    /**
     * Stop and dispose of the current session, if any
     */
    void shutdown();

    /**
     * Configuration for sessions created from now on
     */
    SessionConfig config() const;
    void setConfig(const SessionConfig &config);

    static QString transitionName(Transition transition);

Q_SIGNALS:
    /**
     * A session was constructed and is about to start
     *
     * Emitted before start() so its output and faults can be wired up.
     */
    void sessionCreated(TidalRelay::TidalSession *session);

    void sessionStarted(TidalRelay::TidalSession *session);
    void sessionStopped(TidalRelay::TidalSession *session);

private:
    Transition toggleLocked();
    void shutdownLocked();
    void disposeLocked();

    mutable QRecursiveMutex m_mutex;
    SessionConfig m_config;
    QPointer<TidalSession> m_current;
    bool m_inTransition = false;
};

} // namespace TidalRelay

#endif // SESSIONREGISTRY_H
