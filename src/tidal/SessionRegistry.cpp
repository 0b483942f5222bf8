/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "SessionRegistry.h"
#include "TidalSession.h"

#include <QDebug>
#include <QThread>

namespace TidalRelay
{

SessionRegistry::SessionRegistry(const SessionConfig &config, QObject *parent)
    : QObject(parent)
    , m_config(config)
{
}

SessionRegistry::~SessionRegistry()
{
    QMutexLocker locker(&m_mutex);
    if (m_current) {
        m_current->stop();
        delete m_current.data();
    }
}

SessionRegistry::Transition SessionRegistry::toggle()
{
    if (QThread::currentThread() != thread()) {
        // Sessions and their processes belong to the registry's thread
        Transition result = Transition::Failed;
        QMetaObject::invokeMethod(
            this,
            [this, &result]() {
                result = toggle();
            },
            Qt::BlockingQueuedConnection);
        return result;
    }

    QMutexLocker locker(&m_mutex);
    if (m_inTransition) {
        // Re-entered from one of our own signals; the current transition finishes first
        qDebug() << "SessionRegistry: toggle requested during a transition, deferring";
        QMetaObject::invokeMethod(
            this,
            [this]() {
                toggle();
            },
            Qt::QueuedConnection);
        return Transition::Deferred;
    }

    m_inTransition = true;
    const Transition result = toggleLocked();
    m_inTransition = false;
    return result;
}

SessionRegistry::Transition SessionRegistry::toggleLocked()
{
    if (m_current && m_current->isRunning()) {
        TidalSession *session = m_current;
        session->stop();
        Q_EMIT sessionStopped(session);
        disposeLocked();
        return Transition::Stopped;
    }

    // A session whose interpreter died or whose start failed is replaced
    disposeLocked();

    auto *session = new TidalSession(m_config, this);
    m_current = session;
    Q_EMIT sessionCreated(session);

    if (!session->start()) {
        qWarning() << "SessionRegistry: failed to start session for" << m_config.interpreterPath;
        disposeLocked();
        return Transition::Failed;
    }

    Q_EMIT sessionStarted(session);
    return Transition::Started;
}

void SessionRegistry::disposeLocked()
{
    if (!m_current) {
        return;
    }

    TidalSession *session = m_current;
    m_current = nullptr;

    // Idempotent; releases the writer and kills a stale process
    session->stop();
    session->deleteLater();
}

TidalSession *SessionRegistry::current() const
{
    QMutexLocker locker(&m_mutex);
    return m_current;
}

bool SessionRegistry::hasRunningSession() const
{
    QMutexLocker locker(&m_mutex);
    return m_current && m_current->isRunning();
}

void SessionRegistry::shutdown()
{
    if (QThread::currentThread() != thread()) {
        QMetaObject::invokeMethod(
            this,
            [this]() {
                shutdown();
            },
            Qt::BlockingQueuedConnection);
        return;
    }

    QMutexLocker locker(&m_mutex);
    if (m_inTransition) {
        QMetaObject::invokeMethod(
            this,
            [this]() {
                shutdown();
            },
            Qt::QueuedConnection);
        return;
    }

    m_inTransition = true;
    shutdownLocked();
    m_inTransition = false;
}

void SessionRegistry::shutdownLocked()
{
    if (m_current && m_current->isRunning()) {
        TidalSession *session = m_current;
        session->stop();
        Q_EMIT sessionStopped(session);
    }
    disposeLocked();
}

SessionConfig SessionRegistry::config() const
{
    QMutexLocker locker(&m_mutex);
    return m_config;
}

void SessionRegistry::setConfig(const SessionConfig &config)
{
    QMutexLocker locker(&m_mutex);
    m_config = config;
}

QString SessionRegistry::transitionName(Transition transition)
{
    switch (transition) {
    case Transition::Started:
        return QStringLiteral("started");
    case Transition::Stopped:
        return QStringLiteral("stopped");
    case Transition::Deferred:
        return QStringLiteral("deferred");
    case Transition::Failed:
    default:
        return QStringLiteral("failed");
    }
}

} // namespace TidalRelay

#include "moc_SessionRegistry.cpp"
