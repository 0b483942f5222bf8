/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TidalController.h"

#include "NotificationManager.h"
#include "TidalSession.h"

#include <KLocalizedString>

#include <QDebug>

namespace TidalRelay
{

TidalController::TidalController(SessionRegistry *registry, NotificationManager *notifications, QObject *parent)
    : QObject(parent)
    , m_registry(registry)
    , m_notifications(notifications)
{
    // Wire each session before it starts so bootstrap output and start faults are seen
    connect(m_registry, &SessionRegistry::sessionCreated, this, &TidalController::onSessionCreated);
}

TidalController::~TidalController() = default;

SessionRegistry::Transition TidalController::toggleSession()
{
    const SessionRegistry::Transition transition = m_registry->toggle();

    switch (transition) {
    case SessionRegistry::Transition::Started:
        m_notifications->info(i18n("Started tidal"));
        break;
    case SessionRegistry::Transition::Stopped:
        m_notifications->info(i18n("Stopped tidal"));
        break;
    case SessionRegistry::Transition::Failed:
        // The session already reported why
        break;
    case SessionRegistry::Transition::Deferred:
        break;
    }

    return transition;
}

bool TidalController::sendText(const QString &rawText)
{
    TextFragment fragment;
    fragment.text = rawText.trimmed();
    fragment.start = 0;
    fragment.end = int(rawText.size());
    return sendFragment(fragment);
}

bool TidalController::sendFragment(const TextFragment &fragment)
{
    if (fragment.isBlank()) {
        return false;
    }

    TidalSession *session = m_registry->current();
    if (!session) {
        return false;
    }

    if (!session->send(fragment.payload())) {
        return false;
    }

    Q_EMIT fragmentSent(fragment);
    return true;
}

bool TidalController::hush()
{
    TidalSession *session = m_registry->current();
    if (!session || !session->send(QStringLiteral("hush"))) {
        return false;
    }

    m_notifications->info(i18n("Hushed 🤫"));
    return true;
}

void TidalController::onSessionCreated(TidalSession *session)
{
    connect(session, &TidalSession::stdoutReceived, m_notifications, &NotificationManager::info);
    connect(session, &TidalSession::stderrReceived, m_notifications, &NotificationManager::warning);
    connect(session, &TidalSession::faultOccurred, m_notifications, &NotificationManager::error);
    connect(session, &TidalSession::processExited, m_notifications, [this](int exitCode) {
        m_notifications->warning(i18n("Interpreter exited with code %1", exitCode));
    });
}

} // namespace TidalRelay

#include "moc_TidalController.cpp"
