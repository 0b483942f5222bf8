/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TIDALCONTROLLER_H
#define TIDALCONTROLLER_H

#include "SessionRegistry.h"
#include "TextFragment.h"

#include <QObject>
#include <QString>

namespace TidalRelay
{

class NotificationManager;
class TidalSession;

/**
 * TidalController is what an editor integration talks to.
 *
 * It turns user actions (toggle, send, hush) into registry and session
 * calls and routes everything the session reports to the
 * NotificationManager: stdout as info, stderr as warnings, faults as
 * errors.
 */
class TidalController : public QObject
{
    Q_OBJECT

public:
    TidalController(SessionRegistry *registry, NotificationManager *notifications, QObject *parent = nullptr);
    ~TidalController() override;

    /**
     * Start the interpreter, or stop it if it is running
     */
    SessionRegistry::Transition toggleSession();

    /**
     * Send raw editor text to the running session
     *
     * Blank text is dropped silently. Without a running session this is
     * a no-op.
     *
     * @return true if the text was written to the interpreter
     */
    bool sendText(const QString &rawText);

    /**
     * Send a fragment selected in the editor
     */
    bool sendFragment(const TextFragment &fragment);

    /**
     * Silence all patterns
     */
    bool hush();

    SessionRegistry *registry() const { return m_registry; }
    NotificationManager *notifications() const { return m_notifications; }

Q_SIGNALS:
    /**
     * Emitted after a fragment was written, for highlighting its range
     */
    void fragmentSent(const TidalRelay::TextFragment &fragment);

private Q_SLOTS:
    void onSessionCreated(TidalRelay::TidalSession *session);

private:
    SessionRegistry *m_registry = nullptr;
    NotificationManager *m_notifications = nullptr;
};

} // namespace TidalRelay

#endif // TIDALCONTROLLER_H
