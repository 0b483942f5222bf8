/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef NOTIFICATIONMANAGER_H
#define NOTIFICATIONMANAGER_H

#include "SessionFault.h"

#include <QObject>
#include <QString>

namespace TidalRelay
{

/**
 * NotificationManager surfaces interpreter output and session events.
 *
 * Three notification channels:
 * 1. Desktop Popup - KNotification framework
 * 2. In-App - notificationShown() signal for the host to display
 * 3. Log - qInfo/qWarning output
 *
 * Interpreter output is noisy: the prompt token is stripped from every
 * message and whatever is blank afterwards is dropped without a trace.
 */
class NotificationManager : public QObject
{
    Q_OBJECT

public:
    /**
     * Notification type/priority
     */
    enum class NotificationType {
        Info,       // Interpreter stdout, session started/stopped
        Warning,    // Interpreter stderr, unexpected exit
        Error       // Session faults
    };
    Q_ENUM(NotificationType)

    /**
     * Notification channel flags
     */
    enum class Channel {
        None = 0,
        Desktop = 1 << 0,
        InApp = 1 << 1,
        Log = 1 << 2,
        All = Desktop | InApp | Log
    };
    Q_DECLARE_FLAGS(Channels, Channel)
    Q_FLAG(Channels)

    explicit NotificationManager(QObject *parent = nullptr);
    ~NotificationManager() override;

    /**
     * Show a notification
     *
     * @return false if the message was empty after cleaning and nothing was shown
     */
    bool notify(NotificationType type, const QString &message);

    bool info(const QString &message) { return notify(NotificationType::Info, message); }
    bool warning(const QString &message) { return notify(NotificationType::Warning, message); }
    bool error(const SessionFault &fault);

    /**
     * Remove every occurrence of the prompt token and trim
     */
    static QString cleanMessage(const QString &message, const QString &promptToken);

    /**
     * Get/set the interpreter prompt to strip (default: "Prelude>")
     */
    QString promptToken() const { return m_promptToken; }
    void setPromptToken(const QString &token) { m_promptToken = token; }

    /**
     * Get/set the notification title (default: "Tidal Cycles")
     */
    QString title() const { return m_title; }
    void setTitle(const QString &title) { m_title = title; }

    /**
     * Get/set enabled channels
     */
    Channels enabledChannels() const { return m_enabledChannels; }
    void setEnabledChannels(Channels channels) { m_enabledChannels = channels; }

    /**
     * Enable/disable specific channel
     */
    void enableChannel(Channel channel, bool enable = true);
    bool isChannelEnabled(Channel channel) const;

    /**
     * Number of notifications actually shown
     */
    int shownCount() const { return m_shownCount; }

    /**
     * Get icon name for notification type
     */
    static QString iconName(NotificationType type);

    /**
     * Get the notifyrc event id for notification type
     */
    static QString eventName(NotificationType type);

Q_SIGNALS:
    /**
     * Emitted for every notification that passes cleaning, for in-app display
     */
    void notificationShown(TidalRelay::NotificationManager::NotificationType type, const QString &title, const QString &message);

private:
    void showDesktopNotification(NotificationType type, const QString &message);
    void log(NotificationType type, const QString &message) const;

    QString m_promptToken;
    QString m_title;
    Channels m_enabledChannels = Channel::All;
    int m_shownCount = 0;
};

Q_DECLARE_OPERATORS_FOR_FLAGS(NotificationManager::Channels)

} // namespace TidalRelay

#endif // NOTIFICATIONMANAGER_H
