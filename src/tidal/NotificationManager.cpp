/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "NotificationManager.h"

#include <KLocalizedString>
#include <KNotification>

#include <QDebug>

namespace TidalRelay
{

NotificationManager::NotificationManager(QObject *parent)
    : QObject(parent)
    , m_promptToken(QStringLiteral("Prelude>"))
    , m_title(i18n("Tidal Cycles"))
{
}

NotificationManager::~NotificationManager() = default;

QString NotificationManager::cleanMessage(const QString &message, const QString &promptToken)
{
    QString cleaned = message;
    if (!promptToken.isEmpty()) {
        cleaned.remove(promptToken);
    }
    return cleaned.trimmed();
}

bool NotificationManager::notify(NotificationType type, const QString &message)
{
    const QString cleaned = cleanMessage(message, m_promptToken);
    if (cleaned.isEmpty()) {
        return false;
    }

    ++m_shownCount;

    if (m_enabledChannels.testFlag(Channel::Log)) {
        log(type, cleaned);
    }

    if (m_enabledChannels.testFlag(Channel::Desktop)) {
        showDesktopNotification(type, cleaned);
    }

    if (m_enabledChannels.testFlag(Channel::InApp)) {
        Q_EMIT notificationShown(type, m_title, cleaned);
    }

    return true;
}

bool NotificationManager::error(const SessionFault &fault)
{
    return notify(NotificationType::Error, fault.toString());
}

void NotificationManager::showDesktopNotification(NotificationType type, const QString &message)
{
    KNotification *notification = new KNotification(eventName(type), KNotification::CloseOnTimeout);
    notification->setTitle(m_title);
    notification->setText(message);
    notification->setIconName(iconName(type));
    notification->setComponentName(QStringLiteral("tidalrelay"));

    notification->sendEvent();
}

void NotificationManager::log(NotificationType type, const QString &message) const
{
    switch (type) {
    case NotificationType::Error:
        qWarning().noquote() << "[error]" << message;
        break;
    case NotificationType::Warning:
        qWarning().noquote() << "[warning]" << message;
        break;
    case NotificationType::Info:
    default:
        qInfo().noquote() << message;
        break;
    }
}

void NotificationManager::enableChannel(Channel channel, bool enable)
{
    if (enable) {
        m_enabledChannels |= channel;
    } else {
        m_enabledChannels &= ~Channels(channel);
    }
}

bool NotificationManager::isChannelEnabled(Channel channel) const
{
    return m_enabledChannels.testFlag(channel);
}

QString NotificationManager::iconName(NotificationType type)
{
    switch (type) {
    case NotificationType::Error:
        return QStringLiteral("dialog-error");
    case NotificationType::Warning:
        return QStringLiteral("dialog-warning");
    case NotificationType::Info:
    default:
        return QStringLiteral("dialog-information");
    }
}

QString NotificationManager::eventName(NotificationType type)
{
    switch (type) {
    case NotificationType::Error:
        return QStringLiteral("error");
    case NotificationType::Warning:
        return QStringLiteral("warning");
    case NotificationType::Info:
    default:
        return QStringLiteral("info");
    }
}

} // namespace TidalRelay

#include "moc_NotificationManager.cpp"
