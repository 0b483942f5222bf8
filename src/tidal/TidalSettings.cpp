/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#include "TidalSettings.h"

#include <KConfigGroup>
#include <QStandardPaths>

namespace TidalRelay
{

TidalSettings::TidalSettings(const QString &configName, QObject *parent)
    : QObject(parent)
{
    // Load config from ~/.config/tidalrelayrc
    m_config = KSharedConfig::openConfig(configName);
}

TidalSettings::~TidalSettings()
{
    save();
}

QString TidalSettings::interpreterPath() const
{
    KConfigGroup group(m_config, QStringLiteral("Interpreter"));
    return group.readEntry("Path", defaultInterpreterPath());
}

void TidalSettings::setInterpreterPath(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Interpreter"));
    group.writeEntry("Path", path);
    Q_EMIT settingsChanged();
}

QString TidalSettings::bootScriptPath() const
{
    KConfigGroup group(m_config, QStringLiteral("Bootstrap"));
    return group.readEntry("ScriptPath", defaultBootScriptPath());
}

void TidalSettings::setBootScriptPath(const QString &path)
{
    KConfigGroup group(m_config, QStringLiteral("Bootstrap"));
    group.writeEntry("ScriptPath", path);
    Q_EMIT settingsChanged();
}

int TidalSettings::pollIntervalMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Session"));
    return qMax(1, group.readEntry("PollIntervalMs", 200));
}

void TidalSettings::setPollIntervalMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Session"));
    group.writeEntry("PollIntervalMs", ms);
    Q_EMIT settingsChanged();
}

int TidalSettings::startTimeoutMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Session"));
    return group.readEntry("StartTimeoutMs", 5000);
}

void TidalSettings::setStartTimeoutMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Session"));
    group.writeEntry("StartTimeoutMs", ms);
    Q_EMIT settingsChanged();
}

int TidalSettings::writeTimeoutMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Session"));
    return group.readEntry("WriteTimeoutMs", 1000);
}

void TidalSettings::setWriteTimeoutMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Session"));
    group.writeEntry("WriteTimeoutMs", ms);
    Q_EMIT settingsChanged();
}

int TidalSettings::stopTimeoutMs() const
{
    KConfigGroup group(m_config, QStringLiteral("Session"));
    return group.readEntry("StopTimeoutMs", 3000);
}

void TidalSettings::setStopTimeoutMs(int ms)
{
    KConfigGroup group(m_config, QStringLiteral("Session"));
    group.writeEntry("StopTimeoutMs", ms);
    Q_EMIT settingsChanged();
}

QString TidalSettings::promptToken() const
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    return group.readEntry("PromptToken", QStringLiteral("Prelude>"));
}

void TidalSettings::setPromptToken(const QString &token)
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    group.writeEntry("PromptToken", token);
    Q_EMIT settingsChanged();
}

bool TidalSettings::desktopNotifications() const
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    return group.readEntry("Desktop", true);
}

void TidalSettings::setDesktopNotifications(bool enabled)
{
    KConfigGroup group(m_config, QStringLiteral("Notifications"));
    group.writeEntry("Desktop", enabled);
    Q_EMIT settingsChanged();
}

SessionConfig TidalSettings::sessionConfig() const
{
    SessionConfig config;
    config.interpreterPath = interpreterPath();
    config.bootScriptPath = bootScriptPath();
    config.pollIntervalMs = pollIntervalMs();
    config.startTimeoutMs = startTimeoutMs();
    config.writeTimeoutMs = writeTimeoutMs();
    config.stopTimeoutMs = stopTimeoutMs();
    return config;
}

QString TidalSettings::defaultInterpreterPath()
{
    // First check if ghci is in PATH
    const QString path = QStandardPaths::findExecutable(QStringLiteral("ghci"));
    if (!path.isEmpty()) {
        return path;
    }
    return QStringLiteral("/usr/local/bin/ghci");
}

QString TidalSettings::defaultBootScriptPath()
{
    const QString installed = QStandardPaths::locate(QStandardPaths::AppDataLocation, QStringLiteral("BootTidal.hs"));
    if (!installed.isEmpty()) {
        return installed;
    }
    return QStandardPaths::writableLocation(QStandardPaths::AppDataLocation) + QStringLiteral("/BootTidal.hs");
}

void TidalSettings::save()
{
    m_config->sync();
}

} // namespace TidalRelay

#include "moc_TidalSettings.cpp"
