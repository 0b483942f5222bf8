/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later
*/

#ifndef TIDALSETTINGS_H
#define TIDALSETTINGS_H

#include "SessionConfig.h"

#include <QObject>
#include <QString>

#include <KSharedConfig>

namespace TidalRelay
{

/**
 * TidalSettings manages tidalrelay's persistent settings.
 *
 * Settings include:
 * - Interpreter executable (GHCi)
 * - Bootstrap script (BootTidal.hs)
 * - Session timing (poll interval, timeouts)
 * - Notification prompt token and desktop popups
 */
class TidalSettings : public QObject
{
    Q_OBJECT

public:
    static constexpr const char *DEFAULT_CONFIG_NAME = "tidalrelayrc";

    /**
     * @param configName KConfig file name, resolved in the config location
     */
    explicit TidalSettings(const QString &configName = QString::fromLatin1(DEFAULT_CONFIG_NAME), QObject *parent = nullptr);
    ~TidalSettings() override;

    /**
     * Interpreter launched for each session
     */
    QString interpreterPath() const;
    void setInterpreterPath(const QString &path);

    /**
     * Script replayed into every new session
     */
    QString bootScriptPath() const;
    void setBootScriptPath(const QString &path);

    /**
     * Output drain cadence in milliseconds (default: 200)
     */
    int pollIntervalMs() const;
    void setPollIntervalMs(int ms);

    /**
     * How long to wait for the interpreter to launch (default: 5000)
     */
    int startTimeoutMs() const;
    void setStartTimeoutMs(int ms);

    /**
     * Flush bound for a single send (default: 1000)
     */
    int writeTimeoutMs() const;
    void setWriteTimeoutMs(int ms);

    /**
     * How long to wait for a killed interpreter to be reaped (default: 3000)
     */
    int stopTimeoutMs() const;
    void setStopTimeoutMs(int ms);

    /**
     * Interpreter prompt removed from notifications (default: "Prelude>")
     */
    QString promptToken() const;
    void setPromptToken(const QString &token);

    /**
     * Show desktop popups in addition to in-app notifications
     */
    bool desktopNotifications() const;
    void setDesktopNotifications(bool enabled);

    /**
     * Everything a session needs, in one value
     */
    SessionConfig sessionConfig() const;

    /**
     * Locate ghci on PATH, falling back to /usr/local/bin/ghci
     */
    static QString defaultInterpreterPath();

    /**
     * BootTidal.hs in the application data location
     */
    static QString defaultBootScriptPath();

    /**
     * Save settings to disk
     */
    void save();

Q_SIGNALS:
    void settingsChanged();

private:
    KSharedConfig::Ptr m_config;
};

} // namespace TidalRelay

#endif // TIDALSETTINGS_H
