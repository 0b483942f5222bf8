/*
    SPDX-FileCopyrightText: 2025 Struktured Labs
    SPDX-License-Identifier: GPL-2.0-or-later

    tidalrelay - drive a Tidal interpreter session from the terminal

    Lines read from stdin are collected into a fragment and sent to the
    interpreter when a blank line arrives, the same way an editor sends a
    paragraph. A few lines are commands instead:

        :toggle   start or stop the interpreter
        :hush     silence all patterns
        :quit     stop the interpreter and exit

    Usage:
        tidalrelay [--interpreter <path>] [--boot-script <path>] [--no-start]
*/

#include "../NotificationManager.h"
#include "../SessionRegistry.h"
#include "../TidalController.h"
#include "../TidalSettings.h"

#include <KLocalizedString>

#include <QCommandLineParser>
#include <QCoreApplication>
#include <QDebug>
#include <QSocketNotifier>
#include <QStringList>
#include <QTimer>

#include <cerrno>
#include <cstring>
#include <unistd.h>

using namespace TidalRelay;

namespace
{

/**
 * Reads stdin line by line from the event loop
 */
class StdinRelay : public QObject
{
public:
    StdinRelay(TidalController *controller, QObject *parent = nullptr)
        : QObject(parent)
        , m_controller(controller)
        , m_notifier(new QSocketNotifier(STDIN_FILENO, QSocketNotifier::Read, this))
    {
        connect(m_notifier, &QSocketNotifier::activated, this, [this]() {
            readInput();
        });
    }

private:
    void readInput()
    {
        char chunk[4096];
        const ssize_t count = ::read(STDIN_FILENO, chunk, sizeof(chunk));
        if (count < 0) {
            if (errno == EINTR || errno == EAGAIN) {
                return;
            }
            qWarning() << "tidalrelay: cannot read stdin:" << strerror(errno);
        }
        if (count <= 0) {
            // EOF; a trailing unterminated line and the pending fragment go last
            if (!m_buffer.isEmpty()) {
                handleLine(QString::fromUtf8(m_buffer));
                m_buffer.clear();
            }
            flush();
            quit();
            return;
        }

        m_buffer.append(chunk, count);
        qsizetype newline;
        while (m_notifier->isEnabled() && (newline = m_buffer.indexOf('\n')) >= 0) {
            const QString line = QString::fromUtf8(m_buffer.left(newline));
            m_buffer.remove(0, newline + 1);
            handleLine(line);
        }
    }

    void handleLine(const QString &line)
    {
        const QString command = line.trimmed();

        if (command == QStringLiteral(":quit")) {
            flush();
            quit();
        } else if (command == QStringLiteral(":toggle")) {
            flush();
            m_controller->toggleSession();
        } else if (command == QStringLiteral(":hush")) {
            flush();
            m_controller->hush();
        } else if (command.isEmpty()) {
            flush();
        } else {
            m_pending.append(line);
        }
    }

    void flush()
    {
        if (m_pending.isEmpty()) {
            return;
        }
        m_controller->sendText(m_pending.join(QLatin1Char('\n')));
        m_pending.clear();
    }

    void quit()
    {
        m_notifier->setEnabled(false);
        m_controller->registry()->shutdown();
        QCoreApplication::quit();
    }

    TidalController *m_controller = nullptr;
    QSocketNotifier *m_notifier = nullptr;
    QByteArray m_buffer;
    QStringList m_pending;
};

}

int main(int argc, char *argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("tidalrelay"));
    app.setApplicationVersion(QStringLiteral("0.1.0"));
    KLocalizedString::setApplicationDomain("tidalrelay");

    QCommandLineParser parser;
    parser.setApplicationDescription(i18n("Relay text fragments to a TidalCycles interpreter"));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption interpreterOption(QStringList() << QStringLiteral("i") << QStringLiteral("interpreter"),
                                         i18n("Interpreter executable (default: ghci)"),
                                         QStringLiteral("path"));
    parser.addOption(interpreterOption);

    QCommandLineOption bootOption(QStringList() << QStringLiteral("b") << QStringLiteral("boot-script"),
                                  i18n("Bootstrap script replayed on start (default: BootTidal.hs)"),
                                  QStringLiteral("path"));
    parser.addOption(bootOption);

    QCommandLineOption configOption(QStringList() << QStringLiteral("c") << QStringLiteral("config"),
                                    i18n("Configuration file name (default: tidalrelayrc)"),
                                    QStringLiteral("name"),
                                    QString::fromLatin1(TidalSettings::DEFAULT_CONFIG_NAME));
    parser.addOption(configOption);

    QCommandLineOption noStartOption(QStringLiteral("no-start"), i18n("Do not start the interpreter until :toggle"));
    parser.addOption(noStartOption);

    parser.process(app);

    TidalSettings settings(parser.value(configOption));

    SessionConfig config = settings.sessionConfig();
    if (parser.isSet(interpreterOption)) {
        config.interpreterPath = parser.value(interpreterOption);
    }
    if (parser.isSet(bootOption)) {
        config.bootScriptPath = parser.value(bootOption);
    }

    NotificationManager notifications;
    notifications.setPromptToken(settings.promptToken());
    // Everything is printed; popups only when the user asked for them
    notifications.setEnabledChannels(NotificationManager::Channel::Log);
    notifications.enableChannel(NotificationManager::Channel::Desktop, settings.desktopNotifications());

    SessionRegistry registry(config);
    TidalController controller(&registry, &notifications);
    StdinRelay relay(&controller);

    if (!parser.isSet(noStartOption)) {
        QTimer::singleShot(0, &controller, [&controller]() {
            controller.toggleSession();
        });
    }

    return app.exec();
}
