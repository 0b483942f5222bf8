/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "NotificationManagerTest.h"

// Qt
#include <QSignalSpy>
#include <QStandardPaths>
#include <QTest>

// TidalRelay
#include "../tidal/NotificationManager.h"
#include "../tidal/SessionFault.h"

using namespace TidalRelay;

void NotificationManagerTest::initTestCase()
{
    QStandardPaths::setTestModeEnabled(true);
}

void NotificationManagerTest::init()
{
    // No desktop popups from the test run
    m_manager = new NotificationManager(this);
    m_manager->setEnabledChannels(NotificationManager::Channel::InApp);
}

void NotificationManagerTest::cleanup()
{
    delete m_manager;
    m_manager = nullptr;
}

void NotificationManagerTest::testCleanMessageStripsPrompt()
{
    QCOMPARE(NotificationManager::cleanMessage(QStringLiteral("Prelude> hello\n"), QStringLiteral("Prelude>")), QStringLiteral("hello"));
}

void NotificationManagerTest::testCleanMessageRepeatedPrompt()
{
    QCOMPARE(NotificationManager::cleanMessage(QStringLiteral("Prelude> Prelude> "), QStringLiteral("Prelude>")), QString());
    QCOMPARE(NotificationManager::cleanMessage(QStringLiteral("Prelude> a\nPrelude> b"), QStringLiteral("Prelude>")), QStringLiteral("a\n b"));
}

void NotificationManagerTest::testCleanMessageCustomToken()
{
    QCOMPARE(NotificationManager::cleanMessage(QStringLiteral("tidal> cps 1"), QStringLiteral("tidal>")), QStringLiteral("cps 1"));
    QCOMPARE(NotificationManager::cleanMessage(QStringLiteral("Prelude> x"), QStringLiteral("tidal>")), QStringLiteral("Prelude> x"));
}

void NotificationManagerTest::testCleanMessageEmptyToken()
{
    QCOMPARE(NotificationManager::cleanMessage(QStringLiteral("  text  "), QString()), QStringLiteral("text"));
}

void NotificationManagerTest::testInfoEmitsSignal()
{
    QSignalSpy spy(m_manager, &NotificationManager::notificationShown);

    QVERIFY(m_manager->info(QStringLiteral("Prelude> Started tidal")));

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<NotificationManager::NotificationType>(), NotificationManager::NotificationType::Info);
    QCOMPARE(spy.at(0).at(1).toString(), m_manager->title());
    QCOMPARE(spy.at(0).at(2).toString(), QStringLiteral("Started tidal"));
    QCOMPARE(m_manager->shownCount(), 1);
}

void NotificationManagerTest::testWarningEmitsSignal()
{
    QSignalSpy spy(m_manager, &NotificationManager::notificationShown);

    QVERIFY(m_manager->warning(QStringLiteral("<interactive>:1:1: error: Variable not in scope: d9\n")));

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<NotificationManager::NotificationType>(), NotificationManager::NotificationType::Warning);
    QCOMPARE(spy.at(0).at(2).toString(), QStringLiteral("<interactive>:1:1: error: Variable not in scope: d9"));
}

void NotificationManagerTest::testErrorFromFault()
{
    QSignalSpy spy(m_manager, &NotificationManager::notificationShown);

    const SessionFault fault(SessionFault::Kind::WriteFailure, QStringLiteral("broken pipe"));
    QVERIFY(m_manager->error(fault));

    QCOMPARE(spy.count(), 1);
    QCOMPARE(spy.at(0).at(0).value<NotificationManager::NotificationType>(), NotificationManager::NotificationType::Error);
    QCOMPARE(spy.at(0).at(2).toString(), fault.toString());
    QVERIFY(spy.at(0).at(2).toString().contains(QStringLiteral("broken pipe")));
}

void NotificationManagerTest::testEmptyMessageSuppressed()
{
    QSignalSpy spy(m_manager, &NotificationManager::notificationShown);

    QVERIFY(!m_manager->info(QString()));
    QVERIFY(!m_manager->warning(QStringLiteral(" \n\t ")));

    QCOMPARE(spy.count(), 0);
    QCOMPARE(m_manager->shownCount(), 0);
}

void NotificationManagerTest::testPromptOnlyMessageSuppressed()
{
    QSignalSpy spy(m_manager, &NotificationManager::notificationShown);

    QVERIFY(!m_manager->info(QStringLiteral("Prelude> ")));
    QCOMPARE(spy.count(), 0);
}

void NotificationManagerTest::testInAppChannelDisabled()
{
    QSignalSpy spy(m_manager, &NotificationManager::notificationShown);

    m_manager->setEnabledChannels(NotificationManager::Channel::Log);
    QVERIFY(m_manager->info(QStringLiteral("logged only")));

    QCOMPARE(spy.count(), 0);
    QCOMPARE(m_manager->shownCount(), 1);
}

void NotificationManagerTest::testCustomTitle()
{
    QSignalSpy spy(m_manager, &NotificationManager::notificationShown);

    m_manager->setTitle(QStringLiteral("Strudel"));
    QVERIFY(m_manager->info(QStringLiteral("ok")));
    QCOMPARE(spy.at(0).at(1).toString(), QStringLiteral("Strudel"));
}

void NotificationManagerTest::testDefaultChannels()
{
    NotificationManager manager;

    // Default should be all channels enabled
    NotificationManager::Channels channels = manager.enabledChannels();
    QVERIFY(channels.testFlag(NotificationManager::Channel::Desktop));
    QVERIFY(channels.testFlag(NotificationManager::Channel::InApp));
    QVERIFY(channels.testFlag(NotificationManager::Channel::Log));
    QCOMPARE(manager.promptToken(), QStringLiteral("Prelude>"));
}

void NotificationManagerTest::testEnableChannel()
{
    m_manager->setEnabledChannels(NotificationManager::Channel::None);
    m_manager->enableChannel(NotificationManager::Channel::Log, true);

    QVERIFY(m_manager->isChannelEnabled(NotificationManager::Channel::Log));
    QVERIFY(!m_manager->isChannelEnabled(NotificationManager::Channel::Desktop));
    QVERIFY(!m_manager->isChannelEnabled(NotificationManager::Channel::InApp));
}

void NotificationManagerTest::testDisableChannel()
{
    m_manager->setEnabledChannels(NotificationManager::Channel::All);
    m_manager->enableChannel(NotificationManager::Channel::Desktop, false);

    QVERIFY(!m_manager->isChannelEnabled(NotificationManager::Channel::Desktop));
    QVERIFY(m_manager->isChannelEnabled(NotificationManager::Channel::InApp));
    QVERIFY(m_manager->isChannelEnabled(NotificationManager::Channel::Log));
}

void NotificationManagerTest::testChannelFlags()
{
    NotificationManager::Channels combo = NotificationManager::Channel::Desktop | NotificationManager::Channel::Log;

    QVERIFY(combo.testFlag(NotificationManager::Channel::Desktop));
    QVERIFY(!combo.testFlag(NotificationManager::Channel::InApp));
    QVERIFY(combo.testFlag(NotificationManager::Channel::Log));
}

void NotificationManagerTest::testIconName()
{
    QCOMPARE(NotificationManager::iconName(NotificationManager::NotificationType::Info), QStringLiteral("dialog-information"));
    QCOMPARE(NotificationManager::iconName(NotificationManager::NotificationType::Warning), QStringLiteral("dialog-warning"));
    QCOMPARE(NotificationManager::iconName(NotificationManager::NotificationType::Error), QStringLiteral("dialog-error"));
}

void NotificationManagerTest::testEventName()
{
    // Must match the events in tidalrelay.notifyrc
    QCOMPARE(NotificationManager::eventName(NotificationManager::NotificationType::Info), QStringLiteral("info"));
    QCOMPARE(NotificationManager::eventName(NotificationManager::NotificationType::Warning), QStringLiteral("warning"));
    QCOMPARE(NotificationManager::eventName(NotificationManager::NotificationType::Error), QStringLiteral("error"));
}

QTEST_GUILESS_MAIN(NotificationManagerTest)

#include "moc_NotificationManagerTest.cpp"
