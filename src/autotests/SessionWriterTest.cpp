/*
    SPDX-FileCopyrightText: 2025 Struktured Labs

    SPDX-License-Identifier: GPL-2.0-or-later
*/

// Own
#include "SessionWriterTest.h"

// Qt
#include <QBuffer>
#include <QProcess>
#include <QSignalSpy>
#include <QTest>

// TidalRelay
#include "../tidal/SessionWriter.h"

using namespace TidalRelay;

void SessionWriterTest::testNormalizeWithoutNewline()
{
    const QString line = QStringLiteral("d1 $ sound \"bd*2\"");
    QCOMPARE(SessionWriter::normalize(line), line);
}

void SessionWriterTest::testNormalizeSingleNewline()
{
    QCOMPARE(SessionWriter::normalize(QStringLiteral("a\nb")), QStringLiteral("a\rb"));
}

void SessionWriterTest::testNormalizeBlankLine()
{
    // A blank line inside a fragment stays a real line break
    QCOMPARE(SessionWriter::normalize(QStringLiteral("a\n\nb")), QStringLiteral("a\nb"));
}

void SessionWriterTest::testSendAppendsTerminator()
{
    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::WriteOnly));

    SessionWriter writer(&buffer);
    QVERIFY(writer.send(QStringLiteral("hush")));

    QCOMPARE(buffer.data(), QByteArray("hush\n"));
    QCOMPARE(writer.sentCount(), 1);
}

void SessionWriterTest::testSendMultiLineFragment()
{
    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::WriteOnly));

    SessionWriter writer(&buffer);
    QVERIFY(writer.send(QStringLiteral("d1 $ sound \"bd\"\n  # speed 2")));

    const QByteArray written = buffer.data();
    QCOMPARE(written, QByteArray("d1 $ sound \"bd\"\r  # speed 2\n"));
    QCOMPARE(written.count('\n'), 1);
}

void SessionWriterTest::testSendsStaySeparate()
{
    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::WriteOnly));

    SessionWriter writer(&buffer);
    QVERIFY(writer.send(QStringLiteral("one")));
    QVERIFY(writer.send(QStringLiteral("two")));

    QCOMPARE(buffer.data(), QByteArray("one\ntwo\n"));
    QCOMPARE(writer.sentCount(), 2);
}

void SessionWriterTest::testSendEncodesUtf8()
{
    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::WriteOnly));

    SessionWriter writer(&buffer);
    QVERIFY(writer.send(QStringLiteral("café")));

    QCOMPARE(buffer.data(), QByteArray("caf\xc3\xa9\n"));
}

void SessionWriterTest::testSendToProcess()
{
    QProcess process;
    process.start(QStringLiteral("/bin/cat"), QStringList());
    QVERIFY(process.waitForStarted());

    SessionWriter writer(&process);
    QVERIFY(writer.send(QStringLiteral("ping")));

    QByteArray echoed;
    QVERIFY(QTest::qWaitFor(
        [&]() {
            process.waitForReadyRead(50);
            echoed += process.readAllStandardOutput();
            return echoed.endsWith('\n');
        },
        5000));
    QCOMPARE(echoed, QByteArray("ping\n"));

    writer.close();
    QVERIFY(process.waitForFinished(5000));
    QCOMPARE(process.exitCode(), 0);
}

void SessionWriterTest::testSendToUnopenedDeviceFails()
{
    QBuffer buffer;
    SessionWriter writer(&buffer);
    QSignalSpy spy(&writer, &SessionWriter::writeFailed);

    QVERIFY(!writer.send(QStringLiteral("hush")));
    QCOMPARE(spy.count(), 1);
    QCOMPARE(writer.sentCount(), 0);
    QVERIFY(buffer.data().isEmpty());
}

void SessionWriterTest::testSendAfterCloseFails()
{
    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::WriteOnly));

    SessionWriter writer(&buffer);
    QSignalSpy spy(&writer, &SessionWriter::writeFailed);

    writer.close();
    QVERIFY(!writer.send(QStringLiteral("hush")));
    QCOMPARE(spy.count(), 1);
    QVERIFY(!spy.at(0).at(0).toString().isEmpty());
}

void SessionWriterTest::testCloseIsIdempotent()
{
    QBuffer buffer;
    QVERIFY(buffer.open(QIODevice::WriteOnly));

    SessionWriter writer(&buffer);
    QVERIFY(!writer.isClosed());

    writer.close();
    QVERIFY(writer.isClosed());
    QVERIFY(!buffer.isOpen());

    writer.close();
    QVERIFY(writer.isClosed());
}

void SessionWriterTest::testWriteTimeout()
{
    QBuffer buffer;
    SessionWriter writer(&buffer);

    QCOMPARE(writer.writeTimeout(), SessionWriter::DEFAULT_WRITE_TIMEOUT_MS);
    writer.setWriteTimeout(250);
    QCOMPARE(writer.writeTimeout(), 250);
}

void SessionWriterTest::testSendToClosedPipeFails()
{
    // The child drops its end of the input pipe but keeps running
    QProcess process;
    process.start(QStringLiteral("/bin/sh"), {QStringLiteral("-c"), QStringLiteral("exec 0<&-; echo ready; exec sleep 5")});
    QVERIFY(process.waitForStarted());

    QByteArray output;
    QVERIFY(QTest::qWaitFor(
        [&]() {
            process.waitForReadyRead(50);
            output += process.readAllStandardOutput();
            return output.contains("ready");
        },
        5000));

    SessionWriter writer(&process);
    QSignalSpy spy(&writer, &SessionWriter::writeFailed);

    QVERIFY(!writer.send(QStringLiteral("d1 $ sound \"bd\"")));
    QCOMPARE(spy.count(), 1);
    QVERIFY(!writer.lastError().isEmpty());
    QCOMPARE(writer.sentCount(), 0);
    QCOMPARE(process.state(), QProcess::Running);

    process.kill();
    QVERIFY(process.waitForFinished(5000));
}

void SessionWriterTest::testSlowReaderDelaysDelivery()
{
    // sleep holds the input pipe open without ever reading it
    QProcess process;
    process.start(QStringLiteral("/bin/sh"), {QStringLiteral("-c"), QStringLiteral("exec sleep 5")});
    QVERIFY(process.waitForStarted());

    SessionWriter writer(&process);
    writer.setWriteTimeout(50);
    QSignalSpy spy(&writer, &SessionWriter::writeFailed);

    // Larger than any pipe buffer, so the flush cannot finish
    const QString line(1500000, QLatin1Char('x'));
    QVERIFY(writer.send(line));

    QCOMPARE(spy.count(), 0);
    QCOMPARE(writer.sentCount(), 1);
    QCOMPARE(writer.delayedCount(), 1);
    QVERIFY(process.bytesToWrite() > 0);

    process.kill();
    QVERIFY(process.waitForFinished(5000));
}

QTEST_GUILESS_MAIN(SessionWriterTest)

#include "moc_SessionWriterTest.cpp"
