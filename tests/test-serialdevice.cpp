/*
 * Copyright (C) 2024 Matthias Klumpp <matthias@tenstral.net>
 *
 * Licensed under the GNU Lesser General Public License Version 3
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU Lesser General Public License as published by
 * the Free Software Foundation, either version 3 of the license, or
 * (at your option) any later version.
 *
 * This software is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU Lesser General Public License for more details.
 *
 * You should have received a copy of the GNU Lesser General Public License
 * along with this software.  If not, see <http://www.gnu.org/licenses/>.
 */

#include <stdexcept>
#include <QSignalSpy>
#include <QtTest>

#include "deviceio.h"
#include "ptyecho.h"
#include "serialdevice.h"

using namespace DevIO;

static QByteArray replyToQuery(const QByteArray &command)
{
    if (command == "?")
        return QByteArrayLiteral("-> reply 0101\n");
    if (command == "mute")
        return QByteArrayLiteral("no line terminator");
    if (command == "flood")
        return QByteArray(5000, 'x');
    return QByteArray();
}

class TestSerialDevice : public QObject
{
    Q_OBJECT
private slots:
    void notOpen()
    {
        SerialDevice dev(QStringLiteral("Arduino"));
        QCOMPARE(dev.name(), QStringLiteral("Arduino"));
        QVERIFY(!dev.isOpen());
        QVERIFY(!dev.isAlive());
        QVERIFY(dev.portName().isEmpty());
        QCOMPARE(dev.timeoutMsec(), 4000);

        QByteArray reply;
        QVERIFY(!dev.write("id?"));
        QVERIFY(!dev.lastError().isEmpty());
        QVERIFY(!dev.query("id?", reply));
        QVERIFY(reply.isEmpty());
        QVERIFY(!dev.readLine(reply));

        // closing a device that was never opened is fine
        dev.close();
    }

    void openMissingPort()
    {
        SerialDevice dev;
        QVERIFY(!dev.open(QStringLiteral("/dev/devio-no-such-port")));
        QVERIFY(!dev.isOpen());
        QVERIFY(!dev.isAlive());
        QVERIFY(dev.lastError().contains(QStringLiteral("devio-no-such-port")));
    }

    void invalidBaudRate()
    {
        PtyEcho pty(replyToQuery);
        QVERIFY(pty.isValid());

        SerialDevice dev;
        QVERIFY(!dev.open(pty.slavePath(), 0));
        QVERIFY(!dev.isAlive());
        QVERIFY(dev.lastError().contains(QStringLiteral("baud rate")));
    }

    void openWriteQuery()
    {
        PtyEcho pty(replyToQuery);
        QVERIFY(pty.isValid());

        SerialDevice dev(QStringLiteral("Arduino"));
        QVERIFY2(dev.open(pty.slavePath()), qPrintable(dev.lastError()));
        QVERIFY(dev.isOpen());
        QVERIFY(dev.isAlive());
        QCOMPARE(dev.portName(), pty.slavePath());

        QVERIFY(dev.write("LED on"));
        QTRY_COMPARE(pty.countCommands("LED on"), 1);

        QByteArray reply;
        QVERIFY2(dev.query("?", reply), qPrintable(dev.lastError()));
        QCOMPARE(reply, QByteArrayLiteral("-> reply 0101"));
        QCOMPARE(pty.countCommands("?"), 1);

        dev.close();
        QVERIFY(!dev.isOpen());
        QVERIFY(!dev.write("LED off"));
    }

    void replyTimeout()
    {
        PtyEcho pty(replyToQuery);
        QVERIFY(pty.isValid());

        SerialDevice dev;
        QVERIFY2(dev.open(pty.slavePath()), qPrintable(dev.lastError()));
        dev.setTimeoutMsec(300);

        // the reply never gets terminated by a newline
        QByteArray reply;
        QVERIFY(!dev.query("mute", reply));
        QVERIFY(dev.lastError().startsWith(QStringLiteral("Timed out while waiting")));
        QVERIFY(reply.isEmpty());
    }

    void overlongReply()
    {
        PtyEcho pty(replyToQuery);
        QVERIFY(pty.isValid());

        SerialDevice dev;
        QVERIFY2(dev.open(pty.slavePath()), qPrintable(dev.lastError()));
        dev.setTimeoutMsec(1000);

        QByteArray reply;
        QVERIFY(!dev.query("flood", reply));
        QVERIFY(dev.lastError().contains(QStringLiteral("overlong")));
    }

    void sharedByWorkers()
    {
        PtyEcho pty(replyToQuery);
        QVERIFY(pty.isValid());

        SerialDevice dev(QStringLiteral("Arduino"));
        QVERIFY2(dev.open(pty.slavePath()), qPrintable(dev.lastError()));
        dev.setTimeoutMsec(1000);

        DeviceIO dio(&dev);
        QVERIFY(dio.createDaqWorker({
            .trigger = DaqTrigger::INTERNAL_TIMER,
            .daqFunction =
                [&]() {
                    QByteArray reply;
                    return dev.query("?", reply) && reply == QByteArrayLiteral("-> reply 0101");
                },
            .intervalMs = 20,
            .criticalNotAliveCount = 1,
        }));
        QVERIFY(dio.createJobsWorker());
        QSignalSpy lostSpy(&dio, &DeviceIO::connectionLost);
        QVERIFY(dio.start());

        // the port alternates between the DAQ and the jobs thread
        for (int i = 0; i < 3; ++i) {
            dio.send([&dev]() {
                if (!dev.write("LED on"))
                    throw std::runtime_error(dev.lastError().toStdString());
            });
            QTest::qWait(50);
        }

        QTRY_VERIFY_WITH_TIMEOUT(dio.updateCounterDaq() >= 10, 5000);
        QTRY_COMPARE_WITH_TIMEOUT(pty.countCommands("LED on"), 3, 5000);
        QVERIFY(dio.quit());

        QCOMPARE(lostSpy.count(), 0);
        QCOMPARE(dio.notAliveCounterDaq(), 0);
        QVERIFY(dev.isAlive());

        // and it can be used from the main thread again afterwards
        QByteArray reply;
        QVERIFY2(dev.query("?", reply), qPrintable(dev.lastError()));
        QCOMPARE(reply, QByteArrayLiteral("-> reply 0101"));
        dev.close();
    }

    void workersRefuseDeadDevice()
    {
        SerialDevice dev;
        DeviceIO dio(&dev);
        QVERIFY(dio.createDaqWorker());
        QVERIFY(dio.createJobsWorker());

        // a serial device that was never opened is not alive
        QVERIFY(!dio.start());
        QVERIFY(dio.quit());
    }
};

QTEST_MAIN(TestSerialDevice)
#include "test-serialdevice.moc"
