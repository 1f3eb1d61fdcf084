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

#include <cmath>
#include <QSignalSpy>
#include <QThread>
#include <QTimer>
#include <QtTest>

#include "deviceio.h"
#include "fakedevice.h"

using namespace DevIO;

/**
 * Device I/O with all workers set up already, so users only need to call start().
 */
class FakeDeviceIO : public DeviceIO
{
    Q_OBJECT
public:
    explicit FakeDeviceIO(FakeDevice *dev, QObject *parent = nullptr)
        : DeviceIO(dev, parent),
          m_fakeDev(dev)
    {
        const bool ok = createDaqWorker({
                            .trigger = DaqTrigger::INTERNAL_TIMER,
                            .daqFunction = [this]() { return m_fakeDev->fakeQuery1().endsWith(QStringLiteral("0101")); },
                            .intervalMs = 100,
                            .criticalNotAliveCount = 10,
                            .debug = true,
                        })
                        && createJobsWorker(nullptr, true);
        if (!ok)
            qWarning().noquote() << "Unable to set up workers:" << lastError();
    }

private:
    FakeDevice *m_fakeDev;
};

class TestDeviceIO : public QObject
{
    Q_OBJECT
private slots:
    void initTestCase()
    {
        QThread::currentThread()->setObjectName(QStringLiteral("MAIN"));
    }

    void deviceName()
    {
        FakeDevice dev;
        QCOMPARE(dev.name(), QStringLiteral("FakeDev"));
        dev.setName(QString());
        QCOMPARE(dev.name(), QStringLiteral("myDevice"));
    }

    void attachDeviceTwice()
    {
        FakeDevice dev1;
        FakeDevice dev2;
        DeviceIO dio(&dev1);

        QVERIFY(!dio.attachDevice(&dev2));
        QVERIFY(!dio.lastError().isEmpty());
        QCOMPARE(dio.device(), &dev1);
    }

    void attachDeviceLater()
    {
        FakeDevice dev;
        DeviceIO dio;

        QVERIFY(!dio.attachDevice(nullptr));
        QVERIFY(dio.attachDevice(&dev));
        QCOMPARE(dio.device(), &dev);
        QVERIFY(dio.createDaqWorker());
    }

    void daqNoDeviceAttached()
    {
        DeviceIO dio;
        QVERIFY(!dio.createDaqWorker());
        QVERIFY(!dio.lastError().isEmpty());
        QVERIFY(dio.daqWorker() == nullptr);
    }

    void jobsNoDeviceAttached()
    {
        DeviceIO dio;
        QVERIFY(!dio.createJobsWorker());
        QVERIFY(!dio.lastError().isEmpty());
        QVERIFY(dio.jobsWorker() == nullptr);
    }

    void daqStartWithoutCreate()
    {
        FakeDevice dev;
        DeviceIO dio(&dev);
        QVERIFY(!dio.startDaqWorker());
        QVERIFY(dio.lastError().contains(QStringLiteral("createDaqWorker")));
    }

    void jobsStartWithoutCreate()
    {
        FakeDevice dev;
        DeviceIO dio(&dev);
        QVERIFY(!dio.startJobsWorker());
        QVERIFY(dio.lastError().contains(QStringLiteral("createJobsWorker")));
    }

    void startTwice()
    {
        FakeDevice dev;
        DeviceIO dio(&dev);
        QVERIFY(dio.createJobsWorker());
        QVERIFY(dio.startJobsWorker());
        QVERIFY(!dio.startJobsWorker());
        QVERIFY(dio.quit());
    }

    void invalidDaqOptions()
    {
        FakeDevice dev;
        DeviceIO dio(&dev);
        QVERIFY(!dio.createDaqWorker({.intervalMs = -1}));
        QVERIFY(!dio.createDaqWorker({.criticalNotAliveCount = -5}));
        QVERIFY(dio.createDaqWorker({.intervalMs = 0}));
    }

    void daqQuitWithoutStart()
    {
        FakeDevice dev;
        DeviceIO dio(&dev);
        QVERIFY(dio.createDaqWorker());
        QVERIFY(dio.quit());
    }

    void jobsQuitWithoutStart()
    {
        FakeDevice dev;
        DeviceIO dio(&dev);
        QVERIFY(dio.createJobsWorker());
        QVERIFY(dio.quit());
    }

    void countersWithoutWorkers()
    {
        DeviceIO dio;
        QCOMPARE(dio.updateCounterDaq(), 0);
        QCOMPARE(dio.updateCounterJobs(), 0);
        QCOMPARE(dio.notAliveCounterDaq(), 0);
        QVERIFY(std::isnan(dio.obtainedDaqIntervalMs()));
        QVERIFY(std::isnan(dio.obtainedDaqRateHz()));

        // requests without workers are no-ops
        dio.wakeUpDaq();
        dio.pauseDaq();
        dio.unpauseDaq();
        dio.send(QStringLiteral("nothing"));
        dio.processJobsQueue();
        QVERIFY(dio.quit());
    }

    void threadNames()
    {
        FakeDevice dev;
        DeviceIO dio(&dev);
        QVERIFY(dio.createDaqWorker());
        QVERIFY(dio.createJobsWorker());
        QCOMPARE(dio.daqWorker()->thread()->objectName(), QStringLiteral("FakeDev_DAQ"));
        QCOMPARE(dio.jobsWorker()->thread()->objectName(), QStringLiteral("FakeDev_jobs"));
    }

    void recreateAfterQuit()
    {
        FakeDevice dev;
        DeviceIO dio(&dev);

        QVERIFY(dio.createDaqWorker({.intervalMs = 20}));
        QVERIFY(dio.start());
        QTRY_VERIFY_WITH_TIMEOUT(dio.updateCounterDaq() >= 2, 2000);

        // a running worker can not be replaced
        QVERIFY(!dio.createDaqWorker());
        QVERIFY(dio.quit());

        QVERIFY(dio.createDaqWorker({.intervalMs = 20}));
        QCOMPARE(dio.updateCounterDaq(), 0);
        QVERIFY(dio.start());
        QTRY_VERIFY_WITH_TIMEOUT(dio.updateCounterDaq() >= 2, 2000);
        QVERIFY(dio.quit());
    }

    void subclassed()
    {
        FakeDevice dev;
        FakeDeviceIO dio(&dev);
        QSignalSpy daqSpy(&dio, &DeviceIO::daqUpdated);
        QSignalSpy jobsSpy(&dio, &DeviceIO::jobsUpdated);
        QVERIFY(dio.start());

        QTimer::singleShot(300, &dio, [&]() { dio.send([&]() { dev.fakeQuery2(); }); });
        QTimer::singleShot(600, &dio, [&]() { dio.send([&]() { dev.fakeCommandWithArgument(0); }); });
        QTest::qWait(1000);

        QTRY_COMPARE(jobsSpy.count(), 2);
        QVERIFY(dio.quit());

        QVERIFY(dev.countCommands() >= 9);
        QVERIFY(dev.countReplies() >= 8);
        // the last signal is not always received before the thread quits
        QVERIFY(daqSpy.count() >= 7);
    }
};

QTEST_MAIN(TestDeviceIO)
#include "test-deviceio.moc"
