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

#include <QFile>
#include <QTemporaryDir>
#include <QtTest>

#include "workerconfig.h"

using namespace DevIO;

class TestConfig : public QObject
{
    Q_OBJECT
private slots:
    void defaults()
    {
        DevIOConfig config;
        QString error;
        QVERIFY(loadConfigData(QByteArray(), config, error));
        QVERIFY(error.isEmpty());

        QCOMPARE(config.baudRate, 115200);
        QCOMPARE(config.daqTrigger, DaqTrigger::INTERNAL_TIMER);
        QCOMPARE(config.daqIntervalMs, 100);
        QCOMPARE(config.daqTimerType, Qt::PreciseTimer);
        QCOMPARE(config.criticalNotAliveCount, 1);
        QCOMPARE(config.daqPriority, QThread::InheritPriority);
        QCOMPARE(config.daqQuery, QStringLiteral("?"));
        QVERIFY(!config.daqDebug);
        QVERIFY(config.jobsEnabled);
        QCOMPARE(config.jobsPriority, QThread::InheritPriority);
    }

    void fullConfig()
    {
        const auto data = QByteArrayLiteral(
            "[device]\n"
            "name = \"Arduino\"\n"
            "port = \"/dev/ttyACM0\"\n"
            "baud_rate = 9600\n"
            "\n"
            "[daq]\n"
            "trigger = \"single-shot-wake-up\"\n"
            "interval_ms = 20\n"
            "timer_type = \"coarse\"\n"
            "critical_not_alive_count = 0\n"
            "priority = \"time-critical\"\n"
            "query = \"read\"\n"
            "debug = true\n"
            "\n"
            "[jobs]\n"
            "enabled = false\n"
            "priority = \"low\"\n"
            "debug = true\n");

        DevIOConfig config;
        QString error;
        QVERIFY2(loadConfigData(data, config, error), qPrintable(error));

        QCOMPARE(config.deviceName, QStringLiteral("Arduino"));
        QCOMPARE(config.portName, QStringLiteral("/dev/ttyACM0"));
        QCOMPARE(config.baudRate, 9600);
        QCOMPARE(config.daqTrigger, DaqTrigger::SINGLE_SHOT_WAKE_UP);
        QCOMPARE(config.daqIntervalMs, 20);
        QCOMPARE(config.daqTimerType, Qt::CoarseTimer);
        QCOMPARE(config.criticalNotAliveCount, 0);
        QCOMPARE(config.daqPriority, QThread::TimeCriticalPriority);
        QCOMPARE(config.daqQuery, QStringLiteral("read"));
        QVERIFY(config.daqDebug);
        QVERIFY(!config.jobsEnabled);
        QCOMPARE(config.jobsPriority, QThread::LowPriority);
        QVERIFY(config.jobsDebug);

        const auto options = config.daqWorkerOptions();
        QCOMPARE(options.trigger, DaqTrigger::SINGLE_SHOT_WAKE_UP);
        QCOMPARE(options.intervalMs, 20);
        QCOMPARE(options.timerType, Qt::CoarseTimer);
        QCOMPARE(options.criticalNotAliveCount, 0);
        QVERIFY(options.debug);
        QVERIFY(!options.daqFunction);
    }

    void invalidValues_data()
    {
        QTest::addColumn<QByteArray>("data");

        QTest::newRow("syntax") << QByteArrayLiteral("[daq\ninterval_ms = 10\n");
        QTest::newRow("negative-interval") << QByteArrayLiteral("[daq]\ninterval_ms = -10\n");
        QTest::newRow("negative-count") << QByteArrayLiteral("[daq]\ncritical_not_alive_count = -1\n");
        QTest::newRow("unknown-trigger") << QByteArrayLiteral("[daq]\ntrigger = \"sometimes\"\n");
        QTest::newRow("unknown-timer") << QByteArrayLiteral("[daq]\ntimer_type = \"sloppy\"\n");
        QTest::newRow("unknown-priority") << QByteArrayLiteral("[jobs]\npriority = \"urgent\"\n");
        QTest::newRow("wrong-type") << QByteArrayLiteral("[daq]\ninterval_ms = \"fast\"\n");
        QTest::newRow("float-interval") << QByteArrayLiteral("[daq]\ninterval_ms = 1.5\n");
        QTest::newRow("not-a-table") << QByteArrayLiteral("daq = 5\n");
        QTest::newRow("zero-baud-rate") << QByteArrayLiteral("[device]\nbaud_rate = 0\n");
        QTest::newRow("negative-baud-rate") << QByteArrayLiteral("[device]\nbaud_rate = -9600\n");
    }

    void invalidValues()
    {
        QFETCH(QByteArray, data);

        DevIOConfig config;
        config.daqIntervalMs = 42;
        QString error;
        QVERIFY(!loadConfigData(data, config, error));
        QVERIFY(!error.isEmpty());

        // a failed load leaves the configuration untouched
        QCOMPARE(config.daqIntervalMs, 42);
    }

    void serialize()
    {
        DevIOConfig config;
        config.deviceName = QStringLiteral("Scale");
        config.portName = QStringLiteral("/dev/ttyUSB1");
        config.baudRate = 57600;
        config.daqTrigger = DaqTrigger::CONTINUOUS;
        config.daqIntervalMs = 5;
        config.daqTimerType = Qt::VeryCoarseTimer;
        config.criticalNotAliveCount = 4;
        config.daqPriority = QThread::HighestPriority;
        config.daqQuery = QStringLiteral("w");
        config.jobsEnabled = false;
        config.jobsPriority = QThread::IdlePriority;

        const auto data = serializeConfig(config);
        QVERIFY(data.contains("[daq]"));
        QVERIFY(data.contains("trigger = 'continuous'") || data.contains("trigger = \"continuous\""));

        QTemporaryDir tmpDir;
        QVERIFY(tmpDir.isValid());
        const auto fname = tmpDir.filePath(QStringLiteral("devio.toml"));
        QFile file(fname);
        QVERIFY(file.open(QIODevice::WriteOnly));
        file.write(data);
        file.close();

        DevIOConfig loaded;
        QString error;
        QVERIFY2(loadConfigFile(fname, loaded, error), qPrintable(error));
        QCOMPARE(loaded.deviceName, config.deviceName);
        QCOMPARE(loaded.portName, config.portName);
        QCOMPARE(loaded.baudRate, config.baudRate);
        QCOMPARE(loaded.daqTrigger, config.daqTrigger);
        QCOMPARE(loaded.daqIntervalMs, config.daqIntervalMs);
        QCOMPARE(loaded.daqTimerType, config.daqTimerType);
        QCOMPARE(loaded.criticalNotAliveCount, config.criticalNotAliveCount);
        QCOMPARE(loaded.daqPriority, config.daqPriority);
        QCOMPARE(loaded.daqQuery, config.daqQuery);
        QCOMPARE(loaded.jobsEnabled, config.jobsEnabled);
        QCOMPARE(loaded.jobsPriority, config.jobsPriority);
    }

    void missingFile()
    {
        DevIOConfig config;
        QString error;
        QVERIFY(!loadConfigFile(QStringLiteral("/nonexistent/devio.toml"), config, error));
        QVERIFY(error.contains(QStringLiteral("does not exist")));
    }
};

QTEST_MAIN(TestConfig)
#include "test-config.moc"
