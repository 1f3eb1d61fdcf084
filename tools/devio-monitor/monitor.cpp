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

#include "monitor.h"

#include <cmath>
#include <iostream>
#include <limits>
#include <QCoreApplication>
#include <QDebug>
#include <QMutex>
#include <QTimer>

#include "deviceio.h"
#include "serialdevice.h"

using namespace DevIO;

std::chrono::milliseconds monitorDurationToMsec(double durationSec)
{
    constexpr auto maxMsec = static_cast<double>(std::numeric_limits<int>::max());
    if (!std::isfinite(durationSec) || durationSec <= 0)
        return std::chrono::milliseconds(0);

    const auto msec = durationSec * 1000.0;
    if (msec >= maxMsec) {
        qWarning().noquote() << "Duration of" << durationSec << "seconds is too long, limiting it to"
                             << std::numeric_limits<int>::max() / 1000 << "seconds.";
        return std::chrono::milliseconds(std::numeric_limits<int>::max());
    }

    return std::chrono::milliseconds(std::llround(msec));
}

int runDeviceMonitor(const DevIOConfig &config, const QStringList &sendCommands, double durationSec)
{
    SerialDevice device(config.deviceName);
    if (!device.open(config.portName, config.baudRate)) {
        std::cerr << "Unable to open port '" << config.portName.toStdString() << "': " << device.lastError().toStdString()
                  << std::endl;
        return 1;
    }

    QMutex replyMutex;
    QByteArray lastReply;
    const auto query = config.daqQuery.toUtf8();

    DeviceIO dio(&device);
    auto daqFn = [&]() -> bool {
        QByteArray reply;
        if (!device.query(query, reply))
            return false;

        QMutexLocker locker(&replyMutex);
        lastReply = reply;
        return true;
    };

    if (!dio.createDaqWorker(config.daqWorkerOptions(daqFn))) {
        std::cerr << "Unable to create DAQ worker: " << dio.lastError().toStdString() << std::endl;
        return 1;
    }
    if (config.jobsEnabled || !sendCommands.isEmpty()) {
        if (!dio.createJobsWorker(nullptr, config.jobsDebug)) {
            std::cerr << "Unable to create jobs worker: " << dio.lastError().toStdString() << std::endl;
            return 1;
        }
    }

    int exitCode = 0;
    QObject::connect(&dio, &DeviceIO::daqUpdated, [&]() {
        QByteArray reply;
        {
            QMutexLocker locker(&replyMutex);
            reply = lastReply;
        }

        std::cout << dio.updateCounterDaq() << ";" << dio.obtainedDaqRateHz() << ";" << reply.toStdString()
                  << std::endl;
    });
    QObject::connect(&dio, &DeviceIO::connectionLost, [&]() {
        std::cerr << "Lost connection to " << device.name().toStdString() << "." << std::endl;
        exitCode = 2;
        QCoreApplication::quit();
    });

    if (!dio.start(config.daqPriority, config.jobsPriority)) {
        std::cerr << "Unable to start workers: " << dio.lastError().toStdString() << std::endl;
        return 1;
    }

    for (const auto &cmd : sendCommands) {
        const auto data = cmd.toUtf8();
        dio.send([&device, data]() {
            if (!device.write(data))
                qCWarning(logSerialDevice).noquote() << "Sending" << data << "failed:" << device.lastError();
        });
    }

    QTimer wakeUpTimer;
    if (config.daqTrigger == DaqTrigger::SINGLE_SHOT_WAKE_UP) {
        wakeUpTimer.setTimerType(config.daqTimerType);
        wakeUpTimer.setInterval(config.daqIntervalMs);
        QObject::connect(&wakeUpTimer, &QTimer::timeout, &dio, &DeviceIO::wakeUpDaq);
        wakeUpTimer.start();
    } else if (config.daqTrigger == DaqTrigger::CONTINUOUS) {
        dio.unpauseDaq();
    }

    const auto duration = monitorDurationToMsec(durationSec);
    if (duration.count() > 0)
        QTimer::singleShot(duration, QCoreApplication::instance(), &QCoreApplication::quit);

    QCoreApplication::exec();

    wakeUpTimer.stop();
    dio.quit();
    device.close();

    return exitCode;
}
