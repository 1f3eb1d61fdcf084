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

#include "config.h"

#include <cmath>
#include <QCoreApplication>
#include <QCommandLineParser>
#include <iostream>

#include "monitor.h"
#include "workerconfig.h"

using namespace DevIO;

int main(int argc, char *argv[])
{
    QCoreApplication a(argc, argv);
    QCoreApplication::setApplicationName("devio-monitor");
    QCoreApplication::setApplicationVersion(PROJECT_VERSION);

    QCommandLineParser parser;
    parser.setApplicationDescription(
        QStringLiteral("DevIO Monitor\n\nQuery a line-based serial device and display its replies."));
    parser.addHelpOption();
    parser.addVersionOption();

    QCommandLineOption configOption(
        QStringLiteral("config"), QStringLiteral("Load the device configuration from a TOML file"), QStringLiteral("file"));
    parser.addOption(configOption);
    QCommandLineOption portOption(QStringLiteral("port"), QStringLiteral("Serial port of the device"), QStringLiteral("port"));
    parser.addOption(portOption);
    QCommandLineOption baudOption(QStringLiteral("baud"), QStringLiteral("Baud rate"), QStringLiteral("rate"));
    parser.addOption(baudOption);
    QCommandLineOption intervalOption(
        QStringLiteral("interval"), QStringLiteral("DAQ interval in milliseconds"), QStringLiteral("msec"));
    parser.addOption(intervalOption);
    QCommandLineOption triggerOption(
        QStringLiteral("trigger"),
        QStringLiteral("DAQ trigger mode (internal-timer, single-shot-wake-up or continuous)"),
        QStringLiteral("mode"));
    parser.addOption(triggerOption);
    QCommandLineOption queryOption(
        QStringLiteral("query"), QStringLiteral("Command to send for every DAQ update"), QStringLiteral("command"));
    parser.addOption(queryOption);
    QCommandLineOption sendOption(
        QStringLiteral("send"),
        QStringLiteral("Send a command through the jobs queue after start (can be repeated)"),
        QStringLiteral("command"));
    parser.addOption(sendOption);
    QCommandLineOption durationOption(
        QStringLiteral("duration"), QStringLiteral("Stop after this many seconds"), QStringLiteral("sec"));
    parser.addOption(durationOption);
    QCommandLineOption debugOption(QStringLiteral("debug"), QStringLiteral("Print worker debug messages"));
    parser.addOption(debugOption);

    parser.process(a);

    DevIOConfig config;
    if (parser.isSet(configOption)) {
        QString errorMessage;
        if (!loadConfigFile(parser.value(configOption), config, errorMessage)) {
            std::cerr << "Unable to load configuration: " << errorMessage.toStdString() << std::endl;
            return 1;
        }
    }

    if (parser.isSet(portOption))
        config.portName = parser.value(portOption);
    if (parser.isSet(baudOption)) {
        bool ok;
        config.baudRate = parser.value(baudOption).toInt(&ok);
        if (!ok || config.baudRate <= 0) {
            std::cerr << "Invalid baud rate: " << parser.value(baudOption).toStdString() << std::endl;
            return 1;
        }
    }
    if (parser.isSet(intervalOption)) {
        bool ok;
        config.daqIntervalMs = parser.value(intervalOption).toInt(&ok);
        if (!ok || config.daqIntervalMs < 0) {
            std::cerr << "Invalid DAQ interval: " << parser.value(intervalOption).toStdString() << std::endl;
            return 1;
        }
    }
    if (parser.isSet(triggerOption)) {
        bool ok;
        config.daqTrigger = daqTriggerFromString(parser.value(triggerOption), &ok);
        if (!ok) {
            std::cerr << "Unknown trigger mode: " << parser.value(triggerOption).toStdString() << std::endl;
            return 1;
        }
    }
    if (parser.isSet(queryOption))
        config.daqQuery = parser.value(queryOption);
    if (parser.isSet(debugOption)) {
        config.daqDebug = true;
        config.jobsDebug = true;
    }

    double duration = 0;
    if (parser.isSet(durationOption)) {
        bool ok;
        duration = parser.value(durationOption).toDouble(&ok);
        if (!ok || !std::isfinite(duration) || duration < 0) {
            std::cerr << "Invalid duration: " << parser.value(durationOption).toStdString() << std::endl;
            return 1;
        }
    }

    if (config.portName.isEmpty()) {
        std::cout << parser.helpText().toStdString() << std::endl;
        return 0;
    }

    return runDeviceMonitor(config, parser.values(sendOption), duration);
}
