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

#pragma once

#include <QLoggingCategory>
#include <QString>
#include <QThread>

#include "daqworker.h"

namespace DevIO
{

Q_DECLARE_LOGGING_CATEGORY(logDevIOConfig)

/**
 * @brief Settings for a device and its DAQ & jobs workers
 *
 * This is what a DeviceIO setup can be loaded from, usually
 * a TOML file with [device], [daq] and [jobs] sections.
 */
struct DevIOConfig {
    QString deviceName;
    QString portName;
    qint32 baudRate = 115200;

    DaqTrigger daqTrigger = DaqTrigger::INTERNAL_TIMER;
    int daqIntervalMs = 100;
    Qt::TimerType daqTimerType = Qt::PreciseTimer;
    int criticalNotAliveCount = 1;
    QThread::Priority daqPriority = QThread::InheritPriority;
    QString daqQuery = QStringLiteral("?");
    bool daqDebug = false;

    bool jobsEnabled = true;
    QThread::Priority jobsPriority = QThread::InheritPriority;
    bool jobsDebug = false;

    /**
     * Options to pass to DeviceIO::createDaqWorker() for this configuration.
     */
    DaqWorkerOptions daqWorkerOptions(const DaqFunction &daqFunction = nullptr) const;
};

QString timerTypeToString(Qt::TimerType type);
Qt::TimerType timerTypeFromString(const QString &str, bool *ok = nullptr);

QString threadPriorityToString(QThread::Priority priority);
QThread::Priority threadPriorityFromString(const QString &str, bool *ok = nullptr);

bool loadConfigData(const QByteArray &data, DevIOConfig &config, QString &errorMessage);
bool loadConfigFile(const QString &fname, DevIOConfig &config, QString &errorMessage);

QByteArray serializeConfig(const DevIOConfig &config);

} // namespace DevIO
