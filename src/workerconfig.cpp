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

#include "workerconfig.h"

#include <limits>
#include <QFileInfo>

#include "utils/tomlutils.h"

using namespace DevIO;

namespace DevIO
{
Q_LOGGING_CATEGORY(logDevIOConfig, "devio.config")
}

static bool readString(const QVariantHash &section, const QString &key, QString &value, QString &errorMessage)
{
    const auto var = section.value(key);
    if (!var.isValid())
        return true;
    if (var.typeId() != QMetaType::QString) {
        errorMessage = QStringLiteral("Value of '%1' must be a string.").arg(key);
        return false;
    }
    value = var.toString();
    return true;
}

static bool readInt(const QVariantHash &section, const QString &key, int &value, QString &errorMessage)
{
    const auto var = section.value(key);
    if (!var.isValid())
        return true;
    if (var.typeId() != QMetaType::LongLong && var.typeId() != QMetaType::Int) {
        errorMessage = QStringLiteral("Value of '%1' must be an integer.").arg(key);
        return false;
    }

    const auto v = var.toLongLong();
    if (v < 0) {
        errorMessage = QStringLiteral("Value of '%1' must not be negative (got %2).").arg(key).arg(v);
        return false;
    }
    if (v > std::numeric_limits<int>::max()) {
        errorMessage = QStringLiteral("Value of '%1' is too large (got %2).").arg(key).arg(v);
        return false;
    }

    value = static_cast<int>(v);
    return true;
}

static bool readBool(const QVariantHash &section, const QString &key, bool &value, QString &errorMessage)
{
    const auto var = section.value(key);
    if (!var.isValid())
        return true;
    if (var.typeId() != QMetaType::Bool) {
        errorMessage = QStringLiteral("Value of '%1' must be a boolean.").arg(key);
        return false;
    }
    value = var.toBool();
    return true;
}

static bool readSection(const QVariantHash &root, const QString &name, QVariantHash &section, QString &errorMessage)
{
    const auto var = root.value(name);
    if (!var.isValid())
        return true;
    if (var.typeId() != QMetaType::QVariantHash) {
        errorMessage = QStringLiteral("'%1' must be a table.").arg(name);
        return false;
    }
    section = var.toHash();
    return true;
}

DaqWorkerOptions DevIOConfig::daqWorkerOptions(const DaqFunction &daqFunction) const
{
    return DaqWorkerOptions{
        .trigger = daqTrigger,
        .daqFunction = daqFunction,
        .intervalMs = daqIntervalMs,
        .timerType = daqTimerType,
        .criticalNotAliveCount = criticalNotAliveCount,
        .debug = daqDebug,
    };
}

QString DevIO::timerTypeToString(Qt::TimerType type)
{
    switch (type) {
    case Qt::PreciseTimer:
        return QStringLiteral("precise");
    case Qt::CoarseTimer:
        return QStringLiteral("coarse");
    case Qt::VeryCoarseTimer:
        return QStringLiteral("very-coarse");
    }

    return QStringLiteral("unknown");
}

Qt::TimerType DevIO::timerTypeFromString(const QString &str, bool *ok)
{
    const auto s = str.trimmed().toLower();
    if (ok != nullptr)
        *ok = true;

    if (s == QStringLiteral("precise"))
        return Qt::PreciseTimer;
    if (s == QStringLiteral("coarse"))
        return Qt::CoarseTimer;
    if (s == QStringLiteral("very-coarse"))
        return Qt::VeryCoarseTimer;

    if (ok != nullptr)
        *ok = false;
    return Qt::PreciseTimer;
}

QString DevIO::threadPriorityToString(QThread::Priority priority)
{
    switch (priority) {
    case QThread::IdlePriority:
        return QStringLiteral("idle");
    case QThread::LowestPriority:
        return QStringLiteral("lowest");
    case QThread::LowPriority:
        return QStringLiteral("low");
    case QThread::NormalPriority:
        return QStringLiteral("normal");
    case QThread::HighPriority:
        return QStringLiteral("high");
    case QThread::HighestPriority:
        return QStringLiteral("highest");
    case QThread::TimeCriticalPriority:
        return QStringLiteral("time-critical");
    case QThread::InheritPriority:
        return QStringLiteral("inherit");
    }

    return QStringLiteral("inherit");
}

QThread::Priority DevIO::threadPriorityFromString(const QString &str, bool *ok)
{
    const auto s = str.trimmed().toLower();
    if (ok != nullptr)
        *ok = true;

    if (s == QStringLiteral("idle"))
        return QThread::IdlePriority;
    if (s == QStringLiteral("lowest"))
        return QThread::LowestPriority;
    if (s == QStringLiteral("low"))
        return QThread::LowPriority;
    if (s == QStringLiteral("normal"))
        return QThread::NormalPriority;
    if (s == QStringLiteral("high"))
        return QThread::HighPriority;
    if (s == QStringLiteral("highest"))
        return QThread::HighestPriority;
    if (s == QStringLiteral("time-critical"))
        return QThread::TimeCriticalPriority;
    if (s == QStringLiteral("inherit"))
        return QThread::InheritPriority;

    if (ok != nullptr)
        *ok = false;
    return QThread::InheritPriority;
}

static bool configFromVariantHash(const QVariantHash &root, DevIOConfig &config, QString &errorMessage)
{
    DevIOConfig cfg;
    QVariantHash devSection;
    QVariantHash daqSection;
    QVariantHash jobsSection;

    for (const auto &key : root.keys()) {
        if (key != QStringLiteral("device") && key != QStringLiteral("daq") && key != QStringLiteral("jobs"))
            qCWarning(logDevIOConfig).noquote() << "Ignoring unknown configuration section:" << key;
    }

    if (!readSection(root, QStringLiteral("device"), devSection, errorMessage))
        return false;
    if (!readSection(root, QStringLiteral("daq"), daqSection, errorMessage))
        return false;
    if (!readSection(root, QStringLiteral("jobs"), jobsSection, errorMessage))
        return false;

    // [device]
    int baudRate = cfg.baudRate;
    if (!readString(devSection, QStringLiteral("name"), cfg.deviceName, errorMessage))
        return false;
    if (!readString(devSection, QStringLiteral("port"), cfg.portName, errorMessage))
        return false;
    if (!readInt(devSection, QStringLiteral("baud_rate"), baudRate, errorMessage))
        return false;
    if (baudRate <= 0) {
        errorMessage = QStringLiteral("Value of 'baud_rate' must be a positive number (got %1).").arg(baudRate);
        return false;
    }
    cfg.baudRate = baudRate;

    // [daq]
    QString triggerStr = daqTriggerToString(cfg.daqTrigger);
    QString timerTypeStr = timerTypeToString(cfg.daqTimerType);
    QString daqPrioStr = threadPriorityToString(cfg.daqPriority);
    if (!readString(daqSection, QStringLiteral("trigger"), triggerStr, errorMessage))
        return false;
    if (!readInt(daqSection, QStringLiteral("interval_ms"), cfg.daqIntervalMs, errorMessage))
        return false;
    if (!readString(daqSection, QStringLiteral("timer_type"), timerTypeStr, errorMessage))
        return false;
    if (!readInt(daqSection, QStringLiteral("critical_not_alive_count"), cfg.criticalNotAliveCount, errorMessage))
        return false;
    if (!readString(daqSection, QStringLiteral("priority"), daqPrioStr, errorMessage))
        return false;
    if (!readString(daqSection, QStringLiteral("query"), cfg.daqQuery, errorMessage))
        return false;
    if (!readBool(daqSection, QStringLiteral("debug"), cfg.daqDebug, errorMessage))
        return false;

    bool ok;
    cfg.daqTrigger = daqTriggerFromString(triggerStr, &ok);
    if (!ok) {
        errorMessage = QStringLiteral("Unknown DAQ trigger mode: %1").arg(triggerStr);
        return false;
    }
    cfg.daqTimerType = timerTypeFromString(timerTypeStr, &ok);
    if (!ok) {
        errorMessage = QStringLiteral("Unknown timer type: %1").arg(timerTypeStr);
        return false;
    }
    cfg.daqPriority = threadPriorityFromString(daqPrioStr, &ok);
    if (!ok) {
        errorMessage = QStringLiteral("Unknown DAQ thread priority: %1").arg(daqPrioStr);
        return false;
    }

    // [jobs]
    QString jobsPrioStr = threadPriorityToString(cfg.jobsPriority);
    if (!readBool(jobsSection, QStringLiteral("enabled"), cfg.jobsEnabled, errorMessage))
        return false;
    if (!readString(jobsSection, QStringLiteral("priority"), jobsPrioStr, errorMessage))
        return false;
    if (!readBool(jobsSection, QStringLiteral("debug"), cfg.jobsDebug, errorMessage))
        return false;
    cfg.jobsPriority = threadPriorityFromString(jobsPrioStr, &ok);
    if (!ok) {
        errorMessage = QStringLiteral("Unknown jobs thread priority: %1").arg(jobsPrioStr);
        return false;
    }

    config = cfg;
    return true;
}

bool DevIO::loadConfigData(const QByteArray &data, DevIOConfig &config, QString &errorMessage)
{
    const auto root = parseTomlData(data, errorMessage);
    if (!errorMessage.isEmpty())
        return false;

    return configFromVariantHash(root, config, errorMessage);
}

bool DevIO::loadConfigFile(const QString &fname, DevIOConfig &config, QString &errorMessage)
{
    QFileInfo fi(fname);
    if (!fi.exists()) {
        errorMessage = QStringLiteral("Configuration file '%1' does not exist.").arg(fname);
        return false;
    }

    const auto root = parseTomlFile(fname, errorMessage);
    if (!errorMessage.isEmpty()) {
        qCWarning(logDevIOConfig).noquote().nospace() << "Unable to parse " << fname << ": " << errorMessage;
        return false;
    }

    if (!configFromVariantHash(root, config, errorMessage)) {
        qCWarning(logDevIOConfig).noquote().nospace() << "Invalid configuration in " << fname << ": " << errorMessage;
        return false;
    }

    return true;
}

QByteArray DevIO::serializeConfig(const DevIOConfig &config)
{
    QVariantHash devSection;
    if (!config.deviceName.isEmpty())
        devSection.insert(QStringLiteral("name"), config.deviceName);
    if (!config.portName.isEmpty())
        devSection.insert(QStringLiteral("port"), config.portName);
    devSection.insert(QStringLiteral("baud_rate"), static_cast<qint64>(config.baudRate));

    QVariantHash daqSection;
    daqSection.insert(QStringLiteral("trigger"), daqTriggerToString(config.daqTrigger));
    daqSection.insert(QStringLiteral("interval_ms"), static_cast<qint64>(config.daqIntervalMs));
    daqSection.insert(QStringLiteral("timer_type"), timerTypeToString(config.daqTimerType));
    daqSection.insert(QStringLiteral("critical_not_alive_count"), static_cast<qint64>(config.criticalNotAliveCount));
    daqSection.insert(QStringLiteral("priority"), threadPriorityToString(config.daqPriority));
    daqSection.insert(QStringLiteral("query"), config.daqQuery);
    daqSection.insert(QStringLiteral("debug"), config.daqDebug);

    QVariantHash jobsSection;
    jobsSection.insert(QStringLiteral("enabled"), config.jobsEnabled);
    jobsSection.insert(QStringLiteral("priority"), threadPriorityToString(config.jobsPriority));
    jobsSection.insert(QStringLiteral("debug"), config.jobsDebug);

    QVariantHash root;
    root.insert(QStringLiteral("device"), devSection);
    root.insert(QStringLiteral("daq"), daqSection);
    root.insert(QStringLiteral("jobs"), jobsSection);

    return qVariantHashToTomlData(root);
}
