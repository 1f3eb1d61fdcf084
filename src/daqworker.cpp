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

#include "daqworker.h"

#include <exception>
#include <limits>
#include <QCoreApplication>
#include <QDebug>
#include <QThread>
#include <QTimer>

#include "device.h"
#include "utils/misc.h"

namespace DevIO
{
Q_LOGGING_CATEGORY(logDaqWorker, "devio.daq")
}

using namespace DevIO;

QString DevIO::daqTriggerToString(DaqTrigger trigger)
{
    switch (trigger) {
    case DaqTrigger::INTERNAL_TIMER:
        return QStringLiteral("internal-timer");
    case DaqTrigger::SINGLE_SHOT_WAKE_UP:
        return QStringLiteral("single-shot-wake-up");
    case DaqTrigger::CONTINUOUS:
        return QStringLiteral("continuous");
    }

    return QStringLiteral("unknown");
}

DaqTrigger DevIO::daqTriggerFromString(const QString &str, bool *ok)
{
    const auto s = str.trimmed().toLower();
    if (ok != nullptr)
        *ok = true;

    if (s == QStringLiteral("internal-timer"))
        return DaqTrigger::INTERNAL_TIMER;
    if (s == QStringLiteral("single-shot-wake-up"))
        return DaqTrigger::SINGLE_SHOT_WAKE_UP;
    if (s == QStringLiteral("continuous"))
        return DaqTrigger::CONTINUOUS;

    if (ok != nullptr)
        *ok = false;
    return DaqTrigger::INTERNAL_TIMER;
}

DaqWorker::DaqWorker(AbstractDevice *dev, const DaqWorkerOptions &options, QObject *parent)
    : AbstractWorker(dev, options.debug, parent),
      m_trigger(options.trigger),
      m_daqFunction(options.daqFunction),
      m_intervalMs(options.intervalMs),
      m_timerType(options.timerType),
      m_criticalNotAliveCount(options.criticalNotAliveCount),
      m_updateCounter(0),
      m_notAliveCounter(0),
      m_obtainedIntervalMs(std::numeric_limits<double>::quiet_NaN()),
      m_obtainedRateHz(std::numeric_limits<double>::quiet_NaN()),
      m_running(true),
      m_timer(nullptr),
      m_pendingWakeUps(0),
      m_pause(false),
      m_paused(false)
{
    if (m_trigger == DaqTrigger::INTERNAL_TIMER) {
        // the timer is a child of ours and moves along into the worker thread
        m_timer = new QTimer(this);
        m_timer->setInterval(m_intervalMs);
        m_timer->setTimerType(m_timerType);
        connect(m_timer, &QTimer::timeout, this, &DaqWorker::performDaq);
    }

    if (m_debug)
        qCDebug(logDaqWorker).noquote().nospace()
            << "Worker_DAQ  " << m_dev->name() << ": init @ thread " << currentThreadName();
}

DaqWorker::~DaqWorker() {}

DaqTrigger DaqWorker::trigger() const
{
    return m_trigger;
}

int DaqWorker::intervalMs() const
{
    return m_intervalMs;
}

Qt::TimerType DaqWorker::timerType() const
{
    return m_timerType;
}

int DaqWorker::criticalNotAliveCount() const
{
    return m_criticalNotAliveCount;
}

qint64 DaqWorker::updateCounter() const
{
    return m_updateCounter;
}

int DaqWorker::notAliveCounter() const
{
    return m_notAliveCounter;
}

double DaqWorker::obtainedIntervalMs() const
{
    return m_obtainedIntervalMs;
}

double DaqWorker::obtainedRateHz() const
{
    return m_obtainedRateHz;
}

bool DaqWorker::isPaused() const
{
    return m_paused;
}

void DaqWorker::doWork()
{
    if (m_debug)
        qCDebug(logDaqWorker).noquote().nospace()
            << "Worker_DAQ  " << m_dev->name() << ": starting @ thread " << currentThreadName();

    switch (m_trigger) {
    case DaqTrigger::INTERNAL_TIMER:
        m_timer->start();
        confirmStarted();
        break;
    case DaqTrigger::SINGLE_SHOT_WAKE_UP:
        runWakeUpLoop();
        break;
    case DaqTrigger::CONTINUOUS:
        runContinuousLoop();
        break;
    }
}

void DaqWorker::runWakeUpLoop()
{
    QMutexLocker locker(&m_wakeMutex);
    confirmStarted();

    while (m_running) {
        if (m_debug)
            qCDebug(logDaqWorker).noquote().nospace()
                << "Worker_DAQ  " << m_dev->name() << ": waiting for wake-up trigger";

        while (m_pendingWakeUps == 0 && m_running)
            m_wakeCondition.wait(&m_wakeMutex);

        // final wake-up by stop(), do not perform an update
        if (!m_running)
            break;
        m_pendingWakeUps--;

        locker.unlock();
        if (m_debug)
            qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": has woken up";
        performDaq();
        locker.relock();
    }
    locker.unlock();

    if (m_debug)
        qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": has stopped";
    confirmStopped();
}

void DaqWorker::runContinuousLoop()
{
    // we always start up paused
    m_pause = true;
    m_paused = true;
    if (m_debug)
        qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": starting up paused";
    emit paused();
    confirmStarted();

    while (m_running) {
        // handle queued pause/unpause requests
        QCoreApplication::processEvents();

        if (m_pause) {
            if (!m_paused) {
                if (m_debug)
                    qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": has paused";
                m_paused = true;
                emit paused();
            }

            // do not hog the CPU while paused
            QThread::msleep(10);
        } else {
            if (m_paused) {
                if (m_debug)
                    qCDebug(logDaqWorker).noquote().nospace()
                        << "Worker_DAQ  " << m_dev->name() << ": has unpaused";
                m_paused = false;
            }

            performDaq();
        }
    }

    if (m_debug)
        qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": has stopped";
    confirmStopped();
}

void DaqWorker::performDaq()
{
    QMutexLocker locker(m_dev->mutex());
    const auto updateIdx = ++m_updateCounter;

    if (m_debug)
        qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": lock   # " << updateIdx;

    m_rateMeter.tick();
    m_obtainedIntervalMs = m_rateMeter.intervalMs();
    m_obtainedRateHz = m_rateMeter.rateHz();

    if (m_daqFunction) {
        try {
            if (m_daqFunction())
                m_notAliveCounter = 0;
            else
                m_notAliveCounter++;
        } catch (const std::exception &e) {
            qCWarning(logDaqWorker).noquote().nospace()
                << "Worker_DAQ  " << m_dev->name() << ": DAQ function raised an exception: " << e.what();
        }
    }

    if (m_debug)
        qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": unlock # " << updateIdx;
    locker.unlock();

    if (m_criticalNotAliveCount > 0 && m_notAliveCounter >= m_criticalNotAliveCount) {
        qCWarning(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": Lost connection to device.";
        m_dev->setAlive(false);
        stop();
        emit connectionLost();
        return;
    }

    emit updated();
}

void DaqWorker::stop()
{
    if (hasStopped())
        return;
    if (m_debug)
        qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": stopping";

    switch (m_trigger) {
    case DaqTrigger::INTERNAL_TIMER:
        // the timer must be stopped from within the worker thread
        m_timer->stop();
        if (m_debug)
            qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": has stopped";
        confirmStopped();
        break;
    case DaqTrigger::SINGLE_SHOT_WAKE_UP: {
        QMutexLocker locker(&m_wakeMutex);
        m_running = false;
        m_wakeCondition.wakeAll();
        break;
    }
    case DaqTrigger::CONTINUOUS:
        m_running = false;
        break;
    }
}

void DaqWorker::pause()
{
    if (m_trigger != DaqTrigger::CONTINUOUS)
        return;
    if (m_debug)
        qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": pause requested...";
    m_pause = true;
}

void DaqWorker::unpause()
{
    if (m_trigger != DaqTrigger::CONTINUOUS)
        return;
    if (m_debug)
        qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": unpause requested...";
    m_pause = false;
}

void DaqWorker::wakeUp()
{
    if (m_trigger != DaqTrigger::SINGLE_SHOT_WAKE_UP)
        return;
    if (m_debug)
        qCDebug(logDaqWorker).noquote().nospace() << "Worker_DAQ  " << m_dev->name() << ": wake-up requested...";

    QMutexLocker locker(&m_wakeMutex);
    m_pendingWakeUps++;
    m_wakeCondition.wakeAll();
}
