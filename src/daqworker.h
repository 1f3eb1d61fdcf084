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

#include <atomic>
#include <functional>
#include <QLoggingCategory>
#include <QMutex>
#include <QWaitCondition>

#include "abstractworker.h"
#include "ratemeter.h"

class QTimer;

namespace DevIO
{

Q_DECLARE_LOGGING_CATEGORY(logDaqWorker)

/**
 * @brief Mode of operation of the DAQ worker
 *
 * Selects what causes the worker to perform one data acquisition update.
 */
enum class DaqTrigger {
    INTERNAL_TIMER = 0,      /// Periodic updates, driven by a QTimer running in the worker thread
    SINGLE_SHOT_WAKE_UP = 1, /// One update per call to DeviceIO::wakeUpDaq()
    CONTINUOUS = 2           /// Updates back to back, as fast as the DAQ function returns
};

QString daqTriggerToString(DaqTrigger trigger);
DaqTrigger daqTriggerFromString(const QString &str, bool *ok = nullptr);

/**
 * @brief User-supplied DAQ function.
 *
 * Performs the device I/O and subsequent data processing of one update.
 * Must return true when the communication with the device was successful,
 * false otherwise. Do not touch the GUI from within this function, connect
 * to DeviceIO::daqUpdated() instead.
 */
using DaqFunction = std::function<bool()>;

struct DaqWorkerOptions {
    DaqTrigger trigger = DaqTrigger::INTERNAL_TIMER;
    DaqFunction daqFunction = nullptr;
    int intervalMs = 100;                      /// only used for INTERNAL_TIMER
    Qt::TimerType timerType = Qt::PreciseTimer; /// only used for INTERNAL_TIMER
    int criticalNotAliveCount = 1;             /// 0 = never give up on communication failures
    bool debug = false;
};

/**
 * @brief Acquires data from the device, periodically or aperiodically
 *
 * An instance of this worker is created by DeviceIO::createDaqWorker()
 * and lives in a dedicated thread.
 */
class DaqWorker : public AbstractWorker
{
    Q_OBJECT
public:
    explicit DaqWorker(AbstractDevice *dev, const DaqWorkerOptions &options, QObject *parent = nullptr);
    ~DaqWorker() override;

    DaqTrigger trigger() const;
    int intervalMs() const;
    Qt::TimerType timerType() const;
    int criticalNotAliveCount() const;

    qint64 updateCounter() const;
    int notAliveCounter() const;
    double obtainedIntervalMs() const;
    double obtainedRateHz() const;

    bool isPaused() const;

    /**
     * @brief Request a single update. Only used for SINGLE_SHOT_WAKE_UP.
     *
     * This method can be called from any thread.
     */
    void wakeUp();

public slots:
    void doWork() override;

    /**
     * @brief Stop the worker to prepare for quitting the worker thread.
     *
     * For INTERNAL_TIMER this must be called from within the worker thread.
     */
    void stop() override;

    /**
     * @brief Pause or resume the worker. Only used for CONTINUOUS.
     *
     * Called via queued invocation from the owning thread.
     */
    void pause();
    void unpause();

signals:
    void updated();
    void paused();
    void connectionLost();

private:
    void performDaq();
    void runWakeUpLoop();
    void runContinuousLoop();

    DaqTrigger m_trigger;
    DaqFunction m_daqFunction;
    int m_intervalMs;
    Qt::TimerType m_timerType;
    int m_criticalNotAliveCount;

    std::atomic<qint64> m_updateCounter;
    std::atomic_int m_notAliveCounter;
    std::atomic<double> m_obtainedIntervalMs;
    std::atomic<double> m_obtainedRateHz;
    DaqRateMeter m_rateMeter;

    std::atomic_bool m_running;

    // INTERNAL_TIMER
    QTimer *m_timer;

    // SINGLE_SHOT_WAKE_UP
    QMutex m_wakeMutex;
    QWaitCondition m_wakeCondition;
    uint m_pendingWakeUps;

    // CONTINUOUS
    std::atomic_bool m_pause;
    std::atomic_bool m_paused;
};

} // namespace DevIO
