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
#include <QObject>
#include <QScopedPointer>
#include <QThread>

#include "daqworker.h"
#include "device.h"
#include "jobsworker.h"

namespace DevIO
{

Q_DECLARE_LOGGING_CATEGORY(logDeviceIO)

/**
 * @brief Framework for multithreaded data acquisition and communication with an I/O device
 *
 * All device I/O operations are offloaded to workers, each running in
 * their dedicated thread:
 *
 *  - DaqWorker: acquires data from the device, either periodically or
 *    aperiodically. Created by calling createDaqWorker().
 *  - JobsWorker: maintains a thread-safe queue where desired device I/O
 *    operations, called jobs, can be put onto. It sends the queued jobs
 *    first-in, first-out to the device. Created by calling createJobsWorker().
 *
 * You can derive from this class to hide the specifics of creating the
 * workers, so that users of your device only have to call start().
 */
class DeviceIO : public QObject
{
    Q_OBJECT
public:
    explicit DeviceIO(AbstractDevice *dev = nullptr, QObject *parent = nullptr);
    ~DeviceIO() override;

    AbstractDevice *device() const;

    /**
     * @brief Attach the device to operate on.
     *
     * A device can only be attached once.
     */
    bool attachDevice(AbstractDevice *dev);

    QString lastError() const;

    bool createDaqWorker(const DaqWorkerOptions &options = DaqWorkerOptions());
    bool createJobsWorker(const JobsFunction &jobsFunction = nullptr, bool debug = false);

    DaqWorker *daqWorker() const;
    JobsWorker *jobsWorker() const;

    bool start(QThread::Priority daqPriority = QThread::InheritPriority,
               QThread::Priority jobsPriority = QThread::InheritPriority);
    bool startDaqWorker(QThread::Priority priority = QThread::InheritPriority);
    bool startJobsWorker(QThread::Priority priority = QThread::InheritPriority);

    bool quit();
    bool quitDaqWorker();
    bool quitJobsWorker();

    void pauseDaq();
    void unpauseDaq();
    void wakeUpDaq();

    void send(const DeviceJob &job);
    void send(const std::function<void()> &fn);
    void send(const QString &instruction, const QVariantList &args = QVariantList());
    void addToJobsQueue(const DeviceJob &job);
    void addToJobsQueue(const std::function<void()> &fn);
    void addToJobsQueue(const QString &instruction, const QVariantList &args = QVariantList());
    void processJobsQueue();

    qint64 updateCounterDaq() const;
    qint64 updateCounterJobs() const;
    int notAliveCounterDaq() const;
    double obtainedDaqIntervalMs() const;
    double obtainedDaqRateHz() const;

signals:
    /**
     * Emitted when the DAQ function has run and finished, either
     * successfully or not. Connect your GUI redraw routine here.
     */
    void daqUpdated();

    /**
     * Emitted when all pending jobs have been sent out to the device.
     */
    void jobsUpdated();

    /**
     * Emitted to confirm the DAQ worker has entered the paused state.
     */
    void daqPaused();

    /**
     * Emitted when critical-not-alive-count consecutive DAQ updates failed.
     */
    void connectionLost();

private:
    class Private;
    Q_DISABLE_COPY(DeviceIO)
    QScopedPointer<Private> d;

    bool finishThread(QThread *thread);
    void raiseError(const QString &message);
};

} // namespace DevIO
