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
#include <QQueue>
#include <QVariantList>
#include <QWaitCondition>

#include "abstractworker.h"

namespace DevIO
{

Q_DECLARE_LOGGING_CATEGORY(logJobsWorker)

/**
 * @brief A device I/O operation queued for the jobs worker
 *
 * A job is either a callable, usually a one-way device I/O operation such
 * as writing a command, or a named instruction with arguments that a custom
 * JobsFunction knows how to decode.
 */
class DeviceJob
{
public:
    DeviceJob();
    explicit DeviceJob(const std::function<void()> &fn, const QString &name = QString());
    explicit DeviceJob(const QString &instruction, const QVariantList &args = QVariantList());

    bool isCallable() const;
    QString instruction() const;
    QVariantList args() const;

    /**
     * @brief Execute the callable of this job.
     */
    void operator()() const;

private:
    std::function<void()> m_fn;
    QString m_instruction;
    QVariantList m_args;
};

/**
 * @brief User-supplied routine performed for every job.
 *
 * Replaces the default handling, which calls the job's callable.
 */
using JobsFunction = std::function<void(const DeviceJob &job)>;

/**
 * @brief Sends queued jobs to the device
 *
 * Maintains a thread-safe queue where desired device I/O operations
 * can be put onto. On every wake-up the worker sends out all pending jobs
 * first-in, first-out, until the queue is empty, then goes back to sleep.
 */
class JobsWorker : public AbstractWorker
{
    Q_OBJECT
public:
    explicit JobsWorker(AbstractDevice *dev,
                        const JobsFunction &jobsFunction = nullptr,
                        bool debug = false,
                        QObject *parent = nullptr);
    ~JobsWorker() override;

    qint64 updateCounter() const;
    int pendingJobsCount() const;

    void addToQueue(const DeviceJob &job);
    void processQueue();
    void send(const DeviceJob &job);

public slots:
    void doWork() override;
    void stop() override;

signals:
    void updated();

private:
    void performJobs();
    void handleJob(const DeviceJob &job);

    JobsFunction m_jobsFunction;
    std::atomic<qint64> m_updateCounter;

    mutable QMutex m_queueMutex;
    QQueue<DeviceJob> m_queue;

    QMutex m_wakeMutex;
    QWaitCondition m_wakeCondition;
    bool m_running;
    bool m_processRequested;
};

} // namespace DevIO
