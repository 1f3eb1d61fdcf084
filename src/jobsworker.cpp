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

#include "jobsworker.h"

#include <exception>
#include <QDebug>

#include "device.h"
#include "utils/misc.h"

namespace DevIO
{
Q_LOGGING_CATEGORY(logJobsWorker, "devio.jobs")
}

using namespace DevIO;

DeviceJob::DeviceJob() {}

DeviceJob::DeviceJob(const std::function<void()> &fn, const QString &name)
    : m_fn(fn),
      m_instruction(name)
{
}

DeviceJob::DeviceJob(const QString &instruction, const QVariantList &args)
    : m_instruction(instruction),
      m_args(args)
{
}

bool DeviceJob::isCallable() const
{
    return static_cast<bool>(m_fn);
}

QString DeviceJob::instruction() const
{
    return m_instruction;
}

QVariantList DeviceJob::args() const
{
    return m_args;
}

void DeviceJob::operator()() const
{
    m_fn();
}

JobsWorker::JobsWorker(AbstractDevice *dev, const JobsFunction &jobsFunction, bool debug, QObject *parent)
    : AbstractWorker(dev, debug, parent),
      m_jobsFunction(jobsFunction),
      m_updateCounter(0),
      m_running(true),
      m_processRequested(false)
{
    if (m_debug)
        qCDebug(logJobsWorker).noquote().nospace()
            << "Worker_jobs " << m_dev->name() << ": init @ thread " << currentThreadName();
}

JobsWorker::~JobsWorker() {}

qint64 JobsWorker::updateCounter() const
{
    return m_updateCounter;
}

int JobsWorker::pendingJobsCount() const
{
    QMutexLocker locker(&m_queueMutex);
    return m_queue.size();
}

void JobsWorker::doWork()
{
    if (m_debug)
        qCDebug(logJobsWorker).noquote().nospace()
            << "Worker_jobs " << m_dev->name() << ": starting @ thread " << currentThreadName();

    QMutexLocker locker(&m_wakeMutex);
    confirmStarted();

    while (m_running) {
        if (m_debug)
            qCDebug(logJobsWorker).noquote().nospace()
                << "Worker_jobs " << m_dev->name() << ": waiting for wake-up trigger";

        while (!m_processRequested && m_running)
            m_wakeCondition.wait(&m_wakeMutex);

        // final wake-up by stop(), do not process the queue
        if (!m_running)
            break;
        m_processRequested = false;

        locker.unlock();
        if (m_debug)
            qCDebug(logJobsWorker).noquote().nospace() << "Worker_jobs " << m_dev->name() << ": has woken up";
        performJobs();
        locker.relock();
    }
    locker.unlock();

    if (m_debug)
        qCDebug(logJobsWorker).noquote().nospace() << "Worker_jobs " << m_dev->name() << ": has stopped";
    confirmStopped();
}

void JobsWorker::performJobs()
{
    QMutexLocker locker(m_dev->mutex());
    const auto updateIdx = ++m_updateCounter;

    if (m_debug)
        qCDebug(logJobsWorker).noquote().nospace() << "Worker_jobs " << m_dev->name() << ": lock   # " << updateIdx;

    // process all jobs until the queue is empty, including those
    // added while we are processing
    while (true) {
        m_queueMutex.lock();
        if (m_queue.isEmpty()) {
            m_queueMutex.unlock();
            break;
        }
        const auto job = m_queue.dequeue();
        m_queueMutex.unlock();

        handleJob(job);
    }

    if (m_debug)
        qCDebug(logJobsWorker).noquote().nospace() << "Worker_jobs " << m_dev->name() << ": unlock # " << updateIdx;
    locker.unlock();

    emit updated();
}

void JobsWorker::handleJob(const DeviceJob &job)
{
    if (m_debug)
        qCDebug(logJobsWorker).noquote().nospace()
            << "Worker_jobs " << m_dev->name() << ": "
            << (job.instruction().isEmpty() ? QStringLiteral("<callable>") : job.instruction()) << " " << job.args();

    try {
        if (m_jobsFunction) {
            // user-supplied job processing
            m_jobsFunction(job);
        } else if (job.isCallable()) {
            // default job processing: send the I/O operation to the device
            job();
        } else {
            qCCritical(logJobsWorker).noquote().nospace()
                << "Worker_jobs " << m_dev->name() << ": Received a job that is not a callable: " << job.instruction();
        }
    } catch (const std::exception &e) {
        qCWarning(logJobsWorker).noquote().nospace()
            << "Worker_jobs " << m_dev->name() << ": Job raised an exception: " << e.what();
    }
}

void JobsWorker::stop()
{
    if (m_debug)
        qCDebug(logJobsWorker).noquote().nospace() << "Worker_jobs " << m_dev->name() << ": stopping";

    QMutexLocker locker(&m_wakeMutex);
    m_running = false;
    m_wakeCondition.wakeAll();
}

void JobsWorker::addToQueue(const DeviceJob &job)
{
    QMutexLocker locker(&m_queueMutex);
    m_queue.enqueue(job);
}

void JobsWorker::processQueue()
{
    if (m_debug)
        qCDebug(logJobsWorker).noquote().nospace() << "Worker_jobs " << m_dev->name() << ": wake-up requested...";

    QMutexLocker locker(&m_wakeMutex);
    m_processRequested = true;
    m_wakeCondition.wakeAll();
}

void JobsWorker::send(const DeviceJob &job)
{
    addToQueue(job);
    processQueue();
}
