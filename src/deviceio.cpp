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

#include "deviceio.h"

#include <limits>
#include <QCoreApplication>
#include <QDebug>

namespace DevIO
{
Q_LOGGING_CATEGORY(logDeviceIO, "devio")
}

using namespace DevIO;

#pragma GCC diagnostic push
#pragma GCC diagnostic ignored "-Wpadded"
class DeviceIO::Private
{
public:
    Private() { }
    ~Private() { }

    AbstractDevice *dev;
    QString lastError;

    QScopedPointer<QThread> daqThread;
    QScopedPointer<QThread> jobsThread;
    QScopedPointer<DaqWorker> daqWorker;
    QScopedPointer<JobsWorker> jobsWorker;
};
#pragma GCC diagnostic pop

DeviceIO::DeviceIO(AbstractDevice *dev, QObject *parent)
    : QObject(parent),
      d(new DeviceIO::Private)
{
    d->dev = dev;
}

DeviceIO::~DeviceIO()
{
    quit();

    for (const auto &thread : {d->daqThread.data(), d->jobsThread.data()}) {
        if (thread == nullptr || !thread->isRunning())
            continue;
        qCCritical(logDeviceIO).noquote() << "Thread" << thread->objectName()
                                          << "did not quit in time, attempting to terminate it now.";
        thread->terminate();
        thread->wait();
    }

    // workers have to go before the threads they were living in
    d->daqWorker.reset();
    d->jobsWorker.reset();
}

AbstractDevice *DeviceIO::device() const
{
    return d->dev;
}

bool DeviceIO::attachDevice(AbstractDevice *dev)
{
    if (d->dev != nullptr) {
        raiseError(QStringLiteral("Device can be attached only once. Already attached to '%1'.").arg(d->dev->name()));
        return false;
    }
    if (dev == nullptr) {
        raiseError(QStringLiteral("Can not attach an invalid device."));
        return false;
    }

    d->dev = dev;
    return true;
}

QString DeviceIO::lastError() const
{
    return d->lastError;
}

void DeviceIO::raiseError(const QString &message)
{
    d->lastError = message;
    qCCritical(logDeviceIO).noquote() << message;
}

bool DeviceIO::createDaqWorker(const DaqWorkerOptions &options)
{
    if (d->dev == nullptr) {
        raiseError(QStringLiteral("Can't create worker_DAQ, because there is no device attached."));
        return false;
    }
    if (d->daqThread && d->daqThread->isRunning()) {
        raiseError(QStringLiteral("Worker_DAQ  %1: Can't create worker, because it is already running.")
                       .arg(d->dev->name()));
        return false;
    }
    if (options.intervalMs < 0 || options.criticalNotAliveCount < 0) {
        raiseError(QStringLiteral("Worker_DAQ  %1: Invalid DAQ interval or not-alive count.").arg(d->dev->name()));
        return false;
    }

    // drop a previous, no longer running worker
    d->daqWorker.reset();
    d->daqThread.reset();

    d->daqWorker.reset(new DaqWorker(d->dev, options));
    connect(d->daqWorker.data(), &DaqWorker::updated, this, &DeviceIO::daqUpdated);
    connect(d->daqWorker.data(), &DaqWorker::paused, this, &DeviceIO::daqPaused);
    connect(d->daqWorker.data(), &DaqWorker::connectionLost, this, &DeviceIO::connectionLost);

    d->daqThread.reset(new QThread);
    d->daqThread->setObjectName(QStringLiteral("%1_DAQ").arg(d->dev->name()));
    connect(d->daqThread.data(), &QThread::started, d->daqWorker.data(), &DaqWorker::doWork);
    d->daqWorker->moveToThread(d->daqThread.data());

    return true;
}

bool DeviceIO::createJobsWorker(const JobsFunction &jobsFunction, bool debug)
{
    if (d->dev == nullptr) {
        raiseError(QStringLiteral("Can't create worker_jobs, because there is no device attached."));
        return false;
    }
    if (d->jobsThread && d->jobsThread->isRunning()) {
        raiseError(QStringLiteral("Worker_jobs %1: Can't create worker, because it is already running.")
                       .arg(d->dev->name()));
        return false;
    }

    d->jobsWorker.reset();
    d->jobsThread.reset();

    d->jobsWorker.reset(new JobsWorker(d->dev, jobsFunction, debug));
    connect(d->jobsWorker.data(), &JobsWorker::updated, this, &DeviceIO::jobsUpdated);

    d->jobsThread.reset(new QThread);
    d->jobsThread->setObjectName(QStringLiteral("%1_jobs").arg(d->dev->name()));
    connect(d->jobsThread.data(), &QThread::started, d->jobsWorker.data(), &JobsWorker::doWork);
    d->jobsWorker->moveToThread(d->jobsThread.data());

    return true;
}

DaqWorker *DeviceIO::daqWorker() const
{
    return d->daqWorker.data();
}

JobsWorker *DeviceIO::jobsWorker() const
{
    return d->jobsWorker.data();
}

bool DeviceIO::start(QThread::Priority daqPriority, QThread::Priority jobsPriority)
{
    bool success = true;

    if (d->jobsThread)
        success = startJobsWorker(jobsPriority) && success;
    if (d->daqThread)
        success = startDaqWorker(daqPriority) && success;

    return success;
}

bool DeviceIO::startDaqWorker(QThread::Priority priority)
{
    if (!d->daqThread || !d->daqWorker) {
        raiseError(QStringLiteral("Worker_DAQ  %1: Can't start thread, because it does not exist. "
                                  "Did you forget to call 'createDaqWorker()' first?")
                       .arg(d->dev == nullptr ? QStringLiteral("NoDevice") : d->dev->name()));
        return false;
    }
    if (d->daqWorker->hasStarted()) {
        raiseError(QStringLiteral("Worker_DAQ  %1: Can't start thread, because it was already started.")
                       .arg(d->dev->name()));
        return false;
    }
    if (!d->dev->isAlive()) {
        qCWarning(logDeviceIO).noquote().nospace() << "Worker_DAQ  " << d->dev->name()
                                                   << ": WARNING - Device is not alive.";
        return false;
    }

    if (d->daqWorker->debug())
        qCDebug(logDeviceIO).noquote().nospace() << "Worker_DAQ  " << d->dev->name() << ": start requested...";

    d->daqThread->start(priority);

    // wait for the worker to confirm having started
    d->daqWorker->waitForStarted();

    // the worker emits daqPaused() when starting up in CONTINUOUS mode, make sure
    // it is processed prior to any other action requested after we return
    if (d->daqWorker->trigger() == DaqTrigger::CONTINUOUS)
        QCoreApplication::processEvents();

    return true;
}

bool DeviceIO::startJobsWorker(QThread::Priority priority)
{
    if (!d->jobsThread || !d->jobsWorker) {
        raiseError(QStringLiteral("Worker_jobs %1: Can't start thread, because it does not exist. "
                                  "Did you forget to call 'createJobsWorker()' first?")
                       .arg(d->dev == nullptr ? QStringLiteral("NoDevice") : d->dev->name()));
        return false;
    }
    if (d->jobsWorker->hasStarted()) {
        raiseError(QStringLiteral("Worker_jobs %1: Can't start thread, because it was already started.")
                       .arg(d->dev->name()));
        return false;
    }
    if (!d->dev->isAlive()) {
        qCWarning(logDeviceIO).noquote().nospace() << "Worker_jobs " << d->dev->name()
                                                   << ": WARNING - Device is not alive.";
        return false;
    }

    if (d->jobsWorker->debug())
        qCDebug(logDeviceIO).noquote().nospace() << "Worker_jobs " << d->dev->name() << ": start requested...";

    d->jobsThread->start(priority);
    d->jobsWorker->waitForStarted();

    return true;
}

bool DeviceIO::quit()
{
    const bool daqOk = quitDaqWorker();
    const bool jobsOk = quitJobsWorker();
    return daqOk && jobsOk;
}

bool DeviceIO::quitDaqWorker()
{
    if (!d->daqThread || !d->daqWorker || !d->daqWorker->hasStarted())
        return true;

    if (d->daqThread->isFinished()) {
        // the worker has already been stopped and its thread closed,
        // e.g. after a lost connection and a previous quit request
        qCInfo(logDeviceIO).noquote() << "Closing thread" << d->daqThread->objectName() << "already closed.";
        return true;
    }

    if (!d->daqWorker->hasStopped()) {
        if (d->daqWorker->debug())
            qCDebug(logDeviceIO).noquote().nospace() << "Worker_DAQ  " << d->dev->name() << ": stop requested...";

        if (d->daqWorker->trigger() == DaqTrigger::INTERNAL_TIMER) {
            // the timer has to be stopped from within the worker thread
            QMetaObject::invokeMethod(d->daqWorker.data(), &DaqWorker::stop, Qt::QueuedConnection);
        } else {
            // the worker thread is blocked in its acquisition loop and can not
            // process events, the stop request is thread-safe for these modes
            d->daqWorker->stop();
        }

        d->daqWorker->waitForStopped();
    }

    return finishThread(d->daqThread.data());
}

bool DeviceIO::quitJobsWorker()
{
    if (!d->jobsThread || !d->jobsWorker || !d->jobsWorker->hasStarted())
        return true;

    if (d->jobsThread->isFinished()) {
        qCInfo(logDeviceIO).noquote() << "Closing thread" << d->jobsThread->objectName() << "already closed.";
        return true;
    }

    if (!d->jobsWorker->hasStopped()) {
        if (d->jobsWorker->debug())
            qCDebug(logDeviceIO).noquote().nospace() << "Worker_jobs " << d->dev->name() << ": stop requested...";

        d->jobsWorker->stop();
        d->jobsWorker->waitForStopped();
    }

    return finishThread(d->jobsThread.data());
}

bool DeviceIO::finishThread(QThread *thread)
{
    thread->quit();
    if (thread->wait(2000)) {
        qCInfo(logDeviceIO).noquote() << "Closing thread" << thread->objectName() << "done.";
        return true;
    }

    qCWarning(logDeviceIO).noquote() << "Closing thread" << thread->objectName() << "FAILED.";
    return false;
}

void DeviceIO::pauseDaq()
{
    if (d->daqWorker)
        QMetaObject::invokeMethod(d->daqWorker.data(), &DaqWorker::pause, Qt::QueuedConnection);
}

void DeviceIO::unpauseDaq()
{
    if (d->daqWorker)
        QMetaObject::invokeMethod(d->daqWorker.data(), &DaqWorker::unpause, Qt::QueuedConnection);
}

void DeviceIO::wakeUpDaq()
{
    if (d->daqWorker)
        d->daqWorker->wakeUp();
}

void DeviceIO::send(const DeviceJob &job)
{
    if (d->jobsWorker)
        d->jobsWorker->send(job);
}

void DeviceIO::send(const std::function<void()> &fn)
{
    send(DeviceJob(fn));
}

void DeviceIO::send(const QString &instruction, const QVariantList &args)
{
    send(DeviceJob(instruction, args));
}

void DeviceIO::addToJobsQueue(const DeviceJob &job)
{
    if (d->jobsWorker)
        d->jobsWorker->addToQueue(job);
}

void DeviceIO::addToJobsQueue(const std::function<void()> &fn)
{
    addToJobsQueue(DeviceJob(fn));
}

void DeviceIO::addToJobsQueue(const QString &instruction, const QVariantList &args)
{
    addToJobsQueue(DeviceJob(instruction, args));
}

void DeviceIO::processJobsQueue()
{
    if (d->jobsWorker)
        d->jobsWorker->processQueue();
}

qint64 DeviceIO::updateCounterDaq() const
{
    return d->daqWorker ? d->daqWorker->updateCounter() : 0;
}

qint64 DeviceIO::updateCounterJobs() const
{
    return d->jobsWorker ? d->jobsWorker->updateCounter() : 0;
}

int DeviceIO::notAliveCounterDaq() const
{
    return d->daqWorker ? d->daqWorker->notAliveCounter() : 0;
}

double DeviceIO::obtainedDaqIntervalMs() const
{
    return d->daqWorker ? d->daqWorker->obtainedIntervalMs() : std::numeric_limits<double>::quiet_NaN();
}

double DeviceIO::obtainedDaqRateHz() const
{
    return d->daqWorker ? d->daqWorker->obtainedRateHz() : std::numeric_limits<double>::quiet_NaN();
}
