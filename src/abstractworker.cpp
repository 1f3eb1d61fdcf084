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

#include "abstractworker.h"

#include <QMutex>
#include <QWaitCondition>

using namespace DevIO;

class AbstractWorker::Private
{
public:
    Private()
        : started(false),
          stopped(false)
    {
    }

    bool started;
    bool stopped;
    mutable QMutex mutex;
    QWaitCondition condition;

private:
    Q_DISABLE_COPY(Private)
};

AbstractWorker::AbstractWorker(AbstractDevice *dev, bool debug, QObject *parent)
    : QObject(parent),
      m_dev(dev),
      m_debug(debug),
      d(new AbstractWorker::Private)
{
}

AbstractWorker::~AbstractWorker() {}

AbstractDevice *AbstractWorker::device() const
{
    return m_dev;
}

bool AbstractWorker::debug() const
{
    return m_debug;
}

bool AbstractWorker::hasStarted() const
{
    QMutexLocker locker(&d->mutex);
    return d->started;
}

bool AbstractWorker::hasStopped() const
{
    QMutexLocker locker(&d->mutex);
    return d->stopped;
}

bool AbstractWorker::waitForStarted(unsigned long timeoutMsec)
{
    QMutexLocker locker(&d->mutex);
    while (!d->started) {
        if (!d->condition.wait(&d->mutex, timeoutMsec))
            return d->started;
    }
    return true;
}

bool AbstractWorker::waitForStopped(unsigned long timeoutMsec)
{
    QMutexLocker locker(&d->mutex);
    while (!d->stopped) {
        if (!d->condition.wait(&d->mutex, timeoutMsec))
            return d->stopped;
    }
    return true;
}

void AbstractWorker::confirmStarted()
{
    QMutexLocker locker(&d->mutex);
    d->started = true;
    d->condition.wakeAll();
}

void AbstractWorker::confirmStopped()
{
    QMutexLocker locker(&d->mutex);
    d->stopped = true;
    d->condition.wakeAll();
}
