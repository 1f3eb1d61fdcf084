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

#include <QObject>
#include <QScopedPointer>
#include <climits>

namespace DevIO
{

class AbstractDevice;

/**
 * @brief Common base of the DAQ and jobs workers
 *
 * A worker lives in a dedicated QThread owned by DeviceIO. This class
 * provides the handshake the owning thread uses to wait until the
 * worker has confirmed having started or stopped.
 */
class AbstractWorker : public QObject
{
    Q_OBJECT
public:
    explicit AbstractWorker(AbstractDevice *dev, bool debug, QObject *parent = nullptr);
    ~AbstractWorker() override;

    AbstractDevice *device() const;
    bool debug() const;

    bool hasStarted() const;
    bool hasStopped() const;

    /**
     * @brief Block until the worker has confirmed having started.
     * @return false if the timeout was hit.
     */
    bool waitForStarted(unsigned long timeoutMsec = ULONG_MAX);

    /**
     * @brief Block until the worker has confirmed having stopped.
     * @return false if the timeout was hit.
     */
    bool waitForStopped(unsigned long timeoutMsec = ULONG_MAX);

public slots:
    virtual void doWork() = 0;
    virtual void stop() = 0;

protected:
    void confirmStarted();
    void confirmStopped();

    AbstractDevice *m_dev;
    bool m_debug;

private:
    class Private;
    Q_DISABLE_COPY(AbstractWorker)
    QScopedPointer<Private> d;
};

} // namespace DevIO
