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
#include <QMutex>
#include <QString>

namespace DevIO
{

/**
 * @brief Base class for an I/O device driven by DeviceIO
 *
 * Derive your own device class from this and add the actual
 * I/O methods to it. The DAQ and jobs workers lock the device
 * mutex for every update, so all I/O performed from within a
 * DAQ function or a job is serialized.
 */
class AbstractDevice
{
public:
    explicit AbstractDevice(const QString &name = QString());
    virtual ~AbstractDevice();

    /**
     * @brief Short display name of this device.
     */
    QString name() const;
    void setName(const QString &name);

    /**
     * @brief Mutex guarding all I/O operations on this device.
     */
    QMutex *mutex();

    /**
     * @brief Device is up and we can communicate with it?
     *
     * Devices are assumed to be alive from the start.
     */
    bool isAlive() const;
    void setAlive(bool alive);

private:
    Q_DISABLE_COPY(AbstractDevice)
    QString m_name;
    QMutex m_mutex;
    std::atomic_bool m_alive;
};

} // namespace DevIO
