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

#include "device.h"

using namespace DevIO;

AbstractDevice::AbstractDevice(const QString &name)
    : m_alive(true)
{
    setName(name);
}

AbstractDevice::~AbstractDevice() {}

QString AbstractDevice::name() const
{
    return m_name;
}

void AbstractDevice::setName(const QString &name)
{
    if (name.isEmpty())
        m_name = QStringLiteral("myDevice");
    else
        m_name = name;
}

QMutex *AbstractDevice::mutex()
{
    return &m_mutex;
}

bool AbstractDevice::isAlive() const
{
    return m_alive;
}

void AbstractDevice::setAlive(bool alive)
{
    m_alive = alive;
}
