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

#include "misc.h"

#include <QThread>

QString DevIO::currentThreadName()
{
    const auto thread = QThread::currentThread();
    if (thread == nullptr)
        return QStringLiteral("<none>");
    const auto name = thread->objectName();
    if (!name.isEmpty())
        return name;
    return QStringLiteral("0x%1").arg(reinterpret_cast<quintptr>(thread), 0, 16);
}

