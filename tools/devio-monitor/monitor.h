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

#include <chrono>
#include <QStringList>

#include "workerconfig.h"

/**
 * Convert a run duration in seconds to a timer interval, clamped to
 * the longest single-shot interval QTimer supports.
 */
std::chrono::milliseconds monitorDurationToMsec(double durationSec);

/**
 * Run the device monitor until the duration has elapsed (0 = forever)
 * or the connection to the device was lost.
 *
 * @return Process exit code.
 */
int runDeviceMonitor(const DevIO::DevIOConfig &config, const QStringList &sendCommands, double durationSec);
