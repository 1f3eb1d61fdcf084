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

#include <QElapsedTimer>

namespace DevIO
{

/**
 * @brief Keeps track of the obtained DAQ interval and DAQ rate
 *
 * Call tick() once per DAQ update. The interval is available from the
 * second tick on, the rate is (re)evaluated every time the evaluation
 * window has elapsed. Until then, both values are NaN.
 */
class DaqRateMeter
{
public:
    explicit DaqRateMeter(int windowMsec = 1000);

    void tick();
    void reset();

    double intervalMs() const;
    double rateHz() const;
    int windowMsec() const;

private:
    QElapsedTimer m_intervalTimer;
    QElapsedTimer m_rateTimer;
    int m_windowMsec;
    int m_rateAccumulator;

    double m_intervalMs;
    double m_rateHz;
};

} // namespace DevIO
