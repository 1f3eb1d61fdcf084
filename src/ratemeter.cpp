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

#include "ratemeter.h"

#include <limits>

using namespace DevIO;

DaqRateMeter::DaqRateMeter(int windowMsec)
    : m_windowMsec(windowMsec)
{
    reset();
}

void DaqRateMeter::tick()
{
    if (!m_intervalTimer.isValid()) {
        m_intervalTimer.start();
        m_rateTimer.start();
        return;
    }

    m_intervalMs = static_cast<double>(m_intervalTimer.restart());

    m_rateAccumulator++;
    const auto dT = m_rateTimer.elapsed();
    if (dT >= m_windowMsec) {
        m_rateTimer.restart();
        if (dT > 0)
            m_rateHz = m_rateAccumulator / static_cast<double>(dT) * 1e3;
        else
            m_rateHz = std::numeric_limits<double>::quiet_NaN();
        m_rateAccumulator = 0;
    }
}

void DaqRateMeter::reset()
{
    m_intervalTimer.invalidate();
    m_rateTimer.invalidate();
    m_rateAccumulator = 0;
    m_intervalMs = std::numeric_limits<double>::quiet_NaN();
    m_rateHz = std::numeric_limits<double>::quiet_NaN();
}

double DaqRateMeter::intervalMs() const
{
    return m_intervalMs;
}

double DaqRateMeter::rateHz() const
{
    return m_rateHz;
}

int DaqRateMeter::windowMsec() const
{
    return m_windowMsec;
}
