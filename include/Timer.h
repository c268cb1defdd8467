/******************************************************************************
 *
 * Project:  coastlod
 * Purpose:  Timer
 * Author:   Andreas Vogel
 *
 ***************************************************************************
 *   Copyright (C) 2024 by Andreas Vogel   *
 *                                                                         *
 *   This program is free software; you can redistribute it and/or modify  *
 *   it under the terms of the GNU General Public License as published by  *
 *   the Free Software Foundation; either version 2 of the License, or     *
 *   (at your option) any later version.                                   *
 *                                                                         *
 *   This program is distributed in the hope that it will be useful,       *
 *   but WITHOUT ANY WARRANTY; without even the implied warranty of        *
 *   MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the         *
 *   GNU General Public License for more details.                          *
 *                                                                         *
 *   You should have received a copy of the GNU General Public License     *
 *   along with this program; if not, write to the                         *
 *   Free Software Foundation, Inc.,                                       *
 *   51 Franklin Street, Fifth Floor, Boston, MA 02110-1301,  USA.             *
 ***************************************************************************
 *
 */
#ifndef _TIMER_H
#define _TIMER_H
#include <chrono>
#include <sstream>
#include <vector>
#include <utility>
#include "Types.h"

class Timer
{
public:
    using SteadyTimePoint = std::chrono::steady_clock::time_point;

    static SteadyTimePoint steadyNow()
    {
        return std::chrono::steady_clock::now();
    }
    static int64_t steadyDiffMicros(SteadyTimePoint start, SteadyTimePoint end = steadyNow())
    {
        return std::chrono::duration_cast<std::chrono::microseconds>(end - start).count();
    }
    static int64_t steadyDiffMillis(SteadyTimePoint start, SteadyTimePoint end = steadyNow())
    {
        return std::chrono::duration_cast<std::chrono::milliseconds>(end - start).count();
    }
    /**
     * step durations of one processing run in micro seconds
     * toString: step=us,...,#=total
     */
    class Measure
    {
        typedef std::pair<String, int64_t> Step;
        std::vector<Step> steps;
        SteadyTimePoint start = steadyNow();
        SteadyTimePoint last = start;

    public:
        void add(const String &step)
        {
            SteadyTimePoint now = steadyNow();
            steps.push_back(Step(step, steadyDiffMicros(last, now)));
            last = now;
        }
        String toString() const
        {
            std::stringstream out;
            for (const auto &step : steps)
            {
                out << step.first << "=" << step.second << ",";
            }
            out << "#=" << steadyDiffMicros(start, last);
            return out.str();
        }
    };
};

#endif
