/*
 * Copyright (c) 2026 The asensor Authors
 * All rights reserved.
 * 
 * Redistribution and use in source and binary forms, with or without
 * modification, are permitted provided that the following conditions are met:
 * 1. Redistributions of source code must retain the above copyright
 *    notice, this list of conditions and the following disclaimer.
 * 2. Redistributions in binary form must reproduce the above copyright
 *    notice, this list of conditions and the following disclaimer in the
 *    documentation and/or other materials provided with the distribution.
 * 
 * THIS SOFTWARE IS PROVIDED BY THE COPYRIGHT HOLDERS AND CONTRIBUTORS "AS IS" AND
 * ANY EXPRESS OR IMPLIED WARRANTIES, INCLUDING, BUT NOT LIMITED TO, THE IMPLIED
 * WARRANTIES OF MERCHANTABILITY AND FITNESS FOR A PARTICULAR PURPOSE ARE
 * DISCLAIMED. IN NO EVENT SHALL THE AUTHOR BE LIABLE FOR ANY
 * DIRECT, INDIRECT, INCIDENTAL, SPECIAL, EXEMPLARY, OR CONSEQUENTIAL DAMAGES
 * (INCLUDING, BUT NOT LIMITED TO, PROCUREMENT OF SUBSTITUTE GOODS OR SERVICES;
 * LOSS OF USE, DATA, OR PROFITS; OR BUSINESS INTERRUPTION) HOWEVER CAUSED AND
 * ON ANY THEORY OF LIABILITY, WHETHER IN CONTRACT, STRICT LIABILITY, OR TORT
 * (INCLUDING NEGLIGENCE OR OTHERWISE) ARISING IN ANY WAY OUT OF THE USE OF THIS
 * SOFTWARE, EVEN IF ADVISED OF THE POSSIBILITY OF SUCH DAMAGE.
 */

#include <stdint.h>

#include <asensor/misc/Assert.h>

#include "ClockSyncRegression.h"

namespace ASensor {

ClockSyncRegression::ClockSyncRegression (double nominal_period, double window_ticks,
                                          double converge_ticks, double max_period_ratio) :
    m_nominal_period(nominal_period),
    m_window_ticks(window_ticks),
    m_converge_ticks(converge_ticks),
    m_max_period_ratio(max_period_ratio)
{
    ASENSOR_ASSERT(nominal_period > 0.0)
    ASENSOR_ASSERT(window_ticks > 0.0)
    ASENSOR_ASSERT(converge_ticks > 0.0)
    ASENSOR_ASSERT(max_period_ratio > 1.0)

    clear();
}

void ClockSyncRegression::clear ()
{
    m_start = 0;
    m_count = 0;
    m_rejects = 0;
    m_have_fit = false;
    m_mean_tick = 0.0;
    m_mean_time = 0.0;
    m_period = m_nominal_period;
    m_have_last = false;
    m_last_tick = 0.0;
    m_last_time = 0.0;
}

void ClockSyncRegression::reset (uint64_t tick, double time)
{
    clear();
    push_point(tick, time);
    refit();
}

SensorErr ClockSyncRegression::update (uint64_t tick, double time)
{
    if (m_count == 0) {
        reset(tick, time);
        return SensorErr::SUCCESS;
    }

    Point const &newest = point_at(m_count - 1);
    Point const &oldest = point_at(0);

    bool ok = tick >= newest.tick && time > newest.time;

    if (ok && tick - oldest.tick >= MinRateCheckTicks) {
        double implied = (time - oldest.time) / (double)(tick - oldest.tick);
        ok = period_plausible(implied);
    }

    if (!ok) {
        if (++m_rejects >= MaxConsecutiveRejects) {
            reset(tick, time);
            return SensorErr::CLOCK_RESYNC;
        }
        return SensorErr::CLOCK_DESYNC;
    }

    m_rejects = 0;
    push_point(tick, time);
    evict_points();
    refit();

    return SensorErr::SUCCESS;
}

double ClockSyncRegression::predictTime (double tick) const
{
    return m_mean_time + (tick - m_mean_tick) * m_period;
}

double ClockSyncRegression::predictTick (double time) const
{
    return m_mean_tick + (time - m_mean_time) / m_period;
}

void ClockSyncRegression::setLastChipClock (double tick)
{
    Translation tr = getTimeTranslation();
    m_last_time = tr.timeOf(tick);
    m_last_tick = tick;
    m_have_last = true;
}

auto ClockSyncRegression::getTimeTranslation () const -> Translation
{
    if (!m_have_last) {
        return Translation{m_mean_time, m_mean_tick, m_period};
    }

    // Aim for the point on the fitted line converge_ticks after the
    // last emitted tick.
    double target_time = predictTime(m_last_tick + m_converge_ticks);
    double period = (target_time - m_last_time) / m_converge_ticks;

    double min_period = m_period / m_max_period_ratio;
    double max_period = m_period * m_max_period_ratio;
    if (period < min_period) {
        period = min_period;
    } else if (period > max_period) {
        period = max_period;
    }

    return Translation{m_last_time, m_last_tick, period};
}

auto ClockSyncRegression::point_at (int index) const -> Point const &
{
    ASENSOR_ASSERT(index >= 0 && index < m_count)
    return m_points[(m_start + index) % MaxPoints];
}

void ClockSyncRegression::push_point (uint64_t tick, double time)
{
    if (m_count == MaxPoints) {
        m_start = (m_start + 1) % MaxPoints;
        m_count--;
    }
    m_points[(m_start + m_count) % MaxPoints] = Point{tick, time};
    m_count++;
}

void ClockSyncRegression::evict_points ()
{
    uint64_t newest_tick = point_at(m_count - 1).tick;

    while (m_count > 2 && (double)(newest_tick - point_at(0).tick) > m_window_ticks) {
        m_start = (m_start + 1) % MaxPoints;
        m_count--;
    }
}

void ClockSyncRegression::refit ()
{
    ASENSOR_ASSERT(m_count > 0)

    // Work relative to the oldest point for precision.
    Point const &ref = point_at(0);

    double sum_x = 0.0;
    double sum_y = 0.0;
    for (int i = 0; i < m_count; i++) {
        Point const &p = point_at(i);
        sum_x += (double)(p.tick - ref.tick);
        sum_y += p.time - ref.time;
    }
    double mean_x = sum_x / m_count;
    double mean_y = sum_y / m_count;

    double sxx = 0.0;
    double sxy = 0.0;
    for (int i = 0; i < m_count; i++) {
        Point const &p = point_at(i);
        double dx = (double)(p.tick - ref.tick) - mean_x;
        double dy = (p.time - ref.time) - mean_y;
        sxx += dx * dx;
        sxy += dx * dy;
    }

    m_mean_tick = (double)ref.tick + mean_x;
    m_mean_time = ref.time + mean_y;

    // With fewer than two distinct ticks the slope is undefined and the
    // previous one is kept.
    if (sxx > 0.0) {
        double slope = sxy / sxx;
        if (period_plausible(slope)) {
            m_period = slope;
            m_have_fit = true;
        }
    }
}

bool ClockSyncRegression::period_plausible (double period) const
{
    return period > 0.0 &&
           period >= m_nominal_period / m_max_period_ratio &&
           period <= m_nominal_period * m_max_period_ratio;
}

}
