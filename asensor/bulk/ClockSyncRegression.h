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

#ifndef ASENSOR_CLOCK_SYNC_REGRESSION_H
#define ASENSOR_CLOCK_SYNC_REGRESSION_H

#include <stdint.h>

#include <asensor/misc/Err.h>

namespace ASensor {

/**
 * Maps a device sample counter (the chip clock) to print time using an
 * ordinary least squares fit over a sliding window of recent
 * (tick, time) observations.
 *
 * The fitted line is kept in the form
 *   time = mean_time + (tick - mean_tick) * period
 * where the means are those of the points in the window. The period
 * (seconds per tick) is always positive.
 *
 * Before any observation the mapping is tick * nominal_period. With a
 * single observation (after @ref reset) the mapping passes through that
 * observation with the nominal period.
 *
 * Each new observation is checked against the previous one: the tick
 * must not decrease and the time must increase. Once the window spans
 * at least @ref MinRateCheckTicks ticks, the period implied by the new
 * observation and the oldest one in the window must also be within
 * max_period_ratio of the nominal period. Rejected observations are not
 * used. After @ref MaxConsecutiveRejects rejections in a row, the state
 * is reset onto the newest observation.
 */
class ClockSyncRegression {
public:
    static int const MaxPoints = 64;
    static int const MaxConsecutiveRejects = 3;
    static uint64_t const MinRateCheckTicks = 16;

    /**
     * Linear mapping: time = base_time + (tick - base_tick) * period.
     */
    struct Translation {
        double base_time;
        double base_tick;
        double period;

        inline double timeOf (double tick) const
        {
            return base_time + (tick - base_tick) * period;
        }
    };

    /**
     * Construct with no observations.
     *
     * @param nominal_period Expected seconds per tick (1 / sample rate), >0.
     * @param window_ticks Length of the regression window in ticks, >0.
     * @param converge_ticks Ticks over which @ref getTimeTranslation converges
     *        from the last emitted timestamp back to the fitted line, >0.
     * @param max_period_ratio Maximum ratio between the implied and the
     *        nominal period, >1.
     */
    ClockSyncRegression (double nominal_period, double window_ticks,
                         double converge_ticks, double max_period_ratio);

    /**
     * Discard all state and restart from a single observation.
     */
    void reset (uint64_t tick, double time);

    /**
     * Discard all state including observations.
     */
    void clear ();

    /**
     * Add an observation and refit.
     *
     * @return SUCCESS if the observation was used, CLOCK_DESYNC if it was
     *         rejected, CLOCK_RESYNC if it caused a reset.
     */
    SensorErr update (uint64_t tick, double time);

    double predictTime (double tick) const;

    double predictTick (double time) const;

    inline double getPeriod () const
    {
        return m_period;
    }

    inline int getNumPoints () const
    {
        return m_count;
    }

    /**
     * Whether the mapping is based on a fit of at least two distinct ticks.
     */
    inline bool hasFit () const
    {
        return m_have_fit;
    }

    /**
     * Record that timestamps were emitted up to the given tick.
     *
     * The time of the tick is computed from the current
     * @ref getTimeTranslation.
     */
    void setLastChipClock (double tick);

    /**
     * Return the mapping to use for timestamping new samples.
     *
     * If no timestamps were emitted since the last reset this is the
     * fitted line. Otherwise the mapping starts at the last emitted
     * (tick, time) and meets the fitted line converge_ticks later, so
     * that consecutive batches do not jump.
     */
    Translation getTimeTranslation () const;

private:
    struct Point {
        uint64_t tick;
        double time;
    };

    Point const & point_at (int index) const;
    void push_point (uint64_t tick, double time);
    void evict_points ();
    void refit ();
    bool period_plausible (double period) const;

    double m_nominal_period;
    double m_window_ticks;
    double m_converge_ticks;
    double m_max_period_ratio;
    Point m_points[MaxPoints];
    int m_start;
    int m_count;
    int m_rejects;
    bool m_have_fit;
    double m_mean_tick;
    double m_mean_time;
    double m_period;
    bool m_have_last;
    double m_last_tick;
    double m_last_time;
};

}

#endif
