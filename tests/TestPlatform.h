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

#ifndef ASENSOR_TEST_PLATFORM_H
#define ASENSOR_TEST_PLATFORM_H

#include <stdint.h>
#include <math.h>

#include <asensor/misc/Assert.h>
#include <asensor/misc/NonCopyable.h>
#include <asensor/platform/PlatformFacade.h>
#include <asensor/sim/SimulatedMcu.h>

namespace ASensor {

/**
 * Platform implementation with manually advanced time in microseconds.
 */
class TestPlatform :
    private NonCopyable<TestPlatform>
{
public:
    using TimeType = uint64_t;

    static constexpr double TimeFreq = 1e6;

    class Timer :
        public PlatformRef<TestPlatform>,
        private NonCopyable<Timer>
    {
        friend class TestPlatform;

    public:
        Timer (PlatformRef<TestPlatform> ref) :
            PlatformRef<TestPlatform>(ref),
            m_next(nullptr),
            m_set_time(0),
            m_is_set(false)
        {
        }

        ~Timer ()
        {
            unset();
        }

        bool isSet () const
        {
            return m_is_set;
        }

        TimeType getSetTime () const
        {
            return m_set_time;
        }

        void unset ()
        {
            if (m_is_set) {
                platformImpl()->unlink(this);
            }
        }

        void setAt (TimeType abs_time)
        {
            unset();
            m_set_time = abs_time;
            m_is_set = true;
            m_next = platformImpl()->m_timers;
            platformImpl()->m_timers = this;
        }

    protected:
        virtual void handleTimerExpired () = 0;

    private:
        Timer *m_next;
        TimeType m_set_time;
        bool m_is_set;
    };

    TestPlatform () :
        m_time(0),
        m_timers(nullptr)
    {
    }

    TimeType getTime ()
    {
        return m_time;
    }

    TimeType getEventTime ()
    {
        return m_time;
    }

    /**
     * Advance time to abs_time, dispatching expired timers in order at
     * their expiration times.
     */
    void advanceTo (TimeType abs_time)
    {
        while (true) {
            Timer *first = nullptr;
            for (Timer *tim = m_timers; tim != nullptr; tim = tim->m_next) {
                if (tim->m_set_time <= abs_time &&
                    (first == nullptr || tim->m_set_time < first->m_set_time))
                {
                    first = tim;
                }
            }
            if (first == nullptr) {
                break;
            }
            if (first->m_set_time > m_time) {
                m_time = first->m_set_time;
            }
            unlink(first);
            first->handleTimerExpired();
        }
        m_time = abs_time;
    }

private:
    void unlink (Timer *tim)
    {
        Timer **link = &m_timers;
        while (*link != tim) {
            ASENSOR_ASSERT_FORCE(*link != nullptr)
            link = &(*link)->m_next;
        }
        *link = tim->m_next;
        tim->m_is_set = false;
    }

    TimeType m_time;
    Timer *m_timers;
};

using TestPlatformFacade = PlatformFacade<TestPlatform>;

/**
 * Advance the platform and the simulated MCU together in 1 ms steps.
 * The MCU clock is kept at platform time times the MCU frequency.
 */
inline void RunSimulation (TestPlatform &platform, SimulatedMcu &mcu, double seconds)
{
    uint64_t const step = 1000;
    uint64_t end = platform.getTime() + (uint64_t)llround(seconds * TestPlatform::TimeFreq);

    while (platform.getTime() < end) {
        uint64_t next = platform.getTime() + step;
        if (next > end) {
            next = end;
        }
        mcu.advanceClock(mcu.secondsToClock(next / TestPlatform::TimeFreq));
        platform.advanceTo(next);
    }
}

}

#endif
