/*
 * Copyright (c) 2017 Ambroz Bizjak
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

#ifndef ASENSOR_PLATFORM_FACADE_H
#define ASENSOR_PLATFORM_FACADE_H

#include <stdint.h>
#include <math.h>

#include <type_traits>
#include <limits>

#include <asensor/misc/NonCopyable.h>

namespace ASensor {

template <typename Impl>
class PlatformFacade;

/**
 * A reference to the platform implementation.
 *
 * This is a pointer to the platform implementation (Impl). It is designed
 * to be stored by classes which need access to the platform, which usually
 * access it through the @ref PlatformFacade wrapper obtained via
 * @ref platform.
 *
 * @tparam Impl The platform implementation class. It must provide:
 *         - TimeType, an unsigned integer type of at least 32 bits,
 *         - TimeFreq, the tick frequency in Hz,
 *         - getTime(), the current time,
 *         - getEventTime(), the time of the event being dispatched,
 *         - Timer, a class constructible from PlatformRef<Impl> with
 *           isSet(), getSetTime(), unset(), setAt(TimeType) and a
 *           protected pure virtual handleTimerExpired().
 */
template <typename Impl>
class PlatformRef {
public:
    inline PlatformRef (Impl *impl) :
        m_platform_impl(impl)
    {
    }

    inline PlatformRef ref () const
    {
        return *this;
    }

    inline PlatformFacade<Impl> platform () const
    {
        return PlatformFacade<Impl>(*this);
    }

    inline Impl * platformImpl () const
    {
        return m_platform_impl;
    }

private:
    Impl *m_platform_impl;
};

/**
 * A wrapper to the platform implementation.
 *
 * Provides the time functions of the implementation together with
 * conversions between ticks and seconds, and a @ref Timer wrapper.
 */
template <typename Impl>
class PlatformFacade :
    private PlatformRef<Impl>
{
public:
    using Ref = PlatformRef<Impl>;

    inline PlatformFacade (Ref ref) :
        Ref(ref)
    {
    }

    inline Ref ref () const
    {
        return static_cast<Ref const &>(*this);
    }

    /**
     * An unsigned integer type representing time in platform-defined units.
     */
    using TimeType = typename Impl::TimeType;

    static_assert(std::is_integral<TimeType>::value, "");
    static_assert(std::is_unsigned<TimeType>::value, "");
    static_assert(std::numeric_limits<TimeType>::digits >= 32, "");

    /**
     * The frequency of the clock in Hz.
     */
    static constexpr double TimeFreq = Impl::TimeFreq;

    static_assert(TimeFreq >= 100.0, "");

    /**
     * Get the current time in ticks.
     */
    inline TimeType getTime () const
    {
        return ref().platformImpl()->getTime();
    }

    /**
     * Get the time of the event currently being dispatched.
     *
     * This is not significantly earlier than the current time and is
     * the base for relative timer expiration times.
     */
    inline TimeType getEventTime () const
    {
        return ref().platformImpl()->getEventTime();
    }

    /**
     * Convert a duration in seconds to ticks, rounding to nearest.
     *
     * @param seconds Non-negative duration.
     */
    inline static TimeType secondsToTicks (double seconds)
    {
        return (TimeType)round(seconds * TimeFreq);
    }

    inline static double ticksToSeconds (TimeType ticks)
    {
        return ticks / TimeFreq;
    }

    /**
     * Provides notification when the clock reaches a specific time.
     *
     * The handleTimerExpired virtual function of the implementation
     * timer must be overridden by the user. When it is called the timer
     * is already unset.
     */
    class Timer :
        private NonCopyable<Timer>,
        public Impl::Timer
    {
        using ImplTimer = typename Impl::Timer;

    public:
        inline Timer (PlatformFacade platform) :
            ImplTimer(platform.ref())
        {
        }

        inline PlatformFacade platform () const
        {
            return ImplTimer::ref().platform();
        }

        /**
         * Set the timer to expire after the given number of ticks
         * relative to the event time.
         */
        inline void setAfter (TimeType after_ticks)
        {
            ImplTimer::setAt(platform().getEventTime() + after_ticks);
        }
    };
};

}

#endif
