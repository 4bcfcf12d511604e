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

#ifndef ASENSOR_LINUX_PLATFORM_H
#define ASENSOR_LINUX_PLATFORM_H

#include <stdint.h>

#include <atomic>

#include <asensor/misc/NonCopyable.h>
#include <asensor/platform/PlatformFacade.h>

namespace ASensor {

/**
 * Platform implementation for Linux based on epoll, timerfd and eventfd.
 *
 * Time is CLOCK_MONOTONIC in nanoseconds. All timers are dispatched from
 * the thread which calls @ref run. Only @ref quit may be called from other
 * threads.
 */
class LinuxPlatform :
    private NonCopyable<LinuxPlatform>
{
public:
    using TimeType = uint64_t;

    static constexpr double TimeFreq = 1e9;

    class Timer;

    LinuxPlatform ();

    ~LinuxPlatform ();

    TimeType getTime ();

    inline TimeType getEventTime ()
    {
        return m_event_time;
    }

    /**
     * Run the event loop until @ref quit is called.
     */
    void run ();

    /**
     * Request the event loop to return from @ref run. Thread safe.
     */
    void quit ();

private:
    void control_epoll (int op, int fd, void *data_ptr);
    void link_timer (Timer *tim);
    void unlink_timer (Timer *tim);
    Timer * first_expired_timer (TimeType now);
    void arm_timerfd ();
    void consume_fd (int fd);

    int m_epoll_fd;
    int m_timer_fd;
    int m_event_fd;
    TimeType m_event_time;
    Timer *m_timers;
    std::atomic<bool> m_quit;
};

class LinuxPlatform::Timer :
    public PlatformRef<LinuxPlatform>,
    private NonCopyable<Timer>
{
    friend class LinuxPlatform;

public:
    Timer (PlatformRef<LinuxPlatform> ref);

    ~Timer ();

    inline bool isSet () const
    {
        return m_is_set;
    }

    inline TimeType getSetTime () const
    {
        return m_set_time;
    }

    void unset ();

    void setAt (TimeType abs_time);

protected:
    virtual void handleTimerExpired () = 0;

private:
    Timer *m_prev;
    Timer *m_next;
    TimeType m_set_time;
    bool m_is_set;
};

using LinuxPlatformFacade = PlatformFacade<LinuxPlatform>;

}

#endif
