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
#include <errno.h>

#include <time.h>
#include <unistd.h>
#include <sys/epoll.h>
#include <sys/timerfd.h>
#include <sys/eventfd.h>

#include <asensor/misc/Assert.h>

#include "LinuxPlatform.h"

namespace ASensor {

static int const NumEpollEvents = 4;

LinuxPlatform::LinuxPlatform () :
    m_timers(nullptr),
    m_quit(false)
{
    // Create the epoll instance.
    m_epoll_fd = ::epoll_create1(EPOLL_CLOEXEC);
    ASENSOR_ASSERT_FORCE(m_epoll_fd >= 0)

    // Create the timerfd and add to epoll.
    m_timer_fd = ::timerfd_create(CLOCK_MONOTONIC, TFD_NONBLOCK|TFD_CLOEXEC);
    ASENSOR_ASSERT_FORCE(m_timer_fd >= 0)
    control_epoll(EPOLL_CTL_ADD, m_timer_fd, &m_timer_fd);

    // Create the eventfd used by quit and add to epoll.
    m_event_fd = ::eventfd(0, EFD_NONBLOCK|EFD_CLOEXEC);
    ASENSOR_ASSERT_FORCE(m_event_fd >= 0)
    control_epoll(EPOLL_CTL_ADD, m_event_fd, &m_event_fd);

    m_event_time = getTime();
}

LinuxPlatform::~LinuxPlatform ()
{
    ASENSOR_ASSERT(m_timers == nullptr)

    ::close(m_event_fd);
    ::close(m_timer_fd);
    ::close(m_epoll_fd);
}

auto LinuxPlatform::getTime () -> TimeType
{
    struct timespec ts;
    int res = ::clock_gettime(CLOCK_MONOTONIC, &ts);
    ASENSOR_ASSERT_FORCE(res == 0)

    return (TimeType)ts.tv_sec * 1000000000 + (TimeType)ts.tv_nsec;
}

void LinuxPlatform::run ()
{
    while (!m_quit.load()) {
        m_event_time = getTime();

        // Dispatch expired timers in order of their expiration times.
        // A handler may set timers again, possibly already expired ones.
        while (Timer *tim = first_expired_timer(m_event_time)) {
            unlink_timer(tim);
            tim->handleTimerExpired();

            if (m_quit.load()) {
                return;
            }
        }

        arm_timerfd();

        struct epoll_event events[NumEpollEvents];
        int wait_res;
        while (true) {
            wait_res = ::epoll_wait(m_epoll_fd, events, NumEpollEvents, -1);
            if (wait_res >= 0) {
                break;
            }
            int err = errno;
            ASENSOR_ASSERT_FORCE(err == EINTR)
        }

        for (int i = 0; i < wait_res; i++) {
            consume_fd(*(int *)events[i].data.ptr);
        }
    }
}

void LinuxPlatform::quit ()
{
    m_quit.store(true);

    uint64_t event_count = 1;
    ssize_t write_res = ::write(m_event_fd, &event_count, sizeof(event_count));
    if (write_res < 0) {
        // The counter can only overflow after very many quit requests.
        int err = errno;
        ASENSOR_ASSERT_FORCE(err == EAGAIN || err == EWOULDBLOCK)
    } else {
        ASENSOR_ASSERT_FORCE(write_res == sizeof(event_count))
    }
}

void LinuxPlatform::control_epoll (int op, int fd, void *data_ptr)
{
    struct epoll_event ev = {};
    ev.events = EPOLLIN;
    ev.data.ptr = data_ptr;

    int res = ::epoll_ctl(m_epoll_fd, op, fd, &ev);
    ASENSOR_ASSERT_FORCE(res == 0)
}

void LinuxPlatform::link_timer (Timer *tim)
{
    tim->m_prev = nullptr;
    tim->m_next = m_timers;
    if (m_timers != nullptr) {
        m_timers->m_prev = tim;
    }
    m_timers = tim;
    tim->m_is_set = true;
}

void LinuxPlatform::unlink_timer (Timer *tim)
{
    ASENSOR_ASSERT(tim->m_is_set)

    if (tim->m_prev != nullptr) {
        tim->m_prev->m_next = tim->m_next;
    } else {
        m_timers = tim->m_next;
    }
    if (tim->m_next != nullptr) {
        tim->m_next->m_prev = tim->m_prev;
    }
    tim->m_is_set = false;
}

auto LinuxPlatform::first_expired_timer (TimeType now) -> Timer *
{
    Timer *first = nullptr;
    for (Timer *tim = m_timers; tim != nullptr; tim = tim->m_next) {
        if (tim->m_set_time <= now &&
            (first == nullptr || tim->m_set_time < first->m_set_time))
        {
            first = tim;
        }
    }
    return first;
}

void LinuxPlatform::arm_timerfd ()
{
    struct itimerspec its = {};

    Timer *first = nullptr;
    for (Timer *tim = m_timers; tim != nullptr; tim = tim->m_next) {
        if (first == nullptr || tim->m_set_time < first->m_set_time) {
            first = tim;
        }
    }

    if (first != nullptr) {
        // A zero it_value would disarm the timer.
        TimeType abs_time = (first->m_set_time > 0) ? first->m_set_time : 1;
        its.it_value.tv_sec = abs_time / 1000000000;
        its.it_value.tv_nsec = abs_time % 1000000000;
    }

    int res = ::timerfd_settime(m_timer_fd, TFD_TIMER_ABSTIME, &its, nullptr);
    ASENSOR_ASSERT_FORCE(res == 0)
}

void LinuxPlatform::consume_fd (int fd)
{
    uint64_t count = 0;
    ssize_t read_res = ::read(fd, &count, sizeof(count));
    if (read_res < 0) {
        // The timerfd may have been re-armed after it became readable.
        int err = errno;
        ASENSOR_ASSERT_FORCE(err == EAGAIN || err == EWOULDBLOCK)
    } else {
        ASENSOR_ASSERT_FORCE(read_res == sizeof(count))
    }
}

LinuxPlatform::Timer::Timer (PlatformRef<LinuxPlatform> ref) :
    PlatformRef<LinuxPlatform>(ref),
    m_prev(nullptr),
    m_next(nullptr),
    m_set_time(0),
    m_is_set(false)
{
}

LinuxPlatform::Timer::~Timer ()
{
    unset();
}

void LinuxPlatform::Timer::unset ()
{
    if (m_is_set) {
        platformImpl()->unlink_timer(this);
    }
}

void LinuxPlatform::Timer::setAt (TimeType abs_time)
{
    if (!m_is_set) {
        platformImpl()->link_timer(this);
    }
    m_set_time = abs_time;
}

}
