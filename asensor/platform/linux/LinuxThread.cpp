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

#include <pthread.h>

#include <asensor/misc/Assert.h>

#include "LinuxThread.h"

namespace ASensor {

LinuxThread::LinuxThread () :
    m_running(false)
{
}

LinuxThread::~LinuxThread ()
{
    ASENSOR_ASSERT(!m_running)
}

void LinuxThread::start (FuncType start_func)
{
    ASENSOR_ASSERT(!m_running)
    ASENSOR_ASSERT(start_func)

    m_start_func = start_func;

    int res = ::pthread_create(&m_thread, nullptr, &LinuxThread::thread_trampoline, this);
    ASENSOR_ASSERT_FORCE_MSG(res == 0, "pthread_create failed")

    m_running = true;
}

void LinuxThread::join ()
{
    ASENSOR_ASSERT(m_running)

    int res = ::pthread_join(m_thread, nullptr);
    ASENSOR_ASSERT_FORCE(res == 0)

    m_running = false;
}

void * LinuxThread::thread_trampoline (void *arg)
{
    LinuxThread *o = static_cast<LinuxThread *>(arg);
    o->m_start_func();
    return nullptr;
}

}
