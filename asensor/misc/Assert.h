/*
 * Copyright (c) 2013 Ambroz Bizjak
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

#ifndef ASENSOR_ASSERT_H
#define ASENSOR_ASSERT_H

#include <asensor/misc/Hints.h>

#ifdef ASENSOR_CONFIG_ASSERT_HANDLER
#define ASENSOR_HAS_EXTERNAL_ASSERT_HANDLER 1
#define ASENSOR_ASSERT_HANDLER ASENSOR_CONFIG_ASSERT_HANDLER
#else
#define ASENSOR_HAS_EXTERNAL_ASSERT_HANDLER 0
#define ASENSOR_ASSERT_HANDLER(msg) \
    ASensor_AssertAbort(__FILE__, __LINE__, msg)
#endif

#define ASENSOR_ASSERT_ABORT(msg) \
    do { ASENSOR_ASSERT_HANDLER(msg); } while (0)

#define ASENSOR_ASSERT_FORCE(e) \
    { \
        if (e) {} else ASENSOR_ASSERT_ABORT(#e); \
    }

#define ASENSOR_ASSERT_FORCE_MSG(e, msg) \
    { \
        if (e) {} else ASENSOR_ASSERT_ABORT(msg); \
    }

#ifdef ASENSOR_CONFIG_ENABLE_ASSERTIONS
#define ASENSOR_ASSERTIONS 1
#define ASENSOR_ASSERT(e) ASENSOR_ASSERT_FORCE(e)
#else
#define ASENSOR_ASSERTIONS 0
#define ASENSOR_ASSERT(e) {}
#endif

#if !ASENSOR_HAS_EXTERNAL_ASSERT_HANDLER

#include <stdio.h>
#include <stdlib.h>

extern "C"
ASENSOR_NO_INLINE ASENSOR_NO_RETURN
inline void ASensor_AssertAbort (char const *file, unsigned int line, char const *msg)
{
    fprintf(stderr, "ASensor %s:%u: Assertion `%s' failed.\n", file, line, msg);
    abort();
}

#endif

#endif
