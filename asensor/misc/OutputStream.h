/*
 * Copyright (c) 2015 Ambroz Bizjak
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

#ifndef ASENSOR_OUTPUT_STREAM_H
#define ASENSOR_OUTPUT_STREAM_H

#include <stdint.h>
#include <stddef.h>
#include <string.h>
#include <inttypes.h>
#include <stdio.h>

#include <asensor/misc/Hints.h>

namespace ASensor {

/**
 * Sink for text output, used for diagnostic messages and for the
 * data written to dump clients.
 * 
 * Implementations provide @ref append_buffer and optionally @ref poke,
 * which is called after a complete line or message has been appended.
 */
class OutputStream {
public:
    virtual void append_buffer (char const *str, size_t length) = 0;
    virtual void poke () {}
    
public:
    ASENSOR_NO_INLINE
    void append_str (char const *str)
    {
        append_buffer(str, strlen(str));
    }
    
    ASENSOR_NO_INLINE
    void append_ch (char ch)
    {
        append_buffer(&ch, 1);
    }
    
    ASENSOR_NO_INLINE
    void append_fp (double x)
    {
        char buf[30];
        int len = snprintf(buf, sizeof(buf), "%.9g", x);
        append_buffer(buf, len);
    }
    
    ASENSOR_NO_INLINE
    void append_uint32 (uint32_t x)
    {
        char buf[11];
        int len = snprintf(buf, sizeof(buf), "%" PRIu32, x);
        append_buffer(buf, len);
    }
    
    ASENSOR_NO_INLINE
    void append_int32 (int32_t x)
    {
        char buf[12];
        int len = snprintf(buf, sizeof(buf), "%" PRIi32, x);
        append_buffer(buf, len);
    }
    
    /**
     * Append a complete message line "//<prefix><tag> <name>\n" and poke.
     * 
     * The prefix is typically empty for events, "Error:" or "Warning:".
     */
    ASENSOR_NO_INLINE
    void append_event (char const *prefix, char const *tag, char const *name)
    {
        append_str("//");
        append_str(prefix);
        append_str(tag);
        append_ch(' ');
        append_str(name);
        append_ch('\n');
        poke();
    }
    
    ASENSOR_NO_INLINE
    void append_error (char const *errstr)
    {
        append_str("Error:");
        append_str(errstr);
        append_ch('\n');
        poke();
    }
};

}

#endif
