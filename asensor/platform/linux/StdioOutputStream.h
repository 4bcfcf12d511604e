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

#ifndef ASENSOR_STDIO_OUTPUT_STREAM_H
#define ASENSOR_STDIO_OUTPUT_STREAM_H

#include <stddef.h>
#include <stdio.h>

#include <asensor/misc/OutputStream.h>

namespace ASensor {

/**
 * OutputStream writing to a stdio stream, flushed on poke.
 *
 * Write errors are latched and can be checked with @ref hasFailed.
 */
class StdioOutputStream : public OutputStream {
public:
    inline StdioOutputStream (FILE *file) :
        m_file(file),
        m_failed(false)
    {
    }

    void append_buffer (char const *str, size_t length) override
    {
        if (fwrite(str, 1, length, m_file) != length) {
            m_failed = true;
        }
    }

    void poke () override
    {
        if (fflush(m_file) != 0) {
            m_failed = true;
        }
    }

    inline bool hasFailed () const
    {
        return m_failed;
    }

private:
    FILE *m_file;
    bool m_failed;
};

}

#endif
