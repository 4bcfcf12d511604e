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

#ifndef ASENSOR_CAPTURE_OUTPUT_STREAM_H
#define ASENSOR_CAPTURE_OUTPUT_STREAM_H

#include <stddef.h>

#include <string>

#include <asensor/misc/OutputStream.h>

namespace ASensor {

/**
 * OutputStream which collects everything written into a string.
 */
class CaptureOutputStream : public OutputStream {
public:
    void append_buffer (char const *str, size_t length) override
    {
        m_data.append(str, length);
    }

    std::string const & data () const
    {
        return m_data;
    }

    size_t count (char const *needle) const
    {
        size_t count = 0;
        std::string const n(needle);
        for (size_t pos = m_data.find(n); pos != std::string::npos; pos = m_data.find(n, pos + 1)) {
            count++;
        }
        return count;
    }

    bool contains (char const *needle) const
    {
        return m_data.find(needle) != std::string::npos;
    }

    void clear ()
    {
        m_data.clear();
    }

private:
    std::string m_data;
};

}

#endif
