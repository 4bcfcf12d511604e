/*
 * Copyright (c) 2016 Ambroz Bizjak
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

#ifndef ASENSOR_JSON_BUILDER_H
#define ASENSOR_JSON_BUILDER_H

#include <stddef.h>
#include <stdint.h>
#include <string.h>
#include <stdio.h>
#include <inttypes.h>
#include <math.h>

#include <asensor/misc/Hints.h>
#include <asensor/misc/Assert.h>

namespace ASensor {

struct JsonUint32 {
    uint32_t val;
};

struct JsonInt32 {
    int32_t val;
};

struct JsonDouble {
    double val;
};

// Time in seconds, written with microsecond resolution.
struct JsonTime {
    double val;
};

struct JsonBool {
    bool val;
};

struct JsonNull {};

// A string which contains no characters needing escaping.
struct JsonSafeString {
    char const *val;
};

/**
 * Writes JSON text into a fixed buffer.
 *
 * Output which does not fit is cut off and @ref isTruncated reports it.
 * Commas between elements are inserted automatically.
 */
class JsonBuilder {
public:
    void loadBuffer (char *buffer, size_t buffer_total_size)
    {
        ASENSOR_ASSERT(buffer_total_size > 0)

        m_buffer = buffer;
        m_buffer_size = buffer_total_size - 1;
        m_length = 0;
        m_truncated = false;
        m_inhibit_comma = true;
        m_buffer[0] = '\0';
    }

    size_t getLength () const
    {
        return m_length;
    }

    char const * getData () const
    {
        return m_buffer;
    }

    bool isTruncated () const
    {
        return m_truncated;
    }

    void add (JsonUint32 val)
    {
        adding_element();
        add_formatted("%" PRIu32, val.val);
    }

    void add (JsonInt32 val)
    {
        adding_element();
        add_formatted("%" PRIi32, val.val);
    }

    void add (JsonDouble val)
    {
        adding_element();
        if (ASENSOR_UNLIKELY(!isfinite(val.val))) {
            add_token("null");
        } else {
            add_formatted("%.9g", val.val);
        }
    }

    void add (JsonTime val)
    {
        adding_element();
        if (ASENSOR_UNLIKELY(!isfinite(val.val))) {
            add_token("null");
        } else {
            add_formatted("%.6f", val.val);
        }
    }

    void add (JsonBool val)
    {
        adding_element();
        add_token(val.val ? "true" : "false");
    }

    void add (JsonNull)
    {
        adding_element();
        add_token("null");
    }

    void add (JsonSafeString val)
    {
        adding_element();
        add_char('"');
        add_token(val.val);
        add_char('"');
    }

    /**
     * Add a string, escaping characters as needed.
     */
    void addString (char const *str)
    {
        adding_element();
        add_char('"');
        for (; *str != '\0'; str++) {
            add_string_char(*str);
        }
        add_char('"');
    }

    void startArray ()
    {
        start_list('[');
    }

    void endArray ()
    {
        end_list(']');
    }

    void startObject ()
    {
        start_list('{');
    }

    void endObject ()
    {
        end_list('}');
    }

    template <typename TVal>
    void addSafeKeyVal (char const *key, TVal val)
    {
        add_key(key);
        add(val);
    }

    void addKeyArray (char const *key)
    {
        add_key(key);
        startArray();
    }

private:
    template <typename... Args>
    void add_formatted (char const *fmt, Args... args)
    {
        size_t rem = m_buffer_size - m_length;
        int res = snprintf(m_buffer + m_length, rem + 1, fmt, args...);
        if (res < 0 || (size_t)res > rem) {
            m_truncated = true;
            m_length = m_buffer_size;
        } else {
            m_length += res;
        }
    }

    void add_char (char ch)
    {
        if (ASENSOR_LIKELY(m_length < m_buffer_size)) {
            m_buffer[m_length++] = ch;
            m_buffer[m_length] = '\0';
        } else {
            m_truncated = true;
        }
    }

    void add_token (char const *token)
    {
        while (*token != '\0') {
            add_char(*token++);
        }
    }

    void add_string_char (char ch)
    {
        switch (ch) {
            case '\\':
            case '"': {
                add_char('\\');
                add_char(ch);
            } break;

            case '\n': {
                add_token("\\n");
            } break;

            default: {
                if (ASENSOR_UNLIKELY((unsigned char)ch < 0x20)) {
                    char esc[7];
                    snprintf(esc, sizeof(esc), "\\u%04X", (unsigned int)(unsigned char)ch);
                    add_token(esc);
                } else {
                    add_char(ch);
                }
            } break;
        }
    }

    void add_key (char const *key)
    {
        add(JsonSafeString{key});
        add_char(':');
        m_inhibit_comma = true;
    }

    void start_list (char paren)
    {
        adding_element();
        add_char(paren);
        m_inhibit_comma = true;
    }

    void end_list (char paren)
    {
        add_char(paren);
        m_inhibit_comma = false;
    }

    void adding_element ()
    {
        if (m_inhibit_comma) {
            m_inhibit_comma = false;
        } else {
            add_char(',');
        }
    }

    char *m_buffer;
    size_t m_buffer_size;
    size_t m_length;
    bool m_truncated;
    bool m_inhibit_comma;
};

}

#endif
