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

#ifndef ASENSOR_MCU_COMMAND_H
#define ASENSOR_MCU_COMMAND_H

#include <stdint.h>
#include <string.h>

#include <asensor/misc/Assert.h>

namespace ASensor {

/**
 * A command to the MCU: the message format and its integer arguments.
 *
 * The format is the message description as known to the MCU protocol,
 * for example "query_hx71x oid=%c rest_ticks=%u". Arguments are given in
 * the order of the parameters in the format.
 */
struct McuCommand {
    static int const MaxArgs = 12;

    char const *format;
    uint32_t args[MaxArgs];
    uint8_t num_args;

    template <typename... Args>
    static McuCommand make (char const *format, Args... args)
    {
        static_assert(sizeof...(Args) <= MaxArgs, "");

        McuCommand cmd = {format, {(uint32_t)args...}, (uint8_t)sizeof...(Args)};
        return cmd;
    }

    /**
     * Return the length of the message name, i.e. the first word of
     * the format.
     */
    inline size_t nameLength () const
    {
        char const *end = strchr(format, ' ');
        return (end != nullptr) ? (size_t)(end - format) : strlen(format);
    }

    inline bool nameIs (char const *name) const
    {
        size_t len = nameLength();
        return strlen(name) == len && memcmp(format, name, len) == 0;
    }

    inline uint32_t arg (int index) const
    {
        ASENSOR_ASSERT(index >= 0 && index < num_args)
        return args[index];
    }
};

}

#endif
