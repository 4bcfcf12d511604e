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

#ifndef ASENSOR_WRAP_COUNTER_H
#define ASENSOR_WRAP_COUNTER_H

#include <stdint.h>

#include <limits>
#include <type_traits>

namespace ASensor {

/**
 * Extend a narrow wrapping counter value to 64 bits.
 * 
 * The result is the value closest to @p ref whose low bits equal
 * @p value, i.e. the new value may be at most half the counter range
 * before or after the reference. The result may be negative when
 * stepping back from a reference near zero.
 * 
 * @tparam T Unsigned type of the wrapping counter (e.g. uint16_t).
 */
template <typename T>
inline int64_t ExtendWrapCounter (int64_t ref, T value)
{
    static_assert(std::is_unsigned<T>::value, "");
    static int const Bits = std::numeric_limits<T>::digits;
    static_assert(Bits < 64, "");
    
    uint64_t const mask = ((uint64_t)1 << Bits) - 1;
    uint64_t const half = (uint64_t)1 << (Bits - 1);
    
    uint64_t diff = ((uint64_t)value - (uint64_t)ref) & mask;
    if (diff >= half) {
        return ref - (int64_t)(mask + 1 - diff);
    }
    return ref + (int64_t)diff;
}

}

#endif
