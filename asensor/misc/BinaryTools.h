/*
 * Copyright (c) 2017 Ambroz Bizjak
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

#ifndef ASENSOR_BINARY_TOOLS_H
#define ASENSOR_BINARY_TOOLS_H

#include <stdint.h>

#include <type_traits>
#include <limits>

#include <asensor/misc/Hints.h>

namespace ASensor {

namespace BinaryToolsPrivate {
    
    template <typename T>
    constexpr bool IsValidType ()
    {
        return std::is_integral<T>::value && std::numeric_limits<T>::radix == 2 &&
               std::numeric_limits<T>::digits + std::is_signed<T>::value <= 64;
    }
    
    template <typename UT, bool BigEndian>
    struct UnsignedCodec {
        static_assert(std::is_unsigned<UT>::value, "");
        static int const Bytes = sizeof(UT);
        
        ASENSOR_ALWAYS_INLINE
        static UT read (char const *src)
        {
            UT val = 0;
            for (int i = 0; i < Bytes; i++) {
                int j = BigEndian ? (Bytes - 1 - i) : i;
                val |= (UT)((unsigned char)src[i] & 0xFF) << (8 * j);
            }
            return val;
        }
        
        ASENSOR_ALWAYS_INLINE
        static void write (UT value, char *dst)
        {
            for (int i = 0; i < Bytes; i++) {
                int j = BigEndian ? (Bytes - 1 - i) : i;
                ((unsigned char *)dst)[i] = (value >> (8 * j)) & 0xFF;
            }
        }
    };
}

template <bool BigEndian_>
struct BinaryEndian {
    static bool const BigEndian = BigEndian_;
};

using BinaryLittleEndian = BinaryEndian<false>;
using BinaryBigEndian = BinaryEndian<true>;

/**
 * Read an integer of type T from a byte buffer in the given byte order.
 * 
 * Signed types are decoded as two's complement.
 */
template <typename T, typename Endian>
inline T ReadBinaryInt (char const *src)
{
    static_assert(BinaryToolsPrivate::IsValidType<T>(), "");
    using UT = std::make_unsigned_t<T>;
    
    UT uval = BinaryToolsPrivate::UnsignedCodec<UT, Endian::BigEndian>::read(src);
    return reinterpret_cast<T const &>(uval);
}

/**
 * Write an integer of type T to a byte buffer in the given byte order.
 */
template <typename T, typename Endian>
inline void WriteBinaryInt (T value, char *dst)
{
    static_assert(BinaryToolsPrivate::IsValidType<T>(), "");
    using UT = std::make_unsigned_t<T>;
    
    BinaryToolsPrivate::UnsignedCodec<UT, Endian::BigEndian>::write((UT)value, dst);
}

}

#endif
