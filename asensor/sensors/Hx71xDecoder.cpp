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

#include <asensor/misc/Assert.h>
#include <asensor/misc/BinaryTools.h>

#include "Hx71xDecoder.h"

namespace ASensor {

void Hx71xDecodeBlock (char const *data, uint8_t chip_count, double time, AdcSample &out)
{
    ASENSOR_ASSERT(chip_count >= 1 && chip_count <= AdcMaxChannels)

    out.time = time;
    out.num_counts = chip_count;
    out.saturated = false;

    // The MCU only sends 24-bit values so the sum of up to four fits.
    int32_t total = 0;
    for (uint8_t i = 0; i < chip_count; i++) {
        int32_t counts = ReadBinaryInt<int32_t, BinaryLittleEndian>(data + 4 * i);
        out.counts[i] = counts;
        total = (int32_t)((uint32_t)total + (uint32_t)counts);
        if (counts >= Hx71xSaturationLimit || counts <= -Hx71xSaturationLimit) {
            out.saturated = true;
        }
    }
    for (uint8_t i = chip_count; i < AdcMaxChannels; i++) {
        out.counts[i] = 0;
    }
    out.total_counts = total;
}

AdcRange Hx71xGetRange (uint8_t chip_count)
{
    int64_t half = (int64_t)1 << 23;
    return AdcRange{-half * chip_count, half * chip_count};
}

}
