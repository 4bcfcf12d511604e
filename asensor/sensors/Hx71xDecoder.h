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

#ifndef ASENSOR_HX71X_DECODER_H
#define ASENSOR_HX71X_DECODER_H

#include <stdint.h>

#include <asensor/bulk/AdcSample.h>

namespace ASensor {

/**
 * Largest magnitude of a count that the 24-bit chips can report without
 * being at the end of their range.
 */
static int32_t const Hx71xSaturationLimit = 0x7FFFFF;

/**
 * Decode one sample block: chip_count little-endian int32 counts.
 *
 * The counts are stored as received, total_counts is their sum, and
 * saturated is set if any count is at or beyond +/-Hx71xSaturationLimit.
 */
void Hx71xDecodeBlock (char const *data, uint8_t chip_count, double time, AdcSample &out);

/**
 * Range of total_counts for the given number of chips:
 * [-2^23 * chip_count, 2^23 * chip_count).
 */
AdcRange Hx71xGetRange (uint8_t chip_count);

}

#endif
