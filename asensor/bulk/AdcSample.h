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

#ifndef ASENSOR_ADC_SAMPLE_H
#define ASENSOR_ADC_SAMPLE_H

#include <stdint.h>

#include <vector>

namespace ASensor {

/**
 * Maximum number of chips (channels) in one multi-chip ADC sample.
 */
static int const AdcMaxChannels = 4;

/**
 * One timestamped sample of a multi-chip ADC.
 */
struct AdcSample {
    // Print time of the sample in seconds.
    double time;
    // Sum of counts[0..num_counts-1].
    int32_t total_counts;
    int32_t counts[AdcMaxChannels];
    uint8_t num_counts;
    // Some channel is at the extreme of the chip's range.
    bool saturated;
};

/**
 * Range of raw counts, min inclusive and max exclusive.
 */
struct AdcRange {
    int64_t min;
    int64_t max;
};

/**
 * The samples extracted in one batch cycle.
 */
struct AdcSampleBatch {
    std::vector<AdcSample> samples;
    // Number of messages missing due to sequence gaps.
    uint32_t missed_messages;
    // Possible overflows reported by the MCU since the last batch.
    uint32_t overflows;

    inline void clear ()
    {
        samples.clear();
        missed_messages = 0;
        overflows = 0;
    }

    inline bool isEmpty () const
    {
        return samples.empty();
    }
};

}

#endif
