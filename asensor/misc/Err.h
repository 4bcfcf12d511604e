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

#ifndef ASENSOR_ERR_H
#define ASENSOR_ERR_H

#include <stdint.h>

namespace ASensor {

/**
 * Error code enumeration returned by fallible operations of the
 * acquisition pipeline.
 */
enum class SensorErr : uint8_t {
    SUCCESS         = 0, /**< The operation was successful. */
    BAD_CHIP_COUNT  = 1, /**< The number of chips is not within 1..4. */
    MISSING_PIN     = 2, /**< A data pin was given without a clock pin. */
    MIXED_MCU       = 3, /**< The chip pins are not all on the same MCU. */
    BAD_SAMPLE_RATE = 4, /**< The sample rate is not supported by the chip model. */
    BAD_GAIN        = 5, /**< The gain/channel is not supported by the chip model. */
    BAD_MODEL       = 6, /**< Unknown chip model type name. */
    CLOCK_DESYNC    = 7, /**< A clock sample pair was rejected as inconsistent. */
    CLOCK_RESYNC    = 8, /**< Clock regression was reset after repeated rejections. */
    ACK_TIMEOUT     = 9, /**< The MCU did not acknowledge a command in time. */
    QUERY_FAILED    = 10, /**< A status query to the MCU failed. */
    SEND_FAILED     = 11, /**< A command could not be sent to the MCU. */
    SESSION_FAILED  = 12, /**< The session failed and must be rebuilt. */
    NO_SUCH_ENDPOINT = 13, /**< No dump endpoint matches the request. */
    BAD_TUNING      = 14, /**< A timing parameter is out of range. */
};

/**
 * Return a short name for an error code, suitable for log lines.
 */
inline char const * sensorErrStr (SensorErr err)
{
    switch (err) {
        case SensorErr::SUCCESS:          return "Success";
        case SensorErr::BAD_CHIP_COUNT:   return "BadChipCount";
        case SensorErr::MISSING_PIN:      return "MissingPin";
        case SensorErr::MIXED_MCU:        return "MixedMcu";
        case SensorErr::BAD_SAMPLE_RATE:  return "BadSampleRate";
        case SensorErr::BAD_GAIN:         return "BadGain";
        case SensorErr::BAD_MODEL:        return "BadModel";
        case SensorErr::CLOCK_DESYNC:     return "ClockDesync";
        case SensorErr::CLOCK_RESYNC:     return "ClockResync";
        case SensorErr::ACK_TIMEOUT:      return "AckTimeout";
        case SensorErr::QUERY_FAILED:     return "QueryFailed";
        case SensorErr::SEND_FAILED:      return "SendFailed";
        case SensorErr::SESSION_FAILED:   return "SessionFailed";
        case SensorErr::NO_SUCH_ENDPOINT: return "NoSuchEndpoint";
        case SensorErr::BAD_TUNING:       return "BadTuning";
    }
    return "Unknown";
}

}

#endif
