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

#ifndef ASENSOR_HX71X_MODEL_H
#define ASENSOR_HX71X_MODEL_H

#include <stdint.h>
#include <stddef.h>

#include <asensor/misc/Err.h>
#include <asensor/mcu/McuChannel.h>
#include <asensor/bulk/AdcSample.h>

namespace ASensor {

static int const Hx71xMaxChips = AdcMaxChannels;

// Each chip contributes one little-endian int32 to a sample block.
static uint32_t const Hx71xBytesPerChip = 4;

struct Hx71xGainOption {
    char const *name;
    uint8_t channel;
};

/**
 * Properties of a supported chip model: the selectable sample rates and
 * gain/channel combinations, and their defaults.
 */
struct Hx71xModel {
    char const *type_name;
    int const *sample_rates;
    uint8_t num_sample_rates;
    int default_sample_rate;
    Hx71xGainOption const *gains;
    uint8_t num_gains;
    char const *default_gain;

    bool hasSampleRate (int sps) const;

    /**
     * Return the gain channel code for a gain name, or 0 if unsupported.
     */
    uint8_t findGainChannel (char const *gain) const;
};

extern Hx71xModel const Hx711Model;
extern Hx71xModel const Hx717Model;

/**
 * Look up a model by its type name ("hx711" or "hx717").
 *
 * @return The model, or null if the name is unknown.
 */
Hx71xModel const * findHx71xModel (char const *type_name);

struct Hx71xChipPins {
    McuPin dout;
    McuPin sclk;
};

/**
 * User configuration of a HX71x sensor, see @ref Hx71xSettings::resolve.
 */
struct Hx71xConfig {
    char const *name;
    Hx71xModel const *model;
    // Pins of the chips in order; the first chip is chip 0.
    Hx71xChipPins const *chips;
    size_t num_chips;
    // Samples per second, or 0 for the model default.
    int sample_rate;
    // Gain name such as "A-128", or null for the model default.
    char const *gain;
    // Allocate an oid for a load cell endstop on the MCU.
    bool allocate_endstop_oid;
    // Interval in seconds at which batches are processed.
    double batch_interval;
    // Length of the clock regression window in seconds.
    double clock_smooth_time;
    // Bound on the ratio between measured and nominal sample period.
    double max_period_ratio;

    /**
     * Return a configuration with the given basics and default values
     * for everything else.
     */
    static Hx71xConfig defaults (char const *name, Hx71xModel const *model,
                                 Hx71xChipPins const *chips, size_t num_chips);
};

/**
 * Validated settings of a HX71x sensor.
 */
struct Hx71xSettings {
    char const *name;
    Hx71xModel const *model;
    McuChannel *mcu;
    uint8_t chip_count;
    // All Hx71xMaxChips slots are set; unused ones repeat chip 0's pins.
    uint32_t dout_pins[Hx71xMaxChips];
    uint32_t sclk_pins[Hx71xMaxChips];
    int sample_rate;
    uint8_t gain_channel;
    bool allocate_endstop_oid;
    double batch_interval;
    double clock_smooth_time;
    double max_period_ratio;

    /**
     * Validate a configuration.
     *
     * @return SUCCESS with out filled in, or BAD_MODEL, BAD_CHIP_COUNT,
     *         MISSING_PIN, MIXED_MCU, BAD_SAMPLE_RATE, BAD_GAIN or BAD_TUNING.
     */
    static SensorErr resolve (Hx71xConfig const &config, Hx71xSettings &out);

    inline uint32_t bytesPerBlock () const
    {
        return chip_count * Hx71xBytesPerChip;
    }
};

}

#endif
