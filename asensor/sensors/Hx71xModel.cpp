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

#include <string.h>

#include "Hx71xModel.h"

namespace ASensor {

static int const Hx711SampleRates[] = {80, 10};

static Hx71xGainOption const Hx711Gains[] = {
    {"A-128", 1},
    {"B-32",  2},
    {"A-64",  3},
};

static int const Hx717SampleRates[] = {320, 80, 20, 10};

static Hx71xGainOption const Hx717Gains[] = {
    {"A-128", 1},
    {"B-64",  2},
    {"A-64",  3},
    {"B-8",   4},
};

template <typename T, size_t N>
static constexpr uint8_t array_len (T const (&)[N])
{
    return N;
}

Hx71xModel const Hx711Model = {
    "hx711",
    Hx711SampleRates, array_len(Hx711SampleRates), 80,
    Hx711Gains, array_len(Hx711Gains), "A-128",
};

Hx71xModel const Hx717Model = {
    "hx717",
    Hx717SampleRates, array_len(Hx717SampleRates), 320,
    Hx717Gains, array_len(Hx717Gains), "A-128",
};

bool Hx71xModel::hasSampleRate (int sps) const
{
    for (uint8_t i = 0; i < num_sample_rates; i++) {
        if (sample_rates[i] == sps) {
            return true;
        }
    }
    return false;
}

uint8_t Hx71xModel::findGainChannel (char const *gain) const
{
    for (uint8_t i = 0; i < num_gains; i++) {
        if (!strcmp(gains[i].name, gain)) {
            return gains[i].channel;
        }
    }
    return 0;
}

Hx71xModel const * findHx71xModel (char const *type_name)
{
    static Hx71xModel const * const models[] = {&Hx711Model, &Hx717Model};

    for (Hx71xModel const *model : models) {
        if (!strcmp(model->type_name, type_name)) {
            return model;
        }
    }
    return nullptr;
}

Hx71xConfig Hx71xConfig::defaults (char const *name, Hx71xModel const *model,
                                   Hx71xChipPins const *chips, size_t num_chips)
{
    Hx71xConfig config;
    config.name = name;
    config.model = model;
    config.chips = chips;
    config.num_chips = num_chips;
    config.sample_rate = 0;
    config.gain = nullptr;
    config.allocate_endstop_oid = false;
    config.batch_interval = 0.1;
    config.clock_smooth_time = 2.0;
    config.max_period_ratio = 2.0;
    return config;
}

SensorErr Hx71xSettings::resolve (Hx71xConfig const &config, Hx71xSettings &out)
{
    if (config.model == nullptr) {
        return SensorErr::BAD_MODEL;
    }
    if (config.num_chips < 1 || config.num_chips > Hx71xMaxChips) {
        return SensorErr::BAD_CHIP_COUNT;
    }

    McuChannel *mcu = config.chips[0].dout.mcu;

    for (size_t i = 0; i < config.num_chips; i++) {
        Hx71xChipPins const &chip = config.chips[i];
        if (!chip.dout.isSet() || !chip.sclk.isSet()) {
            return SensorErr::MISSING_PIN;
        }
        if (chip.dout.mcu != mcu || chip.sclk.mcu != mcu) {
            return SensorErr::MIXED_MCU;
        }
    }

    int sps = (config.sample_rate != 0) ? config.sample_rate : config.model->default_sample_rate;
    if (!config.model->hasSampleRate(sps)) {
        return SensorErr::BAD_SAMPLE_RATE;
    }

    char const *gain = (config.gain != nullptr) ? config.gain : config.model->default_gain;
    uint8_t gain_channel = config.model->findGainChannel(gain);
    if (gain_channel == 0) {
        return SensorErr::BAD_GAIN;
    }

    if (!(config.batch_interval > 0.0) || !(config.clock_smooth_time > 0.0) ||
        !(config.max_period_ratio > 1.0))
    {
        return SensorErr::BAD_TUNING;
    }

    out.name = config.name;
    out.model = config.model;
    out.mcu = mcu;
    out.chip_count = (uint8_t)config.num_chips;
    for (int i = 0; i < Hx71xMaxChips; i++) {
        Hx71xChipPins const &chip = config.chips[((size_t)i < config.num_chips) ? i : 0];
        out.dout_pins[i] = chip.dout.pin;
        out.sclk_pins[i] = chip.sclk.pin;
    }
    out.sample_rate = sps;
    out.gain_channel = gain_channel;
    out.allocate_endstop_oid = config.allocate_endstop_oid;
    out.batch_interval = config.batch_interval;
    out.clock_smooth_time = config.clock_smooth_time;
    out.max_period_ratio = config.max_period_ratio;

    return SensorErr::SUCCESS;
}

}
