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
#include <stdio.h>
#include <string.h>

#include <asensor/misc/Assert.h>
#include <asensor/misc/BinaryTools.h>
#include <asensor/misc/Err.h>
#include <asensor/mcu/McuChannel.h>
#include <asensor/bulk/AdcSample.h>
#include <asensor/sensors/Hx71xDecoder.h>
#include <asensor/sensors/Hx71xModel.h>
#include <asensor/sim/SimulatedMcu.h>

using namespace ASensor;

static void put_counts (char *data, int32_t const *counts, int n)
{
    for (int i = 0; i < n; i++) {
        WriteBinaryInt<int32_t, BinaryLittleEndian>(counts[i], data + 4 * i);
    }
}

static void test_decode ()
{
    char data[16];
    AdcSample sample;

    int32_t two[] = {100, -50};
    put_counts(data, two, 2);
    Hx71xDecodeBlock(data, 2, 1.5, sample);
    ASENSOR_ASSERT_FORCE(sample.time == 1.5)
    ASENSOR_ASSERT_FORCE(sample.num_counts == 2)
    ASENSOR_ASSERT_FORCE(sample.counts[0] == 100 && sample.counts[1] == -50)
    ASENSOR_ASSERT_FORCE(sample.counts[2] == 0 && sample.counts[3] == 0)
    ASENSOR_ASSERT_FORCE(sample.total_counts == 50)
    ASENSOR_ASSERT_FORCE(!sample.saturated)

    // Extreme values are passed through and flagged.
    int32_t four[] = {-0x800000, 0x7FFFFF, 0x7FFFFE, 1};
    put_counts(data, four, 4);
    Hx71xDecodeBlock(data, 4, 2.0, sample);
    ASENSOR_ASSERT_FORCE(sample.counts[0] == -0x800000)
    ASENSOR_ASSERT_FORCE(sample.counts[1] == 0x7FFFFF)
    ASENSOR_ASSERT_FORCE(sample.total_counts == -0x800000 + 0x7FFFFF + 0x7FFFFE + 1)
    ASENSOR_ASSERT_FORCE(sample.saturated)

    int32_t one[] = {0x7FFFFE};
    put_counts(data, one, 1);
    Hx71xDecodeBlock(data, 1, 0.0, sample);
    ASENSOR_ASSERT_FORCE(sample.total_counts == 0x7FFFFE)
    ASENSOR_ASSERT_FORCE(!sample.saturated)
}

static void test_range ()
{
    AdcRange r1 = Hx71xGetRange(1);
    ASENSOR_ASSERT_FORCE(r1.min == -0x800000 && r1.max == 0x800000)

    AdcRange r4 = Hx71xGetRange(4);
    ASENSOR_ASSERT_FORCE(r4.min == -4 * 0x800000LL && r4.max == 4 * 0x800000LL)
}

static void test_models ()
{
    ASENSOR_ASSERT_FORCE(findHx71xModel("hx711") == &Hx711Model)
    ASENSOR_ASSERT_FORCE(findHx71xModel("hx717") == &Hx717Model)
    ASENSOR_ASSERT_FORCE(findHx71xModel("hx712") == nullptr)

    ASENSOR_ASSERT_FORCE(Hx711Model.hasSampleRate(80) && Hx711Model.hasSampleRate(10))
    ASENSOR_ASSERT_FORCE(!Hx711Model.hasSampleRate(320))
    ASENSOR_ASSERT_FORCE(Hx717Model.hasSampleRate(320) && Hx717Model.hasSampleRate(20))

    ASENSOR_ASSERT_FORCE(Hx711Model.findGainChannel("B-32") == 2)
    ASENSOR_ASSERT_FORCE(Hx711Model.findGainChannel("B-8") == 0)
    ASENSOR_ASSERT_FORCE(Hx717Model.findGainChannel("B-8") == 4)
    ASENSOR_ASSERT_FORCE(Hx717Model.findGainChannel("B-32") == 0)
}

static void test_resolve ()
{
    SimulatedMcu mcu(1e6);
    SimulatedMcu other(1e6);

    Hx71xChipPins chips[5];
    for (int i = 0; i < 5; i++) {
        chips[i].dout = McuPin{&mcu, (uint32_t)(10 + 2 * i)};
        chips[i].sclk = McuPin{&mcu, (uint32_t)(11 + 2 * i)};
    }

    Hx71xSettings s;

    // Defaults of each model.
    Hx71xConfig config = Hx71xConfig::defaults("scale", &Hx717Model, chips, 2);
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::SUCCESS)
    ASENSOR_ASSERT_FORCE(s.mcu == &mcu)
    ASENSOR_ASSERT_FORCE(s.chip_count == 2)
    ASENSOR_ASSERT_FORCE(s.sample_rate == 320)
    ASENSOR_ASSERT_FORCE(s.gain_channel == 1)
    ASENSOR_ASSERT_FORCE(s.bytesPerBlock() == 8)
    ASENSOR_ASSERT_FORCE(s.batch_interval == 0.1 && s.clock_smooth_time == 2.0)

    config.model = &Hx711Model;
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::SUCCESS)
    ASENSOR_ASSERT_FORCE(s.sample_rate == 80)

    // One chip: the unused pin slots repeat chip 0.
    config.num_chips = 1;
    config.sample_rate = 10;
    config.gain = "A-64";
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::SUCCESS)
    ASENSOR_ASSERT_FORCE(s.gain_channel == 3)
    for (int i = 0; i < Hx71xMaxChips; i++) {
        ASENSOR_ASSERT_FORCE(s.dout_pins[i] == 10 && s.sclk_pins[i] == 11)
    }

    config = Hx71xConfig::defaults("scale", &Hx717Model, chips, 4);
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::SUCCESS)
    ASENSOR_ASSERT_FORCE(s.dout_pins[3] == 16 && s.sclk_pins[3] == 17)

    config.num_chips = 5;
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::BAD_CHIP_COUNT)
    config.num_chips = 0;
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::BAD_CHIP_COUNT)

    config = Hx71xConfig::defaults("scale", nullptr, chips, 1);
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::BAD_MODEL)

    config = Hx71xConfig::defaults("scale", &Hx711Model, chips, 2);
    config.sample_rate = 320;
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::BAD_SAMPLE_RATE)

    config.sample_rate = 0;
    config.gain = "B-64";
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::BAD_GAIN)

    config.gain = nullptr;
    config.batch_interval = 0.0;
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::BAD_TUNING)
    config.batch_interval = 0.1;
    config.max_period_ratio = 1.0;
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::BAD_TUNING)

    // Pin problems.
    chips[1].sclk = McuPin{nullptr, 0};
    config = Hx71xConfig::defaults("scale", &Hx711Model, chips, 2);
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::MISSING_PIN)

    chips[1].sclk = McuPin{&other, 13};
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::MIXED_MCU)

    chips[1].sclk = McuPin{&mcu, 13};
    ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, s) == SensorErr::SUCCESS)
}

int main ()
{
    test_decode();
    test_range();
    test_models();
    test_resolve();

    printf("hx71x_test: OK\n");
    return 0;
}
