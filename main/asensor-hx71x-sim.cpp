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
#include <stdlib.h>
#include <stdio.h>
#include <string.h>

#include <time.h>
#include <unistd.h>
#include <getopt.h>

#include <atomic>

#include <asensor/misc/Assert.h>
#include <asensor/misc/Callback.h>
#include <asensor/misc/Err.h>
#include <asensor/misc/NonCopyable.h>
#include <asensor/mcu/McuChannel.h>
#include <asensor/bulk/DumpClient.h>
#include <asensor/sensors/Hx71xModel.h>
#include <asensor/sensors/Hx71xSensor.h>
#include <asensor/platform/linux/LinuxPlatform.h>
#include <asensor/platform/linux/LinuxThread.h>
#include <asensor/platform/linux/StdioOutputStream.h>
#include <asensor/sim/SimulatedMcu.h>

using namespace ASensor;

using Platform = LinuxPlatformFacade;

static double const SimMcuFreq = 16e6;
static useconds_t const ClockThreadPeriodUs = 1000;

struct Options {
    char const *model;
    int chips;
    int sample_rate;
    char const *gain;
    double duration;
    double batch_interval;
};

static void print_usage (char const *prog)
{
    fprintf(stderr,
        "Usage: %s [--model hx711|hx717] [--chips N] [--rate SPS] [--gain GAIN]\n"
        "          [--time SECONDS] [--interval SECONDS]\n", prog);
}

static bool parse_options (int argc, char *argv[], Options &opts)
{
    opts.model = "hx711";
    opts.chips = 1;
    opts.sample_rate = 0;
    opts.gain = nullptr;
    opts.duration = 5.0;
    opts.batch_interval = 0.1;

    static struct option const long_options[] = {
        {"model",    required_argument, nullptr, 'm'},
        {"chips",    required_argument, nullptr, 'n'},
        {"rate",     required_argument, nullptr, 'r'},
        {"gain",     required_argument, nullptr, 'g'},
        {"time",     required_argument, nullptr, 't'},
        {"interval", required_argument, nullptr, 'i'},
        {}
    };

    while (true) {
        int option_index = 0;
        int opt = getopt_long(argc, argv, "m:n:r:g:t:i:", long_options, &option_index);
        if (opt == -1) {
            break;
        }

        switch (opt) {
            case 'm': {
                opts.model = optarg;
            } break;

            case 'n': {
                opts.chips = atoi(optarg);
            } break;

            case 'r': {
                int val = atoi(optarg);
                if (val <= 0) {
                    fprintf(stderr, "Invalid sample rate\n");
                    return false;
                }
                opts.sample_rate = val;
            } break;

            case 'g': {
                opts.gain = optarg;
            } break;

            case 't': {
                double val = atof(optarg);
                if (!(val > 0.0)) {
                    fprintf(stderr, "Invalid duration\n");
                    return false;
                }
                opts.duration = val;
            } break;

            case 'i': {
                opts.batch_interval = atof(optarg);
            } break;

            default: {
                return false;
            } break;
        }
    }

    if (optind != argc) {
        fprintf(stderr, "Unexpected arguments\n");
        return false;
    }

    return true;
}

static double monotonic_seconds ()
{
    struct timespec ts;
    int res = ::clock_gettime(CLOCK_MONOTONIC, &ts);
    ASENSOR_ASSERT_FORCE(res == 0)
    return ts.tv_sec + ts.tv_nsec / 1e9;
}

/**
 * Plays the role of the MCU transport: keeps the simulated MCU clock in
 * step with real time from a separate thread, which is where bulk data
 * messages are delivered.
 */
class McuClockThread :
    private NonCopyable<McuClockThread>
{
public:
    McuClockThread (SimulatedMcu &mcu) :
        m_mcu(mcu),
        m_start_time(0.0),
        m_stop(false)
    {
    }

    void start ()
    {
        m_start_time = monotonic_seconds();
        m_thread.start(ASENSOR_CB_OBJFUNC(&McuClockThread::thread_func, this));
    }

    void stop ()
    {
        if (m_thread.isRunning()) {
            m_stop.store(true);
            m_thread.join();
        }
    }

private:
    void thread_func ()
    {
        while (!m_stop.load()) {
            double elapsed = monotonic_seconds() - m_start_time;
            m_mcu.advanceClock(m_mcu.secondsToClock(elapsed));
            ::usleep(ClockThreadPeriodUs);
        }
    }

    SimulatedMcu &m_mcu;
    double m_start_time;
    std::atomic<bool> m_stop;
    LinuxThread m_thread;
};

class QuitTimer : private Platform::Timer {
public:
    QuitTimer (Platform platform, double after) :
        Platform::Timer(platform)
    {
        Platform::Timer::setAfter(Platform::secondsToTicks(after));
    }

private:
    void handleTimerExpired () override
    {
        platform().ref().platformImpl()->quit();
    }
};

int main (int argc, char *argv[])
{
    Options opts;
    if (!parse_options(argc, argv, opts)) {
        print_usage(argv[0]);
        return 1;
    }

    StdioOutputStream log(stderr);
    StdioOutputStream out(stdout);

    SimulatedMcu mcu(SimMcuFreq);

    Hx71xChipPins chips[Hx71xMaxChips];
    for (int i = 0; i < Hx71xMaxChips; i++) {
        chips[i].dout = McuPin{&mcu, (uint32_t)(2 * i)};
        chips[i].sclk = McuPin{&mcu, (uint32_t)(2 * i + 1)};
        mcu.setChipSignal((uint8_t)i, 1000 * (i + 1), 5000.0, 0.5 * (i + 1));
    }

    size_t num_chips = (opts.chips >= 0) ? (size_t)opts.chips : 0;
    Hx71xConfig config = Hx71xConfig::defaults("sim", findHx71xModel(opts.model), chips, num_chips);
    config.sample_rate = opts.sample_rate;
    config.gain = opts.gain;
    config.batch_interval = opts.batch_interval;

    Hx71xSettings settings;
    SensorErr err = Hx71xSettings::resolve(config, settings);
    if (err != SensorErr::SUCCESS) {
        fprintf(stderr, "Error: invalid configuration: %s\n", sensorErrStr(err));
        return 1;
    }

    LinuxPlatform platform;
    bool ok = true;
    {
        Hx71xSensor<LinuxPlatform> sensor(Platform(&platform), settings, &log);
        McuClockThread clock_thread(mcu);
        clock_thread.start();

        DumpClient dump(&out);
        err = sensor.openDumpClient(dump);
        if (err != SensorErr::SUCCESS) {
            fprintf(stderr, "Error: cannot start measurement: %s\n", sensorErrStr(err));
            ok = false;
        } else {
            QuitTimer quit_timer(Platform(&platform), opts.duration);
            platform.run();
        }

        sensor.stop();
        clock_thread.stop();

        if (sensor.getState() == BulkState::Failed) {
            ok = false;
        }
    }

    if (out.hasFailed() || log.hasFailed()) {
        ok = false;
    }

    return ok ? 0 : 1;
}
