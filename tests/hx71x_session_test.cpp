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
#include <stddef.h>
#include <stdio.h>
#include <math.h>

#include <asensor/misc/Assert.h>
#include <asensor/misc/Err.h>
#include <asensor/mcu/McuChannel.h>
#include <asensor/mcu/McuCommand.h>
#include <asensor/bulk/AdcSample.h>
#include <asensor/bulk/BatchBulkHelper.h>
#include <asensor/bulk/BatchClient.h>
#include <asensor/bulk/DumpClient.h>
#include <asensor/sensors/Hx71xModel.h>
#include <asensor/sensors/Hx71xSensor.h>
#include <asensor/sim/SimulatedMcu.h>

#include "CaptureOutputStream.h"
#include "TestPlatform.h"

using namespace ASensor;

using Sensor = Hx71xSensor<TestPlatform>;

// MCU ticks between samples at 80 sps and 1 MHz, times 0.7.
static uint32_t const RestTicks80 = 8750;

class CountingClient : public BatchClient {
public:
    CountingClient () :
        keep(true),
        batches(0),
        samples(0),
        missed(0),
        overflows(0),
        first_time(0.0),
        last_time(0.0)
    {
    }

    bool keep;
    uint32_t batches;
    size_t samples;
    uint32_t missed;
    uint32_t overflows;
    double first_time;
    double last_time;

protected:
    bool handleBatch (AdcSampleBatch const &batch) override
    {
        ASENSOR_ASSERT_FORCE(!batch.isEmpty())

        for (AdcSample const &sample : batch.samples) {
            if (samples > 0) {
                ASENSOR_ASSERT_FORCE(sample.time > last_time)
            } else {
                first_time = sample.time;
            }
            last_time = sample.time;
            samples++;
        }
        missed += batch.missed_messages;
        overflows += batch.overflows;
        batches++;
        return keep;
    }
};

// On its first batch, leaves the sensor and hands over to a successor.
class HandoverClient : public CountingClient {
public:
    HandoverClient (Sensor *sensor, BatchClient *successor, bool use_stop) :
        add_result(SensorErr::SUCCESS),
        m_sensor(sensor),
        m_successor(successor),
        m_use_stop(use_stop)
    {
    }

    SensorErr add_result;

protected:
    bool handleBatch (AdcSampleBatch const &batch) override
    {
        CountingClient::handleBatch(batch);

        if (m_use_stop) {
            m_sensor->stop();
        } else {
            m_sensor->removeClient(*this);
        }
        if (m_successor != nullptr) {
            add_result = m_sensor->addClient(*m_successor);
        }
        return false;
    }

private:
    Sensor *m_sensor;
    BatchClient *m_successor;
    bool m_use_stop;
};

struct Env {
    TestPlatform platform;
    SimulatedMcu mcu;
    CaptureOutputStream log;
    Hx71xChipPins chips[2];
    Hx71xSettings settings;

    Env (size_t num_chips) :
        mcu(1e6)
    {
        for (int i = 0; i < 2; i++) {
            chips[i].dout = McuPin{&mcu, (uint32_t)(20 + 2 * i)};
            chips[i].sclk = McuPin{&mcu, (uint32_t)(21 + 2 * i)};
        }
        Hx71xConfig config = Hx71xConfig::defaults("scale", &Hx711Model, chips, num_chips);
        ASENSOR_ASSERT_FORCE(Hx71xSettings::resolve(config, settings) == SensorErr::SUCCESS)
    }

    void run (double seconds)
    {
        RunSimulation(platform, mcu, seconds);
    }

    // Count query_hx71x commands which start or stop streaming since a
    // history position.
    size_t starts_since (size_t start)
    {
        return count_queries(start, true);
    }

    size_t stops_since (size_t start)
    {
        return count_queries(start, false);
    }

private:
    size_t count_queries (size_t start, bool starts)
    {
        size_t count = 0;
        for (size_t i = start; i < mcu.historySize(); i++) {
            McuCommand cmd = mcu.historyAt(i);
            if (cmd.nameIs("query_hx71x") && (cmd.arg(1) != 0) == starts) {
                count++;
            }
        }
        return count;
    }
};

static void test_config_commands ()
{
    Env env(1);
    Sensor sensor(TestPlatformFacade(&env.platform), env.settings, &env.log);

    McuCommand cmd;
    ASENSOR_ASSERT_FORCE(env.mcu.lastCommand("config_hx71x", cmd))
    ASENSOR_ASSERT_FORCE(cmd.num_args == 12)
    ASENSOR_ASSERT_FORCE(cmd.arg(0) == sensor.getOid())
    ASENSOR_ASSERT_FORCE(cmd.arg(1) == 1)
    ASENSOR_ASSERT_FORCE(cmd.arg(2) == 1)
    ASENSOR_ASSERT_FORCE(cmd.arg(3) == 0)
    // Unused chip slots repeat the pins of chip 0.
    for (int i = 0; i < 4; i++) {
        ASENSOR_ASSERT_FORCE(cmd.arg(4 + 2 * i) == 20 && cmd.arg(5 + 2 * i) == 21)
    }

    // Streaming is turned off at configuration.
    ASENSOR_ASSERT_FORCE(env.mcu.lastCommand("query_hx71x", cmd))
    ASENSOR_ASSERT_FORCE(cmd.arg(0) == sensor.getOid() && cmd.arg(1) == 0)

    ASENSOR_ASSERT_FORCE(sensor.getLoadCellEndstopOid() == 0)
    ASENSOR_ASSERT_FORCE(sensor.getSamplesPerSecond() == 80)
    ASENSOR_ASSERT_FORCE(sensor.getRange().max == 0x800000)
    ASENSOR_ASSERT_FORCE(sensor.getState() == BulkState::Idle)

    // Two chips and an endstop oid.
    Env env2(2);
    env2.settings.allocate_endstop_oid = true;
    Sensor sensor2(TestPlatformFacade(&env2.platform), env2.settings, &env2.log);
    ASENSOR_ASSERT_FORCE(sensor2.getLoadCellEndstopOid() != 0)
    ASENSOR_ASSERT_FORCE(sensor2.getLoadCellEndstopOid() != sensor2.getOid())
    ASENSOR_ASSERT_FORCE(env2.mcu.lastCommand("config_hx71x", cmd))
    ASENSOR_ASSERT_FORCE(cmd.arg(1) == 2)
    ASENSOR_ASSERT_FORCE(cmd.arg(3) == sensor2.getLoadCellEndstopOid())
    ASENSOR_ASSERT_FORCE(cmd.arg(6) == 22 && cmd.arg(7) == 23)
}

static void test_start_stop ()
{
    Env env(1);
    Sensor sensor(TestPlatformFacade(&env.platform), env.settings, &env.log);
    size_t h0 = env.mcu.historySize();

    CountingClient a;
    CountingClient b;

    ASENSOR_ASSERT_FORCE(sensor.addClient(a) == SensorErr::SUCCESS)
    ASENSOR_ASSERT_FORCE(sensor.isRunning())
    ASENSOR_ASSERT_FORCE(env.mcu.isStreaming())
    ASENSOR_ASSERT_FORCE(env.mcu.getRestTicks() == RestTicks80)
    ASENSOR_ASSERT_FORCE(env.log.count("//Hx71xStart scale\n") == 1)

    // Only the first client starts measurement.
    ASENSOR_ASSERT_FORCE(sensor.addClient(b) == SensorErr::SUCCESS)
    ASENSOR_ASSERT_FORCE(env.starts_since(h0) == 1)
    ASENSOR_ASSERT_FORCE(sensor.getHelper().getNumClients() == 2)

    env.run(1.0);

    // 72 samples were sent in full messages within one second.
    ASENSOR_ASSERT_FORCE(a.samples == 72)
    ASENSOR_ASSERT_FORCE(b.samples == a.samples && b.batches == a.batches)
    ASENSOR_ASSERT_FORCE(a.batches >= 5)
    ASENSOR_ASSERT_FORCE(a.missed == 0 && a.overflows == 0)
    ASENSOR_ASSERT_FORCE(fabs(a.first_time) < 0.05)
    ASENSOR_ASSERT_FORCE(fabs(a.last_time - 0.9) < 0.05)

    sensor.removeClient(a);
    ASENSOR_ASSERT_FORCE(sensor.isRunning())
    ASENSOR_ASSERT_FORCE(env.stops_since(h0) == 0)

    // The last client leaving stops measurement.
    sensor.removeClient(b);
    ASENSOR_ASSERT_FORCE(!sensor.isRunning())
    ASENSOR_ASSERT_FORCE(sensor.getState() == BulkState::Idle)
    ASENSOR_ASSERT_FORCE(env.stops_since(h0) == 1)
    ASENSOR_ASSERT_FORCE(!env.mcu.isStreaming())
    ASENSOR_ASSERT_FORCE(env.log.count("//Hx71xFinish scale\n") == 1)

    uint32_t batches = b.batches;
    env.run(0.5);
    ASENSOR_ASSERT_FORCE(b.batches == batches)

    // A new session starts over; no samples of the old one are delivered.
    CountingClient c;
    ASENSOR_ASSERT_FORCE(sensor.addClient(c) == SensorErr::SUCCESS)
    ASENSOR_ASSERT_FORCE(env.starts_since(h0) == 2)
    env.run(0.5);
    ASENSOR_ASSERT_FORCE(c.samples > 0)
    ASENSOR_ASSERT_FORCE(c.first_time > 1.4)

    sensor.stop();
    ASENSOR_ASSERT_FORCE(!c.isAttached())
    ASENSOR_ASSERT_FORCE(sensor.getState() == BulkState::Idle)
    ASENSOR_ASSERT_FORCE(env.stops_since(h0) == 2)
}

static void test_client_declines ()
{
    Env env(1);
    Sensor sensor(TestPlatformFacade(&env.platform), env.settings, &env.log);
    size_t h0 = env.mcu.historySize();

    CountingClient a;
    CountingClient b;
    a.keep = false;

    ASENSOR_ASSERT_FORCE(sensor.addClient(a) == SensorErr::SUCCESS)
    ASENSOR_ASSERT_FORCE(sensor.addClient(b) == SensorErr::SUCCESS)

    env.run(0.3);
    ASENSOR_ASSERT_FORCE(a.batches == 1)
    ASENSOR_ASSERT_FORCE(!a.isAttached())
    ASENSOR_ASSERT_FORCE(b.isAttached())
    ASENSOR_ASSERT_FORCE(sensor.isRunning())

    // The last client declining stops measurement.
    b.keep = false;
    uint32_t batches = b.batches;
    env.run(0.3);
    ASENSOR_ASSERT_FORCE(b.batches == batches + 1)
    ASENSOR_ASSERT_FORCE(!b.isAttached())
    ASENSOR_ASSERT_FORCE(!sensor.isRunning())
    ASENSOR_ASSERT_FORCE(env.stops_since(h0) == 1)
    ASENSOR_ASSERT_FORCE(!env.mcu.isStreaming())
}

static void test_handover_during_dispatch ()
{
    for (int use_stop = 0; use_stop < 2; use_stop++) {
        Env env(1);
        Sensor sensor(TestPlatformFacade(&env.platform), env.settings, &env.log);
        size_t h0 = env.mcu.historySize();

        CountingClient b;
        HandoverClient a(&sensor, &b, use_stop);
        ASENSOR_ASSERT_FORCE(sensor.addClient(a) == SensorErr::SUCCESS)

        // The successor keeps measurement running without a restart.
        env.run(0.5);
        ASENSOR_ASSERT_FORCE(a.batches == 1)
        ASENSOR_ASSERT_FORCE(!a.isAttached())
        ASENSOR_ASSERT_FORCE(a.add_result == SensorErr::SUCCESS)
        ASENSOR_ASSERT_FORCE(b.isAttached())
        ASENSOR_ASSERT_FORCE(b.batches > 0)
        ASENSOR_ASSERT_FORCE(b.first_time > a.last_time)
        ASENSOR_ASSERT_FORCE(sensor.isRunning())
        ASENSOR_ASSERT_FORCE(env.mcu.isStreaming())
        ASENSOR_ASSERT_FORCE(env.starts_since(h0) == 1)
        ASENSOR_ASSERT_FORCE(env.stops_since(h0) == 0)

        sensor.stop();
        ASENSOR_ASSERT_FORCE(!b.isAttached())
        ASENSOR_ASSERT_FORCE(env.stops_since(h0) == 1)
    }

    // Leaving without a successor stops measurement after the dispatch.
    Env env(1);
    Sensor sensor(TestPlatformFacade(&env.platform), env.settings, &env.log);
    HandoverClient a(&sensor, nullptr, false);
    ASENSOR_ASSERT_FORCE(sensor.addClient(a) == SensorErr::SUCCESS)
    env.run(0.3);
    ASENSOR_ASSERT_FORCE(a.batches == 1)
    ASENSOR_ASSERT_FORCE(sensor.getState() == BulkState::Idle)
    ASENSOR_ASSERT_FORCE(!env.mcu.isStreaming())
}

static void test_reset_restarts ()
{
    Env env(1);
    Sensor sensor(TestPlatformFacade(&env.platform), env.settings, &env.log);

    CountingClient a;
    ASENSOR_ASSERT_FORCE(sensor.addClient(a) == SensorErr::SUCCESS)
    env.run(0.55);

    size_t h1 = env.mcu.historySize();
    env.mcu.injectReset();
    ASENSOR_ASSERT_FORCE(!env.mcu.isStreaming())

    // Handled at the next batch: one stop, then one start.
    env.run(0.1);
    ASENSOR_ASSERT_FORCE(env.log.count("//Warning:Hx71xReset scale\n") == 1)
    ASENSOR_ASSERT_FORCE(env.stops_since(h1) == 1)
    ASENSOR_ASSERT_FORCE(env.starts_since(h1) == 1)

    size_t stop_index = 0;
    size_t start_index = 0;
    for (size_t i = h1; i < env.mcu.historySize(); i++) {
        McuCommand cmd = env.mcu.historyAt(i);
        if (cmd.nameIs("query_hx71x")) {
            if (cmd.arg(1) == 0) {
                stop_index = i;
            } else {
                start_index = i;
            }
        }
    }
    ASENSOR_ASSERT_FORCE(stop_index < start_index)

    ASENSOR_ASSERT_FORCE(env.mcu.isStreaming())
    ASENSOR_ASSERT_FORCE(sensor.isRunning())
    ASENSOR_ASSERT_FORCE(a.isAttached())

    size_t samples = a.samples;
    env.run(1.0);
    ASENSOR_ASSERT_FORCE(a.samples >= samples + 60)
    ASENSOR_ASSERT_FORCE(env.log.count("//Warning:Hx71xReset scale\n") == 1)

    sensor.stop();
}

static void test_gap_reported ()
{
    Env env(1);
    Sensor sensor(TestPlatformFacade(&env.platform), env.settings, &env.log);

    CountingClient a;
    ASENSOR_ASSERT_FORCE(sensor.addClient(a) == SensorErr::SUCCESS)
    env.run(0.5);

    env.mcu.dropNextMessages(2);
    env.run(1.0);

    ASENSOR_ASSERT_FORCE(a.missed == 2)
    ASENSOR_ASSERT_FORCE(env.log.contains("//Warning:Hx71xSequenceGap scale\n"))

    env.mcu.injectOverflows(1);
    env.run(0.2);
    ASENSOR_ASSERT_FORCE(a.overflows == 1)
    ASENSOR_ASSERT_FORCE(env.log.contains("//Warning:Hx71xOverflow scale\n"))

    sensor.stop();
}

static void test_dump_endpoint ()
{
    Env env(1);
    env.mcu.setChipSignal(0, 1000, 0.0, 0.0);
    Sensor sensor(TestPlatformFacade(&env.platform), env.settings, &env.log);

    CaptureOutputStream out;
    DumpClient dump(&out);
    ASENSOR_ASSERT_FORCE(sensor.openDumpClient(dump) == SensorErr::SUCCESS)
    ASENSOR_ASSERT_FORCE(sensor.isRunning())
    ASENSOR_ASSERT_FORCE(out.data() == "{\"header\":[\"time\",\"total_counts\",\"counts0\"]}\n")

    env.run(0.5);
    ASENSOR_ASSERT_FORCE(dump.getNumBatches() > 0)
    ASENSOR_ASSERT_FORCE(out.count("{\"data\":[[") == dump.getNumBatches())
    ASENSOR_ASSERT_FORCE(out.count("],\"overflows\":0,\"missed\":0}\n") == dump.getNumBatches())
    ASENSOR_ASSERT_FORCE(out.contains(",1000,1000]"))

    DumpClient other(&out);
    ASENSOR_ASSERT_FORCE(sensor.getHelper().openDumpClient(Hx71xDumpPath, "other", other) == SensorErr::NO_SUCH_ENDPOINT)
    ASENSOR_ASSERT_FORCE(sensor.getHelper().openDumpClient("adxl345/dump_adxl345", "scale", other) == SensorErr::NO_SUCH_ENDPOINT)
    ASENSOR_ASSERT_FORCE(!other.isAttached())

    // Closing detaches at the next batch, which stops measurement.
    dump.close();
    env.run(0.3);
    ASENSOR_ASSERT_FORCE(!dump.isAttached())
    ASENSOR_ASSERT_FORCE(!sensor.isRunning())
}

static void test_ack_timeout_fails_session ()
{
    Env env(1);
    Sensor sensor(TestPlatformFacade(&env.platform), env.settings, &env.log);

    CountingClient a;
    ASENSOR_ASSERT_FORCE(sensor.addClient(a) == SensorErr::SUCCESS)
    env.run(0.3);

    env.mcu.setAckTimeout(true);
    sensor.removeClient(a);
    ASENSOR_ASSERT_FORCE(sensor.getState() == BulkState::Failed)
    ASENSOR_ASSERT_FORCE(env.log.count("//Error:AckTimeout scale\n") == 1)

    env.mcu.setAckTimeout(false);
    CountingClient b;
    ASENSOR_ASSERT_FORCE(sensor.addClient(b) == SensorErr::SESSION_FAILED)
    ASENSOR_ASSERT_FORCE(!b.isAttached())

    CaptureOutputStream out;
    DumpClient dump(&out);
    ASENSOR_ASSERT_FORCE(sensor.openDumpClient(dump) == SensorErr::SESSION_FAILED)
    ASENSOR_ASSERT_FORCE(out.data().empty())

    // Failing to stop while restarting after a reset fails the session too.
    Env env2(1);
    Sensor sensor2(TestPlatformFacade(&env2.platform), env2.settings, &env2.log);
    CountingClient c;
    ASENSOR_ASSERT_FORCE(sensor2.addClient(c) == SensorErr::SUCCESS)
    env2.run(0.3);
    env2.mcu.setAckTimeout(true);
    env2.mcu.injectReset();
    env2.run(0.1);
    ASENSOR_ASSERT_FORCE(sensor2.getState() == BulkState::Failed)
    ASENSOR_ASSERT_FORCE(!c.isAttached())
}

static void test_query_failure_stops ()
{
    Env env(1);
    Sensor sensor(TestPlatformFacade(&env.platform), env.settings, &env.log);
    size_t h0 = env.mcu.historySize();

    // Failure to synchronize at start leaves measurement stopped.
    env.mcu.setQueryFail(true);
    CountingClient a;
    ASENSOR_ASSERT_FORCE(sensor.addClient(a) == SensorErr::QUERY_FAILED)
    ASENSOR_ASSERT_FORCE(!a.isAttached())
    ASENSOR_ASSERT_FORCE(sensor.getState() == BulkState::Idle)
    ASENSOR_ASSERT_FORCE(!env.mcu.isStreaming())
    ASENSOR_ASSERT_FORCE(env.log.count("//Error:QueryFailed scale\n") == 1)

    env.mcu.setQueryFail(false);
    ASENSOR_ASSERT_FORCE(sensor.addClient(a) == SensorErr::SUCCESS)
    env.run(0.3);

    // Failure during processing stops measurement and detaches clients.
    env.mcu.setQueryFail(true);
    env.run(0.1);
    ASENSOR_ASSERT_FORCE(env.log.count("//Error:QueryFailed scale\n") == 2)
    ASENSOR_ASSERT_FORCE(!a.isAttached())
    ASENSOR_ASSERT_FORCE(sensor.getState() == BulkState::Idle)
    ASENSOR_ASSERT_FORCE(!env.mcu.isStreaming())
    ASENSOR_ASSERT_FORCE(env.stops_since(h0) == 2)
}

int main ()
{
    test_config_commands();
    test_start_stop();
    test_client_declines();
    test_handover_during_dispatch();
    test_reset_restarts();
    test_gap_reported();
    test_dump_endpoint();
    test_ack_timeout_fails_session();
    test_query_failure_stops();

    printf("hx71x_session_test: OK\n");
    return 0;
}
