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

#ifndef ASENSOR_HX71X_SENSOR_H
#define ASENSOR_HX71X_SENSOR_H

#include <stdint.h>
#include <stddef.h>

#include <atomic>
#include <vector>

#include <asensor/misc/Assert.h>
#include <asensor/misc/Err.h>
#include <asensor/misc/NonCopyable.h>
#include <asensor/misc/OutputStream.h>
#include <asensor/platform/PlatformFacade.h>
#include <asensor/mcu/McuChannel.h>
#include <asensor/mcu/McuCommand.h>
#include <asensor/bulk/AdcSample.h>
#include <asensor/bulk/BatchBulkHelper.h>
#include <asensor/bulk/BatchClient.h>
#include <asensor/bulk/BulkDataQueue.h>
#include <asensor/bulk/BulkSensorDriver.h>
#include <asensor/bulk/ChipClockUpdater.h>
#include <asensor/bulk/ClockSyncRegression.h>
#include <asensor/bulk/DumpClient.h>
#include <asensor/bulk/TimestampHelper.h>
#include <asensor/sensors/Hx71xDecoder.h>
#include <asensor/sensors/Hx71xModel.h>

namespace ASensor {

static char const Hx71xDumpPath[] = "hx71x/dump_hx71x";
static char const Hx71xDumpKey[] = "sensor";

static char const * const Hx71xDumpHeader[] = {
    "time", "total_counts", "counts0", "counts1", "counts2", "counts3",
};

static char const Hx71xConfigFormat[] =
    "config_hx71x oid=%c chip_count=%c gain_channel=%c load_cell_endstop_oid=%c"
    " dout1_pin=%u sclk1_pin=%u dout2_pin=%u sclk2_pin=%u"
    " dout3_pin=%u sclk3_pin=%u dout4_pin=%u sclk4_pin=%u";
static char const Hx71xQueryFormat[] = "query_hx71x oid=%c rest_ticks=%u";
static char const Hx71xQueryStatusFormat[] = "query_hx71x_status oid=%c";

/**
 * Driver for one to four HX711/HX717 load cell ADCs sampled together by
 * the MCU.
 *
 * The sensor registers its MCU configuration when constructed. Sample
 * batches are delivered to @ref BatchClient objects while at least one is
 * attached; see @ref BatchBulkHelper. Batches contain one @ref AdcSample
 * per sample block.
 *
 * A reset notification from the MCU (the chip was shut down due to a
 * timing error) is handled at the next batch by stopping and restarting
 * measurement.
 *
 * @tparam PlatformImpl The platform implementation, see @ref PlatformFacade.
 */
template <typename PlatformImpl>
class Hx71xSensor :
    private NonCopyable<Hx71xSensor<PlatformImpl>>,
    private BulkSensorDriver
{
    using Platform = PlatformFacade<PlatformImpl>;

public:
    /**
     * Construct, allocate oids and register the MCU configuration.
     *
     * @param platform The platform, used for the batch timer.
     * @param settings Resolved settings, see @ref Hx71xSettings::resolve.
     * @param log Stream for messages, or null.
     */
    Hx71xSensor (Platform platform, Hx71xSettings const &settings, OutputStream *log) :
        m_settings(settings),
        m_mcu(*settings.mcu),
        m_log(log),
        m_oid(m_mcu.createOid()),
        m_lce_oid(settings.allocate_endstop_oid ? m_mcu.createOid() : 0),
        m_clock_sync(1.0 / settings.sample_rate,
                     settings.sample_rate * settings.clock_smooth_time,
                     settings.sample_rate * settings.batch_interval * 2.0,
                     settings.max_period_ratio),
        m_updater(m_mcu, m_clock_sync, settings.bytesPerBlock()),
        m_queue(m_mcu, m_oid),
        m_reset_handler(this),
        m_reset_pending(false),
        m_prev_sequence(0),
        m_have_prev_sequence(false),
        m_helper(platform, *this, log, settings.name, settings.batch_interval)
    {
        build_config();
    }

    /**
     * Destroy. Measurement should be stopped before using @ref stop.
     */
    ~Hx71xSensor ()
    {
        m_mcu.unregisterResponse(m_reset_handler);
    }

    inline char const * getName () const
    {
        return m_settings.name;
    }

    inline McuChannel & getMcu ()
    {
        return m_mcu;
    }

    inline uint8_t getOid () const
    {
        return m_oid;
    }

    /**
     * Return the oid allocated for a load cell endstop, or 0 if none was
     * requested.
     */
    inline uint8_t getLoadCellEndstopOid () const
    {
        return m_lce_oid;
    }

    inline int getSamplesPerSecond () const
    {
        return m_settings.sample_rate;
    }

    inline uint8_t getChipCount () const
    {
        return m_settings.chip_count;
    }

    inline AdcRange getRange () const
    {
        return Hx71xGetRange(m_settings.chip_count);
    }

    inline bool isRunning () const
    {
        return m_helper.isRunning();
    }

    inline BulkState getState () const
    {
        return m_helper.getState();
    }

    inline SensorErr addClient (BatchClient &client)
    {
        return m_helper.addClient(client);
    }

    inline void removeClient (BatchClient &client)
    {
        m_helper.removeClient(client);
    }

    inline void stop ()
    {
        m_helper.stop();
    }

    /**
     * Attach a dump client to the endpoint of this sensor.
     */
    inline SensorErr openDumpClient (DumpClient &client)
    {
        return m_helper.openDumpClient(Hx71xDumpPath, m_settings.name, client);
    }

    inline BatchBulkHelper<PlatformImpl> & getHelper ()
    {
        return m_helper;
    }

    inline ClockSyncRegression const & getClockSync () const
    {
        return m_clock_sync;
    }

    inline BulkDataQueue const & getQueue () const
    {
        return m_queue;
    }

private:
    class ResetHandler : public McuResponseHandler {
    public:
        ResetHandler (Hx71xSensor *sensor) :
            McuResponseHandler(McuResponseType::SensorReset, sensor->m_oid),
            m_sensor(sensor)
        {
        }

        void handleMcuResponse (McuResponse const &) override
        {
            m_sensor->m_reset_pending.store(true);
        }

    private:
        Hx71xSensor *m_sensor;
    };

    void build_config ()
    {
        Hx71xSettings const &s = m_settings;

        McuCommand config_cmd = McuCommand::make(Hx71xConfigFormat,
            m_oid, s.chip_count, s.gain_channel, m_lce_oid,
            s.dout_pins[0], s.sclk_pins[0], s.dout_pins[1], s.sclk_pins[1],
            s.dout_pins[2], s.sclk_pins[2], s.dout_pins[3], s.sclk_pins[3]);
        m_mcu.addConfigCommand(config_cmd, false);

        // Make sure streaming is off after an MCU restart.
        m_mcu.addConfigCommand(McuCommand::make(Hx71xQueryFormat, m_oid, 0), true);

        m_updater.setupQueryCommand(Hx71xQueryStatusFormat, m_oid);

        m_mcu.registerResponse(m_reset_handler);

        DumpEndpoint endpoint;
        endpoint.path = Hx71xDumpPath;
        endpoint.key = Hx71xDumpKey;
        endpoint.value = s.name;
        endpoint.header = Hx71xDumpHeader;
        endpoint.header_len = 2 + s.chip_count;
        m_helper.addDumpEndpoint(endpoint);
    }

    SensorErr bulkStart () override
    {
        m_reset_pending.store(false);
        m_queue.clearSamples();
        m_have_prev_sequence = false;

        uint32_t rest_ticks = (uint32_t)m_mcu.secondsToClock(0.7 / m_settings.sample_rate);
        SensorErr err = m_mcu.sendCommand(McuCommand::make(Hx71xQueryFormat, m_oid, rest_ticks));
        if (err != SensorErr::SUCCESS) {
            return err;
        }
        log_event("", "Hx71xStart");

        err = m_updater.noteStart();
        if (err != SensorErr::SUCCESS) {
            // Leave the MCU not streaming.
            SensorErr stop_err = m_mcu.sendCommand(McuCommand::make(Hx71xQueryFormat, m_oid, 0));
            if (stop_err != SensorErr::SUCCESS) {
                log_event("Error:", "Hx71xStopSend");
            }
            return err;
        }

        return SensorErr::SUCCESS;
    }

    SensorErr bulkFinish () override
    {
        SensorErr err = m_mcu.sendCommandWaitAck(McuCommand::make(Hx71xQueryFormat, m_oid, 0));
        m_queue.clearSamples();
        if (err != SensorErr::SUCCESS) {
            return err;
        }
        log_event("", "Hx71xFinish");

        return SensorErr::SUCCESS;
    }

    SensorErr bulkProcess (AdcSampleBatch &batch) override
    {
        if (m_reset_pending.exchange(false)) {
            log_event("Warning:", "Hx71xReset");

            SensorErr err = bulkFinish();
            if (err != SensorErr::SUCCESS) {
                return err;
            }
            err = bulkStart();
            if (err != SensorErr::SUCCESS) {
                return err;
            }

            // The clock was just synchronized; samples of the new session
            // are extracted with the next batch.
            return SensorErr::SUCCESS;
        }

        SensorErr err = m_updater.updateClock();
        if (err == SensorErr::CLOCK_DESYNC || err == SensorErr::CLOCK_RESYNC) {
            log_event("Warning:", sensorErrStr(err));
        }
        else if (err != SensorErr::SUCCESS) {
            return err;
        }

        m_raw.clear();
        m_queue.pullSamples(m_raw);
        if (m_raw.empty()) {
            return SensorErr::SUCCESS;
        }

        // Overflows are reported with the next batch that has samples.
        batch.overflows = m_updater.takeNewOverflows();
        if (batch.overflows > 0) {
            log_event("Warning:", "Hx71xOverflow");
        }

        extract_samples(batch);

        if (batch.missed_messages > 0) {
            log_event("Warning:", "Hx71xSequenceGap");
        }

        return SensorErr::SUCCESS;
    }

    void extract_samples (AdcSampleBatch &batch)
    {
        uint32_t bytes_per_block = m_settings.bytesPerBlock();

        TimestampHelper timestamps(m_clock_sync, m_updater);
        if (m_have_prev_sequence) {
            timestamps.setPreviousSequence(m_prev_sequence);
        }

        for (RawMessage const &msg : m_raw) {
            timestamps.updateSequence(msg.sequence);

            uint32_t num_blocks = msg.data_len / bytes_per_block;
            for (uint32_t i = 0; i < num_blocks; i++) {
                AdcSample sample;
                Hx71xDecodeBlock(msg.data + bytes_per_block * i, m_settings.chip_count,
                                 timestamps.stampBlock(i), sample);
                batch.samples.push_back(sample);
            }
        }

        timestamps.setLastChipClock();
        batch.missed_messages = timestamps.getMissedMessages();

        m_prev_sequence = timestamps.getSequence();
        m_have_prev_sequence = true;
    }

    void log_event (char const *prefix, char const *tag)
    {
        if (m_log != nullptr) {
            m_log->append_event(prefix, tag, m_settings.name);
        }
    }

    Hx71xSettings m_settings;
    McuChannel &m_mcu;
    OutputStream *m_log;
    uint8_t m_oid;
    uint8_t m_lce_oid;
    ClockSyncRegression m_clock_sync;
    ChipClockUpdater m_updater;
    BulkDataQueue m_queue;
    ResetHandler m_reset_handler;
    std::atomic<bool> m_reset_pending;
    int64_t m_prev_sequence;
    bool m_have_prev_sequence;
    std::vector<RawMessage> m_raw;
    BatchBulkHelper<PlatformImpl> m_helper;
};

}

#endif
