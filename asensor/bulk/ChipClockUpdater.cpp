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
#include <asensor/misc/WrapCounter.h>

#include "ChipClockUpdater.h"

namespace ASensor {

// Lower bound for the query duration filter, in seconds of MCU clock.
static double const MinQueryDurationSec = 5e-6;

ChipClockUpdater::ChipClockUpdater (McuChannel &mcu, ClockSyncRegression &clock_sync,
                                    uint32_t bytes_per_block) :
    m_mcu(mcu),
    m_clock_sync(clock_sync),
    m_bytes_per_block(bytes_per_block),
    m_blocks_per_msg(MaxBulkMsgSize / bytes_per_block),
    m_query_cmd(McuCommand::make("")),
    m_last_sequence(0),
    m_last_overflows(0),
    m_new_overflows(0),
    m_max_query_duration(1e300)
{
    ASENSOR_ASSERT(bytes_per_block > 0 && bytes_per_block <= MaxBulkMsgSize)
}

void ChipClockUpdater::setupQueryCommand (char const *format, uint8_t oid)
{
    m_query_cmd = McuCommand::make(format, oid);
}

SensorErr ChipClockUpdater::noteStart ()
{
    m_last_sequence = 0;
    m_last_overflows = 0;
    m_new_overflows = 0;

    // The first query after start is used regardless of its duration.
    m_max_query_duration = 1e300;
    SensorErr err = update_clock(true);
    m_max_query_duration = 1e300;

    return err;
}

SensorErr ChipClockUpdater::updateClock ()
{
    return update_clock(false);
}

uint32_t ChipClockUpdater::takeNewOverflows ()
{
    uint32_t count = m_new_overflows;
    m_new_overflows = 0;
    return count;
}

SensorErr ChipClockUpdater::update_clock (bool is_reset)
{
    ASENSOR_ASSERT(m_query_cmd.num_args > 0)

    SensorBulkStatus status;
    SensorErr err = m_mcu.queryBulkStatus(m_query_cmd, status);
    if (err != SensorErr::SUCCESS) {
        return err;
    }

    m_last_sequence = ExtendWrapCounter<uint16_t>(m_last_sequence, status.next_sequence);

    int64_t overflows = ExtendWrapCounter<uint16_t>(m_last_overflows, status.possible_overflows);
    if (!is_reset && overflows > m_last_overflows) {
        m_new_overflows += (uint32_t)(overflows - m_last_overflows);
    }
    m_last_overflows = overflows;

    // Skip queries which took long; the MCU clock taken for the status
    // may then be far from the time the chip clock was sampled.
    double duration = status.query_ticks;
    if (duration > m_max_query_duration) {
        double min_duration = (double)m_mcu.secondsToClock(MinQueryDurationSec);
        double doubled = 2.0 * m_max_query_duration;
        m_max_query_duration = (doubled > min_duration) ? doubled : min_duration;
        return SensorErr::SUCCESS;
    }
    m_max_query_duration = 2.0 * duration;

    uint64_t chip_clock = (uint64_t)m_last_sequence * m_blocks_per_msg +
                          status.buffered / m_bytes_per_block + 1;

    uint64_t mcu_clock = m_mcu.clock32ToClock64(status.clock) + status.query_ticks / 2;
    double print_time = m_mcu.clockToPrintTime(mcu_clock);

    if (is_reset) {
        m_clock_sync.reset(chip_clock, print_time);
        return SensorErr::SUCCESS;
    }
    return m_clock_sync.update(chip_clock, print_time);
}

}
