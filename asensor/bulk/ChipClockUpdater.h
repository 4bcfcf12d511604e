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

#ifndef ASENSOR_CHIP_CLOCK_UPDATER_H
#define ASENSOR_CHIP_CLOCK_UPDATER_H

#include <stdint.h>

#include <asensor/misc/Err.h>
#include <asensor/misc/NonCopyable.h>
#include <asensor/mcu/McuChannel.h>
#include <asensor/mcu/McuCommand.h>
#include <asensor/bulk/ClockSyncRegression.h>

namespace ASensor {

/**
 * Queries the bulk status of a sensor on the MCU and feeds the resulting
 * (chip clock, print time) observations to a @ref ClockSyncRegression.
 *
 * The chip clock counts sample blocks produced by the sensor since
 * measurements were started: the number of blocks in messages already
 * sent, plus the blocks buffered on the MCU, plus one for the block being
 * acquired when the status was taken.
 *
 * The 16-bit sequence and overflow counters reported by the MCU are
 * extended to 64 bits. Queries which took unusually long to answer are
 * not used for the regression.
 */
class ChipClockUpdater :
    private NonCopyable<ChipClockUpdater>
{
public:
    ChipClockUpdater (McuChannel &mcu, ClockSyncRegression &clock_sync,
                      uint32_t bytes_per_block);

    /**
     * Set the status query command, e.g. "query_hx71x_status oid=%c".
     */
    void setupQueryCommand (char const *format, uint8_t oid);

    /**
     * Reset tracking for a new measurement session and reset the
     * regression on a first status query.
     */
    SensorErr noteStart ();

    /**
     * Query the status and update the regression.
     *
     * @return SUCCESS, an error from the query, or CLOCK_DESYNC /
     *         CLOCK_RESYNC as returned by the regression.
     */
    SensorErr updateClock ();

    inline int64_t getLastSequence () const
    {
        return m_last_sequence;
    }

    inline int64_t getLastOverflows () const
    {
        return m_last_overflows;
    }

    inline uint32_t getBytesPerBlock () const
    {
        return m_bytes_per_block;
    }

    inline uint32_t getBlocksPerMsg () const
    {
        return m_blocks_per_msg;
    }

    /**
     * Return the increase of the possible overflows counter since the
     * previous call, and clear it.
     */
    uint32_t takeNewOverflows ();

private:
    SensorErr update_clock (bool is_reset);

    McuChannel &m_mcu;
    ClockSyncRegression &m_clock_sync;
    uint32_t m_bytes_per_block;
    uint32_t m_blocks_per_msg;
    McuCommand m_query_cmd;
    int64_t m_last_sequence;
    int64_t m_last_overflows;
    uint32_t m_new_overflows;
    double m_max_query_duration;
};

}

#endif
