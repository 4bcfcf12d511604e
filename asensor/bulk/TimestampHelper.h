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

#ifndef ASENSOR_TIMESTAMP_HELPER_H
#define ASENSOR_TIMESTAMP_HELPER_H

#include <stdint.h>

#include <asensor/bulk/ClockSyncRegression.h>
#include <asensor/bulk/ChipClockUpdater.h>

namespace ASensor {

/**
 * Assigns print times to the blocks of the bulk messages of one batch.
 *
 * The block with index i in the message with (extended) sequence seq has
 * the absolute block index seq * blocks_per_msg + i, and its time is
 * computed from that index using the translation of the regression taken
 * at construction. Missing messages therefore do not affect the times of
 * later blocks.
 */
class TimestampHelper {
public:
    TimestampHelper (ClockSyncRegression &clock_sync, ChipClockUpdater const &updater);

    /**
     * Select the message whose blocks are timestamped next.
     *
     * The 16-bit sequence is extended relative to the last sequence
     * reported by the MCU status. A sequence more than one after the
     * previous message counts the messages in between as missed.
     */
    void updateSequence (uint16_t sequence);

    /**
     * Set the extended sequence of the message preceding the first one
     * of this batch, so that gaps across batches are counted.
     */
    inline void setPreviousSequence (int64_t sequence)
    {
        m_sequence = sequence;
        m_have_sequence = true;
    }

    /**
     * Return the print time of block i of the current message.
     */
    inline double timeOfBlock (uint32_t block_index) const
    {
        return m_translation.timeOf(absoluteBlock(block_index));
    }

    /**
     * Like @ref timeOfBlock, but also remembers the block as the last
     * one timestamped, for @ref setLastChipClock.
     */
    inline double stampBlock (uint32_t block_index)
    {
        m_last_block = absoluteBlock(block_index);
        m_have_last_block = true;
        return m_translation.timeOf(m_last_block);
    }

    inline double absoluteBlock (uint32_t block_index) const
    {
        return (double)(m_sequence * m_blocks_per_msg + block_index);
    }

    inline int64_t getSequence () const
    {
        return m_sequence;
    }

    inline uint32_t getMissedMessages () const
    {
        return m_missed_messages;
    }

    /**
     * Tell the regression that timestamps were emitted up to the last
     * block passed to @ref stampBlock. Does nothing if no block was
     * stamped.
     */
    void setLastChipClock ();

private:
    ClockSyncRegression &m_clock_sync;
    ClockSyncRegression::Translation m_translation;
    int64_t m_last_status_sequence;
    int64_t m_blocks_per_msg;
    int64_t m_sequence;
    bool m_have_sequence;
    uint32_t m_missed_messages;
    double m_last_block;
    bool m_have_last_block;
};

}

#endif
