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

#include <asensor/misc/WrapCounter.h>

#include "TimestampHelper.h"

namespace ASensor {

TimestampHelper::TimestampHelper (ClockSyncRegression &clock_sync, ChipClockUpdater const &updater) :
    m_clock_sync(clock_sync),
    m_translation(clock_sync.getTimeTranslation()),
    m_last_status_sequence(updater.getLastSequence()),
    m_blocks_per_msg(updater.getBlocksPerMsg()),
    m_sequence(0),
    m_have_sequence(false),
    m_missed_messages(0),
    m_last_block(0.0),
    m_have_last_block(false)
{
}

void TimestampHelper::updateSequence (uint16_t sequence)
{
    int64_t seq = ExtendWrapCounter<uint16_t>(m_last_status_sequence, sequence);

    if (m_have_sequence && seq > m_sequence + 1) {
        m_missed_messages += (uint32_t)(seq - m_sequence - 1);
    }

    m_sequence = seq;
    m_have_sequence = true;
}

void TimestampHelper::setLastChipClock ()
{
    if (m_have_last_block) {
        m_clock_sync.setLastChipClock(m_last_block);
    }
}

}
