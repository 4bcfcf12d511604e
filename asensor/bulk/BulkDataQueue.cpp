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
#include <string.h>

#include <asensor/misc/Assert.h>

#include "BulkDataQueue.h"

namespace ASensor {

BulkDataQueue::BulkDataQueue (McuChannel &mcu, uint8_t oid, size_t capacity) :
    McuResponseHandler(McuResponseType::BulkData, oid),
    m_mcu(mcu),
    m_slots(capacity),
    m_mask(capacity - 1),
    m_write_index(0),
    m_read_index(0),
    m_dropped(0)
{
    ASENSOR_ASSERT_FORCE(capacity > 0 && (capacity & (capacity - 1)) == 0)

    m_mcu.registerResponse(*this);
}

BulkDataQueue::~BulkDataQueue ()
{
    m_mcu.unregisterResponse(*this);
}

void BulkDataQueue::pullSamples (std::vector<RawMessage> &out)
{
    size_t read_index = m_read_index.load(std::memory_order_relaxed);
    size_t write_index = m_write_index.load(std::memory_order_acquire);

    while (read_index != write_index) {
        out.push_back(m_slots[read_index & m_mask]);
        read_index++;
    }

    m_read_index.store(read_index, std::memory_order_release);
}

void BulkDataQueue::clearSamples ()
{
    size_t write_index = m_write_index.load(std::memory_order_acquire);
    m_read_index.store(write_index, std::memory_order_release);
}

void BulkDataQueue::handleMcuResponse (McuResponse const &response)
{
    ASENSOR_ASSERT(response.type == McuResponseType::BulkData)

    size_t write_index = m_write_index.load(std::memory_order_relaxed);
    size_t read_index = m_read_index.load(std::memory_order_acquire);

    if (write_index - read_index >= m_slots.size()) {
        m_dropped.fetch_add(1, std::memory_order_relaxed);
        return;
    }

    size_t len = response.data_len;
    if (len > MaxBulkMsgSize) {
        len = MaxBulkMsgSize;
    }

    RawMessage &slot = m_slots[write_index & m_mask];
    slot.sequence = response.sequence;
    slot.data_len = (uint8_t)len;
    memcpy(slot.data, response.data, len);

    m_write_index.store(write_index + 1, std::memory_order_release);
}

}
