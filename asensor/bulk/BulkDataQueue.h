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

#ifndef ASENSOR_BULK_DATA_QUEUE_H
#define ASENSOR_BULK_DATA_QUEUE_H

#include <stdint.h>
#include <stddef.h>

#include <atomic>
#include <vector>

#include <asensor/misc/NonCopyable.h>
#include <asensor/mcu/McuChannel.h>

namespace ASensor {

/**
 * A bulk data message as received from the MCU.
 */
struct RawMessage {
    uint16_t sequence;
    uint8_t data_len;
    char data[MaxBulkMsgSize];
};

/**
 * Receives bulk data messages for one sensor oid on the transport thread
 * and hands them over to the event loop thread.
 *
 * This is a single-producer single-consumer ring buffer. The producer is
 * @ref handleMcuResponse (transport thread), the consumer are
 * @ref pullSamples and @ref clearSamples (event loop thread). When the
 * ring is full, arriving messages are dropped and counted.
 */
class BulkDataQueue :
    private NonCopyable<BulkDataQueue>,
    public McuResponseHandler
{
public:
    static size_t const DefaultCapacity = 1024;

    /**
     * Construct and register for BulkData responses of the oid.
     *
     * @param capacity Number of message slots; must be a power of two.
     */
    BulkDataQueue (McuChannel &mcu, uint8_t oid, size_t capacity = DefaultCapacity);

    ~BulkDataQueue ();

    /**
     * Move all pending messages to the end of out, in arrival order.
     */
    void pullSamples (std::vector<RawMessage> &out);

    /**
     * Discard all pending messages.
     */
    void clearSamples ();

    inline uint32_t getDroppedCount () const
    {
        return m_dropped.load(std::memory_order_relaxed);
    }

    inline size_t getCapacity () const
    {
        return m_slots.size();
    }

    void handleMcuResponse (McuResponse const &response) override;

private:
    McuChannel &m_mcu;
    std::vector<RawMessage> m_slots;
    size_t m_mask;
    // Indices increase without bound and are reduced modulo capacity.
    std::atomic<size_t> m_write_index;
    std::atomic<size_t> m_read_index;
    std::atomic<uint32_t> m_dropped;
};

}

#endif
