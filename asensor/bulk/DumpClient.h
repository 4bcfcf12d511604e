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

#ifndef ASENSOR_DUMP_CLIENT_H
#define ASENSOR_DUMP_CLIENT_H

#include <stdint.h>

#include <asensor/misc/OutputStream.h>
#include <asensor/bulk/AdcSample.h>
#include <asensor/bulk/BatchClient.h>

namespace ASensor {

/**
 * A named feed of the batches of a sensor, e.g. path "hx71x/dump_hx71x"
 * selected by key "sensor" with the sensor name as value. The header
 * lists the names of the fields of each data row.
 */
struct DumpEndpoint {
    char const *path;
    char const *key;
    char const *value;
    char const * const *header;
    uint8_t header_len;
};

/**
 * A batch client which writes batches as JSON lines to an OutputStream.
 *
 * When opened on an endpoint, the line {"header":[...]} is written.
 * Each batch is written as
 * {"data":[[time,total_counts,counts0,...],...],"overflows":N,"missed":M}.
 */
class DumpClient : public BatchClient {
public:
    DumpClient (OutputStream *out);

    /**
     * Stop receiving data; the client is detached at the next batch.
     */
    inline void close ()
    {
        m_closed = true;
    }

    inline bool isClosed () const
    {
        return m_closed;
    }

    inline uint32_t getNumBatches () const
    {
        return m_num_batches;
    }

    void writeHeader (DumpEndpoint const &endpoint);

protected:
    bool handleBatch (AdcSampleBatch const &batch) override;

private:
    OutputStream *m_out;
    bool m_closed;
    uint32_t m_num_batches;
};

}

#endif
