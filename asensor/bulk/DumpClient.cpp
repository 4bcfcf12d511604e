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

#include <asensor/bulk/JsonBuilder.h>

#include "DumpClient.h"

namespace ASensor {

// Enough for a row of a time and five 32-bit integers.
static size_t const RowBufferSize = 128;

DumpClient::DumpClient (OutputStream *out) :
    m_out(out),
    m_closed(false),
    m_num_batches(0)
{
}

void DumpClient::writeHeader (DumpEndpoint const &endpoint)
{
    m_out->append_str("{\"header\":[");
    for (uint8_t i = 0; i < endpoint.header_len; i++) {
        if (i > 0) {
            m_out->append_ch(',');
        }
        m_out->append_ch('"');
        m_out->append_str(endpoint.header[i]);
        m_out->append_ch('"');
    }
    m_out->append_str("]}\n");
    m_out->poke();
}

bool DumpClient::handleBatch (AdcSampleBatch const &batch)
{
    if (m_closed) {
        return false;
    }

    char buffer[RowBufferSize];
    JsonBuilder json;

    m_out->append_str("{\"data\":[");

    bool first = true;
    for (AdcSample const &sample : batch.samples) {
        json.loadBuffer(buffer, sizeof(buffer));
        json.startArray();
        json.add(JsonTime{sample.time});
        json.add(JsonInt32{sample.total_counts});
        for (uint8_t i = 0; i < sample.num_counts; i++) {
            json.add(JsonInt32{sample.counts[i]});
        }
        json.endArray();

        if (!first) {
            m_out->append_ch(',');
        }
        m_out->append_buffer(json.getData(), json.getLength());
        first = false;
    }

    json.loadBuffer(buffer, sizeof(buffer));
    json.addSafeKeyVal("overflows", JsonUint32{batch.overflows});
    json.addSafeKeyVal("missed", JsonUint32{batch.missed_messages});

    m_out->append_str("],");
    m_out->append_buffer(json.getData(), json.getLength());
    m_out->append_str("}\n");
    m_out->poke();

    m_num_batches++;
    return true;
}

}
