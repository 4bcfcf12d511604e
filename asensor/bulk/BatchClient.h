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

#ifndef ASENSOR_BATCH_CLIENT_H
#define ASENSOR_BATCH_CLIENT_H

#include <stddef.h>
#include <stdint.h>

#include <asensor/misc/Assert.h>
#include <asensor/misc/NonCopyable.h>
#include <asensor/bulk/AdcSample.h>

namespace ASensor {

class BatchClientList;

/**
 * A subscriber to the sample batches of a bulk sensor.
 *
 * A client is attached to at most one @ref BatchClientList. Destroying an
 * attached client detaches it.
 */
class BatchClient :
    private NonCopyable<BatchClient>
{
    friend class BatchClientList;

public:
    inline BatchClient () :
        m_list(nullptr),
        m_prev(nullptr),
        m_next(nullptr),
        m_added_gen(0)
    {
    }

    ~BatchClient ();

    inline bool isAttached () const
    {
        return m_list != nullptr;
    }

protected:
    /**
     * Called with each non-empty batch.
     *
     * The client may detach itself or other clients of the same list
     * from within this function.
     *
     * @return Whether the client wants further batches; if false it is
     *         detached.
     */
    virtual bool handleBatch (AdcSampleBatch const &batch) = 0;

private:
    BatchClientList *m_list;
    BatchClient *m_prev;
    BatchClient *m_next;
    uint32_t m_added_gen;
};

/**
 * An ordered list of @ref BatchClient with dispatch that tolerates
 * detaching clients during dispatch.
 */
class BatchClientList :
    private NonCopyable<BatchClientList>
{
public:
    inline BatchClientList () :
        m_first(nullptr),
        m_last(nullptr),
        m_count(0),
        m_dispatch_next(nullptr),
        m_dispatch_gen(0),
        m_dispatching(false)
    {
    }

    inline ~BatchClientList ()
    {
        removeAll();
    }

    inline bool isEmpty () const
    {
        return m_first == nullptr;
    }

    inline size_t count () const
    {
        return m_count;
    }

    void add (BatchClient &client)
    {
        ASENSOR_ASSERT(!client.isAttached())

        client.m_list = this;
        client.m_added_gen = m_dispatch_gen;
        client.m_prev = m_last;
        client.m_next = nullptr;
        if (m_last != nullptr) {
            m_last->m_next = &client;
        } else {
            m_first = &client;
        }
        m_last = &client;
        m_count++;
    }

    void remove (BatchClient &client)
    {
        ASENSOR_ASSERT(client.m_list == this)

        if (m_dispatch_next == &client) {
            m_dispatch_next = client.m_next;
        }

        if (client.m_prev != nullptr) {
            client.m_prev->m_next = client.m_next;
        } else {
            m_first = client.m_next;
        }
        if (client.m_next != nullptr) {
            client.m_next->m_prev = client.m_prev;
        } else {
            m_last = client.m_prev;
        }

        client.m_list = nullptr;
        client.m_prev = nullptr;
        client.m_next = nullptr;
        m_count--;
    }

    void removeAll ()
    {
        while (m_first != nullptr) {
            remove(*m_first);
        }
    }

    /**
     * Deliver a batch to all clients in the order they were added.
     *
     * Clients added during dispatch are not called for this batch.
     * A client must not be destroyed from within its own handleBatch.
     */
    void dispatch (AdcSampleBatch const &batch)
    {
        ASENSOR_ASSERT(!m_dispatching)

        m_dispatching = true;
        m_dispatch_gen++;

        BatchClient *client = m_first;
        while (client != nullptr) {
            m_dispatch_next = client->m_next;

            if (client->m_added_gen != m_dispatch_gen) {
                if (!client->handleBatch(batch) && client->m_list == this) {
                    remove(*client);
                }
            }

            client = m_dispatch_next;
        }

        m_dispatch_next = nullptr;
        m_dispatching = false;
    }

private:
    BatchClient *m_first;
    BatchClient *m_last;
    size_t m_count;
    BatchClient *m_dispatch_next;
    uint32_t m_dispatch_gen;
    bool m_dispatching;
};

inline BatchClient::~BatchClient ()
{
    if (m_list != nullptr) {
        m_list->remove(*this);
    }
}

}

#endif
