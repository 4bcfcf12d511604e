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

#ifndef ASENSOR_BATCH_BULK_HELPER_H
#define ASENSOR_BATCH_BULK_HELPER_H

#include <stdint.h>
#include <stddef.h>
#include <string.h>

#include <vector>

#include <asensor/misc/Assert.h>
#include <asensor/misc/Err.h>
#include <asensor/misc/NonCopyable.h>
#include <asensor/misc/OutputStream.h>
#include <asensor/platform/PlatformFacade.h>
#include <asensor/bulk/AdcSample.h>
#include <asensor/bulk/BatchClient.h>
#include <asensor/bulk/BulkSensorDriver.h>
#include <asensor/bulk/DumpClient.h>

namespace ASensor {

enum class BulkState : uint8_t {
    Idle,
    Running,
    // Stopping failed; the session must be rebuilt.
    Failed,
};

/**
 * Runs a bulk sensor while it has clients and delivers sample batches to
 * them at a fixed interval.
 *
 * Measurement is started when the first client is added and stopped when
 * the last client is removed. Every batch interval the driver extracts the
 * pending samples, and if there are any the batch is passed to all clients.
 * A client returning false from its handler is removed.
 *
 * An error from processing stops measurement and detaches all clients. If
 * stopping fails (the MCU does not acknowledge), the helper enters the
 * Failed state in which no clients can be added.
 *
 * @tparam PlatformImpl The platform implementation, see @ref PlatformFacade.
 */
template <typename PlatformImpl>
class BatchBulkHelper :
    private NonCopyable<BatchBulkHelper<PlatformImpl>>,
    private PlatformFacade<PlatformImpl>::Timer
{
    using Platform = PlatformFacade<PlatformImpl>;
    using TimeType = typename Platform::TimeType;
    using Timer = typename Platform::Timer;

public:
    /**
     * Construct in Idle state.
     *
     * @param platform The platform, used for the batch timer.
     * @param driver The sensor driver. Must outlive this object.
     * @param log Stream for messages, or null.
     * @param name Sensor name used in messages.
     * @param batch_interval Batch interval in seconds.
     */
    BatchBulkHelper (Platform platform, BulkSensorDriver &driver, OutputStream *log,
                     char const *name, double batch_interval) :
        Timer(platform),
        m_driver(driver),
        m_log(log),
        m_name(name),
        m_interval_ticks(Platform::secondsToTicks(batch_interval)),
        m_state(BulkState::Idle),
        m_processing(false)
    {
        ASENSOR_ASSERT(batch_interval > 0.0)
    }

    /**
     * Destroy, detaching all clients. No commands are sent to the MCU;
     * use @ref stop before if measurement may be running.
     */
    ~BatchBulkHelper ()
    {
        Timer::unset();
        m_clients.removeAll();
    }

    inline BulkState getState () const
    {
        return m_state;
    }

    inline bool isRunning () const
    {
        return m_state == BulkState::Running;
    }

    inline size_t getNumClients () const
    {
        return m_clients.count();
    }

    inline double getBatchInterval () const
    {
        return Platform::ticksToSeconds(m_interval_ticks);
    }

    /**
     * Add a client, starting measurement if not running.
     *
     * @return SUCCESS, SESSION_FAILED in Failed state, or the error from
     *         starting, in which case all clients are detached.
     */
    SensorErr addClient (BatchClient &client)
    {
        ASENSOR_ASSERT(!client.isAttached())

        if (m_state == BulkState::Failed) {
            return SensorErr::SESSION_FAILED;
        }

        m_clients.add(client);

        if (m_state == BulkState::Idle) {
            return start_measurement();
        }
        return SensorErr::SUCCESS;
    }

    /**
     * Remove a client; removing the last one stops measurement.
     */
    void removeClient (BatchClient &client)
    {
        m_clients.remove(client);

        if (m_clients.isEmpty() && m_state == BulkState::Running && !m_processing) {
            stop_measurement();
        }
    }

    /**
     * Stop measurement and detach all clients.
     */
    void stop ()
    {
        m_clients.removeAll();

        if (m_state == BulkState::Running && !m_processing) {
            stop_measurement();
        }
    }

    /**
     * Register a dump endpoint. The endpoint strings and header must
     * remain valid.
     */
    void addDumpEndpoint (DumpEndpoint const &endpoint)
    {
        m_endpoints.push_back(endpoint);
    }

    /**
     * Attach a dump client to the endpoint with the given path and key
     * value, writing the header to the client first.
     */
    SensorErr openDumpClient (char const *path, char const *value, DumpClient &client)
    {
        for (DumpEndpoint const &endpoint : m_endpoints) {
            if (!strcmp(endpoint.path, path) && !strcmp(endpoint.value, value)) {
                if (m_state == BulkState::Failed) {
                    return SensorErr::SESSION_FAILED;
                }
                client.writeHeader(endpoint);
                return addClient(client);
            }
        }
        return SensorErr::NO_SUCH_ENDPOINT;
    }

private:
    SensorErr start_measurement ()
    {
        ASENSOR_ASSERT(m_state == BulkState::Idle)

        SensorErr err = m_driver.bulkStart();
        if (err != SensorErr::SUCCESS) {
            log_error(err);
            m_clients.removeAll();
            return err;
        }

        m_state = BulkState::Running;
        Timer::setAfter(m_interval_ticks);

        return SensorErr::SUCCESS;
    }

    void stop_measurement ()
    {
        ASENSOR_ASSERT(m_state == BulkState::Running)

        m_clients.removeAll();
        Timer::unset();

        SensorErr err = m_driver.bulkFinish();
        if (err != SensorErr::SUCCESS) {
            log_error(err);
            m_state = BulkState::Failed;
            return;
        }

        m_state = BulkState::Idle;
    }

    void handleTimerExpired () override
    {
        ASENSOR_ASSERT(m_state == BulkState::Running)

        m_processing = true;

        m_batch.clear();
        SensorErr err = m_driver.bulkProcess(m_batch);

        if (err != SensorErr::SUCCESS) {
            log_error(err);
        }
        else if (!m_batch.isEmpty()) {
            m_clients.dispatch(m_batch);
        }

        m_processing = false;

        // Clients removed during processing stop measurement here, unless
        // others were added in the meantime.
        if (err != SensorErr::SUCCESS || m_clients.isEmpty()) {
            if (err == SensorErr::ACK_TIMEOUT) {
                // The MCU did not acknowledge stopping during processing.
                m_clients.removeAll();
                m_state = BulkState::Failed;
                return;
            }
            stop_measurement();
            return;
        }

        Timer::setAfter(m_interval_ticks);
    }

    void log_error (SensorErr err)
    {
        if (m_log != nullptr) {
            m_log->append_event("Error:", sensorErrStr(err), m_name);
        }
    }

    BulkSensorDriver &m_driver;
    OutputStream *m_log;
    char const *m_name;
    TimeType m_interval_ticks;
    BulkState m_state;
    bool m_processing;
    BatchClientList m_clients;
    AdcSampleBatch m_batch;
    std::vector<DumpEndpoint> m_endpoints;
};

}

#endif
