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

#ifndef ASENSOR_MCU_CHANNEL_H
#define ASENSOR_MCU_CHANNEL_H

#include <stdint.h>
#include <stddef.h>

#include <asensor/misc/Err.h>
#include <asensor/mcu/McuCommand.h>

namespace ASensor {

/**
 * Maximum payload size of a bulk data message from the MCU.
 */
static size_t const MaxBulkMsgSize = 51;

/**
 * Types of asynchronous responses from the MCU which a handler can be
 * registered for.
 */
enum class McuResponseType : uint8_t {
    BulkData,    /**< "sensor_bulk_data oid=%c sequence=%hu data=%*s" */
    SensorReset, /**< Sensor specific reset notification, e.g. "reset_hx71x oid=%c". */
};

/**
 * An asynchronous response as delivered to a @ref McuResponseHandler.
 *
 * For BulkData, sequence is the message sequence number and data and
 * data_len the payload. For other types these are zero.
 */
struct McuResponse {
    McuResponseType type;
    uint8_t oid;
    uint16_t sequence;
    char const *data;
    size_t data_len;
};

/**
 * The result of a "sensor_bulk_status" query.
 */
struct SensorBulkStatus {
    uint32_t clock;
    uint32_t query_ticks;
    uint16_t next_sequence;
    uint32_t buffered;
    uint16_t possible_overflows;
};

/**
 * Receiver of asynchronous responses for one (type, oid) pair.
 *
 * handleMcuResponse may be called from the transport thread, concurrently
 * with the event loop. The response data is only valid during the call.
 */
class McuResponseHandler {
public:
    inline McuResponseHandler (McuResponseType type, uint8_t oid) :
        m_response_type(type),
        m_response_oid(oid)
    {
    }

    inline McuResponseType getResponseType () const
    {
        return m_response_type;
    }

    inline uint8_t getResponseOid () const
    {
        return m_response_oid;
    }

    virtual void handleMcuResponse (McuResponse const &response) = 0;

protected:
    ~McuResponseHandler () = default;

private:
    McuResponseType m_response_type;
    uint8_t m_response_oid;
};

/**
 * Interface to a connected MCU as needed by bulk sensor drivers.
 *
 * Except where noted, functions are called from the event loop thread.
 * Clock values are MCU clock ticks; 64-bit clocks are extended from the
 * 32-bit clock the MCU reports. Print time is the host time base in
 * seconds which samples are timestamped in.
 */
class McuChannel {
public:
    /**
     * Allocate an object id on the MCU. Only valid during configuration.
     */
    virtual uint8_t createOid () = 0;

    /**
     * Extend a 32-bit MCU clock which is close to the present.
     */
    virtual uint64_t clock32ToClock64 (uint32_t clock32) = 0;

    virtual double clockToPrintTime (uint64_t clock) = 0;

    virtual uint64_t printTimeToClock (double print_time) = 0;

    virtual uint64_t secondsToClock (double seconds) = 0;

    /**
     * Add a command to be sent when the MCU is configured. If on_restart
     * is true the command is also sent when the MCU is restarted.
     */
    virtual void addConfigCommand (McuCommand const &cmd, bool on_restart) = 0;

    /**
     * Queue a command without waiting for a response.
     */
    virtual SensorErr sendCommand (McuCommand const &cmd) = 0;

    /**
     * Send a command and wait (bounded) until the MCU acknowledged it.
     *
     * @return SUCCESS, or ACK_TIMEOUT if no acknowledgement arrived in time.
     */
    virtual SensorErr sendCommandWaitAck (McuCommand const &cmd) = 0;

    /**
     * Send a status query and wait (bounded) for the "sensor_bulk_status"
     * response.
     */
    virtual SensorErr queryBulkStatus (McuCommand const &cmd, SensorBulkStatus &status) = 0;

    /**
     * Register a response handler. Must not be called while the transport
     * may be delivering responses for the same type and oid.
     */
    virtual void registerResponse (McuResponseHandler &handler) = 0;

    virtual void unregisterResponse (McuResponseHandler &handler) = 0;

protected:
    ~McuChannel () = default;
};

/**
 * A pin on a specific MCU. A null mcu means the pin is not configured.
 */
struct McuPin {
    McuChannel *mcu;
    uint32_t pin;

    inline bool isSet () const
    {
        return mcu != nullptr;
    }
};

}

#endif
