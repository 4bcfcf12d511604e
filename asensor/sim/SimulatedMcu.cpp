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
#include <math.h>

#include <pthread.h>

#include <asensor/misc/Assert.h>
#include <asensor/misc/BinaryTools.h>
#include <asensor/misc/WrapCounter.h>

#include "SimulatedMcu.h"

namespace ASensor {

// The MCU polls the chip at 0.7 times the sample period.
static double const RestTicksFactor = 0.7;

SimulatedMcu::SimulatedMcu (double mcu_freq) :
    m_mcu_freq(mcu_freq),
    m_clock(0),
    m_next_oid(0),
    m_configured(false),
    m_oid(0),
    m_chip_count(0),
    m_streaming(false),
    m_rest_ticks(0),
    m_sample_period(0.0),
    m_next_sample_clock(0.0),
    m_sequence(0),
    m_possible_overflows(0),
    m_buffer_len(0),
    m_drop_messages(0),
    m_ack_timeout(false),
    m_query_fail(false),
    m_query_ticks(100)
{
    ASENSOR_ASSERT_FORCE(mcu_freq > 0.0)

    int res = ::pthread_mutex_init(&m_mutex, nullptr);
    ASENSOR_ASSERT_FORCE(res == 0)

    for (Signal &signal : m_signals) {
        signal = Signal{0, 0.0, 0.0};
    }
}

SimulatedMcu::~SimulatedMcu ()
{
    ASENSOR_ASSERT(m_handlers.empty())

    int res = ::pthread_mutex_destroy(&m_mutex);
    ASENSOR_ASSERT_FORCE(res == 0)
}

uint8_t SimulatedMcu::createOid ()
{
    lock();
    uint8_t oid = m_next_oid++;
    unlock();
    return oid;
}

uint64_t SimulatedMcu::clock32ToClock64 (uint32_t clock32)
{
    lock();
    int64_t clock = ExtendWrapCounter<uint32_t>((int64_t)m_clock, clock32);
    unlock();
    return (clock < 0) ? 0 : (uint64_t)clock;
}

double SimulatedMcu::clockToPrintTime (uint64_t clock)
{
    return clock / m_mcu_freq;
}

uint64_t SimulatedMcu::printTimeToClock (double print_time)
{
    return (uint64_t)llround(print_time * m_mcu_freq);
}

uint64_t SimulatedMcu::secondsToClock (double seconds)
{
    return (uint64_t)llround(seconds * m_mcu_freq);
}

void SimulatedMcu::addConfigCommand (McuCommand const &cmd, bool on_restart)
{
    lock();
    m_config_cmds.push_back(ConfigCmd{cmd, on_restart});
    m_history.push_back(cmd);
    apply_command(cmd);
    unlock();
}

SensorErr SimulatedMcu::sendCommand (McuCommand const &cmd)
{
    lock();
    m_history.push_back(cmd);
    apply_command(cmd);
    unlock();
    return SensorErr::SUCCESS;
}

SensorErr SimulatedMcu::sendCommandWaitAck (McuCommand const &cmd)
{
    lock();
    m_history.push_back(cmd);
    apply_command(cmd);
    bool ack_timeout = m_ack_timeout;
    unlock();

    return ack_timeout ? SensorErr::ACK_TIMEOUT : SensorErr::SUCCESS;
}

SensorErr SimulatedMcu::queryBulkStatus (McuCommand const &cmd, SensorBulkStatus &status)
{
    lock();
    m_history.push_back(cmd);

    SensorErr err = SensorErr::SUCCESS;
    if (m_query_fail || !m_configured || cmd.num_args < 1 || cmd.arg(0) != m_oid) {
        err = SensorErr::QUERY_FAILED;
    } else {
        status.clock = (uint32_t)m_clock;
        status.query_ticks = m_query_ticks;
        status.next_sequence = m_sequence;
        status.buffered = m_buffer_len;
        status.possible_overflows = m_possible_overflows;
    }
    unlock();

    return err;
}

void SimulatedMcu::registerResponse (McuResponseHandler &handler)
{
    lock();
    m_handlers.push_back(&handler);
    unlock();
}

void SimulatedMcu::unregisterResponse (McuResponseHandler &handler)
{
    lock();
    for (auto it = m_handlers.begin(); it != m_handlers.end(); ++it) {
        if (*it == &handler) {
            m_handlers.erase(it);
            break;
        }
    }
    unlock();
}

uint64_t SimulatedMcu::getClock ()
{
    lock();
    uint64_t clock = m_clock;
    unlock();
    return clock;
}

void SimulatedMcu::advanceClock (uint64_t clock)
{
    std::vector<PendingResponse> responses;

    lock();
    if (clock > m_clock) {
        produce_until(clock, responses);
        m_clock = clock;
    }
    unlock();

    deliver(responses);
}

void SimulatedMcu::advanceSeconds (double seconds)
{
    advanceClock(getClock() + secondsToClock(seconds));
}

void SimulatedMcu::restart ()
{
    lock();
    m_streaming = false;
    m_sequence = 0;
    m_buffer_len = 0;
    for (ConfigCmd const &config_cmd : m_config_cmds) {
        if (config_cmd.on_restart) {
            m_history.push_back(config_cmd.cmd);
            apply_command(config_cmd.cmd);
        }
    }
    unlock();
}

void SimulatedMcu::setChipSignal (uint8_t chip, int32_t base, double amplitude, double freq)
{
    ASENSOR_ASSERT_FORCE(chip < 4)

    lock();
    m_signals[chip] = Signal{base, amplitude, freq};
    unlock();
}

void SimulatedMcu::injectReset ()
{
    std::vector<PendingResponse> responses;

    lock();
    m_streaming = false;
    m_buffer_len = 0;
    PendingResponse resp = {};
    resp.type = McuResponseType::SensorReset;
    responses.push_back(resp);
    unlock();

    deliver(responses);
}

void SimulatedMcu::injectOverflows (uint16_t count)
{
    lock();
    m_possible_overflows += count;
    unlock();
}

void SimulatedMcu::dropNextMessages (uint32_t count)
{
    lock();
    m_drop_messages += count;
    unlock();
}

void SimulatedMcu::setAckTimeout (bool ack_timeout)
{
    lock();
    m_ack_timeout = ack_timeout;
    unlock();
}

void SimulatedMcu::setQueryFail (bool query_fail)
{
    lock();
    m_query_fail = query_fail;
    unlock();
}

void SimulatedMcu::setQueryTicks (uint32_t query_ticks)
{
    lock();
    m_query_ticks = query_ticks;
    unlock();
}

bool SimulatedMcu::isStreaming ()
{
    lock();
    bool streaming = m_streaming;
    unlock();
    return streaming;
}

uint32_t SimulatedMcu::getRestTicks ()
{
    lock();
    uint32_t rest_ticks = m_rest_ticks;
    unlock();
    return rest_ticks;
}

uint16_t SimulatedMcu::getNextSequence ()
{
    lock();
    uint16_t sequence = m_sequence;
    unlock();
    return sequence;
}

size_t SimulatedMcu::commandCount (char const *name)
{
    return countSince(name, 0);
}

bool SimulatedMcu::lastCommand (char const *name, McuCommand &out)
{
    bool found = false;

    lock();
    for (size_t i = m_history.size(); i > 0; i--) {
        if (m_history[i - 1].nameIs(name)) {
            out = m_history[i - 1];
            found = true;
            break;
        }
    }
    unlock();

    return found;
}

size_t SimulatedMcu::countSince (char const *name, size_t start_index)
{
    size_t count = 0;

    lock();
    for (size_t i = start_index; i < m_history.size(); i++) {
        if (m_history[i].nameIs(name)) {
            count++;
        }
    }
    unlock();

    return count;
}

size_t SimulatedMcu::historySize ()
{
    lock();
    size_t size = m_history.size();
    unlock();
    return size;
}

McuCommand SimulatedMcu::historyAt (size_t index)
{
    lock();
    ASENSOR_ASSERT_FORCE(index < m_history.size())
    McuCommand cmd = m_history[index];
    unlock();
    return cmd;
}

void SimulatedMcu::lock ()
{
    int res = ::pthread_mutex_lock(&m_mutex);
    ASENSOR_ASSERT_FORCE(res == 0)
}

void SimulatedMcu::unlock ()
{
    int res = ::pthread_mutex_unlock(&m_mutex);
    ASENSOR_ASSERT_FORCE(res == 0)
}

void SimulatedMcu::apply_command (McuCommand const &cmd)
{
    if (cmd.nameIs("config_hx71x")) {
        ASENSOR_ASSERT_FORCE(cmd.num_args == 12)
        m_configured = true;
        m_oid = (uint8_t)cmd.arg(0);
        m_chip_count = (uint8_t)cmd.arg(1);
        ASENSOR_ASSERT_FORCE(m_chip_count >= 1 && m_chip_count <= 4)
    }
    else if (cmd.nameIs("query_hx71x")) {
        ASENSOR_ASSERT_FORCE(cmd.num_args == 2)
        if (!m_configured || cmd.arg(0) != m_oid) {
            return;
        }
        m_rest_ticks = cmd.arg(1);
        if (m_rest_ticks == 0) {
            m_streaming = false;
            return;
        }
        m_streaming = true;
        m_sequence = 0;
        m_buffer_len = 0;
        m_possible_overflows = 0;
        m_sample_period = m_rest_ticks / RestTicksFactor;
        m_next_sample_clock = m_clock + m_sample_period;
    }
}

void SimulatedMcu::produce_until (uint64_t clock, std::vector<PendingResponse> &out)
{
    if (!m_streaming) {
        return;
    }

    uint8_t bytes_per_block = 4 * m_chip_count;
    uint8_t blocks_per_msg = MaxBulkMsgSize / bytes_per_block;

    while (m_next_sample_clock <= (double)clock) {
        double t = m_next_sample_clock / m_mcu_freq;
        for (uint8_t i = 0; i < m_chip_count; i++) {
            Signal const &signal = m_signals[i];
            double value = signal.base + signal.amplitude * sin(2.0 * M_PI * signal.freq * t);
            WriteBinaryInt<int32_t, BinaryLittleEndian>((int32_t)lround(value),
                                                        m_buffer + m_buffer_len);
            m_buffer_len += 4;
        }
        m_next_sample_clock += m_sample_period;

        if (m_buffer_len == blocks_per_msg * bytes_per_block) {
            if (m_drop_messages > 0) {
                m_drop_messages--;
            } else {
                PendingResponse resp;
                resp.type = McuResponseType::BulkData;
                resp.sequence = m_sequence;
                resp.data_len = m_buffer_len;
                memcpy(resp.data, m_buffer, m_buffer_len);
                out.push_back(resp);
            }
            m_sequence++;
            m_buffer_len = 0;
        }
    }
}

void SimulatedMcu::deliver (std::vector<PendingResponse> const &responses)
{
    for (PendingResponse const &resp : responses) {
        McuResponseHandler *handler = nullptr;

        lock();
        for (McuResponseHandler *h : m_handlers) {
            if (h->getResponseType() == resp.type && h->getResponseOid() == m_oid) {
                handler = h;
                break;
            }
        }
        uint8_t oid = m_oid;
        unlock();

        if (handler != nullptr) {
            McuResponse response;
            response.type = resp.type;
            response.oid = oid;
            response.sequence = resp.sequence;
            response.data = resp.data;
            response.data_len = resp.data_len;
            handler->handleMcuResponse(response);
        }
    }
}

}
