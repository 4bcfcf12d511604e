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

#ifndef ASENSOR_SIMULATED_MCU_H
#define ASENSOR_SIMULATED_MCU_H

#include <stdint.h>
#include <stddef.h>

#include <pthread.h>

#include <vector>

#include <asensor/misc/NonCopyable.h>
#include <asensor/mcu/McuChannel.h>
#include <asensor/mcu/McuCommand.h>

namespace ASensor {

/**
 * An McuChannel implementation which simulates an MCU running one HX71x
 * sensor object.
 *
 * The MCU clock only advances through @ref advanceClock. While streaming,
 * a sample block is produced every sample period (derived from the
 * rest_ticks of the start command as rest_ticks / 0.7), and blocks are
 * sent as bulk data messages when a message is full.
 *
 * Commands are recorded and can be inspected. Faults (resets, overflows,
 * lost messages, unacknowledged commands, failed queries) can be injected.
 *
 * All functions are thread safe. Responses are delivered to handlers
 * without the internal lock held, from the thread calling
 * @ref advanceClock or @ref injectReset.
 */
class SimulatedMcu :
    private NonCopyable<SimulatedMcu>,
    public McuChannel
{
public:
    /**
     * @param mcu_freq MCU clock frequency in Hz.
     */
    SimulatedMcu (double mcu_freq);

    ~SimulatedMcu ();

    uint8_t createOid () override;
    uint64_t clock32ToClock64 (uint32_t clock32) override;
    double clockToPrintTime (uint64_t clock) override;
    uint64_t printTimeToClock (double print_time) override;
    uint64_t secondsToClock (double seconds) override;
    void addConfigCommand (McuCommand const &cmd, bool on_restart) override;
    SensorErr sendCommand (McuCommand const &cmd) override;
    SensorErr sendCommandWaitAck (McuCommand const &cmd) override;
    SensorErr queryBulkStatus (McuCommand const &cmd, SensorBulkStatus &status) override;
    void registerResponse (McuResponseHandler &handler) override;
    void unregisterResponse (McuResponseHandler &handler) override;

    inline double getMcuFreq () const
    {
        return m_mcu_freq;
    }

    uint64_t getClock ();

    /**
     * Advance the MCU clock, producing samples and sending messages.
     */
    void advanceClock (uint64_t clock);

    void advanceSeconds (double seconds);

    /**
     * Simulate an MCU restart: streaming stops and the on-restart
     * configuration commands are executed.
     */
    void restart ();

    /**
     * Set the counts reported by a chip: base + amplitude * sin(2 pi freq t).
     */
    void setChipSignal (uint8_t chip, int32_t base, double amplitude, double freq);

    /**
     * Stop streaming and send a reset notification for the sensor.
     */
    void injectReset ();

    void injectOverflows (uint16_t count);

    /**
     * Do not deliver the next count messages (their sequence numbers are
     * still used).
     */
    void dropNextMessages (uint32_t count);

    void setAckTimeout (bool ack_timeout);

    void setQueryFail (bool query_fail);

    /**
     * Set the query duration reported in status responses, in MCU ticks.
     */
    void setQueryTicks (uint32_t query_ticks);

    bool isStreaming ();

    uint32_t getRestTicks ();

    uint16_t getNextSequence ();

    /**
     * Count recorded commands (sent, acked, queried or config) by message name.
     */
    size_t commandCount (char const *name);

    /**
     * Get the most recent recorded command with the given name.
     */
    bool lastCommand (char const *name, McuCommand &out);

    /**
     * Count recorded commands with the given name starting at the given
     * position in the history.
     */
    size_t countSince (char const *name, size_t start_index);

    size_t historySize ();

    McuCommand historyAt (size_t index);

private:
    struct ConfigCmd {
        McuCommand cmd;
        bool on_restart;
    };

    struct Signal {
        int32_t base;
        double amplitude;
        double freq;
    };

    struct PendingResponse {
        McuResponseType type;
        uint16_t sequence;
        uint8_t data_len;
        char data[MaxBulkMsgSize];
    };

    void lock ();
    void unlock ();
    void apply_command (McuCommand const &cmd);
    void produce_until (uint64_t clock, std::vector<PendingResponse> &out);
    void deliver (std::vector<PendingResponse> const &responses);

    double m_mcu_freq;
    pthread_mutex_t m_mutex;
    uint64_t m_clock;
    uint8_t m_next_oid;
    std::vector<McuResponseHandler *> m_handlers;
    std::vector<ConfigCmd> m_config_cmds;
    std::vector<McuCommand> m_history;

    // HX71x object state.
    bool m_configured;
    uint8_t m_oid;
    uint8_t m_chip_count;
    bool m_streaming;
    uint32_t m_rest_ticks;
    double m_sample_period;
    double m_next_sample_clock;
    uint16_t m_sequence;
    uint16_t m_possible_overflows;
    char m_buffer[MaxBulkMsgSize];
    uint8_t m_buffer_len;
    Signal m_signals[4];

    uint32_t m_drop_messages;
    bool m_ack_timeout;
    bool m_query_fail;
    uint32_t m_query_ticks;
};

}

#endif
