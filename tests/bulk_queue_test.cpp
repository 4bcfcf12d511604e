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
#include <stdio.h>
#include <string.h>

#include <sched.h>

#include <vector>

#include <asensor/misc/Assert.h>
#include <asensor/misc/BinaryTools.h>
#include <asensor/misc/Callback.h>
#include <asensor/mcu/McuChannel.h>
#include <asensor/bulk/BulkDataQueue.h>
#include <asensor/platform/linux/LinuxThread.h>
#include <asensor/sim/SimulatedMcu.h>

using namespace ASensor;

static void deliver (BulkDataQueue &queue, uint16_t sequence)
{
    char data[8];
    memset(data, (uint8_t)sequence, sizeof(data));

    McuResponse response;
    response.type = McuResponseType::BulkData;
    response.oid = 0;
    response.sequence = sequence;
    response.data = data;
    response.data_len = sizeof(data);
    queue.handleMcuResponse(response);
}

static void test_fifo_and_clear ()
{
    SimulatedMcu mcu(1e6);
    BulkDataQueue queue(mcu, 0, 16);
    std::vector<RawMessage> out;

    for (uint16_t i = 0; i < 5; i++) {
        deliver(queue, i);
    }
    queue.pullSamples(out);
    ASENSOR_ASSERT_FORCE(out.size() == 5)
    for (uint16_t i = 0; i < 5; i++) {
        ASENSOR_ASSERT_FORCE(out[i].sequence == i)
        ASENSOR_ASSERT_FORCE(out[i].data_len == 8)
        ASENSOR_ASSERT_FORCE((uint8_t)out[i].data[7] == i)
    }

    // Pulling appends and empties the queue.
    deliver(queue, 5);
    queue.pullSamples(out);
    ASENSOR_ASSERT_FORCE(out.size() == 6)
    queue.pullSamples(out);
    ASENSOR_ASSERT_FORCE(out.size() == 6)

    deliver(queue, 6);
    deliver(queue, 7);
    queue.clearSamples();
    out.clear();
    queue.pullSamples(out);
    ASENSOR_ASSERT_FORCE(out.empty())
    ASENSOR_ASSERT_FORCE(queue.getDroppedCount() == 0)
}

static void test_drop_when_full ()
{
    SimulatedMcu mcu(1e6);
    BulkDataQueue queue(mcu, 0, 4);
    std::vector<RawMessage> out;

    for (uint16_t i = 0; i < 6; i++) {
        deliver(queue, i);
    }
    ASENSOR_ASSERT_FORCE(queue.getDroppedCount() == 2)

    queue.pullSamples(out);
    ASENSOR_ASSERT_FORCE(out.size() == 4)
    ASENSOR_ASSERT_FORCE(out[3].sequence == 3)

    // Space is available again after pulling.
    deliver(queue, 6);
    out.clear();
    queue.pullSamples(out);
    ASENSOR_ASSERT_FORCE(out.size() == 1 && out[0].sequence == 6)
}

static void test_registered_with_mcu ()
{
    SimulatedMcu mcu(1e6);
    mcu.addConfigCommand(McuCommand::make(
        "config_hx71x oid=%c chip_count=%c gain_channel=%c load_cell_endstop_oid=%c"
        " dout1_pin=%u sclk1_pin=%u dout2_pin=%u sclk2_pin=%u"
        " dout3_pin=%u sclk3_pin=%u dout4_pin=%u sclk4_pin=%u",
        0, 2, 1, 0, 10, 11, 12, 13, 10, 11, 10, 11), false);

    BulkDataQueue queue(mcu, 0);
    ASENSOR_ASSERT_FORCE(queue.getCapacity() == BulkDataQueue::DefaultCapacity)

    ASENSOR_ASSERT_FORCE(mcu.sendCommand(McuCommand::make("query_hx71x oid=%c rest_ticks=%u", 0, 8750)) == SensorErr::SUCCESS)
    mcu.advanceSeconds(1.0);

    // 80 blocks of 8 bytes, 6 per message.
    std::vector<RawMessage> out;
    queue.pullSamples(out);
    ASENSOR_ASSERT_FORCE(out.size() == 13)
    ASENSOR_ASSERT_FORCE(out[0].data_len == 48)
    ASENSOR_ASSERT_FORCE(out[12].sequence == 12)
}

struct Producer {
    BulkDataQueue *queue;
    uint32_t count;

    void run ()
    {
        for (uint32_t i = 0; i < count; i++) {
            char data[4];
            WriteBinaryInt<uint32_t, BinaryLittleEndian>(i, data);

            McuResponse response;
            response.type = McuResponseType::BulkData;
            response.oid = 0;
            response.sequence = (uint16_t)i;
            response.data = data;
            response.data_len = sizeof(data);
            queue->handleMcuResponse(response);
        }
    }
};

static void test_threaded_producer ()
{
    uint32_t const count = 200000;

    SimulatedMcu mcu(1e6);
    BulkDataQueue queue(mcu, 0, 64);

    Producer producer = {&queue, count};
    LinuxThread thread;
    thread.start(ASENSOR_CB_OBJFUNC(&Producer::run, &producer));

    std::vector<RawMessage> out;
    uint32_t received = 0;
    uint32_t expected_min = 0;

    while (received + queue.getDroppedCount() < count) {
        out.clear();
        queue.pullSamples(out);
        for (RawMessage const &msg : out) {
            // Order is preserved; drops only skip ahead.
            uint32_t index = ReadBinaryInt<uint32_t, BinaryLittleEndian>(msg.data);
            ASENSOR_ASSERT_FORCE(index >= expected_min && index < count)
            ASENSOR_ASSERT_FORCE(msg.sequence == (uint16_t)index)
            expected_min = index + 1;
        }
        received += (uint32_t)out.size();
        if (out.empty()) {
            sched_yield();
        }
    }

    thread.join();

    out.clear();
    queue.pullSamples(out);
    ASENSOR_ASSERT_FORCE(out.empty())
    ASENSOR_ASSERT_FORCE(received + queue.getDroppedCount() == count)
}

int main ()
{
    test_fifo_and_clear();
    test_drop_when_full();
    test_registered_with_mcu();
    test_threaded_producer();

    printf("bulk_queue_test: OK\n");
    return 0;
}
