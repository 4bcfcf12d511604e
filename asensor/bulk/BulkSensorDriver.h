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

#ifndef ASENSOR_BULK_SENSOR_DRIVER_H
#define ASENSOR_BULK_SENSOR_DRIVER_H

#include <asensor/misc/Err.h>
#include <asensor/bulk/AdcSample.h>

namespace ASensor {

/**
 * The sensor specific part of a bulk sensor, driven by @ref BatchBulkHelper.
 */
class BulkSensorDriver {
public:
    /**
     * Start streaming on the MCU and reset clock tracking.
     *
     * On failure the MCU must be left not streaming.
     */
    virtual SensorErr bulkStart () = 0;

    /**
     * Stop streaming on the MCU, waiting for acknowledgement, and discard
     * pending data.
     */
    virtual SensorErr bulkFinish () = 0;

    /**
     * Update clock tracking and extract the samples received since the
     * previous call into batch, which is empty on entry.
     */
    virtual SensorErr bulkProcess (AdcSampleBatch &batch) = 0;

protected:
    ~BulkSensorDriver () = default;
};

}

#endif
