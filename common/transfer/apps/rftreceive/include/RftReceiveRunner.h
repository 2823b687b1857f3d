/**
 * @file RftReceiveRunner.h
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 *
 * @section DESCRIPTION
 *
 * This RftReceiveRunner class is used for launching the TransferReceiver class into its own process.
 * The RftReceiveRunner provides a blocking Run function which loads the receiver configuration,
 * applies command line overrides, and keeps the receiver running until a termination signal
 * (SIGINT or SIGTERM) arrives, at which point in-flight transfers are paused and the process exits.
 */

#ifndef _RFT_RECEIVE_RUNNER_H
#define _RFT_RECEIVE_RUNNER_H 1

#include <stdint.h>
#include <atomic>
#include "TransferReceiver.h"

class RftReceiveRunner {
public:
    RftReceiveRunner();
    ~RftReceiveRunner();
    bool Run(int argc, const char* const argv[], std::atomic<bool>& running, bool useSignalHandler);

    transfer_receiver_telemetry_t m_finalTelemetry;

private:
    void MonitorExitKeypressThreadFunction(int signalNumber);

    std::atomic<bool> m_runningFromSigHandler;
};


#endif //_RFT_RECEIVE_RUNNER_H
