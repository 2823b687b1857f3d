/**
 * @file RftSendRunner.h
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
 * This RftSendRunner class is used for launching a TransferSender send attempt as its own process.
 * A termination signal (SIGINT or SIGTERM) pauses the attempt at the next chunk boundary;
 * the runner then reports the remote name and offset to pass to a later resume attempt.
 */

#ifndef _RFT_SEND_RUNNER_H
#define _RFT_SEND_RUNNER_H 1

#include <stdint.h>
#include <atomic>
#include "TransferSender.h"

class RftSendRunner {
public:
    RftSendRunner();
    ~RftSendRunner();
    bool Run(int argc, const char* const argv[], std::atomic<bool>& running, bool useSignalHandler);

    transfer_sender_result_t m_result;

private:
    void MonitorExitKeypressThreadFunction(int signalNumber);

    std::atomic<TransferSender*> m_transferSenderPtr;
};


#endif //_RFT_SEND_RUNNER_H
