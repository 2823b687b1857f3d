/**
 * @file SignalHandler.h
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
 * This SignalHandler class captures termination signals (SIGINT, SIGTERM, SIGQUIT)
 * for the rftreceive and rftsend processes and calls a custom function with the
 * signal number when one arrives, so that in-flight transfers can be paused
 * cleanly (partial progress recorded) before the process exits.
 */

#ifndef SIGNAL_HANDLER_H
#define SIGNAL_HANDLER_H 1
#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include <boost/function.hpp>
#include <memory>
#include <atomic>
#include "rft_util_export.h"

class SignalHandler {
private:
    SignalHandler();
public:
    typedef boost::function<void(int signalNumber)> HandleSignalFunction_t;

    /**
     * Set the signal handler callback.
     * Register termination signals to listen for.
     * @param handleSignalFunction The signal handler callback.
     */
    RFT_UTIL_EXPORT SignalHandler(const HandleSignalFunction_t & handleSignalFunction);
    
    /// Release all underlying I/O resources
    RFT_UTIL_EXPORT ~SignalHandler();
    
    /** Start the signal event listener.
     *
     * @param useDedicatedThread Whether to spawn a separate thread for the I/O.
     */
    RFT_UTIL_EXPORT void Start(bool useDedicatedThread = true);

    /** Poll signal event listener.
     *
     * Only call when NOT using a dedicated I/O thread.
     * @return True if any signal events have occurred since last checked, or False otherwise.
     */
    RFT_UTIL_EXPORT bool PollOnce();

    /// Number of signals received since Start()
    RFT_UTIL_EXPORT unsigned int GetNumSignalsReceived() const;

private:
    RFT_UTIL_NO_EXPORT void HandleSignal(const boost::system::error_code& error, int signalNumber);

private:
    boost::asio::io_service m_ioService;
    boost::asio::signal_set m_signals;
    /// Thread that invokes m_ioService.run() (if using dedicated I/O thread)
    std::unique_ptr<boost::thread> m_ioServiceThreadPtr;
    HandleSignalFunction_t m_handleSignalFunction;
    std::atomic<unsigned int> m_numSignalsReceived;
};
#endif
