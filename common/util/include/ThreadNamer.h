/**
 * @file ThreadNamer.h
 *
 * @copyright Copyright © 2021 United States Government as represented by
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
 * This ThreadNamer static class is used to set the names of the current/calling thread
 * or of the threads running a boost::asio::io_service, so that the receiver's
 * io threads and session threads can be identified in a debugger or in top -H.
 */

#ifndef _THREAD_NAMER_H
#define _THREAD_NAMER_H 1

#include <boost/asio.hpp>
#include <string>
#include "rft_util_export.h"

class ThreadNamer {
public:
    
    ThreadNamer() = delete;

    /** Set the thread name for the current/calling thread.
     *
     * @param threadName The name to assign to the current/calling thread.
     *
     * @post The name of the current/calling thread is set to threadName.
     */
    RFT_UTIL_EXPORT static void SetThisThreadName(const std::string& threadName);

    /** Post a naming request to an io_service.
     *
     * The thread that dequeues the request (one of the threads calling ioService.run())
     * gets named.  Post once per thread in a pool.
     */
    RFT_UTIL_EXPORT static void SetIoServiceThreadName(boost::asio::io_service& ioService, const std::string& threadName);
};



#endif //_THREAD_NAMER_H
