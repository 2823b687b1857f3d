/**
 * @file ThreadNamer.cpp
 *
 * @copyright Copyright © 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include "ThreadNamer.h"
#include <boost/bind/bind.hpp>
#include "Logger.h"
#include <sys/prctl.h>

static constexpr rft::Logger::SubProcess subprocess = rft::Logger::SubProcess::none;

//linux limits thread names to 16 bytes including the null terminator
static const std::size_t MAX_THREAD_NAME_LENGTH = 15;

void ThreadNamer::SetThisThreadName(const std::string& threadName) {
    const std::string truncatedName = threadName.substr(0, MAX_THREAD_NAME_LENGTH);
    if (prctl(PR_SET_NAME, truncatedName.c_str(), 0, 0, 0) != 0) {
        LOG_DEBUG(subprocess) << "unable to set thread name " << truncatedName;
    }
}

void ThreadNamer::SetIoServiceThreadName(boost::asio::io_service& ioService, const std::string& threadName) {
    boost::asio::post(ioService, boost::bind(&ThreadNamer::SetThisThreadName, threadName));
}
