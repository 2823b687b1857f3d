/**
 * @file SignalHandler.cpp
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

#include "SignalHandler.h"
#include <boost/make_unique.hpp>
#include <boost/bind/bind.hpp>
#include <signal.h>
#include "Logger.h"
#include "ThreadNamer.h"

static constexpr rft::Logger::SubProcess subprocess = rft::Logger::SubProcess::none;

SignalHandler::SignalHandler(const HandleSignalFunction_t & handleSignalFunction) :
    m_ioService(),
    m_signals(m_ioService),
    m_handleSignalFunction(handleSignalFunction),
    m_numSignalsReceived(0)
{
    m_signals.add(SIGINT);
    m_signals.add(SIGTERM);
#if defined(SIGQUIT)
    m_signals.add(SIGQUIT);
#endif // defined(SIGQUIT)
}

SignalHandler::~SignalHandler() {
    m_ioService.stop();
    if (m_ioServiceThreadPtr) {
        try {
            m_ioServiceThreadPtr->join();
        }
        catch (const boost::thread_resource_error&) {
            LOG_ERROR(subprocess) << "error stopping SignalHandler io_service";
        }
        m_ioServiceThreadPtr.reset();
    }
}

void SignalHandler::Start(bool useDedicatedThread) {
    m_signals.async_wait(boost::bind(&SignalHandler::HandleSignal, this,
        boost::asio::placeholders::error,
        boost::asio::placeholders::signal_number));
    if (useDedicatedThread) {
        m_ioServiceThreadPtr = boost::make_unique<boost::thread>(boost::bind(&boost::asio::io_service::run, &m_ioService));
        ThreadNamer::SetIoServiceThreadName(m_ioService, "ioServiceSignal");
    }
}

bool SignalHandler::PollOnce() {
    return (m_ioService.poll_one() > 0);
}

unsigned int SignalHandler::GetNumSignalsReceived() const {
    return m_numSignalsReceived.load(std::memory_order_acquire);
}

void SignalHandler::HandleSignal(const boost::system::error_code& error, int signalNumber) {
    if (error) {
        if (error != boost::asio::error::operation_aborted) {
            LOG_ERROR(subprocess) << "SignalHandler::HandleSignal: " << error.message();
        }
        return;
    }
    m_numSignalsReceived.fetch_add(1, std::memory_order_acq_rel);
    LOG_INFO(subprocess) << "received signal " << signalNumber;
    if (m_handleSignalFunction) {
        m_handleSignalFunction(signalNumber);
    }
}
