/**
 * @file TransferReceiver.cpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include "TransferReceiver.h"
#include "EnvelopeCodec.h"
#include "Logger.h"
#include "ThreadNamer.h"
#include <boost/make_unique.hpp>
#include <boost/bind/bind.hpp>
#include <boost/lexical_cast.hpp>
#include <algorithm>

static constexpr rft::Logger::SubProcess subprocess = rft::Logger::SubProcess::receiver;

static constexpr uint64_t MAX_PURGE_INTERVAL_SECONDS = 60;

static validation_policy_t MakeValidationPolicy(const ReceiverConfig & receiverConfig) {
    return validation_policy_t(receiverConfig.m_maxFileSizeBytes, receiverConfig.m_allowedExtensions);
}

static void SleepMilliseconds(unsigned int ms) {
    try {
        boost::this_thread::sleep(boost::posix_time::milliseconds(ms));
    }
    catch (const boost::thread_resource_error&) {}
    catch (const boost::thread_interrupted&) {}
}

transfer_receiver_telemetry_t::transfer_receiver_telemetry_t() :
    totalSessionsAccepted(0),
    totalSessionsCompleted(0),
    totalSessionsPaused(0),
    totalSessionsFailed(0),
    totalSessionsRefused(0),
    numActiveSessions(0),
    sessions() { }

TransferReceiver::TransferReceiver(const ReceiverConfig & receiverConfig) :
    M_CONFIG(receiverConfig),
    m_validationPolicy(MakeValidationPolicy(receiverConfig)),
    m_reservationStore(receiverConfig.m_receiveDirectory),
    m_ioService(),
    m_acceptorStrand(m_ioService),
    m_tcpAcceptor(m_ioService),
    m_housekeepingTimer(m_ioService),
    m_workPtr(boost::make_unique<boost::asio::io_service::work>(m_ioService)),
    m_running(false),
    m_acceptorClosed(false),
    m_secondsSinceLastPurge(0),
    m_listenPort(0),
    m_totalSessionsAccepted(0),
    m_totalSessionsCompleted(0),
    m_totalSessionsPaused(0),
    m_totalSessionsFailed(0),
    m_totalSessionsRefused(0),
    m_numActiveSessions(0)
{
}

TransferReceiver::~TransferReceiver() {
    Stop();
}

bool TransferReceiver::Init() {
    if (!M_CONFIG.IsValid()) { //prints message
        return false;
    }
    if (!m_reservationStore.Init()) {
        return false;
    }
    const std::size_t numPurged = m_reservationStore.PurgeStaleReservations(M_CONFIG.m_reservationStaleSeconds);
    if (numPurged) {
        LOG_INFO(subprocess) << "purged " << numPurged << " stale reservation(s) at startup";
    }

    try {
        const boost::asio::ip::address listenAddress = boost::asio::ip::make_address(M_CONFIG.m_listenAddress);
        const boost::asio::ip::tcp::endpoint listenEndpoint(listenAddress, M_CONFIG.m_listenPort);
        m_tcpAcceptor.open(listenEndpoint.protocol());
        m_tcpAcceptor.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
        m_tcpAcceptor.bind(listenEndpoint);
        m_tcpAcceptor.listen();
        m_listenPort = m_tcpAcceptor.local_endpoint().port();
    }
    catch (const boost::system::system_error & e) {
        LOG_ERROR(subprocess) << "unable to listen on " << M_CONFIG.m_listenAddress << ":" << M_CONFIG.m_listenPort << ": " << e.what();
        boost::system::error_code ec;
        m_tcpAcceptor.close(ec);
        return false;
    }

    m_running = true;
    StartTcpAccept();
    StartHousekeepingTimer();
    for (uint64_t i = 0; i < M_CONFIG.m_numIoThreads; ++i) {
        m_ioServiceThreadPtrs.push_back(boost::make_unique<boost::thread>(boost::bind(&boost::asio::io_service::run, &m_ioService)));
    }
    ThreadNamer::SetIoServiceThreadName(m_ioService, "ioServiceRftRx");
    LOG_INFO(subprocess) << "receiving into " << m_reservationStore.GetReceiveDirectory() << " on "
        << M_CONFIG.m_listenAddress << ":" << m_listenPort << " with " << M_CONFIG.m_numIoThreads << " I/O thread(s)";
    return true;
}

void TransferReceiver::Stop() {
    if (!m_running.exchange(false)) {
        return;
    }
    boost::asio::post(m_acceptorStrand, boost::bind(&TransferReceiver::DoCloseAcceptor, this));
    while (!m_acceptorClosed.load(std::memory_order_acquire)) {
        SleepMilliseconds(10);
    }

    {
        boost::mutex::scoped_lock lock(m_listTransferSessionsMutex);
        for (std::list<TransferSession>::iterator it = m_listTransferSessions.begin(); it != m_listTransferSessions.end(); ++it) {
            it->Stop();
        }
    }
    while (true) {
        bool allReadyToBeDeleted = true;
        {
            boost::mutex::scoped_lock lock(m_listTransferSessionsMutex);
            for (std::list<TransferSession>::const_iterator it = m_listTransferSessions.cbegin(); it != m_listTransferSessions.cend(); ++it) {
                if (!it->ReadyToBeDeleted()) {
                    allReadyToBeDeleted = false;
                    break;
                }
            }
            if (allReadyToBeDeleted) {
                m_listTransferSessions.clear();
                break;
            }
        }
        SleepMilliseconds(10);
    }

    m_workPtr.reset();
    for (std::size_t i = 0; i < m_ioServiceThreadPtrs.size(); ++i) {
        try {
            m_ioServiceThreadPtrs[i]->join();
        }
        catch (const boost::thread_resource_error&) {
            LOG_ERROR(subprocess) << "error stopping TransferReceiver io_service";
        }
    }
    m_ioServiceThreadPtrs.clear();
    LOG_INFO(subprocess) << "receiver stopped: " << m_totalSessionsCompleted << " completed, " << m_totalSessionsPaused
        << " paused, " << m_totalSessionsFailed << " failed, " << m_totalSessionsRefused << " refused";
}

void TransferReceiver::DoCloseAcceptor() {
    boost::system::error_code ec;
    if (m_tcpAcceptor.is_open()) {
        m_tcpAcceptor.close(ec);
        if (ec) {
            LOG_ERROR(subprocess) << "Error closing TCP Acceptor in TransferReceiver::Stop: " << ec.message();
        }
    }
    m_housekeepingTimer.cancel(ec);
    m_acceptorClosed = true;
}

void TransferReceiver::StartTcpAccept() {
    std::shared_ptr<boost::asio::ip::tcp::socket> newTcpSocketPtr = std::make_shared<boost::asio::ip::tcp::socket>(m_ioService);

    m_tcpAcceptor.async_accept(*newTcpSocketPtr,
        boost::asio::bind_executor(m_acceptorStrand,
            boost::bind(&TransferReceiver::HandleTcpAccept, this, newTcpSocketPtr, boost::asio::placeholders::error)));
}

void TransferReceiver::HandleTcpAccept(std::shared_ptr<boost::asio::ip::tcp::socket> & newTcpSocketPtr, const boost::system::error_code& error) {
    if (!error) {
        if (m_numActiveSessions.load(std::memory_order_acquire) >= M_CONFIG.m_maxConcurrentSessions) {
            RefuseConnection(newTcpSocketPtr);
        }
        else {
            ++m_numActiveSessions;
            ++m_totalSessionsAccepted;
            TransferSession * sessionPtr;
            {
                boost::mutex::scoped_lock lock(m_listTransferSessionsMutex);
                m_listTransferSessions.emplace_back(newTcpSocketPtr, m_ioService,
                    M_CONFIG,
                    m_validationPolicy,
                    m_reservationStore,
                    boost::bind(&TransferReceiver::SessionOutcomeReceived, this, boost::placeholders::_1),
                    boost::bind(&TransferReceiver::SessionReadyToBeDeletedNotificationReceived, this));
                sessionPtr = &m_listTransferSessions.back();
            }
            sessionPtr->Start();
        }
        StartTcpAccept(); //only accept if there was no error
    }
    else if (error != boost::asio::error::operation_aborted) {
        LOG_ERROR(subprocess) << "tcp accept error: " << error.message();
        if (m_running.load(std::memory_order_acquire)) {
            StartTcpAccept();
        }
    }
}

void TransferReceiver::RefuseConnection(std::shared_ptr<boost::asio::ip::tcp::socket> & newTcpSocketPtr) {
    ++m_totalSessionsRefused;
    boost::system::error_code ec;
    const boost::asio::ip::tcp::endpoint remoteEndpoint = newTcpSocketPtr->remote_endpoint(ec);
    LOG_WARNING(subprocess) << "refusing connection from " << remoteEndpoint << ": "
        << M_CONFIG.m_maxConcurrentSessions << " sessions already active";
    std::shared_ptr<std::vector<uint8_t> > refusalPtr = std::make_shared<std::vector<uint8_t> >();
    EnvelopeCodec::GenerateRejectResponse(*refusalPtr, REJECT_REASON::SERVER_BUSY,
        "maximum of " + boost::lexical_cast<std::string>(M_CONFIG.m_maxConcurrentSessions) + " concurrent sessions reached, retry later");
    boost::asio::async_write(*newTcpSocketPtr,
        boost::asio::buffer(*refusalPtr),
        boost::bind(&TransferReceiver::HandleRefusalSent, this, newTcpSocketPtr, refusalPtr, boost::asio::placeholders::error));
}

void TransferReceiver::HandleRefusalSent(std::shared_ptr<boost::asio::ip::tcp::socket> & tcpSocketPtr,
    std::shared_ptr<std::vector<uint8_t> > & refusalPtr, const boost::system::error_code& error)
{
    (void)refusalPtr;
    if (error) {
        LOG_DEBUG(subprocess) << "unable to send the refusal: " << error.message();
    }
    boost::system::error_code ec;
    tcpSocketPtr->shutdown(boost::asio::socket_base::shutdown_type::shutdown_both, ec);
    tcpSocketPtr->close(ec);
}

void TransferReceiver::SessionOutcomeReceived(const transfer_session_telemetry_t & outcome) {
    if (outcome.state == TRANSFER_SESSION_STATE::COMPLETED) {
        ++m_totalSessionsCompleted;
    }
    else if (outcome.state == TRANSFER_SESSION_STATE::PAUSED) {
        ++m_totalSessionsPaused;
    }
    else {
        ++m_totalSessionsFailed;
    }
    --m_numActiveSessions;
}

void TransferReceiver::SessionReadyToBeDeletedNotificationReceived() {
    boost::asio::post(m_ioService, boost::bind(&TransferReceiver::RemoveInactiveSessions, this));
}

void TransferReceiver::RemoveInactiveSessions() {
    boost::mutex::scoped_lock lock(m_listTransferSessionsMutex);
    m_listTransferSessions.remove_if([](const TransferSession& session) {
        return session.ReadyToBeDeleted();
    });
}

void TransferReceiver::StartHousekeepingTimer() {
    m_housekeepingTimer.expires_from_now(boost::posix_time::seconds(1));
    m_housekeepingTimer.async_wait(boost::asio::bind_executor(m_acceptorStrand,
        boost::bind(&TransferReceiver::OnHousekeeping_TimerExpired, this, boost::asio::placeholders::error)));
}

void TransferReceiver::OnHousekeeping_TimerExpired(const boost::system::error_code& e) {
    if ((e == boost::asio::error::operation_aborted) || (!m_running.load(std::memory_order_acquire))) {
        LOG_DEBUG(subprocess) << "housekeeping timer stopped";
        return;
    }
    //sessions that finished while a removal pass was already running
    RemoveInactiveSessions();

    const uint64_t staleSeconds = M_CONFIG.m_reservationStaleSeconds;
    if (staleSeconds) {
        ++m_secondsSinceLastPurge;
        if (m_secondsSinceLastPurge >= std::min(staleSeconds, MAX_PURGE_INTERVAL_SECONDS)) {
            m_secondsSinceLastPurge = 0;
            const std::size_t numPurged = m_reservationStore.PurgeStaleReservations(staleSeconds);
            if (numPurged) {
                LOG_INFO(subprocess) << "purged " << numPurged << " stale reservation(s)";
            }
        }
    }
    StartHousekeepingTimer();
}

uint16_t TransferReceiver::GetListenPort() const {
    return m_listenPort;
}

uint64_t TransferReceiver::GetNumActiveSessions() const {
    return m_numActiveSessions.load(std::memory_order_acquire);
}

uint64_t TransferReceiver::GetTotalSessionsCompleted() const {
    return m_totalSessionsCompleted.load(std::memory_order_acquire);
}

uint64_t TransferReceiver::GetTotalSessionsPaused() const {
    return m_totalSessionsPaused.load(std::memory_order_acquire);
}

uint64_t TransferReceiver::GetTotalSessionsFailed() const {
    return m_totalSessionsFailed.load(std::memory_order_acquire);
}

uint64_t TransferReceiver::GetTotalSessionsRefused() const {
    return m_totalSessionsRefused.load(std::memory_order_acquire);
}

ReservationStore & TransferReceiver::GetReservationStore() {
    return m_reservationStore;
}

const ReceiverConfig & TransferReceiver::GetConfig() const {
    return M_CONFIG;
}

void TransferReceiver::GetTelemetry(transfer_receiver_telemetry_t & telem) {
    telem.totalSessionsAccepted = m_totalSessionsAccepted;
    telem.totalSessionsCompleted = m_totalSessionsCompleted;
    telem.totalSessionsPaused = m_totalSessionsPaused;
    telem.totalSessionsFailed = m_totalSessionsFailed;
    telem.totalSessionsRefused = m_totalSessionsRefused;
    telem.numActiveSessions = m_numActiveSessions;
    telem.sessions.clear();
    boost::mutex::scoped_lock lock(m_listTransferSessionsMutex);
    for (std::list<TransferSession>::const_iterator it = m_listTransferSessions.cbegin(); it != m_listTransferSessions.cend(); ++it) {
        telem.sessions.emplace_back();
        it->GetTelemetry(telem.sessions.back());
    }
}
