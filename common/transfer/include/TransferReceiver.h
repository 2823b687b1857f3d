/**
 * @file TransferReceiver.h
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
 * The TransferReceiver class listens on the configured address and port and
 * hands every accepted connection to a new TransferSession, immediately returning
 * to accepting further connections.  Connections above the configured session limit
 * are refused with a SERVER_BUSY reject.  The receiver owns the receive directory's
 * ReservationStore and periodically purges stale paused reservations.
 */

#ifndef TRANSFER_RECEIVER_H
#define TRANSFER_RECEIVER_H 1

#include <string>
#include <list>
#include <vector>
#include <memory>
#include <atomic>
#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include "ReceiverConfig.h"
#include "TransferSession.h"
#include "TransferValidationPolicy.h"
#include "ReservationStore.h"
#include "rft_transfer_export.h"

struct transfer_receiver_telemetry_t {
    uint64_t totalSessionsAccepted;
    uint64_t totalSessionsCompleted;
    uint64_t totalSessionsPaused;
    uint64_t totalSessionsFailed;
    uint64_t totalSessionsRefused;
    uint64_t numActiveSessions;
    std::vector<transfer_session_telemetry_t> sessions;

    RFT_TRANSFER_EXPORT transfer_receiver_telemetry_t();
};

class TransferReceiver {
public:
    RFT_TRANSFER_EXPORT TransferReceiver(const ReceiverConfig & receiverConfig);
    RFT_TRANSFER_EXPORT ~TransferReceiver();

    /** Prepare the receive directory, bind the listen endpoint, and start the I/O threads.
     *
     * @return True if the receiver is listening, or False otherwise (reason is logged).
     */
    RFT_TRANSFER_EXPORT bool Init();

    /// Close the acceptor and every session (paused transfers stay resumable), then join the I/O threads
    RFT_TRANSFER_EXPORT void Stop();

    /// The bound listen port
    RFT_TRANSFER_EXPORT uint16_t GetListenPort() const;

    RFT_TRANSFER_EXPORT void GetTelemetry(transfer_receiver_telemetry_t & telem);
    RFT_TRANSFER_EXPORT uint64_t GetNumActiveSessions() const;
    RFT_TRANSFER_EXPORT uint64_t GetTotalSessionsCompleted() const;
    RFT_TRANSFER_EXPORT uint64_t GetTotalSessionsPaused() const;
    RFT_TRANSFER_EXPORT uint64_t GetTotalSessionsFailed() const;
    RFT_TRANSFER_EXPORT uint64_t GetTotalSessionsRefused() const;
    RFT_TRANSFER_EXPORT ReservationStore & GetReservationStore();
    RFT_TRANSFER_EXPORT const ReceiverConfig & GetConfig() const;

private:
    TransferReceiver();
    RFT_TRANSFER_NO_EXPORT void StartTcpAccept();
    RFT_TRANSFER_NO_EXPORT void HandleTcpAccept(std::shared_ptr<boost::asio::ip::tcp::socket> & newTcpSocketPtr, const boost::system::error_code& error);
    RFT_TRANSFER_NO_EXPORT void RefuseConnection(std::shared_ptr<boost::asio::ip::tcp::socket> & newTcpSocketPtr);
    RFT_TRANSFER_NO_EXPORT void HandleRefusalSent(std::shared_ptr<boost::asio::ip::tcp::socket> & tcpSocketPtr,
        std::shared_ptr<std::vector<uint8_t> > & refusalPtr, const boost::system::error_code& error);
    RFT_TRANSFER_NO_EXPORT void SessionOutcomeReceived(const transfer_session_telemetry_t & outcome);
    RFT_TRANSFER_NO_EXPORT void SessionReadyToBeDeletedNotificationReceived();
    RFT_TRANSFER_NO_EXPORT void RemoveInactiveSessions();
    RFT_TRANSFER_NO_EXPORT void StartHousekeepingTimer();
    RFT_TRANSFER_NO_EXPORT void OnHousekeeping_TimerExpired(const boost::system::error_code& e);
    RFT_TRANSFER_NO_EXPORT void DoCloseAcceptor();

private:
    const ReceiverConfig M_CONFIG;
    const TransferValidationPolicy m_validationPolicy;
    ReservationStore m_reservationStore;

    boost::asio::io_service m_ioService;
    boost::asio::io_service::strand m_acceptorStrand;
    boost::asio::ip::tcp::acceptor m_tcpAcceptor;
    boost::asio::deadline_timer m_housekeepingTimer;
    std::unique_ptr<boost::asio::io_service::work> m_workPtr;
    std::vector<std::unique_ptr<boost::thread> > m_ioServiceThreadPtrs;
    std::list<TransferSession> m_listTransferSessions;
    boost::mutex m_listTransferSessionsMutex;
    std::atomic<bool> m_running;
    std::atomic<bool> m_acceptorClosed;
    uint64_t m_secondsSinceLastPurge;
    uint16_t m_listenPort;

    //telemetry
    std::atomic<uint64_t> m_totalSessionsAccepted;
    std::atomic<uint64_t> m_totalSessionsCompleted;
    std::atomic<uint64_t> m_totalSessionsPaused;
    std::atomic<uint64_t> m_totalSessionsFailed;
    std::atomic<uint64_t> m_totalSessionsRefused;
    std::atomic<uint64_t> m_numActiveSessions;
};

#endif // TRANSFER_RECEIVER_H
