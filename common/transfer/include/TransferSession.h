/**
 * @file TransferSession.h
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
 * This TransferSession class owns the lifecycle of one accepted connection:
 * it reads the envelope, asks the validation policy to accept or reject it,
 * reserves (or, on resume, re-acquires) a collision-free final name,
 * streams the file body into the partial file, and finalizes the file once
 * every declared byte has arrived.  A connection that ends mid-stream leaves the
 * transfer paused with its progress recorded so that a later connection can resume it.
 *
 * All completion handlers run through a per-session strand so that sessions
 * sharing a multi-threaded io_service proceed independently.
 */

#ifndef _TRANSFER_SESSION_H
#define _TRANSFER_SESSION_H 1

#include <stdint.h>
#include <cstdio>
#include <boost/asio.hpp>
#include <boost/thread.hpp>
#include <boost/function.hpp>
#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <memory>
#include <atomic>
#include <string>
#include <vector>
#include "EnvelopeCodec.h"
#include "TransferValidationPolicy.h"
#include "ReservationStore.h"
#include "ReceiverConfig.h"
#include "rft_transfer_export.h"

enum class TRANSFER_SESSION_STATE {
    AWAITING_ENVELOPE = 0,
    VALIDATING,
    STREAMING,
    PAUSED,
    COMPLETED,
    FAILED
};

enum class TRANSFER_FAILURE {
    NONE = 0,
    DECODE_ERROR,
    REJECTED,
    OFFSET_MISMATCH,
    RESERVATION_CONFLICT,
    UNKNOWN_TRANSFER,
    SIZE_MISMATCH,
    IO_FAILURE
};

RFT_TRANSFER_EXPORT const char * TransferSessionStateToString(TRANSFER_SESSION_STATE state);
RFT_TRANSFER_EXPORT const char * TransferFailureToString(TRANSFER_FAILURE failure);

struct transfer_session_telemetry_t {
    std::string remoteEndpoint;
    std::string finalName;
    TRANSFER_SESSION_STATE state;
    TRANSFER_FAILURE failure;
    uint64_t declaredSize;
    uint64_t bytesReceived;

    RFT_TRANSFER_EXPORT transfer_session_telemetry_t();
};

class TransferSession {
private:
    TransferSession();
public:
    typedef boost::function<void(const transfer_session_telemetry_t & outcome)> SessionOutcomeCallback_t;
    typedef boost::function<void()> NotifyReadyToDeleteCallback_t;

    RFT_TRANSFER_EXPORT TransferSession(std::shared_ptr<boost::asio::ip::tcp::socket> tcpSocketPtr,
        boost::asio::io_service & tcpSocketIoServiceRef,
        const ReceiverConfig & receiverConfig,
        const TransferValidationPolicy & validationPolicy,
        ReservationStore & reservationStore,
        const SessionOutcomeCallback_t & sessionOutcomeCallback = SessionOutcomeCallback_t(),
        const NotifyReadyToDeleteCallback_t & notifyReadyToDeleteCallback = NotifyReadyToDeleteCallback_t());
    RFT_TRANSFER_EXPORT ~TransferSession();

    /// Begin reading the envelope, must be called exactly once after construction
    RFT_TRANSFER_EXPORT void Start();

    /// Close the connection (thread safe), a transfer in progress becomes paused
    RFT_TRANSFER_EXPORT void Stop();

    RFT_TRANSFER_EXPORT bool ReadyToBeDeleted() const;
    RFT_TRANSFER_EXPORT void GetTelemetry(transfer_session_telemetry_t & telem) const;
    RFT_TRANSFER_EXPORT TRANSFER_SESSION_STATE GetState() const;

    /** Whether a failed write or open leaves the reservation paused for a later resume.
     *
     * Only a full disk or exhausted quota keeps it, and only once the sender was told the
     * resolved name; anything else deletes the reservation and its partial file.
     */
    RFT_TRANSFER_EXPORT static bool KeepsReservationAfterIoError(int errorNumber, bool reservationKnownToSender);

private:
    RFT_TRANSFER_NO_EXPORT void DoStart();
    RFT_TRANSFER_NO_EXPORT void DoStop();
    RFT_TRANSFER_NO_EXPORT void StartIdleTimer();
    RFT_TRANSFER_NO_EXPORT void OnIdleTimerExpired(const boost::system::error_code& e);
    RFT_TRANSFER_NO_EXPORT void StartReadEnvelopeLength();
    RFT_TRANSFER_NO_EXPORT void HandleReadEnvelopeLength(const boost::system::error_code & error, std::size_t bytesTransferred);
    RFT_TRANSFER_NO_EXPORT void HandleReadEnvelopeRemainder(const boost::system::error_code & error, std::size_t bytesTransferred);
    RFT_TRANSFER_NO_EXPORT void ValidateAndReserve();
    RFT_TRANSFER_NO_EXPORT bool OpenPartialFile();
    RFT_TRANSFER_NO_EXPORT void HandleAcceptSent(const boost::system::error_code & error, std::size_t bytesTransferred);
    RFT_TRANSFER_NO_EXPORT void StartReadChunk();
    RFT_TRANSFER_NO_EXPORT void HandleReadChunk(const boost::system::error_code & error, std::size_t bytesTransferred);
    RFT_TRANSFER_NO_EXPORT bool FlushAndRecordProgress();
    RFT_TRANSFER_NO_EXPORT void CompleteTransfer();
    RFT_TRANSFER_NO_EXPORT void PauseTransfer(const std::string & cause);
    RFT_TRANSFER_NO_EXPORT void HandleDisconnect(const std::string & cause);
    RFT_TRANSFER_NO_EXPORT void FailIo(int errorNumber, const std::string & what);
    RFT_TRANSFER_NO_EXPORT void FailWithoutResponse(TRANSFER_FAILURE failure, const std::string & cause);
    RFT_TRANSFER_NO_EXPORT void FailWithReject(TRANSFER_FAILURE failure, REJECT_REASON reason, const std::string & explanation);
    RFT_TRANSFER_NO_EXPORT void SendFinalResponseThenShutdown();
    RFT_TRANSFER_NO_EXPORT void HandleFinalResponseSent(const boost::system::error_code & error, std::size_t bytesTransferred);
    RFT_TRANSFER_NO_EXPORT void ReportOutcome();
    RFT_TRANSFER_NO_EXPORT bool CloseFile();
    RFT_TRANSFER_NO_EXPORT void DoSessionShutdown();
    RFT_TRANSFER_NO_EXPORT void TryFinishShutdown();
    RFT_TRANSFER_NO_EXPORT void SetState(TRANSFER_SESSION_STATE state);
    RFT_TRANSFER_NO_EXPORT std::string GetPrintableFinalName() const;

private:
    const SessionOutcomeCallback_t m_sessionOutcomeCallback;
    const NotifyReadyToDeleteCallback_t m_notifyReadyToDeleteCallback;

    std::shared_ptr<boost::asio::ip::tcp::socket> m_tcpSocketPtr;
    boost::asio::io_service & m_tcpSocketIoServiceRef;
    boost::asio::io_service::strand m_strand;
    boost::asio::deadline_timer m_idleTimer;
    const TransferValidationPolicy & m_validationPolicyRef;
    ReservationStore & m_reservationStoreRef;

    const uint64_t M_MAX_FILENAME_LENGTH_BYTES;
    const uint64_t M_CHUNK_SIZE_BYTES;
    const uint64_t M_PROGRESS_RECORD_INTERVAL_BYTES;
    const boost::posix_time::time_duration M_IDLE_TIMEOUT;

    std::vector<uint8_t> m_envelopeBuffer;
    std::vector<uint8_t> m_chunkBuffer;
    std::vector<uint8_t> m_responseBuffer;
    transfer_envelope_t m_envelope;
    std::string m_finalName;
    FILE * m_partialFileHandle;
    bool m_holdsReservation;
    bool m_reservationKnownToSender;
    uint64_t m_bytesSinceLastRecord;
    uint64_t m_nextProgressLogBytes;
    boost::posix_time::ptime m_lastActivityTime;

    //outstanding asynchronous operations (strand protected)
    bool m_readInProgress;
    bool m_writeInProgress;
    bool m_timerInProgress;
    bool m_shutdownRequested;
    bool m_idleTimedOut;
    bool m_outcomeReported;
    std::atomic<unsigned int> m_numPendingPosts;
    std::atomic<bool> m_safeToDelete;

    //telemetry
    mutable boost::mutex m_telemetryMutex;
    const std::string M_REMOTE_ENDPOINT;
    std::atomic<TRANSFER_SESSION_STATE> m_state;
    std::atomic<TRANSFER_FAILURE> m_failure;
    std::atomic<uint64_t> m_bytesReceived;
};

#endif  //_TRANSFER_SESSION_H
