/**
 * @file TransferSession.cpp
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

#include <boost/bind/bind.hpp>
#include <memory>
#include <cerrno>
#include <cstring>
#include <algorithm>
#include "Logger.h"
#include "TransferSession.h"
#include "Utf8Paths.h"
#include <boost/lexical_cast.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

static constexpr rft::Logger::SubProcess subprocess = rft::Logger::SubProcess::receiver;

static constexpr uint64_t PROGRESS_LOG_INTERVAL_BYTES = 1024 * 1024;

static const char * const TRANSFER_SESSION_STATE_STRINGS[] = {
    "AwaitingEnvelope",
    "Validating",
    "Streaming",
    "Paused",
    "Completed",
    "Failed"
};

static const char * const TRANSFER_FAILURE_STRINGS[] = {
    "None",
    "DecodeError",
    "Rejected",
    "OffsetMismatch",
    "ReservationConflict",
    "UnknownTransfer",
    "SizeMismatch",
    "IOFailure"
};

const char * TransferSessionStateToString(TRANSFER_SESSION_STATE state) {
    return TRANSFER_SESSION_STATE_STRINGS[static_cast<unsigned int>(state)];
}

const char * TransferFailureToString(TRANSFER_FAILURE failure) {
    return TRANSFER_FAILURE_STRINGS[static_cast<unsigned int>(failure)];
}

static std::string GetRemoteEndpointString(const std::shared_ptr<boost::asio::ip::tcp::socket> & tcpSocketPtr) {
    boost::system::error_code ec;
    const boost::asio::ip::tcp::endpoint remoteEndpoint = tcpSocketPtr->remote_endpoint(ec);
    if (ec) {
        return "unknown";
    }
    return remoteEndpoint.address().to_string() + ":" + boost::lexical_cast<std::string>(remoteEndpoint.port());
}

static bool IsTransientIoError(int errorNumber) {
    if (errorNumber == ENOSPC) {
        return true;
    }
#ifdef EDQUOT
    if (errorNumber == EDQUOT) {
        return true;
    }
#endif
    return false;
}

transfer_session_telemetry_t::transfer_session_telemetry_t() :
    remoteEndpoint(),
    finalName(),
    state(TRANSFER_SESSION_STATE::AWAITING_ENVELOPE),
    failure(TRANSFER_FAILURE::NONE),
    declaredSize(0),
    bytesReceived(0) { }

TransferSession::TransferSession(std::shared_ptr<boost::asio::ip::tcp::socket> tcpSocketPtr,
    boost::asio::io_service & tcpSocketIoServiceRef,
    const ReceiverConfig & receiverConfig,
    const TransferValidationPolicy & validationPolicy,
    ReservationStore & reservationStore,
    const SessionOutcomeCallback_t & sessionOutcomeCallback,
    const NotifyReadyToDeleteCallback_t & notifyReadyToDeleteCallback) :

    m_sessionOutcomeCallback(sessionOutcomeCallback),
    m_notifyReadyToDeleteCallback(notifyReadyToDeleteCallback),
    m_tcpSocketPtr(tcpSocketPtr),
    m_tcpSocketIoServiceRef(tcpSocketIoServiceRef),
    m_strand(tcpSocketIoServiceRef),
    m_idleTimer(tcpSocketIoServiceRef),
    m_validationPolicyRef(validationPolicy),
    m_reservationStoreRef(reservationStore),
    M_MAX_FILENAME_LENGTH_BYTES(receiverConfig.m_maxFilenameLengthBytes),
    M_CHUNK_SIZE_BYTES(receiverConfig.m_chunkSizeBytes),
    M_PROGRESS_RECORD_INTERVAL_BYTES(receiverConfig.m_progressRecordIntervalBytes),
    M_IDLE_TIMEOUT(boost::posix_time::seconds(static_cast<long>(receiverConfig.m_idleTimeoutSeconds))),
    m_chunkBuffer(static_cast<std::size_t>(receiverConfig.m_chunkSizeBytes)),
    m_partialFileHandle(NULL),
    m_holdsReservation(false),
    m_reservationKnownToSender(false),
    m_bytesSinceLastRecord(0),
    m_nextProgressLogBytes(PROGRESS_LOG_INTERVAL_BYTES),
    m_readInProgress(false),
    m_writeInProgress(false),
    m_timerInProgress(false),
    m_shutdownRequested(false),
    m_idleTimedOut(false),
    m_outcomeReported(false),
    m_numPendingPosts(0),
    m_safeToDelete(false),
    M_REMOTE_ENDPOINT(GetRemoteEndpointString(tcpSocketPtr)),
    m_state(TRANSFER_SESSION_STATE::AWAITING_ENVELOPE),
    m_failure(TRANSFER_FAILURE::NONE),
    m_bytesReceived(0)
{
    LOG_INFO(subprocess) << "new transfer session from " << M_REMOTE_ENDPOINT;
}

TransferSession::~TransferSession() {
    if (!ReadyToBeDeleted()) {
        Stop();
        while (!ReadyToBeDeleted()) {
            try {
                boost::this_thread::sleep(boost::posix_time::milliseconds(50));
            }
            catch (const boost::thread_resource_error&) {}
            catch (const boost::thread_interrupted&) {}
        }
    }
    CloseFile();
}

void TransferSession::Start() {
    m_numPendingPosts.fetch_add(1, std::memory_order_acq_rel);
    boost::asio::post(m_strand, boost::bind(&TransferSession::DoStart, this));
}

void TransferSession::Stop() {
    m_numPendingPosts.fetch_add(1, std::memory_order_acq_rel);
    boost::asio::post(m_strand, boost::bind(&TransferSession::DoStop, this));
}

void TransferSession::DoStart() {
    if (!m_shutdownRequested) {
        m_lastActivityTime = boost::posix_time::microsec_clock::universal_time();
        StartIdleTimer();
        StartReadEnvelopeLength();
    }
    m_numPendingPosts.fetch_sub(1, std::memory_order_acq_rel); //last access to this
}

void TransferSession::DoStop() {
    if (!m_safeToDelete.load(std::memory_order_acquire)) {
        LOG_INFO(subprocess) << "stopping transfer session from " << M_REMOTE_ENDPOINT;
        DoSessionShutdown();
    }
    m_numPendingPosts.fetch_sub(1, std::memory_order_acq_rel); //last access to this
}

bool TransferSession::ReadyToBeDeleted() const {
    return m_safeToDelete.load(std::memory_order_acquire) && (m_numPendingPosts.load(std::memory_order_acquire) == 0);
}

TRANSFER_SESSION_STATE TransferSession::GetState() const {
    return m_state.load(std::memory_order_acquire);
}

void TransferSession::GetTelemetry(transfer_session_telemetry_t & telem) const {
    boost::mutex::scoped_lock lock(m_telemetryMutex);
    telem.remoteEndpoint = M_REMOTE_ENDPOINT;
    telem.finalName = m_finalName;
    telem.state = m_state.load(std::memory_order_acquire);
    telem.failure = m_failure.load(std::memory_order_acquire);
    telem.declaredSize = m_envelope.declaredSize;
    telem.bytesReceived = m_bytesReceived.load(std::memory_order_acquire);
}

void TransferSession::SetState(TRANSFER_SESSION_STATE state) {
    m_state.store(state, std::memory_order_release);
}

std::string TransferSession::GetPrintableFinalName() const {
    return Utf8Paths::ToPrintableString(m_finalName);
}

void TransferSession::StartIdleTimer() {
    m_idleTimer.expires_at(m_lastActivityTime + M_IDLE_TIMEOUT);
    m_timerInProgress = true;
    m_idleTimer.async_wait(boost::asio::bind_executor(m_strand,
        boost::bind(&TransferSession::OnIdleTimerExpired, this, boost::asio::placeholders::error)));
}

void TransferSession::OnIdleTimerExpired(const boost::system::error_code& e) {
    m_timerInProgress = false;
    if (m_shutdownRequested || (e == boost::asio::error::operation_aborted)) {
        TryFinishShutdown();
        return;
    }
    const boost::posix_time::ptime nowTime = boost::posix_time::microsec_clock::universal_time();
    if (nowTime >= (m_lastActivityTime + M_IDLE_TIMEOUT)) {
        LOG_WARNING(subprocess) << "no bytes from " << M_REMOTE_ENDPOINT << " for " << M_IDLE_TIMEOUT.total_seconds()
            << " seconds, closing the connection";
        m_idleTimedOut = true;
        //the pending read completes with operation_aborted and is handled as a disconnect
        boost::system::error_code ec;
        m_tcpSocketPtr->close(ec);
    }
    else {
        StartIdleTimer();
    }
}

void TransferSession::StartReadEnvelopeLength() {
    m_envelopeBuffer.resize(EnvelopeCodec::FILENAME_LENGTH_FIELD_SIZE);
    m_readInProgress = true;
    boost::asio::async_read(*m_tcpSocketPtr,
        boost::asio::buffer(m_envelopeBuffer),
        boost::asio::bind_executor(m_strand,
            boost::bind(&TransferSession::HandleReadEnvelopeLength, this,
                boost::asio::placeholders::error,
                boost::asio::placeholders::bytes_transferred)));
}

void TransferSession::HandleReadEnvelopeLength(const boost::system::error_code & error, std::size_t bytesTransferred) {
    m_readInProgress = false;
    if (m_shutdownRequested) {
        HandleDisconnect("session stopped");
        return;
    }
    if (error) {
        HandleDisconnect(m_idleTimedOut ? std::string("idle timeout before the envelope completed") : ("envelope read failed: " + error.message()));
        return;
    }
    m_lastActivityTime = boost::posix_time::microsec_clock::universal_time();
    const uint16_t filenameLength = EnvelopeCodec::DecodeFilenameLength(m_envelopeBuffer.data());
    if ((filenameLength == 0) || (filenameLength > M_MAX_FILENAME_LENGTH_BYTES) || (filenameLength > EnvelopeCodec::MAX_ENVELOPE_FILENAME_LENGTH)) {
        FailWithoutResponse(TRANSFER_FAILURE::DECODE_ERROR, "malformed envelope filename length " + boost::lexical_cast<std::string>(filenameLength));
        return;
    }
    const std::size_t remainderSize = filenameLength + EnvelopeCodec::ENVELOPE_TRAILER_SIZE;
    m_envelopeBuffer.resize(bytesTransferred + remainderSize);
    m_readInProgress = true;
    boost::asio::async_read(*m_tcpSocketPtr,
        boost::asio::buffer(&m_envelopeBuffer[bytesTransferred], remainderSize),
        boost::asio::bind_executor(m_strand,
            boost::bind(&TransferSession::HandleReadEnvelopeRemainder, this,
                boost::asio::placeholders::error,
                boost::asio::placeholders::bytes_transferred)));
}

void TransferSession::HandleReadEnvelopeRemainder(const boost::system::error_code & error, std::size_t bytesTransferred) {
    m_readInProgress = false;
    if (m_shutdownRequested) {
        HandleDisconnect("session stopped");
        return;
    }
    if (error) {
        HandleDisconnect(m_idleTimedOut ? std::string("idle timeout before the envelope completed") : ("envelope read failed: " + error.message()));
        return;
    }
    m_lastActivityTime = boost::posix_time::microsec_clock::universal_time();
    transfer_envelope_t envelope;
    std::size_t numBytesConsumed = 0;
    const ENVELOPE_DECODE_STATUS status = EnvelopeCodec::DecodeEnvelope(m_envelopeBuffer.data(), m_envelopeBuffer.size(),
        M_MAX_FILENAME_LENGTH_BYTES, envelope, numBytesConsumed);
    if (status == ENVELOPE_DECODE_STATUS::INVALID_OFFSET) {
        FailWithoutResponse(TRANSFER_FAILURE::DECODE_ERROR, "envelope resume offset exceeds its declared size");
        return;
    }
    else if (status != ENVELOPE_DECODE_STATUS::SUCCESS) {
        FailWithoutResponse(TRANSFER_FAILURE::DECODE_ERROR, "malformed envelope");
        return;
    }
    {
        boost::mutex::scoped_lock lock(m_telemetryMutex);
        m_envelope = std::move(envelope);
    }
    LOG_INFO(subprocess) << M_REMOTE_ENDPOINT << " requests " << Utf8Paths::ToPrintableString(m_envelope.filename)
        << " (" << m_envelope.declaredSize << " bytes"
        << (m_envelope.IsResume() ? (", resuming at " + boost::lexical_cast<std::string>(m_envelope.resumeOffset)) : std::string(""))
        << ")";
    ValidateAndReserve();
}

void TransferSession::ValidateAndReserve() {
    SetState(TRANSFER_SESSION_STATE::VALIDATING);
    const validation_result_t validationResult = m_validationPolicyRef.Evaluate(m_envelope.filename, m_envelope.declaredSize);
    if (!validationResult.IsAccepted()) {
        FailWithReject(TRANSFER_FAILURE::REJECTED, REJECT_REASON::REJECTED, validationResult.reason);
        return;
    }
    const std::string & sanitizedName = validationResult.sanitizedFilename;
    std::string finalName;
    if (m_envelope.IsResume()) {
        uint64_t recordedBytesReceived = 0;
        const RESERVATION_STATUS status = m_reservationStoreRef.AcquireForResume(sanitizedName,
            m_envelope.declaredSize, m_envelope.resumeOffset, recordedBytesReceived);
        switch (status) {
            case RESERVATION_STATUS::SUCCESS:
                break;
            case RESERVATION_STATUS::UNKNOWN_TRANSFER:
                FailWithReject(TRANSFER_FAILURE::UNKNOWN_TRANSFER, REJECT_REASON::UNKNOWN_TRANSFER,
                    "no paused transfer named " + Utf8Paths::ToPrintableString(sanitizedName));
                return;
            case RESERVATION_STATUS::CONFLICT:
                FailWithReject(TRANSFER_FAILURE::RESERVATION_CONFLICT, REJECT_REASON::RESERVATION_CONFLICT,
                    "the transfer is held by another connection, retry later");
                return;
            case RESERVATION_STATUS::SIZE_MISMATCH:
                FailWithReject(TRANSFER_FAILURE::SIZE_MISMATCH, REJECT_REASON::SIZE_MISMATCH,
                    "declared size " + boost::lexical_cast<std::string>(m_envelope.declaredSize) + " does not match the paused transfer");
                return;
            case RESERVATION_STATUS::OFFSET_MISMATCH:
                FailWithReject(TRANSFER_FAILURE::OFFSET_MISMATCH, REJECT_REASON::OFFSET_MISMATCH,
                    EnvelopeCodec::MakeOffsetMismatchExplanation(m_envelope.resumeOffset, recordedBytesReceived));
                return;
            default:
                FailWithReject(TRANSFER_FAILURE::IO_FAILURE, REJECT_REASON::IO_FAILURE, "unable to reopen the partial file");
                return;
        }
        finalName = sanitizedName;
        m_reservationKnownToSender = true;
    }
    else if (m_reservationStoreRef.AcquireUnstarted(sanitizedName, m_envelope.declaredSize) == RESERVATION_STATUS::SUCCESS) {
        //an earlier attempt paused before its first byte, continue it under the same name
        LOG_INFO(subprocess) << "continuing the empty paused transfer " << Utf8Paths::ToPrintableString(sanitizedName);
        finalName = sanitizedName;
        m_reservationKnownToSender = true;
    }
    else {
        const RESERVATION_STATUS status = m_reservationStoreRef.ReserveFresh(sanitizedName, m_envelope.declaredSize, finalName);
        if (status == RESERVATION_STATUS::NAME_EXHAUSTED) {
            FailWithReject(TRANSFER_FAILURE::REJECTED, REJECT_REASON::REJECTED, "no collision-free name is available");
            return;
        }
        else if (status != RESERVATION_STATUS::SUCCESS) {
            FailWithReject(TRANSFER_FAILURE::IO_FAILURE, REJECT_REASON::IO_FAILURE, "unable to create the partial file");
            return;
        }
    }
    {
        boost::mutex::scoped_lock lock(m_telemetryMutex);
        m_finalName = finalName;
    }
    m_holdsReservation = true;
    m_bytesReceived.store(m_envelope.resumeOffset, std::memory_order_release);
    m_nextProgressLogBytes = ((m_envelope.resumeOffset / PROGRESS_LOG_INTERVAL_BYTES) + 1) * PROGRESS_LOG_INTERVAL_BYTES;
    if (!OpenPartialFile()) {
        return;
    }

    SetState(TRANSFER_SESSION_STATE::STREAMING);
    LOG_INFO(subprocess) << "accepted " << GetPrintableFinalName() << " from " << M_REMOTE_ENDPOINT;
    EnvelopeCodec::GenerateAcceptResponse(m_responseBuffer, m_finalName);
    m_writeInProgress = true;
    boost::asio::async_write(*m_tcpSocketPtr,
        boost::asio::buffer(m_responseBuffer),
        boost::asio::bind_executor(m_strand,
            boost::bind(&TransferSession::HandleAcceptSent, this,
                boost::asio::placeholders::error,
                boost::asio::placeholders::bytes_transferred)));
}

bool TransferSession::OpenPartialFile() {
    const boost::filesystem::path partialPath = m_reservationStoreRef.GetPartialFilePath(m_finalName);
    errno = 0;
    //append mode, the reservation store leaves the partial file at exactly the accepted offset
    m_partialFileHandle = fopen(partialPath.string().c_str(), "ab");
    if (m_partialFileHandle == NULL) {
        FailIo(errno, "unable to open the partial file");
        return false;
    }
    return true;
}

void TransferSession::HandleAcceptSent(const boost::system::error_code & error, std::size_t bytesTransferred) {
    (void)bytesTransferred;
    m_writeInProgress = false;
    if (!error) {
        m_reservationKnownToSender = true;
    }
    if (m_shutdownRequested) {
        HandleDisconnect("session stopped");
        return;
    }
    if (error) {
        HandleDisconnect("unable to send the accept response: " + error.message());
        return;
    }
    if (m_bytesReceived.load(std::memory_order_acquire) == m_envelope.declaredSize) {
        CompleteTransfer();
    }
    else {
        StartReadChunk();
    }
}

//Note: the tcp layer will control flow in the event that the sender is faster than the disk
void TransferSession::StartReadChunk() {
    const uint64_t remaining = m_envelope.declaredSize - m_bytesReceived.load(std::memory_order_acquire);
    const std::size_t bytesToRead = static_cast<std::size_t>(std::min(M_CHUNK_SIZE_BYTES, remaining));
    m_readInProgress = true;
    m_tcpSocketPtr->async_read_some(
        boost::asio::buffer(m_chunkBuffer.data(), bytesToRead),
        boost::asio::bind_executor(m_strand,
            boost::bind(&TransferSession::HandleReadChunk, this,
                boost::asio::placeholders::error,
                boost::asio::placeholders::bytes_transferred)));
}

void TransferSession::HandleReadChunk(const boost::system::error_code & error, std::size_t bytesTransferred) {
    m_readInProgress = false;
    if (bytesTransferred) {
        m_lastActivityTime = boost::posix_time::microsec_clock::universal_time();
        errno = 0;
        if (fwrite(m_chunkBuffer.data(), 1, bytesTransferred, m_partialFileHandle) != bytesTransferred) {
            FailIo(errno, "write to the partial file failed");
            return;
        }
        const uint64_t bytesReceived = m_bytesReceived.fetch_add(bytesTransferred, std::memory_order_acq_rel) + bytesTransferred;
        m_bytesSinceLastRecord += bytesTransferred;
        if (bytesReceived >= m_nextProgressLogBytes) {
            LOG_INFO(subprocess) << GetPrintableFinalName() << ": received " << bytesReceived << " of " << m_envelope.declaredSize << " bytes";
            m_nextProgressLogBytes = ((bytesReceived / PROGRESS_LOG_INTERVAL_BYTES) + 1) * PROGRESS_LOG_INTERVAL_BYTES;
        }
    }
    if (m_shutdownRequested) {
        HandleDisconnect("session stopped");
        return;
    }
    if (error) {
        if (error == boost::asio::error::eof) {
            HandleDisconnect("connection closed by peer");
        }
        else if (m_idleTimedOut) {
            HandleDisconnect("idle timeout");
        }
        else {
            HandleDisconnect(error.message());
        }
        return;
    }
    if (m_bytesReceived.load(std::memory_order_acquire) == m_envelope.declaredSize) {
        CompleteTransfer();
        return;
    }
    if (m_bytesSinceLastRecord >= M_PROGRESS_RECORD_INTERVAL_BYTES) {
        if (!FlushAndRecordProgress()) {
            return;
        }
    }
    StartReadChunk();
}

bool TransferSession::FlushAndRecordProgress() {
    errno = 0;
    if (fflush(m_partialFileHandle) != 0) {
        FailIo(errno, "flush of the partial file failed");
        return false;
    }
    if (!m_reservationStoreRef.RecordProgress(m_finalName, m_bytesReceived.load(std::memory_order_acquire))) {
        //the previously recorded progress still stands and the unrecorded tail is truncated on resume
        CloseFile();
        m_reservationStoreRef.Release(m_finalName);
        m_holdsReservation = false;
        FailWithReject(TRANSFER_FAILURE::IO_FAILURE, REJECT_REASON::IO_FAILURE, "unable to record transfer progress");
        return false;
    }
    m_bytesSinceLastRecord = 0;
    return true;
}

void TransferSession::CompleteTransfer() {
    errno = 0;
    if (!CloseFile()) {
        FailIo(errno, "unable to close the partial file");
        return;
    }
    std::string publishedName;
    if (!m_reservationStoreRef.Finalize(m_finalName, publishedName)) {
        //keep the fully received partial file, a resume at the declared size retries the finalize
        m_reservationStoreRef.RecordProgress(m_finalName, m_bytesReceived.load(std::memory_order_acquire));
        m_reservationStoreRef.Release(m_finalName);
        m_holdsReservation = false;
        FailWithReject(TRANSFER_FAILURE::IO_FAILURE, REJECT_REASON::IO_FAILURE, "unable to publish the received file");
        return;
    }
    m_holdsReservation = false;
    if (publishedName != m_finalName) {
        boost::mutex::scoped_lock lock(m_telemetryMutex);
        m_finalName = publishedName;
    }
    SetState(TRANSFER_SESSION_STATE::COMPLETED);
    LOG_INFO(subprocess) << "completed " << GetPrintableFinalName() << " (" << m_envelope.declaredSize << " bytes) from " << M_REMOTE_ENDPOINT;
    ReportOutcome();
    EnvelopeCodec::GenerateCompletedResponse(m_responseBuffer);
    SendFinalResponseThenShutdown();
}

void TransferSession::PauseTransfer(const std::string & cause) {
    const uint64_t bytesReceived = m_bytesReceived.load(std::memory_order_acquire);
    bool flushed = true;
    if (m_partialFileHandle) {
        errno = 0;
        if (fflush(m_partialFileHandle) != 0) {
            LOG_ERROR(subprocess) << "flush of " << GetPrintableFinalName() << " failed: " << std::strerror(errno);
            flushed = false;
        }
    }
    CloseFile();
    if (m_holdsReservation) {
        if (flushed) {
            m_reservationStoreRef.RecordProgress(m_finalName, bytesReceived); //logs on failure
        }
        m_reservationStoreRef.Release(m_finalName);
        m_holdsReservation = false;
    }
    SetState(TRANSFER_SESSION_STATE::PAUSED);
    LOG_WARNING(subprocess) << "paused " << GetPrintableFinalName() << " at " << bytesReceived << " of "
        << m_envelope.declaredSize << " bytes from " << M_REMOTE_ENDPOINT << ": " << cause;
    ReportOutcome();
    DoSessionShutdown();
}

void TransferSession::HandleDisconnect(const std::string & cause) {
    const TRANSFER_SESSION_STATE state = GetState();
    if (state == TRANSFER_SESSION_STATE::AWAITING_ENVELOPE) {
        FailWithoutResponse(TRANSFER_FAILURE::DECODE_ERROR, cause);
    }
    else if (state == TRANSFER_SESSION_STATE::STREAMING) {
        PauseTransfer(cause);
    }
    else {
        DoSessionShutdown();
    }
}

void TransferSession::FailIo(int errorNumber, const std::string & what) {
    const std::string errorString = (errorNumber != 0) ? std::string(std::strerror(errorNumber)) : std::string("unknown error");
    CloseFile();
    if (m_holdsReservation) {
        if (KeepsReservationAfterIoError(errorNumber, m_reservationKnownToSender)) {
            LOG_WARNING(subprocess) << "keeping the partial file of " << GetPrintableFinalName() << " for a later resume";
            m_reservationStoreRef.Release(m_finalName);
        }
        else {
            m_reservationStoreRef.Abandon(m_finalName);
        }
        m_holdsReservation = false;
    }
    FailWithReject(TRANSFER_FAILURE::IO_FAILURE, REJECT_REASON::IO_FAILURE, what + ": " + errorString);
}

bool TransferSession::KeepsReservationAfterIoError(int errorNumber, bool reservationKnownToSender) {
    return reservationKnownToSender && IsTransientIoError(errorNumber);
}

void TransferSession::FailWithoutResponse(TRANSFER_FAILURE failure, const std::string & cause) {
    m_failure.store(failure, std::memory_order_release);
    SetState(TRANSFER_SESSION_STATE::FAILED);
    LOG_WARNING(subprocess) << "transfer session from " << M_REMOTE_ENDPOINT << " failed (" << TransferFailureToString(failure) << "): " << cause;
    ReportOutcome();
    DoSessionShutdown();
}

void TransferSession::FailWithReject(TRANSFER_FAILURE failure, REJECT_REASON reason, const std::string & explanation) {
    m_failure.store(failure, std::memory_order_release);
    SetState(TRANSFER_SESSION_STATE::FAILED);
    const std::string reasonText = EnvelopeCodec::MakeReasonText(reason, explanation);
    if (failure == TRANSFER_FAILURE::IO_FAILURE) {
        LOG_ERROR(subprocess) << "transfer session from " << M_REMOTE_ENDPOINT << " failed: " << reasonText;
    }
    else {
        LOG_WARNING(subprocess) << "transfer session from " << M_REMOTE_ENDPOINT << " rejected: " << reasonText;
    }
    ReportOutcome();
    EnvelopeCodec::GenerateRejectResponse(m_responseBuffer, reasonText);
    SendFinalResponseThenShutdown();
}

void TransferSession::SendFinalResponseThenShutdown() {
    if (m_shutdownRequested) {
        DoSessionShutdown();
        return;
    }
    m_writeInProgress = true;
    boost::asio::async_write(*m_tcpSocketPtr,
        boost::asio::buffer(m_responseBuffer),
        boost::asio::bind_executor(m_strand,
            boost::bind(&TransferSession::HandleFinalResponseSent, this,
                boost::asio::placeholders::error,
                boost::asio::placeholders::bytes_transferred)));
}

void TransferSession::HandleFinalResponseSent(const boost::system::error_code & error, std::size_t bytesTransferred) {
    (void)bytesTransferred;
    m_writeInProgress = false;
    if (error && (error != boost::asio::error::operation_aborted)) {
        LOG_DEBUG(subprocess) << "unable to send the final response to " << M_REMOTE_ENDPOINT << ": " << error.message();
    }
    DoSessionShutdown();
}

void TransferSession::ReportOutcome() {
    if (m_outcomeReported) {
        return;
    }
    m_outcomeReported = true;
    if (m_sessionOutcomeCallback) {
        transfer_session_telemetry_t outcome;
        GetTelemetry(outcome);
        m_sessionOutcomeCallback(outcome);
    }
}

bool TransferSession::CloseFile() {
    if (m_partialFileHandle == NULL) {
        return true;
    }
    const bool success = (fclose(m_partialFileHandle) == 0);
    m_partialFileHandle = NULL;
    if (!success) {
        LOG_ERROR(subprocess) << "error closing the partial file of " << GetPrintableFinalName() << ": " << std::strerror(errno);
    }
    return success;
}

void TransferSession::DoSessionShutdown() {
    if (!m_shutdownRequested) {
        m_shutdownRequested = true;
        boost::system::error_code ec;
        if (m_tcpSocketPtr->is_open()) {
            m_tcpSocketPtr->shutdown(boost::asio::socket_base::shutdown_type::shutdown_both, ec);
            if (ec && (ec != boost::asio::error::not_connected)) {
                LOG_DEBUG(subprocess) << "TransferSession::DoSessionShutdown: " << ec.message();
            }
            m_tcpSocketPtr->close(ec);
            if (ec) {
                LOG_ERROR(subprocess) << "TransferSession::DoSessionShutdown: " << ec.message();
            }
        }
        m_idleTimer.cancel(ec);
    }
    TryFinishShutdown();
}

void TransferSession::TryFinishShutdown() {
    if ((!m_shutdownRequested) || m_readInProgress || m_writeInProgress || m_timerInProgress || m_safeToDelete.load(std::memory_order_acquire)) {
        return;
    }
    //every handler has completed, so nothing references this session after m_safeToDelete is set
    if (m_holdsReservation) {
        PauseTransfer("session stopped");
        return; //PauseTransfer re-enters TryFinishShutdown
    }
    CloseFile();
    ReportOutcome();
    LOG_DEBUG(subprocess) << "transfer session from " << M_REMOTE_ENDPOINT << " finished in state " << TransferSessionStateToString(GetState());
    const NotifyReadyToDeleteCallback_t notifyReadyToDeleteCallback(m_notifyReadyToDeleteCallback);
    m_safeToDelete.store(true, std::memory_order_release);
    if (notifyReadyToDeleteCallback) {
        notifyReadyToDeleteCallback();
    }
}
