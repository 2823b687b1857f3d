/**
 * @file TransferSender.h
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
 * The TransferSender class is the producing side of a transfer.  It connects to a
 * receiver, writes the envelope, waits for the accept or reject response, streams
 * the file from the resume offset, and finally waits for the completion byte.
 * A send attempt may deliberately stop early (or be asked to pause from another
 * thread), in which case the connection is closed and the receiver keeps the
 * transfer resumable under the resolved name returned in the result.
 */

#ifndef TRANSFER_SENDER_H
#define TRANSFER_SENDER_H 1

#include <cstdint>
#include <string>
#include <vector>
#include <atomic>
#include <boost/asio.hpp>
#include <boost/filesystem/path.hpp>
#include "EnvelopeCodec.h"
#include "rft_transfer_export.h"

enum class TRANSFER_SENDER_OUTCOME {
    COMPLETED = 0,
    PAUSED,
    REJECTED,
    CONNECTION_ERROR,
    LOCAL_FILE_ERROR
};

RFT_TRANSFER_EXPORT const char * TransferSenderOutcomeToString(TRANSFER_SENDER_OUTCOME outcome);

struct transfer_sender_result_t {
    TRANSFER_SENDER_OUTCOME outcome;
    /// The name chosen by the receiver, use it as the remote name of any resume attempt
    std::string resolvedName;
    /// Reject reason text or a description of the connection error
    std::string reason;
    REJECT_REASON rejectReason;
    uint64_t declaredSize;
    /// Bytes written during this attempt (not counting the resume offset)
    uint64_t bytesSent;
    /// Set when an OFFSET_MISMATCH reject told us how many bytes the receiver has recorded
    bool hasReceiverRecordedOffset;
    uint64_t receiverRecordedOffset;

    RFT_TRANSFER_EXPORT transfer_sender_result_t();
    /// Offset to put in the envelope of the next attempt after a pause
    RFT_TRANSFER_EXPORT uint64_t GetNextResumeOffset(uint64_t resumeOffsetOfThisAttempt) const;
};

class TransferSender {
public:
    static constexpr std::size_t DEFAULT_CHUNK_SIZE_BYTES = 65536;

    RFT_TRANSFER_EXPORT TransferSender(std::size_t chunkSizeBytes = DEFAULT_CHUNK_SIZE_BYTES);
    RFT_TRANSFER_EXPORT ~TransferSender();

    /** Run one send attempt, blocking until it completes, pauses, or fails.
     *
     * @param host The receiver's host name or address.
     * @param port The receiver's port.
     * @param localFile The file to send, its current size is the declared size.
     * @param remoteName The envelope filename.  Leave empty to use the local file's name (fresh transfers only).
     * @param resumeOffset 0 for a fresh transfer, or the offset the receiver has durably stored.
     * @param maxBytesThisAttempt Stop and close the connection after this many bytes (0 means no limit).
     * @param result The outcome of the attempt.
     * @return True if the attempt completed, or False otherwise (see result.outcome).
     */
    RFT_TRANSFER_EXPORT bool Send(const std::string & host, uint16_t port,
        const boost::filesystem::path & localFile, const std::string & remoteName,
        uint64_t resumeOffset, uint64_t maxBytesThisAttempt, transfer_sender_result_t & result);

    /// Ask a running Send to stop streaming at the next chunk boundary (thread safe)
    RFT_TRANSFER_EXPORT void RequestPause();

private:
    RFT_TRANSFER_NO_EXPORT bool ReadResponse(boost::asio::ip::tcp::socket & socket,
        TRANSFER_RESPONSE_TYPE & responseType, std::string & text);
    RFT_TRANSFER_NO_EXPORT static void CloseSocket(boost::asio::ip::tcp::socket & socket);

private:
    const std::size_t M_CHUNK_SIZE_BYTES;
    boost::asio::io_service m_ioService;
    std::vector<uint8_t> m_chunkBuffer;
    std::atomic<bool> m_pauseRequested;
};

#endif // TRANSFER_SENDER_H
