/**
 * @file EnvelopeCodec.h
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
 * The EnvelopeCodec class encodes and decodes the fixed layout envelope
 * that precedes every file's byte stream on a transfer connection,
 * as well as the single byte responses (accept, reject, completed) that
 * the receiver writes back to the sender.
 * All integers are big endian.
 *
 * Envelope:
 *   uint16 filenameLength | filename (UTF-8) | uint64 declaredSize | uint64 resumeOffset
 * Accept:    0x01 | uint16 length | resolved final name
 * Reject:    0x00 | uint16 length | reason text ("TOKEN: explanation")
 * Completed: 0x02
 */

#ifndef ENVELOPE_CODEC_H
#define ENVELOPE_CODEC_H 1

#include <cstdint>
#include <cstddef>
#include <string>
#include <vector>
#include "rft_transfer_export.h"

enum class ENVELOPE_DECODE_STATUS {
    SUCCESS = 0,
    NEED_MORE_DATA,
    MALFORMED_LENGTH,
    INVALID_OFFSET
};

enum class TRANSFER_RESPONSE_TYPE : uint8_t {
    REJECTED = 0x00,
    ACCEPTED = 0x01,
    COMPLETED = 0x02
};

/// Stable token at the start of every reject reason text
enum class REJECT_REASON {
    REJECTED = 0,
    OFFSET_MISMATCH,
    RESERVATION_CONFLICT,
    UNKNOWN_TRANSFER,
    SIZE_MISMATCH,
    SERVER_BUSY,
    IO_FAILURE,
    UNRECOGNIZED
};

struct transfer_envelope_t {
    std::string filename;
    uint64_t declaredSize;
    uint64_t resumeOffset;

    RFT_TRANSFER_EXPORT transfer_envelope_t();
    RFT_TRANSFER_EXPORT transfer_envelope_t(const std::string & paramFilename, uint64_t paramDeclaredSize, uint64_t paramResumeOffset);
    RFT_TRANSFER_EXPORT bool operator==(const transfer_envelope_t & o) const;
    RFT_TRANSFER_EXPORT bool operator!=(const transfer_envelope_t & o) const;
    RFT_TRANSFER_EXPORT bool IsResume() const;
};

class EnvelopeCodec {
public:
    static constexpr uint64_t MAX_ENVELOPE_FILENAME_LENGTH = 4096;
    static constexpr std::size_t FILENAME_LENGTH_FIELD_SIZE = sizeof(uint16_t);
    static constexpr std::size_t ENVELOPE_TRAILER_SIZE = 2 * sizeof(uint64_t);
    static constexpr std::size_t RESPONSE_TEXT_HEADER_SIZE = 1 + sizeof(uint16_t);
    static constexpr std::size_t MAX_RESPONSE_TEXT_LENGTH = UINT16_MAX;

    /** Serialize an envelope.
     *
     * @return False if the filename is empty or longer than MAX_ENVELOPE_FILENAME_LENGTH,
     * or if resumeOffset > declaredSize (nothing is written), or True otherwise.
     */
    RFT_TRANSFER_EXPORT static bool GenerateEnvelope(std::vector<uint8_t> & serialization,
        const std::string & filename, uint64_t declaredSize, uint64_t resumeOffset);

    /** Decode an envelope from the start of a buffer.
     *
     * Pure function, the buffer is never modified.
     * @param data The received bytes.
     * @param size The number of received bytes.
     * @param maxFilenameLength The hard ceiling of the filename length field (at most MAX_ENVELOPE_FILENAME_LENGTH).
     * @param envelope Set on SUCCESS.
     * @param numBytesConsumed Set on SUCCESS to the envelope's encoded size.
     * @return NEED_MORE_DATA if the buffer ends before the envelope is complete,
     * MALFORMED_LENGTH if the filename length is zero or above the ceiling,
     * INVALID_OFFSET if resumeOffset > declaredSize, or SUCCESS.
     */
    RFT_TRANSFER_EXPORT static ENVELOPE_DECODE_STATUS DecodeEnvelope(const uint8_t * data, std::size_t size,
        uint64_t maxFilenameLength, transfer_envelope_t & envelope, std::size_t & numBytesConsumed);

    /// Peek at the filename length field, the caller must supply at least FILENAME_LENGTH_FIELD_SIZE bytes
    RFT_TRANSFER_EXPORT static uint16_t DecodeFilenameLength(const uint8_t * data);

    RFT_TRANSFER_EXPORT static void GenerateAcceptResponse(std::vector<uint8_t> & serialization, const std::string & finalName);
    RFT_TRANSFER_EXPORT static void GenerateRejectResponse(std::vector<uint8_t> & serialization, const std::string & reasonText);
    RFT_TRANSFER_EXPORT static void GenerateRejectResponse(std::vector<uint8_t> & serialization, REJECT_REASON reason, const std::string & explanation);
    RFT_TRANSFER_EXPORT static void GenerateCompletedResponse(std::vector<uint8_t> & serialization);

    /** Decode an accept, reject, or completed response from the start of a buffer.
     *
     * @param text Set to the resolved final name (accept) or the reason text (reject), cleared on completed.
     * @return NEED_MORE_DATA if incomplete, MALFORMED_LENGTH if the type byte is unknown, or SUCCESS.
     */
    RFT_TRANSFER_EXPORT static ENVELOPE_DECODE_STATUS DecodeResponse(const uint8_t * data, std::size_t size,
        TRANSFER_RESPONSE_TYPE & responseType, std::string & text, std::size_t & numBytesConsumed);

    RFT_TRANSFER_EXPORT static std::string MakeReasonText(REJECT_REASON reason, const std::string & explanation);
    RFT_TRANSFER_EXPORT static REJECT_REASON ParseReasonToken(const std::string & reasonText);
    RFT_TRANSFER_EXPORT static const std::string & RejectReasonToString(REJECT_REASON reason);

    /// Explanation of an OFFSET_MISMATCH reject carrying the progress the receiver has recorded
    RFT_TRANSFER_EXPORT static std::string MakeOffsetMismatchExplanation(uint64_t resumeOffset, uint64_t recordedBytesReceived);

    /** Recover the receiver's recorded progress from an OFFSET_MISMATCH reason text.
     *
     * @return False if the text is another kind of reject or carries no recorded progress.
     */
    RFT_TRANSFER_EXPORT static bool ParseRecordedOffset(const std::string & reasonText, uint64_t & recordedBytesReceived);
};

#endif // ENVELOPE_CODEC_H
