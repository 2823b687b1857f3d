/**
 * @file EnvelopeCodec.cpp
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

#include "EnvelopeCodec.h"
#include <boost/endian/conversion.hpp>
#include <boost/lexical_cast.hpp>
#include <cstring>
#include <algorithm>

constexpr uint64_t EnvelopeCodec::MAX_ENVELOPE_FILENAME_LENGTH;
constexpr std::size_t EnvelopeCodec::FILENAME_LENGTH_FIELD_SIZE;
constexpr std::size_t EnvelopeCodec::ENVELOPE_TRAILER_SIZE;
constexpr std::size_t EnvelopeCodec::RESPONSE_TEXT_HEADER_SIZE;
constexpr std::size_t EnvelopeCodec::MAX_RESPONSE_TEXT_LENGTH;

static const std::string REJECT_REASON_TOKENS[] = {
    "REJECTED",
    "OFFSET_MISMATCH",
    "RESERVATION_CONFLICT",
    "UNKNOWN_TRANSFER",
    "SIZE_MISMATCH",
    "SERVER_BUSY",
    "IO_FAILURE",
    "UNRECOGNIZED"
};

static uint64_t UnalignedBigEndianToNativeU64(const uint8_t * const data) {
    uint64_t result64Be;
    std::memcpy(&result64Be, data, sizeof(result64Be));
    return boost::endian::big_to_native(result64Be);
}

static void NativeU64ToUnalignedBigEndian(uint8_t * const output, uint64_t nativeValue) {
    const uint64_t valueBe = boost::endian::native_to_big(nativeValue);
    std::memcpy(output, &valueBe, sizeof(valueBe));
}

static uint16_t UnalignedBigEndianToNativeU16(const uint8_t * const data) {
    return static_cast<uint16_t>(((static_cast<uint16_t>(data[0])) << 8) | data[1]);
}

static void NativeU16ToUnalignedBigEndian(uint8_t * const output, uint16_t nativeValue) {
    output[0] = (uint8_t)(nativeValue >> 8); //big endian most significant byte first
    output[1] = (uint8_t)nativeValue; //big endian least significant byte last
}

transfer_envelope_t::transfer_envelope_t() : filename(), declaredSize(0), resumeOffset(0) { }
transfer_envelope_t::transfer_envelope_t(const std::string & paramFilename, uint64_t paramDeclaredSize, uint64_t paramResumeOffset) :
    filename(paramFilename), declaredSize(paramDeclaredSize), resumeOffset(paramResumeOffset) { }
bool transfer_envelope_t::operator==(const transfer_envelope_t & o) const {
    return (filename == o.filename) && (declaredSize == o.declaredSize) && (resumeOffset == o.resumeOffset);
}
bool transfer_envelope_t::operator!=(const transfer_envelope_t & o) const {
    return !(*this == o);
}
bool transfer_envelope_t::IsResume() const {
    return (resumeOffset != 0);
}

bool EnvelopeCodec::GenerateEnvelope(std::vector<uint8_t> & serialization,
    const std::string & filename, uint64_t declaredSize, uint64_t resumeOffset)
{
    if (filename.empty() || (filename.size() > MAX_ENVELOPE_FILENAME_LENGTH) || (resumeOffset > declaredSize)) {
        return false;
    }
    serialization.resize(FILENAME_LENGTH_FIELD_SIZE + filename.size() + ENVELOPE_TRAILER_SIZE);
    uint8_t * ptr = serialization.data();
    NativeU16ToUnalignedBigEndian(ptr, static_cast<uint16_t>(filename.size()));
    ptr += FILENAME_LENGTH_FIELD_SIZE;
    std::memcpy(ptr, filename.data(), filename.size());
    ptr += filename.size();
    NativeU64ToUnalignedBigEndian(ptr, declaredSize);
    ptr += sizeof(uint64_t);
    NativeU64ToUnalignedBigEndian(ptr, resumeOffset);
    return true;
}

uint16_t EnvelopeCodec::DecodeFilenameLength(const uint8_t * data) {
    return UnalignedBigEndianToNativeU16(data);
}

ENVELOPE_DECODE_STATUS EnvelopeCodec::DecodeEnvelope(const uint8_t * data, std::size_t size,
    uint64_t maxFilenameLength, transfer_envelope_t & envelope, std::size_t & numBytesConsumed)
{
    if (size < FILENAME_LENGTH_FIELD_SIZE) {
        return ENVELOPE_DECODE_STATUS::NEED_MORE_DATA;
    }
    const uint16_t filenameLength = UnalignedBigEndianToNativeU16(data);
    const uint64_t ceiling = std::min(maxFilenameLength, MAX_ENVELOPE_FILENAME_LENGTH);
    if ((filenameLength == 0) || (filenameLength > ceiling)) {
        return ENVELOPE_DECODE_STATUS::MALFORMED_LENGTH;
    }
    const std::size_t totalSize = FILENAME_LENGTH_FIELD_SIZE + filenameLength + ENVELOPE_TRAILER_SIZE;
    if (size < totalSize) {
        return ENVELOPE_DECODE_STATUS::NEED_MORE_DATA;
    }
    const uint8_t * ptr = data + FILENAME_LENGTH_FIELD_SIZE;
    const uint8_t * const filenamePtr = ptr;
    ptr += filenameLength;
    const uint64_t declaredSize = UnalignedBigEndianToNativeU64(ptr);
    ptr += sizeof(uint64_t);
    const uint64_t resumeOffset = UnalignedBigEndianToNativeU64(ptr);
    if (resumeOffset > declaredSize) {
        return ENVELOPE_DECODE_STATUS::INVALID_OFFSET;
    }
    envelope.filename.assign(reinterpret_cast<const char*>(filenamePtr), filenameLength);
    envelope.declaredSize = declaredSize;
    envelope.resumeOffset = resumeOffset;
    numBytesConsumed = totalSize;
    return ENVELOPE_DECODE_STATUS::SUCCESS;
}

static void GenerateTextResponse(std::vector<uint8_t> & serialization, TRANSFER_RESPONSE_TYPE responseType, const std::string & text) {
    const std::size_t textLength = std::min(text.size(), EnvelopeCodec::MAX_RESPONSE_TEXT_LENGTH);
    serialization.resize(EnvelopeCodec::RESPONSE_TEXT_HEADER_SIZE + textLength);
    serialization[0] = static_cast<uint8_t>(responseType);
    NativeU16ToUnalignedBigEndian(&serialization[1], static_cast<uint16_t>(textLength));
    if (textLength) {
        std::memcpy(&serialization[EnvelopeCodec::RESPONSE_TEXT_HEADER_SIZE], text.data(), textLength);
    }
}

void EnvelopeCodec::GenerateAcceptResponse(std::vector<uint8_t> & serialization, const std::string & finalName) {
    GenerateTextResponse(serialization, TRANSFER_RESPONSE_TYPE::ACCEPTED, finalName);
}

void EnvelopeCodec::GenerateRejectResponse(std::vector<uint8_t> & serialization, const std::string & reasonText) {
    GenerateTextResponse(serialization, TRANSFER_RESPONSE_TYPE::REJECTED, reasonText);
}

void EnvelopeCodec::GenerateRejectResponse(std::vector<uint8_t> & serialization, REJECT_REASON reason, const std::string & explanation) {
    GenerateRejectResponse(serialization, MakeReasonText(reason, explanation));
}

void EnvelopeCodec::GenerateCompletedResponse(std::vector<uint8_t> & serialization) {
    serialization.assign(1, static_cast<uint8_t>(TRANSFER_RESPONSE_TYPE::COMPLETED));
}

ENVELOPE_DECODE_STATUS EnvelopeCodec::DecodeResponse(const uint8_t * data, std::size_t size,
    TRANSFER_RESPONSE_TYPE & responseType, std::string & text, std::size_t & numBytesConsumed)
{
    if (size < 1) {
        return ENVELOPE_DECODE_STATUS::NEED_MORE_DATA;
    }
    const uint8_t typeByte = data[0];
    if (typeByte == static_cast<uint8_t>(TRANSFER_RESPONSE_TYPE::COMPLETED)) {
        responseType = TRANSFER_RESPONSE_TYPE::COMPLETED;
        text.clear();
        numBytesConsumed = 1;
        return ENVELOPE_DECODE_STATUS::SUCCESS;
    }
    else if ((typeByte != static_cast<uint8_t>(TRANSFER_RESPONSE_TYPE::ACCEPTED)) && (typeByte != static_cast<uint8_t>(TRANSFER_RESPONSE_TYPE::REJECTED))) {
        return ENVELOPE_DECODE_STATUS::MALFORMED_LENGTH;
    }
    if (size < RESPONSE_TEXT_HEADER_SIZE) {
        return ENVELOPE_DECODE_STATUS::NEED_MORE_DATA;
    }
    const uint16_t textLength = UnalignedBigEndianToNativeU16(&data[1]);
    if (size < (RESPONSE_TEXT_HEADER_SIZE + textLength)) {
        return ENVELOPE_DECODE_STATUS::NEED_MORE_DATA;
    }
    responseType = static_cast<TRANSFER_RESPONSE_TYPE>(typeByte);
    text.assign(reinterpret_cast<const char*>(&data[RESPONSE_TEXT_HEADER_SIZE]), textLength);
    numBytesConsumed = RESPONSE_TEXT_HEADER_SIZE + textLength;
    return ENVELOPE_DECODE_STATUS::SUCCESS;
}

const std::string & EnvelopeCodec::RejectReasonToString(REJECT_REASON reason) {
    const unsigned int index = static_cast<unsigned int>(reason);
    if (index > static_cast<unsigned int>(REJECT_REASON::UNRECOGNIZED)) {
        return REJECT_REASON_TOKENS[static_cast<unsigned int>(REJECT_REASON::UNRECOGNIZED)];
    }
    return REJECT_REASON_TOKENS[index];
}

std::string EnvelopeCodec::MakeReasonText(REJECT_REASON reason, const std::string & explanation) {
    return RejectReasonToString(reason) + ": " + explanation;
}

REJECT_REASON EnvelopeCodec::ParseReasonToken(const std::string & reasonText) {
    const std::string::size_type colonPos = reasonText.find(':');
    const std::string token = reasonText.substr(0, colonPos); //npos takes the whole string
    for (unsigned int i = 0; i < static_cast<unsigned int>(REJECT_REASON::UNRECOGNIZED); ++i) {
        if (token == REJECT_REASON_TOKENS[i]) {
            return static_cast<REJECT_REASON>(i);
        }
    }
    return REJECT_REASON::UNRECOGNIZED;
}

static const std::string OFFSET_MISMATCH_RECORDED_PREFIX(" does not match the ");
static const std::string OFFSET_MISMATCH_RECORDED_SUFFIX(" bytes received");

std::string EnvelopeCodec::MakeOffsetMismatchExplanation(uint64_t resumeOffset, uint64_t recordedBytesReceived) {
    return "resume offset " + boost::lexical_cast<std::string>(resumeOffset)
        + OFFSET_MISMATCH_RECORDED_PREFIX + boost::lexical_cast<std::string>(recordedBytesReceived)
        + OFFSET_MISMATCH_RECORDED_SUFFIX;
}

bool EnvelopeCodec::ParseRecordedOffset(const std::string & reasonText, uint64_t & recordedBytesReceived) {
    if (ParseReasonToken(reasonText) != REJECT_REASON::OFFSET_MISMATCH) {
        return false;
    }
    const std::string::size_type prefixPos = reasonText.rfind(OFFSET_MISMATCH_RECORDED_PREFIX);
    if (prefixPos == std::string::npos) {
        return false;
    }
    const std::string::size_type digitsBegin = prefixPos + OFFSET_MISMATCH_RECORDED_PREFIX.size();
    const std::string::size_type digitsEnd = reasonText.find(OFFSET_MISMATCH_RECORDED_SUFFIX, digitsBegin);
    if ((digitsEnd == std::string::npos) || (digitsEnd == digitsBegin)) {
        return false;
    }
    const std::string digits = reasonText.substr(digitsBegin, digitsEnd - digitsBegin);
    if (digits.find_first_not_of("0123456789") != std::string::npos) {
        return false;
    }
    try {
        recordedBytesReceived = boost::lexical_cast<uint64_t>(digits);
    }
    catch (const boost::bad_lexical_cast &) {
        return false; //overflows 64 bits
    }
    return true;
}
