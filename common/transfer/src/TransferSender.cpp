/**
 * @file TransferSender.cpp
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

#include "TransferSender.h"
#include "Logger.h"
#include "Utf8Paths.h"
#include <cstring>
#include <algorithm>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/endian/conversion.hpp>
#include <boost/lexical_cast.hpp>

static constexpr rft::Logger::SubProcess subprocess = rft::Logger::SubProcess::sender;

constexpr std::size_t TransferSender::DEFAULT_CHUNK_SIZE_BYTES;

const char * TransferSenderOutcomeToString(TRANSFER_SENDER_OUTCOME outcome) {
    switch (outcome) {
        case TRANSFER_SENDER_OUTCOME::COMPLETED: return "Completed";
        case TRANSFER_SENDER_OUTCOME::PAUSED: return "Paused";
        case TRANSFER_SENDER_OUTCOME::REJECTED: return "Rejected";
        case TRANSFER_SENDER_OUTCOME::CONNECTION_ERROR: return "ConnectionError";
        case TRANSFER_SENDER_OUTCOME::LOCAL_FILE_ERROR: return "LocalFileError";
        default: return "Unknown";
    }
}

transfer_sender_result_t::transfer_sender_result_t() :
    outcome(TRANSFER_SENDER_OUTCOME::CONNECTION_ERROR),
    resolvedName(),
    reason(),
    rejectReason(REJECT_REASON::UNRECOGNIZED),
    declaredSize(0),
    bytesSent(0),
    hasReceiverRecordedOffset(false),
    receiverRecordedOffset(0) { }

uint64_t transfer_sender_result_t::GetNextResumeOffset(uint64_t resumeOffsetOfThisAttempt) const {
    return resumeOffsetOfThisAttempt + bytesSent;
}

TransferSender::TransferSender(std::size_t chunkSizeBytes) :
    M_CHUNK_SIZE_BYTES((chunkSizeBytes) ? chunkSizeBytes : DEFAULT_CHUNK_SIZE_BYTES),
    m_chunkBuffer(M_CHUNK_SIZE_BYTES),
    m_pauseRequested(false)
{
}

TransferSender::~TransferSender() {}

void TransferSender::RequestPause() {
    m_pauseRequested = true;
}

void TransferSender::CloseSocket(boost::asio::ip::tcp::socket & socket) {
    boost::system::error_code ec;
    socket.shutdown(boost::asio::socket_base::shutdown_type::shutdown_both, ec);
    socket.close(ec);
}

bool TransferSender::ReadResponse(boost::asio::ip::tcp::socket & socket,
    TRANSFER_RESPONSE_TYPE & responseType, std::string & text)
{
    std::vector<uint8_t> response(EnvelopeCodec::RESPONSE_TEXT_HEADER_SIZE);
    boost::system::error_code ec;
    boost::asio::read(socket, boost::asio::buffer(response.data(), 1), ec);
    if (ec) {
        LOG_ERROR(subprocess) << "connection closed while waiting for a response: " << ec.message();
        return false;
    }
    std::size_t numBytesConsumed;
    if (response[0] == static_cast<uint8_t>(TRANSFER_RESPONSE_TYPE::COMPLETED)) {
        return EnvelopeCodec::DecodeResponse(response.data(), 1, responseType, text, numBytesConsumed) == ENVELOPE_DECODE_STATUS::SUCCESS;
    }
    if ((response[0] != static_cast<uint8_t>(TRANSFER_RESPONSE_TYPE::ACCEPTED))
        && (response[0] != static_cast<uint8_t>(TRANSFER_RESPONSE_TYPE::REJECTED)))
    {
        LOG_ERROR(subprocess) << "unknown response type " << static_cast<unsigned int>(response[0]);
        return false;
    }
    boost::asio::read(socket, boost::asio::buffer(&response[1], sizeof(uint16_t)), ec);
    if (ec) {
        LOG_ERROR(subprocess) << "connection closed while reading a response length: " << ec.message();
        return false;
    }
    uint16_t textLength;
    memcpy(&textLength, &response[1], sizeof(textLength));
    boost::endian::big_to_native_inplace(textLength);
    response.resize(EnvelopeCodec::RESPONSE_TEXT_HEADER_SIZE + textLength);
    if (textLength) {
        boost::asio::read(socket, boost::asio::buffer(&response[EnvelopeCodec::RESPONSE_TEXT_HEADER_SIZE], textLength), ec);
        if (ec) {
            LOG_ERROR(subprocess) << "connection closed while reading response text: " << ec.message();
            return false;
        }
    }
    return EnvelopeCodec::DecodeResponse(response.data(), response.size(), responseType, text, numBytesConsumed) == ENVELOPE_DECODE_STATUS::SUCCESS;
}

bool TransferSender::Send(const std::string & host, uint16_t port,
    const boost::filesystem::path & localFile, const std::string & remoteName,
    uint64_t resumeOffset, uint64_t maxBytesThisAttempt, transfer_sender_result_t & result)
{
    result = transfer_sender_result_t();
    m_pauseRequested = false;

    boost::system::error_code fsEc;
    const uintmax_t fileSize = boost::filesystem::file_size(localFile, fsEc);
    if (fsEc) {
        result.outcome = TRANSFER_SENDER_OUTCOME::LOCAL_FILE_ERROR;
        result.reason = "cannot stat " + Utf8Paths::PathToUtf8String(localFile) + ": " + fsEc.message();
        LOG_ERROR(subprocess) << result.reason;
        return false;
    }
    result.declaredSize = static_cast<uint64_t>(fileSize);
    const std::string envelopeName = (remoteName.empty()) ? Utf8Paths::PathToUtf8String(localFile.filename()) : remoteName;

    std::vector<uint8_t> envelope;
    if (!EnvelopeCodec::GenerateEnvelope(envelope, envelopeName, result.declaredSize, resumeOffset)) {
        result.outcome = TRANSFER_SENDER_OUTCOME::LOCAL_FILE_ERROR;
        result.reason = "cannot build an envelope for " + Utf8Paths::ToPrintableString(envelopeName) + " with size "
            + boost::lexical_cast<std::string>(result.declaredSize) + " and resume offset " + boost::lexical_cast<std::string>(resumeOffset);
        LOG_ERROR(subprocess) << result.reason;
        return false;
    }

    boost::filesystem::ifstream fileStream(localFile, std::ios::in | std::ios::binary);
    if (!fileStream.good()) {
        result.outcome = TRANSFER_SENDER_OUTCOME::LOCAL_FILE_ERROR;
        result.reason = "cannot open " + Utf8Paths::PathToUtf8String(localFile);
        LOG_ERROR(subprocess) << result.reason;
        return false;
    }
    fileStream.seekg(static_cast<std::streamoff>(resumeOffset), std::ios::beg);

    boost::asio::ip::tcp::socket socket(m_ioService);
    try {
        boost::asio::ip::tcp::resolver resolver(m_ioService);
        boost::asio::connect(socket, resolver.resolve(host, boost::lexical_cast<std::string>(port)));
        boost::asio::write(socket, boost::asio::buffer(envelope));
    }
    catch (const boost::system::system_error & e) {
        result.reason = "unable to connect to " + host + ":" + boost::lexical_cast<std::string>(port) + ": " + e.what();
        LOG_ERROR(subprocess) << result.reason;
        CloseSocket(socket);
        return false;
    }

    TRANSFER_RESPONSE_TYPE responseType;
    std::string responseText;
    if (!ReadResponse(socket, responseType, responseText)) {
        result.reason = "no valid response to the envelope";
        CloseSocket(socket);
        return false;
    }
    if (responseType == TRANSFER_RESPONSE_TYPE::REJECTED) {
        result.outcome = TRANSFER_SENDER_OUTCOME::REJECTED;
        result.reason = responseText;
        result.rejectReason = EnvelopeCodec::ParseReasonToken(responseText);
        result.hasReceiverRecordedOffset = EnvelopeCodec::ParseRecordedOffset(responseText, result.receiverRecordedOffset);
        LOG_WARNING(subprocess) << "transfer of " << Utf8Paths::ToPrintableString(envelopeName) << " rejected: " << responseText;
        CloseSocket(socket);
        return false;
    }
    if (responseType != TRANSFER_RESPONSE_TYPE::ACCEPTED) {
        result.reason = "completion received before the transfer was accepted";
        LOG_ERROR(subprocess) << result.reason;
        CloseSocket(socket);
        return false;
    }
    result.resolvedName = responseText;
    LOG_INFO(subprocess) << "accepted as " << Utf8Paths::ToPrintableString(result.resolvedName)
        << ", sending " << (result.declaredSize - resumeOffset) << " bytes from offset " << resumeOffset;

    uint64_t remaining = result.declaredSize - resumeOffset;
    while (remaining) {
        if (m_pauseRequested.load(std::memory_order_acquire)
            || (maxBytesThisAttempt && (result.bytesSent >= maxBytesThisAttempt)))
        {
            result.outcome = TRANSFER_SENDER_OUTCOME::PAUSED;
            LOG_INFO(subprocess) << "pausing " << Utf8Paths::ToPrintableString(result.resolvedName) << " at offset "
                << result.GetNextResumeOffset(resumeOffset);
            CloseSocket(socket);
            return false;
        }
        uint64_t numBytesThisChunk = std::min<uint64_t>(M_CHUNK_SIZE_BYTES, remaining);
        if (maxBytesThisAttempt) {
            numBytesThisChunk = std::min<uint64_t>(numBytesThisChunk, maxBytesThisAttempt - result.bytesSent);
        }
        fileStream.read(reinterpret_cast<char*>(m_chunkBuffer.data()), static_cast<std::streamsize>(numBytesThisChunk));
        if (static_cast<uint64_t>(fileStream.gcount()) != numBytesThisChunk) {
            result.outcome = TRANSFER_SENDER_OUTCOME::LOCAL_FILE_ERROR;
            result.reason = "short read from " + Utf8Paths::PathToUtf8String(localFile);
            LOG_ERROR(subprocess) << result.reason;
            CloseSocket(socket);
            return false;
        }
        boost::system::error_code ec;
        boost::asio::write(socket, boost::asio::buffer(m_chunkBuffer.data(), static_cast<std::size_t>(numBytesThisChunk)), ec);
        if (ec) {
            result.reason = "write failed: " + ec.message();
            LOG_ERROR(subprocess) << result.reason;
            CloseSocket(socket);
            return false;
        }
        result.bytesSent += numBytesThisChunk;
        remaining -= numBytesThisChunk;
    }

    if (!ReadResponse(socket, responseType, responseText)) {
        result.reason = "no completion received";
        CloseSocket(socket);
        return false;
    }
    CloseSocket(socket);
    if (responseType == TRANSFER_RESPONSE_TYPE::COMPLETED) {
        result.outcome = TRANSFER_SENDER_OUTCOME::COMPLETED;
        LOG_INFO(subprocess) << "transfer of " << Utf8Paths::ToPrintableString(result.resolvedName) << " completed ("
            << result.declaredSize << " bytes)";
        return true;
    }
    if (responseType == TRANSFER_RESPONSE_TYPE::REJECTED) {
        result.outcome = TRANSFER_SENDER_OUTCOME::REJECTED;
        result.reason = responseText;
        result.rejectReason = EnvelopeCodec::ParseReasonToken(responseText);
        LOG_WARNING(subprocess) << "transfer of " << Utf8Paths::ToPrintableString(result.resolvedName) << " failed after streaming: " << responseText;
        return false;
    }
    result.reason = "unexpected response after streaming";
    LOG_ERROR(subprocess) << result.reason;
    return false;
}
