/**
 * @file TestEnvelopeCodec.cpp
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

#include <boost/test/unit_test.hpp>
#include "EnvelopeCodec.h"
#include <string>
#include <vector>

BOOST_AUTO_TEST_CASE(EnvelopeCodecEncodeDecodeTestCase)
{
    std::vector<uint8_t> serialization;
    BOOST_REQUIRE(EnvelopeCodec::GenerateEnvelope(serialization, "report.pdf", 1000, 0));
    BOOST_REQUIRE_EQUAL(serialization.size(), 2 + 10 + 16);
    //big endian length prefix
    BOOST_REQUIRE_EQUAL(serialization[0], 0);
    BOOST_REQUIRE_EQUAL(serialization[1], 10);
    //declared size 1000 = 0x03e8 in the last two bytes of the first uint64
    BOOST_REQUIRE_EQUAL(serialization[2 + 10 + 6], 0x03);
    BOOST_REQUIRE_EQUAL(serialization[2 + 10 + 7], 0xe8);
    BOOST_REQUIRE_EQUAL(EnvelopeCodec::DecodeFilenameLength(serialization.data()), 10);

    transfer_envelope_t envelope;
    std::size_t numBytesConsumed = 0;
    BOOST_REQUIRE(EnvelopeCodec::DecodeEnvelope(serialization.data(), serialization.size(), 255, envelope, numBytesConsumed)
        == ENVELOPE_DECODE_STATUS::SUCCESS);
    BOOST_REQUIRE_EQUAL(numBytesConsumed, serialization.size());
    BOOST_REQUIRE(envelope == transfer_envelope_t("report.pdf", 1000, 0));
    BOOST_REQUIRE(!envelope.IsResume());

    //resume envelope followed by file bytes, only the envelope is consumed
    BOOST_REQUIRE(EnvelopeCodec::GenerateEnvelope(serialization, "report.pdf", 1000, 400));
    const std::size_t envelopeSize = serialization.size();
    serialization.push_back('x');
    serialization.push_back('y');
    BOOST_REQUIRE(EnvelopeCodec::DecodeEnvelope(serialization.data(), serialization.size(), 255, envelope, numBytesConsumed)
        == ENVELOPE_DECODE_STATUS::SUCCESS);
    BOOST_REQUIRE_EQUAL(numBytesConsumed, envelopeSize);
    BOOST_REQUIRE_EQUAL(envelope.resumeOffset, 400);
    BOOST_REQUIRE(envelope.IsResume());

    //offset equal to the declared size is legal (finalize retry)
    BOOST_REQUIRE(EnvelopeCodec::GenerateEnvelope(serialization, "a.txt", 7, 7));
    BOOST_REQUIRE(EnvelopeCodec::DecodeEnvelope(serialization.data(), serialization.size(), 255, envelope, numBytesConsumed)
        == ENVELOPE_DECODE_STATUS::SUCCESS);

    //zero length file
    BOOST_REQUIRE(EnvelopeCodec::GenerateEnvelope(serialization, "empty.txt", 0, 0));
    BOOST_REQUIRE(EnvelopeCodec::DecodeEnvelope(serialization.data(), serialization.size(), 255, envelope, numBytesConsumed)
        == ENVELOPE_DECODE_STATUS::SUCCESS);
    BOOST_REQUIRE_EQUAL(envelope.declaredSize, 0);
}

BOOST_AUTO_TEST_CASE(EnvelopeCodecGenerateInvalidTestCase)
{
    std::vector<uint8_t> serialization;
    BOOST_REQUIRE(!EnvelopeCodec::GenerateEnvelope(serialization, "", 10, 0));
    BOOST_REQUIRE(!EnvelopeCodec::GenerateEnvelope(serialization, "a.txt", 10, 11));
    BOOST_REQUIRE(!EnvelopeCodec::GenerateEnvelope(serialization, std::string(4097, 'a'), 10, 0));
    BOOST_REQUIRE(EnvelopeCodec::GenerateEnvelope(serialization, std::string(4096, 'a'), 10, 0));
}

BOOST_AUTO_TEST_CASE(EnvelopeCodecDecodeErrorsTestCase)
{
    transfer_envelope_t envelope;
    std::size_t numBytesConsumed = 0;
    std::vector<uint8_t> serialization;
    BOOST_REQUIRE(EnvelopeCodec::GenerateEnvelope(serialization, "notes.txt", 50, 10));

    //every strict prefix needs more data
    for (std::size_t i = 0; i < serialization.size(); ++i) {
        BOOST_REQUIRE(EnvelopeCodec::DecodeEnvelope(serialization.data(), i, 255, envelope, numBytesConsumed)
            == ENVELOPE_DECODE_STATUS::NEED_MORE_DATA);
    }

    //zero filename length
    {
        const std::vector<uint8_t> zeroLength({ 0, 0, 1, 2, 3 });
        BOOST_REQUIRE(EnvelopeCodec::DecodeEnvelope(zeroLength.data(), zeroLength.size(), 255, envelope, numBytesConsumed)
            == ENVELOPE_DECODE_STATUS::MALFORMED_LENGTH);
    }

    //length above the configured cap is detected from the prefix alone
    {
        const std::vector<uint8_t> longLength({ 0x01, 0x00 }); //256
        BOOST_REQUIRE(EnvelopeCodec::DecodeEnvelope(longLength.data(), longLength.size(), 255, envelope, numBytesConsumed)
            == ENVELOPE_DECODE_STATUS::MALFORMED_LENGTH);
        BOOST_REQUIRE(EnvelopeCodec::DecodeEnvelope(longLength.data(), longLength.size(), 256, envelope, numBytesConsumed)
            == ENVELOPE_DECODE_STATUS::NEED_MORE_DATA);
    }

    //the hard ceiling applies even if the caller asks for more
    {
        const std::vector<uint8_t> hugeLength({ 0x10, 0x01 }); //4097
        BOOST_REQUIRE(EnvelopeCodec::DecodeEnvelope(hugeLength.data(), hugeLength.size(), 100000, envelope, numBytesConsumed)
            == ENVELOPE_DECODE_STATUS::MALFORMED_LENGTH);
    }

    //resume offset beyond the declared size
    {
        std::vector<uint8_t> badOffset;
        BOOST_REQUIRE(EnvelopeCodec::GenerateEnvelope(badOffset, "notes.txt", 50, 50));
        badOffset.back() = 51;
        BOOST_REQUIRE(EnvelopeCodec::DecodeEnvelope(badOffset.data(), badOffset.size(), 255, envelope, numBytesConsumed)
            == ENVELOPE_DECODE_STATUS::INVALID_OFFSET);
    }
}

BOOST_AUTO_TEST_CASE(EnvelopeCodecResponsesTestCase)
{
    std::vector<uint8_t> serialization;
    TRANSFER_RESPONSE_TYPE responseType;
    std::string text;
    std::size_t numBytesConsumed = 0;

    EnvelopeCodec::GenerateAcceptResponse(serialization, "report (1).pdf");
    BOOST_REQUIRE_EQUAL(serialization[0], 0x01);
    BOOST_REQUIRE_EQUAL(serialization.size(), 3 + 14);
    BOOST_REQUIRE(EnvelopeCodec::DecodeResponse(serialization.data(), 2, responseType, text, numBytesConsumed)
        == ENVELOPE_DECODE_STATUS::NEED_MORE_DATA);
    BOOST_REQUIRE(EnvelopeCodec::DecodeResponse(serialization.data(), serialization.size() - 1, responseType, text, numBytesConsumed)
        == ENVELOPE_DECODE_STATUS::NEED_MORE_DATA);
    BOOST_REQUIRE(EnvelopeCodec::DecodeResponse(serialization.data(), serialization.size(), responseType, text, numBytesConsumed)
        == ENVELOPE_DECODE_STATUS::SUCCESS);
    BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::ACCEPTED);
    BOOST_REQUIRE_EQUAL(text, "report (1).pdf");
    BOOST_REQUIRE_EQUAL(numBytesConsumed, serialization.size());

    EnvelopeCodec::GenerateRejectResponse(serialization, REJECT_REASON::OFFSET_MISMATCH, "resume offset 5 does not match the 3 bytes received");
    BOOST_REQUIRE_EQUAL(serialization[0], 0x00);
    BOOST_REQUIRE(EnvelopeCodec::DecodeResponse(serialization.data(), serialization.size(), responseType, text, numBytesConsumed)
        == ENVELOPE_DECODE_STATUS::SUCCESS);
    BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::REJECTED);
    BOOST_REQUIRE_EQUAL(text, "OFFSET_MISMATCH: resume offset 5 does not match the 3 bytes received");
    BOOST_REQUIRE(EnvelopeCodec::ParseReasonToken(text) == REJECT_REASON::OFFSET_MISMATCH);

    EnvelopeCodec::GenerateCompletedResponse(serialization);
    BOOST_REQUIRE_EQUAL(serialization.size(), 1);
    BOOST_REQUIRE(EnvelopeCodec::DecodeResponse(serialization.data(), serialization.size(), responseType, text, numBytesConsumed)
        == ENVELOPE_DECODE_STATUS::SUCCESS);
    BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::COMPLETED);
    BOOST_REQUIRE(text.empty());
    BOOST_REQUIRE_EQUAL(numBytesConsumed, 1);

    const uint8_t unknownType = 0x07;
    BOOST_REQUIRE(EnvelopeCodec::DecodeResponse(&unknownType, 1, responseType, text, numBytesConsumed)
        == ENVELOPE_DECODE_STATUS::MALFORMED_LENGTH);
}

BOOST_AUTO_TEST_CASE(EnvelopeCodecReasonTokensTestCase)
{
    BOOST_REQUIRE_EQUAL(EnvelopeCodec::MakeReasonText(REJECT_REASON::SERVER_BUSY, "retry later"), "SERVER_BUSY: retry later");
    BOOST_REQUIRE(EnvelopeCodec::ParseReasonToken("REJECTED: extension .exe is not allowed") == REJECT_REASON::REJECTED);
    BOOST_REQUIRE(EnvelopeCodec::ParseReasonToken("RESERVATION_CONFLICT: in use") == REJECT_REASON::RESERVATION_CONFLICT);
    BOOST_REQUIRE(EnvelopeCodec::ParseReasonToken("UNKNOWN_TRANSFER: x") == REJECT_REASON::UNKNOWN_TRANSFER);
    BOOST_REQUIRE(EnvelopeCodec::ParseReasonToken("SIZE_MISMATCH: x") == REJECT_REASON::SIZE_MISMATCH);
    BOOST_REQUIRE(EnvelopeCodec::ParseReasonToken("IO_FAILURE: disk full") == REJECT_REASON::IO_FAILURE);
    BOOST_REQUIRE(EnvelopeCodec::ParseReasonToken("IO_FAILURE") == REJECT_REASON::IO_FAILURE);
    BOOST_REQUIRE(EnvelopeCodec::ParseReasonToken("something else") == REJECT_REASON::UNRECOGNIZED);
    BOOST_REQUIRE(EnvelopeCodec::ParseReasonToken("") == REJECT_REASON::UNRECOGNIZED);
    BOOST_REQUIRE_EQUAL(EnvelopeCodec::RejectReasonToString(REJECT_REASON::SIZE_MISMATCH), "SIZE_MISMATCH");
}

BOOST_AUTO_TEST_CASE(EnvelopeCodecRecordedOffsetTestCase)
{
    const std::string text = EnvelopeCodec::MakeReasonText(REJECT_REASON::OFFSET_MISMATCH,
        EnvelopeCodec::MakeOffsetMismatchExplanation(5000, 8000));
    BOOST_REQUIRE_EQUAL(text, "OFFSET_MISMATCH: resume offset 5000 does not match the 8000 bytes received");
    uint64_t recorded = 1;
    BOOST_REQUIRE(EnvelopeCodec::ParseRecordedOffset(text, recorded));
    BOOST_REQUIRE_EQUAL(recorded, 8000);
    BOOST_REQUIRE(EnvelopeCodec::ParseRecordedOffset("OFFSET_MISMATCH: resume offset 9 does not match the 0 bytes received", recorded));
    BOOST_REQUIRE_EQUAL(recorded, 0);

    //only an offset mismatch carries a usable offset
    BOOST_REQUIRE(!EnvelopeCodec::ParseRecordedOffset("SIZE_MISMATCH: resume offset 5 does not match the 8 bytes received", recorded));
    BOOST_REQUIRE(!EnvelopeCodec::ParseRecordedOffset("OFFSET_MISMATCH: try again", recorded));
    BOOST_REQUIRE(!EnvelopeCodec::ParseRecordedOffset("OFFSET_MISMATCH: resume offset 5 does not match the  bytes received", recorded));
    BOOST_REQUIRE(!EnvelopeCodec::ParseRecordedOffset("OFFSET_MISMATCH: resume offset 5 does not match the -8 bytes received", recorded));
    BOOST_REQUIRE(!EnvelopeCodec::ParseRecordedOffset("OFFSET_MISMATCH: resume offset 5 does not match the 99999999999999999999 bytes received", recorded));
    BOOST_REQUIRE_EQUAL(recorded, 0);
}
