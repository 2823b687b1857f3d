/**
 * @file TestTransferReceiver.cpp
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
 * Loopback tests of a TransferReceiver driven by TransferSender and by raw sockets.
 */

#include <boost/test/unit_test.hpp>
#include "TransferReceiver.h"
#include "TransferSender.h"
#include "EnvelopeCodec.h"
#include "ReceiverConfig.h"
#include "TransferSession.h"
#include <boost/asio.hpp>
#include <boost/filesystem.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/thread.hpp>
#include <boost/bind/bind.hpp>
#include <boost/function.hpp>
#include <boost/make_unique.hpp>
#include <boost/endian/conversion.hpp>
#include <cerrno>
#include <cstring>
#include <iterator>
#include <memory>
#include <string>
#include <vector>

static const std::string LOCALHOST("127.0.0.1");

static bool WaitUntil(const boost::function<bool()> & predicate, unsigned int timeoutMilliseconds = 5000) {
    for (unsigned int elapsed = 0; elapsed < timeoutMilliseconds; elapsed += 10) {
        if (predicate()) {
            return true;
        }
        boost::this_thread::sleep(boost::posix_time::milliseconds(10));
    }
    return predicate();
}

static ReceiverConfig MakeTestConfig(uint16_t port, const boost::filesystem::path & receiveDirectory) {
    ReceiverConfig config;
    config.m_listenAddress = LOCALHOST;
    config.m_listenPort = port;
    config.m_receiveDirectory = receiveDirectory.string();
    config.m_maxFileSizeBytes = 10000000;
    config.m_idleTimeoutSeconds = 5;
    config.m_maxConcurrentSessions = 8;
    config.m_chunkSizeBytes = 4096;
    config.m_progressRecordIntervalBytes = 16384;
    config.m_reservationStaleSeconds = 0;
    config.m_numIoThreads = 2;
    return config;
}

static boost::filesystem::path MakeTestDirectory(const std::string & prefix) {
    return boost::filesystem::temp_directory_path() / boost::filesystem::unique_path(prefix + "_%%%%-%%%%-%%%%");
}

static std::string MakeTestData(std::size_t size, unsigned int seed) {
    std::string data(size, '\0');
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<char>((i * 7 + seed) % 251);
    }
    return data;
}

static void WriteFile(const boost::filesystem::path & p, const std::string & data) {
    boost::filesystem::ofstream ofs(p, std::ios::out | std::ios::binary | std::ios::trunc);
    ofs.write(data.data(), data.size());
}

static std::string ReadWholeFile(const boost::filesystem::path & p) {
    boost::filesystem::ifstream ifs(p, std::ios::in | std::ios::binary);
    return std::string((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());
}

static std::size_t CountEntries(const boost::filesystem::path & dir) {
    return static_cast<std::size_t>(std::distance(boost::filesystem::directory_iterator(dir), boost::filesystem::directory_iterator()));
}

///A hand driven sender for holding connections open and sending malformed data
class RawClient {
public:
    RawClient() : m_socket(m_ioService) {}
    bool Connect(uint16_t port) {
        boost::system::error_code ec;
        m_socket.connect(boost::asio::ip::tcp::endpoint(boost::asio::ip::make_address(LOCALHOST), port), ec);
        return !ec;
    }
    bool Write(const std::vector<uint8_t> & bytes) {
        boost::system::error_code ec;
        boost::asio::write(m_socket, boost::asio::buffer(bytes), ec);
        return !ec;
    }
    bool Write(const std::string & bytes) {
        return Write(std::vector<uint8_t>(bytes.begin(), bytes.end()));
    }
    bool SendEnvelope(const std::string & name, uint64_t declaredSize, uint64_t resumeOffset) {
        std::vector<uint8_t> envelope;
        return EnvelopeCodec::GenerateEnvelope(envelope, name, declaredSize, resumeOffset) && Write(envelope);
    }
    bool ReadResponse(TRANSFER_RESPONSE_TYPE & responseType, std::string & text) {
        std::vector<uint8_t> response(EnvelopeCodec::RESPONSE_TEXT_HEADER_SIZE);
        boost::system::error_code ec;
        boost::asio::read(m_socket, boost::asio::buffer(response.data(), 1), ec);
        if (ec) {
            return false;
        }
        if (response[0] != static_cast<uint8_t>(TRANSFER_RESPONSE_TYPE::COMPLETED)) {
            boost::asio::read(m_socket, boost::asio::buffer(&response[1], 2), ec);
            if (ec) {
                return false;
            }
            const uint16_t textLength = static_cast<uint16_t>((response[1] << 8) | response[2]);
            response.resize(EnvelopeCodec::RESPONSE_TEXT_HEADER_SIZE + textLength);
            boost::asio::read(m_socket, boost::asio::buffer(&response[EnvelopeCodec::RESPONSE_TEXT_HEADER_SIZE], textLength), ec);
            if (ec) {
                return false;
            }
        }
        std::size_t numBytesConsumed;
        return EnvelopeCodec::DecodeResponse(response.data(), response.size(), responseType, text, numBytesConsumed)
            == ENVELOPE_DECODE_STATUS::SUCCESS;
    }
    ///True if the receiver closed the connection without sending anything
    bool ClosedWithoutData() {
        uint8_t byte;
        boost::system::error_code ec;
        const std::size_t n = boost::asio::read(m_socket, boost::asio::buffer(&byte, 1), ec);
        return (n == 0) && ec;
    }
    void Close() {
        boost::system::error_code ec;
        m_socket.shutdown(boost::asio::socket_base::shutdown_type::shutdown_both, ec);
        m_socket.close(ec);
    }
private:
    boost::asio::io_service m_ioService;
    boost::asio::ip::tcp::socket m_socket;
};

BOOST_AUTO_TEST_CASE(TransferReceiverRoundTripTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    const boost::filesystem::path sendDir = MakeTestDirectory("rft_tx");
    BOOST_REQUIRE(boost::filesystem::create_directories(sendDir));
    const std::string data = MakeTestData(100000, 3);
    WriteFile(sendDir / "payload.bin", data);
    WriteFile(sendDir / "empty.txt", "");

    TransferReceiver receiver(MakeTestConfig(47301, receiveDir));
    BOOST_REQUIRE(receiver.Init());
    BOOST_REQUIRE_EQUAL(receiver.GetListenPort(), 47301);

    TransferSender sender(3000);
    transfer_sender_result_t result;
    BOOST_REQUIRE(sender.Send(LOCALHOST, 47301, sendDir / "payload.bin", "", 0, 0, result));
    BOOST_REQUIRE(result.outcome == TRANSFER_SENDER_OUTCOME::COMPLETED);
    BOOST_REQUIRE_EQUAL(result.resolvedName, "payload.bin");
    BOOST_REQUIRE_EQUAL(result.bytesSent, data.size());
    BOOST_REQUIRE_EQUAL(result.declaredSize, data.size());
    BOOST_REQUIRE(ReadWholeFile(receiveDir / "payload.bin") == data);

    //same name again gets a collision-free name and leaves the first file alone
    BOOST_REQUIRE(sender.Send(LOCALHOST, 47301, sendDir / "payload.bin", "", 0, 0, result));
    BOOST_REQUIRE_EQUAL(result.resolvedName, "payload (1).bin");
    BOOST_REQUIRE(ReadWholeFile(receiveDir / "payload (1).bin") == data);
    BOOST_REQUIRE(ReadWholeFile(receiveDir / "payload.bin") == data);

    //a zero length file completes right after the accept
    BOOST_REQUIRE(sender.Send(LOCALHOST, 47301, sendDir / "empty.txt", "", 0, 0, result));
    BOOST_REQUIRE_EQUAL(result.bytesSent, 0);
    BOOST_REQUIRE(boost::filesystem::exists(receiveDir / "empty.txt"));
    BOOST_REQUIRE_EQUAL(boost::filesystem::file_size(receiveDir / "empty.txt"), 0);

    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsCompleted, &receiver) == 3));
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetNumActiveSessions, &receiver) == 0));
    BOOST_REQUIRE_EQUAL(receiver.GetTotalSessionsFailed(), 0);
    BOOST_REQUIRE_EQUAL(receiver.GetReservationStore().GetNumReservations(), 0);
    BOOST_REQUIRE_EQUAL(CountEntries(receiveDir / ReservationStore::PARTIAL_DIRECTORY_NAME), 0);

    transfer_receiver_telemetry_t telem;
    receiver.GetTelemetry(telem);
    BOOST_REQUIRE_EQUAL(telem.totalSessionsAccepted, 3);
    BOOST_REQUIRE_EQUAL(telem.totalSessionsCompleted, 3);

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
    boost::filesystem::remove_all(sendDir);
}

BOOST_AUTO_TEST_CASE(TransferReceiverResumeTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    const boost::filesystem::path sendDir = MakeTestDirectory("rft_tx");
    BOOST_REQUIRE(boost::filesystem::create_directories(sendDir));
    const std::string data = MakeTestData(90000, 11);
    WriteFile(sendDir / "report.pdf", data);

    TransferReceiver receiver(MakeTestConfig(47302, receiveDir));
    BOOST_REQUIRE(receiver.Init());
    ReservationStore & store = receiver.GetReservationStore();

    TransferSender sender;
    transfer_sender_result_t result;
    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47302, sendDir / "report.pdf", "", 0, 30000, result));
    BOOST_REQUIRE(result.outcome == TRANSFER_SENDER_OUTCOME::PAUSED);
    BOOST_REQUIRE_EQUAL(result.bytesSent, 30000);
    BOOST_REQUIRE_EQUAL(result.GetNextResumeOffset(0), 30000);
    const std::string resolvedName = result.resolvedName;
    BOOST_REQUIRE_EQUAL(resolvedName, "report.pdf");
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsPaused, &receiver) == 1));

    //paused state is durable and the final file does not exist yet
    ReservationRecord record;
    BOOST_REQUIRE(store.GetRecord(resolvedName, record));
    BOOST_REQUIRE_EQUAL(record.m_bytesReceived, 30000);
    BOOST_REQUIRE_EQUAL(record.m_declaredSize, data.size());
    BOOST_REQUIRE(!store.IsActive(resolvedName));
    BOOST_REQUIRE_EQUAL(boost::filesystem::file_size(store.GetPartialFilePath(resolvedName)), 30000);
    BOOST_REQUIRE(!boost::filesystem::exists(receiveDir / "report.pdf"));

    //a fresh transfer of the same name does not steal the paused name
    WriteFile(sendDir / "other.pdf", "x");
    BOOST_REQUIRE(sender.Send(LOCALHOST, 47302, sendDir / "other.pdf", "report.pdf", 0, 0, result));
    BOOST_REQUIRE_EQUAL(result.resolvedName, "report (1).pdf");

    //second pause
    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47302, sendDir / "report.pdf", resolvedName, 30000, 25000, result));
    BOOST_REQUIRE(result.outcome == TRANSFER_SENDER_OUTCOME::PAUSED);
    BOOST_REQUIRE_EQUAL(result.resolvedName, resolvedName);
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsPaused, &receiver) == 2));
    BOOST_REQUIRE(store.GetRecord(resolvedName, record));
    BOOST_REQUIRE_EQUAL(record.m_bytesReceived, 55000);

    BOOST_REQUIRE(sender.Send(LOCALHOST, 47302, sendDir / "report.pdf", resolvedName, 55000, 0, result));
    BOOST_REQUIRE(result.outcome == TRANSFER_SENDER_OUTCOME::COMPLETED);
    BOOST_REQUIRE_EQUAL(result.bytesSent, data.size() - 55000);
    BOOST_REQUIRE(ReadWholeFile(receiveDir / "report.pdf") == data);
    BOOST_REQUIRE(!store.IsReserved(resolvedName));

    //the transfer is gone once finalized
    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47302, sendDir / "report.pdf", resolvedName, 55000, 0, result));
    BOOST_REQUIRE(result.outcome == TRANSFER_SENDER_OUTCOME::REJECTED);
    BOOST_REQUIRE(result.rejectReason == REJECT_REASON::UNKNOWN_TRANSFER);

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
    boost::filesystem::remove_all(sendDir);
}

BOOST_AUTO_TEST_CASE(TransferReceiverResumeMismatchTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    const boost::filesystem::path sendDir = MakeTestDirectory("rft_tx");
    BOOST_REQUIRE(boost::filesystem::create_directories(sendDir));
    const std::string data = MakeTestData(20000, 5);
    WriteFile(sendDir / "notes.txt", data);
    WriteFile(sendDir / "shorter.txt", MakeTestData(19999, 5));

    TransferReceiver receiver(MakeTestConfig(47303, receiveDir));
    BOOST_REQUIRE(receiver.Init());
    ReservationStore & store = receiver.GetReservationStore();

    TransferSender sender;
    transfer_sender_result_t result;
    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47303, sendDir / "notes.txt", "", 0, 8000, result));
    BOOST_REQUIRE(result.outcome == TRANSFER_SENDER_OUTCOME::PAUSED);
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsPaused, &receiver) == 1));

    //wrong offset
    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47303, sendDir / "notes.txt", "notes.txt", 5000, 0, result));
    BOOST_REQUIRE(result.outcome == TRANSFER_SENDER_OUTCOME::REJECTED);
    BOOST_REQUIRE(result.rejectReason == REJECT_REASON::OFFSET_MISMATCH);
    BOOST_REQUIRE_EQUAL(result.reason, "OFFSET_MISMATCH: resume offset 5000 does not match the 8000 bytes received");
    BOOST_REQUIRE(result.hasReceiverRecordedOffset);
    BOOST_REQUIRE_EQUAL(result.receiverRecordedOffset, 8000);
    BOOST_REQUIRE_EQUAL(result.bytesSent, 0);
    BOOST_REQUIRE_EQUAL(boost::filesystem::file_size(store.GetPartialFilePath("notes.txt")), 8000);

    //wrong declared size
    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47303, sendDir / "shorter.txt", "notes.txt", 8000, 0, result));
    BOOST_REQUIRE(result.rejectReason == REJECT_REASON::SIZE_MISMATCH);
    BOOST_REQUIRE(!result.hasReceiverRecordedOffset);

    //never reserved
    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47303, sendDir / "notes.txt", "unheard-of.txt", 8000, 0, result));
    BOOST_REQUIRE(result.rejectReason == REJECT_REASON::UNKNOWN_TRANSFER);

    ReservationRecord record;
    BOOST_REQUIRE(store.GetRecord("notes.txt", record));
    BOOST_REQUIRE_EQUAL(record.m_bytesReceived, 8000);
    BOOST_REQUIRE(!store.IsActive("notes.txt"));

    //the correct offset still works after the rejections
    BOOST_REQUIRE(sender.Send(LOCALHOST, 47303, sendDir / "notes.txt", "notes.txt", 8000, 0, result));
    BOOST_REQUIRE(ReadWholeFile(receiveDir / "notes.txt") == data);
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsFailed, &receiver) == 3));

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
    boost::filesystem::remove_all(sendDir);
}

BOOST_AUTO_TEST_CASE(TransferReceiverRejectBeforeTransferTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    const boost::filesystem::path sendDir = MakeTestDirectory("rft_tx");
    BOOST_REQUIRE(boost::filesystem::create_directories(sendDir));
    WriteFile(sendDir / "big.txt", MakeTestData(2000, 1));
    WriteFile(sendDir / "tool.exe", MakeTestData(100, 1));
    WriteFile(sendDir / "small.TXT", MakeTestData(100, 1));

    ReceiverConfig config = MakeTestConfig(47304, receiveDir);
    config.m_maxFileSizeBytes = 1000;
    BOOST_REQUIRE(config.AddAllowedExtension("txt"));
    TransferReceiver receiver(config);
    BOOST_REQUIRE(receiver.Init());

    TransferSender sender;
    transfer_sender_result_t result;
    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47304, sendDir / "big.txt", "", 0, 0, result));
    BOOST_REQUIRE(result.outcome == TRANSFER_SENDER_OUTCOME::REJECTED);
    BOOST_REQUIRE(result.rejectReason == REJECT_REASON::REJECTED);
    BOOST_REQUIRE_EQUAL(result.reason, "REJECTED: declared size 2000 exceeds the maximum of 1000 bytes");
    BOOST_REQUIRE_EQUAL(result.bytesSent, 0);

    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47304, sendDir / "tool.exe", "", 0, 0, result));
    BOOST_REQUIRE(result.rejectReason == REJECT_REASON::REJECTED);
    BOOST_REQUIRE_EQUAL(result.reason, "REJECTED: extension .exe is not allowed");

    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47304, sendDir / "tool.exe", "../escape.txt", 0, 0, result));
    BOOST_REQUIRE_EQUAL(result.reason, "REJECTED: filename contains a path separator");

    //nothing was reserved or written for any rejected request
    BOOST_REQUIRE_EQUAL(receiver.GetReservationStore().GetNumReservations(), 0);
    BOOST_REQUIRE_EQUAL(CountEntries(receiveDir / ReservationStore::PARTIAL_DIRECTORY_NAME), 0);
    BOOST_REQUIRE_EQUAL(CountEntries(receiveDir), 1); //only the partial directory
    BOOST_REQUIRE(!boost::filesystem::exists(receiveDir.parent_path() / "escape.txt"));

    //extension matching is case insensitive
    BOOST_REQUIRE(sender.Send(LOCALHOST, 47304, sendDir / "small.TXT", "", 0, 0, result));
    BOOST_REQUIRE_EQUAL(result.resolvedName, "small.TXT");
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsFailed, &receiver) == 3));

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
    boost::filesystem::remove_all(sendDir);
}

BOOST_AUTO_TEST_CASE(TransferReceiverDecodeErrorTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    ReceiverConfig config = MakeTestConfig(47305, receiveDir);
    config.m_maxFilenameLengthBytes = 32;
    TransferReceiver receiver(config);
    BOOST_REQUIRE(receiver.Init());

    {
        RawClient client;
        BOOST_REQUIRE(client.Connect(47305));
        BOOST_REQUIRE(client.Write(std::vector<uint8_t>({ 0, 0 }))); //zero length name
        BOOST_REQUIRE(client.ClosedWithoutData());
    }
    {
        RawClient client;
        BOOST_REQUIRE(client.Connect(47305));
        BOOST_REQUIRE(client.Write(std::vector<uint8_t>({ 0, 33 }))); //above the configured cap
        BOOST_REQUIRE(client.ClosedWithoutData());
    }
    {
        RawClient client;
        BOOST_REQUIRE(client.Connect(47305));
        std::vector<uint8_t> envelope;
        BOOST_REQUIRE(EnvelopeCodec::GenerateEnvelope(envelope, "a.txt", 10, 10));
        envelope.back() = 11; //resume offset beyond the declared size
        BOOST_REQUIRE(client.Write(envelope));
        BOOST_REQUIRE(client.ClosedWithoutData());
    }
    {
        //peer disconnects halfway through the envelope
        RawClient client;
        BOOST_REQUIRE(client.Connect(47305));
        BOOST_REQUIRE(client.Write(std::vector<uint8_t>({ 0, 5, 'a', '.' })));
        client.Close();
    }
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsFailed, &receiver) == 4));
    BOOST_REQUIRE_EQUAL(receiver.GetReservationStore().GetNumReservations(), 0);

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
}

BOOST_AUTO_TEST_CASE(TransferReceiverIdleTimeoutTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    ReceiverConfig config = MakeTestConfig(47306, receiveDir);
    config.m_idleTimeoutSeconds = 1;
    TransferReceiver receiver(config);
    BOOST_REQUIRE(receiver.Init());

    //stalls after part of the file: the transfer pauses with the bytes received so far
    RawClient streamingClient;
    BOOST_REQUIRE(streamingClient.Connect(47306));
    BOOST_REQUIRE(streamingClient.SendEnvelope("stall.txt", 1000, 0));
    TRANSFER_RESPONSE_TYPE responseType;
    std::string text;
    BOOST_REQUIRE(streamingClient.ReadResponse(responseType, text));
    BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::ACCEPTED);
    BOOST_REQUIRE_EQUAL(text, "stall.txt");
    BOOST_REQUIRE(streamingClient.Write(MakeTestData(300, 9)));

    //stalls before the envelope completes: a decode error with no response
    RawClient envelopeClient;
    BOOST_REQUIRE(envelopeClient.Connect(47306));
    BOOST_REQUIRE(envelopeClient.Write(std::vector<uint8_t>({ 0, 9, 'h' })));

    BOOST_REQUIRE(streamingClient.ClosedWithoutData());
    BOOST_REQUIRE(envelopeClient.ClosedWithoutData());
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsPaused, &receiver) == 1));
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsFailed, &receiver) == 1));

    ReservationRecord record;
    BOOST_REQUIRE(receiver.GetReservationStore().GetRecord("stall.txt", record));
    BOOST_REQUIRE_EQUAL(record.m_bytesReceived, 300);
    BOOST_REQUIRE(!receiver.GetReservationStore().IsActive("stall.txt"));

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
}

BOOST_AUTO_TEST_CASE(TransferReceiverReservationConflictTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    const boost::filesystem::path sendDir = MakeTestDirectory("rft_tx");
    BOOST_REQUIRE(boost::filesystem::create_directories(sendDir));
    const std::string data = MakeTestData(5000, 2);
    WriteFile(sendDir / "shared.txt", data);

    TransferReceiver receiver(MakeTestConfig(47307, receiveDir));
    BOOST_REQUIRE(receiver.Init());

    TransferSender sender;
    transfer_sender_result_t result;
    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47307, sendDir / "shared.txt", "", 0, 1000, result));
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsPaused, &receiver) == 1));

    //first resumer holds the transfer
    RawClient holder;
    BOOST_REQUIRE(holder.Connect(47307));
    BOOST_REQUIRE(holder.SendEnvelope("shared.txt", 5000, 1000));
    TRANSFER_RESPONSE_TYPE responseType;
    std::string text;
    BOOST_REQUIRE(holder.ReadResponse(responseType, text));
    BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::ACCEPTED);
    BOOST_REQUIRE(receiver.GetReservationStore().IsActive("shared.txt"));

    //second resumer is refused without disturbing the first
    BOOST_REQUIRE(!sender.Send(LOCALHOST, 47307, sendDir / "shared.txt", "shared.txt", 1000, 0, result));
    BOOST_REQUIRE(result.outcome == TRANSFER_SENDER_OUTCOME::REJECTED);
    BOOST_REQUIRE(result.rejectReason == REJECT_REASON::RESERVATION_CONFLICT);

    BOOST_REQUIRE(holder.Write(data.substr(1000)));
    BOOST_REQUIRE(holder.ReadResponse(responseType, text));
    BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::COMPLETED);
    BOOST_REQUIRE(ReadWholeFile(receiveDir / "shared.txt") == data);

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
    boost::filesystem::remove_all(sendDir);
}

BOOST_AUTO_TEST_CASE(TransferReceiverServerBusyTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    ReceiverConfig config = MakeTestConfig(47308, receiveDir);
    config.m_maxConcurrentSessions = 1;
    TransferReceiver receiver(config);
    BOOST_REQUIRE(receiver.Init());

    RawClient holder;
    BOOST_REQUIRE(holder.Connect(47308));
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetNumActiveSessions, &receiver) == 1));

    RawClient refused;
    BOOST_REQUIRE(refused.Connect(47308));
    TRANSFER_RESPONSE_TYPE responseType;
    std::string text;
    BOOST_REQUIRE(refused.ReadResponse(responseType, text));
    BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::REJECTED);
    BOOST_REQUIRE(EnvelopeCodec::ParseReasonToken(text) == REJECT_REASON::SERVER_BUSY);
    BOOST_REQUIRE(refused.ClosedWithoutData());
    BOOST_REQUIRE_EQUAL(receiver.GetTotalSessionsRefused(), 1);

    //capacity frees up once the holder goes away
    holder.Close();
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetNumActiveSessions, &receiver) == 0));
    RawClient admitted;
    BOOST_REQUIRE(admitted.Connect(47308));
    BOOST_REQUIRE(admitted.SendEnvelope("ok.txt", 2, 0));
    BOOST_REQUIRE(admitted.ReadResponse(responseType, text));
    BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::ACCEPTED);
    BOOST_REQUIRE(admitted.Write(std::string("ok")));
    BOOST_REQUIRE(admitted.ReadResponse(responseType, text));
    BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::COMPLETED);

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
}

static void SendThreadFunc(uint16_t port, boost::filesystem::path localFile, transfer_sender_result_t * resultPtr) {
    TransferSender sender(1024);
    sender.Send(LOCALHOST, port, localFile, "", 0, 0, *resultPtr);
}

BOOST_AUTO_TEST_CASE(TransferReceiverConcurrentTransfersTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    const boost::filesystem::path sendDir = MakeTestDirectory("rft_tx");
    BOOST_REQUIRE(boost::filesystem::create_directories(sendDir));
    static const unsigned int NUM_TRANSFERS = 4;
    std::vector<std::string> datas;
    for (unsigned int i = 0; i < NUM_TRANSFERS; ++i) {
        datas.push_back(MakeTestData(60000 + (i * 1000), i));
        WriteFile(sendDir / ("file" + std::to_string(i) + ".dat"), datas.back());
    }

    ReceiverConfig config = MakeTestConfig(47309, receiveDir);
    config.m_numIoThreads = 3;
    TransferReceiver receiver(config);
    BOOST_REQUIRE(receiver.Init());

    std::vector<transfer_sender_result_t> results(NUM_TRANSFERS);
    std::vector<std::unique_ptr<boost::thread> > threads;
    for (unsigned int i = 0; i < NUM_TRANSFERS; ++i) {
        threads.push_back(boost::make_unique<boost::thread>(boost::bind(&SendThreadFunc, static_cast<uint16_t>(47309),
            sendDir / ("file" + std::to_string(i) + ".dat"), &results[i])));
    }
    for (unsigned int i = 0; i < NUM_TRANSFERS; ++i) {
        threads[i]->join();
    }
    for (unsigned int i = 0; i < NUM_TRANSFERS; ++i) {
        BOOST_REQUIRE(results[i].outcome == TRANSFER_SENDER_OUTCOME::COMPLETED);
        BOOST_REQUIRE_EQUAL(results[i].resolvedName, "file" + std::to_string(i) + ".dat");
        BOOST_REQUIRE(ReadWholeFile(receiveDir / results[i].resolvedName) == datas[i]);
    }
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsCompleted, &receiver) == NUM_TRANSFERS));

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
    boost::filesystem::remove_all(sendDir);
}

BOOST_AUTO_TEST_CASE(TransferReceiverRestartTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    const boost::filesystem::path sendDir = MakeTestDirectory("rft_tx");
    BOOST_REQUIRE(boost::filesystem::create_directories(sendDir));
    const std::string data = MakeTestData(3000, 8);
    WriteFile(sendDir / "survivor.txt", data);

    {
        TransferReceiver receiver(MakeTestConfig(47310, receiveDir));
        BOOST_REQUIRE(receiver.Init());
        RawClient client;
        BOOST_REQUIRE(client.Connect(47310));
        BOOST_REQUIRE(client.SendEnvelope("survivor.txt", 3000, 0));
        TRANSFER_RESPONSE_TYPE responseType;
        std::string text;
        BOOST_REQUIRE(client.ReadResponse(responseType, text));
        BOOST_REQUIRE(client.Write(data.substr(0, 1200)));
        BOOST_REQUIRE(WaitUntil([&receiver]() {
            transfer_receiver_telemetry_t telem;
            receiver.GetTelemetry(telem);
            return (telem.sessions.size() == 1) && (telem.sessions[0].bytesReceived == 1200);
        }));
        //stopping the receiver mid-stream pauses the transfer
        receiver.Stop();
        BOOST_REQUIRE_EQUAL(receiver.GetTotalSessionsPaused(), 1);
    }

    TransferReceiver receiver(MakeTestConfig(47310, receiveDir));
    BOOST_REQUIRE(receiver.Init());
    ReservationRecord record;
    BOOST_REQUIRE(receiver.GetReservationStore().GetRecord("survivor.txt", record));
    BOOST_REQUIRE_EQUAL(record.m_bytesReceived, 1200);

    TransferSender sender;
    transfer_sender_result_t result;
    BOOST_REQUIRE(sender.Send(LOCALHOST, 47310, sendDir / "survivor.txt", "survivor.txt", 1200, 0, result));
    BOOST_REQUIRE(ReadWholeFile(receiveDir / "survivor.txt") == data);

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
    boost::filesystem::remove_all(sendDir);
}

BOOST_AUTO_TEST_CASE(TransferReceiverResumeBeforeFirstByteTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    const boost::filesystem::path sendDir = MakeTestDirectory("rft_tx");
    BOOST_REQUIRE(boost::filesystem::create_directories(sendDir));
    const std::string data = MakeTestData(100, 17);

    TransferReceiver receiver(MakeTestConfig(47311, receiveDir));
    BOOST_REQUIRE(receiver.Init());
    ReservationStore & store = receiver.GetReservationStore();

    TRANSFER_RESPONSE_TYPE responseType;
    std::string text;
    {
        //accepted, then the connection drops before any file byte
        RawClient client;
        BOOST_REQUIRE(client.Connect(47311));
        BOOST_REQUIRE(client.SendEnvelope("z.txt", data.size(), 0));
        BOOST_REQUIRE(client.ReadResponse(responseType, text));
        BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::ACCEPTED);
        BOOST_REQUIRE_EQUAL(text, "z.txt");
        client.Close();
    }
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsPaused, &receiver) == 1));
    ReservationRecord record;
    BOOST_REQUIRE(store.GetRecord("z.txt", record));
    BOOST_REQUIRE_EQUAL(record.m_bytesReceived, 0);

    //a different file of the same name does not take over the empty reservation
    WriteFile(sendDir / "z.txt", "other");
    TransferSender sender;
    transfer_sender_result_t result;
    BOOST_REQUIRE(sender.Send(LOCALHOST, 47311, sendDir / "z.txt", "", 0, 0, result));
    BOOST_REQUIRE_EQUAL(result.resolvedName, "z (1).txt");
    BOOST_REQUIRE(store.IsReserved("z.txt"));

    {
        //the retry with offset zero continues under the same name
        RawClient client;
        BOOST_REQUIRE(client.Connect(47311));
        BOOST_REQUIRE(client.SendEnvelope("z.txt", data.size(), 0));
        BOOST_REQUIRE(client.ReadResponse(responseType, text));
        BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::ACCEPTED);
        BOOST_REQUIRE_EQUAL(text, "z.txt");
        BOOST_REQUIRE(client.Write(data));
        BOOST_REQUIRE(client.ReadResponse(responseType, text));
        BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::COMPLETED);
        client.Close();
    }
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsCompleted, &receiver) == 2));
    BOOST_REQUIRE(ReadWholeFile(receiveDir / "z.txt") == data);
    BOOST_REQUIRE_EQUAL(ReadWholeFile(receiveDir / "z (1).txt"), "other");
    BOOST_REQUIRE_EQUAL(store.GetNumReservations(), 0);
    BOOST_REQUIRE_EQUAL(CountEntries(receiveDir / ReservationStore::PARTIAL_DIRECTORY_NAME), 0);

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
    boost::filesystem::remove_all(sendDir);
}

BOOST_AUTO_TEST_CASE(TransferReceiverFinalizeRetryTestCase)
{
    const boost::filesystem::path receiveDir = MakeTestDirectory("rft_rx");
    const std::string data = MakeTestData(6000, 23);

    TransferReceiver receiver(MakeTestConfig(47312, receiveDir));
    BOOST_REQUIRE(receiver.Init());
    ReservationStore & store = receiver.GetReservationStore();
    const boost::filesystem::path partialPath = store.GetPartialFilePath("final.bin");

    TRANSFER_RESPONSE_TYPE responseType;
    std::string text;
    {
        RawClient client;
        BOOST_REQUIRE(client.Connect(47312));
        BOOST_REQUIRE(client.SendEnvelope("final.bin", data.size(), 0));
        BOOST_REQUIRE(client.ReadResponse(responseType, text));
        BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::ACCEPTED);
        //the session keeps writing to its open handle but the publish rename has nothing to move
        BOOST_REQUIRE(boost::filesystem::remove(partialPath));
        BOOST_REQUIRE(client.Write(data));
        BOOST_REQUIRE(client.ReadResponse(responseType, text));
        BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::REJECTED);
        BOOST_REQUIRE(EnvelopeCodec::ParseReasonToken(text) == REJECT_REASON::IO_FAILURE);
        client.Close();
    }
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsFailed, &receiver) == 1));
    BOOST_REQUIRE(!boost::filesystem::exists(receiveDir / "final.bin"));

    //the reservation is kept, paused at the declared size
    ReservationRecord record;
    BOOST_REQUIRE(store.GetRecord("final.bin", record));
    BOOST_REQUIRE_EQUAL(record.m_bytesReceived, data.size());
    BOOST_REQUIRE(!store.IsActive("final.bin"));

    //once the partial file is back, a resume at the declared size only retries the publish
    WriteFile(partialPath, data);
    {
        RawClient client;
        BOOST_REQUIRE(client.Connect(47312));
        BOOST_REQUIRE(client.SendEnvelope("final.bin", data.size(), data.size()));
        BOOST_REQUIRE(client.ReadResponse(responseType, text));
        BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::ACCEPTED);
        BOOST_REQUIRE_EQUAL(text, "final.bin");
        BOOST_REQUIRE(client.ReadResponse(responseType, text));
        BOOST_REQUIRE(responseType == TRANSFER_RESPONSE_TYPE::COMPLETED);
        client.Close();
    }
    BOOST_REQUIRE(WaitUntil(boost::bind(&TransferReceiver::GetTotalSessionsCompleted, &receiver) == 1));
    BOOST_REQUIRE(ReadWholeFile(receiveDir / "final.bin") == data);
    BOOST_REQUIRE_EQUAL(store.GetNumReservations(), 0);

    receiver.Stop();
    boost::filesystem::remove_all(receiveDir);
}

BOOST_AUTO_TEST_CASE(TransferSessionIoErrorReservationTestCase)
{
    //a full disk keeps a transfer the sender can resume
    BOOST_REQUIRE(TransferSession::KeepsReservationAfterIoError(ENOSPC, true));
#ifdef EDQUOT
    BOOST_REQUIRE(TransferSession::KeepsReservationAfterIoError(EDQUOT, true));
#endif
    //before the accept reaches the sender it cannot know the name, so nothing is kept
    BOOST_REQUIRE(!TransferSession::KeepsReservationAfterIoError(ENOSPC, false));
    //any other error discards the partial file
    BOOST_REQUIRE(!TransferSession::KeepsReservationAfterIoError(EIO, true));
    BOOST_REQUIRE(!TransferSession::KeepsReservationAfterIoError(EACCES, true));
    BOOST_REQUIRE(!TransferSession::KeepsReservationAfterIoError(0, true));
}
