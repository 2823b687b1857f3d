/**
 * @file RftSendRunner.cpp
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

#include "RftSendRunner.h"
#include "SignalHandler.h"
#include "Logger.h"
#include "Utf8Paths.h"
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/bind/bind.hpp>

static constexpr rft::Logger::SubProcess subprocess = rft::Logger::SubProcess::sender;

void RftSendRunner::MonitorExitKeypressThreadFunction(int signalNumber) {
    LOG_INFO(subprocess) << "Signal " << signalNumber << " received.. pausing the transfer";
    TransferSender * const transferSenderPtr = m_transferSenderPtr.load(std::memory_order_acquire);
    if (transferSenderPtr) {
        transferSenderPtr->RequestPause();
    }
}


RftSendRunner::RftSendRunner() : m_transferSenderPtr(NULL) {}
RftSendRunner::~RftSendRunner() {}


bool RftSendRunner::Run(int argc, const char* const argv[], std::atomic<bool> & running, bool useSignalHandler) {
    //scope to ensure clean exit before return 0
    {
        running = true;
        std::string host;
        uint16_t port;
        boost::filesystem::path filePath;
        std::string remoteName;
        uint64_t resumeOffset;
        uint64_t maxBytes;
        std::size_t chunkSizeBytes;

        boost::program_options::options_description desc("Allowed options");
        try {
            desc.add_options()
                ("help", "Produce help message.")
                ("host", boost::program_options::value<std::string>()->default_value("127.0.0.1"), "Receiver host name or address.")
                ("port", boost::program_options::value<uint16_t>()->default_value(9999), "Receiver TCP port.")
                ("file", boost::program_options::value<boost::filesystem::path>()->default_value(""), "File to send.")
                ("remote-name", boost::program_options::value<std::string>()->default_value(""), "Envelope filename (required to resume: use the name the receiver accepted).")
                ("resume-offset", boost::program_options::value<uint64_t>()->default_value(0), "Resume a paused transfer from this offset (0=>fresh transfer).")
                ("max-bytes", boost::program_options::value<uint64_t>()->default_value(0), "Pause after sending this many bytes (0=>send everything).")
                ("chunk-size-bytes", boost::program_options::value<std::size_t>()->default_value(TransferSender::DEFAULT_CHUNK_SIZE_BYTES), "Bytes per socket write.")
                ;

            boost::program_options::variables_map vm;
            boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc, boost::program_options::command_line_style::unix_style | boost::program_options::command_line_style::case_insensitive), vm);
            boost::program_options::notify(vm);

            if (vm.count("help")) {
                LOG_INFO(subprocess) << desc;
                return false;
            }

            host = vm["host"].as<std::string>();
            port = vm["port"].as<uint16_t>();
            filePath = vm["file"].as<boost::filesystem::path>();
            remoteName = vm["remote-name"].as<std::string>();
            resumeOffset = vm["resume-offset"].as<uint64_t>();
            maxBytes = vm["max-bytes"].as<uint64_t>();
            chunkSizeBytes = vm["chunk-size-bytes"].as<std::size_t>();
        }
        catch (boost::bad_any_cast & e) {
            LOG_ERROR(subprocess) << "invalid data error: " << e.what() << "\n";
            LOG_ERROR(subprocess) << desc;
            return false;
        }
        catch (std::exception& e) {
            LOG_ERROR(subprocess) << e.what();
            return false;
        }

        if (filePath.empty()) {
            LOG_ERROR(subprocess) << "no --file given";
            return false;
        }
        if (resumeOffset && remoteName.empty()) {
            LOG_ERROR(subprocess) << "--resume-offset requires --remote-name";
            return false;
        }

        TransferSender transferSender(chunkSizeBytes);
        m_transferSenderPtr = &transferSender;
        SignalHandler sigHandler(boost::bind(&RftSendRunner::MonitorExitKeypressThreadFunction, this, boost::placeholders::_1));
        if (useSignalHandler) {
            sigHandler.Start(true);
        }

        LOG_INFO(subprocess) << "sending " << filePath << " to " << host << ":" << port;
        transferSender.Send(host, port, filePath, remoteName, resumeOffset, maxBytes, m_result);
        m_transferSenderPtr = NULL;

        switch (m_result.outcome) {
            case TRANSFER_SENDER_OUTCOME::COMPLETED:
                LOG_INFO(subprocess) << "completed as " << Utf8Paths::ToPrintableString(m_result.resolvedName);
                break;
            case TRANSFER_SENDER_OUTCOME::PAUSED:
                LOG_INFO(subprocess) << "paused, resume with --remote-name=\"" << m_result.resolvedName
                    << "\" --resume-offset=" << m_result.GetNextResumeOffset(resumeOffset);
                break;
            default:
                LOG_ERROR(subprocess) << TransferSenderOutcomeToString(m_result.outcome) << ": " << m_result.reason;
                if (m_result.hasReceiverRecordedOffset) {
                    LOG_INFO(subprocess) << "the receiver holds " << m_result.receiverRecordedOffset
                        << " bytes, resume with --remote-name=\"" << remoteName
                        << "\" --resume-offset=" << m_result.receiverRecordedOffset;
                }
                break;
        }
        running = false;
    }
    LOG_INFO(subprocess) << "Exited cleanly";
    return (m_result.outcome == TRANSFER_SENDER_OUTCOME::COMPLETED);

}
