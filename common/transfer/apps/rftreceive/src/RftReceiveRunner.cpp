/**
 * @file RftReceiveRunner.cpp
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

#include "RftReceiveRunner.h"
#include "ReceiverConfig.h"
#include "SignalHandler.h"
#include "Logger.h"
#include "Utf8Paths.h"
#include <boost/filesystem.hpp>
#include <boost/program_options.hpp>
#include <boost/bind/bind.hpp>

static constexpr rft::Logger::SubProcess subprocess = rft::Logger::SubProcess::receiver;

void RftReceiveRunner::MonitorExitKeypressThreadFunction(int signalNumber) {
    LOG_INFO(subprocess) << "Signal " << signalNumber << " received.. pausing transfers and exiting";
    m_runningFromSigHandler = false; //do this first
}


RftReceiveRunner::RftReceiveRunner() {}
RftReceiveRunner::~RftReceiveRunner() {}


bool RftReceiveRunner::Run(int argc, const char* const argv[], std::atomic<bool> & running, bool useSignalHandler) {
    //scope to ensure clean exit before return 0
    {
        running = true;
        m_runningFromSigHandler = true;
        SignalHandler sigHandler(boost::bind(&RftReceiveRunner::MonitorExitKeypressThreadFunction, this, boost::placeholders::_1));
        ReceiverConfig_ptr receiverConfigPtr;

        boost::program_options::options_description desc("Allowed options");
        try {
            desc.add_options()
                ("help", "Produce help message.")
                ("config-file", boost::program_options::value<boost::filesystem::path>()->default_value(""), "Receiver Configuration File.  Empty=>use the built in defaults")
                ("receive-directory", boost::program_options::value<boost::filesystem::path>()->default_value(""), "Override the directory files are received into.")
                ("listen-port", boost::program_options::value<uint16_t>()->default_value(0), "Override the TCP listen port (0=>keep the configured port).")
                ;

            boost::program_options::variables_map vm;
            boost::program_options::store(boost::program_options::parse_command_line(argc, argv, desc, boost::program_options::command_line_style::unix_style | boost::program_options::command_line_style::case_insensitive), vm);
            boost::program_options::notify(vm);

            if (vm.count("help")) {
                LOG_INFO(subprocess) << desc;
                return false;
            }

            const boost::filesystem::path configFilePath = vm["config-file"].as<boost::filesystem::path>();
            if (!configFilePath.empty()) {
                receiverConfigPtr = ReceiverConfig::CreateFromJsonFilePath(configFilePath);
                if (!receiverConfigPtr) {
                    LOG_ERROR(subprocess) << "error loading config file: " << configFilePath;
                    return false;
                }
            }
            else {
                LOG_WARNING(subprocess) << "no config file given, using the default receiver configuration";
                receiverConfigPtr = std::make_shared<ReceiverConfig>();
            }

            const boost::filesystem::path receiveDirectory = vm["receive-directory"].as<boost::filesystem::path>();
            if (!receiveDirectory.empty()) {
                receiverConfigPtr->m_receiveDirectory = Utf8Paths::PathToUtf8String(receiveDirectory);
            }
            const uint16_t listenPort = vm["listen-port"].as<uint16_t>();
            if (listenPort) {
                receiverConfigPtr->m_listenPort = listenPort;
            }
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

        if (!receiverConfigPtr->IsValid()) {
            LOG_ERROR(subprocess) << "invalid receiver configuration";
            return false;
        }

        LOG_INFO(subprocess) << "starting..";
        TransferReceiver transferReceiver(*receiverConfigPtr);
        if (!transferReceiver.Init()) {
            LOG_FATAL(subprocess) << "Cannot Init TransferReceiver!";
            return false;
        }


        if (useSignalHandler) {
            sigHandler.Start(false);
        }
        LOG_INFO(subprocess) << "Up and running";
        while (running && m_runningFromSigHandler) {
            boost::this_thread::sleep(boost::posix_time::millisec(250));
            if (useSignalHandler) {
                sigHandler.PollOnce();
            }
        }


        LOG_INFO(subprocess) << "Exiting cleanly..";
        transferReceiver.Stop();
        transferReceiver.GetTelemetry(m_finalTelemetry);
        LOG_INFO(subprocess) << "sessions accepted: " << m_finalTelemetry.totalSessionsAccepted
            << ", completed: " << m_finalTelemetry.totalSessionsCompleted
            << ", paused: " << m_finalTelemetry.totalSessionsPaused
            << ", failed: " << m_finalTelemetry.totalSessionsFailed
            << ", refused: " << m_finalTelemetry.totalSessionsRefused;
    }
    LOG_INFO(subprocess) << "Exited cleanly";
    return true;

}
