/**
 * @file Logger.h
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
 * Process-wide Boost.Log front end for rftreceive, rftsend and the unit tests.
 * Every record carries the process that emitted it (set once by the process main)
 * and a channel naming the component (receiver or sender side of a transfer).
 * Which sinks exist is decided at compile time:
 *   LOG_TO_CONSOLE           info and below to stdout, warnings and above to stderr
 *   LOG_TO_PROCESS_FILE      logs/<process>_NNNNN.log
 *   LOG_TO_SUBPROCESS_FILES  logs/receiver_NNNNN.log and logs/sender_NNNNN.log
 *   LOG_TO_ERROR_FILE        logs/errors_NNNNN.log with the source location of each record
 * Records below LOG_LEVEL are removed by the preprocessor.
 */

#ifndef _RFT_LOG_H
#define _RFT_LOG_H 1

#include <iostream>
#include <string>
#include <boost/log/sources/record_ostream.hpp>
#include <boost/log/sources/severity_channel_logger.hpp>
#include <boost/log/trivial.hpp>
#include <boost/log/utility/manipulators/add_value.hpp>
#include "rft_log_export.h"

#define LOG_LEVEL_TRACE 0
#define LOG_LEVEL_DEBUG 1
#define LOG_LEVEL_INFO 2
#define LOG_LEVEL_WARNING 3
#define LOG_LEVEL_ERROR 4
#define LOG_LEVEL_FATAL 5

#ifndef LOG_LEVEL
#define LOG_LEVEL LOG_LEVEL_INFO
#endif

//discards a streaming expression; the else branch is never taken
#define RFT_LOG_DISCARD if (true) {} else std::cout

#define RFT_LOG_INTERNAL(subprocess, lvl)\
    rft::Logger::ensureInitialized();\
    BOOST_LOG_STREAM_CHANNEL_SEV(rft::Logger::m_severityChannelLogger, subprocess, lvl)\
        << boost::log::add_value("File", __FILE__)\
        << boost::log::add_value("Line", __LINE__)

#if LOG_LEVEL > LOG_LEVEL_TRACE
    #define LOG_TRACE(subprocess) RFT_LOG_DISCARD
#else
    #define LOG_TRACE(subprocess) RFT_LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::trace)
#endif

#if LOG_LEVEL > LOG_LEVEL_DEBUG
    #define LOG_DEBUG(subprocess) RFT_LOG_DISCARD
#else
    #define LOG_DEBUG(subprocess) RFT_LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::debug)
#endif

#if LOG_LEVEL > LOG_LEVEL_INFO
    #define LOG_INFO(subprocess) RFT_LOG_DISCARD
#else
    #define LOG_INFO(subprocess) RFT_LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::info)
#endif

#if LOG_LEVEL > LOG_LEVEL_WARNING
    #define LOG_WARNING(subprocess) RFT_LOG_DISCARD
#else
    #define LOG_WARNING(subprocess) RFT_LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::warning)
#endif

#if LOG_LEVEL > LOG_LEVEL_ERROR
    #define LOG_ERROR(subprocess) RFT_LOG_DISCARD
#else
    #define LOG_ERROR(subprocess) RFT_LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::error)
#endif

#if LOG_LEVEL > LOG_LEVEL_FATAL
    #define LOG_FATAL(subprocess) RFT_LOG_DISCARD
#else
    #define LOG_FATAL(subprocess) RFT_LOG_INTERNAL(subprocess, boost::log::trivial::severity_level::fatal)
#endif

namespace rft {

class Logger {
public:
    enum class Process {
        rftreceive,
        rftsend,
        unittest,
        none
    };

    enum class SubProcess {
        receiver,
        sender,
        unittest,
        none
    };

    typedef boost::log::sources::severity_channel_logger_mt<
        boost::log::trivial::severity_level,
        Logger::SubProcess
    > severity_channel_logger_t;

    /// Source used by the LOG_* macros
    RFT_LOG_EXPORT static severity_channel_logger_t m_severityChannelLogger;

    /** Tag every following record with process and log the version.
     *
     * May be called after records were already emitted; earlier records keep "none".
     */
    RFT_LOG_EXPORT static void initializeWithProcess(Process process);

    /// Install the compiled-in sinks exactly once
    RFT_LOG_EXPORT static void ensureInitialized();

    RFT_LOG_EXPORT static Process getProcess();

    RFT_LOG_EXPORT static std::string toString(Process process);
    RFT_LOG_EXPORT static std::string toString(SubProcess subprocess);

    /// Upper case severity name, example: "WARNING"
    RFT_LOG_EXPORT static std::string toString(boost::log::trivial::severity_level level);

    /** The bracketed source of a line: "process/channel", or just one of them when
     * the other is none or both name the same thing.
     */
    RFT_LOG_EXPORT static std::string makeSourceTag(Process process, SubProcess subprocess);

    /// "MAJOR.MINOR.PATCH"
    RFT_LOG_EXPORT static const std::string& GetRftVersionAsString();

private:
    Logger() = delete;
    static void installSinks();
};

} //namespace rft

#endif //_RFT_LOG_H
