/**
 * @file Logger.cpp
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

#include "Logger.h"
#include "RftVersion.hpp"
#include <boost/bind/bind.hpp>
#include <boost/core/null_deleter.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>
#include <boost/filesystem/path.hpp>
#include <boost/lexical_cast.hpp>
#include <boost/log/attributes/clock.hpp>
#include <boost/log/attributes/mutable_constant.hpp>
#include <boost/log/attributes/value_extraction.hpp>
#include <boost/log/core.hpp>
#include <boost/log/expressions/message.hpp>
#include <boost/log/sinks/sync_frontend.hpp>
#include <boost/log/sinks/text_file_backend.hpp>
#include <boost/log/sinks/text_ostream_backend.hpp>
#include <boost/log/utility/formatting_ostream.hpp>
#include <boost/make_shared.hpp>
#include <boost/preprocessor/stringize.hpp>
#include <boost/thread/locks.hpp>
#include <boost/thread/once.hpp>
#include <boost/thread/shared_mutex.hpp>

namespace logging = boost::log;
namespace sinks = boost::log::sinks;
namespace keywords = boost::log::keywords;

namespace rft {

Logger::severity_channel_logger_t Logger::m_severityChannelLogger;

namespace {

typedef logging::trivial::severity_level severity_t;
typedef sinks::synchronous_sink<sinks::text_ostream_backend> console_sink_t;
typedef sinks::synchronous_sink<sinks::text_file_backend> file_sink_t;

//set from any thread by initializeWithProcess while sessions may be logging
typedef logging::attributes::mutable_constant<
    Logger::Process,
    boost::shared_mutex,
    boost::unique_lock<boost::shared_mutex>,
    boost::shared_lock<boost::shared_mutex>
> process_attribute_t;

static const uintmax_t FILE_ROTATION_SIZE_BYTES = 5 * 1024 * 1024;
static const char * const LOG_DIRECTORY = "logs/";

boost::once_flag g_sinksInstalledOnceFlag = BOOST_ONCE_INIT;
#ifdef LOG_TO_PROCESS_FILE
boost::once_flag g_processFileOnceFlag = BOOST_ONCE_INIT;
#endif

process_attribute_t & ProcessAttribute() {
    static process_attribute_t attr(Logger::Process::none);
    return attr;
}

struct record_fields_t {
    Logger::Process process;
    Logger::SubProcess channel;
    severity_t level;
};

record_fields_t ExtractFields(const logging::record_view & rec) {
    record_fields_t fields;
    fields.process = logging::extract_or_default<Logger::Process>("Process", rec, Logger::Process::none);
    fields.channel = logging::extract_or_default<Logger::SubProcess>("Channel", rec, Logger::SubProcess::none);
    fields.level = logging::extract_or_default<severity_t>("Severity", rec, severity_t::info);
    return fields;
}

void FormatSourceAndSeverity(const record_fields_t & fields, logging::formatting_ostream & strm) {
    strm << '[' << Logger::makeSourceTag(fields.process, fields.channel) << "] " << Logger::toString(fields.level);
}

void FormatTimeStamp(const logging::record_view & rec, logging::formatting_ostream & strm) {
    logging::value_ref<boost::posix_time::ptime> timeStamp = logging::extract<boost::posix_time::ptime>("TimeStamp", rec);
    if (timeStamp) {
        strm << boost::posix_time::to_iso_extended_string(timeStamp.get()) << ' ';
    }
}

//[unittest/receiver] INFO: message
void ConsoleFormatter(const logging::record_view & rec, logging::formatting_ostream & strm) {
    FormatSourceAndSeverity(ExtractFields(rec), strm);
    strm << ": " << rec[logging::expressions::smessage];
}

//2024-01-31T10:00:00.123456 [rftreceive/receiver] INFO: message
void TimeStampedFormatter(const logging::record_view & rec, logging::formatting_ostream & strm) {
    FormatTimeStamp(rec, strm);
    ConsoleFormatter(rec, strm);
}

//2024-01-31T10:00:00.123456 [rftreceive/receiver] ERROR TransferSession.cpp:42: message
void ErrorFileFormatter(const logging::record_view & rec, logging::formatting_ostream & strm) {
    FormatTimeStamp(rec, strm);
    FormatSourceAndSeverity(ExtractFields(rec), strm);
    logging::value_ref<std::string> file = logging::extract<std::string>("File", rec);
    logging::value_ref<int> line = logging::extract<int>("Line", rec);
    if (file && line) {
        strm << ' ' << boost::filesystem::path(file.get()).filename().string() << ':' << line.get();
    }
    strm << ": " << rec[logging::expressions::smessage];
}

bool IsBelowWarning(const logging::attribute_value_set & values) {
    return logging::extract_or_default<severity_t>("Severity", values, severity_t::info) < severity_t::warning;
}

bool IsAtLeastWarning(const logging::attribute_value_set & values) {
    return !IsBelowWarning(values);
}

bool IsAtLeastError(const logging::attribute_value_set & values) {
    return logging::extract_or_default<severity_t>("Severity", values, severity_t::info) >= severity_t::error;
}

bool IsChannel(const logging::attribute_value_set & values, Logger::SubProcess subprocess) {
    return logging::extract_or_default<Logger::SubProcess>("Channel", values, Logger::SubProcess::none) == subprocess;
}

bool IsProcess(const logging::attribute_value_set & values, Logger::Process process) {
    return logging::extract_or_default<Logger::Process>("Process", values, Logger::Process::none) == process;
}

boost::shared_ptr<file_sink_t> MakeFileSink(const std::string & baseName) {
    boost::shared_ptr<sinks::text_file_backend> backend = boost::make_shared<sinks::text_file_backend>(
        keywords::file_name = std::string(LOG_DIRECTORY) + baseName + "_%5N.log",
        keywords::rotation_size = FILE_ROTATION_SIZE_BYTES);
    backend->auto_flush(true);
    return boost::make_shared<file_sink_t>(backend);
}

#ifdef LOG_TO_CONSOLE
void AddConsoleSink(std::ostream & stream, bool (*filter)(const logging::attribute_value_set &)) {
    boost::shared_ptr<sinks::text_ostream_backend> backend = boost::make_shared<sinks::text_ostream_backend>();
    backend->add_stream(boost::shared_ptr<std::ostream>(&stream, boost::null_deleter()));
    backend->auto_flush(true);
    boost::shared_ptr<console_sink_t> sink = boost::make_shared<console_sink_t>(backend);
    sink->set_filter(filter);
    sink->set_formatter(&ConsoleFormatter);
    logging::core::get()->add_sink(sink);
}
#endif

#ifdef LOG_TO_SUBPROCESS_FILES
void AddSubProcessFileSink(Logger::SubProcess subprocess) {
    boost::shared_ptr<file_sink_t> sink = MakeFileSink(Logger::toString(subprocess));
    sink->set_filter(boost::bind(&IsChannel, boost::placeholders::_1, subprocess));
    sink->set_formatter(&TimeStampedFormatter);
    logging::core::get()->add_sink(sink);
}
#endif

#ifdef LOG_TO_PROCESS_FILE
void AddProcessFileSink(Logger::Process process) {
    boost::shared_ptr<file_sink_t> sink = MakeFileSink(Logger::toString(process));
    sink->set_filter(boost::bind(&IsProcess, boost::placeholders::_1, process));
    sink->set_formatter(&TimeStampedFormatter);
    logging::core::get()->add_sink(sink);
}
#endif

#ifdef LOG_TO_ERROR_FILE
void AddErrorFileSink() {
    boost::shared_ptr<file_sink_t> sink = MakeFileSink("errors");
    sink->set_filter(&IsAtLeastError);
    sink->set_formatter(&ErrorFileFormatter);
    logging::core::get()->add_sink(sink);
}
#endif

} //namespace

void Logger::installSinks() {
    boost::shared_ptr<logging::core> core = logging::core::get();
    core->add_global_attribute("TimeStamp", logging::attributes::local_clock());
    core->add_global_attribute("Process", ProcessAttribute());
#ifdef LOG_TO_CONSOLE
    AddConsoleSink(std::cout, &IsBelowWarning);
    AddConsoleSink(std::cerr, &IsAtLeastWarning);
#endif
#ifdef LOG_TO_SUBPROCESS_FILES
    AddSubProcessFileSink(SubProcess::receiver);
    AddSubProcessFileSink(SubProcess::sender);
#endif
#ifdef LOG_TO_ERROR_FILE
    AddErrorFileSink();
#endif
}

void Logger::ensureInitialized() {
    boost::call_once(g_sinksInstalledOnceFlag, &Logger::installSinks);
}

void Logger::initializeWithProcess(Process process) {
    ensureInitialized();
    ProcessAttribute().set(process);
#ifdef LOG_TO_PROCESS_FILE
    boost::call_once(g_processFileOnceFlag, boost::bind(&AddProcessFileSink, process));
#endif
    LOG_INFO(SubProcess::none) << "RFT version " << GetRftVersionAsString();
#ifdef RFT_COMMIT_SHA
    LOG_INFO(SubProcess::none) << "RFT git commit " << BOOST_PP_STRINGIZE(RFT_COMMIT_SHA);
#endif
}

Logger::Process Logger::getProcess() {
    return ProcessAttribute().get();
}

std::string Logger::toString(Process process) {
    switch (process) {
        case Process::rftreceive: return "rftreceive";
        case Process::rftsend: return "rftsend";
        case Process::unittest: return "unittest";
        case Process::none: break;
    }
    return "none";
}

std::string Logger::toString(SubProcess subprocess) {
    switch (subprocess) {
        case SubProcess::receiver: return "receiver";
        case SubProcess::sender: return "sender";
        case SubProcess::unittest: return "unittest";
        case SubProcess::none: break;
    }
    return "none";
}

std::string Logger::toString(boost::log::trivial::severity_level level) {
    switch (level) {
        case severity_t::trace: return "TRACE";
        case severity_t::debug: return "DEBUG";
        case severity_t::info: return "INFO";
        case severity_t::warning: return "WARNING";
        case severity_t::error: return "ERROR";
        case severity_t::fatal: return "FATAL";
    }
    return "UNKNOWN";
}

std::string Logger::makeSourceTag(Process process, SubProcess subprocess) {
    const std::string processName = toString(process);
    const std::string channelName = toString(subprocess);
    if (subprocess == SubProcess::none || channelName == processName) {
        return processName;
    }
    if (process == Process::none) {
        return channelName;
    }
    return processName + "/" + channelName;
}

const std::string& Logger::GetRftVersionAsString() {
    static const std::string versionString =
        boost::lexical_cast<std::string>(RFT_VERSION_MAJOR) + "." +
        boost::lexical_cast<std::string>(RFT_VERSION_MINOR) + "." +
        boost::lexical_cast<std::string>(RFT_VERSION_PATCH);
    return versionString;
}

} //namespace rft
