/**
 * @file ReceiverConfig.cpp
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

#include "ReceiverConfig.h"
#include "Logger.h"
#include <memory>
#include <limits>
#include <boost/foreach.hpp>
#include <boost/algorithm/string/case_conv.hpp>

static constexpr rft::Logger::SubProcess subprocess = rft::Logger::SubProcess::none;

constexpr uint64_t ReceiverConfig::MAX_FILENAME_LENGTH_CEILING;

ReceiverConfig::ReceiverConfig() :
    m_listenAddress("0.0.0.0"),
    m_listenPort(9999),
    m_receiveDirectory("received"),
    m_maxFileSizeBytes(100ULL * 1024 * 1024),
    m_allowedExtensions(),
    m_idleTimeoutSeconds(30),
    m_maxConcurrentSessions(16),
    m_maxFilenameLengthBytes(255),
    m_chunkSizeBytes(65536),
    m_progressRecordIntervalBytes(1024 * 1024),
    m_reservationStaleSeconds(0),
    m_numIoThreads(2) { }

ReceiverConfig::~ReceiverConfig() {
}

//a copy constructor: X(const X&)
ReceiverConfig::ReceiverConfig(const ReceiverConfig& o) :
    m_listenAddress(o.m_listenAddress),
    m_listenPort(o.m_listenPort),
    m_receiveDirectory(o.m_receiveDirectory),
    m_maxFileSizeBytes(o.m_maxFileSizeBytes),
    m_allowedExtensions(o.m_allowedExtensions),
    m_idleTimeoutSeconds(o.m_idleTimeoutSeconds),
    m_maxConcurrentSessions(o.m_maxConcurrentSessions),
    m_maxFilenameLengthBytes(o.m_maxFilenameLengthBytes),
    m_chunkSizeBytes(o.m_chunkSizeBytes),
    m_progressRecordIntervalBytes(o.m_progressRecordIntervalBytes),
    m_reservationStaleSeconds(o.m_reservationStaleSeconds),
    m_numIoThreads(o.m_numIoThreads) { }

//a move constructor: X(X&&)
ReceiverConfig::ReceiverConfig(ReceiverConfig&& o) noexcept :
    m_listenAddress(std::move(o.m_listenAddress)),
    m_listenPort(o.m_listenPort),
    m_receiveDirectory(std::move(o.m_receiveDirectory)),
    m_maxFileSizeBytes(o.m_maxFileSizeBytes),
    m_allowedExtensions(std::move(o.m_allowedExtensions)),
    m_idleTimeoutSeconds(o.m_idleTimeoutSeconds),
    m_maxConcurrentSessions(o.m_maxConcurrentSessions),
    m_maxFilenameLengthBytes(o.m_maxFilenameLengthBytes),
    m_chunkSizeBytes(o.m_chunkSizeBytes),
    m_progressRecordIntervalBytes(o.m_progressRecordIntervalBytes),
    m_reservationStaleSeconds(o.m_reservationStaleSeconds),
    m_numIoThreads(o.m_numIoThreads) { }

//a copy assignment: operator=(const X&)
ReceiverConfig& ReceiverConfig::operator=(const ReceiverConfig& o) {
    m_listenAddress = o.m_listenAddress;
    m_listenPort = o.m_listenPort;
    m_receiveDirectory = o.m_receiveDirectory;
    m_maxFileSizeBytes = o.m_maxFileSizeBytes;
    m_allowedExtensions = o.m_allowedExtensions;
    m_idleTimeoutSeconds = o.m_idleTimeoutSeconds;
    m_maxConcurrentSessions = o.m_maxConcurrentSessions;
    m_maxFilenameLengthBytes = o.m_maxFilenameLengthBytes;
    m_chunkSizeBytes = o.m_chunkSizeBytes;
    m_progressRecordIntervalBytes = o.m_progressRecordIntervalBytes;
    m_reservationStaleSeconds = o.m_reservationStaleSeconds;
    m_numIoThreads = o.m_numIoThreads;
    return *this;
}

//a move assignment: operator=(X&&)
ReceiverConfig& ReceiverConfig::operator=(ReceiverConfig&& o) noexcept {
    m_listenAddress = std::move(o.m_listenAddress);
    m_listenPort = o.m_listenPort;
    m_receiveDirectory = std::move(o.m_receiveDirectory);
    m_maxFileSizeBytes = o.m_maxFileSizeBytes;
    m_allowedExtensions = std::move(o.m_allowedExtensions);
    m_idleTimeoutSeconds = o.m_idleTimeoutSeconds;
    m_maxConcurrentSessions = o.m_maxConcurrentSessions;
    m_maxFilenameLengthBytes = o.m_maxFilenameLengthBytes;
    m_chunkSizeBytes = o.m_chunkSizeBytes;
    m_progressRecordIntervalBytes = o.m_progressRecordIntervalBytes;
    m_reservationStaleSeconds = o.m_reservationStaleSeconds;
    m_numIoThreads = o.m_numIoThreads;
    return *this;
}

bool ReceiverConfig::operator==(const ReceiverConfig & other) const {
    return
        (m_listenAddress == other.m_listenAddress) &&
        (m_listenPort == other.m_listenPort) &&
        (m_receiveDirectory == other.m_receiveDirectory) &&
        (m_maxFileSizeBytes == other.m_maxFileSizeBytes) &&
        (m_allowedExtensions == other.m_allowedExtensions) &&
        (m_idleTimeoutSeconds == other.m_idleTimeoutSeconds) &&
        (m_maxConcurrentSessions == other.m_maxConcurrentSessions) &&
        (m_maxFilenameLengthBytes == other.m_maxFilenameLengthBytes) &&
        (m_chunkSizeBytes == other.m_chunkSizeBytes) &&
        (m_progressRecordIntervalBytes == other.m_progressRecordIntervalBytes) &&
        (m_reservationStaleSeconds == other.m_reservationStaleSeconds) &&
        (m_numIoThreads == other.m_numIoThreads);
}

std::string ReceiverConfig::NormalizeExtension(const std::string & extension) {
    std::string ext(extension);
    if ((!ext.empty()) && (ext[0] == '.')) {
        ext.erase(0, 1);
    }
    boost::algorithm::to_lower(ext);
    return ext;
}

bool ReceiverConfig::AddAllowedExtension(const std::string & extension) {
    const std::string ext = NormalizeExtension(extension);
    if (ext.empty()) {
        return false;
    }
    return m_allowedExtensions.insert(ext).second;
}

bool ReceiverConfig::IsValid() const {
    if (m_listenAddress.empty()) {
        LOG_ERROR(subprocess) << "invalid receiver config: listenAddress must be defined";
        return false;
    }
    if (m_listenPort == 0) {
        LOG_ERROR(subprocess) << "invalid receiver config: listenPort must be non-zero";
        return false;
    }
    if (m_receiveDirectory.empty()) {
        LOG_ERROR(subprocess) << "invalid receiver config: receiveDirectory must be defined";
        return false;
    }
    if (m_maxFileSizeBytes == 0) {
        LOG_ERROR(subprocess) << "invalid receiver config: maxFileSizeBytes must be non-zero";
        return false;
    }
    if (m_idleTimeoutSeconds == 0) {
        LOG_ERROR(subprocess) << "invalid receiver config: idleTimeoutSeconds must be non-zero";
        return false;
    }
    if (m_maxConcurrentSessions == 0) {
        LOG_ERROR(subprocess) << "invalid receiver config: maxConcurrentSessions must be at least 1";
        return false;
    }
    if ((m_maxFilenameLengthBytes == 0) || (m_maxFilenameLengthBytes > MAX_FILENAME_LENGTH_CEILING)) {
        LOG_ERROR(subprocess) << "invalid receiver config: maxFilenameLengthBytes ("
            << m_maxFilenameLengthBytes << ") must be in the range [1, " << MAX_FILENAME_LENGTH_CEILING << "]";
        return false;
    }
    if (m_chunkSizeBytes == 0) {
        LOG_ERROR(subprocess) << "invalid receiver config: chunkSizeBytes must be non-zero";
        return false;
    }
    if (m_progressRecordIntervalBytes == 0) {
        LOG_ERROR(subprocess) << "invalid receiver config: progressRecordIntervalBytes must be non-zero";
        return false;
    }
    if (m_numIoThreads == 0) {
        LOG_ERROR(subprocess) << "invalid receiver config: numIoThreads must be at least 1";
        return false;
    }
    return true;
}

bool ReceiverConfig::SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) {
    try {
        m_listenAddress = pt.get<std::string>("listenAddress");
        const uint64_t listenPort = pt.get<uint64_t>("listenPort");
        if (listenPort > std::numeric_limits<uint16_t>::max()) {
            LOG_ERROR(subprocess) << "error parsing JSON Receiver config: listenPort (" << listenPort << ") is out of range";
            return false;
        }
        m_listenPort = static_cast<uint16_t>(listenPort);
        m_receiveDirectory = pt.get<std::string>("receiveDirectory");
        m_maxFileSizeBytes = pt.get<uint64_t>("maxFileSizeBytes");
        m_idleTimeoutSeconds = pt.get<uint64_t>("idleTimeoutSeconds");
        m_maxConcurrentSessions = pt.get<uint64_t>("maxConcurrentSessions");
        m_maxFilenameLengthBytes = pt.get<uint64_t>("maxFilenameLengthBytes");
        m_chunkSizeBytes = pt.get<uint64_t>("chunkSizeBytes");
        m_progressRecordIntervalBytes = pt.get<uint64_t>("progressRecordIntervalBytes");
        m_reservationStaleSeconds = pt.get<uint64_t>("reservationStaleSeconds");
        m_numIoThreads = pt.get<uint64_t>("numIoThreads");
    }
    catch (const boost::property_tree::ptree_error & e) {
        LOG_ERROR(subprocess) << "error parsing JSON Receiver config: " << e.what();
        return false;
    }

    //for non-throw versions of get_child which return a reference to the second parameter
    static const boost::property_tree::ptree EMPTY_PTREE;

    const boost::property_tree::ptree & allowedExtensionsPt = pt.get_child("allowedExtensions", EMPTY_PTREE); //non-throw version
    m_allowedExtensions.clear();
    BOOST_FOREACH(const boost::property_tree::ptree::value_type & allowedExtensionValuePt, allowedExtensionsPt) {
        const std::string extension = allowedExtensionValuePt.second.get_value<std::string>();
        if (NormalizeExtension(extension).empty()) {
            LOG_ERROR(subprocess) << "error parsing JSON Receiver config: allowedExtensions contains an empty extension";
            return false;
        }
        else if (!AddAllowedExtension(extension)) { //not inserted
            LOG_ERROR(subprocess) << "error parsing JSON Receiver config: duplicate allowed extension " << extension;
            return false;
        }
    }

    return IsValid();
}

ReceiverConfig_ptr ReceiverConfig::CreateFromJson(const std::string& jsonString, bool verifyNoUnusedJsonKeys) {
    boost::property_tree::ptree pt;
    ReceiverConfig_ptr config; //NULL
    if (GetPropertyTreeFromJsonString(jsonString, pt)) { //prints message if failed
        config = CreateFromPtree(pt);
        //verify that there are no unused variables within the original json
        if (config && verifyNoUnusedJsonKeys) {
            std::string returnedErrorMessage;
            if (JsonSerializable::HasUnusedJsonVariablesInString(*config, jsonString, returnedErrorMessage)) {
                LOG_ERROR(subprocess) << returnedErrorMessage;
                config.reset(); //NULL
            }
        }
    }
    return config;
}

ReceiverConfig_ptr ReceiverConfig::CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath, bool verifyNoUnusedJsonKeys) {
    boost::property_tree::ptree pt;
    ReceiverConfig_ptr config; //NULL
    if (GetPropertyTreeFromJsonFilePath(jsonFilePath, pt)) { //prints message if failed
        config = CreateFromPtree(pt);
        //verify that there are no unused variables within the original json
        if (config && verifyNoUnusedJsonKeys) {
            std::string returnedErrorMessage;
            if (JsonSerializable::HasUnusedJsonVariablesInFilePath(*config, jsonFilePath, returnedErrorMessage)) {
                LOG_ERROR(subprocess) << returnedErrorMessage;
                config.reset(); //NULL
            }
        }
    }
    return config;
}

ReceiverConfig_ptr ReceiverConfig::CreateFromPtree(const boost::property_tree::ptree & pt) {
    ReceiverConfig_ptr ptrReceiverConfig = std::make_shared<ReceiverConfig>();
    if (!ptrReceiverConfig->SetValuesFromPropertyTree(pt)) {
        ptrReceiverConfig = ReceiverConfig_ptr(); //failed, so delete and set it NULL
    }
    return ptrReceiverConfig;
}

boost::property_tree::ptree ReceiverConfig::GetNewPropertyTree() const {
    boost::property_tree::ptree pt;
    pt.put("listenAddress", m_listenAddress);
    pt.put("listenPort", m_listenPort);
    pt.put("receiveDirectory", m_receiveDirectory);
    pt.put("maxFileSizeBytes", m_maxFileSizeBytes);
    boost::property_tree::ptree & allowedExtensionsPt = pt.put_child("allowedExtensions",
        m_allowedExtensions.empty() ? boost::property_tree::ptree("[]") : boost::property_tree::ptree());
    for (std::set<std::string>::const_iterator allowedExtensionsIt = m_allowedExtensions.cbegin();
        allowedExtensionsIt != m_allowedExtensions.cend(); ++allowedExtensionsIt)
    {
        allowedExtensionsPt.push_back(std::make_pair("", boost::property_tree::ptree(*allowedExtensionsIt))); //using "" as key creates json array
    }
    pt.put("idleTimeoutSeconds", m_idleTimeoutSeconds);
    pt.put("maxConcurrentSessions", m_maxConcurrentSessions);
    pt.put("maxFilenameLengthBytes", m_maxFilenameLengthBytes);
    pt.put("chunkSizeBytes", m_chunkSizeBytes);
    pt.put("progressRecordIntervalBytes", m_progressRecordIntervalBytes);
    pt.put("reservationStaleSeconds", m_reservationStaleSeconds);
    pt.put("numIoThreads", m_numIoThreads);
    return pt;
}
