/**
 * @file ReservationRecord.cpp
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

#include "ReservationRecord.h"
#include "Logger.h"
#include <boost/filesystem/operations.hpp>
#include <boost/date_time/posix_time/posix_time.hpp>

static constexpr rft::Logger::SubProcess subprocess = rft::Logger::SubProcess::receiver;

ReservationRecord::ReservationRecord() :
    m_finalName(""),
    m_requestedName(""),
    m_declaredSize(0),
    m_bytesReceived(0),
    m_createdSecondsSinceEpoch(0),
    m_lastUpdateSecondsSinceEpoch(0) { }

ReservationRecord::ReservationRecord(const std::string & finalName, const std::string & requestedName, uint64_t declaredSize) :
    m_finalName(finalName),
    m_requestedName(requestedName),
    m_declaredSize(declaredSize),
    m_bytesReceived(0),
    m_createdSecondsSinceEpoch(GetSecondsSinceEpochNow()),
    m_lastUpdateSecondsSinceEpoch(m_createdSecondsSinceEpoch) { }

ReservationRecord::~ReservationRecord() { }

//a copy constructor: X(const X&)
ReservationRecord::ReservationRecord(const ReservationRecord& o) :
    m_finalName(o.m_finalName),
    m_requestedName(o.m_requestedName),
    m_declaredSize(o.m_declaredSize),
    m_bytesReceived(o.m_bytesReceived),
    m_createdSecondsSinceEpoch(o.m_createdSecondsSinceEpoch),
    m_lastUpdateSecondsSinceEpoch(o.m_lastUpdateSecondsSinceEpoch) { }

//a move constructor: X(X&&)
ReservationRecord::ReservationRecord(ReservationRecord&& o) noexcept :
    m_finalName(std::move(o.m_finalName)),
    m_requestedName(std::move(o.m_requestedName)),
    m_declaredSize(o.m_declaredSize),
    m_bytesReceived(o.m_bytesReceived),
    m_createdSecondsSinceEpoch(o.m_createdSecondsSinceEpoch),
    m_lastUpdateSecondsSinceEpoch(o.m_lastUpdateSecondsSinceEpoch) { }

//a copy assignment: operator=(const X&)
ReservationRecord& ReservationRecord::operator=(const ReservationRecord& o) {
    m_finalName = o.m_finalName;
    m_requestedName = o.m_requestedName;
    m_declaredSize = o.m_declaredSize;
    m_bytesReceived = o.m_bytesReceived;
    m_createdSecondsSinceEpoch = o.m_createdSecondsSinceEpoch;
    m_lastUpdateSecondsSinceEpoch = o.m_lastUpdateSecondsSinceEpoch;
    return *this;
}

//a move assignment: operator=(X&&)
ReservationRecord& ReservationRecord::operator=(ReservationRecord&& o) noexcept {
    m_finalName = std::move(o.m_finalName);
    m_requestedName = std::move(o.m_requestedName);
    m_declaredSize = o.m_declaredSize;
    m_bytesReceived = o.m_bytesReceived;
    m_createdSecondsSinceEpoch = o.m_createdSecondsSinceEpoch;
    m_lastUpdateSecondsSinceEpoch = o.m_lastUpdateSecondsSinceEpoch;
    return *this;
}

bool ReservationRecord::operator==(const ReservationRecord & other) const {
    return
        (m_finalName == other.m_finalName) &&
        (m_requestedName == other.m_requestedName) &&
        (m_declaredSize == other.m_declaredSize) &&
        (m_bytesReceived == other.m_bytesReceived) &&
        (m_createdSecondsSinceEpoch == other.m_createdSecondsSinceEpoch) &&
        (m_lastUpdateSecondsSinceEpoch == other.m_lastUpdateSecondsSinceEpoch);
}

uint64_t ReservationRecord::GetSecondsSinceEpochNow() {
    static const boost::posix_time::ptime EPOCH(boost::gregorian::date(1970, 1, 1));
    const boost::posix_time::time_duration diff = boost::posix_time::second_clock::universal_time() - EPOCH;
    return static_cast<uint64_t>(diff.total_seconds());
}

void ReservationRecord::Touch() {
    m_lastUpdateSecondsSinceEpoch = GetSecondsSinceEpochNow();
}

uint64_t ReservationRecord::GetAgeSeconds(uint64_t nowSecondsSinceEpoch) const {
    return (nowSecondsSinceEpoch > m_lastUpdateSecondsSinceEpoch) ? (nowSecondsSinceEpoch - m_lastUpdateSecondsSinceEpoch) : 0;
}

bool ReservationRecord::SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) {
    try {
        m_finalName = pt.get<std::string>("finalName");
        m_requestedName = pt.get<std::string>("requestedName");
        m_declaredSize = pt.get<uint64_t>("declaredSize");
        m_bytesReceived = pt.get<uint64_t>("bytesReceived");
        m_createdSecondsSinceEpoch = pt.get<uint64_t>("createdSecondsSinceEpoch");
        m_lastUpdateSecondsSinceEpoch = pt.get<uint64_t>("lastUpdateSecondsSinceEpoch");
    }
    catch (const boost::property_tree::ptree_error & e) {
        LOG_ERROR(subprocess) << "error parsing JSON reservation record: " << e.what();
        return false;
    }
    if (m_finalName.empty()) {
        LOG_ERROR(subprocess) << "error parsing JSON reservation record: finalName must be defined";
        return false;
    }
    if (m_bytesReceived > m_declaredSize) {
        LOG_ERROR(subprocess) << "error parsing JSON reservation record: bytesReceived (" << m_bytesReceived
            << ") exceeds declaredSize (" << m_declaredSize << ")";
        return false;
    }
    return true;
}

ReservationRecord_ptr ReservationRecord::CreateFromPtree(const boost::property_tree::ptree & pt) {
    ReservationRecord_ptr ptrRecord = std::make_shared<ReservationRecord>();
    if (!ptrRecord->SetValuesFromPropertyTree(pt)) {
        ptrRecord = ReservationRecord_ptr(); //failed, so delete and set it NULL
    }
    return ptrRecord;
}

ReservationRecord_ptr ReservationRecord::CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath) {
    boost::property_tree::ptree pt;
    ReservationRecord_ptr record; //NULL
    if (GetPropertyTreeFromJsonFilePath(jsonFilePath, pt)) { //prints message if failed
        record = CreateFromPtree(pt);
    }
    return record;
}

boost::property_tree::ptree ReservationRecord::GetNewPropertyTree() const {
    boost::property_tree::ptree pt;
    pt.put("finalName", m_finalName);
    pt.put("requestedName", m_requestedName);
    pt.put("declaredSize", m_declaredSize);
    pt.put("bytesReceived", m_bytesReceived);
    pt.put("createdSecondsSinceEpoch", m_createdSecondsSinceEpoch);
    pt.put("lastUpdateSecondsSinceEpoch", m_lastUpdateSecondsSinceEpoch);
    return pt;
}

bool ReservationRecord::WriteAtomically(const boost::filesystem::path & recordFilePath) const {
    boost::filesystem::path tmpPath(recordFilePath);
    tmpPath += ".tmp";
    if (!ToJsonFile(tmpPath)) { //prints message if failed
        return false;
    }
    boost::system::error_code ec;
    boost::filesystem::rename(tmpPath, recordFilePath, ec);
    if (ec) {
        LOG_ERROR(subprocess) << "unable to replace reservation record " << recordFilePath << ": " << ec.message();
        boost::filesystem::remove(tmpPath, ec);
        return false;
    }
    return true;
}
