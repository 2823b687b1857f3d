/**
 * @file ReservationStore.cpp
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

#include "ReservationStore.h"
#include "NameResolver.h"
#include "Logger.h"
#include "Utf8Paths.h"
#include <boost/filesystem/operations.hpp>
#include <boost/filesystem/fstream.hpp>
#include <boost/bind/bind.hpp>
#include <set>

static constexpr rft::Logger::SubProcess subprocess = rft::Logger::SubProcess::receiver;

const std::string ReservationStore::PARTIAL_DIRECTORY_NAME(".rft_partial");
const std::string ReservationStore::PARTIAL_FILE_EXTENSION(".part");
const std::string ReservationStore::RECORD_FILE_EXTENSION(".reservation");

static const char * const RESERVATION_STATUS_STRINGS[] = {
    "SUCCESS",
    "UNKNOWN_TRANSFER",
    "CONFLICT",
    "SIZE_MISMATCH",
    "OFFSET_MISMATCH",
    "NAME_EXHAUSTED",
    "IO_FAILURE"
};

const char * ReservationStatusToString(RESERVATION_STATUS status) {
    return RESERVATION_STATUS_STRINGS[static_cast<unsigned int>(status)];
}

static bool EndsWith(const std::string & s, const std::string & suffix) {
    return (s.size() >= suffix.size()) && (s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0);
}

ReservationStore::ReservationStore(const boost::filesystem::path & receiveDirectory) :
    M_RECEIVE_DIRECTORY(receiveDirectory),
    M_PARTIAL_DIRECTORY(receiveDirectory / PARTIAL_DIRECTORY_NAME)
{
}

ReservationStore::~ReservationStore() {}

const boost::filesystem::path & ReservationStore::GetReceiveDirectory() const {
    return M_RECEIVE_DIRECTORY;
}

const boost::filesystem::path & ReservationStore::GetPartialDirectory() const {
    return M_PARTIAL_DIRECTORY;
}

boost::filesystem::path ReservationStore::GetPartialFilePath(const std::string & finalName) const {
    return M_PARTIAL_DIRECTORY / Utf8Paths::Utf8StringToPath(finalName + PARTIAL_FILE_EXTENSION);
}

boost::filesystem::path ReservationStore::GetRecordFilePath(const std::string & finalName) const {
    return M_PARTIAL_DIRECTORY / Utf8Paths::Utf8StringToPath(finalName + RECORD_FILE_EXTENSION);
}

boost::filesystem::path ReservationStore::GetFinalFilePath(const std::string & finalName) const {
    return M_RECEIVE_DIRECTORY / Utf8Paths::Utf8StringToPath(finalName);
}

bool ReservationStore::Init() {
    boost::mutex::scoped_lock lock(m_mutex);
    boost::system::error_code ec;
    for (unsigned int i = 0; i < 2; ++i) {
        const boost::filesystem::path & dir = (i == 0) ? M_RECEIVE_DIRECTORY : M_PARTIAL_DIRECTORY;
        if (!boost::filesystem::is_directory(dir, ec)) {
            if (!boost::filesystem::create_directories(dir, ec)) {
                LOG_ERROR(subprocess) << "unable to create directory " << dir << ": " << ec.message();
                return false;
            }
            LOG_INFO(subprocess) << "created directory " << dir;
        }
    }
    ReloadFromDisk_NotThreadSafe();
    return true;
}

void ReservationStore::ReloadFromDisk_NotThreadSafe() {
    m_reservations.clear();
    std::set<boost::filesystem::path> recordPaths;
    std::set<boost::filesystem::path> partialPaths;
    boost::system::error_code ec;
    for (boost::filesystem::directory_iterator it(M_PARTIAL_DIRECTORY, ec), end; (!ec) && (it != end); it.increment(ec)) {
        const boost::filesystem::path & p = it->path();
        const std::string filenameUtf8 = Utf8Paths::PathToUtf8String(p.filename());
        if (EndsWith(filenameUtf8, RECORD_FILE_EXTENSION)) {
            recordPaths.insert(p);
        }
        else if (EndsWith(filenameUtf8, PARTIAL_FILE_EXTENSION)) {
            partialPaths.insert(p);
        }
        else {
            //leftover temporary record from an interrupted write
            LOG_WARNING(subprocess) << "removing stray file " << p;
            boost::system::error_code ecRemove;
            boost::filesystem::remove(p, ecRemove);
        }
    }
    if (ec) {
        LOG_ERROR(subprocess) << "error scanning " << M_PARTIAL_DIRECTORY << ": " << ec.message();
    }

    for (std::set<boost::filesystem::path>::const_iterator it = recordPaths.cbegin(); it != recordPaths.cend(); ++it) {
        const boost::filesystem::path & recordPath = *it;
        ReservationRecord_ptr recordPtr = ReservationRecord::CreateFromJsonFilePath(recordPath);
        if ((!recordPtr) || (GetRecordFilePath(recordPtr->m_finalName) != recordPath)) {
            LOG_WARNING(subprocess) << "discarding unreadable reservation record " << recordPath;
            boost::system::error_code ecRemove;
            boost::filesystem::remove(recordPath, ecRemove);
            continue;
        }
        ReservationRecord & record = *recordPtr;
        const boost::filesystem::path partialPath = GetPartialFilePath(record.m_finalName);
        boost::system::error_code ecSize;
        const uintmax_t partialSize = boost::filesystem::file_size(partialPath, ecSize);
        if (ecSize) {
            LOG_WARNING(subprocess) << "discarding reservation " << Utf8Paths::ToPrintableString(record.m_finalName)
                << " because its partial file is not readable: " << ecSize.message();
            boost::system::error_code ecRemove;
            boost::filesystem::remove(recordPath, ecRemove);
            continue;
        }
        partialPaths.erase(partialPath);
        if (partialSize < record.m_bytesReceived) {
            LOG_WARNING(subprocess) << "reservation " << Utf8Paths::ToPrintableString(record.m_finalName)
                << " recorded " << record.m_bytesReceived << " bytes but the partial file holds " << partialSize
                << ", lowering recorded progress";
            record.m_bytesReceived = static_cast<uint64_t>(partialSize);
            if (!record.WriteAtomically(recordPath)) {
                continue;
            }
        }
        reservation_entry_t & entry = m_reservations[record.m_finalName];
        entry.record = std::move(record);
        entry.active = false;
        LOG_INFO(subprocess) << "reloaded paused reservation " << Utf8Paths::ToPrintableString(entry.record.m_finalName)
            << " (" << entry.record.m_bytesReceived << " of " << entry.record.m_declaredSize << " bytes)";
    }

    //partial files left without a record cannot be resumed
    for (std::set<boost::filesystem::path>::const_iterator it = partialPaths.cbegin(); it != partialPaths.cend(); ++it) {
        LOG_WARNING(subprocess) << "removing orphaned partial file " << *it;
        boost::system::error_code ecRemove;
        boost::filesystem::remove(*it, ecRemove);
    }
}

bool ReservationStore::IsReserved_NotThreadSafe(const std::string & candidateName) const {
    return (m_reservations.count(candidateName) != 0);
}

RESERVATION_STATUS ReservationStore::ReserveFresh(const std::string & sanitizedName, uint64_t declaredSize, std::string & finalName) {
    boost::mutex::scoped_lock lock(m_mutex);
    std::string resolvedName;
    if (!NameResolver::Resolve(M_RECEIVE_DIRECTORY, sanitizedName,
        boost::bind(&ReservationStore::IsReserved_NotThreadSafe, this, boost::placeholders::_1), resolvedName))
    {
        return RESERVATION_STATUS::NAME_EXHAUSTED;
    }

    const boost::filesystem::path partialPath = GetPartialFilePath(resolvedName);
    {
        boost::filesystem::ofstream ofs(partialPath, std::ios::out | std::ios::binary | std::ios::trunc);
        if (!ofs.good()) {
            LOG_ERROR(subprocess) << "unable to create partial file " << partialPath;
            return RESERVATION_STATUS::IO_FAILURE;
        }
    }
    ReservationRecord record(resolvedName, sanitizedName, declaredSize);
    if (!record.WriteAtomically(GetRecordFilePath(resolvedName))) {
        boost::system::error_code ec;
        boost::filesystem::remove(partialPath, ec);
        return RESERVATION_STATUS::IO_FAILURE;
    }
    reservation_entry_t & entry = m_reservations[resolvedName];
    entry.record = std::move(record);
    entry.active = true;
    finalName = resolvedName;
    return RESERVATION_STATUS::SUCCESS;
}

RESERVATION_STATUS ReservationStore::AcquireForResume(const std::string & finalName, uint64_t declaredSize,
    uint64_t resumeOffset, uint64_t & recordedBytesReceived)
{
    boost::mutex::scoped_lock lock(m_mutex);
    reservation_map_t::iterator it = m_reservations.find(finalName);
    if (it == m_reservations.end()) {
        return RESERVATION_STATUS::UNKNOWN_TRANSFER;
    }
    reservation_entry_t & entry = it->second;
    recordedBytesReceived = entry.record.m_bytesReceived;
    if (entry.active) {
        return RESERVATION_STATUS::CONFLICT;
    }
    if (entry.record.m_declaredSize != declaredSize) {
        return RESERVATION_STATUS::SIZE_MISMATCH;
    }
    if (entry.record.m_bytesReceived != resumeOffset) {
        return RESERVATION_STATUS::OFFSET_MISMATCH;
    }
    return Activate_NotThreadSafe(finalName, entry, resumeOffset, recordedBytesReceived);
}

RESERVATION_STATUS ReservationStore::AcquireUnstarted(const std::string & finalName, uint64_t declaredSize) {
    boost::mutex::scoped_lock lock(m_mutex);
    reservation_map_t::iterator it = m_reservations.find(finalName);
    if ((it == m_reservations.end()) || it->second.active
        || (it->second.record.m_bytesReceived != 0) || (it->second.record.m_declaredSize != declaredSize))
    {
        return RESERVATION_STATUS::UNKNOWN_TRANSFER;
    }
    uint64_t recordedBytesReceived = 0;
    return Activate_NotThreadSafe(finalName, it->second, 0, recordedBytesReceived);
}

RESERVATION_STATUS ReservationStore::Activate_NotThreadSafe(const std::string & finalName,
    reservation_entry_t & entry, uint64_t resumeOffset, uint64_t & recordedBytesReceived)
{
    const boost::filesystem::path partialPath = GetPartialFilePath(finalName);
    boost::system::error_code ec;
    const uintmax_t partialSize = boost::filesystem::file_size(partialPath, ec);
    if (ec) {
        LOG_ERROR(subprocess) << "unable to stat partial file " << partialPath << ": " << ec.message();
        return RESERVATION_STATUS::IO_FAILURE;
    }
    if (partialSize < resumeOffset) {
        //the partial file was shortened behind our back, report the progress actually on disk
        LOG_ERROR(subprocess) << "partial file " << partialPath << " holds " << partialSize
            << " bytes, fewer than the recorded " << resumeOffset;
        entry.record.m_bytesReceived = static_cast<uint64_t>(partialSize);
        entry.record.Touch();
        recordedBytesReceived = entry.record.m_bytesReceived;
        if (!entry.record.WriteAtomically(GetRecordFilePath(finalName))) {
            return RESERVATION_STATUS::IO_FAILURE;
        }
        return RESERVATION_STATUS::OFFSET_MISMATCH;
    }
    if (partialSize > resumeOffset) {
        //bytes written after the last recorded progress are not trusted
        boost::filesystem::resize_file(partialPath, resumeOffset, ec);
        if (ec) {
            LOG_ERROR(subprocess) << "unable to truncate partial file " << partialPath << ": " << ec.message();
            return RESERVATION_STATUS::IO_FAILURE;
        }
        LOG_INFO(subprocess) << "truncated " << (partialSize - resumeOffset) << " unrecorded bytes from " << partialPath;
    }
    entry.active = true;
    entry.record.Touch();
    return RESERVATION_STATUS::SUCCESS;
}

bool ReservationStore::RecordProgress(const std::string & finalName, uint64_t bytesReceived) {
    boost::mutex::scoped_lock lock(m_mutex);
    reservation_map_t::iterator it = m_reservations.find(finalName);
    if (it == m_reservations.end()) {
        LOG_ERROR(subprocess) << "RecordProgress: no reservation for " << Utf8Paths::ToPrintableString(finalName);
        return false;
    }
    ReservationRecord & record = it->second.record;
    if (bytesReceived > record.m_declaredSize) {
        LOG_ERROR(subprocess) << "RecordProgress: " << bytesReceived << " bytes exceeds declared size " << record.m_declaredSize;
        return false;
    }
    ReservationRecord updated(record);
    updated.m_bytesReceived = bytesReceived;
    updated.Touch();
    if (!updated.WriteAtomically(GetRecordFilePath(finalName))) {
        return false;
    }
    record = std::move(updated);
    return true;
}

void ReservationStore::Release(const std::string & finalName) {
    boost::mutex::scoped_lock lock(m_mutex);
    reservation_map_t::iterator it = m_reservations.find(finalName);
    if (it != m_reservations.end()) {
        it->second.active = false;
    }
}

bool ReservationStore::RemoveFiles_NotThreadSafe(const std::string & finalName) {
    bool success = true;
    boost::system::error_code ec;
    boost::filesystem::remove(GetPartialFilePath(finalName), ec);
    if (ec) {
        LOG_ERROR(subprocess) << "unable to remove partial file of " << Utf8Paths::ToPrintableString(finalName) << ": " << ec.message();
        success = false;
    }
    boost::filesystem::remove(GetRecordFilePath(finalName), ec);
    if (ec) {
        LOG_ERROR(subprocess) << "unable to remove reservation record of " << Utf8Paths::ToPrintableString(finalName) << ": " << ec.message();
        success = false;
    }
    return success;
}

bool ReservationStore::Finalize(const std::string & finalName, std::string & publishedName) {
    boost::mutex::scoped_lock lock(m_mutex);
    reservation_map_t::iterator it = m_reservations.find(finalName);
    if (it == m_reservations.end()) {
        LOG_ERROR(subprocess) << "Finalize: no reservation for " << Utf8Paths::ToPrintableString(finalName);
        return false;
    }
    std::string targetName = finalName;
    if (NameResolver::IsOccupied(GetFinalFilePath(targetName))) {
        //our own name is still in the map so the resolver skips it
        if (!NameResolver::Resolve(M_RECEIVE_DIRECTORY, finalName,
            boost::bind(&ReservationStore::IsReserved_NotThreadSafe, this, boost::placeholders::_1), targetName))
        {
            return false;
        }
        LOG_WARNING(subprocess) << "a file appeared at " << Utf8Paths::ToPrintableString(finalName)
            << " during the transfer, publishing as " << Utf8Paths::ToPrintableString(targetName) << " instead";
    }
    boost::system::error_code ec;
    boost::filesystem::rename(GetPartialFilePath(finalName), GetFinalFilePath(targetName), ec);
    if (ec) {
        LOG_ERROR(subprocess) << "unable to publish " << Utf8Paths::ToPrintableString(targetName) << ": " << ec.message();
        return false;
    }
    boost::filesystem::remove(GetRecordFilePath(finalName), ec);
    if (ec) {
        LOG_ERROR(subprocess) << "unable to remove reservation record of " << Utf8Paths::ToPrintableString(finalName) << ": " << ec.message();
    }
    m_reservations.erase(it);
    publishedName = targetName;
    return true;
}

bool ReservationStore::Abandon(const std::string & finalName) {
    boost::mutex::scoped_lock lock(m_mutex);
    reservation_map_t::iterator it = m_reservations.find(finalName);
    if (it == m_reservations.end()) {
        return false;
    }
    const bool success = RemoveFiles_NotThreadSafe(finalName);
    m_reservations.erase(it);
    return success;
}

std::size_t ReservationStore::PurgeStaleReservations(uint64_t maxAgeSeconds) {
    if (maxAgeSeconds == 0) {
        return 0;
    }
    const uint64_t now = ReservationRecord::GetSecondsSinceEpochNow();
    std::size_t numPurged = 0;
    boost::mutex::scoped_lock lock(m_mutex);
    for (reservation_map_t::iterator it = m_reservations.begin(); it != m_reservations.end(); ) {
        const reservation_entry_t & entry = it->second;
        if ((!entry.active) && (entry.record.GetAgeSeconds(now) > maxAgeSeconds)) {
            LOG_INFO(subprocess) << "purging stale reservation " << Utf8Paths::ToPrintableString(it->first)
                << " (" << entry.record.m_bytesReceived << " of " << entry.record.m_declaredSize << " bytes, idle "
                << entry.record.GetAgeSeconds(now) << "s)";
            RemoveFiles_NotThreadSafe(it->first);
            it = m_reservations.erase(it);
            ++numPurged;
        }
        else {
            ++it;
        }
    }
    return numPurged;
}

bool ReservationStore::IsReserved(const std::string & finalName) const {
    boost::mutex::scoped_lock lock(m_mutex);
    return IsReserved_NotThreadSafe(finalName);
}

bool ReservationStore::IsActive(const std::string & finalName) const {
    boost::mutex::scoped_lock lock(m_mutex);
    reservation_map_t::const_iterator it = m_reservations.find(finalName);
    return (it != m_reservations.cend()) && it->second.active;
}

bool ReservationStore::GetRecord(const std::string & finalName, ReservationRecord & record) const {
    boost::mutex::scoped_lock lock(m_mutex);
    reservation_map_t::const_iterator it = m_reservations.find(finalName);
    if (it == m_reservations.cend()) {
        return false;
    }
    record = it->second.record;
    return true;
}

std::size_t ReservationStore::GetNumReservations() const {
    boost::mutex::scoped_lock lock(m_mutex);
    return m_reservations.size();
}

void ReservationStore::GetReservedNames(std::vector<std::string> & names) const {
    boost::mutex::scoped_lock lock(m_mutex);
    names.clear();
    names.reserve(m_reservations.size());
    for (reservation_map_t::const_iterator it = m_reservations.cbegin(); it != m_reservations.cend(); ++it) {
        names.push_back(it->first);
    }
}
