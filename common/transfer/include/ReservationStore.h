/**
 * @file ReservationStore.h
 *
 * @copyright Copyright © 2021 United States Government as represented by
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
 * The ReservationStore class owns the namespace of one receive directory:
 * the finalized files plus every reserved (in-progress or paused) final name.
 * All naming and reservation decisions go through a single mutex so that two
 * concurrent uploads of the same name always receive distinct final names,
 * and so that at most one session holds a given reservation at a time.
 *
 * On-disk layout (inside the receive directory):
 *   .rft_partial/<finalName>.part          partial bytes of an unfinished transfer
 *   .rft_partial/<finalName>.reservation   JSON ReservationRecord
 * Finalized files are moved to <receiveDirectory>/<finalName>.
 */

#ifndef RESERVATION_STORE_H
#define RESERVATION_STORE_H 1

#include <cstdint>
#include <string>
#include <map>
#include <vector>
#include <boost/filesystem/path.hpp>
#include <boost/thread/mutex.hpp>
#include "ReservationRecord.h"
#include "rft_transfer_export.h"

enum class RESERVATION_STATUS {
    SUCCESS = 0,
    UNKNOWN_TRANSFER,
    CONFLICT,
    SIZE_MISMATCH,
    OFFSET_MISMATCH,
    NAME_EXHAUSTED,
    IO_FAILURE
};

RFT_TRANSFER_EXPORT const char * ReservationStatusToString(RESERVATION_STATUS status);

class ReservationStore {
public:
    RFT_TRANSFER_EXPORT static const std::string PARTIAL_DIRECTORY_NAME;
    RFT_TRANSFER_EXPORT static const std::string PARTIAL_FILE_EXTENSION;
    RFT_TRANSFER_EXPORT static const std::string RECORD_FILE_EXTENSION;

    RFT_TRANSFER_EXPORT ReservationStore(const boost::filesystem::path & receiveDirectory);
    RFT_TRANSFER_EXPORT ~ReservationStore();

    /** Create the receive and partial directories and reload persisted reservations.
     *
     * Reloaded records are reconciled against their partial files, records whose
     * partial file is missing are discarded, as are partial files without a record.
     * @return True if the directories are usable, or False otherwise.
     */
    RFT_TRANSFER_EXPORT bool Init();

    /** Resolve a collision-free final name and reserve it for a fresh transfer.
     *
     * Creates an empty partial file and its record.  The reservation is returned active
     * (held by the caller) and must be ended with Release, Finalize, or Abandon.
     */
    RFT_TRANSFER_EXPORT RESERVATION_STATUS ReserveFresh(const std::string & sanitizedName, uint64_t declaredSize, std::string & finalName);

    /** Acquire an existing paused reservation to resume it.
     *
     * On success any partial bytes beyond the recorded progress are truncated.
     * If the partial file holds fewer bytes than recorded, the recorded progress is lowered
     * to the bytes on disk and OFFSET_MISMATCH is returned, so the sender can resume from there.
     * On any other status the reservation and its partial file are left untouched.
     * @param recordedBytesReceived Set to the recorded progress whenever the reservation exists.
     */
    RFT_TRANSFER_EXPORT RESERVATION_STATUS AcquireForResume(const std::string & finalName, uint64_t declaredSize,
        uint64_t resumeOffset, uint64_t & recordedBytesReceived);

    /** Acquire a paused reservation under finalName that has not recorded any bytes.
     *
     * Lets a transfer that paused before its first byte be retried with offset zero
     * under the same name instead of leaving the empty reservation behind.
     * @return SUCCESS if acquired, UNKNOWN_TRANSFER if no such idle empty reservation
     * of the same declared size exists, or IO_FAILURE if its partial file is unusable.
     */
    RFT_TRANSFER_EXPORT RESERVATION_STATUS AcquireUnstarted(const std::string & finalName, uint64_t declaredSize);

    /// Persist progress of an active reservation (caller must have flushed those bytes)
    RFT_TRANSFER_EXPORT bool RecordProgress(const std::string & finalName, uint64_t bytesReceived);

    /// End the caller's hold on a reservation, keeping it (paused) for a later resume
    RFT_TRANSFER_EXPORT void Release(const std::string & finalName);

    /** Publish a fully received partial file under its final name and delete the reservation.
     *
     * If something else appeared at the final name since reservation, a new collision-free
     * name is resolved instead of overwriting it.
     * @param publishedName Set to the name the file was published under.
     */
    RFT_TRANSFER_EXPORT bool Finalize(const std::string & finalName, std::string & publishedName);

    /// Delete the reservation and its partial file
    RFT_TRANSFER_EXPORT bool Abandon(const std::string & finalName);

    /** Abandon inactive reservations not updated within maxAgeSeconds.
     *
     * @param maxAgeSeconds The staleness ceiling, 0 disables purging.
     * @return The number of reservations purged.
     */
    RFT_TRANSFER_EXPORT std::size_t PurgeStaleReservations(uint64_t maxAgeSeconds);

    RFT_TRANSFER_EXPORT bool IsReserved(const std::string & finalName) const;
    RFT_TRANSFER_EXPORT bool IsActive(const std::string & finalName) const;
    RFT_TRANSFER_EXPORT bool GetRecord(const std::string & finalName, ReservationRecord & record) const;
    RFT_TRANSFER_EXPORT std::size_t GetNumReservations() const;
    RFT_TRANSFER_EXPORT void GetReservedNames(std::vector<std::string> & names) const;

    RFT_TRANSFER_EXPORT const boost::filesystem::path & GetReceiveDirectory() const;
    RFT_TRANSFER_EXPORT const boost::filesystem::path & GetPartialDirectory() const;
    RFT_TRANSFER_EXPORT boost::filesystem::path GetPartialFilePath(const std::string & finalName) const;
    RFT_TRANSFER_EXPORT boost::filesystem::path GetRecordFilePath(const std::string & finalName) const;
    RFT_TRANSFER_EXPORT boost::filesystem::path GetFinalFilePath(const std::string & finalName) const;

private:
    ReservationStore();
    RFT_TRANSFER_NO_EXPORT void ReloadFromDisk_NotThreadSafe();
    RFT_TRANSFER_NO_EXPORT bool IsReserved_NotThreadSafe(const std::string & candidateName) const;
    RFT_TRANSFER_NO_EXPORT bool RemoveFiles_NotThreadSafe(const std::string & finalName);

private:
    struct reservation_entry_t {
        ReservationRecord record;
        bool active;
    };
    typedef std::map<std::string, reservation_entry_t> reservation_map_t;

    RFT_TRANSFER_NO_EXPORT RESERVATION_STATUS Activate_NotThreadSafe(const std::string & finalName,
        reservation_entry_t & entry, uint64_t resumeOffset, uint64_t & recordedBytesReceived);

    const boost::filesystem::path M_RECEIVE_DIRECTORY;
    const boost::filesystem::path M_PARTIAL_DIRECTORY;
    mutable boost::mutex m_mutex;
    reservation_map_t m_reservations;
};

#endif // RESERVATION_STORE_H
