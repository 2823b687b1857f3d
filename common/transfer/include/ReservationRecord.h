/**
 * @file ReservationRecord.h
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
 * The ReservationRecord class is the durable marker of one logical transfer
 * that has reserved a resolved final name.  It records the declared size and the
 * number of bytes received so far, and it is persisted as JSON beside the
 * partial file so that a later connection (even after a receiver restart)
 * can resume the transfer.
 */

#ifndef RESERVATION_RECORD_H
#define RESERVATION_RECORD_H 1

#include <cstdint>
#include <string>
#include <memory>
#include "JsonSerializable.h"
#include "rft_transfer_export.h"

class ReservationRecord;
typedef std::shared_ptr<ReservationRecord> ReservationRecord_ptr;

class ReservationRecord : public JsonSerializable {
public:
    RFT_TRANSFER_EXPORT ReservationRecord();
    RFT_TRANSFER_EXPORT ReservationRecord(const std::string & finalName, const std::string & requestedName, uint64_t declaredSize);
    RFT_TRANSFER_EXPORT ~ReservationRecord();

    //a copy constructor: X(const X&)
    RFT_TRANSFER_EXPORT ReservationRecord(const ReservationRecord& o);

    //a move constructor: X(X&&)
    RFT_TRANSFER_EXPORT ReservationRecord(ReservationRecord&& o) noexcept;

    //a copy assignment: operator=(const X&)
    RFT_TRANSFER_EXPORT ReservationRecord& operator=(const ReservationRecord& o);

    //a move assignment: operator=(X&&)
    RFT_TRANSFER_EXPORT ReservationRecord& operator=(ReservationRecord&& o) noexcept;

    RFT_TRANSFER_EXPORT bool operator==(const ReservationRecord & other) const;

    RFT_TRANSFER_EXPORT static ReservationRecord_ptr CreateFromPtree(const boost::property_tree::ptree & pt);
    RFT_TRANSFER_EXPORT static ReservationRecord_ptr CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath);
    RFT_TRANSFER_EXPORT virtual boost::property_tree::ptree GetNewPropertyTree() const override;
    RFT_TRANSFER_EXPORT virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) override;

    /** Write the record to a temporary file then rename it over recordFilePath.
     *
     * @return True if the record was replaced, or False otherwise (the previous record is left intact).
     */
    RFT_TRANSFER_EXPORT bool WriteAtomically(const boost::filesystem::path & recordFilePath) const;

    /// Set the last update time to now
    RFT_TRANSFER_EXPORT void Touch();

    RFT_TRANSFER_EXPORT uint64_t GetAgeSeconds(uint64_t nowSecondsSinceEpoch) const;
    RFT_TRANSFER_EXPORT static uint64_t GetSecondsSinceEpochNow();

public:
    std::string m_finalName;
    std::string m_requestedName;
    uint64_t m_declaredSize;
    uint64_t m_bytesReceived;
    uint64_t m_createdSecondsSinceEpoch;
    uint64_t m_lastUpdateSecondsSinceEpoch;
};

#endif // RESERVATION_RECORD_H
