/**
 * @file NameResolver.h
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
 * The NameResolver class computes a collision-free filename within a directory
 * by trying "base.ext", "base (1).ext", "base (2).ext", ... and taking the first
 * candidate that neither exists on disk nor is reserved by an in-progress transfer.
 * NameResolver itself holds no state; callers that need the candidate search and the
 * subsequent reservation to be atomic (see ReservationStore) must call Resolve
 * while holding their own lock.
 */

#ifndef NAME_RESOLVER_H
#define NAME_RESOLVER_H 1

#include <cstdint>
#include <string>
#include <boost/filesystem/path.hpp>
#include <boost/function.hpp>
#include "rft_transfer_export.h"

class NameResolver {
public:
    static constexpr uint64_t MAX_COLLISION_CANDIDATES = 1000000;

    typedef boost::function<bool(const std::string & candidateName)> IsReservedFunction_t;

    /** Split a filename into base and extension.
     *
     * The extension is the substring starting at the last '.', unless that dot is the first character.
     * "archive.tar.gz" gives "archive.tar" and ".gz", ".bashrc" gives ".bashrc" and "".
     */
    RFT_TRANSFER_EXPORT static void SplitBaseAndExtension(const std::string & filename, std::string & base, std::string & extensionWithDot);

    /// Candidate name for candidate index n, where n == 0 is the unchanged name
    RFT_TRANSFER_EXPORT static std::string MakeCandidateName(const std::string & base, const std::string & extensionWithDot, uint64_t n);

    /** Resolve a collision-free name.
     *
     * @param directory The directory the final file will be placed in.
     * @param sanitizedName The already sanitized candidate filename.
     * @param isReservedFunction Returns true if a candidate is held by an active reservation (may be empty).
     * @param finalName Set on success.
     * @return True if a free name was found within MAX_COLLISION_CANDIDATES candidates, or False otherwise.
     */
    RFT_TRANSFER_EXPORT static bool Resolve(const boost::filesystem::path & directory, const std::string & sanitizedName,
        const IsReservedFunction_t & isReservedFunction, std::string & finalName);

    /// True if anything (file, directory, or dangling symlink) occupies the path
    RFT_TRANSFER_EXPORT static bool IsOccupied(const boost::filesystem::path & path);
};

#endif // NAME_RESOLVER_H
