/**
 * @file NameResolver.cpp
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

#include "NameResolver.h"
#include "Logger.h"
#include "Utf8Paths.h"
#include <boost/filesystem/operations.hpp>
#include <boost/lexical_cast.hpp>

static constexpr rft::Logger::SubProcess subprocess = rft::Logger::SubProcess::receiver;

constexpr uint64_t NameResolver::MAX_COLLISION_CANDIDATES;

void NameResolver::SplitBaseAndExtension(const std::string & filename, std::string & base, std::string & extensionWithDot) {
    const std::string::size_type lastDot = filename.rfind('.');
    if ((lastDot == std::string::npos) || (lastDot == 0)) {
        base = filename;
        extensionWithDot.clear();
    }
    else {
        base = filename.substr(0, lastDot);
        extensionWithDot = filename.substr(lastDot);
    }
}

std::string NameResolver::MakeCandidateName(const std::string & base, const std::string & extensionWithDot, uint64_t n) {
    if (n == 0) {
        return base + extensionWithDot;
    }
    return base + " (" + boost::lexical_cast<std::string>(n) + ")" + extensionWithDot;
}

bool NameResolver::IsOccupied(const boost::filesystem::path & path) {
    boost::system::error_code ec;
    const boost::filesystem::file_status st = boost::filesystem::symlink_status(path, ec);
    if (ec && (st.type() != boost::filesystem::file_not_found)) {
        //cannot stat, count it as occupied
        return true;
    }
    return boost::filesystem::exists(st);
}

bool NameResolver::Resolve(const boost::filesystem::path & directory, const std::string & sanitizedName,
    const IsReservedFunction_t & isReservedFunction, std::string & finalName)
{
    if (sanitizedName.empty()) {
        return false;
    }
    std::string base;
    std::string extensionWithDot;
    SplitBaseAndExtension(sanitizedName, base, extensionWithDot);
    for (uint64_t n = 0; n <= MAX_COLLISION_CANDIDATES; ++n) {
        std::string candidate = MakeCandidateName(base, extensionWithDot, n);
        if (isReservedFunction && isReservedFunction(candidate)) {
            continue;
        }
        if (IsOccupied(directory / Utf8Paths::Utf8StringToPath(candidate))) {
            continue;
        }
        finalName = std::move(candidate);
        return true;
    }
    LOG_ERROR(subprocess) << "NameResolver::Resolve: no free name for " << Utf8Paths::ToPrintableString(sanitizedName)
        << " after " << MAX_COLLISION_CANDIDATES << " candidates";
    return false;
}
