/**
 * @file Utf8Paths.h
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
 * This class allows conversion between the UTF-8 file names carried on the wire
 * and boost::filesystem::path.  The conversions are no-op on POSIX systems.
 * It also provides a printable form of an untrusted UTF-8 name for logging.
 */

#ifndef _UTF8_PATHS_H
#define _UTF8_PATHS_H 1
#include <stdint.h>
#include <string>
#include <boost/filesystem/path.hpp>
#include "rft_util_export.h"

class RFT_UTIL_EXPORT Utf8Paths {
public:
    static std::string PathToUtf8String(const boost::filesystem::path& p);
    static boost::filesystem::path Utf8StringToPath(const std::string& u8String);
    static bool IsAscii(const std::string& u8String);
    /// Returns u8String if it is printable ascii, otherwise a placeholder that is safe to log.
    static std::string ToPrintableString(const std::string& u8String);
};
#endif      // _UTF8_PATHS_H 
