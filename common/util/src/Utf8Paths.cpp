/**
 * @file Utf8Paths.cpp
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

#include "Utf8Paths.h"
#include <algorithm>
#include <cctype>

std::string Utf8Paths::PathToUtf8String(const boost::filesystem::path& p) {
    return p.native();
}
boost::filesystem::path Utf8Paths::Utf8StringToPath(const std::string& u8String) {
    return boost::filesystem::path(u8String);
}

bool Utf8Paths::IsAscii(const std::string& u8String) {
    return std::all_of(u8String.begin(), u8String.end(), [](char c) {
        return std::isprint(static_cast<unsigned char>(c)) != 0;
    });
}

std::string Utf8Paths::ToPrintableString(const std::string& u8String) {
    return (IsAscii(u8String)) ? u8String : std::string("UTF-8-non-printable-file-name");
}
