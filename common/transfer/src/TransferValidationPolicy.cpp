/**
 * @file TransferValidationPolicy.cpp
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

#include "TransferValidationPolicy.h"
#include "NameResolver.h"
#include <boost/algorithm/string/case_conv.hpp>
#include <boost/algorithm/string/trim.hpp>
#include <boost/lexical_cast.hpp>

validation_policy_t::validation_policy_t() : maxFileSizeBytes(0), allowedExtensions() { }
validation_policy_t::validation_policy_t(uint64_t paramMaxFileSizeBytes, const std::set<std::string> & paramAllowedExtensions) :
    maxFileSizeBytes(paramMaxFileSizeBytes), allowedExtensions(paramAllowedExtensions) { }

validation_result_t::validation_result_t() : decision(VALIDATION_DECISION::REJECT_EMPTY_NAME) { }
bool validation_result_t::IsAccepted() const {
    return (decision == VALIDATION_DECISION::ACCEPT);
}

TransferValidationPolicy::TransferValidationPolicy(const validation_policy_t & policy) : m_policy(policy) { }

const validation_policy_t & TransferValidationPolicy::GetPolicy() const {
    return m_policy;
}

std::string TransferValidationPolicy::SanitizeFilename(const std::string & rawFilename) {
    //keep only the final path component
    const std::string::size_type lastSeparator = rawFilename.find_last_of("/\\");
    const std::string finalComponent = (lastSeparator == std::string::npos) ? rawFilename : rawFilename.substr(lastSeparator + 1);

    std::string sanitized;
    sanitized.reserve(finalComponent.size());
    for (std::string::const_iterator it = finalComponent.cbegin(); it != finalComponent.cend(); ++it) {
        const unsigned char c = static_cast<unsigned char>(*it);
        if ((c < 0x20) || (c == 0x7f)) { //control character
            continue;
        }
        sanitized.push_back(*it);
    }
    boost::algorithm::trim(sanitized);
    if ((sanitized == ".") || (sanitized == "..")) {
        sanitized.clear();
    }
    return sanitized;
}

std::string TransferValidationPolicy::GetLowerCaseExtension(const std::string & filename) {
    std::string base;
    std::string extensionWithDot;
    NameResolver::SplitBaseAndExtension(filename, base, extensionWithDot);
    if (extensionWithDot.empty()) {
        return extensionWithDot;
    }
    std::string extension = extensionWithDot.substr(1);
    boost::algorithm::to_lower(extension);
    return extension;
}

bool TransferValidationPolicy::IsExtensionAllowed(const std::string & lowerCaseExtension) const {
    if (m_policy.allowedExtensions.empty()) {
        return true;
    }
    return (m_policy.allowedExtensions.count(lowerCaseExtension) != 0);
}

validation_result_t TransferValidationPolicy::Evaluate(const std::string & rawFilename, uint64_t declaredSize) const {
    validation_result_t result;
    if (rawFilename.find_first_of("/\\") != std::string::npos) {
        result.decision = VALIDATION_DECISION::REJECT_PATH_SEPARATOR;
        result.reason = "filename contains a path separator";
        return result;
    }
    result.sanitizedFilename = SanitizeFilename(rawFilename);
    if (result.sanitizedFilename.empty()) {
        result.decision = VALIDATION_DECISION::REJECT_EMPTY_NAME;
        result.reason = "filename is empty after sanitization";
        return result;
    }
    if (declaredSize > m_policy.maxFileSizeBytes) {
        result.decision = VALIDATION_DECISION::REJECT_TOO_LARGE;
        result.reason = "declared size " + boost::lexical_cast<std::string>(declaredSize)
            + " exceeds the maximum of " + boost::lexical_cast<std::string>(m_policy.maxFileSizeBytes) + " bytes";
        return result;
    }
    const std::string extension = GetLowerCaseExtension(result.sanitizedFilename);
    if (!IsExtensionAllowed(extension)) {
        result.decision = VALIDATION_DECISION::REJECT_EXTENSION_NOT_ALLOWED;
        result.reason = extension.empty() ? std::string("files without an extension are not allowed") : ("extension ." + extension + " is not allowed");
        return result;
    }
    result.decision = VALIDATION_DECISION::ACCEPT;
    return result;
}
