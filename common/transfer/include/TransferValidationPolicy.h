/**
 * @file TransferValidationPolicy.h
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
 * The TransferValidationPolicy class decides whether an incoming transfer
 * is accepted based on its declared filename and size, before any bytes of the
 * file body are read from the connection.
 * The policy is immutable once constructed.
 */

#ifndef TRANSFER_VALIDATION_POLICY_H
#define TRANSFER_VALIDATION_POLICY_H 1

#include <cstdint>
#include <string>
#include <set>
#include "rft_transfer_export.h"

struct validation_policy_t {
    uint64_t maxFileSizeBytes;
    /// Lower case, no leading dot.  An empty set allows every extension.
    std::set<std::string> allowedExtensions;

    RFT_TRANSFER_EXPORT validation_policy_t();
    RFT_TRANSFER_EXPORT validation_policy_t(uint64_t paramMaxFileSizeBytes, const std::set<std::string> & paramAllowedExtensions);
};

enum class VALIDATION_DECISION {
    ACCEPT = 0,
    REJECT_EMPTY_NAME,
    REJECT_PATH_SEPARATOR,
    REJECT_TOO_LARGE,
    REJECT_EXTENSION_NOT_ALLOWED
};

struct validation_result_t {
    VALIDATION_DECISION decision;
    /// The name that flows to the name resolver (only meaningful on ACCEPT)
    std::string sanitizedFilename;
    std::string reason;

    RFT_TRANSFER_EXPORT validation_result_t();
    RFT_TRANSFER_EXPORT bool IsAccepted() const;
};

class TransferValidationPolicy {
public:
    RFT_TRANSFER_EXPORT TransferValidationPolicy(const validation_policy_t & policy);

    /** Evaluate a declared filename and size.
     *
     * @param rawFilename The untrusted name from the envelope.
     * @param declaredSize The total size the sender intends to send.
     * @return The decision, the sanitized name, and a human readable reason when rejected.
     */
    RFT_TRANSFER_EXPORT validation_result_t Evaluate(const std::string & rawFilename, uint64_t declaredSize) const;

    /** Strip directory components and control characters and trim surrounding whitespace.
     *
     * @return The sanitized name, which is empty if nothing usable remains (including "." and "..").
     */
    RFT_TRANSFER_EXPORT static std::string SanitizeFilename(const std::string & rawFilename);

    /// Lower case extension without the dot, empty if the name has none
    RFT_TRANSFER_EXPORT static std::string GetLowerCaseExtension(const std::string & filename);

    RFT_TRANSFER_EXPORT bool IsExtensionAllowed(const std::string & lowerCaseExtension) const;
    RFT_TRANSFER_EXPORT const validation_policy_t & GetPolicy() const;

private:
    TransferValidationPolicy();

    const validation_policy_t m_policy;
};

#endif // TRANSFER_VALIDATION_POLICY_H
