/**
 * @file ReceiverConfig.h
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
 * The ReceiverConfig class contains all the config parameters for
 * instantiating a single file transfer receiver (listen endpoint,
 * receive directory, validation policy limits, and session tuning), and it
 * provides JSON serialization and deserialization capability.
 * A ReceiverConfig is treated as immutable once a receiver has been constructed from it.
 */

#ifndef RECEIVER_CONFIG_H
#define RECEIVER_CONFIG_H 1

#include <string>
#include <memory>
#include <set>
#include <cstdint>
#include "JsonSerializable.h"
#include "rft_config_export.h"

class ReceiverConfig;
typedef std::shared_ptr<ReceiverConfig> ReceiverConfig_ptr;

class ReceiverConfig : public JsonSerializable {
public:
    /// Hard ceiling of the envelope filename length field (matches the wire limit)
    static constexpr uint64_t MAX_FILENAME_LENGTH_CEILING = 4096;

    RFT_CONFIG_EXPORT ReceiverConfig();
    RFT_CONFIG_EXPORT ~ReceiverConfig();

    //a copy constructor: X(const X&)
    RFT_CONFIG_EXPORT ReceiverConfig(const ReceiverConfig& o);

    //a move constructor: X(X&&)
    RFT_CONFIG_EXPORT ReceiverConfig(ReceiverConfig&& o) noexcept;

    //a copy assignment: operator=(const X&)
    RFT_CONFIG_EXPORT ReceiverConfig& operator=(const ReceiverConfig& o);

    //a move assignment: operator=(X&&)
    RFT_CONFIG_EXPORT ReceiverConfig& operator=(ReceiverConfig&& o) noexcept;

    RFT_CONFIG_EXPORT bool operator==(const ReceiverConfig & other) const;

    RFT_CONFIG_EXPORT static ReceiverConfig_ptr CreateFromPtree(const boost::property_tree::ptree & pt);
    RFT_CONFIG_EXPORT static ReceiverConfig_ptr CreateFromJson(const std::string & jsonString, bool verifyNoUnusedJsonKeys = true);
    RFT_CONFIG_EXPORT static ReceiverConfig_ptr CreateFromJsonFilePath(const boost::filesystem::path& jsonFilePath, bool verifyNoUnusedJsonKeys = true);
    RFT_CONFIG_EXPORT virtual boost::property_tree::ptree GetNewPropertyTree() const override;
    RFT_CONFIG_EXPORT virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) override;

    /** Check the limits that the JSON parser enforces.
     *
     * Also used after command line overrides are applied to a loaded config.
     * @return True if every parameter is within range, or False otherwise (reason is logged).
     */
    RFT_CONFIG_EXPORT bool IsValid() const;

    /** Add an extension to the allow-list.
     *
     * The extension is stored lower case without a leading dot.
     * @return True if the extension was inserted, or False if it was empty or a duplicate.
     */
    RFT_CONFIG_EXPORT bool AddAllowedExtension(const std::string & extension);

    /// Lower case and remove a single leading dot, ".PDF" becomes "pdf"
    RFT_CONFIG_EXPORT static std::string NormalizeExtension(const std::string & extension);
public:

    std::string m_listenAddress;
    uint16_t m_listenPort;
    std::string m_receiveDirectory;
    uint64_t m_maxFileSizeBytes;
    std::set<std::string> m_allowedExtensions;
    uint64_t m_idleTimeoutSeconds;
    uint64_t m_maxConcurrentSessions;
    uint64_t m_maxFilenameLengthBytes;
    uint64_t m_chunkSizeBytes;
    uint64_t m_progressRecordIntervalBytes;
    uint64_t m_reservationStaleSeconds;
    uint64_t m_numIoThreads;
};

#endif // RECEIVER_CONFIG_H
