/**
 * @file JsonSerializable.h
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
 * This JsonSerializable virtual base class provides methods to 
 * use a boost::property_tree::ptree for the serialization and deserialization
 * of C++ classes to and from JSON.
 * It is used both for the receiver configuration and for the
 * reservation records that persist the progress of partial transfers.
 * Inheriting from this class helps to overcome some of the limitations
 * of property_tree such as C++ numerical values being serialized into JSON strings.
 */

#ifndef JSON_SERIALIZABLE_H
#define JSON_SERIALIZABLE_H 1

#include <string>
#include <set>
#include <istream>
#include <boost/property_tree/ptree.hpp>
#include <boost/filesystem/path.hpp>
#include "rft_util_export.h"

class RFT_UTIL_EXPORT JsonSerializable {
public:
    virtual ~JsonSerializable();

    /// Append every quoted key that precedes a colon in jsonText.
    static void GetAllJsonKeys(const std::string& jsonText, std::set<std::string> & jsonKeysNoQuotesSetToAppend);
    static void GetAllJsonKeysLineByLine(std::istream& stream, std::set<std::string>& jsonKeysNoQuotesSetToAppend);

    /** Detect keys in the user's JSON that the config would not write back out (typos, stale keys).
     *
     * @param config The already parsed config whose ToJson() defines the set of valid keys.
     * @param returnedErrorMessage Set to "line N: unused JSON key: K" for the first offending key.
     * @return True if an unused key was found, or if the file path could not be opened.
     */
    static bool HasUnusedJsonVariablesInFilePath(const JsonSerializable& config, const boost::filesystem::path& originalUserJsonFilePath, std::string& returnedErrorMessage);
    static bool HasUnusedJsonVariablesInString(const JsonSerializable& config, const std::string& originalUserJsonString, std::string& returnedErrorMessage);
    static bool HasUnusedJsonVariablesInStream(const JsonSerializable& config, std::istream& originalUserJsonStream, std::string& returnedErrorMessage);

    //warning: reading [] from Json then writing back out using this function will replace the [] with "", example: "allowedExtensions": ""
    static std::string PtToJsonString(const boost::property_tree::ptree& pt, bool pretty = true);

    std::string ToJson(bool pretty = true) const;
    /// Write ToJson() to filePath, returning false (and logging) if the file cannot be opened or fully written.
    bool ToJsonFile(const boost::filesystem::path& filePath, bool pretty = true) const;
    static bool GetPropertyTreeFromJsonStream(std::istream& jsonStream, boost::property_tree::ptree& pt);
    static bool GetPropertyTreeFromJsonString(const std::string & jsonStr, boost::property_tree::ptree& pt);
    static bool GetPropertyTreeFromJsonFilePath(const boost::filesystem::path& jsonFilePath, boost::property_tree::ptree& pt);

    virtual boost::property_tree::ptree GetNewPropertyTree() const = 0;
    virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) = 0;
    bool SetValuesFromJson(const std::string & jsonString);

protected:
    JsonSerializable();
};

#endif // JSON_SERIALIZABLE_H
