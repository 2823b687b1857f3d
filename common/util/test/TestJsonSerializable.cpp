/**
 * @file TestJsonSerializable.cpp
 *
 * @copyright Copyright (c) 2021 United States Government as represented by
 * the National Aeronautics and Space Administration.
 * No copyright is claimed in the United States under Title 17, U.S.Code.
 * All Other Rights Reserved.
 *
 * @section LICENSE
 * Released under the NASA Open Source Agreement (NOSA)
 * See LICENSE.md in the source root directory for more information.
 */

#include <boost/test/unit_test.hpp>
#include "JsonSerializable.h"
#include <set>
#include <sstream>

namespace {
//single-field config used to exercise the unused key detection
class PortOnlyConfig : public JsonSerializable {
public:
    PortOnlyConfig() : m_port(0) {}
    virtual boost::property_tree::ptree GetNewPropertyTree() const override {
        boost::property_tree::ptree pt;
        pt.put("listenPort", m_port);
        return pt;
    }
    virtual bool SetValuesFromPropertyTree(const boost::property_tree::ptree & pt) override {
        try {
            m_port = pt.get<uint16_t>("listenPort");
        }
        catch (const boost::property_tree::ptree_error &) {
            return false;
        }
        return true;
    }
    uint16_t m_port;
};
}

BOOST_AUTO_TEST_CASE(JsonSerializableTestCase)
{
    //UTF-8 (Greek): "arxeio" is \xce\xb1\xcf\x81\xcf\x87\xce\xb5\xce\xaf\xce\xbf
    #define UTF_8_FILE_NAME "\xce\xb1\xcf\x81\xcf\x87\xce\xb5\xce\xaf\xce\xbf.pdf"
    #define UTF_8_KEY_NAME "\xce\xb1\xcf\x81\xcf\x87\xce\xb5\xce\xaf\xce\xbf_key"
    static const char* const jsonText =
    "{"
        "\"finalized\":true,"
        "\"resumable\":false,"
        "\"receiveDirectory\":\"incoming\","
        "\"finalName\":\"" UTF_8_FILE_NAME "\","
        "\"" UTF_8_KEY_NAME "\":\"plain\","
        "\"offsetAdjust\":-7,\"chunkSizeBytes\"  :  65536,"
        "\"listenAddress\":    \"127.0.0.1\""
    "}\n";

    static const std::string jsonTextStr(jsonText);

    {
        boost::property_tree::ptree pt;
        BOOST_REQUIRE(JsonSerializable::GetPropertyTreeFromJsonString(jsonTextStr, pt));
        BOOST_REQUIRE_EQUAL(pt.get<bool>("finalized", false), true);
        BOOST_REQUIRE_EQUAL(pt.get<bool>("resumable", true), false);
        BOOST_REQUIRE_EQUAL(pt.get<std::string>("receiveDirectory", ""), "incoming");
        BOOST_REQUIRE_EQUAL(pt.get<std::string>("finalName", ""), UTF_8_FILE_NAME);
        BOOST_REQUIRE_EQUAL(pt.get<std::string>(UTF_8_KEY_NAME, ""), "plain");
        BOOST_REQUIRE_EQUAL(pt.get<int>("offsetAdjust", 0), -7);
        BOOST_REQUIRE_EQUAL(pt.get<unsigned int>("chunkSizeBytes", 0), 65536);
        BOOST_REQUIRE_EQUAL(pt.get<std::string>("listenAddress", ""), "127.0.0.1");
    }

    {
        std::set<std::string> jsonKeys;
        JsonSerializable::GetAllJsonKeys(jsonTextStr, jsonKeys);
        BOOST_REQUIRE(jsonKeys == std::set<std::string>({ "finalized", "resumable", "receiveDirectory",
            "finalName", UTF_8_KEY_NAME, "offsetAdjust", "chunkSizeBytes", "listenAddress" }));
        std::set<std::string> jsonKeysLineByLine;
        std::istringstream iss(jsonTextStr);
        JsonSerializable::GetAllJsonKeysLineByLine(iss, jsonKeysLineByLine);
        BOOST_REQUIRE(jsonKeys == jsonKeysLineByLine);
    }

    {
        boost::property_tree::ptree pt;
        BOOST_REQUIRE(!JsonSerializable::GetPropertyTreeFromJsonString("{\"listenPort\": ", pt));
    }
}

BOOST_AUTO_TEST_CASE(JsonSerializableUnusedKeysTestCase)
{
    PortOnlyConfig config;
    BOOST_REQUIRE(config.SetValuesFromJson("{\"listenPort\": 4557}"));
    BOOST_REQUIRE_EQUAL(config.m_port, 4557);
    std::string errorMessage;
    BOOST_REQUIRE(!JsonSerializable::HasUnusedJsonVariablesInString(config, "{\"listenPort\": 4557}\n", errorMessage));
    BOOST_REQUIRE(JsonSerializable::HasUnusedJsonVariablesInString(config,
        "{\"listenPort\": 4557,\n\"listenPrt\": 1}", errorMessage));
    BOOST_REQUIRE(errorMessage.find("listenPrt") != std::string::npos);
    BOOST_REQUIRE(!config.SetValuesFromJson("{\"port\": 1}"));
}
