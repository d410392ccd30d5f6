// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "EngineDefaultsReader.h"
#include "ABTestException.h"
#include "ResultSerializer.h"
#include <fstream>
#include <iterator>
#include <boost/filesystem.hpp>

using namespace mkc_abtest;

namespace abvalidator
{

namespace
{

std::string slurp(const std::string& filePath, const char* what)
{
    if (!boost::filesystem::exists(filePath))
        throw ConfigurationError(std::string(what) + " file '" + filePath + "' does not exist");

    std::ifstream file(filePath);
    if (!file.is_open())
        throw ConfigurationError(std::string("cannot open ") + what + " file '" + filePath + "'");

    return std::string((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
}

} // namespace

EngineDefaultsReader::EngineDefaultsReader(const std::string& filePath)
    : mFilePath(filePath)
{
}

EngineDefaults EngineDefaultsReader::read() const
{
    return parse(slurp(mFilePath, "engine defaults"));
}

EngineDefaults EngineDefaultsReader::parse(const std::string& json)
{
    EngineDefaults defaults = ResultSerializer::engineDefaultsFromJson(json);
    defaults.validate();
    return defaults;
}

TestConfigurationReader::TestConfigurationReader(const std::string& filePath)
    : mFilePath(filePath)
{
}

TestConfiguration TestConfigurationReader::read(const TestConfiguration& base) const
{
    rapidjson::Document doc;
    ResultSerializer::parse(doc, slurp(mFilePath, "configuration"));

    // Keys present in the file override base; the rest of base is kept
    rapidjson::Document merged;
    merged.SetObject();
    rapidjson::Value baseJson = ResultSerializer::serializeConfiguration(base, merged.GetAllocator());
    if (!doc.IsObject())
        throw SerializationError("configuration file '" + mFilePath + "' must hold a JSON object");

    for (auto it = doc.MemberBegin(); it != doc.MemberEnd(); ++it)
    {
        auto existing = baseJson.FindMember(it->name);
        rapidjson::Value copy(it->value, merged.GetAllocator());
        if (existing != baseJson.MemberEnd())
            existing->value = copy;
        else
        {
            rapidjson::Value name(it->name, merged.GetAllocator());
            baseJson.AddMember(name, copy, merged.GetAllocator());
        }
    }

    return ResultSerializer::deserializeConfiguration(baseJson);
}

} // namespace abvalidator
