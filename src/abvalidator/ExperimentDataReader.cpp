// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ExperimentDataReader.h"
#include <fstream>
#include <iterator>
#include <optional>
#include <sstream>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include <rapidjson/document.h>
#include <rapidjson/error/en.h>

using namespace rapidjson;
using mkc_abtest::Observation;

namespace abvalidator
{

namespace
{

std::string recordError(std::size_t index, const std::string& what)
{
    return "dataset record " + boost::lexical_cast<std::string>(index) + ": " + what;
}

std::string readSubjectId(const Value& record, std::size_t index)
{
    auto it = record.FindMember("user_id");
    if (it == record.MemberEnd())
        throw DatasetFormatError(recordError(index, "missing 'user_id'"));

    const Value& id = it->value;
    if (id.IsString())
        return std::string(id.GetString(), id.GetStringLength());
    if (id.IsInt64())
        return boost::lexical_cast<std::string>(id.GetInt64());
    if (id.IsUint64())
        return boost::lexical_cast<std::string>(id.GetUint64());

    throw DatasetFormatError(recordError(index, "'user_id' must be a string or an integer"));
}

double readMetric(const Value& record, std::size_t index)
{
    auto event = record.FindMember("event");
    auto value = record.FindMember("value");

    if (event != record.MemberEnd() && value != record.MemberEnd())
        throw DatasetFormatError(recordError(index, "has both 'event' and 'value'"));

    auto it = (event != record.MemberEnd()) ? event : value;
    if (it == record.MemberEnd())
        throw DatasetFormatError(recordError(index, "missing 'event' or 'value'"));

    if (it->value.IsBool())
        return it->value.GetBool() ? 1.0 : 0.0;
    if (!it->value.IsNumber())
        throw DatasetFormatError(recordError(index, "metric must be a number"));

    return it->value.GetDouble();
}

std::optional<std::string> readOptionalString(const Value& record, const char* name, std::size_t index)
{
    auto it = record.FindMember(name);
    if (it == record.MemberEnd() || it->value.IsNull())
        return std::nullopt;

    if (!it->value.IsString())
        throw DatasetFormatError(recordError(index, std::string("'") + name + "' must be a string"));

    return std::string(it->value.GetString(), it->value.GetStringLength());
}

} // namespace

std::vector<Observation> ExperimentDataReader::readFile(const std::string& filePath)
{
    if (!boost::filesystem::exists(filePath))
        throw DatasetFormatError("dataset file '" + filePath + "' does not exist");

    std::ifstream file(filePath);
    if (!file.is_open())
        throw DatasetFormatError("cannot open dataset file '" + filePath + "'");

    std::string json((std::istreambuf_iterator<char>(file)), std::istreambuf_iterator<char>());
    return parse(json);
}

std::vector<Observation> ExperimentDataReader::parse(const std::string& json)
{
    Document doc;
    doc.Parse(json.c_str());
    if (doc.HasParseError())
    {
        std::ostringstream os;
        os << "dataset is not valid JSON (offset " << doc.GetErrorOffset() << "): "
           << GetParseError_En(doc.GetParseError());
        throw DatasetFormatError(os.str());
    }

    if (!doc.IsArray())
        throw DatasetFormatError("dataset must be a JSON array of records");

    std::vector<Observation> observations;
    observations.reserve(doc.Size());

    std::size_t index = 0;
    for (const auto& record : doc.GetArray())
    {
        if (!record.IsObject())
            throw DatasetFormatError(recordError(index, "must be a JSON object"));

        Observation observation;
        observation.subjectId = readSubjectId(record, index);
        observation.value = readMetric(record, index);
        observation.group = readOptionalString(record, "group", index);
        observation.timestamp = readOptionalString(record, "timestamp", index);
        observations.push_back(std::move(observation));
        ++index;
    }

    return observations;
}

} // namespace abvalidator
