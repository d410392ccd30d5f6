// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <string>
#include <rapidjson/document.h>
#include "ABTestConfiguration.h"
#include "ABTestException.h"
#include "ResultAggregator.h"
#include "SummaryStatistics.h"
#include "TestResult.h"

namespace mkc_abtest
{
  // Malformed JSON, or JSON that does not describe the expected value
  class SerializationError : public ABTestException
  {
  public:
    explicit SerializationError(const std::string& msg)
      : ABTestException(msg)
    {}
  };

  /**
   * @brief JSON encoding of engine values with rapidjson.
   *
   * Numbers are written with full round-trip precision and parsed back
   * with kParseFullPrecisionFlag, so parsing a serialized configuration,
   * summary, result or report yields an equal value. Absent optional
   * fields are omitted. NaN and infinity use rapidjson's NaN/Infinity
   * extension.
   *
   * Configuration and engine default objects may be partial: missing keys
   * keep their defaults, unknown keys are rejected.
   */
  class ResultSerializer
  {
  public:
    using Allocator = rapidjson::Document::AllocatorType;

    static std::string toJson(const TestConfiguration& config, bool pretty = false);
    static std::string toJson(const EngineDefaults& defaults, bool pretty = false);
    static std::string toJson(const GroupSummary& summary, bool pretty = false);
    static std::string toJson(const TestResult& result, bool pretty = false);
    static std::string toJson(const AggregateReport& report, bool pretty = false);

    // @throws SerializationError on malformed input
    static TestConfiguration configurationFromJson(const std::string& json);
    static EngineDefaults engineDefaultsFromJson(const std::string& json);
    static GroupSummary summaryFromJson(const std::string& json);
    static TestResult resultFromJson(const std::string& json);
    static AggregateReport reportFromJson(const std::string& json);

    static rapidjson::Value serializeConfiguration(const TestConfiguration& config, Allocator& allocator);
    static TestConfiguration deserializeConfiguration(const rapidjson::Value& json);

    static rapidjson::Value serializeEngineDefaults(const EngineDefaults& defaults, Allocator& allocator);
    static EngineDefaults deserializeEngineDefaults(const rapidjson::Value& json);

    static rapidjson::Value serializeSummary(const GroupSummary& summary, Allocator& allocator);
    static GroupSummary deserializeSummary(const rapidjson::Value& json);

    static rapidjson::Value serializeResult(const TestResult& result, Allocator& allocator);
    static TestResult deserializeResult(const rapidjson::Value& json);

    static rapidjson::Value serializeReport(const AggregateReport& report, Allocator& allocator);
    static AggregateReport deserializeReport(const rapidjson::Value& json);

    static rapidjson::Value serializeCurve(const Curve& curve, Allocator& allocator);
    static Curve deserializeCurve(const rapidjson::Value& json);

    static rapidjson::Value serializeCorrectionEntry(const CorrectionEntry& entry, Allocator& allocator);
    static CorrectionEntry deserializeCorrectionEntry(const rapidjson::Value& json);

    // Write a document as compact or indented text
    static std::string write(const rapidjson::Value& value, bool pretty);

    // @throws SerializationError with the parser's message and offset
    static void parse(rapidjson::Document& doc, const std::string& json);
  };

} // namespace mkc_abtest
