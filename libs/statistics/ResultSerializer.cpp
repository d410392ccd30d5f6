// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ResultSerializer.h"
#include <algorithm>
#include <initializer_list>
#include <map>
#include <optional>
#include <sstream>
#include <rapidjson/error/en.h>
#include <rapidjson/prettywriter.h>
#include <rapidjson/stringbuffer.h>
#include <rapidjson/writer.h>

using namespace rapidjson;

namespace mkc_abtest
{
  namespace
  {
    using Allocator = ResultSerializer::Allocator;

    void requireObject(const Value& json, const char* what)
    {
      if (!json.IsObject())
	throw SerializationError(std::string(what) + ": expected a JSON object");
    }

    const Value& member(const Value& json, const char* name)
    {
      auto it = json.FindMember(name);
      if (it == json.MemberEnd())
	throw SerializationError(std::string("missing field '") + name + "'");

      return it->value;
    }

    bool hasMember(const Value& json, const char* name)
    {
      auto it = json.FindMember(name);
      return it != json.MemberEnd() && !it->value.IsNull();
    }

    // Reject keys the reader does not know, so typos in hand-written files surface
    void rejectUnknownMembers(const Value& json, std::initializer_list<const char*> known, const char* what)
    {
      for (auto it = json.MemberBegin(); it != json.MemberEnd(); ++it)
	{
	  const std::string key = it->name.GetString();
	  const bool found = std::any_of(known.begin(), known.end(),
					 [&key](const char* k) { return key == k; });
	  if (!found)
	    throw ConfigurationError(std::string(what) + ": unknown field '" + key + "'");
	}
    }

    double asDouble(const Value& v, const char* name)
    {
      if (!v.IsNumber())
	throw SerializationError(std::string("field '") + name + "' must be a number");
      return v.GetDouble();
    }

    uint64_t asUint64(const Value& v, const char* name)
    {
      if (!v.IsUint64())
	throw SerializationError(std::string("field '") + name + "' must be a non-negative integer");
      return v.GetUint64();
    }

    std::size_t asSize(const Value& v, const char* name)
    {
      return static_cast<std::size_t>(asUint64(v, name));
    }

    bool asBool(const Value& v, const char* name)
    {
      if (!v.IsBool())
	throw SerializationError(std::string("field '") + name + "' must be true or false");
      return v.GetBool();
    }

    std::string asString(const Value& v, const char* name)
    {
      if (!v.IsString())
	throw SerializationError(std::string("field '") + name + "' must be a string");
      return std::string(v.GetString(), v.GetStringLength());
    }

    double getDouble(const Value& json, const char* name)
    {
      return asDouble(member(json, name), name);
    }

    std::size_t getSize(const Value& json, const char* name)
    {
      return asSize(member(json, name), name);
    }

    bool getBool(const Value& json, const char* name)
    {
      return asBool(member(json, name), name);
    }

    std::string getString(const Value& json, const char* name)
    {
      return asString(member(json, name), name);
    }

    std::optional<double> getOptionalDouble(const Value& json, const char* name)
    {
      if (!hasMember(json, name))
	return std::nullopt;
      return asDouble(json[name], name);
    }

    Value stringValue(const std::string& s, Allocator& allocator)
    {
      return Value(s.c_str(), static_cast<SizeType>(s.size()), allocator);
    }

    void addOptional(Value& json, const char* name, const std::optional<double>& v, Allocator& allocator)
    {
      if (v)
	json.AddMember(StringRef(name), *v, allocator);
    }

    Value doubleArray(const std::vector<double>& xs, Allocator& allocator)
    {
      Value array(kArrayType);
      array.Reserve(static_cast<SizeType>(xs.size()), allocator);
      for (double x : xs)
	array.PushBack(x, allocator);
      return array;
    }

    std::vector<double> readDoubleArray(const Value& json, const char* name)
    {
      const Value& array = member(json, name);
      if (!array.IsArray())
	throw SerializationError(std::string("field '") + name + "' must be an array");

      std::vector<double> xs;
      xs.reserve(array.Size());
      for (const auto& v : array.GetArray())
	xs.push_back(asDouble(v, name));
      return xs;
    }
  }

  std::string ResultSerializer::write(const Value& value, bool pretty)
  {
    StringBuffer buffer;
    if (pretty)
      {
	PrettyWriter<StringBuffer, UTF8<>, UTF8<>, CrtAllocator, kWriteNanAndInfFlag> writer(buffer);
	writer.SetIndent(' ', 2);
	value.Accept(writer);
      }
    else
      {
	Writer<StringBuffer, UTF8<>, UTF8<>, CrtAllocator, kWriteNanAndInfFlag> writer(buffer);
	value.Accept(writer);
      }

    return std::string(buffer.GetString(), buffer.GetSize());
  }

  void ResultSerializer::parse(Document& doc, const std::string& json)
  {
    doc.Parse<kParseFullPrecisionFlag | kParseNanAndInfFlag>(json.c_str());
    if (doc.HasParseError())
      {
	std::ostringstream os;
	os << "JSON parse error at offset " << doc.GetErrorOffset() << ": "
	   << GetParseError_En(doc.GetParseError());
	throw SerializationError(os.str());
      }
  }

  // ---------------------------------------------------------------------
  // TestConfiguration

  Value ResultSerializer::serializeConfiguration(const TestConfiguration& config, Allocator& allocator)
  {
    Value json(kObjectType);
    json.AddMember("test_type", stringValue(toString(config.getTestType()), allocator), allocator);
    json.AddMember("metric_kind", stringValue(toString(config.getMetricKind()), allocator), allocator);
    json.AddMember("sequential", config.isSequential(), allocator);
    addOptional(json, "stopping_threshold", config.getExplicitStoppingThreshold(), allocator);
    json.AddMember("alpha", config.getAlpha(), allocator);
    json.AddMember("minimum_detectable_effect", config.getMinimumDetectableEffect(), allocator);
    json.AddMember("correction_method", stringValue(toString(config.getCorrectionMethod()), allocator), allocator);
    json.AddMember("alternative", stringValue(toString(config.getAlternative()), allocator), allocator);
    json.AddMember("uplift_method", stringValue(toString(config.getUpliftMethod()), allocator), allocator);
    json.AddMember("count_variance_model", stringValue(toString(config.getCountVarianceModel()), allocator),
		   allocator);
    json.AddMember("prior_successes", config.getPriorSuccesses(), allocator);
    json.AddMember("prior_trials", config.getPriorTrials(), allocator);
    json.AddMember("loss_tolerance", config.getLossTolerance(), allocator);
    json.AddMember("credible_level", config.getCredibleLevel(), allocator);
    json.AddMember("posterior_draws", static_cast<uint64_t>(config.getPosteriorDraws()), allocator);
    json.AddMember("random_seed", config.getRandomSeed(), allocator);
    json.AddMember("max_simulation_draws", static_cast<uint64_t>(config.getMaxSimulationDraws()), allocator);
    json.AddMember("max_simulation_millis", static_cast<uint64_t>(config.getMaxSimulationMillis()), allocator);
    json.AddMember("max_sample_size", static_cast<uint64_t>(config.getMaxSampleSize()), allocator);
    json.AddMember("looks", static_cast<uint64_t>(config.getNumberOfLooks()), allocator);
    json.AddMember("futility_threshold", config.getFutilityThreshold(), allocator);
    json.AddMember("target_power", config.getTargetPower(), allocator);
    return json;
  }

  TestConfiguration ResultSerializer::deserializeConfiguration(const Value& json)
  {
    requireObject(json, "test configuration");
    rejectUnknownMembers(json, { "test_type", "metric_kind", "sequential", "stopping_threshold", "alpha",
				 "minimum_detectable_effect", "correction_method", "alternative",
				 "uplift_method", "count_variance_model", "prior_successes", "prior_trials",
				 "loss_tolerance", "credible_level", "posterior_draws", "random_seed",
				 "max_simulation_draws", "max_simulation_millis", "max_sample_size", "looks",
				 "futility_threshold", "target_power" },
			 "test configuration");

    TestConfiguration config;
    if (hasMember(json, "test_type"))
      config = config.withTestType(parseTestType(getString(json, "test_type")));
    if (hasMember(json, "metric_kind"))
      config = config.withMetricKind(parseMetricKind(getString(json, "metric_kind")));
    if (hasMember(json, "sequential"))
      config = config.withSequential(getBool(json, "sequential"));
    if (hasMember(json, "stopping_threshold"))
      config = config.withStoppingThreshold(getDouble(json, "stopping_threshold"));
    if (hasMember(json, "alpha"))
      config = config.withAlpha(getDouble(json, "alpha"));
    if (hasMember(json, "minimum_detectable_effect"))
      config = config.withMinimumDetectableEffect(getDouble(json, "minimum_detectable_effect"));
    if (hasMember(json, "correction_method"))
      config = config.withCorrectionMethod(parseCorrectionMethod(getString(json, "correction_method")));
    if (hasMember(json, "alternative"))
      config = config.withAlternative(parseAlternativeHypothesis(getString(json, "alternative")));
    if (hasMember(json, "uplift_method"))
      config = config.withUpliftMethod(parseUpliftMethod(getString(json, "uplift_method")));
    if (hasMember(json, "count_variance_model"))
      config = config.withCountVarianceModel(parseCountVarianceModel(getString(json, "count_variance_model")));

    if (hasMember(json, "prior_successes") || hasMember(json, "prior_trials"))
      {
	const double successes = hasMember(json, "prior_successes") ? getDouble(json, "prior_successes")
	  : config.getPriorSuccesses();
	const double trials = hasMember(json, "prior_trials") ? getDouble(json, "prior_trials")
	  : config.getPriorTrials();
	config = config.withPrior(successes, trials);
      }

    if (hasMember(json, "loss_tolerance"))
      config = config.withLossTolerance(getDouble(json, "loss_tolerance"));
    if (hasMember(json, "credible_level"))
      config = config.withCredibleLevel(getDouble(json, "credible_level"));
    if (hasMember(json, "posterior_draws"))
      config = config.withPosteriorDraws(getSize(json, "posterior_draws"));
    if (hasMember(json, "random_seed"))
      config = config.withRandomSeed(asUint64(json["random_seed"], "random_seed"));

    if (hasMember(json, "max_simulation_draws") || hasMember(json, "max_simulation_millis"))
      {
	const std::size_t draws = hasMember(json, "max_simulation_draws") ? getSize(json, "max_simulation_draws")
	  : config.getMaxSimulationDraws();
	const std::size_t millis = hasMember(json, "max_simulation_millis") ? getSize(json, "max_simulation_millis")
	  : config.getMaxSimulationMillis();
	config = config.withSimulationBudget(draws, millis);
      }

    if (hasMember(json, "max_sample_size"))
      config = config.withMaxSampleSize(getSize(json, "max_sample_size"));
    if (hasMember(json, "looks"))
      config = config.withNumberOfLooks(getSize(json, "looks"));
    if (hasMember(json, "futility_threshold"))
      config = config.withFutilityThreshold(getDouble(json, "futility_threshold"));
    if (hasMember(json, "target_power"))
      config = config.withTargetPower(getDouble(json, "target_power"));

    return config;
  }

  // ---------------------------------------------------------------------
  // EngineDefaults

  Value ResultSerializer::serializeEngineDefaults(const EngineDefaults& defaults, Allocator& allocator)
  {
    Value json(kObjectType);
    json.AddMember("alpha", defaults.alpha, allocator);
    json.AddMember("bucketing_strategy", stringValue(toString(defaults.bucketingStrategy), allocator), allocator);
    json.AddMember("bucket_count", static_cast<uint64_t>(defaults.bucketCount), allocator);
    json.AddMember("credible_level", defaults.credibleLevel, allocator);
    json.AddMember("minimum_posterior_draws", static_cast<uint64_t>(defaults.minimumPosteriorDraws), allocator);
    json.AddMember("number_of_chains", static_cast<uint64_t>(defaults.numberOfChains), allocator);
    json.AddMember("max_rhat", defaults.maxRHat, allocator);
    json.AddMember("min_effective_sample_size", defaults.minEffectiveSampleSize, allocator);
    json.AddMember("weight_tolerance", defaults.weightTolerance, allocator);
    json.AddMember("binary_power_grid_step", defaults.binaryPowerGridStep, allocator);
    json.AddMember("binary_power_grid_max", defaults.binaryPowerGridMax, allocator);
    json.AddMember("continuous_power_grid_steps", static_cast<uint64_t>(defaults.continuousPowerGridSteps),
		   allocator);
    json.AddMember("continuous_power_grid_span_se", defaults.continuousPowerGridSpanSE, allocator);
    json.AddMember("density_grid_points", static_cast<uint64_t>(defaults.densityGridPoints), allocator);
    json.AddMember("control_label", stringValue(defaults.controlLabel, allocator), allocator);
    return json;
  }

  EngineDefaults ResultSerializer::deserializeEngineDefaults(const Value& json)
  {
    requireObject(json, "engine defaults");
    rejectUnknownMembers(json, { "alpha", "bucketing_strategy", "bucket_count", "credible_level",
				 "minimum_posterior_draws", "number_of_chains", "max_rhat",
				 "min_effective_sample_size", "weight_tolerance", "binary_power_grid_step",
				 "binary_power_grid_max", "continuous_power_grid_steps",
				 "continuous_power_grid_span_se", "density_grid_points", "control_label" },
			 "engine defaults");

    EngineDefaults defaults;
    if (hasMember(json, "alpha"))
      defaults.alpha = getDouble(json, "alpha");
    if (hasMember(json, "bucketing_strategy"))
      defaults.bucketingStrategy = parseBucketingStrategy(getString(json, "bucketing_strategy"));
    if (hasMember(json, "bucket_count"))
      defaults.bucketCount = getSize(json, "bucket_count");
    if (hasMember(json, "credible_level"))
      defaults.credibleLevel = getDouble(json, "credible_level");
    if (hasMember(json, "minimum_posterior_draws"))
      defaults.minimumPosteriorDraws = getSize(json, "minimum_posterior_draws");
    if (hasMember(json, "number_of_chains"))
      defaults.numberOfChains = getSize(json, "number_of_chains");
    if (hasMember(json, "max_rhat"))
      defaults.maxRHat = getDouble(json, "max_rhat");
    if (hasMember(json, "min_effective_sample_size"))
      defaults.minEffectiveSampleSize = getDouble(json, "min_effective_sample_size");
    if (hasMember(json, "weight_tolerance"))
      defaults.weightTolerance = getDouble(json, "weight_tolerance");
    if (hasMember(json, "binary_power_grid_step"))
      defaults.binaryPowerGridStep = getDouble(json, "binary_power_grid_step");
    if (hasMember(json, "binary_power_grid_max"))
      defaults.binaryPowerGridMax = getDouble(json, "binary_power_grid_max");
    if (hasMember(json, "continuous_power_grid_steps"))
      defaults.continuousPowerGridSteps = getSize(json, "continuous_power_grid_steps");
    if (hasMember(json, "continuous_power_grid_span_se"))
      defaults.continuousPowerGridSpanSE = getDouble(json, "continuous_power_grid_span_se");
    if (hasMember(json, "density_grid_points"))
      defaults.densityGridPoints = getSize(json, "density_grid_points");
    if (hasMember(json, "control_label"))
      defaults.controlLabel = getString(json, "control_label");

    return defaults;
  }

  // ---------------------------------------------------------------------
  // GroupSummary

  Value ResultSerializer::serializeSummary(const GroupSummary& summary, Allocator& allocator)
  {
    Value json(kObjectType);
    json.AddMember("label", stringValue(summary.getLabel(), allocator), allocator);
    json.AddMember("metric_kind", stringValue(toString(summary.getMetricKind()), allocator), allocator);
    json.AddMember("sample_size", static_cast<uint64_t>(summary.getSampleSize()), allocator);
    json.AddMember("sum", summary.getSum(), allocator);
    json.AddMember("mean", summary.getMean(), allocator);
    json.AddMember("variance", summary.getVariance(), allocator);
    json.AddMember("variance_model", stringValue(toString(summary.getVarianceModel()), allocator), allocator);
    if (auto conversions = summary.getConversions())
      json.AddMember("conversions", static_cast<uint64_t>(*conversions), allocator);
    return json;
  }

  GroupSummary ResultSerializer::deserializeSummary(const Value& json)
  {
    requireObject(json, "group summary");

    // mean and conversions are derived from sum and sample size
    return GroupSummary(getString(json, "label"),
			parseMetricKind(getString(json, "metric_kind")),
			getSize(json, "sample_size"),
			getDouble(json, "sum"),
			getDouble(json, "variance"),
			parseCountVarianceModel(getString(json, "variance_model")));
  }

  // ---------------------------------------------------------------------
  // Curve

  Value ResultSerializer::serializeCurve(const Curve& curve, Allocator& allocator)
  {
    Value json(kObjectType);
    json.AddMember("name", stringValue(curve.name, allocator), allocator);
    json.AddMember("x_label", stringValue(curve.xLabel, allocator), allocator);
    json.AddMember("y_label", stringValue(curve.yLabel, allocator), allocator);
    json.AddMember("x", doubleArray(curve.x, allocator), allocator);
    json.AddMember("y", doubleArray(curve.y, allocator), allocator);
    return json;
  }

  Curve ResultSerializer::deserializeCurve(const Value& json)
  {
    requireObject(json, "curve");

    Curve curve;
    curve.name = getString(json, "name");
    curve.xLabel = getString(json, "x_label");
    curve.yLabel = getString(json, "y_label");
    curve.x = readDoubleArray(json, "x");
    curve.y = readDoubleArray(json, "y");
    if (curve.x.size() != curve.y.size())
      throw SerializationError("curve '" + curve.name + "': x and y have different lengths");
    return curve;
  }

  // ---------------------------------------------------------------------
  // TestResult

  Value ResultSerializer::serializeResult(const TestResult& result, Allocator& allocator)
  {
    Value json(kObjectType);
    json.AddMember("test_type", stringValue(toString(result.testType), allocator), allocator);
    json.AddMember("metric_kind", stringValue(toString(result.metricKind), allocator), allocator);
    json.AddMember("decision", stringValue(toString(result.decision), allocator), allocator);
    json.AddMember("control", serializeSummary(result.control, allocator), allocator);
    json.AddMember("treatment", serializeSummary(result.treatment, allocator), allocator);
    json.AddMember("absolute_effect", result.absoluteEffect, allocator);
    addOptional(json, "relative_uplift", result.relativeUplift, allocator);

    addOptional(json, "statistic", result.statistic, allocator);
    addOptional(json, "degrees_of_freedom", result.degreesOfFreedom, allocator);
    addOptional(json, "p_value", result.pValue, allocator);
    addOptional(json, "achieved_power", result.achievedPower, allocator);
    if (result.requiredSampleSize)
      json.AddMember("required_sample_size", static_cast<uint64_t>(*result.requiredSampleSize), allocator);

    addOptional(json, "probability_of_superiority", result.probabilityOfSuperiority, allocator);
    addOptional(json, "expected_loss_treatment", result.expectedLossTreatment, allocator);
    addOptional(json, "expected_loss_control", result.expectedLossControl, allocator);
    addOptional(json, "expected_uplift", result.expectedUplift, allocator);
    addOptional(json, "r_hat", result.rHat, allocator);
    addOptional(json, "effective_sample_size", result.effectiveSampleSize, allocator);
    json.AddMember("posterior_draws", static_cast<uint64_t>(result.posteriorDraws), allocator);
    json.AddMember("approximated", result.approximated, allocator);

    if (result.interval)
      {
	Value interval(kObjectType);
	interval.AddMember("lower", result.interval->lower, allocator);
	interval.AddMember("upper", result.interval->upper, allocator);
	interval.AddMember("level", result.interval->level, allocator);
	interval.AddMember("quantity", stringValue(result.interval->quantity, allocator), allocator);
	json.AddMember("interval", interval, allocator);
      }

    addOptional(json, "adjusted_p_value", result.adjustedPValue, allocator);
    addOptional(json, "adjusted_threshold", result.adjustedThreshold, allocator);

    json.AddMember("sample_size", static_cast<uint64_t>(result.sampleSize), allocator);
    json.AddMember("look_index", static_cast<uint64_t>(result.lookIndex), allocator);
    json.AddMember("low_information", result.lowInformation, allocator);

    Value notes(kArrayType);
    for (const auto& note : result.notes)
      notes.PushBack(stringValue(note, allocator), allocator);
    json.AddMember("notes", notes, allocator);

    Value curves(kArrayType);
    for (const auto& curve : result.curves)
      curves.PushBack(serializeCurve(curve, allocator), allocator);
    json.AddMember("curves", curves, allocator);

    return json;
  }

  TestResult ResultSerializer::deserializeResult(const Value& json)
  {
    requireObject(json, "test result");

    TestResult result(parseTestType(getString(json, "test_type")),
		      parseMetricKind(getString(json, "metric_kind")),
		      deserializeSummary(member(json, "control")),
		      deserializeSummary(member(json, "treatment")));

    result.decision = parseDecision(getString(json, "decision"));
    result.absoluteEffect = getDouble(json, "absolute_effect");
    result.relativeUplift = getOptionalDouble(json, "relative_uplift");

    result.statistic = getOptionalDouble(json, "statistic");
    result.degreesOfFreedom = getOptionalDouble(json, "degrees_of_freedom");
    result.pValue = getOptionalDouble(json, "p_value");
    result.achievedPower = getOptionalDouble(json, "achieved_power");
    if (hasMember(json, "required_sample_size"))
      result.requiredSampleSize = getSize(json, "required_sample_size");

    result.probabilityOfSuperiority = getOptionalDouble(json, "probability_of_superiority");
    result.expectedLossTreatment = getOptionalDouble(json, "expected_loss_treatment");
    result.expectedLossControl = getOptionalDouble(json, "expected_loss_control");
    result.expectedUplift = getOptionalDouble(json, "expected_uplift");
    result.rHat = getOptionalDouble(json, "r_hat");
    result.effectiveSampleSize = getOptionalDouble(json, "effective_sample_size");
    result.posteriorDraws = getSize(json, "posterior_draws");
    result.approximated = getBool(json, "approximated");

    if (hasMember(json, "interval"))
      {
	const Value& interval = json["interval"];
	requireObject(interval, "interval");
	IntervalEstimate estimate;
	estimate.lower = getDouble(interval, "lower");
	estimate.upper = getDouble(interval, "upper");
	estimate.level = getDouble(interval, "level");
	estimate.quantity = getString(interval, "quantity");
	result.interval = estimate;
      }

    result.adjustedPValue = getOptionalDouble(json, "adjusted_p_value");
    result.adjustedThreshold = getOptionalDouble(json, "adjusted_threshold");

    result.sampleSize = getSize(json, "sample_size");
    result.lookIndex = getSize(json, "look_index");
    result.lowInformation = getBool(json, "low_information");

    const Value& notes = member(json, "notes");
    if (!notes.IsArray())
      throw SerializationError("field 'notes' must be an array");
    for (const auto& note : notes.GetArray())
      result.notes.push_back(asString(note, "notes"));

    const Value& curves = member(json, "curves");
    if (!curves.IsArray())
      throw SerializationError("field 'curves' must be an array");
    for (const auto& curve : curves.GetArray())
      result.curves.push_back(deserializeCurve(curve));

    return result;
  }

  // ---------------------------------------------------------------------
  // AggregateReport

  Value ResultSerializer::serializeCorrectionEntry(const CorrectionEntry& entry, Allocator& allocator)
  {
    Value json(kObjectType);
    json.AddMember("index", static_cast<uint64_t>(entry.index), allocator);
    json.AddMember("raw_p_value", entry.rawPValue, allocator);
    json.AddMember("adjusted_p_value", entry.adjustedPValue, allocator);
    json.AddMember("threshold", entry.threshold, allocator);
    json.AddMember("rank", static_cast<uint64_t>(entry.rank), allocator);
    json.AddMember("significant", entry.significant, allocator);
    return json;
  }

  CorrectionEntry ResultSerializer::deserializeCorrectionEntry(const Value& json)
  {
    requireObject(json, "correction entry");

    CorrectionEntry entry;
    entry.index = getSize(json, "index");
    entry.rawPValue = getDouble(json, "raw_p_value");
    entry.adjustedPValue = getDouble(json, "adjusted_p_value");
    entry.threshold = getDouble(json, "threshold");
    entry.rank = getSize(json, "rank");
    entry.significant = getBool(json, "significant");
    return entry;
  }

  Value ResultSerializer::serializeReport(const AggregateReport& report, Allocator& allocator)
  {
    Value json(kObjectType);
    json.AddMember("correction_method", stringValue(toString(report.getCorrectionMethod()), allocator),
		   allocator);
    json.AddMember("target_alpha", report.getTargetAlpha(), allocator);

    Value counts(kObjectType);
    for (const auto& entry : report.getDecisionCounts())
      {
	Value key = stringValue(toString(entry.first), allocator);
	Value count(static_cast<uint64_t>(entry.second));
	counts.AddMember(key, count, allocator);
      }
    json.AddMember("decision_counts", counts, allocator);

    Value results(kArrayType);
    for (const auto& named : report.getResults())
      {
	Value item(kObjectType);
	item.AddMember("name", stringValue(named.name, allocator), allocator);
	item.AddMember("result", serializeResult(named.result, allocator), allocator);
	results.PushBack(item, allocator);
      }
    json.AddMember("results", results, allocator);

    Value corrections(kArrayType);
    for (const auto& entry : report.getCorrections())
      corrections.PushBack(serializeCorrectionEntry(entry, allocator), allocator);
    json.AddMember("corrections", corrections, allocator);

    return json;
  }

  AggregateReport ResultSerializer::deserializeReport(const Value& json)
  {
    requireObject(json, "report");

    std::vector<NamedResult> results;
    const Value& items = member(json, "results");
    if (!items.IsArray())
      throw SerializationError("field 'results' must be an array");
    for (const auto& item : items.GetArray())
      {
	requireObject(item, "report entry");
	results.push_back(NamedResult{ getString(item, "name"), deserializeResult(member(item, "result")) });
      }

    std::vector<CorrectionEntry> corrections;
    const Value& entries = member(json, "corrections");
    if (!entries.IsArray())
      throw SerializationError("field 'corrections' must be an array");
    for (const auto& entry : entries.GetArray())
      corrections.push_back(deserializeCorrectionEntry(entry));

    // decision_counts is recomputed from the results
    return AggregateReport(parseCorrectionMethod(getString(json, "correction_method")),
			   getDouble(json, "target_alpha"),
			   std::move(results),
			   std::move(corrections));
  }

  // ---------------------------------------------------------------------
  // String entry points

  std::string ResultSerializer::toJson(const TestConfiguration& config, bool pretty)
  {
    Document doc;
    return write(serializeConfiguration(config, doc.GetAllocator()), pretty);
  }

  std::string ResultSerializer::toJson(const EngineDefaults& defaults, bool pretty)
  {
    Document doc;
    return write(serializeEngineDefaults(defaults, doc.GetAllocator()), pretty);
  }

  std::string ResultSerializer::toJson(const GroupSummary& summary, bool pretty)
  {
    Document doc;
    return write(serializeSummary(summary, doc.GetAllocator()), pretty);
  }

  std::string ResultSerializer::toJson(const TestResult& result, bool pretty)
  {
    Document doc;
    return write(serializeResult(result, doc.GetAllocator()), pretty);
  }

  std::string ResultSerializer::toJson(const AggregateReport& report, bool pretty)
  {
    Document doc;
    return write(serializeReport(report, doc.GetAllocator()), pretty);
  }

  TestConfiguration ResultSerializer::configurationFromJson(const std::string& json)
  {
    Document doc;
    parse(doc, json);
    return deserializeConfiguration(doc);
  }

  EngineDefaults ResultSerializer::engineDefaultsFromJson(const std::string& json)
  {
    Document doc;
    parse(doc, json);
    return deserializeEngineDefaults(doc);
  }

  GroupSummary ResultSerializer::summaryFromJson(const std::string& json)
  {
    Document doc;
    parse(doc, json);
    return deserializeSummary(doc);
  }

  TestResult ResultSerializer::resultFromJson(const std::string& json)
  {
    Document doc;
    parse(doc, json);
    return deserializeResult(doc);
  }

  AggregateReport ResultSerializer::reportFromJson(const std::string& json)
  {
    Document doc;
    parse(doc, json);
    return deserializeReport(doc);
  }

} // namespace mkc_abtest
