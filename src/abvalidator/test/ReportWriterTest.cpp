#include <catch2/catch_test_macros.hpp>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>
#include <boost/filesystem.hpp>
#include <rapidjson/document.h>

#include "ReportWriter.h"
#include "utils/OutputUtils.h"

using namespace abvalidator;
using namespace mkc_abtest;

namespace
{
  std::vector<Observation> conversions(const std::string& group, std::size_t n, std::size_t converted)
  {
    std::vector<Observation> observations;
    for (std::size_t i = 0; i < n; ++i)
      {
	Observation observation;
	observation.subjectId = group + "-" + std::to_string(i);
	observation.value = (i < converted) ? 1.0 : 0.0;
	observation.group = group;
	observations.push_back(observation);
      }
    return observations;
  }

  ExperimentOutcome runExperiment(const TestConfiguration& config)
  {
    std::vector<Observation> observations = conversions("control", 1000, 100);
    const auto treatment = conversions("test1", 1000, 200);
    observations.insert(observations.end(), treatment.begin(), treatment.end());

    EngineDefaults defaults;
    return ExperimentPipeline(defaults).run(observations, GroupAllocation::evenSplit({ "control", "test1" }),
					    "checkout", config);
  }
}

TEST_CASE("ReportWriter: JSON document", "[report][json]")
{
  const TestConfiguration config = TestConfiguration().withMinimumDetectableEffect(0.03);
  const ExperimentOutcome outcome = runExperiment(config);
  ReportWriter writer("checkout", config);

  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseNanAndInfFlag>(writer.toJson(outcome).c_str());
  REQUIRE_FALSE(doc.HasParseError());

  REQUIRE(std::string(doc["experiment_key"].GetString()) == "checkout");
  REQUIRE(doc["configuration"].IsObject());
  REQUIRE(doc["summaries"].IsArray());
  REQUIRE(doc["summaries"].Size() == 2);
  REQUIRE(doc["report"]["results"].Size() == 1);
  REQUIRE(std::string(doc["report"]["results"][0]["name"].GetString()) == "test1");
  REQUIRE(doc["report"]["results"][0]["result"].HasMember("p_value"));
  REQUIRE(doc["report"]["results"][0]["result"]["curves"].Size() >= 1);
  REQUIRE_FALSE(doc.HasMember("sequential_traces"));
}

TEST_CASE("ReportWriter: sequential traces are written per group", "[report][json][sequential]")
{
  const TestConfiguration config = TestConfiguration().withSequential(true)
    .withMaxSampleSize(1000)
    .withNumberOfLooks(2);
  const ExperimentOutcome outcome = runExperiment(config);

  rapidjson::Document doc;
  doc.Parse<rapidjson::kParseNanAndInfFlag>(ReportWriter("checkout", config).toJson(outcome).c_str());
  REQUIRE_FALSE(doc.HasParseError());
  REQUIRE(doc.HasMember("sequential_traces"));
  REQUIRE(doc["sequential_traces"]["test1"].IsArray());
  REQUIRE(doc["sequential_traces"]["test1"].Size() == outcome.sequentialTraces.at("test1").size());
}

TEST_CASE("ReportWriter: console summary", "[report][console]")
{
  const TestConfiguration config;
  const ExperimentOutcome outcome = runExperiment(config);

  std::ostringstream os;
  ReportWriter("checkout", config).printSummary(outcome, os);
  const std::string text = os.str();

  REQUIRE(text.find("experiment 'checkout'") != std::string::npos);
  REQUIRE(text.find("control: n = 1000") != std::string::npos);
  REQUIRE(text.find("(200 / 1000)") != std::string::npos);
  REQUIRE(text.find("test1 vs control") != std::string::npos);
  REQUIRE(text.find("Relative uplift: +100.00%") != std::string::npos);
  REQUIRE(text.find("95% interval") != std::string::npos);
  REQUIRE(text.find("Decision: significant") != std::string::npos);
  REQUIRE(text.find("Significant: 1") != std::string::npos);
}

TEST_CASE("ReportWriter: file output", "[report][file]")
{
  namespace fs = boost::filesystem;

  const TestConfiguration config;
  const ExperimentOutcome outcome = runExperiment(config);
  ReportWriter writer("checkout", config);

  const fs::path path = fs::temp_directory_path() / fs::unique_path("abvalidator-report-%%%%-%%%%.json");
  writer.writeJson(outcome, path.string());
  REQUIRE(fs::exists(path));
  REQUIRE(fs::file_size(path) > 0);
  fs::remove(path);

  REQUIRE_THROWS_AS(writer.writeJson(outcome, "/nonexistent-directory/report.json"), std::runtime_error);
}

TEST_CASE("OutputUtils: formatting and tee stream", "[report][utils]")
{
  REQUIRE(utils::formatNumber(0.123456) == "0.1235");
  REQUIRE(utils::formatNumber(2.0, 0) == "2");
  REQUIRE(utils::formatPercent(0.1234) == "+12.34%");
  REQUIRE(utils::formatPercent(-0.05, 1) == "-5.0%");

  std::ostringstream a, b;
  utils::TeeStream tee(a, b);
  tee << "look " << 3 << std::endl;
  REQUIRE(a.str() == "look 3\n");
  REQUIRE(b.str() == "look 3\n");
}
