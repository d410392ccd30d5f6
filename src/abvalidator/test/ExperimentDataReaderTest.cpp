#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <fstream>
#include <boost/filesystem.hpp>

#include "ExperimentDataReader.h"

using namespace abvalidator;
using Catch::Approx;

TEST_CASE("ExperimentDataReader: records", "[dataset]")
{
  const auto observations = ExperimentDataReader::parse(R"([
    { "user_id": "u1", "event": 1 },
    { "user_id": 42, "event": false },
    { "user_id": "u3", "value": 12.5, "group": "test1", "timestamp": "2024-06-01T10:00:00Z" },
    { "user_id": "u4", "value": 3, "group": null }
  ])");

  REQUIRE(observations.size() == 4);

  REQUIRE(observations[0].subjectId == "u1");
  REQUIRE(observations[0].value == 1.0);
  REQUIRE_FALSE(observations[0].group.has_value());

  REQUIRE(observations[1].subjectId == "42");
  REQUIRE(observations[1].value == 0.0);

  REQUIRE(observations[2].value == Approx(12.5));
  REQUIRE(*observations[2].group == "test1");
  REQUIRE(*observations[2].timestamp == "2024-06-01T10:00:00Z");

  REQUIRE_FALSE(observations[3].group.has_value());
  REQUIRE(observations[3].value == 3.0);
}

TEST_CASE("ExperimentDataReader: empty dataset", "[dataset]")
{
  REQUIRE(ExperimentDataReader::parse("[]").empty());
}

TEST_CASE("ExperimentDataReader: malformed input", "[dataset][errors]")
{
  REQUIRE_THROWS_AS(ExperimentDataReader::parse("[{\"user_id\": \"u1\", "), DatasetFormatError);
  REQUIRE_THROWS_AS(ExperimentDataReader::parse(R"({"user_id": "u1", "event": 1})"), DatasetFormatError);
  REQUIRE_THROWS_AS(ExperimentDataReader::parse(R"([1, 2])"), DatasetFormatError);
  REQUIRE_THROWS_AS(ExperimentDataReader::parse(R"([{"event": 1}])"), DatasetFormatError);
  REQUIRE_THROWS_AS(ExperimentDataReader::parse(R"([{"user_id": 1.5, "event": 1}])"), DatasetFormatError);
  REQUIRE_THROWS_AS(ExperimentDataReader::parse(R"([{"user_id": "u1"}])"), DatasetFormatError);
  REQUIRE_THROWS_AS(ExperimentDataReader::parse(R"([{"user_id": "u1", "event": 1, "value": 2}])"),
		    DatasetFormatError);
  REQUIRE_THROWS_AS(ExperimentDataReader::parse(R"([{"user_id": "u1", "event": "yes"}])"), DatasetFormatError);
  REQUIRE_THROWS_AS(ExperimentDataReader::parse(R"([{"user_id": "u1", "event": 1, "group": 2}])"),
		    DatasetFormatError);

  SECTION("The failing record is named")
  {
    try
      {
	ExperimentDataReader::parse(R"([{"user_id": "u1", "event": 1}, {"user_id": "u2"}])");
	FAIL("expected DatasetFormatError");
      }
    catch (const DatasetFormatError& e)
      {
	REQUIRE(std::string(e.what()).find("record 1") != std::string::npos);
      }
  }
}

TEST_CASE("ExperimentDataReader: files", "[dataset][file]")
{
  namespace fs = boost::filesystem;

  const fs::path path = fs::temp_directory_path() / fs::unique_path("abvalidator-%%%%-%%%%.json");
  {
    std::ofstream out(path.string());
    out << R"([{"user_id": "a", "event": 1}, {"user_id": "b", "event": 0}])";
  }

  const auto observations = ExperimentDataReader::readFile(path.string());
  REQUIRE(observations.size() == 2);
  fs::remove(path);

  REQUIRE_THROWS_AS(ExperimentDataReader::readFile(path.string()), DatasetFormatError);
}
