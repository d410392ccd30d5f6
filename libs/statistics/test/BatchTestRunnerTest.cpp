#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <string>
#include <vector>

#include "BatchTestRunner.h"
#include "ParallelExecutors.h"
#include "ABTestException.h"

using namespace mkc_abtest;
using Catch::Approx;

namespace
{
  std::vector<BatchTestCase> makeCases()
  {
    const auto bayesian = TestConfiguration().withTestType(TestType::Bayesian)
      .withCorrectionMethod(CorrectionMethod::BenjaminiHochberg);

    std::vector<BatchTestCase> cases;
    for (std::size_t i = 0; i < 6; ++i)
      cases.push_back(BatchTestCase{ "variant_" + std::to_string(i),
				     GroupSummary::fromConversions("control", 100, 1000),
				     GroupSummary::fromConversions("treatment", 95 + 10 * i, 1000),
				     bayesian });
    return cases;
  }
}

TEST_CASE("BatchTestRunner: identical reports on any executor", "[batch][concurrency]")
{
  EngineDefaults defaults;
  const auto cases = makeCases();

  concurrency::SingleThreadExecutor single;
  concurrency::ThreadPoolExecutor pool(4);

  const AggregateReport sequential = BatchTestRunner(defaults, single, 2024).run(cases);
  const AggregateReport parallel = BatchTestRunner(defaults, pool, 2024).run(cases);

  REQUIRE(sequential.size() == cases.size());
  REQUIRE(sequential == parallel);
  REQUIRE(sequential.getCorrectionMethod() == CorrectionMethod::BenjaminiHochberg);
  REQUIRE(sequential.getTargetAlpha() == Approx(0.05));

  for (std::size_t i = 0; i < cases.size(); ++i)
    REQUIRE(sequential.getResults()[i].name == cases[i].name);

  // The strongest treatment converts 45% better than control
  REQUIRE(sequential.getResult("variant_5").decision == Decision::Significant);

  SECTION("A different master seed changes the draws")
  {
    const AggregateReport reseeded = BatchTestRunner(defaults, single, 7).run(cases);
    REQUIRE_FALSE(reseeded == sequential);
  }
}

TEST_CASE("BatchTestRunner: per-run seeds", "[batch]")
{
  REQUIRE(BatchTestRunner::seedForRun(1, 0) == BatchTestRunner::seedForRun(1, 0));
  REQUIRE(BatchTestRunner::seedForRun(1, 0) != BatchTestRunner::seedForRun(1, 1));
  REQUIRE(BatchTestRunner::seedForRun(1, 0) != BatchTestRunner::seedForRun(2, 0));
}

TEST_CASE("BatchTestRunner: errors", "[batch][errors]")
{
  EngineDefaults defaults;
  concurrency::ThreadPoolExecutor pool(2);
  BatchTestRunner runner(defaults, pool, 1);

  SECTION("Duplicate names")
  {
    auto cases = makeCases();
    cases[3].name = cases[1].name;
    REQUIRE_THROWS_AS(runner.runAll(cases), ConfigurationError);
  }

  SECTION("Invalid configuration")
  {
    auto cases = makeCases();
    cases[2].config = cases[2].config.withStoppingThreshold(0.2);
    REQUIRE_THROWS_AS(runner.runAll(cases), ConfigurationError);
  }

  SECTION("Errors raised inside a run reach the caller")
  {
    auto cases = makeCases();
    cases[4].treatment = GroupSummary::fromConversions("treatment", 0, 0);
    REQUIRE_THROWS_AS(runner.runAll(cases), InsufficientDataError);
  }

  SECTION("Empty batch")
  {
    REQUIRE(runner.run({}).size() == 0);
  }
}
