#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <cmath>

#include "ABTestException.h"
#include "FrequentistTest.h"

using namespace mkc_abtest;
using Catch::Approx;

TEST_CASE("FrequentistTest: two-proportion z-test", "[frequentist]")
{
  EngineDefaults defaults;
  FrequentistTest engine(defaults);
  const TestConfiguration config;

  const auto control = GroupSummary::fromConversions("control", 100, 1000);
  const auto treatment = GroupSummary::fromConversions("test1", 130, 1000);

  const TestResult result = engine.run(control, treatment, config);

  REQUIRE(result.testType == TestType::Frequentist);
  REQUIRE(result.absoluteEffect == Approx(0.03));
  REQUIRE(result.relativeUplift.value() == Approx(0.3));
  REQUIRE(result.statistic.value() == Approx(2.1027).margin(1e-3));
  REQUIRE(result.pValue.value() == Approx(0.0355).margin(1e-3));
  REQUIRE(result.pValue.value() < 0.05);
  REQUIRE(result.decision == Decision::Significant);
  REQUIRE_FALSE(result.degreesOfFreedom.has_value());

  REQUIRE(result.interval.has_value());
  REQUIRE(result.interval->level == Approx(0.95));
  REQUIRE(result.interval->quantity == "difference");
  REQUIRE_FALSE(result.interval->contains(0.0));
  REQUIRE(result.interval->lower == Approx(0.03 - 1.959964 * std::sqrt(0.09 / 1000 + 0.1131 / 1000)).margin(1e-5));

  SECTION("One-tailed test halves the p-value")
  {
    const auto oneTailed = engine.run(control, treatment,
				      config.withAlternative(AlternativeHypothesis::OneTailed));
    REQUIRE(oneTailed.pValue.value() == Approx(result.pValue.value() / 2.0).margin(1e-6));
  }
}

TEST_CASE("FrequentistTest: identical summaries", "[frequentist]")
{
  EngineDefaults defaults;
  FrequentistTest engine(defaults);
  const auto control = GroupSummary::fromConversions("control", 100, 1000);
  const auto treatment = GroupSummary::fromConversions("test1", 100, 1000);

  const TestResult result = engine.run(control, treatment, TestConfiguration());

  REQUIRE(result.pValue.value() == Approx(1.0));
  REQUIRE(result.statistic.value() == Approx(0.0));
  REQUIRE(result.interval->contains(0.0));
  REQUIRE(result.decision == Decision::NotSignificant);
}

TEST_CASE("FrequentistTest: Welch t-test for continuous metrics", "[frequentist]")
{
  EngineDefaults defaults;
  FrequentistTest engine(defaults);
  const auto config = TestConfiguration().withMetricKind(MetricKind::Continuous);

  const auto control = GroupSummary::fromMoments("control", MetricKind::Continuous, 50, 10.0, 4.0);
  const auto treatment = GroupSummary::fromMoments("test1", MetricKind::Continuous, 50, 11.0, 4.0);

  const TestResult result = engine.run(control, treatment, config);

  REQUIRE(result.statistic.value() == Approx(2.5));
  REQUIRE(result.degreesOfFreedom.value() == Approx(98.0));
  REQUIRE(result.pValue.value() == Approx(0.0141).margin(1e-3));
  REQUIRE(result.decision == Decision::Significant);

  SECTION("Unequal variances lower the degrees of freedom")
  {
    const auto wide = GroupSummary::fromMoments("test1", MetricKind::Continuous, 20, 11.0, 25.0);
    const auto unequal = engine.run(control, wide, config);
    REQUIRE(unequal.degreesOfFreedom.value() < 68.0);
  }
}

TEST_CASE("FrequentistTest: zero variance never produces NaN", "[frequentist]")
{
  EngineDefaults defaults;
  FrequentistTest engine(defaults);

  SECTION("No conversions in either group")
  {
    const auto result = engine.run(GroupSummary::fromConversions("control", 0, 100),
				   GroupSummary::fromConversions("test1", 0, 100),
				   TestConfiguration());
    REQUIRE(result.pValue.value() == 1.0);
    REQUIRE(result.interval->lower == 0.0);
    REQUIRE(result.interval->upper == 0.0);
    REQUIRE(result.decision == Decision::NotSignificant);
    REQUIRE_FALSE(result.notes.empty());
  }

  SECTION("Constant continuous values that differ")
  {
    const auto config = TestConfiguration().withMetricKind(MetricKind::Continuous);
    const auto result = engine.run(GroupSummary::fromMoments("control", MetricKind::Continuous, 10, 5.0, 0.0),
				   GroupSummary::fromMoments("test1", MetricKind::Continuous, 10, 6.0, 0.0),
				   config);
    REQUIRE(result.pValue.value() == 0.0);
    REQUIRE(result.interval->lower == Approx(1.0));
    REQUIRE(result.interval->upper == Approx(1.0));
    REQUIRE(result.decision == Decision::Significant);
    REQUIRE_FALSE(std::isnan(result.absoluteEffect));
  }
}

TEST_CASE("FrequentistTest: count metrics use the normal approximation", "[frequentist]")
{
  EngineDefaults defaults;
  FrequentistTest engine(defaults);
  const auto config = TestConfiguration().withMetricKind(MetricKind::Count);

  const auto control = GroupSummary::fromMoments("control", MetricKind::Count, 400, 2.0, 0.0, CountVarianceModel::Poisson);
  const auto treatment = GroupSummary::fromMoments("test1", MetricKind::Count, 400, 2.3, 0.0, CountVarianceModel::Poisson);

  const auto result = engine.run(control, treatment, config);
  const double se = std::sqrt(2.0 / 400.0 + 2.3 / 400.0);
  REQUIRE(result.statistic.value() == Approx(0.3 / se));
  REQUIRE_FALSE(result.degreesOfFreedom.has_value());
}

TEST_CASE("FrequentistTest: power and sample size", "[frequentist]")
{
  EngineDefaults defaults;
  FrequentistTest engine(defaults);
  const auto control = GroupSummary::fromConversions("control", 100, 1000);
  const auto treatment = GroupSummary::fromConversions("test1", 110, 1000);

  SECTION("Power at zero effect equals alpha")
  {
    REQUIRE(engine.power(control, treatment, 0.0, 0.05, AlternativeHypothesis::TwoTailed) ==
	    Approx(0.05).margin(1e-4));
  }

  SECTION("Power curve starts at alpha and never decreases")
  {
    const Curve curve = engine.powerCurve(control, treatment, 0.05, AlternativeHypothesis::TwoTailed);
    REQUIRE(curve.name == curve_names::kPowerCurve);
    REQUIRE(curve.x.size() == 40);
    REQUIRE(curve.y.front() == Approx(0.05).margin(1e-4));
    for (std::size_t i = 1; i < curve.y.size(); ++i)
      REQUIRE(curve.y[i] >= curve.y[i - 1]);
    REQUIRE(curve.y.back() > 0.99);
  }

  SECTION("Required sample size for a 3 point lift at 80% power")
  {
    const std::size_t n = engine.requiredSampleSize(control, treatment, 0.03, 0.05, 0.8,
						    AlternativeHypothesis::TwoTailed);
    REQUIRE(n >= 1765);
    REQUIRE(n <= 1780);
    REQUIRE_THROWS_AS(engine.requiredSampleSize(control, treatment, 0.0, 0.05, 0.8,
						AlternativeHypothesis::TwoTailed),
		      ConfigurationError);
  }

  SECTION("Run reports power when a minimum detectable effect is configured")
  {
    const auto result = engine.run(control, treatment, TestConfiguration().withMinimumDetectableEffect(0.03));
    REQUIRE(result.achievedPower.has_value());
    REQUIRE(result.requiredSampleSize.has_value());
    REQUIRE(result.findCurve(curve_names::kPowerCurve) != nullptr);
  }
}

TEST_CASE("FrequentistTest: input errors", "[frequentist]")
{
  EngineDefaults defaults;
  FrequentistTest engine(defaults);

  REQUIRE_THROWS_AS(engine.run(GroupSummary::fromConversions("control", 1, 1),
			       GroupSummary::fromConversions("test1", 5, 10),
			       TestConfiguration()),
		    InsufficientDataError);

  REQUIRE_THROWS_AS(engine.run(GroupSummary::fromConversions("control", 1, 10),
			       GroupSummary::fromConversions("test1", 5, 10),
			       TestConfiguration().withMetricKind(MetricKind::Continuous)),
		    ConfigurationError);
}
