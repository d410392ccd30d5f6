#include <catch2/catch_test_macros.hpp>
#include <catch2/catch_approx.hpp>
#include <atomic>
#include <chrono>
#include <cmath>

#include "ABTestException.h"
#include "BayesianTest.h"

using namespace mkc_abtest;
using Catch::Approx;

namespace
{
  TestConfiguration bayesianConfig(MetricKind kind = MetricKind::Binary)
  {
    return TestConfiguration().withTestType(TestType::Bayesian).withMetricKind(kind);
  }

  bool hasNoteContaining(const TestResult& result, const std::string& text)
  {
    for (const auto& note : result.notes)
      if (note.find(text) != std::string::npos)
	return true;
    return false;
  }
}

TEST_CASE("BayesianTest: conjugate posteriors", "[bayesian]")
{
  EngineDefaults defaults;
  BayesianTest engine(defaults);

  SECTION("Beta posterior adds the prior to the observed conversions")
  {
    const auto posterior = engine.posteriorFor(GroupSummary::fromConversions("control", 100, 1000),
					       bayesianConfig());
    REQUIRE(posterior.getFamily() == GroupPosterior::Family::Beta);
    REQUIRE(posterior.getFirst() == Approx(31.0 + 100.0));
    REQUIRE(posterior.getSecond() == Approx(71.0 + 900.0));
  }

  SECTION("Student-t posterior for a continuous mean")
  {
    const auto posterior = engine.posteriorFor(
      GroupSummary::fromMoments("control", MetricKind::Continuous, 100, 5.0, 4.0),
      bayesianConfig(MetricKind::Continuous));
    REQUIRE(posterior.getFamily() == GroupPosterior::Family::StudentT);
    REQUIRE(posterior.getFirst() == Approx(99.0));
    REQUIRE(posterior.getSecond() == Approx(5.0));
    REQUIRE(posterior.getThird() == Approx(0.2));
    REQUIRE(posterior.isSimulable());
  }

  SECTION("A single continuous observation gives an improper posterior")
  {
    const auto posterior = engine.posteriorFor(
      GroupSummary::fromMoments("control", MetricKind::Continuous, 1, 5.0, 0.0),
      bayesianConfig(MetricKind::Continuous));
    REQUIRE_FALSE(posterior.isSimulable());
  }
}

TEST_CASE("BayesianTest: closed form probability of superiority", "[bayesian]")
{
  SECTION("Uniform control against Beta(2, 1)")
  {
    const auto p = BayesianTest::closedFormProbabilityOfSuperiority(GroupPosterior::beta(1.0, 1.0),
								    GroupPosterior::beta(2.0, 1.0));
    REQUIRE(p.has_value());
    REQUIRE(*p == Approx(2.0 / 3.0));
  }

  SECTION("Identical posteriors")
  {
    const auto p = BayesianTest::closedFormProbabilityOfSuperiority(GroupPosterior::beta(131.0, 971.0),
								    GroupPosterior::beta(131.0, 971.0));
    REQUIRE(*p == Approx(0.5).margin(1e-6));
  }

  SECTION("Non-integral treatment alpha has no closed form")
  {
    REQUIRE_FALSE(BayesianTest::closedFormProbabilityOfSuperiority(GroupPosterior::beta(1.0, 1.0),
								   GroupPosterior::beta(2.5, 1.0)).has_value());
    REQUIRE_FALSE(BayesianTest::closedFormProbabilityOfSuperiority(GroupPosterior::gamma(2.0, 1.0),
								   GroupPosterior::gamma(2.0, 1.0)).has_value());
  }
}

TEST_CASE("BayesianTest: identical summaries", "[bayesian]")
{
  EngineDefaults defaults;
  BayesianTest engine(defaults);

  SECTION("Binary")
  {
    const auto result = engine.run(GroupSummary::fromConversions("control", 100, 1000),
				   GroupSummary::fromConversions("test1", 100, 1000),
				   bayesianConfig());
    REQUIRE(result.probabilityOfSuperiority.value() == Approx(0.5).margin(0.01));
    REQUIRE(result.decision == Decision::ContinueSampling);
    REQUIRE(hasNoteContaining(result, "closed form"));
  }

  SECTION("Continuous")
  {
    const auto summary = GroupSummary::fromMoments("control", MetricKind::Continuous, 200, 10.0, 4.0);
    const auto result = engine.run(summary, summary.withLabel("test1"), bayesianConfig(MetricKind::Continuous));
    REQUIRE(result.probabilityOfSuperiority.value() == Approx(0.5).margin(0.05));
    REQUIRE(result.interval->contains(0.0));
  }
}

TEST_CASE("BayesianTest: clear winner", "[bayesian]")
{
  EngineDefaults defaults;
  BayesianTest engine(defaults);

  const auto result = engine.run(GroupSummary::fromConversions("control", 100, 1000),
				 GroupSummary::fromConversions("test1", 200, 1000),
				 bayesianConfig());

  REQUIRE(result.probabilityOfSuperiority.value() > 0.999);
  REQUIRE(result.expectedLossTreatment.value() < 1e-4);
  REQUIRE(result.expectedLossControl.value() > 0.05);
  REQUIRE(result.decision == Decision::Significant);
  REQUIRE(result.posteriorDraws == 2000);
  REQUIRE_FALSE(result.approximated);
  REQUIRE(result.rHat.has_value());
  REQUIRE(result.effectiveSampleSize.value() >= defaults.minEffectiveSampleSize);

  REQUIRE(result.interval->quantity == "uplift:percent");
  REQUIRE(result.interval->level == Approx(0.95));
  REQUIRE(result.expectedUplift.value() > 0.5);
  REQUIRE(result.interval->lower < result.expectedUplift.value());
  REQUIRE(result.interval->upper > result.expectedUplift.value());

  const Curve* density = result.findCurve(curve_names::kUpliftDensity);
  const Curve* cumulative = result.findCurve(curve_names::kUpliftCumulative);
  REQUIRE(density != nullptr);
  REQUIRE(cumulative != nullptr);
  REQUIRE(density->x.size() == defaults.densityGridPoints);
  for (std::size_t i = 1; i < cumulative->y.size(); ++i)
    REQUIRE(cumulative->y[i] >= cumulative->y[i - 1]);
  REQUIRE(cumulative->y.back() == Approx(1.0));
}

TEST_CASE("BayesianTest: continuous posterior matches the normal limit", "[bayesian]")
{
  EngineDefaults defaults;
  BayesianTest engine(defaults);
  const auto config = bayesianConfig(MetricKind::Continuous).withUpliftMethod(UpliftMethod::Difference);

  const auto result = engine.run(GroupSummary::fromMoments("control", MetricKind::Continuous, 200, 10.0, 4.0),
				 GroupSummary::fromMoments("test1", MetricKind::Continuous, 200, 10.5, 4.0),
				 config);

  // D ~ N(0.5, 0.04) approximately: P(D > 0) = Phi(2.5)
  REQUIRE(result.probabilityOfSuperiority.value() == Approx(0.9938).margin(0.01));
  REQUIRE(result.expectedUplift.value() == Approx(0.5).margin(0.03));
  REQUIRE(result.interval->quantity == "uplift:difference");
}

TEST_CASE("BayesianTest: simulation is reproducible for a seed", "[bayesian]")
{
  EngineDefaults defaults;
  BayesianTest engine(defaults);
  const auto control = GroupSummary::fromMoments("control", MetricKind::Count, 300, 2.0, 0.0, CountVarianceModel::Poisson);
  const auto treatment = GroupSummary::fromMoments("test1", MetricKind::Count, 300, 2.1, 0.0, CountVarianceModel::Poisson);
  const auto config = bayesianConfig(MetricKind::Count).withRandomSeed(1234);

  const auto first = engine.run(control, treatment, config);
  const auto second = engine.run(control, treatment, config);
  REQUIRE(first == second);

  const auto reseeded = engine.run(control, treatment, config.withRandomSeed(4321));
  REQUIRE(reseeded.expectedUplift != first.expectedUplift);
  REQUIRE(reseeded.probabilityOfSuperiority.value() == Approx(first.probabilityOfSuperiority.value()).margin(0.05));
}

TEST_CASE("BayesianTest: simulation budget", "[bayesian]")
{
  EngineDefaults defaults;
  BayesianTest engine(defaults);
  const auto control = GroupSummary::fromConversions("control", 100, 1000);
  const auto treatment = GroupSummary::fromConversions("test1", 130, 1000);

  SECTION("A draw limit below the minimum is inconclusive")
  {
    const auto result = engine.run(control, treatment, bayesianConfig(),
				   SimulationBudget::fromConfiguration(bayesianConfig().withSimulationBudget(100, 0)));
    REQUIRE(result.decision == Decision::Inconclusive);
    REQUIRE_FALSE(result.probabilityOfSuperiority.has_value());
    REQUIRE(hasNoteContaining(result, "budget exhausted"));
  }

  SECTION("A cancelled run is inconclusive")
  {
    std::atomic<bool> cancelled{ true };
    SimulationBudget budget(0, std::chrono::milliseconds::zero(), &cancelled);
    const auto result = engine.run(control, treatment, bayesianConfig(), budget);
    REQUIRE(result.decision == Decision::Inconclusive);
  }

  SECTION("A generous budget changes nothing")
  {
    const auto limited = engine.run(control, treatment, bayesianConfig(),
				    SimulationBudget(1000000, std::chrono::milliseconds(60000)));
    const auto unlimited = engine.run(control, treatment, bayesianConfig());
    REQUIRE(limited == unlimited);
  }
}

TEST_CASE("BayesianTest: degenerate inputs", "[bayesian]")
{
  EngineDefaults defaults;

  SECTION("One continuous observation per group cannot be decided")
  {
    BayesianTest engine(defaults);
    const auto result = engine.run(GroupSummary::fromMoments("control", MetricKind::Continuous, 1, 5.0, 0.0),
				   GroupSummary::fromMoments("test1", MetricKind::Continuous, 1, 6.0, 0.0),
				   bayesianConfig(MetricKind::Continuous));
    REQUIRE(result.lowInformation);
    REQUIRE(result.decision == Decision::Inconclusive);
    REQUIRE_FALSE(result.notes.empty());
  }

  SECTION("Failed diagnostics fall back to the normal approximation")
  {
    defaults.minEffectiveSampleSize = 1.0e9;
    BayesianTest engine(defaults);
    const auto result = engine.run(GroupSummary::fromMoments("control", MetricKind::Continuous, 200, 10.0, 4.0),
				   GroupSummary::fromMoments("test1", MetricKind::Continuous, 200, 10.5, 4.0),
				   bayesianConfig(MetricKind::Continuous));
    REQUIRE(result.approximated);
    REQUIRE(result.posteriorDraws == 0);
    REQUIRE(result.probabilityOfSuperiority.value() == Approx(0.9938).margin(0.001));
    REQUIRE(hasNoteContaining(result, "normal approximation"));
    REQUIRE(result.findCurve(curve_names::kUpliftDensity) != nullptr);
  }

  SECTION("Empty group")
  {
    BayesianTest engine(defaults);
    REQUIRE_THROWS_AS(engine.run(GroupSummary::fromConversions("control", 0, 0),
				 GroupSummary::fromConversions("test1", 1, 10),
				 bayesianConfig()),
		      InsufficientDataError);
  }
}

TEST_CASE("BayesianTest: uplift forms", "[bayesian]")
{
  REQUIRE(computeUplift(0.1, 0.13, UpliftMethod::Percent) == Approx(0.3));
  REQUIRE(computeUplift(0.1, 0.13, UpliftMethod::Ratio) == Approx(1.3));
  REQUIRE(computeUplift(0.1, 0.13, UpliftMethod::Difference) == Approx(0.03));
  REQUIRE_FALSE(std::isfinite(computeUplift(0.0, 0.13, UpliftMethod::Percent)));
}
