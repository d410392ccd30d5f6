// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ExperimentPipeline.h"
#include "ABTestException.h"
#include "RngUtils.h"
#include "SequentialTest.h"
#include <algorithm>
#include <set>

namespace mkc_abtest
{
  namespace
  {
    const std::string* groupOf(const Observation& observation, const GroupAssignment& assignment)
    {
      if (observation.group)
	return &*observation.group;

      auto it = assignment.find(observation.subjectId);
      return (it == assignment.end()) ? nullptr : &it->second;
    }
  }

  ExperimentPipeline::ExperimentPipeline(const EngineDefaults& defaults, std::ostream* log)
    : mDefaults(defaults),
      mLog(log),
      mBucketing(defaults),
      mRunner(defaults)
  {}

  GroupAssignment ExperimentPipeline::assignSubjects(const std::vector<Observation>& observations,
						     const GroupAllocation& allocation,
						     const std::string& experimentKey,
						     BucketingStrategy strategy,
						     std::optional<uint64_t> seed) const
  {
    std::vector<std::string> subjects;
    std::set<std::string> seen;
    for (const auto& observation : observations)
      if (!observation.group && seen.insert(observation.subjectId).second)
	subjects.push_back(observation.subjectId);

    return mBucketing.assignAll(subjects, experimentKey, strategy, allocation, seed);
  }

  TestConfiguration ExperimentPipeline::comparisonConfiguration(const TestConfiguration& config,
								const std::string& treatmentLabel) const
  {
    const uint64_t seed = rng_utils::hash_combine64({ config.getRandomSeed(),
						      rng_utils::fnv1a64(treatmentLabel) });
    return config.withRandomSeed(seed);
  }

  ExperimentOutcome ExperimentPipeline::run(const std::vector<Observation>& observations,
					    const GroupAllocation& allocation,
					    const std::string& experimentKey,
					    const TestConfiguration& config) const
  {
    return run(observations, allocation, experimentKey, config, mDefaults.bucketingStrategy);
  }

  ExperimentOutcome ExperimentPipeline::run(const std::vector<Observation>& observations,
					    const GroupAllocation& allocation,
					    const std::string& experimentKey,
					    const TestConfiguration& config,
					    BucketingStrategy strategy) const
  {
    config.validate();

    const std::string& controlLabel = mDefaults.controlLabel;
    ExperimentOutcome outcome;

    std::optional<uint64_t> seed;
    if (strategy == BucketingStrategy::SeededRandom)
      seed = config.getRandomSeed();

    outcome.assignment = assignSubjects(observations, allocation, experimentKey, strategy, seed);

    if (mLog)
      *mLog << "Experiment '" << experimentKey << "': " << observations.size() << " observations, "
	    << outcome.assignment.size() << " subjects bucketed with the " << toString(strategy)
	    << " strategy" << std::endl;

    SummaryStatisticsExtractor extractor(config.getMetricKind(), config.getCountVarianceModel());
    bool controlSeen = allocation.contains(controlLabel);
    for (const auto& observation : observations)
      if (observation.group && *observation.group == controlLabel)
	controlSeen = true;

    if (!controlSeen)
      throw ConfigurationError("experiment has no '" + controlLabel + "' group to compare against");

    outcome.summaries = extractor.summarize(observations, outcome.assignment, config.getTestType(),
					    allocation.getLabels());

    auto controlIt = outcome.summaries.find(controlLabel);
    if (controlIt == outcome.summaries.end())
      throw ConfigurationError("experiment has no '" + controlLabel + "' group to compare against");

    if (outcome.summaries.size() < 2)
      throw ConfigurationError("experiment needs at least one treatment group besides '" +
			       controlLabel + "'");

    std::vector<NamedResult> comparisons;
    for (const auto& entry : outcome.summaries)
      {
	const std::string& label = entry.first;
	if (label == controlLabel)
	  continue;

	const TestConfiguration comparison = comparisonConfiguration(config, label);
	if (config.isSequential())
	  {
	    auto trace = runSequential(observations, outcome.assignment, label, comparison);
	    comparisons.push_back(NamedResult{ label, trace.back() });
	    outcome.sequentialTraces.emplace(label, std::move(trace));
	  }
	else
	  comparisons.push_back(NamedResult{ label, mRunner.run(controlIt->second, entry.second, comparison) });

	if (mLog)
	  *mLog << "  " << label << " vs " << controlLabel << ": "
		<< toString(comparisons.back().result.decision) << std::endl;
      }

    ResultAggregator aggregator(config.getCorrectionMethod(), correctionTargetAlpha(config));
    outcome.report = aggregator.aggregate(comparisons);

    if (mLog)
      *mLog << "Correction (" << toString(config.getCorrectionMethod()) << "): "
	    << outcome.report.count(Decision::Significant) << " of " << outcome.report.size()
	    << " comparisons significant" << std::endl;

    return outcome;
  }

  std::vector<TestResult> ExperimentPipeline::runSequential(const std::vector<Observation>& observations,
							    const GroupAssignment& assignment,
							    const std::string& treatmentLabel,
							    const TestConfiguration& config) const
  {
    const std::string& controlLabel = mDefaults.controlLabel;

    std::vector<const Observation*> ordered;
    bool allTimestamped = true;
    for (const auto& observation : observations)
      {
	const std::string* group = groupOf(observation, assignment);
	if (group && (*group == controlLabel || *group == treatmentLabel))
	  {
	    ordered.push_back(&observation);
	    allTimestamped = allTimestamped && observation.timestamp.has_value();
	  }
      }

    if (allTimestamped)
      std::stable_sort(ordered.begin(), ordered.end(),
		       [](const Observation* a, const Observation* b) {
			 return *a->timestamp < *b->timestamp;
		       });

    SummaryStatisticsExtractor extractor(config.getMetricKind(), config.getCountVarianceModel());
    SequentialTest sequential(mDefaults, config, mLog);

    const std::size_t looks = config.getNumberOfLooks();
    const std::size_t minimum = SummaryStatisticsExtractor::minimumSampleSize(config.getTestType());
    const std::size_t total = ordered.size();

    for (std::size_t k = 1; k <= looks && !sequential.isTerminal(); ++k)
      {
	const std::size_t end = (k == looks) ? total : (k * total + looks - 1) / looks;

	std::vector<double> controlValues, treatmentValues;
	for (std::size_t i = 0; i < end; ++i)
	  {
	    const Observation& observation = *ordered[i];
	    if (*groupOf(observation, assignment) == controlLabel)
	      controlValues.push_back(observation.value);
	    else
	      treatmentValues.push_back(observation.value);
	  }

	// Too little data this early; the final look always runs
	if (k < looks && (controlValues.size() < minimum || treatmentValues.size() < minimum))
	  {
	    if (mLog)
	      *mLog << "Look at " << end << " observations skipped: a group has fewer than "
		    << minimum << " observations" << std::endl;
	    continue;
	  }

	sequential.look(extractor.summarizeValues(controlLabel, controlValues),
			extractor.summarizeValues(treatmentLabel, treatmentValues),
			SimulationBudget::fromConfiguration(config));
      }

    return sequential.getTrace();
  }

} // namespace mkc_abtest
