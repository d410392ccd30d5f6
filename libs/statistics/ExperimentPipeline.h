// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#ifndef __EXPERIMENT_PIPELINE_H
#define __EXPERIMENT_PIPELINE_H 1

#include <map>
#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include "ABTestConfiguration.h"
#include "ABTestRunner.h"
#include "Bucketing.h"
#include "ResultAggregator.h"
#include "SummaryStatistics.h"
#include "TestResult.h"

namespace mkc_abtest
{
  /**
   * @brief Everything one experiment run produced.
   *
   * sequentialTraces holds, for a sequential configuration, every look
   * taken for each treatment group; the report carries the last one.
   */
  struct ExperimentOutcome
  {
    GroupAssignment assignment;
    GroupSummaryMap summaries;
    AggregateReport report;
    std::map<std::string, std::vector<TestResult>> sequentialTraces;
  };

  /**
   * @class ExperimentPipeline
   * @brief Raw observations to a corrected report.
   *
   * Subjects without a pre-assigned group are bucketed with the default
   * strategy, observations are summarized per group, every non-control
   * group is compared against control, and the comparisons are corrected
   * together and aggregated. Each comparison gets its own random stream
   * derived from the configured seed and the treatment label.
   *
   * A sequential configuration replays the observations in timestamp order
   * (input order when timestamps are missing) as the planned number of
   * cumulative looks.
   */
  class ExperimentPipeline
  {
  public:
    explicit ExperimentPipeline(const EngineDefaults& defaults, std::ostream* log = nullptr);

    /**
     * @throws ConfigurationError on an invalid configuration, invalid
     * observations, or when the control group is missing.
     * @throws InsufficientDataError when a group is too small.
     */
    ExperimentOutcome run(const std::vector<Observation>& observations,
			  const GroupAllocation& allocation,
			  const std::string& experimentKey,
			  const TestConfiguration& config) const;

    ExperimentOutcome run(const std::vector<Observation>& observations,
			  const GroupAllocation& allocation,
			  const std::string& experimentKey,
			  const TestConfiguration& config,
			  BucketingStrategy strategy) const;

    // Assignment of every subject that has no pre-assigned group
    GroupAssignment assignSubjects(const std::vector<Observation>& observations,
				   const GroupAllocation& allocation,
				   const std::string& experimentKey,
				   BucketingStrategy strategy,
				   std::optional<uint64_t> seed) const;

    const std::string& getControlLabel() const
    {
      return mDefaults.controlLabel;
    }

  private:
    TestConfiguration comparisonConfiguration(const TestConfiguration& config,
					      const std::string& treatmentLabel) const;

    std::vector<TestResult> runSequential(const std::vector<Observation>& observations,
					  const GroupAssignment& assignment,
					  const std::string& treatmentLabel,
					  const TestConfiguration& config) const;

  private:
    EngineDefaults mDefaults;
    std::ostream* mLog;
    BucketingEngine mBucketing;
    ABTestRunner mRunner;
  };

} // namespace mkc_abtest

#endif
