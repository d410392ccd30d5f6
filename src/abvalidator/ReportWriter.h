// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <ostream>
#include <string>
#include "ABTestConfiguration.h"
#include "ExperimentPipeline.h"

namespace abvalidator
{

/**
 * @brief Writes an experiment outcome as a JSON report and as a console summary.
 *
 * The JSON document holds the experiment key, the configuration, the group
 * summaries, the corrected report (results with their curves) and, for
 * sequential runs, every look per treatment group.
 */
class ReportWriter
{
public:
    ReportWriter(const std::string& experimentKey, const mkc_abtest::TestConfiguration& config);

    std::string toJson(const mkc_abtest::ExperimentOutcome& outcome) const;

    /**
     * @throws std::runtime_error if the file cannot be written.
     */
    void writeJson(const mkc_abtest::ExperimentOutcome& outcome, const std::string& filePath) const;

    void printSummary(const mkc_abtest::ExperimentOutcome& outcome, std::ostream& os) const;

private:
    std::string mExperimentKey;
    mkc_abtest::TestConfiguration mConfig;
};

} // namespace abvalidator
