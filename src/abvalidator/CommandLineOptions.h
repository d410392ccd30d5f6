// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <boost/program_options.hpp>
#include "ABTestConfiguration.h"
#include "Bucketing.h"

namespace abvalidator
{

/**
 * @brief Everything the application needs for one run, resolved from the
 * command line and the optional configuration files.
 */
struct AppOptions
{
    bool helpRequested = false;
    std::string dataFile;
    std::string experimentKey;
    std::string groups;
    std::optional<mkc_abtest::GroupAllocation> allocation;  ///< empty only when help was requested
    mkc_abtest::BucketingStrategy bucketing = mkc_abtest::BucketingStrategy::Hash;
    std::optional<std::string> outputFile;
    std::optional<std::string> logFile;
    mkc_abtest::EngineDefaults defaults;
    mkc_abtest::TestConfiguration config;
};

/**
 * @brief Command line of the abvalidator tool (Boost.Program_options).
 *
 * The test configuration is layered: engine defaults (built in, or from
 * --defaults), then the --config file, then individual command line flags.
 */
class CommandLineOptions
{
public:
    static constexpr const char* kDefaultGroups = "control:0-50,test1:50-100";
    static constexpr const char* kDefaultExperimentKey = "experiment";

    CommandLineOptions();

    /**
     * @throws ConfigurationError for unknown options, missing required
     * options, unrecognized enumeration names and invalid settings.
     */
    AppOptions parse(int argc, const char* const argv[]) const;

    // Arguments without the program name
    AppOptions parse(const std::vector<std::string>& args) const;

    void printUsage(std::ostream& os) const;

private:
    AppOptions resolve(const boost::program_options::variables_map& vm) const;

    boost::program_options::options_description mDesc;
};

} // namespace abvalidator
