// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "CommandLineOptions.h"
#include "ABTestException.h"
#include "EngineDefaultsReader.h"
#include <cstdint>

namespace po = boost::program_options;
using namespace mkc_abtest;

namespace abvalidator
{

CommandLineOptions::CommandLineOptions()
    : mDesc("Options")
{
    mDesc.add_options()
        ("help,h", "Show help message")
        ("data,d", po::value<std::string>(), "JSON dataset of {user_id, event|value[, group, timestamp]} records")
        ("test-type,t", po::value<std::string>(), "frequentist or bayesian (required unless --config sets it)")
        ("metric,m", po::value<std::string>(), "binary, continuous or count")
        ("sequential", "Evaluate the data as a group-sequential test")
        ("looks", po::value<std::size_t>(), "Number of planned interim looks")
        ("stopping-threshold", po::value<double>(), "p-value bound (frequentist) or P(superiority) bound (bayesian)")
        ("max-sample-size", po::value<std::size_t>(), "Planned sample size per group for sequential tests")
        ("alpha,a", po::value<double>(), "Significance level")
        ("mde", po::value<double>(), "Minimum detectable effect (absolute difference)")
        ("alternative", po::value<std::string>(), "two-tailed or one-tailed")
        ("correction,c", po::value<std::string>(), "none, bonferroni, holm or benjamini-hochberg")
        ("uplift", po::value<std::string>(), "Bayesian uplift: percent, ratio or difference")
        ("prior-successes", po::value<double>(), "Beta prior successes for binary Bayesian tests")
        ("prior-trials", po::value<double>(), "Beta prior trials for binary Bayesian tests")
        ("loss-tolerance", po::value<double>(), "Expected loss bound for a Bayesian decision")
        ("draws", po::value<std::size_t>(), "Posterior draws per chain")
        ("max-draws", po::value<std::size_t>(), "Simulation budget in draws (0 = unlimited)")
        ("max-millis", po::value<std::size_t>(), "Simulation budget in milliseconds (0 = unlimited)")
        ("groups,g", po::value<std::string>()->default_value(kDefaultGroups), "Bucket ranges of the groups")
        ("bucketing", po::value<std::string>(), "hash, seeded-random or bucket")
        ("experiment-key,k", po::value<std::string>()->default_value(kDefaultExperimentKey), "Experiment key used for bucketing")
        ("seed", po::value<uint64_t>(), "Random seed for simulation and seeded bucketing")
        ("config", po::value<std::string>(), "JSON file with test configuration fields")
        ("defaults", po::value<std::string>(), "JSON file with engine defaults")
        ("output,o", po::value<std::string>(), "Write the JSON report to this file")
        ("log-file", po::value<std::string>(), "Mirror console output to this file");
}

void CommandLineOptions::printUsage(std::ostream& os) const
{
    os << "abvalidator - A/B test evaluation (frequentist, Bayesian and sequential)\n\n";
    os << "Usage: abvalidator --data FILE --test-type frequentist|bayesian [options]\n\n";
    os << mDesc << std::endl;

    os << "\nExamples:\n";
    os << "  # Two-sided z-test on conversions\n";
    os << "  abvalidator --data events.json --test-type frequentist\n\n";
    os << "  # Bayesian test with three groups and Holm correction\n";
    os << "  abvalidator --data events.json --test-type bayesian --groups \"control:0-34,a:34-67,b:67-100\" --correction holm\n\n";
    os << "  # Sequential test with five looks\n";
    os << "  abvalidator --data events.json --test-type frequentist --sequential --looks 5 --max-sample-size 20000\n";
}

AppOptions CommandLineOptions::parse(int argc, const char* const argv[]) const
{
    po::variables_map vm;
    try
    {
        po::store(po::parse_command_line(argc, argv, mDesc), vm);
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        throw ConfigurationError(std::string("command line: ") + e.what());
    }

    return resolve(vm);
}

AppOptions CommandLineOptions::parse(const std::vector<std::string>& args) const
{
    po::variables_map vm;
    try
    {
        po::store(po::command_line_parser(args).options(mDesc).run(), vm);
        po::notify(vm);
    }
    catch (const po::error& e)
    {
        throw ConfigurationError(std::string("command line: ") + e.what());
    }

    return resolve(vm);
}

AppOptions CommandLineOptions::resolve(const po::variables_map& vm) const
{
    AppOptions options;
    if (vm.count("help"))
    {
        options.helpRequested = true;
        return options;
    }

    if (!vm.count("data"))
        throw ConfigurationError("command line: --data is required");
    if (!vm.count("test-type") && !vm.count("config"))
        throw ConfigurationError("command line: --test-type is required unless --config is given");

    options.dataFile = vm["data"].as<std::string>();
    options.experimentKey = vm["experiment-key"].as<std::string>();
    options.groups = vm["groups"].as<std::string>();

    if (vm.count("defaults"))
        options.defaults = EngineDefaultsReader(vm["defaults"].as<std::string>()).read();

    TestConfiguration config = TestConfiguration::fromDefaults(options.defaults);
    if (vm.count("config"))
        config = TestConfigurationReader(vm["config"].as<std::string>()).read(config);

    if (vm.count("test-type"))
        config = config.withTestType(parseTestType(vm["test-type"].as<std::string>()));
    if (vm.count("metric"))
        config = config.withMetricKind(parseMetricKind(vm["metric"].as<std::string>()));
    if (vm.count("sequential"))
        config = config.withSequential(true);
    if (vm.count("looks"))
        config = config.withNumberOfLooks(vm["looks"].as<std::size_t>());
    if (vm.count("stopping-threshold"))
        config = config.withStoppingThreshold(vm["stopping-threshold"].as<double>());
    if (vm.count("max-sample-size"))
        config = config.withMaxSampleSize(vm["max-sample-size"].as<std::size_t>());
    if (vm.count("alpha"))
        config = config.withAlpha(vm["alpha"].as<double>());
    if (vm.count("mde"))
        config = config.withMinimumDetectableEffect(vm["mde"].as<double>());
    if (vm.count("alternative"))
        config = config.withAlternative(parseAlternativeHypothesis(vm["alternative"].as<std::string>()));
    if (vm.count("correction"))
        config = config.withCorrectionMethod(parseCorrectionMethod(vm["correction"].as<std::string>()));
    if (vm.count("uplift"))
        config = config.withUpliftMethod(parseUpliftMethod(vm["uplift"].as<std::string>()));
    if (vm.count("prior-successes") || vm.count("prior-trials"))
    {
        const double successes = vm.count("prior-successes") ? vm["prior-successes"].as<double>()
                                                              : config.getPriorSuccesses();
        const double trials = vm.count("prior-trials") ? vm["prior-trials"].as<double>()
                                                       : config.getPriorTrials();
        config = config.withPrior(successes, trials);
    }
    if (vm.count("loss-tolerance"))
        config = config.withLossTolerance(vm["loss-tolerance"].as<double>());
    if (vm.count("draws"))
        config = config.withPosteriorDraws(vm["draws"].as<std::size_t>());
    if (vm.count("max-draws") || vm.count("max-millis"))
    {
        const std::size_t draws = vm.count("max-draws") ? vm["max-draws"].as<std::size_t>()
                                                        : config.getMaxSimulationDraws();
        const std::size_t millis = vm.count("max-millis") ? vm["max-millis"].as<std::size_t>()
                                                          : config.getMaxSimulationMillis();
        config = config.withSimulationBudget(draws, millis);
    }
    if (vm.count("seed"))
        config = config.withRandomSeed(vm["seed"].as<uint64_t>());

    config.validate();
    options.config = config;

    options.bucketing = vm.count("bucketing") ? parseBucketingStrategy(vm["bucketing"].as<std::string>())
                                              : options.defaults.bucketingStrategy;
    options.allocation = GroupAllocation::fromBucketRanges(options.groups, options.defaults.bucketCount);
    if (!options.allocation->contains(options.defaults.controlLabel))
        throw ConfigurationError("groups: no '" + options.defaults.controlLabel + "' group in '" + options.groups + "'");

    if (vm.count("output"))
        options.outputFile = vm["output"].as<std::string>();
    if (vm.count("log-file"))
        options.logFile = vm["log-file"].as<std::string>();

    return options;
}

} // namespace abvalidator
