// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include <fstream>
#include <iostream>
#include <memory>
#include "ABTestException.h"
#include "CommandLineOptions.h"
#include "ExperimentDataReader.h"
#include "ExperimentPipeline.h"
#include "ReportWriter.h"
#include "ResultSerializer.h"
#include "utils/OutputUtils.h"

using namespace mkc_abtest;
using namespace abvalidator;

namespace
{
    // Process exit codes
    constexpr int kExitOk = 0;
    constexpr int kExitFailure = 1;
    constexpr int kExitConfiguration = 2;
    constexpr int kExitDataFormat = 3;
    constexpr int kExitInsufficientData = 4;
}

int main(int argc, char* argv[])
{
    CommandLineOptions cli;

    try {
        const AppOptions options = cli.parse(argc, argv);
        if (options.helpRequested) {
            cli.printUsage(std::cout);
            return kExitOk;
        }

        std::ofstream logFile;
        std::unique_ptr<utils::TeeStream> tee;
        std::ostream* out = &std::cout;
        if (options.logFile) {
            logFile.open(*options.logFile);
            if (!logFile.is_open()) {
                std::cerr << "Error: cannot open log file " << *options.logFile << std::endl;
                return kExitFailure;
            }
            tee = std::make_unique<utils::TeeStream>(std::cout, logFile);
            out = tee.get();
        }

        *out << "Reading observations from " << options.dataFile << std::endl;
        const auto observations = ExperimentDataReader::readFile(options.dataFile);
        *out << "Read " << observations.size() << " observations" << std::endl;
        *out << "Groups: " << options.groups << " (" << toString(options.bucketing) << " bucketing, key '"
             << options.experimentKey << "')" << std::endl;

        ExperimentPipeline pipeline(options.defaults, out);
        const ExperimentOutcome outcome = pipeline.run(observations, *options.allocation,
                                                       options.experimentKey, options.config,
                                                       options.bucketing);

        ReportWriter writer(options.experimentKey, options.config);
        writer.printSummary(outcome, *out);

        if (options.outputFile) {
            writer.writeJson(outcome, *options.outputFile);
            *out << "\nReport written to " << *options.outputFile << std::endl;
        }

        return kExitOk;
    }
    catch (const ConfigurationError& e) {
        std::cerr << "Configuration error: " << e.what() << std::endl;
        std::cerr << "Run 'abvalidator --help' for usage" << std::endl;
        return kExitConfiguration;
    }
    catch (const DatasetFormatError& e) {
        std::cerr << "Dataset error: " << e.what() << std::endl;
        return kExitDataFormat;
    }
    catch (const SerializationError& e) {
        std::cerr << "JSON error: " << e.what() << std::endl;
        return kExitDataFormat;
    }
    catch (const InsufficientDataError& e) {
        std::cerr << "Insufficient data: " << e.what() << std::endl;
        return kExitInsufficientData;
    }
    catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return kExitFailure;
    }
}
