// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "ReportWriter.h"
#include "ResultSerializer.h"
#include "utils/OutputUtils.h"
#include <fstream>
#include <stdexcept>
#include <rapidjson/document.h>

using namespace mkc_abtest;
using abvalidator::utils::formatNumber;
using abvalidator::utils::formatPercent;

namespace abvalidator
{

ReportWriter::ReportWriter(const std::string& experimentKey, const TestConfiguration& config)
    : mExperimentKey(experimentKey),
      mConfig(config)
{
}

std::string ReportWriter::toJson(const ExperimentOutcome& outcome) const
{
    rapidjson::Document doc;
    doc.SetObject();
    auto& allocator = doc.GetAllocator();

    doc.AddMember("experiment_key", rapidjson::Value(mExperimentKey.c_str(), allocator), allocator);
    doc.AddMember("configuration", ResultSerializer::serializeConfiguration(mConfig, allocator), allocator);

    rapidjson::Value summaries(rapidjson::kArrayType);
    for (const auto& entry : outcome.summaries)
        summaries.PushBack(ResultSerializer::serializeSummary(entry.second, allocator), allocator);
    doc.AddMember("summaries", summaries, allocator);

    doc.AddMember("report", ResultSerializer::serializeReport(outcome.report, allocator), allocator);

    if (!outcome.sequentialTraces.empty())
    {
        rapidjson::Value traces(rapidjson::kObjectType);
        for (const auto& entry : outcome.sequentialTraces)
        {
            rapidjson::Value looks(rapidjson::kArrayType);
            for (const auto& result : entry.second)
                looks.PushBack(ResultSerializer::serializeResult(result, allocator), allocator);

            rapidjson::Value name(entry.first.c_str(), allocator);
            traces.AddMember(name, looks, allocator);
        }
        doc.AddMember("sequential_traces", traces, allocator);
    }

    return ResultSerializer::write(doc, true);
}

void ReportWriter::writeJson(const ExperimentOutcome& outcome, const std::string& filePath) const
{
    std::ofstream file(filePath);
    if (!file.is_open())
        throw std::runtime_error("cannot open report file '" + filePath + "' for writing");

    file << toJson(outcome) << std::endl;
    if (!file)
        throw std::runtime_error("failed writing report file '" + filePath + "'");
}

void ReportWriter::printSummary(const ExperimentOutcome& outcome, std::ostream& os) const
{
    os << "\n" << toString(mConfig.getTestType()) << " " << toString(mConfig.getMetricKind())
       << " test for experiment '" << mExperimentKey << "'" << std::endl;
    os << std::string(60, '=') << std::endl;

    for (const auto& entry : outcome.summaries)
    {
        const GroupSummary& summary = entry.second;
        os << "  " << summary.getLabel() << ": n = " << summary.getSampleSize()
           << ", mean = " << formatNumber(summary.getMean());
        if (auto conversions = summary.getConversions())
            os << " (" << *conversions << " / " << summary.getSampleSize() << ")";
        os << std::endl;
    }

    for (const auto& named : outcome.report.getResults())
    {
        const TestResult& result = named.result;
        os << "\n" << named.name << " vs " << result.control.getLabel() << std::endl;
        os << std::string(25, '-') << std::endl;

        os << "  Absolute effect: " << formatNumber(result.absoluteEffect) << std::endl;
        if (result.relativeUplift)
            os << "  Relative uplift: " << formatPercent(*result.relativeUplift) << std::endl;

        if (result.statistic)
            os << "  Test statistic: " << formatNumber(*result.statistic) << std::endl;
        if (result.pValue)
            os << "  P-value: " << formatNumber(*result.pValue) << std::endl;
        if (result.adjustedPValue && mConfig.getCorrectionMethod() != CorrectionMethod::None)
            os << "  Adjusted p-value (" << toString(mConfig.getCorrectionMethod()) << "): "
               << formatNumber(*result.adjustedPValue) << std::endl;

        if (result.probabilityOfSuperiority)
            os << "  P(treatment > control): " << formatNumber(*result.probabilityOfSuperiority) << std::endl;
        if (result.expectedLossTreatment)
            os << "  Expected loss (treatment): " << formatNumber(*result.expectedLossTreatment, 6) << std::endl;
        if (result.expectedUplift)
            os << "  Expected uplift: " << formatNumber(*result.expectedUplift) << std::endl;

        if (result.interval)
            os << "  " << formatNumber(result.interval->level * 100.0, 0) << "% interval (" << result.interval->quantity
               << "): [" << formatNumber(result.interval->lower) << ", "
               << formatNumber(result.interval->upper) << "]" << std::endl;

        if (result.achievedPower)
            os << "  Power at MDE: " << formatNumber(*result.achievedPower) << std::endl;
        if (result.requiredSampleSize)
            os << "  Required sample size per group: " << *result.requiredSampleSize << std::endl;
        if (result.lookIndex > 0)
            os << "  Look: " << result.lookIndex << std::endl;

        os << "  Decision: " << toString(result.decision) << std::endl;
        for (const auto& note : result.notes)
            os << "  Note: " << note << std::endl;
    }

    os << "\nSignificant: " << outcome.report.count(Decision::Significant)
       << ", not significant: " << outcome.report.count(Decision::NotSignificant)
       << ", continue sampling: " << outcome.report.count(Decision::ContinueSampling)
       << ", inconclusive: " << outcome.report.count(Decision::Inconclusive) << std::endl;
}

} // namespace abvalidator
