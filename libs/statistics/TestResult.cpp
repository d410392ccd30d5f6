// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "TestResult.h"

namespace mkc_abtest
{
  TestResult::TestResult(TestType type,
			 MetricKind kind,
			 const GroupSummary& controlSummary,
			 const GroupSummary& treatmentSummary)
    : testType(type),
      metricKind(kind),
      control(controlSummary),
      treatment(treatmentSummary),
      sampleSize(controlSummary.getSampleSize() + treatmentSummary.getSampleSize()),
      lowInformation(controlSummary.isLowInformation() || treatmentSummary.isLowInformation())
  {}

  const Curve* TestResult::findCurve(const std::string& name) const
  {
    for (const auto& curve : curves)
      if (curve.name == name)
	return &curve;

    return nullptr;
  }

  std::optional<double> TestResult::significanceScore() const
  {
    if (testType == TestType::Frequentist)
      return pValue;

    if (probabilityOfSuperiority)
      return 1.0 - *probabilityOfSuperiority;

    return std::nullopt;
  }

  bool TestResult::operator==(const TestResult& rhs) const
  {
    return testType == rhs.testType &&
      metricKind == rhs.metricKind &&
      control == rhs.control &&
      treatment == rhs.treatment &&
      absoluteEffect == rhs.absoluteEffect &&
      relativeUplift == rhs.relativeUplift &&
      statistic == rhs.statistic &&
      degreesOfFreedom == rhs.degreesOfFreedom &&
      pValue == rhs.pValue &&
      achievedPower == rhs.achievedPower &&
      requiredSampleSize == rhs.requiredSampleSize &&
      probabilityOfSuperiority == rhs.probabilityOfSuperiority &&
      expectedLossTreatment == rhs.expectedLossTreatment &&
      expectedLossControl == rhs.expectedLossControl &&
      expectedUplift == rhs.expectedUplift &&
      rHat == rhs.rHat &&
      effectiveSampleSize == rhs.effectiveSampleSize &&
      posteriorDraws == rhs.posteriorDraws &&
      approximated == rhs.approximated &&
      interval == rhs.interval &&
      adjustedPValue == rhs.adjustedPValue &&
      adjustedThreshold == rhs.adjustedThreshold &&
      decision == rhs.decision &&
      sampleSize == rhs.sampleSize &&
      lookIndex == rhs.lookIndex &&
      lowInformation == rhs.lowInformation &&
      notes == rhs.notes &&
      curves == rhs.curves;
  }

} // namespace mkc_abtest
