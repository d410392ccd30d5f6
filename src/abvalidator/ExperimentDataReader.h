// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <string>
#include <vector>
#include "ABTestException.h"
#include "ABTestTypes.h"
#include "SummaryStatistics.h"

namespace abvalidator
{

/**
 * @brief Thrown when the dataset file cannot be read or is not a JSON array
 * of observation records.
 */
class DatasetFormatError : public mkc_abtest::ABTestException
{
public:
    explicit DatasetFormatError(const std::string& msg)
        : mkc_abtest::ABTestException(msg)
    {}
};

/**
 * @brief Reads experiment observations from JSON.
 *
 * The dataset is an array of records:
 *
 * @code
 * [ { "user_id": "u1", "event": 1 },
 *   { "user_id": 42, "value": 12.5, "group": "test1", "timestamp": "2024-06-01T10:00:00Z" } ]
 * @endcode
 *
 * user_id may be a string or an integer (integers are stringified). The
 * metric is "event" (0/1 conversions) or "value". group and timestamp are
 * optional. Metric validity (0/1, non-negative counts) is checked later by
 * the summary extractor.
 */
class ExperimentDataReader
{
public:
    /**
     * @throws DatasetFormatError if the file is missing or malformed.
     */
    static std::vector<mkc_abtest::Observation> readFile(const std::string& filePath);

    static std::vector<mkc_abtest::Observation> parse(const std::string& json);
};

} // namespace abvalidator
