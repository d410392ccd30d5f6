// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <string>
#include "ABTestConfiguration.h"

namespace abvalidator
{

/**
 * @brief Loads engine defaults from a JSON object file.
 *
 * Keys that are absent keep their built-in values. The result is validated
 * before it is returned.
 */
class EngineDefaultsReader
{
public:
    explicit EngineDefaultsReader(const std::string& filePath);

    /**
     * @throws ConfigurationError if the file is missing or holds invalid settings.
     * @throws SerializationError if the file is not valid JSON.
     */
    mkc_abtest::EngineDefaults read() const;

    // As read(), for JSON already in memory
    static mkc_abtest::EngineDefaults parse(const std::string& json);

private:
    std::string mFilePath;
};

/**
 * @brief Loads a test configuration (possibly partial) from a JSON object file.
 */
class TestConfigurationReader
{
public:
    explicit TestConfigurationReader(const std::string& filePath);

    /**
     * @throws ConfigurationError if the file is missing or has unknown keys.
     * @throws SerializationError if the file is not valid JSON.
     */
    mkc_abtest::TestConfiguration read(const mkc_abtest::TestConfiguration& base) const;

private:
    std::string mFilePath;
};

} // namespace abvalidator
