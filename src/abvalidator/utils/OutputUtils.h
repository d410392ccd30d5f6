// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#pragma once

#include <ostream>
#include <streambuf>
#include <string>

namespace abvalidator
{
namespace utils
{

/**
 * @brief Stream buffer that forwards every character to two buffers,
 * used to mirror console output into the log file.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* first, std::streambuf* second);

protected:
    int overflow(int c) override;
    std::streamsize xsputn(const char* s, std::streamsize n) override;
    int sync() override;

private:
    std::streambuf* mFirst;
    std::streambuf* mSecond;
};

/**
 * @brief Output stream writing to two streams at once (console and --log-file).
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

// Fixed precision formatting for the console summary
std::string formatNumber(double value, int precision = 4);
std::string formatPercent(double fraction, int precision = 2);

} // namespace utils
} // namespace abvalidator
