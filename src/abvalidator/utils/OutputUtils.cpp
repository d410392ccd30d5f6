// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
//

#include "OutputUtils.h"
#include <cstdio>
#include <iomanip>
#include <sstream>

namespace abvalidator
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* first, std::streambuf* second)
    : mFirst(first),
      mSecond(second)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mFirst->sputc(static_cast<char>(c));
    const int r2 = mSecond->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

std::streamsize TeeBuf::xsputn(const char* s, std::streamsize n)
{
    const std::streamsize n1 = mFirst->sputn(s, n);
    const std::streamsize n2 = mSecond->sputn(s, n);
    return (n1 < n2) ? n1 : n2;
}

int TeeBuf::sync()
{
    const int r1 = mFirst->pubsync();
    const int r2 = mSecond->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string formatNumber(double value, int precision)
{
    std::ostringstream os;
    os << std::fixed << std::setprecision(precision) << value;
    return os.str();
}

std::string formatPercent(double fraction, int precision)
{
    std::ostringstream os;
    os << std::showpos << std::fixed << std::setprecision(precision) << fraction * 100.0 << "%";
    return os.str();
}

} // namespace utils
} // namespace abvalidator
