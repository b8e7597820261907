// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "OutputUtils.h"
#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <boost/filesystem.hpp>

namespace lsmbacktest
{
namespace utils
{

TeeBuf::TeeBuf(std::streambuf* sb1, std::streambuf* sb2)
    : mStreamBuf1(sb1),
      mStreamBuf2(sb2)
{
}

int TeeBuf::overflow(int c)
{
    if (c == EOF)
    {
        return !EOF;
    }

    const int r1 = mStreamBuf1->sputc(static_cast<char>(c));
    const int r2 = mStreamBuf2->sputc(static_cast<char>(c));
    return (r1 == EOF || r2 == EOF) ? EOF : c;
}

std::streamsize TeeBuf::xsputn(const char* s, std::streamsize n)
{
    const std::streamsize n1 = mStreamBuf1->sputn(s, n);
    const std::streamsize n2 = mStreamBuf2->sputn(s, n);
    return (n1 < n2) ? n1 : n2;
}

int TeeBuf::sync()
{
    const int r1 = mStreamBuf1->pubsync();
    const int r2 = mStreamBuf2->pubsync();
    return (r1 == 0 && r2 == 0) ? 0 : -1;
}

TeeStream::TeeStream(std::ostream& streamA, std::ostream& streamB)
    : std::ostream(nullptr),
      mTeeBuf(streamA.rdbuf(), streamB.rdbuf())
{
    this->rdbuf(&mTeeBuf);
}

std::string getCurrentTimestamp()
{
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);

    std::stringstream ss;
    ss << std::put_time(std::localtime(&time_t), "%b_%d_%Y_%H%M");
    return ss.str();
}

std::string createLogFileName(const std::string& outputDirectory)
{
    boost::filesystem::path dir(outputDirectory.empty() ? std::string(".") : outputDirectory);
    boost::filesystem::create_directories(dir);
    return (dir / ("lsmbacktest_" + getCurrentTimestamp() + ".log")).string();
}

} // namespace utils
} // namespace lsmbacktest
