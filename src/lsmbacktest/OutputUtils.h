// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#pragma once

#include <streambuf>
#include <ostream>
#include <string>

namespace lsmbacktest
{
namespace utils
{

/**
 * @brief Stream buffer that mirrors output to two underlying buffers
 *
 * Used to log to the console and to the run's log file at the same time.
 */
class TeeBuf : public std::streambuf
{
public:
    TeeBuf(std::streambuf* sb1, std::streambuf* sb2);

protected:
    /**
     * @brief Write one character to both buffers
     * @return EOF if either buffer failed, otherwise the character written
     */
    int overflow(int c) override;

    std::streamsize xsputn(const char* s, std::streamsize n) override;

    int sync() override;

private:
    std::streambuf* mStreamBuf1;
    std::streambuf* mStreamBuf2;
};

/**
 * @brief Output stream that writes to two streams simultaneously
 */
class TeeStream : public std::ostream
{
public:
    TeeStream(std::ostream& streamA, std::ostream& streamB);

private:
    TeeBuf mTeeBuf;
};

/**
 * @brief Timestamp in the format "MMM_DD_YYYY_HHMM" for file naming
 *
 * Example: "Oct_19_2026_1430"
 */
std::string getCurrentTimestamp();

/**
 * @brief Path of the log file of a backtest run, lsmbacktest_<timestamp>.log
 *
 * The output directory is created when it does not exist.
 */
std::string createLogFileName(const std::string& outputDirectory);

} // namespace utils
} // namespace lsmbacktest
