// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, October 2026
//

#include "PriceSeriesCsvReader.h"
#include <cmath>
#include <vector>
#include <boost/filesystem.hpp>
#include <boost/lexical_cast.hpp>
#include "csv.h"

namespace lsmbacktest
{
  PriceSeriesCsvReader::PriceSeriesCsvReader(const std::string& fileName, const std::string& columnName)
    : mFileName(fileName),
      mColumnName(columnName),
      mPriceSeries()
  {}

  void PriceSeriesCsvReader::readFile()
  {
    if (!boost::filesystem::exists(mFileName))
      throw PriceSeriesCsvReaderException("PriceSeriesCsvReader::readFile - price file " + mFileName
					  + " does not exist");

    io::CSVReader<1, io::trim_chars<' ', '\t'>, io::double_quote_escape<',', '\"'>> csvFile(mFileName.c_str());

    try
      {
	csvFile.read_header(io::ignore_extra_column, mColumnName);
      }
    catch (const io::error::missing_column_in_header&)
      {
	throw PriceSeriesCsvReaderException("PriceSeriesCsvReader::readFile - column " + mColumnName
					    + " not found in " + mFileName);
      }

    std::vector<Num> prices;
    std::string priceString;

    while (csvFile.read_row(priceString))
      {
	const std::string lineNumber = std::to_string(csvFile.get_file_line());

	if (priceString.empty())
	  throw PriceSeriesCsvReaderException("PriceSeriesCsvReader::readFile - empty " + mColumnName
					      + " at line " + lineNumber + " of " + mFileName);

	Num price;
	try
	  {
	    price = boost::lexical_cast<Num>(priceString);
	  }
	catch (const boost::bad_lexical_cast&)
	  {
	    throw PriceSeriesCsvReaderException("PriceSeriesCsvReader::readFile - unparseable price '" + priceString
						+ "' at line " + lineNumber + " of " + mFileName);
	  }

	if (!std::isfinite(price))
	  throw PriceSeriesCsvReaderException("PriceSeriesCsvReader::readFile - non-finite price at line "
					      + lineNumber + " of " + mFileName);

	prices.push_back(price);
      }

    mPriceSeries = mkc_latentsource::PriceSeries<Num>(std::move(prices));
  }
}
