// Copyright (C) MKC Associates, LLC - All Rights Reserved
// Unauthorized copying of this file, via any medium is strictly prohibited
// Proprietary and confidential
// Written by Michael K. Collison <collison956@gmail.com>, July 2016
//

#ifndef __DATE_RANGE_H
#define __DATE_RANGE_H 1

#include <boost/date_time/gregorian/gregorian.hpp>
#include <stdexcept>
#include <string>

namespace theory_validator
{
  namespace sportsdata
  {
    class DateRangeException : public std::runtime_error
    {
    public:
      DateRangeException(const std::string& msg)
	: std::runtime_error(msg)
      {}

      ~DateRangeException()
      {}
    };

    // Inclusive range of calendar dates.
    class DateRange
    {
    public:
      DateRange(const boost::gregorian::date& firstDate, const boost::gregorian::date& lastDate)
	: mFirstDate(firstDate),
	  mLastDate(lastDate)
      {
	if (lastDate < firstDate)
	  throw DateRangeException ("DateRange::DateRange - Second date cannot occur before first date");
      }

      DateRange(const DateRange&) = default;
      DateRange& operator=(const DateRange&) = default;
      ~DateRange() noexcept = default;

      // Half-open range [first, endExclusive) expressed as an inclusive range.
      static DateRange halfOpen(const boost::gregorian::date& first,
				const boost::gregorian::date& endExclusive)
      {
	return DateRange(first, endExclusive - boost::gregorian::days(1));
      }

      const boost::gregorian::date& getFirstDate() const
      {
	return mFirstDate;
      }

      const boost::gregorian::date& getLastDate() const
      {
	return mLastDate;
      }

      bool contains(const boost::gregorian::date& d) const
      {
	return d >= mFirstDate && d <= mLastDate;
      }

      long lengthInDays() const
      {
	return (mLastDate - mFirstDate).days() + 1;
      }

    private:
      boost::gregorian::date mFirstDate;
      boost::gregorian::date mLastDate;
    };

    inline bool operator==(const DateRange& lhs, const DateRange& rhs)
    {
      return lhs.getFirstDate() == rhs.getFirstDate() && lhs.getLastDate() == rhs.getLastDate();
    }

    inline bool operator!=(const DateRange& lhs, const DateRange& rhs)
    {
      return !(lhs == rhs);
    }
  }
}

#endif
