// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_DATETIME_H__
#define __FAKEIDP_DATETIME_H__

#include <stdint.h>

#include <ctime>
#include <string>

namespace FakeIdP {

  /** \addtogroup common
   *  @{ */

  /// Textual forms of time.
  enum TimeFormat {
    UserTime,      ///< YYYY-MM-DD HH:MM:SS in local time zone
    UTCTime        ///< YYYY-MM-DDTHH:MM:SSZ
  };

  /// Length of time in whole seconds, may be negative.
  /** \headerfile DateTime.h fakeidp/DateTime.h */
  class Period {
  public:
    Period() : seconds(0) {}
    Period(time_t sec) : seconds(sec) {}
    time_t GetPeriod() const { return seconds; }
  private:
    time_t seconds;
  };

  /// Point in time, seconds since epoch plus nanoseconds.
  /** \headerfile DateTime.h fakeidp/DateTime.h */
  class Time {
  public:
    /// Current time
    Time();
    Time(time_t time);
    Time(time_t time, uint32_t nanosec);
    /// Parses UTC time YYYY-MM-DDTHH:MM:SS[.fraction]Z.
    /** On failure time is UNDEFINED and an error is logged. */
    Time(const std::string& utc);

    time_t GetTime() const { return gtime; }
    uint32_t GetTimeNanoseconds() const { return gnano; }

    std::string str(TimeFormat format = UserTime) const;

    bool operator<(const Time& t) const { return Compare(t) < 0; }
    bool operator>(const Time& t) const { return Compare(t) > 0; }
    bool operator<=(const Time& t) const { return Compare(t) <= 0; }
    bool operator>=(const Time& t) const { return Compare(t) >= 0; }
    bool operator==(const Time& t) const { return Compare(t) == 0; }
    bool operator!=(const Time& t) const { return Compare(t) != 0; }

    Time operator+(const Period& p) const { return Time(gtime + p.GetPeriod(), gnano); }
    Time operator-(const Period& p) const { return Time(gtime - p.GetPeriod(), gnano); }

    static const int DAY   = 86400;
    static const int HOUR  = 3600;
    static const time_t UNDEFINED = (time_t)(-1);

  private:
    int Compare(const Time& t) const;
    time_t gtime;
    uint32_t gnano;
  };

  /// Current time in given format.
  std::string TimeStamp(TimeFormat format = UserTime);

  /** @} */

} // namespace FakeIdP

#endif // __FAKEIDP_DATETIME_H__
