// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <cstdio>
#include <ctype.h>
#include <sys/time.h>

#include <fakeidp/Logger.h>

#include "DateTime.h"

namespace FakeIdP {

  static Logger logger(Logger::getRootLogger(), "DateTime");

  Time::Time()
    : gtime(0), gnano(0) {
    timeval tv;
    if (gettimeofday(&tv, NULL) == 0) {
      gtime = tv.tv_sec;
      gnano = tv.tv_usec * 1000;
    } else {
      gtime = time(NULL);
    }
  }

  Time::Time(time_t time)
    : gtime(time), gnano(0) {}

  Time::Time(time_t time, uint32_t nanosec)
    : gtime(time), gnano(nanosec) {}

  Time::Time(const std::string& utc)
    : gtime(UNDEFINED), gnano(0) {
    tm t = tm();
    int end = 0;
    if ((utc.length() < 20) || !isdigit(utc[0]) ||
        (sscanf(utc.c_str(), "%4d-%2d-%2dT%2d:%2d:%2d%n",
                &t.tm_year, &t.tm_mon, &t.tm_mday,
                &t.tm_hour, &t.tm_min, &t.tm_sec, &end) != 6)) {
      logger.msg(ERROR, "Can not parse time: %s", utc);
      return;
    }
    std::string::size_type pos = end;
    if ((pos < utc.length()) && (utc[pos] == '.')) {
      do ++pos; while ((pos < utc.length()) && isdigit(utc[pos]));
    }
    if ((pos + 1 != utc.length()) || (utc[pos] != 'Z')) {
      logger.msg(ERROR, "Time is not in UTC or has trailing data: %s", utc);
      return;
    }
    t.tm_year -= 1900;
    t.tm_mon -= 1;
    gtime = timegm(&t);
  }

  int Time::Compare(const Time& t) const {
    if (gtime != t.gtime) return (gtime < t.gtime) ? -1 : 1;
    if (gnano != t.gnano) return (gnano < t.gnano) ? -1 : 1;
    return 0;
  }

  std::string Time::str(TimeFormat format) const {
    tm t;
    const char *layout;
    if (format == UTCTime) {
      gmtime_r(&gtime, &t);
      layout = "%Y-%m-%dT%H:%M:%SZ";
    } else {
      localtime_r(&gtime, &t);
      layout = "%Y-%m-%d %H:%M:%S";
    }
    char buf[32];
    size_t len = strftime(buf, sizeof(buf), layout, &t);
    return std::string(buf, len);
  }

  std::string TimeStamp(TimeFormat format) {
    return Time().str(format);
  }

} // namespace FakeIdP
