// -*- indent-tabs-mode: nil -*-

#ifdef HAVE_CONFIG_H
#include <config.h>
#endif

#include <fakeidp/DateTime.h>
#include <fakeidp/StringConv.h>

#include "Logger.h"

namespace FakeIdP {

  static const char *level_names[] = {
    "DEBUG", "VERBOSE", "INFO", "WARNING", "ERROR", "FATAL"
  };
  static const int level_count = sizeof(level_names) / sizeof(level_names[0]);

  std::string level_to_string(LogLevel level) {
    for (int n = 0; n < level_count; ++n)
      if (level == (1 << n)) return level_names[n];
    return "";
  }

  std::ostream& operator<<(std::ostream& os, LogLevel level) {
    return os << level_to_string(level);
  }

  bool string_to_level(const std::string& str, LogLevel& ll) {
    for (int n = 0; n < level_count; ++n) {
      if (str == level_names[n]) {
        ll = (LogLevel)(1 << n);
        return true;
      }
    }
    return false;
  }

  bool istring_to_level(const std::string& str, LogLevel& ll) {
    return string_to_level(upper(str), ll);
  }

  LogMessage::LogMessage(LogLevel level, const IString& message)
    : time(TimeStamp()),
      level(level),
      message(message) {}

  std::string LogMessage::format(LogFormat fmt) const {
    if (fmt == ShortFormat)
      return level_to_string(level) + ": " + message.str();
    return "[" + time + "] [" + domain + "] [" + level_to_string(level) + "] " +
           message.str();
  }

  void LogDestination::setFormat(LogFormat newformat) {
    Glib::Mutex::Lock lock(mutex);
    format = newformat;
  }

  LogFormat LogDestination::getFormat() const {
    Glib::Mutex::Lock lock(mutex);
    return format;
  }

  void LogStream::log(const LogMessage& message) {
    Glib::Mutex::Lock lock(mutex);
    destination << message.format(format) << std::endl;
  }

  Logger& Logger::getRootLogger() {
    static Logger root;
    return root;
  }

  Logger::Logger()
    : parent(NULL),
      domain("FakeIdP"),
      threshold(WARNING) {}

  Logger::Logger(Logger& parent, const std::string& subdomain)
    : parent(&parent),
      domain(parent.getDomain() + "." + subdomain),
      threshold((LogLevel)0) {}

  Logger::Logger(Logger& parent, const std::string& subdomain, LogLevel threshold)
    : parent(&parent),
      domain(parent.getDomain() + "." + subdomain),
      threshold(threshold) {}

  void Logger::addDestination(LogDestination& destination) {
    Glib::Mutex::Lock lock(mutex);
    destinations.push_back(&destination);
  }

  void Logger::removeDestinations(void) {
    Glib::Mutex::Lock lock(mutex);
    destinations.clear();
  }

  void Logger::setThreshold(LogLevel threshold) {
    Glib::Mutex::Lock lock(mutex);
    this->threshold = threshold;
  }

  LogLevel Logger::getThreshold() const {
    {
      Glib::Mutex::Lock lock(mutex);
      if (threshold != (LogLevel)0) return threshold;
    }
    return parent ? parent->getThreshold() : (LogLevel)0;
  }

  void Logger::msg(LogMessage message) {
    if (message.getLevel() < getThreshold()) return;
    message.domain = domain;
    deliver(message);
  }

  void Logger::deliver(const LogMessage& message) {
    {
      Glib::Mutex::Lock lock(mutex);
      for (std::list<LogDestination*>::iterator d = destinations.begin();
           d != destinations.end(); ++d)
        (*d)->log(message);
    }
    if (parent) parent->deliver(message);
  }

} // namespace FakeIdP
