// -*- indent-tabs-mode: nil -*-

#ifndef __FAKEIDP_LOGGER_H__
#define __FAKEIDP_LOGGER_H__

#include <string>
#include <list>
#include <ostream>

#include <glibmm/thread.h>

#include <fakeidp/IString.h>

namespace FakeIdP {

  /** \addtogroup common
   *  @{ */

  /// Message levels, in increasing severity.
  enum LogLevel {
    DEBUG = 1,   ///< Canonical forms, decrypted fragments and similar dumps.
    VERBOSE = 2, ///< Progress of individual pipeline stages.
    INFO = 4,
    WARNING = 8,
    ERROR = 16,  ///< Failure of the current operation.
    FATAL = 32
  };

  enum LogFormat {
    /// [time] [domain] [level] message
    LongFormat,
    /// level: message
    ShortFormat
  };

  std::ostream& operator<<(std::ostream& os, LogLevel level);
  std::string level_to_string(LogLevel level);
  /// Parses exact level name. ll is untouched on failure.
  bool string_to_level(const std::string& str, LogLevel& ll);
  /// Same as string_to_level but ignores case.
  bool istring_to_level(const std::string& str, LogLevel& ll);

  /// Single log record. Timestamp is taken at creation.
  /** \headerfile Logger.h fakeidp/Logger.h */
  class LogMessage {
  public:
    LogMessage(LogLevel level, const IString& message);
    LogLevel getLevel() const {
      return level;
    }
    /// Renders the record in given format, without line end.
    std::string format(LogFormat fmt) const;
  private:
    friend class Logger;
    std::string time;
    LogLevel level;
    std::string domain;
    IString message;
  };

  /// Where log messages end up.
  /** Destinations are attached to loggers by reference and must outlive them.
     \headerfile Logger.h fakeidp/Logger.h */
  class LogDestination {
  public:
    virtual ~LogDestination() {}
    virtual void log(const LogMessage& message) = 0;
    void setFormat(LogFormat newformat);
    LogFormat getFormat() const;
  protected:
    LogDestination()
      : format(LongFormat) {}
    mutable Glib::Mutex mutex;
    LogFormat format;
  private:
    LogDestination(const LogDestination&);
    LogDestination& operator=(const LogDestination&);
  };

  /// Writes one line per message to an ostream, serialized by mutex.
  /** \headerfile Logger.h fakeidp/Logger.h */
  class LogStream
    : public LogDestination {
  public:
    LogStream(std::ostream& destination)
      : destination(destination) {}
    virtual void log(const LogMessage& message);
  private:
    std::ostream& destination;
  };

  /// Named message source with a threshold.
  /** Loggers form a tree under the root logger. The domain of a logger is
     its parent's domain with subdomain appended. A message at or above the
     effective threshold goes to the logger's own destinations and then to
     those of every ancestor. Loggers without own threshold use their parent's.
     @code
  static FakeIdP::Logger logger(FakeIdP::Logger::getRootLogger(), "SAMLResponse");
  logger.msg(FakeIdP::ERROR, "Failed to read %s", path);
     @endcode
     \headerfile Logger.h fakeidp/Logger.h */
  class Logger {
  public:
    static Logger& getRootLogger();

    Logger(Logger& parent, const std::string& subdomain);
    Logger(Logger& parent, const std::string& subdomain, LogLevel threshold);

    void addDestination(LogDestination& destination);
    void removeDestinations(void);
    void setThreshold(LogLevel threshold);
    LogLevel getThreshold() const;
    const std::string& getDomain() const {
      return domain;
    }

    void msg(LogMessage message);

    /// Arguments are formatted only if message passes threshold.
    void msg(LogLevel level, const std::string& str) {
      if (level >= getThreshold()) msg(LogMessage(level, IString(str)));
    }

    template<class T0>
    void msg(LogLevel level, const std::string& str, const T0& t0) {
      if (level >= getThreshold()) msg(LogMessage(level, IString(str, t0)));
    }

    template<class T0, class T1>
    void msg(LogLevel level, const std::string& str, const T0& t0, const T1& t1) {
      if (level >= getThreshold()) msg(LogMessage(level, IString(str, t0, t1)));
    }

    template<class T0, class T1, class T2>
    void msg(LogLevel level, const std::string& str, const T0& t0, const T1& t1,
             const T2& t2) {
      if (level >= getThreshold()) msg(LogMessage(level, IString(str, t0, t1, t2)));
    }

    template<class T0, class T1, class T2, class T3>
    void msg(LogLevel level, const std::string& str, const T0& t0, const T1& t1,
             const T2& t2, const T3& t3) {
      if (level >= getThreshold()) msg(LogMessage(level, IString(str, t0, t1, t2, t3)));
    }

  private:
    Logger();
    Logger(const Logger&);
    Logger& operator=(const Logger&);

    void deliver(const LogMessage& message);

    Logger *parent;
    std::string domain;
    std::list<LogDestination*> destinations;
    LogLevel threshold;
    mutable Glib::Mutex mutex;
  };

  /** @} */

} // namespace FakeIdP

#endif // __FAKEIDP_LOGGER_H__
