/*
 Copyright (C) 2024 Quaternion Risk Management Ltd
 All rights reserved.

 This file is part of ORE, a free-software/open-source library
 for transparent pricing and risk analysis - http://opensourcerisk.org

 ORE is free software: you can redistribute it and/or modify it
 under the terms of the Modified BSD License.  You should have received a
 copy of the license along with this program.
 The license is also available online at <http://opensourcerisk.org>

 This program is distributed on the basis that it will form a useful
 contribution to risk analytics and model standardisation, but WITHOUT
 ANY WARRANTY; without even the implied warranty of MERCHANTABILITY or
 FITNESS FOR A PARTICULAR PURPOSE. See the license for more details.
*/

/*! \file zrk/utilities/log.hpp
    \brief Classes and functions for log message handling.
    \ingroup utilities
*/

#pragma once

// accumulate log messages and only write them out if the mask matches

#define ZRK_ALERT 1    // 00000001   1 = 2^0
#define ZRK_CRITICAL 2 // 00000010   2 = 2^1
#define ZRK_ERROR 4    // 00000100   4 = 2^2
#define ZRK_WARNING 8  // 00001000   8 = 2^3
#define ZRK_NOTICE 16  // 00010000  16 = 2^4
#define ZRK_DEBUG 32   // 00100000  32 = 2^5
#define ZRK_DATA 64    // 01000000  64 = 2^6

#include <fstream>
#include <map>
#include <queue>
#include <sstream>
#include <string>

#include <boost/thread/lock_types.hpp>
#include <boost/thread/shared_mutex.hpp>
#include <ql/patterns/singleton.hpp>
#include <ql/shared_ptr.hpp>

namespace ZeroRisk {

//! The Base Custom Log Handler class
/*!
  This base log handler class can be used to define your own custom handler and then registered with the Log class.
  Once registered it will receive all log messages as soon as they occur via its log() method
  \ingroup utilities
  \see Log
 */
class Logger {
public:
    //! Destructor
    virtual ~Logger() {}

    //! The Log call back function
    /*!
      This function will be called every time a log message is produced.
      \param level the log level
      \param s the log message
     */
    virtual void log(unsigned level, const std::string& s) = 0;

    //! Returns the Logger name
    const std::string& name() const { return name_; }

protected:
    //! Constructor
    /*!
      Implementations must provide a logger name
      \param name the logger name
     */
    Logger(const std::string& name) : name_(name) {}

private:
    std::string name_;
};

//! Stderr Logger
/*!
  This logger writes each log message out to stderr. Pass \c alertOnly to restrict it to alerts.
  \ingroup utilities
  \see Log
 */
class StderrLogger : public Logger {
public:
    //! the name "StderrLogger"
    static const std::string name;
    //! Constructor
    StderrLogger(bool alertOnly = false) : Logger(name), alertOnly_(alertOnly) {}
    //! The log callback that writes to stderr
    void log(unsigned l, const std::string& s) override;

private:
    bool alertOnly_;
};

//! FileLogger
/*!
  This logger writes each log message out to the given file.
  The file is flushed, but not closed, after each log message.
  \ingroup utilities
  \see Log
 */
class FileLogger : public Logger {
public:
    //! the name "FileLogger"
    static const std::string name;
    //! Constructor
    /*!
      Opens the given file.
      \param filename the log filename
     */
    FileLogger(const std::string& filename);
    //! Destructor
    ~FileLogger() override;
    //! The log callback
    void log(unsigned, const std::string&) override;

private:
    std::string filename_;
    std::fstream fout_;
};

//! BufferLogger
/*!
  This logger stores each log message in an internal buffer, it can then be probed for log messages at a later point.
  Log messages are always returned in FIFO order.

  Typical usage to display log messages would be
  <pre>
      while (bLogger.hasNext()) {
          MsgBox("Log Message", bLogger.next());
      }
  </pre>
  \ingroup utilities
  \see Log
 */
class BufferLogger : public Logger {
public:
    //! the name "BufferLogger"
    static const std::string name;
    //! Constructor, messages with a level above \c minLevel are ignored
    BufferLogger(unsigned minLevel = ZRK_DATA) : Logger(name), minLevel_(minLevel) {}
    //! The log callback
    void log(unsigned, const std::string&) override;

    //! Checks if Logger has new messages
    /*!
      \return True if this BufferLogger has any new log messages
     */
    bool hasNext();
    //! Retrieve new messages
    /*!
      Retrieve the next new message from the buffer, this will throw if the buffer is empty.
      Messages are returned in FIFO order. Messages are deleted from the buffer once returned.
      \return The next message
     */
    std::string next();

private:
    std::queue<std::string> buffer_;
    unsigned minLevel_;
};

//! Global static Log class
/*!
  The Global Log class gets registered with individual loggers and receives application log messages.
  Once a message is received, it is immediately dispatched to each of the registered loggers, the order in which
  the loggers are called is not guaranteed.

  Logging is done by the calling thread and the function call only returns once all loggers have processed the
  message (i.e. written it to a file, stderr or a buffer).

  When registered, loggers are stored by name, so registering a second logger with an existing name fails.

  \ingroup utilities
 */
class Log : public QuantLib::Singleton<Log, std::integral_constant<bool, true>> {

    friend class QuantLib::Singleton<Log, std::integral_constant<bool, true>>;

private:
    // may be empty but never uninitialised
    Log();

public:
    //! Add a new Logger.
    /*! Adds a new logger to the Log class, the logger will be stored by it's name.
        \param logger the logger to add
     */
    void registerLogger(const QuantLib::ext::shared_ptr<Logger>& logger);
    //! Check if logger exists
    bool hasLogger(const std::string& name) const;
    //! Retrieve a Logger.
    /*! Retrieve a Logger from it's name, throws if the logger does not exist.
     */
    QuantLib::ext::shared_ptr<Logger> logger(const std::string& name) const;
    //! Remove a Logger
    /*! Remove a logger by name
        \param name the logger name
     */
    void removeLogger(const std::string& name);
    //! Remove all loggers
    void removeAllLoggers();

    //! macro utility function - do not use directly, not thread safe
    void header(unsigned m, const char* filename, int lineNo);
    //! macro utility function - do not use directly, not thread safe
    std::ostream& logStream() { return ls_; }
    //! macro utility function - do not use directly, not thread safe
    void log(unsigned m);

    //! mutex to acquire locks
    boost::shared_mutex& mutex() { return mutex_; }

    // Avoid a large number of warnings in VS by adding 0 !=
    bool filter(unsigned mask) {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return 0 != (mask & mask_);
    }
    unsigned mask() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return mask_;
    }
    void setMask(unsigned mask) {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        mask_ = mask;
    }

    bool enabled() {
        boost::shared_lock<boost::shared_mutex> lock(mutex_);
        return enabled_;
    }
    void switchOn() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = true;
    }
    void switchOff() {
        boost::unique_lock<boost::shared_mutex> lock(mutex_);
        enabled_ = false;
    }

private:
    std::map<std::string, QuantLib::ext::shared_ptr<Logger>> loggers_;
    bool enabled_;
    unsigned mask_;
    std::ostringstream ls_;

    int maxLen_ = 45;

    mutable boost::shared_mutex mutex_;
};

/*!
  Main Logging macro, do not use this directly, use one of the below 7 macros instead
 */
#define MLOG(mask, text)                                                                                               \
    {                                                                                                                  \
        if (ZeroRisk::Log::instance().enabled() && ZeroRisk::Log::instance().filter(mask)) {                           \
            boost::unique_lock<boost::shared_mutex> lock(ZeroRisk::Log::instance().mutex());                           \
            ZeroRisk::Log::instance().header(mask, __FILE__, __LINE__);                                                \
            ZeroRisk::Log::instance().logStream() << text;                                                             \
            ZeroRisk::Log::instance().log(mask);                                                                       \
        }                                                                                                              \
    }

//! Logging Macro (Level = Alert)
#define ALOG(text) MLOG(ZRK_ALERT, text)
//! Logging Macro (Level = Critical)
#define CLOG(text) MLOG(ZRK_CRITICAL, text)
//! Logging Macro (Level = Error)
#define ELOG(text) MLOG(ZRK_ERROR, text)
//! Logging Macro (Level = Warning)
#define WLOG(text) MLOG(ZRK_WARNING, text)
//! Logging Macro (Level = Notice)
#define LOG(text) MLOG(ZRK_NOTICE, text)
//! Logging Macro (Level = Debug)
#define DLOG(text) MLOG(ZRK_DEBUG, text)
//! Logging Macro (Level = Data)
#define TLOG(text) MLOG(ZRK_DATA, text)

} // namespace ZeroRisk
