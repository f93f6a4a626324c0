//
//  Copyright (c) 2013-2015 plan44.ch / Lukas Zeller, Zurich, Switzerland
//
//  Author: Lukas Zeller <luz@plan44.ch>
//
//  This file is part of dalimaster.
//
//  dalimaster is free software: you can redistribute it and/or modify
//  it under the terms of the GNU General Public License as published by
//  the Free Software Foundation, either version 3 of the License, or
//  (at your option) any later version.
//
//  dalimaster is distributed in the hope that it will be useful,
//  but WITHOUT ANY WARRANTY; without even the implied warranty of
//  MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
//  GNU General Public License for more details.
//
//  You should have received a copy of the GNU General Public License
//  along with dalimaster. If not, see <http://www.gnu.org/licenses/>.
//

#ifndef __dalimaster__logger__
#define __dalimaster__logger__

#include <pthread.h>
#include <stdarg.h>
#include <stdio.h>
#include <syslog.h>

#include <string>

#include "dmobj.hpp"

// Logging levels are the syslog levels, LOG_EMERG (0) to LOG_DEBUG (7)

#if defined(DEBUG) || ALWAYS_DEBUG
#define DBGLOG(lvl,...) LOG(lvl,##__VA_ARGS__)
#define LOGGER_DEFAULT_LOGLEVEL LOG_DEBUG
#else
#define DBGLOG(lvl,...)
#define LOGGER_DEFAULT_LOGLEVEL LOG_NOTICE
#endif

// per-file focus logging, enabled by defining FOCUSLOGLEVEL before including this header
#if FOCUSLOGLEVEL
#define FOCUSLOG(...) LOG(FOCUSLOGLEVEL,##__VA_ARGS__)
#if !(defined(DEBUG) || ALWAYS_DEBUG || FOCUSLOGLEVEL>=7)
#warning "**** FOCUSLOGLEVEL<7 enabled in non-DEBUG build ****"
#endif
#else
#define FOCUSLOG(...)
#endif

#define LOGENABLED(lvl) globalLogger.logEnabled(lvl)
#define LOG(lvl,...) { if (globalLogger.wantsLevel(lvl)) globalLogger.log(lvl,##__VA_ARGS__); }

#define SETLOGLEVEL(lvl) globalLogger.setLogLevel(lvl)
#define SETERRLEVEL(lvl, dup) globalLogger.setErrLevel(lvl, dup)


namespace dalimaster {

  /// timestamped log output to stdout, with the more severe messages going to stderr
  class Logger : public DMObj
  {
    pthread_mutex_t outputMutex;
    int logLevel; ///< max level shown on stdout
    int stderrLevel; ///< max level shown on stderr
    bool errToStdout; ///< stderr messages are shown on stdout as well

  public:

    Logger();
    virtual ~Logger();

    /// @return true if messages of aLevel are shown on stdout
    bool logEnabled(int aLevel) { return aLevel<=logLevel; };

    /// @return true if messages of aLevel are shown anywhere
    bool wantsLevel(int aLevel) { return aLevel<=logLevel || aLevel<=stderrLevel; };

    /// log a printf style message
    void log(int aLevel, const char *aFmt, ...);

    /// @param aLogLevel max level for stdout. Messages for stderr (see setErrLevel()) are shown there regardless
    void setLogLevel(int aLogLevel);

    /// @param aStderrLevel max level for stderr (default: LOG_ERR)
    /// @param aErrToStdout if set, stderr messages are also shown on stdout when logLevel allows
    void setErrLevel(int aStderrLevel, bool aErrToStdout);

  private:

    void output(FILE *aStream, const char *aTimestamp, bool aMultiline, const std::string &aMessage);

  };

} // namespace dalimaster


extern dalimaster::Logger globalLogger;


#endif /* defined(__dalimaster__logger__) */
