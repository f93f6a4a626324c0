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

#include "logger.hpp"

#include <ctype.h>
#include <sys/time.h>
#include <time.h>

#include "utils.hpp"

using namespace dalimaster;

dalimaster::Logger globalLogger;


Logger::Logger() :
  logLevel(LOGGER_DEFAULT_LOGLEVEL),
  stderrLevel(LOG_ERR),
  errToStdout(true)
{
  pthread_mutex_init(&outputMutex, NULL);
}


Logger::~Logger()
{
  pthread_mutex_destroy(&outputMutex);
}


void Logger::setLogLevel(int aLogLevel)
{
  if (aLogLevel>=LOG_EMERG && aLogLevel<=LOG_DEBUG) logLevel = aLogLevel;
}


void Logger::setErrLevel(int aStderrLevel, bool aErrToStdout)
{
  if (aStderrLevel<LOG_EMERG || aStderrLevel>LOG_DEBUG) return;
  stderrLevel = aStderrLevel;
  errToStdout = aErrToStdout;
}


void Logger::log(int aLevel, const char *aFmt, ...)
{
  if (!wantsLevel(aLevel)) return;
  va_list args;
  va_start(args, aFmt);
  string raw;
  string_format_v(raw, false, aFmt, args);
  va_end(args);
  // control chars are shown as \xNN, bytes with bit 7 set are left alone (UTF-8)
  string message;
  message.reserve(raw.size()+1);
  bool multiline = false;
  for (size_t i=0; i<raw.size(); i++) {
    char c = raw[i];
    if (c=='\n') {
      if (i+1<raw.size()) multiline = true;
      message += c;
    }
    else if ((uint8_t)c<0x80 && !isprint(c)) {
      string_format_append(message, "\\x%02x", (unsigned)(uint8_t)c);
    }
    else {
      message += c;
    }
  }
  if (message.empty() || message[message.size()-1]!='\n') message += '\n';
  struct timeval tv;
  gettimeofday(&tv, NULL);
  struct tm lt;
  localtime_r(&tv.tv_sec, &lt);
  char ts[40];
  size_t n = strftime(ts, sizeof(ts), "[%Y-%m-%d %H:%M:%S", &lt);
  snprintf(ts+n, sizeof(ts)-n, ".%03d]", (int)(tv.tv_usec/1000));
  pthread_mutex_lock(&outputMutex);
  bool toStderr = aLevel<=stderrLevel;
  if (toStderr) output(stderr, ts, multiline, message);
  if (logEnabled(aLevel) && (!toStderr || errToStdout)) output(stdout, ts, multiline, message);
  pthread_mutex_unlock(&outputMutex);
}


void Logger::output(FILE *aStream, const char *aTimestamp, bool aMultiline, const std::string &aMessage)
{
  fprintf(aStream, "%s%c%s", aTimestamp, aMultiline ? '\n' : ' ', aMessage.c_str());
  fflush(aStream);
}
