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

#include "error.hpp"

#include <string.h>
#include <errno.h>
#include <stdarg.h>

#include "utils.hpp"

using namespace dalimaster;


string Error::description() const
{
  return string_format("%s (%s:%ld)", errorMessage.empty() ? "Error" : errorMessage.c_str(), getErrorDomain(), errorCode);
}


bool Error::isDomain(const char *aDomain) const
{
  return strcmp(aDomain, getErrorDomain())==0;
}


bool Error::isError(const char *aDomain, ErrorCode aErrorCode) const
{
  if (errorCode!=aErrorCode) return false;
  return aDomain==NULL || isDomain(aDomain);
}


bool Error::isError(ErrorPtr aError, const char *aDomain, ErrorCode aErrorCode)
{
  return aError && aError->isError(aDomain, aErrorCode);
}


bool Error::isOK(ErrorPtr aError)
{
  return !aError || aError->getErrorCode()==0;
}


string Error::text(ErrorPtr aError)
{
  return isOK(aError) ? "OK" : aError->description();
}


#pragma mark - SysError

SysError::SysError(int aErrNo, const char *aContextMessage) :
  Error(aErrNo, string(nonNullCStr(aContextMessage))+nonNullCStr(strerror(aErrNo)))
{
}


ErrorPtr SysError::err(int aErrNo, const char *aContextMessage)
{
  if (aErrNo==0) return ErrorPtr();
  return ErrorPtr(new SysError(aErrNo, aContextMessage));
}


ErrorPtr SysError::errNo(const char *aContextMessage)
{
  return err(errno, aContextMessage);
}


#pragma mark - TextError

ErrorPtr TextError::err(const char *aFormat, ...)
{
  va_list args;
  va_start(args, aFormat);
  string msg;
  string_format_v(msg, false, aFormat, args);
  va_end(args);
  return ErrorPtr(new TextError(msg));
}
