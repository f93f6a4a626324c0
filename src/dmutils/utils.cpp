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

#include "utils.hpp"

#include <string.h>
#include <ctype.h>

#include <vector>

using namespace dalimaster;


void dalimaster::string_format_v(std::string &aStringObj, bool aAppend, const char *aFormat, va_list aArgs)
{
  if (!aAppend) aStringObj.clear();
  char buf[128];
  // vsnprintf consumes the va_list, keep a copy for the second pass
  va_list retryArgs;
  va_copy(retryArgs, aArgs);
  int n = vsnprintf(buf, sizeof(buf), aFormat, aArgs);
  if (n>=(int)sizeof(buf)) {
    std::vector<char> bigBuf(n+1);
    n = vsnprintf(&bigBuf[0], bigBuf.size(), aFormat, retryArgs);
    if (n>0) aStringObj.append(&bigBuf[0], n);
  }
  else if (n>0) {
    aStringObj.append(buf, n);
  }
  va_end(retryArgs);
}


std::string dalimaster::string_format(const char *aFormat, ...)
{
  std::string s;
  va_list args;
  va_start(args, aFormat);
  string_format_v(s, false, aFormat, args);
  va_end(args);
  return s;
}


void dalimaster::string_format_append(std::string &aStringToAppendTo, const char *aFormat, ...)
{
  va_list args;
  va_start(args, aFormat);
  string_format_v(aStringToAppendTo, true, aFormat, args);
  va_end(args);
}


const char *dalimaster::nonNullCStr(const char *aNULLOrCStr)
{
  return aNULLOrCStr ? aNULLOrCStr : "";
}


string dalimaster::trimWhiteSpace(const string &aString, bool aLeading, bool aTrailing)
{
  size_t b = 0;
  size_t e = aString.size();
  if (aLeading) while (b<e && isspace((uint8_t)aString[b])) b++;
  if (aTrailing) while (e>b && isspace((uint8_t)aString[e-1])) e--;
  return aString.substr(b, e-b);
}


bool dalimaster::nextLine(const char * &aCursor, string &aLine)
{
  if (!aCursor || *aCursor==0) return false;
  size_t len = strcspn(aCursor, "\r\n");
  aLine.assign(aCursor, len);
  const char *p = aCursor+len;
  if (*p=='\r') p++;
  if (*p=='\n') p++;
  aCursor = p;
  return true;
}


bool dalimaster::keyAndValue(const string &aInput, string &aKey, string &aValue, char aSeparator)
{
  size_t sep = aInput.find(aSeparator);
  if (sep==string::npos) return false;
  aKey = trimWhiteSpace(aInput.substr(0, sep));
  aValue = trimWhiteSpace(aInput.substr(sep+1), true, false);
  return !aKey.empty();
}


bool dalimaster::string_fgetfile(FILE *aFile, string &aData)
{
  aData.clear();
  char buf[512];
  size_t n;
  while ((n = fread(buf, 1, sizeof(buf), aFile))>0) aData.append(buf, n);
  return !aData.empty();
}


string dalimaster::dataToHexString(const uint8_t *aBinary, size_t aSize, char aSpacer)
{
  static const char hexDigits[] = "0123456789ABCDEF";
  string s;
  s.reserve(aSize*3);
  for (size_t i=0; i<aSize; i++) {
    if (aSpacer && i>0) s += aSpacer;
    s += hexDigits[aBinary[i]>>4];
    s += hexDigits[aBinary[i] & 0x0F];
  }
  return s;
}
