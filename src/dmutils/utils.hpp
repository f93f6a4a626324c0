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

#ifndef __dalimaster__utils__
#define __dalimaster__utils__

#include <string>
#include <stdarg.h>
#include <stdint.h>
#include <stdio.h>

using namespace std;

namespace dalimaster {

  /// @name printf style formatting into std::string
  /// @{
  void string_format_v(std::string &aStringObj, bool aAppend, const char *aFormat, va_list aArgs);
  std::string string_format(const char *aFormat, ...);
  void string_format_append(std::string &aStringToAppendTo, const char *aFormat, ...);
  /// @}

  /// @return aNULLOrCStr, or an empty C string for NULL
  const char *nonNullCStr(const char *aNULLOrCStr);

  /// @return aString without leading and/or trailing whitespace
  string trimWhiteSpace(const string &aString, bool aLeading = true, bool aTrailing = true);

  /// get next line from a text buffer, accepting LF, CR and CRLF line ends
  /// @param aCursor points to the start of the text, advanced to the start of the next line
  /// @param aLine receives the line without line end
  /// @return false at end of text
  bool nextLine(const char * &aCursor, string &aLine);

  /// split a "key<separator>value" line, such as the KEY=value lines of sysfs uevent files
  /// @return true if there was a separator and a non-empty key
  /// @note key is trimmed, value has leading whitespace removed only
  bool keyAndValue(const string &aInput, string &aKey, string &aValue, char aSeparator = ':');

  /// read all of a small file
  /// @return true if anything was read
  bool string_fgetfile(FILE *aFile, string &aData);

  /// @return uppercase hex bytes, separated by aSpacer unless it is 0
  string dataToHexString(const uint8_t *aBinary, size_t aSize, char aSpacer = ' ');

} // namespace dalimaster

#endif /* defined(__dalimaster__utils__) */
