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

#include "dalitypes.hpp"

#include <stdarg.h>

using namespace dalimaster;


ErrorPtr DaliCommError::err(DaliCommErrors aError, const char *aFormat, ...)
{
  va_list args;
  va_start(args, aFormat);
  string s;
  string_format_v(s, false, aFormat, args);
  va_end(args);
  return ErrorPtr(new DaliCommError(aError, s));
}


string dalimaster::daliAddressText(DaliAddress aAddress)
{
  if (aAddress==DaliBroadcast) return "broadcast";
  if (aAddress==DaliBroadcastUnaddressed) return "broadcast unaddressed";
  if (aAddress & DaliGroup) return string_format("group %d", aAddress & DaliGroupMask);
  return string_format("short %d", aAddress & DaliAddressMask);
}
