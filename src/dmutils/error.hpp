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

#ifndef __dalimaster__error__
#define __dalimaster__error__

#include <string>
#include <stdint.h>
#include "dmobj.hpp"

using namespace std;

namespace dalimaster {

  typedef long ErrorCode;

  typedef enum {
    ErrorOK,
    ErrorNotOK
  } CommonErrors;


  class Error;
  typedef boost::intrusive_ptr<Error> ErrorPtr;

  /// Error with a code and an optional message. Codes are unique within a domain only, 0 means OK in every domain.
  /// Subclasses define their domain by overriding getErrorDomain() and providing a static domain().
  class Error : public DMObj
  {
    ErrorCode errorCode;
    string errorMessage;

  public:

    static const char *domain() { return "Error_baseClass"; };

    Error(ErrorCode aErrorCode, const std::string &aErrorMessage = "") : errorCode(aErrorCode), errorMessage(aErrorMessage) {};

    ErrorCode getErrorCode() const { return errorCode; };
    virtual const char *getErrorDomain() const { return Error::domain(); };

    /// @return the message as set, empty if none
    const char *getErrorMessage() const { return errorMessage.c_str(); };

    /// @return message followed by (domain:code)
    virtual std::string description() const;

    /// @param aDomain the domain, NULL for any
    bool isError(const char *aDomain, ErrorCode aErrorCode) const;
    bool isDomain(const char *aDomain) const;

    /// @return true if aError is set and matches
    static bool isError(ErrorPtr aError, const char *aDomain, ErrorCode aErrorCode);

    /// @return true for no error object or an error object with code 0
    static bool isOK(ErrorPtr aError);

    /// @return "OK" or the description
    static std::string text(ErrorPtr aError);
  };


  /// errno based error, message is the context followed by strerror()
  class SysError : public Error
  {
  public:
    static const char *domain() { return "System"; };
    virtual const char *getErrorDomain() const { return SysError::domain(); };

    SysError(int aErrNo, const char *aContextMessage = NULL);

    /// @return NULL if aErrNo is 0, SysError otherwise
    static ErrorPtr err(int aErrNo, const char *aContextMessage = NULL);

    /// same as err() with the current errno
    static ErrorPtr errNo(const char *aContextMessage = NULL);
  };


  /// free text error
  class TextError : public Error
  {
  public:
    static const char *domain() { return "TextError"; };
    virtual const char *getErrorDomain() const { return TextError::domain(); };
    TextError(const std::string &aErrorMessage) : Error(ErrorNotOK, aErrorMessage) {};

    /// @return TextError with printf style formatted message
    static ErrorPtr err(const char *aFormat, ...);
  };


} // namespace dalimaster


#endif /* defined(__dalimaster__error__) */
