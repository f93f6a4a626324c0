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

#ifndef __dalimaster__dalitypes__
#define __dalimaster__dalitypes__

#include "dm_common.hpp"

#include "dalidefs.h"

using namespace std;

namespace dalimaster {

  // Errors
  typedef enum {
    DaliCommErrorOK,
    DaliCommErrorBusy, ///< a procedure (scan, identity read) has exclusive access to the bus
    DaliCommErrorConnection, ///< transport not open, lost or failing
    DaliCommErrorMalformedFrame, ///< adapter report or backward frame with unexpected length/contents
    DaliCommErrorNoResponse, ///< query expecting an answer got none
    DaliCommErrorDALIFrame, ///< framing error on the bus (usually several devices answering differently)
    DaliCommErrorInvalidCommand, ///< command cannot be encoded
    DaliCommErrorInvalidAnswer, ///< answer not plausible
    DaliCommErrorAddressSpaceExhausted, ///< no free short address left
    DaliCommErrorIdentityReadFailed, ///< memory bank 0 could not be read or is unusable
    DaliCommErrorDeviceNotAddressed, ///< device has no known short address
    DaliCommErrorDeviceSearch, ///< binary search failed
    DaliCommErrorSetShortAddress, ///< short address could not be programmed
    DaliCommErrorCancelled, ///< procedure was cancelled
  } DaliCommErrors;

  class DaliCommError : public Error
  {
  public:
    static const char *domain() { return "DaliComm"; }
    virtual const char *getErrorDomain() const { return DaliCommError::domain(); };
    DaliCommError(DaliCommErrors aError) : Error(ErrorCode(aError)) {};
    DaliCommError(DaliCommErrors aError, std::string aErrorMessage) : Error(ErrorCode(aError), aErrorMessage) {};

    /// factory method to create DaliCommError fprint style
    static ErrorPtr err(DaliCommErrors aError, const char *aFormat, ...);
  };


  /// abstracted DALI bus address
  typedef uint8_t DaliAddress;
  const DaliAddress DaliGroup = 0x80; // marks group address
  const DaliAddress DaliBroadcast = 0xFF; // all devices on the bus
  const DaliAddress DaliBroadcastUnaddressed = 0xFE; // all devices without short address
  const DaliAddress DaliAddressMask = 0x3F; // address mask
  const DaliAddress DaliGroupMask = 0x0F; // group mask

  /// raw bytes as exchanged with the adapter
  typedef std::vector<uint8_t> DaliByteVector;

  /// @return textual representation of a DALI address, like "short 12", "group 3" or "broadcast"
  string daliAddressText(DaliAddress aAddress);

} // namespace dalimaster

#endif /* defined(__dalimaster__dalitypes__) */
