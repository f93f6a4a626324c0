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

#ifndef __dalimaster__daliidentity__
#define __dalimaster__daliidentity__

#include "dalicomm.hpp"

using namespace std;

namespace dalimaster {

  /// DALI device information record, as read from memory bank 0
  class DaliDeviceInfo : public DMObj
  {
  public:

    DaliDeviceInfo();

    /// short address
    DaliAddress shortAddress;
    // DALI device information
    uint64_t gtin; ///< 48 bit global trade identification number (GTIN / EAN)
    uint8_t fw_version_major; ///< major firmware version
    uint8_t fw_version_minor; ///< minor firmware version
    uint64_t serialNo; ///< 64 bit identification number
    uint8_t hw_version_major; ///< major hardware version
    uint8_t hw_version_minor; ///< minor hardware version
    uint8_t version101; ///< IEC 62386-101 version
    uint8_t version102; ///< IEC 62386-102 version
    uint8_t version103; ///< IEC 62386-103 version
    uint8_t logicalDeviceUnits; ///< number of logical control device units in the bus unit
    uint8_t logicalGearUnits; ///< number of logical control gear units in the bus unit
    uint8_t endpointIndex; ///< index of this control gear unit within the bus unit
    uint8_t lastMemoryLocation; ///< last accessible location of bank 0
    uint8_t deviceType; ///< device type (0xFF if unknown or multiple)

    /// @return the identifier of the device, which does not change when the short address changes
    string uniqueId() const;

    /// text description
    string description() const;
  };
  typedef boost::intrusive_ptr<DaliDeviceInfo> DaliDeviceInfoPtr;

  /// callback function for resolveIdentity
  typedef boost::function<void (DaliDeviceInfoPtr aDaliDeviceInfoPtr, ErrorPtr aError)> DaliDeviceInfoCB;


  /// reads memory bank 0 and the device type of one control gear
  class DaliIdentityResolver : public DaliProcedure
  {
    typedef DaliProcedure inherited;

    DaliDeviceInfoCB callback;
    DaliAddress busAddress;
    DaliDeviceInfoPtr deviceInfo;

  public:

    /// Read identity of a device
    /// @param aDaliComm the bus
    /// @param aResultCB callback receiving the device info record
    /// @param aAddress short address of device to read device info from
    /// @param aWithinProcedure must be set when called from another procedure holding the bus
    static void resolveIdentity(DaliComm &aDaliComm, DaliDeviceInfoCB aResultCB, DaliAddress aAddress, bool aWithinProcedure = false);

    /// evaluate memory bank 0 contents
    /// @param aBank0Data bytes read from bank 0, starting at offset 0
    /// @param aDeviceInfo will receive the identity fields
    /// @return DaliCommErrorIdentityReadFailed if data is missing or not usable for identification
    static ErrorPtr parseBank0(const std::vector<uint8_t> &aBank0Data, DaliDeviceInfo &aDeviceInfo);

  private:

    DaliIdentityResolver(DaliComm &aDaliComm, DaliDeviceInfoCB aResultCB, DaliAddress aAddress);

    void start();
    void handleBank0Data(DaliComm::MemoryVectorPtr aBank0Data, ErrorPtr aError);
    void handleDeviceType(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError);
    void complete(ErrorPtr aError);

  };

} // namespace dalimaster

#endif /* defined(__dalimaster__daliidentity__) */
