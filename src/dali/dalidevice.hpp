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

#ifndef __dalimaster__dalidevice__
#define __dalimaster__dalidevice__

#include "daliaddressing.hpp"

using namespace std;

namespace dalimaster {

  /// a control gear known by its identity
  class DaliDevice : public DMObj
  {
    friend class DaliDeviceRegistry;

    string uid;
    uint64_t gtin;
    uint64_t serialNo;
    uint8_t endpointIndex;
    DaliAddress shortAddress; ///< last known short address, DaliBroadcast if unknown
    uint8_t deviceType;
    DaliDeviceInfoPtr deviceInfo;

    DaliDevice(DaliDeviceInfoPtr aDeviceInfo);

  public:

    /// @return unique ID, stable across rescans and short address changes
    const string &uniqueId() const { return uid; };
    uint64_t getGtin() const { return gtin; };
    uint64_t getSerialNo() const { return serialNo; };
    uint8_t getEndpointIndex() const { return endpointIndex; };
    /// @return last known short address, DaliBroadcast if not known
    DaliAddress getShortAddress() const { return shortAddress; };
    uint8_t getDeviceType() const { return deviceType; };
    /// @return the device info record of the last identity resolution
    DaliDeviceInfoPtr getDeviceInfo() const { return deviceInfo; };

    string description() const;
  };
  typedef boost::intrusive_ptr<DaliDevice> DaliDevicePtr;
  typedef std::list<DaliDevicePtr> DaliDeviceList;


  /// all devices known on one bus, by unique ID
  class DaliDeviceRegistry : public DMObj
  {
    typedef std::map<string, DaliDevicePtr> DeviceMap;
    DeviceMap deviceMap;

  public:

    /// create or update device from identity
    /// @param aDeviceInfo the identity as read from the device
    /// @return the device record
    /// @note other devices which had the same short address lose it
    DaliDevicePtr confirmDevice(DaliDeviceInfoPtr aDeviceInfo);

    /// @return device or NULL if unknown
    DaliDevicePtr getDevice(const string &aUniqueId);

    /// get the current short address of a device
    /// @return false if device is unknown or has no known short address
    bool shortAddressFor(const string &aUniqueId, DaliAddress &aShortAddress);

    /// @return short addresses held by known devices
    DaliAddressSet usedShortAddresses();

    /// remove all devices not in the given set
    /// @return number of devices removed
    int removeDevicesExcept(const std::set<string> &aUniqueIds);

    /// remove a device
    void forgetDevice(const string &aUniqueId);

    /// @return all devices, ordered by unique ID
    DaliDeviceList devices();

    size_t size() const { return deviceMap.size(); };
  };
  typedef boost::intrusive_ptr<DaliDeviceRegistry> DaliDeviceRegistryPtr;


  /// decoded QUERY_STATUS answer
  typedef struct {
    uint8_t raw;
    bool controlGearFailure;
    bool lampFailure;
    bool lampOn;
    bool limitError;
    bool fadeRunning;
    bool resetState;
    bool missingShortAddress;
    bool powerCycleSeen;
  } DaliGearStatus;

  /// callback for status queries
  typedef boost::function<void (DaliGearStatus aStatus, ErrorPtr aError)> DaliGearStatusCB;

  /// callback for single value queries
  typedef boost::function<void (uint8_t aValue, ErrorPtr aError)> DaliValueCB;

  /// callback for group membership queries
  typedef boost::function<void (uint16_t aGroupMask, ErrorPtr aError)> DaliGroupsCB;


  /// handle to control one control gear by its unique ID
  /// @note the short address is looked up in the registry for every command
  class DaliGear : public DMObj
  {
    DaliCommPtr daliComm;
    DaliDeviceRegistryPtr registry;
    string uid;

  public:

    DaliGear(DaliCommPtr aDaliComm, DaliDeviceRegistryPtr aRegistry, const string &aUniqueId);

    const string &uniqueId() const { return uid; };

    /// @name light control
    /// @{
    void on(StatusCB aStatusCB = NULL);
    void off(StatusCB aStatusCB = NULL);
    void setLevel(uint8_t aLevel, StatusCB aStatusCB = NULL);
    void recallMax(StatusCB aStatusCB = NULL);
    void recallMin(StatusCB aStatusCB = NULL);
    void brighten(StatusCB aStatusCB = NULL);
    void dim(StatusCB aStatusCB = NULL);
    /// switch off if on, on if off (based on actual level)
    void toggle(StatusCB aStatusCB = NULL);
    /// @}

    /// @name queries
    /// @{
    void queryStatus(DaliGearStatusCB aResultCB);
    void queryActualLevel(DaliValueCB aResultCB);
    /// @note answer is fade time in upper, fade rate in lower 4 bits
    void queryFade(DaliValueCB aResultCB);
    void queryPowerOnLevel(DaliValueCB aResultCB);
    void queryGroups(DaliGroupsCB aResultCB);
    /// @}

    /// @name configuration
    /// @{
    void setPowerOnLevel(uint8_t aLevel, StatusCB aStatusCB = NULL);
    void addToGroup(uint8_t aGroup, StatusCB aStatusCB = NULL);
    void removeFromGroup(uint8_t aGroup, StatusCB aStatusCB = NULL);
    /// @}

    /// decode QUERY_STATUS answer
    static DaliGearStatus decodeStatus(uint8_t aStatusByte);

  private:

    ErrorPtr resolveAddress(DaliAddress &aShortAddress);
    void sendCommand(uint8_t aCommand, StatusCB aStatusCB);
    void query(uint8_t aQuery, DaliValueCB aResultCB);
    void queryResponse(DaliValueCB aResultCB, bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError);
    void statusResponse(DaliGearStatusCB aResultCB, uint8_t aValue, ErrorPtr aError);
    void toggleLevelResponse(StatusCB aStatusCB, uint8_t aValue, ErrorPtr aError);
    void groupsLowResponse(DaliGroupsCB aResultCB, uint8_t aValue, ErrorPtr aError);
    void groupsHighResponse(DaliGroupsCB aResultCB, uint8_t aLow, uint8_t aValue, ErrorPtr aError);
  };
  typedef boost::intrusive_ptr<DaliGear> DaliGearPtr;


  /// handle to control a DALI group or all gear on the bus
  class DaliGearGroup : public DMObj
  {
    DaliCommPtr daliComm;
    DaliAddress address;
    string uid;

  public:

    /// @param aAddress DaliGroup+n or DaliBroadcast
    /// @param aBusId identifier of the bus, used as unique ID prefix
    DaliGearGroup(DaliCommPtr aDaliComm, DaliAddress aAddress, const string &aBusId);

    const string &uniqueId() const { return uid; };
    DaliAddress getAddress() const { return address; };

    void on(StatusCB aStatusCB = NULL);
    void off(StatusCB aStatusCB = NULL);
    void setLevel(uint8_t aLevel, StatusCB aStatusCB = NULL);
    void recallMax(StatusCB aStatusCB = NULL);
    void recallMin(StatusCB aStatusCB = NULL);
  };
  typedef boost::intrusive_ptr<DaliGearGroup> DaliGearGroupPtr;

} // namespace dalimaster

#endif /* defined(__dalimaster__dalidevice__) */
