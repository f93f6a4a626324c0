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

// File scope debugging options
// - Set ALWAYS_DEBUG to 1 to enable DBGLOG output even in non-DEBUG builds of this file
#define ALWAYS_DEBUG 0
// - set FOCUSLOGLEVEL to non-zero log level (usually, 5,6, or 7==LOG_DEBUG) to get focus (extensive logging) for this file
//   Note: must be before including "logger.hpp" (or anything that includes "logger.hpp")
#define FOCUSLOGLEVEL 0

#include "dalidevice.hpp"

using namespace dalimaster;


#pragma mark - DaliDevice

DaliDevice::DaliDevice(DaliDeviceInfoPtr aDeviceInfo) :
  uid(aDeviceInfo->uniqueId()),
  gtin(aDeviceInfo->gtin),
  serialNo(aDeviceInfo->serialNo),
  endpointIndex(aDeviceInfo->endpointIndex),
  shortAddress(aDeviceInfo->shortAddress),
  deviceType(aDeviceInfo->deviceType),
  deviceInfo(aDeviceInfo)
{
}


string DaliDevice::description() const
{
  string s = uid;
  if (shortAddress==DaliBroadcast)
    s += " (no short address)";
  else
    string_format_append(s, " at short address %d", shortAddress);
  string_format_append(s, ", device type %d", deviceType);
  return s;
}


#pragma mark - DaliDeviceRegistry

DaliDevicePtr DaliDeviceRegistry::confirmDevice(DaliDeviceInfoPtr aDeviceInfo)
{
  string uid = aDeviceInfo->uniqueId();
  // nobody else can have this short address now
  for (DeviceMap::iterator pos = deviceMap.begin(); pos!=deviceMap.end(); ++pos) {
    if (pos->first!=uid && pos->second->shortAddress==aDeviceInfo->shortAddress) {
      LOG(LOG_INFO, "registry: %s lost short address %d", pos->first.c_str(), aDeviceInfo->shortAddress);
      pos->second->shortAddress = DaliBroadcast;
    }
  }
  DeviceMap::iterator pos = deviceMap.find(uid);
  DaliDevicePtr dev;
  if (pos==deviceMap.end()) {
    dev = DaliDevicePtr(new DaliDevice(aDeviceInfo));
    deviceMap[uid] = dev;
    LOG(LOG_NOTICE, "registry: new device %s", dev->description().c_str());
  }
  else {
    dev = pos->second;
    if (dev->shortAddress!=aDeviceInfo->shortAddress) {
      LOG(LOG_NOTICE, "registry: device %s moved from short address %d to %d", uid.c_str(), dev->shortAddress, aDeviceInfo->shortAddress);
    }
    dev->shortAddress = aDeviceInfo->shortAddress;
    dev->deviceType = aDeviceInfo->deviceType;
    dev->deviceInfo = aDeviceInfo;
  }
  return dev;
}


DaliDevicePtr DaliDeviceRegistry::getDevice(const string &aUniqueId)
{
  DeviceMap::iterator pos = deviceMap.find(aUniqueId);
  if (pos==deviceMap.end()) return DaliDevicePtr();
  return pos->second;
}


bool DaliDeviceRegistry::shortAddressFor(const string &aUniqueId, DaliAddress &aShortAddress)
{
  DaliDevicePtr dev = getDevice(aUniqueId);
  if (!dev || dev->shortAddress==DaliBroadcast) return false;
  aShortAddress = dev->shortAddress;
  return true;
}


DaliAddressSet DaliDeviceRegistry::usedShortAddresses()
{
  DaliAddressSet used;
  for (DeviceMap::iterator pos = deviceMap.begin(); pos!=deviceMap.end(); ++pos) {
    if (pos->second->shortAddress!=DaliBroadcast) used.insert(pos->second->shortAddress);
  }
  return used;
}


int DaliDeviceRegistry::removeDevicesExcept(const std::set<string> &aUniqueIds)
{
  int removed = 0;
  DeviceMap::iterator pos = deviceMap.begin();
  while (pos!=deviceMap.end()) {
    if (aUniqueIds.count(pos->first)==0) {
      LOG(LOG_NOTICE, "registry: device %s is gone", pos->first.c_str());
      deviceMap.erase(pos++);
      removed++;
    }
    else {
      ++pos;
    }
  }
  return removed;
}


void DaliDeviceRegistry::forgetDevice(const string &aUniqueId)
{
  deviceMap.erase(aUniqueId);
}


DaliDeviceList DaliDeviceRegistry::devices()
{
  DaliDeviceList list;
  for (DeviceMap::iterator pos = deviceMap.begin(); pos!=deviceMap.end(); ++pos) {
    list.push_back(pos->second);
  }
  return list;
}


#pragma mark - DaliGear

DaliGear::DaliGear(DaliCommPtr aDaliComm, DaliDeviceRegistryPtr aRegistry, const string &aUniqueId) :
  daliComm(aDaliComm),
  registry(aRegistry),
  uid(aUniqueId)
{
}


ErrorPtr DaliGear::resolveAddress(DaliAddress &aShortAddress)
{
  if (!registry->shortAddressFor(uid, aShortAddress)) {
    return DaliCommError::err(DaliCommErrorDeviceNotAddressed, "no short address known for device %s", uid.c_str());
  }
  return ErrorPtr();
}


void DaliGear::sendCommand(uint8_t aCommand, StatusCB aStatusCB)
{
  DaliAddress a;
  ErrorPtr err = resolveAddress(a);
  if (err) { if (aStatusCB) aStatusCB(err); return; }
  daliComm->daliSendCommand(a, aCommand, aStatusCB);
}


void DaliGear::on(StatusCB aStatusCB)
{
  sendCommand(DALICMD_GO_TO_LAST_ACTIVE_LEVEL, aStatusCB);
}


void DaliGear::off(StatusCB aStatusCB)
{
  sendCommand(DALICMD_OFF, aStatusCB);
}


void DaliGear::setLevel(uint8_t aLevel, StatusCB aStatusCB)
{
  DaliAddress a;
  ErrorPtr err = resolveAddress(a);
  if (err) { if (aStatusCB) aStatusCB(err); return; }
  daliComm->daliSendDirectPower(a, aLevel, aStatusCB);
}


void DaliGear::recallMax(StatusCB aStatusCB)
{
  sendCommand(DALICMD_RECALL_MAX_LEVEL, aStatusCB);
}


void DaliGear::recallMin(StatusCB aStatusCB)
{
  sendCommand(DALICMD_RECALL_MIN_LEVEL, aStatusCB);
}


void DaliGear::brighten(StatusCB aStatusCB)
{
  sendCommand(DALICMD_UP, aStatusCB);
}


void DaliGear::dim(StatusCB aStatusCB)
{
  sendCommand(DALICMD_DOWN, aStatusCB);
}


void DaliGear::toggle(StatusCB aStatusCB)
{
  queryActualLevel(boost::bind(&DaliGear::toggleLevelResponse, DaliGearPtr(this), aStatusCB, _1, _2));
}


void DaliGear::toggleLevelResponse(StatusCB aStatusCB, uint8_t aValue, ErrorPtr aError)
{
  if (aError) { if (aStatusCB) aStatusCB(aError); return; }
  if (aValue>0)
    off(aStatusCB);
  else
    on(aStatusCB);
}


void DaliGear::query(uint8_t aQuery, DaliValueCB aResultCB)
{
  DaliAddress a;
  ErrorPtr err = resolveAddress(a);
  if (err) { aResultCB(0, err); return; }
  daliComm->daliSendQuery(a, aQuery, boost::bind(&DaliGear::queryResponse, DaliGearPtr(this), aResultCB, _1, _2, _3));
}


void DaliGear::queryResponse(DaliValueCB aResultCB, bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
{
  aResultCB(aResponse, aError);
}


DaliGearStatus DaliGear::decodeStatus(uint8_t aStatusByte)
{
  DaliGearStatus st;
  st.raw = aStatusByte;
  st.controlGearFailure = (aStatusByte & DALISTATUS_CONTROL_GEAR_FAILURE)!=0;
  st.lampFailure = (aStatusByte & DALISTATUS_LAMP_FAILURE)!=0;
  st.lampOn = (aStatusByte & DALISTATUS_LAMP_ON)!=0;
  st.limitError = (aStatusByte & DALISTATUS_LIMIT_ERROR)!=0;
  st.fadeRunning = (aStatusByte & DALISTATUS_FADE_RUNNING)!=0;
  st.resetState = (aStatusByte & DALISTATUS_RESET_STATE)!=0;
  st.missingShortAddress = (aStatusByte & DALISTATUS_MISSING_SHORT_ADDRESS)!=0;
  st.powerCycleSeen = (aStatusByte & DALISTATUS_POWER_CYCLE_SEEN)!=0;
  return st;
}


void DaliGear::queryStatus(DaliGearStatusCB aResultCB)
{
  query(DALICMD_QUERY_STATUS, boost::bind(&DaliGear::statusResponse, DaliGearPtr(this), aResultCB, _1, _2));
}


void DaliGear::statusResponse(DaliGearStatusCB aResultCB, uint8_t aValue, ErrorPtr aError)
{
  aResultCB(decodeStatus(aError ? 0 : aValue), aError);
}


void DaliGear::queryActualLevel(DaliValueCB aResultCB)
{
  query(DALICMD_QUERY_ACTUAL_LEVEL, aResultCB);
}


void DaliGear::queryFade(DaliValueCB aResultCB)
{
  query(DALICMD_QUERY_FADE_TIME_FADE_RATE, aResultCB);
}


void DaliGear::queryPowerOnLevel(DaliValueCB aResultCB)
{
  query(DALICMD_QUERY_POWER_ON_LEVEL, aResultCB);
}


void DaliGear::queryGroups(DaliGroupsCB aResultCB)
{
  query(DALICMD_QUERY_GROUPS_0_TO_7, boost::bind(&DaliGear::groupsLowResponse, DaliGearPtr(this), aResultCB, _1, _2));
}


void DaliGear::groupsLowResponse(DaliGroupsCB aResultCB, uint8_t aValue, ErrorPtr aError)
{
  if (aError) { aResultCB(0, aError); return; }
  query(DALICMD_QUERY_GROUPS_8_TO_15, boost::bind(&DaliGear::groupsHighResponse, DaliGearPtr(this), aResultCB, aValue, _1, _2));
}


void DaliGear::groupsHighResponse(DaliGroupsCB aResultCB, uint8_t aLow, uint8_t aValue, ErrorPtr aError)
{
  if (aError) { aResultCB(0, aError); return; }
  aResultCB(((uint16_t)aValue<<8) | aLow, ErrorPtr());
}


void DaliGear::setPowerOnLevel(uint8_t aLevel, StatusCB aStatusCB)
{
  DaliAddress a;
  ErrorPtr err = resolveAddress(a);
  if (err) { if (aStatusCB) aStatusCB(err); return; }
  daliComm->daliSendDtrAndCommand(a, DALICMD_STORE_DTR_AS_POWER_ON_LEVEL, aLevel, aStatusCB);
}


void DaliGear::addToGroup(uint8_t aGroup, StatusCB aStatusCB)
{
  if (aGroup>=DALI_MAXGROUPS) {
    if (aStatusCB) aStatusCB(DaliCommError::err(DaliCommErrorInvalidCommand, "invalid group %d", aGroup));
    return;
  }
  sendCommand(DALICMD_ADD_TO_GROUP+aGroup, aStatusCB);
}


void DaliGear::removeFromGroup(uint8_t aGroup, StatusCB aStatusCB)
{
  if (aGroup>=DALI_MAXGROUPS) {
    if (aStatusCB) aStatusCB(DaliCommError::err(DaliCommErrorInvalidCommand, "invalid group %d", aGroup));
    return;
  }
  sendCommand(DALICMD_REMOVE_FROM_GROUP+aGroup, aStatusCB);
}


#pragma mark - DaliGearGroup

DaliGearGroup::DaliGearGroup(DaliCommPtr aDaliComm, DaliAddress aAddress, const string &aBusId) :
  daliComm(aDaliComm),
  address(aAddress)
{
  if (address==DaliBroadcast)
    uid = aBusId + "-broadcast";
  else
    uid = string_format("%s-group%d", aBusId.c_str(), address & DaliGroupMask);
}


void DaliGearGroup::on(StatusCB aStatusCB)
{
  daliComm->daliSendCommand(address, DALICMD_GO_TO_LAST_ACTIVE_LEVEL, aStatusCB);
}


void DaliGearGroup::off(StatusCB aStatusCB)
{
  daliComm->daliSendCommand(address, DALICMD_OFF, aStatusCB);
}


void DaliGearGroup::setLevel(uint8_t aLevel, StatusCB aStatusCB)
{
  daliComm->daliSendDirectPower(address, aLevel, aStatusCB);
}


void DaliGearGroup::recallMax(StatusCB aStatusCB)
{
  daliComm->daliSendCommand(address, DALICMD_RECALL_MAX_LEVEL, aStatusCB);
}


void DaliGearGroup::recallMin(StatusCB aStatusCB)
{
  daliComm->daliSendCommand(address, DALICMD_RECALL_MIN_LEVEL, aStatusCB);
}
