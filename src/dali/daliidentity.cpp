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

#include "daliidentity.hpp"

using namespace dalimaster;


#pragma mark - DaliDeviceInfo

DaliDeviceInfo::DaliDeviceInfo() :
  shortAddress(DaliBroadcast),
  gtin(0),
  fw_version_major(0),
  fw_version_minor(0),
  serialNo(0),
  hw_version_major(0),
  hw_version_minor(0),
  version101(0),
  version102(0),
  version103(0),
  logicalDeviceUnits(0),
  logicalGearUnits(0),
  endpointIndex(0),
  lastMemoryLocation(0),
  deviceType(0xFF)
{
}


string DaliDeviceInfo::uniqueId() const
{
  return string_format("%llu-%016llX-%d", (unsigned long long)gtin, (unsigned long long)serialNo, endpointIndex);
}


string DaliDeviceInfo::description() const
{
  string s = string_format("DaliDeviceInfo for short address %d", shortAddress);
  string_format_append(s, "\n- GTIN       : %llu", (unsigned long long)gtin);
  string_format_append(s, "\n- Serial     : %llu", (unsigned long long)serialNo);
  string_format_append(s, "\n- Firmware   : %d.%d", fw_version_major, fw_version_minor);
  string_format_append(s, "\n- Hardware   : %d.%d", hw_version_major, hw_version_minor);
  string_format_append(s, "\n- Gear unit  : %d of %d", endpointIndex, logicalGearUnits);
  string_format_append(s, "\n- Device type: %d", deviceType);
  return s;
}


#pragma mark - DaliIdentityResolver

void DaliIdentityResolver::resolveIdentity(DaliComm &aDaliComm, DaliDeviceInfoCB aResultCB, DaliAddress aAddress, bool aWithinProcedure)
{
  if (!aWithinProcedure && aDaliComm.isBusy()) { if (aResultCB) aResultCB(DaliDeviceInfoPtr(), DaliComm::busyError()); return; }
  // create new instance, deletes itself when finished
  DaliIdentityResolver *resolver = new DaliIdentityResolver(aDaliComm, aResultCB, aAddress);
  resolver->start();
}


DaliIdentityResolver::DaliIdentityResolver(DaliComm &aDaliComm, DaliDeviceInfoCB aResultCB, DaliAddress aAddress) :
  inherited(aDaliComm),
  callback(aResultCB),
  busAddress(aAddress)
{
}


void DaliIdentityResolver::start()
{
  deviceInfo = DaliDeviceInfoPtr(new DaliDeviceInfo);
  deviceInfo->shortAddress = busAddress;
  readMemory(boost::bind(&DaliIdentityResolver::handleBank0Data, this, _1, _2), busAddress, 0, 0, DALIMEM_BANK0_IDBYTES);
}


ErrorPtr DaliIdentityResolver::parseBank0(const std::vector<uint8_t> &aBank0Data, DaliDeviceInfo &aDeviceInfo)
{
  size_t n = aBank0Data.size();
  if (n<DALIMEM_BANK0_MINBYTES) {
    return DaliCommError::err(DaliCommErrorIdentityReadFailed, "only %d bytes of bank 0 could be read from short address %d", (int)n, aDeviceInfo.shortAddress);
  }
  aDeviceInfo.lastMemoryLocation = aBank0Data[DALIMEM_BANK0_LAST_LOCATION];
  if (aDeviceInfo.lastMemoryLocation>=DALIMEM_BANK0_GEAR_UNIT_INDEX && n<DALIMEM_BANK0_IDBYTES) {
    return DaliCommError::err(DaliCommErrorIdentityReadFailed, "bank 0 of short address %d is incomplete (%d bytes)", aDeviceInfo.shortAddress, (int)n);
  }
  // bytes beyond the last accessible location are not valid
  size_t valid = (size_t)aDeviceInfo.lastMemoryLocation+1;
  if (valid<n) n = valid<DALIMEM_BANK0_MINBYTES ? DALIMEM_BANK0_MINBYTES : valid;
  // check plausibility of data
  uint8_t refByte = aBank0Data[DALIMEM_BANK0_GTIN];
  uint8_t numSame = 0;
  for (int i=DALIMEM_BANK0_GTIN+1; i<DALIMEM_BANK0_MINBYTES; i++) {
    uint8_t b = aBank0Data[i];
    if (b==refByte) {
      numSame++;
      if (numSame>=10) {
        LOG(LOG_ERR, "DALI shortaddress %d Bank 0 has >%d consecutive bytes of 0x%02X - indicates invalid GTIN/Serial data", aDeviceInfo.shortAddress, numSame, refByte);
        return DaliCommError::err(DaliCommErrorIdentityReadFailed, "bad repetitive DALI memory bank 0 contents at short address %d", aDeviceInfo.shortAddress);
      }
    }
    else {
      refByte = b;
      numSame = 0;
    }
  }
  // GTIN: bytes 0x03..0x08, MSB first
  aDeviceInfo.gtin = 0;
  for (int i=DALIMEM_BANK0_GTIN; i<DALIMEM_BANK0_GTIN+6; i++) {
    aDeviceInfo.gtin = (aDeviceInfo.gtin << 8) + aBank0Data[i];
  }
  // Firmware version
  aDeviceInfo.fw_version_major = aBank0Data[DALIMEM_BANK0_FW_VERSION];
  aDeviceInfo.fw_version_minor = aBank0Data[DALIMEM_BANK0_FW_VERSION+1];
  // Identification number: bytes 0x0B..0x12, MSB first
  aDeviceInfo.serialNo = 0;
  bool serialBlank = true;
  for (int i=DALIMEM_BANK0_SERIAL; i<DALIMEM_BANK0_SERIAL+8; i++) {
    uint8_t b = aBank0Data[i];
    if (b!=0x00 && b!=0xFF) serialBlank = false;
    aDeviceInfo.serialNo = (aDeviceInfo.serialNo << 8) + b;
  }
  if ((aDeviceInfo.gtin==0 || aDeviceInfo.gtin==0xFFFFFFFFFFFFll) && serialBlank) {
    return DaliCommError::err(DaliCommErrorIdentityReadFailed, "short address %d has no GTIN and serial number", aDeviceInfo.shortAddress);
  }
  // optional parts
  if (n>DALIMEM_BANK0_HW_VERSION+1) {
    aDeviceInfo.hw_version_major = aBank0Data[DALIMEM_BANK0_HW_VERSION];
    aDeviceInfo.hw_version_minor = aBank0Data[DALIMEM_BANK0_HW_VERSION+1];
  }
  if (n>DALIMEM_BANK0_103_VERSION) {
    aDeviceInfo.version101 = aBank0Data[DALIMEM_BANK0_101_VERSION];
    aDeviceInfo.version102 = aBank0Data[DALIMEM_BANK0_102_VERSION];
    aDeviceInfo.version103 = aBank0Data[DALIMEM_BANK0_103_VERSION];
  }
  if (n>DALIMEM_BANK0_NUM_GEAR_UNITS) {
    aDeviceInfo.logicalDeviceUnits = aBank0Data[DALIMEM_BANK0_NUM_DEVICE_UNITS];
    aDeviceInfo.logicalGearUnits = aBank0Data[DALIMEM_BANK0_NUM_GEAR_UNITS];
  }
  aDeviceInfo.endpointIndex = n>DALIMEM_BANK0_GEAR_UNIT_INDEX ? aBank0Data[DALIMEM_BANK0_GEAR_UNIT_INDEX] : 0;
  return ErrorPtr();
}


void DaliIdentityResolver::handleBank0Data(DaliComm::MemoryVectorPtr aBank0Data, ErrorPtr aError)
{
  if (aError) {
    if (!aError->isError(DaliCommError::domain(), DaliCommErrorDALIFrame) && !aError->isError(DaliCommError::domain(), DaliCommErrorConnection)) {
      aError = DaliCommError::err(DaliCommErrorIdentityReadFailed, "reading bank 0 of short address %d failed: %s", busAddress, aError->description().c_str());
    }
    complete(aError);
    return;
  }
  ErrorPtr err = parseBank0(*aBank0Data, *deviceInfo);
  if (err) {
    complete(err);
    return;
  }
  sendQuery(busAddress, DALICMD_QUERY_DEVICE_TYPE, boost::bind(&DaliIdentityResolver::handleDeviceType, this, _1, _2, _3));
}


void DaliIdentityResolver::handleDeviceType(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
{
  if (Error::isError(aError, DaliCommError::domain(), DaliCommErrorNoResponse)) {
    // device type unknown
    aError.reset();
    aResponse = 0xFF;
  }
  if (aError) {
    complete(aError);
    return;
  }
  deviceInfo->deviceType = aResponse;
  LOG(LOG_INFO, "%s", deviceInfo->description().c_str());
  complete(ErrorPtr());
}


void DaliIdentityResolver::complete(ErrorPtr aError)
{
  if (aError) {
    LOG(LOG_WARNING, "DALI short address %d: identity not resolved: %s", busAddress, aError->description().c_str());
    deviceInfo.reset();
  }
  procedureEnded();
  if (callback) callback(deviceInfo, aError);
  // done, delete myself
  delete this;
}
