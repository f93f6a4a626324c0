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

#include "dalibus.hpp"

using namespace dalimaster;


DaliBus::DaliBus(MainLoop &aMainLoop, DaliTransportPtr aTransport, const string aBusId) :
  mainLoop(aMainLoop),
  busId(aBusId)
{
  if (busId.empty()) busId = aTransport->description();
  daliComm = DaliCommPtr(new DaliComm(aMainLoop, aTransport));
  registry = DaliDeviceRegistryPtr(new DaliDeviceRegistry);
}


DaliBus::~DaliBus()
{
  close();
}


ErrorPtr DaliBus::open()
{
  ErrorPtr err = daliComm->open();
  if (err) {
    LOG(LOG_ERR, "DALI bus %s: cannot open: %s", busId.c_str(), err->description().c_str());
  }
  return err;
}


void DaliBus::close()
{
  // a cancelled scan ends at the latest when the dispatcher fails its requests
  DaliScanControlPtr control = scanControl;
  if (control) control->cancel();
  daliComm->close();
}


void DaliBus::scanForGear(DaliDeviceListCB aResultCB, bool aFullRescan)
{
  if (daliComm->isBusy()) {
    if (aResultCB) aResultCB(DaliDeviceList(), DaliScanResultPtr(), DaliComm::busyError());
    return;
  }
  LOG(LOG_NOTICE, "DALI bus %s: %s scan for control gear", busId.c_str(), aFullRescan ? "full" : "incremental");
  DaliScanControlPtr control = DaliAddressingScanner::scanForGear(
    *daliComm,
    boost::bind(&DaliBus::scanDone, this, aResultCB, _1, _2),
    registry->usedShortAddresses(),
    aFullRescan
  );
  if (daliComm->isBusy()) scanControl = control; // not yet completed synchronously
}


void DaliBus::cancelScan()
{
  DaliScanControlPtr control = scanControl;
  if (control) {
    LOG(LOG_NOTICE, "DALI bus %s: cancelling scan", busId.c_str());
    control->cancel();
  }
}


void DaliBus::scanDone(DaliDeviceListCB aResultCB, DaliScanResultPtr aResult, ErrorPtr aError)
{
  DaliDeviceList devices;
  scanControl.reset();
  if (aResult) {
    // scan did run
    std::set<string> confirmed;
    for (DaliDeviceInfoList::iterator pos = aResult->deviceInfos.begin(); pos!=aResult->deviceInfos.end(); ++pos) {
      DaliDevicePtr dev = registry->confirmDevice(*pos);
      confirmed.insert(dev->uniqueId());
      devices.push_back(dev);
    }
    if (Error::isOK(aError)) {
      // absence confirmed for all others
      registry->removeDevicesExcept(confirmed);
    }
  }
  if (aResultCB) aResultCB(devices, aResult, aError);
}


DaliGearPtr DaliBus::gear(const string &aUniqueId)
{
  return DaliGearPtr(new DaliGear(daliComm, registry, aUniqueId));
}


DaliGearGroupPtr DaliBus::group(uint8_t aGroupNo)
{
  if (aGroupNo>=DALI_MAXGROUPS) return DaliGearGroupPtr();
  return DaliGearGroupPtr(new DaliGearGroup(daliComm, DaliGroup+aGroupNo, busId));
}


DaliGearGroupPtr DaliBus::broadcast()
{
  return DaliGearGroupPtr(new DaliGearGroup(daliComm, DaliBroadcast, busId));
}
