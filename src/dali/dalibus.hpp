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

#ifndef __dalimaster__dalibus__
#define __dalimaster__dalibus__

#include "dalidevice.hpp"

using namespace std;

namespace dalimaster {

  /// callback for scanForGear
  /// @param aDevices the devices confirmed by the scan
  /// @param aResult the scan details (statistics, problems), can be NULL if scan could not start
  /// @param aError error, if any
  typedef boost::function<void (DaliDeviceList aDevices, DaliScanResultPtr aResult, ErrorPtr aError)> DaliDeviceListCB;


  /// one DALI bus, accessed via one adapter
  class DaliBus : public DMObj
  {
    MainLoop &mainLoop;
    string busId;
    DaliCommPtr daliComm;
    DaliDeviceRegistryPtr registry;
    DaliScanControlPtr scanControl;

  public:

    /// @param aTransport the adapter
    /// @param aBusId identifier of the bus, defaults to the transport's description
    DaliBus(MainLoop &aMainLoop, DaliTransportPtr aTransport, const string aBusId = "");
    virtual ~DaliBus();

    ErrorPtr open();
    void close();

    const string &getBusId() const { return busId; };
    DaliCommPtr getDaliComm() { return daliComm; };
    DaliDeviceRegistryPtr getRegistry() { return registry; };

    /// scan the bus, assign short addresses where needed and identify all control gear
    /// @param aResultCB called with the devices found
    /// @param aFullRescan if set, all devices take part in the random address search,
    ///   otherwise only those without short address
    /// @note devices in the registry that are not found any more are removed when the scan completes without error
    void scanForGear(DaliDeviceListCB aResultCB, bool aFullRescan = false);

    /// cancel a running scan
    void cancelScan();

    /// @return true if a scan is running
    bool isScanning() { return scanControl!=NULL; };

    /// @return handle to control a gear by unique ID
    DaliGearPtr gear(const string &aUniqueId);

    /// @return handle to control a group (0..15), NULL for invalid group number
    DaliGearGroupPtr group(uint8_t aGroupNo);

    /// @return handle to control all gear on the bus
    DaliGearGroupPtr broadcast();

    /// @name bus event listeners
    /// @{
    long addMessageCallback(DaliBusEventCB aCallback, size_t aMaxQueued = 100) { return daliComm->addMessageCallback(aCallback, aMaxQueued); };
    void removeMessageCallback(long aListenerId) { daliComm->removeMessageCallback(aListenerId); };
    /// @}

  private:

    void scanDone(DaliDeviceListCB aResultCB, DaliScanResultPtr aResult, ErrorPtr aError);

  };
  typedef boost::intrusive_ptr<DaliBus> DaliBusPtr;

} // namespace dalimaster

#endif /* defined(__dalimaster__dalibus__) */
