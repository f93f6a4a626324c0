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

#ifndef __dalimaster__daliaddressing__
#define __dalimaster__daliaddressing__

#include "daliidentity.hpp"

#include <set>

using namespace std;

namespace dalimaster {

  typedef std::set<DaliAddress> DaliAddressSet;
  typedef std::list<DaliDeviceInfoPtr> DaliDeviceInfoList;


  /// handle to cancel a running scan
  class DaliScanControl : public DMObj
  {
    friend class DaliAddressingScanner;

    bool cancelled;
    boost::function<void ()> wakeHandler; ///< set while the scan waits for a timer rather than for the bus

  public:
    DaliScanControl() : cancelled(false) {};
    /// request cancellation. The scan stops at the next step, always terminating addressing mode on the bus.
    /// A scan waiting for a timer takes that step right away.
    void cancel();
    bool isCancelled() const { return cancelled; };
  };
  typedef boost::intrusive_ptr<DaliScanControl> DaliScanControlPtr;


  /// outcome of a scan
  class DaliScanResult : public DMObj
  {
  public:
    DaliScanResult() : compareCount(0), searchRounds(0), withdrawnCount(0), restarts(0), collisionSeen(false) {};

    DaliDeviceInfoList deviceInfos; ///< devices identified
    typedef std::list<std::pair<DaliAddress, ErrorPtr> > ProblemList;
    ProblemList problems; ///< devices that could not be addressed or identified
    DaliAddressSet presentAddresses; ///< short addresses answering the poll before addressing
    int compareCount; ///< number of COMPARE commands sent
    int searchRounds; ///< number of COMPARE commands sent for narrowing down a search interval
    int withdrawnCount; ///< number of devices withdrawn from the search
    int restarts; ///< number of search restarts
    bool collisionSeen; ///< framing errors were seen (devices sharing short or random address)
  };
  typedef boost::intrusive_ptr<DaliScanResult> DaliScanResultPtr;

  /// callback for scan results
  typedef boost::function<void (DaliScanResultPtr aResult, ErrorPtr aError)> DaliScanCB;


  /// assigns short addresses to all control gear on the bus by random address binary search,
  /// and resolves the identity of every gear found
  class DaliAddressingScanner : public DaliProcedure
  {
    typedef DaliProcedure inherited;

    DaliScanCB callback;
    DaliScanControlPtr control;
    DaliScanResultPtr result;
    bool fullRescan;

    DaliAddressSet usedAddresses; ///< addresses present on the bus or reserved for known devices
    DaliAddressSet claimedAddresses; ///< addresses given to devices found in this scan
    DaliAddressSet resolvedAddresses; ///< addresses whose identity is already resolved

    DaliAddress pollAddress;
    bool probing;
    uint32_t searchMin;
    uint32_t searchMax;
    uint32_t searchAddr;
    uint8_t searchL, searchM, searchH;
    bool setLMH;
    int readShortAddrRepeat;
    int restarts;
    int clashRestarts;
    DaliAddress newAddress;
    DaliAddressSet::iterator resolvePos;
    long settleTicket;

  public:

    /// Scan the bus
    /// @param aDaliComm the bus
    /// @param aResultCB called when scan is complete
    /// @param aReservedAddresses short addresses that must not be given to new devices (e.g. known from earlier scans)
    /// @param aFullRescan if set, all devices take part in the search, otherwise only devices without short address
    /// @return control handle to cancel the scan
    static DaliScanControlPtr scanForGear(DaliComm &aDaliComm, DaliScanCB aResultCB, const DaliAddressSet &aReservedAddresses, bool aFullRescan);

  private:

    DaliAddressingScanner(DaliComm &aDaliComm, DaliScanCB aResultCB, const DaliAddressSet &aReservedAddresses, bool aFullRescan);

    void start();
    void pollNext();
    void handlePollResponse(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError);
    void startAddressing();
    void handleRandomised(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError);
    void settled();
    void wakeForCancel();
    void newSearch();
    void updateSearchAddress();
    void compareNext();
    void handleCompareResult(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError);
    void deviceFound();
    void readShortAddress();
    void handleShortAddressQuery(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError);
    DaliAddress lowestFreeAddress();
    void handleNewShortAddressVerify(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError);
    void deviceAddressed(DaliAddress aShortAddress);
    void handleIdentity(DaliAddress aShortAddress, DaliDeviceInfoPtr aDeviceInfo, ErrorPtr aError);
    void clashDetected(DaliAddress aShortAddress);
    void handleWithdrawn(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError);
    void noMoreDevices();
    void searchTerminated(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError);
    void resolveNextPresent();
    void handlePresentIdentity(DaliAddress aShortAddress, DaliDeviceInfoPtr aDeviceInfo, ErrorPtr aError);
    void completed(ErrorPtr aError);
    void terminated(ErrorPtr aError, bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aTerminateError);
    void finish(ErrorPtr aError);
    bool checkCancelled();

  };

} // namespace dalimaster

#endif /* defined(__dalimaster__daliaddressing__) */
