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

#include "daliaddressing.hpp"

using namespace dalimaster;


#define MAX_RESTARTS 3
#define MAX_SHORTADDR_READ_REPEATS 2
#define RANDOMISE_SETTLE_TIME (100*MilliSecond)


#pragma mark - DaliScanControl

void DaliScanControl::cancel()
{
  cancelled = true;
  if (wakeHandler) {
    boost::function<void ()> h = wakeHandler;
    wakeHandler.clear();
    h();
  }
}


#pragma mark - DaliAddressingScanner

DaliScanControlPtr DaliAddressingScanner::scanForGear(DaliComm &aDaliComm, DaliScanCB aResultCB, const DaliAddressSet &aReservedAddresses, bool aFullRescan)
{
  DaliScanControlPtr control = DaliScanControlPtr(new DaliScanControl);
  if (aDaliComm.isBusy()) { if (aResultCB) aResultCB(DaliScanResultPtr(), DaliComm::busyError()); return control; }
  // create new instance, deletes itself when finished
  DaliAddressingScanner *scanner = new DaliAddressingScanner(aDaliComm, aResultCB, aReservedAddresses, aFullRescan);
  scanner->control = control;
  scanner->start();
  return control;
}


DaliAddressingScanner::DaliAddressingScanner(DaliComm &aDaliComm, DaliScanCB aResultCB, const DaliAddressSet &aReservedAddresses, bool aFullRescan) :
  inherited(aDaliComm),
  callback(aResultCB),
  result(new DaliScanResult),
  fullRescan(aFullRescan),
  usedAddresses(aReservedAddresses),
  pollAddress(0),
  probing(false),
  searchMin(0),
  searchMax(DALI_SEARCHADDR_MAX),
  searchAddr(DALI_SEARCHADDR_MAX),
  searchL(0), searchM(0), searchH(0),
  setLMH(true),
  readShortAddrRepeat(0),
  restarts(0),
  clashRestarts(0),
  newAddress(DaliBroadcast),
  settleTicket(0)
{
}


bool DaliAddressingScanner::checkCancelled()
{
  if (control && control->isCancelled()) {
    LOG(LOG_NOTICE, "DALI scan: cancelled");
    completed(DaliCommError::err(DaliCommErrorCancelled, "scan cancelled"));
    return true;
  }
  return false;
}


#pragma mark - short address poll

void DaliAddressingScanner::start()
{
  LOG(LOG_NOTICE, "DALI scan: polling short addresses");
  pollAddress = 0;
  pollNext();
}


void DaliAddressingScanner::pollNext()
{
  if (checkCancelled()) return;
  sendQuery(pollAddress, DALICMD_QUERY_CONTROL_GEAR, boost::bind(&DaliAddressingScanner::handlePollResponse, this, _1, _2, _3));
}


void DaliAddressingScanner::handlePollResponse(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
{
  bool isYes = false;
  if (Error::isError(aError, DaliCommError::domain(), DaliCommErrorDALIFrame)) {
    // framing error, indicates that we might have duplicates
    LOG(LOG_INFO, "DALI scan: framing error from short address %d - probably short address collision", pollAddress);
    result->collisionSeen = true;
    isYes = true; // still count as YES
    aError.reset();
  }
  else if (aError) {
    completed(aError);
    return;
  }
  else if (!aNoOrTimeout) {
    isYes = true;
    if (aResponse!=DALIANSWER_YES) {
      // not entirely correct answer, also indicates collision
      LOG(LOG_INFO, "DALI scan: incorrect YES answer 0x%02X from short address %d - probably short address collision", aResponse, pollAddress);
      result->collisionSeen = true;
    }
  }
  if (isYes) {
    LOG(LOG_INFO, "DALI scan: control gear present at short address %d", pollAddress);
    result->presentAddresses.insert(pollAddress);
  }
  pollAddress++;
  if (pollAddress<DALI_MAXDEVICES) {
    pollNext();
    return;
  }
  startAddressing();
}


#pragma mark - random address search

void DaliAddressingScanner::startAddressing()
{
  usedAddresses.insert(result->presentAddresses.begin(), result->presentAddresses.end());
  if (result->collisionSeen && !fullRescan) {
    LOG(LOG_NOTICE, "DALI scan: short address collisions detected -> including all devices in the search");
    fullRescan = true;
  }
  LOG(LOG_NOTICE, "DALI scan: starting random address search (%s)", fullRescan ? "all devices" : "devices without short address");
  // Terminate any special modes first
  sendSpecial(DALICMD_TERMINATE, 0x00);
  // initialize for random address selection process
  sendSpecial(DALICMD_INITIALISE, fullRescan ? DALIINIT_ALL : DALIINIT_UNADDRESSED);
  sendSpecial(DALICMD_RANDOMISE, 0x00, boost::bind(&DaliAddressingScanner::handleRandomised, this, _1, _2, _3));
}


void DaliAddressingScanner::handleRandomised(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
{
  if (aError) {
    completed(aError);
    return;
  }
  // devices might need 100mS until new random addresses are ready
  settleTicket = MainLoop::currentMainLoop().executeOnce(boost::bind(&DaliAddressingScanner::settled, this), RANDOMISE_SETTLE_TIME, this);
  if (control) control->wakeHandler = boost::bind(&DaliAddressingScanner::wakeForCancel, this);
}


void DaliAddressingScanner::settled()
{
  settleTicket = 0;
  if (control) control->wakeHandler.clear();
  newSearch();
}


void DaliAddressingScanner::wakeForCancel()
{
  // no need to wait for the random addresses when the scan is cancelled anyway
  MainLoop::currentMainLoop().cancelExecutionTicket(settleTicket);
  newSearch();
}


void DaliAddressingScanner::newSearch()
{
  if (checkCancelled()) return;
  // first check if there is any device left at all
  probing = true;
  searchMin = 0;
  searchMax = DALI_SEARCHADDR_MAX;
  searchAddr = DALI_SEARCHADDR_MAX;
  // no search address currently set
  setLMH = true;
  compareNext();
}


void DaliAddressingScanner::updateSearchAddress()
{
  // update address bytes as needed (only those that have changed)
  uint8_t by = (searchAddr>>16) & 0xFF;
  if (by!=searchH || setLMH) {
    searchH = by;
    sendSpecial(DALICMD_SEARCHADDRH, searchH);
  }
  // - searchM
  by = (searchAddr>>8) & 0xFF;
  if (by!=searchM || setLMH) {
    searchM = by;
    sendSpecial(DALICMD_SEARCHADDRM, searchM);
  }
  // - searchL
  by = (searchAddr) & 0xFF;
  if (by!=searchL || setLMH) {
    searchL = by;
    sendSpecial(DALICMD_SEARCHADDRL, searchL);
  }
  setLMH = false; // incremental from now on until flag is set again
}


void DaliAddressingScanner::compareNext()
{
  if (!probing && checkCancelled()) return;
  updateSearchAddress();
  result->compareCount++;
  if (!probing) result->searchRounds++;
  sendSpecial(DALICMD_COMPARE, 0x00, boost::bind(&DaliAddressingScanner::handleCompareResult, this, _1, _2, _3));
}


void DaliAddressingScanner::handleCompareResult(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
{
  // Anything received but timeout is considered a yes
  bool isYes = DaliComm::isYes(aNoOrTimeout, aResponse, aError, true);
  if (aError) {
    completed(aError); // other error, abort
    return;
  }
  DBGLOG(LOG_DEBUG, "DALI scan: COMPARE result = %s, search=0x%06X, searchMin=0x%06X, searchMax=0x%06X", isYes ? "Yes" : "No ", searchAddr, searchMin, searchMax);
  if (probing) {
    probing = false;
    if (!isYes) {
      // no device at or below max random address
      noMoreDevices();
      return;
    }
  }
  else if (isYes) {
    // at least one device has smaller or equal random address
    searchMax = searchAddr;
  }
  else {
    // none at or below current search
    searchMin = searchAddr+1;
  }
  if (searchMin>searchMax) {
    LOG(LOG_WARNING, "DALI scan: binary search failed");
    if (restarts<MAX_RESTARTS) {
      restarts++;
      result->restarts++;
      newSearch();
      return;
    }
    completed(DaliCommError::err(DaliCommErrorDeviceSearch, "binary search got out of range"));
    return;
  }
  if (searchMin==searchMax) {
    searchAddr = searchMin;
    deviceFound();
    return;
  }
  // not yet - continue
  searchAddr = searchMin + (searchMax-searchMin)/2;
  compareNext();
}


#pragma mark - short address assignment

void DaliAddressingScanner::deviceFound()
{
  LOG(LOG_NOTICE, "DALI scan: found device at random address 0x%06X", searchAddr);
  // select the device
  updateSearchAddress();
  readShortAddrRepeat = 0;
  readShortAddress();
}


void DaliAddressingScanner::readShortAddress()
{
  sendSpecial(DALICMD_QUERY_SHORT_ADDRESS, 0x00, boost::bind(&DaliAddressingScanner::handleShortAddressQuery, this, _1, _2, _3));
}


void DaliAddressingScanner::handleShortAddressQuery(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
{
  if (Error::isError(aError, DaliCommError::domain(), DaliCommErrorDALIFrame)) {
    // devices sharing this random address have different short addresses
    clashDetected(DaliBroadcast);
    return;
  }
  if (Error::isError(aError, DaliCommError::domain(), DaliCommErrorNoResponse)) {
    // should not happen, but just retry
    LOG(LOG_WARNING, "DALI scan: device at 0x%06X does not respond to QUERY_SHORT_ADDRESS", searchAddr);
    readShortAddrRepeat++;
    if (readShortAddrRepeat<=MAX_SHORTADDR_READ_REPEATS) {
      readShortAddress();
      return;
    }
    // probably bus error led to false device detection -> restart search
    if (restarts<MAX_RESTARTS) {
      LOG(LOG_NOTICE, "DALI scan: restarting search");
      restarts++;
      result->restarts++;
      newSearch();
      return;
    }
    completed(DaliCommError::err(DaliCommErrorDeviceSearch, "detected device does not respond to QUERY_SHORT_ADDRESS"));
    return;
  }
  if (aError) {
    completed(aError);
    return;
  }
  // response is short address in 0AAAAAA1 format or DALIVALUE_MASK (no address)
  bool needsNewAddress = false;
  if (aResponse==DALIVALUE_MASK) {
    needsNewAddress = true;
    LOG(LOG_INFO, "DALI scan: device at 0x%06X has no short address", searchAddr);
  }
  else {
    DaliAddress shortAddress = DaliCodec::addressFromDaliResponse(aResponse);
    if (claimedAddresses.count(shortAddress)>0) {
      needsNewAddress = true;
      LOG(LOG_NOTICE, "DALI scan: device at 0x%06X has short address %d which is already taken in this scan", searchAddr, shortAddress);
    }
    else {
      // short address is ok as-is
      LOG(LOG_INFO, "DALI scan: device at 0x%06X keeps short address %d", searchAddr, shortAddress);
      claimedAddresses.insert(shortAddress);
      usedAddresses.insert(shortAddress);
      deviceAddressed(shortAddress);
      return;
    }
  }
  if (needsNewAddress) {
    newAddress = lowestFreeAddress();
    if (newAddress==DaliBroadcast) {
      // no more short addresses available
      LOG(LOG_ERR, "DALI scan: bus has too many devices, device 0x%06X cannot be assigned a short address", searchAddr);
      ErrorPtr err = DaliCommError::err(DaliCommErrorAddressSpaceExhausted, "no free short address for device at random address 0x%06X", searchAddr);
      result->problems.push_back(make_pair(DaliBroadcast, err));
      completed(err);
      return;
    }
    LOG(LOG_NOTICE, "DALI scan: assigning short address %d to device at 0x%06X", newAddress, searchAddr);
    claimedAddresses.insert(newAddress);
    usedAddresses.insert(newAddress);
    sendSpecial(DALICMD_PROGRAM_SHORT_ADDRESS, DaliCodec::dali1FromAddress(newAddress)+1);
    sendSpecial(DALICMD_VERIFY_SHORT_ADDRESS, DaliCodec::dali1FromAddress(newAddress)+1, boost::bind(&DaliAddressingScanner::handleNewShortAddressVerify, this, _1, _2, _3));
  }
}


DaliAddress DaliAddressingScanner::lowestFreeAddress()
{
  for (DaliAddress a=0; a<DALI_MAXDEVICES; a++) {
    if (usedAddresses.count(a)==0 && claimedAddresses.count(a)==0) return a;
  }
  return DaliBroadcast;
}


void DaliAddressingScanner::handleNewShortAddressVerify(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
{
  if (DaliComm::isYes(aNoOrTimeout, aResponse, aError, true)) {
    deviceAddressed(newAddress);
    return;
  }
  if (aError && !aError->isError(DaliCommError::domain(), DaliCommErrorInvalidAnswer)) {
    completed(aError);
    return;
  }
  // short address verification failed
  LOG(LOG_ERR, "DALI scan: could not assign short address %d", newAddress);
  completed(DaliCommError::err(DaliCommErrorSetShortAddress, "failed setting short address %d", newAddress));
}


#pragma mark - identity

void DaliAddressingScanner::deviceAddressed(DaliAddress aShortAddress)
{
  DaliIdentityResolver::resolveIdentity(*daliComm, boost::bind(&DaliAddressingScanner::handleIdentity, this, aShortAddress, _1, _2), aShortAddress, true);
}


void DaliAddressingScanner::handleIdentity(DaliAddress aShortAddress, DaliDeviceInfoPtr aDeviceInfo, ErrorPtr aError)
{
  if (Error::isError(aError, DaliCommError::domain(), DaliCommErrorDALIFrame)) {
    // several devices answer with different data
    clashDetected(aShortAddress);
    return;
  }
  if (Error::isError(aError, DaliCommError::domain(), DaliCommErrorIdentityReadFailed)) {
    // device stays addressed, but cannot be identified
    result->problems.push_back(make_pair(aShortAddress, aError));
  }
  else if (aError) {
    completed(aError);
    return;
  }
  else {
    result->deviceInfos.push_back(aDeviceInfo);
  }
  resolvedAddresses.insert(aShortAddress);
  // withdraw this device from further searches
  sendSpecial(DALICMD_WITHDRAW, 0x00, boost::bind(&DaliAddressingScanner::handleWithdrawn, this, _1, _2, _3));
}


void DaliAddressingScanner::clashDetected(DaliAddress aShortAddress)
{
  result->collisionSeen = true;
  if (clashRestarts>=MAX_RESTARTS) {
    LOG(LOG_ERR, "DALI scan: devices at random address 0x%06X still clash after %d re-randomisations", searchAddr, clashRestarts);
    completed(DaliCommError::err(DaliCommErrorDeviceSearch, "random address collision at 0x%06X could not be resolved", searchAddr));
    return;
  }
  clashRestarts++;
  result->restarts++;
  LOG(LOG_NOTICE, "DALI scan: several devices share random address 0x%06X -> re-randomising", searchAddr);
  if (aShortAddress!=DaliBroadcast) {
    // remove the short address again from all devices that got it
    sendSpecial(DALICMD_SET_DTR, DALIVALUE_MASK);
    sendCommand(aShortAddress, DALICMD_STORE_DTR_AS_SHORT_ADDRESS);
    claimedAddresses.erase(aShortAddress);
    if (result->presentAddresses.count(aShortAddress)==0) usedAddresses.erase(aShortAddress);
    // nothing answers at this address any more
    result->presentAddresses.erase(aShortAddress);
    resolvedAddresses.erase(aShortAddress);
  }
  sendSpecial(DALICMD_RANDOMISE, 0x00, boost::bind(&DaliAddressingScanner::handleRandomised, this, _1, _2, _3));
}


void DaliAddressingScanner::handleWithdrawn(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
{
  if (aError) {
    completed(aError);
    return;
  }
  result->withdrawnCount++;
  newSearch();
}


#pragma mark - completion

void DaliAddressingScanner::noMoreDevices()
{
  LOG(LOG_NOTICE, "DALI scan: no more devices, %d withdrawn, %d COMPAREs", result->withdrawnCount, result->compareCount);
  sendSpecial(DALICMD_TERMINATE, 0x00, boost::bind(&DaliAddressingScanner::searchTerminated, this, _1, _2, _3));
}


void DaliAddressingScanner::searchTerminated(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
{
  if (aError) {
    finish(aError);
    return;
  }
  // resolve the devices that already had a short address and did not take part in the search
  resolvePos = result->presentAddresses.begin();
  resolveNextPresent();
}


void DaliAddressingScanner::resolveNextPresent()
{
  while (resolvePos!=result->presentAddresses.end() && resolvedAddresses.count(*resolvePos)>0) ++resolvePos;
  if (resolvePos==result->presentAddresses.end()) {
    finish(ErrorPtr());
    return;
  }
  if (control && control->isCancelled()) {
    finish(DaliCommError::err(DaliCommErrorCancelled, "scan cancelled"));
    return;
  }
  DaliAddress a = *resolvePos;
  ++resolvePos;
  DaliIdentityResolver::resolveIdentity(*daliComm, boost::bind(&DaliAddressingScanner::handlePresentIdentity, this, a, _1, _2), a, true);
}


void DaliAddressingScanner::handlePresentIdentity(DaliAddress aShortAddress, DaliDeviceInfoPtr aDeviceInfo, ErrorPtr aError)
{
  if (
    Error::isError(aError, DaliCommError::domain(), DaliCommErrorIdentityReadFailed) ||
    Error::isError(aError, DaliCommError::domain(), DaliCommErrorDALIFrame)
  ) {
    result->problems.push_back(make_pair(aShortAddress, aError));
  }
  else if (aError) {
    finish(aError);
    return;
  }
  else {
    result->deviceInfos.push_back(aDeviceInfo);
  }
  resolvedAddresses.insert(aShortAddress);
  resolveNextPresent();
}


void DaliAddressingScanner::completed(ErrorPtr aError)
{
  // always leave addressing mode
  sendSpecial(DALICMD_TERMINATE, 0x00, boost::bind(&DaliAddressingScanner::terminated, this, aError, _1, _2, _3));
}


void DaliAddressingScanner::terminated(ErrorPtr aError, bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aTerminateError)
{
  if (!aError) aError = aTerminateError;
  finish(aError);
}


void DaliAddressingScanner::finish(ErrorPtr aError)
{
  MainLoop::currentMainLoop().cancelExecutionsFrom(this);
  if (control) control->wakeHandler.clear();
  if (aError) {
    LOG(LOG_WARNING, "DALI scan: ended with error: %s", aError->description().c_str());
  }
  LOG(LOG_NOTICE,
    "DALI scan: %d device(s) identified, %d problem(s), %d COMPAREs (%d search rounds)",
    (int)result->deviceInfos.size(), (int)result->problems.size(), result->compareCount, result->searchRounds
  );
  procedureEnded();
  if (callback) callback(result, aError);
  // done, delete myself
  delete this;
}
