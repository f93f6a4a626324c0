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

#include "dalicomm.hpp"

#include <algorithm>

using namespace dalimaster;


#define DALI_REPEAT_WINDOW (100*MilliSecond)


#pragma mark - DaliBusEvent

DaliBusEvent::DaliBusEvent() :
  timestamp(Never),
  external(false),
  seq(0),
  reportType(adapterReport_frameReceived)
{
}


string DaliBusEvent::description() const
{
  return string_format("%s seq=%d: %s", external ? "external" : "own", seq, frame.description().c_str());
}


#pragma mark - DaliComm

DaliComm::DaliComm(MainLoop &aMainLoop, DaliTransportPtr aTransport) :
  mainLoop(aMainLoop),
  transport(aTransport),
  runningProcedures(0),
  nextSeq(1),
  settlingDelay(DALI_DEFAULT_SETTLING_DELAY),
  repeatGap(DALI_DEFAULT_REPEAT_GAP),
  responseTimeout(DALI_DEFAULT_RESPONSE_TIMEOUT),
  settledAt(Never),
  queueTicket(0),
  repeatTicket(0),
  responseTicket(0),
  nextListenerId(1)
{
  transport->setReceiveHandler(boost::bind(&DaliComm::transportHandler, this, _1));
}


DaliComm::~DaliComm()
{
  transport->setReceiveHandler(StatusCB());
  mainLoop.cancelExecutionsFrom(this);
}


void DaliComm::startProcedure()
{
  ++runningProcedures;
}

void DaliComm::endProcedure()
{
  if (runningProcedures>0)
    --runningProcedures;
}


bool DaliComm::isBusy()
{
  return runningProcedures>0;
}


void DaliComm::setTiming(MLMicroSeconds aSettlingDelay, MLMicroSeconds aRepeatGap, MLMicroSeconds aResponseTimeout)
{
  settlingDelay = aSettlingDelay;
  repeatGap = aRepeatGap<aSettlingDelay ? aSettlingDelay : aRepeatGap;
  if (repeatGap>=DALI_REPEAT_WINDOW) {
    LOG(LOG_WARNING, "DaliComm: repeat gap %lld mS is too long for commands that must be sent twice", repeatGap/MilliSecond);
  }
  responseTimeout = aResponseTimeout;
}


#pragma mark - connection

ErrorPtr DaliComm::open()
{
  return transport->open();
}


void DaliComm::close()
{
  transport->close();
  failAll(ErrorPtr(new DaliCommError(DaliCommErrorConnection, "DALI transport closed")));
}


bool DaliComm::isOpen()
{
  return transport->isOpen();
}


void DaliComm::failAll(ErrorPtr aError)
{
  mainLoop.cancelExecutionTicket(queueTicket);
  mainLoop.cancelExecutionTicket(repeatTicket);
  mainLoop.cancelExecutionTicket(responseTicket);
  // take all requests out first, callbacks might queue new ones (which will fail immediately)
  RequestQueue failing;
  if (pendingRequest) {
    failing.push_back(pendingRequest);
    pendingRequest.reset();
  }
  failing.splice(failing.end(), requestQueue);
  if (failing.size()>0) {
    LOG(LOG_WARNING, "DaliComm: failing %d request(s): %s", (int)failing.size(), Error::text(aError).c_str());
  }
  for (RequestQueue::iterator pos = failing.begin(); pos!=failing.end(); ++pos) {
    if ((*pos)->resultCB) (*pos)->resultCB(true, 0, aError);
  }
}


#pragma mark - request queue

ErrorPtr DaliComm::prepareRequest(const DaliCommand &aCommand, DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay, DaliRequestPtr &aRequest)
{
  aRequest = DaliRequestPtr(new DaliRequest(aCommand));
  ErrorPtr err = DaliCodec::encode(aCommand, aRequest->frame);
  if (err) {
    LOG(LOG_ERR, "DaliComm: %s", err->description().c_str());
    aRequest.reset();
    return err;
  }
  if (!transport->isOpen()) {
    aRequest.reset();
    return DaliCommError::err(DaliCommErrorConnection, "DALI transport %s not open", transport->description().c_str());
  }
  aRequest->resultCB = aResultCB;
  aRequest->delay = aWithDelay>0 ? aWithDelay : 0;
  return ErrorPtr();
}


void DaliComm::enqueueRequest(DaliRequestPtr aRequest)
{
  requestQueue.push_back(aRequest);
  FOCUSLOG("DaliComm: queued %s, %d in queue", aRequest->command.description().c_str(), (int)requestQueue.size());
  scheduleQueue(MainLoop::now());
}


void DaliComm::queueCommand(const DaliCommand &aCommand, DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay)
{
  DaliRequestPtr req;
  ErrorPtr err = prepareRequest(aCommand, aResultCB, aWithDelay, req);
  if (err) {
    if (aResultCB) aResultCB(true, 0, err);
    return;
  }
  enqueueRequest(req);
}


void DaliComm::scheduleQueue(MLMicroSeconds aAt)
{
  mainLoop.cancelExecutionTicket(queueTicket);
  queueTicket = mainLoop.executeOnceAt(boost::bind(&DaliComm::processQueue, this), aAt, this);
}


void DaliComm::processQueue()
{
  queueTicket = 0;
  if (pendingRequest || requestQueue.empty()) return; // busy or nothing to do
  MLMicroSeconds now = MainLoop::now();
  DaliRequestPtr req = requestQueue.front();
  MLMicroSeconds due = settledAt;
  if (req->delay>0) {
    if (req->delayStart==Never) req->delayStart = now>settledAt ? now : settledAt;
    due = req->delayStart+req->delay;
  }
  if (now<due) {
    scheduleQueue(due);
    return;
  }
  requestQueue.pop_front();
  pendingRequest = req;
  transmit();
}


void DaliComm::transmit()
{
  repeatTicket = 0;
  if (!pendingRequest) return;
  DaliRequestPtr req = pendingRequest;
  req->seq = nextSeq;
  if (++nextSeq==0) nextSeq = 1; // 0 is used by the adapter for foreign traffic
  DaliByteVector report;
  DaliCodec::encodeAdapterReport(req->frame, req->seq, req->command.isDA24Config(), report);
  FOCUSLOG("DaliComm: seq=%d sending %s%s", req->seq, req->command.description().c_str(), req->awaitingRepeat ? " (repeat)" : "");
  ErrorPtr err = transport->write(report);
  if (err) {
    finishRequest(true, 0, err);
    return;
  }
  if (req->command.needsRepeat() && !req->awaitingRepeat) {
    // second write must follow within the repeat window
    req->firstSeq = req->seq;
    req->awaitingRepeat = true;
    repeatTicket = mainLoop.executeOnce(boost::bind(&DaliComm::transmit, this), repeatGap, this);
    return;
  }
  req->awaitingRepeat = false;
  responseTicket = mainLoop.executeOnce(boost::bind(&DaliComm::responseTimedOut, this), responseTimeout, this);
}


void DaliComm::responseTimedOut()
{
  responseTicket = 0;
  if (!pendingRequest) return;
  DBGLOG(LOG_DEBUG, "DaliComm: seq=%d timeout waiting for adapter report", pendingRequest->seq);
  finishRequest(true, 0, ErrorPtr());
}


void DaliComm::finishRequest(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
{
  mainLoop.cancelExecutionTicket(responseTicket);
  mainLoop.cancelExecutionTicket(repeatTicket);
  DaliRequestPtr req = pendingRequest;
  pendingRequest.reset();
  if (!req) return;
  settledAt = MainLoop::now()+settlingDelay;
  if (aNoOrTimeout && !aError && req->command.getReplyKind()==DaliCommand::reply_value) {
    // value queries need an answer
    aError = DaliCommError::err(DaliCommErrorNoResponse, "no answer to %s", req->command.description().c_str());
  }
  FOCUSLOG(
    "DaliComm: seq=%d done: %s, response=0x%02X, error=%s",
    req->seq, aNoOrTimeout ? "no answer" : "answer", aResponse, Error::text(aError).c_str()
  );
  DaliRequestPtr dependent = req->dependentRequest;
  req->dependentRequest.reset();
  if (aError && dependent) {
    // the dependent request relies on this one's effect and must not be sent
    RequestQueue::iterator pos = std::find(requestQueue.begin(), requestQueue.end(), dependent);
    if (pos!=requestQueue.end()) requestQueue.erase(pos);
    else dependent.reset(); // already gone
  }
  else {
    dependent.reset();
  }
  if (!requestQueue.empty()) scheduleQueue(settledAt);
  if (req->resultCB) req->resultCB(aNoOrTimeout, aResponse, aError);
  if (dependent && dependent->resultCB) dependent->resultCB(true, 0, aError);
}


#pragma mark - adapter reports

void DaliComm::transportHandler(ErrorPtr aError)
{
  DaliCommPtr keepMeAlive(this); // make sure this object lives until routine terminates
  if (aError) {
    failAll(aError);
    return;
  }
  // read all reports that are ready
  while (true) {
    DaliByteVector report;
    ErrorPtr err = transport->readWithTimeout(0, report);
    if (err) {
      failAll(err);
      break;
    }
    if (report.empty()) break;
    handleAdapterReport(report);
  }
}


void DaliComm::handleAdapterReport(const DaliByteVector &aReport)
{
  DaliAdapterReport rep;
  ErrorPtr err = DaliCodec::decodeAdapterReport(aReport, rep);
  if (err) {
    LOG(LOG_WARNING, "DaliComm: ignored adapter report %s: %s", dataToHexString(&aReport[0], aReport.size()).c_str(), err->description().c_str());
    return;
  }
  if (rep.source==adapterSource_self && pendingRequest && rep.seq!=0) {
    if (rep.seq==pendingRequest->firstSeq && rep.seq!=pendingRequest->seq) {
      return; // report for first write of a repeated command
    }
    if (rep.seq==pendingRequest->seq) {
      if (pendingRequest->awaitingRepeat || rep.type==adapterReport_txComplete) {
        return; // outcome will be reported for the last write
      }
      switch (rep.type) {
        case adapterReport_response:
          finishRequest(false, rep.frame.getValue(), ErrorPtr());
          return;
        case adapterReport_nak:
          finishRequest(true, 0, ErrorPtr());
          return;
        case adapterReport_framingError:
          finishRequest(false, 0, DaliCommError::err(DaliCommErrorDALIFrame, "framing error in answer to %s", pendingRequest->command.description().c_str()));
          return;
        default:
          break;
      }
    }
  }
  unsolicitedFrame(rep);
}


void DaliComm::unsolicitedFrame(const DaliAdapterReport &aReport)
{
  DaliBusEventPtr event = DaliBusEventPtr(new DaliBusEvent);
  event->timestamp = MainLoop::now();
  event->external = aReport.source==adapterSource_external;
  event->seq = aReport.seq;
  event->reportType = aReport.type;
  event->frame = aReport.frame;
  DBGLOG(LOG_DEBUG, "DaliComm: unsolicited %s", event->description().c_str());
  for (ListenerMap::iterator pos = listeners.begin(); pos!=listeners.end(); ++pos) {
    Listener &l = pos->second;
    if (l.queue.size()>=l.maxQueued) {
      // listener does not keep up, drop newest
      l.droppedEvents++;
      continue;
    }
    l.queue.push_back(event);
    if (l.deliveryTicket==0) {
      l.deliveryTicket = mainLoop.executeOnce(boost::bind(&DaliComm::deliverEvent, this, pos->first), 0, this);
    }
  }
}


#pragma mark - listeners

long DaliComm::addMessageCallback(DaliBusEventCB aCallback, size_t aMaxQueued)
{
  long id = nextListenerId++;
  Listener &l = listeners[id];
  l.callback = aCallback;
  l.maxQueued = aMaxQueued>0 ? aMaxQueued : 1;
  l.droppedEvents = 0;
  l.deliveryTicket = 0;
  return id;
}


void DaliComm::removeMessageCallback(long aListenerId)
{
  ListenerMap::iterator pos = listeners.find(aListenerId);
  if (pos==listeners.end()) return;
  mainLoop.cancelExecutionTicket(pos->second.deliveryTicket);
  listeners.erase(pos);
}


long DaliComm::droppedEvents(long aListenerId)
{
  ListenerMap::iterator pos = listeners.find(aListenerId);
  if (pos==listeners.end()) return 0;
  return pos->second.droppedEvents;
}


void DaliComm::deliverEvent(long aListenerId)
{
  ListenerMap::iterator pos = listeners.find(aListenerId);
  if (pos==listeners.end()) return; // removed in the meantime
  Listener &l = pos->second;
  l.deliveryTicket = 0;
  if (l.queue.empty()) return;
  DaliBusEventPtr event = l.queue.front();
  l.queue.pop_front();
  DaliBusEventCB cb = l.callback;
  if (!l.queue.empty()) {
    l.deliveryTicket = mainLoop.executeOnce(boost::bind(&DaliComm::deliverEvent, this, aListenerId), 0, this);
  }
  // Note: listener map might change in the callback, l must not be used any more
  cb(event);
}


#pragma mark - DALI bus commands

void DaliComm::sendCommand(const DaliCommand &aCommand, DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay)
{
  if (isBusy()) { if (aResultCB) aResultCB(true, 0, busyError()); return; }
  queueCommand(aCommand, aResultCB, aWithDelay);
}


void DaliComm::daliCommandStatusHandler(DaliCommandStatusCB aResultCB, bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
{
  if (aResultCB) aResultCB(aError);
}


void DaliComm::daliSendDirectPower(DaliAddress aAddress, uint8_t aPower, DaliCommandStatusCB aStatusCB, MLMicroSeconds aWithDelay)
{
  sendCommand(DaliCommand::directArcPower(aAddress, aPower), boost::bind(&DaliComm::daliCommandStatusHandler, this, aStatusCB, _1, _2, _3), aWithDelay);
}


void DaliComm::daliSendCommand(DaliAddress aAddress, uint8_t aCommand, DaliCommandStatusCB aStatusCB, MLMicroSeconds aWithDelay)
{
  sendCommand(DaliCommand::addressed(aAddress, aCommand), boost::bind(&DaliComm::daliCommandStatusHandler, this, aStatusCB, _1, _2, _3), aWithDelay);
}


void DaliComm::daliSendDtrAndCommand(DaliAddress aAddress, uint8_t aCommand, uint8_t aDTRValue, DaliCommandStatusCB aStatusCB, MLMicroSeconds aWithDelay)
{
  if (isBusy()) { if (aStatusCB) aStatusCB(busyError()); return; }
  // DTR and the command using it are queued back-to-back, no other request may get in between
  DaliRequestPtr dtrReq;
  DaliRequestPtr cmdReq;
  ErrorPtr err = prepareRequest(DaliCommand::special(DALICMD_SET_DTR, aDTRValue), NULL, aWithDelay, dtrReq);
  if (Error::isOK(err)) {
    err = prepareRequest(DaliCommand::addressed(aAddress, aCommand), boost::bind(&DaliComm::daliCommandStatusHandler, this, aStatusCB, _1, _2, _3), 0, cmdReq);
  }
  if (!Error::isOK(err)) {
    if (aStatusCB) aStatusCB(err);
    return;
  }
  // failure to set DTR is reported through the command's callback
  dtrReq->dependentRequest = cmdReq;
  enqueueRequest(dtrReq);
  enqueueRequest(cmdReq);
}


void DaliComm::daliSendQuery(DaliAddress aAddress, uint8_t aQueryCommand, DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay)
{
  sendCommand(DaliCommand::addressed(aAddress, aQueryCommand), aResultCB, aWithDelay);
}


void DaliComm::daliSendSpecial(uint8_t aSpecialCommand, uint8_t aData, DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay)
{
  sendCommand(DaliCommand::special(aSpecialCommand, aData), aResultCB, aWithDelay);
}


bool DaliComm::isYes(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr &aError, bool aCollisionIsYes)
{
  bool isYes = !aNoOrTimeout;
  if (aError && aCollisionIsYes && aError->isError(DaliCommError::domain(), DaliCommErrorDALIFrame)) {
    // framing error -> consider this a YES
    isYes = true;
    aError.reset(); // not considered an error when aCollisionIsYes is set
  }
  else if (isYes && !aCollisionIsYes) {
    // regular answer, must be DALIANSWER_YES to be a regular YES
    if (aResponse!=DALIANSWER_YES) {
      // invalid YES response
      aError.reset(new DaliCommError(DaliCommErrorInvalidAnswer, string_format("invalid YES answer 0x%02X", aResponse)));
    }
  }
  if (aError)
    return false; // real error, consider NO
  // return YES/NO
  return isYes;
}


#pragma mark - quiescent mode

void DaliComm::startQuiescentMode(DaliCommandStatusCB aStatusCB)
{
  LOG(LOG_NOTICE, "DaliComm: starting quiescent mode");
  sendCommand(DaliCommand::extended(DALI24_START_QUIESCENT_MODE, true, true), boost::bind(&DaliComm::daliCommandStatusHandler, this, aStatusCB, _1, _2, _3));
}


void DaliComm::stopQuiescentMode(DaliCommandStatusCB aStatusCB)
{
  LOG(LOG_NOTICE, "DaliComm: stopping quiescent mode");
  sendCommand(DaliCommand::extended(DALI24_STOP_QUIESCENT_MODE, true, true), boost::bind(&DaliComm::daliCommandStatusHandler, this, aStatusCB, _1, _2, _3));
}


#pragma mark - DaliProcedure

DaliProcedure::DaliProcedure(DaliComm &aDaliComm) :
  procedureActive(true),
  daliComm(&aDaliComm)
{
  daliComm->startProcedure();
}


DaliProcedure::~DaliProcedure()
{
  procedureEnded();
}


void DaliProcedure::procedureEnded()
{
  if (procedureActive) {
    procedureActive = false;
    daliComm->endProcedure();
  }
}


void DaliProcedure::send(const DaliCommand &aCommand, DaliComm::DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay)
{
  daliComm->queueCommand(aCommand, aResultCB, aWithDelay);
}


void DaliProcedure::sendSpecial(uint8_t aSpecialCommand, uint8_t aData, DaliComm::DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay)
{
  send(DaliCommand::special(aSpecialCommand, aData), aResultCB, aWithDelay);
}


void DaliProcedure::sendCommand(DaliAddress aAddress, uint8_t aCommand, DaliComm::DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay)
{
  send(DaliCommand::addressed(aAddress, aCommand), aResultCB, aWithDelay);
}


void DaliProcedure::sendQuery(DaliAddress aAddress, uint8_t aQueryCommand, DaliComm::DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay)
{
  send(DaliCommand::addressed(aAddress, aQueryCommand), aResultCB, aWithDelay);
}


#pragma mark - DALI memory access

class DaliMemoryReader : public DaliProcedure
{
  typedef DaliProcedure inherited;

  DaliComm::DaliReadMemoryCB callback;
  DaliAddress busAddress;
  DaliComm::MemoryVectorPtr memory;
  int bytesToRead;
  typedef std::vector<uint8_t> MemoryVector;
public:
  static void readMemory(DaliComm &aDaliComm, DaliComm::DaliReadMemoryCB aResultCB, DaliAddress aAddress, uint8_t aBank, uint8_t aOffset, uint8_t aNumBytes)
  {
    // create new instance, deletes itself when finished
    DaliMemoryReader *reader = new DaliMemoryReader(aDaliComm, aResultCB, aAddress);
    reader->start(aBank, aOffset, aNumBytes);
  };
private:
  DaliMemoryReader(DaliComm &aDaliComm, DaliComm::DaliReadMemoryCB aResultCB, DaliAddress aAddress) :
    inherited(aDaliComm),
    callback(aResultCB),
    busAddress(aAddress),
    memory(new MemoryVector),
    bytesToRead(0)
  {
  };

  void start(uint8_t aBank, uint8_t aOffset, uint8_t aNumBytes)
  {
    bytesToRead = aNumBytes;
    LOG(LOG_INFO, "DALI bus address %d - reading %d bytes from bank %d at offset %d", busAddress, aNumBytes, aBank, aOffset);
    // set DTR1 = bank
    sendSpecial(DALICMD_SET_DTR1, aBank);
    // set DTR = offset within bank
    sendSpecial(DALICMD_SET_DTR, aOffset, boost::bind(&DaliMemoryReader::dtrSet, this, _1, _2, _3));
  };

  void dtrSet(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
  {
    if (aError) {
      completed(aError);
      return;
    }
    // start reading
    if (bytesToRead>0)
      readNextByte();
    else
      completed(ErrorPtr());
  }

  // handle scan result
  void handleResponse(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)
  {
    if (!aError && !aNoOrTimeout) {
      // byte received, append to vector
      memory->push_back(aResponse);
      if (--bytesToRead>0) {
        // more bytes to read
        readNextByte();
        return;
      }
    }
    if (Error::isError(aError, DaliCommError::domain(), DaliCommErrorNoResponse)) {
      // end of accessible memory, not an error
      aError.reset();
    }
    completed(aError);
  };

  void completed(ErrorPtr aError)
  {
    // read done, timeout or error, return memory to callback
    procedureEnded();
    if (LOGENABLED(LOG_DEBUG)) {
      // dump data
      int o=0;
      for (MemoryVector::iterator pos = memory->begin(); pos!=memory->end(); ++pos, ++o) {
        LOG(LOG_DEBUG, "- %03d/0x%02X : 0x%02X/%03d", o, o, *pos, *pos);
      }
    }
    if (callback) callback(memory, aError);
    // done, delete myself
    delete this;
  }

  void readNextByte()
  {
    sendQuery(busAddress, DALICMD_READ_MEMORY_LOCATION, boost::bind(&DaliMemoryReader::handleResponse, this, _1, _2, _3));
  }
};


void DaliProcedure::readMemory(DaliComm::DaliReadMemoryCB aResultCB, DaliAddress aAddress, uint8_t aBank, uint8_t aOffset, uint8_t aNumBytes)
{
  DaliMemoryReader::readMemory(*daliComm, aResultCB, aAddress, aBank, aOffset, aNumBytes);
}


void DaliComm::daliReadMemory(DaliReadMemoryCB aResultCB, DaliAddress aAddress, uint8_t aBank, uint8_t aOffset, uint8_t aNumBytes)
{
  if (isBusy()) { if (aResultCB) aResultCB(MemoryVectorPtr(), DaliComm::busyError()); return; }
  DaliMemoryReader::readMemory(*this, aResultCB, aAddress, aBank, aOffset, aNumBytes);
}
