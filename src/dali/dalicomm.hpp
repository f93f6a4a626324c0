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

#ifndef __dalimaster__dalicomm__
#define __dalimaster__dalicomm__

#include "daliframe.hpp"
#include "dalitransport.hpp"

using namespace std;

// default dispatcher timing
#define DALI_DEFAULT_SETTLING_DELAY (15*MilliSecond)
#define DALI_DEFAULT_REPEAT_GAP (35*MilliSecond)
#define DALI_DEFAULT_RESPONSE_TIMEOUT (150*MilliSecond)

namespace dalimaster {

  class DaliComm;
  typedef boost::intrusive_ptr<DaliComm> DaliCommPtr;


  /// a frame seen on the bus that was not an answer to one of our own requests
  class DaliBusEvent : public DMObj
  {
  public:
    DaliBusEvent();

    MLMicroSeconds timestamp; ///< when the report was read from the adapter
    bool external; ///< set if caused by another master on the bus
    uint8_t seq; ///< adapter sequence number
    DaliAdapterReportType reportType; ///< type of adapter report
    DaliFrame frame; ///< the frame

    /// @return true if the frame is a forward frame addressing the given device
    bool affectsAddress(DaliAddress aShortAddress, uint16_t aGroupMask = 0) const { return frame.affects(aShortAddress, aGroupMask); };

    string description() const;
  };
  typedef boost::intrusive_ptr<DaliBusEvent> DaliBusEventPtr;

  /// callback for bus event listeners
  typedef boost::function<void (DaliBusEventPtr aEvent)> DaliBusEventCB;


  /// a request waiting for or in transmission
  class DaliRequest : public DMObj
  {
    friend class DaliComm;

    DaliCommand command;
    DaliFrame frame;
    boost::function<void (bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)> resultCB;
    MLMicroSeconds delay; ///< initiation delay
    MLMicroSeconds delayStart; ///< when the initiation delay started
    uint8_t seq; ///< sequence number of the last write
    uint8_t firstSeq; ///< sequence number of the first write of a repeated command
    bool awaitingRepeat; ///< first of two writes done, second not yet
    boost::intrusive_ptr<DaliRequest> dependentRequest; ///< queued request to be failed instead of sent when this one fails

    DaliRequest(const DaliCommand &aCommand) : command(aCommand), delay(0), delayStart(Never), seq(0), firstSeq(0), awaitingRepeat(false) {};
  };
  typedef boost::intrusive_ptr<DaliRequest> DaliRequestPtr;


  class DaliProcedure;

  /// Command dispatcher for one DALI bus. This is the only object writing to the transport.
  class DaliComm : public DMObj
  {
    friend class DaliProcedure;

    MainLoop &mainLoop;
    DaliTransportPtr transport;

    int runningProcedures;

    typedef std::list<DaliRequestPtr> RequestQueue;
    RequestQueue requestQueue;
    DaliRequestPtr pendingRequest;
    uint8_t nextSeq;

    MLMicroSeconds settlingDelay;
    MLMicroSeconds repeatGap;
    MLMicroSeconds responseTimeout;
    MLMicroSeconds settledAt;
    long queueTicket;
    long repeatTicket;
    long responseTicket;

    typedef struct {
      DaliBusEventCB callback;
      size_t maxQueued;
      std::deque<DaliBusEventPtr> queue;
      long droppedEvents;
      long deliveryTicket;
    } Listener;
    typedef std::map<long, Listener> ListenerMap;
    ListenerMap listeners;
    long nextListenerId;

  public:

    DaliComm(MainLoop &aMainLoop, DaliTransportPtr aTransport);
    virtual ~DaliComm();

    /// @name procedures (scan, memory read) which need exclusive access to the bus
    /// @{

    void startProcedure();
    void endProcedure();
    bool isBusy();
    static ErrorPtr busyError() { return ErrorPtr(new DaliCommError(DaliCommErrorBusy, "DALI bus busy with addressing or memory access")); };

    /// @}

    /// @name connection
    /// @{

    /// open the transport
    ErrorPtr open();

    /// close the transport, fails all pending requests
    void close();

    /// @return true if transport is open
    bool isOpen();

    /// @return the transport
    DaliTransportPtr getTransport() { return transport; };

    /// set dispatcher timing
    /// @param aSettlingDelay minimal gap between end of one request and the next forward frame
    /// @param aRepeatGap gap between the two writes of a command that must be sent twice (must be < 100mS)
    /// @param aResponseTimeout how long to wait for the adapter's outcome report
    void setTiming(MLMicroSeconds aSettlingDelay, MLMicroSeconds aRepeatGap, MLMicroSeconds aResponseTimeout);

    /// @}

    /// @name low level DALI bus communication
    /// @{

    /// callback function for daliSendXXX methods
    typedef boost::function<void (ErrorPtr aError)> DaliCommandStatusCB;

    /// callback function for daliSendXXX methods returning data
    /// @param aNoOrTimeout set if no answer was received (which is the NO answer for yes/no queries)
    /// @param aResponse the answer byte
    /// @param aError error, DaliCommErrorNoResponse for value queries without answer
    typedef boost::function<void (bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError)> DaliQueryResultCB;

    /// Send a DALI command
    /// @param aCommand the command
    /// @param aResultCB result callback
    /// @param aWithDelay if>0, time to delay BEFORE sending the command
    /// @note fails immediately with DaliCommErrorBusy while a procedure is running
    void sendCommand(const DaliCommand &aCommand, DaliQueryResultCB aResultCB = NULL, MLMicroSeconds aWithDelay = 0);

    /// @param aAddress DALI address (device short address, or group address + DaliGroup, or DaliBroadcast)
    /// @param aPower Arc power
    /// @param aStatusCB status callback
    /// @param aWithDelay if>0, time to delay BEFORE sending the command
    void daliSendDirectPower(DaliAddress aAddress, uint8_t aPower, DaliCommandStatusCB aStatusCB = NULL, MLMicroSeconds aWithDelay = 0);

    /// @param aAddress DALI address (device short address, or group address + DaliGroup, or DaliBroadcast)
    /// @param aCommand command
    /// @param aStatusCB status callback
    /// @param aWithDelay if>0, time to delay BEFORE sending the command
    /// @note config commands are automatically sent twice
    void daliSendCommand(DaliAddress aAddress, uint8_t aCommand, DaliCommandStatusCB aStatusCB = NULL, MLMicroSeconds aWithDelay = 0);

    /// @param aAddress DALI address (device short address, or group address + DaliGroup, or DaliBroadcast)
    /// @param aCommand command
    /// @param aDTRValue the value to be sent to DTR before executing aCommand
    /// @param aStatusCB status callback
    /// @param aWithDelay if>0, time to delay BEFORE sending the command
    void daliSendDtrAndCommand(DaliAddress aAddress, uint8_t aCommand, uint8_t aDTRValue, DaliCommandStatusCB aStatusCB = NULL, MLMicroSeconds aWithDelay = 0);

    /// @param aAddress DALI address (device short address, or group address + DaliGroup, or DaliBroadcast)
    /// @param aQueryCommand query command
    /// @param aResultCB result callback
    /// @param aWithDelay if>0, time to delay BEFORE sending the command
    void daliSendQuery(DaliAddress aAddress, uint8_t aQueryCommand, DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay = 0);

    /// @param aSpecialCommand special command byte
    /// @param aData data byte
    /// @param aResultCB result callback
    /// @param aWithDelay if>0, time to delay BEFORE sending the command
    void daliSendSpecial(uint8_t aSpecialCommand, uint8_t aData, DaliQueryResultCB aResultCB = NULL, MLMicroSeconds aWithDelay = 0);

    /// helper to check daliSendQuery() callback response for a DALI YES answer
    static bool isYes(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr &aError, bool aCollisionIsYes);

    /// @}

    /// @name DALI memory access
    /// @{

    typedef boost::shared_ptr<std::vector<uint8_t> > MemoryVectorPtr;

    /// callback function for daliReadMemory
    typedef boost::function<void (MemoryVectorPtr aMemoryVectorPtr, ErrorPtr aError)> DaliReadMemoryCB;

    /// Read DALI memory
    /// @param aResultCB callback receiving the data read as a vector<uint8_t>
    /// @param aAddress short address of device to read
    /// @param aBank memory bank to read
    /// @param aOffset offset to start reading
    /// @param aNumBytes number of bytes to read
    /// @note reading none or less data than requested is not considered an error - aMemoryVectorPtr param in callback will
    ///   just return the number of bytes that could be read; check its size to make sure expected result was returned
    void daliReadMemory(DaliReadMemoryCB aResultCB, DaliAddress aAddress, uint8_t aBank, uint8_t aOffset, uint8_t aNumBytes);

    /// @}

    /// @name quiescent mode
    /// @{

    /// make all control devices on the bus stop sending events
    void startQuiescentMode(DaliCommandStatusCB aStatusCB = NULL);

    /// end quiescent mode
    void stopQuiescentMode(DaliCommandStatusCB aStatusCB = NULL);

    /// @}

    /// @name bus event listeners
    /// @{

    /// register a listener for unsolicited frames
    /// @param aCallback called from the mainloop for every event
    /// @param aMaxQueued max number of events queued for this listener. When exceeded, new events are dropped
    /// @return listener id
    long addMessageCallback(DaliBusEventCB aCallback, size_t aMaxQueued = 100);

    /// unregister a listener, discarding events not yet delivered
    /// @param aListenerId id as returned by addMessageCallback()
    void removeMessageCallback(long aListenerId);

    /// @return number of events dropped for this listener because its queue was full
    long droppedEvents(long aListenerId);

    /// @}

  private:

    ErrorPtr prepareRequest(const DaliCommand &aCommand, DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay, DaliRequestPtr &aRequest);
    void enqueueRequest(DaliRequestPtr aRequest);
    void queueCommand(const DaliCommand &aCommand, DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay);
    void scheduleQueue(MLMicroSeconds aAt);
    void processQueue();
    void transmit();
    void responseTimedOut();
    void finishRequest(bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError);
    void failAll(ErrorPtr aError);

    void transportHandler(ErrorPtr aError);
    void handleAdapterReport(const DaliByteVector &aReport);
    void unsolicitedFrame(const DaliAdapterReport &aReport);
    void deliverEvent(long aListenerId);

    void daliCommandStatusHandler(DaliCommandStatusCB aResultCB, bool aNoOrTimeout, uint8_t aResponse, ErrorPtr aError);

  };


  /// base class for self-contained multi-step operations which need exclusive bus access.
  /// Instances are created with new and delete themselves when done.
  class DaliProcedure : public DMObj
  {
    bool procedureActive;

  protected:

    DaliCommPtr daliComm; ///< kept alive as long as the procedure runs

    DaliProcedure(DaliComm &aDaliComm);
    virtual ~DaliProcedure();

    /// release exclusive bus access. Must be called before reporting the result
    void procedureEnded();

    /// @name sending while holding exclusive access
    /// @{
    void send(const DaliCommand &aCommand, DaliComm::DaliQueryResultCB aResultCB = NULL, MLMicroSeconds aWithDelay = 0);
    void sendSpecial(uint8_t aSpecialCommand, uint8_t aData, DaliComm::DaliQueryResultCB aResultCB = NULL, MLMicroSeconds aWithDelay = 0);
    void sendCommand(DaliAddress aAddress, uint8_t aCommand, DaliComm::DaliQueryResultCB aResultCB = NULL, MLMicroSeconds aWithDelay = 0);
    void sendQuery(DaliAddress aAddress, uint8_t aQueryCommand, DaliComm::DaliQueryResultCB aResultCB, MLMicroSeconds aWithDelay = 0);
    void readMemory(DaliComm::DaliReadMemoryCB aResultCB, DaliAddress aAddress, uint8_t aBank, uint8_t aOffset, uint8_t aNumBytes);
    /// @}
  };

} // namespace dalimaster

#endif /* defined(__dalimaster__dalicomm__) */
