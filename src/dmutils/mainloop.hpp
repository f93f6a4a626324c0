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

#ifndef __dalimaster__mainloop__
#define __dalimaster__mainloop__

#include "dmobj.hpp"
#include "error.hpp"

#include <list>
#include <map>
#include <sys/poll.h>

#include <boost/function.hpp>

using namespace std;

namespace dalimaster {

  // Mainloop timing unit
  typedef long long MLMicroSeconds;
  const MLMicroSeconds Never = 0;
  const MLMicroSeconds MilliSecond = 1000;
  const MLMicroSeconds Second = 1000*MilliSecond;

  /// @name Mainloop callbacks
  /// @{

  /// Generic handler for returning a status (ok or error)
  typedef boost::function<void (ErrorPtr aError)> StatusCB;

  /// Handler for one time processing (scheduled by executeOnce()/executeOnceAt())
  /// @param aRoundStart the time when the current mainloop round has started
  typedef boost::function<void (MLMicroSeconds aRoundStart)> OneTimeCB;

  /// I/O callback
  /// @param aFD the file descriptor that was signalled
  /// @param aPollFlags the revents poll() reported for aFD
  typedef boost::function<void (int aFD, int aPollFlags)> IOPollCB;

  /// @}


  /// A single threaded main loop, running timed one-time handlers and poll() based I/O handlers.
  /// Each round runs the timers that were due when the round started, then waits for I/O
  /// until the next timer is due.
  class MainLoop : public DMObj
  {
    struct OnetimeHandler {
      void *submitterP;
      long ticketNo;
      MLMicroSeconds executionTime;
      OneTimeCB callback;
    };
    typedef std::list<OnetimeHandler> OnetimeHandlerList;
    OnetimeHandlerList onetimeHandlers; ///< ordered by executionTime, FIFO for equal times
    long ticketNo;

    struct IOPollHandler {
      int pollFlags;
      IOPollCB pollHandler;
    };
    typedef std::map<int, IOPollHandler> IOPollHandlerMap;
    IOPollHandlerMap ioPollHandlers;

    bool terminated;
    int exitCode;

    MainLoop();

  public:

    /// returns or creates the current thread's mainloop
    static MainLoop &currentMainLoop();

    /// returns the current time in microseconds (monotonic)
    static MLMicroSeconds now();

    /// have handler called from the mainloop once at a given time
    /// @param aCallback the functor to be called
    /// @param aExecutionTime when to execute (approximately), in now() timescale
    /// @param aSubmitterP optionally, an identifying value which allows to cancel the pending execution requests
    /// @return ticket number which can be used to cancel this specific execution request
    long executeOnceAt(OneTimeCB aCallback, MLMicroSeconds aExecutionTime, void *aSubmitterP = NULL);

    /// have handler called from the mainloop once with an optional delay from now
    /// @return ticket number which can be used to cancel this specific execution request
    long executeOnce(OneTimeCB aCallback, MLMicroSeconds aDelay = 0, void *aSubmitterP = NULL);

    /// cancel pending execution requests from submitter (NULL = cancel all)
    void cancelExecutionsFrom(void *aSubmitterP);

    /// cancel pending execution by ticket number
    /// @param aTicketNo ticket of execution to cancel. Will be set to 0 on return
    void cancelExecutionTicket(long &aTicketNo);

    /// register handler to be called for activity on a file descriptor
    /// @param aPollFlags POLLxxx flags to wait for, 0 to keep the handler registered but idle
    /// @note registering again for the same fd replaces handler and flags
    void registerPollHandler(int aFD, int aPollFlags, IOPollCB aPollEventHandler);

    void unregisterPollHandler(int aFD);

    /// terminate the mainloop
    /// @param aExitCode the code to return from run()
    void terminate(int aExitCode);

    /// run the mainloop until terminate() is called
    /// @return returns the exit code passed to terminate()
    int run();

  private:

    void runDueHandlers(MLMicroSeconds aRoundStart);
    void handleIOPoll(MLMicroSeconds aTimeout);

  };

} // namespace dalimaster

#endif /* defined(__dalimaster__mainloop__) */
