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

#include "mainloop.hpp"

#include <unistd.h>
#include <stdlib.h>
#include <time.h>
#include <errno.h>
#include <string.h>
#include <vector>

#include "logger.hpp"

// longest poll() without any timer pending
#define MAINLOOP_MAX_IDLE_WAIT (1*Second)

using namespace dalimaster;


MLMicroSeconds MainLoop::now()
{
  struct timespec tsp;
  clock_gettime(CLOCK_MONOTONIC, &tsp);
  return ((MLMicroSeconds)tsp.tv_sec)*Second + tsp.tv_nsec/1000;
}


static __thread MainLoop *currentMainLoopP = NULL;

MainLoop &MainLoop::currentMainLoop()
{
  if (currentMainLoopP==NULL) {
    currentMainLoopP = new MainLoop();
  }
  return *currentMainLoopP;
}


MainLoop::MainLoop() :
  ticketNo(0),
  terminated(false),
  exitCode(EXIT_SUCCESS)
{
}


long MainLoop::executeOnce(OneTimeCB aCallback, MLMicroSeconds aDelay, void *aSubmitterP)
{
  return executeOnceAt(aCallback, now()+aDelay, aSubmitterP);
}


long MainLoop::executeOnceAt(OneTimeCB aCallback, MLMicroSeconds aExecutionTime, void *aSubmitterP)
{
  OnetimeHandler h;
  h.submitterP = aSubmitterP;
  h.ticketNo = ++ticketNo;
  h.executionTime = aExecutionTime;
  h.callback = aCallback;
  // behind all handlers due at the same time or earlier
  OnetimeHandlerList::iterator pos = onetimeHandlers.begin();
  while (pos!=onetimeHandlers.end() && pos->executionTime<=aExecutionTime) ++pos;
  onetimeHandlers.insert(pos, h);
  return h.ticketNo;
}


void MainLoop::cancelExecutionsFrom(void *aSubmitterP)
{
  OnetimeHandlerList::iterator pos = onetimeHandlers.begin();
  while (pos!=onetimeHandlers.end()) {
    if (aSubmitterP==NULL || pos->submitterP==aSubmitterP)
      pos = onetimeHandlers.erase(pos);
    else
      ++pos;
  }
}


void MainLoop::cancelExecutionTicket(long &aTicketNo)
{
  if (aTicketNo==0) return;
  for (OnetimeHandlerList::iterator pos = onetimeHandlers.begin(); pos!=onetimeHandlers.end(); ++pos) {
    if (pos->ticketNo==aTicketNo) {
      onetimeHandlers.erase(pos);
      break;
    }
  }
  aTicketNo = 0;
}


void MainLoop::registerPollHandler(int aFD, int aPollFlags, IOPollCB aPollEventHandler)
{
  if (aPollEventHandler.empty()) {
    unregisterPollHandler(aFD);
    return;
  }
  IOPollHandler &h = ioPollHandlers[aFD];
  h.pollFlags = aPollFlags;
  h.pollHandler = aPollEventHandler;
}


void MainLoop::unregisterPollHandler(int aFD)
{
  ioPollHandlers.erase(aFD);
}


void MainLoop::terminate(int aExitCode)
{
  terminated = true;
  exitCode = aExitCode;
}


void MainLoop::runDueHandlers(MLMicroSeconds aRoundStart)
{
  // handlers scheduled by the callbacks themselves wait for the next round
  long lastTicket = ticketNo;
  while (!terminated) {
    OnetimeHandlerList::iterator pos = onetimeHandlers.begin();
    while (pos!=onetimeHandlers.end() && pos->executionTime<=aRoundStart && pos->ticketNo>lastTicket) ++pos;
    if (pos==onetimeHandlers.end() || pos->executionTime>aRoundStart) break;
    OneTimeCB cb = pos->callback;
    onetimeHandlers.erase(pos);
    cb(aRoundStart);
  }
}


void MainLoop::handleIOPoll(MLMicroSeconds aTimeout)
{
  std::vector<struct pollfd> pollFds;
  pollFds.reserve(ioPollHandlers.size());
  for (IOPollHandlerMap::iterator pos = ioPollHandlers.begin(); pos!=ioPollHandlers.end(); ++pos) {
    if (pos->second.pollFlags==0) continue; // idle
    struct pollfd pfd;
    pfd.fd = pos->first;
    pfd.events = pos->second.pollFlags;
    pfd.revents = 0;
    pollFds.push_back(pfd);
  }
  if (pollFds.empty()) {
    if (aTimeout>0) usleep((useconds_t)aTimeout);
    return;
  }
  // round up, a timer due within the next millisecond must not cause a busy loop
  int timeoutMs = aTimeout<=0 ? 0 : (int)((aTimeout+MilliSecond-1)/MilliSecond);
  int numReadyFDs = poll(&pollFds[0], (nfds_t)pollFds.size(), timeoutMs);
  if (numReadyFDs<0) {
    if (errno!=EINTR) LOG(LOG_ERR, "MainLoop: poll() failed: %s", strerror(errno));
    return;
  }
  for (size_t i=0; i<pollFds.size() && numReadyFDs>0 && !terminated; i++) {
    if (pollFds[i].revents==0) continue;
    // an earlier handler may have unregistered this fd
    IOPollHandlerMap::iterator pos = ioPollHandlers.find(pollFds[i].fd);
    if (pos!=ioPollHandlers.end()) {
      IOPollCB cb = pos->second.pollHandler; // copy, handler might unregister itself
      cb(pollFds[i].fd, pollFds[i].revents);
    }
  }
}


int MainLoop::run()
{
  terminated = false;
  while (!terminated) {
    runDueHandlers(now());
    if (terminated) break;
    MLMicroSeconds wait = MAINLOOP_MAX_IDLE_WAIT;
    if (!onetimeHandlers.empty()) {
      wait = onetimeHandlers.front().executionTime-now();
      if (wait<0) wait = 0;
      else if (wait>MAINLOOP_MAX_IDLE_WAIT) wait = MAINLOOP_MAX_IDLE_WAIT;
    }
    handleIOPoll(wait);
  }
  return exitCode;
}
