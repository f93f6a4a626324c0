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

// - set FOCUSLOGLEVEL to non-zero log level (usually, 5,6, or 7==LOG_DEBUG) to get focus (extensive logging) for this file
//   Note: must be before including "logger.hpp" (or anything that includes "logger.hpp")
#define FOCUSLOGLEVEL 0

#include "fdcomm.hpp"

#include <unistd.h>
#include <errno.h>
#include <sys/poll.h>

using namespace dalimaster;


FdComm::FdComm(MainLoop &aMainLoop) :
  dataFd(-1),
  mainLoop(aMainLoop)
{
}


FdComm::~FdComm()
{
  setFd(-1);
}


void FdComm::setFd(int aFd)
{
  if (dataFd==aFd) return;
  if (dataFd>=0) mainLoop.unregisterPollHandler(dataFd);
  dataFd = aFd;
  updatePollHandler();
}


void FdComm::stopMonitoringAndClose()
{
  if (dataFd>=0) {
    mainLoop.unregisterPollHandler(dataFd);
    close(dataFd);
    dataFd = -1;
  }
}


void FdComm::setReceiveHandler(FdCommCB aReceiveHandler)
{
  receiveHandler = aReceiveHandler;
  updatePollHandler();
}


void FdComm::updatePollHandler()
{
  if (dataFd<0) return;
  // stays registered without flags while nobody listens, so POLLHUP is not reported in a loop
  mainLoop.registerPollHandler(dataFd, receiveHandler ? POLLIN : 0, boost::bind(&FdComm::dataMonitorHandler, this, _1, _2));
}


void FdComm::dataMonitorHandler(int aFd, int aPollFlags)
{
  FdCommPtr keepMeAlive(this); // receive handler may drop the last reference
  FOCUSLOG("FdComm: fd %d pollflags 0x%X", aFd, aPollFlags);
  // a packet arriving together with the hangup is delivered first
  if ((aPollFlags & POLLIN) && receiveHandler) {
    receiveHandler(ErrorPtr());
  }
  if ((aPollFlags & (POLLHUP|POLLERR|POLLNVAL)) && receiveHandler) {
    receiveHandler(SysError::err(EPIPE, "FdComm: "));
  }
}


size_t FdComm::transmitBytes(size_t aNumBytes, const uint8_t *aBytes, ErrorPtr &aError)
{
  if (dataFd<0) {
    aError = SysError::err(EBADF, "FdComm: not open: ");
    return 0;
  }
  ssize_t res = write(dataFd, aBytes, aNumBytes);
  if (res<0) {
    aError = SysError::errNo("FdComm: write: ");
    return 0;
  }
  return res;
}


size_t FdComm::receiveBytes(MLMicroSeconds aTimeout, size_t aMaxBytes, uint8_t *aBytes, ErrorPtr &aError)
{
  if (dataFd<0) {
    aError = SysError::err(EBADF, "FdComm: not open: ");
    return 0;
  }
  struct pollfd pfd;
  pfd.fd = dataFd;
  pfd.events = POLLIN;
  pfd.revents = 0;
  int res = poll(&pfd, 1, (int)(aTimeout/MilliSecond));
  if (res<0) {
    if (errno==EINTR) return 0; // same as timeout
    aError = SysError::errNo("FdComm: poll: ");
    return 0;
  }
  if (res==0) return 0;
  if (pfd.revents & POLLIN) {
    ssize_t n = read(dataFd, aBytes, aMaxBytes);
    if (n<0) {
      if (errno==EWOULDBLOCK || errno==EAGAIN) return 0;
      aError = SysError::errNo("FdComm: read: ");
      return 0;
    }
    if (n==0 && (pfd.revents & POLLHUP)) {
      aError = SysError::err(ENODEV, "FdComm: hangup: ");
    }
    return n;
  }
  // POLLHUP, POLLERR or POLLNVAL without data
  aError = SysError::err(ENODEV, "FdComm: hangup: ");
  return 0;
}
