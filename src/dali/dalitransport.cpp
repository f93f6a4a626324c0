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

#include "dalitransport.hpp"

#include "daliframe.hpp"

#include <dirent.h>
#include <fcntl.h>
#include <errno.h>
#include <string.h>

using namespace dalimaster;

// USB vendor/product of the Tridonic DALI USB adapter, as it appears in HID_ID
#define TRIDONIC_HID_ID "000017B5:00000020"


#pragma mark - DaliTransport

DaliTransport::DaliTransport(MainLoop &aMainLoop) :
  mainLoop(aMainLoop),
  state(transport_closed)
{
}


DaliTransport::~DaliTransport()
{
}


void DaliTransport::dataReady()
{
  if (receiveHandler) receiveHandler(ErrorPtr());
}


void DaliTransport::connectionLost(ErrorPtr aError)
{
  if (state==transport_lost) return; // already reported
  state = transport_lost;
  LOG(LOG_ERR, "DALI transport %s lost: %s", description().c_str(), Error::text(aError).c_str());
  if (receiveHandler) receiveHandler(aError);
}


#pragma mark - DaliHidrawTransport

DaliHidrawTransport::DaliHidrawTransport(MainLoop &aMainLoop, const string aDevicePath) :
  inherited(aMainLoop),
  devicePath(aDevicePath)
{
  fdComm = FdCommPtr(new FdComm(aMainLoop));
}


DaliHidrawTransport::~DaliHidrawTransport()
{
  close();
}


string DaliHidrawTransport::description()
{
  return devicePath;
}


ErrorPtr DaliHidrawTransport::open()
{
  if (state==transport_open) return ErrorPtr(); // already open
  int fd = ::open(devicePath.c_str(), O_RDWR|O_NONBLOCK);
  if (fd<0) {
    return ioError(errno, "cannot open");
  }
  fdComm->setReceiveHandler(boost::bind(&DaliHidrawTransport::fdReceiveHandler, this, _1));
  fdComm->setFd(fd);
  state = transport_open;
  LOG(LOG_INFO, "DALI transport %s opened", devicePath.c_str());
  return ErrorPtr();
}


void DaliHidrawTransport::close()
{
  fdComm->setReceiveHandler(FdCommCB());
  fdComm->stopMonitoringAndClose();
  if (state==transport_open) {
    LOG(LOG_INFO, "DALI transport %s closed", devicePath.c_str());
  }
  state = transport_closed;
}


ErrorPtr DaliHidrawTransport::ioError(int aErrNo, const char *aContext)
{
  ErrorPtr err = DaliCommError::err(
    DaliCommErrorConnection, "%s %s: %s",
    aContext, devicePath.c_str(), Error::text(SysError::err(aErrNo)).c_str()
  );
  if (aErrNo==ENODEV || aErrNo==EPIPE || aErrNo==EIO) {
    // adapter unplugged
    fdComm->setReceiveHandler(FdCommCB());
    fdComm->stopMonitoringAndClose();
    connectionLost(err);
  }
  return err;
}


void DaliHidrawTransport::fdReceiveHandler(ErrorPtr aError)
{
  if (!Error::isOK(aError)) {
    // POLLHUP or POLLERR
    ioError(ENODEV, "hangup on");
    return;
  }
  dataReady();
}


ErrorPtr DaliHidrawTransport::write(const DaliByteVector &aReport)
{
  if (state!=transport_open) {
    return DaliCommError::err(DaliCommErrorConnection, "%s not open", devicePath.c_str());
  }
  FOCUSLOG("hidraw write: %s", dataToHexString(&aReport[0], aReport.size()).c_str());
  ErrorPtr err;
  size_t n = fdComm->transmitBytes(aReport.size(), &aReport[0], err);
  if (!Error::isOK(err)) {
    return ioError((int)err->getErrorCode(), "write to");
  }
  if (n!=aReport.size()) {
    return DaliCommError::err(DaliCommErrorConnection, "short write to %s (%d of %d bytes)", devicePath.c_str(), (int)n, (int)aReport.size());
  }
  return ErrorPtr();
}


ErrorPtr DaliHidrawTransport::readWithTimeout(MLMicroSeconds aTimeout, DaliByteVector &aReport)
{
  aReport.clear();
  if (state!=transport_open) {
    return DaliCommError::err(DaliCommErrorConnection, "%s not open", devicePath.c_str());
  }
  uint8_t buf[DALIADAPTER_INREPORT_SIZE];
  ErrorPtr err;
  size_t n = fdComm->receiveBytes(aTimeout, DALIADAPTER_INREPORT_SIZE, buf, err);
  if (!Error::isOK(err)) {
    return ioError((int)err->getErrorCode(), "read from");
  }
  if (n>0) {
    aReport.assign(buf, buf+n);
    FOCUSLOG("hidraw read: %s", dataToHexString(buf, n).c_str());
  }
  return ErrorPtr();
}


DaliTransportDescriptorList DaliHidrawTransport::discover(const char *aSysClassDir)
{
  DaliTransportDescriptorList adapters;
  DIR *dir = opendir(aSysClassDir);
  if (!dir) {
    LOG(LOG_WARNING, "cannot enumerate hidraw devices in %s: %s", aSysClassDir, Error::text(SysError::errNo()).c_str());
    return adapters;
  }
  struct dirent *de;
  while ((de = readdir(dir))!=NULL) {
    if (strncmp(de->d_name, "hidraw", 6)!=0) continue;
    string ueventPath = string_format("%s/%s/device/uevent", aSysClassDir, de->d_name);
    FILE *f = fopen(ueventPath.c_str(), "r");
    if (!f) continue;
    string uevent;
    bool ok = string_fgetfile(f, uevent);
    fclose(f);
    if (!ok) continue;
    DaliTransportDescriptor desc;
    bool isAdapter = false;
    const char *p = uevent.c_str();
    string line, key, value;
    while (nextLine(p, line)) {
      if (!keyAndValue(line, key, value, '=')) continue;
      if (key=="HID_ID") isAdapter = value.find(TRIDONIC_HID_ID)!=string::npos;
      else if (key=="HID_UNIQ") desc.serialNo = value;
      else if (key=="HID_NAME") desc.productName = value;
    }
    if (isAdapter) {
      desc.devicePath = string_format("/dev/%s", de->d_name);
      LOG(LOG_INFO, "found DALI adapter %s: '%s' serial '%s'", desc.devicePath.c_str(), desc.productName.c_str(), desc.serialNo.c_str());
      adapters.push_back(desc);
    }
  }
  closedir(dir);
  return adapters;
}
