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

#ifndef __dalimaster__fdcomm__
#define __dalimaster__fdcomm__

#include "dm_common.hpp"

using namespace std;

namespace dalimaster {


  class FdComm;
  typedef boost::intrusive_ptr<FdComm> FdCommPtr;

  /// callback for signalling a packet ready to receive, or a hangup
  typedef boost::function<void (ErrorPtr aError)> FdCommCB;


  /// mainloop-monitored file descriptor of a packet device such as hidraw,
  /// where each read() and write() transfers exactly one report
  class FdComm : public DMObj
  {
    FdCommCB receiveHandler;
    int dataFd;
    MainLoop &mainLoop;

  public:

    FdComm(MainLoop &aMainLoop);
    virtual ~FdComm();

    /// take ownership of a file descriptor and monitor it
    /// @param aFd the file descriptor, -1 to stop monitoring
    void setFd(int aFd);

    int getFd() { return dataFd; };

    /// stop monitoring and close the file descriptor
    void stopMonitoringAndClose();

    /// write one packet
    /// @param aError set when write() fails, untouched otherwise
    /// @return number of bytes actually written
    size_t transmitBytes(size_t aNumBytes, const uint8_t *aBytes, ErrorPtr &aError);

    /// read one packet, waiting at most aTimeout for it
    /// @param aError set when reading fails or the device hung up, untouched otherwise
    /// @return number of bytes read, 0 on timeout
    size_t receiveBytes(MLMicroSeconds aTimeout, size_t aMaxBytes, uint8_t *aBytes, ErrorPtr &aError);

    /// install callback for a packet becoming ready to read
    /// @param aReceiveHandler called from the mainloop with no error when a packet can be read,
    ///   or with an error when the device hung up. Empty handler stops read monitoring.
    void setReceiveHandler(FdCommCB aReceiveHandler);

  private:

    void updatePollHandler();
    void dataMonitorHandler(int aFd, int aPollFlags);
  };

} // namespace dalimaster


#endif /* defined(__dalimaster__fdcomm__) */
