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

#ifndef __dalimaster__dalitransport__
#define __dalimaster__dalitransport__

#include "dalitypes.hpp"
#include "fdcomm.hpp"

using namespace std;

namespace dalimaster {

  class DaliTransport;
  typedef boost::intrusive_ptr<DaliTransport> DaliTransportPtr;

  /// duplex report channel to one DALI USB adapter
  class DaliTransport : public DMObj
  {
    StatusCB receiveHandler;

  public:

    typedef enum {
      transport_closed,
      transport_open,
      transport_lost
    } TransportState;

  protected:

    MainLoop &mainLoop;
    TransportState state;

    /// to be called by subclasses when reports are ready to be read
    void dataReady();

    /// to be called by subclasses when the adapter is gone or failing
    /// @param aError the reason
    void connectionLost(ErrorPtr aError);

  public:

    DaliTransport(MainLoop &aMainLoop);
    virtual ~DaliTransport();

    /// open the transport
    /// @return NULL when open, DaliCommErrorConnection otherwise
    virtual ErrorPtr open() = 0;

    /// close the transport
    virtual void close() = 0;

    /// write one output report
    /// @param aReport the report
    /// @return NULL when written, DaliCommErrorConnection otherwise
    virtual ErrorPtr write(const DaliByteVector &aReport) = 0;

    /// read one input report
    /// @param aTimeout how long to wait for a report, 0 to check only
    /// @param aReport will receive the report, empty when timed out
    /// @return NULL when a report was read or the timeout has passed, DaliCommErrorConnection otherwise
    virtual ErrorPtr readWithTimeout(MLMicroSeconds aTimeout, DaliByteVector &aReport) = 0;

    /// @return description of the adapter (path, serial)
    virtual string description() = 0;

    /// set handler called from the mainloop when reports are ready (with NULL error)
    /// or when the connection is lost (with the reason)
    void setReceiveHandler(StatusCB aReceiveHandler) { receiveHandler = aReceiveHandler; };

    TransportState getState() const { return state; };
    bool isOpen() const { return state==transport_open; };

  };


  /// describes an adapter found by DaliHidrawTransport::discover()
  typedef struct {
    string devicePath; ///< /dev/hidrawN
    string serialNo; ///< HID_UNIQ
    string productName; ///< HID_NAME
  } DaliTransportDescriptor;
  typedef std::list<DaliTransportDescriptor> DaliTransportDescriptorList;


  class DaliHidrawTransport;
  typedef boost::intrusive_ptr<DaliHidrawTransport> DaliHidrawTransportPtr;

  /// Tridonic DALI USB adapter accessed via Linux hidraw
  class DaliHidrawTransport : public DaliTransport
  {
    typedef DaliTransport inherited;

    string devicePath;
    FdCommPtr fdComm;

  public:

    DaliHidrawTransport(MainLoop &aMainLoop, const string aDevicePath);
    virtual ~DaliHidrawTransport();

    /// find all Tridonic DALI USB adapters
    /// @param aSysClassDir the sysfs hidraw class directory
    /// @return list of adapters
    static DaliTransportDescriptorList discover(const char *aSysClassDir = "/sys/class/hidraw");

    virtual ErrorPtr open();
    virtual void close();
    virtual ErrorPtr write(const DaliByteVector &aReport);
    virtual ErrorPtr readWithTimeout(MLMicroSeconds aTimeout, DaliByteVector &aReport);
    virtual string description();

  private:

    void fdReceiveHandler(ErrorPtr aError);
    ErrorPtr ioError(int aErrNo, const char *aContext);

  };

} // namespace dalimaster

#endif /* defined(__dalimaster__dalitransport__) */
