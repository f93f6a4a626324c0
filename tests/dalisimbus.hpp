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

#ifndef __dalimaster__dalisimbus__
#define __dalimaster__dalisimbus__

#include "dalitransport.hpp"
#include "daliframe.hpp"

using namespace std;

namespace dalimaster {

  /// one simulated control gear
  class SimDaliGear : public DMObj
  {
  public:
    SimDaliGear(uint64_t aGtin, uint64_t aSerial, uint32_t aRandomAddress);

    uint32_t randomAddress;
    std::list<uint32_t> nextRandomAddresses; ///< used by RANDOMISE, before falling back to a pseudo random address
    DaliAddress shortAddress; ///< DaliBroadcast for none
    bool initialised;
    bool withdrawn;
    uint8_t level;
    uint8_t lastActiveLevel;
    uint8_t powerOnLevel;
    uint8_t fade;
    uint16_t groups;
    uint8_t deviceType;
    uint8_t dtr, dtr1, dtr2;
    uint8_t status; ///< extra status bits (failures)
    DaliByteVector bank0;
    bool mute; ///< does not answer at all
    int answersToIgnore; ///< number of next answers to suppress

    /// set up a standard bank 0
    void setBank0(uint64_t aGtin, uint64_t aSerial, uint8_t aEndpointIndex = 0);
  };
  typedef boost::intrusive_ptr<SimDaliGear> SimDaliGearPtr;
  typedef std::vector<SimDaliGearPtr> SimDaliGearVector;


  /// a frame written by the master
  typedef struct {
    MLMicroSeconds timestamp;
    uint8_t seq;
    uint8_t bits;
    uint32_t data;
    bool da24;
  } SimWrittenFrame;
  typedef std::vector<SimWrittenFrame> SimWrittenFrameVector;


  /// simulated DALI bus with adapter, acting as a transport
  class SimDaliBus : public DaliTransport
  {
    typedef DaliTransport inherited;

    std::deque<DaliByteVector> inReports;
    uint32_t searchAddress;
    uint32_t lastFrame;
    MLMicroSeconds lastFrameTime;
    bool lastFrameConsumed;
    uint32_t randomSeed;

  public:

    SimDaliBus(MainLoop &aMainLoop);
    virtual ~SimDaliBus();

    SimDaliGearVector gears;
    SimWrittenFrameVector written;

    /// @name fault injection
    /// @{
    bool adapterSilent; ///< adapter does not report anything
    bool failWrites; ///< writes fail with a connection error
    MLMicroSeconds reportDelay; ///< delay for adapter reports
    /// @}

    /// add a gear
    SimDaliGearPtr addGear(uint64_t aGtin, uint64_t aSerial, uint32_t aRandomAddress, DaliAddress aShortAddress = DaliBroadcast);

    /// @return number of COMPARE commands seen
    int compareCount();

    /// @return number of frames with given special opcode / addressed opcode written
    int countSpecial(uint8_t aSpecialOpcode);
    int countAddressed(DaliAddress aAddress, uint8_t aOpcode);

    /// queue a raw report from the adapter
    void injectReport(const DaliByteVector &aReport);

    /// queue a forward frame from another master
    void injectForeignFrame(uint32_t aData, uint8_t aBits = 16);

    /// simulate unplugging the adapter
    void unplug();

    // DaliTransport
    virtual ErrorPtr open();
    virtual void close();
    virtual ErrorPtr write(const DaliByteVector &aReport);
    virtual ErrorPtr readWithTimeout(MLMicroSeconds aTimeout, DaliByteVector &aReport);
    virtual string description() { return "simbus"; };

  private:

    void reportReady(DaliByteVector aReport);
    void queueReport(uint8_t aSource, uint8_t aType, uint8_t aSeq, uint32_t aData, uint8_t aBits);
    void processForward(uint8_t aSeq, uint32_t aData, uint8_t aBits);
    bool repeated(uint32_t aData);
    bool addressedTo(SimDaliGearPtr aGear, uint8_t aAddrByte);
    bool selected(SimDaliGearPtr aGear);
    uint32_t nextRandom();
    void gearCommand(SimDaliGearPtr aGear, uint8_t aOpcode, bool aRepeated, std::vector<uint8_t> &aAnswers);
    void specialCommand(uint8_t aOpcode, uint8_t aData, bool aRepeated, std::vector<uint8_t> &aAnswers);
    void answer(SimDaliGearPtr aGear, uint8_t aValue, std::vector<uint8_t> &aAnswers);
  };
  typedef boost::intrusive_ptr<SimDaliBus> SimDaliBusPtr;

} // namespace dalimaster

#endif /* defined(__dalimaster__dalisimbus__) */
