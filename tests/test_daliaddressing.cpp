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

#include "testhelpers.hpp"

#include "daliaddressing.hpp"

using namespace dalimaster;


class DaliAddressingTests : public DaliSimTest
{
public:

  DaliScanResultPtr result;
  DaliScanControlPtr control;

  void scanned(DaliScanResultPtr aResult, ErrorPtr aError)
  {
    result = aResult;
    statusDone(aError);
  }

  void scan(bool aFull, const DaliAddressSet &aReserved = DaliAddressSet())
  {
    control = DaliAddressingScanner::scanForGear(*comm, boost::bind(&DaliAddressingTests::scanned, this, _1, _2), aReserved, aFull);
  }

  DaliDeviceInfoPtr infoFor(uint64_t aSerial)
  {
    if (!result) return DaliDeviceInfoPtr();
    for (DaliDeviceInfoList::iterator pos = result->deviceInfos.begin(); pos!=result->deviceInfos.end(); ++pos) {
      if ((*pos)->serialNo==aSerial) return *pos;
    }
    return DaliDeviceInfoPtr();
  }

  const SimWrittenFrame *lastSpecial()
  {
    for (SimWrittenFrameVector::reverse_iterator pos = sim->written.rbegin(); pos!=sim->written.rend(); ++pos) {
      uint8_t a = (pos->data>>8) & 0xFF;
      if (pos->bits==16 && a>=0xA0 && a<=0xCB) return &(*pos);
    }
    return NULL;
  }

};


TEST_F(DaliAddressingTests, EmptyBusNeedsSingleCompare)
{
  scan(true);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  ASSERT_TRUE(result.get()!=NULL);
  EXPECT_TRUE(result->deviceInfos.empty());
  EXPECT_TRUE(result->problems.empty());
  EXPECT_EQ(result->compareCount, 1);
  EXPECT_EQ(result->searchRounds, 0);
  EXPECT_EQ(sim->compareCount(), 1);
  EXPECT_EQ(sim->countSpecial(DALICMD_PROGRAM_SHORT_ADDRESS), 0);
  // all 64 short addresses polled
  int polls = 0;
  for (DaliAddress a=0; a<DALI_MAXDEVICES; a++) polls += sim->countAddressed(a, DALICMD_QUERY_CONTROL_GEAR);
  EXPECT_EQ(polls, DALI_MAXDEVICES);
  const SimWrittenFrame *f = lastSpecial();
  ASSERT_TRUE(f!=NULL);
  EXPECT_EQ((f->data>>8) & 0xFF, DALICMD_TERMINATE);
}


TEST_F(DaliAddressingTests, InitialiseAndRandomiseAreRepeated)
{
  SimDaliGearPtr gear = sim->addGear(7611234567890ll, 1001, 0);
  gear->nextRandomAddresses.push_back(0x345678);
  scan(true);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  EXPECT_EQ(sim->countSpecial(DALICMD_INITIALISE), 2);
  EXPECT_EQ(sim->countSpecial(DALICMD_RANDOMISE), 2);
  // the gear did take the new random address, which requires both frames within the repeat window
  EXPECT_EQ(gear->randomAddress, 0x345678u);
  EXPECT_EQ(gear->shortAddress, 0);
  for (size_t i=1; i<sim->written.size(); i++) {
    EXPECT_GE(sim->written[i].timestamp-sim->written[i-1].timestamp, TEST_SETTLING_DELAY);
  }
}


TEST_F(DaliAddressingTests, AssignsAddressesInRandomAddressOrder)
{
  sim->addGear(7611234567890ll, 3003, 0)->nextRandomAddresses.push_back(0xABCDEF);
  sim->addGear(7611234567890ll, 1001, 0)->nextRandomAddresses.push_back(0x010203);
  sim->addGear(7611234567890ll, 2002, 0)->nextRandomAddresses.push_back(0x0F0F0F);
  scan(true);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  ASSERT_EQ(result->deviceInfos.size(), 3u);
  DaliDeviceInfoList::iterator pos = result->deviceInfos.begin();
  EXPECT_EQ((*pos)->serialNo, 1001u); EXPECT_EQ((*pos)->shortAddress, 0); ++pos;
  EXPECT_EQ((*pos)->serialNo, 2002u); EXPECT_EQ((*pos)->shortAddress, 1); ++pos;
  EXPECT_EQ((*pos)->serialNo, 3003u); EXPECT_EQ((*pos)->shortAddress, 2);
  EXPECT_EQ(sim->gears[0]->shortAddress, 2);
  EXPECT_EQ(sim->gears[1]->shortAddress, 0);
  EXPECT_EQ(sim->gears[2]->shortAddress, 1);
  EXPECT_EQ(result->withdrawnCount, 3);
  EXPECT_FALSE(result->collisionSeen);
}


TEST_F(DaliAddressingTests, FindsGearAtRandomAddressLimits)
{
  sim->addGear(7611234567890ll, 1001, 0)->nextRandomAddresses.push_back(DALI_SEARCHADDR_MAX);
  sim->addGear(7611234567890ll, 2002, 0)->nextRandomAddresses.push_back(0);
  scan(true);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  ASSERT_EQ(result->deviceInfos.size(), 2u);
  EXPECT_EQ(infoFor(2002)->shortAddress, 0);
  EXPECT_EQ(infoFor(1001)->shortAddress, 1);
}


TEST_F(DaliAddressingTests, SearchEffortIsBoundedPerDevice)
{
  const int numGears = 6;
  for (int i=0; i<numGears; i++) {
    sim->addGear(7611234567890ll, 100+i, 0); // random addresses chosen by the simulator
  }
  scan(true);
  ASSERT_TRUE(runUntilFinished(20*Second));
  ASSERT_TRUE(Error::isOK(lastError));
  ASSERT_EQ((int)result->deviceInfos.size(), numGears);
  EXPECT_LE(result->searchRounds, numGears*24);
  // one probing COMPARE per search, plus the final one finding nothing
  EXPECT_EQ(result->compareCount, result->searchRounds+numGears+1);
  DaliAddressSet addresses;
  for (SimDaliGearVector::iterator pos = sim->gears.begin(); pos!=sim->gears.end(); ++pos) {
    EXPECT_LT((*pos)->shortAddress, DALI_MAXDEVICES);
    addresses.insert((*pos)->shortAddress);
  }
  EXPECT_EQ((int)addresses.size(), numGears);
}


TEST_F(DaliAddressingTests, IncrementalScanKeepsAddressedGear)
{
  SimDaliGearPtr addressed = sim->addGear(7611234567890ll, 1001, 0, 0);
  addressed->nextRandomAddresses.push_back(0x000001);
  SimDaliGearPtr fresh = sim->addGear(7611234567890ll, 2002, 0);
  fresh->nextRandomAddresses.push_back(0x800000);
  scan(false);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  EXPECT_EQ(result->presentAddresses.size(), 1u);
  EXPECT_EQ(result->presentAddresses.count(0), 1u);
  // the addressed gear did not take part in the search
  EXPECT_EQ(addressed->randomAddress, 0u);
  EXPECT_EQ(addressed->shortAddress, 0);
  EXPECT_EQ(fresh->shortAddress, 1);
  EXPECT_EQ(result->withdrawnCount, 1);
  ASSERT_EQ(result->deviceInfos.size(), 2u);
  EXPECT_EQ(infoFor(1001)->shortAddress, 0);
  EXPECT_EQ(infoFor(2002)->shortAddress, 1);
}


TEST_F(DaliAddressingTests, FullScanKeepsValidShortAddresses)
{
  SimDaliGearPtr g1 = sim->addGear(7611234567890ll, 1001, 0, 17);
  g1->nextRandomAddresses.push_back(0x000100);
  SimDaliGearPtr g2 = sim->addGear(7611234567890ll, 2002, 0);
  g2->nextRandomAddresses.push_back(0x000200);
  scan(true);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  EXPECT_EQ(g1->shortAddress, 17);
  EXPECT_EQ(g2->shortAddress, 0);
  EXPECT_EQ(result->withdrawnCount, 2);
  EXPECT_EQ(sim->countSpecial(DALICMD_PROGRAM_SHORT_ADDRESS), 1);
  ASSERT_EQ(result->deviceInfos.size(), 2u);
  // identity is read only once per device
  EXPECT_EQ(sim->countAddressed(17, DALICMD_QUERY_DEVICE_TYPE), 1);
}


TEST_F(DaliAddressingTests, ReservedAddressesAreNotGiven)
{
  sim->addGear(7611234567890ll, 1001, 0)->nextRandomAddresses.push_back(0x123456);
  DaliAddressSet reserved;
  reserved.insert(0);
  reserved.insert(1);
  scan(false, reserved);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  EXPECT_EQ(sim->gears[0]->shortAddress, 2);
}


TEST_F(DaliAddressingTests, FullScanSeparatesDuplicateShortAddresses)
{
  SimDaliGearPtr g1 = sim->addGear(7611234567890ll, 1001, 0, 2);
  g1->nextRandomAddresses.push_back(0x000100);
  SimDaliGearPtr g2 = sim->addGear(7611234567890ll, 2002, 0, 2);
  g2->nextRandomAddresses.push_back(0x000200);
  scan(true);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  EXPECT_EQ(g1->shortAddress, 2);
  EXPECT_EQ(g2->shortAddress, 0);
  ASSERT_EQ(result->deviceInfos.size(), 2u);
  EXPECT_TRUE(result->problems.empty());
}


TEST_F(DaliAddressingTests, DuplicateShortAddressIsReportedInIncrementalScan)
{
  sim->addGear(7611234567890ll, 1001, 0, 2);
  sim->addGear(7611234567890ll, 2002, 0, 2);
  scan(false);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  EXPECT_TRUE(result->deviceInfos.empty());
  ASSERT_EQ(result->problems.size(), 1u);
  EXPECT_EQ(result->problems.front().first, 2);
  EXPECT_TRUE(Error::isError(result->problems.front().second, DaliCommError::domain(), DaliCommErrorDALIFrame));
}


TEST_F(DaliAddressingTests, RecoversFromRandomAddressClash)
{
  SimDaliGearPtr g1 = sim->addGear(1111111111111ll, 1001, 0);
  g1->nextRandomAddresses.push_back(0x404040);
  g1->nextRandomAddresses.push_back(0x100000);
  SimDaliGearPtr g2 = sim->addGear(2222222222222ll, 2002, 0);
  g2->nextRandomAddresses.push_back(0x404040);
  g2->nextRandomAddresses.push_back(0x200000);
  scan(true);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  EXPECT_TRUE(result->collisionSeen);
  EXPECT_EQ(result->restarts, 1);
  EXPECT_EQ(sim->countSpecial(DALICMD_RANDOMISE), 4);
  EXPECT_EQ(g1->shortAddress, 0);
  EXPECT_EQ(g2->shortAddress, 1);
  ASSERT_EQ(result->deviceInfos.size(), 2u);
  EXPECT_EQ(infoFor(1001)->gtin, 1111111111111ull);
  EXPECT_EQ(infoFor(2002)->gtin, 2222222222222ull);
  EXPECT_TRUE(result->problems.empty());
}


TEST_F(DaliAddressingTests, ClashOnKeptShortAddressLeavesNoProblem)
{
  // same short address and same random address, only identity read tells them apart
  SimDaliGearPtr g1 = sim->addGear(1111111111111ll, 1001, 0, 5);
  g1->nextRandomAddresses.push_back(0x404040);
  g1->nextRandomAddresses.push_back(0x100000);
  SimDaliGearPtr g2 = sim->addGear(2222222222222ll, 2002, 0, 5);
  g2->nextRandomAddresses.push_back(0x404040);
  g2->nextRandomAddresses.push_back(0x200000);
  scan(true);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  EXPECT_TRUE(result->collisionSeen);
  EXPECT_EQ(result->restarts, 1);
  EXPECT_EQ(result->presentAddresses.count(5), 0u);
  EXPECT_TRUE(result->problems.empty());
  ASSERT_EQ(result->deviceInfos.size(), 2u);
  EXPECT_NE(g1->shortAddress, g2->shortAddress);
  EXPECT_NE(g1->shortAddress, 5);
  EXPECT_NE(g2->shortAddress, 5);
  EXPECT_EQ(sim->countAddressed(5, DALICMD_STORE_DTR_AS_SHORT_ADDRESS), 2);
}


TEST_F(DaliAddressingTests, PersistentClashFailsScan)
{
  SimDaliGearPtr g1 = sim->addGear(1111111111111ll, 1001, 0);
  SimDaliGearPtr g2 = sim->addGear(2222222222222ll, 2002, 0);
  for (int i=0; i<5; i++) {
    g1->nextRandomAddresses.push_back(0x404040);
    g2->nextRandomAddresses.push_back(0x404040);
  }
  scan(true);
  ASSERT_TRUE(runUntilFinished());
  EXPECT_TRUE(Error::isError(lastError, DaliCommError::domain(), DaliCommErrorDeviceSearch));
  ASSERT_TRUE(result.get()!=NULL);
  EXPECT_EQ(result->restarts, 3);
  const SimWrittenFrame *f = lastSpecial();
  ASSERT_TRUE(f!=NULL);
  EXPECT_EQ((f->data>>8) & 0xFF, DALICMD_TERMINATE);
}


TEST_F(DaliAddressingTests, UnidentifiableGearIsReportedAsProblem)
{
  SimDaliGearPtr gear = sim->addGear(7611234567890ll, 1001, 0);
  gear->nextRandomAddresses.push_back(0x123456);
  gear->bank0.assign(DALIMEM_BANK0_IDBYTES, 0);
  gear->bank0[DALIMEM_BANK0_LAST_LOCATION] = DALIMEM_BANK0_GEAR_UNIT_INDEX;
  scan(true);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  EXPECT_TRUE(result->deviceInfos.empty());
  ASSERT_EQ(result->problems.size(), 1u);
  EXPECT_EQ(result->problems.front().first, 0);
  EXPECT_TRUE(Error::isError(result->problems.front().second, DaliCommError::domain(), DaliCommErrorIdentityReadFailed));
  // still addressed and withdrawn
  EXPECT_EQ(gear->shortAddress, 0);
  EXPECT_EQ(result->withdrawnCount, 1);
}


TEST_F(DaliAddressingTests, ExhaustedAddressSpace)
{
  sim->addGear(7611234567890ll, 1001, 0)->nextRandomAddresses.push_back(0x123456);
  DaliAddressSet reserved;
  for (DaliAddress a=0; a<DALI_MAXDEVICES; a++) reserved.insert(a);
  scan(false, reserved);
  ASSERT_TRUE(runUntilFinished());
  EXPECT_TRUE(Error::isError(lastError, DaliCommError::domain(), DaliCommErrorAddressSpaceExhausted));
  ASSERT_TRUE(result.get()!=NULL);
  ASSERT_EQ(result->problems.size(), 1u);
  EXPECT_EQ(result->problems.front().first, DaliBroadcast);
  EXPECT_EQ(sim->gears[0]->shortAddress, DaliBroadcast);
  EXPECT_EQ(sim->countSpecial(DALICMD_PROGRAM_SHORT_ADDRESS), 0);
  const SimWrittenFrame *f = lastSpecial();
  ASSERT_TRUE(f!=NULL);
  EXPECT_EQ((f->data>>8) & 0xFF, DALICMD_TERMINATE);
}


TEST_F(DaliAddressingTests, CancelTerminatesAddressingMode)
{
  sim->addGear(7611234567890ll, 1001, 0)->nextRandomAddresses.push_back(0x123456);
  scan(true);
  ASSERT_TRUE(control.get()!=NULL);
  control->cancel();
  ASSERT_TRUE(runUntilFinished());
  EXPECT_TRUE(Error::isError(lastError, DaliCommError::domain(), DaliCommErrorCancelled));
  EXPECT_EQ(sim->countSpecial(DALICMD_PROGRAM_SHORT_ADDRESS), 0);
  EXPECT_EQ(sim->gears[0]->shortAddress, DaliBroadcast);
  const SimWrittenFrame *f = lastSpecial();
  ASSERT_TRUE(f!=NULL);
  EXPECT_EQ((f->data>>8) & 0xFF, DALICMD_TERMINATE);
  EXPECT_FALSE(comm->isBusy());
}


TEST_F(DaliAddressingTests, BusIsBusyDuringScan)
{
  scan(true);
  EXPECT_TRUE(comm->isBusy());
  comm->daliSendQuery(0, DALICMD_QUERY_CONTROL_GEAR, boost::bind(&DaliAddressingTests::queryDone, this, _1, _2, _3));
  EXPECT_EQ(callbackCount, 1);
  EXPECT_TRUE(Error::isError(lastError, DaliCommError::domain(), DaliCommErrorBusy));
  // a second scan is rejected as well
  DaliAddressingScanner::scanForGear(*comm, boost::bind(&DaliAddressingTests::scanned, this, _1, _2), DaliAddressSet(), true);
  EXPECT_EQ(callbackCount, 2);
  EXPECT_TRUE(result.get()==NULL);
  EXPECT_TRUE(Error::isError(lastError, DaliCommError::domain(), DaliCommErrorBusy));
  // let the first scan complete
  finished = false;
  callbackCount = 0;
  ASSERT_TRUE(runUntilFinished());
  EXPECT_EQ(callbackCount, 1);
  EXPECT_TRUE(Error::isOK(lastError));
  EXPECT_FALSE(comm->isBusy());
}
