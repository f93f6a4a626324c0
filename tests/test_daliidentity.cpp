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

#include "daliidentity.hpp"

using namespace dalimaster;


class DaliIdentityTests : public DaliSimTest
{
public:

  DaliDeviceInfoPtr info;

  void identified(DaliDeviceInfoPtr aInfo, ErrorPtr aError)
  {
    info = aInfo;
    statusDone(aError);
  }

  void resolve(DaliAddress aAddress)
  {
    DaliIdentityResolver::resolveIdentity(*comm, boost::bind(&DaliIdentityTests::identified, this, _1, _2), aAddress);
  }

};


TEST_F(DaliIdentityTests, ResolvesIdentityFromBank0)
{
  sim->addGear(7611234567890ll, 0x12345678, 0x123456, 5);
  resolve(5);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  ASSERT_TRUE(info.get()!=NULL);
  EXPECT_EQ(info->shortAddress, 5);
  EXPECT_EQ(info->gtin, 7611234567890ull);
  EXPECT_EQ(info->serialNo, 0x12345678ull);
  EXPECT_EQ(info->fw_version_major, 2);
  EXPECT_EQ(info->fw_version_minor, 1);
  EXPECT_EQ(info->hw_version_major, 1);
  EXPECT_EQ(info->hw_version_minor, 3);
  EXPECT_EQ(info->logicalGearUnits, 1);
  EXPECT_EQ(info->endpointIndex, 0);
  EXPECT_EQ(info->deviceType, 6);
  EXPECT_EQ(info->uniqueId(), "7611234567890-0000000012345678-0");
  // 27 memory reads plus DTR1, DTR and device type
  EXPECT_EQ(sim->countAddressed(5, DALICMD_READ_MEMORY_LOCATION), DALIMEM_BANK0_IDBYTES);
  EXPECT_EQ(sim->countAddressed(5, DALICMD_QUERY_DEVICE_TYPE), 1);
}


TEST_F(DaliIdentityTests, EndpointIndexIsPartOfUniqueId)
{
  sim->addGear(7611234567890ll, 0x12345678, 0x123456, 5)->setBank0(7611234567890ll, 0x12345678, 2);
  resolve(5);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  EXPECT_EQ(info->endpointIndex, 2);
  EXPECT_EQ(info->uniqueId(), "7611234567890-0000000012345678-2");
}


TEST_F(DaliIdentityTests, OlderGearWithShortBank0)
{
  SimDaliGearPtr gear = sim->addGear(7611234567890ll, 4711, 0x123456, 8);
  gear->bank0.resize(DALIMEM_BANK0_MINBYTES);
  gear->bank0[DALIMEM_BANK0_LAST_LOCATION] = DALIMEM_BANK0_MINBYTES-1;
  resolve(8);
  ASSERT_TRUE(runUntilFinished());
  ASSERT_TRUE(Error::isOK(lastError));
  EXPECT_EQ(info->serialNo, 4711ull);
  EXPECT_EQ(info->hw_version_major, 0);
  EXPECT_EQ(info->endpointIndex, 0);
}


TEST_F(DaliIdentityTests, MissingMandatoryBytesFail)
{
  SimDaliGearPtr gear = sim->addGear(7611234567890ll, 4711, 0x123456, 8);
  gear->bank0[DALIMEM_BANK0_LAST_LOCATION] = DALIMEM_BANK0_FW_VERSION-1;
  resolve(8);
  ASSERT_TRUE(runUntilFinished());
  EXPECT_TRUE(Error::isError(lastError, DaliCommError::domain(), DaliCommErrorIdentityReadFailed));
  EXPECT_TRUE(info.get()==NULL);
}


TEST_F(DaliIdentityTests, SilentGearFails)
{
  sim->addGear(7611234567890ll, 4711, 0x123456, 8)->mute = true;
  resolve(8);
  ASSERT_TRUE(runUntilFinished());
  EXPECT_TRUE(Error::isError(lastError, DaliCommError::domain(), DaliCommErrorIdentityReadFailed));
}


TEST_F(DaliIdentityTests, BlankIdentityFails)
{
  sim->addGear(0xFFFFFFFFFFFFll, 0, 0x123456, 8);
  resolve(8);
  ASSERT_TRUE(runUntilFinished());
  EXPECT_TRUE(Error::isError(lastError, DaliCommError::domain(), DaliCommErrorIdentityReadFailed));
}


TEST_F(DaliIdentityTests, CollidingGearReportsFramingError)
{
  sim->addGear(7611234567890ll, 1111, 0x123456, 8);
  sim->addGear(7611234567890ll, 2222, 0x654321, 8);
  resolve(8);
  ASSERT_TRUE(runUntilFinished());
  EXPECT_TRUE(Error::isError(lastError, DaliCommError::domain(), DaliCommErrorDALIFrame));
}


TEST_F(DaliIdentityTests, BusyWhileOtherProcedureRuns)
{
  sim->addGear(7611234567890ll, 1111, 0x123456, 8);
  comm->daliReadMemory(DaliComm::DaliReadMemoryCB(), 8, 0, 0, 2);
  resolve(8);
  EXPECT_EQ(callbackCount, 1);
  EXPECT_TRUE(Error::isError(lastError, DaliCommError::domain(), DaliCommErrorBusy));
  runFor(100*MilliSecond);
}


TEST(DaliBank0Tests, RequiresMandatoryPart)
{
  std::vector<uint8_t> data(DALIMEM_BANK0_MINBYTES-1, 0x11);
  DaliDeviceInfo info;
  EXPECT_TRUE(Error::isError(DaliIdentityResolver::parseBank0(data, info), DaliCommError::domain(), DaliCommErrorIdentityReadFailed));
}


TEST(DaliBank0Tests, RequiresBytesUpToAdvertisedLastLocation)
{
  SimDaliGear g(7611234567890ll, 4711, 0);
  std::vector<uint8_t> data = g.bank0;
  data.resize(DALIMEM_BANK0_HW_VERSION+2);
  DaliDeviceInfo info;
  EXPECT_TRUE(Error::isError(DaliIdentityResolver::parseBank0(data, info), DaliCommError::domain(), DaliCommErrorIdentityReadFailed));
}


TEST(DaliBank0Tests, RejectsRepetitiveContents)
{
  SimDaliGear g(7611234567890ll, 4711, 0);
  for (int i=DALIMEM_BANK0_GTIN; i<=DALIMEM_BANK0_GTIN+10; i++) g.bank0[i] = 0x55;
  DaliDeviceInfo info;
  EXPECT_TRUE(Error::isError(DaliIdentityResolver::parseBank0(g.bank0, info), DaliCommError::domain(), DaliCommErrorIdentityReadFailed));
  // ten identical bytes are still acceptable
  g.bank0[DALIMEM_BANK0_GTIN] = 0x01;
  EXPECT_TRUE(Error::isOK(DaliIdentityResolver::parseBank0(g.bank0, info)));
}


TEST(DaliBank0Tests, LeadingZerosCountFromFirstByte)
{
  SimDaliGear g(7611234567890ll, 0x0102030405060708ull, 0);
  for (int i=DALIMEM_BANK0_GTIN; i<DALIMEM_BANK0_GTIN+10; i++) g.bank0[i] = 0x00;
  DaliDeviceInfo info;
  EXPECT_TRUE(Error::isOK(DaliIdentityResolver::parseBank0(g.bank0, info)));
  g.bank0[DALIMEM_BANK0_GTIN+10] = 0x00;
  EXPECT_TRUE(Error::isError(DaliIdentityResolver::parseBank0(g.bank0, info), DaliCommError::domain(), DaliCommErrorIdentityReadFailed));
}


TEST(DaliBank0Tests, IgnoresBytesBeyondLastLocation)
{
  SimDaliGear g(7611234567890ll, 4711, 0);
  g.bank0[DALIMEM_BANK0_LAST_LOCATION] = DALIMEM_BANK0_HW_VERSION+1;
  g.bank0[DALIMEM_BANK0_GEAR_UNIT_INDEX] = 3;
  DaliDeviceInfo info;
  ASSERT_TRUE(Error::isOK(DaliIdentityResolver::parseBank0(g.bank0, info)));
  EXPECT_EQ(info.hw_version_major, 1);
  EXPECT_EQ(info.endpointIndex, 0);
  EXPECT_EQ(info.logicalGearUnits, 0);
}
