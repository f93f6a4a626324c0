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

#include <gtest/gtest.h>

#include "daliframe.hpp"

using namespace dalimaster;

namespace {

  uint32_t encoded(const DaliCommand &aCommand)
  {
    DaliFrame f;
    ErrorPtr err = DaliCodec::encode(aCommand, f);
    EXPECT_TRUE(Error::isOK(err)) << aCommand.description();
    return f.getData();
  }

  bool rejected(const DaliCommand &aCommand)
  {
    DaliFrame f;
    return Error::isError(DaliCodec::encode(aCommand, f), DaliCommError::domain(), DaliCommErrorInvalidCommand);
  }

  DaliByteVector inReport(uint8_t aSource, uint8_t aType, uint8_t aB3, uint8_t aB4, uint8_t aB5, uint8_t aSeq)
  {
    DaliByteVector r(DALIADAPTER_INREPORT_SIZE, 0);
    r[0] = aSource; r[1] = aType; r[3] = aB3; r[4] = aB4; r[5] = aB5; r[8] = aSeq;
    return r;
  }

} // namespace


TEST(DaliCodecTests, EncodesDirectArcPower)
{
  EXPECT_EQ(encoded(DaliCommand::directArcPower(5, 0x80)), 0x0A80u);
  EXPECT_EQ(encoded(DaliCommand::directArcPower(DaliGroup+2, 0)), 0x8400u);
  EXPECT_EQ(encoded(DaliCommand::directArcPower(DaliBroadcast, 254)), 0xFEFEu);
  EXPECT_EQ(encoded(DaliCommand::directArcPower(DaliBroadcastUnaddressed, 1)), 0xFC01u);
}


TEST(DaliCodecTests, EncodesAddressedCommands)
{
  EXPECT_EQ(encoded(DaliCommand::addressed(63, DALICMD_QUERY_STATUS)), 0x7F90u);
  EXPECT_EQ(encoded(DaliCommand::addressed(DaliGroup+3, DALICMD_OFF)), 0x8700u);
  EXPECT_EQ(encoded(DaliCommand::addressed(DaliBroadcast, DALICMD_RECALL_MAX_LEVEL)), 0xFF05u);
  EXPECT_EQ(encoded(DaliCommand::addressed(DaliBroadcastUnaddressed, DALICMD_QUERY_CONTROL_GEAR)), 0xFD91u);
  EXPECT_EQ(encoded(DaliCommand::addressed(0, DALICMD_QUERY_EXTENDED_VERSION_NUMBER)), 0x01FFu);
}


TEST(DaliCodecTests, EncodesSpecialCommands)
{
  EXPECT_EQ(encoded(DaliCommand::special(DALICMD_INITIALISE, DALIINIT_UNADDRESSED)), 0xA5FFu);
  EXPECT_EQ(encoded(DaliCommand::special(DALICMD_SEARCHADDRM, 0x12)), 0xB312u);
  EXPECT_EQ(encoded(DaliCommand::special(DALICMD_SET_DTR1, 0)), 0xC300u);
  DaliFrame f;
  ASSERT_TRUE(Error::isOK(DaliCodec::encode(DaliCommand::extended(DALI24_START_QUIESCENT_MODE, true, true), f)));
  EXPECT_EQ(f.getBits(), 24);
  EXPECT_EQ(f.getData(), 0xFFFE1Du);
}


TEST(DaliCodecTests, RejectsInvalidCommands)
{
  EXPECT_TRUE(rejected(DaliCommand::addressed(64, DALICMD_OFF)));
  EXPECT_TRUE(rejected(DaliCommand::directArcPower(DaliGroup+16, 100)));
  EXPECT_TRUE(rejected(DaliCommand::addressed(3, 0x0D))); // reserved
  EXPECT_TRUE(rejected(DaliCommand::addressed(3, 0xC6))); // reserved
  EXPECT_TRUE(rejected(DaliCommand::special(0xA0, 0)));
  EXPECT_TRUE(rejected(DaliCommand::special(0xCB, 0)));
  EXPECT_TRUE(rejected(DaliCommand::extended(0x1000000)));
  EXPECT_FALSE(rejected(DaliCommand::addressed(DaliGroup+15, DALICMD_GO_TO_SCENE+15)));
  EXPECT_FALSE(rejected(DaliCommand::addressed(3, DALICMD_CONTINUOUS_UP)));
  EXPECT_FALSE(rejected(DaliCommand::addressed(DaliBroadcast, DALICMD_CONTINUOUS_DOWN)));
}


TEST(DaliCodecTests, ClassifiesReplyKinds)
{
  EXPECT_EQ(DaliCommand::addressed(1, DALICMD_OFF).getReplyKind(), DaliCommand::reply_none);
  EXPECT_EQ(DaliCommand::addressed(1, DALICMD_QUERY_CONTROL_GEAR).getReplyKind(), DaliCommand::reply_yesNo);
  EXPECT_EQ(DaliCommand::addressed(1, DALICMD_QUERY_MISSING_SHORT_ADDRESS).getReplyKind(), DaliCommand::reply_yesNo);
  EXPECT_EQ(DaliCommand::addressed(1, DALICMD_QUERY_POWER_FAILURE).getReplyKind(), DaliCommand::reply_yesNo);
  EXPECT_EQ(DaliCommand::addressed(1, DALICMD_QUERY_STATUS).getReplyKind(), DaliCommand::reply_value);
  EXPECT_EQ(DaliCommand::addressed(1, DALICMD_QUERY_ACTUAL_LEVEL).getReplyKind(), DaliCommand::reply_value);
  EXPECT_EQ(DaliCommand::addressed(1, DALICMD_READ_MEMORY_LOCATION).getReplyKind(), DaliCommand::reply_value);
  EXPECT_EQ(DaliCommand::special(DALICMD_COMPARE).getReplyKind(), DaliCommand::reply_yesNo);
  EXPECT_EQ(DaliCommand::special(DALICMD_VERIFY_SHORT_ADDRESS, 0x03).getReplyKind(), DaliCommand::reply_yesNo);
  EXPECT_EQ(DaliCommand::special(DALICMD_QUERY_SHORT_ADDRESS).getReplyKind(), DaliCommand::reply_value);
  EXPECT_EQ(DaliCommand::special(DALICMD_WITHDRAW).getReplyKind(), DaliCommand::reply_none);
  EXPECT_FALSE(DaliCommand::special(DALICMD_WITHDRAW).expectsReply());
  EXPECT_TRUE(DaliCommand::special(DALICMD_COMPARE).expectsReply());
}


TEST(DaliCodecTests, MarksRepeatRequiredCommands)
{
  EXPECT_TRUE(DaliCommand::addressed(1, DALICMD_RESET).needsRepeat());
  EXPECT_TRUE(DaliCommand::addressed(1, DALICMD_ADD_TO_GROUP+4).needsRepeat());
  EXPECT_TRUE(DaliCommand::addressed(1, DALICMD_STORE_DTR_AS_SHORT_ADDRESS).needsRepeat());
  EXPECT_TRUE(DaliCommand::addressed(1, DALICMD_ENABLE_WRITE_MEMORY).needsRepeat());
  EXPECT_FALSE(DaliCommand::addressed(1, DALICMD_GO_TO_SCENE).needsRepeat());
  EXPECT_FALSE(DaliCommand::addressed(1, DALICMD_QUERY_STATUS).needsRepeat());
  EXPECT_TRUE(DaliCommand::special(DALICMD_INITIALISE, 0).needsRepeat());
  EXPECT_TRUE(DaliCommand::special(DALICMD_RANDOMISE).needsRepeat());
  EXPECT_FALSE(DaliCommand::special(DALICMD_COMPARE).needsRepeat());
  EXPECT_FALSE(DaliCommand::special(DALICMD_PROGRAM_SHORT_ADDRESS, 0x01).needsRepeat());
}


TEST(DaliCodecTests, DecodesBackwardFrames)
{
  DaliFrame f;
  DaliByteVector bytes;
  ASSERT_TRUE(Error::isOK(DaliCodec::decodeBackward(bytes, f)));
  EXPECT_EQ(f.getType(), DaliFrame::frame_noReply);
  bytes.push_back(0x42);
  ASSERT_TRUE(Error::isOK(DaliCodec::decodeBackward(bytes, f)));
  EXPECT_EQ(f.getType(), DaliFrame::frame_backward);
  EXPECT_EQ(f.getValue(), 0x42);
  bytes.push_back(0x43);
  EXPECT_TRUE(Error::isError(DaliCodec::decodeBackward(bytes, f), DaliCommError::domain(), DaliCommErrorMalformedFrame));
}


TEST(DaliCodecTests, ClassifiesForwardFrames)
{
  DaliFrame f = DaliCodec::decodeForward(0x0B90, 16);
  EXPECT_EQ(f.addressType(), DaliFrame::addr_short);
  EXPECT_EQ(f.address(), 5);
  EXPECT_TRUE(f.isCommand());
  EXPECT_EQ(f.opcodeByte(), DALICMD_QUERY_STATUS);
  f = DaliCodec::decodeForward(0x8680, 16);
  EXPECT_EQ(f.addressType(), DaliFrame::addr_group);
  EXPECT_EQ(f.address(), DaliGroup+3);
  EXPECT_FALSE(f.isCommand());
  EXPECT_EQ(DaliCodec::decodeForward(0xFF00, 16).addressType(), DaliFrame::addr_broadcast);
  EXPECT_EQ(DaliCodec::decodeForward(0xFD00, 16).addressType(), DaliFrame::addr_broadcastUnaddressed);
  EXPECT_EQ(DaliCodec::decodeForward(0xA900, 16).addressType(), DaliFrame::addr_special);
  EXPECT_EQ(DaliCodec::decodeForward(0xCD00, 16).addressType(), DaliFrame::addr_reserved);
  EXPECT_EQ(DaliCodec::decodeForward(0xFFFE1D, 24).addressType(), DaliFrame::addr_extended24);
}


TEST(DaliCodecTests, ForwardFrameAffectsAddressedGear)
{
  DaliFrame f = DaliCodec::decodeForward(0x0B05, 16); // short 5
  EXPECT_TRUE(f.affects(5, 0));
  EXPECT_FALSE(f.affects(6, 0));
  f = DaliCodec::decodeForward(0x8700, 16); // group 3
  EXPECT_TRUE(f.affects(9, 1<<3));
  EXPECT_FALSE(f.affects(9, 1<<4));
  f = DaliCodec::decodeForward(0xFF00, 16);
  EXPECT_TRUE(f.affects(63, 0));
  f = DaliCodec::decodeForward(0xFD00, 16);
  EXPECT_FALSE(f.affects(2, 0));
  EXPECT_TRUE(f.affects(DaliBroadcast, 0));
  EXPECT_FALSE(DaliCodec::decodeForward(0xA900, 16).affects(5, 0xFFFF));
}


TEST(DaliCodecTests, ConvertsAddressBytes)
{
  EXPECT_EQ(DaliCodec::dali1FromAddress(7), 0x0E);
  EXPECT_EQ(DaliCodec::dali1FromAddress(DaliGroup+15), 0x9E);
  EXPECT_EQ(DaliCodec::addressFromDaliResponse(0x0F), 7);
  EXPECT_EQ(DaliCodec::addressFromDaliResponse(0x9F), DaliGroup+15);
  EXPECT_EQ(DaliCodec::addressFromDaliResponse(0xFF), DaliBroadcast);
}


TEST(DaliAdapterReportTests, EncodesOutputReports)
{
  DaliByteVector r;
  DaliCodec::encodeAdapterReport(DaliFrame::forward(0x0B90, 16), 0x2A, false, r);
  ASSERT_EQ(r.size(), (size_t)DALIADAPTER_OUTREPORT_SIZE);
  EXPECT_EQ(r[0], 0x12);
  EXPECT_EQ(r[1], 0x2A);
  EXPECT_EQ(r[3], 0x03);
  EXPECT_EQ(r[5], 0x00);
  EXPECT_EQ(r[6], 0x0B);
  EXPECT_EQ(r[7], 0x90);
  DaliCodec::encodeAdapterReport(DaliFrame::forward(0xFFFE1D, 24), 1, false, r);
  EXPECT_EQ(r[3], 0x04);
  EXPECT_EQ(r[5], 0xFF);
  EXPECT_EQ(r[6], 0xFE);
  EXPECT_EQ(r[7], 0x1D);
  DaliCodec::encodeAdapterReport(DaliFrame::forward(0xFFFE1D, 24), 1, true, r);
  EXPECT_EQ(r[3], 0x06);
}


TEST(DaliAdapterReportTests, DecodesInputReports)
{
  DaliAdapterReport rep;
  ASSERT_TRUE(Error::isOK(DaliCodec::decodeAdapterReport(inReport(0x12, 0x72, 0, 0, 0x55, 7), rep)));
  EXPECT_EQ(rep.source, adapterSource_self);
  EXPECT_EQ(rep.type, adapterReport_response);
  EXPECT_EQ(rep.seq, 7);
  EXPECT_EQ(rep.frame.getType(), DaliFrame::frame_backward);
  EXPECT_EQ(rep.frame.getValue(), 0x55);

  ASSERT_TRUE(Error::isOK(DaliCodec::decodeAdapterReport(inReport(0x12, 0x71, 0, 0, 0, 8), rep)));
  EXPECT_EQ(rep.frame.getType(), DaliFrame::frame_noReply);

  ASSERT_TRUE(Error::isOK(DaliCodec::decodeAdapterReport(inReport(0x12, 0x77, 0, 0, 0, 9), rep)));
  EXPECT_EQ(rep.frame.getType(), DaliFrame::frame_framingError);

  ASSERT_TRUE(Error::isOK(DaliCodec::decodeAdapterReport(inReport(0x12, 0x73, 0, 0xA3, 0x10, 10), rep)));
  EXPECT_EQ(rep.type, adapterReport_txComplete);
  EXPECT_EQ(rep.frame.getBits(), 16);
  EXPECT_EQ(rep.frame.getData(), 0xA310u);

  ASSERT_TRUE(Error::isOK(DaliCodec::decodeAdapterReport(inReport(0x11, 0x74, 0xFF, 0xFE, 0x1D, 0), rep)));
  EXPECT_EQ(rep.source, adapterSource_external);
  EXPECT_EQ(rep.type, adapterReport_frameReceived);
  EXPECT_EQ(rep.frame.getBits(), 24);
  EXPECT_EQ(rep.frame.getData(), 0xFFFE1Du);
}


TEST(DaliAdapterReportTests, RejectsMalformedReports)
{
  DaliAdapterReport rep;
  DaliByteVector shortReport(5, 0x12);
  EXPECT_TRUE(Error::isError(DaliCodec::decodeAdapterReport(shortReport, rep), DaliCommError::domain(), DaliCommErrorMalformedFrame));
  EXPECT_TRUE(Error::isError(DaliCodec::decodeAdapterReport(inReport(0x13, 0x72, 0, 0, 1, 1), rep), DaliCommError::domain(), DaliCommErrorMalformedFrame));
  EXPECT_TRUE(Error::isError(DaliCodec::decodeAdapterReport(inReport(0x12, 0x70, 0, 0, 1, 1), rep), DaliCommError::domain(), DaliCommErrorMalformedFrame));
}
