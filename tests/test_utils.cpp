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

#include "mainloop.hpp"
#include "fdcomm.hpp"
#include "utils.hpp"

#include <errno.h>
#include <unistd.h>
#include <sys/socket.h>

using namespace dalimaster;


TEST(UtilsTests, StringFormat)
{
  EXPECT_EQ(string_format("%d-%s-%02X", 42, "abc", 10), "42-abc-0A");
  string s = "x";
  string_format_append(s, "%d", 7);
  EXPECT_EQ(s, "x7");
  // longer than any internal buffer
  string longStr(500, 'y');
  EXPECT_EQ(string_format("%s!", longStr.c_str()).size(), 501u);
  EXPECT_STREQ(nonNullCStr(NULL), "");
}


TEST(UtilsTests, KeyAndValue)
{
  string key, value;
  EXPECT_TRUE(keyAndValue("  level : 100 ", key, value));
  EXPECT_EQ(key, "level");
  EXPECT_EQ(value, "100 ");
  EXPECT_TRUE(keyAndValue("7611234567890-0000000000001001-0=42", key, value, '='));
  EXPECT_EQ(key, "7611234567890-0000000000001001-0");
  EXPECT_EQ(value, "42");
  EXPECT_FALSE(keyAndValue("=42", key, value, '='));
  EXPECT_FALSE(keyAndValue("novalue", key, value, '='));
}


TEST(UtilsTests, TextHelpers)
{
  EXPECT_EQ(trimWhiteSpace("  a b \t"), "a b");
  EXPECT_EQ(trimWhiteSpace("  a ", false, true), "  a");
  const char *text = "one\ntwo\r\nthree";
  string line;
  int lines = 0;
  while (nextLine(text, line)) lines++;
  EXPECT_EQ(lines, 3);
  EXPECT_EQ(line, "three");
  uint8_t data[] = { 0x12, 0x00, 0xAB };
  EXPECT_EQ(dataToHexString(data, 3), "12 00 AB");
  EXPECT_EQ(dataToHexString(data, 3, 0), "1200AB");
}


TEST(ErrorTests, OkAndErrors)
{
  ErrorPtr err;
  EXPECT_TRUE(Error::isOK(err));
  EXPECT_EQ(Error::text(err), "OK");
  err = TextError::err("bus %d gone", 3);
  EXPECT_FALSE(Error::isOK(err));
  EXPECT_TRUE(err->isDomain(TextError::domain()));
  EXPECT_TRUE(Error::isError(err, TextError::domain(), ErrorNotOK));
  EXPECT_FALSE(Error::isError(err, SysError::domain(), ErrorNotOK));
  EXPECT_EQ(err->description(), "bus 3 gone (TextError:1)");
  EXPECT_FALSE(Error::isError(ErrorPtr(), TextError::domain(), ErrorNotOK));
}


TEST(ErrorTests, SysErrorFromErrno)
{
  EXPECT_TRUE(SysError::err(0).get()==NULL);
  ErrorPtr err = SysError::err(ENOENT, "opening device: ");
  ASSERT_TRUE(err.get()!=NULL);
  EXPECT_EQ(err->getErrorCode(), ENOENT);
  EXPECT_TRUE(err->isDomain(SysError::domain()));
  EXPECT_EQ(string(err->getErrorMessage()).find("opening device: "), 0u);
  errno = EACCES;
  err = SysError::errNo();
  ASSERT_TRUE(err.get()!=NULL);
  EXPECT_EQ(err->getErrorCode(), EACCES);
}


class MainLoopTests : public ::testing::Test
{
public:

  MainLoop &mainLoop;
  std::vector<int> calls;

  MainLoopTests() : mainLoop(MainLoop::currentMainLoop()) {};

  virtual void TearDown()
  {
    mainLoop.cancelExecutionsFrom(NULL);
  }

  void called(int aWhich)
  {
    calls.push_back(aWhich);
  }

  void stop(int aExitCode)
  {
    mainLoop.terminate(aExitCode);
  }

  void scheduleFollowUp()
  {
    calls.push_back(1);
    mainLoop.executeOnce(boost::bind(&MainLoopTests::called, this, 3));
  }

  void packetReady(FdCommPtr aFdComm, ErrorPtr aError)
  {
    ASSERT_TRUE(Error::isOK(aError));
    uint8_t buf[16];
    ErrorPtr err;
    size_t n = aFdComm->receiveBytes(0, sizeof(buf), buf, err);
    EXPECT_TRUE(Error::isOK(err));
    calls.push_back((int)n);
    mainLoop.terminate(EXIT_SUCCESS);
  }

};


TEST_F(MainLoopTests, ExecutesInTimeOrder)
{
  MLMicroSeconds start = MainLoop::now();
  mainLoop.executeOnce(boost::bind(&MainLoopTests::called, this, 2), 20*MilliSecond);
  mainLoop.executeOnce(boost::bind(&MainLoopTests::called, this, 1), 10*MilliSecond);
  mainLoop.executeOnce(boost::bind(&MainLoopTests::called, this, 3), 20*MilliSecond);
  mainLoop.executeOnce(boost::bind(&MainLoopTests::stop, this, 7), 30*MilliSecond);
  EXPECT_EQ(mainLoop.run(), 7);
  ASSERT_EQ(calls.size(), 3u);
  EXPECT_EQ(calls[0], 1);
  EXPECT_EQ(calls[1], 2);
  EXPECT_EQ(calls[2], 3);
  EXPECT_GE(MainLoop::now()-start, 30*MilliSecond);
}


TEST_F(MainLoopTests, CancelsByTicketAndSubmitter)
{
  long t = mainLoop.executeOnce(boost::bind(&MainLoopTests::called, this, 1), 5*MilliSecond);
  mainLoop.executeOnce(boost::bind(&MainLoopTests::called, this, 2), 5*MilliSecond, this);
  mainLoop.executeOnce(boost::bind(&MainLoopTests::called, this, 3), 5*MilliSecond);
  mainLoop.executeOnce(boost::bind(&MainLoopTests::stop, this, EXIT_SUCCESS), 20*MilliSecond);
  mainLoop.cancelExecutionTicket(t);
  EXPECT_EQ(t, 0);
  mainLoop.cancelExecutionsFrom(this);
  EXPECT_EQ(mainLoop.run(), EXIT_SUCCESS);
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0], 3);
}


TEST_F(MainLoopTests, SameTimeRunsInSubmissionOrder)
{
  MLMicroSeconds t = MainLoop::now()+5*MilliSecond;
  mainLoop.executeOnceAt(boost::bind(&MainLoopTests::called, this, 1), t);
  mainLoop.executeOnceAt(boost::bind(&MainLoopTests::called, this, 2), t);
  mainLoop.executeOnceAt(boost::bind(&MainLoopTests::called, this, 3), t);
  mainLoop.executeOnceAt(boost::bind(&MainLoopTests::stop, this, EXIT_SUCCESS), t+5*MilliSecond);
  EXPECT_EQ(mainLoop.run(), EXIT_SUCCESS);
  ASSERT_EQ(calls.size(), 3u);
  EXPECT_EQ(calls[0], 1);
  EXPECT_EQ(calls[1], 2);
  EXPECT_EQ(calls[2], 3);
}


TEST_F(MainLoopTests, HandlerScheduledFromHandlerRunsAfterDueOnes)
{
  MLMicroSeconds t = MainLoop::now()+5*MilliSecond;
  mainLoop.executeOnceAt(boost::bind(&MainLoopTests::scheduleFollowUp, this), t);
  mainLoop.executeOnceAt(boost::bind(&MainLoopTests::called, this, 2), t);
  mainLoop.executeOnce(boost::bind(&MainLoopTests::stop, this, EXIT_SUCCESS), 20*MilliSecond);
  EXPECT_EQ(mainLoop.run(), EXIT_SUCCESS);
  ASSERT_EQ(calls.size(), 3u);
  EXPECT_EQ(calls[1], 2);
  EXPECT_EQ(calls[2], 3);
}


TEST_F(MainLoopTests, FdCommTransfersPackets)
{
  int fds[2];
  ASSERT_EQ(socketpair(AF_UNIX, SOCK_SEQPACKET, 0, fds), 0);
  FdCommPtr fdComm = FdCommPtr(new FdComm(mainLoop));
  fdComm->setFd(fds[0]);
  // outgoing packet
  const uint8_t out[3] = { 0x12, 0x34, 0x56 };
  ErrorPtr err;
  EXPECT_EQ(fdComm->transmitBytes(3, out, err), 3u);
  EXPECT_TRUE(Error::isOK(err));
  uint8_t peerBuf[16];
  EXPECT_EQ(read(fds[1], peerBuf, sizeof(peerBuf)), 3);
  // incoming packet delivered through the mainloop
  fdComm->setReceiveHandler(boost::bind(&MainLoopTests::packetReady, this, fdComm, _1));
  const uint8_t in[2] = { 0xAB, 0xCD };
  ASSERT_EQ(write(fds[1], in, 2), 2);
  mainLoop.executeOnce(boost::bind(&MainLoopTests::stop, this, EXIT_FAILURE), 1*Second);
  EXPECT_EQ(mainLoop.run(), EXIT_SUCCESS);
  ASSERT_EQ(calls.size(), 1u);
  EXPECT_EQ(calls[0], 2);
  fdComm->setReceiveHandler(FdCommCB());
  // nothing pending: timeout without error
  EXPECT_EQ(fdComm->receiveBytes(10*MilliSecond, sizeof(peerBuf), peerBuf, err), 0u);
  EXPECT_TRUE(Error::isOK(err));
  // peer gone
  close(fds[1]);
  fdComm->receiveBytes(10*MilliSecond, sizeof(peerBuf), peerBuf, err);
  EXPECT_TRUE(Error::isError(err, SysError::domain(), ENODEV));
  fdComm->stopMonitoringAndClose();
  EXPECT_EQ(fdComm->getFd(), -1);
  fdComm->transmitBytes(3, out, err);
  EXPECT_TRUE(Error::isError(err, SysError::domain(), EBADF));
}
