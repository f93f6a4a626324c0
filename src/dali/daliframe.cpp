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

#include "daliframe.hpp"

using namespace dalimaster;


#pragma mark - DaliCommand

DaliCommand::DaliCommand(CommandKind aKind) :
  kind(aKind),
  address(DaliBroadcast),
  opcode(0),
  data(0),
  frame24(0),
  replyKind(reply_none),
  repeat(false),
  da24Config(false),
  valid(false)
{
}


DaliCommand DaliCommand::directArcPower(DaliAddress aAddress, uint8_t aLevel)
{
  DaliCommand cmd(cmd_directArcPower);
  cmd.address = aAddress;
  cmd.data = aLevel;
  cmd.valid = DaliCodec::isValidAddress(aAddress);
  return cmd;
}


DaliCommand DaliCommand::addressed(DaliAddress aAddress, uint8_t aOpcode)
{
  DaliCommand cmd(cmd_addressed);
  cmd.address = aAddress;
  cmd.opcode = aOpcode;
  cmd.replyKind = DaliCodec::replyKindForOpcode(aOpcode);
  cmd.repeat = DaliCodec::opcodeNeedsRepeat(aOpcode);
  cmd.valid = DaliCodec::isValidAddress(aAddress) && DaliCodec::isKnownOpcode(aOpcode);
  return cmd;
}


DaliCommand DaliCommand::special(uint8_t aOpcode, uint8_t aData)
{
  DaliCommand cmd(cmd_special);
  cmd.opcode = aOpcode;
  cmd.data = aData;
  cmd.replyKind = DaliCodec::replyKindForSpecialOpcode(aOpcode);
  cmd.repeat = DaliCodec::specialOpcodeNeedsRepeat(aOpcode);
  cmd.valid = DaliCodec::isKnownSpecialOpcode(aOpcode);
  return cmd;
}


DaliCommand DaliCommand::extended(uint32_t aFrame, bool aSendTwice, bool aDA24Config)
{
  DaliCommand cmd(cmd_extended24);
  cmd.frame24 = aFrame;
  cmd.repeat = aSendTwice;
  cmd.da24Config = aDA24Config;
  cmd.valid = aFrame<=0xFFFFFF;
  return cmd;
}


string DaliCommand::description() const
{
  string s;
  switch (kind) {
    case cmd_directArcPower:
      s = string_format("DAPC %s level=%d", daliAddressText(address).c_str(), data);
      break;
    case cmd_addressed:
      s = string_format("CMD 0x%02X to %s", opcode, daliAddressText(address).c_str());
      break;
    case cmd_special: {
      const char *name = DaliCodec::specialOpcodeName(opcode);
      s = name ? string_format("%s data=0x%02X", name, data) : string_format("special 0x%02X data=0x%02X", opcode, data);
      break;
    }
    case cmd_extended24:
      s = string_format("24bit 0x%06X", frame24);
      if (da24Config) s += " (DA24)";
      break;
  }
  if (repeat) s += " (twice)";
  if (replyKind==reply_yesNo) s += " -> yes/no";
  else if (replyKind==reply_value) s += " -> value";
  return s;
}


#pragma mark - DaliFrame

DaliFrame::DaliFrame() :
  type(frame_none),
  bits(0),
  data(0)
{
}


DaliFrame DaliFrame::forward(uint32_t aData, uint8_t aBits)
{
  DaliFrame f;
  f.type = frame_forward;
  f.bits = aBits;
  f.data = aBits>=24 ? aData & 0xFFFFFF : aData & 0xFFFF;
  return f;
}


DaliFrame DaliFrame::backward(uint8_t aValue)
{
  DaliFrame f;
  f.type = frame_backward;
  f.bits = 8;
  f.data = aValue;
  return f;
}


DaliFrame DaliFrame::noReply()
{
  DaliFrame f;
  f.type = frame_noReply;
  return f;
}


DaliFrame DaliFrame::framingError()
{
  DaliFrame f;
  f.type = frame_framingError;
  return f;
}


DaliFrame::AddressType DaliFrame::addressType() const
{
  if (bits==24) return addr_extended24;
  uint8_t a = addressByte();
  if ((a & 0x80)==0) return addr_short; // 0AAAAAAS
  if ((a & 0xE0)==0x80) return addr_group; // 100AAAAS
  if (a==0xFC || a==0xFD) return addr_broadcastUnaddressed;
  if (a==0xFE || a==0xFF) return addr_broadcast;
  if (a>=0xA0 && a<=0xCB) return addr_special;
  return addr_reserved;
}


DaliAddress DaliFrame::address() const
{
  uint8_t a = addressByte();
  switch (addressType()) {
    case addr_short: return (a>>1) & DaliAddressMask;
    case addr_group: return ((a>>1) & DaliGroupMask) | DaliGroup;
    case addr_broadcastUnaddressed: return DaliBroadcastUnaddressed;
    default: return DaliBroadcast;
  }
}


bool DaliFrame::isCommand() const
{
  AddressType at = addressType();
  if (at==addr_special || at==addr_extended24 || at==addr_reserved) return true;
  return (addressByte() & 0x01)!=0;
}


bool DaliFrame::affects(DaliAddress aShortAddress, uint16_t aGroupMask) const
{
  if (type!=frame_forward) return false;
  switch (addressType()) {
    case addr_short: return address()==aShortAddress;
    case addr_group: return (aGroupMask & (1<<(address() & DaliGroupMask)))!=0;
    case addr_broadcast: return true;
    case addr_broadcastUnaddressed: return aShortAddress==DaliBroadcast; // only devices without short address
    default: return false;
  }
}


string DaliFrame::description() const
{
  switch (type) {
    case frame_forward: {
      if (bits==24) return string_format("forward 24bit 0x%06X", data);
      AddressType at = addressType();
      if (at==addr_special) {
        const char *name = DaliCodec::specialOpcodeName(addressByte());
        if (name) return string_format("forward %s data=0x%02X", name, opcodeByte());
        return string_format("forward special 0x%02X data=0x%02X", addressByte(), opcodeByte());
      }
      if (at==addr_reserved) {
        return string_format("forward reserved 0x%04X", data);
      }
      return string_format(
        "forward %s %s 0x%02X",
        daliAddressText(address()).c_str(),
        isCommand() ? "cmd" : "level",
        opcodeByte()
      );
    }
    case frame_backward: return string_format("backward 0x%02X", getValue());
    case frame_noReply: return "no reply";
    case frame_framingError: return "framing error";
    default: return "none";
  }
}


#pragma mark - DaliCodec opcode table

bool DaliCodec::isValidAddress(DaliAddress aAddress)
{
  if (aAddress==DaliBroadcast || aAddress==DaliBroadcastUnaddressed) return true;
  if (aAddress & DaliGroup) return (aAddress & ~(DaliGroup|DaliGroupMask))==0;
  return aAddress<=DaliAddressMask;
}


bool DaliCodec::isKnownOpcode(uint8_t aOpcode)
{
  if (aOpcode<=DALICMD_CONTINUOUS_DOWN) return true; // arc power commands
  if (aOpcode>=DALICMD_GO_TO_SCENE && aOpcode<DALICMD_GO_TO_SCENE+DALI_MAXSCENES) return true;
  if (aOpcode>=DALICMD_RESET && aOpcode<=DALICMD_IDENTIFY_DEVICE) return true;
  if (aOpcode>=DALICMD_STORE_DTR_AS_MAX_LEVEL && aOpcode<=DALICMD_STORE_DTR_AS_EXT_FADE_TIME) return true;
  if (aOpcode>=DALICMD_STORE_DTR_AS_SCENE && aOpcode<=DALICMD_ENABLE_WRITE_MEMORY) return true; // scenes, groups, short address, write enable
  if (aOpcode>=DALICMD_QUERY_STATUS && aOpcode<=DALICMD_QUERY_EXTENDED_FADE_TIME) return true;
  if (aOpcode==DALICMD_QUERY_CONTROL_GEAR_FAILURE) return true;
  if (aOpcode>=DALICMD_QUERY_SCENE_LEVEL && aOpcode<=DALICMD_READ_MEMORY_LOCATION) return true; // scene levels, groups, random address, memory
  if (aOpcode==DALICMD_QUERY_EXTENDED_VERSION_NUMBER) return true;
  return false;
}


DaliCommand::ReplyKind DaliCodec::replyKindForOpcode(uint8_t aOpcode)
{
  if (aOpcode>=DALICMD_QUERY_CONTROL_GEAR && aOpcode<=DALICMD_QUERY_MISSING_SHORT_ADDRESS) return DaliCommand::reply_yesNo;
  if (
    aOpcode==DALICMD_QUERY_POWER_FAILURE ||
    aOpcode==DALICMD_QUERY_MANUFACTURER_SPECIFIC_MODE ||
    aOpcode==DALICMD_QUERY_CONTROL_GEAR_FAILURE
  ) return DaliCommand::reply_yesNo;
  if (aOpcode>=DALICMD_FIRST_QUERY && aOpcode<=DALICMD_LAST_QUERY) return DaliCommand::reply_value;
  if (aOpcode==DALICMD_QUERY_EXTENDED_VERSION_NUMBER) return DaliCommand::reply_value;
  return DaliCommand::reply_none;
}


bool DaliCodec::opcodeNeedsRepeat(uint8_t aOpcode)
{
  return aOpcode>=DALICMD_FIRST_CONFIG_COMMAND && aOpcode<=DALICMD_LAST_CONFIG_COMMAND;
}


bool DaliCodec::isKnownSpecialOpcode(uint8_t aSpecialOpcode)
{
  return specialOpcodeName(aSpecialOpcode)!=NULL;
}


DaliCommand::ReplyKind DaliCodec::replyKindForSpecialOpcode(uint8_t aSpecialOpcode)
{
  switch (aSpecialOpcode) {
    case DALICMD_COMPARE:
    case DALICMD_VERIFY_SHORT_ADDRESS:
      return DaliCommand::reply_yesNo;
    case DALICMD_QUERY_SHORT_ADDRESS:
    case DALICMD_WRITE_MEMORY_LOCATION:
      return DaliCommand::reply_value;
    default:
      return DaliCommand::reply_none;
  }
}


bool DaliCodec::specialOpcodeNeedsRepeat(uint8_t aSpecialOpcode)
{
  return aSpecialOpcode==DALICMD_INITIALISE || aSpecialOpcode==DALICMD_RANDOMISE;
}


const char *DaliCodec::specialOpcodeName(uint8_t aSpecialOpcode)
{
  switch (aSpecialOpcode) {
    case DALICMD_TERMINATE: return "TERMINATE";
    case DALICMD_SET_DTR: return "SET_DTR";
    case DALICMD_INITIALISE: return "INITIALISE";
    case DALICMD_RANDOMISE: return "RANDOMISE";
    case DALICMD_COMPARE: return "COMPARE";
    case DALICMD_WITHDRAW: return "WITHDRAW";
    case DALICMD_PING: return "PING";
    case DALICMD_SEARCHADDRH: return "SEARCHADDRH";
    case DALICMD_SEARCHADDRM: return "SEARCHADDRM";
    case DALICMD_SEARCHADDRL: return "SEARCHADDRL";
    case DALICMD_PROGRAM_SHORT_ADDRESS: return "PROGRAM_SHORT_ADDRESS";
    case DALICMD_VERIFY_SHORT_ADDRESS: return "VERIFY_SHORT_ADDRESS";
    case DALICMD_QUERY_SHORT_ADDRESS: return "QUERY_SHORT_ADDRESS";
    case DALICMD_PHYSICAL_SELECTION: return "PHYSICAL_SELECTION";
    case DALICMD_ENABLE_DEVICE_TYPE: return "ENABLE_DEVICE_TYPE";
    case DALICMD_SET_DTR1: return "SET_DTR1";
    case DALICMD_SET_DTR2: return "SET_DTR2";
    case DALICMD_WRITE_MEMORY_LOCATION: return "WRITE_MEMORY_LOCATION";
    case DALICMD_WRITE_MEMORY_LOCATION_NO_REPLY: return "WRITE_MEMORY_LOCATION_NO_REPLY";
    default: return NULL;
  }
}


#pragma mark - DaliCodec encoding/decoding

uint8_t DaliCodec::dali1FromAddress(DaliAddress aAddress)
{
  if (aAddress==DaliBroadcast) return 0xFE; // broadcast
  if (aAddress==DaliBroadcastUnaddressed) return 0xFC; // broadcast to unaddressed devices
  if (aAddress & DaliGroup) return ((aAddress & DaliGroupMask)<<1) | 0x80; // group address
  return ((aAddress & DaliAddressMask)<<1); // single address
}


DaliAddress DaliCodec::addressFromDaliResponse(uint8_t aResponse)
{
  aResponse &= 0xFE;
  if (aResponse==0xFE) return DaliBroadcast;
  if (aResponse==0xFC) return DaliBroadcastUnaddressed;
  if (aResponse & 0x80) return ((aResponse>>1) & DaliGroupMask) | DaliGroup;
  return (aResponse>>1) & DaliAddressMask;
}


ErrorPtr DaliCodec::encode(const DaliCommand &aCommand, DaliFrame &aFrame)
{
  if (!aCommand.isValid()) {
    return DaliCommError::err(DaliCommErrorInvalidCommand, "cannot encode %s", aCommand.description().c_str());
  }
  switch (aCommand.getKind()) {
    case DaliCommand::cmd_directArcPower:
      aFrame = DaliFrame::forward(((uint32_t)dali1FromAddress(aCommand.getAddress())<<8) | aCommand.getData(), 16);
      break;
    case DaliCommand::cmd_addressed:
      aFrame = DaliFrame::forward(((uint32_t)(dali1FromAddress(aCommand.getAddress())|0x01)<<8) | aCommand.getOpcode(), 16);
      break;
    case DaliCommand::cmd_special:
      aFrame = DaliFrame::forward(((uint32_t)aCommand.getOpcode()<<8) | aCommand.getData(), 16);
      break;
    case DaliCommand::cmd_extended24:
      aFrame = DaliFrame::forward(aCommand.getFrame24(), 24);
      break;
  }
  return ErrorPtr();
}


DaliFrame DaliCodec::decodeForward(uint32_t aData, uint8_t aBits)
{
  return DaliFrame::forward(aData, aBits>16 ? 24 : 16);
}


ErrorPtr DaliCodec::decodeBackward(const DaliByteVector &aBytes, DaliFrame &aFrame)
{
  if (aBytes.size()==0) {
    aFrame = DaliFrame::noReply();
    return ErrorPtr();
  }
  if (aBytes.size()==1) {
    aFrame = DaliFrame::backward(aBytes[0]);
    return ErrorPtr();
  }
  return DaliCommError::err(DaliCommErrorMalformedFrame, "backward frame with %d bytes", (int)aBytes.size());
}


void DaliCodec::encodeAdapterReport(const DaliFrame &aFrame, uint8_t aSeq, bool aDA24Config, DaliByteVector &aReport)
{
  aReport.assign(DALIADAPTER_OUTREPORT_SIZE, 0);
  aReport[0] = adapterSource_self; // send command
  aReport[1] = aSeq;
  aReport[2] = 0; // no adapter-side repeat, repeats are sent explicitly
  if (aDA24Config) aReport[3] = 0x06;
  else if (aFrame.getBits()==24) aReport[3] = 0x04;
  else aReport[3] = 0x03;
  aReport[4] = 0;
  uint32_t d = aFrame.getData();
  aReport[5] = aFrame.getBits()==24 ? (d>>16) & 0xFF : 0;
  aReport[6] = (d>>8) & 0xFF;
  aReport[7] = d & 0xFF;
}


ErrorPtr DaliCodec::decodeAdapterReport(const DaliByteVector &aReport, DaliAdapterReport &aAdapterReport)
{
  if (aReport.size()<9) {
    return DaliCommError::err(DaliCommErrorMalformedFrame, "adapter report too short (%d bytes)", (int)aReport.size());
  }
  uint8_t src = aReport[0];
  if (src!=adapterSource_self && src!=adapterSource_external) {
    return DaliCommError::err(DaliCommErrorMalformedFrame, "unknown adapter report source 0x%02X", src);
  }
  aAdapterReport.source = (DaliAdapterSource)src;
  aAdapterReport.seq = aReport[8];
  uint8_t t = aReport[1];
  switch (t) {
    case adapterReport_nak:
      aAdapterReport.frame = DaliFrame::noReply();
      break;
    case adapterReport_response:
      aAdapterReport.frame = DaliFrame::backward(aReport[5]);
      break;
    case adapterReport_txComplete:
    case adapterReport_frameReceived: {
      if (aReport[3]!=0) {
        aAdapterReport.frame = DaliFrame::forward(((uint32_t)aReport[3]<<16) | ((uint32_t)aReport[4]<<8) | aReport[5], 24);
      }
      else {
        aAdapterReport.frame = DaliFrame::forward(((uint32_t)aReport[4]<<8) | aReport[5], 16);
      }
      break;
    }
    case adapterReport_framingError:
      aAdapterReport.frame = DaliFrame::framingError();
      break;
    default:
      return DaliCommError::err(DaliCommErrorMalformedFrame, "unknown adapter report type 0x%02X", t);
  }
  aAdapterReport.type = (DaliAdapterReportType)t;
  FOCUSLOG("adapter report: src=0x%02X type=0x%02X seq=%d: %s", src, t, aAdapterReport.seq, aAdapterReport.frame.description().c_str());
  return ErrorPtr();
}
