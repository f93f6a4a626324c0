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

#ifndef __dalimaster__daliframe__
#define __dalimaster__daliframe__

#include "dalitypes.hpp"

using namespace std;

namespace dalimaster {

  /// a DALI command as issued by the master
  /// @note commands are immutable. Encoding rule, reply kind and repeat requirement are derived
  ///   from the opcode table when the command is constructed.
  class DaliCommand
  {
  public:

    typedef enum {
      cmd_directArcPower, ///< YAAAAAA0 level
      cmd_addressed, ///< YAAAAAA1 opcode
      cmd_special, ///< special command byte + data byte
      cmd_extended24 ///< 24-bit frame
    } CommandKind;

    typedef enum {
      reply_none, ///< no backward frame expected
      reply_yesNo, ///< YES answer or no answer at all (which means NO)
      reply_value ///< a backward frame carrying a value is expected
    } ReplyKind;

  private:

    CommandKind kind;
    DaliAddress address;
    uint8_t opcode;
    uint8_t data;
    uint32_t frame24;
    ReplyKind replyKind;
    bool repeat;
    bool da24Config;
    bool valid;

    DaliCommand(CommandKind aKind);

  public:

    /// direct arc power control
    /// @param aAddress short address, group address (DaliGroup+n), DaliBroadcast or DaliBroadcastUnaddressed
    /// @param aLevel arc power level, 0xFF (MASK) stops fading
    static DaliCommand directArcPower(DaliAddress aAddress, uint8_t aLevel);

    /// addressed command or query
    /// @param aAddress short address, group address (DaliGroup+n), DaliBroadcast or DaliBroadcastUnaddressed
    /// @param aOpcode DALICMD_xxx opcode
    static DaliCommand addressed(DaliAddress aAddress, uint8_t aOpcode);

    /// special command
    /// @param aOpcode DALICMD_xxx special command byte (like DALICMD_COMPARE)
    /// @param aData data byte
    static DaliCommand special(uint8_t aOpcode, uint8_t aData = 0);

    /// 24-bit frame
    /// @param aFrame the 24 frame bits
    /// @param aSendTwice if set, frame must be sent twice
    /// @param aDA24Config if set, frame is sent as DA24 configuration command by the adapter
    static DaliCommand extended(uint32_t aFrame, bool aSendTwice = false, bool aDA24Config = false);

    CommandKind getKind() const { return kind; };
    DaliAddress getAddress() const { return address; };
    uint8_t getOpcode() const { return opcode; };
    uint8_t getData() const { return data; };
    uint32_t getFrame24() const { return frame24; };
    ReplyKind getReplyKind() const { return replyKind; };
    bool expectsReply() const { return replyKind!=reply_none; };
    bool needsRepeat() const { return repeat; };
    bool isDA24Config() const { return da24Config; };

    /// @return true if command can be encoded
    bool isValid() const { return valid; };

    /// @return readable description
    string description() const;
  };


  /// a DALI frame as seen on the bus
  class DaliFrame
  {
  public:

    typedef enum {
      frame_none,
      frame_forward, ///< 16 or 24 bit frame from a master
      frame_backward, ///< 8 bit answer from a device
      frame_noReply, ///< no backward frame within the response window
      frame_framingError ///< unreadable answer, usually several devices answering
    } FrameType;

    typedef enum {
      addr_short,
      addr_group,
      addr_broadcast,
      addr_broadcastUnaddressed,
      addr_special,
      addr_extended24,
      addr_reserved
    } AddressType;

  private:

    FrameType type;
    uint8_t bits;
    uint32_t data;

  public:

    DaliFrame();

    static DaliFrame forward(uint32_t aData, uint8_t aBits);
    static DaliFrame backward(uint8_t aValue);
    static DaliFrame noReply();
    static DaliFrame framingError();

    FrameType getType() const { return type; };
    uint8_t getBits() const { return bits; };
    uint32_t getData() const { return data; };

    /// @return backward frame value (0 for other frame types)
    uint8_t getValue() const { return type==frame_backward ? (uint8_t)data : 0; };

    /// @name forward frame decoding
    /// @{

    /// @return the address byte of a 16 bit forward frame
    uint8_t addressByte() const { return (data>>8) & 0xFF; };
    /// @return the opcode/data byte of a 16 bit forward frame
    uint8_t opcodeByte() const { return data & 0xFF; };
    /// @return type of the address field
    AddressType addressType() const;
    /// @return address as DaliAddress (short, DaliGroup+n, DaliBroadcast, DaliBroadcastUnaddressed), DaliBroadcast for other types
    DaliAddress address() const;
    /// @return true if frame is a command (selector bit set), false for direct arc power
    bool isCommand() const;
    /// @return true if this forward frame affects the device with the given short address and group membership
    bool affects(DaliAddress aShortAddress, uint16_t aGroupMask) const;

    /// @}

    string description() const;
  };


  /// source of a report from the USB adapter
  typedef enum {
    adapterSource_external = 0x11, ///< traffic from another master on the bus
    adapterSource_self = 0x12 ///< traffic caused by our own transmission
  } DaliAdapterSource;

  /// type of a report from the USB adapter
  typedef enum {
    adapterReport_nak = 0x71, ///< no answer
    adapterReport_response = 0x72, ///< backward frame
    adapterReport_txComplete = 0x73, ///< forward frame was transmitted
    adapterReport_frameReceived = 0x74, ///< forward frame from another master
    adapterReport_framingError = 0x77 ///< framing error
  } DaliAdapterReportType;

  /// decoded report from the USB adapter
  typedef struct {
    DaliAdapterSource source;
    DaliAdapterReportType type;
    uint8_t seq; ///< sequence number of the transmission this report belongs to, 0 for foreign traffic
    DaliFrame frame;
  } DaliAdapterReport;

  #define DALIADAPTER_OUTREPORT_SIZE 64
  #define DALIADAPTER_INREPORT_SIZE 16


  /// stateless translation between commands, frames and adapter reports
  class DaliCodec
  {
  public:

    /// encode command into forward frame
    /// @param aCommand the command
    /// @param aFrame will receive the frame
    /// @return DaliCommErrorInvalidCommand if command cannot be encoded
    static ErrorPtr encode(const DaliCommand &aCommand, DaliFrame &aFrame);

    /// classify forward frame data (e.g. snooped from another master)
    static DaliFrame decodeForward(uint32_t aData, uint8_t aBits);

    /// decode backward frame
    /// @param aBytes empty for no reply, single byte for an answer
    /// @param aFrame will receive backward or noReply frame
    /// @return DaliCommErrorMalformedFrame for any other length
    static ErrorPtr decodeBackward(const DaliByteVector &aBytes, DaliFrame &aFrame);

    /// create the output report to send a forward frame via the USB adapter
    /// @param aFrame the forward frame
    /// @param aSeq the sequence number (1..255) to correlate the adapter's reports
    /// @param aDA24Config if set, the frame is sent as DA24 configuration frame
    /// @param aReport will receive the report
    static void encodeAdapterReport(const DaliFrame &aFrame, uint8_t aSeq, bool aDA24Config, DaliByteVector &aReport);

    /// decode an input report from the USB adapter
    /// @param aReport the raw report
    /// @param aAdapterReport will receive the decoded report
    /// @return DaliCommErrorMalformedFrame if report cannot be decoded
    static ErrorPtr decodeAdapterReport(const DaliByteVector &aReport, DaliAdapterReport &aAdapterReport);

    /// utility function to create address byte
    /// @param aAddress DALI address (device short address, or group address + DaliGroup, or DaliBroadcast)
    /// @return first DALI byte for direct arc power (add 1 for commands)
    static uint8_t dali1FromAddress(DaliAddress aAddress);

    /// utility function to decode address byte
    /// @param aResponse DALI-style bAAAAAAx address byte, as returned by some query commands
    /// @return DALI address (device short address, or group address + DaliGroup, or DaliBroadcast)
    static DaliAddress addressFromDaliResponse(uint8_t aResponse);

    /// @return true if aAddress is a valid target address
    static bool isValidAddress(DaliAddress aAddress);

    /// @name opcode table
    /// @{
    static bool isKnownOpcode(uint8_t aOpcode);
    static bool isKnownSpecialOpcode(uint8_t aSpecialOpcode);
    static DaliCommand::ReplyKind replyKindForOpcode(uint8_t aOpcode);
    static DaliCommand::ReplyKind replyKindForSpecialOpcode(uint8_t aSpecialOpcode);
    static bool opcodeNeedsRepeat(uint8_t aOpcode);
    static bool specialOpcodeNeedsRepeat(uint8_t aSpecialOpcode);
    static const char *specialOpcodeName(uint8_t aSpecialOpcode);
    /// @}
  };

} // namespace dalimaster

#endif /* defined(__dalimaster__daliframe__) */
