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

#ifndef __dalimaster__dalidefs__
#define __dalimaster__dalidefs__

// IEC 62386-102 opcode table

// Address byte of forward frames:
// 0AAA AAAS : device short address (0..63)
// 100A AAAS : group address (0..15)
// 1111 110S : broadcast to devices without short address
// 1111 111S : broadcast
// 101C CCC1 / 110C CCC1 : special commands
// S : 0=direct arc power, 1=command

// - control commands (S=1)
#define DALICMD_OFF 0x00
#define DALICMD_UP 0x01
#define DALICMD_DOWN 0x02
#define DALICMD_STEP_UP 0x03
#define DALICMD_STEP_DOWN 0x04
#define DALICMD_RECALL_MAX_LEVEL 0x05
#define DALICMD_RECALL_MIN_LEVEL 0x06
#define DALICMD_STEP_DOWN_AND_OFF 0x07
#define DALICMD_ON_AND_STEP_UP 0x08
#define DALICMD_ENABLE_DAPC_SEQUENCE 0x09
#define DALICMD_GO_TO_LAST_ACTIVE_LEVEL 0x0A
#define DALICMD_CONTINUOUS_UP 0x0B // DALI-2
#define DALICMD_CONTINUOUS_DOWN 0x0C // DALI-2
#define DALICMD_GO_TO_SCENE 0x10 // +scene number 0..15

// - configuration commands (must be sent twice within 100ms)
#define DALICMD_RESET 0x20
#define DALICMD_STORE_ACTUAL_LEVEL_IN_DTR 0x21
#define DALICMD_SAVE_PERSISTENT_VARIABLES 0x22
#define DALICMD_SET_OPERATING_MODE 0x23
#define DALICMD_RESET_MEMORY_BANK 0x24
#define DALICMD_IDENTIFY_DEVICE 0x25
#define DALICMD_STORE_DTR_AS_MAX_LEVEL 0x2A
#define DALICMD_STORE_DTR_AS_MIN_LEVEL 0x2B
#define DALICMD_STORE_DTR_AS_FAILURE_LEVEL 0x2C
#define DALICMD_STORE_DTR_AS_POWER_ON_LEVEL 0x2D
#define DALICMD_STORE_DTR_AS_FADE_TIME 0x2E
#define DALICMD_STORE_DTR_AS_FADE_RATE 0x2F
#define DALICMD_STORE_DTR_AS_EXT_FADE_TIME 0x30
#define DALICMD_STORE_DTR_AS_SCENE 0x40 // +scene number 0..15
#define DALICMD_REMOVE_FROM_SCENE 0x50 // +scene number 0..15
#define DALICMD_ADD_TO_GROUP 0x60 // +group number 0..15
#define DALICMD_REMOVE_FROM_GROUP 0x70 // +group number 0..15
#define DALICMD_STORE_DTR_AS_SHORT_ADDRESS 0x80
#define DALICMD_ENABLE_WRITE_MEMORY 0x81
#define DALICMD_FIRST_CONFIG_COMMAND DALICMD_RESET
#define DALICMD_LAST_CONFIG_COMMAND DALICMD_ENABLE_WRITE_MEMORY

// - queries
#define DALICMD_QUERY_STATUS 0x90
#define DALICMD_QUERY_CONTROL_GEAR 0x91
#define DALICMD_QUERY_LAMP_FAILURE 0x92
#define DALICMD_QUERY_LAMP_POWER_ON 0x93
#define DALICMD_QUERY_LIMIT_ERROR 0x94
#define DALICMD_QUERY_RESET_STATE 0x95
#define DALICMD_QUERY_MISSING_SHORT_ADDRESS 0x96
#define DALICMD_QUERY_VERSION_NUMBER 0x97
#define DALICMD_QUERY_CONTENT_DTR 0x98
#define DALICMD_QUERY_DEVICE_TYPE 0x99
#define DALICMD_QUERY_PHYSICAL_MINIMUM_LEVEL 0x9A
#define DALICMD_QUERY_POWER_FAILURE 0x9B
#define DALICMD_QUERY_CONTENT_DTR1 0x9C
#define DALICMD_QUERY_CONTENT_DTR2 0x9D
#define DALICMD_QUERY_OPERATING_MODE 0x9E
#define DALICMD_QUERY_LIGHT_SOURCE_TYPE 0x9F
#define DALICMD_QUERY_ACTUAL_LEVEL 0xA0
#define DALICMD_QUERY_MAX_LEVEL 0xA1
#define DALICMD_QUERY_MIN_LEVEL 0xA2
#define DALICMD_QUERY_POWER_ON_LEVEL 0xA3
#define DALICMD_QUERY_SYSTEM_FAILURE_LEVEL 0xA4
#define DALICMD_QUERY_FADE_TIME_FADE_RATE 0xA5
#define DALICMD_QUERY_MANUFACTURER_SPECIFIC_MODE 0xA6
#define DALICMD_QUERY_NEXT_DEVICE_TYPE 0xA7
#define DALICMD_QUERY_EXTENDED_FADE_TIME 0xA8
#define DALICMD_QUERY_CONTROL_GEAR_FAILURE 0xAA
#define DALICMD_QUERY_SCENE_LEVEL 0xB0 // +scene number 0..15
#define DALICMD_QUERY_GROUPS_0_TO_7 0xC0
#define DALICMD_QUERY_GROUPS_8_TO_15 0xC1
#define DALICMD_QUERY_RANDOM_ADDRESS_H 0xC2
#define DALICMD_QUERY_RANDOM_ADDRESS_M 0xC3
#define DALICMD_QUERY_RANDOM_ADDRESS_L 0xC4
#define DALICMD_READ_MEMORY_LOCATION 0xC5
#define DALICMD_FIRST_QUERY DALICMD_QUERY_STATUS
#define DALICMD_LAST_QUERY DALICMD_READ_MEMORY_LOCATION
#define DALICMD_QUERY_EXTENDED_VERSION_NUMBER 0xFF

// - special commands (first byte of frame)
#define DALICMD_TERMINATE 0xA1
#define DALICMD_SET_DTR 0xA3
#define DALICMD_INITIALISE 0xA5
#define DALICMD_RANDOMISE 0xA7
#define DALICMD_COMPARE 0xA9
#define DALICMD_WITHDRAW 0xAB
#define DALICMD_PING 0xAD
#define DALICMD_SEARCHADDRH 0xB1
#define DALICMD_SEARCHADDRM 0xB3
#define DALICMD_SEARCHADDRL 0xB5
#define DALICMD_PROGRAM_SHORT_ADDRESS 0xB7
#define DALICMD_VERIFY_SHORT_ADDRESS 0xB9
#define DALICMD_QUERY_SHORT_ADDRESS 0xBB
#define DALICMD_PHYSICAL_SELECTION 0xBD
#define DALICMD_ENABLE_DEVICE_TYPE 0xC1
#define DALICMD_SET_DTR1 0xC3
#define DALICMD_SET_DTR2 0xC5
#define DALICMD_WRITE_MEMORY_LOCATION 0xC7
#define DALICMD_WRITE_MEMORY_LOCATION_NO_REPLY 0xC9

// - INITIALISE parameters
#define DALIINIT_ALL 0x00
#define DALIINIT_UNADDRESSED 0xFF

// - 24-bit frames (IEC 62386-103)
#define DALI24_START_QUIESCENT_MODE 0xFFFE1D
#define DALI24_STOP_QUIESCENT_MODE 0xFFFE1E

// - answers and values
#define DALIVALUE_MASK 0xFF // MASK value, also "no short address" answer of QUERY_SHORT_ADDRESS
#define DALIANSWER_YES 0xFF

#define DALI_MAXDEVICES 64
#define DALI_MAXGROUPS 16
#define DALI_MAXSCENES 16

// - search address space
#define DALI_SEARCHADDR_MAX 0xFFFFFF

// - memory bank 0 layout (IEC 62386-102 ed.2)
#define DALIMEM_BANK0_LAST_LOCATION 0x00
#define DALIMEM_BANK0_LAST_BANK 0x02
#define DALIMEM_BANK0_GTIN 0x03 // 6 bytes, MSB first
#define DALIMEM_BANK0_FW_VERSION 0x09 // major, minor
#define DALIMEM_BANK0_SERIAL 0x0B // 8 bytes, MSB first
#define DALIMEM_BANK0_HW_VERSION 0x13 // major, minor
#define DALIMEM_BANK0_101_VERSION 0x15
#define DALIMEM_BANK0_102_VERSION 0x16
#define DALIMEM_BANK0_103_VERSION 0x17
#define DALIMEM_BANK0_NUM_DEVICE_UNITS 0x18
#define DALIMEM_BANK0_NUM_GEAR_UNITS 0x19
#define DALIMEM_BANK0_GEAR_UNIT_INDEX 0x1A
#define DALIMEM_BANK0_MINBYTES (DALIMEM_BANK0_SERIAL+8) // up to and including the serial number
#define DALIMEM_BANK0_IDBYTES (DALIMEM_BANK0_GEAR_UNIT_INDEX+1) // up to and including the gear unit index

// - status bits (QUERY_STATUS answer)
#define DALISTATUS_CONTROL_GEAR_FAILURE 0x01
#define DALISTATUS_LAMP_FAILURE 0x02
#define DALISTATUS_LAMP_ON 0x04
#define DALISTATUS_LIMIT_ERROR 0x08
#define DALISTATUS_FADE_RUNNING 0x10
#define DALISTATUS_RESET_STATE 0x20
#define DALISTATUS_MISSING_SHORT_ADDRESS 0x40
#define DALISTATUS_POWER_CYCLE_SEEN 0x80

#endif /* defined(__dalimaster__dalidefs__) */
