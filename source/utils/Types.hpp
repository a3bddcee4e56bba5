#pragma once
#include <array>
#include <cstddef>
#include <cstdint>

typedef unsigned char byte;
typedef uint32_t UInt;
typedef byte errorcode_t;

typedef std::array<byte, 256> ByteTable_t;			//byte -> value
typedef std::array<bool, 256> ByteSet_t;			//byte -> membership
typedef std::array<UInt, 256> LaneTable_t;			//byte -> pre-shifted 24bit lane
