#pragma once
#include "Types.hpp"

//Error Codes
static constexpr errorcode_t SUCCESS = 0;

//Recoverable decode errors. Each one is reported as-is, never converted to another.
static constexpr errorcode_t ERR_INVALID_CHARACTER = 10;	//byte outside of alphabet, pad and ignore set.
static constexpr errorcode_t ERR_INVALID_PADDING = 11;		//wrong length, non-zero residue bits or wrong count of pad characters.
static constexpr errorcode_t ERR_NO_SPACE_LEFT = 12;		//destination is exhausted before input is consumed.

//Construction errors. Constructors throw these, validators return them.
static constexpr errorcode_t ERR_INVALID_ALPHABET = 20;
static constexpr errorcode_t ERR_INVALID_IGNORE = 21;
static constexpr errorcode_t ERR_INVALID_CONFIG = 22;

//Pad character
static constexpr byte DEFAULT_PAD = '=';
