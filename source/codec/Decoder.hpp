#pragma once
#include <string>
#include <vector>
#include "Alphabet.hpp"
#include "Expected.hpp"

namespace b64kit{
namespace codec{

using utils::Expected;

/**
 * @brief Base64 Decoder of one alphabet. Destination memory must be exactly sized by 'CalcSizeForSlice()'.
 * 
 * Aligned groups of 4 characters are decoded with four lane tables. Each table places the 6 bit value of a character
 * in its own bits of a 24 bit group, so OR of four lookups is the 3 decoded bytes. Invalid characters set the top byte,
 * which is tested once per group.
 * 
 */
class Decoder
{
	public:
		static constexpr byte INVALID_CHAR = 0xFF;
		static constexpr UInt INVALID_CHAR_TST = 0xFF000000;

	private:
		Alphabet m_alphabet;
		ByteTable_t m_char_to_index;
		std::array<LaneTable_t, 4> m_fast_char_to_index;

	public:
		explicit Decoder(const Alphabet &alphabet);
		/**
		 * @brief Maximum decoded size for a given input length. The actual size may be less if the input includes padding.
		 * 
		 * @param source_len number of characters.
		 * @return Expected<size_t, ErrorCode> size, or ERR_INVALID_PADDING if the length is impossible.
		 */
		Expected<size_t, ErrorCode> CalcSizeUpperBound(size_t source_len) const;
		/**
		 * @brief Exact decoded size of characters.
		 * 
		 * @return Expected<size_t, ErrorCode> size, or ERR_INVALID_PADDING if the length is impossible.
		 */
		Expected<size_t, ErrorCode> CalcSizeForSlice(const byte *source, size_t source_len) const;
		Expected<size_t, ErrorCode> CalcSizeForSlice(const std::string &str) const;
		/**
		 * @brief Decode characters into caller's memory.
		 * 
		 * @param dest destination memory.
		 * @param dest_len destination memory size. it must be 'CalcSizeForSlice()' of the source.
		 * @param source characters.
		 * @param source_len number of characters.
		 * @return ErrorCode SUCCESS, ERR_INVALID_CHARACTER or ERR_INVALID_PADDING. Content of 'dest' is unspecified on failure.
		 * @throw BufferSizeExcept if 'dest_len' is smaller than the decoded data.
		 */
		ErrorCode Decode(byte *dest, size_t dest_len, const byte *source, size_t source_len) const;
		/**
		 * @brief Decode string data.
		 * 
		 * @param str Encoded characters in std::string type.
		 * @return Expected<std::vector<byte>, ErrorCode> decoded byte data, or the reason of failure.
		 */
		Expected<std::vector<byte>, ErrorCode> Decode(const std::string &str) const;
		/**
		 * @brief 6 bit value of a character.
		 * 
		 * @return byte 0~63, or INVALID_CHAR if 'c' is not in the alphabet.
		 */
		byte IndexOf(byte c) const { return m_char_to_index[c]; }
		const Alphabet& GetAlphabet() const { return m_alphabet; }
};

}
}
