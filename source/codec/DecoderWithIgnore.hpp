#pragma once
#include <string>
#include <vector>
#include "Decoder.hpp"

namespace b64kit{
namespace codec{

/**
 * @brief Base64 Decoder that skips the characters of an ignore set(e.g. whitespace) wherever they appear.
 * Destination memory does not need to be exact, running out of it is reported as ERR_NO_SPACE_LEFT.
 * 
 */
class DecoderWithIgnore
{
	private:
		Decoder m_decoder;
		ByteSet_t m_char_is_ignored;

	public:
		/**
		 * @brief Constructor.
		 * 
		 * @param alphabet alphabet to decode.
		 * @param ignore characters to skip. None of them can be in the alphabet, be the pad character or be repeated.
		 * @throw ErrorCodeExcept ERR_INVALID_IGNORE if 'ignore' is not valid for 'alphabet'.
		 */
		DecoderWithIgnore(const Alphabet &alphabet, const std::string &ignore);
		/**
		 * @brief Check the ignore set without constructing.
		 * 
		 * @return ErrorCode SUCCESS or ERR_INVALID_IGNORE with the reason as message.
		 */
		static ErrorCode ValidateIgnore(const Alphabet &alphabet, const std::string &ignore);
		/**
		 * @brief Maximum decoded size for a given input length. Ignored and pad characters are not subtracted,
		 * so it is looser than 'Decoder::CalcSizeForSlice()'.
		 * 
		 * @param source_len number of characters including ignored ones.
		 * @return size_t upper bound of decoded size.
		 */
		size_t CalcSizeUpperBound(size_t source_len) const;
		/**
		 * @brief Decode characters into caller's memory.
		 * 
		 * @param dest destination memory.
		 * @param dest_len destination memory size.
		 * @param source characters.
		 * @param source_len number of characters.
		 * @return Expected<size_t, ErrorCode> number of bytes written, or ERR_INVALID_CHARACTER, ERR_INVALID_PADDING, ERR_NO_SPACE_LEFT.
		 */
		Expected<size_t, ErrorCode> Decode(byte *dest, size_t dest_len, const byte *source, size_t source_len) const;
		/**
		 * @brief Decode string data.
		 * 
		 * @param str Encoded characters in std::string type.
		 * @return Expected<std::vector<byte>, ErrorCode> decoded byte data, or the reason of failure.
		 */
		Expected<std::vector<byte>, ErrorCode> Decode(const std::string &str) const;
		bool IsIgnored(byte c) const { return m_char_is_ignored[c]; }
		const Alphabet& GetAlphabet() const { return m_decoder.GetAlphabet(); }
};

}
}
