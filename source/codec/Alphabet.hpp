#pragma once
#include <string>
#include "Types.hpp"
#include "Codes.hpp"
#include "ErrorCode.hpp"
#include "StackTraceExcept.hpp"

namespace b64kit{
namespace codec{

using utils::ErrorCode;

/**
 * @brief 64 distinct characters mapped to the 6 bit values 0~63, and an optional pad character that is none of them.
 * 
 */
class Alphabet
{
	public:
		static constexpr size_t SIZE = 64;
		static const char* STANDARD_CHARS;		//RFC 4648 section 4
		static const char* URL_SAFE_CHARS;		//RFC 4648 section 5

	private:
		std::array<byte, SIZE> m_chars;
		bool m_hasPad;
		byte m_pad;

	public:
		/**
		 * @brief Alphabet without pad character.
		 * 
		 * @param chars 64 distinct characters.
		 * @throw ErrorCodeExcept ERR_INVALID_ALPHABET if 'chars' is not 64 distinct characters.
		 */
		explicit Alphabet(const std::string &chars);
		/**
		 * @brief Alphabet with pad character.
		 * 
		 * @param chars 64 distinct characters.
		 * @param pad pad character. It must not be one of 'chars'.
		 * @throw ErrorCodeExcept ERR_INVALID_ALPHABET if 'chars' is not 64 distinct characters or 'pad' is one of them.
		 */
		Alphabet(const std::string &chars, byte pad);
		/**
		 * @brief Check the characters without constructing.
		 * 
		 * @return ErrorCode SUCCESS or ERR_INVALID_ALPHABET with the reason as message.
		 */
		static ErrorCode Validate(const std::string &chars, bool hasPad, byte pad);

		byte At(size_t index) const { return m_chars[index]; }
		bool HasPad() const { return m_hasPad; }
		byte Pad() const { return m_pad; }
		std::string Chars() const;
		bool operator==(const Alphabet&) const;
};

}
}
