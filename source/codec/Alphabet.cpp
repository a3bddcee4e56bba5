#include "Alphabet.hpp"
#include <algorithm>

namespace b64kit{
namespace codec{

using utils::ErrorCodeExcept;

const char* Alphabet::STANDARD_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789+/";
const char* Alphabet::URL_SAFE_CHARS = "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

Alphabet::Alphabet(const std::string &chars) : m_hasPad(false), m_pad(0)
{
	ErrorCodeExcept::ThrowOnFail(Validate(chars, false, 0), __STACKINFO__);
	std::copy(chars.begin(), chars.end(), m_chars.begin());
}

Alphabet::Alphabet(const std::string &chars, byte pad) : m_hasPad(true), m_pad(pad)
{
	ErrorCodeExcept::ThrowOnFail(Validate(chars, true, pad), __STACKINFO__);
	std::copy(chars.begin(), chars.end(), m_chars.begin());
}

ErrorCode Alphabet::Validate(const std::string &chars, bool hasPad, byte pad)
{
	ErrorCode ec(ERR_INVALID_ALPHABET);
	if(chars.length() != SIZE)
	{
		ec.SetMessage("expected " + std::to_string(SIZE) + " characters, got " + std::to_string(chars.length()));
		return ec;
	}
	ByteSet_t seen{};
	for(char ch : chars)
	{
		byte c = (byte)ch;
		if(seen[c])
		{
			ec.SetMessage("duplicated character " + std::to_string(c));
			return ec;
		}
		if(hasPad && c == pad)
		{
			ec.SetMessage("pad character " + std::to_string(c) + " is in the alphabet");
			return ec;
		}
		seen[c] = true;
	}
	return ErrorCode(SUCCESS);
}

std::string Alphabet::Chars() const
{
	return std::string(m_chars.begin(), m_chars.end());
}

bool Alphabet::operator==(const Alphabet& rhs) const
{
	if(m_hasPad != rhs.m_hasPad || m_chars != rhs.m_chars)
		return false;
	return !m_hasPad || m_pad == rhs.m_pad;
}

}
}
