#include "DecoderWithIgnore.hpp"

namespace b64kit{
namespace codec{

using utils::ErrorCodeExcept;

DecoderWithIgnore::DecoderWithIgnore(const Alphabet &alphabet, const std::string &ignore) : m_decoder(alphabet), m_char_is_ignored{}
{
	ErrorCodeExcept::ThrowOnFail(ValidateIgnore(alphabet, ignore), __STACKINFO__);
	for(char c : ignore)
		m_char_is_ignored[(byte)c] = true;
}

ErrorCode DecoderWithIgnore::ValidateIgnore(const Alphabet &alphabet, const std::string &ignore)
{
	ErrorCode ec(ERR_INVALID_IGNORE);
	ByteSet_t in_alphabet{};
	for(size_t i = 0;i<Alphabet::SIZE;i++)
		in_alphabet[alphabet.At(i)] = true;

	ByteSet_t seen{};
	for(char ch : ignore)
	{
		byte c = (byte)ch;
		if(in_alphabet[c])
		{
			ec.SetMessage("character " + std::to_string(c) + " is in the alphabet");
			return ec;
		}
		if(alphabet.HasPad() && c == alphabet.Pad())
		{
			ec.SetMessage("character " + std::to_string(c) + " is the pad character");
			return ec;
		}
		if(seen[c])
		{
			ec.SetMessage("duplicated character " + std::to_string(c));
			return ec;
		}
		seen[c] = true;
	}
	return ErrorCode(SUCCESS);
}

size_t DecoderWithIgnore::CalcSizeUpperBound(size_t source_len) const
{
	size_t result = source_len / 4 * 3;
	if(!GetAlphabet().HasPad())
		result += source_len % 4 * 3 / 4;
	return result;
}

Expected<size_t, ErrorCode> DecoderWithIgnore::Decode(byte *dest, size_t dest_len, const byte *source, size_t source_len) const
{
	const Alphabet &alphabet = GetAlphabet();
	UInt acc = 0;		//12 bits
	UInt acc_len = 0;
	size_t dest_idx = 0;
	size_t leftover_idx = source_len;
	for(size_t src_idx = 0;src_idx<source_len;src_idx++)
	{
		byte c = source[src_idx];
		if(m_char_is_ignored[c])
			continue;
		byte d = m_decoder.IndexOf(c);
		if(d == Decoder::INVALID_CHAR)
		{
			if(!alphabet.HasPad() || c != alphabet.Pad())
				return ErrorCode(ERR_INVALID_CHARACTER);
			leftover_idx = src_idx;
			break;
		}
		acc = ((acc << 6) + d) & 0xFFF;
		acc_len += 6;
		if(acc_len >= 8)
		{
			if(dest_idx == dest_len)
				return ErrorCode(ERR_NO_SPACE_LEFT);
			acc_len -= 8;
			dest[dest_idx++] = (byte)(acc >> acc_len);
		}
	}
	if(acc_len > 4 || (acc & ((1u << acc_len) - 1)) != 0)
		return ErrorCode(ERR_INVALID_PADDING);

	const size_t padding_len = acc_len / 2;
	if(leftover_idx == source_len)
	{
		if(alphabet.HasPad() && padding_len != 0)
			return ErrorCode(ERR_INVALID_PADDING);
		return dest_idx;
	}
	size_t padding_chars = 0;
	for(size_t i = leftover_idx;i<source_len;i++)
	{
		byte c = source[i];
		if(m_char_is_ignored[c])
			continue;
		if(c != alphabet.Pad())
			return ErrorCode(m_decoder.IndexOf(c) == Decoder::INVALID_CHAR ? ERR_INVALID_CHARACTER : ERR_INVALID_PADDING);
		padding_chars++;
	}
	if(padding_chars != padding_len)
		return ErrorCode(ERR_INVALID_PADDING);
	return dest_idx;
}

Expected<std::vector<byte>, ErrorCode> DecoderWithIgnore::Decode(const std::string &str) const
{
	//Every character can carry 6 bits, so this never runs out of space.
	std::vector<byte> result(str.size() / 4 * 3 + str.size() % 4 * 3 / 4);
	auto written = Decode(result.data(), result.size(), (const byte*)str.data(), str.size());
	if(!written.isSuccessed())
		return written.error();
	result.resize(*written);
	return result;
}

}
}
