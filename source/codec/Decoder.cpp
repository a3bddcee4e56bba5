#include "Decoder.hpp"
#include <boost/endian/conversion.hpp>

namespace b64kit{
namespace codec{

using utils::BufferSizeExcept;
using boost::endian::store_little_u32;

Decoder::Decoder(const Alphabet &alphabet) : m_alphabet(alphabet)
{
	m_char_to_index.fill(INVALID_CHAR);
	for(LaneTable_t &lane : m_fast_char_to_index)
		lane.fill(INVALID_CHAR_TST);

	for(UInt i = 0;i<Alphabet::SIZE;i++)
	{
		byte c = alphabet.At(i);
		m_fast_char_to_index[0][c] = i << 2;
		m_fast_char_to_index[1][c] = (i >> 4) | ((i & 0x0F) << 12);
		m_fast_char_to_index[2][c] = ((i & 0x03) << 22) | ((i & 0x3C) << 6);
		m_fast_char_to_index[3][c] = i << 16;

		m_char_to_index[c] = (byte)i;
	}
}

Expected<size_t, ErrorCode> Decoder::CalcSizeUpperBound(size_t source_len) const
{
	size_t result = source_len / 4 * 3;
	size_t leftover = source_len % 4;
	if(m_alphabet.HasPad())
	{
		if(leftover != 0)
			return ErrorCode(ERR_INVALID_PADDING);
	}
	else
	{
		if(leftover == 1)
			return ErrorCode(ERR_INVALID_PADDING);
		result += leftover * 3 / 4;
	}
	return result;
}

Expected<size_t, ErrorCode> Decoder::CalcSizeForSlice(const byte *source, size_t source_len) const
{
	auto result = CalcSizeUpperBound(source_len);
	if(!result.isSuccessed() || !m_alphabet.HasPad())
		return result;
	size_t size = *result;
	if(source_len >= 1 && source[source_len - 1] == m_alphabet.Pad())
		size--;
	if(source_len >= 2 && source[source_len - 2] == m_alphabet.Pad())
		size--;
	return size;
}

Expected<size_t, ErrorCode> Decoder::CalcSizeForSlice(const std::string &str) const
{
	return CalcSizeForSlice((const byte*)str.data(), str.size());
}

ErrorCode Decoder::Decode(byte *dest, size_t dest_len, const byte *source, size_t source_len) const
{
	if(m_alphabet.HasPad() && source_len % 4 != 0)
		return ErrorCode(ERR_INVALID_PADDING);

	size_t src_idx = 0;
	size_t dest_idx = 0;
	//16 characters into 12 bytes. The last group is always left for the tail, since it may hold padding.
	for(;src_idx + 16 < source_len && dest_idx + 15 < dest_len;src_idx += 16, dest_idx += 12)
	{
		for(int i = 0;i<4;i++)
		{
			const byte *group = source + src_idx + i * 4;
			UInt bits = m_fast_char_to_index[0][group[0]]
				| m_fast_char_to_index[1][group[1]]
				| m_fast_char_to_index[2][group[2]]
				| m_fast_char_to_index[3][group[3]];
			if((bits & INVALID_CHAR_TST) != 0)
				return ErrorCode(ERR_INVALID_CHARACTER);
			store_little_u32(dest + dest_idx + i * 3, bits);	//4th byte is overwritten by the next group.
		}
	}
	for(;src_idx + 4 < source_len && dest_idx + 3 < dest_len;src_idx += 4, dest_idx += 3)
	{
		UInt bits = m_fast_char_to_index[0][source[src_idx]]
			| m_fast_char_to_index[1][source[src_idx + 1]]
			| m_fast_char_to_index[2][source[src_idx + 2]]
			| m_fast_char_to_index[3][source[src_idx + 3]];
		if((bits & INVALID_CHAR_TST) != 0)
			return ErrorCode(ERR_INVALID_CHARACTER);
		store_little_u32(dest + dest_idx, bits);
	}

	UInt acc = 0;		//12 bits
	UInt acc_len = 0;
	size_t leftover_idx = source_len;
	for(;src_idx < source_len;src_idx++)
	{
		byte c = source[src_idx];
		byte d = m_char_to_index[c];
		if(d == INVALID_CHAR)
		{
			if(!m_alphabet.HasPad() || c != m_alphabet.Pad())
				return ErrorCode(ERR_INVALID_CHARACTER);
			leftover_idx = src_idx;
			break;
		}
		acc = ((acc << 6) + d) & 0xFFF;
		acc_len += 6;
		if(acc_len >= 8)
		{
			acc_len -= 8;
			if(dest_idx >= dest_len)
				throw BufferSizeExcept(dest_idx + 1, dest_len, __STACKINFO__);
			dest[dest_idx++] = (byte)(acc >> acc_len);
		}
	}
	if(acc_len > 4 || (acc & ((1u << acc_len) - 1)) != 0)
		return ErrorCode(ERR_INVALID_PADDING);
	if(leftover_idx == source_len)
		return ErrorCode(SUCCESS);

	//Only pad characters may follow the first one, as many as the residue bits require.
	const size_t padding_len = acc_len / 2;
	size_t padding_chars = 0;
	for(size_t i = leftover_idx;i<source_len;i++)
	{
		byte c = source[i];
		if(c != m_alphabet.Pad())
			return ErrorCode(m_char_to_index[c] == INVALID_CHAR ? ERR_INVALID_CHARACTER : ERR_INVALID_PADDING);
		padding_chars++;
	}
	if(padding_chars != padding_len)
		return ErrorCode(ERR_INVALID_PADDING);
	return ErrorCode(SUCCESS);
}

Expected<std::vector<byte>, ErrorCode> Decoder::Decode(const std::string &str) const
{
	const byte *source = (const byte*)str.data();
	auto size = CalcSizeForSlice(source, str.size());
	if(!size.isSuccessed())
		return size.error();
	std::vector<byte> result(*size);
	ErrorCode ec = Decode(result.data(), result.size(), source, str.size());
	if(!ec)
		return ec;
	return result;
}

}
}
