#include "Encoder.hpp"
#include <boost/endian/conversion.hpp>

namespace b64kit{
namespace codec{

using utils::BufferSizeExcept;
using boost::endian::load_big_u32;
using boost::endian::load_big_u64;

Encoder::Encoder(const Alphabet &alphabet) : m_alphabet(alphabet) {}

size_t Encoder::CalcSize(size_t source_len) const
{
	//RFC 4648 section 3.2 : 0, 1, 2 leftover bytes become 0, 2, 3 characters without padding.
	static constexpr size_t unpadded_tail[3] = {0, 2, 3};

	if(m_alphabet.HasPad())
		return (source_len + 2) / 3 * 4;
	return source_len / 3 * 4 + unpadded_tail[source_len % 3];
}

size_t Encoder::Encode(byte *dest, size_t dest_len, const byte *source, size_t source_len) const
{
	const size_t out_len = CalcSize(source_len);
	if(dest_len < out_len)
		throw BufferSizeExcept(out_len, dest_len, __STACKINFO__);

	size_t idx = 0;
	size_t out_idx = 0;
	//12 bytes into 16 characters. Two big-endian words hold 6 bytes each in their top 48 bits.
	for(;idx + 15 < source_len;idx += 12)
	{
		for(int half = 0;half<2;half++)
		{
			uint64_t bits = load_big_u64(source + idx + half * 6);
			for(int i = 0;i<8;i++)
				dest[out_idx + half * 8 + i] = Char((UInt)(bits >> (58 - i * 6)));
		}
		out_idx += 16;
	}
	for(;idx + 3 < source_len;idx += 3)
	{
		UInt bits = load_big_u32(source + idx);
		dest[out_idx] = Char(bits >> 26);
		dest[out_idx + 1] = Char(bits >> 20);
		dest[out_idx + 2] = Char(bits >> 14);
		dest[out_idx + 3] = Char(bits >> 8);
		out_idx += 4;
	}
	switch(source_len - idx)
	{
		case 3:
			dest[out_idx] = Char(source[idx] >> 2);
			dest[out_idx + 1] = Char((source[idx] & 0x03) << 4 | source[idx + 1] >> 4);
			dest[out_idx + 2] = Char((source[idx + 1] & 0x0F) << 2 | source[idx + 2] >> 6);
			dest[out_idx + 3] = Char(source[idx + 2]);
			out_idx += 4;
			break;
		case 2:
			dest[out_idx] = Char(source[idx] >> 2);
			dest[out_idx + 1] = Char((source[idx] & 0x03) << 4 | source[idx + 1] >> 4);
			dest[out_idx + 2] = Char((source[idx + 1] & 0x0F) << 2);
			out_idx += 3;
			break;
		case 1:
			dest[out_idx] = Char(source[idx] >> 2);
			dest[out_idx + 1] = Char((source[idx] & 0x03) << 4);
			out_idx += 2;
			break;
		default:
			break;
	}
	if(m_alphabet.HasPad())
	{
		for(;out_idx < out_len;out_idx++)
			dest[out_idx] = m_alphabet.Pad();
	}
	return out_len;
}

std::string Encoder::Encode(const byte *bytes, size_t len) const
{
	std::string result(CalcSize(len), '\0');
	Encode((byte*)result.data(), result.size(), bytes, len);
	return result;
}

std::string Encoder::Encode(const std::vector<byte> &bytes) const
{
	return Encode(bytes.data(), bytes.size());
}

std::string Encoder::Encode(const std::string &str) const
{
	return Encode((const byte*)str.data(), str.size());
}

}
}
