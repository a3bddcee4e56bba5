#pragma once
#include <string>
#include <vector>
#include "Alphabet.hpp"

namespace b64kit{
namespace codec{

/**
 * @brief Base64 Encoder of one alphabet. It pads the output only if the alphabet has pad character.
 * 
 */
class Encoder
{
	private:
		Alphabet m_alphabet;
	public:
		explicit Encoder(const Alphabet &alphabet);
		/**
		 * @brief Compute the encoded length.
		 * 
		 * @param source_len length of raw data.
		 * @return size_t number of characters 'Encode()' writes.
		 */
		size_t CalcSize(size_t source_len) const;
		/**
		 * @brief Encode byte data into caller's memory. Memory after the encoded length is not touched.
		 * 
		 * @param dest destination memory.
		 * @param dest_len destination memory size. it must be at least 'CalcSize(source_len)'.
		 * @param source data memory pointer.
		 * @param source_len data memory size.
		 * @return size_t number of characters written, always 'CalcSize(source_len)'.
		 * @throw BufferSizeExcept if 'dest_len' is too small.
		 */
		size_t Encode(byte *dest, size_t dest_len, const byte *source, size_t source_len) const;
		/**
		 * @brief Encode byte data.
		 * 
		 * @param bytes data memory pointer.
		 * @param len data memory size.
		 * @return std::string Encoded characters in std::string type.
		 */
		std::string Encode(const byte *bytes, size_t len) const;
		/**
		 * @brief Encode byte data.
		 * 
		 * @param bytes data in Vector STL Container.
		 * @return std::string Encoded characters in std::string type.
		 */
		std::string Encode(const std::vector<byte> &bytes) const;
		/**
		 * @brief Encode characters of string as raw bytes.
		 * 
		 */
		std::string Encode(const std::string &str) const;
		const Alphabet& GetAlphabet() const { return m_alphabet; }
	private:
		byte Char(UInt index) const { return m_alphabet.At(index & 0x3F); }
};

}
}
