#pragma once
#include <string>
#include <vector>
#include "Encoder.hpp"
#include "Decoder.hpp"
#include "DecoderWithIgnore.hpp"

namespace b64kit{
namespace codec{

/**
 * @brief Encoder and Decoder of one alphabet, and a factory of DecoderWithIgnore for it.
 * The four RFC 4648 codecs are process-wide constants, initialized on first use.
 * 
 */
class Codecs
{
	private:
		Alphabet m_alphabet;
		Encoder m_encoder;
		Decoder m_decoder;

	public:
		explicit Codecs(const Alphabet &alphabet);

		/**
		 * @brief Standard alphabet with '=' padding.(RFC 4648 section 4)
		 */
		static const Codecs& Standard();
		/**
		 * @brief Standard alphabet without padding.(RFC 4648 section 3.2)
		 */
		static const Codecs& StandardNoPad();
		/**
		 * @brief URL-safe alphabet with '=' padding.(RFC 4648 section 5)
		 */
		static const Codecs& UrlSafe();
		/**
		 * @brief URL-safe alphabet without padding.(RFC 4648 section 3.2)
		 */
		static const Codecs& UrlSafeNoPad();

		const Alphabet& GetAlphabet() const { return m_alphabet; }
		const Encoder& GetEncoder() const { return m_encoder; }
		const Decoder& GetDecoder() const { return m_decoder; }
		/**
		 * @brief Create a DecoderWithIgnore of this alphabet and pad character.
		 * 
		 * @param ignore characters to skip.
		 * @throw ErrorCodeExcept ERR_INVALID_IGNORE if 'ignore' is not valid for this alphabet.
		 */
		DecoderWithIgnore MakeDecoderWithIgnore(const std::string &ignore) const;

		std::string Encode(const std::vector<byte> &bytes) const { return m_encoder.Encode(bytes); }
		std::string Encode(const std::string &str) const { return m_encoder.Encode(str); }
		Expected<std::vector<byte>, ErrorCode> Decode(const std::string &str) const { return m_decoder.Decode(str); }
		/**
		 * @brief Decode string data.
		 * 
		 * @param str Encoded characters in std::string type.
		 * @return std::vector<byte> decoded byte data in Vector STL Container.
		 * @throw ErrorCodeExcept on invalid character or padding.
		 */
		std::vector<byte> DecodeOrThrow(const std::string &str) const;
};

}
}
