#pragma once
#include <string>
#include "Codecs.hpp"

namespace b64kit{
namespace codec{

/**
 * @brief Description of a codec read from configuration file(.conf).
 * 
 * alphabet = standard			# 'standard', 'url_safe' or 64 characters.
 * pad = "="					# one character. empty or 'none' for no padding.
 * ignore = "\s\t\r\n"			# characters to skip. \s \t \r \n \\ are escapes.
 * 
 */
class CodecConfig
{
	public:
		static const std::string KEY_ALPHABET;
		static const std::string KEY_PAD;
		static const std::string KEY_IGNORE;

	private:
		std::string m_alphabet_chars;
		bool m_hasPad;
		byte m_pad;
		std::string m_ignore_chars;

	public:
		/**
		 * @brief Standard alphabet with '=' padding, nothing ignored.
		 * 
		 */
		CodecConfig();
		/**
		 * @brief Read configuration file and validate the codec it describes.
		 * Values read before are cleared from ConfigParser first, so keys missing in the file take their defaults.
		 * 
		 * @param path configuration file path
		 * @return Expected<CodecConfig, ErrorCode> config, errno if file cannot be accessed,
		 * or ERR_INVALID_CONFIG, ERR_INVALID_ALPHABET, ERR_INVALID_IGNORE.
		 */
		static Expected<CodecConfig, ErrorCode> FromFile(const std::string &path);
		/**
		 * @brief Build config from the values already read by ConfigParser.
		 * 
		 * @return Expected<CodecConfig, ErrorCode> config or ERR_INVALID_CONFIG, ERR_INVALID_ALPHABET, ERR_INVALID_IGNORE.
		 */
		static Expected<CodecConfig, ErrorCode> FromParser();

		const std::string& AlphabetChars() const { return m_alphabet_chars; }
		bool HasPad() const { return m_hasPad; }
		byte Pad() const { return m_pad; }
		const std::string& IgnoreChars() const { return m_ignore_chars; }

		Alphabet MakeAlphabet() const;
		Codecs MakeCodecs() const;
		DecoderWithIgnore MakeDecoderWithIgnore() const;

	private:
		static std::string unescape(const std::string&);
};

}
}
