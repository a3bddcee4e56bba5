#include <cerrno>
#include "CodecConfig.hpp"
#include "ConfigParser.hpp"
#include "Logger.hpp"

namespace b64kit{
namespace codec{

using utils::ConfigParser;
using utils::Logger;

const std::string CodecConfig::KEY_ALPHABET = "alphabet";
const std::string CodecConfig::KEY_PAD = "pad";
const std::string CodecConfig::KEY_IGNORE = "ignore";

CodecConfig::CodecConfig() : m_alphabet_chars(Alphabet::STANDARD_CHARS), m_hasPad(true), m_pad(DEFAULT_PAD), m_ignore_chars() {}

Expected<CodecConfig, ErrorCode> CodecConfig::FromFile(const std::string &path)
{
	ConfigParser::Clear();		//keys of a former file must not leak into this codec.
	if(!ConfigParser::ReadFile(path))
	{
		ErrorCode ec(errno);
		ec.SetMessage(path);
		Logger::log("Cannot read codec config : " + ec.message_code(), Logger::LogType::error);
		return ec;
	}
	auto config = FromParser();
	if(!config.isSuccessed())
	{
		Logger::log("Codec config rejected(" + path + ") : " + config.error().message_code(), Logger::LogType::error);
		return config;
	}
	Logger::log("Codec loaded from " + path + " (pad : " + (config->HasPad() ? std::string(1, (char)config->Pad()) : "none") + ", " + std::to_string(config->IgnoreChars().length()) + " ignored characters)", Logger::LogType::info);
	return config;
}

Expected<CodecConfig, ErrorCode> CodecConfig::FromParser()
{
	CodecConfig config;

	std::string alphabet = ConfigParser::GetString(KEY_ALPHABET, "standard");
	if(alphabet == "standard")
		config.m_alphabet_chars = Alphabet::STANDARD_CHARS;
	else if(alphabet == "url_safe")
		config.m_alphabet_chars = Alphabet::URL_SAFE_CHARS;
	else if(alphabet.length() == Alphabet::SIZE)
		config.m_alphabet_chars = alphabet;
	else
	{
		ErrorCode ec(ERR_INVALID_CONFIG);
		ec.SetMessage("unknown alphabet '" + alphabet + "'");
		return ec;
	}

	std::string pad = ConfigParser::HasKey(KEY_PAD) ? ConfigParser::GetString(KEY_PAD) : std::string(1, (char)DEFAULT_PAD);
	if(pad.empty() || pad == "none")
		config.m_hasPad = false;
	else if(pad.length() == 1)
	{
		config.m_hasPad = true;
		config.m_pad = (byte)pad[0];
	}
	else
	{
		ErrorCode ec(ERR_INVALID_CONFIG);
		ec.SetMessage("pad must be one character, got '" + pad + "'");
		return ec;
	}

	ErrorCode ec = Alphabet::Validate(config.m_alphabet_chars, config.m_hasPad, config.m_pad);
	if(!ec)
		return ec;

	config.m_ignore_chars = unescape(ConfigParser::GetString(KEY_IGNORE));
	ec = DecoderWithIgnore::ValidateIgnore(config.MakeAlphabet(), config.m_ignore_chars);
	if(!ec)
		return ec;

	return config;
}

Alphabet CodecConfig::MakeAlphabet() const
{
	if(m_hasPad)
		return Alphabet(m_alphabet_chars, m_pad);
	return Alphabet(m_alphabet_chars);
}

Codecs CodecConfig::MakeCodecs() const
{
	return Codecs(MakeAlphabet());
}

DecoderWithIgnore CodecConfig::MakeDecoderWithIgnore() const
{
	return DecoderWithIgnore(MakeAlphabet(), m_ignore_chars);
}

std::string CodecConfig::unescape(const std::string &src)
{
	std::string result;
	for(size_t i = 0;i<src.length();i++)
	{
		if(src[i] != '\\' || i + 1 >= src.length())
		{
			result.push_back(src[i]);
			continue;
		}
		switch(src[++i])
		{
			case 's':	result.push_back(' ');	break;
			case 't':	result.push_back('\t');	break;
			case 'r':	result.push_back('\r');	break;
			case 'n':	result.push_back('\n');	break;
			case '\\':	result.push_back('\\');	break;
			default:
				result.push_back('\\');
				result.push_back(src[i]);
				break;
		}
	}
	return result;
}

}
}
