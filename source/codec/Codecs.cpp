#include "Codecs.hpp"

namespace b64kit{
namespace codec{

using utils::ErrorCodeExcept;

Codecs::Codecs(const Alphabet &alphabet) : m_alphabet(alphabet), m_encoder(alphabet), m_decoder(alphabet) {}

const Codecs& Codecs::Standard()
{
	static const Codecs codecs(Alphabet(Alphabet::STANDARD_CHARS, DEFAULT_PAD));
	return codecs;
}

const Codecs& Codecs::StandardNoPad()
{
	static const Codecs codecs(Alphabet(Alphabet::STANDARD_CHARS));
	return codecs;
}

const Codecs& Codecs::UrlSafe()
{
	static const Codecs codecs(Alphabet(Alphabet::URL_SAFE_CHARS, DEFAULT_PAD));
	return codecs;
}

const Codecs& Codecs::UrlSafeNoPad()
{
	static const Codecs codecs(Alphabet(Alphabet::URL_SAFE_CHARS));
	return codecs;
}

DecoderWithIgnore Codecs::MakeDecoderWithIgnore(const std::string &ignore) const
{
	return DecoderWithIgnore(m_alphabet, ignore);
}

std::vector<byte> Codecs::DecodeOrThrow(const std::string &str) const
{
	auto result = m_decoder.Decode(str);
	ErrorCodeExcept::ThrowOnFail(result.error(), __STACKINFO__);
	return *result;
}

}
}
