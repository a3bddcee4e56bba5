#include <gtest/gtest.h>
#include <random>
#include "Codecs.hpp"

using b64kit::codec::Codecs;
using b64kit::codec::Alphabet;
using b64kit::codec::DecoderWithIgnore;
using b64kit::utils::ErrorCode;
using b64kit::utils::ErrorCodeExcept;

static std::string DecodeToString(const DecoderWithIgnore &decoder, const std::string &encoded)
{
	std::vector<byte> buffer(decoder.CalcSizeUpperBound(encoded.size()));
	auto written = decoder.Decode(buffer.data(), buffer.size(), (const byte*)encoded.data(), encoded.size());
	EXPECT_TRUE(written.isSuccessed()) << "'" << encoded << "' : " << written.error().message_code();
	EXPECT_LE(written.value_or(0), buffer.size());
	return std::string(buffer.begin(), buffer.begin() + written.value_or(0));
}

static int DecodeError(const DecoderWithIgnore &decoder, const std::string &encoded, size_t dest_len = 0x100)
{
	std::vector<byte> buffer(dest_len);
	auto written = decoder.Decode(buffer.data(), buffer.size(), (const byte*)encoded.data(), encoded.size());
	EXPECT_FALSE(written.isSuccessed()) << "'" << encoded << "' decoded into " << written.value_or(0) << " bytes";
	return written.error().code();
}

TEST(DecoderWithIgnoreTest, IgnoreNothingTest)
{
	DecoderWithIgnore decoder = Codecs::Standard().MakeDecoderWithIgnore("");
	EXPECT_STREQ("", DecodeToString(decoder, "").c_str());
	EXPECT_STREQ("f", DecodeToString(decoder, "Zg==").c_str());
	EXPECT_STREQ("fo", DecodeToString(decoder, "Zm8=").c_str());
	EXPECT_STREQ("foo", DecodeToString(decoder, "Zm9v").c_str());
	EXPECT_STREQ("foobar", DecodeToString(decoder, "Zm9vYmFy").c_str());
	EXPECT_STREQ("foobarfoobarfoob", DecodeToString(decoder, "Zm9vYmFyZm9vYmFyZm9vYg==").c_str());
}

TEST(DecoderWithIgnoreTest, IgnoreSpaceTest)
{
	DecoderWithIgnore decoder = Codecs::Standard().MakeDecoderWithIgnore(" ");
	EXPECT_STREQ("", DecodeToString(decoder, " ").c_str());
	EXPECT_STREQ("f", DecodeToString(decoder, "Z g= =").c_str());
	EXPECT_STREQ("fo", DecodeToString(decoder, "    Zm8=").c_str());
	EXPECT_STREQ("foo", DecodeToString(decoder, "Zm9v    ").c_str());
	EXPECT_STREQ("foob", DecodeToString(decoder, "Zm9vYg = = ").c_str());
	EXPECT_STREQ("fooba", DecodeToString(decoder, "Zm9v YmE=").c_str());
	EXPECT_STREQ("foobar", DecodeToString(decoder, " Z m 9 v Y m F y ").c_str());
}

TEST(DecoderWithIgnoreTest, UnpaddedIgnoreSpaceTest)
{
	DecoderWithIgnore decoder = Codecs::UrlSafeNoPad().MakeDecoderWithIgnore(" ");
	EXPECT_STREQ("", DecodeToString(decoder, " ").c_str());
	EXPECT_STREQ("f", DecodeToString(decoder, "Z g ").c_str());
	EXPECT_STREQ("fo", DecodeToString(decoder, "    Zm8").c_str());
	EXPECT_STREQ("foo", DecodeToString(decoder, "Zm9v    ").c_str());
	EXPECT_STREQ("foob", DecodeToString(decoder, "Zm9vYg   ").c_str());
	EXPECT_STREQ("fooba", DecodeToString(decoder, "Zm9v YmE").c_str());
	EXPECT_STREQ("foobar", DecodeToString(decoder, " Z m 9 v Y m F y ").c_str());
}

TEST(DecoderWithIgnoreTest, MimeTest)
{
	DecoderWithIgnore decoder = Codecs::Standard().MakeDecoderWithIgnore("\r\n");
	std::string plain = "The Quick Brown Fox Jumps Over The Lazy Dog";
	EXPECT_EQ(plain, DecodeToString(decoder, "VGhlIFF1aWNrIEJyb3duIEZveCBK\r\ndW1wcyBPdmVyIFRoZSBMYXp5IERvZw==\r\n"));
}

TEST(DecoderWithIgnoreTest, PaddedErrorTest)
{
	DecoderWithIgnore decoder = Codecs::Standard().MakeDecoderWithIgnore(" ");
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "A"));
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "AA"));
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "AAA"));
	EXPECT_EQ(ERR_INVALID_CHARACTER, DecodeError(decoder, "A..A"));
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "AA=A"));
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "AA/="));
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "A/=="));
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "A==="));
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "===="));
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "Zg= "));
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "Zm8= ="));
	EXPECT_EQ(ERR_INVALID_CHARACTER, DecodeError(decoder, "Zg=\t="));
	EXPECT_EQ(ERR_INVALID_CHARACTER, DecodeError(decoder, "Zm9vYmFyZm9vYmFyA..A"));
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "Zm9vYmFyZm9vYmFyAA=A"));
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "Zm9vYmFyZm9vYmFyA==="));
	EXPECT_EQ(ERR_INVALID_CHARACTER, DecodeError(decoder, "A..AZm9vYmFyZm9vYmFy"));
}

TEST(DecoderWithIgnoreTest, UnpaddedErrorTest)
{
	DecoderWithIgnore decoder = Codecs::UrlSafeNoPad().MakeDecoderWithIgnore(" ");
	EXPECT_EQ(ERR_INVALID_PADDING, DecodeError(decoder, "A"));
	EXPECT_EQ(ERR_INVALID_CHARACTER, DecodeError(decoder, "AAA="));
	EXPECT_EQ(ERR_INVALID_CHARACTER, DecodeError(decoder, "A..A"));
	EXPECT_EQ(ERR_INVALID_CHARACTER, DecodeError(decoder, "AA=A"));
	EXPECT_EQ(ERR_INVALID_CHARACTER, DecodeError(decoder, "AA/="));
	EXPECT_EQ(ERR_INVALID_CHARACTER, DecodeError(decoder, "===="));
	EXPECT_EQ(ERR_INVALID_CHARACTER, DecodeError(decoder, "Zm9vYmFyZm9vYmFyA..A"));
}

TEST(DecoderWithIgnoreTest, NoSpaceLeftTest)
{
	//one byte short of the exact size
	DecoderWithIgnore padded = Codecs::Standard().MakeDecoderWithIgnore(" ");
	for(std::string encoded : {"AA==", "AAA=", "AAAA", "AAAAAA=="})
	{
		size_t exact = *Codecs::Standard().GetDecoder().CalcSizeForSlice(encoded);
		EXPECT_EQ(ERR_NO_SPACE_LEFT, DecodeError(padded, encoded, exact - 1)) << encoded;
	}
	DecoderWithIgnore unpadded = Codecs::UrlSafeNoPad().MakeDecoderWithIgnore(" ");
	for(std::string encoded : {"AA", "AAA", "AAAA", "AAAAAA"})
	{
		size_t exact = *Codecs::UrlSafeNoPad().GetDecoder().CalcSizeForSlice(encoded);
		EXPECT_EQ(ERR_NO_SPACE_LEFT, DecodeError(unpadded, encoded, exact - 1)) << encoded;
	}

	//a whole group with no room at all
	EXPECT_EQ(ERR_NO_SPACE_LEFT, DecodeError(padded, "AAAA", 0));
	EXPECT_EQ(ERR_NO_SPACE_LEFT, DecodeError(padded, "AAAAAAAAAAAAAAAA", 4));
	EXPECT_EQ(ERR_NO_SPACE_LEFT, DecodeError(unpadded, "AAAAAAAAAAAAAAAA", 4));
}

TEST(DecoderWithIgnoreTest, UpperBoundTest)
{
	DecoderWithIgnore padded = Codecs::Standard().MakeDecoderWithIgnore(" ");
	DecoderWithIgnore unpadded = Codecs::StandardNoPad().MakeDecoderWithIgnore(" ");
	EXPECT_EQ(3u, padded.CalcSizeUpperBound(4));		//pad characters are not subtracted
	EXPECT_EQ(3u, padded.CalcSizeUpperBound(6));		//and odd lengths are not rejected
	EXPECT_EQ(4u, unpadded.CalcSizeUpperBound(6));
	EXPECT_EQ(5u, unpadded.CalcSizeUpperBound(7));
}

TEST(DecoderWithIgnoreTest, ConstructTest)
{
	EXPECT_THROW(Codecs::Standard().MakeDecoderWithIgnore("A"), ErrorCodeExcept);		//in alphabet
	EXPECT_THROW(Codecs::Standard().MakeDecoderWithIgnore(" ="), ErrorCodeExcept);		//pad character
	EXPECT_THROW(Codecs::Standard().MakeDecoderWithIgnore("  "), ErrorCodeExcept);		//duplicated
	EXPECT_NO_THROW(Codecs::StandardNoPad().MakeDecoderWithIgnore("="));				//no pad character to collide
	EXPECT_THROW(Codecs::UrlSafe().MakeDecoderWithIgnore("-"), ErrorCodeExcept);
	EXPECT_NO_THROW(Codecs::UrlSafe().MakeDecoderWithIgnore("+/"));

	ErrorCode ec = DecoderWithIgnore::ValidateIgnore(Codecs::Standard().GetAlphabet(), "\n=");
	EXPECT_EQ(ERR_INVALID_IGNORE, ec.code());
	EXPECT_TRUE(DecoderWithIgnore::ValidateIgnore(Codecs::Standard().GetAlphabet(), " \t\r\n").isSuccessed());
}

TEST(DecoderWithIgnoreTest, InsertionTest)
{
	//Ignored characters anywhere must not change the result.
	std::mt19937 gen(20061017);
	std::uniform_int_distribution<int> value(0, 255);
	const std::string ignore = " \t\r\n";
	for(const Codecs *codecs : {&Codecs::Standard(), &Codecs::StandardNoPad(), &Codecs::UrlSafe(), &Codecs::UrlSafeNoPad()})
	{
		DecoderWithIgnore decoder = codecs->MakeDecoderWithIgnore(ignore);
		for(size_t len = 0;len<64;len++)
		{
			std::vector<byte> data(len);
			for(byte &b : data)
				b = (byte)value(gen);
			std::string encoded = codecs->Encode(data);

			std::string noisy;
			std::uniform_int_distribution<int> count(0, 2);
			for(char c : encoded)
			{
				for(int i = count(gen);i>0;i--)
					noisy.push_back(ignore[value(gen) % ignore.length()]);
				noisy.push_back(c);
			}
			noisy.push_back('\n');

			auto decoded = decoder.Decode(noisy);
			ASSERT_TRUE(decoded.isSuccessed()) << noisy << " : " << decoded.error().message_code();
			EXPECT_EQ(data, *decoded) << noisy;
		}
	}
}
