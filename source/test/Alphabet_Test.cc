#include <gtest/gtest.h>
#include "Alphabet.hpp"

using b64kit::codec::Alphabet;
using b64kit::utils::ErrorCode;
using b64kit::utils::ErrorCodeExcept;

TEST(AlphabetTest, StandardTest)
{
	Alphabet standard(Alphabet::STANDARD_CHARS, '=');
	EXPECT_EQ('A', standard.At(0));
	EXPECT_EQ('/', standard.At(63));
	EXPECT_TRUE(standard.HasPad());
	EXPECT_EQ('=', standard.Pad());
	EXPECT_STREQ(Alphabet::STANDARD_CHARS, standard.Chars().c_str());

	Alphabet url(Alphabet::URL_SAFE_CHARS);
	EXPECT_EQ('-', url.At(62));
	EXPECT_EQ('_', url.At(63));
	EXPECT_FALSE(url.HasPad());
}

TEST(AlphabetTest, ComparisonTest)
{
	EXPECT_TRUE(Alphabet(Alphabet::STANDARD_CHARS, '=') == Alphabet(Alphabet::STANDARD_CHARS, '='));
	EXPECT_FALSE(Alphabet(Alphabet::STANDARD_CHARS, '=') == Alphabet(Alphabet::STANDARD_CHARS));
	EXPECT_FALSE(Alphabet(Alphabet::STANDARD_CHARS, '=') == Alphabet(Alphabet::STANDARD_CHARS, '.'));
	EXPECT_FALSE(Alphabet(Alphabet::STANDARD_CHARS) == Alphabet(Alphabet::URL_SAFE_CHARS));
}

TEST(AlphabetTest, BrokenTest)
{
	std::string duplicated = Alphabet::STANDARD_CHARS;
	duplicated[1] = 'A';
	EXPECT_THROW(Alphabet{duplicated}, ErrorCodeExcept);
	EXPECT_THROW(Alphabet(duplicated, '='), ErrorCodeExcept);

	EXPECT_THROW(Alphabet(Alphabet::STANDARD_CHARS, '+'), ErrorCodeExcept);
	EXPECT_THROW(Alphabet(Alphabet::URL_SAFE_CHARS, '_'), ErrorCodeExcept);

	EXPECT_THROW(Alphabet{std::string(Alphabet::STANDARD_CHARS).substr(1)}, ErrorCodeExcept);
	EXPECT_THROW(Alphabet{std::string(Alphabet::STANDARD_CHARS) + "!"}, ErrorCodeExcept);
}

TEST(AlphabetTest, ValidateTest)
{
	EXPECT_TRUE(Alphabet::Validate(Alphabet::STANDARD_CHARS, true, '=').isSuccessed());
	EXPECT_TRUE(Alphabet::Validate(Alphabet::URL_SAFE_CHARS, false, '+').isSuccessed());	//pad is not used

	ErrorCode ec = Alphabet::Validate(Alphabet::STANDARD_CHARS, true, '/');
	EXPECT_EQ(ERR_INVALID_ALPHABET, ec.code());
	EXPECT_NE(std::string::npos, ec.message().find("pad character")) << ec.message();

	ec = Alphabet::Validate("ABC", false, 0);
	EXPECT_EQ(ERR_INVALID_ALPHABET, ec.code());

	try
	{
		Alphabet broken("0000000000000000000000000000000000000000000000000000000000000000");
		FAIL() << "duplicated alphabet must not be constructed";
	}
	catch(const ErrorCodeExcept &e)
	{
		EXPECT_EQ(ERR_INVALID_ALPHABET, e.error().code());
	}
}
