#include <gtest/gtest.h>
#include <algorithm>
#include <random>
#include <openssl/evp.h>
#include "Codecs.hpp"

using b64kit::codec::Codecs;

//OpenSSL's EVP block functions implement the standard alphabet with '=' padding.
TEST(OpenSSLCompatTest, EncodeTest)
{
	std::mt19937 gen(20061010);
	std::uniform_int_distribution<int> dist(0, 255);
	for(size_t len = 0;len<=200;len++)
	{
		std::vector<byte> data(len);
		for(byte &b : data)
			b = (byte)dist(gen);

		std::vector<unsigned char> reference(Codecs::Standard().GetEncoder().CalcSize(len) + 1);
		int ref_len = EVP_EncodeBlock(reference.data(), data.data(), (int)len);
		ASSERT_EQ((size_t)ref_len, Codecs::Standard().GetEncoder().CalcSize(len));

		std::string encoded = Codecs::Standard().Encode(data);
		EXPECT_EQ(std::string((const char*)reference.data(), ref_len), encoded) << len;
	}
}

TEST(OpenSSLCompatTest, DecodeTest)
{
	std::mt19937 gen(4648);
	std::uniform_int_distribution<int> dist(0, 255);
	for(size_t len = 1;len<=200;len++)
	{
		std::vector<byte> data(len);
		for(byte &b : data)
			b = (byte)dist(gen);

		std::vector<unsigned char> encoded(Codecs::Standard().GetEncoder().CalcSize(len) + 1);
		int enc_len = EVP_EncodeBlock(encoded.data(), data.data(), (int)len);

		//EVP_DecodeBlock keeps the zero bytes of padding, so only the prefix is compared.
		std::vector<unsigned char> reference(enc_len / 4 * 3);
		int ref_len = EVP_DecodeBlock(reference.data(), encoded.data(), enc_len);
		ASSERT_GE(ref_len, (int)len);

		auto decoded = Codecs::Standard().Decode(std::string((const char*)encoded.data(), enc_len));
		ASSERT_TRUE(decoded.isSuccessed()) << len;
		ASSERT_EQ(len, decoded->size());
		EXPECT_TRUE(std::equal(decoded->begin(), decoded->end(), reference.begin())) << len;
	}
}
