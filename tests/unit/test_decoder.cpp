/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file test_decoder.cpp
 * @brief Unit tests for the content codings of response bodies
 */

#include <gtest/gtest.h>

#include <impcurl/decoder.hpp>
#include <impcurl/error.hpp>

#include "compress.hpp"

#include <string>

namespace impcurl::test
{
// ============================================================================
// Fixture
// ============================================================================

class DecoderTest : public ::testing::Test
{
protected:
    const std::string text_{ "The quick brown fox jumps over the lazy dog. The quick brown fox jumps again." };
};

// ============================================================================
// Content-Encoding tokens
// ============================================================================

TEST_F(DecoderTest, TokensAreCaseInsensitive)
{
    EXPECT_EQ(parse_content_encoding("gzip"), content_encoding::gzip);
    EXPECT_EQ(parse_content_encoding(" X-GZIP "), content_encoding::gzip);
    EXPECT_EQ(parse_content_encoding("Deflate"), content_encoding::deflate);
    EXPECT_EQ(parse_content_encoding("br"), content_encoding::brotli);
    EXPECT_EQ(parse_content_encoding("brotli"), content_encoding::brotli);
    EXPECT_EQ(parse_content_encoding(""), content_encoding::identity);
    EXPECT_EQ(parse_content_encoding("identity"), content_encoding::identity);
    EXPECT_EQ(parse_content_encoding("zstd"), content_encoding::unknown);
}

TEST_F(DecoderTest, TokenNames)
{
    EXPECT_STREQ(to_string(content_encoding::brotli), "br");
    EXPECT_STREQ(to_string(content_encoding::gzip), "gzip");
    EXPECT_STREQ(to_string(content_encoding::unknown), "unknown");
}

// ============================================================================
// Single codings
// ============================================================================

TEST_F(DecoderTest, Gzip)
{
    EXPECT_EQ(decode(gzipped(text_), content_encoding::gzip), text_);
}

TEST_F(DecoderTest, DeflateWithItsZlibWrapper)
{
    EXPECT_EQ(decode(deflated(text_, MAX_WBITS), content_encoding::deflate), text_);
}

TEST_F(DecoderTest, RawDeflate)
{
    EXPECT_EQ(decode(deflated(text_, -MAX_WBITS), content_encoding::deflate), text_);
}

TEST_F(DecoderTest, Brotli)
{
    EXPECT_EQ(decode(brotlied(text_), content_encoding::brotli), text_);
}

TEST_F(DecoderTest, LargeBodySpansManyChunks)
{
    std::string big;
    for (int i = 0; i < 20000; ++i) big += std::to_string(i) + ",";

    EXPECT_EQ(decode(gzipped(big), content_encoding::gzip), big);
    EXPECT_EQ(decode(brotlied(big), content_encoding::brotli), big);
}

TEST_F(DecoderTest, IdentityKeepsTheData)
{
    EXPECT_EQ(decode(text_, content_encoding::identity), text_);
}

// ============================================================================
// Failures
// ============================================================================

TEST_F(DecoderTest, CorruptDataThrows)
{
    EXPECT_THROW(decode("definitely not gzip", content_encoding::gzip), decode_error);
    EXPECT_THROW(decode("definitely not brotli", content_encoding::brotli), decode_error);
}

TEST_F(DecoderTest, TruncatedDataThrows)
{
    const auto gz{ gzipped(text_) };
    const auto br{ brotlied(text_) };

    EXPECT_THROW(decode(gz.substr(0, gz.size() / 2), content_encoding::gzip), decode_error);
    EXPECT_THROW(decode(br.substr(0, br.size() / 2), content_encoding::brotli), decode_error);
}

TEST_F(DecoderTest, UnknownCodingThrows)
{
    EXPECT_THROW(decode(text_, content_encoding::unknown), decode_error);
    EXPECT_THROW(decode_body(text_, "compress"), decode_error);
}

// ============================================================================
// Header values
// ============================================================================

TEST_F(DecoderTest, CodingsAreUndoneInReverseOrder)
{
    const auto twice{ brotlied(gzipped(text_)) };

    EXPECT_EQ(decode_body(twice, "gzip, br"), text_);
}

TEST_F(DecoderTest, IdentityTokensAreSkipped)
{
    EXPECT_EQ(decode_body(gzipped(text_), "identity, gzip"), text_);
    EXPECT_EQ(decode_body(text_, "identity"), text_);
}

} // namespace impcurl::test
