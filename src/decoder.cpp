/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

#include <impcurl/decoder.hpp>
#include <impcurl/error.hpp>

#include <brotli/decode.h>
#include <zlib.h>

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <memory>
#include <vector>

namespace impcurl
{
namespace
{
constexpr std::size_t CHUNK_SIZE{ 16 * 1024 };

std::string
normalize(std::string_view value)
{
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.front()))) value.remove_prefix(1);
    while (!value.empty() && std::isspace(static_cast<unsigned char>(value.back()))) value.remove_suffix(1);

    std::string ret;
    ret.reserve(value.size());
    for (auto c : value) ret += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    return ret;
}

/**
 * @brief inflate_with - Run zlib over a whole body
 * @param window_bits 16 + MAX_WBITS for gzip, MAX_WBITS for zlib-wrapped deflate, -MAX_WBITS for raw deflate
 *
 * @throw decode_error carrying the zlib result code
 */
std::string
inflate_with(std::string_view data, int window_bits)
{
    z_stream strm{};
    if (auto rc{ inflateInit2(&strm, window_bits) }; Z_OK != rc)
        throw decode_error("zlib initialization failed", rc);

    std::unique_ptr<z_stream, decltype(&inflateEnd)> guard{ &strm, &inflateEnd };

    strm.next_in  = reinterpret_cast<Bytef*>(const_cast<char*>(data.data()));
    strm.avail_in = static_cast<uInt>(data.size());

    std::string ret;
    char        chunk[CHUNK_SIZE];
    for (;;)
    {
        strm.next_out  = reinterpret_cast<Bytef*>(chunk);
        strm.avail_out = static_cast<uInt>(sizeof(chunk));

        const auto rc{ inflate(&strm, Z_NO_FLUSH) };
        ret.append(chunk, sizeof(chunk) - strm.avail_out);

        if (ret.size() > MAX_DECODED_SIZE) throw decode_error("decoded body exceeds the size limit", Z_MEM_ERROR);
        if (Z_STREAM_END == rc) return ret;
        if (Z_OK == rc) continue;

        // No progress possible: the input ended before the stream did
        if (Z_BUF_ERROR == rc && 0 == strm.avail_in) throw decode_error("truncated compressed body", rc);
        throw decode_error(std::string{ "zlib: " } + ((nullptr != strm.msg) ? strm.msg : "inflate failed"), rc);
    }
}

std::string
unbrotli(std::string_view data)
{
    std::unique_ptr<BrotliDecoderState, decltype(&BrotliDecoderDestroyInstance)> state{
        BrotliDecoderCreateInstance(nullptr, nullptr, nullptr), &BrotliDecoderDestroyInstance
    };
    if (nullptr == state) throw decode_error("brotli decoder creation failed");

    auto        next_in{ reinterpret_cast<const uint8_t*>(data.data()) };
    std::size_t avail_in{ data.size() };

    std::string ret;
    uint8_t     chunk[CHUNK_SIZE];
    for (;;)
    {
        auto        next_out{ chunk };
        std::size_t avail_out{ sizeof(chunk) };

        const auto rc{ BrotliDecoderDecompressStream(state.get(), &avail_in, &next_in, &avail_out, &next_out, nullptr) };
        ret.append(reinterpret_cast<const char*>(chunk), sizeof(chunk) - avail_out);

        if (ret.size() > MAX_DECODED_SIZE) throw decode_error("decoded body exceeds the size limit");
        switch (rc)
        {
            case BROTLI_DECODER_RESULT_SUCCESS:
                return ret;
            case BROTLI_DECODER_RESULT_NEEDS_MORE_OUTPUT:
                continue;
            case BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT:
                throw decode_error("truncated brotli body");
            default:
                throw decode_error(std::string{ "brotli: " }
                                     + BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state.get())));
        }
    }
}

} // namespace

/**
 * @brief parse_content_encoding - Map one content coding token to its enumeration value
 *
 * An empty token is identity. Matching is case-insensitive and ignores surrounding spaces.
 */
content_encoding
parse_content_encoding(std::string_view value)
{
    const auto v{ normalize(value) };

    if (v.empty() || "identity" == v) return content_encoding::identity;
    if ("gzip" == v || "x-gzip" == v) return content_encoding::gzip;
    if ("deflate" == v) return content_encoding::deflate;
    if ("br" == v || "brotli" == v) return content_encoding::brotli;
    return content_encoding::unknown;
}

const char*
to_string(content_encoding enc) noexcept
{
    switch (enc)
    {
        case content_encoding::identity:
            return "identity";
        case content_encoding::gzip:
            return "gzip";
        case content_encoding::deflate:
            return "deflate";
        case content_encoding::brotli:
            return "br";
        default:
            return "unknown";
    }
}

/**
 * @brief decode - Decode a body compressed with a single content coding
 *
 * deflate is accepted with or without its zlib wrapper, as servers send both.
 *
 * @throw decode_error on corrupt or truncated data, on an unknown coding, or past MAX_DECODED_SIZE
 */
std::string
decode(std::string_view data, content_encoding enc)
{
    switch (enc)
    {
        case content_encoding::identity:
            return std::string{ data };
        case content_encoding::gzip:
            return inflate_with(data, 16 + MAX_WBITS);
        case content_encoding::deflate:
            try
            {
                return inflate_with(data, MAX_WBITS);
            }
            catch (const decode_error& e)
            {
                if (Z_DATA_ERROR != e.code()) throw;
                return inflate_with(data, -MAX_WBITS);
            }
        case content_encoding::brotli:
            return unbrotli(data);
        default:
            throw decode_error("unsupported content coding");
    }
}

/**
 * @brief decode_body - Decode a body with the value of its Content-Encoding header
 *
 * Codings are listed in the order they were applied, so they are undone from the last one.
 *
 * @throw decode_error (\see decode)
 */
std::string
decode_body(std::string_view data, std::string_view content_encoding_header)
{
    std::vector<content_encoding> codings;
    for (std::string_view rest{ content_encoding_header }; !rest.empty();)
    {
        const auto comma{ rest.find(',') };
        const auto token{ rest.substr(0, comma) };
        rest = (std::string_view::npos == comma) ? std::string_view{} : rest.substr(comma + 1);

        const auto enc{ parse_content_encoding(token) };
        if (content_encoding::unknown == enc)
            throw decode_error("unsupported content coding \"" + normalize(token) + "\"");
        if (content_encoding::identity != enc) codings.push_back(enc);
    }

    std::string ret{ data };
    std::for_each(std::rbegin(codings), std::rend(codings), [&ret](content_encoding enc) { ret = decode(ret, enc); });
    return ret;
}

} // namespace impcurl
