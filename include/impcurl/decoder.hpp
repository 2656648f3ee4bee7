/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file decoder.hpp
 * @brief Content codings of HTTP response bodies (gzip, deflate, br)
 *
 * libcurl decodes the body itself when CURLOPT_ACCEPT_ENCODING is set. These helpers decode the bodies it did not.
 * @author impcurl contributors
 */

#ifndef INCLUDE_IMPCURL_DECODER_H
#define INCLUDE_IMPCURL_DECODER_H

#include <cstddef>
#include <string>
#include <string_view>

namespace impcurl
{
enum class content_encoding
{
    identity,
    gzip,
    deflate,
    brotli,
    unknown
};

/*!< Larger decoded bodies are a decode_error */
constexpr std::size_t MAX_DECODED_SIZE{ 256 * 1024 * 1024 };

content_encoding parse_content_encoding(std::string_view value);
const char*      to_string(content_encoding enc) noexcept;

std::string decode(std::string_view data, content_encoding enc);
std::string decode_body(std::string_view data, std::string_view content_encoding_header);

} // namespace impcurl

#endif // INCLUDE_IMPCURL_DECODER_H
