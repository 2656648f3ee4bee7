/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file error.hpp
 * @brief Exceptions thrown (or carried by futures) by the impcurl library
 *
 * Every error derives from impcurl::error, which is a std::runtime_error.
 * When the failure comes from the native layer, the native code is available through error::code()
 * and the native human-readable string is part of what().
 * @author impcurl contributors
 */

#ifndef INCLUDE_IMPCURL_ERROR_H
#define INCLUDE_IMPCURL_ERROR_H

#include <stdexcept>
#include <string>

namespace impcurl
{
/*********************************************************************************************************************/
class error : public std::runtime_error
{
private:
    int code__{ 0 };

public:
    explicit error(const std::string& what, int code = 0)
      : std::runtime_error{ what }
      , code__{ code }
    {}

    int code() const noexcept { return code__; }
};

/**
 * @brief init_error - A native session (easy or multi) could not be allocated
 */
class init_error : public error
{
public:
    using error::error;
};

/**
 * @brief attach_error - The multi session refused to take control of a transfer
 * The handle is left untouched and can still be used on its own (\see handle::perform)
 */
class attach_error : public error
{
public:
    using error::error;
};

/**
 * @brief option_error - An option was rejected, either by impcurl or by the native layer
 */
class option_error : public error
{
private:
    std::string option__;

public:
    option_error(const std::string& option, const std::string& what, int code = 0)
      : error{ "failed to set option " + option + ": " + what, code }
      , option__{ option }
    {}

    const std::string& option() const noexcept { return option__; }
};

/**
 * @brief transfer_error - A transfer completed with a non-zero native result code
 */
class transfer_error : public error
{
public:
    using error::error;
};

/**
 * @brief cancelled_error - A pending transfer was removed from its multi session before completion
 */
class cancelled_error : public error
{
public:
    using error::error;
};

/**
 * @brief closed_error - The multi session has been closed
 */
class closed_error : public error
{
public:
    using error::error;
};

/**
 * @brief too_many_redirects_error - The redirect ceiling of a request was reached
 */
class too_many_redirects_error : public error
{
public:
    using error::error;
};

/**
 * @brief decode_error - A response body could not be decoded with its content coding
 */
class decode_error : public error
{
public:
    using error::error;
};

} // namespace impcurl

#endif // INCLUDE_IMPCURL_ERROR_H
