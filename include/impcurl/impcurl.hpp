/**
 * Copyright (C) 2026 impcurl contributors - All Rights Reserved
 * Unauthorized copying of this file, via any medium is strictly prohibited
 * Proprietary and confidential
 */

/**
 * @file impcurl.hpp
 * @brief The only inclusion header you will need
 * @author impcurl contributors
 */

#ifndef INCLUDE_IMPCURL_IMPCURL_H
#define INCLUDE_IMPCURL_IMPCURL_H

#include "browser.hpp"
#include "config.hpp"
#include "decoder.hpp"
#include "error.hpp"
#include "handle.hpp"
#include "logger.hpp"
#include "mhandle.hpp"
#include "request.hpp"

#endif // INCLUDE_IMPCURL_IMPCURL_H
