/**
 * @file rotor_version.hpp
 * @brief Version information for logrotor
 * @author dorgby.net
 * @copyright Copyright (c) 2025 dorgby.net. Licensed under MIT License, see LICENSE for details.
 */
#pragma once

namespace logrotor
{

#ifndef LOGROTOR_VERSION_STRING
    #define LOGROTOR_VERSION_STRING "dev"
#endif

inline constexpr const char *VERSION = LOGROTOR_VERSION_STRING;

} // namespace logrotor
