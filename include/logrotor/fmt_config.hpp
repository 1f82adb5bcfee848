/**
 * @file fmt_config.hpp
 * @brief Configuration for fmt library to be used in header-only mode
 *
 * logrotor ships as headers only; fmt is pulled in the same way so users
 * do not need to link a compiled fmt.
 */
#pragma once

// Enable fmt header-only mode
#ifndef FMT_HEADER_ONLY
#define FMT_HEADER_ONLY
#endif

#include <fmt/format.h>
