#ifndef RC_DEBUG_HPP
#define RC_DEBUG_HPP

/**
 * @file rc_debug.hpp
 * @brief Debug logging macro for the range coder
 * 
 * This header provides compile-time debug logging support.
 * To enable debug logging, define RC_DEBUG before including this header
 * (the RC_ENABLE_DEBUG_LOG CMake option does this for the library):
 *   #define RC_DEBUG
 *   #include "rc_debug.hpp"
 */

#ifdef RC_DEBUG
#include <iostream>
#include <sstream>

/**
 * @brief Macro for debug logging
 * 
 * Usage: RC_DEBUG_LOG("rng=" << rng << " cnt=" << cnt);
 * 
 * When RC_DEBUG is defined, this macro outputs to stderr.
 * When RC_DEBUG is not defined, this macro compiles to nothing and the
 * streamed expression is never evaluated.
 */
#define RC_DEBUG_LOG(msg) do { \
    std::ostringstream _oss; \
    _oss << "[RC_DEBUG] " << msg; \
    std::cerr << _oss.str() << std::endl; \
} while(0)

#else
#define RC_DEBUG_LOG(msg) ((void)0)
#endif

#endif // RC_DEBUG_HPP
