// ==============================================================================
// Layer 0: Core Utility - Debug Tracing
// ==============================================================================
// Compile-time gated diagnostic output. With ECHO_DSP_DEBUG_TRACE undefined
// or 0 (the default) ECHO_DSP_TRACE expands to nothing and its arguments are
// not evaluated.
//
// Enable from CMake with -DECHO_DSP_DEBUG_TRACE=ON, or define the macro to 1
// before including any EchoDSP header.
// ==============================================================================

#pragma once

#ifndef ECHO_DSP_DEBUG_TRACE
#define ECHO_DSP_DEBUG_TRACE 0
#endif

#if ECHO_DSP_DEBUG_TRACE
#include <cstdarg>
#include <cstddef>
#include <cstdio>
#ifdef _WIN32
#ifndef WIN32_LEAN_AND_MEAN
#define WIN32_LEAN_AND_MEAN
#endif
#ifndef NOMINMAX
#define NOMINMAX
#endif
#include <windows.h>
#endif

namespace Echo::DSP::detail {

inline void debugTrace(const char* fmt, ...) {
    char buf[512];
    const int prefixLen = std::snprintf(buf, sizeof(buf), "[echo-dsp] ");
    va_list args;
    va_start(args, fmt);
    std::vsnprintf(buf + prefixLen, sizeof(buf) - static_cast<size_t>(prefixLen), fmt, args);
    va_end(args);
#ifdef _WIN32
    OutputDebugStringA(buf);
    OutputDebugStringA("\n");
#else
    std::fprintf(stderr, "%s\n", buf);
#endif
}

} // namespace Echo::DSP::detail

#define ECHO_DSP_TRACE(...) ::Echo::DSP::detail::debugTrace(__VA_ARGS__)
#else
#define ECHO_DSP_TRACE(...) ((void)0)
#endif
