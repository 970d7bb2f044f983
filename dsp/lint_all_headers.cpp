// ==============================================================================
// EchoDSP Lint Stub - Strict clang-tidy analysis of all public headers
// ==============================================================================
// This file exists solely to give clang-tidy a .cpp translation unit that
// includes every public DSP header, so header-only code is analyzed even when
// no test includes it directly.
//
// This file is NOT part of the EchoDSP library itself; it is compiled as a
// separate OBJECT library target (dsp_lint_stub) for compile_commands.json.
// ==============================================================================

// Layer 0: Core
#include <echo/dsp/core/complex_number.h>
#include <echo/dsp/core/debug_trace.h>
#include <echo/dsp/core/dsp_errors.h>
#include <echo/dsp/core/math_constants.h>
#include <echo/dsp/core/power_of_two.h>
#include <echo/dsp/core/spectral_simd.h>

// Layer 1: Primitives
#include <echo/dsp/primitives/fft.h>
#include <echo/dsp/primitives/signal.h>
#include <echo/dsp/primitives/signal_2d.h>

// Layer 2: Processors
#include <echo/dsp/processors/spectral_correlation.h>
