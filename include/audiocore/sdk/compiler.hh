/**
 * @file compiler.hh
 * @brief Compiler detection and feature macros
 */
#pragma once

#if defined(__clang__)
#define AUDIOCORE_COMPILER_CLANG
#elif defined(__GNUC__) || defined(__GNUG__)
#define AUDIOCORE_COMPILER_GCC
#elif defined(_MSC_VER)
#define AUDIOCORE_COMPILER_MSVC
#endif

// Loop vectorisation hint used by the mixing loops
#if defined(AUDIOCORE_COMPILER_MSVC)
#define AUDIOCORE_IVDEP __pragma(loop(ivdep))
#elif defined(__INTEL_COMPILER)
#define AUDIOCORE_IVDEP _Pragma("ivdep")
#elif defined(AUDIOCORE_COMPILER_CLANG)
#define AUDIOCORE_IVDEP _Pragma("clang loop vectorize(enable) interleave(enable)")
#elif defined(AUDIOCORE_COMPILER_GCC)
#define AUDIOCORE_IVDEP _Pragma("GCC ivdep")
#else
#define AUDIOCORE_IVDEP
#endif
