#pragma once

// SDL headers trip the project's cast warnings
#include <audiocore/sdk/compiler.hh>

#if defined(AUDIOCORE_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#elif defined(AUDIOCORE_COMPILER_CLANG)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#elif defined(AUDIOCORE_COMPILER_MSVC)
# pragma warning(push)
# pragma warning(disable : 4820)
#endif

#include <SDL3/SDL.h>

#if defined(AUDIOCORE_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(AUDIOCORE_COMPILER_CLANG)
# pragma clang diagnostic pop
#elif defined(AUDIOCORE_COMPILER_MSVC)
# pragma warning(pop)
#endif
