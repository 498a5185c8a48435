/**
 * @file example_common.hh
 * @brief Common utilities for audiocore examples
 *
 * Picks the SDL3 backend when it is built, the null backend otherwise.
 */

#ifndef AUDIOCORE_EXAMPLE_COMMON_HH
#define AUDIOCORE_EXAMPLE_COMMON_HH

#include <iostream>
#include <memory>
#include <audiocore/sdk/audio_backend.hh>

#ifdef AUDIOCORE_USE_SDL3_BACKEND
#include <audiocore_backends/sdl3/sdl3_backend.hh>
#else
#include <audiocore/backends/null/null_backend.hh>
#endif

namespace audiocore {
    namespace examples {
        /**
         * @brief Create and initialise the backend chosen at build time
         */
        inline std::shared_ptr <audio_backend> create_default_backend() {
#ifdef AUDIOCORE_USE_SDL3_BACKEND
            std::shared_ptr <audio_backend> backend(create_sdl3_backend());
#else
            std::shared_ptr <audio_backend> backend = std::make_shared <null_backend>();
#endif
            backend->init();
            std::cout << "Using " << backend->get_name() << " backend" << std::endl;
            return backend;
        }
    } // namespace examples
} // namespace audiocore

#endif // AUDIOCORE_EXAMPLE_COMMON_HH
