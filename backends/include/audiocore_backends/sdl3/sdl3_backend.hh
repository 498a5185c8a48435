/**
 * @file sdl3_backend.hh
 * @brief SDL3 audio backend factory
 * @ingroup backends
 */

#ifndef AUDIOCORE_BACKENDS_SDL3_BACKEND_HH
#define AUDIOCORE_BACKENDS_SDL3_BACKEND_HH

#include <memory>
#include <audiocore/sdk/audio_backend.hh>

// Include generated export header
#include "export_audiocore_backend_sdl3.h"

namespace audiocore {

/**
 * @defgroup sdl3_backend SDL3 Audio Backend
 * @ingroup backends
 * @brief Playback and recording through SDL3's audio streams
 *
 * Every device_output and device_input opens its own logical SDL device
 * and binds one SDL_AudioStream to it. SDL converts between the stream's
 * wire format and whatever the hardware runs at, so the pipeline never
 * sees the native format.
 *
 * Wire formats SDL can carry: u8, s8, s16, s32 and f32. Other audio_format
 * values are rejected when the stream is created.
 *
 * @{
 */

/**
 * @brief Create an SDL3 audio backend instance
 * @return New, uninitialised backend
 *
 * ## Usage Example
 *
 * @code
 * #include <audiocore_backends/sdl3/sdl3_backend.hh>
 * #include <audiocore/device_output.hh>
 *
 * std::shared_ptr<audiocore::audio_backend> backend = audiocore::create_sdl3_backend();
 * backend->init();
 * audiocore::device_output speakers(backend, audiocore::audio_spec{});
 * @endcode
 *
 * ## Configuration
 *
 * SDL3 honours its environment variables, e.g.:
 * - `SDL_AUDIO_DRIVER`: force a specific driver
 * - `SDL_AUDIO_DEVICE_SAMPLE_FRAMES`: hardware period in frames
 */
AUDIOCORE_BACKEND_SDL3_EXPORT std::unique_ptr<audio_backend> create_sdl3_backend();

/** @} */ // end of sdl3_backend group

} // namespace audiocore

#endif // AUDIOCORE_BACKENDS_SDL3_BACKEND_HH
