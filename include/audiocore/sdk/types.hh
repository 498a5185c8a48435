/**
 * @file types.hh
 * @brief Platform-independent type definitions
 * @ingroup sdk_types
 */

#ifndef AUDIOCORE_SDK_TYPES_HH
#define AUDIOCORE_SDK_TYPES_HH

#include <cstdint>
#include <cstddef>

namespace audiocore {

/**
 * @defgroup sdk_types Type Definitions
 * @ingroup sdk
 * @brief Core type definitions for audio processing
 *
 * Audio quantities get their own aliases so that signatures read as
 * what they carry: `sample_rate_t rate` rather than `unsigned rate`.
 *
 * @code
 * sample_rate_t rate = 48000;
 * channels_t channels = 2;
 * frames_t period = 1024;        // 1024 frames == 2048 samples in stereo
 * @endcode
 *
 * @{
 */

/**
 * @typedef sample_rate_t
 * @brief Number of frames per second (Hz)
 *
 * Common values: 8000 (telephony), 44100 (CD), 48000 (professional),
 * 96000 / 192000 (high resolution). Zero is never a valid rate.
 */
using sample_rate_t = uint32_t;

/**
 * @typedef channels_t
 * @brief Number of interleaved channels in a frame
 *
 * Range: 1 to 255. Zero is never a valid channel count.
 */
using channels_t = uint8_t;

/**
 * @typedef frames_t
 * @brief A count of frames (one sample per channel at one instant)
 */
using frames_t = std::size_t;

/**
 * @typedef device_id_t
 * @brief Backend-assigned identifier of a physical audio endpoint
 *
 * The value 0 is reserved and means "the default device".
 */
using device_id_t = uint32_t;

/// Reserved device id selecting the system default endpoint
inline constexpr device_id_t default_device_id = 0;

/** @} */ // end of sdk_types group

} // namespace audiocore

#endif // AUDIOCORE_SDK_TYPES_HH
