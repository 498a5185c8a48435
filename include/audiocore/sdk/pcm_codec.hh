/**
 * @file pcm_codec.hh
 * @brief Conversion between canonical float samples and PCM bytes
 * @ingroup sdk_codec
 */

#ifndef AUDIOCORE_SDK_PCM_CODEC_HH
#define AUDIOCORE_SDK_PCM_CODEC_HH

#include <vector>
#include <audiocore/sdk/audio_format.hh>
#include <audiocore/sdk/types.hh>
#include <audiocore/sdk/export_audiocore_sdk.h>

namespace audiocore {

/**
 * @defgroup sdk_codec PCM Codec
 * @ingroup sdk
 * @brief Encoders and decoders for 8/16/24/32-bit integer and 32/64-bit float PCM
 *
 * Internally every sample is a 32-bit float nominally in [-1, 1]. These
 * functions translate that to and from the little-endian byte layouts
 * exchanged with hardware.
 *
 * ## Integer encoding
 *
 * Each sample is first clamped to [-1, 1], then scaled:
 * - signed:   `s * max` where `max = 2^(n-1) - 1`
 * - unsigned: `(s + 1) * (2^n - 1) / 2`
 *
 * and rounded to nearest, ties away from zero. 24-bit packs the low
 * three bytes of the 32-bit intermediate.
 *
 * ## Float encoding
 *
 * 32-bit is the float bit pattern itself; 64-bit widens to double first.
 * Neither scales nor clamps.
 *
 * ## Decoding
 *
 * The numeric inverse of each encoder. Trailing bytes that do not make up
 * a whole sample are ignored.
 *
 * @code
 * std::vector<float> mix = ...;
 * auto wire = pcm::to_pcm(mix, audio_format(16, sample_type::signed_integer));
 * auto back = pcm::from_pcm(wire, audio_format(16, sample_type::signed_integer));
 * @endcode
 * @{
 */
namespace pcm {

    /// Writes `samples` encoded samples to @p dst (dst holds samples * bytes_per_sample bytes)
    using encoder_func_t = void (*)(uint8_t* dst, const float* src, std::size_t samples);

    /// Reads `samples` encoded samples from @p src into @p dst
    using decoder_func_t = void (*)(float* dst, const uint8_t* src, std::size_t samples);

    /**
     * @brief Look up the non-allocating encoder for a format
     *
     * Intended for render callbacks that convert into a device buffer.
     * @throws out_of_range_error / format_error like to_pcm()
     */
    AUDIOCORE_SDK_EXPORT encoder_func_t get_encoder(unsigned bit_depth, bool is_signed, bool floating_point);
    AUDIOCORE_SDK_EXPORT encoder_func_t get_encoder(const audio_format& fmt);

    /**
     * @brief Look up the non-allocating decoder for a format
     * @throws out_of_range_error / format_error like from_pcm()
     */
    AUDIOCORE_SDK_EXPORT decoder_func_t get_decoder(unsigned bit_depth, bool is_signed, bool floating_point);
    AUDIOCORE_SDK_EXPORT decoder_func_t get_decoder(const audio_format& fmt);

    /**
     * @brief Encode samples at the requested depth and representation
     *
     * @param samples Canonical float samples
     * @param count Number of samples
     * @param bit_depth 8, 16, 24 or 32 for integers; 32 or 64 for floats
     * @param is_signed Integer signedness (ignored for floats)
     * @param floating_point Select the float encoders
     *
     * @throws out_of_range_error if the depth is outside [8, 32] (integer)
     *         or [32, 64] (float)
     * @throws format_error if the depth is in range but not a supported width
     */
    AUDIOCORE_SDK_EXPORT std::vector<uint8_t> to_pcm(const float* samples, std::size_t count,
                                                     unsigned bit_depth, bool is_signed,
                                                     bool floating_point = false);
    AUDIOCORE_SDK_EXPORT std::vector<uint8_t> to_pcm(const std::vector<float>& samples,
                                                     const audio_format& fmt);

    /**
     * @brief Decode PCM bytes back to canonical float samples
     *
     * Produces `size / bytes_per_sample` samples; any remainder is not consumed.
     * @throws out_of_range_error / format_error like to_pcm()
     */
    AUDIOCORE_SDK_EXPORT std::vector<float> from_pcm(const uint8_t* bytes, std::size_t size,
                                                     unsigned bit_depth, bool is_signed,
                                                     bool floating_point = false);
    AUDIOCORE_SDK_EXPORT std::vector<float> from_pcm(const std::vector<uint8_t>& bytes,
                                                     const audio_format& fmt);

    /// Bytes one encoded sample occupies, after the same validation as to_pcm()
    AUDIOCORE_SDK_EXPORT std::size_t bytes_per_sample(unsigned bit_depth, bool floating_point);

    // Width-specific helpers. 8-bit defaults to unsigned, the others to signed.
    AUDIOCORE_SDK_EXPORT std::vector<uint8_t> to_8bit(const std::vector<float>& samples, bool is_signed = false);
    AUDIOCORE_SDK_EXPORT std::vector<uint8_t> to_16bit(const std::vector<float>& samples, bool is_signed = true);
    AUDIOCORE_SDK_EXPORT std::vector<uint8_t> to_24bit(const std::vector<float>& samples, bool is_signed = true);
    AUDIOCORE_SDK_EXPORT std::vector<uint8_t> to_32bit(const std::vector<float>& samples, bool is_signed = true);
    AUDIOCORE_SDK_EXPORT std::vector<uint8_t> to_float(const std::vector<float>& samples);
    AUDIOCORE_SDK_EXPORT std::vector<uint8_t> to_double(const std::vector<float>& samples);

    AUDIOCORE_SDK_EXPORT std::vector<float> from_8bit(const std::vector<uint8_t>& bytes, bool is_signed = false);
    AUDIOCORE_SDK_EXPORT std::vector<float> from_16bit(const std::vector<uint8_t>& bytes, bool is_signed = true);
    AUDIOCORE_SDK_EXPORT std::vector<float> from_24bit(const std::vector<uint8_t>& bytes, bool is_signed = true);
    AUDIOCORE_SDK_EXPORT std::vector<float> from_32bit(const std::vector<uint8_t>& bytes, bool is_signed = true);
    AUDIOCORE_SDK_EXPORT std::vector<float> from_float(const std::vector<uint8_t>& bytes);
    AUDIOCORE_SDK_EXPORT std::vector<float> from_double(const std::vector<uint8_t>& bytes);

} // namespace pcm

/** @} */ // end of sdk_codec group

} // namespace audiocore

#endif // AUDIOCORE_SDK_PCM_CODEC_HH
