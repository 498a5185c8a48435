/**
 * @file audio_format.hh
 * @brief Sample encoding descriptions
 * @ingroup sdk_audio_format
 */

#ifndef AUDIOCORE_SDK_AUDIO_FORMAT_HH
#define AUDIOCORE_SDK_AUDIO_FORMAT_HH

#include <audiocore/sdk/types.hh>
#include <audiocore/sdk/export_audiocore_sdk.h>
#include <iosfwd>

namespace audiocore {

/**
 * @defgroup sdk_audio_format Audio Formats
 * @ingroup sdk
 * @brief Describes how one sample is laid out on the wire
 * @{
 */

/**
 * @enum sample_type
 * @brief Numeric representation of a PCM sample
 */
enum class sample_type : uint8_t {
    signed_integer,     ///< Two's complement, silence at 0
    unsigned_integer,   ///< Offset binary, silence at mid-scale
    floating_point      ///< IEEE-754, nominal range [-1, 1]
};

/**
 * @class audio_format
 * @brief Bit depth plus sample type, validated on construction
 *
 * Valid combinations:
 * - floating point: 32 or 64 bits
 * - integer (signed or unsigned): 8, 16, 24, 32 or 64 bits
 *
 * Anything else is rejected with configuration_error (or its
 * out_of_range_error refinement when the depth is outside [8, 64], or
 * outside [32, 64] for floating point). Instances are immutable.
 *
 * @code
 * audio_format cd(16, sample_type::signed_integer);
 * audio_format native = audio_format::float32();
 * @endcode
 *
 * @note The in-memory canonical representation used by inputs, the ring
 *       buffer and the mixer is always 32-bit float; audio_format only
 *       describes what a codec or device exchanges.
 */
class AUDIOCORE_SDK_EXPORT audio_format {
public:
    /**
     * @brief Validate and construct
     * @throws out_of_range_error if the depth is outside the type's range
     * @throws configuration_error if the depth is in range but not a supported width
     */
    audio_format(unsigned bit_depth, sample_type type);

    /// Canonical 32-bit float format
    static audio_format float32() noexcept;

    [[nodiscard]] unsigned bit_depth() const noexcept { return m_bit_depth; }
    [[nodiscard]] sample_type type() const noexcept { return m_type; }
    [[nodiscard]] unsigned bytes_per_sample() const noexcept { return m_bit_depth / 8; }
    [[nodiscard]] bool is_signed() const noexcept { return m_type != sample_type::unsigned_integer; }
    [[nodiscard]] bool is_float() const noexcept { return m_type == sample_type::floating_point; }

    /**
     * @brief Check a combination without throwing
     */
    static bool is_valid(unsigned bit_depth, sample_type type) noexcept;

    bool operator==(const audio_format& other) const noexcept {
        return m_bit_depth == other.m_bit_depth && m_type == other.m_type;
    }
    bool operator!=(const audio_format& other) const noexcept { return !(*this == other); }

private:
    struct unchecked_tag {};
    audio_format(unsigned bit_depth, sample_type type, unchecked_tag) noexcept
        : m_bit_depth(bit_depth), m_type(type) {}

    unsigned m_bit_depth;
    sample_type m_type;
};

/**
 * @struct audio_spec
 * @brief Complete description of an interleaved stream
 *
 * @code
 * audio_spec cd{audio_format(16, sample_type::signed_integer), 2, 44100};
 * @endcode
 */
struct audio_spec {
    audio_format format = audio_format::float32();  ///< Wire sample format
    channels_t channels = 2;                        ///< Interleaved channels per frame
    sample_rate_t freq = 44100;                     ///< Frames per second
};

/**
 * @brief Reject zero channels or a zero sample rate
 * @throws configuration_error naming the offending value
 */
AUDIOCORE_SDK_EXPORT void validate_stream_params(channels_t channels, sample_rate_t freq);

/// Prints e.g. "s16", "u8", "f32"
AUDIOCORE_SDK_EXPORT std::ostream& operator<<(std::ostream& os, sample_type type);
AUDIOCORE_SDK_EXPORT std::ostream& operator<<(std::ostream& os, const audio_format& fmt);

/** @} */ // end of sdk_audio_format group

} // namespace audiocore

#endif // AUDIOCORE_SDK_AUDIO_FORMAT_HH
