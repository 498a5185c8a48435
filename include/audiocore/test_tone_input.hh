/**
 * @file test_tone_input.hh
 * @brief Periodic waveform generator
 * @ingroup generators
 */

#ifndef AUDIOCORE_TEST_TONE_INPUT_HH
#define AUDIOCORE_TEST_TONE_INPUT_HH

#include <atomic>
#include <iosfwd>
#include <audiocore/audio_input.hh>
#include <audiocore/export_audiocore.h>

namespace audiocore {
    /**
     * @enum waveform
     * @brief Shape of a test tone
     */
    enum class waveform : uint8_t {
        sine,
        square,
        sawtooth,
        triangle
    };

    AUDIOCORE_EXPORT std::ostream& operator<<(std::ostream& os, waveform w);

    /**
     * @class test_tone_input
     * @brief Full-scale tone written identically to every channel
     * @ingroup generators
     *
     * Produces `shape(frequency * n / sample_rate)` for frame n. The frame
     * counter wraps once per second, so an integral frequency repeats
     * seamlessly. Starts in the playing state; level is set with the
     * inherited volume controls.
     *
     * @code
     * auto tone = std::make_shared<test_tone_input>(2, 48000, 440, waveform::triangle);
     * tone->set_volume(-12);
     * @endcode
     */
    class AUDIOCORE_EXPORT test_tone_input : public audio_input {
        public:
            static constexpr unsigned default_frequency = 1000;

            /**
             * @throws configuration_error on zero channels, rate or frequency
             */
            test_tone_input(channels_t channels, sample_rate_t sample_rate,
                            unsigned frequency = default_frequency,
                            waveform shape = waveform::sine);

            [[nodiscard]] unsigned frequency() const noexcept { return m_frequency.load(std::memory_order_relaxed); }

            /**
             * @throws configuration_error if @p hz is zero
             */
            void set_frequency(unsigned hz);

            [[nodiscard]] waveform shape() const noexcept { return m_shape.load(std::memory_order_relaxed); }
            void set_shape(waveform shape) noexcept { m_shape.store(shape, std::memory_order_relaxed); }

            void get_frames(float* out, frames_t frames) override;

        private:
            std::atomic<unsigned> m_frequency;
            std::atomic<waveform> m_shape;
            sample_rate_t m_frame_number = 0;
    };
}

#endif // AUDIOCORE_TEST_TONE_INPUT_HH
