/**
 * @file noise_input.hh
 * @brief White, pink and brown noise generator
 * @ingroup generators
 */

#ifndef AUDIOCORE_NOISE_INPUT_HH
#define AUDIOCORE_NOISE_INPUT_HH

#include <array>
#include <atomic>
#include <iosfwd>
#include <random>
#include <audiocore/audio_input.hh>
#include <audiocore/export_audiocore.h>

namespace audiocore {
    /**
     * @enum noise_type
     * @brief Spectral colour of a noise_input
     */
    enum class noise_type : uint8_t {
        white,  ///< Uniform in [-1, 1)
        pink,   ///< -3 dB/octave, Paul Kellet's refined filter
        brown   ///< -6 dB/octave, leaky integrator
    };

    AUDIOCORE_EXPORT std::ostream& operator<<(std::ostream& os, noise_type t);

    /**
     * @class noise_input
     * @brief Noise written identically to every channel
     * @ingroup generators
     *
     * Starts in the playing state. A fixed seed gives a reproducible
     * sequence; the default seed comes from std::random_device.
     */
    class AUDIOCORE_EXPORT noise_input : public audio_input {
        public:
            noise_input(channels_t channels, sample_rate_t sample_rate,
                        noise_type type = noise_type::white);
            noise_input(channels_t channels, sample_rate_t sample_rate,
                        noise_type type, uint32_t seed);

            [[nodiscard]] noise_type type() const noexcept { return m_type.load(std::memory_order_relaxed); }
            void set_type(noise_type type) noexcept { m_type.store(type, std::memory_order_relaxed); }

            void get_frames(float* out, frames_t frames) override;

        private:
            float next_sample(noise_type type) noexcept;

            std::atomic<noise_type> m_type;
            std::mt19937 m_rng;
            std::uniform_real_distribution<float> m_dist{-1.0f, 1.0f};
            std::array<float, 7> m_pink{};
            float m_brown = 0.0f;
    };
}

#endif // AUDIOCORE_NOISE_INPUT_HH
