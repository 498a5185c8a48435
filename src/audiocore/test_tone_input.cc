#include <audiocore/test_tone_input.hh>
#include <audiocore/error.hh>
#include <cmath>
#include <ostream>

namespace audiocore {
    namespace {
        constexpr double two_pi = 6.283185307179586476925286766559;

        float shape_at(waveform shape, double phase) noexcept {
            switch (shape) {
                case waveform::sine:
                    return static_cast<float>(std::sin(two_pi * phase));
                case waveform::square:
                    return phase < 0.5 ? 1.0f : -1.0f;
                case waveform::sawtooth:
                    return static_cast<float>(2.0 * phase - 1.0);
                case waveform::triangle:
                    return static_cast<float>(phase < 0.5 ? 4.0 * phase - 1.0 : 3.0 - 4.0 * phase);
            }
            return 0.0f;
        }
    }

    std::ostream& operator<<(std::ostream& os, waveform w) {
        switch (w) {
            case waveform::sine:     return os << "sine";
            case waveform::square:   return os << "square";
            case waveform::sawtooth: return os << "sawtooth";
            case waveform::triangle: return os << "triangle";
        }
        return os << "unknown";
    }

    test_tone_input::test_tone_input(channels_t channels, sample_rate_t sample_rate,
                                     unsigned frequency, waveform shape)
        : audio_input(channels, sample_rate),
          m_frequency(0),
          m_shape(shape) {
        set_frequency(frequency);
        set_state(playback_state::playing);
    }

    void test_tone_input::set_frequency(unsigned hz) {
        if (hz == 0) {
            throw configuration_error("Tone frequency must be greater than 0");
        }
        m_frequency.store(hz, std::memory_order_relaxed);
    }

    void test_tone_input::get_frames(float* out, frames_t frames) {
        if (state() != playback_state::playing) {
            return;
        }
        const channels_t ch = channels();
        const sample_rate_t rate = sample_rate();
        const double freq = frequency();
        const waveform shape = m_shape.load(std::memory_order_relaxed);

        for (frames_t i = 0; i < frames; i++) {
            if (++m_frame_number > rate) {
                m_frame_number = 1;
            }
            const double cycles = freq * static_cast<double>(m_frame_number) / static_cast<double>(rate);
            const float value = shape_at(shape, cycles - std::floor(cycles));
            float* frame = out + i * ch;
            for (channels_t c = 0; c < ch; c++) {
                frame[c] = value;
            }
        }
        apply_gain(out, frames * ch);
    }
}
