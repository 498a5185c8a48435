#include <audiocore/noise_input.hh>
#include <ostream>

namespace audiocore {
    std::ostream& operator<<(std::ostream& os, noise_type t) {
        switch (t) {
            case noise_type::white: return os << "white";
            case noise_type::pink:  return os << "pink";
            case noise_type::brown: return os << "brown";
        }
        return os << "unknown";
    }

    noise_input::noise_input(channels_t channels, sample_rate_t sample_rate, noise_type type)
        : noise_input(channels, sample_rate, type, std::random_device{}()) {
    }

    noise_input::noise_input(channels_t channels, sample_rate_t sample_rate, noise_type type, uint32_t seed)
        : audio_input(channels, sample_rate),
          m_type(type),
          m_rng(seed) {
        set_state(playback_state::playing);
    }

    float noise_input::next_sample(noise_type type) noexcept {
        const float white = m_dist(m_rng);
        switch (type) {
            case noise_type::white:
                return white;
            case noise_type::pink: {
                auto& b = m_pink;
                b[0] = 0.99886f * b[0] + white * 0.0555179f;
                b[1] = 0.99332f * b[1] + white * 0.0750759f;
                b[2] = 0.96900f * b[2] + white * 0.1538520f;
                b[3] = 0.86650f * b[3] + white * 0.3104856f;
                b[4] = 0.55000f * b[4] + white * 0.5329522f;
                b[5] = -0.7616f * b[5] - white * 0.0168980f;
                const float pink = (b[0] + b[1] + b[2] + b[3] + b[4] + b[5] + b[6] + white * 0.5362f) * 0.11f;
                b[6] = white * 0.115926f;
                return pink;
            }
            case noise_type::brown:
                m_brown = (m_brown + 0.02f * white) / 1.02f;
                return m_brown * 3.5f;
        }
        return 0.0f;
    }

    void noise_input::get_frames(float* out, frames_t frames) {
        if (state() != playback_state::playing) {
            return;
        }
        const channels_t ch = channels();
        const noise_type type = m_type.load(std::memory_order_relaxed);

        for (frames_t i = 0; i < frames; i++) {
            const float value = next_sample(type);
            float* frame = out + i * ch;
            for (channels_t c = 0; c < ch; c++) {
                frame[c] = value;
            }
        }
        apply_gain(out, frames * ch);
    }
}
