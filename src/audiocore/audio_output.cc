//
// Mixer
//

#include <audiocore/audio_output.hh>
#include <audiocore/error.hh>
#include <audiocore/sdk/compiler.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>
#include <string>
#include "input_container.hh"

namespace audiocore {
    audio_output::audio_output(channels_t channels, sample_rate_t sample_rate, const audio_format& format)
        : m_channels(channels),
          m_sample_rate(sample_rate),
          m_format(format),
          m_inputs(std::make_unique<input_container>()) {
        validate_stream_params(channels, sample_rate);
    }

    audio_output::~audio_output() = default;

    void audio_output::add_input(std::shared_ptr<audio_input> input) {
        if (!input) {
            throw usage_error("Cannot attach a null input");
        }
        if (input->channels() != m_channels) {
            throw format_mismatch_error("Input has " + std::to_string(input->channels()) +
                                        " channels, output expects " + std::to_string(m_channels));
        }
        if (input->sample_rate() != m_sample_rate) {
            throw format_mismatch_error("Input sample rate " + std::to_string(input->sample_rate()) +
                                        " Hz does not match output rate " + std::to_string(m_sample_rate) + " Hz");
        }
        const int token = input->token();
        if (!m_inputs->add(std::move(input))) {
            throw usage_error("Input is already attached to this output");
        }
        LOG_DEBUG("audio_output", "Attached input", token);
    }

    void audio_output::remove_input(const std::shared_ptr<audio_input>& input) {
        if (!input || !m_inputs->remove(input.get())) {
            throw usage_error("Input is not attached to this output");
        }
        LOG_DEBUG("audio_output", "Detached input", input->token());
    }

    bool audio_output::has_input(const std::shared_ptr<audio_input>& input) const {
        return input && m_inputs->contains(input.get());
    }

    std::size_t audio_output::input_count() const {
        return m_inputs->size();
    }

    void audio_output::start() {
        set_state(playback_state::playing);
    }

    void audio_output::stop() {
        set_state(playback_state::stopped);
    }

    void audio_output::set_state_callback(state_callback_t callback) {
        std::lock_guard<std::mutex> lk(m_callback_mutex);
        m_state_callback = std::move(callback);
    }

    void audio_output::set_state(playback_state to) {
        const auto old = m_state.exchange(to, std::memory_order_acq_rel);
        if (old == to) {
            return;
        }
        state_callback_t callback;
        {
            std::lock_guard<std::mutex> lk(m_callback_mutex);
            callback = m_state_callback;
        }
        if (callback) {
            callback(*this, to);
        }
    }

    const float* audio_output::get_input_frames(frames_t frames) {
        const std::size_t samples = frames * m_channels;
        if (m_mix.size() < samples) {
            m_mix.reset(samples);
            m_scratch.reset(samples);
        }
        std::fill_n(m_mix.data(), samples, 0.0f);

        auto inputs = m_inputs->snapshot();
        for (const auto& input : *inputs) {
            if (input->state() != playback_state::playing) {
                continue;
            }
            std::fill_n(m_scratch.data(), samples, 0.0f);
            input->get_frames(m_scratch.data(), frames);

            float* mix = m_mix.data();
            const float* src = m_scratch.data();
            AUDIOCORE_IVDEP
            for (std::size_t i = 0; i < samples; i++) {
                mix[i] += src[i];
            }
        }
        return m_mix.data();
    }
}
