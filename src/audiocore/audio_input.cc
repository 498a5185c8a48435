//
// Base input: state machine and gain
//

#include <audiocore/audio_input.hh>
#include <audiocore/error.hh>

namespace audiocore {
    namespace {
        std::atomic<int> s_next_token{1};
    }

    audio_input::audio_input(channels_t channels, sample_rate_t sample_rate, const audio_format& format)
        : m_channels(channels),
          m_sample_rate(sample_rate),
          m_format(format),
          m_token(s_next_token.fetch_add(1, std::memory_order_relaxed)) {
        validate_stream_params(channels, sample_rate);
    }

    audio_input::~audio_input() = default;

    void audio_input::start() {
        transition(playback_state::stopped, playback_state::playing);
    }

    void audio_input::stop() {
        set_state(playback_state::stopped);
    }

    int audio_input::volume() const {
        std::lock_guard<std::mutex> lk(m_gain_mutex);
        return m_volume;
    }

    void audio_input::set_volume(int dbfs) {
        std::lock_guard<std::mutex> lk(m_gain_mutex);
        m_volume = dbfs;
        m_ramp.set(db_to_gain(dbfs));
    }

    void audio_input::transition_volume(int target_dbfs, std::chrono::milliseconds duration) {
        // whole frames per millisecond: 44.1 kHz ramps over 44 frames per ms
        const auto ms = duration.count() > 0 ? static_cast<uint64_t>(duration.count()) : 0u;
        const auto frames = static_cast<frames_t>(static_cast<uint64_t>(m_sample_rate / 1000u) * ms);

        std::lock_guard<std::mutex> lk(m_gain_mutex);
        m_volume = target_dbfs;
        m_ramp.start(db_to_gain(target_dbfs), frames);
    }

    float audio_input::gain() const {
        std::lock_guard<std::mutex> lk(m_gain_mutex);
        return m_ramp.current();
    }

    void audio_input::set_state_callback(state_callback_t callback) {
        std::lock_guard<std::mutex> lk(m_callback_mutex);
        m_state_callback = std::move(callback);
    }

    std::uint64_t audio_input::exchange_state(playback_state from, playback_state to) {
        std::lock_guard<std::mutex> lk(m_state_mutex);
        if (m_state.load(std::memory_order_relaxed) != from) {
            return 0;
        }
        m_state.store(to, std::memory_order_release);
        return ++m_state_generation;
    }

    std::uint64_t audio_input::store_state(playback_state to) {
        std::lock_guard<std::mutex> lk(m_state_mutex);
        if (m_state.load(std::memory_order_relaxed) == to) {
            return 0;
        }
        m_state.store(to, std::memory_order_release);
        return ++m_state_generation;
    }

    bool audio_input::transition(playback_state from, playback_state to) {
        const auto generation = exchange_state(from, to);
        if (generation == 0) {
            return false;
        }
        notify_state_changed(to, generation);
        return true;
    }

    void audio_input::set_state(playback_state to) {
        const auto generation = store_state(to);
        if (generation != 0) {
            notify_state_changed(to, generation);
        }
    }

    void audio_input::notify_state_changed(playback_state state, std::uint64_t generation) {
        std::lock_guard<std::recursive_mutex> delivery(m_notify_mutex);
        if (generation <= m_delivered_generation) {
            return;
        }
        m_delivered_generation = generation;

        state_callback_t callback;
        {
            std::lock_guard<std::mutex> lk(m_callback_mutex);
            callback = m_state_callback;
        }
        if (callback) {
            callback(*this, state);
        }
    }

    void audio_input::apply_gain(float* samples, std::size_t count) {
        const std::size_t frames = count / m_channels;

        std::lock_guard<std::mutex> lk(m_gain_mutex);
        if (!m_ramp.active()) {
            const float g = m_ramp.current();
            if (g == 1.0f) {
                return;
            }
            for (std::size_t i = 0; i < count; i++) {
                samples[i] *= g;
            }
            return;
        }

        for (std::size_t f = 0; f < frames; f++) {
            const float g = m_ramp.next();
            float* frame = samples + f * m_channels;
            for (channels_t c = 0; c < m_channels; c++) {
                frame[c] *= g;
            }
        }
        // partial trailing frame, if any
        const float g = m_ramp.current();
        for (std::size_t i = frames * m_channels; i < count; i++) {
            samples[i] *= g;
        }
    }
}
