#ifndef AUDIOCORE_TEST_HELPERS_HH
#define AUDIOCORE_TEST_HELPERS_HH

#include <audiocore/audio_input.hh>
#include <audiocore/playback_state.hh>
#include <atomic>
#include <chrono>
#include <mutex>
#include <thread>
#include <vector>

namespace audiocore::test {

// Input producing a constant value on every sample, and counting pulls
class constant_input : public audio_input {
public:
    constant_input(channels_t channels, sample_rate_t sample_rate, float value)
        : audio_input(channels, sample_rate), m_value(value) {}

    void get_frames(float* out, frames_t frames) override {
        m_calls++;
        if (state() != playback_state::playing) {
            return;
        }
        const std::size_t count = frames * channels();
        for (std::size_t i = 0; i < count; i++) {
            out[i] = m_value;
        }
        apply_gain(out, count);
    }

    [[nodiscard]] int calls() const { return m_calls.load(); }

private:
    float m_value;
    std::atomic<int> m_calls{0};
};

// Input producing an increasing ramp 0, 1, 2 ... per sample
class counting_input : public audio_input {
public:
    counting_input(channels_t channels, sample_rate_t sample_rate)
        : audio_input(channels, sample_rate) {}

    void get_frames(float* out, frames_t frames) override {
        if (state() != playback_state::playing) {
            return;
        }
        const std::size_t count = frames * channels();
        for (std::size_t i = 0; i < count; i++) {
            out[i] = static_cast<float>(m_next++);
        }
        apply_gain(out, count);
    }

private:
    long m_next = 0;
};

// Thread-safe log of state notifications
class state_recorder {
public:
    void record(playback_state state) {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_states.push_back(state);
    }

    std::vector<playback_state> states() const {
        std::lock_guard<std::mutex> lk(m_mutex);
        return m_states;
    }

private:
    mutable std::mutex m_mutex;
    std::vector<playback_state> m_states;
};

// Poll @p pred until it holds or @p timeout expires
template <typename Pred>
bool wait_for(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(2000)) {
    const auto deadline = std::chrono::steady_clock::now() + timeout;
    while (!pred()) {
        if (std::chrono::steady_clock::now() >= deadline) {
            return false;
        }
        std::this_thread::sleep_for(std::chrono::milliseconds(1));
    }
    return true;
}

inline std::vector<float> ramp_samples(std::size_t count, float start = 0.0f) {
    std::vector<float> v(count);
    for (std::size_t i = 0; i < count; i++) {
        v[i] = start + static_cast<float>(i);
    }
    return v;
}

} // namespace audiocore::test

#endif // AUDIOCORE_TEST_HELPERS_HH
