//
// Ring-buffered input
//

#include <audiocore/buffered_audio_input.hh>
#include <audiocore/error.hh>
#include <failsafe/failsafe.hh>
#include <string>

namespace audiocore {
    buffered_audio_input::buffered_audio_input(channels_t channels, sample_rate_t sample_rate,
                                               const audio_format& format,
                                               std::shared_ptr<event_dispatcher> dispatcher)
        : audio_input(channels, sample_rate, format),
          m_dispatcher(dispatcher ? std::move(dispatcher) : event_dispatcher::shared()) {
    }

    buffered_audio_input::~buffered_audio_input() {
        m_dispatcher->cancel(token());
    }

    void buffered_audio_input::start() {
        transition(playback_state::stopped, playback_state::buffering);
    }

    void buffered_audio_input::stop() {
        std::uint64_t stopped;
        {
            std::lock_guard<std::mutex> lk(m_ring_mutex);
            m_ring.clear();
            m_overflowing = false;
            stopped = store_state(playback_state::stopped);
        }
        if (stopped != 0) {
            notify_state_changed(playback_state::stopped, stopped);
        }
    }

    void buffered_audio_input::set_buffer_size(frames_t frames) {
        if (frames == 0) {
            throw configuration_error("Buffer size must be at least one frame");
        }
        const std::size_t capacity = static_cast<std::size_t>(frames) * channels() * 2;
        sample_ring fresh(capacity);
        {
            std::lock_guard<std::mutex> lk(m_ring_mutex);
            m_ring.swap(fresh);
            m_buffer_frames = frames;
            m_threshold = frames;
            m_overflowing = false;
        }
        LOG_DEBUG("buffered_input", "Input", token(), "buffer size", frames, "frames, capacity", capacity, "samples");
    }

    frames_t buffered_audio_input::buffer_size() const {
        std::lock_guard<std::mutex> lk(m_ring_mutex);
        return m_buffer_frames;
    }

    frames_t buffered_audio_input::frame_count() const {
        std::lock_guard<std::mutex> lk(m_ring_mutex);
        return m_ring.size() / channels();
    }

    std::size_t buffered_audio_input::sample_count() const {
        std::lock_guard<std::mutex> lk(m_ring_mutex);
        return m_ring.size();
    }

    std::size_t buffered_audio_input::capacity() const {
        std::lock_guard<std::mutex> lk(m_ring_mutex);
        return m_ring.capacity();
    }

    void buffered_audio_input::set_overflow_policy(overflow_policy policy) {
        m_overflow_policy.store(policy, std::memory_order_relaxed);
    }

    overflow_policy buffered_audio_input::get_overflow_policy() const {
        return m_overflow_policy.load(std::memory_order_relaxed);
    }

    void buffered_audio_input::set_samples_available_callback(samples_available_callback_t callback) {
        std::lock_guard<std::mutex> lk(m_callbacks_mutex);
        m_samples_available = std::move(callback);
    }

    void buffered_audio_input::set_overflow_callback(overflow_callback_t callback) {
        std::lock_guard<std::mutex> lk(m_callbacks_mutex);
        m_overflow = std::move(callback);
    }

    void buffered_audio_input::write(const std::vector<float>& samples) {
        write(samples.data(), samples.size());
    }

    void buffered_audio_input::write(const float* samples, std::size_t count) {
        std::size_t accepted;
        std::uint64_t started = 0;
        bool first_overflow = false;
        {
            std::lock_guard<std::mutex> lk(m_ring_mutex);
            if (m_ring.capacity() == 0) {
                throw usage_error("Buffer has not been initialised; call set_buffer_size() first");
            }
            accepted = m_ring.write(samples, count);
            if (m_ring.size() >= m_threshold) {
                started = exchange_state(playback_state::buffering, playback_state::playing);
            }
            if (accepted < count) {
                first_overflow = !m_overflowing;
                m_overflowing = true;
            } else {
                m_overflowing = false;
            }
        }

        if (started != 0) {
            notify_state_changed(playback_state::playing, started);
        }
        if (accepted > 0) {
            post_samples_available();
        }
        if (accepted < count) {
            const std::size_t dropped = count - accepted;
            if (m_overflow_policy.load(std::memory_order_relaxed) == overflow_policy::strict) {
                throw overflow_error("Audio buffer overflowed, " + std::to_string(dropped) + " samples dropped");
            }
            if (first_overflow) {
                LOG_WARN("buffered_input", "Input", token(), "overflowed, dropping", dropped, "samples");
            }
            post_overflow(dropped);
        }
    }

    void buffered_audio_input::get_frames(float* out, frames_t frames) {
        std::size_t copied = 0;
        std::uint64_t underrun = 0;
        {
            std::lock_guard<std::mutex> lk(m_ring_mutex);
            if (state() != playback_state::playing) {
                return;
            }
            const std::size_t wanted = frames * channels();
            if (m_ring.empty()) {
                underrun = exchange_state(playback_state::playing, playback_state::buffering);
            } else {
                copied = m_ring.read(out, wanted);
            }
        }

        if (underrun != 0) {
            LOG_DEBUG("buffered_input", "Input", token(), "underrun, buffering");
            notify_state_changed(playback_state::buffering, underrun);
            return;
        }
        apply_gain(out, copied);
    }

    void buffered_audio_input::post_samples_available() {
        {
            std::lock_guard<std::mutex> lk(m_callbacks_mutex);
            if (!m_samples_available) {
                return;
            }
        }
        m_dispatcher->post(token(), [this] {
            samples_available_callback_t callback;
            {
                std::lock_guard<std::mutex> lk(m_callbacks_mutex);
                callback = m_samples_available;
            }
            if (callback) {
                callback(*this);
            }
        });
    }

    void buffered_audio_input::post_overflow(std::size_t dropped) {
        {
            std::lock_guard<std::mutex> lk(m_callbacks_mutex);
            if (!m_overflow) {
                return;
            }
        }
        m_dispatcher->post(token(), [this, dropped] {
            overflow_callback_t callback;
            {
                std::lock_guard<std::mutex> lk(m_callbacks_mutex);
                callback = m_overflow;
            }
            if (callback) {
                callback(*this, dropped);
            }
        });
    }
}
