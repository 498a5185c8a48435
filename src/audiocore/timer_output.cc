//
// Timer-clocked output
//

#include <audiocore/timer_output.hh>
#include <audiocore/error.hh>
#include <failsafe/failsafe.hh>
#include <chrono>
#include <exception>

namespace audiocore {
    timer_output::timer_output(channels_t channels, sample_rate_t sample_rate,
                               frames_t buffer_size, const audio_format& format)
        : audio_output(channels, sample_rate, format),
          m_buffer_frames(buffer_size) {
        if (buffer_size == 0) {
            throw configuration_error("Buffer size must be at least one frame");
        }
    }

    timer_output::~timer_output() {
        stop();
    }

    void timer_output::start() {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (m_running) {
                return;
            }
            m_running = true;
        }
        m_thread = std::thread([this] { run(); });
        set_state(playback_state::playing);
    }

    void timer_output::stop() {
        {
            std::lock_guard<std::mutex> lk(m_mutex);
            if (!m_running) {
                return;
            }
            m_running = false;
        }
        m_wakeup.notify_all();
        if (m_thread.joinable()) {
            m_thread.join();
        }
        set_state(playback_state::stopped);
    }

    void timer_output::set_render_callback(render_callback_t callback) {
        std::lock_guard<std::mutex> lk(m_mutex);
        m_render_callback = std::move(callback);
    }

    void timer_output::run() {
        using clock = std::chrono::steady_clock;
        const auto period = std::chrono::duration_cast<clock::duration>(
            std::chrono::duration<double>(static_cast<double>(m_buffer_frames) / sample_rate()));

        auto next = clock::now() + period;
        std::unique_lock<std::mutex> lk(m_mutex);
        while (m_running) {
            if (m_wakeup.wait_until(lk, next, [this] { return !m_running; })) {
                break;
            }
            next += period;
            auto callback = m_render_callback;
            lk.unlock();

            try {
                const float* mix = get_input_frames(m_buffer_frames);
                if (callback) {
                    callback(mix, m_buffer_frames);
                }
            } catch (const std::exception& e) {
                LOG_ERROR("timer_output", "Render failed:", e.what());
            }
            m_periods.fetch_add(1, std::memory_order_relaxed);

            lk.lock();
        }
    }
}
