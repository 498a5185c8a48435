/**
 * @file timer_output.hh
 * @brief Output clocked by a software timer
 * @ingroup core
 */

#ifndef AUDIOCORE_TIMER_OUTPUT_HH
#define AUDIOCORE_TIMER_OUTPUT_HH

#include <atomic>
#include <condition_variable>
#include <cstdint>
#include <functional>
#include <mutex>
#include <thread>
#include <audiocore/audio_output.hh>
#include <audiocore/export_audiocore.h>

namespace audiocore {
    /**
     * @class timer_output
     * @brief Pulls the mix on a timer without any audio hardware
     * @ingroup core
     *
     * While playing, a worker thread renders buffer_size() frames every
     * `buffer_size / sample_rate` seconds and discards them, or hands them
     * to the render callback. Useful to keep inputs draining on machines
     * without a sound card and in tests.
     */
    class AUDIOCORE_EXPORT timer_output : public audio_output {
        public:
            static constexpr frames_t default_buffer_size = 1024;

            /// Observer of each rendered period, called on the timer thread
            using render_callback_t = std::function<void(const float* mix, frames_t frames)>;

            /**
             * @throws configuration_error on zero channels, rate or buffer size
             */
            timer_output(channels_t channels, sample_rate_t sample_rate,
                         frames_t buffer_size = default_buffer_size,
                         const audio_format& format = audio_format::float32());
            ~timer_output() override;

            void start() override;
            void stop() override;

            [[nodiscard]] frames_t buffer_size() const noexcept { return m_buffer_frames; }

            /// Periods rendered since construction
            [[nodiscard]] uint64_t periods() const noexcept { return m_periods.load(std::memory_order_relaxed); }

            void set_render_callback(render_callback_t callback);

        private:
            void run();

            const frames_t m_buffer_frames;
            std::atomic<uint64_t> m_periods{0};

            std::mutex m_mutex;
            std::condition_variable m_wakeup;
            bool m_running = false;
            std::thread m_thread;
            render_callback_t m_render_callback;
    };
}

#endif // AUDIOCORE_TIMER_OUTPUT_HH
