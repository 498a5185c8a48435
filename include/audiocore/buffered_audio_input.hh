/**
 * @file buffered_audio_input.hh
 * @brief Input fed asynchronously through a ring buffer
 * @ingroup core
 */

#ifndef AUDIOCORE_BUFFERED_AUDIO_INPUT_HH
#define AUDIOCORE_BUFFERED_AUDIO_INPUT_HH

#include <functional>
#include <memory>
#include <mutex>
#include <vector>
#include <audiocore/audio_input.hh>
#include <audiocore/event_dispatcher.hh>
#include <audiocore/sdk/sample_ring.hh>
#include <audiocore/export_audiocore.h>

namespace audiocore {
    /**
     * @enum overflow_policy
     * @brief What write() does when the ring cannot take every sample
     */
    enum class overflow_policy {
        notify,  ///< Drop the excess and post an overflow event
        strict   ///< Keep what fitted, then throw overflow_error
    };

    /**
     * @class buffered_audio_input
     * @brief Bridges a push producer to the pull-based mixer
     * @ingroup core
     *
     * A producer (typically a capture callback on its own thread) calls
     * write(); the output's render thread calls get_frames(). Both meet in
     * a ring of `buffer_size() * channels() * 2` samples guarded by one
     * mutex, held only while samples are copied.
     *
     * ## State
     *
     * @code
     * stopped --start()--> buffering --(unread samples >= buffer_size)--> playing
     * playing --(get_frames finds the ring empty)--> buffering
     * any     --stop()--> stopped (ring emptied)
     * @endcode
     *
     * The transition to playing happens on the very write() that crosses
     * the threshold. An underrun is not an error: the caller's buffer is
     * left untouched (silence) and the input waits for the threshold again.
     *
     * ## Notifications
     *
     * The samples-available and overflow callbacks run on an
     * event_dispatcher worker, never on the producer thread. State changes
     * are reported synchronously once the ring lock has been released; when
     * a stop() races a write() or an underrun, only the state that won is
     * reported last.
     *
     * @code
     * class capture : public buffered_audio_input {
     *     ...
     *     void on_hardware(const float* data, std::size_t n) { write(data, n); }
     * };
     * input.set_buffer_size(1024);
     * input.start();
     * @endcode
     */
    class AUDIOCORE_EXPORT buffered_audio_input : public audio_input {
        public:
            using samples_available_callback_t = std::function<void(buffered_audio_input&)>;
            using overflow_callback_t = std::function<void(buffered_audio_input&, std::size_t dropped)>;

            ~buffered_audio_input() override;

            /// stopped -> buffering
            void start() override;

            /// Empty the ring and stop
            void stop() override;

            /**
             * @brief Reallocate the ring and set the start threshold
             *
             * Playback starts once @p frames samples are unread, whatever the
             * channel count. Capacity becomes `frames * channels() * 2`
             * samples and any buffered data is discarded.
             * @throws configuration_error if @p frames is zero
             */
            void set_buffer_size(frames_t frames);

            /// Configured buffer size (0 until set_buffer_size())
            [[nodiscard]] frames_t buffer_size() const;

            /// Unread frames in the ring
            [[nodiscard]] frames_t frame_count() const;

            /// Unread samples in the ring
            [[nodiscard]] std::size_t sample_count() const;

            /// Ring capacity in samples
            [[nodiscard]] std::size_t capacity() const;

            void set_overflow_policy(overflow_policy policy);
            [[nodiscard]] overflow_policy get_overflow_policy() const;

            void set_samples_available_callback(samples_available_callback_t callback);
            void set_overflow_callback(overflow_callback_t callback);

            /**
             * @brief Append interleaved samples
             *
             * Accepts `min(count, free space)` samples. Never blocks on the
             * consumer and never allocates.
             * @throws usage_error if set_buffer_size() was never called
             * @throws overflow_error in strict mode when samples were dropped
             */
            void write(const float* samples, std::size_t count);
            void write(const std::vector<float>& samples);

            void get_frames(float* out, frames_t frames) override;

        protected:
            /**
             * @param dispatcher Worker for asynchronous notifications;
             *        event_dispatcher::shared() when null
             */
            buffered_audio_input(channels_t channels, sample_rate_t sample_rate,
                                 const audio_format& format = audio_format::float32(),
                                 std::shared_ptr<event_dispatcher> dispatcher = nullptr);

        private:
            void post_samples_available();
            void post_overflow(std::size_t dropped);

            std::shared_ptr<event_dispatcher> m_dispatcher;

            mutable std::mutex m_ring_mutex;
            sample_ring        m_ring;
            frames_t           m_buffer_frames = 0;
            std::size_t        m_threshold = 0;
            bool               m_overflowing = false;

            std::atomic<overflow_policy> m_overflow_policy{overflow_policy::notify};

            mutable std::mutex           m_callbacks_mutex;
            samples_available_callback_t m_samples_available;
            overflow_callback_t          m_overflow;
    };

    /**
     * @class push_audio_input
     * @brief buffered_audio_input fed directly by application code
     * @ingroup core
     *
     * Exposes the protected constructor so a producer that is not a device,
     * such as a network receiver or a test, can own a buffered input.
     */
    class AUDIOCORE_EXPORT push_audio_input : public buffered_audio_input {
        public:
            push_audio_input(channels_t channels, sample_rate_t sample_rate,
                             std::shared_ptr<event_dispatcher> dispatcher = nullptr)
                : buffered_audio_input(channels, sample_rate, audio_format::float32(), std::move(dispatcher)) {}
    };
}

#endif // AUDIOCORE_BUFFERED_AUDIO_INPUT_HH
