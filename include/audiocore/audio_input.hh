/**
 * @file audio_input.hh
 * @brief Abstract sample producer
 * @ingroup core
 */

#ifndef AUDIOCORE_AUDIO_INPUT_HH
#define AUDIOCORE_AUDIO_INPUT_HH

#include <atomic>
#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <audiocore/playback_state.hh>
#include <audiocore/sdk/audio_format.hh>
#include <audiocore/sdk/gain_ramp.hh>
#include <audiocore/sdk/types.hh>
#include <audiocore/export_audiocore.h>

namespace audiocore {
    /**
     * @class audio_input
     * @brief Anything that can be pulled for interleaved float frames
     * @ingroup core
     *
     * An input has a fixed channel count and sample rate, a playback state
     * and a volume. Concrete inputs implement get_frames(); everything else
     * is provided here.
     *
     * ## State
     *
     * `stopped --start()--> playing --stop()--> stopped`. The state callback
     * fires synchronously on the thread that performs each transition.
     * Buffered inputs refine this with a `buffering` state.
     *
     * ## Volume
     *
     * Volume is in dBFS (0 = unity). set_volume() applies immediately;
     * transition_volume() ramps linearly over a duration, advancing one
     * step per frame rendered and landing exactly on the target.
     *
     * @code
     * auto tone = std::make_shared<test_tone_input>(2, 48000);
     * tone->set_volume(-6);
     * tone->transition_volume(-40, std::chrono::milliseconds(500));
     * @endcode
     *
     * ## Thread Safety
     *
     * State is atomic and the gain ramp has its own lock, so start(), stop()
     * and the volume setters may be called from a control thread while an
     * output renders.
     */
    class AUDIOCORE_EXPORT audio_input {
        public:
            using state_callback_t = std::function<void(audio_input&, playback_state)>;

            virtual ~audio_input();

            audio_input(const audio_input&) = delete;
            audio_input& operator=(const audio_input&) = delete;

            [[nodiscard]] channels_t channels() const noexcept { return m_channels; }
            [[nodiscard]] sample_rate_t sample_rate() const noexcept { return m_sample_rate; }
            [[nodiscard]] const audio_format& format() const noexcept { return m_format; }
            [[nodiscard]] playback_state state() const noexcept { return m_state.load(std::memory_order_acquire); }

            /// Unique id, used to tag asynchronous events
            [[nodiscard]] int token() const noexcept { return m_token; }

            /// Begin producing data. No-op when already playing.
            virtual void start();

            /// Stop producing data. No-op when already stopped.
            virtual void stop();

            [[nodiscard]] int volume() const;

            /**
             * @brief Set the volume in dBFS, replacing any running transition
             */
            void set_volume(int dbfs);

            /**
             * @brief Ramp linearly from the current gain to @p target_dbfs
             *
             * The ramp spans `sample_rate * duration / 1000` frames.
             */
            void transition_volume(int target_dbfs, std::chrono::milliseconds duration);

            /// Current linear gain (does not advance a ramp)
            [[nodiscard]] float gain() const;

            void set_state_callback(state_callback_t callback);

            /**
             * @brief Fill @p out with @p frames interleaved frames
             *
             * @p out holds `frames * channels()` samples. The caller clears it
             * beforehand; an input with nothing to deliver leaves it alone.
             * Gain is applied before returning.
             */
            virtual void get_frames(float* out, frames_t frames) = 0;

        protected:
            /**
             * @throws configuration_error on zero channels or sample rate
             */
            audio_input(channels_t channels, sample_rate_t sample_rate,
                        const audio_format& format = audio_format::float32());

            /**
             * @brief Compare-and-set without notification
             * @return generation of the change, 0 when the state was not @p from
             */
            std::uint64_t exchange_state(playback_state from, playback_state to);

            /**
             * @brief Unconditional set without notification
             * @return generation of the change, 0 when the state already was @p to
             */
            std::uint64_t store_state(playback_state to);

            /// Compare-and-set, notifying on success
            bool transition(playback_state from, playback_state to);

            /// Unconditional set, notifying when the state actually changed
            void set_state(playback_state to);

            /**
             * @brief Report the change stamped with @p generation
             *
             * Listeners are called one at a time. A notification overtaken by
             * a later change is dropped, so the last state reported is always
             * the current one.
             */
            void notify_state_changed(playback_state state, std::uint64_t generation);

            /**
             * @brief Scale @p count interleaved samples by the gain
             *
             * A running ramp advances one step per frame.
             */
            void apply_gain(float* samples, std::size_t count);

        private:
            const channels_t            m_channels;
            const sample_rate_t         m_sample_rate;
            const audio_format          m_format;
            const int                   m_token;
            std::atomic<playback_state> m_state{playback_state::stopped};

            mutable std::mutex m_gain_mutex;
            gain_ramp          m_ramp;
            int                m_volume = 0;

            std::mutex    m_state_mutex;
            std::uint64_t m_state_generation = 0;

            std::recursive_mutex m_notify_mutex;
            std::uint64_t        m_delivered_generation = 0;

            std::mutex       m_callback_mutex;
            state_callback_t m_state_callback;
    };
}

#endif // AUDIOCORE_AUDIO_INPUT_HH
