/**
 * @file audio_output.hh
 * @brief Mixing sink for audio inputs
 * @ingroup core
 */

#ifndef AUDIOCORE_AUDIO_OUTPUT_HH
#define AUDIOCORE_AUDIO_OUTPUT_HH

#include <atomic>
#include <functional>
#include <memory>
#include <mutex>
#include <audiocore/audio_input.hh>
#include <audiocore/playback_state.hh>
#include <audiocore/sdk/audio_format.hh>
#include <audiocore/sdk/buffer.hh>
#include <audiocore/sdk/types.hh>
#include <audiocore/export_audiocore.h>

namespace audiocore {
    class input_container;

    /**
     * @class audio_output
     * @brief Sums every playing input into one interleaved stream
     * @ingroup core
     *
     * Inputs must match the output's channel count and sample rate; the
     * check happens in add_input(), before any data flows. Inputs can be
     * attached and detached while the output renders.
     *
     * get_input_frames() is the render step. For each attached input in the
     * `playing` state it pulls the requested frames into a cleared scratch
     * buffer and adds them to the mix. Stopped and buffering inputs are
     * skipped without being called. The sum is not clipped; the PCM codec
     * clamps when it encodes.
     *
     * The base class has no hardware: start() and stop() only move the
     * state between `stopped` and `playing`. device_output and
     * timer_output drive real or simulated callbacks.
     *
     * @code
     * audio_output out(2, 48000);
     * out.add_input(tone);
     * out.add_input(noise);
     * const float* mix = out.get_input_frames(256);   // 512 samples
     * @endcode
     */
    class AUDIOCORE_EXPORT audio_output {
        public:
            using state_callback_t = std::function<void(audio_output&, playback_state)>;

            /**
             * @throws configuration_error on zero channels or sample rate
             */
            audio_output(channels_t channels, sample_rate_t sample_rate,
                         const audio_format& format = audio_format::float32());
            virtual ~audio_output();

            audio_output(const audio_output&) = delete;
            audio_output& operator=(const audio_output&) = delete;

            [[nodiscard]] channels_t channels() const noexcept { return m_channels; }
            [[nodiscard]] sample_rate_t sample_rate() const noexcept { return m_sample_rate; }
            [[nodiscard]] const audio_format& format() const noexcept { return m_format; }
            [[nodiscard]] playback_state state() const noexcept { return m_state.load(std::memory_order_acquire); }

            /**
             * @brief Attach an input
             * @throws format_mismatch_error if channels or sample rate differ
             * @throws usage_error if @p input is null or already attached
             */
            void add_input(std::shared_ptr<audio_input> input);

            /**
             * @brief Detach an input
             * @throws usage_error if @p input is not attached
             */
            void remove_input(const std::shared_ptr<audio_input>& input);

            [[nodiscard]] bool has_input(const std::shared_ptr<audio_input>& input) const;
            [[nodiscard]] std::size_t input_count() const;

            virtual void start();
            virtual void stop();

            void set_state_callback(state_callback_t callback);

            /**
             * @brief Render @p frames frames of mix
             *
             * @return `frames * channels()` samples, valid until the next call.
             *         Called from one render thread at a time.
             */
            const float* get_input_frames(frames_t frames);

        protected:
            void set_state(playback_state to);

        private:
            const channels_t            m_channels;
            const sample_rate_t         m_sample_rate;
            const audio_format          m_format;
            std::atomic<playback_state> m_state{playback_state::stopped};

            std::unique_ptr<input_container> m_inputs;
            buffer<float> m_mix;
            buffer<float> m_scratch;

            std::mutex       m_callback_mutex;
            state_callback_t m_state_callback;
    };
}

#endif // AUDIOCORE_AUDIO_OUTPUT_HH
