/**
 * @file device_output.hh
 * @brief Output rendered by a backend playback device
 * @ingroup core
 */

#ifndef AUDIOCORE_DEVICE_OUTPUT_HH
#define AUDIOCORE_DEVICE_OUTPUT_HH

#include <memory>
#include <audiocore/audio_output.hh>
#include <audiocore/sdk/audio_backend.hh>
#include <audiocore/sdk/pcm_codec.hh>
#include <audiocore/export_audiocore.h>

namespace audiocore {
    /**
     * @class device_output
     * @brief Mixes attached inputs into a playback device
     * @ingroup core
     *
     * Opens a playback device on the given backend and registers a render
     * callback. Each callback renders `len / bytes_per_frame` frames of mix
     * and encodes them with the PCM codec into the wire format of @p spec.
     *
     * The device starts paused; start() resumes it. An exception escaping
     * the mix is logged and that period is rendered as silence.
     *
     * @code
     * auto backend = create_sdl3_backend();
     * backend->init();
     * device_output out(std::move(backend), audio_spec{audio_format(16, sample_type::signed_integer), 2, 48000});
     * out.add_input(tone);
     * out.start();
     * @endcode
     */
    class AUDIOCORE_EXPORT device_output : public audio_output {
        public:
            /**
             * @param backend Initialised backend
             * @param spec Channels, rate and wire format of the mix
             * @param device Device id from enumeration, or default_device_id
             * @throws configuration_error if @p spec is invalid
             * @throws format_error / out_of_range_error if the codec cannot encode @p spec.format
             * @throws std::runtime_error if the backend cannot open the device
             */
            device_output(std::shared_ptr<audio_backend> backend, const audio_spec& spec,
                          device_id_t device = default_device_id);
            ~device_output() override;

            void start() override;
            void stop() override;

            /// Frames per hardware period
            [[nodiscard]] frames_t buffer_size() const noexcept { return m_buffer_frames; }

            /// Hardware latency in milliseconds, from buffer_size() and the sample rate
            [[nodiscard]] unsigned latency() const noexcept;

            [[nodiscard]] uint32_t device_handle() const noexcept { return m_handle; }

            /// Spec reported by the device
            [[nodiscard]] const audio_spec& device_spec() const noexcept { return m_obtained; }

        private:
            static void render_callback(void* userdata, uint8_t* stream, int len);
            void render(uint8_t* stream, std::size_t len);
            void render_silence(uint8_t* stream, std::size_t samples) const;

            std::shared_ptr<audio_backend> m_backend;
            pcm::encoder_func_t m_encode;
            std::size_t m_bytes_per_sample;
            uint32_t m_handle = 0;
            audio_spec m_obtained;
            frames_t m_buffer_frames = 0;
            std::unique_ptr<audio_stream_interface> m_stream;
    };
}

#endif // AUDIOCORE_DEVICE_OUTPUT_HH
