/**
 * @file device_input.hh
 * @brief Input fed by a backend recording device
 * @ingroup core
 */

#ifndef AUDIOCORE_DEVICE_INPUT_HH
#define AUDIOCORE_DEVICE_INPUT_HH

#include <memory>
#include <vector>
#include <audiocore/buffered_audio_input.hh>
#include <audiocore/sdk/audio_backend.hh>
#include <audiocore/sdk/pcm_codec.hh>
#include <audiocore/export_audiocore.h>

namespace audiocore {
    /**
     * @class device_input
     * @brief Captures from a recording device into the ring buffer
     * @ingroup core
     *
     * The backend's capture callback decodes the wire format of @p spec to
     * float and calls write(). The software buffer defaults to one hardware
     * period; call set_buffer_size() for more headroom.
     *
     * Attach it to an output with the same channels and rate to monitor the
     * device:
     *
     * @code
     * auto mic = std::make_shared<device_input>(backend, spec);
     * speakers.add_input(mic);
     * mic->start();
     * @endcode
     */
    class AUDIOCORE_EXPORT device_input : public buffered_audio_input {
        public:
            /**
             * @throws configuration_error if @p spec is invalid
             * @throws format_error / out_of_range_error if the codec cannot decode @p spec.format
             * @throws device_error if the backend cannot record
             * @throws std::runtime_error if the backend cannot open the device
             */
            device_input(std::shared_ptr<audio_backend> backend, const audio_spec& spec,
                         device_id_t device = default_device_id,
                         std::shared_ptr<event_dispatcher> dispatcher = nullptr);
            ~device_input() override;

            void start() override;
            void stop() override;

            /// Frames per hardware period
            [[nodiscard]] frames_t hardware_buffer_size() const noexcept { return m_hardware_frames; }

            /// Hardware latency in milliseconds, excluding the software ring
            [[nodiscard]] unsigned latency() const noexcept;

            [[nodiscard]] uint32_t device_handle() const noexcept { return m_handle; }

        private:
            static void capture_callback(void* userdata, uint8_t* stream, int len);
            void capture(const uint8_t* stream, std::size_t len);

            std::shared_ptr<audio_backend> m_backend;
            pcm::decoder_func_t m_decode;
            std::size_t m_bytes_per_sample;
            uint32_t m_handle = 0;
            frames_t m_hardware_frames = 0;
            std::vector<float> m_scratch;
            std::unique_ptr<audio_stream_interface> m_stream;
    };
}

#endif // AUDIOCORE_DEVICE_INPUT_HH
