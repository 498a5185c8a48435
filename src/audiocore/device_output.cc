//
// Backend-driven playback
//

#include <audiocore/device_output.hh>
#include <audiocore/error.hh>
#include <failsafe/failsafe.hh>
#include <cstring>
#include <exception>

namespace audiocore {
    device_output::device_output(std::shared_ptr<audio_backend> backend, const audio_spec& spec,
                                 device_id_t device)
        : audio_output(spec.channels, spec.freq, spec.format),
          m_backend(std::move(backend)),
          m_encode(pcm::get_encoder(spec.format)),
          m_bytes_per_sample(pcm::bytes_per_sample(spec.format.bit_depth(), spec.format.is_float())),
          m_obtained(spec) {
        if (!m_backend) {
            throw device_error("device_output requires a backend");
        }

        m_handle = m_backend->open_device(device_direction::playback, device, spec, m_obtained);
        try {
            m_buffer_frames = m_backend->get_device_buffer_frames(m_handle);
            m_stream = m_backend->create_stream(m_handle, spec, render_callback, this);
            m_stream->pause();
        } catch (...) {
            m_stream.reset();
            m_backend->close_device(m_handle);
            throw;
        }

        LOG_INFO("device_output", "Opened", m_backend->get_name(), "playback device", device,
                 "as", m_obtained.format, static_cast<int>(m_obtained.channels), "ch", m_obtained.freq, "Hz,",
                 m_buffer_frames, "frames per period");
    }

    device_output::~device_output() {
        if (m_stream) {
            m_stream->pause();
            m_stream->unbind_from_device();
            m_stream.reset();
        }
        m_backend->close_device(m_handle);
        LOG_INFO("device_output", "Closed playback device handle", m_handle);
    }

    void device_output::start() {
        if (state() == playback_state::playing) {
            return;
        }
        if (!m_stream->resume()) {
            throw device_error("Failed to resume playback stream");
        }
        m_backend->resume_device(m_handle);
        set_state(playback_state::playing);
    }

    void device_output::stop() {
        if (state() == playback_state::stopped) {
            return;
        }
        m_stream->pause();
        set_state(playback_state::stopped);
    }

    unsigned device_output::latency() const noexcept {
        return static_cast<unsigned>(static_cast<uint64_t>(m_buffer_frames) * 1000u / sample_rate());
    }

    void device_output::render_callback(void* userdata, uint8_t* stream, int len) {
        if (!userdata || !stream || len <= 0) {
            return;
        }
        static_cast<device_output*>(userdata)->render(stream, static_cast<std::size_t>(len));
    }

    void device_output::render(uint8_t* stream, std::size_t len) {
        const std::size_t frame_bytes = m_bytes_per_sample * channels();
        const frames_t frames = len / frame_bytes;
        const std::size_t samples = frames * channels();

        // trailing partial frame is zeroed
        if (len > samples * m_bytes_per_sample) {
            std::memset(stream + samples * m_bytes_per_sample, 0, len - samples * m_bytes_per_sample);
        }

        if (state() != playback_state::playing) {
            render_silence(stream, samples);
            return;
        }

        try {
            const float* mix = get_input_frames(frames);
            m_encode(stream, mix, samples);
        } catch (const std::exception& e) {
            LOG_ERROR("device_output", "Render failed, emitting silence:", e.what());
            render_silence(stream, samples);
        }
    }

    void device_output::render_silence(uint8_t* stream, std::size_t samples) const {
        const float zero = 0.0f;
        for (std::size_t i = 0; i < samples; i++) {
            m_encode(stream + i * m_bytes_per_sample, &zero, 1);
        }
    }
}
