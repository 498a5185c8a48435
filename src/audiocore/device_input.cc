//
// Backend-driven capture
//

#include <audiocore/device_input.hh>
#include <audiocore/error.hh>
#include <failsafe/failsafe.hh>
#include <exception>

namespace audiocore {
    device_input::device_input(std::shared_ptr<audio_backend> backend, const audio_spec& spec,
                               device_id_t device, std::shared_ptr<event_dispatcher> dispatcher)
        : buffered_audio_input(spec.channels, spec.freq, spec.format, std::move(dispatcher)),
          m_backend(std::move(backend)),
          m_decode(pcm::get_decoder(spec.format)),
          m_bytes_per_sample(pcm::bytes_per_sample(spec.format.bit_depth(), spec.format.is_float())) {
        if (!m_backend) {
            throw device_error("device_input requires a backend");
        }
        if (!m_backend->supports_recording()) {
            throw device_error(m_backend->get_name() + " backend does not support recording");
        }

        audio_spec obtained = spec;
        m_handle = m_backend->open_device(device_direction::recording, device, spec, obtained);
        try {
            m_hardware_frames = m_backend->get_device_buffer_frames(m_handle);
            set_buffer_size(m_hardware_frames > 0 ? m_hardware_frames : 1024);
            m_scratch.resize(m_hardware_frames * channels());
            m_stream = m_backend->create_stream(m_handle, spec, capture_callback, this);
            m_stream->pause();
        } catch (...) {
            m_stream.reset();
            m_backend->close_device(m_handle);
            throw;
        }

        LOG_INFO("device_input", "Opened", m_backend->get_name(), "recording device", device,
                 "as", spec.format, static_cast<int>(spec.channels), "ch", spec.freq, "Hz,",
                 m_hardware_frames, "frames per period");
    }

    device_input::~device_input() {
        if (m_stream) {
            m_stream->pause();
            m_stream->unbind_from_device();
            m_stream.reset();
        }
        m_backend->close_device(m_handle);
        LOG_INFO("device_input", "Closed recording device handle", m_handle);
    }

    void device_input::start() {
        if (state() != playback_state::stopped) {
            return;
        }
        buffered_audio_input::start();
        if (!m_stream->resume()) {
            buffered_audio_input::stop();
            throw device_error("Failed to resume recording stream");
        }
        m_backend->resume_device(m_handle);
    }

    void device_input::stop() {
        m_stream->pause();
        buffered_audio_input::stop();
    }

    unsigned device_input::latency() const noexcept {
        return static_cast<unsigned>(static_cast<uint64_t>(m_hardware_frames) * 1000u / sample_rate());
    }

    void device_input::capture_callback(void* userdata, uint8_t* stream, int len) {
        if (!userdata || !stream || len <= 0) {
            return;
        }
        static_cast<device_input*>(userdata)->capture(stream, static_cast<std::size_t>(len));
    }

    void device_input::capture(const uint8_t* stream, std::size_t len) {
        if (state() == playback_state::stopped) {
            return;
        }
        const std::size_t samples = len / m_bytes_per_sample;
        try {
            if (m_scratch.size() < samples) {
                m_scratch.resize(samples);
            }
            m_decode(m_scratch.data(), stream, samples);
            write(m_scratch.data(), samples);
        } catch (const overflow_error& e) {
            LOG_WARN("device_input", e.what());
        } catch (const std::exception& e) {
            LOG_ERROR("device_input", "Capture failed:", e.what());
        }
    }
}
