#include <audiocore/backends/null/null_backend.hh>
#include <audiocore/error.hh>
#include <audiocore/sdk/pcm_codec.hh>
#include <failsafe/failsafe.hh>
#include <atomic>
#include <string>

namespace audiocore {

struct null_backend::stream_state {
    audio_spec spec;
    std::mutex callback_mutex;
    audio_callback_t callback = nullptr;
    void* userdata = nullptr;
    std::atomic<bool> paused{false};
    std::atomic<bool> bound{true};
};

namespace {
    class null_audio_stream : public audio_stream_interface {
    public:
        explicit null_audio_stream(std::shared_ptr<null_backend::stream_state> state)
            : m_state(std::move(state)) {}

        ~null_audio_stream() override {
            std::lock_guard<std::mutex> lk(m_state->callback_mutex);
            m_state->callback = nullptr;
            m_state->userdata = nullptr;
        }

        void clear() override {}
        bool pause() override { m_state->paused = true; return true; }
        bool resume() override { m_state->paused = false; return true; }
        bool is_paused() const override { return m_state->paused; }
        bool bind_to_device() override { m_state->bound = true; return true; }
        void unbind_from_device() override { m_state->bound = false; }

    private:
        std::shared_ptr<null_backend::stream_state> m_state;
    };

    device_info make_device(device_direction direction) {
        device_info info;
        if (direction == device_direction::playback) {
            info.id = null_backend::playback_device_id;
            info.name = "Null Playback";
        } else {
            info.id = null_backend::recording_device_id;
            info.name = "Null Recording";
        }
        info.is_default = true;
        info.channels = 2;
        info.sample_rate = 44100;
        return info;
    }
}

null_backend::null_backend() = default;

null_backend::~null_backend() {
    shutdown();
}

void null_backend::init() {
    std::lock_guard<std::mutex> lk(m_mutex);
    if (m_initialized) {
        THROW_RUNTIME("Null backend already initialized");
    }
    m_initialized = true;
}

void null_backend::shutdown() {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_devices.clear();
    m_initialized = false;
}

std::string null_backend::get_name() const {
    return "Null";
}

bool null_backend::is_initialized() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_initialized;
}

std::vector<device_info> null_backend::enumerate_devices(device_direction direction) {
    if (!is_initialized()) {
        THROW_RUNTIME("Backend not initialized");
    }
    return {make_device(direction)};
}

device_info null_backend::get_default_device(device_direction direction) {
    return enumerate_devices(direction).front();
}

uint32_t null_backend::open_device(device_direction direction,
                                   device_id_t device_id,
                                   const audio_spec& spec,
                                   audio_spec& obtained_spec) {
    validate_stream_params(spec.channels, spec.freq);

    std::lock_guard<std::mutex> lk(m_mutex);
    if (!m_initialized) {
        THROW_RUNTIME("Backend not initialized");
    }
    if (device_id != default_device_id && device_id != make_device(direction).id) {
        throw device_error("No " + std::string(direction == device_direction::playback ? "playback" : "recording") +
                           " device with id " + std::to_string(device_id));
    }

    const uint32_t handle = m_next_handle++;
    device_state& dev = m_devices[handle];
    dev.direction = direction;
    dev.spec = spec;
    dev.buffer_frames = m_buffer_frames;
    obtained_spec = spec;

    LOG_DEBUG("null_backend", "Opened", direction, "device, handle", handle);
    return handle;
}

void null_backend::close_device(uint32_t device_handle) {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_devices.erase(device_handle);
}

frames_t null_backend::get_device_buffer_frames(uint32_t device_handle) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_devices.find(device_handle);
    if (it == m_devices.end()) {
        THROW_RUNTIME("Invalid device handle");
    }
    return it->second.buffer_frames;
}

bool null_backend::pause_device(uint32_t device_handle) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_devices.find(device_handle);
    if (it == m_devices.end()) {
        return false;
    }
    it->second.paused = true;
    return true;
}

bool null_backend::resume_device(uint32_t device_handle) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_devices.find(device_handle);
    if (it == m_devices.end()) {
        return false;
    }
    it->second.paused = false;
    return true;
}

bool null_backend::is_device_paused(uint32_t device_handle) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_devices.find(device_handle);
    if (it == m_devices.end()) {
        THROW_RUNTIME("Invalid device handle");
    }
    return it->second.paused;
}

std::unique_ptr<audio_stream_interface> null_backend::create_stream(
    uint32_t device_handle,
    const audio_spec& spec,
    audio_callback_t callback,
    void* userdata) {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_devices.find(device_handle);
    if (it == m_devices.end()) {
        THROW_RUNTIME("Invalid device handle");
    }

    auto state = std::make_shared<stream_state>();
    state->spec = spec;
    state->callback = callback;
    state->userdata = userdata;
    it->second.streams.push_back(state);
    return std::make_unique<null_audio_stream>(std::move(state));
}

bool null_backend::supports_recording() const {
    return true;
}

void null_backend::set_buffer_frames(frames_t frames) {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_buffer_frames = frames;
}

void null_backend::set_capture_source(capture_source_t source) {
    std::lock_guard<std::mutex> lk(m_mutex);
    m_capture_source = std::move(source);
}

std::size_t null_backend::pump(frames_t frames) {
    struct job {
        uint32_t handle;
        device_direction direction;
        std::shared_ptr<stream_state> stream;
    };

    std::vector<job> jobs;
    capture_source_t source;
    {
        std::lock_guard<std::mutex> lk(m_mutex);
        for (auto& [handle, dev] : m_devices) {
            if (dev.paused) {
                continue;
            }
            for (auto& weak : dev.streams) {
                if (auto stream = weak.lock()) {
                    jobs.push_back({handle, dev.direction, std::move(stream)});
                }
            }
        }
        source = m_capture_source;
    }

    std::size_t calls = 0;
    for (auto& j : jobs) {
        std::lock_guard<std::mutex> cb_lock(j.stream->callback_mutex);
        if (!j.stream->callback || j.stream->paused || !j.stream->bound) {
            continue;
        }
        const audio_spec& spec = j.stream->spec;
        const std::size_t samples = frames * spec.channels;
        std::vector<uint8_t> bytes(samples * spec.format.bytes_per_sample());

        if (j.direction == device_direction::recording) {
            std::vector<float> captured(samples, 0.0f);
            if (source) {
                source(captured.data(), samples);
            }
            pcm::get_encoder(spec.format)(bytes.data(), captured.data(), samples);
            j.stream->callback(j.stream->userdata, bytes.data(), static_cast<int>(bytes.size()));
        } else {
            j.stream->callback(j.stream->userdata, bytes.data(), static_cast<int>(bytes.size()));
            std::lock_guard<std::mutex> lk(m_mutex);
            auto it = m_devices.find(j.handle);
            if (it != m_devices.end()) {
                it->second.last_output = std::move(bytes);
            }
        }
        calls++;
    }
    return calls;
}

std::vector<uint8_t> null_backend::last_output(uint32_t device_handle) const {
    std::lock_guard<std::mutex> lk(m_mutex);
    auto it = m_devices.find(device_handle);
    if (it == m_devices.end()) {
        return {};
    }
    return it->second.last_output;
}

std::size_t null_backend::open_device_count() const {
    std::lock_guard<std::mutex> lk(m_mutex);
    return m_devices.size();
}

} // namespace audiocore
