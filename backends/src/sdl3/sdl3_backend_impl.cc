#include "sdl3_backend_impl.hh"
#include "sdl3_audio_stream.hh"
#include <audiocore/error.hh>
#include <failsafe/failsafe.hh>
#include <algorithm>

namespace audiocore {
    namespace {
        std::string get_sdl_error() {
            const char* error = SDL_GetError();
            return error ? error : "Unknown SDL error";
        }
#if defined(AUDIOCORE_COMPILER_MSVC)
#pragma warning( push )
#pragma warning( disable : 4820)
#elif defined(AUDIOCORE_COMPILER_GCC)
# pragma GCC diagnostic push
# pragma GCC diagnostic ignored "-Wold-style-cast"
# pragma GCC diagnostic ignored "-Wuseless-cast"
#elif defined(AUDIOCORE_COMPILER_CLANG)
# pragma clang diagnostic push
# pragma clang diagnostic ignored "-Wold-style-cast"
#endif
        SDL_AudioDeviceID get_sdl_device_id(device_id_t device_id, device_direction direction) {
            if (device_id == default_device_id) {
                return direction == device_direction::playback
                    ? SDL_AUDIO_DEVICE_DEFAULT_PLAYBACK
                    : SDL_AUDIO_DEVICE_DEFAULT_RECORDING;
            }
            return static_cast<SDL_AudioDeviceID>(device_id);
        }
#if defined(AUDIOCORE_COMPILER_MSVC)
#pragma warning( pop )
#elif defined(AUDIOCORE_COMPILER_GCC)
# pragma GCC diagnostic pop
#elif defined(AUDIOCORE_COMPILER_CLANG)
# pragma clang diagnostic pop
#endif

        device_info fallback_device(device_direction direction) {
            device_info info;
            info.id = default_device_id;
            info.name = direction == device_direction::playback ? "Default Playback" : "Default Recording";
            info.is_default = true;
            info.channels = 2;
            info.sample_rate = 44100;
            return info;
        }
    }

    SDL_AudioFormat sdl3_backend::to_sdl_format(const audio_format& fmt) {
        if (fmt.is_float()) {
            return fmt.bit_depth() == 32 ? SDL_AUDIO_F32LE : SDL_AUDIO_UNKNOWN;
        }
        switch (fmt.bit_depth()) {
            case 8:  return fmt.is_signed() ? SDL_AUDIO_S8 : SDL_AUDIO_U8;
            case 16: return fmt.is_signed() ? SDL_AUDIO_S16LE : SDL_AUDIO_UNKNOWN;
            case 32: return fmt.is_signed() ? SDL_AUDIO_S32LE : SDL_AUDIO_UNKNOWN;
            default: return SDL_AUDIO_UNKNOWN;
        }
    }

    audio_format sdl3_backend::from_sdl_format(SDL_AudioFormat sdl_fmt) {
        switch (sdl_fmt) {
            case SDL_AUDIO_U8: return audio_format(8, sample_type::unsigned_integer);
            case SDL_AUDIO_S8: return audio_format(8, sample_type::signed_integer);
            case SDL_AUDIO_S16LE:
            case SDL_AUDIO_S16BE: return audio_format(16, sample_type::signed_integer);
            case SDL_AUDIO_S32LE:
            case SDL_AUDIO_S32BE: return audio_format(32, sample_type::signed_integer);
            default: return audio_format::float32();
        }
    }

    sdl3_backend::~sdl3_backend() {
        if (m_initialized) {
            shutdown();
        }
    }

    void sdl3_backend::init() {
        if (m_initialized) {
            THROW_RUNTIME("SDL3 backend already initialized");
        }

        if (!SDL_InitSubSystem(SDL_INIT_AUDIO)) {
            THROW_RUNTIME("Failed to initialize SDL3 audio: " + get_sdl_error());
        }

        m_initialized = true;
        const char* driver = SDL_GetCurrentAudioDriver();
        LOG_INFO("sdl3_backend", "Initialized, driver:", driver ? driver : "none");
    }

    void sdl3_backend::shutdown() {
        if (!m_initialized) {
            return;
        }

        {
            std::lock_guard<std::mutex> lock(m_devices_mutex);
            for (const auto& [handle, info] : m_devices) {
                SDL_CloseAudioDevice(info.sdl_id);
            }
            m_devices.clear();
        }

        SDL_QuitSubSystem(SDL_INIT_AUDIO);
        m_initialized = false;
        LOG_INFO("sdl3_backend", "Shut down");
    }

    std::string sdl3_backend::get_name() const {
        return "SDL3";
    }

    bool sdl3_backend::is_initialized() const {
        return m_initialized;
    }

    std::vector<device_info> sdl3_backend::enumerate_devices(device_direction direction) {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }

        const bool playback = direction == device_direction::playback;
        std::vector<device_info> devices;

        int count = 0;
        SDL_AudioDeviceID* sdl_devices = playback
            ? SDL_GetAudioPlaybackDevices(&count)
            : SDL_GetAudioRecordingDevices(&count);

        // Open the default device to learn which physical device it maps to
        std::string default_device_name;
        SDL_AudioSpec probe_spec;
        SDL_zero(probe_spec);
        probe_spec.freq = 44100;
        probe_spec.format = SDL_AUDIO_F32LE;
        probe_spec.channels = 2;

        SDL_AudioDeviceID probe = SDL_OpenAudioDevice(get_sdl_device_id(default_device_id, direction), &probe_spec);
        if (probe != 0) {
            const char* opened_name = SDL_GetAudioDeviceName(probe);
            if (opened_name) {
                default_device_name = opened_name;
            }
            SDL_CloseAudioDevice(probe);
        }

        if (sdl_devices) {
            for (size_t i = 0; i < static_cast<size_t>(count); i++) {
                const char* name = SDL_GetAudioDeviceName(sdl_devices[i]);
                if (!name) continue;

                SDL_AudioSpec spec;
                if (SDL_GetAudioDeviceFormat(sdl_devices[i], &spec, nullptr)) {
                    device_info info;
                    info.id = static_cast<device_id_t>(sdl_devices[i]);
                    info.name = name;
                    info.is_default = (!default_device_name.empty() && info.name == default_device_name);
                    info.channels = static_cast<channels_t>(spec.channels);
                    info.sample_rate = static_cast<sample_rate_t>(spec.freq);
                    devices.push_back(info);
                }
            }
            SDL_free(sdl_devices);
        }

        // Default device first
        auto default_it = std::find_if(devices.begin(), devices.end(),
            [](const device_info& dev) { return dev.is_default; });
        if (default_it != devices.end() && default_it != devices.begin()) {
            std::rotate(devices.begin(), default_it, default_it + 1);
        }

        if (!devices.empty() && default_it == devices.end()) {
            devices[0].is_default = true;
        }

        if (devices.empty()) {
            devices.push_back(fallback_device(direction));
        }

        return devices;
    }

    device_info sdl3_backend::get_default_device(device_direction direction) {
        auto devices = enumerate_devices(direction);
        if (!devices.empty()) {
            return devices[0];
        }
        return fallback_device(direction);
    }

    uint32_t sdl3_backend::open_device(device_direction direction,
                                       device_id_t device_id,
                                       const audio_spec& spec,
                                       audio_spec& obtained_spec) {
        if (!m_initialized) {
            THROW_RUNTIME("Backend not initialized");
        }

        SDL_AudioSpec wanted;
        SDL_zero(wanted);
        wanted.freq = static_cast<int>(spec.freq);
        wanted.format = to_sdl_format(spec.format);
        if (wanted.format == SDL_AUDIO_UNKNOWN) {
            wanted.format = SDL_AUDIO_F32LE;
        }
        wanted.channels = spec.channels;

        SDL_AudioDeviceID sdl_id = SDL_OpenAudioDevice(get_sdl_device_id(device_id, direction), &wanted);
        if (sdl_id == 0) {
            throw device_error("Failed to open audio device " + std::to_string(device_id) + ": " + get_sdl_error());
        }

        SDL_AudioSpec obtained;
        int sample_frames = 0;
        if (!SDL_GetAudioDeviceFormat(sdl_id, &obtained, &sample_frames)) {
            SDL_CloseAudioDevice(sdl_id);
            THROW_RUNTIME("Failed to get audio device format: " + get_sdl_error());
        }

        obtained_spec.freq = static_cast<sample_rate_t>(obtained.freq);
        obtained_spec.format = from_sdl_format(obtained.format);
        obtained_spec.channels = static_cast<channels_t>(obtained.channels);

        uint32_t handle = 0; {
            std::lock_guard<std::mutex> lock(m_devices_mutex);
            handle = m_next_handle++;

            device_state& info = m_devices[handle];
            info.sdl_id = sdl_id;
            info.direction = direction;
            info.spec = obtained_spec;
            info.buffer_frames = sample_frames > 0 ? static_cast<frames_t>(sample_frames) : 0;
        }

        return handle;
    }

    void sdl3_backend::close_device(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it != m_devices.end()) {
            SDL_CloseAudioDevice(it->second.sdl_id);
            m_devices.erase(it);
        }
    }

    frames_t sdl3_backend::get_device_buffer_frames(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            THROW_RUNTIME("Invalid device handle");
        }
        return it->second.buffer_frames;
    }

    bool sdl3_backend::pause_device(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            return false;
        }
        return SDL_PauseAudioDevice(it->second.sdl_id);
    }

    bool sdl3_backend::resume_device(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            return false;
        }
        return SDL_ResumeAudioDevice(it->second.sdl_id);
    }

    bool sdl3_backend::is_device_paused(uint32_t device_handle) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            THROW_RUNTIME("Invalid device handle");
        }
        return SDL_AudioDevicePaused(it->second.sdl_id);
    }

    std::unique_ptr<audio_stream_interface> sdl3_backend::create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) {
        std::lock_guard<std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(device_handle);
        if (it == m_devices.end()) {
            THROW_RUNTIME("Invalid device handle");
        }

        return std::make_unique<sdl3_audio_stream>(it->second.sdl_id, it->second.direction,
                                                   spec, callback, userdata);
    }

    bool sdl3_backend::supports_recording() const {
        return true;
    }

    SDL_AudioDeviceID sdl3_backend::get_sdl_device(uint32_t handle) const {
        std::lock_guard<std::mutex> lock(m_devices_mutex);

        auto it = m_devices.find(handle);
        if (it == m_devices.end()) {
            return 0;
        }
        return it->second.sdl_id;
    }
} // namespace audiocore
