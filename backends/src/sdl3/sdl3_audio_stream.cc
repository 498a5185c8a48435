#include "sdl3_audio_stream.hh"
#include "sdl3_backend_impl.hh"
#include <audiocore/error.hh>
#include <failsafe/failsafe.hh>
#include <cstring>
#include <string>

namespace audiocore {

// Custom deleter that checks if SDL is still initialized
static void safe_destroy_audio_stream(SDL_AudioStream* stream) {
    if (stream && SDL_WasInit(SDL_INIT_AUDIO)) {
        SDL_DestroyAudioStream(stream);
    }
}

sdl3_audio_stream::sdl3_audio_stream(SDL_AudioDeviceID device_id, device_direction direction,
                                     const audio_spec& spec, audio_callback_t callback, void* userdata)
    : m_device_id(device_id)
    , m_callback(callback)
    , m_userdata(userdata)
    , m_bound(false) {

    SDL_AudioSpec wire;
    SDL_zero(wire);
    wire.format = sdl3_backend::to_sdl_format(spec.format);
    wire.channels = spec.channels;
    wire.freq = static_cast<int>(spec.freq);
    if (wire.format == SDL_AUDIO_UNKNOWN) {
        throw device_error("SDL3 cannot carry audio format " + std::string(
            spec.format.is_float() ? "f" : (spec.format.is_signed() ? "s" : "u")) +
            std::to_string(spec.format.bit_depth()));
    }

    SDL_AudioSpec device_spec;
    if (!SDL_GetAudioDeviceFormat(m_device_id, &device_spec, nullptr)) {
        THROW_RUNTIME("Failed to get device format: " + std::string(SDL_GetError()));
    }

    const bool recording = direction == device_direction::recording;
    m_stream = std::shared_ptr<SDL_AudioStream>(
        recording ? SDL_CreateAudioStream(&device_spec, &wire)
                  : SDL_CreateAudioStream(&wire, &device_spec),
        safe_destroy_audio_stream
    );
    if (!m_stream) {
        THROW_RUNTIME("Failed to create audio stream: " + std::string(SDL_GetError()));
    }

    if (m_callback) {
        const bool ok = recording
            ? SDL_SetAudioStreamPutCallback(m_stream.get(), put_callback, this)
            : SDL_SetAudioStreamGetCallback(m_stream.get(), get_callback, this);
        if (!ok) {
            THROW_RUNTIME("Failed to set stream callback: " + std::string(SDL_GetError()));
        }
    }

    if (!SDL_BindAudioStream(m_device_id, m_stream.get())) {
        THROW_RUNTIME("Failed to bind stream to device: " + std::string(SDL_GetError()));
    }
    m_bound = true;
}

sdl3_audio_stream::~sdl3_audio_stream() {
    unbind_from_device();
}

uint8_t* sdl3_audio_stream::scratch(std::size_t size) {
    if (m_scratch.size() < size) {
        m_scratch.resize(size);
    }
    return m_scratch.data();
}

void sdl3_audio_stream::get_callback(void* userdata,
    SDL_AudioStream* stream,
    int additional_amount, [[maybe_unused]] int total_amount) {
    auto* self = static_cast<sdl3_audio_stream*>(userdata);
    if (!self || !self->m_callback || additional_amount <= 0) {
        return;
    }

    uint8_t* data = self->scratch(static_cast<std::size_t>(additional_amount));
    self->m_callback(self->m_userdata, data, additional_amount);
    SDL_PutAudioStreamData(stream, data, additional_amount);
}

void sdl3_audio_stream::put_callback(void* userdata,
    SDL_AudioStream* stream,
    [[maybe_unused]] int additional_amount, [[maybe_unused]] int total_amount) {
    auto* self = static_cast<sdl3_audio_stream*>(userdata);
    if (!self || !self->m_callback) {
        return;
    }

    const int available = SDL_GetAudioStreamAvailable(stream);
    if (available <= 0) {
        return;
    }
    uint8_t* data = self->scratch(static_cast<std::size_t>(available));
    const int got = SDL_GetAudioStreamData(stream, data, available);
    if (got > 0) {
        self->m_callback(self->m_userdata, data, got);
    }
}

void sdl3_audio_stream::clear() {
    SDL_ClearAudioStream(m_stream.get());
}

bool sdl3_audio_stream::pause() {
    return SDL_PauseAudioStreamDevice(m_stream.get());
}

bool sdl3_audio_stream::resume() {
    return SDL_ResumeAudioStreamDevice(m_stream.get());
}

bool sdl3_audio_stream::is_paused() const {
    return SDL_AudioStreamDevicePaused(m_stream.get());
}

bool sdl3_audio_stream::bind_to_device() {
    if (!m_bound && m_stream) {
        if (SDL_BindAudioStream(m_device_id, m_stream.get())) {
            m_bound = true;
            return true;
        }
    }
    return false;
}

void sdl3_audio_stream::unbind_from_device() {
    if (m_bound && m_stream && SDL_WasInit(SDL_INIT_AUDIO)) {
        SDL_UnbindAudioStream(m_stream.get());
    }
    m_bound = false;
}

} // namespace audiocore
