/**
 * @file sdl3_backend_impl.hh
 * @brief SDL3 backend implementation
 * @ingroup sdl3_backend
 */

#ifndef AUDIOCORE_SDL3_BACKEND_IMPL_HH
#define AUDIOCORE_SDL3_BACKEND_IMPL_HH

#include <audiocore/sdk/audio_backend.hh>
#include "sdl3.hh"
#include <map>
#include <mutex>
#include <string>
#include <vector>

namespace audiocore {

/**
 * @class sdl3_backend
 * @brief SDL3 implementation of the audio backend interface
 * @ingroup sdl3_backend
 *
 * - **Handle Mapping**: audiocore handles map to logical SDL device ids
 * - **Device ids**: enumeration reports SDL's own instance ids; 0 selects
 *   SDL's default playback or recording device
 * - **Streams**: one SDL_AudioStream per create_stream(), converting
 *   between the callback's wire format and the device format
 *
 * @note Internal class; create instances via create_sdl3_backend().
 */
class sdl3_backend : public audio_backend {
private:
    bool m_initialized = false;

    struct device_state {
        SDL_AudioDeviceID sdl_id = 0;
        device_direction direction = device_direction::playback;
        audio_spec spec;
        frames_t buffer_frames = 0;
    };

    std::map<uint32_t, device_state> m_devices;
    mutable std::mutex m_devices_mutex;
    uint32_t m_next_handle = 1;

public:
    sdl3_backend() = default;
    ~sdl3_backend() override;

    // Wire format for SDL, or SDL_AUDIO_UNKNOWN when SDL cannot carry it
    static SDL_AudioFormat to_sdl_format(const audio_format& fmt);
    static audio_format from_sdl_format(SDL_AudioFormat sdl_fmt);

    void init() override;
    void shutdown() override;
    std::string get_name() const override;
    bool is_initialized() const override;

    std::vector<device_info> enumerate_devices(device_direction direction) override;
    device_info get_default_device(device_direction direction) override;

    uint32_t open_device(device_direction direction,
                         device_id_t device_id,
                         const audio_spec& spec,
                         audio_spec& obtained_spec) override;
    void close_device(uint32_t device_handle) override;
    frames_t get_device_buffer_frames(uint32_t device_handle) override;

    bool pause_device(uint32_t device_handle) override;
    bool resume_device(uint32_t device_handle) override;
    bool is_device_paused(uint32_t device_handle) override;

    std::unique_ptr<audio_stream_interface> create_stream(
        uint32_t device_handle,
        const audio_spec& spec,
        audio_callback_t callback,
        void* userdata) override;

    bool supports_recording() const override;

    SDL_AudioDeviceID get_sdl_device(uint32_t handle) const;
};

} // namespace audiocore

#endif // AUDIOCORE_SDL3_BACKEND_IMPL_HH
