#ifndef AUDIOCORE_SDL3_AUDIO_STREAM_HH
#define AUDIOCORE_SDL3_AUDIO_STREAM_HH

#include <audiocore/sdk/audio_stream_interface.hh>
#include <audiocore/sdk/audio_backend.hh>
#include "sdl3.hh"
#include <memory>
#include <vector>

namespace audiocore {

class sdl3_audio_stream : public audio_stream_interface {
public:
    sdl3_audio_stream(SDL_AudioDeviceID device_id, device_direction direction,
                      const audio_spec& spec, audio_callback_t callback, void* userdata);
    ~sdl3_audio_stream() override;

    void clear() override;
    bool pause() override;
    bool resume() override;
    bool is_paused() const override;
    bool bind_to_device() override;
    void unbind_from_device() override;

private:
    // playback: SDL asks for more data
    static void get_callback(void* userdata, SDL_AudioStream* stream, int additional_amount, int total_amount);
    // recording: the device delivered data
    static void put_callback(void* userdata, SDL_AudioStream* stream, int additional_amount, int total_amount);

    uint8_t* scratch(std::size_t size);

    SDL_AudioDeviceID m_device_id;
    std::shared_ptr<SDL_AudioStream> m_stream;
    audio_callback_t m_callback;
    void* m_userdata;
    bool m_bound;
    std::vector<uint8_t> m_scratch;
};

} // namespace audiocore

#endif // AUDIOCORE_SDL3_AUDIO_STREAM_HH
