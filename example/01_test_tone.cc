/**
 * @example 01_test_tone.cc
 * @brief Test tone with a volume fade
 *
 * Plays a 440 Hz tone through the default playback device, cycles
 * through the waveforms and fades out at the end.
 */

#include "example_common.hh"
#include <audiocore/device_output.hh>
#include <audiocore/test_tone_input.hh>
#include <iostream>
#include <thread>
#include <chrono>

int main() {
    try {
        auto backend = audiocore::examples::create_default_backend();

        audiocore::audio_spec spec;
        spec.channels = 2;
        spec.freq = 48000;

        audiocore::device_output speakers(backend, spec);
        std::cout << "Device buffer: " << speakers.buffer_size() << " frames, "
                  << speakers.latency() << " ms\n";

        auto tone = std::make_shared<audiocore::test_tone_input>(spec.channels, spec.freq, 440);
        tone->set_volume(-12);
        speakers.add_input(tone);
        speakers.start();

        const audiocore::waveform shapes[] = {
            audiocore::waveform::sine,
            audiocore::waveform::square,
            audiocore::waveform::sawtooth,
            audiocore::waveform::triangle
        };
        for (auto shape : shapes) {
            tone->set_shape(shape);
            std::cout << "Playing " << shape << '\n';
            std::this_thread::sleep_for(std::chrono::seconds(1));
        }

        std::cout << "Fading out\n";
        tone->transition_volume(-90, std::chrono::milliseconds(2000));
        std::this_thread::sleep_for(std::chrono::milliseconds(2100));

        speakers.stop();
        speakers.remove_input(tone);
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << '\n';
        return 1;
    }

    return 0;
}
